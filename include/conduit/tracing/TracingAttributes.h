#pragma once

#include <utility>

#include "conduit/Features.h"
#include "conduit/protocol/HttpRequest.h"
#include "conduit/tracing/Span.h"
#include "conduit/tracing/SpanState.h"

namespace conduit {
namespace tracing {

// OpenTelemetry HTTP semantic-convention attribute keys.
constexpr const char* HTTP_REQUEST_METHOD = "http.request.method";
constexpr const char* HTTP_REQUEST_METHOD_ORIGINAL = "http.request.method_original";
constexpr const char* HTTP_RESPONSE_STATUS_CODE = "http.response.status_code";
constexpr const char* HTTP_REQUEST_RESEND_COUNT = "http.request.resend_count";
constexpr const char* HTTP_REQUEST_BODY_SIZE = "http.request.body.size";
constexpr const char* HTTP_REQUEST_SIZE = "http.request.size";
constexpr const char* HTTP_RESPONSE_BODY_SIZE = "http.response.body.size";
constexpr const char* HTTP_RESPONSE_SIZE = "http.response.size";
constexpr const char* URL_FULL = "url.full";
constexpr const char* URL_PATH = "url.path";
constexpr const char* URL_QUERY = "url.query";
constexpr const char* URL_SCHEME = "url.scheme";
constexpr const char* USER_AGENT_ORIGINAL = "user_agent.original";
constexpr const char* NETWORK_PROTOCOL_NAME = "network.protocol.name";
constexpr const char* NETWORK_PROTOCOL_VERSION = "network.protocol.version";
constexpr const char* UPSTREAM_CLUSTER_NAME = "upstream.cluster.name";
constexpr const char* UPSTREAM_ADDRESS = "upstream.address";

// http.request.method value for methods outside the registered set; the raw
// token goes to http.request.method_original.
constexpr const char* kOtherMethod = "_OTHER";

// Sets method, url, protocol and user-agent attributes from the request head.
// Query and scheme are set only when the request carries them.
void SetAttributesFromRequest(Span& span, const protocol::HttpRequest& request);

// "1.1" for HTTP/1.1 etc., "unknown" when the version was not parsed.
const char* ProtocolVersionOf(const protocol::HttpRequest& request);

// User-Agent value, "unknown" when absent, "invalid-user-agent" when it holds
// bytes outside visible ASCII.
std::string UserAgentOf(const protocol::HttpRequest& request);

// Run fn(Span&) on the server/client span if tracing is compiled in and the
// state and slot exist. Compiles to nothing otherwise.
template <typename Fn>
inline void WithServerSpan(SpanState* state, Fn&& fn) {
    if constexpr (kTracingEnabled) {
        if (state) state->withServerSpan(std::forward<Fn>(fn));
    } else {
        (void)state;
        (void)fn;
    }
}

template <typename Fn>
inline void WithClientSpan(SpanState* state, Fn&& fn) {
    if constexpr (kTracingEnabled) {
        if (state) state->withClientSpan(std::forward<Fn>(fn));
    } else {
        (void)state;
        (void)fn;
    }
}

} // namespace tracing
} // namespace conduit
