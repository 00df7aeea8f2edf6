#include "conduit/tracing/TracingAttributes.h"

#include <cstring>

namespace conduit {
namespace tracing {

const char* ProtocolVersionOf(const protocol::HttpRequest& request) {
    const char* name = request.versionString();
    if (!name) return "unknown";
    const char* slash = std::strchr(name, '/');
    return slash ? slash + 1 : "unknown";
}

std::string UserAgentOf(const protocol::HttpRequest& request) {
    const std::string* ua = request.headers().get("User-Agent");
    if (!ua) return "unknown";
    for (unsigned char c : *ua) {
        if (c != '\t' && (c < 0x20 || c > 0x7e)) return "invalid-user-agent";
    }
    return *ua;
}

void SetAttributesFromRequest(Span& span, const protocol::HttpRequest& request) {
    if (request.isExtensionMethod()) {
        span.setAttribute(HTTP_REQUEST_METHOD, std::string(kOtherMethod));
        span.setAttribute(HTTP_REQUEST_METHOD_ORIGINAL, std::string(request.methodString()));
    } else {
        span.setAttribute(HTTP_REQUEST_METHOD, std::string(request.methodString()));
    }
    span.setAttribute(URL_FULL, request.fullUrl());
    span.setAttribute(URL_PATH, request.path());
    span.setAttribute(NETWORK_PROTOCOL_NAME, std::string("http"));
    span.setAttribute(NETWORK_PROTOCOL_VERSION, std::string(ProtocolVersionOf(request)));
    span.setAttribute(USER_AGENT_ORIGINAL, UserAgentOf(request));

    if (request.query()) span.setAttribute(URL_QUERY, *request.query());
    if (request.scheme()) span.setAttribute(URL_SCHEME, *request.scheme());
}

} // namespace tracing
} // namespace conduit
