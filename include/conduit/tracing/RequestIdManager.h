#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "conduit/Features.h"
#include "conduit/common/Config.h"
#include "conduit/protocol/HttpRequest.h"
#include "conduit/protocol/HttpResponse.h"
#include "conduit/tracing/RequestId.h"

namespace conduit {
namespace tracing {

// X-Request-ID policy of a listener. Immutable and stateless, so one instance
// serves every concurrent request.
//
// Decision table (first match wins):
//   incoming valid id && preserveExternal -> keep incoming, not generated
//   generate                              -> fresh id, generated
//   tracing compiled in                   -> fresh id, generated
//   access log enabled                    -> fresh id, not generated
//   otherwise                             -> no id
// The id is propagated when (incoming && preserveExternal) || generate.
class RequestIdManager {
public:
    RequestIdManager(bool generate, bool preserveExternal, bool alwaysSetInResponse)
        : generate_(generate),
          preserveExternal_(preserveExternal),
          alwaysSetInResponse_(alwaysSetInResponse) {}

    // Reads [section] generate / preserve_external / always_set_in_response.
    static RequestIdManager FromConfig(const common::Config& config,
                                       const std::string& section = "request_id");

    // Rewrites X-Request-ID on the outbound request and returns the request's
    // id. The header is inserted only for a freshly generated id that must be
    // propagated, and removed when an incoming id must not be propagated.
    std::optional<RequestId> applyPolicy(protocol::HttpRequest* request,
                                         const std::optional<RequestId>& incoming,
                                         bool accessLogEnabled,
                                         bool tracingEnabled = kTracingEnabled) const;

    // Stamps the id (either kind) on the response when alwaysSetInResponse is set.
    void applyTo(protocol::HttpResponse* response, const std::optional<RequestId>& id) const;

    // 32 lower-case hex chars from 128 random bits; kFallbackId if the random
    // source fails.
    static std::string GenerateId();

    // Formats 16 bytes as a v4 UUID without hyphens. Any other length yields kFallbackId.
    static std::string FormatId(const unsigned char* bytes, size_t len);

    static constexpr const char* kFallbackId = "unknown-request-id";

    bool generate() const { return generate_; }
    bool preserveExternal() const { return preserveExternal_; }
    bool alwaysSetInResponse() const { return alwaysSetInResponse_; }

private:
    bool generate_;
    bool preserveExternal_;
    bool alwaysSetInResponse_;
};

} // namespace tracing
} // namespace conduit
