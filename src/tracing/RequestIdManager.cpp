#include "conduit/tracing/RequestIdManager.h"
#include "conduit/common/Logger.h"

#include <openssl/err.h>
#include <openssl/rand.h>

namespace conduit {
namespace tracing {

RequestIdManager RequestIdManager::FromConfig(const common::Config& config, const std::string& section) {
    return RequestIdManager(config.GetBool(section, "generate", true),
                            config.GetBool(section, "preserve_external", true),
                            config.GetBool(section, "always_set_in_response", false));
}

std::string RequestIdManager::FormatId(const unsigned char* bytes, size_t len) {
    static const char kHex[] = "0123456789abcdef";
    if (!bytes || len != 16) {
        LOG_INFO << "request id source returned " << len << " bytes, using " << kFallbackId;
        return kFallbackId;
    }

    unsigned char b[16];
    for (size_t i = 0; i < 16; ++i) b[i] = bytes[i];
    b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);  // version 4
    b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);  // RFC 4122 variant

    std::string out(32, '0');
    for (size_t i = 0; i < 16; ++i) {
        out[2 * i] = kHex[b[i] >> 4];
        out[2 * i + 1] = kHex[b[i] & 0x0f];
    }
    return out;
}

std::string RequestIdManager::GenerateId() {
    unsigned char buf[16];
    if (RAND_bytes(buf, static_cast<int>(sizeof(buf))) != 1) {
        LOG_INFO << "RAND_bytes failed for request id: " << ERR_get_error() << ", using " << kFallbackId;
        return kFallbackId;
    }
    return FormatId(buf, sizeof(buf));
}

std::optional<RequestId> RequestIdManager::applyPolicy(protocol::HttpRequest* request,
                                                       const std::optional<RequestId>& incoming,
                                                       bool accessLogEnabled,
                                                       bool tracingEnabled) const {
    const bool keepIncoming = incoming.has_value() && preserveExternal_;

    // 1. Pick the authoritative id and whether we minted it.
    std::optional<std::string> authoritative;
    bool generated = false;
    if (keepIncoming) {
        authoritative = incoming->value();
    } else if (generate_ || tracingEnabled) {
        authoritative = GenerateId();
        generated = true;
    } else if (accessLogEnabled) {
        authoritative = GenerateId();
    }

    // 2. Decide whether it goes on the wire.
    const bool propagate = keepIncoming || generate_;

    // 3. Rewrite the outbound header.
    if (propagate) {
        if (generated && authoritative) {
            request->setHeader(X_REQUEST_ID, *authoritative);
        }
    } else if (incoming) {
        request->removeHeader(X_REQUEST_ID);
    }

    // 4. Tag the id.
    if (!authoritative) return std::nullopt;
    return propagate ? RequestId::Propagate(std::move(*authoritative))
                     : RequestId::Internal(std::move(*authoritative));
}

void RequestIdManager::applyTo(protocol::HttpResponse* response, const std::optional<RequestId>& id) const {
    if (!alwaysSetInResponse_ || !id) return;
    response->setHeader(X_REQUEST_ID, id->value());
}

} // namespace tracing
} // namespace conduit
