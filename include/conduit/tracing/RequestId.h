#pragma once

#include <optional>
#include <string>
#include <utility>

#include "conduit/protocol/HttpRequest.h"

namespace conduit {
namespace tracing {

// Correlation header carried to and from the next hop.
constexpr const char* X_REQUEST_ID = "X-Request-ID";

// Per-request correlation identifier. A Propagate id travels on the wire; an
// Internal id is only used in-process (logs, spans) and never forwarded.
class RequestId {
public:
    enum class Kind {
        kPropagate,
        kInternal
    };

    static RequestId Propagate(std::string value) { return RequestId(Kind::kPropagate, std::move(value)); }
    static RequestId Internal(std::string value) { return RequestId(Kind::kInternal, std::move(value)); }

    // Propagate(value) when the request carries a non-empty, well-formed UUID
    // in X-Request-ID. Malformed values are logged at INFO and ignored.
    static std::optional<RequestId> FromRequest(const protocol::HttpRequest& request);

    // Accepts the simple (32 hex), hyphenated (8-4-4-4-12), braced and
    // "urn:uuid:" forms, hex digits in either case.
    static bool IsValidUuid(const std::string& s);

    Kind kind() const { return kind_; }
    bool isPropagate() const { return kind_ == Kind::kPropagate; }
    bool isInternal() const { return kind_ == Kind::kInternal; }

    const std::string& value() const { return value_; }

    // nullptr unless the id has the matching kind.
    const std::string* propagateRef() const { return isPropagate() ? &value_ : nullptr; }
    const std::string* internalRef() const { return isInternal() ? &value_ : nullptr; }

    bool operator==(const RequestId& other) const {
        return kind_ == other.kind_ && value_ == other.value_;
    }
    bool operator!=(const RequestId& other) const { return !(*this == other); }

private:
    RequestId(Kind kind, std::string value) : kind_(kind), value_(std::move(value)) {}

    Kind kind_;
    std::string value_;
};

} // namespace tracing
} // namespace conduit
