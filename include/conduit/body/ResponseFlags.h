#pragma once

#include <cstdint>
#include <string>

#include "conduit/body/Body.h"

namespace conduit {
namespace body {

// Bitmask describing why a stream did not complete cleanly. Empty means no
// error was observed.
class ResponseFlags {
public:
    enum Flag : uint32_t {
        kDownstreamConnectionTermination = 1u << 0,  // DC
        kUpstreamConnectionTermination = 1u << 1,    // UC
        kStreamIdleTimeout = 1u << 2,                // SI
        kUpstreamRequestTimeout = 1u << 3,           // UT
        kUpstreamProtocolError = 1u << 4,            // UPE
        kDownstreamProtocolError = 1u << 5,          // DPE
        kUpstreamConnectionFailure = 1u << 6,        // UF
    };

    static constexpr int kFlagCount = 7;

    ResponseFlags() = default;
    explicit ResponseFlags(uint32_t bits) : bits_(bits) {}

    bool empty() const { return bits_ == 0; }
    bool has(Flag f) const { return (bits_ & f) != 0; }
    void set(Flag f) { bits_ |= f; }
    uint32_t bits() const { return bits_; }

    // Comma-joined short codes ("UC,SI"), or "-" when empty.
    std::string toShortString() const;

    static const char* ShortName(Flag f);

    bool operator==(const ResponseFlags& other) const { return bits_ == other.bits_; }
    bool operator!=(const ResponseFlags& other) const { return bits_ != other.bits_; }

private:
    uint32_t bits_{0};
};

using ErrorClassifier = ResponseFlags (*)(const BodyError& error, BodyKind kind);

// Default classifier: failures on a response body are blamed on the
// upstream side, failures on a request body on the downstream side.
ResponseFlags ClassifyBodyError(const BodyError& error, BodyKind kind);

} // namespace body
} // namespace conduit
