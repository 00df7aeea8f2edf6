#include "conduit/body/ResponseFlags.h"

namespace conduit {
namespace body {

const char* ResponseFlags::ShortName(Flag f) {
    switch (f) {
        case kDownstreamConnectionTermination: return "DC";
        case kUpstreamConnectionTermination: return "UC";
        case kStreamIdleTimeout: return "SI";
        case kUpstreamRequestTimeout: return "UT";
        case kUpstreamProtocolError: return "UPE";
        case kDownstreamProtocolError: return "DPE";
        case kUpstreamConnectionFailure: return "UF";
        default: return "?";
    }
}

std::string ResponseFlags::toShortString() const {
    if (empty()) return "-";
    std::string out;
    for (int i = 0; i < kFlagCount; ++i) {
        const auto f = static_cast<Flag>(1u << i);
        if (!has(f)) continue;
        if (!out.empty()) out.push_back(',');
        out.append(ShortName(f));
    }
    return out;
}

ResponseFlags ClassifyBodyError(const BodyError& error, BodyKind kind) {
    const bool upstream = (kind == BodyKind::kResponse);
    ResponseFlags flags;
    switch (error.code) {
        case BodyError::kTimeout:
            flags.set(ResponseFlags::kStreamIdleTimeout);
            break;
        case BodyError::kProtocol:
            flags.set(upstream ? ResponseFlags::kUpstreamProtocolError
                               : ResponseFlags::kDownstreamProtocolError);
            break;
        case BodyError::kIo:
        case BodyError::kReset:
        case BodyError::kAborted:
            flags.set(upstream ? ResponseFlags::kUpstreamConnectionTermination
                               : ResponseFlags::kDownstreamConnectionTermination);
            break;
    }
    return flags;
}

} // namespace body
} // namespace conduit
