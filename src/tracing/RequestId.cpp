#include "conduit/tracing/RequestId.h"
#include "conduit/common/Logger.h"

#include <cctype>

namespace conduit {
namespace tracing {

namespace {

bool IsHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool AllHex(const std::string& s, size_t pos, size_t len) {
    for (size_t i = pos; i < pos + len; ++i) {
        if (!IsHex(s[i])) return false;
    }
    return true;
}

// 8-4-4-4-12 starting at pos; caller guarantees s.size() >= pos + 36.
bool IsHyphenatedAt(const std::string& s, size_t pos) {
    static const size_t kGroups[] = {8, 4, 4, 4, 12};
    size_t p = pos;
    for (size_t g = 0; g < 5; ++g) {
        if (!AllHex(s, p, kGroups[g])) return false;
        p += kGroups[g];
        if (g < 4) {
            if (s[p] != '-') return false;
            ++p;
        }
    }
    return true;
}

} // namespace

bool RequestId::IsValidUuid(const std::string& s) {
    switch (s.size()) {
        case 32:
            return AllHex(s, 0, 32);
        case 36:
            return IsHyphenatedAt(s, 0);
        case 38:
            return s.front() == '{' && s.back() == '}' && IsHyphenatedAt(s, 1);
        case 45:
            return s.compare(0, 9, "urn:uuid:") == 0 && IsHyphenatedAt(s, 9);
        default:
            return false;
    }
}

std::optional<RequestId> RequestId::FromRequest(const protocol::HttpRequest& request) {
    const std::string* value = request.headers().get(X_REQUEST_ID);
    if (!value || value->empty()) return std::nullopt;
    if (!IsValidUuid(*value)) {
        LOG_INFO << "Invalid UUID in " << X_REQUEST_ID << " header: " << *value;
        return std::nullopt;
    }
    return RequestId::Propagate(*value);
}

} // namespace tracing
} // namespace conduit
