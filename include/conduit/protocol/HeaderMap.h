#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace conduit {
namespace protocol {

// Header field names compare case-insensitively (RFC 9110 5.1). The first
// spelling inserted is kept.
class HeaderMap {
public:
    struct CaseInsensitiveLess {
        bool operator()(const std::string& a, const std::string& b) const {
            const size_t n = a.size() < b.size() ? a.size() : b.size();
            for (size_t i = 0; i < n; ++i) {
                const char ca = Lower(a[i]);
                const char cb = Lower(b[i]);
                if (ca != cb) return ca < cb;
            }
            return a.size() < b.size();
        }

        static char Lower(char c) {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        }
    };

    using Map = std::map<std::string, std::string, CaseInsensitiveLess>;

    // Overwrites any existing value for the field.
    void set(const std::string& field, const std::string& value) {
        auto it = map_.find(field);
        if (it != map_.end()) {
            it->second = value;
            return;
        }
        map_.emplace(field, value);
    }

    void remove(const std::string& field) { map_.erase(field); }

    bool contains(const std::string& field) const { return map_.count(field) != 0; }

    // Returns nullptr if the field is absent.
    const std::string* get(const std::string& field) const {
        auto it = map_.find(field);
        return it == map_.end() ? nullptr : &it->second;
    }

    size_t size() const { return map_.size(); }

private:
    Map map_;
};

} // namespace protocol
} // namespace conduit
