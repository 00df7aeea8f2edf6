#pragma once

#include <string>

#include "conduit/protocol/HeaderMap.h"

namespace conduit {
namespace protocol {

// Response head. The body streams separately.
class HttpResponse {
public:
    explicit HttpResponse(int code) : statusCode_(code) {}

    int statusCode() const { return statusCode_; }

    HeaderMap& headers() { return headers_; }
    const HeaderMap& headers() const { return headers_; }

    std::string getHeader(const std::string& field) const {
        const std::string* v = headers_.get(field);
        return v ? *v : std::string();
    }

    void setHeader(const std::string& key, const std::string& value) { headers_.set(key, value); }

private:
    int statusCode_;
    HeaderMap headers_;
};

} // namespace protocol
} // namespace conduit
