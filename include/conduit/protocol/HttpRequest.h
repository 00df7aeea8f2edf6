#pragma once

#include <optional>
#include <string>
#include <utility>

#include "conduit/protocol/HeaderMap.h"

namespace conduit {
namespace protocol {

// Request head as seen by the data plane. The body travels separately as a
// body::Body stream.
class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kPatch, kOptions, kConnect, kTrace
    };

    enum Version {
        kUnknown, kHttp10, kHttp11, kHttp2
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown), path_("/") {}

    // Unrecognized tokens (WebDAV PROPFIND, MKCOL, ...) map to kInvalid but
    // are kept verbatim for methodString().
    bool setMethod(const std::string& m) {
        methodToken_ = m;
        if (m == "GET") method_ = kGet;
        else if (m == "POST") method_ = kPost;
        else if (m == "HEAD") method_ = kHead;
        else if (m == "PUT") method_ = kPut;
        else if (m == "DELETE") method_ = kDelete;
        else if (m == "PATCH") method_ = kPatch;
        else if (m == "OPTIONS") method_ = kOptions;
        else if (m == "CONNECT") method_ = kConnect;
        else if (m == "TRACE") method_ = kTrace;
        else method_ = kInvalid;
        return method_ != kInvalid;
    }

    bool isExtensionMethod() const { return method_ == kInvalid && !methodToken_.empty(); }

    // Canonical name of a known method, the raw token of an extension method,
    // "UNKNOWN" when no method was set.
    const char* methodString() const {
        switch (method_) {
            case kGet: return "GET";
            case kPost: return "POST";
            case kHead: return "HEAD";
            case kPut: return "PUT";
            case kDelete: return "DELETE";
            case kPatch: return "PATCH";
            case kOptions: return "OPTIONS";
            case kConnect: return "CONNECT";
            case kTrace: return "TRACE";
            default: return methodToken_.empty() ? "UNKNOWN" : methodToken_.c_str();
        }
    }

    void setVersion(Version v) { version_ = v; }

    // "HTTP/1.1" style name, or nullptr for kUnknown.
    const char* versionString() const {
        switch (version_) {
            case kHttp10: return "HTTP/1.0";
            case kHttp11: return "HTTP/1.1";
            case kHttp2: return "HTTP/2.0";
            default: return nullptr;
        }
    }

    // Absolute-form requests and HTTP/2 carry a scheme; origin-form HTTP/1 requests do not.
    void setScheme(std::string scheme) { scheme_ = std::move(scheme); }
    const std::optional<std::string>& scheme() const { return scheme_; }

    void setAuthority(std::string authority) { authority_ = std::move(authority); }
    const std::optional<std::string>& authority() const { return authority_; }

    const std::string& path() const { return path_; }

    // Query string without the leading '?'.
    const std::optional<std::string>& query() const { return query_; }

    // Splits "/path?query" into path and query.
    void setTarget(const std::string& target) {
        auto q = target.find('?');
        if (q == std::string::npos) {
            path_ = target;
            query_.reset();
        } else {
            path_ = target.substr(0, q);
            query_ = target.substr(q + 1);
        }
        if (path_.empty()) path_ = "/";
    }

    // scheme://authority/path?query when scheme and authority are known,
    // otherwise the origin-form target.
    std::string fullUrl() const {
        std::string out;
        if (scheme_ && authority_) {
            out.append(*scheme_).append("://").append(*authority_);
        }
        out.append(path_);
        if (query_) out.append("?").append(*query_);
        return out;
    }

    HeaderMap& headers() { return headers_; }
    const HeaderMap& headers() const { return headers_; }

    std::string getHeader(const std::string& field) const {
        const std::string* v = headers_.get(field);
        return v ? *v : std::string();
    }

    void setHeader(const std::string& field, const std::string& value) { headers_.set(field, value); }
    void removeHeader(const std::string& field) { headers_.remove(field); }

private:
    Method method_;
    std::string methodToken_;
    Version version_;
    std::optional<std::string> scheme_;
    std::optional<std::string> authority_;
    std::string path_;
    std::optional<std::string> query_;
    HeaderMap headers_;
};

} // namespace protocol
} // namespace conduit
