#pragma once

#include <string>
#include <optional>
#include <cstddef>

#include "sticky/protocol/HttpHeaders.h"
#include "sticky/protocol/QueryString.h"

namespace sticky {
namespace protocol {

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kOptions, kPatch
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    bool setMethod(const char* start, const char* end);
    Method getMethod() const { return method_; }
    const char* methodString() const;

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    void setPath(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    // Raw query, without the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    void setQuery(const std::string& query) { query_ = query; }
    const std::string& query() const { return query_; }
    QueryString queryParams() const { return QueryString::Parse(query_); }

    // "Name: value" line, colon points into [start, end).
    void addHeader(const char* start, const char* colon, const char* end);
    void addHeader(const std::string& field, const std::string& value) { headers_.add(field, value); }
    std::string getHeader(const std::string& field) const { return headers_.get(field); }

    const HttpHeaders& headers() const { return headers_; }
    HttpHeaders& headers() { return headers_; }

    // Looks through every Cookie header line; nullopt when no line has it.
    std::optional<std::string> cookie(const std::string& name) const;

    // Copy of this request whose Cookie header also carries name=value, as
    // if the client had sent it. The receiver is left untouched.
    HttpRequest withAddedCookie(const std::string& name, const std::string& value) const;

    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that);

private:
    Method method_;
    Version version_;
    std::string path_;
    std::string query_;
    HttpHeaders headers_;
    std::string body_;
};

} // namespace protocol
} // namespace sticky
