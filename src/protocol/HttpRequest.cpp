#include "sticky/protocol/HttpRequest.h"
#include "sticky/protocol/Cookie.h"

#include <cctype>
#include <utility>

namespace sticky {
namespace protocol {

bool HttpRequest::setMethod(const char* start, const char* end) {
    std::string m(start, end);
    if (m == "GET") method_ = kGet;
    else if (m == "POST") method_ = kPost;
    else if (m == "HEAD") method_ = kHead;
    else if (m == "PUT") method_ = kPut;
    else if (m == "DELETE") method_ = kDelete;
    else if (m == "OPTIONS") method_ = kOptions;
    else if (m == "PATCH") method_ = kPatch;
    else method_ = kInvalid;
    return method_ != kInvalid;
}

const char* HttpRequest::methodString() const {
    switch (method_) {
        case kGet: return "GET";
        case kPost: return "POST";
        case kHead: return "HEAD";
        case kPut: return "PUT";
        case kDelete: return "DELETE";
        case kOptions: return "OPTIONS";
        case kPatch: return "PATCH";
        default: return "UNKNOWN";
    }
}

void HttpRequest::addHeader(const char* start, const char* colon, const char* end) {
    std::string field(start, colon);
    ++colon;
    while (colon < end && std::isspace(static_cast<unsigned char>(*colon))) {
        ++colon;
    }
    std::string value(colon, end);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    headers_.add(field, value);
}

std::optional<std::string> HttpRequest::cookie(const std::string& name) const {
    for (const auto& line : headers_.values("Cookie")) {
        auto v = FindCookie(line, name);
        if (v) return v;
    }
    return std::nullopt;
}

HttpRequest HttpRequest::withAddedCookie(const std::string& name, const std::string& value) const {
    HttpRequest augmented(*this);
    const std::string pair = Cookie(name, value).toRequestPair();
    std::string merged;
    for (const auto& line : headers_.values("Cookie")) {
        if (line.empty()) continue;
        merged += line;
        merged += "; ";
    }
    merged += pair;
    augmented.headers_.set("Cookie", merged);
    return augmented;
}

void HttpRequest::swap(HttpRequest& that) {
    std::swap(method_, that.method_);
    std::swap(version_, that.version_);
    path_.swap(that.path_);
    query_.swap(that.query_);
    std::swap(headers_, that.headers_);
    body_.swap(that.body_);
}

} // namespace protocol
} // namespace sticky
