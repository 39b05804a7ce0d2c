#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sticky {
namespace protocol {

// Parse cookie header value and return the value of a cookie by name.
// Example: "a=1; b=2" + "b" => "2"
// Returns empty string if not found.
std::string GetCookieValue(const std::string& cookieHeader, const std::string& name);

// Like GetCookieValue, but tells "absent" apart from "present with an empty
// value" ("a=1; b=" + "b" => "").
std::optional<std::string> FindCookie(const std::string& cookieHeader, const std::string& name);

// Name and value of the leading pair of one Set-Cookie line. The line is
// trimmed and cut at the first ';'; the pair splits on its first '=', so a
// value may itself contain '='. Trailing attributes are ignored.
// Empty lines and pairs without '=' yield nullopt.
std::optional<std::pair<std::string, std::string>> ParseSetCookiePair(const std::string& setCookieLine);

// Value of the first Set-Cookie line whose cookie is called `name`.
// Later lines with the same name are not considered.
std::optional<std::string> FindSetCookieValue(const std::vector<std::string>& setCookieLines,
                                              const std::string& name);

struct Cookie {
    std::string name;
    std::string value;
    std::string path;
    // Emitted as "Max-Age=<n>" when set; 0 asks the client to drop the cookie.
    std::optional<int> maxAge;
    // Preformatted IMF-fixdate, e.g. "Thu, 01 Jan 1970 00:00:00 GMT".
    std::string expires;

    Cookie() = default;
    Cookie(std::string n, std::string v)
        : name(std::move(n)), value(std::move(v)) {}

    // "name=value; Path=/; Expires=...; Max-Age=0"
    std::string toSetCookieString() const;
    // "name=value", for a request Cookie header.
    std::string toRequestPair() const;
};

// Cookie value as it may appear on the wire: bytes outside cookie-octet
// (controls, '"', ';', '\\', non-ASCII) are dropped; a value containing
// space or ',' is wrapped in double quotes.
std::string SanitizeCookieValue(const std::string& value);

} // namespace protocol
} // namespace sticky
