#include "sticky/protocol/Cookie.h"

#include <cctype>

namespace sticky {
namespace protocol {

static inline void TrimInPlace(std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    s = s.substr(i, j - i);
}

std::optional<std::string> FindCookie(const std::string& cookieHeader, const std::string& name) {
    if (name.empty() || cookieHeader.empty()) return std::nullopt;

    size_t pos = 0;
    while (pos < cookieHeader.size()) {
        size_t next = cookieHeader.find(';', pos);
        if (next == std::string::npos) next = cookieHeader.size();

        std::string part = cookieHeader.substr(pos, next - pos);
        TrimInPlace(part);
        if (!part.empty()) {
            size_t eq = part.find('=');
            if (eq != std::string::npos) {
                std::string k = part.substr(0, eq);
                std::string v = part.substr(eq + 1);
                TrimInPlace(k);
                TrimInPlace(v);
                if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
                    v = v.substr(1, v.size() - 2);
                }
                if (k == name) return v;
            }
        }

        pos = next + 1;
    }
    return std::nullopt;
}

std::string GetCookieValue(const std::string& cookieHeader, const std::string& name) {
    return FindCookie(cookieHeader, name).value_or("");
}

std::optional<std::pair<std::string, std::string>> ParseSetCookiePair(const std::string& setCookieLine) {
    std::string line = setCookieLine;
    TrimInPlace(line);
    if (line.empty()) return std::nullopt;

    std::string first = line.substr(0, line.find(';'));
    TrimInPlace(first);

    const size_t eq = first.find('=');
    if (eq == std::string::npos) return std::nullopt;

    return std::make_pair(first.substr(0, eq), first.substr(eq + 1));
}

std::optional<std::string> FindSetCookieValue(const std::vector<std::string>& setCookieLines,
                                              const std::string& name) {
    for (const auto& line : setCookieLines) {
        auto pair = ParseSetCookiePair(line);
        if (pair && pair->first == name) return pair->second;
    }
    return std::nullopt;
}

static bool IsCookieValueByte(unsigned char c) {
    return c >= 0x20 && c < 0x7f && c != '"' && c != ';' && c != '\\';
}

std::string SanitizeCookieValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    bool needsQuotes = false;
    for (unsigned char c : value) {
        if (!IsCookieValueByte(c)) continue;
        if (c == ' ' || c == ',') needsQuotes = true;
        out.push_back(static_cast<char>(c));
    }
    if (needsQuotes) return "\"" + out + "\"";
    return out;
}

std::string Cookie::toRequestPair() const {
    return name + "=" + SanitizeCookieValue(value);
}

std::string Cookie::toSetCookieString() const {
    std::string out = toRequestPair();
    if (!path.empty()) {
        out += "; Path=";
        out += path;
    }
    if (!expires.empty()) {
        out += "; Expires=";
        out += expires;
    }
    if (maxAge) {
        out += "; Max-Age=";
        out += std::to_string(*maxAge < 0 ? 0 : *maxAge);
    }
    return out;
}

} // namespace protocol
} // namespace sticky
