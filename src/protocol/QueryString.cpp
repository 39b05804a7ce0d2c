#include "sticky/protocol/QueryString.h"
#include "sticky/common/Logger.h"

namespace sticky {
namespace protocol {

static int ParseHexDigit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 0xa;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 0xa;
    return -1;
}

std::optional<std::string> UriUnescape(std::string_view src, bool plusAsSpace) {
    std::string out;
    out.reserve(src.size());

    for (size_t i = 0; i < src.size(); ++i) {
        const char c = src[i];
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
            continue;
        }
        if (c != '%') {
            out.push_back(c);
            continue;
        }

        // percent sign at the end of string
        if (i + 2 >= src.size()) return std::nullopt;

        const int digit1 = ParseHexDigit(src[i + 1]);
        const int digit2 = ParseHexDigit(src[i + 2]);
        if (digit1 == -1 || digit2 == -1) return std::nullopt;

        const char ch = static_cast<char>((digit1 << 4) | digit2);
        if (ch == 0) return std::nullopt;

        out.push_back(ch);
        i += 2;
    }
    return out;
}

QueryString QueryString::Parse(std::string_view query) {
    QueryString qs;
    if (!query.empty() && query.front() == '?') query.remove_prefix(1);

    while (!query.empty()) {
        const size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view() : query.substr(amp + 1);

        if (pair.empty()) continue;
        if (pair.find(';') != std::string_view::npos) {
            LOG_DEBUG << "Skipping query pair with ';': " << pair;
            continue;
        }

        const size_t eq = pair.find('=');
        std::string_view rawKey = pair.substr(0, eq);
        std::string_view rawValue = (eq == std::string_view::npos) ? std::string_view() : pair.substr(eq + 1);

        auto key = UriUnescape(rawKey, true);
        auto value = UriUnescape(rawValue, true);
        if (!key || !value) {
            LOG_DEBUG << "Skipping query pair with invalid escape: " << pair;
            continue;
        }
        qs.params_.emplace_back(std::move(*key), std::move(*value));
    }
    return qs;
}

std::string QueryString::get(const std::string& key) const {
    for (const auto& p : params_) {
        if (p.first == key) return p.second;
    }
    return "";
}

bool QueryString::has(const std::string& key) const {
    for (const auto& p : params_) {
        if (p.first == key) return true;
    }
    return false;
}

std::vector<std::string> QueryString::values(const std::string& key) const {
    std::vector<std::string> out;
    for (const auto& p : params_) {
        if (p.first == key) out.push_back(p.second);
    }
    return out;
}

} // namespace protocol
} // namespace sticky
