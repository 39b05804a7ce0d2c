#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sticky {
namespace protocol {

// Decode "%XX" escapes. With plusAsSpace, '+' decodes to ' ' (form
// encoding, as used in query strings). Returns nullopt for a truncated or
// non-hex escape and for "%00".
std::optional<std::string> UriUnescape(std::string_view src, bool plusAsSpace);

// Decoded "application/x-www-form-urlencoded" query parameters, in order.
class QueryString {
public:
    // `query` is the part after '?'; a leading '?' is tolerated.
    // Pairs with a ';', or whose key or value does not decode, are skipped.
    static QueryString Parse(std::string_view query);

    // First value for key, or empty string.
    std::string get(const std::string& key) const;
    bool has(const std::string& key) const;
    std::vector<std::string> values(const std::string& key) const;

    size_t size() const { return params_.size(); }
    bool empty() const { return params_.empty(); }

private:
    std::vector<std::pair<std::string, std::string>> params_;
};

} // namespace protocol
} // namespace sticky
