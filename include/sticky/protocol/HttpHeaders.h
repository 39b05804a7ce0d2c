#pragma once

#include <string>
#include <utility>
#include <vector>

namespace sticky {
namespace protocol {

// Ordered header list with case-insensitive names. A name may repeat
// (Set-Cookie does); iteration yields fields in insertion order and the
// spelling of a name is whatever the first insertion used.
class HttpHeaders {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    // First value of the field, or empty string.
    std::string get(const std::string& name) const;
    std::vector<std::string> values(const std::string& name) const;
    bool has(const std::string& name) const;

    // Replace every value of the field with a single one.
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void del(const std::string& name);

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    void clear() { fields_.clear(); }

    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    static bool IEquals(const std::string& a, const std::string& b);
    // Value safe to put on the wire: CR and LF become spaces.
    static std::string WireValue(const std::string& value);

private:
    std::vector<Field> fields_;
};

} // namespace protocol
} // namespace sticky
