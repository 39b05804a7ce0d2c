#include "sticky/protocol/HttpHeaders.h"

#include <algorithm>

namespace sticky {
namespace protocol {

bool HttpHeaders::IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
        if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
        if (ca != cb) return false;
    }
    return true;
}

std::string HttpHeaders::WireValue(const std::string& value) {
    std::string out(value);
    std::replace(out.begin(), out.end(), '\r', ' ');
    std::replace(out.begin(), out.end(), '\n', ' ');
    return out;
}

std::string HttpHeaders::get(const std::string& name) const {
    for (const auto& f : fields_) {
        if (IEquals(f.first, name)) return f.second;
    }
    return "";
}

std::vector<std::string> HttpHeaders::values(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& f : fields_) {
        if (IEquals(f.first, name)) out.push_back(f.second);
    }
    return out;
}

bool HttpHeaders::has(const std::string& name) const {
    return std::any_of(fields_.begin(), fields_.end(),
                       [&](const Field& f) { return IEquals(f.first, name); });
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const Field& f) { return IEquals(f.first, name); });
    if (it == fields_.end()) {
        fields_.emplace_back(name, value);
        return;
    }
    it->second = value;
    fields_.erase(std::remove_if(it + 1, fields_.end(),
                                 [&](const Field& f) { return IEquals(f.first, name); }),
                  fields_.end());
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    std::string spelling = name;
    for (const auto& f : fields_) {
        if (IEquals(f.first, name)) {
            spelling = f.first;
            break;
        }
    }
    fields_.emplace_back(std::move(spelling), value);
}

void HttpHeaders::del(const std::string& name) {
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&](const Field& f) { return IEquals(f.first, name); }),
                  fields_.end());
}

} // namespace protocol
} // namespace sticky
