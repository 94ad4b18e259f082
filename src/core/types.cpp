#include "dotenv/types.hpp"

#include <algorithm>
#include <cctype>

namespace dotenv {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool is_control_key(const std::string& key) {
    for (const char* control : CONTROL_KEYS) {
        if (key == control) return true;
    }
    return false;
}

std::string to_kv_string(const std::string& name, const std::string& value) {
    return name + "=" + value;
}

std::string kv_key(const std::string& kv) {
    auto eq = kv.find('=');
    if (eq == std::string::npos) return kv;
    return kv.substr(0, eq);
}

std::string trim_left(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    return s.substr(start);
}

std::string trim_right(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && is_space(s[end - 1])) --end;
    return s.substr(0, end);
}

std::string trim(const std::string& s) {
    return trim_left(trim_right(s));
}

std::string to_upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace dotenv
