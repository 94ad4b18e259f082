#include "dotenv/entry_parser.hpp"

#include <spdlog/spdlog.h>

namespace dotenv {

bool is_quoted_value(const std::string& value) {
    if (value.size() < 2) {
        return false;
    }
    char quote = value.front();
    if (quote != '"' && quote != '\'') {
        return false;
    }
    // The span must close on the last character, not earlier
    return find_unescaped(value, quote, 1) == value.size() - 1;
}

std::string decode_escapes(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c != '\\' || i + 1 >= s.size()) {
            out += c;
            continue;
        }

        char next = s[i + 1];
        switch (next) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case '\\': out += '\\'; break;
            case '"': out += '"'; break;
            case '\'': out += '\''; break;
            default:
                out += c;
                out += next;
                break;
        }
        ++i;
    }

    return out;
}

std::optional<EnvironmentVariable> parse_entry(const LogicalEntry& entry) {
    if (!entry.has_separator) {
        spdlog::debug("line {}: no '=' in entry, ignored", entry.line);
        return std::nullopt;
    }

    std::string name = to_upper(entry.key);
    if (name.empty() || name.find('=') != std::string::npos) {
        spdlog::debug("line {}: invalid key '{}', ignored", entry.line, entry.key);
        return std::nullopt;
    }

    if (is_quoted_value(entry.value)) {
        std::string inner = entry.value.substr(1, entry.value.size() - 2);
        return EnvironmentVariable{std::move(name), decode_escapes(inner)};
    }

    std::string value = trim(entry.value);
    if (value.empty()) {
        spdlog::debug("line {}: {} has no value, ignored", entry.line, name);
        return std::nullopt;
    }

    return EnvironmentVariable{std::move(name), std::move(value)};
}

} // namespace dotenv
