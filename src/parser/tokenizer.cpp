#include "dotenv/tokenizer.hpp"
#include "dotenv/types.hpp"

namespace dotenv {

size_t find_unescaped(const std::string& s, char c, size_t from) {
    bool escaped = false;
    for (size_t i = from; i < s.size(); ++i) {
        if (escaped) {
            escaped = false;
            continue;
        }
        if (s[i] == '\\') {
            escaped = true;
        } else if (s[i] == c) {
            return i;
        }
    }
    return std::string::npos;
}

std::string strip_inline_comment(const std::string& s) {
    bool in_quotes = false;
    bool escaped = false;
    char quote = '"';

    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (in_quotes) {
            if (c == '\\') {
                escaped = true;
            } else if (c == quote) {
                in_quotes = false;
            }
        } else if (c == '"' || c == '\'') {
            in_quotes = true;
            quote = c;
        } else if (c == '#') {
            return s.substr(0, i);
        }
    }
    return s;
}

bool has_continuation(const std::string& s) {
    size_t backslashes = 0;
    for (auto it = s.rbegin(); it != s.rend() && *it == '\\'; ++it) {
        ++backslashes;
    }
    return backslashes % 2 == 1;
}

bool Tokenizer::read_line(std::string& out) {
    if (offset_ >= content_.size()) {
        return false;
    }

    size_t nl = content_.find('\n', offset_);
    if (nl == std::string::npos) {
        out = content_.substr(offset_);
        offset_ = content_.size();
    } else {
        out = content_.substr(offset_, nl - offset_);
        offset_ = nl + 1;
    }

    if (!out.empty() && out.back() == '\r') {
        out.pop_back();
    }
    ++line_;
    return true;
}

Result<std::optional<LogicalEntry>> Tokenizer::next() {
    using NextResult = Result<std::optional<LogicalEntry>>;

    std::string raw;
    while (read_line(raw)) {
        // Right side is kept verbatim in case a quoted span opens here
        std::string line = trim_left(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        LogicalEntry entry;
        entry.line = line_;

        // An '=' inside a trailing comment does not make an assignment
        size_t eq = find_unescaped(strip_inline_comment(line), '=');
        if (eq == std::string::npos) {
            auto joined = read_unquoted(line, entry.line);
            if (joined.isErr()) {
                return NextResult::err(joined.error());
            }
            // A continuation may bring the separator in on a later line
            const std::string& text = joined.value();
            eq = find_unescaped(text, '=');
            if (eq == std::string::npos) {
                entry.key = trim(text);
            } else {
                entry.has_separator = true;
                entry.key = trim(text.substr(0, eq));
                entry.value = trim(text.substr(eq + 1));
            }
            return NextResult::ok(std::move(entry));
        }

        entry.has_separator = true;
        entry.key = trim(line.substr(0, eq));
        std::string rest = trim_left(line.substr(eq + 1));

        if (!rest.empty() && (rest[0] == '"' || rest[0] == '\'')) {
            auto quoted = read_quoted(std::move(rest), entry.line);
            if (quoted.isErr()) {
                return NextResult::err(quoted.error());
            }
            entry.value = std::move(quoted.value());
        } else {
            auto value = read_unquoted(rest, entry.line);
            if (value.isErr()) {
                return NextResult::err(value.error());
            }
            entry.value = std::move(value.value());
        }
        return NextResult::ok(std::move(entry));
    }

    return NextResult::ok(std::nullopt);
}

Result<std::string> Tokenizer::read_quoted(std::string buffer, size_t start_line) {
    const char quote = buffer[0];

    while (true) {
        size_t close = find_unescaped(buffer, quote, 1);
        if (close != std::string::npos) {
            std::string trailing = trim_right(strip_inline_comment(buffer.substr(close + 1)));
            return Result<std::string>::ok(buffer.substr(0, close + 1) + trailing);
        }

        std::string next;
        if (!read_line(next)) {
            return Result<std::string>::err(
                Error(ErrorCode::MALFORMED_ENTRY, "unterminated quoted value", start_line));
        }
        // Newlines inside the span are content; rescan from the start of the
        // span so escape state carries across the line break
        buffer += '\n';
        buffer += next;
    }
}

Result<std::string> Tokenizer::read_unquoted(const std::string& text, size_t start_line) {
    std::string value = trim_right(strip_inline_comment(text));

    while (has_continuation(value)) {
        value.pop_back();

        std::string next;
        if (!read_line(next)) {
            return Result<std::string>::err(
                Error(ErrorCode::MALFORMED_ENTRY, "line continuation at end of input", start_line));
        }
        value += trim_right(strip_inline_comment(trim(next)));
    }

    return Result<std::string>::ok(std::move(value));
}

} // namespace dotenv
