#pragma once

#include "dotenv/result.hpp"

#include <optional>
#include <string>

namespace dotenv {

// ============================================================================
// Logical Entry
// ============================================================================

// One KEY=VALUE entry reconstructed from one or more physical lines.
// The value still carries its surrounding quotes and escape sequences.
struct LogicalEntry {
    size_t line = 0;             // 1-based line the entry starts on
    std::string key;             // raw key text, trimmed
    std::string value;           // raw value text, comment stripped
    bool has_separator = false;  // false when the entry had no '='
};

// ============================================================================
// Line Tokenizer
// ============================================================================

/**
 * @brief Single-pass tokenizer over .env content
 *
 * Skips blank and comment lines, joins quoted spans and backslash
 * continuations, and yields one LogicalEntry per call to next().
 * An empty optional marks the end of input.
 */
class Tokenizer {
public:
    explicit Tokenizer(std::string content) : content_(std::move(content)) {}

    Result<std::optional<LogicalEntry>> next();

    // Number of physical lines consumed so far
    size_t line() const { return line_; }

private:
    bool read_line(std::string& out);
    Result<std::string> read_quoted(std::string buffer, size_t start_line);
    Result<std::string> read_unquoted(const std::string& text, size_t start_line);

    std::string content_;
    size_t offset_ = 0;
    size_t line_ = 0;
};

// ============================================================================
// Scanning Helpers
// ============================================================================

// Position of the first `c` in `s` at or after `from` that is not preceded
// by an escaping backslash, or npos
size_t find_unescaped(const std::string& s, char c, size_t from = 0);

// Cut `s` at the first '#' that lies outside a quoted span
std::string strip_inline_comment(const std::string& s);

// True when `s` ends in an odd run of backslashes
bool has_continuation(const std::string& s);

} // namespace dotenv
