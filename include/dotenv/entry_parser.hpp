#pragma once

#include "dotenv/tokenizer.hpp"
#include "dotenv/types.hpp"

#include <optional>
#include <string>

namespace dotenv {

// ============================================================================
// Entry Parser
// ============================================================================

// Convert one logical entry into a variable.
// Returns nullopt when the entry is dropped:
// - no '=' separator
// - empty key
// - unquoted value that trims to empty
std::optional<EnvironmentVariable> parse_entry(const LogicalEntry& entry);

// True when `value` is exactly one "..." or '...' span
bool is_quoted_value(const std::string& value);

// Decode \n \t \r \\ \" \' ; other sequences pass through unchanged
std::string decode_escapes(const std::string& s);

} // namespace dotenv
