#pragma once

#include "dotenv/result.hpp"
#include "dotenv/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dotenv {

// ============================================================================
// Environment Table
// ============================================================================

/**
 * @brief Ordered name -> value mapping loaded from one or more files
 *
 * Keys are unique. Setting an existing key replaces its value in place, so
 * iteration follows first-insertion order.
 */
class EnvironmentTable {
public:
    using const_iterator = std::vector<EnvironmentVariable>::const_iterator;

    void set(const std::string& name, const std::string& value);

    // Remove a key; returns false when it was absent
    bool erase(const std::string& name);

    bool contains(const std::string& name) const;
    std::optional<std::string> get(const std::string& name) const;

    // Overlay `other` on top of this table (other wins on collision)
    void merge_from(const EnvironmentTable& other);

    // Value of DOTENV_COMMAND, if present
    std::optional<std::string> command_alias() const;

    // Value of DOTENV_STRICT, if present
    std::optional<std::string> strict_override() const;

    // DOTENV_STRICT is present with a non-empty value
    bool forces_strict() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<EnvironmentVariable>& entries() const { return entries_; }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const EnvironmentTable& other) const { return entries_ == other.entries_; }

private:
    void reindex();

    std::vector<EnvironmentVariable> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// ============================================================================
// Table Builder
// ============================================================================

// Tokenize and parse .env content into a table.
// Fails with MALFORMED_ENTRY on an unterminated quote or a dangling
// continuation backslash.
Result<EnvironmentTable> parse(const std::string& content);

} // namespace dotenv
