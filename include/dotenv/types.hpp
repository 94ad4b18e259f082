#pragma once

#include <array>
#include <string>
#include <vector>

namespace dotenv {

// ============================================================================
// Reserved Keys
// ============================================================================

// Directive keys interpreted by dotenv itself; never forwarded to the child
constexpr const char* KEY_COMMAND = "DOTENV_COMMAND";
constexpr const char* KEY_STRICT = "DOTENV_STRICT";

constexpr std::array<const char*, 2> CONTROL_KEYS = {KEY_COMMAND, KEY_STRICT};

bool is_control_key(const std::string& key);

// Name of the implicit local file
constexpr const char* DEFAULT_ENV_FILE = ".env";

// Environment variable overriding the named-environment directory
constexpr const char* CONFIG_DIR_ENV = "DOTENV_CONFIG_DIR";

// ============================================================================
// Environment Variable
// ============================================================================

struct EnvironmentVariable {
    std::string name;   // non-empty, uppercased, no '='
    std::string value;

    bool operator==(const EnvironmentVariable& other) const {
        return name == other.name && value == other.value;
    }
    bool operator!=(const EnvironmentVariable& other) const { return !(*this == other); }
};

// Ordered KEY=VALUE list as consumed by execve
using EnvironmentList = std::vector<std::string>;

// Render a variable as KEY=VALUE
std::string to_kv_string(const std::string& name, const std::string& value);

// Key part of a KEY=VALUE string (whole string when there is no '=')
std::string kv_key(const std::string& kv);

// ============================================================================
// Text Helpers
// ============================================================================

std::string trim(const std::string& s);
std::string trim_left(const std::string& s);
std::string trim_right(const std::string& s);
std::string to_upper(const std::string& s);

} // namespace dotenv
