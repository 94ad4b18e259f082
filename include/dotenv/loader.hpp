#pragma once

#include "dotenv/environment_table.hpp"
#include "dotenv/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dotenv {

// ============================================================================
// Path Resolution
// ============================================================================

// Expand "~" and "~/..." to the home directory; other paths are unchanged
Result<std::string> expand_home(const std::string& path);

/**
 * Resolve the directory holding named environments.
 * Priority: explicit override > DOTENV_CONFIG_DIR env > ~/.dotenv
 */
Result<std::string> resolve_config_dir(const std::optional<std::string>& override_dir);

// <config_dir>/<name>.env
std::string named_environment_path(const std::string& name, const std::string& config_dir);

// ============================================================================
// Loading
// ============================================================================

// Read and parse one file. Parse errors carry the path as context.
Result<EnvironmentTable> load_env_file(const std::string& path);

// Which files to load for one invocation
struct LoadRequest {
    std::optional<std::string> environment;  // --environment NAME
    std::optional<std::string> file;         // --file PATH
    std::optional<std::string> config_dir;   // --config-dir DIR
    std::string working_dir = ".";           // where the implicit .env lives
};

// One loaded layer with its origin, for diagnostics
struct LoadedLayer {
    std::string path;
    bool present = false;  // false for a missing implicit .env
    EnvironmentTable table;
};

/**
 * Load the tables for an invocation in increasing precedence:
 * 1. the named environment, when requested (must exist)
 * 2. the explicit --file (must exist), or else the implicit ./.env
 *    (a missing implicit file yields an empty layer)
 */
Result<std::vector<LoadedLayer>> load_layers(const LoadRequest& request);

// Tables of `layers`, in the same order
std::vector<EnvironmentTable> tables_of(const std::vector<LoadedLayer>& layers);

} // namespace dotenv
