#pragma once

#include "dotenv/result.hpp"
#include "dotenv/types.hpp"

#include <optional>
#include <string>

namespace dotenv {

// ============================================================================
// File Access
// ============================================================================

// Read a whole file.
// NOT_FOUND when the path does not exist, IO_ERROR for any other failure.
Result<std::string> read_file(const std::string& path);

bool path_exists(const std::string& path);

// Regular file with an execute bit for the current user
bool is_executable_file(const std::string& path);

// Absolute form of `path` relative to the working directory
std::string absolute_path(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Snapshot of the process environment as KEY=VALUE strings, in order
EnvironmentList current_environment();

// HOME, falling back to the password database
std::optional<std::string> home_directory();

// ============================================================================
// Child Lifetime Linkage
// ============================================================================

// Called in the forked child before exec with the launcher's pid. Ties the
// child's lifetime to the launcher where the platform supports it (Linux:
// parent-death signal); a no-op elsewhere. The implementation is chosen at
// build time.
Result<void> configure_child_lifetime(int launcher_pid);

} // namespace dotenv
