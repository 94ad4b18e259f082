#pragma once

#include "dotenv/result.hpp"
#include "dotenv/types.hpp"

#include <string>
#include <vector>

namespace dotenv {
namespace exec {

// ============================================================================
// EXECUTION SPEC
// ============================================================================

struct ExecSpec {
    std::string binary;               // resolved path passed to execve
    std::vector<std::string> argv;    // argv[0] is the command as typed
    EnvironmentList environment;
};

struct ExecResult {
    bool ok = false;
    int exit_code = -1;
    std::string error;
};

// Exit status reported when the child could not exec
constexpr int EXIT_EXEC_FAILED = 127;

// ============================================================================
// EXECUTABLE LOOKUP
// ============================================================================

/**
 * Locate `command` for execution.
 *
 * A command containing '/' is used as given. Otherwise each directory of
 * `search_path` (colon separated, empty entries meaning ".") is tried in
 * order. Fails with NOT_FOUND when nothing executable matches.
 */
Result<std::string> resolve_executable(const std::string& command,
                                       const std::string& search_path);

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

/**
 * Spawn the command with fork/execve, wait for it and report its status.
 *
 * stdin, stdout and stderr are inherited. The exit code is the child's
 * own, or 128 + signal number when it was killed by a signal.
 */
ExecResult execute(const ExecSpec& spec);

} // namespace exec
} // namespace dotenv
