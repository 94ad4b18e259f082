#pragma once

#include "dotenv/environment_table.hpp"
#include "dotenv/result.hpp"
#include "dotenv/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dotenv {

// ============================================================================
// Merge Inputs and Outputs
// ============================================================================

// Command line as given to the launcher, before alias resolution
struct Invocation {
    std::optional<std::string> command;
    std::vector<std::string> args;
    bool strict = false;  // --strict
};

struct MergeResult {
    EnvironmentList environment;  // final KEY=VALUE list for the child
    std::string command;
    std::vector<std::string> args;
    bool strict = false;          // effective strict mode
    bool aliased = false;         // DOTENV_COMMAND replaced the command
};

// ============================================================================
// Merge Engine
// ============================================================================

// Layer tables in increasing precedence (later tables win)
EnvironmentTable layer_tables(const std::vector<EnvironmentTable>& tables);

/**
 * @brief Compute the child environment and command line
 *
 * Output order is the ambient environment (original order, minus control
 * keys, DOTENV_CONFIG_DIR and keys redefined by the tables) followed by the
 * effective table in its own order. In strict mode the ambient environment is omitted
 * entirely. DOTENV_COMMAND and DOTENV_STRICT are consumed and never appear
 * in the output.
 *
 * Fails with CONFIG_ERROR when no command remains after alias resolution.
 */
Result<MergeResult> merge(const EnvironmentList& ambient,
                          const std::vector<EnvironmentTable>& tables,
                          const Invocation& invocation);

} // namespace dotenv
