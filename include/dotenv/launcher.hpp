#pragma once

/**
 * @file launcher.hpp
 * @brief Library entry point: load, merge and launch for one invocation
 *
 * @example
 * ```cpp
 * dotenv::LaunchRequest request;
 * request.invocation.command = "env";
 *
 * auto launcher = dotenv::Launcher::create();
 * auto plan = launcher->resolve(request);
 * if (plan.isOk() && launcher->locate(plan.value()).isOk()) {
 *     auto result = launcher->launch(plan.value());
 *     return result.exit_code;
 * }
 * ```
 */

#include "dotenv/exec.hpp"
#include "dotenv/loader.hpp"
#include "dotenv/merge.hpp"
#include "dotenv/result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dotenv {

struct LaunchRequest {
    LoadRequest load;
    Invocation invocation;
};

// Everything needed to start the child, plus where it came from
struct LaunchPlan {
    std::vector<std::string> sources;  // files that contributed, in precedence order
    MergeResult merged;
    std::string binary;                // resolved executable path
};

class Launcher {
public:
    /**
     * @brief Create a launcher bound to an ambient environment
     * @param ambient KEY=VALUE list the child may inherit
     * @param search_path PATH used to locate the command
     */
    static std::unique_ptr<Launcher> create(EnvironmentList ambient, std::string search_path);

    // Launcher over the current process environment and PATH
    static std::unique_ptr<Launcher> create();

    const EnvironmentList& ambient() const { return ambient_; }

    // Load the requested files and merge them; binary is left empty
    Result<LaunchPlan> resolve(const LaunchRequest& request) const;

    // Fill plan.binary from the launcher's search path
    Result<void> locate(LaunchPlan& plan) const;

    // Run the plan and wait for the child
    exec::ExecResult launch(const LaunchPlan& plan) const;

private:
    Launcher(EnvironmentList ambient, std::string search_path)
        : ambient_(std::move(ambient)), search_path_(std::move(search_path)) {}

    EnvironmentList ambient_;
    std::string search_path_;
};

} // namespace dotenv
