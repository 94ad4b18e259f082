/**
 * dotenv CLI - run
 *
 * Load the environment files, merge them with the process environment and
 * execute the command, propagating its exit code.
 */

#include "common.hpp"
#include "run.hpp"

#include <dotenv/launcher.hpp>
#include <dotenv/platform.hpp>
#include <CLI/CLI.hpp>

namespace dotenv::cli {

namespace {

void print_plan(const LaunchPlan& plan, bool json_mode) {
    const auto& merged = plan.merged;

    if (json_mode) {
        nlohmann::json j;
        j["ok"] = true;
        j["command"] = merged.command;
        j["args"] = merged.args;
        j["strict"] = merged.strict;
        j["aliased"] = merged.aliased;
        j["sources"] = plan.sources;
        j["environment"] = merged.environment;
        output_json(j);
        return;
    }

    std::cout << "command: " << merged.command << "\n";
    std::cout << "args:";
    for (const auto& arg : merged.args) {
        std::cout << " " << arg;
    }
    std::cout << "\n";
    std::cout << "strict: " << (merged.strict ? "true" : "false") << "\n";
    for (const auto& source : plan.sources) {
        std::cout << "source: " << source << "\n";
    }
    std::cout << "environment:\n";
    for (const auto& kv : merged.environment) {
        std::cout << "  " << kv << "\n";
    }
    std::cout.flush();
}

} // anonymous namespace

std::vector<std::string> command_line_from(const CLI::App& app) {
    auto command_line = app.remaining();
    // In prefix-command mode CLI11 keeps the "--" separator
    if (!command_line.empty() && command_line.front() == "--") {
        command_line.erase(command_line.begin());
    }
    return command_line;
}

LaunchRequest build_request(const RunOptions& run_opts) {
    LaunchRequest request;

    if (!run_opts.file.empty()) {
        request.load.file = run_opts.file;
    }
    if (!run_opts.environment.empty()) {
        request.load.environment = run_opts.environment;
    }
    if (!run_opts.config_dir.empty()) {
        request.load.config_dir = run_opts.config_dir;
    }

    request.invocation.strict = run_opts.strict;
    if (!run_opts.command_line.empty()) {
        request.invocation.command = run_opts.command_line.front();
        request.invocation.args.assign(run_opts.command_line.begin() + 1,
                                       run_opts.command_line.end());
    }
    return request;
}

int cmd_run(const GlobalOptions& opts, const RunOptions& run_opts) {
    auto launcher = Launcher::create();
    auto request = build_request(run_opts);

    auto plan = launcher->resolve(request);
    if (plan.isErr()) {
        print_error(plan.error(), opts.json);
        return EXIT_LAUNCHER_ERROR;
    }

    if (run_opts.dry_run) {
        print_plan(plan.value(), opts.json);
        return 0;
    }

    auto located = launcher->locate(plan.value());
    if (located.isErr()) {
        print_error("unable to execute command: " + located.error().message(), opts.json);
        return exec::EXIT_EXEC_FAILED;
    }

    auto result = launcher->launch(plan.value());
    if (!result.ok) {
        print_error("unable to execute command " + plan.value().merged.command + ": " + result.error,
                    opts.json);
        return EXIT_LAUNCHER_ERROR;
    }

    return result.exit_code;
}

void setup_run(CLI::App& app, GlobalOptions& opts, RunOptions& run_opts) {
    app.add_option("-f,--file", run_opts.file,
                   "Environment file to load instead of ./.env");
    app.add_option("-e,--environment", run_opts.environment,
                   "Named environment to load first (<config-dir>/NAME.env)");
    app.add_option("--config-dir", run_opts.config_dir,
                   "Directory of named environments (default: $DOTENV_CONFIG_DIR or ~/.dotenv)");
    app.add_flag("--strict", run_opts.strict,
                 "Only pass variables from the loaded files to the command");
    app.add_flag("--dry-run", run_opts.dry_run,
                 "Print the resolved command and environment instead of running it");

    app.add_flag("--json", opts.json, "Machine-readable output");
    auto* verbose = app.add_flag("-v,--verbose", opts.verbose, "Log loading and merge decisions");
    app.add_flag("-q,--quiet", opts.quiet, "Only log errors")->excludes(verbose);

    // Everything from the first positional on belongs to the command
    app.prefix_command();
}

} // namespace dotenv::cli
