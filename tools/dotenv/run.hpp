/**
 * dotenv CLI - run command declarations
 */

#pragma once

#include "common.hpp"

#include <dotenv/launcher.hpp>

#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace dotenv::cli {

struct RunOptions {
    std::string file;                       // -f, --file
    std::string environment;                // -e, --environment
    std::string config_dir;                 // --config-dir
    bool strict = false;                    // --strict
    bool dry_run = false;                   // --dry-run
    std::vector<std::string> command_line;  // command and its arguments
};

void setup_run(CLI::App& app, GlobalOptions& opts, RunOptions& run_opts);

// Command line left over after option parsing, without a leading "--"
std::vector<std::string> command_line_from(const CLI::App& app);

// Translate parsed options into a library request
LaunchRequest build_request(const RunOptions& run_opts);

int cmd_run(const GlobalOptions& opts, const RunOptions& run_opts);

} // namespace dotenv::cli
