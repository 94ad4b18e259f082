/**
 * dotenv CLI - Entry Point
 *
 * Run a command with variables loaded from .env files.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"
#include "run.hpp"

int main(int argc, char** argv) {
    using namespace dotenv::cli;

    CLI::App app{"dotenv - run a command with variables from a .env file"};
    app.set_version_flag("-V,--version", DOTENV_VERSION);
    app.footer(
        "Usage: dotenv [OPTIONS] [--] command [args...]\n\n"
        "Reads ./.env unless --file is given. With --environment NAME, NAME.env from the\n"
        "config directory is loaded first and the local file overrides it.\n"
        "The command's exit code is passed through.");

    GlobalOptions opts;
    RunOptions run_opts;
    setup_run(app, opts, run_opts);

    CLI11_PARSE(app, argc, argv);

    init_logging(opts);
    run_opts.command_line = command_line_from(app);

    return cmd_run(opts, run_opts);
}
