/**
 * dotenv CLI - Common utilities and types
 */

#pragma once

#include <dotenv/result.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>

namespace dotenv::cli {

/**
 * Options shared by the whole command line.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

// Exit status for launcher-side failures (bad file, bad flags)
constexpr int EXIT_LAUNCHER_ERROR = 1;

/**
 * Route diagnostics to stderr; stdout belongs to the child.
 * Level: warn by default, debug with --verbose, err with --quiet.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("dotenv");
    logger->set_pattern("[%n] %^%l%$: %v");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["kind"] = error_code_to_string(error.code());
        if (error.line()) {
            j["line"] = *error.line();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        print_error(error.toString(), false);
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace dotenv::cli
