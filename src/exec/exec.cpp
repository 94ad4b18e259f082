#include "dotenv/exec.hpp"
#include "dotenv/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace dotenv {
namespace exec {

namespace {

std::vector<char*> to_c_array(const std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (const auto& s : strings) {
        out.push_back(const_cast<char*>(s.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

} // namespace

Result<std::string> resolve_executable(const std::string& command,
                                       const std::string& search_path) {
    if (command.empty()) {
        return Result<std::string>::err(Error(ErrorCode::CONFIG_ERROR, "empty command"));
    }

    if (command.find('/') != std::string::npos) {
        if (!path_exists(command)) {
            return Result<std::string>::err(
                Error(ErrorCode::NOT_FOUND, "command not found: " + command));
        }
        return Result<std::string>::ok(command);
    }

    std::istringstream ss(search_path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = (std::filesystem::path(dir) / command).string();
        if (is_executable_file(candidate)) {
            return Result<std::string>::ok(candidate);
        }
    }

    return Result<std::string>::err(
        Error(ErrorCode::NOT_FOUND, "command not found: " + command));
}

ExecResult execute(const ExecSpec& spec) {
    ExecResult result;

    // Build C-style arrays before forking
    auto argv = to_c_array(spec.argv);
    auto envp = to_c_array(spec.environment);
    pid_t launcher = getpid();

    spdlog::debug("exec {} ({} argument(s), {} variable(s))",
                  spec.binary, spec.argv.size(), spec.environment.size());

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        if (configure_child_lifetime(static_cast<int>(launcher)).isErr()) {
            _exit(EXIT_EXEC_FAILED);
        }

        execve(spec.binary.c_str(), argv.data(), envp.data());

        // If execve returns, it failed
        _exit(EXIT_EXEC_FAILED);
    }

    // Parent process
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

} // namespace exec
} // namespace dotenv
