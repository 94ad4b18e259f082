#include "dotenv/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif

namespace dotenv {

namespace fs = std::filesystem;

Result<std::string> read_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::string>::err(
            Error(ErrorCode::NOT_FOUND, "file not found: " + absolute_path(path)));
    }
    if (fs::is_directory(path, ec)) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "unable to read file " + path + ": is a directory"));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "unable to open file " + path + ": " + std::strerror(errno)));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "unable to read file " + path));
    }
    return Result<std::string>::ok(ss.str());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_executable_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    return abs.lexically_normal().string();
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

EnvironmentList current_environment() {
    EnvironmentList env;
    for (char** ep = environ; ep && *ep; ++ep) {
        env.emplace_back(*ep);
    }
    return env;
}

std::optional<std::string> home_directory() {
    auto home = get_env("HOME");
    if (home && !home->empty()) {
        return home;
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }
    return std::nullopt;
}

} // namespace dotenv
