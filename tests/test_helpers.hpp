/**
 * Shared fixtures for the dotenv test suite.
 */

#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <unistd.h>

namespace dotenv::test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "dotenv_test") {
        static int counter = 0;
        root_ = fs::temp_directory_path() /
                (prefix + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::create_directories(root_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return root_.string(); }

    std::string file(const std::string& name) const { return (root_ / name).string(); }

    // Write `content` to `name` (parent directories created) and return its path
    std::string write(const std::string& name, const std::string& content) const {
        fs::path target = root_ / name;
        fs::create_directories(target.parent_path());
        std::ofstream(target, std::ios::binary) << content;
        return target.string();
    }

private:
    fs::path root_;
};

// Set or unset a process variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(std::string name, const std::optional<std::string>& value)
        : name_(std::move(name)) {
        if (const char* old = std::getenv(name_.c_str())) {
            previous_ = old;
        }
        if (value) {
            setenv(name_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ~ScopedEnv() {
        if (previous_) {
            setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace dotenv::test
