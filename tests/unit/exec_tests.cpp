#include <doctest/doctest.h>
#include <dotenv/exec.hpp>
#include <dotenv/platform.hpp>

#include "test_helpers.hpp"

#include <cerrno>
#include <csignal>
#include <filesystem>

#include <sys/wait.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/prctl.h>
#endif

using namespace dotenv;
using namespace dotenv::exec;

namespace {

ExecSpec shell(const std::string& script, EnvironmentList environment = {}) {
    ExecSpec spec;
    spec.binary = "/bin/sh";
    spec.argv = {"sh", "-c", script};
    spec.environment = std::move(environment);
    return spec;
}

// Fork, run `child` in the new process and return its exit status
template<typename F>
int exit_status_of_child(F child) {
    pid_t pid = fork();
    REQUIRE(pid != -1);
    if (pid == 0) {
        _exit(child());
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        REQUIRE(errno == EINTR);
    }
    REQUIRE(WIFEXITED(status));
    return WEXITSTATUS(status);
}

} // namespace

// =============================================================================
// Executable Lookup
// =============================================================================

TEST_CASE("resolve_executable searches the path in order") {
    auto found = resolve_executable("sh", "/nonexistent-dir:/bin:/usr/bin");
    REQUIRE(found.isOk());
    CHECK(found.value() == "/bin/sh");
}

TEST_CASE("resolve_executable uses commands with a slash as given") {
    CHECK(resolve_executable("/bin/sh", "").value() == "/bin/sh");

    auto missing = resolve_executable("/nonexistent/tool", "/bin");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("resolve_executable reports unknown commands") {
    auto missing = resolve_executable("dotenv-no-such-command", "/bin:/usr/bin");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::NOT_FOUND);
    CHECK(missing.error().message() == "command not found: dotenv-no-such-command");

    auto empty = resolve_executable("", "/bin");
    REQUIRE(empty.isErr());
    CHECK(empty.error().code() == ErrorCode::CONFIG_ERROR);
}

TEST_CASE("resolve_executable skips non-executable files") {
    dotenv::test::TempDir dir;
    dir.write("bin/tool", "#!/bin/sh\n");

    auto found = resolve_executable("tool", dir.file("bin"));
    CHECK(found.isErr());

    std::filesystem::permissions(dir.file("bin/tool"), std::filesystem::perms::owner_all);
    found = resolve_executable("tool", dir.file("bin"));
    REQUIRE(found.isOk());
    CHECK(found.value() == dir.file("bin/tool"));
}

// =============================================================================
// Process Execution
// =============================================================================

TEST_CASE("execute passes the exit code through") {
    auto result = execute(shell("exit 3"));
    REQUIRE(result.ok);
    CHECK(result.exit_code == 3);

    result = execute(shell("exit 0"));
    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
}

TEST_CASE("execute maps a fatal signal to 128 + signal") {
    auto result = execute(shell("kill -TERM $$"));
    REQUIRE(result.ok);
    CHECK(result.exit_code == 143);
}

TEST_CASE("execute gives the child exactly the requested environment") {
    auto result = execute(shell("test \"$GREETING\" = hello && test -z \"$HOME\"",
                                {"GREETING=hello"}));
    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
}

TEST_CASE("execute passes arguments") {
    ExecSpec spec = shell("exit $#");
    spec.argv.push_back("sh");
    spec.argv.push_back("a");
    spec.argv.push_back("b");

    auto result = execute(spec);
    REQUIRE(result.ok);
    CHECK(result.exit_code == 2);
}

TEST_CASE("execute reports a failed exec as 127") {
    ExecSpec spec;
    spec.binary = "/nonexistent/tool";
    spec.argv = {"tool"};

    auto result = execute(spec);
    REQUIRE(result.ok);
    CHECK(result.exit_code == EXIT_EXEC_FAILED);
}

// =============================================================================
// Child Lifetime Linkage
// =============================================================================

#if defined(__linux__)

TEST_CASE("configure_child_lifetime arms the parent-death signal") {
    int status = exit_status_of_child([] {
        if (configure_child_lifetime(static_cast<int>(getppid())).isErr()) {
            return 100;
        }
        int sig = 0;
        if (prctl(PR_GET_PDEATHSIG, &sig, 0, 0, 0) != 0) {
            return 101;
        }
        return sig;
    });
    CHECK(status == SIGTERM);
}

TEST_CASE("configure_child_lifetime fails when the launcher is gone") {
    int status = exit_status_of_child([] {
        // Our own pid is never our parent's
        return configure_child_lifetime(static_cast<int>(getpid())).isErr() ? 0 : 1;
    });
    CHECK(status == 0);
}

#else

TEST_CASE("configure_child_lifetime is a no-op") {
    CHECK(configure_child_lifetime(static_cast<int>(getpid())).isOk());
}

#endif
