#include <doctest/doctest.h>
#include <dotenv/launcher.hpp>

#include "test_helpers.hpp"

#include <algorithm>

using namespace dotenv;
using dotenv::test::TempDir;

namespace {

const char* SEARCH_PATH = "/usr/bin:/bin";

std::unique_ptr<Launcher> make_launcher() {
    return Launcher::create({"PATH=/usr/bin:/bin", "HOME=/home/user", "SHLVL=1", "FOO=ambient"},
                            SEARCH_PATH);
}

LaunchRequest request_in(const TempDir& dir, const std::string& command,
                         std::vector<std::string> args = {}) {
    LaunchRequest request;
    request.load.working_dir = dir.path();
    request.invocation.command = command;
    request.invocation.args = std::move(args);
    return request;
}

bool contains(const EnvironmentList& env, const std::string& kv) {
    return std::find(env.begin(), env.end(), kv) != env.end();
}

int run(const Launcher& launcher, const LaunchRequest& request) {
    auto plan = launcher.resolve(request);
    REQUIRE(plan.isOk());
    REQUIRE(launcher.locate(plan.value()).isOk());
    auto result = launcher.launch(plan.value());
    REQUIRE(result.ok);
    return result.exit_code;
}

} // namespace

TEST_CASE("Launcher resolves file variables over the ambient environment") {
    TempDir dir;
    dir.write(".env", "FOO=file\nBAR=bar\n");
    auto launcher = make_launcher();

    auto plan = launcher->resolve(request_in(dir, "env"));
    REQUIRE(plan.isOk());

    const auto& env = plan.value().merged.environment;
    CHECK(contains(env, "FOO=file"));
    CHECK_FALSE(contains(env, "FOO=ambient"));
    CHECK(contains(env, "BAR=bar"));
    CHECK(contains(env, "PATH=/usr/bin:/bin"));
    REQUIRE(plan.value().sources.size() == 1);
    CHECK(plan.value().binary.empty());
}

TEST_CASE("Launcher without a local .env runs with the ambient environment") {
    TempDir dir;
    auto launcher = make_launcher();

    auto plan = launcher->resolve(request_in(dir, "env"));
    REQUIRE(plan.isOk());
    CHECK(plan.value().sources.empty());
    CHECK(plan.value().merged.environment == launcher->ambient());
}

TEST_CASE("Launcher strict mode hides the ambient environment") {
    TempDir dir;
    dir.write(".env", "ONLY=this\n");
    auto launcher = make_launcher();

    auto request = request_in(dir, "/bin/sh",
                              {"-c", "test \"$ONLY\" = this && test -z \"$HOME\""});
    request.invocation.strict = true;

    auto plan = launcher->resolve(request);
    REQUIRE(plan.isOk());
    CHECK(plan.value().merged.environment == EnvironmentList{"ONLY=this"});

    CHECK(run(*launcher, request) == 0);
}

TEST_CASE("Launcher honours DOTENV_STRICT from the file") {
    TempDir dir;
    dir.write(".env", "DOTENV_STRICT=1\nONLY=this\n");
    auto launcher = make_launcher();

    auto plan = launcher->resolve(request_in(dir, "env"));
    REQUIRE(plan.isOk());
    CHECK(plan.value().merged.strict);
    CHECK(plan.value().merged.environment == EnvironmentList{"ONLY=this"});
}

TEST_CASE("Launcher layers a named environment under the local file") {
    TempDir dir;
    dir.write("config/staging.env", "DB=staging\nREGION=eu\n");
    dir.write("project/.env", "DB=local\n");
    auto launcher = make_launcher();

    LaunchRequest request;
    request.load.environment = "staging";
    request.load.config_dir = dir.file("config");
    request.load.working_dir = dir.file("project");
    request.invocation.command = "/bin/sh";
    request.invocation.args = {"-c", "test \"$DB\" = local && test \"$REGION\" = eu"};

    auto plan = launcher->resolve(request);
    REQUIRE(plan.isOk());
    CHECK(plan.value().sources.size() == 2);

    CHECK(run(*launcher, request) == 0);
}

TEST_CASE("Launcher runs the aliased command") {
    TempDir dir;
    dir.write(".env", "DOTENV_COMMAND=/bin/sh\n");
    auto launcher = make_launcher();

    auto request = request_in(dir, "-c", {"exit 7"});
    auto plan = launcher->resolve(request);
    REQUIRE(plan.isOk());
    CHECK(plan.value().merged.aliased);
    CHECK_FALSE(contains(plan.value().merged.environment, "DOTENV_COMMAND=/bin/sh"));

    CHECK(run(*launcher, request) == 7);
}

TEST_CASE("Launcher passes the exit code through") {
    TempDir dir;
    auto launcher = make_launcher();
    CHECK(run(*launcher, request_in(dir, "sh", {"-c", "exit 42"})) == 42);
}

TEST_CASE("Launcher errors") {
    TempDir dir;
    auto launcher = make_launcher();

    SUBCASE("explicit file missing") {
        auto request = request_in(dir, "env");
        request.load.file = dir.file("missing.env");
        auto plan = launcher->resolve(request);
        REQUIRE(plan.isErr());
        CHECK(plan.error().code() == ErrorCode::NOT_FOUND);
    }

    SUBCASE("malformed local file") {
        dir.write(".env", "OK=1\nBAD=\"unterminated\n");
        auto plan = launcher->resolve(request_in(dir, "env"));
        REQUIRE(plan.isErr());
        CHECK(plan.error().code() == ErrorCode::MALFORMED_ENTRY);
        CHECK(*plan.error().line() == 2);
    }

    SUBCASE("command not on the search path") {
        auto plan = launcher->resolve(request_in(dir, "dotenv-no-such-command"));
        REQUIRE(plan.isOk());
        auto located = launcher->locate(plan.value());
        REQUIRE(located.isErr());
        CHECK(located.error().code() == ErrorCode::NOT_FOUND);
    }
}
