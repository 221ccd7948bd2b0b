#include <catch2/catch_test_macros.hpp>

#include "process/managed_process.hpp"
#include "test_helpers.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>

using namespace std::chrono_literals;

TEST_CASE("ManagedProcess", "[process]") {
    test::TmpDir dir;

    SECTION("CapturesStdoutAndStderr") {
        auto res = ManagedProcess::run({.argv = {"/bin/sh", "-c", "echo out; echo err >&2"}});
        REQUIRE(res);
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->out == "out\n");
        REQUIRE(res->err == "err\n");
    }

    SECTION("NonZeroExitIsNotAnError") {
        auto res = ManagedProcess::run({.argv = {"/bin/sh", "-c", "exit 3"}});
        REQUIRE(res);
        REQUIRE(res->exit_code == 3);
    }

    SECTION("MissingBinaryIsSpawnError") {
        ManagedProcess proc({.argv = {(dir / "does-not-exist").string()}});
        auto started = proc.start();
        REQUIRE_FALSE(started);
        REQUIRE(started.error().kind == ProcessError::Kind::Spawn);
        REQUIRE(started.error().code == ENOENT);
        REQUIRE(proc.state() == ProcessState::Failed);
    }

    SECTION("EmptyCommandLine") {
        auto res = ManagedProcess::run({});
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ProcessError::Kind::Spawn);
    }

    SECTION("TimeoutKillsChild") {
        auto start = std::chrono::steady_clock::now();
        ManagedProcess proc({.argv = {"/bin/sh", "-c", "echo partial >&2; sleep 30"}, .timeout = 300ms});
        REQUIRE(proc.start());
        pid_t pid = proc.pid();

        auto res = proc.wait();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ProcessError::Kind::Timeout);
        REQUIRE(res.error().err == "partial\n");
        REQUIRE(proc.state() == ProcessState::Failed);
        REQUIRE(std::chrono::steady_clock::now() - start < 10s);

        // Reaped: the pid no longer exists.
        REQUIRE(::kill(pid, 0) == -1);
    }

    SECTION("KilledBySignal") {
        auto res = ManagedProcess::run({.argv = {"/bin/sh", "-c", "kill -9 $$"}});
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ProcessError::Kind::Signal);
        REQUIRE(res.error().code == SIGKILL);
    }

    SECTION("WorkingDirectoryAndEnvironment") {
        auto res = ManagedProcess::run({
            .argv = {"/bin/sh", "-c", "pwd; echo \"$ECHO_TEST_PATH\""},
            .working_dir = dir.path.string(),
            .env_prepend = {{"ECHO_TEST_PATH", "/opt/bin"}},
        });
        REQUIRE(res);
        auto canonical = std::filesystem::canonical(dir.path).string();
        REQUIRE(res->out == canonical + "\n/opt/bin\n");
    }

    SECTION("DestructorReapsRunningChild") {
        pid_t pid;
        {
            ManagedProcess proc({.argv = {"/bin/sh", "-c", "sleep 30"}});
            REQUIRE(proc.start());
            REQUIRE(proc.state() == ProcessState::Running);
            pid = proc.pid();
        }
        REQUIRE(::kill(pid, 0) == -1);
    }
}
