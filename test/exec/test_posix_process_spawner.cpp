#include <catch2/catch_test_macros.hpp>

#include <sre_gateway/exec/posix_process_spawner.hpp>
#include <sre_gateway/exec/process_runner.hpp>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <signal.h>
#include <unistd.h>

using namespace sre_gateway;
using namespace std::chrono_literals;

// These tests spawn real processes (sh, cat, sleep).

namespace {

RunnerOptions LiveOptions() {
    RunnerOptions options;
    options.kill_grace = 200ms;
    if (const char* path = std::getenv("PATH")) {
        options.base_environment["PATH"] = path;
    }
    return options;
}

ProcessRunner MakeLiveRunner(RunnerOptions options = LiveOptions()) {
    return ProcessRunner(std::make_unique<PosixProcessSpawner>(), std::move(options));
}

Command Sh(const std::string& script, std::chrono::milliseconds timeout = 10s) {
    Command cmd;
    cmd.argv = {"sh", "-c", script};
    cmd.timeout = timeout;
    return cmd;
}

std::string TempPath(const std::string& name) {
    return "/tmp/sre_gateway_test_" + std::to_string(::getpid()) + "_" + name;
}

pid_t ReadPid(const std::string& path) {
    std::ifstream in(path);
    pid_t pid = 0;
    in >> pid;
    return pid;
}

// True once the pid no longer names a live process (gone or zombie).
bool ProcessGone(pid_t pid, std::chrono::milliseconds wait = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (true) {
        if (::kill(pid, 0) != 0 && errno == ESRCH) {
            return true;
        }
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (std::getline(stat, line)) {
            auto close_paren = line.rfind(')');
            if (close_paren != std::string::npos && close_paren + 2 < line.size() &&
                line[close_paren + 2] == 'Z') {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(20ms);
    }
}

} // anonymous namespace

// ===========================================================================
// Normal completion
// ===========================================================================

TEST_CASE("PosixProcessSpawner: captures stdout and exit 0", "[exec][posix]") {
    auto runner = MakeLiveRunner();
    auto result = runner.Run(Sh("echo hello"));

    CHECK(result.succeeded);
    CHECK(result.exit_code == 0);
    CHECK(result.stdout_data == "hello\n");
}

TEST_CASE("PosixProcessSpawner: separates stderr and reports exit code", "[exec][posix]") {
    auto runner = MakeLiveRunner();
    auto result = runner.Run(Sh("echo oops >&2; exit 3"));

    CHECK_FALSE(result.succeeded);
    CHECK(result.exit_code == 3);
    CHECK(result.stdout_data.empty());
    CHECK(result.stderr_data == "oops\n");
}

TEST_CASE("PosixProcessSpawner: argv is passed without a shell", "[exec][posix]") {
    auto runner = MakeLiveRunner();
    Command cmd;
    cmd.argv = {"printf", "%s|%s", "a b", "$HOME"};
    auto result = runner.Run(cmd);

    REQUIRE(result.succeeded);
    CHECK(result.stdout_data == "a b|$HOME");
}

TEST_CASE("PosixProcessSpawner: stdin payload is piped", "[exec][posix][stdin]") {
    auto runner = MakeLiveRunner();
    Command cmd;
    cmd.argv = {"cat"};
    cmd.stdin_data = "line one\nline two\n";

    auto result = runner.Run(cmd);
    REQUIRE(result.succeeded);
    CHECK(result.stdout_data == "line one\nline two\n");
}

TEST_CASE("PosixProcessSpawner: large stdin and stdout do not deadlock", "[exec][posix][stdin]") {
    auto runner = MakeLiveRunner();
    Command cmd;
    cmd.argv = {"cat"};
    cmd.stdin_data = std::string(4 * 1024 * 1024, 'x');

    auto result = runner.Run(cmd);
    REQUIRE(result.succeeded);
    CHECK(result.stdout_data.size() == cmd.stdin_data->size());
}

TEST_CASE("PosixProcessSpawner: child without stdin sees EOF", "[exec][posix][stdin]") {
    auto runner = MakeLiveRunner();
    Command cmd;
    cmd.argv = {"cat"};
    cmd.timeout = 5s;

    auto result = runner.Run(cmd);
    CHECK(result.succeeded);
    CHECK(result.stdout_data.empty());
}

TEST_CASE("PosixProcessSpawner: environment overrides reach the child", "[exec][posix][env]") {
    auto runner = MakeLiveRunner();
    Command cmd = Sh("printf %s \"$SRE_GATEWAY_TEST_VAR\"");
    cmd.environment["SRE_GATEWAY_TEST_VAR"] = "from-command";

    auto result = runner.Run(cmd);
    REQUIRE(result.succeeded);
    CHECK(result.stdout_data == "from-command");
}

TEST_CASE("PosixProcessSpawner: working directory is applied", "[exec][posix]") {
    auto runner = MakeLiveRunner();
    Command cmd;
    cmd.argv = {"pwd"};
    cmd.working_directory = "/";

    auto result = runner.Run(cmd);
    REQUIRE(result.succeeded);
    CHECK(result.stdout_data == "/\n");
}

// ===========================================================================
// Spawn failures
// ===========================================================================

TEST_CASE("PosixProcessSpawner: missing executable is a spawn failure", "[exec][posix][error]") {
    auto runner = MakeLiveRunner();
    Command cmd;
    cmd.argv = {"sre-gateway-definitely-not-installed"};

    auto result = runner.Run(cmd);
    CHECK_FALSE(result.succeeded);
    CHECK(result.exit_code == -1);
    CHECK(result.stderr_data.find("cannot execute") != std::string::npos);
}

TEST_CASE("PosixProcessSpawner: bad working directory is a spawn failure", "[exec][posix][error]") {
    auto runner = MakeLiveRunner();
    Command cmd;
    cmd.argv = {"pwd"};
    cmd.working_directory = "/nonexistent/sre-gateway";

    auto result = runner.Run(cmd);
    CHECK_FALSE(result.succeeded);
    CHECK(result.exit_code == -1);
    CHECK(result.stderr_data.find("cannot change directory") != std::string::npos);
}

// ===========================================================================
// Timeout, signals, cancellation
// ===========================================================================

TEST_CASE("PosixProcessSpawner: timeout kills the child", "[exec][posix][timeout]") {
    auto runner = MakeLiveRunner();
    const auto pid_file = TempPath("timeout.pid");
    std::remove(pid_file.c_str());

    const auto start = std::chrono::steady_clock::now();
    auto result = runner.Run(Sh("echo $$ > " + pid_file + "; exec sleep 30", 300ms));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK_FALSE(result.succeeded);
    CHECK(result.exit_code == -1);
    CHECK(result.stderr_data == "Command timed out after 300ms");
    CHECK(elapsed < 5s);

    pid_t pid = ReadPid(pid_file);
    REQUIRE(pid > 0);
    CHECK(ProcessGone(pid));
    std::remove(pid_file.c_str());
}

TEST_CASE("PosixProcessSpawner: timeout takes down the process group", "[exec][posix][timeout]") {
    auto runner = MakeLiveRunner();
    const auto pid_file = TempPath("grandchild.pid");
    std::remove(pid_file.c_str());

    auto result = runner.Run(Sh("sleep 30 & echo $! > " + pid_file + "; wait", 300ms));
    CHECK(result.exit_code == -1);

    pid_t grandchild = ReadPid(pid_file);
    REQUIRE(grandchild > 0);
    CHECK(ProcessGone(grandchild));
    std::remove(pid_file.c_str());
}

TEST_CASE("PosixProcessSpawner: SIGTERM-ignoring child is killed after grace", "[exec][posix][timeout]") {
    auto runner = MakeLiveRunner();
    const auto start = std::chrono::steady_clock::now();
    auto result = runner.Run(Sh("trap '' TERM; sleep 30", 200ms));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(result.exit_code == -1);
    CHECK(elapsed < 5s);
}

TEST_CASE("PosixProcessSpawner: killed by signal reports 128 + N", "[exec][posix]") {
    auto runner = MakeLiveRunner();
    auto result = runner.Run(Sh("kill -TERM $$"));

    CHECK_FALSE(result.succeeded);
    CHECK(result.exit_code == 128 + SIGTERM);
}

TEST_CASE("PosixProcessSpawner: cancellation stops a running command", "[exec][posix][cancel]") {
    auto runner = MakeLiveRunner();
    CancellationToken token;

    std::thread canceller([&token] {
        std::this_thread::sleep_for(200ms);
        token.Cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = runner.Run(Sh("sleep 30"), &token);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    CHECK_FALSE(result.succeeded);
    CHECK(result.exit_code == -1);
    CHECK(result.stderr_data == "Command cancelled");
    CHECK(elapsed < 5s);
}

// ===========================================================================
// Admission gate
// ===========================================================================

TEST_CASE("ProcessRunner: admission limit refuses after waiting", "[exec][posix][admission]") {
    auto options = LiveOptions();
    options.max_concurrent_processes = 1;
    auto runner = MakeLiveRunner(options);

    ExecutionResult first;
    std::thread holder([&runner, &first] { first = runner.Run(Sh("sleep 1")); });

    const auto wait_until = std::chrono::steady_clock::now() + 5s;
    while (runner.RunningCount() == 0 && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(runner.RunningCount() == 1);

    auto refused = runner.Run(Sh("echo never", 100ms));
    CHECK_FALSE(refused.succeeded);
    CHECK(refused.exit_code == -1);
    CHECK(refused.stderr_data.find("Process limit reached") != std::string::npos);

    holder.join();
    CHECK(first.succeeded);
    CHECK(runner.RunningCount() == 0);
}

TEST_CASE("ProcessRunner: queued command runs once a slot frees", "[exec][posix][admission]") {
    auto options = LiveOptions();
    options.max_concurrent_processes = 1;
    auto runner = MakeLiveRunner(options);

    std::thread holder([&runner] { (void)runner.Run(Sh("sleep 0.3")); });
    const auto wait_until = std::chrono::steady_clock::now() + 5s;
    while (runner.RunningCount() == 0 && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(10ms);
    }

    auto queued = runner.Run(Sh("echo later", 5s));
    holder.join();

    CHECK(queued.succeeded);
    CHECK(queued.stdout_data == "later\n");
}
