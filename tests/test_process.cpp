#include <catch2/catch.hpp>
#include "process.hpp"
#include "errors.hpp"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <atomic>
#include <algorithm>
#include <unistd.h>
#include <signal.h>

using namespace agentbridge;

static std::vector<std::string> sh(const std::string& script) {
    return {"/bin/sh", "-c", script};
}

// Zombies count as dead: an unreaped orphan still answers kill(pid, 0)
static bool process_alive(pid_t pid) {
    if (::kill(pid, 0) != 0) return false;
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string content;
    std::getline(stat, content);
    auto paren = content.rfind(')');
    if (paren == std::string::npos || paren + 2 >= content.size()) return true;
    return content[paren + 2] != 'Z';
}

// ── run ──────────────────────────────────────────────────────────

TEST_CASE("PosixProcessRunner::run: captures stdout, stderr and exit code", "[process]") {
    PosixProcessRunner runner;
    auto out = runner.run(sh("echo out; echo err >&2; exit 3"), "", 10);
    REQUIRE(out.exit_code == 3);
    REQUIRE(out.stdout_text == "out\n");
    REQUIRE(out.stderr_text == "err\n");
}

TEST_CASE("PosixProcessRunner::run: arguments are not shell-interpreted", "[process]") {
    PosixProcessRunner runner;
    auto out = runner.run({"/bin/echo", "$HOME; `id` \"q\""}, "", 10);
    REQUIRE(out.exit_code == 0);
    REQUIRE(out.stdout_text == "$HOME; `id` \"q\"\n");
}

TEST_CASE("PosixProcessRunner::run: large output does not deadlock", "[process]") {
    PosixProcessRunner runner;
    auto out = runner.run(sh("i=0; while [ $i -lt 20000 ]; do echo line$i; "
                             "echo e$i >&2; i=$((i+1)); done"), "", 30);
    REQUIRE(out.exit_code == 0);
    REQUIRE(out.stdout_text.find("line19999\n") != std::string::npos);
}

TEST_CASE("PosixProcessRunner::run: working directory applied", "[process]") {
    PosixProcessRunner runner;
    auto tmp = std::filesystem::canonical(std::filesystem::temp_directory_path()).string();
    auto out = runner.run(sh("pwd -P"), tmp, 10);
    REQUIRE(out.stdout_text == tmp + "\n");
}

TEST_CASE("PosixProcessRunner::run: deadline kills the process", "[process]") {
    PosixProcessRunner runner;
    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(runner.run(sh("sleep 30"), "", 1), TimeoutError);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed < std::chrono::seconds(10));
}

TEST_CASE("PosixProcessRunner::run: missing executable is a spawn error", "[process]") {
    PosixProcessRunner runner;
    REQUIRE_THROWS_AS(runner.run({"/nonexistent/agentbridge-cli"}, "", 5), SpawnError);
}

TEST_CASE("PosixProcessRunner::run: missing working directory is a spawn error", "[process]") {
    PosixProcessRunner runner;
    REQUIRE_THROWS_AS(runner.run(sh("true"), "/nonexistent/agentbridge-dir", 5), SpawnError);
}

TEST_CASE("PosixProcessRunner::run: empty argv rejected", "[process]") {
    PosixProcessRunner runner;
    REQUIRE_THROWS_AS(runner.run({}, "", 5), SpawnError);
}

TEST_CASE("PosixProcessRunner::run: concurrent spawns do not hold its pipes open", "[process]") {
    PosixProcessRunner runner;
    std::atomic<bool> stop{false};

    // Long-lived children forked while the main thread keeps creating pipes
    std::vector<std::thread> spawners;
    for (int t = 0; t < 4; ++t) {
        spawners.emplace_back([&runner, &stop]() {
            std::vector<std::unique_ptr<ProcessHandle>> children;
            while (!stop.load() && children.size() < 40) {
                children.push_back(runner.spawn(sh("sleep 5"), ""));
            }
            while (!stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        });
    }

    auto slowest = std::chrono::milliseconds(0);
    for (int i = 0; i < 150; ++i) {
        auto start = std::chrono::steady_clock::now();
        auto out = runner.run({"true"}, "", 10);
        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        slowest = std::max(slowest, took);
        CHECK(out.exit_code == 0);
    }

    stop.store(true);
    for (auto& t : spawners) t.join();
    REQUIRE(slowest < std::chrono::milliseconds(2000));
}

// ── spawn / read_line ────────────────────────────────────────────

TEST_CASE("ChildProcess: lines read in order, final line without newline", "[process]") {
    PosixProcessRunner runner;
    auto child = runner.spawn(sh("echo one; echo two; printf three"), "");

    auto a = child->read_line(5000);
    auto b = child->read_line(5000);
    auto c = child->read_line(5000);
    auto d = child->read_line(5000);
    REQUIRE(a.status == ReadStatus::Line);
    REQUIRE(a.line == "one");
    REQUIRE(b.line == "two");
    REQUIRE(c.status == ReadStatus::Line);
    REQUIRE(c.line == "three");
    REQUIRE(d.status == ReadStatus::Eof);
    REQUIRE(child->wait(5000) == std::optional<int>(0));
}

TEST_CASE("ChildProcess: stderr collected alongside stdout", "[process]") {
    PosixProcessRunner runner;
    auto child = runner.spawn(sh("echo out; echo 'rate limited' >&2; exit 1"), "");
    while (child->read_line(5000).status == ReadStatus::Line) {}
    REQUIRE(child->wait(5000) == std::optional<int>(1));
    REQUIRE(child->stderr_output() == "rate limited\n");
}

TEST_CASE("ChildProcess: read_line times out on a silent process", "[process]") {
    PosixProcessRunner runner;
    auto child = runner.spawn(sh("sleep 30"), "");
    auto r = child->read_line(200);
    REQUIRE(r.status == ReadStatus::Timeout);
    child->kill();
}

TEST_CASE("ChildProcess: kill terminates the whole process group", "[process]") {
    PosixProcessRunner runner;
    // The shell prints the pid of a background grandchild, then waits
    auto child = runner.spawn(sh("sleep 30 & echo $!; wait"), "");
    auto r = child->read_line(5000);
    REQUIRE(r.status == ReadStatus::Line);
    pid_t grandchild = static_cast<pid_t>(std::stol(r.line));
    REQUIRE(process_alive(grandchild));

    child->kill();
    child->kill(); // idempotent

    // The grandchild is reparented; give init a moment to reap it
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (process_alive(grandchild) && std::chrono::steady_clock::now() < deadline) {
        ::usleep(20000);
    }
    REQUIRE_FALSE(process_alive(grandchild));
}

TEST_CASE("ChildProcess: destructor kills a running process", "[process]") {
    PosixProcessRunner runner;
    pid_t pid;
    {
        auto child = runner.spawn(sh("echo $$; sleep 30"), "");
        auto r = child->read_line(5000);
        REQUIRE(r.status == ReadStatus::Line);
        pid = static_cast<pid_t>(std::stol(r.line));
    }
    REQUIRE_FALSE(process_alive(pid));
}

TEST_CASE("decode_wait_status: signalled child maps to 128 + signal", "[process]") {
    PosixProcessRunner runner;
    auto out = runner.run(sh("kill -9 $$"), "", 10);
    REQUIRE(out.exit_code == 128 + SIGKILL);
}
