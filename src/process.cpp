#include "process.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agentbridge {

using Clock = std::chrono::steady_clock;

static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    if (left <= 0) return 0;
    return static_cast<int>(std::min<long long>(left, 1 << 30));
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── ChildProcess ────────────────────────────────────────────────

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd)
{}

ChildProcess::~ChildProcess() {
    kill();
}

void ChildProcess::close_fds() {
    if (stdout_fd_ >= 0) { ::close(stdout_fd_); stdout_fd_ = -1; }
    if (stderr_fd_ >= 0) { ::close(stderr_fd_); stderr_fd_ = -1; }
}

bool ChildProcess::pump(int timeout_ms) {
    struct pollfd fds[2];
    int* owners[2];
    std::string* sinks[2];
    nfds_t n = 0;

    if (stdout_fd_ >= 0) {
        fds[n] = {stdout_fd_, POLLIN, 0};
        owners[n] = &stdout_fd_;
        sinks[n] = &stdout_buf_;
        ++n;
    }
    if (stderr_fd_ >= 0) {
        fds[n] = {stderr_fd_, POLLIN, 0};
        owners[n] = &stderr_fd_;
        sinks[n] = &stderr_buf_;
        ++n;
    }
    if (n == 0) return true;

    int ret = ::poll(fds, n, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) return true;
        close_fds();
        return true;
    }
    if (ret == 0) return false;

    std::array<char, 4096> buffer;
    for (nfds_t i = 0; i < n; ++i) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
        ssize_t got = ::read(fds[i].fd, buffer.data(), buffer.size());
        if (got > 0) {
            sinks[i]->append(buffer.data(), static_cast<size_t>(got));
        } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
            ::close(*owners[i]);
            *owners[i] = -1;
        }
    }
    return true;
}

LineRead ChildProcess::read_line(int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        auto newline = stdout_buf_.find('\n');
        if (newline != std::string::npos) {
            std::string line = stdout_buf_.substr(0, newline);
            stdout_buf_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return {ReadStatus::Line, std::move(line)};
        }

        if (stdout_fd_ < 0) {
            // Final line without a trailing newline
            if (!stdout_buf_.empty()) {
                std::string line = std::move(stdout_buf_);
                stdout_buf_.clear();
                return {ReadStatus::Line, std::move(line)};
            }
            return {ReadStatus::Eof, {}};
        }

        int left = remaining_ms(deadline);
        if (left <= 0 || !pump(left)) {
            return {ReadStatus::Timeout, {}};
        }
    }
}

bool ChildProcess::try_reap(int flags) {
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, flags);
    if (r == pid_) {
        exit_code_ = decode_wait_status(status);
        reaped_ = true;
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        reaped_ = true;
        return true;
    }
    return false;
}

std::optional<int> ChildProcess::wait(int timeout_ms) {
    if (reaped_) return exit_code_;
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        if (try_reap(WNOHANG)) return exit_code_;
        int left = remaining_ms(deadline);
        if (left <= 0) return std::nullopt;

        // Keep draining the pipes so a chatty child can't block on write
        int slice = std::min(left, 50);
        if (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
            pump(slice);
        } else {
            ::poll(nullptr, 0, slice);
        }
    }
}

void ChildProcess::kill() {
    if (!reaped_) {
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        while (!try_reap(0)) {
            if (errno != EINTR) break;
        }
        reaped_ = true;
    }
    close_fds();
}

std::string ChildProcess::take_stdout() {
    std::string out = std::move(stdout_buf_);
    stdout_buf_.clear();
    return out;
}

// ── Spawning ────────────────────────────────────────────────────

// Close-on-exec from creation: a fork on another thread must not inherit them
static bool make_cloexec_pipe(int fds[2]) {
    return ::pipe2(fds, O_CLOEXEC) == 0;
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

static std::unique_ptr<ChildProcess> spawn_child(const std::vector<std::string>& argv,
                                                 const std::string& working_dir) {
    if (argv.empty()) {
        throw SpawnError("Cannot spawn an empty command");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // carries errno if chdir/exec fails

    if (!make_cloexec_pipe(out_pipe) || !make_cloexec_pipe(err_pipe) ||
        !make_cloexec_pipe(exec_pipe)) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        throw SpawnError("Failed to create pipes");
    }

    // Built before fork: the child may only make async-signal-safe calls
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);
    const char* cwd = working_dir.empty() ? nullptr : working_dir.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        throw SpawnError("Failed to fork process");
    }

    if (pid == 0) {
        // Child process: own session so the whole group can be killed
        ::setsid();
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        if (cwd && ::chdir(cwd) != 0) {
            int e = errno;
            ssize_t w = ::write(exec_pipe[1], &e, sizeof(e));
            (void)w;
            _exit(127);
        }
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t w = ::write(exec_pipe[1], &e, sizeof(e));
        (void)w;
        _exit(127);
    }

    // Parent process
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        std::string what = cwd ? " in " + working_dir : "";
        throw SpawnError("Failed to start " + argv[0] + what + ": " +
                         std::strerror(child_errno));
    }

    return std::make_unique<ChildProcess>(pid, out_pipe[0], err_pipe[0]);
}

// ── PosixProcessRunner ──────────────────────────────────────────

ProcessOutput PosixProcessRunner::run(const std::vector<std::string>& argv,
                                      const std::string& working_dir,
                                      int timeout_seconds) {
    auto child = spawn_child(argv, working_dir);
    auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds);

    while (!child->output_closed()) {
        int left = remaining_ms(deadline);
        if (left <= 0 || !child->pump(left)) {
            child->kill();
            throw TimeoutError(timeout_seconds);
        }
    }

    auto code = child->wait(std::max(remaining_ms(deadline), 1));
    if (!code) {
        child->kill();
        throw TimeoutError(timeout_seconds);
    }

    ProcessOutput output;
    output.exit_code = *code;
    output.stdout_text = child->take_stdout();
    output.stderr_text = child->stderr_output();
    return output;
}

std::unique_ptr<ProcessHandle> PosixProcessRunner::spawn(const std::vector<std::string>& argv,
                                                         const std::string& working_dir) {
    return spawn_child(argv, working_dir);
}

} // namespace agentbridge
