#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <sys/types.h>

namespace agentbridge {

struct ProcessOutput {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
};

enum class ReadStatus { Line, Eof, Timeout };

struct LineRead {
    ReadStatus status = ReadStatus::Eof;
    std::string line; // without the trailing newline
};

// A running backend process with piped stdout/stderr.
// Destroying the handle kills and reaps the process if it is still alive.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    // Wait up to timeout_ms for the next complete stdout line.
    virtual LineRead read_line(int timeout_ms) = 0;

    // Reap the process. Returns nullopt if it did not exit within timeout_ms.
    virtual std::optional<int> wait(int timeout_ms) = 0;

    // stderr collected so far (drained while reading stdout and waiting)
    virtual std::string stderr_output() const = 0;

    // SIGKILL the process group and reap. Safe to call more than once.
    virtual void kill() = 0;
};

// Abstract process launcher (injectable for testing)
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Run to completion. Throws TimeoutError if the process has not exited
    // within timeout_seconds (the process is killed first), SpawnError if it
    // could not be started. A non-zero exit is reported, not thrown.
    virtual ProcessOutput run(const std::vector<std::string>& argv,
                              const std::string& working_dir,
                              int timeout_seconds) = 0;

    // Start a process for incremental line reads. Throws SpawnError.
    virtual std::unique_ptr<ProcessHandle> spawn(const std::vector<std::string>& argv,
                                                 const std::string& working_dir) = 0;
};

// fork/exec implementation. stdin is /dev/null; the child gets its own
// session so kill() reaches any helpers it starts.
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessOutput run(const std::vector<std::string>& argv,
                      const std::string& working_dir,
                      int timeout_seconds) override;

    std::unique_ptr<ProcessHandle> spawn(const std::vector<std::string>& argv,
                                         const std::string& working_dir) override;
};

class ChildProcess : public ProcessHandle {
public:
    ChildProcess(pid_t pid, int stdout_fd, int stderr_fd);
    ~ChildProcess() override;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    LineRead read_line(int timeout_ms) override;
    std::optional<int> wait(int timeout_ms) override;
    std::string stderr_output() const override { return stderr_buf_; }
    void kill() override;

    // Read whatever is available on stdout/stderr, waiting up to timeout_ms.
    // Returns false on timeout with nothing read.
    bool pump(int timeout_ms);

    bool output_closed() const { return stdout_fd_ < 0 && stderr_fd_ < 0; }
    std::string take_stdout();
    pid_t pid() const { return pid_; }

private:
    bool try_reap(int flags);
    void close_fds();

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    std::string stdout_buf_;
    std::string stderr_buf_;
    bool reaped_ = false;
    int exit_code_ = -1;
};

// Convert a waitpid() status to an exit code (128 + signal when killed)
int decode_wait_status(int status);

} // namespace agentbridge
