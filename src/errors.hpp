#pragma once
#include <stdexcept>
#include <string>

namespace agentbridge {

// Turn-fatal failures. Malformed backend output is deliberately absent: it
// always degrades to raw text and never reaches the caller as an error.

// Backend process exited non-zero.
class ProcessFailed : public std::runtime_error {
public:
    ProcessFailed(int exit_code, std::string stderr_text)
        : std::runtime_error(stderr_text.empty()
                                 ? "process exited with code " + std::to_string(exit_code)
                                 : stderr_text)
        , exit_code_(exit_code)
        , stderr_(std::move(stderr_text)) {}

    int exit_code() const { return exit_code_; }
    const std::string& stderr_text() const { return stderr_; }

private:
    int exit_code_;
    std::string stderr_;
};

// Deadline exceeded, either waiting for exit or waiting for one stdout line.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(int deadline_seconds)
        : std::runtime_error("timed out after " + std::to_string(deadline_seconds) + " seconds")
        , deadline_seconds_(deadline_seconds) {}

    int deadline_seconds() const { return deadline_seconds_; }

private:
    int deadline_seconds_;
};

// Resume requested without a resolvable native identity, or unusable settings.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// pipe/fork/exec failure before the backend ever ran.
class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace agentbridge
