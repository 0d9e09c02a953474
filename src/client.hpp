#pragma once
#include "backend.hpp"
#include "event.hpp"
#include "process.hpp"
#include <memory>
#include <optional>
#include <string>

namespace agentbridge {

// What a streamed turn left behind once Done has been delivered
struct StreamOutcome {
    bool produced_output = false; // at least one Token was delivered
    bool failed = false;          // at least one Error was delivered
    bool cancelled = false;       // the callback returned false
    std::string text;             // concatenated tokens
    std::optional<std::string> native_id;
};

// Executes one turn of a backend CLI: argv from the backend, process from
// the runner, output through the backend's decoder.
class AgentClient {
public:
    AgentClient(std::unique_ptr<Backend> backend,
                ProcessRunner& runner,
                int timeout_seconds);

    // Run to completion. Throws ProcessFailed, TimeoutError or SpawnError.
    BufferedResult run_buffered(const TurnPlan& plan);

    // Deliver events as lines arrive; never throws for process failures.
    // Exactly one Done is delivered unless the callback cancelled first.
    StreamOutcome run_streaming(const TurnPlan& plan, const StreamCallback& callback);

    const Backend& backend() const { return *backend_; }
    int timeout_seconds() const { return timeout_seconds_; }

private:
    std::unique_ptr<Backend> backend_;
    ProcessRunner& runner_;
    int timeout_seconds_;
};

} // namespace agentbridge
