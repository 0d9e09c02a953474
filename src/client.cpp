#include "client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace agentbridge {

static constexpr const char* kStreamTimeoutMessage = "Stream timeout";

AgentClient::AgentClient(std::unique_ptr<Backend> backend,
                         ProcessRunner& runner,
                         int timeout_seconds)
    : backend_(std::move(backend))
    , runner_(runner)
    , timeout_seconds_(std::clamp(timeout_seconds, 1, static_cast<int>(kMaxTimeoutSeconds)))
{}

BufferedResult AgentClient::run_buffered(const TurnPlan& plan) {
    auto argv = backend_->build_command(plan, OutputMode::Buffered);
    std::cerr << "[process] Running: " << format_command(argv) << "\n";

    ProcessOutput output = runner_.run(argv, backend_->settings().working_dir,
                                       timeout_seconds_);
    if (output.exit_code != 0) {
        std::cerr << "[process] " << backend_->backend_name()
                  << " exited with code " << output.exit_code << "\n";
        throw ProcessFailed(output.exit_code, trim(output.stderr_text));
    }

    return backend_->parse_output(output.stdout_text);
}

StreamOutcome AgentClient::run_streaming(const TurnPlan& plan,
                                         const StreamCallback& callback) {
    StreamOutcome outcome;

    auto emit = [&](const StreamEvent& event) {
        if (event.kind == EventKind::Token) {
            outcome.produced_output = true;
            outcome.text += event.text;
        } else if (event.kind == EventKind::Error) {
            outcome.failed = true;
        }
        if (!callback(event)) {
            outcome.cancelled = true;
            return false;
        }
        return true;
    };

    auto argv = backend_->build_command(plan, OutputMode::Streaming);
    std::cerr << "[process] Streaming: " << format_command(argv) << "\n";

    std::unique_ptr<ProcessHandle> child;
    try {
        child = runner_.spawn(argv, backend_->settings().working_dir);
    } catch (const SpawnError& e) {
        std::cerr << "[process] " << e.what() << "\n";
        if (emit(StreamEvent::error(e.what()))) emit(StreamEvent::done());
        return outcome;
    }

    auto decoder = backend_->create_decoder();
    const int read_timeout_ms = timeout_seconds_ * 1000;

    while (true) {
        LineRead read = child->read_line(read_timeout_ms);
        if (read.status == ReadStatus::Eof) break;

        if (read.status == ReadStatus::Timeout) {
            std::cerr << "[process] No output for " << timeout_seconds_
                      << "s, killing " << backend_->backend_name() << "\n";
            child->kill();
            outcome.native_id = decoder->native_id();
            if (emit(StreamEvent::error(kStreamTimeoutMessage))) emit(StreamEvent::done());
            return outcome;
        }

        for (const auto& event : decoder->decode(read.line)) {
            if (!emit(event)) {
                std::cerr << "[process] Consumer cancelled, killing "
                          << backend_->backend_name() << "\n";
                child->kill();
                outcome.native_id = decoder->native_id();
                return outcome;
            }
        }
    }

    outcome.native_id = decoder->native_id();

    auto code = child->wait(read_timeout_ms);
    if (!code) {
        child->kill();
        if (emit(StreamEvent::error(kStreamTimeoutMessage))) emit(StreamEvent::done());
        return outcome;
    }

    if (*code != 0) {
        std::cerr << "[process] " << backend_->backend_name()
                  << " exited with code " << *code << "\n";
        outcome.failed = true;
        std::string err = trim(child->stderr_output());
        if (!err.empty() && !emit(StreamEvent::error(err))) return outcome;
    }

    emit(StreamEvent::done());
    return outcome;
}

} // namespace agentbridge
