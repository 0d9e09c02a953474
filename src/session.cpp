#include "session.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <iostream>

namespace agentbridge {

SessionManager::SessionManager(std::unique_ptr<Backend> backend,
                               ProcessRunner& runner,
                               int timeout_seconds,
                               ChatSink* sink)
    : client_(std::move(backend), runner, timeout_seconds)
    , resolver_(create_profile_resolver(client_.backend().settings(),
                                        client_.backend().skill_sigil()))
    , sink_(sink)
{}

TurnPlan SessionManager::plan_turn(const TurnRequest& request) const {
    const Backend& backend = client_.backend();
    auto existing = registry_.resolve(request.conversation_key);

    TurnPlan plan;
    if (request.intent == TurnIntent::New ||
        (request.intent == TurnIntent::Auto && !existing)) {
        plan.is_new = true;
        plan.session_id = request.session_id && !request.session_id->empty()
                              ? *request.session_id
                              : generate_uuid();
        std::cerr << "[session] New " << backend.backend_name() << " session for "
                  << request.conversation_key << " -> " << plan.session_id << "\n";
    } else {
        if (!existing) {
            throw ConfigurationError("No session to resume for " + request.conversation_key);
        }
        if (backend.requires_native_resume_id() && !existing->native_resume_id) {
            throw ConfigurationError("No " + backend.backend_name() +
                                     " thread id recorded for " +
                                     request.conversation_key);
        }
        plan.is_new = false;
        plan.session_id = existing->session_id;
        plan.resume_id = existing->resume_id();
        std::cerr << "[session] Resuming " << plan.resume_id << " for "
                  << request.conversation_key << "\n";
    }

    plan.prompt = resolver_->resolve(request.question, request.agent_type);
    return plan;
}

void SessionManager::record(const TurnRequest& request, const TurnPlan& plan,
                            const std::optional<std::string>& native_id,
                            const std::string& answer) {
    registry_.commit(request.conversation_key, plan.session_id, native_id);
    if (plan.is_new) {
        std::cerr << "[session] Stored session " << plan.session_id << " for "
                  << request.conversation_key << "\n";
    }

    if (sink_ && !answer.empty()) {
        sink_->push(request.conversation_key, request.user_id,
                    request.question, request.message_type);
        sink_->push(request.conversation_key, request.user_id,
                    answer, kAgentMessageType);
    }
}

TurnResult SessionManager::ask(const TurnRequest& request) {
    auto guard = registry_.lock(request.conversation_key);
    TurnPlan plan = plan_turn(request);

    BufferedResult output = client_.run_buffered(plan);
    record(request, plan, output.native_id, output.text);

    TurnResult result;
    result.text = std::move(output.text);
    result.session_id = plan.session_id;
    result.is_new = plan.is_new;
    result.committed = true;
    return result;
}

TurnResult SessionManager::ask_streaming(const TurnRequest& request,
                                         const StreamCallback& callback) {
    auto guard = registry_.lock(request.conversation_key);
    TurnResult result;

    TurnPlan plan;
    try {
        plan = plan_turn(request);
    } catch (const ConfigurationError& e) {
        std::cerr << "[session] " << e.what() << "\n";
        if (callback(StreamEvent::error(e.what()))) callback(StreamEvent::done());
        return result;
    }
    result.session_id = plan.session_id;
    result.is_new = plan.is_new;

    StreamOutcome outcome = client_.run_streaming(plan, callback);
    result.text = outcome.text;

    // Partial or failed streams leave the registry untouched
    if (outcome.failed || outcome.cancelled || !outcome.produced_output) {
        return result;
    }
    record(request, plan, outcome.native_id, outcome.text);
    result.committed = true;
    return result;
}

bool SessionManager::remove_session(const std::string& conversation_key) {
    bool removed = registry_.remove(conversation_key);
    if (removed) {
        std::cerr << "[session] Cleared session for " << conversation_key << "\n";
    }
    return removed;
}

} // namespace agentbridge
