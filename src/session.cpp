#include "session.hpp"
#include <utility>

namespace sqlsession {

SessionManager::SessionManager(std::string session_id, SessionRepository& repository,
                               SessionType session_type)
    : session_id_(std::move(session_id)), repository_(repository)
{
    auto existing = repository_.read_session(session_id_);
    if (existing) {
        session_ = std::move(*existing);
        return;
    }

    session_.session_id = session_id_;
    session_.session_type = session_type;
    repository_.create_session(session_);
}

AgentRestore SessionManager::initialize_agent(const SessionAgent& agent,
                                              const std::vector<Message>& initial_messages) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_agents_.count(agent.agent_id) != 0) {
        throw SessionError("Agent " + agent.agent_id +
                           " is already initialized in session " + session_id_);
    }

    AgentRestore result;
    auto stored = repository_.read_agent(session_id_, agent.agent_id);
    if (!stored) {
        repository_.create_agent(session_id_, agent);
        result.agent = agent;

        int64_t next_id = 0;
        for (const auto& msg : initial_messages) {
            SessionMessage sm;
            sm.message = msg;
            sm.message_id = next_id++;
            repository_.create_message(session_id_, agent.agent_id, sm);
            latest_message_[agent.agent_id] = sm;
            result.messages.push_back(msg);
        }
        initialized_agents_.insert(agent.agent_id);
        return result;
    }

    result.agent = std::move(*stored);
    result.restored = true;

    auto messages = repository_.list_messages(session_id_, agent.agent_id);
    result.messages.reserve(messages.size());
    for (const auto& sm : messages) {
        result.messages.push_back(sm.effective_message());
    }
    if (!messages.empty()) {
        latest_message_[agent.agent_id] = messages.back();
    }
    initialized_agents_.insert(agent.agent_id);
    return result;
}

SessionMessage SessionManager::append_message(const std::string& agent_id,
                                              const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    SessionMessage sm;
    sm.message = message;
    auto it = latest_message_.find(agent_id);
    sm.message_id = (it == latest_message_.end()) ? 0 : it->second.message_id + 1;

    repository_.create_message(session_id_, agent_id, sm);
    latest_message_[agent_id] = sm;
    return sm;
}

void SessionManager::redact_latest_message(const std::string& agent_id,
                                           const Message& replacement) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = latest_message_.find(agent_id);
    if (it == latest_message_.end()) {
        throw SessionError("No message to redact for agent " + agent_id);
    }

    SessionMessage updated = it->second;
    updated.redact_message = replacement;
    repository_.update_message(session_id_, agent_id, updated);
    it->second = std::move(updated);
}

void SessionManager::sync_agent(const SessionAgent& agent) {
    repository_.update_agent(session_id_, agent);
}

nlohmann::json SessionManager::initialize_multi_agent(const std::string& multi_agent_id,
                                                      const nlohmann::json& initial_state) {
    try {
        return repository_.read_multi_agent(session_id_, multi_agent_id);
    } catch (const NotFoundError&) {
        // First run for this workflow: store the initial state below.
    }
    repository_.create_multi_agent(session_id_, multi_agent_id, initial_state);
    return initial_state;
}

void SessionManager::sync_multi_agent(const std::string& multi_agent_id,
                                      const nlohmann::json& state) {
    repository_.update_multi_agent(session_id_, multi_agent_id, state);
}

void SessionManager::delete_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    repository_.delete_session(session_id_);
    initialized_agents_.clear();
    latest_message_.clear();
}

} // namespace sqlsession
