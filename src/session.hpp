#pragma once
#include "session_repository.hpp"
#include "types.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sqlsession {

// Result of binding an agent to the session.
struct AgentRestore {
    SessionAgent agent;             // stored snapshot, or the one just created
    std::vector<Message> messages;  // conversation, redactions applied
    bool restored = false;          // true when the agent already existed
};

// Binds one session id to a repository and tracks per-agent message
// numbering. The session row is created on construction when absent.
//
// The repository must outlive the manager.
class SessionManager {
public:
    SessionManager(std::string session_id, SessionRepository& repository,
                   SessionType session_type = SessionType::Agent);

    const std::string& session_id() const { return session_id_; }
    const Session& session() const { return session_; }

    // Create the agent with `initial_messages`, or restore it with its
    // stored conversation. Each agent id can be initialized once per manager.
    AgentRestore initialize_agent(const SessionAgent& agent,
                                  const std::vector<Message>& initial_messages = {});

    // Persist the next message of an agent. Ids start at 0 and follow the
    // latest appended or restored message.
    SessionMessage append_message(const std::string& agent_id, const Message& message);

    // Attach replacement content to the latest message of an agent.
    void redact_latest_message(const std::string& agent_id, const Message& replacement);

    void sync_agent(const SessionAgent& agent);

    // Stored multi-agent state, or `initial_state` after storing it.
    nlohmann::json initialize_multi_agent(const std::string& multi_agent_id,
                                          const nlohmann::json& initial_state);

    void sync_multi_agent(const std::string& multi_agent_id, const nlohmann::json& state);

    // Delete the session and everything under it.
    void delete_session();

private:
    std::string session_id_;
    SessionRepository& repository_;
    Session session_;
    std::unordered_set<std::string> initialized_agents_;
    std::unordered_map<std::string, SessionMessage> latest_message_;
    mutable std::mutex mutex_;
};

} // namespace sqlsession
