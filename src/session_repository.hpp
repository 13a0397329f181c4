#pragma once
#include "errors.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlsession {

// Abstract storage contract for hierarchical session state.
//
// Every method is synchronous. Failures are reported by throwing
// DuplicateEntityError, NotFoundError or StorageError (see errors.hpp).
// read_session/read_agent return std::nullopt for a missing row, while
// read_message/read_multi_agent throw NotFoundError. Callers rely on that
// difference: the former answer "does it exist", the latter must exist.
class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    virtual std::string backend_name() const = 0;

    // ── Sessions ────────────────────────────────────────────────
    virtual void create_session(const Session& session) = 0;
    virtual std::optional<Session> read_session(const std::string& session_id) = 0;
    // Removes the session and, by cascade, all of its agents, messages and
    // multi-agent records.
    virtual void delete_session(const std::string& session_id) = 0;

    // ── Agents ──────────────────────────────────────────────────
    virtual void create_agent(const std::string& session_id, const SessionAgent& agent) = 0;
    virtual std::optional<SessionAgent> read_agent(const std::string& session_id,
                                                   const std::string& agent_id) = 0;
    // Never creates: a missing agent is a NotFoundError.
    virtual void update_agent(const std::string& session_id, const SessionAgent& agent) = 0;

    // ── Messages ────────────────────────────────────────────────
    virtual void create_message(const std::string& session_id, const std::string& agent_id,
                                const SessionMessage& message) = 0;
    virtual SessionMessage read_message(const std::string& session_id,
                                        const std::string& agent_id,
                                        int64_t message_id) = 0;
    virtual void update_message(const std::string& session_id, const std::string& agent_id,
                                const SessionMessage& message) = 0;

    // Messages in ascending message_id order. With a limit, `offset` rows
    // are skipped first; without one the full set is returned.
    virtual std::vector<SessionMessage> list_messages(const std::string& session_id,
                                                      const std::string& agent_id,
                                                      std::optional<uint32_t> limit = std::nullopt,
                                                      uint32_t offset = 0) = 0;

    // ── Multi-agent state ───────────────────────────────────────
    virtual void create_multi_agent(const std::string& session_id,
                                    const std::string& multi_agent_id,
                                    const nlohmann::json& state) = 0;
    virtual nlohmann::json read_multi_agent(const std::string& session_id,
                                            const std::string& multi_agent_id) = 0;
    virtual void update_multi_agent(const std::string& session_id,
                                    const std::string& multi_agent_id,
                                    const nlohmann::json& state) = 0;
};

// Open the SQLite repository at `explicit_path`, or at the location the
// config resolves to when it is empty.
struct Config;
std::unique_ptr<SessionRepository> create_repository(const Config& config,
                                                     const std::string& explicit_path = "");

} // namespace sqlsession
