#pragma once
#include "../session_repository.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare
struct sqlite3_stmt;

namespace sqlsession {

// Path sentinel selecting a private in-memory database that is discarded
// when the repository closes.
constexpr const char* kMemoryDbPath = ":memory:";

// SessionRepository backed by a single SQLite connection.
//
// Opening enables WAL journaling and foreign-key enforcement, then creates
// the schema if needed; running it against an initialized file is a no-op.
// Every statement auto-commits. Several instances may share one file; the
// SQLite locking protocol arbitrates between them.
class SqliteSessionRepository : public SessionRepository {
public:
    // Throws StorageError if the database cannot be opened or initialized.
    explicit SqliteSessionRepository(const std::string& path);
    ~SqliteSessionRepository() override;

    // Non-copyable
    SqliteSessionRepository(const SqliteSessionRepository&) = delete;
    SqliteSessionRepository& operator=(const SqliteSessionRepository&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    const std::string& path() const { return path_; }
    bool is_open() const;

    // Release the connection. Safe to call more than once; later operations
    // fail with StorageError.
    void close();

    void create_session(const Session& session) override;
    std::optional<Session> read_session(const std::string& session_id) override;
    void delete_session(const std::string& session_id) override;

    void create_agent(const std::string& session_id, const SessionAgent& agent) override;
    std::optional<SessionAgent> read_agent(const std::string& session_id,
                                           const std::string& agent_id) override;
    void update_agent(const std::string& session_id, const SessionAgent& agent) override;

    void create_message(const std::string& session_id, const std::string& agent_id,
                        const SessionMessage& message) override;
    SessionMessage read_message(const std::string& session_id, const std::string& agent_id,
                                int64_t message_id) override;
    void update_message(const std::string& session_id, const std::string& agent_id,
                        const SessionMessage& message) override;
    std::vector<SessionMessage> list_messages(const std::string& session_id,
                                              const std::string& agent_id,
                                              std::optional<uint32_t> limit = std::nullopt,
                                              uint32_t offset = 0) override;

    void create_multi_agent(const std::string& session_id, const std::string& multi_agent_id,
                            const nlohmann::json& state) override;
    nlohmann::json read_multi_agent(const std::string& session_id,
                                    const std::string& multi_agent_id) override;
    void update_multi_agent(const std::string& session_id, const std::string& multi_agent_id,
                            const nlohmann::json& state) override;

private:
    void configure();
    void init_schema();

    sqlite3* handle(const std::string& op) const;
    void prepare(sqlite3_stmt** stmt, const char* sql, const std::string& op);
    void step_done(sqlite3_stmt* stmt, const std::string& op);
    [[noreturn]] void raise_insert_error(const std::string& op,
                                         const std::string& duplicate_what,
                                         const std::string& missing_parent_what);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace sqlsession
