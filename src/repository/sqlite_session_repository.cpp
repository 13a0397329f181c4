#include "sqlite_session_repository.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace sqlsession {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static const char* kSchema =
    "CREATE TABLE IF NOT EXISTS sessions ("
    "  session_id TEXT PRIMARY KEY,"
    "  data       TEXT NOT NULL,"
    "  created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    "  updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
    ");"
    "CREATE TABLE IF NOT EXISTS agents ("
    "  session_id TEXT NOT NULL,"
    "  agent_id   TEXT NOT NULL,"
    "  data       TEXT NOT NULL,"
    "  created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    "  updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    "  PRIMARY KEY (session_id, agent_id),"
    "  FOREIGN KEY (session_id) REFERENCES sessions(session_id) ON DELETE CASCADE"
    ");"
    "CREATE TABLE IF NOT EXISTS messages ("
    "  session_id TEXT NOT NULL,"
    "  agent_id   TEXT NOT NULL,"
    "  message_id INTEGER NOT NULL,"
    "  data       TEXT NOT NULL,"
    "  created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    "  updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    "  PRIMARY KEY (session_id, agent_id, message_id),"
    "  FOREIGN KEY (session_id, agent_id) REFERENCES agents(session_id, agent_id)"
    "    ON DELETE CASCADE"
    ");"
    "CREATE TABLE IF NOT EXISTS multi_agents ("
    "  session_id     TEXT NOT NULL,"
    "  multi_agent_id TEXT NOT NULL,"
    "  data           TEXT NOT NULL,"
    "  created_at     TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    "  updated_at     TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    "  PRIMARY KEY (session_id, multi_agent_id),"
    "  FOREIGN KEY (session_id) REFERENCES sessions(session_id) ON DELETE CASCADE"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_messages_session_agent"
    "  ON messages(session_id, agent_id, message_id);"
    "CREATE INDEX IF NOT EXISTS idx_agents_session ON agents(session_id);"
    "CREATE INDEX IF NOT EXISTS idx_multi_agents_session ON multi_agents(session_id);";

// ── Encoding ────────────────────────────────────────────────────

template <typename T>
static std::string encode(const T& value, const std::string& op) {
    try {
        return nlohmann::json(value).dump();
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(op, e.what());
    }
}

template <typename T>
static T decode(const std::string& text, const std::string& op) {
    try {
        return nlohmann::json::parse(text).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(op, e.what());
    } catch (const std::invalid_argument& e) {
        throw StorageError(op, e.what());
    }
}

static void bind_text(sqlite3_stmt* stmt, int col, const std::string& value) {
    sqlite3_bind_text(stmt, col, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

static std::string column_string(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    if (!v) return {};
    return std::string(reinterpret_cast<const char*>(v),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

// ── Lifecycle ───────────────────────────────────────────────────

SqliteSessionRepository::SqliteSessionRepository(const std::string& path) : path_(path) {
    const std::string op = "open database " + path_;

    // Ensure parent directory exists
    if (path_ != kMemoryDbPath) {
        auto parent = std::filesystem::path(path_).parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw StorageError(op, ec.message());
            }
            std::cerr << "[session_store] Created directory " << parent.string() << "\n";
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        close();
        throw StorageError(op, err);
    }

    try {
        configure();
        init_schema();
    } catch (...) {
        // The destructor does not run for a throwing constructor.
        close();
        throw;
    }
}

SqliteSessionRepository::~SqliteSessionRepository() {
    close();
}

void SqliteSessionRepository::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool SqliteSessionRepository::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void SqliteSessionRepository::configure() {
    sqlite3_extended_result_codes(db_, 1);

    // WAL must actually take effect on a file database; SQLite silently
    // keeps the old mode where the filesystem cannot support it.
    {
        StmtGuard g;
        prepare(&g.stmt, "PRAGMA journal_mode=WAL;", "enable WAL journaling");
        if (sqlite3_step(g.stmt) != SQLITE_ROW) {
            throw StorageError("enable WAL journaling", sqlite3_errmsg(db_));
        }
        std::string mode = column_string(g.stmt, 0);
        std::transform(mode.begin(), mode.end(), mode.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string expected = path_ == kMemoryDbPath ? "memory" : "wal";
        if (mode != expected) {
            throw StorageError("enable WAL journaling",
                               "journal_mode is '" + mode + "' for " + path_);
        }
    }

    char* err = nullptr;
    if (sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StorageError("enable foreign keys", msg);
    }
}

void SqliteSessionRepository::init_schema() {
    char* err = nullptr;
    if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StorageError("create schema", msg);
    }
}

// ── Statement helpers ───────────────────────────────────────────

sqlite3* SqliteSessionRepository::handle(const std::string& op) const {
    if (!db_) {
        throw StorageError(op, "repository is closed");
    }
    return db_;
}

void SqliteSessionRepository::prepare(sqlite3_stmt** stmt, const char* sql,
                                      const std::string& op) {
    sqlite3* db = handle(op);
    if (sqlite3_prepare_v2(db, sql, -1, stmt, nullptr) != SQLITE_OK) {
        throw StorageError(op, sqlite3_errmsg(db));
    }
}

void SqliteSessionRepository::step_done(sqlite3_stmt* stmt, const std::string& op) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw StorageError(op, sqlite3_errmsg(db_));
    }
}

// Map a failed INSERT to the error taxonomy using the extended result code,
// which tells a key collision apart from a dangling foreign key.
void SqliteSessionRepository::raise_insert_error(const std::string& op,
                                                 const std::string& duplicate_what,
                                                 const std::string& missing_parent_what) {
    switch (sqlite3_extended_errcode(db_)) {
        case SQLITE_CONSTRAINT_PRIMARYKEY:
        case SQLITE_CONSTRAINT_UNIQUE:
            throw DuplicateEntityError(duplicate_what + " already exists");
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            throw NotFoundError(missing_parent_what + " not found");
        default:
            throw StorageError(op, sqlite3_errmsg(db_));
    }
}

// ── Sessions ────────────────────────────────────────────────────

void SqliteSessionRepository::create_session(const Session& session) {
    const std::string op = "create session";
    std::string data = encode(session, op);

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(&g.stmt, "INSERT INTO sessions (session_id, data) VALUES (?, ?);", op);
    bind_text(g.stmt, 1, session.session_id);
    bind_text(g.stmt, 2, data);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        raise_insert_error(op, "Session " + session.session_id, "Session " + session.session_id);
    }
}

std::optional<Session> SqliteSessionRepository::read_session(const std::string& session_id) {
    const std::string op = "read session";
    std::string data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StmtGuard g;
        prepare(&g.stmt, "SELECT data FROM sessions WHERE session_id = ?;", op);
        bind_text(g.stmt, 1, session_id);
        int rc = sqlite3_step(g.stmt);
        if (rc == SQLITE_DONE) return std::nullopt;
        if (rc != SQLITE_ROW) throw StorageError(op, sqlite3_errmsg(db_));
        data = column_string(g.stmt, 0);
    }
    return decode<Session>(data, op);
}

void SqliteSessionRepository::delete_session(const std::string& session_id) {
    const std::string op = "delete session";

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(&g.stmt, "DELETE FROM sessions WHERE session_id = ?;", op);
    bind_text(g.stmt, 1, session_id);
    step_done(g.stmt, op);
    // Cascaded child deletes are not counted here, only the session row.
    if (sqlite3_changes(db_) == 0) {
        throw NotFoundError("Session " + session_id + " not found");
    }
}

// ── Agents ──────────────────────────────────────────────────────

void SqliteSessionRepository::create_agent(const std::string& session_id,
                                           const SessionAgent& agent) {
    const std::string op = "create agent";
    std::string data = encode(agent, op);

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(&g.stmt, "INSERT INTO agents (session_id, agent_id, data) VALUES (?, ?, ?);", op);
    bind_text(g.stmt, 1, session_id);
    bind_text(g.stmt, 2, agent.agent_id);
    bind_text(g.stmt, 3, data);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        raise_insert_error(op,
                           "Agent " + agent.agent_id + " in session " + session_id,
                           "Session " + session_id);
    }
}

std::optional<SessionAgent> SqliteSessionRepository::read_agent(const std::string& session_id,
                                                                const std::string& agent_id) {
    const std::string op = "read agent";
    std::string data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StmtGuard g;
        prepare(&g.stmt, "SELECT data FROM agents WHERE session_id = ? AND agent_id = ?;", op);
        bind_text(g.stmt, 1, session_id);
        bind_text(g.stmt, 2, agent_id);
        int rc = sqlite3_step(g.stmt);
        if (rc == SQLITE_DONE) return std::nullopt;
        if (rc != SQLITE_ROW) throw StorageError(op, sqlite3_errmsg(db_));
        data = column_string(g.stmt, 0);
    }
    return decode<SessionAgent>(data, op);
}

void SqliteSessionRepository::update_agent(const std::string& session_id,
                                           const SessionAgent& agent) {
    const std::string op = "update agent";
    std::string data = encode(agent, op);

    std::lock_guard<std::mutex> lock(mutex_);
    {
        StmtGuard existing;
        prepare(&existing.stmt,
                "SELECT created_at FROM agents WHERE session_id = ? AND agent_id = ?;", op);
        bind_text(existing.stmt, 1, session_id);
        bind_text(existing.stmt, 2, agent.agent_id);
        int rc = sqlite3_step(existing.stmt);
        if (rc == SQLITE_DONE) {
            throw NotFoundError("Agent " + agent.agent_id + " not found in session " + session_id);
        }
        if (rc != SQLITE_ROW) throw StorageError(op, sqlite3_errmsg(db_));
    }

    StmtGuard g;
    prepare(&g.stmt,
            "UPDATE agents SET data = ?, updated_at = CURRENT_TIMESTAMP"
            " WHERE session_id = ? AND agent_id = ?;", op);
    bind_text(g.stmt, 1, data);
    bind_text(g.stmt, 2, session_id);
    bind_text(g.stmt, 3, agent.agent_id);
    step_done(g.stmt, op);
}

// ── Messages ────────────────────────────────────────────────────

void SqliteSessionRepository::create_message(const std::string& session_id,
                                             const std::string& agent_id,
                                             const SessionMessage& message) {
    const std::string op = "create message";
    std::string data = encode(message, op);

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(&g.stmt,
            "INSERT INTO messages (session_id, agent_id, message_id, data)"
            " VALUES (?, ?, ?, ?);", op);
    bind_text(g.stmt, 1, session_id);
    bind_text(g.stmt, 2, agent_id);
    sqlite3_bind_int64(g.stmt, 3, message.message_id);
    bind_text(g.stmt, 4, data);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        raise_insert_error(op,
                           "Message " + std::to_string(message.message_id) +
                               " of agent " + agent_id + " in session " + session_id,
                           "Agent " + agent_id + " in session " + session_id);
    }
}

SessionMessage SqliteSessionRepository::read_message(const std::string& session_id,
                                                     const std::string& agent_id,
                                                     int64_t message_id) {
    const std::string op = "read message";
    std::string data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StmtGuard g;
        prepare(&g.stmt,
                "SELECT data FROM messages"
                " WHERE session_id = ? AND agent_id = ? AND message_id = ?;", op);
        bind_text(g.stmt, 1, session_id);
        bind_text(g.stmt, 2, agent_id);
        sqlite3_bind_int64(g.stmt, 3, message_id);
        int rc = sqlite3_step(g.stmt);
        if (rc == SQLITE_DONE) {
            throw NotFoundError("Message " + std::to_string(message_id) + " of agent " +
                                agent_id + " not found in session " + session_id);
        }
        if (rc != SQLITE_ROW) throw StorageError(op, sqlite3_errmsg(db_));
        data = column_string(g.stmt, 0);
    }
    return decode<SessionMessage>(data, op);
}

void SqliteSessionRepository::update_message(const std::string& session_id,
                                             const std::string& agent_id,
                                             const SessionMessage& message) {
    const std::string op = "update message";
    std::string data = encode(message, op);

    std::lock_guard<std::mutex> lock(mutex_);
    {
        StmtGuard existing;
        prepare(&existing.stmt,
                "SELECT created_at FROM messages"
                " WHERE session_id = ? AND agent_id = ? AND message_id = ?;", op);
        bind_text(existing.stmt, 1, session_id);
        bind_text(existing.stmt, 2, agent_id);
        sqlite3_bind_int64(existing.stmt, 3, message.message_id);
        int rc = sqlite3_step(existing.stmt);
        if (rc == SQLITE_DONE) {
            throw NotFoundError("Message " + std::to_string(message.message_id) + " of agent " +
                                agent_id + " not found in session " + session_id);
        }
        if (rc != SQLITE_ROW) throw StorageError(op, sqlite3_errmsg(db_));
    }

    StmtGuard g;
    prepare(&g.stmt,
            "UPDATE messages SET data = ?, updated_at = CURRENT_TIMESTAMP"
            " WHERE session_id = ? AND agent_id = ? AND message_id = ?;", op);
    bind_text(g.stmt, 1, data);
    bind_text(g.stmt, 2, session_id);
    bind_text(g.stmt, 3, agent_id);
    sqlite3_bind_int64(g.stmt, 4, message.message_id);
    step_done(g.stmt, op);
}

std::vector<SessionMessage> SqliteSessionRepository::list_messages(const std::string& session_id,
                                                                   const std::string& agent_id,
                                                                   std::optional<uint32_t> limit,
                                                                   uint32_t offset) {
    const std::string op = "list messages";
    std::string sql =
        "SELECT data FROM messages WHERE session_id = ? AND agent_id = ?"
        " ORDER BY message_id";
    if (limit) {
        sql += " LIMIT ? OFFSET ?";
    }
    sql += ";";

    std::vector<std::string> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StmtGuard g;
        prepare(&g.stmt, sql.c_str(), op);
        bind_text(g.stmt, 1, session_id);
        bind_text(g.stmt, 2, agent_id);
        if (limit) {
            sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(*limit));
            sqlite3_bind_int64(g.stmt, 4, static_cast<sqlite3_int64>(offset));
        }
        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            rows.push_back(column_string(g.stmt, 0));
            rc = sqlite3_step(g.stmt);
        }
        if (rc != SQLITE_DONE) throw StorageError(op, sqlite3_errmsg(db_));
    }

    std::vector<SessionMessage> messages;
    messages.reserve(rows.size());
    for (const auto& data : rows) {
        messages.push_back(decode<SessionMessage>(data, op));
    }
    return messages;
}

// ── Multi-agent state ───────────────────────────────────────────

void SqliteSessionRepository::create_multi_agent(const std::string& session_id,
                                                 const std::string& multi_agent_id,
                                                 const nlohmann::json& state) {
    const std::string op = "create multi-agent";
    std::string data = encode(state, op);

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(&g.stmt,
            "INSERT INTO multi_agents (session_id, multi_agent_id, data) VALUES (?, ?, ?);", op);
    bind_text(g.stmt, 1, session_id);
    bind_text(g.stmt, 2, multi_agent_id);
    bind_text(g.stmt, 3, data);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        raise_insert_error(op,
                           "Multi-agent " + multi_agent_id + " in session " + session_id,
                           "Session " + session_id);
    }
}

nlohmann::json SqliteSessionRepository::read_multi_agent(const std::string& session_id,
                                                         const std::string& multi_agent_id) {
    const std::string op = "read multi-agent";
    std::string data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StmtGuard g;
        prepare(&g.stmt,
                "SELECT data FROM multi_agents WHERE session_id = ? AND multi_agent_id = ?;", op);
        bind_text(g.stmt, 1, session_id);
        bind_text(g.stmt, 2, multi_agent_id);
        int rc = sqlite3_step(g.stmt);
        if (rc == SQLITE_DONE) {
            throw NotFoundError("Multi-agent " + multi_agent_id + " not found in session " +
                                session_id);
        }
        if (rc != SQLITE_ROW) throw StorageError(op, sqlite3_errmsg(db_));
        data = column_string(g.stmt, 0);
    }
    return decode<nlohmann::json>(data, op);
}

void SqliteSessionRepository::update_multi_agent(const std::string& session_id,
                                                 const std::string& multi_agent_id,
                                                 const nlohmann::json& state) {
    const std::string op = "update multi-agent";
    std::string data = encode(state, op);

    std::lock_guard<std::mutex> lock(mutex_);
    {
        StmtGuard existing;
        prepare(&existing.stmt,
                "SELECT created_at FROM multi_agents"
                " WHERE session_id = ? AND multi_agent_id = ?;", op);
        bind_text(existing.stmt, 1, session_id);
        bind_text(existing.stmt, 2, multi_agent_id);
        int rc = sqlite3_step(existing.stmt);
        if (rc == SQLITE_DONE) {
            throw NotFoundError("Multi-agent " + multi_agent_id + " not found in session " +
                                session_id);
        }
        if (rc != SQLITE_ROW) throw StorageError(op, sqlite3_errmsg(db_));
    }

    StmtGuard g;
    prepare(&g.stmt,
            "UPDATE multi_agents SET data = ?, updated_at = CURRENT_TIMESTAMP"
            " WHERE session_id = ? AND multi_agent_id = ?;", op);
    bind_text(g.stmt, 1, data);
    bind_text(g.stmt, 2, session_id);
    bind_text(g.stmt, 3, multi_agent_id);
    step_done(g.stmt, op);
}

} // namespace sqlsession
