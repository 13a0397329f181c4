#include <catch2/catch.hpp>
#include "session.hpp"
#include "repository/sqlite_session_repository.hpp"
#include <filesystem>
#include <unistd.h>

using namespace sqlsession;

static Message text_message(const std::string& role, const std::string& text) {
    Message m;
    m.role = role;
    m.content = nlohmann::json::array({{{"text", text}}});
    return m;
}

static SessionAgent make_agent(const std::string& id) {
    SessionAgent a;
    a.agent_id = id;
    return a;
}

// ── Construction ─────────────────────────────────────────────────

TEST_CASE("SessionManager: creates session on first use", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    REQUIRE_FALSE(repo.read_session("s1").has_value());

    SessionManager mgr("s1", repo);
    REQUIRE(mgr.session_id() == "s1");
    REQUIRE(mgr.session().session_type == SessionType::Agent);
    REQUIRE(repo.read_session("s1").has_value());
}

TEST_CASE("SessionManager: reuses an existing session", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    Session stored;
    stored.session_id = "s1";
    stored.session_type = SessionType::MultiAgent;
    stored.payload = {{"label", "existing"}};
    repo.create_session(stored);

    SessionManager mgr("s1", repo);
    REQUIRE(mgr.session() == stored);
}

// ── Agents and messages ──────────────────────────────────────────

TEST_CASE("SessionManager: new agent stores initial messages", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);

    auto result = mgr.initialize_agent(make_agent("a1"),
                                       {text_message("user", "hi"),
                                        text_message("assistant", "hello")});
    REQUIRE_FALSE(result.restored);
    REQUIRE(result.messages.size() == 2);

    auto stored = repo.list_messages("s1", "a1");
    REQUIRE(stored.size() == 2);
    REQUIRE(stored[0].message_id == 0);
    REQUIRE(stored[1].message_id == 1);

    auto next = mgr.append_message("a1", text_message("user", "again"));
    REQUIRE(next.message_id == 2);
}

TEST_CASE("SessionManager: append numbers messages from zero", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);
    mgr.initialize_agent(make_agent("a1"));

    REQUIRE(mgr.append_message("a1", text_message("user", "one")).message_id == 0);
    REQUIRE(mgr.append_message("a1", text_message("assistant", "two")).message_id == 1);
    REQUIRE(repo.read_message("s1", "a1", 1).message == text_message("assistant", "two"));
}

TEST_CASE("SessionManager: append to unknown agent throws NotFound", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);
    REQUIRE_THROWS_AS(mgr.append_message("ghost", text_message("user", "x")), NotFoundError);
}

TEST_CASE("SessionManager: agent can only be initialized once", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);
    mgr.initialize_agent(make_agent("a1"));
    REQUIRE_THROWS_AS(mgr.initialize_agent(make_agent("a1")), SessionError);
}

TEST_CASE("SessionManager: restores agent and conversation from file", "[session]") {
    std::string path = "/tmp/sqlsession_test_manager_" + std::to_string(getpid()) + ".db";
    {
        SqliteSessionRepository repo(path);
        SessionManager mgr("s1", repo);
        SessionAgent agent = make_agent("a1");
        mgr.initialize_agent(agent);
        mgr.append_message("a1", text_message("user", "my favorite color is blue"));
        mgr.append_message("a1", text_message("assistant", "noted"));

        agent.state = {{"favorite_color", "blue"}};
        mgr.sync_agent(agent);
    }
    {
        SqliteSessionRepository repo(path);
        SessionManager mgr("s1", repo);
        auto result = mgr.initialize_agent(make_agent("a1"));

        REQUIRE(result.restored);
        REQUIRE(result.agent.state["favorite_color"] == "blue");
        REQUIRE(result.messages.size() == 2);
        REQUIRE(result.messages[0] == text_message("user", "my favorite color is blue"));

        // Numbering continues after the restored messages
        REQUIRE(mgr.append_message("a1", text_message("user", "next")).message_id == 2);
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

// ── Redaction ────────────────────────────────────────────────────

TEST_CASE("SessionManager: redact latest message", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);
    mgr.initialize_agent(make_agent("a1"));
    mgr.append_message("a1", text_message("user", "fine"));
    mgr.append_message("a1", text_message("user", "my ssn is 123"));

    mgr.redact_latest_message("a1", text_message("user", "[redacted]"));

    auto stored = repo.read_message("s1", "a1", 1);
    REQUIRE(stored.redact_message.has_value());
    REQUIRE(stored.effective_message() == text_message("user", "[redacted]"));
    REQUIRE_FALSE(repo.read_message("s1", "a1", 0).redact_message.has_value());
}

TEST_CASE("SessionManager: restored conversation shows redacted content", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    {
        SessionManager mgr("s1", repo);
        mgr.initialize_agent(make_agent("a1"));
        mgr.append_message("a1", text_message("user", "secret"));
        mgr.redact_latest_message("a1", text_message("user", "[redacted]"));
    }
    SessionManager mgr("s1", repo);
    auto result = mgr.initialize_agent(make_agent("a1"));
    REQUIRE(result.messages.size() == 1);
    REQUIRE(result.messages[0] == text_message("user", "[redacted]"));
}

TEST_CASE("SessionManager: redact without messages throws", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);
    mgr.initialize_agent(make_agent("a1"));
    REQUIRE_THROWS_AS(mgr.redact_latest_message("a1", text_message("user", "x")), SessionError);
}

// ── Agent sync ───────────────────────────────────────────────────

TEST_CASE("SessionManager: sync of unknown agent throws NotFound", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);
    REQUIRE_THROWS_AS(mgr.sync_agent(make_agent("ghost")), NotFoundError);
}

// ── Multi-agent state ────────────────────────────────────────────

TEST_CASE("SessionManager: multi-agent state is created then restored", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);

    nlohmann::json initial = {{"status", "pending"}};
    REQUIRE(mgr.initialize_multi_agent("graph", initial) == initial);

    mgr.sync_multi_agent("graph", {{"status", "completed"}});
    REQUIRE(mgr.initialize_multi_agent("graph", initial) ==
            nlohmann::json{{"status", "completed"}});
}

TEST_CASE("SessionManager: sync of unknown multi-agent throws NotFound", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);
    REQUIRE_THROWS_AS(mgr.sync_multi_agent("nope", nlohmann::json::object()), NotFoundError);
}

// ── Deletion ─────────────────────────────────────────────────────

TEST_CASE("SessionManager: delete session removes everything", "[session]") {
    SqliteSessionRepository repo(kMemoryDbPath);
    SessionManager mgr("s1", repo);
    mgr.initialize_agent(make_agent("a1"));
    mgr.append_message("a1", text_message("user", "bye"));
    mgr.initialize_multi_agent("graph", nlohmann::json::object());

    mgr.delete_session();

    REQUIRE_FALSE(repo.read_session("s1").has_value());
    REQUIRE_FALSE(repo.read_agent("s1", "a1").has_value());
    REQUIRE(repo.list_messages("s1", "a1").empty());
    REQUIRE_THROWS_AS(mgr.delete_session(), NotFoundError);
}
