#include "types.hpp"
#include <stdexcept>

namespace sqlsession {

const char* session_type_to_string(SessionType type) {
    switch (type) {
        case SessionType::Agent:      return "AGENT";
        case SessionType::MultiAgent: return "MULTI_AGENT";
    }
    return "AGENT";
}

SessionType session_type_from_string(const std::string& s) {
    if (s == "AGENT")       return SessionType::Agent;
    if (s == "MULTI_AGENT") return SessionType::MultiAgent;
    throw std::invalid_argument("unknown session type: " + s);
}

// ── Equality ────────────────────────────────────────────────────

bool operator==(const Message& a, const Message& b) {
    return a.role == b.role && a.content == b.content;
}

bool operator!=(const Message& a, const Message& b) { return !(a == b); }

bool operator==(const Session& a, const Session& b) {
    return a.session_id == b.session_id &&
           a.session_type == b.session_type &&
           a.payload == b.payload &&
           a.created_at == b.created_at &&
           a.updated_at == b.updated_at;
}

bool operator!=(const Session& a, const Session& b) { return !(a == b); }

bool operator==(const SessionAgent& a, const SessionAgent& b) {
    return a.agent_id == b.agent_id &&
           a.state == b.state &&
           a.conversation_manager_state == b.conversation_manager_state &&
           a.internal_state == b.internal_state &&
           a.created_at == b.created_at &&
           a.updated_at == b.updated_at;
}

bool operator!=(const SessionAgent& a, const SessionAgent& b) { return !(a == b); }

bool operator==(const SessionMessage& a, const SessionMessage& b) {
    return a.message_id == b.message_id &&
           a.message == b.message &&
           a.redact_message == b.redact_message &&
           a.created_at == b.created_at &&
           a.updated_at == b.updated_at;
}

bool operator!=(const SessionMessage& a, const SessionMessage& b) { return !(a == b); }

// ── JSON conversion ─────────────────────────────────────────────

void to_json(nlohmann::json& j, const Message& m) {
    j = nlohmann::json{{"role", m.role}, {"content", m.content}};
}

void from_json(const nlohmann::json& j, Message& m) {
    m.role = j.at("role").get<std::string>();
    m.content = j.value("content", nlohmann::json::array());
}

void to_json(nlohmann::json& j, const Session& s) {
    j = nlohmann::json{
        {"session_id", s.session_id},
        {"session_type", session_type_to_string(s.session_type)},
        {"created_at", s.created_at},
        {"updated_at", s.updated_at}
    };
    if (!(s.payload.is_object() && s.payload.empty())) {
        j["payload"] = s.payload;
    }
}

void from_json(const nlohmann::json& j, Session& s) {
    s.session_id = j.at("session_id").get<std::string>();
    s.session_type = session_type_from_string(j.value("session_type", "AGENT"));
    s.payload = j.value("payload", nlohmann::json::object());
    s.created_at = j.value("created_at", "");
    s.updated_at = j.value("updated_at", "");
}

void to_json(nlohmann::json& j, const SessionAgent& a) {
    j = nlohmann::json{
        {"agent_id", a.agent_id},
        {"state", a.state},
        {"conversation_manager_state", a.conversation_manager_state},
        {"_internal_state", a.internal_state},
        {"created_at", a.created_at},
        {"updated_at", a.updated_at}
    };
}

void from_json(const nlohmann::json& j, SessionAgent& a) {
    a.agent_id = j.at("agent_id").get<std::string>();
    a.state = j.value("state", nlohmann::json::object());
    a.conversation_manager_state =
        j.value("conversation_manager_state", nlohmann::json::object());
    // Older rows were written under "internal_state".
    if (j.contains("_internal_state")) {
        a.internal_state = j["_internal_state"];
    } else {
        a.internal_state = j.value("internal_state", nlohmann::json::object());
    }
    a.created_at = j.value("created_at", "");
    a.updated_at = j.value("updated_at", "");
}

void to_json(nlohmann::json& j, const SessionMessage& m) {
    j = nlohmann::json{
        {"message", m.message},
        {"message_id", m.message_id},
        {"redact_message", nullptr},
        {"created_at", m.created_at},
        {"updated_at", m.updated_at}
    };
    if (m.redact_message) {
        j["redact_message"] = *m.redact_message;
    }
}

void from_json(const nlohmann::json& j, SessionMessage& m) {
    m.message = j.at("message").get<Message>();
    m.message_id = j.at("message_id").get<int64_t>();
    m.redact_message.reset();
    auto it = j.find("redact_message");
    if (it != j.end() && !it->is_null()) {
        m.redact_message = it->get<Message>();
    }
    m.created_at = j.value("created_at", "");
    m.updated_at = j.value("updated_at", "");
}

} // namespace sqlsession
