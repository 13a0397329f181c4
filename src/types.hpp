#pragma once
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlsession {

enum class SessionType { Agent, MultiAgent };

const char* session_type_to_string(SessionType type);

// Throws std::invalid_argument for an unknown tag.
SessionType session_type_from_string(const std::string& s);

// One conversation turn as the framework hands it over. Content blocks
// are opaque documents ({"text": ...}, {"toolUse": ...}, ...).
struct Message {
    std::string role;
    nlohmann::json content = nlohmann::json::array();
};

struct Session {
    std::string session_id;
    SessionType session_type = SessionType::Agent;
    nlohmann::json payload = nlohmann::json::object();
    std::string created_at = timestamp_now();
    std::string updated_at = timestamp_now();
};

struct SessionAgent {
    std::string agent_id;
    nlohmann::json state = nlohmann::json::object();
    nlohmann::json conversation_manager_state = nlohmann::json::object();
    nlohmann::json internal_state = nlohmann::json::object();
    std::string created_at = timestamp_now();
    std::string updated_at = timestamp_now();
};

struct SessionMessage {
    Message message;
    int64_t message_id = 0;
    // Replacement content shown instead of `message` once redacted
    std::optional<Message> redact_message;
    std::string created_at = timestamp_now();
    std::string updated_at = timestamp_now();

    // The message the conversation should see.
    const Message& effective_message() const {
        return redact_message ? *redact_message : message;
    }
};

bool operator==(const Message& a, const Message& b);
bool operator!=(const Message& a, const Message& b);
bool operator==(const Session& a, const Session& b);
bool operator!=(const Session& a, const Session& b);
bool operator==(const SessionAgent& a, const SessionAgent& b);
bool operator!=(const SessionAgent& a, const SessionAgent& b);
bool operator==(const SessionMessage& a, const SessionMessage& b);
bool operator!=(const SessionMessage& a, const SessionMessage& b);

// JSON document conversion, picked up by nlohmann::json through ADL.
// from_json throws nlohmann::json::exception or std::invalid_argument on
// a document that does not have the expected shape.
void to_json(nlohmann::json& j, const Message& m);
void from_json(const nlohmann::json& j, Message& m);
void to_json(nlohmann::json& j, const Session& s);
void from_json(const nlohmann::json& j, Session& s);
void to_json(nlohmann::json& j, const SessionAgent& a);
void from_json(const nlohmann::json& j, SessionAgent& a);
void to_json(nlohmann::json& j, const SessionMessage& m);
void from_json(const nlohmann::json& j, SessionMessage& m);

} // namespace sqlsession
