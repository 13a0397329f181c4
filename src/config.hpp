#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace sqlsession {

// Environment variable consulted when no explicit path is given
constexpr const char* kDbPathEnvVar = "STRANDS_SQLITE_DB_PATH";

// Fallback when neither the config file nor the environment names a path
constexpr const char* kDefaultDbPath = "./sessions.db";

struct Config {
    std::string db_path = kDefaultDbPath;

    // Load from ~/.sqlsession/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply the recognized keys of a config document; unknown keys and
    // values of the wrong type are ignored.
    static Config from_json(const nlohmann::json& j);

    // Storage location for a repository: the explicit path when non-empty,
    // otherwise db_path. `~` is expanded; ":memory:" passes through.
    std::string resolve_db_path(const std::string& explicit_path = "") const;
};

// Location of the user config file (~/.sqlsession/config.json)
std::string config_file_path();

} // namespace sqlsession
