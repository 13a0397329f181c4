#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace sqlsession {

std::string config_file_path() {
    return expand_home("~/.sqlsession/config.json");
}

nlohmann::json Config::defaults_json() {
    return {
        {"db_path", kDefaultDbPath}
    };
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;
    if (j.contains("db_path") && j["db_path"].is_string()) {
        std::string path = trim(j["db_path"].get<std::string>());
        if (!path.empty()) cfg.db_path = path;
    }
    return cfg;
}

Config Config::load() {
    std::string config_path = config_file_path();
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv(kDbPathEnvVar)) {
        std::string path = trim(v);
        if (!path.empty()) cfg.db_path = path;
    }

    return cfg;
}

std::string Config::resolve_db_path(const std::string& explicit_path) const {
    std::string path = trim(explicit_path);
    if (path.empty()) path = db_path;
    if (path.empty()) path = kDefaultDbPath;
    return expand_home(path);
}

} // namespace sqlsession
