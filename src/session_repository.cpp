#include "session_repository.hpp"
#include "config.hpp"
#include "repository/sqlite_session_repository.hpp"

namespace sqlsession {

std::unique_ptr<SessionRepository> create_repository(const Config& config,
                                                     const std::string& explicit_path) {
    return std::make_unique<SqliteSessionRepository>(config.resolve_db_path(explicit_path));
}

} // namespace sqlsession
