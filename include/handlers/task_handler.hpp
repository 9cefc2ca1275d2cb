#pragma once

#include <string>
#include <vector>
#include <chrono>

#include "session_manager.hpp"

namespace chatgate {

// Chat front end for background tasks: /task spawn|list|status|cancel|clear|help.
class TaskCommandHandler {
public:
    explicit TaskCommandHandler(SessionManager& sessions,
                                std::chrono::seconds clear_after = std::chrono::hours(1))
        : sessions_(sessions), clear_after_(clear_after) {}

    // args excludes the "/task" word itself. Throws SessionLimitError from spawn.
    std::string handle_command(const std::string& user_id, const std::string& platform,
                               const std::string& chat_id, const std::vector<std::string>& args);

    static std::string help();

private:
    std::string spawn_task(const std::string& user_id, const std::string& platform,
                           const std::string& chat_id, const std::vector<std::string>& args);
    std::string list_sessions(const std::string& user_id);
    std::string session_status(const std::string& user_id, const std::vector<std::string>& args);
    std::string cancel_session(const std::string& user_id, const std::vector<std::string>& args);
    std::string clear_sessions();

    // Exact ID first, then the lowest sub-session ID starting with prefix, among the user's sessions.
    SessionManager::SessionPtr find(const std::string& user_id, const std::string& prefix, bool include_complete);

    static std::string format_status(const Session& s);
    static const char* status_icon(SessionStatus status);

    SessionManager& sessions_;
    std::chrono::seconds clear_after_;
};

}
