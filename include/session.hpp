#pragma once

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <boost/json.hpp>

namespace chatgate {

enum class SessionStatus {
    PENDING,
    RUNNING,
    COMPLETE,
    FAILED,
    CANCELED
};

enum class SessionType {
    MAIN,
    SUB
};

std::string to_string(SessionStatus status);
std::string to_string(SessionType type);

inline bool is_terminal(SessionStatus status) {
    return status == SessionStatus::COMPLETE || status == SessionStatus::FAILED ||
           status == SessionStatus::CANCELED;
}

struct HistoryEntry {
    std::string role; // user, assistant, system
    std::string content;
    std::chrono::system_clock::time_point timestamp;
};

// What a caller polling a sub-session needs to know.
struct StatusReport {
    SessionStatus status;
    std::string result;
    std::string error;
    std::optional<std::chrono::system_clock::time_point> completed_at;
};

// Conversation state for one (platform, chat) pair, or a background sub-session forked from one.
// Identity fields are fixed at construction; everything else is guarded by the session's own lock
// and only changed through SessionManager.
class Session {
public:
    using Clock = std::chrono::system_clock;

    Session(std::string id, SessionType type, std::string platform, std::string chat_id,
            std::string user_id, std::string parent_id = "", std::string task = "");

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    SessionType type() const { return type_; }
    const std::string& platform() const { return platform_; }
    const std::string& chat_id() const { return chat_id_; }
    const std::string& user_id() const { return user_id_; }
    const std::string& parent_id() const { return parent_id_; }
    const std::string& task() const { return task_; }

    SessionStatus status() const;
    std::string result() const;
    std::string error() const;
    Clock::time_point created_at() const { return created_at_; }
    Clock::time_point updated_at() const;
    std::optional<Clock::time_point> completed_at() const;
    size_t message_count() const;

    StatusReport report() const;

private:
    friend class SessionManager;

    const std::string id_;
    const SessionType type_;
    const std::string platform_;
    const std::string chat_id_;
    const std::string user_id_;
    const std::string parent_id_;
    const std::string task_;
    const Clock::time_point created_at_;

    mutable std::shared_mutex mutex_;
    SessionStatus status_;
    std::string result_;
    std::string error_;
    std::deque<HistoryEntry> messages_;
    std::map<std::string, boost::json::value> context_;
    Clock::time_point updated_at_;
    std::optional<Clock::time_point> completed_at_;
    std::optional<std::stop_source> stop_source_; // set only while pending or running
};

}
