#include "session.hpp"

#include <mutex>

namespace chatgate {

std::string to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::PENDING: return "pending";
        case SessionStatus::RUNNING: return "running";
        case SessionStatus::COMPLETE: return "complete";
        case SessionStatus::FAILED: return "failed";
        case SessionStatus::CANCELED: return "canceled";
        default: return "unknown";
    }
}

std::string to_string(SessionType type) {
    return type == SessionType::MAIN ? "main" : "sub";
}

Session::Session(std::string id, SessionType type, std::string platform, std::string chat_id,
                 std::string user_id, std::string parent_id, std::string task)
    : id_(std::move(id)),
      type_(type),
      platform_(std::move(platform)),
      chat_id_(std::move(chat_id)),
      user_id_(std::move(user_id)),
      parent_id_(std::move(parent_id)),
      task_(std::move(task)),
      created_at_(Clock::now()),
      status_(type == SessionType::MAIN ? SessionStatus::RUNNING : SessionStatus::PENDING),
      updated_at_(created_at_) {}

SessionStatus Session::status() const {
    std::shared_lock lock(mutex_);
    return status_;
}

std::string Session::result() const {
    std::shared_lock lock(mutex_);
    return result_;
}

std::string Session::error() const {
    std::shared_lock lock(mutex_);
    return error_;
}

Session::Clock::time_point Session::updated_at() const {
    std::shared_lock lock(mutex_);
    return updated_at_;
}

std::optional<Session::Clock::time_point> Session::completed_at() const {
    std::shared_lock lock(mutex_);
    return completed_at_;
}

size_t Session::message_count() const {
    std::shared_lock lock(mutex_);
    return messages_.size();
}

StatusReport Session::report() const {
    std::shared_lock lock(mutex_);
    return {status_, result_, error_, completed_at_};
}

}
