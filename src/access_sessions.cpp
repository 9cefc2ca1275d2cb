#include "access_sessions.hpp"
#include <mutex>

namespace chatgate {

AccessSessionTable::AccessSessionTable(std::chrono::seconds lifetime, std::chrono::seconds idle_timeout)
    : lifetime_(lifetime), idle_timeout_(idle_timeout) {}

bool AccessSessionTable::is_valid(const AccessSession& s, Clock::time_point now) const {
    return now <= s.expires_at && now - s.last_seen <= idle_timeout_;
}

AccessSession AccessSessionTable::touch(const std::string& platform, const std::string& user_id) {
    const auto now = Clock::now();
    std::unique_lock lock(mutex_);

    auto it = sessions_.find(key(platform, user_id));
    if (it != sessions_.end() && is_valid(it->second, now)) {
        it->second.last_seen = now;
        return it->second;
    }

    AccessSession s{platform, user_id, now, now + lifetime_, now};
    sessions_[key(platform, user_id)] = s;
    return s;
}

AccessSessionTable::Validity AccessSessionTable::validate(const std::string& platform, const std::string& user_id) {
    const auto now = Clock::now();
    const std::string k = key(platform, user_id);

    Validity result = Validity::VALID;
    {
        std::shared_lock lock(mutex_);
        auto it = sessions_.find(k);
        if (it == sessions_.end()) return Validity::ABSENT;
        if (now > it->second.expires_at) {
            result = Validity::EXPIRED;
        } else if (now - it->second.last_seen > idle_timeout_) {
            result = Validity::IDLE;
        }
    }

    if (result != Validity::VALID) {
        std::unique_lock lock(mutex_);
        sessions_.erase(k);
    }
    return result;
}

void AccessSessionTable::invalidate(const std::string& platform, const std::string& user_id) {
    std::unique_lock lock(mutex_);
    sessions_.erase(key(platform, user_id));
}

size_t AccessSessionTable::cleanup() {
    const auto now = Clock::now();
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        if (!is_valid(it->second, now)) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t AccessSessionTable::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

}
