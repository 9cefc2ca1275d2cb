#include "auth_attempts.hpp"
#include <algorithm>

namespace chatgate {

AuthAttemptTracker::AuthAttemptTracker(int max_failures, std::chrono::seconds lockout)
    : max_failures_(max_failures), lockout_(lockout) {}

int AuthAttemptTracker::recent_failures(const std::string& user_key, Clock::time_point now) const {
    auto it = failures_.find(user_key);
    if (it == failures_.end()) return 0;

    const auto cutoff = now - lockout_;
    return static_cast<int>(std::count_if(it->second.begin(), it->second.end(),
                                          [cutoff](Clock::time_point t) { return t > cutoff; }));
}

bool AuthAttemptTracker::is_locked(const std::string& user_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return recent_failures(user_key, Clock::now()) >= max_failures_;
}

int AuthAttemptTracker::failure_count(const std::string& user_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return recent_failures(user_key, Clock::now());
}

void AuthAttemptTracker::record_failure(const std::string& user_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    const auto cutoff = now - lockout_;

    auto& times = failures_[user_key];
    times.erase(std::remove_if(times.begin(), times.end(),
                               [cutoff](Clock::time_point t) { return t <= cutoff; }),
                times.end());
    times.push_back(now);
}

void AuthAttemptTracker::clear_failures(const std::string& user_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.erase(user_key);
}

size_t AuthAttemptTracker::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = Clock::now() - 2 * lockout_;
    size_t removed = 0;

    for (auto it = failures_.begin(); it != failures_.end(); ) {
        auto& times = it->second;
        times.erase(std::remove_if(times.begin(), times.end(),
                                   [cutoff](Clock::time_point t) { return t <= cutoff; }),
                    times.end());
        if (times.empty()) {
            it = failures_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}
