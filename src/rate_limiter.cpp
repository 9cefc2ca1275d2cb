#include "rate_limiter.hpp"
#include "redis_manager.hpp"
#include <algorithm>

namespace chatgate {

SlidingWindowRateLimiter::SlidingWindowRateLimiter(int messages_per_window, int commands_per_window,
                                                   std::chrono::seconds window)
    : max_messages_(messages_per_window)
    , max_commands_(commands_per_window)
    , window_(window)
{}

bool SlidingWindowRateLimiter::allow_message(const std::string& user_key) {
    return allow(user_key, false);
}

bool SlidingWindowRateLimiter::allow_command(const std::string& user_key) {
    return allow(user_key, true);
}

size_t SlidingWindowRateLimiter::tracked_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

// Admits the event if fewer than the budget were admitted during the trailing window.
bool SlidingWindowRateLimiter::allow(const std::string& user_key, bool is_command) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();

    if (++call_count_ % PURGE_EVERY == 0) {
        purge_stale(now, user_key);
    }

    UserWindow& w = windows_[user_key];
    auto& events = is_command ? w.commands : w.messages;
    const int budget = is_command ? max_commands_ : max_messages_;

    const auto cutoff = now - window_;
    while (!events.empty() && events.front() <= cutoff) {
        events.pop_front();
    }

    if (static_cast<int>(events.size()) >= budget) {
        return false;
    }
    events.push_back(now);
    return true;
}

// Drops keys with no activity in the last two windows so the table stays bounded.
void SlidingWindowRateLimiter::purge_stale(Clock::time_point now, const std::string& keep_key) {
    const auto stale = now - 2 * window_;
    auto recent = [stale](const std::deque<Clock::time_point>& events) {
        return !events.empty() && events.back() > stale;
    };

    for (auto it = windows_.begin(); it != windows_.end(); ) {
        if (it->first != keep_key && !recent(it->second.messages) && !recent(it->second.commands)) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
}

RedisRateLimiter::RedisRateLimiter(RedisManager& redis, int messages_per_minute, int commands_per_minute)
    : redis_(redis)
    , messages_per_minute_(messages_per_minute)
    , commands_per_minute_(commands_per_minute)
{}

bool RedisRateLimiter::allow_message(const std::string& user_key) {
    return redis_.rate_limit("msg:" + user_key, messages_per_minute_, 60).allowed;
}

bool RedisRateLimiter::allow_command(const std::string& user_key) {
    return redis_.rate_limit("cmd:" + user_key, commands_per_minute_, 60).allowed;
}

}
