#pragma once

#include <string>
#include <unordered_map>
#include <deque>
#include <chrono>
#include <mutex>

namespace chatgate {

class RedisManager;

// Per-user admission control for plain messages and commands.
// Implementations provide their own thread safety.
class RateLimiter {
public:
    virtual ~RateLimiter() = default;
    virtual bool allow_message(const std::string& user_key) = 0;
    virtual bool allow_command(const std::string& user_key) = 0;
};

// In-process sliding window limiter.
// Each key keeps the timestamps of admitted events inside the window.
class SlidingWindowRateLimiter : public RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    SlidingWindowRateLimiter(int messages_per_window, int commands_per_window,
                             std::chrono::seconds window = std::chrono::seconds(60));

    bool allow_message(const std::string& user_key) override;
    bool allow_command(const std::string& user_key) override;

    // Number of keys currently tracked.
    size_t tracked_keys() const;

private:
    struct UserWindow {
        std::deque<Clock::time_point> messages;
        std::deque<Clock::time_point> commands;
    };

    bool allow(const std::string& user_key, bool is_command);
    void purge_stale(Clock::time_point now, const std::string& keep_key);

    static constexpr unsigned PURGE_EVERY = 200;

    int max_messages_;
    int max_commands_;
    Clock::duration window_;
    unsigned call_count_ = 0;
    std::unordered_map<std::string, UserWindow> windows_;
    mutable std::mutex mutex_;
};

// Cluster-wide limiter: thin wrapper over the Redis token bucket.
// Fails open when Redis is unreachable.
class RedisRateLimiter : public RateLimiter {
public:
    RedisRateLimiter(RedisManager& redis, int messages_per_minute, int commands_per_minute);

    bool allow_message(const std::string& user_key) override;
    bool allow_command(const std::string& user_key) override;

private:
    RedisManager& redis_;
    int messages_per_minute_;
    int commands_per_minute_;
};

}
