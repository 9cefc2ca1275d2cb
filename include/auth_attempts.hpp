#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <mutex>

namespace chatgate {

// Per-user failure counter with lockout threshold.
class AuthAttempts {
public:
    virtual ~AuthAttempts() = default;
    virtual bool is_locked(const std::string& user_key) = 0;
    virtual void record_failure(const std::string& user_key) = 0;
    virtual void clear_failures(const std::string& user_key) = 0;
};

// Locks a key once max_failures failures fall inside the lockout window.
// Clearing on success means only consecutive recent failures count.
class AuthAttemptTracker : public AuthAttempts {
public:
    using Clock = std::chrono::steady_clock;

    explicit AuthAttemptTracker(int max_failures = 5,
                                std::chrono::seconds lockout = std::chrono::minutes(15));

    bool is_locked(const std::string& user_key) override;
    void record_failure(const std::string& user_key) override;
    void clear_failures(const std::string& user_key) override;

    // Recent failures for a key (inside the lockout window).
    int failure_count(const std::string& user_key);

    // Removes keys without failures in the last two windows. Returns the number removed.
    size_t cleanup();

private:
    int recent_failures(const std::string& user_key, Clock::time_point now) const;

    int max_failures_;
    Clock::duration lockout_;
    std::unordered_map<std::string, std::vector<Clock::time_point>> failures_;
    std::mutex mutex_;
};

}
