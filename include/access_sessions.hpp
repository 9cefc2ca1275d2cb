#pragma once

#include <string>
#include <unordered_map>
#include <chrono>
#include <shared_mutex>

namespace chatgate {

// Access-layer session: tracks "is this user currently validated".
// Unrelated to conversation content (see SessionManager).
struct AccessSession {
    using Clock = std::chrono::steady_clock;

    std::string platform;
    std::string user_id;
    Clock::time_point created_at;
    Clock::time_point expires_at;
    Clock::time_point last_seen;
};

class AccessSessionTable {
public:
    using Clock = AccessSession::Clock;

    enum class Validity {
        VALID,
        ABSENT,
        EXPIRED,
        IDLE
    };

    explicit AccessSessionTable(std::chrono::seconds lifetime = std::chrono::hours(24),
                                std::chrono::seconds idle_timeout = std::chrono::hours(4));

    AccessSessionTable(const AccessSessionTable&) = delete;
    AccessSessionTable& operator=(const AccessSessionTable&) = delete;

    // Refreshes a valid session or replaces an expired/absent one.
    AccessSession touch(const std::string& platform, const std::string& user_id);

    // Expired and idle sessions are removed as a side effect.
    Validity validate(const std::string& platform, const std::string& user_id);

    void invalidate(const std::string& platform, const std::string& user_id);

    // Removes every session that is no longer valid. Returns the number removed.
    size_t cleanup();

    size_t size() const;

private:
    static std::string key(const std::string& platform, const std::string& user_id) {
        return platform + ":" + user_id;
    }
    bool is_valid(const AccessSession& s, Clock::time_point now) const;

    Clock::duration lifetime_;
    Clock::duration idle_timeout_;
    std::unordered_map<std::string, AccessSession> sessions_;
    mutable std::shared_mutex mutex_;
};

}
