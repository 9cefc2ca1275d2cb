#pragma once

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <sw/redis++/redis++.h>

#include "message_store.hpp"

namespace chatgate {

struct GatewayConfig;

struct RateLimitResult {
    bool allowed;
    long long current;
    long long limit;
    long long reset_after_sec;
};

// Redis-backed persistence and distributed admission control.
// Implements MessageStore over per-chat lists and provides an atomic
// sliding-window rate limiter. Every operation degrades gracefully
// (saves report false, rate limits fail open) while Redis is unreachable.
class RedisManager : public MessageStore {
public:
    explicit RedisManager(const GatewayConfig& config);
    ~RedisManager() = default;

    RedisManager(const RedisManager&) = delete;
    RedisManager& operator=(const RedisManager&) = delete;

    bool is_connected() const { return connected_; }

    // --- MessageStore ---
    bool save_message(const MessageRecord& record) override;
    bool save_audit(const AuditRecord& record) override;

    // Most recent serialized records of one chat, oldest first.
    std::vector<std::string> recent_messages(const std::string& platform, const std::string& chat_id,
                                             long long limit);

    // --- Distributed Rate Limiting ---
    // Counts events for key inside the trailing window via a Lua script (atomic across nodes).
    RateLimitResult rate_limit(const std::string& key, int limit, int window_sec);

    static std::string messages_key(const std::string& platform, const std::string& chat_id) {
        return "chatgate:messages:" + platform + ":" + chat_id;
    }
    static constexpr const char* AUDIT_KEY = "chatgate:audit";

private:
    bool append(const std::string& list_key, const std::string& value);

    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
    long long max_list_length_;
};

}
