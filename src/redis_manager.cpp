#include "redis_manager.hpp"
#include "gateway_config.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"

#include <chrono>
#include <iterator>
#include <boost/json.hpp>

namespace chatgate {

RedisManager::RedisManager(const GatewayConfig& config)
    : max_list_length_(static_cast<long long>(config.max_stored_messages)) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config.redis_url);
        redis_->ping();
        connected_ = true;
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::MAINTENANCE, "internal",
                         "Redis connected: " + config.redis_url);
    } catch (const sw::redis::Error& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, "internal",
                         std::string("Redis connection failed: ") + e.what());
        connected_ = false;
    }
}

// Appends to a capped list. The cap keeps per-chat history bounded on the server.
bool RedisManager::append(const std::string& list_key, const std::string& value) {
    if (!connected_) return false;
    try {
        auto pipe = redis_->pipeline();
        pipe.rpush(list_key, value)
            .ltrim(list_key, -max_list_length_, -1)
            .exec();
        return true;
    } catch (const sw::redis::Error& e) {
        MetricsRegistry::instance().increment_counter("storage_failure_total");
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, "internal",
                         std::string("Redis append failed: ") + e.what());
        return false;
    }
}

bool RedisManager::save_message(const MessageRecord& record) {
    return append(messages_key(record.platform, record.chat_id),
                  boost::json::serialize(to_json(record)));
}

bool RedisManager::save_audit(const AuditRecord& record) {
    return append(AUDIT_KEY, boost::json::serialize(to_json(record)));
}

std::vector<std::string> RedisManager::recent_messages(const std::string& platform, const std::string& chat_id,
                                                       long long limit) {
    std::vector<std::string> out;
    if (!connected_ || limit <= 0) return out;
    try {
        redis_->lrange(messages_key(platform, chat_id), -limit, -1, std::back_inserter(out));
    } catch (const sw::redis::Error& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, "internal",
                         std::string("Redis read failed: ") + e.what());
    }
    return out;
}

// Sliding-window counter on a sorted set: members are admission timestamps.
// Returns {allowed, count_in_window, seconds_until_oldest_expires}.
RateLimitResult RedisManager::rate_limit(const std::string& key, int limit, int window_sec) {
    RateLimitResult result = {true, 0LL, static_cast<long long>(limit), 0LL};

    if (!connected_) return result;

    try {
        static const std::string script = R"(
            local key = KEYS[1]
            local limit = tonumber(ARGV[1])
            local window_ms = tonumber(ARGV[2])
            local now_ms = tonumber(ARGV[3])
            local member = ARGV[4]

            redis.call('ZREMRANGEBYSCORE', key, '-inf', now_ms - window_ms)
            local count = redis.call('ZCARD', key)

            if count >= limit then
                local oldest = redis.call('ZRANGE', key, 0, 0, 'WITHSCORES')
                local retry_ms = window_ms
                if oldest[2] then
                    retry_ms = tonumber(oldest[2]) + window_ms - now_ms
                end
                return {0, count, math.ceil(retry_ms / 1000)}
            end

            redis.call('ZADD', key, now_ms, member)
            redis.call('PEXPIRE', key, window_ms)
            return {1, count + 1, 0}
        )";

        static std::atomic<unsigned long long> sequence{0};

        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        std::vector<std::string> keys = {"chatgate:rl:" + key};
        std::vector<std::string> args = {
            std::to_string(limit),
            std::to_string(static_cast<long long>(window_sec) * 1000),
            std::to_string(now_ms),
            std::to_string(now_ms) + "-" + std::to_string(sequence.fetch_add(1))
        };

        std::vector<long long> res;
        redis_->eval(script, keys.begin(), keys.end(), args.begin(), args.end(), std::back_inserter(res));

        if (res.size() >= 3) {
            result.allowed = res[0] == 1;
            result.current = res[1];
            result.reset_after_sec = res[2];
        }
        return result;
    } catch (const sw::redis::Error& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, "internal",
                         std::string("Redis rate limit error: ") + e.what());
        return result;
    }
}

}
