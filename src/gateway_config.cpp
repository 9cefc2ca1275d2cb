#include "gateway_config.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <stdexcept>

namespace chatgate {

namespace {

int parse_int(const char* name, const char* value) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != std::string(value).size()) {
            throw ConfigError(std::string(name) + ": trailing characters in '" + value + "'");
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ConfigError(std::string(name) + ": not a number: '" + value + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError(std::string(name) + ": out of range: '" + value + "'");
    }
}

int parse_positive(const char* name, const char* value) {
    int parsed = parse_int(name, value);
    if (parsed <= 0) {
        throw ConfigError(std::string(name) + ": must be positive");
    }
    return parsed;
}

}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::string rest(value);
    size_t pos = 0;
    while ((pos = rest.find(',')) != std::string::npos) {
        std::string item = rest.substr(0, pos);
        if (!item.empty()) items.push_back(item);
        rest.erase(0, pos + 1);
    }
    if (!rest.empty()) items.push_back(rest);
    return items;
}

void apply_env_overrides(GatewayConfig& config) {
    if (const char* e = std::getenv("CHATGATE_REDIS_URL")) config.redis_url = e;
    if (const char* e = std::getenv("CHATGATE_ENCRYPTION_KEY")) config.encryption_key = e;
    if (const char* e = std::getenv("CHATGATE_AUDIT_LOG_DIR")) config.audit_log_dir = e;
    if (const char* e = std::getenv("CHATGATE_LOG_LEVEL")) config.log_level = e;

    if (const char* e = std::getenv("CHATGATE_ACCESS_MODE")) {
        std::string mode(e);
        if (mode != "allowlist" && mode != "open") {
            throw ConfigError("CHATGATE_ACCESS_MODE: expected 'allowlist' or 'open', got '" + mode + "'");
        }
        config.access.mode = mode;
    }

    if (const char* e = std::getenv("CHATGATE_GLOBAL_ADMINS")) {
        config.access.global_admins = split_list(e);
    }

    // platform:user pairs. A bare platform name registers the platform with an empty list.
    if (const char* e = std::getenv("CHATGATE_ALLOWED_USERS")) {
        config.allowed_users.clear();
        for (const auto& item : split_list(e)) {
            auto colon = item.find(':');
            if (colon == 0) {
                throw ConfigError("CHATGATE_ALLOWED_USERS: missing platform in '" + item + "'");
            }
            if (colon == std::string::npos) {
                config.allowed_users[item];
                continue;
            }
            config.allowed_users[item.substr(0, colon)].push_back(item.substr(colon + 1));
        }
    }

    if (const char* e = std::getenv("CHATGATE_LIMIT_MESSAGES")) {
        config.messages_per_minute = parse_positive("CHATGATE_LIMIT_MESSAGES", e);
    }
    if (const char* e = std::getenv("CHATGATE_LIMIT_COMMANDS")) {
        config.commands_per_minute = parse_positive("CHATGATE_LIMIT_COMMANDS", e);
    }
    if (const char* e = std::getenv("CHATGATE_DISTRIBUTED_RATE_LIMIT")) {
        std::string v(e);
        config.distributed_rate_limit = (v == "1" || v == "true" || v == "yes");
    }
    if (const char* e = std::getenv("CHATGATE_MAX_FAILED_AUTH")) {
        config.max_failed_auth = parse_positive("CHATGATE_MAX_FAILED_AUTH", e);
    }
    if (const char* e = std::getenv("CHATGATE_LOCKOUT_SEC")) {
        config.lockout_sec = parse_positive("CHATGATE_LOCKOUT_SEC", e);
    }
    if (const char* e = std::getenv("CHATGATE_MAX_HISTORY")) {
        config.max_history = static_cast<size_t>(parse_positive("CHATGATE_MAX_HISTORY", e));
    }
    if (const char* e = std::getenv("CHATGATE_TASK_TIMEOUT_SEC")) {
        config.task_timeout_sec = parse_positive("CHATGATE_TASK_TIMEOUT_SEC", e);
    }
    if (const char* e = std::getenv("CHATGATE_SESSION_RETENTION_SEC")) {
        config.session_retention_sec = parse_positive("CHATGATE_SESSION_RETENTION_SEC", e);
    }
    if (const char* e = std::getenv("CHATGATE_MAX_ACTIVE_TASKS")) {
        config.max_active_subsessions = static_cast<size_t>(parse_positive("CHATGATE_MAX_ACTIVE_TASKS", e));
    }
    if (const char* e = std::getenv("CHATGATE_THREADS")) {
        config.thread_count = parse_int("CHATGATE_THREADS", e);
        if (config.thread_count < 0) {
            throw ConfigError("CHATGATE_THREADS: must not be negative");
        }
    }
}

}
