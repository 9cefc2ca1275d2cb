#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <atomic>
#include <cctype>

namespace chatgate {

// Logs gateway events. Subjects are hashed user references (see hash_user_id),
// never raw platform user IDs.
class EventLogger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        AUTH_SUCCESS,
        AUTH_FAILURE,
        AUTH_LOCKOUT,
        RATE_LIMIT_HIT,
        HOOK_BLOCKED,
        HOOK_FAILURE,
        HANDLER_ERROR,
        ENCRYPT_FAILURE,
        STORAGE_FAILURE,
        PLATFORM,
        SUBSESSION,
        NOTIFY_FAILURE,
        MAINTENANCE
    };

    /**
     * Records a gateway event.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param subject Hashed user reference, or "internal" for process events.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& subject,
                   const std::string& message = "") {
        if (level < min_level()) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "user=" << (subject.empty() ? "unknown" : subject);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        ss << "\n";

        // One write per line; concurrent pipelines must not interleave output
        static std::mutex write_mutex;
        std::lock_guard<std::mutex> lock(write_mutex);
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str();
        } else {
            std::cout << ss.str();
        }
    }

    static void set_min_level(Level level) { min_level_ref().store(level); }
    static Level min_level() { return min_level_ref().load(); }

    // Accepts debug|info|warn|warning|error|critical; anything else keeps INFO.
    static Level parse_level(const std::string& name) {
        if (name == "debug") return Level::DEBUG;
        if (name == "warn" || name == "warning") return Level::WARNING;
        if (name == "error") return Level::ERROR;
        if (name == "critical") return Level::CRITICAL;
        return Level::INFO;
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::AUTH_SUCCESS: return "AUTH_SUCCESS";
            case EventType::AUTH_FAILURE: return "AUTH_FAILURE";
            case EventType::AUTH_LOCKOUT: return "AUTH_LOCKOUT";
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::HOOK_BLOCKED: return "HOOK_BLOCKED";
            case EventType::HOOK_FAILURE: return "HOOK_FAILURE";
            case EventType::HANDLER_ERROR: return "HANDLER_ERROR";
            case EventType::ENCRYPT_FAILURE: return "ENCRYPT_FAILURE";
            case EventType::STORAGE_FAILURE: return "STORAGE_FAILURE";
            case EventType::PLATFORM: return "PLATFORM";
            case EventType::SUBSESSION: return "SUBSESSION";
            case EventType::NOTIFY_FAILURE: return "NOTIFY_FAILURE";
            case EventType::MAINTENANCE: return "MAINTENANCE";
            default: return "UNKNOWN_EVENT";
        }
    }

private:
    static std::atomic<Level>& min_level_ref() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }
};

}
