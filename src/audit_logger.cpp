#include "audit_logger.hpp"
#include "vault.hpp"
#include "text_util.hpp"
#include "event_logger.hpp"

#include <stdexcept>
#include <boost/json.hpp>

namespace fs = std::filesystem;

namespace chatgate {

JsonAuditLogger::JsonAuditLogger(const fs::path& dir, size_t max_bytes)
    : dir_(dir), path_(dir / "security.log"), max_bytes_(max_bytes) {
    fs::create_directories(dir_);
    fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace);
    open();
}

void JsonAuditLogger::open() {
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        throw std::runtime_error("failed to open security log: " + path_.string());
    }
    std::error_code ec;
    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
}

std::string JsonAuditLogger::infer_severity(const std::string& event_type) {
    if (event_type == "auth_lockout") return "critical";
    if (event_type == "auth_failure" || event_type == "rate_limited") {
        return "warning";
    }
    return "info";
}

// Rename first, then reopen. If reopening fails the old name is restored.
void JsonAuditLogger::rotate_if_needed() {
    std::error_code ec;
    auto size = fs::file_size(path_, ec);
    if (ec || size < max_bytes_) return;

    auto stamp = std::chrono::system_clock::now();
    fs::path rotated = path_;
    rotated += "." + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        stamp.time_since_epoch()).count());

    out_.close();
    fs::rename(path_, rotated, ec);
    if (ec) {
        out_.open(path_, std::ios::out | std::ios::app);
        return;
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        fs::rename(rotated, path_, ec);
        out_.clear();
        out_.open(path_, std::ios::out | std::ios::app);
    }
}

bool JsonAuditLogger::log(SecurityEvent event) {
    if (event.severity.empty()) {
        event.severity = infer_severity(event.event_type);
    }

    boost::json::object obj;
    obj["timestamp"] = format_utc(event.timestamp);
    obj["event_type"] = event.event_type;
    if (!event.platform.empty()) obj["platform"] = event.platform;
    if (!event.user_id.empty()) obj["user_id"] = event.user_id;
    obj["success"] = event.success;
    if (!event.details.empty()) obj["details"] = event.details;
    obj["severity"] = event.severity;

    std::string line = boost::json::serialize(obj);

    std::lock_guard<std::mutex> lock(mutex_);
    rotate_if_needed();
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, "internal",
                         "audit log write failed");
        out_.clear();
        return false;
    }
    return true;
}

void JsonAuditLogger::log_auth_lockout(const std::string& platform, const std::string& user_id) {
    log({.event_type = "auth_lockout",
         .platform = platform,
         .user_id = hash_user_id(platform, user_id),
         .success = false,
         .details = "account locked due to repeated failures",
         .severity = "critical"});
}

void JsonAuditLogger::log_auth_failure(const std::string& platform, const std::string& user_id,
                                       const std::string& reason) {
    log({.event_type = "auth_failure",
         .platform = platform,
         .user_id = hash_user_id(platform, user_id),
         .success = false,
         .details = reason});
}

void JsonAuditLogger::log_rate_limited(const std::string& platform, const std::string& user_id) {
    log({.event_type = "rate_limited",
         .platform = platform,
         .user_id = hash_user_id(platform, user_id),
         .success = false});
}

}
