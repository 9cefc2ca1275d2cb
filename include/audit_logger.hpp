#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>
#include <chrono>

namespace chatgate {

// Append-only record of security-relevant events. Calls never fail the caller.
// user_id arguments are raw platform IDs; implementations hash them before writing.
class AuditLogger {
public:
    virtual ~AuditLogger() = default;

    virtual void log_auth_lockout(const std::string& platform, const std::string& user_id) = 0;
    virtual void log_auth_failure(const std::string& platform, const std::string& user_id,
                                  const std::string& reason) = 0;
    virtual void log_rate_limited(const std::string& platform, const std::string& user_id) = 0;
};

class NullAuditLogger : public AuditLogger {
public:
    void log_auth_lockout(const std::string&, const std::string&) override {}
    void log_auth_failure(const std::string&, const std::string&, const std::string&) override {}
    void log_rate_limited(const std::string&, const std::string&) override {}
};

struct SecurityEvent {
    std::string event_type;  // auth_lockout, auth_failure, rate_limited
    std::string platform;
    std::string user_id;     // hashed
    bool success = false;
    std::string details;
    std::string severity;    // inferred when empty
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// Writes one JSON document per line to <dir>/security.log (mode 0600),
// rotating to security.log.<stamp> once the file exceeds max_bytes.
class JsonAuditLogger : public AuditLogger {
public:
    // Throws std::filesystem::filesystem_error / std::runtime_error when the log cannot be opened.
    JsonAuditLogger(const std::filesystem::path& dir, size_t max_bytes = 50 * 1024 * 1024);

    void log_auth_lockout(const std::string& platform, const std::string& user_id) override;
    void log_auth_failure(const std::string& platform, const std::string& user_id,
                          const std::string& reason) override;
    void log_rate_limited(const std::string& platform, const std::string& user_id) override;

    // Returns false if the event could not be written.
    bool log(SecurityEvent event);

    const std::filesystem::path& path() const { return path_; }

    static std::string infer_severity(const std::string& event_type);

private:
    void open();
    void rotate_if_needed();

    std::filesystem::path dir_;
    std::filesystem::path path_;
    size_t max_bytes_;
    std::ofstream out_;
    std::mutex mutex_;
};

}
