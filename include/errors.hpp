#pragma once

#include <stdexcept>
#include <string>

namespace chatgate {

// Root of every failure the gateway reports.
// user_message() is the text a chat user may see; what() is for logs.
class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& what, std::string user_message = "Something went wrong.")
        : std::runtime_error(what), user_message_(std::move(user_message)) {}

    const std::string& user_message() const noexcept { return user_message_; }

private:
    std::string user_message_;
};

// --- Pipeline-terminal security errors ---

class LockedAccountError : public GatewayError {
public:
    LockedAccountError()
        : GatewayError("account temporarily locked",
                       "Too many failed attempts. Please try again later.") {}
};

class NotAuthorizedError : public GatewayError {
public:
    NotAuthorizedError()
        : GatewayError("user not authorized", "Access denied.") {}
};

class RateLimitedError : public GatewayError {
public:
    RateLimitedError()
        : GatewayError("rate limit exceeded", "You are sending messages too fast. Please slow down.") {}
};

// --- Platform registry ---

class UnknownPlatformError : public GatewayError {
public:
    explicit UnknownPlatformError(const std::string& platform)
        : GatewayError("unknown platform: " + platform), platform_(platform) {}

    const std::string& platform() const noexcept { return platform_; }

private:
    std::string platform_;
};

class PlatformStartError : public GatewayError {
public:
    PlatformStartError(const std::string& platform, const std::string& cause)
        : GatewayError("start " + platform + ": " + cause), platform_(platform) {}

    const std::string& platform() const noexcept { return platform_; }

private:
    std::string platform_;
};

// --- Sessions ---

class SessionNotFoundError : public GatewayError {
public:
    explicit SessionNotFoundError(const std::string& id)
        : GatewayError("session not found: " + id, "Session not found.") {}
};

class SessionNotRunningError : public GatewayError {
public:
    explicit SessionNotRunningError(const std::string& id)
        : GatewayError("session not running: " + id, "Session is not running.") {}
};

class SessionLimitError : public GatewayError {
public:
    explicit SessionLimitError(size_t limit)
        : GatewayError("too many active sub-sessions (limit " + std::to_string(limit) + ")",
                       "Too many background tasks are running. Please wait for one to finish.") {}
};

class NoTaskRunnerError : public GatewayError {
public:
    NoTaskRunnerError() : GatewayError("no task runner configured") {}
};

// --- Infrastructure ---

class VaultError : public GatewayError {
public:
    explicit VaultError(const std::string& what) : GatewayError("vault: " + what) {}
};

class ConfigError : public GatewayError {
public:
    explicit ConfigError(const std::string& what) : GatewayError("config: " + what) {}
};

}
