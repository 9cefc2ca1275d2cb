#pragma once

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <functional>
#include <shared_mutex>
#include <boost/asio/io_context.hpp>

#include "platform.hpp"
#include "access_control.hpp"
#include "rate_limiter.hpp"
#include "auth_attempts.hpp"
#include "access_sessions.hpp"
#include "audit_logger.hpp"
#include "hook_manager.hpp"
#include "message_store.hpp"
#include "vault.hpp"

namespace chatgate {

// Application logic behind the security pipeline. Throws on failure.
using MessageHandler = std::function<std::string(Message&)>;

// Owns the platform registry and runs every inbound message through the security pipeline:
// lockout, authorization, rate limiting, inbound persistence, pre_message hook, dispatch,
// post_response hook, outbound persistence.
class Router {
public:
    Router(MessageStore& store, Vault& vault, RateLimiter& rate_limiter, AuthAttempts& auth_attempts,
           char command_prefix = '/');

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Optional collaborators. Passing nullptr restores the no-op default.
    void set_access_control(std::shared_ptr<AccessControl> access);
    void set_authorizer(std::shared_ptr<Authorizer> authorizer);
    void set_audit_logger(std::shared_ptr<AuditLogger> audit);
    void set_hooks(std::shared_ptr<HookManager> hooks);

    // Re-registering a name replaces the previous platform.
    void register_platform(std::shared_ptr<Platform> platform);
    void set_handler(MessageHandler handler);

    // Throws PlatformStartError naming the first platform that fails.
    void start(boost::asio::io_context& ioc);

    // Best effort: failures are logged and the remaining platforms are still stopped.
    void stop();

    // Throws UnknownPlatformError.
    void send(const std::string& platform, const std::string& chat_id, const std::string& text);

    std::vector<std::string> platforms() const;

    // The pipeline. Returns the response to transmit ("" for nothing).
    // Throws LockedAccountError, NotAuthorizedError, RateLimitedError, or the handler's exception.
    std::string handle_message(Message& msg);

    AccessSessionTable& access_sessions() { return access_sessions_; }

private:
    bool authorize(const Message& msg);
    void persist(const Message& msg, const std::string& text, const std::string& user_hash,
                 const std::string& direction);

    MessageStore& store_;
    Vault& vault_;
    RateLimiter& rate_limiter_;
    AuthAttempts& auth_attempts_;
    const char command_prefix_;

    AccessSessionTable access_sessions_;

    std::shared_ptr<AccessControl> access_;
    std::shared_ptr<Authorizer> authorizer_;
    std::shared_ptr<AuditLogger> audit_;
    std::shared_ptr<HookManager> hooks_;

    std::map<std::string, std::shared_ptr<Platform>> platforms_;
    MessageHandler handler_;
    mutable std::shared_mutex mutex_;
};

}
