#include "router.hpp"
#include "errors.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"

#include <mutex>

namespace chatgate {

namespace {

const std::shared_ptr<DenyAll>& deny_all() {
    static const auto instance = std::make_shared<DenyAll>();
    return instance;
}

}

Router::Router(MessageStore& store, Vault& vault, RateLimiter& rate_limiter, AuthAttempts& auth_attempts,
               char command_prefix)
    : store_(store),
      vault_(vault),
      rate_limiter_(rate_limiter),
      auth_attempts_(auth_attempts),
      command_prefix_(command_prefix),
      access_(deny_all()),
      authorizer_(deny_all()),
      audit_(std::make_shared<NullAuditLogger>()),
      hooks_(std::make_shared<NullHookManager>()) {}

void Router::set_access_control(std::shared_ptr<AccessControl> access) {
    std::unique_lock lock(mutex_);
    access_ = access ? std::move(access) : std::shared_ptr<AccessControl>(deny_all());
}

void Router::set_authorizer(std::shared_ptr<Authorizer> authorizer) {
    std::unique_lock lock(mutex_);
    authorizer_ = authorizer ? std::move(authorizer) : std::shared_ptr<Authorizer>(deny_all());
}

void Router::set_audit_logger(std::shared_ptr<AuditLogger> audit) {
    std::unique_lock lock(mutex_);
    audit_ = audit ? std::move(audit) : std::make_shared<NullAuditLogger>();
}

void Router::set_hooks(std::shared_ptr<HookManager> hooks) {
    std::unique_lock lock(mutex_);
    hooks_ = hooks ? std::move(hooks) : std::make_shared<NullHookManager>();
}

void Router::register_platform(std::shared_ptr<Platform> platform) {
    std::unique_lock lock(mutex_);
    platform->set_handler([this](Message& msg) { return handle_message(msg); });
    platforms_[platform->name()] = std::move(platform);
}

void Router::set_handler(MessageHandler handler) {
    std::unique_lock lock(mutex_);
    handler_ = std::move(handler);
}

void Router::start(boost::asio::io_context& ioc) {
    std::shared_lock lock(mutex_);
    for (const auto& [name, p] : platforms_) {
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::PLATFORM, "internal",
                         "starting platform " + name);
        try {
            p->start(ioc);
        } catch (const std::exception& e) {
            throw PlatformStartError(name, e.what());
        }
    }
}

void Router::stop() {
    std::shared_lock lock(mutex_);
    for (const auto& [name, p] : platforms_) {
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::PLATFORM, "internal",
                         "stopping platform " + name);
        try {
            p->stop();
        } catch (const std::exception& e) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::PLATFORM, "internal",
                             "stop platform " + name + " failed: " + e.what());
        }
    }
}

void Router::send(const std::string& platform, const std::string& chat_id, const std::string& text) {
    std::shared_ptr<Platform> target;
    {
        std::shared_lock lock(mutex_);
        auto it = platforms_.find(platform);
        if (it == platforms_.end()) {
            throw UnknownPlatformError(platform);
        }
        target = it->second;
    }
    target->send(chat_id, text);
}

std::vector<std::string> Router::platforms() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(platforms_.size());
    for (const auto& [name, p] : platforms_) {
        names.push_back(name);
    }
    return names;
}

// Platform rules first; the legacy allowlist only gets a say when they do not allow.
bool Router::authorize(const Message& msg) {
    std::shared_ptr<AccessControl> access;
    std::shared_ptr<Authorizer> authorizer;
    {
        std::shared_lock lock(mutex_);
        access = access_;
        authorizer = authorizer_;
    }
    if (access->is_allowed(msg.platform, msg.user_id, msg.chat_id, msg.is_group())) {
        return true;
    }
    return authorizer->is_authorized(msg.platform, msg.user_id);
}

// Failures here are recorded, never surfaced.
void Router::persist(const Message& msg, const std::string& text, const std::string& user_hash,
                     const std::string& direction) {
    std::string ciphertext;
    try {
        ciphertext = vault_.encrypt(text);
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("encrypt_failures_total");
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::ENCRYPT_FAILURE, user_hash,
                         "encrypt message failed (" + direction + "): " + e.what());
        return;
    }

    MessageRecord record{
        .platform = msg.platform,
        .chat_id = msg.chat_id,
        .user_id = direction == "in" ? user_hash : "bot",
        .username = direction == "in" ? msg.username : "",
        .content = std::move(ciphertext),
        .direction = direction,
        .timestamp = direction == "in" ? msg.timestamp : std::chrono::system_clock::now()
    };

    if (!store_.save_message(record)) {
        MetricsRegistry::instance().increment_counter("storage_failures_total");
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, user_hash,
                         "save message failed (" + direction + ")");
    }
}

std::string Router::handle_message(Message& msg) {
    GaugeGuard in_flight("pipeline_in_flight");
    auto& metrics = MetricsRegistry::instance();
    metrics.increment_counter("pipeline_messages_total");

    const std::string user_key = msg.platform + ":" + msg.user_id;
    const std::string user_hash = hash_user_id(msg.platform, msg.user_id);

    std::shared_ptr<AuditLogger> audit;
    std::shared_ptr<HookManager> hooks;
    {
        std::shared_lock lock(mutex_);
        audit = audit_;
        hooks = hooks_;
    }

    // 1. Lockout
    if (auth_attempts_.is_locked(user_key)) {
        metrics.increment_counter("pipeline_rejected_locked_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::AUTH_LOCKOUT, user_hash,
                         "account locked on " + msg.platform);
        audit->log_auth_lockout(msg.platform, msg.user_id);
        throw LockedAccountError();
    }

    // 2. Authorization
    if (!authorize(msg)) {
        metrics.increment_counter("pipeline_rejected_unauthorized_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::AUTH_FAILURE, user_hash,
                         "unauthorized user on " + msg.platform);
        if (!store_.save_audit({.platform = msg.platform, .user_hash = user_hash, .action = "unauthorized"})) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, user_hash,
                             "save audit record failed");
        }
        auth_attempts_.record_failure(user_key);
        audit->log_auth_failure(msg.platform, msg.user_id, "not in allowlist");
        throw NotAuthorizedError();
    }

    auth_attempts_.clear_failures(user_key);
    access_sessions_.touch(msg.platform, msg.user_id);

    // 3. Rate limiting
    bool is_command = !msg.text.empty() && msg.text[0] == command_prefix_;
    bool admitted = is_command ? rate_limiter_.allow_command(user_key) : rate_limiter_.allow_message(user_key);
    if (!admitted) {
        metrics.increment_counter("pipeline_rate_limited_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::RATE_LIMIT_HIT, user_hash,
                         is_command ? "rate limited (command)" : "rate limited (message)");
        audit->log_rate_limited(msg.platform, msg.user_id);
        throw RateLimitedError();
    }

    // 4. Inbound persistence stores the text as received, before any hook rewrites it
    persist(msg, msg.text, user_hash, "in");

    // 5. Pre-message hook
    if (hooks->has_hooks(HookEventKind::PRE_MESSAGE)) {
        auto result = hooks->fire(HookEventKind::PRE_MESSAGE, {
            .platform = msg.platform,
            .user_id = msg.user_id,
            .chat_id = msg.chat_id,
            .text = msg.text
        });
        if (result.blocked) {
            metrics.increment_counter("pipeline_blocked_by_hook_total");
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::HOOK_BLOCKED, user_hash,
                             "message blocked by pre_message hook");
            return "";
        }
        if (!result.output.empty()) {
            msg.text = result.output;
        }
    }

    // 6. Dispatch
    MessageHandler handler;
    {
        std::shared_lock lock(mutex_);
        handler = handler_;
    }
    if (!handler) {
        return "";
    }

    std::string response;
    try {
        response = handler(msg);
    } catch (const std::exception& e) {
        metrics.increment_counter("handler_errors_total");
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::HANDLER_ERROR, user_hash,
                         e.what());
        hooks->fire_async(HookEventKind::ON_ERROR, {
            .platform = msg.platform,
            .user_id = msg.user_id,
            .chat_id = msg.chat_id,
            .text = msg.text,
            .error = e.what()
        });
        throw;
    }

    // 7. Post-response hook
    if (!response.empty() && hooks->has_hooks(HookEventKind::POST_RESPONSE)) {
        auto result = hooks->fire(HookEventKind::POST_RESPONSE, {
            .platform = msg.platform,
            .user_id = msg.user_id,
            .chat_id = msg.chat_id,
            .text = msg.text,
            .response = response
        });
        if (!result.output.empty()) {
            response = result.output;
        }
    }

    // 8. Outbound persistence
    if (!response.empty()) {
        persist(msg, response, user_hash, "out");
    }

    return response;
}

}
