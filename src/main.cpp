#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <sstream>
#include <functional>

#include "gateway_config.hpp"
#include "errors.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "vault.hpp"
#include "redis_manager.hpp"
#include "rate_limiter.hpp"
#include "auth_attempts.hpp"
#include "access_control.hpp"
#include "audit_logger.hpp"
#include "hook_manager.hpp"
#include "router.hpp"
#include "session_manager.hpp"
#include "console_platform.hpp"
#include "handlers/task_handler.hpp"

namespace net = boost::asio;

namespace {

constexpr const char* VERSION = "1.0.0";
constexpr const char* CONSOLE_USER = "local";

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string w;
    while (in >> w) words.push_back(w);
    return words;
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "Options:\n"
              << "  --console, -c  Read messages from stdin (local development)\n"
              << "  --help, -h     Show this help\n"
              << "Configuration is read from CHATGATE_* environment variables.\n";
}

}

int main(int argc, char* argv[]) {
    using chatgate::EventLogger;
    try {
        chatgate::GatewayConfig config;
        bool console = false;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--console" || arg == "-c") {
                console = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        // --- Environment Variable Overrides ---
        chatgate::apply_env_overrides(config);
        EventLogger::set_min_level(EventLogger::parse_level(config.log_level));

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        if (config.encryption_key.empty()) {
            config.encryption_key = chatgate::AesGcmVault::generate_key();
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::MAINTENANCE, "internal",
                             "CHATGATE_ENCRYPTION_KEY not set; using an ephemeral key, stored messages "
                             "will not be readable after restart");
        }

        // --- Collaborators ---
        chatgate::AesGcmVault vault(config.encryption_key);
        chatgate::RedisManager redis(config);

        std::unique_ptr<chatgate::RateLimiter> rate_limiter;
        if (config.distributed_rate_limit) {
            rate_limiter = std::make_unique<chatgate::RedisRateLimiter>(
                redis, config.messages_per_minute, config.commands_per_minute);
        } else {
            rate_limiter = std::make_unique<chatgate::SlidingWindowRateLimiter>(
                config.messages_per_minute, config.commands_per_minute);
        }

        chatgate::AuthAttemptTracker auth_attempts(config.max_failed_auth, std::chrono::seconds(config.lockout_sec));

        if (console && config.access.platforms.find("console") == config.access.platforms.end()) {
            config.access.platforms["console"] = chatgate::PlatformAccess{.allowed_users = {CONSOLE_USER}};
        }

        chatgate::Router router(redis, vault, *rate_limiter, auth_attempts, config.command_prefix);
        router.set_access_control(std::make_shared<chatgate::AccessPolicy>(config.access));
        if (!config.allowed_users.empty()) {
            router.set_authorizer(std::make_shared<chatgate::Allowlist>(config.allowed_users));
        }

        try {
            router.set_audit_logger(std::make_shared<chatgate::JsonAuditLogger>(
                config.audit_log_dir, config.audit_log_max_bytes));
        } catch (const std::exception& e) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE, "internal",
                             std::string("audit log disabled: ") + e.what());
        }

        // Hook definitions come from the embedding application; the daemon ships none.
        std::shared_ptr<chatgate::HookManager> hooks = std::make_shared<chatgate::NullHookManager>();
        router.set_hooks(hooks);

        chatgate::SessionOptions session_options{
            .max_history = config.max_history,
            .parent_history_window = config.parent_history_window,
            .task_timeout = std::chrono::seconds(config.task_timeout_sec),
            .max_active_sub_sessions = config.max_active_subsessions
        };
        chatgate::SessionManager sessions(session_options,
            [&router](const std::string& platform, const std::string& chat_id, const std::string& message) {
                router.send(platform, chat_id, message);
            });

        const auto retention = std::chrono::seconds(config.session_retention_sec);
        chatgate::TaskCommandHandler tasks(sessions, retention);
        const std::string task_command = std::string(1, config.command_prefix) + "task";

        router.set_handler([&](chatgate::Message& msg) -> std::string {
            auto session = sessions.get_or_create(msg.platform, msg.chat_id, msg.user_id);

            auto words = split_words(msg.text);
            if (!words.empty() && words[0] == task_command) {
                hooks->fire_async(chatgate::HookEventKind::ON_COMMAND, {
                    .platform = msg.platform,
                    .user_id = msg.user_id,
                    .chat_id = msg.chat_id,
                    .command = "task",
                    .args = std::vector<std::string>(words.begin() + 1, words.end())
                });
                return tasks.handle_command(msg.user_id, msg.platform, msg.chat_id,
                                            std::vector<std::string>(words.begin() + 1, words.end()));
            }

            sessions.add_message(*session, "user", msg.text);
            std::string reply = "Received. " + std::to_string(session->message_count()) +
                                " messages in this conversation. Use /task help for background tasks.";
            sessions.add_message(*session, "assistant", reply);
            return reply;
        });

        if (console) {
            router.register_platform(std::make_shared<chatgate::ConsolePlatform>(CONSOLE_USER, "console"));
        }
        if (router.platforms().empty()) {
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::PLATFORM, "internal",
                             "no platforms registered (use --console for local testing)");
        }

        net::io_context ioc{config.thread_count};

        router.start(ioc);
        hooks->fire_async(chatgate::HookEventKind::ON_START, {
            .version = VERSION,
            .platforms = router.platforms()
        });
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::PLATFORM, "internal",
                         std::string("chatgate ") + VERSION + " started");

        // --- Periodic Maintenance ---
        const auto interval = std::chrono::seconds(config.maintenance_interval_sec);
        net::steady_timer maintenance_timer(ioc, interval);
        std::function<void(const boost::system::error_code&)> on_maintenance;
        on_maintenance = [&](const boost::system::error_code& ec) {
            if (ec) return;
            size_t cleared = sessions.clear(retention);
            size_t attempts = auth_attempts.cleanup();
            size_t access = router.access_sessions().cleanup();
            chatgate::MetricsRegistry::instance().set_gauge("sessions_total", static_cast<double>(sessions.size()));
            EventLogger::log(EventLogger::Level::DEBUG, EventLogger::EventType::MAINTENANCE, "internal",
                             "cleared " + std::to_string(cleared) + " sessions, " + std::to_string(attempts) +
                             " auth records, " + std::to_string(access) + " access sessions");
            maintenance_timer.expires_after(interval);
            maintenance_timer.async_wait(on_maintenance);
        };
        maintenance_timer.async_wait(on_maintenance);

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::PLATFORM, "internal",
                             "Initiating graceful shutdown");
            boost::system::error_code ec;
            maintenance_timer.cancel(ec);
            router.stop();
            hooks->fire(chatgate::HookEventKind::ON_STOP, {.version = VERSION});
            ioc.stop();
        });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);
        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();

        for (auto& t : threads) {
            t.join();
        }
        return 0;

    } catch (const chatgate::ConfigError& e) {
        std::cerr << "[!] Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
