#include "hook_manager.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "text_util.hpp"

#include <stdexcept>
#include <boost/asio/post.hpp>

namespace chatgate {

std::string to_string(HookEventKind kind) {
    switch (kind) {
        case HookEventKind::PRE_MESSAGE: return "pre_message";
        case HookEventKind::POST_RESPONSE: return "post_response";
        case HookEventKind::ON_COMMAND: return "on_command";
        case HookEventKind::ON_START: return "on_start";
        case HookEventKind::ON_STOP: return "on_stop";
        case HookEventKind::ON_ERROR: return "on_error";
        default: return "unknown";
    }
}

std::optional<HookEventKind> parse_hook_event(const std::string& name) {
    for (auto kind : {HookEventKind::PRE_MESSAGE, HookEventKind::POST_RESPONSE, HookEventKind::ON_COMMAND,
                      HookEventKind::ON_START, HookEventKind::ON_STOP, HookEventKind::ON_ERROR}) {
        if (to_string(kind) == name) return kind;
    }
    return std::nullopt;
}

namespace {

void put_if_set(boost::json::object& obj, const char* key, const std::string& value) {
    if (!value.empty()) obj[key] = value;
}

void put_if_set(boost::json::object& obj, const char* key, const std::vector<std::string>& values) {
    if (values.empty()) return;
    boost::json::array arr;
    for (const auto& v : values) arr.emplace_back(v);
    obj[key] = std::move(arr);
}

}

boost::json::object HookEvent::to_json() const {
    boost::json::object obj;
    obj["event"] = event;
    put_if_set(obj, "platform", platform);
    put_if_set(obj, "user_id", user_id);
    put_if_set(obj, "chat_id", chat_id);
    put_if_set(obj, "text", text);
    put_if_set(obj, "response", response);
    put_if_set(obj, "command", command);
    put_if_set(obj, "args", args);
    put_if_set(obj, "error", error);
    put_if_set(obj, "version", version);
    put_if_set(obj, "platforms", platforms);
    return obj;
}

HookDispatcher::HookDispatcher(std::vector<HookConfig> hooks, std::shared_ptr<HookRunner> runner,
                               size_t async_workers)
    : hooks_(std::move(hooks)), runner_(std::move(runner)), pool_(async_workers == 0 ? 1 : async_workers) {
    if (!runner_) {
        throw std::invalid_argument("HookDispatcher requires a runner");
    }
}

HookDispatcher::~HookDispatcher() {
    drain();
}

void HookDispatcher::drain() {
    pool_.join();
}

bool HookDispatcher::matches_platform(const std::vector<std::string>& platforms, const std::string& platform) {
    if (platforms.empty()) return true;
    std::string wanted = to_lower(platform);
    for (const auto& p : platforms) {
        if (to_lower(p) == wanted) return true;
    }
    return false;
}

bool HookDispatcher::has_hooks(HookEventKind kind) const {
    for (const auto& h : hooks_) {
        if (h.event == kind) return true;
    }
    return false;
}

// A runner that throws counts as a failed hook.
HookRunResult HookDispatcher::execute(const HookConfig& hook, const std::string& payload) {
    try {
        HookRunResult result = runner_->run(hook, payload);
        if (!result.ok) {
            MetricsRegistry::instance().increment_counter("hook_failures_total");
        }
        return result;
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("hook_failures_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::HOOK_FAILURE, "internal",
                         "hook " + hook.name + " failed: " + e.what());
        return {"", false};
    }
}

void HookDispatcher::detach(const HookConfig& hook, std::string payload) {
    boost::asio::post(pool_, [this, hook, payload = std::move(payload)]() {
        auto result = execute(hook, payload);
        if (!result.ok) {
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::HOOK_FAILURE, "internal",
                             "async hook " + hook.name + " failed");
        }
    });
}

HookResult HookDispatcher::fire(HookEventKind kind, HookEvent event) {
    HookResult result;
    event.event = to_string(kind);
    std::string payload;

    for (const auto& h : hooks_) {
        if (h.event != kind || !matches_platform(h.platforms, event.platform)) continue;
        if (payload.empty()) payload = boost::json::serialize(event.to_json());

        if (h.async) {
            detach(h, payload);
            continue;
        }

        auto run = execute(h, payload);
        if (!run.ok) {
            result.blocked = true;
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::HOOK_BLOCKED, "internal",
                             "hook " + h.name + " blocked " + event.event);
        }
        if (!run.output.empty()) {
            result.output = run.output;
        }
    }
    return result;
}

void HookDispatcher::fire_async(HookEventKind kind, HookEvent event) {
    event.event = to_string(kind);
    std::string payload;
    for (const auto& h : hooks_) {
        if (h.event != kind || !matches_platform(h.platforms, event.platform)) continue;
        if (payload.empty()) payload = boost::json::serialize(event.to_json());
        detach(h, payload);
    }
}

}
