#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <boost/json.hpp>
#include <boost/asio/thread_pool.hpp>

namespace chatgate {

enum class HookEventKind {
    PRE_MESSAGE,
    POST_RESPONSE,
    ON_COMMAND,
    ON_START,
    ON_STOP,
    ON_ERROR
};

std::string to_string(HookEventKind kind);
std::optional<HookEventKind> parse_hook_event(const std::string& name);

// Payload handed to hook commands. Empty fields are omitted from the JSON form.
struct HookEvent {
    std::string event;  // filled in by the dispatcher
    std::string platform;
    std::string user_id;
    std::string chat_id;
    std::string text;
    std::string response;
    std::string command;
    std::vector<std::string> args;
    std::string error;
    std::string version;
    std::vector<std::string> platforms;

    boost::json::object to_json() const;
};

struct HookResult {
    std::string output;   // last non-empty output of a synchronous hook
    bool blocked = false; // some synchronous hook failed
};

class HookManager {
public:
    virtual ~HookManager() = default;

    virtual bool has_hooks(HookEventKind kind) const = 0;

    // Runs matching hooks synchronously (async-flagged hooks are still detached).
    virtual HookResult fire(HookEventKind kind, HookEvent event) = 0;

    // Detaches every matching hook; never waits.
    virtual void fire_async(HookEventKind kind, HookEvent event) = 0;
};

class NullHookManager : public HookManager {
public:
    bool has_hooks(HookEventKind) const override { return false; }
    HookResult fire(HookEventKind, HookEvent) override { return {}; }
    void fire_async(HookEventKind, HookEvent) override {}
};

struct HookConfig {
    std::string name;
    HookEventKind event = HookEventKind::PRE_MESSAGE;
    std::vector<std::string> platforms; // empty matches every platform
    std::string command;
    int timeout_sec = 10;
    bool async = false;
};

struct HookRunResult {
    std::string output;
    bool ok = true;
};

// Executes one hook with its serialized payload. Process handling lives behind this seam.
class HookRunner {
public:
    virtual ~HookRunner() = default;
    virtual HookRunResult run(const HookConfig& hook, const std::string& payload_json) = 0;
};

class HookDispatcher : public HookManager {
public:
    HookDispatcher(std::vector<HookConfig> hooks, std::shared_ptr<HookRunner> runner,
                   size_t async_workers = 2);
    ~HookDispatcher() override;

    HookDispatcher(const HookDispatcher&) = delete;
    HookDispatcher& operator=(const HookDispatcher&) = delete;

    bool has_hooks(HookEventKind kind) const override;
    HookResult fire(HookEventKind kind, HookEvent event) override;
    void fire_async(HookEventKind kind, HookEvent event) override;

    // Blocks until every detached hook has finished. Used on shutdown.
    void drain();

    static bool matches_platform(const std::vector<std::string>& platforms, const std::string& platform);

private:
    HookRunResult execute(const HookConfig& hook, const std::string& payload);
    void detach(const HookConfig& hook, std::string payload);

    std::vector<HookConfig> hooks_;
    std::shared_ptr<HookRunner> runner_;
    boost::asio::thread_pool pool_;
};

}
