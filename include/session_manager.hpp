#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <functional>
#include <chrono>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <thread>
#include <optional>
#include <stop_token>
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/json.hpp>

#include "session.hpp"

namespace chatgate {

// Executes a background task (usually a model call) against a snapshot of the parent's history.
// Implementations should return promptly once stop is requested. Failures are thrown.
class TaskRunner {
public:
    virtual ~TaskRunner() = default;
    virtual std::string execute(std::stop_token stop, const std::string& task,
                                const std::vector<HistoryEntry>& history) = 0;
};

// Delivers a completion summary to a chat. Throws on delivery failure.
using NotifyFunc = std::function<void(const std::string& platform, const std::string& chat_id,
                                      const std::string& message)>;

struct SessionOptions {
    size_t max_history = 50;
    size_t parent_history_window = 10;
    std::chrono::milliseconds task_timeout = std::chrono::minutes(5);
    size_t max_active_sub_sessions = 50;
    // Runs on the worker thread before a sub-session leaves PENDING.
    std::function<void(const Session&)> before_run;
};

// Owns every conversation session and the background sub-sessions forked from them.
//
// Main sessions are keyed "platform:chat". Sub-sessions are keyed "<parent>:sub:<n>" with n
// drawn from a per-manager counter, run on their own worker thread, and stop either on cancel()
// or when the task timeout fires; both request stop on the same stop_source. Each sub-session
// produces exactly one notification once it reaches a terminal state.
class SessionManager {
public:
    using SessionPtr = std::shared_ptr<Session>;

    explicit SessionManager(SessionOptions options = {}, NotifyFunc notify = nullptr);

    // Cancels outstanding sub-sessions and waits for their workers.
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    void set_task_runner(std::shared_ptr<TaskRunner> runner);
    void set_notify(NotifyFunc notify);

    // Returns the single session for (platform, chat), creating it on first use.
    SessionPtr get_or_create(const std::string& platform, const std::string& chat_id,
                             const std::string& user_id);

    // nullptr when absent. A sub-session wins over a main session whose chat ID spells the same key.
    SessionPtr get(const std::string& id) const;

    void add_message(Session& session, const std::string& role, const std::string& content);

    // Most recent `limit` entries (0 or more than stored means all), as an independent copy.
    std::vector<HistoryEntry> get_history(const Session& session, size_t limit = 0) const;

    // Starts a background sub-session and returns immediately.
    // Throws SessionLimitError when too many sub-sessions are active.
    SessionPtr spawn(const SessionPtr& parent, const std::string& task);

    // Throws SessionNotFoundError or SessionNotRunningError.
    void cancel(const std::string& session_id);

    // user_id empty matches everyone. Without include_complete, complete and failed sessions are
    // skipped but canceled ones are kept.
    std::vector<SessionPtr> list(const std::string& user_id, bool include_complete) const;
    std::vector<SessionPtr> list_sub_sessions(const std::string& parent_id) const;

    // Removes terminal sessions completed before now - older_than. Returns the number removed.
    size_t clear(std::chrono::system_clock::duration older_than);

    void set_context(Session& session, const std::string& key, boost::json::value value);
    std::optional<boost::json::value> get_context(const Session& session, const std::string& key) const;

    // Throws SessionNotFoundError.
    StatusReport status(const std::string& session_id) const;

    // Blocks until the session is terminal or the timeout elapses, then reports its state.
    // Throws SessionNotFoundError.
    StatusReport wait(const std::string& session_id, std::chrono::milliseconds timeout) const;

    size_t active_sub_sessions() const;
    size_t size() const;

    static std::string format_notification(const Session& session, const StatusReport& report);

private:
    SessionPtr find_main(const std::string& id) const;
    void run_sub_session(SessionPtr sub);
    void notify_completion(const Session& sub, const StatusReport& report);
    void signal_done() const;

    SessionOptions options_;

    // Separate tables: a chat ID may itself contain ":sub:<n>".
    std::unordered_map<std::string, SessionPtr> main_sessions_;
    std::unordered_map<std::string, SessionPtr> sub_sessions_;
    mutable std::shared_mutex sessions_mutex_;

    std::shared_ptr<TaskRunner> task_runner_;
    NotifyFunc notify_;
    mutable std::mutex callbacks_mutex_;

    std::atomic<unsigned long long> sub_counter_{0};

    // Live worker threads; the destructor waits for this to reach zero.
    size_t active_workers_ = 0;
    mutable std::mutex workers_mutex_;
    std::condition_variable workers_cv_;

    // Terminal transitions wake wait().
    mutable std::mutex done_mutex_;
    mutable std::condition_variable done_cv_;

    // Task timeouts fire on a dedicated context so they never queue behind busy workers.
    boost::asio::io_context timer_ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> timer_work_;
    std::thread timer_thread_;
};

}
