#include "session_manager.hpp"
#include "errors.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "text_util.hpp"
#include "vault.hpp"

#include <boost/asio/steady_timer.hpp>

namespace chatgate {

namespace {

constexpr size_t DEFAULT_MAX_HISTORY = 50;
constexpr size_t NOTIFY_TASK_CHARS = 100;
constexpr size_t NOTIFY_RESULT_CHARS = 1000;

}

SessionManager::SessionManager(SessionOptions options, NotifyFunc notify)
    : options_(options),
      notify_(std::move(notify)),
      timer_work_(boost::asio::make_work_guard(timer_ioc_)) {
    if (options_.max_history == 0) {
        options_.max_history = DEFAULT_MAX_HISTORY;
    }
    timer_thread_ = std::thread([this] { timer_ioc_.run(); });
}

SessionManager::~SessionManager() {
    {
        std::shared_lock lock(sessions_mutex_);
        for (const auto& [id, s] : sub_sessions_) {
            std::unique_lock session_lock(s->mutex_);
            if (is_terminal(s->status_)) continue;
            if (s->stop_source_) s->stop_source_->request_stop();
            auto now = Session::Clock::now();
            s->status_ = SessionStatus::CANCELED;
            s->completed_at_ = now;
            s->updated_at_ = now;
        }
    }
    signal_done();

    {
        std::unique_lock lock(workers_mutex_);
        workers_cv_.wait(lock, [this] { return active_workers_ == 0; });
    }

    timer_work_.reset();
    timer_ioc_.stop();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

void SessionManager::set_task_runner(std::shared_ptr<TaskRunner> runner) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    task_runner_ = std::move(runner);
}

void SessionManager::set_notify(NotifyFunc notify) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    notify_ = std::move(notify);
}

SessionManager::SessionPtr SessionManager::get_or_create(const std::string& platform, const std::string& chat_id,
                                                         const std::string& user_id) {
    std::string key = platform + ":" + chat_id;

    {
        std::shared_lock lock(sessions_mutex_);
        auto it = main_sessions_.find(key);
        if (it != main_sessions_.end()) return it->second;
    }

    std::unique_lock lock(sessions_mutex_);
    // Another caller may have created it between the two locks
    auto [it, inserted] = main_sessions_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_shared<Session>(key, SessionType::MAIN, platform, chat_id, user_id);
        MetricsRegistry::instance().increment_counter("sessions_created_total");
    }
    return it->second;
}

SessionManager::SessionPtr SessionManager::find_main(const std::string& id) const {
    std::shared_lock lock(sessions_mutex_);
    auto it = main_sessions_.find(id);
    return it != main_sessions_.end() ? it->second : nullptr;
}

SessionManager::SessionPtr SessionManager::get(const std::string& id) const {
    std::shared_lock lock(sessions_mutex_);
    if (auto it = sub_sessions_.find(id); it != sub_sessions_.end()) return it->second;
    auto it = main_sessions_.find(id);
    return it != main_sessions_.end() ? it->second : nullptr;
}

void SessionManager::add_message(Session& session, const std::string& role, const std::string& content) {
    auto now = Session::Clock::now();
    std::unique_lock lock(session.mutex_);
    session.messages_.push_back({role, content, now});
    session.updated_at_ = now;
    while (session.messages_.size() > options_.max_history) {
        session.messages_.pop_front();
    }
}

std::vector<HistoryEntry> SessionManager::get_history(const Session& session, size_t limit) const {
    std::shared_lock lock(session.mutex_);
    size_t count = session.messages_.size();
    if (limit == 0 || limit > count) limit = count;
    return std::vector<HistoryEntry>(session.messages_.end() - static_cast<std::ptrdiff_t>(limit),
                                     session.messages_.end());
}

SessionManager::SessionPtr SessionManager::spawn(const SessionPtr& parent, const std::string& task) {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (active_workers_ >= options_.max_active_sub_sessions) {
            throw SessionLimitError(options_.max_active_sub_sessions);
        }
        ++active_workers_;
    }

    std::string id = parent->id() + ":sub:" + std::to_string(sub_counter_.fetch_add(1) + 1);
    auto sub = std::make_shared<Session>(id, SessionType::SUB, parent->platform(), parent->chat_id(),
                                         parent->user_id(), parent->id(), task);
    sub->stop_source_.emplace();

    {
        std::unique_lock lock(sessions_mutex_);
        sub_sessions_[id] = sub;
    }

    try {
        std::thread([this, sub] { run_sub_session(sub); }).detach();
    } catch (const std::system_error&) {
        {
            std::unique_lock lock(sessions_mutex_);
            sub_sessions_.erase(id);
        }
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            --active_workers_;
        }
        workers_cv_.notify_all();
        throw;
    }

    MetricsRegistry::instance().increment_counter("subsessions_spawned_total");
    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::SUBSESSION,
                     hash_user_id(parent->platform(), parent->user_id()),
                     "spawned " + id + ": " + truncate(task, NOTIFY_TASK_CHARS));
    return sub;
}

void SessionManager::run_sub_session(SessionPtr sub) {
    GaugeGuard gauge("subsessions_active");
    StatusReport final_report;

    if (options_.before_run) {
        options_.before_run(*sub);
    }

    {
        std::stop_token token;
        std::stop_source source;
        bool canceled_early = false;
        {
            std::unique_lock lock(sub->mutex_);
            if (sub->status_ == SessionStatus::PENDING) {
                sub->status_ = SessionStatus::RUNNING;
                sub->updated_at_ = Session::Clock::now();
            } else {
                canceled_early = true;
            }
            if (sub->stop_source_) {
                source = *sub->stop_source_;
                token = source.get_token();
            }
        }

        std::string result;
        std::string error;
        if (!canceled_early) {
            auto timed_out = std::make_shared<std::atomic<bool>>(false);
            boost::asio::steady_timer ceiling(timer_ioc_, options_.task_timeout);
            ceiling.async_wait([source, timed_out](const boost::system::error_code& ec) mutable {
                if (!ec) {
                    timed_out->store(true);
                    source.request_stop();
                }
            });

            std::shared_ptr<TaskRunner> runner;
            {
                std::lock_guard<std::mutex> lock(callbacks_mutex_);
                runner = task_runner_;
            }

            if (!runner) {
                error = NoTaskRunnerError().what();
            } else {
                std::vector<HistoryEntry> history;
                if (auto parent = find_main(sub->parent_id())) {
                    history = get_history(*parent, options_.parent_history_window);
                }
                try {
                    result = runner->execute(token, sub->task(), history);
                } catch (const std::exception& e) {
                    error = e.what();
                    if (error.empty()) error = "task failed";
                }
            }

            ceiling.cancel();
            if (timed_out->load() && error.empty()) {
                error = "task timed out";
            }
        }

        std::unique_lock lock(sub->mutex_);
        // cancel() may have won the race; terminal states are absorbing
        if (sub->status_ == SessionStatus::RUNNING) {
            auto now = Session::Clock::now();
            sub->completed_at_ = now;
            sub->updated_at_ = now;
            if (error.empty()) {
                sub->status_ = SessionStatus::COMPLETE;
                sub->result_ = std::move(result);
            } else {
                sub->status_ = SessionStatus::FAILED;
                sub->error_ = std::move(error);
            }
        }
        sub->stop_source_.reset();
        final_report = {sub->status_, sub->result_, sub->error_, sub->completed_at_};
    }

    signal_done();

    std::string subject = hash_user_id(sub->platform(), sub->user_id());
    switch (final_report.status) {
        case SessionStatus::COMPLETE:
            MetricsRegistry::instance().increment_counter("subsessions_completed_total");
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::SUBSESSION, subject,
                             "completed " + sub->id());
            break;
        case SessionStatus::FAILED:
            MetricsRegistry::instance().increment_counter("subsessions_failed_total");
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::SUBSESSION, subject,
                             "failed " + sub->id() + ": " + final_report.error);
            break;
        default:
            MetricsRegistry::instance().increment_counter("subsessions_canceled_total");
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::SUBSESSION, subject,
                             "canceled " + sub->id());
            break;
    }

    notify_completion(*sub, final_report);

    std::lock_guard<std::mutex> lock(workers_mutex_);
    --active_workers_;
    workers_cv_.notify_all();
}

std::string SessionManager::format_notification(const Session& session, const StatusReport& report) {
    std::string task = truncate(session.task(), NOTIFY_TASK_CHARS);
    switch (report.status) {
        case SessionStatus::COMPLETE:
            return "✅ *Task Complete*\n\n📋 " + task + "\n\n" + truncate(report.result, NOTIFY_RESULT_CHARS);
        case SessionStatus::FAILED:
            return "❌ *Task Failed*\n\n📋 " + task + "\n\n⚠️ " + report.error;
        default:
            return "🛑 *Task Canceled*\n\n📋 " + task;
    }
}

void SessionManager::notify_completion(const Session& sub, const StatusReport& report) {
    NotifyFunc notify;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        notify = notify_;
    }
    if (!notify) return;

    try {
        notify(sub.platform(), sub.chat_id(), format_notification(sub, report));
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("notify_failures_total");
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::NOTIFY_FAILURE,
                         hash_user_id(sub.platform(), sub.user_id()),
                         "failed to notify " + sub.id() + ": " + e.what());
    }
}

void SessionManager::signal_done() const {
    { std::lock_guard<std::mutex> lock(done_mutex_); }
    done_cv_.notify_all();
}

void SessionManager::cancel(const std::string& session_id) {
    auto s = get(session_id);
    if (!s) {
        throw SessionNotFoundError(session_id);
    }

    {
        std::unique_lock lock(s->mutex_);
        if (s->status_ != SessionStatus::PENDING && s->status_ != SessionStatus::RUNNING) {
            throw SessionNotRunningError(session_id);
        }
        if (s->stop_source_) {
            s->stop_source_->request_stop();
        }
        auto now = Session::Clock::now();
        s->status_ = SessionStatus::CANCELED;
        s->completed_at_ = now;
        s->updated_at_ = now;
    }
    signal_done();
}

std::vector<SessionManager::SessionPtr> SessionManager::list(const std::string& user_id,
                                                             bool include_complete) const {
    std::vector<SessionPtr> out;
    std::shared_lock lock(sessions_mutex_);
    for (const auto* table : {&main_sessions_, &sub_sessions_}) {
        for (const auto& [id, s] : *table) {
            if (!user_id.empty() && s->user_id() != user_id) continue;
            if (!include_complete) {
                auto st = s->status();
                if (st == SessionStatus::COMPLETE || st == SessionStatus::FAILED) continue;
            }
            out.push_back(s);
        }
    }
    return out;
}

std::vector<SessionManager::SessionPtr> SessionManager::list_sub_sessions(const std::string& parent_id) const {
    std::vector<SessionPtr> out;
    std::shared_lock lock(sessions_mutex_);
    for (const auto& [id, s] : sub_sessions_) {
        if (s->parent_id() == parent_id) out.push_back(s);
    }
    return out;
}

size_t SessionManager::clear(std::chrono::system_clock::duration older_than) {
    auto cutoff = Session::Clock::now() - older_than;
    size_t removed = 0;

    std::unique_lock lock(sessions_mutex_);
    for (auto* table : {&main_sessions_, &sub_sessions_}) {
        for (auto it = table->begin(); it != table->end();) {
            bool expired = false;
            {
                std::shared_lock session_lock(it->second->mutex_);
                expired = is_terminal(it->second->status_) && it->second->completed_at_ &&
                          *it->second->completed_at_ < cutoff;
            }
            if (expired) {
                it = table->erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

void SessionManager::set_context(Session& session, const std::string& key, boost::json::value value) {
    std::unique_lock lock(session.mutex_);
    session.context_[key] = std::move(value);
}

std::optional<boost::json::value> SessionManager::get_context(const Session& session, const std::string& key) const {
    std::shared_lock lock(session.mutex_);
    auto it = session.context_.find(key);
    if (it == session.context_.end()) return std::nullopt;
    return it->second;
}

StatusReport SessionManager::status(const std::string& session_id) const {
    auto s = get(session_id);
    if (!s) {
        throw SessionNotFoundError(session_id);
    }
    return s->report();
}

StatusReport SessionManager::wait(const std::string& session_id, std::chrono::milliseconds timeout) const {
    auto s = get(session_id);
    if (!s) {
        throw SessionNotFoundError(session_id);
    }
    std::unique_lock lock(done_mutex_);
    done_cv_.wait_for(lock, timeout, [&s] { return is_terminal(s->status()); });
    return s->report();
}

size_t SessionManager::active_sub_sessions() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return active_workers_;
}

size_t SessionManager::size() const {
    std::shared_lock lock(sessions_mutex_);
    return main_sessions_.size() + sub_sessions_.size();
}

}
