#include "handlers/task_handler.hpp"
#include "errors.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <sstream>

namespace chatgate {

std::string TaskCommandHandler::handle_command(const std::string& user_id, const std::string& platform,
                                               const std::string& chat_id, const std::vector<std::string>& args) {
    if (args.empty()) {
        return help();
    }

    std::string cmd = to_lower(args[0]);
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (cmd == "spawn" || cmd == "run" || cmd == "bg") return spawn_task(user_id, platform, chat_id, rest);
    if (cmd == "list" || cmd == "ls") return list_sessions(user_id);
    if (cmd == "status") return session_status(user_id, rest);
    if (cmd == "cancel" || cmd == "stop") return cancel_session(user_id, rest);
    if (cmd == "clear") return clear_sessions();
    if (cmd == "help") return help();

    return "❌ Unknown command: " + cmd + "\nUse /task help for available commands.";
}

std::string TaskCommandHandler::spawn_task(const std::string& user_id, const std::string& platform,
                                           const std::string& chat_id, const std::vector<std::string>& args) {
    if (args.empty()) {
        return "Usage: /task spawn <task description>";
    }

    std::string task;
    for (const auto& word : args) {
        if (!task.empty()) task += ' ';
        task += word;
    }

    auto main_session = sessions_.get_or_create(platform, chat_id, user_id);
    auto sub = sessions_.spawn(main_session, task);

    return "🚀 *Task Spawned*\n\n📋 " + truncate(task, 100) + "\n🔑 ID: " + sub->id() +
           "\n\nI'll notify you when it's done!";
}

const char* TaskCommandHandler::status_icon(SessionStatus status) {
    switch (status) {
        case SessionStatus::COMPLETE: return "✅";
        case SessionStatus::FAILED: return "❌";
        case SessionStatus::PENDING: return "⏳";
        case SessionStatus::CANCELED: return "🚫";
        default: return "🔄";
    }
}

std::string TaskCommandHandler::list_sessions(const std::string& user_id) {
    auto list = sessions_.list(user_id, false);
    if (list.empty()) {
        return "📋 No active sessions.";
    }

    std::sort(list.begin(), list.end(), [](const auto& a, const auto& b) {
        return a->created_at() < b->created_at();
    });

    std::ostringstream ss;
    ss << "📋 *Active Sessions* (" << list.size() << ")\n\n";
    for (const auto& s : list) {
        ss << status_icon(s->status()) << " `" << s->id() << "` [" << to_string(s->type()) << "]\n";
        if (!s->task().empty()) {
            ss << "   📋 " << truncate(s->task(), 50) << "\n";
        }
    }
    return ss.str();
}

SessionManager::SessionPtr TaskCommandHandler::find(const std::string& user_id, const std::string& prefix,
                                                    bool include_complete) {
    auto list = sessions_.list(user_id, include_complete);
    SessionManager::SessionPtr match;
    for (const auto& s : list) {
        if (s->id() == prefix) return s;
        // Every sub-session ID extends its parent's, so prefixes only select sub-sessions
        if (s->type() != SessionType::SUB) continue;
        if (s->id().rfind(prefix, 0) == 0 && (!match || s->id() < match->id())) {
            match = s;
        }
    }
    return match;
}

std::string TaskCommandHandler::format_status(const Session& s) {
    auto report = s.report();

    std::ostringstream ss;
    ss << status_icon(report.status) << " *Session Status*\n\n"
       << "ID: `" << s.id() << "`\n"
       << "Type: " << to_string(s.type()) << "\n"
       << "Status: " << to_string(report.status) << "\n";

    if (!s.task().empty()) {
        ss << "\n📋 *Task:*\n" << s.task() << "\n";
    }
    if (!report.result.empty()) {
        ss << "\n✅ *Result:*\n" << truncate(report.result, 500) << "\n";
    }
    if (!report.error.empty()) {
        ss << "\n❌ *Error:*\n" << report.error << "\n";
    }

    ss << "\n📅 Created: " << format_clock(s.created_at());
    if (report.completed_at) {
        ss << "\n⏱️ Completed: " << format_clock(*report.completed_at);
    }
    return ss.str();
}

std::string TaskCommandHandler::session_status(const std::string& user_id, const std::vector<std::string>& args) {
    if (args.empty()) {
        return "Usage: /task status <session_id>";
    }
    auto s = find(user_id, args[0], true);
    if (!s) {
        return "❌ Session not found: " + args[0];
    }
    return format_status(*s);
}

std::string TaskCommandHandler::cancel_session(const std::string& user_id, const std::vector<std::string>& args) {
    if (args.empty()) {
        return "Usage: /task cancel <session_id>";
    }
    auto s = find(user_id, args[0], false);
    // Only background tasks are cancelable; cancel() resolves IDs to sub-sessions first
    if (!s || s->type() != SessionType::SUB) {
        return "❌ Session not found: " + args[0];
    }
    try {
        sessions_.cancel(s->id());
    } catch (const GatewayError& e) {
        return std::string("❌ Failed to cancel: ") + e.what();
    }
    return "🚫 Canceled session: " + s->id();
}

std::string TaskCommandHandler::clear_sessions() {
    size_t count = sessions_.clear(clear_after_);
    return "🗑️ Cleared " + std::to_string(count) + " completed sessions.";
}

std::string TaskCommandHandler::help() {
    return "🔄 *Session/Task Commands*\n\n"
           "/task spawn <task>     Run a task in background\n"
           "/task list             List active sessions\n"
           "/task status <id>      Show session status\n"
           "/task cancel <id>      Cancel a running task\n"
           "/task clear            Clear completed tasks\n"
           "/task help             Show this help\n\n"
           "*Examples:*\n"
           "• /task spawn Research AI trends and summarize\n"
           "• /task list\n"
           "• /task cancel console:42:sub:1\n\n"
           "💡 Background tasks run independently and notify you when done.";
}

}
