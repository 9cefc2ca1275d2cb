#include <gtest/gtest.h>
#include "handlers/task_handler.hpp"
#include "errors.hpp"

#include <atomic>
#include <thread>

using namespace chatgate;
using namespace std::chrono_literals;

namespace {

class EchoRunner : public TaskRunner {
public:
    std::string execute(std::stop_token, const std::string& task, const std::vector<HistoryEntry>&) override {
        return "done: " + task;
    }
};

class StallingRunner : public TaskRunner {
public:
    std::string execute(std::stop_token stop, const std::string&, const std::vector<HistoryEntry>&) override {
        while (!stop.stop_requested()) std::this_thread::sleep_for(1ms);
        return "late";
    }
};

std::vector<std::string> words(std::initializer_list<const char*> list) {
    return std::vector<std::string>(list.begin(), list.end());
}

std::string extract_id(const std::string& reply) {
    auto pos = reply.find("ID: ");
    if (pos == std::string::npos) return "";
    auto end = reply.find('\n', pos);
    return reply.substr(pos + 4, end - pos - 4);
}

}

class TaskHandlerTest : public ::testing::Test {
protected:
    TaskHandlerTest() : manager(SessionOptions{.max_active_sub_sessions = 2}), handler(manager, 0s) {}

    SessionManager manager;
    TaskCommandHandler handler;
};

TEST_F(TaskHandlerTest, HelpByDefault) {
    EXPECT_EQ(handler.handle_command("u1", "console", "c1", {}), TaskCommandHandler::help());
    EXPECT_EQ(handler.handle_command("u1", "console", "c1", words({"HELP"})), TaskCommandHandler::help());
}

TEST_F(TaskHandlerTest, UnknownSubcommand) {
    auto reply = handler.handle_command("u1", "console", "c1", words({"explode"}));
    EXPECT_NE(reply.find("Unknown command: explode"), std::string::npos);
}

TEST_F(TaskHandlerTest, SpawnRequiresDescription) {
    EXPECT_EQ(handler.handle_command("u1", "console", "c1", words({"spawn"})),
              "Usage: /task spawn <task description>");
    EXPECT_EQ(manager.size(), 0u);
}

TEST_F(TaskHandlerTest, SpawnThenStatus) {
    manager.set_task_runner(std::make_shared<EchoRunner>());

    auto reply = handler.handle_command("u1", "console", "c1", words({"run", "summarize", "news"}));
    EXPECT_NE(reply.find("Task Spawned"), std::string::npos);
    EXPECT_NE(reply.find("summarize news"), std::string::npos);

    auto id = extract_id(reply);
    ASSERT_EQ(id, "console:c1:sub:1");
    EXPECT_EQ(manager.wait(id, 2s).status, SessionStatus::COMPLETE);

    auto status = handler.handle_command("u1", "console", "c1", words({"status", id.c_str()}));
    EXPECT_NE(status.find("Status: complete"), std::string::npos);
    EXPECT_NE(status.find("done: summarize news"), std::string::npos);
    EXPECT_NE(status.find("Completed:"), std::string::npos);
}

TEST_F(TaskHandlerTest, ListShowsOwnActiveSessions) {
    manager.set_task_runner(std::make_shared<StallingRunner>());
    handler.handle_command("u1", "console", "c1", words({"spawn", "long", "job"}));
    manager.get_or_create("console", "c2", "u2");

    auto reply = handler.handle_command("u1", "console", "c1", words({"ls"}));
    EXPECT_NE(reply.find("Active Sessions* (2)"), std::string::npos);
    EXPECT_NE(reply.find("console:c1:sub:1"), std::string::npos);
    EXPECT_NE(reply.find("long job"), std::string::npos);
    EXPECT_EQ(reply.find("console:c2"), std::string::npos);

    EXPECT_EQ(handler.handle_command("nobody", "console", "c9", words({"list"})), "📋 No active sessions.");
}

TEST_F(TaskHandlerTest, CancelByPrefix) {
    manager.set_task_runner(std::make_shared<StallingRunner>());
    handler.handle_command("u1", "console", "c1", words({"spawn", "wait"}));

    auto reply = handler.handle_command("u1", "console", "c1", words({"stop", "console:c1:s"}));
    EXPECT_EQ(reply, "🚫 Canceled session: console:c1:sub:1");
    EXPECT_EQ(manager.status("console:c1:sub:1").status, SessionStatus::CANCELED);

    // Already terminal
    reply = handler.handle_command("u1", "console", "c1", words({"cancel", "console:c1:sub:1"}));
    EXPECT_NE(reply.find("Failed to cancel"), std::string::npos);
}

TEST_F(TaskHandlerTest, PrefixNeverSelectsMainSession) {
    manager.get_or_create("console", "c1", "u1");
    auto reply = handler.handle_command("u1", "console", "c1", words({"cancel", "console:c"}));
    EXPECT_EQ(reply, "❌ Session not found: console:c");
    EXPECT_EQ(manager.get("console:c1")->status(), SessionStatus::RUNNING);
}

TEST_F(TaskHandlerTest, CancelNeverReachesAnotherUsersTaskThroughAChatId) {
    manager.set_task_runner(std::make_shared<StallingRunner>());
    handler.handle_command("u1", "console", "c1", words({"spawn", "private"}));
    // u2's chat ID spells u1's sub-session key
    manager.get_or_create("console", "c1:sub:1", "u2");

    EXPECT_EQ(handler.handle_command("u2", "console", "c1:sub:1", words({"cancel", "console:c1:sub:1"})),
              "❌ Session not found: console:c1:sub:1");
    EXPECT_EQ(manager.status("console:c1:sub:1").status, SessionStatus::RUNNING);
}

TEST_F(TaskHandlerTest, OtherUsersSessionsAreInvisible) {
    manager.set_task_runner(std::make_shared<StallingRunner>());
    handler.handle_command("u1", "console", "c1", words({"spawn", "private"}));

    EXPECT_EQ(handler.handle_command("u2", "console", "c2", words({"cancel", "console:c1:sub:1"})),
              "❌ Session not found: console:c1:sub:1");
    EXPECT_EQ(handler.handle_command("u2", "console", "c2", words({"status", "console:c1:sub:1"})),
              "❌ Session not found: console:c1:sub:1");
    EXPECT_EQ(manager.status("console:c1:sub:1").status, SessionStatus::RUNNING);
}

TEST_F(TaskHandlerTest, SpawnLimitPropagates) {
    manager.set_task_runner(std::make_shared<StallingRunner>());
    handler.handle_command("u1", "console", "c1", words({"spawn", "a"}));
    handler.handle_command("u1", "console", "c1", words({"spawn", "b"}));
    EXPECT_THROW(handler.handle_command("u1", "console", "c1", words({"spawn", "c"})), SessionLimitError);
}

TEST_F(TaskHandlerTest, ClearRemovesFinishedSessions) {
    manager.set_task_runner(std::make_shared<EchoRunner>());
    auto id = extract_id(handler.handle_command("u1", "console", "c1", words({"bg", "quick"})));
    ASSERT_EQ(manager.wait(id, 2s).status, SessionStatus::COMPLETE);
    std::this_thread::sleep_for(5ms);

    EXPECT_EQ(handler.handle_command("u1", "console", "c1", words({"clear"})),
              "🗑️ Cleared 1 completed sessions.");
    EXPECT_EQ(manager.get(id), nullptr);
    EXPECT_NE(manager.get("console:c1"), nullptr);
}
