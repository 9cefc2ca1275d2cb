#include <gtest/gtest.h>
#include "router.hpp"
#include "errors.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace chatgate;

namespace {

class FakeStore : public MessageStore {
public:
    bool save_message(const MessageRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(record);
        return !fail;
    }
    bool save_audit(const AuditRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex);
        audits.push_back(record);
        return !fail;
    }

    std::vector<MessageRecord> messages;
    std::vector<AuditRecord> audits;
    bool fail = false;
    std::mutex mutex;
};

class FakeVault : public Vault {
public:
    std::string encrypt(const std::string& plaintext) override {
        if (fail) throw VaultError("boom");
        return "enc:" + plaintext;
    }
    std::string decrypt(const std::string& ciphertext) override {
        return ciphertext.substr(4);
    }
    bool fail = false;
};

class FakeLimiter : public RateLimiter {
public:
    bool allow_message(const std::string&) override { ++messages; return allow_messages; }
    bool allow_command(const std::string&) override { ++commands; return allow_commands; }

    std::atomic<int> messages{0};
    std::atomic<int> commands{0};
    bool allow_messages = true;
    bool allow_commands = true;
};

class FakeAudit : public AuditLogger {
public:
    void log_auth_lockout(const std::string&, const std::string&) override { ++lockouts; }
    void log_auth_failure(const std::string&, const std::string&, const std::string&) override { ++failures; }
    void log_rate_limited(const std::string&, const std::string&) override { ++rate_limited; }

    std::atomic<int> lockouts{0};
    std::atomic<int> failures{0};
    std::atomic<int> rate_limited{0};
};

class FakeHooks : public HookManager {
public:
    bool has_hooks(HookEventKind kind) const override {
        return kind == HookEventKind::PRE_MESSAGE ? pre_message : kind == HookEventKind::POST_RESPONSE;
    }
    HookResult fire(HookEventKind kind, HookEvent event) override {
        std::lock_guard<std::mutex> lock(mutex);
        fired.push_back({kind, event});
        if (kind == HookEventKind::PRE_MESSAGE) return {pre_output, block};
        return {post_output, false};
    }
    void fire_async(HookEventKind kind, HookEvent event) override {
        std::lock_guard<std::mutex> lock(mutex);
        fired_async.push_back({kind, event});
    }

    bool pre_message = true;
    bool block = false;
    std::string pre_output;
    std::string post_output;
    std::vector<std::pair<HookEventKind, HookEvent>> fired;
    std::vector<std::pair<HookEventKind, HookEvent>> fired_async;
    std::mutex mutex;
};

class FakePlatform : public Platform {
public:
    explicit FakePlatform(std::string name, bool fail_start = false, bool fail_stop = false)
        : name_(std::move(name)), fail_start_(fail_start), fail_stop_(fail_stop) {}

    std::string name() const override { return name_; }
    void start(boost::asio::io_context&) override {
        if (fail_start_) throw std::runtime_error("token rejected");
        started = true;
    }
    void stop() override {
        stopped = true;
        if (fail_stop_) throw std::runtime_error("already closed");
    }
    void send(const std::string& chat_id, const std::string& text) override {
        sent.emplace_back(chat_id, text);
    }
    void set_handler(MessageCallback handler) override { callback = std::move(handler); }

    MessageCallback callback;
    bool started = false;
    bool stopped = false;
    std::vector<std::pair<std::string, std::string>> sent;

private:
    std::string name_;
    bool fail_start_;
    bool fail_stop_;
};

Message make_message(const std::string& user, const std::string& text, const std::string& chat = "") {
    Message msg;
    msg.platform = "telegram";
    msg.user_id = user;
    msg.chat_id = chat.empty() ? user : chat;
    msg.username = "name_" + user;
    msg.text = text;
    return msg;
}

} // namespace

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        AccessConfig access;
        access.platforms["telegram"] = PlatformAccess{.allowed_users = {"u1", "u2"}};
        router.set_access_control(std::make_shared<AccessPolicy>(access));
        router.set_audit_logger(audit);
        router.set_hooks(hooks);
        hooks->pre_message = false;
        router.set_handler([this](Message& msg) {
            ++handler_calls;
            std::lock_guard<std::mutex> lock(text_mutex);
            last_text = msg.text;
            return std::string("ok");
        });
    }

    FakeStore store;
    FakeVault vault;
    FakeLimiter limiter;
    AuthAttemptTracker attempts{5, std::chrono::minutes(15)};
    Router router{store, vault, limiter, attempts};
    std::shared_ptr<FakeAudit> audit = std::make_shared<FakeAudit>();
    std::shared_ptr<FakeHooks> hooks = std::make_shared<FakeHooks>();
    std::atomic<int> handler_calls{0};
    std::string last_text;
    std::mutex text_mutex;
};

TEST_F(RouterTest, AuthorizedMessageReachesHandlerAndIsPersistedEncrypted) {
    auto msg = make_message("u1", "hello");
    EXPECT_EQ(router.handle_message(msg), "ok");
    EXPECT_EQ(handler_calls.load(), 1);

    ASSERT_EQ(store.messages.size(), 2u);
    EXPECT_EQ(store.messages[0].direction, "in");
    EXPECT_EQ(store.messages[0].content, "enc:hello");
    EXPECT_EQ(store.messages[0].user_id, hash_user_id("telegram", "u1"));
    EXPECT_EQ(store.messages[0].username, "name_u1");
    EXPECT_EQ(store.messages[1].direction, "out");
    EXPECT_EQ(store.messages[1].content, "enc:ok");
    EXPECT_EQ(store.messages[1].user_id, "bot");
    EXPECT_TRUE(store.audits.empty());
}

TEST_F(RouterTest, UnauthorizedUserIsRejectedAndRecorded) {
    auto msg = make_message("u9", "let me in");
    EXPECT_THROW(router.handle_message(msg), NotAuthorizedError);

    EXPECT_EQ(handler_calls.load(), 0);
    ASSERT_EQ(store.audits.size(), 1u);
    EXPECT_EQ(store.audits[0].action, "unauthorized");
    EXPECT_EQ(store.audits[0].user_hash, hash_user_id("telegram", "u9"));
    EXPECT_EQ(attempts.failure_count("telegram:u9"), 1);
    EXPECT_EQ(audit->failures.load(), 1);
    EXPECT_TRUE(store.messages.empty());
    EXPECT_EQ(limiter.messages.load(), 0);
}

TEST_F(RouterTest, LockoutPrecedesAuthorization) {
    for (int i = 0; i < 5; ++i) {
        auto msg = make_message("u9", "try");
        EXPECT_THROW(router.handle_message(msg), NotAuthorizedError);
    }
    EXPECT_EQ(store.audits.size(), 5u);

    auto msg = make_message("u9", "again");
    EXPECT_THROW(router.handle_message(msg), LockedAccountError);
    EXPECT_EQ(audit->lockouts.load(), 1);
    // Authorization did not run again
    EXPECT_EQ(store.audits.size(), 5u);
    EXPECT_EQ(audit->failures.load(), 5);
}

TEST_F(RouterTest, LockedAccountIsRejectedEvenWhenAuthorized) {
    for (int i = 0; i < 5; ++i) attempts.record_failure("telegram:u1");

    auto msg = make_message("u1", "hello");
    EXPECT_THROW(router.handle_message(msg), LockedAccountError);
    EXPECT_EQ(handler_calls.load(), 0);
}

TEST_F(RouterTest, SuccessfulAuthorizationClearsFailures) {
    for (int i = 0; i < 4; ++i) attempts.record_failure("telegram:u1");

    auto msg = make_message("u1", "hello");
    router.handle_message(msg);
    EXPECT_EQ(attempts.failure_count("telegram:u1"), 0);
    EXPECT_EQ(router.access_sessions().validate("telegram", "u1"), AccessSessionTable::Validity::VALID);
}

TEST_F(RouterTest, LegacyAuthorizerIsFallback) {
    router.set_authorizer(std::make_shared<Allowlist>(
        std::map<std::string, std::vector<std::string>>{{"telegram", {"u7"}}}));

    auto msg = make_message("u7", "hi");
    EXPECT_EQ(router.handle_message(msg), "ok");
}

TEST_F(RouterTest, GroupMessagesFollowPlatformPolicy) {
    auto msg = make_message("u1", "hi", "group-1");
    EXPECT_TRUE(msg.is_group());
    EXPECT_THROW(router.handle_message(msg), NotAuthorizedError);
}

TEST_F(RouterTest, CommandsAndMessagesUseSeparateLimits) {
    auto cmd = make_message("u1", "/task list");
    router.handle_message(cmd);
    EXPECT_EQ(limiter.commands.load(), 1);
    EXPECT_EQ(limiter.messages.load(), 0);

    limiter.allow_messages = false;
    auto msg = make_message("u1", "plain");
    EXPECT_THROW(router.handle_message(msg), RateLimitedError);
    EXPECT_EQ(audit->rate_limited.load(), 1);
    EXPECT_EQ(handler_calls.load(), 1);
}

TEST_F(RouterTest, RateLimitedMessageIsNotPersisted) {
    limiter.allow_messages = false;
    auto msg = make_message("u1", "plain");
    EXPECT_THROW(router.handle_message(msg), RateLimitedError);
    EXPECT_TRUE(store.messages.empty());
}

TEST_F(RouterTest, EncryptionFailureDoesNotBlockDelivery) {
    vault.fail = true;
    auto msg = make_message("u1", "secret");
    EXPECT_EQ(router.handle_message(msg), "ok");
    EXPECT_TRUE(store.messages.empty());
}

TEST_F(RouterTest, PersistenceFailureDoesNotBlockDelivery) {
    store.fail = true;
    auto msg = make_message("u1", "hello");
    EXPECT_EQ(router.handle_message(msg), "ok");
}

TEST_F(RouterTest, BlockingPreMessageHookStopsSilently) {
    hooks->pre_message = true;
    hooks->block = true;

    auto msg = make_message("u1", "hello");
    std::string response;
    EXPECT_NO_THROW(response = router.handle_message(msg));
    EXPECT_EQ(response, "");
    EXPECT_EQ(handler_calls.load(), 0);
    // Inbound copy was stored before the hook ran
    ASSERT_EQ(store.messages.size(), 1u);
    EXPECT_EQ(store.messages[0].direction, "in");
}

TEST_F(RouterTest, PreMessageHookRewritesTextButNotStoredCopy) {
    hooks->pre_message = true;
    hooks->pre_output = "rewritten";

    auto msg = make_message("u1", "original");
    router.handle_message(msg);
    EXPECT_EQ(last_text, "rewritten");
    ASSERT_FALSE(store.messages.empty());
    EXPECT_EQ(store.messages[0].content, "enc:original");
}

TEST_F(RouterTest, PostResponseHookReplacesResponse) {
    hooks->post_output = "decorated";
    auto msg = make_message("u1", "hello");
    EXPECT_EQ(router.handle_message(msg), "decorated");
    ASSERT_EQ(store.messages.size(), 2u);
    EXPECT_EQ(store.messages[1].content, "enc:decorated");
}

TEST_F(RouterTest, HandlerErrorPropagatesAndFiresErrorHook) {
    router.set_handler([](Message&) -> std::string { throw std::logic_error("model unavailable"); });

    auto msg = make_message("u1", "hello");
    EXPECT_THROW(router.handle_message(msg), std::logic_error);
    ASSERT_EQ(hooks->fired_async.size(), 1u);
    EXPECT_EQ(hooks->fired_async[0].first, HookEventKind::ON_ERROR);
    EXPECT_EQ(hooks->fired_async[0].second.error, "model unavailable");
    // No outbound record
    EXPECT_EQ(store.messages.size(), 1u);
}

TEST_F(RouterTest, EmptyResponseSkipsPostHookAndOutbound) {
    router.set_handler([](Message&) { return std::string(); });
    auto msg = make_message("u1", "hello");
    EXPECT_EQ(router.handle_message(msg), "");
    EXPECT_TRUE(hooks->fired.empty());
    EXPECT_EQ(store.messages.size(), 1u);
}

TEST_F(RouterTest, MissingHandlerReturnsEmpty) {
    router.set_handler(nullptr);
    auto msg = make_message("u1", "hello");
    EXPECT_EQ(router.handle_message(msg), "");
}

TEST_F(RouterTest, NullCollaboratorsAreSafe) {
    router.set_audit_logger(nullptr);
    router.set_hooks(nullptr);
    auto msg = make_message("u9", "hello");
    EXPECT_THROW(router.handle_message(msg), NotAuthorizedError);
}

TEST_F(RouterTest, RegisterWiresPipelineAndReplacesByName) {
    auto first = std::make_shared<FakePlatform>("slack");
    auto second = std::make_shared<FakePlatform>("slack");
    router.register_platform(first);
    router.register_platform(second);

    EXPECT_EQ(router.platforms(), std::vector<std::string>{"slack"});
    ASSERT_TRUE(second->callback);

    Message msg = make_message("u1", "hi");
    msg.platform = "telegram";
    EXPECT_EQ(second->callback(msg), "ok");

    router.send("slack", "C1", "hello");
    EXPECT_TRUE(first->sent.empty());
    ASSERT_EQ(second->sent.size(), 1u);
    EXPECT_EQ(second->sent[0].second, "hello");
}

TEST_F(RouterTest, SendToUnknownPlatformThrows) {
    EXPECT_THROW(router.send("irc", "c", "x"), UnknownPlatformError);
}

TEST_F(RouterTest, StartFailureNamesPlatform) {
    router.register_platform(std::make_shared<FakePlatform>("discord", true));
    boost::asio::io_context ioc;
    try {
        router.start(ioc);
        FAIL() << "expected PlatformStartError";
    } catch (const PlatformStartError& e) {
        EXPECT_EQ(e.platform(), "discord");
        EXPECT_NE(std::string(e.what()).find("start discord"), std::string::npos);
    }
}

TEST_F(RouterTest, StopIsBestEffort) {
    auto a = std::make_shared<FakePlatform>("a", false, true);
    auto b = std::make_shared<FakePlatform>("b");
    router.register_platform(a);
    router.register_platform(b);

    EXPECT_NO_THROW(router.stop());
    EXPECT_TRUE(a->stopped);
    EXPECT_TRUE(b->stopped);
}

TEST_F(RouterTest, ConcurrentMessagesFromSameUser) {
    const int num_threads = 8;
    const int per_thread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < per_thread; ++i) {
                auto msg = make_message("u2", "m");
                EXPECT_EQ(router.handle_message(msg), "ok");
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(handler_calls.load(), num_threads * per_thread);
    EXPECT_EQ(store.messages.size(), static_cast<size_t>(2 * num_threads * per_thread));
}
