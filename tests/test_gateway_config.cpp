#include <gtest/gtest.h>
#include "gateway_config.hpp"
#include "errors.hpp"

#include <cstdlib>

using namespace chatgate;

namespace {

const char* const VARS[] = {
    "CHATGATE_REDIS_URL", "CHATGATE_ENCRYPTION_KEY", "CHATGATE_AUDIT_LOG_DIR", "CHATGATE_LOG_LEVEL",
    "CHATGATE_ACCESS_MODE", "CHATGATE_GLOBAL_ADMINS", "CHATGATE_ALLOWED_USERS",
    "CHATGATE_LIMIT_MESSAGES", "CHATGATE_LIMIT_COMMANDS", "CHATGATE_DISTRIBUTED_RATE_LIMIT",
    "CHATGATE_MAX_FAILED_AUTH", "CHATGATE_LOCKOUT_SEC", "CHATGATE_MAX_HISTORY",
    "CHATGATE_TASK_TIMEOUT_SEC", "CHATGATE_SESSION_RETENTION_SEC", "CHATGATE_MAX_ACTIVE_TASKS",
    "CHATGATE_THREADS"
};

}

class GatewayConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* v : VARS) ::unsetenv(v);
    }
};

TEST_F(GatewayConfigTest, DefaultsWithoutEnvironment) {
    GatewayConfig config;
    apply_env_overrides(config);

    EXPECT_EQ(config.access.mode, "allowlist");
    EXPECT_EQ(config.messages_per_minute, 30);
    EXPECT_EQ(config.commands_per_minute, 10);
    EXPECT_EQ(config.max_failed_auth, 5);
    EXPECT_EQ(config.lockout_sec, 900);
    EXPECT_EQ(config.max_history, 50u);
    EXPECT_EQ(config.parent_history_window, 10u);
    EXPECT_EQ(config.task_timeout_sec, 300);
    EXPECT_FALSE(config.distributed_rate_limit);
    EXPECT_TRUE(config.allowed_users.empty());
}

TEST_F(GatewayConfigTest, OverridesApply) {
    ::setenv("CHATGATE_REDIS_URL", "tcp://redis:6380", 1);
    ::setenv("CHATGATE_ACCESS_MODE", "open", 1);
    ::setenv("CHATGATE_GLOBAL_ADMINS", "root,,ops", 1);
    ::setenv("CHATGATE_LIMIT_MESSAGES", "60", 1);
    ::setenv("CHATGATE_MAX_HISTORY", "20", 1);
    ::setenv("CHATGATE_DISTRIBUTED_RATE_LIMIT", "true", 1);
    ::setenv("CHATGATE_MAX_ACTIVE_TASKS", "4", 1);
    ::setenv("CHATGATE_THREADS", "0", 1);

    GatewayConfig config;
    apply_env_overrides(config);

    EXPECT_EQ(config.redis_url, "tcp://redis:6380");
    EXPECT_EQ(config.access.mode, "open");
    EXPECT_EQ(config.access.global_admins, (std::vector<std::string>{"root", "ops"}));
    EXPECT_EQ(config.messages_per_minute, 60);
    EXPECT_EQ(config.max_history, 20u);
    EXPECT_TRUE(config.distributed_rate_limit);
    EXPECT_EQ(config.max_active_subsessions, 4u);
    EXPECT_EQ(config.thread_count, 0);
}

TEST_F(GatewayConfigTest, AllowedUsersPairs) {
    ::setenv("CHATGATE_ALLOWED_USERS", "telegram:u1,telegram:u2,discord", 1);

    GatewayConfig config;
    apply_env_overrides(config);

    ASSERT_EQ(config.allowed_users.size(), 2u);
    EXPECT_EQ(config.allowed_users["telegram"], (std::vector<std::string>{"u1", "u2"}));
    EXPECT_TRUE(config.allowed_users["discord"].empty());
}

TEST_F(GatewayConfigTest, MalformedValuesThrow) {
    GatewayConfig config;

    ::setenv("CHATGATE_ACCESS_MODE", "everyone", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
    ::unsetenv("CHATGATE_ACCESS_MODE");

    ::setenv("CHATGATE_LIMIT_MESSAGES", "ten", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
    ::setenv("CHATGATE_LIMIT_MESSAGES", "10x", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
    ::setenv("CHATGATE_LIMIT_MESSAGES", "0", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
    ::unsetenv("CHATGATE_LIMIT_MESSAGES");

    ::setenv("CHATGATE_THREADS", "-1", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
    ::unsetenv("CHATGATE_THREADS");

    ::setenv("CHATGATE_ALLOWED_USERS", ":u1", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
}

TEST(SplitListTest, DropsEmptyItems) {
    EXPECT_EQ(split_list("a,b,c"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(split_list(",a,,b,"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(split_list("").empty());
}
