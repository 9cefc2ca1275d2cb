#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <map>

namespace chatgate {

// Per-platform access rules (admins, allowlists, DM/group policy).
struct PlatformAccess {
    bool enabled = true;
    std::vector<std::string> admins;
    std::vector<std::string> allowed_users;
    std::vector<std::string> allowed_chats;
    bool allow_groups = false;
    bool allow_dms = true;
};

struct AccessConfig {
    std::string mode = "allowlist"; // "allowlist" or "open"
    std::vector<std::string> global_admins;
    std::map<std::string, PlatformAccess> platforms;
};

// Core gateway configuration and security policy definitions.
struct GatewayConfig {
    // --- Runtime ---
    int thread_count = 0;  // 0 defaults to hardware concurrency
    std::string log_level = "info";
    char command_prefix = '/';

    // --- Persistence ---
    std::string redis_url = "tcp://127.0.0.1:6379";
    size_t max_stored_messages = 10000; // per chat list in Redis
    std::string audit_log_dir = "logs";
    size_t audit_log_max_bytes = 50 * 1024 * 1024;

    // --- Encryption at rest ---
    std::string encryption_key = ""; // base64, 32 bytes. Generated if empty.

    // --- Access control ---
    AccessConfig access;
    // Legacy global allowlist: platform -> user IDs
    std::map<std::string, std::vector<std::string>> allowed_users;

    // --- Rate limiting (per user, per minute) ---
    int messages_per_minute = 30;
    int commands_per_minute = 10;
    bool distributed_rate_limit = false; // Redis token bucket instead of in-process windows

    // --- Lockout ---
    int max_failed_auth = 5;
    int lockout_sec = 15 * 60;

    // --- Conversation sessions & background tasks ---
    size_t max_history = 50;
    size_t parent_history_window = 10;
    int task_timeout_sec = 5 * 60;
    int session_retention_sec = 60 * 60;
    int maintenance_interval_sec = 5 * 60;
    size_t max_active_subsessions = 50;
};

// Applies CHATGATE_* environment overrides. Throws ConfigError on malformed values.
void apply_env_overrides(GatewayConfig& config);

// Splits a comma separated list, dropping empty items.
std::vector<std::string> split_list(const std::string& value);

}
