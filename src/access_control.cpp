#include "access_control.hpp"

#include <algorithm>

namespace chatgate {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& item) {
    return std::find(list.begin(), list.end(), item) != list.end();
}

}

AccessPolicy::AccessPolicy(AccessConfig config) : config_(std::move(config)) {}

// Global admins and open mode short-circuit; otherwise the platform's own rules decide.
bool AccessPolicy::is_allowed(const std::string& platform, const std::string& user_id,
                              const std::string& chat_id, bool is_group) const {
    if (contains(config_.global_admins, user_id)) return true;
    if (config_.mode == "open") return true;

    auto it = config_.platforms.find(platform);
    if (it == config_.platforms.end()) return false;

    return is_allowed_on(it->second, user_id, chat_id, is_group);
}

bool AccessPolicy::is_allowed_on(const PlatformAccess& pa, const std::string& user_id,
                                 const std::string& chat_id, bool is_group) const {
    if (!pa.enabled) return false;
    if (is_group && !pa.allow_groups) return false;
    if (!is_group && !pa.allow_dms) return false;
    if (contains(pa.admins, user_id)) return true;

    const bool strict = config_.mode == "allowlist";

    bool user_ok = pa.allowed_users.empty() ? !strict : contains(pa.allowed_users, user_id);

    bool chat_ok = true;
    if (is_group) {
        chat_ok = pa.allowed_chats.empty() ? !strict : contains(pa.allowed_chats, chat_id);
    }
    return user_ok && chat_ok;
}

Allowlist::Allowlist(const std::map<std::string, std::vector<std::string>>& users) {
    for (const auto& [platform, ids] : users) {
        allowed_[platform] = std::unordered_set<std::string>(ids.begin(), ids.end());
    }
}

bool Allowlist::is_authorized(const std::string& platform, const std::string& user_id) const {
    auto it = allowed_.find(platform);
    if (it == allowed_.end()) return false;
    if (it->second.empty()) return true;
    return it->second.count(user_id) > 0;
}

}
