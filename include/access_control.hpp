#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <unordered_set>

#include "gateway_config.hpp"

namespace chatgate {

// Platform-scoped authorization: admins, allowlists, DM/group policy, access mode.
class AccessControl {
public:
    virtual ~AccessControl() = default;
    virtual bool is_allowed(const std::string& platform, const std::string& user_id,
                            const std::string& chat_id, bool is_group) const = 0;
};

// Legacy global authorizer (platform -> allowed user IDs).
class Authorizer {
public:
    virtual ~Authorizer() = default;
    virtual bool is_authorized(const std::string& platform, const std::string& user_id) const = 0;
};

// Decision table built from AccessConfig. Immutable once built.
class AccessPolicy : public AccessControl {
public:
    explicit AccessPolicy(AccessConfig config);

    bool is_allowed(const std::string& platform, const std::string& user_id,
                    const std::string& chat_id, bool is_group) const override;

private:
    bool is_allowed_on(const PlatformAccess& pa, const std::string& user_id,
                       const std::string& chat_id, bool is_group) const;

    const AccessConfig config_;
};

// Empty list for a known platform allows everyone (initial setup); unknown platforms deny.
class Allowlist : public Authorizer {
public:
    Allowlist() = default;
    explicit Allowlist(const std::map<std::string, std::vector<std::string>>& users);

    bool is_authorized(const std::string& platform, const std::string& user_id) const override;

private:
    std::unordered_map<std::string, std::unordered_set<std::string>> allowed_;
};

// Null object used when no access source is configured.
class DenyAll : public AccessControl, public Authorizer {
public:
    bool is_allowed(const std::string&, const std::string&, const std::string&, bool) const override {
        return false;
    }
    bool is_authorized(const std::string&, const std::string&) const override { return false; }
};

}
