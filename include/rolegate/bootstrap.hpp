#pragma once

#include "rolegate/guard.hpp"
#include "rolegate/policy_engine.hpp"
#include "rolegate/settings.hpp"
#include "rolegate/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rolegate {

/// Profile of a signed-in user as the identity layer hands it over.
struct UserProfile {
    std::string                id;
    std::string                name;
    std::string                email;
    std::optional<std::string> role;   // role vocabulary string, "ic" when absent
    std::string                team;
    std::string                department;
};

struct BootstrapUser {
    std::string id;
    std::string name;
    std::string email;
    Role        role = Role::Contributor;
    std::string team;
    std::string department;
};

/// Everything a UI needs to render itself for the current caller.
struct BootstrapPayload {
    BootstrapUser                         user;
    DashboardConfig                       dashboard;
    std::map<std::string, ToolPermission> mcp_permissions;
    KnowledgeScope                        knowledge_scope;
    std::vector<PermissionInfo>           permissions;
};

/// The demo role replaces the profile role outside production only.
BootstrapPayload build_bootstrap(const RbacGuard& guard,
                                 const PolicyEngine& engine,
                                 const UserProfile& profile,
                                 const std::optional<std::string>& demo_role,
                                 const Settings& settings);

} // namespace rolegate
