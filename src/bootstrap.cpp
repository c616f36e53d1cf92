#include "rolegate/bootstrap.hpp"

#include <spdlog/spdlog.h>

namespace rolegate {

BootstrapPayload build_bootstrap(const RbacGuard& guard,
                                 const PolicyEngine& engine,
                                 const UserProfile& profile,
                                 const std::optional<std::string>& demo_role,
                                 const Settings& settings) {
    Role role = parse_role(profile.role.value_or("ic"));

    if (demo_role && !demo_role->empty()) {
        if (settings.is_production()) {
            spdlog::warn("bootstrap: demo role ignored in production user_id={} demo_role={}",
                         profile.id, *demo_role);
        } else {
            role = parse_role(*demo_role);
        }
    }

    UserContext ctx;
    ctx.user_id       = profile.id;
    ctx.role          = role;
    ctx.team_id       = profile.team;
    ctx.department_id = profile.department;
    ctx.email         = profile.email;
    ctx.name          = profile.name;

    BootstrapPayload payload;
    payload.user            = { profile.id, profile.name, profile.email, role,
                                profile.team, profile.department };
    payload.dashboard       = guard.dashboard_config(ctx);
    payload.mcp_permissions = guard.mcp_tool_permissions(ctx);
    payload.knowledge_scope = guard.knowledge_scope(ctx);
    payload.permissions     = engine.permissions_for_role(role);
    return payload;
}

} // namespace rolegate
