#include "rolegate/guard.hpp"
#include "rolegate/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>

namespace rolegate {

namespace {

ToolPermission tool_permission(const AccessDecision& decision) {
    return { decision.allowed,
             decision.allowed ? AccessLevel::Read : AccessLevel::None,
             decision.scope_filters };
}

} // namespace

ResourceType resource_for_source_type(const std::string& source_type) {
    std::string type = source_type;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (type == "document" || type == "team_doc") return ResourceType::KnowledgeTeam;
    if (type == "department_doc")                 return ResourceType::KnowledgeDepartment;
    if (type == "company_doc")                    return ResourceType::KnowledgeGlobal;
    if (type == "personal")                       return ResourceType::KnowledgePersonal;
    if (type == "jira")                           return ResourceType::McpJira;
    if (type == "github")                         return ResourceType::McpGithub;
    if (type == "slack")                          return ResourceType::McpSlack;
    return ResourceType::KnowledgeTeam;
}

// ── RbacGuard ─────────────────────────────────────────────────────────────────

RbacGuard::RbacGuard(std::shared_ptr<const PolicyEngine> engine,
                     std::shared_ptr<AuditSink> audit)
    : engine_(std::move(engine)),
      audit_(std::move(audit)),
      redactor_(default_content_redactor()) {
    if (!engine_) {
        throw ConfigurationError("RbacGuard requires a policy engine");
    }
}

void RbacGuard::add_audit_handler(DecisionHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.push_back(std::move(handler));
}

void RbacGuard::audit(const AccessDecision& decision, const UserContext& ctx) const {
    spdlog::info("rbac: access decision allowed={} user_id={} role={} resource={} "
                 "policy_id={} reason=\"{}\"",
                 decision.allowed, ctx.user_id, to_string(ctx.role),
                 decision.resource ? to_string(*decision.resource) : std::string("-"),
                 decision.policy_id.empty() ? std::string("-") : decision.policy_id,
                 decision.reason);

    if (audit_) {
        try {
            audit_->record_decision(decision, ctx);
        } catch (const std::exception& e) {
            spdlog::error("rbac: audit sink failed user_id={} error={}", ctx.user_id, e.what());
        } catch (...) {
            spdlog::error("rbac: audit sink failed user_id={} error=unknown error", ctx.user_id);
        }
    }

    std::vector<DecisionHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers = handlers_;
    }
    for (const auto& handler : handlers) {
        try {
            handler(decision, ctx);
        } catch (const std::exception& e) {
            spdlog::error("rbac: audit handler failed user_id={} error={}", ctx.user_id, e.what());
        } catch (...) {
            spdlog::error("rbac: audit handler failed user_id={} error=unknown error", ctx.user_id);
        }
    }
}

AccessDecision RbacGuard::check_access(const UserContext& ctx,
                                       ResourceType resource,
                                       AccessLevel required_level,
                                       const ResourceAttributes& resource_attrs) const {
    auto decision = engine_->evaluate(ctx, resource, required_level, resource_attrs);
    audit(decision, ctx);
    return decision;
}

AccessDecision RbacGuard::require_access(const UserContext& ctx,
                                         ResourceType resource,
                                         AccessLevel required_level,
                                         const ResourceAttributes& resource_attrs) const {
    auto decision = check_access(ctx, resource, required_level, resource_attrs);
    if (!decision.allowed) {
        throw PermissionDenied(std::move(decision));
    }
    return decision;
}

void RbacGuard::require_role(const UserContext& ctx, Role min_role) const {
    if (outranks_or_equals(ctx.role, min_role)) return;

    spdlog::warn("rbac: role check failed user_id={} user_role={} required_role={}",
                 ctx.user_id, to_string(ctx.role), to_string(min_role));

    AccessDecision decision;
    decision.reason = "Requires " + to_string(min_role) + " role or higher";
    decision.context_snapshot = ctx;
    audit(decision, ctx);
    throw PermissionDenied(std::move(decision));
}

FilteredChatResponse RbacGuard::filter_chat_response(const UserContext& ctx,
                                                     const std::string& response,
                                                     const std::vector<ChatSource>& sources) const {
    FilteredChatResponse filtered;
    filtered.sources.reserve(sources.size());

    for (const auto& source : sources) {
        if (source.access_denied) {
            filtered.sources.push_back(source);
            continue;
        }

        // owner_id is always present so an unowned source never defaults to the caller.
        ResourceAttributes attrs = {
            { "team_id",       source.team_id },
            { "department_id", source.department_id },
            { "owner_id",      source.owner_id },
        };

        auto decision = check_access(ctx, resource_for_source_type(source.type),
                                     AccessLevel::Read, attrs);
        if (decision.allowed) {
            filtered.sources.push_back(source);
        } else {
            ChatSource placeholder;
            placeholder.title         = "[Restricted]";
            placeholder.type          = source.type;
            placeholder.access_denied = true;
            filtered.sources.push_back(std::move(placeholder));
        }
    }

    // Figures are visible from Manager upwards.
    filtered.text = outranks_or_equals(ctx.role, Role::Manager) ? response
                                                                : redactor_.apply(response);
    return filtered;
}

KnowledgeScope RbacGuard::knowledge_scope(const UserContext& ctx) const {
    KnowledgeScope scope;

    switch (ctx.role) {
        case Role::Executive:
            scope.allowed_nodes = { "*" };
            break;

        case Role::Leadership:
            scope.allowed_nodes = { "department:" + ctx.department_id,
                                    "team:" + ctx.team_id };
            scope.filters["department_id"] = ctx.department_id;
            break;

        case Role::Manager:
            scope.allowed_nodes = { "team:" + ctx.team_id };
            scope.filters["team_id"] = ctx.team_id;
            break;

        case Role::Contributor:
            scope.allowed_nodes = { "team:" + ctx.team_id };
            scope.filters["team_id"] = ctx.team_id;
            scope.max_depth = 5;
            break;

        case Role::NewHire:
            scope.allowed_nodes = { "team:" + ctx.team_id };
            scope.filters["team_id"] = ctx.team_id;
            scope.filters["onboarding_visible"] = true;
            scope.max_depth = 2;
            break;
    }
    return scope;
}

std::map<std::string, ToolPermission> RbacGuard::mcp_tool_permissions(const UserContext& ctx) const {
    // Permissions are reported for the caller's own team and department.
    const ResourceAttributes own_scope = {
        { "team_id",       ctx.team_id },
        { "department_id", ctx.department_id },
    };
    return {
        { "jira",   tool_permission(check_access(ctx, ResourceType::McpJira,   AccessLevel::Read, own_scope)) },
        { "github", tool_permission(check_access(ctx, ResourceType::McpGithub, AccessLevel::Read, own_scope)) },
        { "slack",  tool_permission(check_access(ctx, ResourceType::McpSlack,  AccessLevel::Read, own_scope)) },
    };
}

DashboardConfig RbacGuard::dashboard_config(const UserContext& ctx) const {
    DashboardConfig config;

    switch (ctx.role) {
        case Role::Executive:
            config.widgets = {
                "company_overview", "all_teams_health", "cross_team_analytics",
                "company_okrs", "executive_summary", "bottleneck_analysis", "ownership_map",
            };
            config.data_scope = { { "level", "company" } };
            break;

        case Role::Leadership:
            config.widgets = {
                "department_overview", "team_health", "department_analytics",
                "department_okrs", "team_bottlenecks", "ownership_map",
            };
            config.data_scope = { { "level", "department" },
                                  { "department_id", ctx.department_id } };
            break;

        case Role::Manager:
            config.widgets = {
                "team_overview", "sprint_velocity", "team_workload",
                "team_analytics", "member_status", "ownership_lookup",
            };
            config.data_scope = { { "level", "team" }, { "team_id", ctx.team_id } };
            break;

        case Role::Contributor:
            config.widgets = {
                "personal_tasks", "team_activity", "my_analytics", "team_knowledge",
            };
            config.data_scope = { { "level", "personal" },
                                  { "team_id", ctx.team_id },
                                  { "user_id", ctx.user_id } };
            break;

        case Role::NewHire:
            config.widgets = {
                "onboarding_progress", "next_steps", "team_introduction", "help_resources",
            };
            config.data_scope = { { "level", "onboarding" }, { "user_id", ctx.user_id } };
            config.refresh_interval_seconds = 300;
            break;
    }
    return config;
}

bool RbacGuard::can_view_employee_data(const UserContext& ctx,
                                       const std::string& target_user_id,
                                       const std::string& target_team_id,
                                       const std::string& target_department_id) const {
    if (!ctx.user_id.empty() && ctx.user_id == target_user_id) return true;
    if (ctx.role == Role::Executive) return true;
    if (ctx.is_manager_of(target_user_id)) return true;
    if (ctx.same_team(target_team_id)) return true;

    // Inherited team_members grants carry no conditions, so the department
    // boundary is checked here.
    if (ctx.role == Role::Leadership && ctx.same_department(target_department_id)) {
        return check_access(ctx, ResourceType::TeamMembers, AccessLevel::Read,
                            { { "team_id", target_team_id },
                              { "department_id", target_department_id } }).allowed;
    }
    return false;
}

} // namespace rolegate
