#include "rolegate/agent_guard.hpp"
#include "rolegate/errors.hpp"

#include <spdlog/spdlog.h>

namespace rolegate {

std::optional<ResourceType> resource_for_tool(const std::string& tool_name) {
    static const std::map<std::string, ResourceType> kToolResources = {
        { "jira_search",        ResourceType::McpJira },
        { "jira_get_issue",     ResourceType::McpJira },
        { "jira_get_sprint",    ResourceType::McpJira },
        { "github_search",      ResourceType::McpGithub },
        { "github_get_pr",      ResourceType::McpGithub },
        { "github_get_commits", ResourceType::McpGithub },
        { "slack_search",       ResourceType::McpSlack },
        { "slack_get_channel",  ResourceType::McpSlack },
        { "knowledge_search",   ResourceType::KnowledgeTeam },
        { "team_analytics",     ResourceType::TeamAnalytics },
        { "ownership_lookup",   ResourceType::OwnershipLookup },
    };

    auto it = kToolResources.find(tool_name);
    if (it == kToolResources.end()) return std::nullopt;
    return it->second;
}

AgentGuard::AgentGuard(std::shared_ptr<const RbacGuard> guard,
                       std::shared_ptr<AuditLogger> audit)
    : guard_(std::move(guard)), audit_(std::move(audit)) {
    if (!guard_) {
        throw ConfigurationError("AgentGuard requires an RbacGuard");
    }
}

AgentContext AgentGuard::build_agent_context(const UserContext& ctx,
                                             const std::string& query) const {
    const auto dashboard = guard_->dashboard_config(ctx);

    AgentContext agent;
    agent.user_id            = ctx.user_id;
    agent.user_role          = ctx.role;
    agent.user_team          = ctx.team_id;
    agent.user_department    = ctx.department_id;
    agent.knowledge_scope    = guard_->knowledge_scope(ctx);
    agent.mcp_permissions    = guard_->mcp_tool_permissions(ctx);
    agent.dashboard_widgets  = dashboard.widgets;
    agent.data_scope         = dashboard.data_scope;
    agent.query              = query;
    agent.is_new_employee    = ctx.role == Role::NewHire;
    agent.can_see_cross_team = outranks_or_equals(ctx.role, Role::Leadership);
    agent.can_see_sensitive  = outranks_or_equals(ctx.role, Role::Leadership);
    return agent;
}

std::vector<RetrievedDocument> AgentGuard::filter_retrieved_context(
    const UserContext& ctx,
    const std::vector<RetrievedDocument>& docs) const {
    const auto scope = guard_->knowledge_scope(ctx);
    const auto team       = get_string(scope.filters, "team_id");
    const auto department = get_string(scope.filters, "department_id");
    const bool onboarding_only = get_bool(scope.filters, "onboarding_visible").value_or(false);

    std::vector<RetrievedDocument> filtered;
    for (const auto& doc : docs) {
        // Documents that declare no team or department are not scoped by it.
        if (team && !doc.team_id.empty() && doc.team_id != *team) continue;
        if (department && !doc.department_id.empty() && doc.department_id != *department) continue;
        if (onboarding_only && !doc.onboarding_visible) continue;
        if (doc.hierarchy_depth > scope.max_depth) continue;
        filtered.push_back(doc);
    }

    spdlog::debug("agent: context filtered original_count={} filtered_count={} user_id={}",
                  docs.size(), filtered.size(), ctx.user_id);
    return filtered;
}

ToolCheck AgentGuard::check_tool_permission(const UserContext& ctx,
                                            const std::string& tool_name,
                                            const ResourceAttributes& tool_params) const {
    auto resource = resource_for_tool(tool_name);
    if (!resource) {
        spdlog::warn("agent: unknown tool tool={} user_id={}", tool_name, ctx.user_id);
        if (audit_) audit_->log_mcp_tool_call(ctx, tool_name, false, {});
        return {};
    }

    // Calls that name no team or department run within the caller's own.
    ResourceAttributes attrs = tool_params;
    attrs.emplace("team_id", ctx.team_id);
    attrs.emplace("department_id", ctx.department_id);

    auto decision = guard_->check_access(ctx, *resource, AccessLevel::Read, attrs);

    if (audit_) {
        audit_->log_mcp_tool_call(ctx, tool_name, decision.allowed,
                                  decision.allowed ? decision.scope_filters : ScopeFilters{});
    }
    return { decision.allowed, decision.scope_filters };
}

ResourceAttributes AgentGuard::apply_tool_scope(const ResourceAttributes& tool_params,
                                                const ScopeFilters& scope) {
    ResourceAttributes scoped = tool_params;

    auto pin = [&](const std::string& from, std::initializer_list<const char*> to) {
        auto it = scope.find(from);
        if (it == scope.end()) return;
        for (const char* key : to) scoped[key] = it->second;
    };

    pin("team_id",       { "team_id", "team_filter" });
    pin("department_id", { "department_id" });
    pin("owner_id",      { "owner_id", "assignee" });
    pin("project_ids",   { "project_ids" });
    pin("max_depth",     { "max_depth" });
    return scoped;
}

FilteredChatResponse AgentGuard::filter_agent_response(const UserContext& ctx,
                                                       const std::string& response,
                                                       const std::vector<ChatSource>& sources,
                                                       const std::string& agent_name) const {
    auto filtered = guard_->filter_chat_response(ctx, response, sources);

    const bool text_filtered    = filtered.text != response;
    const bool sources_filtered = filtered.sources != sources;

    if (audit_) {
        audit_->log_chat_interaction(ctx, "[agent response]", filtered.text.substr(0, 500),
                                     agent_name, filtered.sources.size(),
                                     text_filtered || sources_filtered);
    }
    return filtered;
}

} // namespace rolegate
