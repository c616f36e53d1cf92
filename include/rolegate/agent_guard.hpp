#pragma once

#include "rolegate/audit.hpp"
#include "rolegate/guard.hpp"
#include "rolegate/types.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rolegate {

/// Bounds an agent must operate within for one query.
struct AgentContext {
    std::string user_id;
    Role        user_role = Role::Contributor;
    std::string user_team;
    std::string user_department;

    KnowledgeScope                        knowledge_scope;
    std::map<std::string, ToolPermission> mcp_permissions;
    std::vector<std::string>              dashboard_widgets;
    std::map<std::string, std::string>    data_scope;

    std::string query;

    bool is_new_employee    = false;
    bool can_see_cross_team = false;
    bool can_see_sensitive  = false;
};

/// A document returned by retrieval, before it reaches the model.
struct RetrievedDocument {
    std::string id;
    std::string title;
    std::string content;
    std::string team_id;
    std::string department_id;
    int         hierarchy_depth    = 0;
    bool        onboarding_visible = false;
};

struct ToolCheck {
    bool         allowed = false;
    ScopeFilters scope;
};

/// Resource guarding a named agent tool, if the tool is known.
std::optional<ResourceType> resource_for_tool(const std::string& tool_name);

/**
 * AgentGuard
 *
 * Applies the guard's decisions to agent interactions: what context an
 * agent is given, which retrieved documents it may see, which tool calls it
 * may make and with which parameters, and what reaches the user.
 */
class AgentGuard {
public:
    AgentGuard(std::shared_ptr<const RbacGuard> guard,
               std::shared_ptr<AuditLogger> audit = nullptr);

    AgentContext build_agent_context(const UserContext& ctx, const std::string& query) const;

    std::vector<RetrievedDocument> filter_retrieved_context(
        const UserContext& ctx,
        const std::vector<RetrievedDocument>& docs) const;

    /// Unknown tools are denied.
    ToolCheck check_tool_permission(const UserContext& ctx,
                                    const std::string& tool_name,
                                    const ResourceAttributes& tool_params = {}) const;

    /// Overwrites tool parameters with the values the scope pins down.
    static ResourceAttributes apply_tool_scope(const ResourceAttributes& tool_params,
                                               const ScopeFilters& scope);

    FilteredChatResponse filter_agent_response(const UserContext& ctx,
                                               const std::string& response,
                                               const std::vector<ChatSource>& sources = {},
                                               const std::string& agent_name = "unknown") const;

private:
    std::shared_ptr<const RbacGuard> guard_;
    std::shared_ptr<AuditLogger>     audit_;
};

} // namespace rolegate
