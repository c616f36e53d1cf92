#pragma once

#include "rolegate/audit.hpp"
#include "rolegate/policy_engine.hpp"
#include "rolegate/redaction.hpp"
#include "rolegate/types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rolegate {

/// A document or record cited by a chat answer.
struct ChatSource {
    std::string title;
    std::string type;            // document, team_doc, department_doc, company_doc, personal, jira, github, slack
    std::string team_id;
    std::string department_id;
    std::string owner_id;
    std::string url;
    bool        access_denied = false;
};

inline bool operator==(const ChatSource& a, const ChatSource& b) {
    return a.title == b.title && a.type == b.type && a.team_id == b.team_id
        && a.department_id == b.department_id && a.owner_id == b.owner_id
        && a.url == b.url && a.access_denied == b.access_denied;
}

struct FilteredChatResponse {
    std::string             text;
    std::vector<ChatSource> sources;
};

struct KnowledgeScope {
    std::vector<std::string> allowed_nodes;
    int                      max_depth = 10;
    ScopeFilters             filters;
};

struct ToolPermission {
    bool         allowed = false;
    AccessLevel  level   = AccessLevel::None;
    ScopeFilters scope;
};

struct DashboardConfig {
    std::vector<std::string>           widgets;
    std::map<std::string, std::string> data_scope;
    int                                refresh_interval_seconds = 60;
};

/// Resource checked for a chat source of the given declared type.
ResourceType resource_for_source_type(const std::string& source_type);

using DecisionHandler = std::function<void(const AccessDecision&, const UserContext&)>;

/**
 * RbacGuard
 *
 * The enforcement point every caller goes through. Wraps a policy engine,
 * forwards each decision to the audit sink, and shapes responses and
 * configuration to the caller's role.
 */
class RbacGuard {
public:
    explicit RbacGuard(std::shared_ptr<const PolicyEngine> engine,
                       std::shared_ptr<AuditSink> audit = nullptr);

    const PolicyEngine& engine() const { return *engine_; }

    void add_audit_handler(DecisionHandler handler);

    AccessDecision check_access(const UserContext& ctx,
                                ResourceType resource,
                                AccessLevel required_level = AccessLevel::Read,
                                const ResourceAttributes& resource_attrs = {}) const;

    /// Throws PermissionDenied when the decision denies access.
    AccessDecision require_access(const UserContext& ctx,
                                  ResourceType resource,
                                  AccessLevel required_level = AccessLevel::Read,
                                  const ResourceAttributes& resource_attrs = {}) const;

    /// Throws PermissionDenied when the caller ranks below min_role.
    void require_role(const UserContext& ctx, Role min_role) const;

    FilteredChatResponse filter_chat_response(const UserContext& ctx,
                                              const std::string& response,
                                              const std::vector<ChatSource>& sources = {}) const;

    KnowledgeScope knowledge_scope(const UserContext& ctx) const;

    std::map<std::string, ToolPermission> mcp_tool_permissions(const UserContext& ctx) const;

    DashboardConfig dashboard_config(const UserContext& ctx) const;

    /// Self, Executive, manager of the target, same team, or Leadership
    /// within its own department.
    bool can_view_employee_data(const UserContext& ctx,
                                const std::string& target_user_id,
                                const std::string& target_team_id,
                                const std::string& target_department_id = {}) const;

private:
    void audit(const AccessDecision& decision, const UserContext& ctx) const;

    std::shared_ptr<const PolicyEngine> engine_;
    std::shared_ptr<AuditSink>          audit_;
    ContentRedactor                     redactor_;

    mutable std::mutex           handlers_mutex_;
    std::vector<DecisionHandler> handlers_;
};

} // namespace rolegate
