#include "rolegate/policy_engine.hpp"
#include "rolegate/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace rolegate {

// ── Conditions ────────────────────────────────────────────────────────────────

std::string to_string(ConditionType type) {
    switch (type) {
        case ConditionType::SameTeam:          return "same_team";
        case ConditionType::SameDepartment:    return "same_department";
        case ConditionType::IsOwner:           return "is_owner";
        case ConditionType::IsManagerOfOwner:  return "is_manager_of_owner";
        case ConditionType::ProjectMember:     return "project_member";
        case ConditionType::OnboardingVisible: return "onboarding_visible";
        case ConditionType::MaxHierarchyDepth: return "max_hierarchy_depth";
    }
    return "unknown";
}

bool condition_holds(const Condition& condition,
                     const UserContext& ctx,
                     const ResourceAttributes& attrs) {
    switch (condition.type) {
        case ConditionType::SameTeam:
            return ctx.same_team(get_string(attrs, "team_id").value_or(""));

        case ConditionType::SameDepartment:
            return ctx.same_department(get_string(attrs, "department_id").value_or(""));

        case ConditionType::IsOwner: {
            auto owner = get_string(attrs, "owner_id");
            return owner && !owner->empty() && *owner == ctx.user_id;
        }

        case ConditionType::IsManagerOfOwner:
            return ctx.is_manager_of(get_string(attrs, "owner_id").value_or(""));

        case ConditionType::ProjectMember: {
            // A resource outside any project is not constrained by membership.
            auto project = get_string(attrs, "project_id");
            if (!project || project->empty()) return true;
            return std::find(ctx.project_ids.begin(), ctx.project_ids.end(), *project)
                   != ctx.project_ids.end();
        }

        case ConditionType::OnboardingVisible:
            return get_bool(attrs, "onboarding_visible").value_or(true);

        case ConditionType::MaxHierarchyDepth:
            return get_int(attrs, "hierarchy_depth").value_or(0) <= condition.limit;
    }
    return false;
}

// ── AccessPolicy ──────────────────────────────────────────────────────────────

bool AccessPolicy::matches(const UserContext& ctx, const ResourceAttributes& attrs) const {
    if (!enabled) return false;
    if (ctx.role != role) return false;
    for (const auto& condition : conditions) {
        if (!condition_holds(condition, ctx, attrs)) return false;
    }
    return true;
}

ScopeFilters build_scope_filters(const AccessPolicy& policy, const UserContext& ctx) {
    ScopeFilters filters;
    for (const auto& condition : policy.conditions) {
        switch (condition.type) {
            case ConditionType::SameTeam:
                filters["team_id"] = ctx.team_id;
                break;
            case ConditionType::SameDepartment:
                filters["department_id"] = ctx.department_id;
                break;
            case ConditionType::IsOwner:
                filters["owner_id"] = ctx.user_id;
                break;
            case ConditionType::IsManagerOfOwner:
                filters["owner_ids"] = ctx.direct_reports;
                break;
            case ConditionType::ProjectMember:
                filters["project_ids"] = ctx.project_ids;
                break;
            case ConditionType::OnboardingVisible:
                filters["onboarding_visible"] = true;
                break;
            case ConditionType::MaxHierarchyDepth:
                filters["max_depth"] = condition.limit;
                break;
        }
    }
    return filters;
}

// ── PolicyEngine ─────────────────────────────────────────────────────────────

void PolicyEngine::register_policy(AccessPolicy policy) {
    if (policy.policy_id.empty()) {
        throw ConfigurationError("policy id must not be empty");
    }
    if (!is_known(policy.role)) {
        throw ConfigurationError("policy '" + policy.policy_id + "' names an unknown role");
    }
    if (!is_known(policy.resource)) {
        throw ConfigurationError("policy '" + policy.policy_id + "' names an unknown resource");
    }
    if (!is_known(policy.access_level)) {
        throw ConfigurationError("policy '" + policy.policy_id + "' names an unknown access level");
    }
    for (const auto& condition : policy.conditions) {
        if (condition.type == ConditionType::MaxHierarchyDepth && condition.limit < 0) {
            throw ConfigurationError("policy '" + policy.policy_id
                                     + "' has a negative max_hierarchy_depth");
        }
    }

    auto ptr = std::make_shared<const AccessPolicy>(std::move(policy));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (policies_.count(ptr->policy_id) > 0) {
        throw ConfigurationError("duplicate policy id '" + ptr->policy_id + "'");
    }
    policies_.emplace(ptr->policy_id, ptr);
    role_index_[ptr->role].push_back(ptr);
    resource_index_[ptr->resource].push_back(ptr);
}

bool PolicyEngine::unregister_policy(const std::string& policy_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = policies_.find(policy_id);
    if (it == policies_.end()) return false;

    const PolicyPtr policy = it->second;
    policies_.erase(it);

    auto drop = [&policy](std::vector<PolicyPtr>& index) {
        index.erase(std::remove(index.begin(), index.end(), policy), index.end());
    };
    drop(role_index_[policy->role]);
    drop(resource_index_[policy->resource]);
    return true;
}

std::vector<PolicyEngine::Candidate>
PolicyEngine::candidates(const UserContext& ctx, ResourceType resource) const {
    std::vector<Candidate> out;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = resource_index_.find(resource);
    if (it == resource_index_.end()) return out;

    for (const auto& policy : it->second) {
        if (policy->role == ctx.role && policy->enabled) {
            out.push_back({ *policy, false });
        }
    }

    // Leadership and above receive the unscoped union of lower grants.
    if (outranks_or_equals(ctx.role, Role::Leadership)) {
        for (const auto& policy : it->second) {
            if (rank(policy->role) >= rank(ctx.role) || !policy->enabled) continue;

            AccessPolicy inherited;
            inherited.policy_id    = policy->policy_id + "-inherited";
            inherited.role         = ctx.role;
            inherited.resource     = policy->resource;
            inherited.access_level = policy->access_level;
            inherited.description  = "Inherited from " + policy->policy_id;
            inherited.priority     = policy->priority - 1;
            out.push_back({ std::move(inherited), true });
        }
    }
    return out;
}

EvaluationResult PolicyEngine::explain(const UserContext& ctx,
                                       ResourceType resource,
                                       AccessLevel required_level,
                                       const ResourceAttributes& resource_attrs) const {
    ResourceAttributes attrs = resource_attrs;
    attrs.emplace("owner_id", ctx.user_id);

    EvaluationTrace trace;
    auto finish = [&](AccessDecision decision) {
        decision.context_snapshot = ctx;
        return EvaluationResult{ std::move(decision), std::move(trace) };
    };

    auto policies = candidates(ctx, resource);
    if (policies.empty()) {
        return finish(AccessDecision::deny(
            "No policies found for role " + to_string(ctx.role)
                + " on resource " + to_string(resource),
            resource));
    }

    std::stable_sort(policies.begin(), policies.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.policy.priority > b.policy.priority;
                     });

    for (const auto& candidate : policies) {
        const auto& policy = candidate.policy;
        if (!policy.matches(ctx, attrs)) {
            trace.steps.push_back({ policy.policy_id, policy.priority,
                                    candidate.inherited, StepOutcome::Skip });
            continue;
        }

        if (policy.access_level == AccessLevel::None) {
            trace.steps.push_back({ policy.policy_id, policy.priority,
                                    candidate.inherited, StepOutcome::Deny });
            return finish(AccessDecision::deny(
                "Access denied by policy " + policy.policy_id, resource));
        }

        if (policy.allows(required_level)) {
            trace.steps.push_back({ policy.policy_id, policy.priority,
                                    candidate.inherited, StepOutcome::Allow });
            spdlog::debug("rbac: access granted user_id={} role={} resource={} policy_id={}",
                          ctx.user_id, to_string(ctx.role), to_string(resource),
                          policy.policy_id);
            return finish(AccessDecision::allow(policy.policy_id, resource,
                                                policy.access_level,
                                                build_scope_filters(policy, ctx)));
        }

        // The first matching policy is terminal, even when its level is short.
        trace.steps.push_back({ policy.policy_id, policy.priority,
                                candidate.inherited, StepOutcome::Deny });
        break;
    }

    return finish(AccessDecision::deny(
        "No policy grants " + to_string(required_level)
            + " access to " + to_string(resource),
        resource));
}

AccessDecision PolicyEngine::evaluate(const UserContext& ctx,
                                      ResourceType resource,
                                      AccessLevel required_level,
                                      const ResourceAttributes& resource_attrs) const {
    return explain(ctx, resource, required_level, resource_attrs).decision;
}

bool PolicyEngine::is_allowed(const UserContext& ctx,
                              ResourceType resource,
                              AccessLevel required_level) const {
    return evaluate(ctx, resource, required_level).allowed;
}

std::vector<PermissionInfo> PolicyEngine::permissions_for_role(Role role) const {
    std::vector<PermissionInfo> permissions;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = role_index_.find(role);
    if (it == role_index_.end()) return permissions;

    for (const auto& policy : it->second) {
        if (!policy->enabled) continue;
        permissions.push_back({ policy->resource, policy->access_level,
                                policy->conditions, policy->description });
    }
    return permissions;
}

std::optional<AccessPolicy> PolicyEngine::find_policy(const std::string& policy_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = policies_.find(policy_id);
    if (it == policies_.end()) return std::nullopt;
    return *it->second;
}

std::size_t PolicyEngine::policy_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return policies_.size();
}

// ── Built-in policies ─────────────────────────────────────────────────────────

void register_default_policies(PolicyEngine& engine) {
    using namespace conditions;
    using R = ResourceType;
    using L = AccessLevel;

    const std::vector<AccessPolicy> defaults = {
        // Executive: company-wide access
        { "executive-global-knowledge", Role::Executive, R::KnowledgeGlobal, L::Admin, {},
          "Executives have full access to all knowledge" },
        { "executive-company-dashboard", Role::Executive, R::DashboardCompany, L::Admin, {},
          "Executives can view and configure company dashboards" },
        { "executive-all-analytics", Role::Executive, R::TeamAnalytics, L::Read, {},
          "Executives can view all team analytics" },
        { "executive-org-memory", Role::Executive, R::MemoryOrg, L::Admin, {},
          "Executives have full access to organizational memory" },
        { "executive-ownership-lookup", Role::Executive, R::OwnershipLookup, L::Read, {},
          "Executives can look up ownership across the company" },

        // Leadership: department-level access
        { "leadership-dept-knowledge", Role::Leadership, R::KnowledgeDepartment, L::Write,
          { same_department() }, "Leadership has write access to department knowledge" },
        { "leadership-dept-dashboard", Role::Leadership, R::DashboardDepartment, L::Admin,
          { same_department() }, "Leadership can manage department dashboards" },
        { "leadership-team-analytics", Role::Leadership, R::TeamAnalytics, L::Read,
          { same_department() }, "Leadership can view team analytics in their department" },
        { "leadership-team-memory", Role::Leadership, R::MemoryTeam, L::Write,
          { same_department() }, "Leadership can read and write team memory in their department" },
        { "leadership-ownership-dept", Role::Leadership, R::OwnershipLookup, L::Read,
          { same_department() }, "Leadership can look up ownership in their department" },

        // Manager: team-level access
        { "manager-team-knowledge", Role::Manager, R::KnowledgeTeam, L::Write,
          { same_team() }, "Managers have write access to team knowledge" },
        { "manager-team-dashboard", Role::Manager, R::DashboardTeam, L::Admin,
          { same_team() }, "Managers can manage team dashboards" },
        { "manager-team-members", Role::Manager, R::TeamMembers, L::Read,
          { same_team() }, "Managers can view team member information" },
        { "manager-team-workload", Role::Manager, R::TeamWorkload, L::Read,
          { same_team() }, "Managers can view team workload" },
        { "manager-team-analytics", Role::Manager, R::TeamAnalytics, L::Read,
          { same_team() }, "Managers can view their team's analytics" },
        { "manager-team-memory", Role::Manager, R::MemoryTeam, L::Write,
          { same_team() }, "Managers can read and write team memory" },
        { "manager-ownership-team", Role::Manager, R::OwnershipLookup, L::Read,
          { same_team() }, "Managers can look up ownership in their team" },
        { "manager-mcp-jira", Role::Manager, R::McpJira, L::Read,
          { same_team() }, "Managers can access Jira for their team" },
        { "manager-mcp-github", Role::Manager, R::McpGithub, L::Read,
          { same_team() }, "Managers can access GitHub for their team" },
        { "manager-mcp-slack", Role::Manager, R::McpSlack, L::Read,
          { same_team() }, "Managers can search Slack channels of their team" },

        // Contributor: team-scoped and personal access
        { "contributor-team-knowledge-read", Role::Contributor, R::KnowledgeTeam, L::Read,
          { same_team() }, "Contributors can read team knowledge" },
        { "contributor-personal-knowledge", Role::Contributor, R::KnowledgePersonal, L::Write,
          { is_owner() }, "Contributors have full access to their personal knowledge" },
        { "contributor-personal-dashboard", Role::Contributor, R::DashboardPersonal, L::Write,
          { is_owner() }, "Contributors can manage their personal dashboard" },
        { "contributor-user-memory", Role::Contributor, R::MemoryUser, L::Write,
          { is_owner() }, "Contributors have full access to their personal memory" },
        { "contributor-ownership-team", Role::Contributor, R::OwnershipLookup, L::Read,
          { same_team() }, "Contributors can look up ownership in their team" },
        { "contributor-mcp-jira-own", Role::Contributor, R::McpJira, L::Read,
          { is_owner() }, "Contributors can access their own Jira tickets" },
        { "contributor-mcp-github-own", Role::Contributor, R::McpGithub, L::Read,
          { is_owner() }, "Contributors can access their own GitHub activity" },

        // New hire: onboarding-focused access
        { "new-hire-onboarding-flows", Role::NewHire, R::OnboardingFlows, L::Read, {},
          "New hires can access onboarding flows" },
        { "new-hire-onboarding-progress", Role::NewHire, R::OnboardingProgress, L::Write,
          { is_owner() }, "New hires can update their onboarding progress" },
        { "new-hire-team-knowledge-limited", Role::NewHire, R::KnowledgeTeam, L::Read,
          { same_team(), onboarding_visible(), max_hierarchy_depth(2) },
          "New hires have limited team knowledge access" },
        { "new-hire-chat", Role::NewHire, R::Chat, L::Write, {},
          "New hires can use chat for onboarding help" },
        { "new-hire-ownership-team-limited", Role::NewHire, R::OwnershipLookup, L::Read,
          { same_team() }, "New hires can find contacts in their team" },
    };

    for (const auto& policy : defaults) {
        engine.register_policy(policy);
    }

    // Chat is common to every role above new hire.
    for (Role role : { Role::Contributor, Role::Manager, Role::Leadership, Role::Executive }) {
        const std::string name = to_string(role);
        engine.register_policy({ name + "-chat", role, R::Chat, L::Write, {},
                                 name + " can use chat" });
        engine.register_policy({ name + "-chat-history-own", role, R::ChatHistory, L::Read,
                                 { is_owner() }, name + " can view their own chat history" });
    }
}

std::shared_ptr<PolicyEngine> make_default_policy_engine() {
    auto engine = std::make_shared<PolicyEngine>();
    register_default_policies(*engine);
    spdlog::info("rbac: policies initialized policy_count={}", engine->policy_count());
    return engine;
}

} // namespace rolegate
