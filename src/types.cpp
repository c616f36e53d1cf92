#include "rolegate/types.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace rolegate {

namespace {

struct ResourceName {
    ResourceType resource;
    const char*  name;
};

const ResourceName kResourceNames[] = {
    { ResourceType::Chat,                "chat" },
    { ResourceType::ChatHistory,         "chat_history" },
    { ResourceType::KnowledgeGlobal,     "knowledge_global" },
    { ResourceType::KnowledgeDepartment, "knowledge_department" },
    { ResourceType::KnowledgeTeam,       "knowledge_team" },
    { ResourceType::KnowledgePersonal,   "knowledge_personal" },
    { ResourceType::MemoryOrg,           "memory_org" },
    { ResourceType::MemoryTeam,          "memory_team" },
    { ResourceType::MemoryUser,          "memory_user" },
    { ResourceType::DashboardCompany,    "dashboard_company" },
    { ResourceType::DashboardDepartment, "dashboard_department" },
    { ResourceType::DashboardTeam,       "dashboard_team" },
    { ResourceType::DashboardPersonal,   "dashboard_personal" },
    { ResourceType::McpJira,             "mcp_jira" },
    { ResourceType::McpGithub,           "mcp_github" },
    { ResourceType::McpSlack,            "mcp_slack" },
    { ResourceType::TeamMembers,         "team_members" },
    { ResourceType::TeamWorkload,        "team_workload" },
    { ResourceType::TeamAnalytics,       "team_analytics" },
    { ResourceType::OnboardingFlows,     "onboarding_flows" },
    { ResourceType::OnboardingProgress,  "onboarding_progress" },
    { ResourceType::OwnershipLookup,     "ownership_lookup" },
    { ResourceType::ExpertiseSearch,     "expertise_search" },
};

// Accepted spellings for each rank. Lookup is on the lower-cased input.
const std::pair<const char*, Role> kRoleAliases[] = {
    { "new_employee",           Role::NewHire },
    { "new_hire",               Role::NewHire },
    { "intern",                 Role::NewHire },
    { "ic",                     Role::Contributor },
    { "individual_contributor", Role::Contributor },
    { "contributor",            Role::Contributor },
    { "engineer",               Role::Contributor },
    { "employee",               Role::Contributor },
    { "manager",                Role::Manager },
    { "team_lead",              Role::Manager },
    { "lead",                   Role::Manager },
    { "leadership",             Role::Leadership },
    { "director",               Role::Leadership },
    { "vp",                     Role::Leadership },
    { "vice_president",         Role::Leadership },
    { "ceo",                    Role::Executive },
    { "cto",                    Role::Executive },
    { "cfo",                    Role::Executive },
    { "executive",              Role::Executive },
};

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename T>
std::optional<T> get_as(const AttributeMap& attrs, const std::string& key) {
    auto it = attrs.find(key);
    if (it == attrs.end()) return std::nullopt;
    if (const auto* value = std::get_if<T>(&it->second)) return *value;
    return std::nullopt;
}

} // namespace

// ── Names ─────────────────────────────────────────────────────────────────────

std::string to_string(Role r) {
    switch (r) {
        case Role::NewHire:     return "new_hire";
        case Role::Contributor: return "contributor";
        case Role::Manager:     return "manager";
        case Role::Leadership:  return "leadership";
        case Role::Executive:   return "executive";
    }
    return "unknown";
}

std::string to_string(AccessLevel level) {
    switch (level) {
        case AccessLevel::None:  return "none";
        case AccessLevel::Read:  return "read";
        case AccessLevel::Write: return "write";
        case AccessLevel::Admin: return "admin";
    }
    return "unknown";
}

std::string to_string(ResourceType resource) {
    for (const auto& entry : kResourceNames) {
        if (entry.resource == resource) return entry.name;
    }
    return "unknown";
}

Role parse_role(const std::string& role_str) {
    const std::string key = lower(role_str);
    for (const auto& alias : kRoleAliases) {
        if (key == alias.first) return alias.second;
    }
    return Role::Contributor;
}

std::optional<ResourceType> resource_from_string(const std::string& s) {
    const std::string key = lower(s);
    for (const auto& entry : kResourceNames) {
        if (key == entry.name) return entry.resource;
    }
    return std::nullopt;
}

std::optional<AccessLevel> access_level_from_string(const std::string& s) {
    const std::string key = lower(s);
    if (key == "none")  return AccessLevel::None;
    if (key == "read")  return AccessLevel::Read;
    if (key == "write") return AccessLevel::Write;
    if (key == "admin") return AccessLevel::Admin;
    return std::nullopt;
}

const std::vector<ResourceType>& all_resource_types() {
    static const std::vector<ResourceType> resources = [] {
        std::vector<ResourceType> out;
        for (const auto& entry : kResourceNames) out.push_back(entry.resource);
        return out;
    }();
    return resources;
}

const std::vector<Role>& all_roles() {
    static const std::vector<Role> roles = {
        Role::NewHire, Role::Contributor, Role::Manager, Role::Leadership, Role::Executive
    };
    return roles;
}

bool is_known(Role r) {
    return rank(r) >= rank(Role::NewHire) && rank(r) <= rank(Role::Executive);
}

bool is_known(ResourceType resource) {
    return to_string(resource) != "unknown";
}

bool is_known(AccessLevel level) {
    return static_cast<int>(level) <= static_cast<int>(AccessLevel::Admin);
}

// ── Attributes ────────────────────────────────────────────────────────────────

std::optional<std::string> get_string(const AttributeMap& attrs, const std::string& key) {
    return get_as<std::string>(attrs, key);
}

std::optional<std::int64_t> get_int(const AttributeMap& attrs, const std::string& key) {
    return get_as<std::int64_t>(attrs, key);
}

std::optional<bool> get_bool(const AttributeMap& attrs, const std::string& key) {
    return get_as<bool>(attrs, key);
}

std::optional<StringList> get_list(const AttributeMap& attrs, const std::string& key) {
    return get_as<StringList>(attrs, key);
}

// ── UserContext ───────────────────────────────────────────────────────────────

bool UserContext::is_manager_of(const std::string& other_user_id) const {
    if (other_user_id.empty()) return false;
    return std::find(direct_reports.begin(), direct_reports.end(), other_user_id)
           != direct_reports.end();
}

bool UserContext::same_team(const std::string& other_team_id) const {
    return !team_id.empty() && team_id == other_team_id;
}

bool UserContext::same_department(const std::string& other_department_id) const {
    return !department_id.empty() && department_id == other_department_id;
}

// ── AccessDecision ────────────────────────────────────────────────────────────

AccessDecision AccessDecision::deny(std::string reason, ResourceType resource) {
    AccessDecision d;
    d.allowed  = false;
    d.reason   = std::move(reason);
    d.resource = resource;
    return d;
}

AccessDecision AccessDecision::allow(std::string policy_id,
                                     ResourceType resource,
                                     AccessLevel level,
                                     ScopeFilters scope_filters) {
    AccessDecision d;
    d.allowed       = true;
    d.reason        = "Access granted by policy";
    d.policy_id     = std::move(policy_id);
    d.resource      = resource;
    d.access_level  = level;
    d.scope_filters = std::move(scope_filters);
    return d;
}

} // namespace rolegate
