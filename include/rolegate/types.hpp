#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace rolegate {

// ── Vocabulary ────────────────────────────────────────────────────────────────

// Organizational roles ordered by hierarchy level. Rank is the only basis
// for inheritance.
enum class Role : std::uint8_t {
    NewHire     = 1,
    Contributor = 2,
    Manager     = 3,
    Leadership  = 4,
    Executive   = 5,
};

enum class AccessLevel : std::uint8_t {
    None  = 0,
    Read  = 1,
    Write = 2,
    Admin = 3,
};

enum class ResourceType : std::uint8_t {
    // Chat
    Chat,
    ChatHistory,

    // Knowledge graph
    KnowledgeGlobal,
    KnowledgeDepartment,
    KnowledgeTeam,
    KnowledgePersonal,

    // Memory
    MemoryOrg,
    MemoryTeam,
    MemoryUser,

    // Dashboards
    DashboardCompany,
    DashboardDepartment,
    DashboardTeam,
    DashboardPersonal,

    // External tools
    McpJira,
    McpGithub,
    McpSlack,

    // Team management
    TeamMembers,
    TeamWorkload,
    TeamAnalytics,

    // Onboarding
    OnboardingFlows,
    OnboardingProgress,

    // Ownership
    OwnershipLookup,
    ExpertiseSearch,
};

inline int rank(Role r) { return static_cast<int>(r); }

inline bool outranks_or_equals(Role r, Role other) { return rank(r) >= rank(other); }

/// True when a grant of `granted` satisfies a request for `required`.
inline bool satisfies(AccessLevel granted, AccessLevel required) {
    return static_cast<int>(granted) >= static_cast<int>(required);
}

std::string to_string(Role r);
std::string to_string(AccessLevel level);
std::string to_string(ResourceType resource);

/// Case-insensitive role vocabulary; unrecognized strings map to Contributor.
Role parse_role(const std::string& role_str);

std::optional<ResourceType> resource_from_string(const std::string& s);
std::optional<AccessLevel>  access_level_from_string(const std::string& s);

/// Every resource type, in declaration order.
const std::vector<ResourceType>& all_resource_types();

/// Every role, lowest rank first.
const std::vector<Role>& all_roles();

bool is_known(Role r);
bool is_known(ResourceType resource);
bool is_known(AccessLevel level);

inline std::ostream& operator<<(std::ostream& os, Role r)           { return os << to_string(r); }
inline std::ostream& operator<<(std::ostream& os, AccessLevel l)    { return os << to_string(l); }
inline std::ostream& operator<<(std::ostream& os, ResourceType res) { return os << to_string(res); }

// ── Attributes ────────────────────────────────────────────────────────────────

using StringList = std::vector<std::string>;
using AttrValue  = std::variant<std::string, std::int64_t, bool, StringList>;

// Ordered so that rendered filters and decisions are deterministic.
using AttributeMap       = std::map<std::string, AttrValue>;
using ResourceAttributes = AttributeMap;
using ScopeFilters       = AttributeMap;

std::optional<std::string>  get_string(const AttributeMap& attrs, const std::string& key);
std::optional<std::int64_t> get_int(const AttributeMap& attrs, const std::string& key);
std::optional<bool>         get_bool(const AttributeMap& attrs, const std::string& key);
std::optional<StringList>   get_list(const AttributeMap& attrs, const std::string& key);

// ── Identity ──────────────────────────────────────────────────────────────────

struct SessionInfo {
    std::optional<std::string> session_id;
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;
};

/**
 * UserContext
 *
 * Identity of the caller for one request. Built by the context builder,
 * treated as immutable for the rest of the request and never persisted.
 */
struct UserContext {
    std::string user_id;
    Role        role = Role::Contributor;
    std::string team_id;
    std::string department_id;
    std::string organization_id;

    std::optional<std::string> email;
    std::optional<std::string> name;
    std::optional<std::string> manager_id;
    StringList                 direct_reports;
    StringList                 project_ids;

    SessionInfo session;

    bool is_manager_of(const std::string& other_user_id) const;

    // Membership checks never match on an empty identifier.
    bool same_team(const std::string& other_team_id) const;
    bool same_department(const std::string& other_department_id) const;
};

// ── Decision ──────────────────────────────────────────────────────────────────

struct AccessDecision {
    bool                         allowed = false;
    std::string                  reason;
    std::string                  policy_id;      // empty on deny
    std::optional<ResourceType>  resource;
    std::optional<AccessLevel>   access_level;   // granted level on allow
    ScopeFilters                 scope_filters;
    std::optional<UserContext>   context_snapshot;

    static AccessDecision deny(std::string reason, ResourceType resource);
    static AccessDecision allow(std::string policy_id,
                                ResourceType resource,
                                AccessLevel level,
                                ScopeFilters scope_filters);
};

} // namespace rolegate
