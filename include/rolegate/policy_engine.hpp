#pragma once

#include "rolegate/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <string>
#include <vector>

namespace rolegate {

// ── Conditions ────────────────────────────────────────────────────────────────

enum class ConditionType : std::uint8_t {
    SameTeam,
    SameDepartment,
    IsOwner,
    IsManagerOfOwner,
    ProjectMember,
    OnboardingVisible,
    MaxHierarchyDepth,
};

struct Condition {
    ConditionType type;
    std::int64_t  limit = 0;   // MaxHierarchyDepth only
};

inline bool operator==(const Condition& a, const Condition& b) {
    return a.type == b.type && a.limit == b.limit;
}

std::string to_string(ConditionType type);

inline std::ostream& operator<<(std::ostream& os, ConditionType t) { return os << to_string(t); }

namespace conditions {

inline Condition same_team()           { return { ConditionType::SameTeam }; }
inline Condition same_department()     { return { ConditionType::SameDepartment }; }
inline Condition is_owner()            { return { ConditionType::IsOwner }; }
inline Condition is_manager_of_owner() { return { ConditionType::IsManagerOfOwner }; }
inline Condition project_member()      { return { ConditionType::ProjectMember }; }
inline Condition onboarding_visible()  { return { ConditionType::OnboardingVisible }; }
inline Condition max_hierarchy_depth(std::int64_t limit) {
    return { ConditionType::MaxHierarchyDepth, limit };
}

} // namespace conditions

/// Evaluates one condition. Pure: never touches its inputs.
bool condition_holds(const Condition& condition,
                     const UserContext& ctx,
                     const ResourceAttributes& attrs);

// ── Policy ────────────────────────────────────────────────────────────────────

struct AccessPolicy {
    std::string            policy_id;
    Role                   role;
    ResourceType           resource;
    AccessLevel            access_level;
    std::vector<Condition> conditions;
    std::string            description;
    int                    priority = 0;   // higher evaluates first
    bool                   enabled  = true;

    bool allows(AccessLevel required) const { return satisfies(access_level, required); }

    /// Enabled, same role, and every condition holds.
    bool matches(const UserContext& ctx, const ResourceAttributes& attrs) const;
};

/// Scope filters mirror the policy's conditions one to one.
ScopeFilters build_scope_filters(const AccessPolicy& policy, const UserContext& ctx);

/// A policy as shown to a UI layer.
struct PermissionInfo {
    ResourceType           resource;
    AccessLevel            access_level;
    std::vector<Condition> conditions;
    std::string            description;
};

// ── Trace types ───────────────────────────────────────────────────────────────

enum class StepOutcome { Allow, Deny, Skip };

inline std::ostream& operator<<(std::ostream& os, StepOutcome o) {
    switch (o) {
        case StepOutcome::Allow: return os << "Allow";
        case StepOutcome::Deny:  return os << "Deny";
        case StepOutcome::Skip:  return os << "Skip";
        default:                 return os << "Unknown";
    }
}

struct PolicyStep {
    std::string policy_id;
    int         priority = 0;
    bool        inherited = false;
    StepOutcome outcome;
};

struct EvaluationTrace {
    std::vector<PolicyStep> steps;

    std::size_t skipped_count() const {
        std::size_t count = 0;
        for (const auto& s : steps)
            if (s.outcome == StepOutcome::Skip) ++count;
        return count;
    }
};

struct EvaluationResult {
    AccessDecision  decision;
    EvaluationTrace trace;
};

/**
 * PolicyEngine
 *
 * Registry of access policies indexed by role and by resource, plus the
 * evaluation algorithm.
 *
 * Resolution strategy (fail-closed):
 *   1. Candidates are the enabled policies for the caller's role and the
 *      resource. Leadership and above also receive every lower-role policy
 *      for that resource with its conditions removed and priority lowered
 *      by one.
 *   2. Candidates are scanned by priority, highest first. The first one whose
 *      conditions hold decides: None denies, a sufficient level allows with
 *      scope filters, an insufficient level denies.
 *   3. Default: Deny.
 *
 * Registration takes an exclusive lock, evaluation a shared one.
 */
class PolicyEngine {
public:
    PolicyEngine() = default;
    PolicyEngine(const PolicyEngine&) = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;

    /// Throws ConfigurationError on an empty or duplicate id, or an
    /// unresolvable role, resource or level.
    void register_policy(AccessPolicy policy);

    /// Returns false when no policy has this id.
    bool unregister_policy(const std::string& policy_id);

    AccessDecision evaluate(const UserContext& ctx,
                            ResourceType resource,
                            AccessLevel required_level = AccessLevel::Read,
                            const ResourceAttributes& resource_attrs = {}) const;

    /// Same decision as evaluate(), with the scan recorded step by step.
    EvaluationResult explain(const UserContext& ctx,
                             ResourceType resource,
                             AccessLevel required_level = AccessLevel::Read,
                             const ResourceAttributes& resource_attrs = {}) const;

    bool is_allowed(const UserContext& ctx,
                    ResourceType resource,
                    AccessLevel required_level = AccessLevel::Read) const;

    std::vector<PermissionInfo> permissions_for_role(Role role) const;

    std::optional<AccessPolicy> find_policy(const std::string& policy_id) const;

    std::size_t policy_count() const;

private:
    using PolicyPtr = std::shared_ptr<const AccessPolicy>;

    struct Candidate {
        AccessPolicy policy;
        bool         inherited = false;
    };

    std::vector<Candidate> candidates(const UserContext& ctx, ResourceType resource) const;

    mutable std::shared_mutex                    mutex_;
    std::map<std::string, PolicyPtr>             policies_;
    std::map<Role, std::vector<PolicyPtr>>         role_index_;
    std::map<ResourceType, std::vector<PolicyPtr>> resource_index_;
};

// ── Built-in policies ────────────────────────────────────────────────────────

/// Registers the organization's standard policy set.
void register_default_policies(PolicyEngine& engine);

/// Returns an engine pre-loaded with the standard policy set.
std::shared_ptr<PolicyEngine> make_default_policy_engine();

} // namespace rolegate
