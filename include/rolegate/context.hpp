#pragma once

#include "rolegate/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rolegate {

/// Claims of an already-validated authentication token.
/// Recognised: sub, role, team_id, department_id, org_id, email, name.
using AuthPayload = std::map<std::string, std::string>;

struct DirectoryRecord {
    std::string                role = "ic";
    std::string                team_id;
    std::string                department_id;
    std::string                organization_id = "default";
    std::optional<std::string> email;
    std::optional<std::string> name;
    std::optional<std::string> manager_id;
    StringList                 direct_reports;
    StringList                 project_ids;
};

struct OrgChartEntry {
    std::optional<std::string> manager_id;
    StringList                 direct_reports;
};

/**
 * UserDirectory
 *
 * Source of user records and reporting lines (HR system, org chart
 * service, graph store). Lookups may fail; the context builder logs the
 * failure and continues with what the token carries.
 */
class UserDirectory {
public:
    virtual ~UserDirectory() = default;

    virtual std::optional<DirectoryRecord> find_user(const std::string& user_id) const = 0;
    virtual std::optional<OrgChartEntry>   find_org_chart(const std::string& user_id) const = 0;
};

class InMemoryUserDirectory : public UserDirectory {
public:
    void add_user(const std::string& user_id, DirectoryRecord record);
    void add_org_chart(const std::string& user_id, OrgChartEntry entry);

    std::optional<DirectoryRecord> find_user(const std::string& user_id) const override;
    std::optional<OrgChartEntry>   find_org_chart(const std::string& user_id) const override;

private:
    mutable std::mutex                       mutex_;
    std::map<std::string, DirectoryRecord>   users_;
    std::map<std::string, OrgChartEntry>     org_chart_;
};

/**
 * ContextBuilder
 *
 * Turns authentication data into a UserContext. Token validation happens
 * before this point; the builder only maps claims and directory data.
 */
class ContextBuilder {
public:
    explicit ContextBuilder(std::shared_ptr<const UserDirectory> directory = nullptr);

    /// Throws ContextError when the payload carries no subject.
    UserContext from_auth_payload(const AuthPayload& payload,
                                  const SessionInfo& session = {}) const;

    /// Throws ContextError when the directory has no such user.
    UserContext from_user_id(const std::string& user_id,
                             const SessionInfo& session = {}) const;

    /// Most restrictive identity, used for unauthenticated callers.
    UserContext anonymous(const SessionInfo& session = {}) const;

    /// Copy of ctx with manager and direct reports from the org chart.
    UserContext enrich_with_org_chart(const UserContext& ctx) const;

private:
    std::optional<DirectoryRecord> lookup_user(const std::string& user_id) const;

    std::shared_ptr<const UserDirectory> directory_;
};

/// Payload first, then user id, otherwise anonymous.
UserContext build_user_context(const ContextBuilder& builder,
                               const std::optional<AuthPayload>& payload,
                               const std::optional<std::string>& user_id,
                               const SessionInfo& session = {});

} // namespace rolegate
