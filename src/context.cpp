#include "rolegate/context.hpp"
#include "rolegate/errors.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace rolegate {

namespace {

std::optional<std::string> claim(const AuthPayload& payload, const std::string& key) {
    auto it = payload.find(key);
    if (it == payload.end()) return std::nullopt;
    return it->second;
}

} // namespace

// ── InMemoryUserDirectory ─────────────────────────────────────────────────────

void InMemoryUserDirectory::add_user(const std::string& user_id, DirectoryRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    users_[user_id] = std::move(record);
}

void InMemoryUserDirectory::add_org_chart(const std::string& user_id, OrgChartEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    org_chart_[user_id] = std::move(entry);
}

std::optional<DirectoryRecord> InMemoryUserDirectory::find_user(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) return std::nullopt;
    return it->second;
}

std::optional<OrgChartEntry> InMemoryUserDirectory::find_org_chart(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = org_chart_.find(user_id);
    if (it == org_chart_.end()) return std::nullopt;
    return it->second;
}

// ── ContextBuilder ────────────────────────────────────────────────────────────

ContextBuilder::ContextBuilder(std::shared_ptr<const UserDirectory> directory)
    : directory_(std::move(directory)) {}

std::optional<DirectoryRecord> ContextBuilder::lookup_user(const std::string& user_id) const {
    if (!directory_) return std::nullopt;
    try {
        return directory_->find_user(user_id);
    } catch (const std::exception& e) {
        spdlog::error("context: directory lookup failed user_id={} error={}", user_id, e.what());
        return std::nullopt;
    }
}

UserContext ContextBuilder::from_auth_payload(const AuthPayload& payload,
                                              const SessionInfo& session) const {
    auto sub = claim(payload, "sub");
    if (!sub || sub->empty()) {
        throw ContextError("Token missing 'sub' (user_id)");
    }

    const DirectoryRecord record = lookup_user(*sub).value_or(DirectoryRecord{});

    UserContext ctx;
    ctx.user_id         = *sub;
    ctx.role            = parse_role(claim(payload, "role").value_or("ic"));
    ctx.team_id         = claim(payload, "team_id").value_or(record.team_id);
    ctx.department_id   = claim(payload, "department_id").value_or(record.department_id);
    ctx.organization_id = claim(payload, "org_id").value_or(record.organization_id);
    ctx.email           = claim(payload, "email");
    if (!ctx.email) ctx.email = record.email;
    ctx.name            = claim(payload, "name");
    if (!ctx.name) ctx.name = record.name;
    ctx.manager_id      = record.manager_id;
    ctx.direct_reports  = record.direct_reports;
    ctx.project_ids     = record.project_ids;
    ctx.session         = session;
    return ctx;
}

UserContext ContextBuilder::from_user_id(const std::string& user_id,
                                         const SessionInfo& session) const {
    auto record = lookup_user(user_id);
    if (!record) {
        throw ContextError("User not found: " + user_id);
    }

    UserContext ctx;
    ctx.user_id         = user_id;
    ctx.role            = parse_role(record->role);
    ctx.team_id         = record->team_id;
    ctx.department_id   = record->department_id;
    ctx.organization_id = record->organization_id;
    ctx.email           = record->email;
    ctx.name            = record->name;
    ctx.manager_id      = record->manager_id;
    ctx.direct_reports  = record->direct_reports;
    ctx.project_ids     = record->project_ids;
    ctx.session         = session;
    return ctx;
}

UserContext ContextBuilder::anonymous(const SessionInfo& session) const {
    UserContext ctx;
    ctx.user_id = "anonymous";
    ctx.role    = Role::NewHire;
    ctx.session = session;
    return ctx;
}

UserContext ContextBuilder::enrich_with_org_chart(const UserContext& ctx) const {
    UserContext enriched = ctx;
    if (!directory_) return enriched;

    std::optional<OrgChartEntry> entry;
    try {
        entry = directory_->find_org_chart(ctx.user_id);
    } catch (const std::exception& e) {
        spdlog::error("context: org chart lookup failed user_id={} error={}",
                      ctx.user_id, e.what());
        return enriched;
    }

    if (entry) {
        if (entry->manager_id) enriched.manager_id = entry->manager_id;
        enriched.direct_reports = entry->direct_reports;
    }
    return enriched;
}

UserContext build_user_context(const ContextBuilder& builder,
                               const std::optional<AuthPayload>& payload,
                               const std::optional<std::string>& user_id,
                               const SessionInfo& session) {
    if (payload) return builder.from_auth_payload(*payload, session);
    if (user_id) return builder.from_user_id(*user_id, session);
    return builder.anonymous(session);
}

} // namespace rolegate
