#include "rolegate/audit.hpp"
#include "rolegate/json.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include <exception>

namespace rolegate {

namespace {

std::string opt(const std::optional<std::string>& value) {
    return value.value_or("-");
}

} // namespace

std::string to_string(AuditEventType type) {
    switch (type) {
        case AuditEventType::AccessGranted:      return "access_granted";
        case AuditEventType::AccessDenied:       return "access_denied";
        case AuditEventType::DataRead:           return "data_read";
        case AuditEventType::DataWrite:          return "data_write";
        case AuditEventType::DataDelete:         return "data_delete";
        case AuditEventType::KnowledgeQuery:     return "knowledge_query";
        case AuditEventType::KnowledgeUpdate:    return "knowledge_update";
        case AuditEventType::ChatMessage:        return "chat_message";
        case AuditEventType::ChatResponse:       return "chat_response";
        case AuditEventType::ChatFiltered:       return "chat_filtered";
        case AuditEventType::OwnershipLookup:    return "ownership_lookup";
        case AuditEventType::ExpertiseSearch:    return "expertise_search";
        case AuditEventType::RecommendationMade: return "recommendation_made";
        case AuditEventType::McpToolCall:        return "mcp_tool_call";
        case AuditEventType::McpToolBlocked:     return "mcp_tool_blocked";
        case AuditEventType::LoginSuccess:       return "login_success";
        case AuditEventType::LoginFailed:        return "login_failed";
        case AuditEventType::Logout:             return "logout";
        case AuditEventType::PolicyChange:       return "policy_change";
        case AuditEventType::RoleChange:         return "role_change";
    }
    return "unknown";
}

AuditEvent make_audit_event(AuditEventType type) {
    thread_local boost::uuids::random_generator generator;
    AuditEvent event;
    event.event_id   = boost::uuids::to_string(generator());
    event.event_type = type;
    event.timestamp  = std::chrono::system_clock::now();
    return event;
}

// ── AuditLogger ───────────────────────────────────────────────────────────────

void AuditLogger::add_handler(AuditHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void AuditLogger::add_alert_handler(AuditHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    alert_handlers_.push_back(std::move(handler));
}

bool AuditLogger::is_sensitive(AuditEventType type) {
    switch (type) {
        case AuditEventType::AccessDenied:
        case AuditEventType::LoginFailed:
        case AuditEventType::PolicyChange:
        case AuditEventType::RoleChange:
        case AuditEventType::McpToolBlocked:
            return true;
        default:
            return false;
    }
}

void AuditLogger::dispatch(const std::vector<AuditHandler>& handlers,
                           const AuditEvent& event,
                           const char* what) const {
    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            spdlog::error("audit: {} handler failed event_id={} error={}",
                          what, event.event_id, e.what());
        } catch (...) {
            spdlog::error("audit: {} handler failed event_id={} error=unknown error",
                          what, event.event_id);
        }
    }
}

void AuditLogger::log(const AuditEvent& event) {
    spdlog::info("audit: event_type={} user_id={} resource={} result={} event_id={}",
                 to_string(event.event_type), opt(event.user_id),
                 opt(event.resource_type), opt(event.result), event.event_id);

    std::vector<AuditHandler> handlers;
    std::vector<AuditHandler> alert_handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
        if (is_sensitive(event.event_type)) alert_handlers = alert_handlers_;
    }

    dispatch(handlers, event, "audit");
    dispatch(alert_handlers, event, "alert");
}

void AuditLogger::record_decision(const AccessDecision& decision, const UserContext& ctx) {
    auto event = make_audit_event(decision.allowed ? AuditEventType::AccessGranted
                                                   : AuditEventType::AccessDenied);
    event.user_id       = ctx.user_id;
    event.user_role     = to_string(ctx.role);
    event.team_id       = ctx.team_id;
    event.department_id = ctx.department_id;
    if (decision.resource) event.resource_type = to_string(*decision.resource);
    event.result        = decision.allowed ? "success" : "denied";
    event.session       = ctx.session;
    if (!decision.policy_id.empty()) event.policy_id = decision.policy_id;
    event.access_reason = decision.reason;
    event.metadata["scope_filters"] = to_json(decision.scope_filters);

    log(event);
}

void AuditLogger::log_chat_interaction(const UserContext& ctx,
                                       const std::string& query,
                                       const std::string& response,
                                       const std::string& agent,
                                       std::size_t sources_count,
                                       bool filtered) {
    auto event = make_audit_event(filtered ? AuditEventType::ChatFiltered
                                           : AuditEventType::ChatResponse);
    event.user_id   = ctx.user_id;
    event.user_role = to_string(ctx.role);
    event.team_id   = ctx.team_id;
    event.action    = "chat_response";
    event.result    = "success";
    event.session   = ctx.session;
    event.metadata["agent"]           = agent;
    event.metadata["query_length"]    = std::to_string(query.size());
    event.metadata["response_length"] = std::to_string(response.size());
    event.metadata["sources_count"]   = std::to_string(sources_count);
    event.metadata["filtered"]        = filtered ? "true" : "false";

    log(event);
}

void AuditLogger::log_mcp_tool_call(const UserContext& ctx,
                                    const std::string& tool_name,
                                    bool allowed,
                                    const ScopeFilters& scope) {
    auto event = make_audit_event(allowed ? AuditEventType::McpToolCall
                                          : AuditEventType::McpToolBlocked);
    event.user_id       = ctx.user_id;
    event.user_role     = to_string(ctx.role);
    event.team_id       = ctx.team_id;
    event.resource_type = "mcp_" + tool_name;
    event.action        = "tool_call";
    event.result        = allowed ? "success" : "blocked";
    event.session       = ctx.session;
    event.metadata["tool"]  = tool_name;
    event.metadata["scope"] = to_json(scope);

    log(event);
}

void AuditLogger::log_ownership_lookup(const UserContext& ctx,
                                       const std::string& query,
                                       std::size_t result_count,
                                       const ScopeFilters& scope) {
    auto event = make_audit_event(AuditEventType::OwnershipLookup);
    event.user_id       = ctx.user_id;
    event.user_role     = to_string(ctx.role);
    event.team_id       = ctx.team_id;
    event.department_id = ctx.department_id;
    event.action        = "ownership_lookup";
    event.result        = "success";
    event.session       = ctx.session;
    event.metadata["query"]        = query.substr(0, 100);
    event.metadata["result_count"] = std::to_string(result_count);
    event.metadata["scope"]        = to_json(scope);

    log(event);
}

} // namespace rolegate
