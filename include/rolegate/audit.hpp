#pragma once

#include "rolegate/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace rolegate {

/**
 * AuditSink
 *
 * Receives every access decision together with the caller's context.
 * Delivery is best-effort: implementations must not block and the guard
 * discards anything they throw after logging it.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void record_decision(const AccessDecision& decision, const UserContext& ctx) = 0;
};

enum class AuditEventType {
    // Access control
    AccessGranted,
    AccessDenied,

    // Data operations
    DataRead,
    DataWrite,
    DataDelete,

    // Knowledge graph
    KnowledgeQuery,
    KnowledgeUpdate,

    // Chat
    ChatMessage,
    ChatResponse,
    ChatFiltered,

    // Ownership
    OwnershipLookup,
    ExpertiseSearch,
    RecommendationMade,

    // External tools
    McpToolCall,
    McpToolBlocked,

    // Authentication
    LoginSuccess,
    LoginFailed,
    Logout,

    // Administrative
    PolicyChange,
    RoleChange,
};

std::string to_string(AuditEventType type);

inline std::ostream& operator<<(std::ostream& os, AuditEventType t) { return os << to_string(t); }

struct AuditEvent {
    std::string                           event_id;
    AuditEventType                        event_type = AuditEventType::DataRead;
    std::chrono::system_clock::time_point timestamp;

    // Actor
    std::optional<std::string> user_id;
    std::optional<std::string> user_role;
    std::optional<std::string> team_id;
    std::optional<std::string> department_id;

    // Action
    std::optional<std::string> resource_type;
    std::optional<std::string> resource_id;
    std::optional<std::string> action;
    std::optional<std::string> result;   // "success", "denied", "blocked", "error"

    SessionInfo session;

    std::map<std::string, std::string> metadata;

    // Access events only
    std::optional<std::string> policy_id;
    std::optional<std::string> access_reason;
};

/// Returns a fresh event with a random id and the current time.
AuditEvent make_audit_event(AuditEventType type);

using AuditHandler = std::function<void(const AuditEvent&)>;

/**
 * AuditLogger
 *
 * Writes structured audit records to the log, forwards each event to the
 * registered handlers and, for sensitive event types, to the alert handlers.
 * Handler failures are logged and never reach the caller.
 */
class AuditLogger : public AuditSink {
public:
    void add_handler(AuditHandler handler);
    void add_alert_handler(AuditHandler handler);

    void log(const AuditEvent& event);

    void record_decision(const AccessDecision& decision, const UserContext& ctx) override;

    void log_chat_interaction(const UserContext& ctx,
                              const std::string& query,
                              const std::string& response,
                              const std::string& agent,
                              std::size_t sources_count,
                              bool filtered);

    void log_mcp_tool_call(const UserContext& ctx,
                           const std::string& tool_name,
                           bool allowed,
                           const ScopeFilters& scope);

    void log_ownership_lookup(const UserContext& ctx,
                              const std::string& query,
                              std::size_t result_count,
                              const ScopeFilters& scope);

    static bool is_sensitive(AuditEventType type);

private:
    void dispatch(const std::vector<AuditHandler>& handlers,
                  const AuditEvent& event,
                  const char* what) const;

    mutable std::mutex        mutex_;
    std::vector<AuditHandler> handlers_;
    std::vector<AuditHandler> alert_handlers_;
};

} // namespace rolegate
