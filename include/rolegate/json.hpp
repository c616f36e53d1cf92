#pragma once

#include "rolegate/bootstrap.hpp"
#include "rolegate/guard.hpp"
#include "rolegate/policy_engine.hpp"
#include "rolegate/types.hpp"

#include <cstdio>
#include <map>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace rolegate {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline std::string boolean(bool b) {
    return b ? "true" : "false";
}

inline std::string string_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += quoted(items[i]);
    }
    return out + "]";
}

inline std::string value(const AttrValue& v) {
    struct Visitor {
        std::string operator()(const std::string& s) const  { return quoted(s); }
        std::string operator()(std::int64_t n) const         { return std::to_string(n); }
        std::string operator()(bool b) const                 { return boolean(b); }
        std::string operator()(const StringList& l) const    { return string_list(l); }
    };
    return std::visit(Visitor{}, v);
}

inline std::string outcome_str(StepOutcome o) {
    switch (o) {
        case StepOutcome::Allow: return "Allow";
        case StepOutcome::Deny:  return "Deny";
        case StepOutcome::Skip:  return "Skip";
        default:                 return "Unknown";
    }
}

inline std::string condition_str(const Condition& c) {
    if (c.type == ConditionType::MaxHierarchyDepth) {
        return to_string(c.type) + "(" + std::to_string(c.limit) + ")";
    }
    return to_string(c.type);
}

} // namespace json_detail

// ── Attributes ────────────────────────────────────────────────────────────────

/// Single-line object; used inside audit metadata as well as larger documents.
inline std::string to_json(const AttributeMap& attrs) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, v] : attrs) {
        if (!first) out += ", ";
        first = false;
        out += json_detail::quoted(key) + ": " + json_detail::value(v);
    }
    return out + "}";
}

inline std::string to_json(const std::map<std::string, std::string>& fields) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, v] : fields) {
        if (!first) out += ", ";
        first = false;
        out += json_detail::quoted(key) + ": " + json_detail::quoted(v);
    }
    return out + "}";
}

// ── Decisions ─────────────────────────────────────────────────────────────────

inline std::string to_json(const AccessDecision& d) {
    std::ostringstream os;
    os << "{\n"
       << "  \"allowed\": "       << json_detail::boolean(d.allowed) << ",\n"
       << "  \"reason\": "        << json_detail::quoted(d.reason) << ",\n"
       << "  \"policy_id\": "     << json_detail::quoted(d.policy_id) << ",\n"
       << "  \"resource\": "
       << (d.resource ? json_detail::quoted(to_string(*d.resource)) : "null") << ",\n"
       << "  \"access_level\": "
       << (d.access_level ? json_detail::quoted(to_string(*d.access_level)) : "null") << ",\n"
       << "  \"scope_filters\": " << to_json(d.scope_filters) << "\n"
       << "}";
    return os.str();
}

inline std::string to_json(const PolicyStep& step) {
    std::ostringstream os;
    os << "{ \"policy_id\": " << json_detail::quoted(step.policy_id)
       << ", \"priority\": "  << step.priority
       << ", \"inherited\": " << json_detail::boolean(step.inherited)
       << ", \"outcome\": "   << json_detail::quoted(json_detail::outcome_str(step.outcome))
       << " }";
    return os.str();
}

inline std::string to_json(const EvaluationResult& result) {
    std::ostringstream os;
    const auto& d = result.decision;
    const auto& t = result.trace;
    os << "{\n"
       << "  \"decision\": {\n"
       << "    \"allowed\": "       << json_detail::boolean(d.allowed) << ",\n"
       << "    \"reason\": "        << json_detail::quoted(d.reason) << ",\n"
       << "    \"policy_id\": "     << json_detail::quoted(d.policy_id) << ",\n"
       << "    \"scope_filters\": " << to_json(d.scope_filters) << "\n"
       << "  },\n"
       << "  \"trace\": {\n"
       << "    \"skipped\": " << t.skipped_count() << ",\n"
       << "    \"steps\": [";
    for (std::size_t i = 0; i < t.steps.size(); ++i) {
        os << "\n      " << to_json(t.steps[i]);
        if (i + 1 < t.steps.size()) os << ",";
    }
    os << "\n    ]\n"
       << "  }\n"
       << "}";
    return os.str();
}

// ── Guard outputs ─────────────────────────────────────────────────────────────

inline std::string to_json(const KnowledgeScope& scope) {
    std::ostringstream os;
    os << "{ \"allowed_nodes\": " << json_detail::string_list(scope.allowed_nodes)
       << ", \"max_depth\": "     << scope.max_depth
       << ", \"filters\": "       << to_json(scope.filters)
       << " }";
    return os.str();
}

inline std::string to_json(const ToolPermission& p) {
    std::ostringstream os;
    os << "{ \"allowed\": " << json_detail::boolean(p.allowed)
       << ", \"level\": "   << json_detail::quoted(to_string(p.level))
       << ", \"scope\": "   << to_json(p.scope)
       << " }";
    return os.str();
}

inline std::string to_json(const std::map<std::string, ToolPermission>& tools) {
    std::string out = "{";
    bool first = true;
    for (const auto& [name, permission] : tools) {
        if (!first) out += ", ";
        first = false;
        out += json_detail::quoted(name) + ": " + to_json(permission);
    }
    return out + "}";
}

inline std::string to_json(const DashboardConfig& config) {
    std::ostringstream os;
    os << "{ \"widgets\": "                  << json_detail::string_list(config.widgets)
       << ", \"data_scope\": "               << to_json(config.data_scope)
       << ", \"refresh_interval_seconds\": " << config.refresh_interval_seconds
       << " }";
    return os.str();
}

inline std::string to_json(const ChatSource& source) {
    std::ostringstream os;
    os << "{ \"title\": " << json_detail::quoted(source.title)
       << ", \"type\": "  << json_detail::quoted(source.type);
    if (!source.access_denied) {
        os << ", \"url\": " << json_detail::quoted(source.url);
    }
    os << ", \"access_denied\": " << json_detail::boolean(source.access_denied)
       << " }";
    return os.str();
}

inline std::string to_json(const PermissionInfo& info) {
    std::vector<std::string> conditions;
    for (const auto& c : info.conditions) conditions.push_back(json_detail::condition_str(c));

    std::ostringstream os;
    os << "{ \"resource\": "     << json_detail::quoted(to_string(info.resource))
       << ", \"access_level\": " << json_detail::quoted(to_string(info.access_level))
       << ", \"conditions\": "   << json_detail::string_list(conditions)
       << ", \"description\": "  << json_detail::quoted(info.description)
       << " }";
    return os.str();
}

inline std::string to_json(const BootstrapPayload& payload) {
    const auto& u = payload.user;
    std::ostringstream os;
    os << "{\n"
       << "  \"user\": {\n"
       << "    \"id\": "         << json_detail::quoted(u.id) << ",\n"
       << "    \"name\": "       << json_detail::quoted(u.name) << ",\n"
       << "    \"email\": "      << json_detail::quoted(u.email) << ",\n"
       << "    \"role\": "       << json_detail::quoted(to_string(u.role)) << ",\n"
       << "    \"team\": "       << json_detail::quoted(u.team) << ",\n"
       << "    \"department\": " << json_detail::quoted(u.department) << "\n"
       << "  },\n"
       << "  \"dashboard\": "       << to_json(payload.dashboard) << ",\n"
       << "  \"mcp_permissions\": " << to_json(payload.mcp_permissions) << ",\n"
       << "  \"knowledge_scope\": " << to_json(payload.knowledge_scope) << ",\n"
       << "  \"permissions\": [";
    for (std::size_t i = 0; i < payload.permissions.size(); ++i) {
        os << "\n    " << to_json(payload.permissions[i]);
        if (i + 1 < payload.permissions.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

} // namespace rolegate
