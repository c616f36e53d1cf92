#include "rolegate/errors.hpp"
#include "rolegate/guard.hpp"
#include "rolegate/json.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rolegate;

// ── Helpers ──────────────────────────────────────────────────────────────────

static UserContext make_ctx(Role role,
                            const std::string& user_id,
                            const std::string& team_id = "platform",
                            const std::string& department_id = "engineering") {
    UserContext ctx;
    ctx.user_id       = user_id;
    ctx.role          = role;
    ctx.team_id       = team_id;
    ctx.department_id = department_id;
    return ctx;
}

static ChatSource make_source(const std::string& title,
                              const std::string& type,
                              const std::string& team_id,
                              const std::string& owner_id = "") {
    ChatSource s;
    s.title         = title;
    s.type          = type;
    s.team_id       = team_id;
    s.department_id = "engineering";
    s.owner_id      = owner_id;
    s.url           = "https://wiki.example/" + title;
    return s;
}

/// Sink that counts what the guard forwards to it.
class RecordingSink : public AuditSink {
public:
    void record_decision(const AccessDecision& decision, const UserContext&) override {
        ++count;
        if (!decision.allowed) ++denied;
    }

    int count  = 0;
    int denied = 0;
};

/// Sink that fails with something other than a std::exception.
class ThrowingSink : public AuditSink {
public:
    void record_decision(const AccessDecision&, const UserContext&) override {
        throw 7;
    }
};

static int passed = 0;
static int failed = 0;

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

// ── Test suites ───────────────────────────────────────────────────────────────

void test_chat_response_filtering() {
    std::cout << "\n[ChatResponseFiltering]\n";
    RbacGuard guard(make_default_policy_engine());
    auto alice = make_ctx(Role::Contributor, "alice");

    std::vector<ChatSource> sources = {
        make_source("Platform runbook", "team_doc", "platform"),
        make_source("ML roadmap", "team_doc", "other-team"),
    };
    auto out = guard.filter_chat_response(alice, "The salary: $150,000 band applies.", sources);

    ASSERT_EQ("source count preserved", std::size_t{2}, out.sources.size());
    ASSERT_TRUE("own team source kept", out.sources[0] == sources[0]);
    ASSERT_EQ("foreign source replaced", std::string("[Restricted]"), out.sources[1].title);
    ASSERT_TRUE("placeholder flagged", out.sources[1].access_denied);
    ASSERT_EQ("placeholder keeps type", std::string("team_doc"), out.sources[1].type);
    ASSERT_TRUE("placeholder drops url", out.sources[1].url.empty());
    ASSERT_EQ("salary redacted", std::string("The [SALARY REDACTED] band applies."), out.text);
}

void test_chat_redaction_by_role() {
    std::cout << "\n[ChatRedactionByRole]\n";
    RbacGuard guard(make_default_policy_engine());
    const std::string text = "Revenue: $12M, budget $400K, compensation: $90,000.";

    auto hire = guard.filter_chat_response(make_ctx(Role::NewHire, "nina"), text);
    ASSERT_EQ("new hire sees redactions",
              std::string("[REVENUE REDACTED], [BUDGET REDACTED], [COMPENSATION REDACTED]."),
              hire.text);

    auto manager = guard.filter_chat_response(make_ctx(Role::Manager, "mike"), text);
    ASSERT_EQ("manager sees figures", text, manager.text);

    auto exec = guard.filter_chat_response(make_ctx(Role::Executive, "eve"), text);
    ASSERT_EQ("executive sees figures", text, exec.text);
}

void test_chat_filtering_idempotent() {
    std::cout << "\n[ChatFilteringIdempotent]\n";
    RbacGuard guard(make_default_policy_engine());
    auto alice = make_ctx(Role::Contributor, "alice");

    std::vector<ChatSource> sources = {
        make_source("Runbook", "document", "platform"),
        make_source("Bob's notes", "personal", "platform", "bob"),
        make_source("Alice's notes", "personal", "platform", "alice"),
        make_source("Sales plan", "department_doc", "deals"),
    };
    auto once  = guard.filter_chat_response(alice, "Salary: $100,000", sources);
    auto twice = guard.filter_chat_response(alice, once.text, once.sources);

    ASSERT_EQ("text stable", once.text, twice.text);
    ASSERT_TRUE("sources stable", once.sources == twice.sources);
    ASSERT_TRUE("other owner's notes restricted", once.sources[1].access_denied);
    ASSERT_TRUE("own notes kept", !once.sources[2].access_denied);
    ASSERT_TRUE("department doc restricted for contributor", once.sources[3].access_denied);
}

void test_unowned_personal_source_denied() {
    std::cout << "\n[UnownedPersonalSourceDenied]\n";
    RbacGuard guard(make_default_policy_engine());
    auto out = guard.filter_chat_response(make_ctx(Role::Contributor, "alice"), "",
                                          { make_source("Orphan", "personal", "platform") });
    ASSERT_TRUE("unowned personal source is not the caller's", out.sources[0].access_denied);
}

void test_source_type_mapping() {
    std::cout << "\n[SourceTypeMapping]\n";
    ASSERT_EQ("document",       ResourceType::KnowledgeTeam,       resource_for_source_type("document"));
    ASSERT_EQ("department doc", ResourceType::KnowledgeDepartment, resource_for_source_type("Department_Doc"));
    ASSERT_EQ("company doc",    ResourceType::KnowledgeGlobal,     resource_for_source_type("company_doc"));
    ASSERT_EQ("personal",       ResourceType::KnowledgePersonal,   resource_for_source_type("personal"));
    ASSERT_EQ("slack",          ResourceType::McpSlack,            resource_for_source_type("slack"));
    ASSERT_EQ("unknown type",   ResourceType::KnowledgeTeam,       resource_for_source_type("wiki"));
}

void test_require_access() {
    std::cout << "\n[RequireAccess]\n";
    RbacGuard guard(make_default_policy_engine());
    auto alice = make_ctx(Role::Contributor, "alice");

    auto ok = guard.require_access(alice, ResourceType::Chat, AccessLevel::Write);
    ASSERT_TRUE("allowed decision returned", ok.allowed);

    bool thrown = false;
    try {
        guard.require_access(alice, ResourceType::DashboardCompany);
    } catch (const PermissionDenied& e) {
        thrown = true;
        ASSERT_EQ("reason verbatim",
                  std::string("No policies found for role contributor on resource dashboard_company"),
                  e.reason());
        ASSERT_EQ("message prefix", std::string("Access denied: ") + e.reason(), std::string(e.what()));
        ASSERT_TRUE("decision carried", !e.decision().allowed);
    }
    ASSERT_TRUE("PermissionDenied thrown", thrown);
}

void test_require_role() {
    std::cout << "\n[RequireRole]\n";
    RbacGuard guard(make_default_policy_engine());

    bool thrown = false;
    try {
        guard.require_role(make_ctx(Role::Contributor, "alice"), Role::Manager);
    } catch (const PermissionDenied& e) {
        thrown = true;
        ASSERT_EQ("role reason", std::string("Requires manager role or higher"), e.reason());
    }
    ASSERT_TRUE("junior role rejected", thrown);

    bool senior_ok = true;
    try {
        guard.require_role(make_ctx(Role::Executive, "eve"), Role::Manager);
        guard.require_role(make_ctx(Role::Manager, "mike"), Role::Manager);
    } catch (const PermissionDenied&) {
        senior_ok = false;
    }
    ASSERT_TRUE("equal or higher role accepted", senior_ok);

    auto sink = std::make_shared<RecordingSink>();
    RbacGuard audited(make_default_policy_engine(), sink);
    try {
        audited.require_role(make_ctx(Role::NewHire, "nina"), Role::Leadership);
    } catch (const PermissionDenied&) {
    }
    ASSERT_EQ("role denial audited", 1, sink->denied);
}

void test_knowledge_scope() {
    std::cout << "\n[KnowledgeScope]\n";
    RbacGuard guard(make_default_policy_engine());

    auto exec = guard.knowledge_scope(make_ctx(Role::Executive, "eve"));
    ASSERT_TRUE("executive sees everything",
                exec.allowed_nodes == std::vector<std::string>{ "*" } && exec.filters.empty());
    ASSERT_EQ("executive depth", 10, exec.max_depth);

    auto lead = guard.knowledge_scope(make_ctx(Role::Leadership, "lee"));
    ASSERT_EQ("leadership nodes", std::size_t{2}, lead.allowed_nodes.size());
    ASSERT_EQ("leadership department filter", std::string("engineering"),
              get_string(lead.filters, "department_id").value_or(""));

    auto ic = guard.knowledge_scope(make_ctx(Role::Contributor, "alice"));
    ASSERT_EQ("contributor node", std::string("team:platform"), ic.allowed_nodes.at(0));
    ASSERT_EQ("contributor depth", 5, ic.max_depth);

    auto hire = guard.knowledge_scope(make_ctx(Role::NewHire, "nina"));
    ASSERT_EQ("new hire depth", 2, hire.max_depth);
    ASSERT_TRUE("new hire onboarding filter",
                get_bool(hire.filters, "onboarding_visible").value_or(false));
    ASSERT_EQ("new hire team filter", std::string("platform"),
              get_string(hire.filters, "team_id").value_or(""));
}

void test_mcp_tool_permissions() {
    std::cout << "\n[McpToolPermissions]\n";
    RbacGuard guard(make_default_policy_engine());

    auto ic = guard.mcp_tool_permissions(make_ctx(Role::Contributor, "alice"));
    ASSERT_TRUE("contributor jira allowed", ic.at("jira").allowed);
    ASSERT_EQ("contributor jira scoped to self", std::string("alice"),
              get_string(ic.at("jira").scope, "owner_id").value_or(""));
    ASSERT_TRUE("contributor slack denied", !ic.at("slack").allowed);
    ASSERT_EQ("denied level", AccessLevel::None, ic.at("slack").level);

    auto mgr = guard.mcp_tool_permissions(make_ctx(Role::Manager, "mike"));
    ASSERT_TRUE("manager slack allowed", mgr.at("slack").allowed);
    ASSERT_EQ("manager level", AccessLevel::Read, mgr.at("github").level);
    ASSERT_EQ("manager jira scoped to team", std::string("platform"),
              get_string(mgr.at("jira").scope, "team_id").value_or(""));

    auto hire = guard.mcp_tool_permissions(make_ctx(Role::NewHire, "nina"));
    ASSERT_TRUE("new hire has no tools",
                !hire.at("jira").allowed && !hire.at("github").allowed && !hire.at("slack").allowed);

    auto json = to_json(mgr);
    ASSERT_TRUE("tool json", json.find("\"slack\": { \"allowed\": true") != std::string::npos);
}

void test_dashboard_config() {
    std::cout << "\n[DashboardConfig]\n";
    RbacGuard guard(make_default_policy_engine());

    auto hire = guard.dashboard_config(make_ctx(Role::NewHire, "nina"));
    ASSERT_EQ("new hire refresh", 300, hire.refresh_interval_seconds);
    ASSERT_EQ("new hire first widget", std::string("onboarding_progress"), hire.widgets.at(0));

    auto mgr = guard.dashboard_config(make_ctx(Role::Manager, "mike"));
    ASSERT_EQ("manager refresh", 60, mgr.refresh_interval_seconds);
    ASSERT_EQ("manager data scope", std::string("platform"), mgr.data_scope.at("team_id"));

    auto exec = guard.dashboard_config(make_ctx(Role::Executive, "eve"));
    ASSERT_EQ("executive level", std::string("company"), exec.data_scope.at("level"));
}

void test_can_view_employee_data() {
    std::cout << "\n[CanViewEmployeeData]\n";
    RbacGuard guard(make_default_policy_engine());

    auto alice = make_ctx(Role::Contributor, "alice");
    ASSERT_TRUE("self",             guard.can_view_employee_data(alice, "alice", "ml"));
    ASSERT_TRUE("same team",        guard.can_view_employee_data(alice, "bob", "platform"));
    ASSERT_TRUE("other team denied", !guard.can_view_employee_data(alice, "carl", "ml"));

    auto mike = make_ctx(Role::Manager, "mike");
    mike.direct_reports = { "dana" };
    ASSERT_TRUE("manager of target", guard.can_view_employee_data(mike, "dana", "ml"));
    ASSERT_TRUE("manager other team denied", !guard.can_view_employee_data(mike, "carl", "ml"));

    auto lee = make_ctx(Role::Leadership, "lee");
    ASSERT_TRUE("leadership within own department",
                guard.can_view_employee_data(lee, "carl", "ml", "engineering"));
    ASSERT_TRUE("leadership other department denied",
                !guard.can_view_employee_data(lee, "sam", "deals", "sales"));
    ASSERT_TRUE("leadership without target department denied",
                !guard.can_view_employee_data(lee, "carl", "ml"));
    ASSERT_TRUE("executive", guard.can_view_employee_data(make_ctx(Role::Executive, "eve"), "carl", "ml"));
}

void test_audit_sink_and_handlers() {
    std::cout << "\n[AuditSinkAndHandlers]\n";
    auto sink = std::make_shared<RecordingSink>();
    RbacGuard guard(make_default_policy_engine(), sink);

    int observed = 0;
    guard.add_audit_handler([](const AccessDecision&, const UserContext&) {
        throw std::runtime_error("handler offline");
    });
    guard.add_audit_handler([&observed](const AccessDecision&, const UserContext&) { ++observed; });

    auto alice = make_ctx(Role::Contributor, "alice");
    auto d = guard.check_access(alice, ResourceType::Chat, AccessLevel::Write);
    guard.check_access(alice, ResourceType::MemoryOrg);

    ASSERT_TRUE("decision unaffected by failing handler", d.allowed);
    ASSERT_EQ("sink saw every decision", 2, sink->count);
    ASSERT_EQ("sink saw the denial", 1, sink->denied);
    ASSERT_EQ("later handler still called", 2, observed);

    guard.add_audit_handler([](const AccessDecision&, const UserContext&) { throw 42; });
    bool escaped = false;
    AccessDecision after;
    try {
        after = guard.check_access(alice, ResourceType::Chat, AccessLevel::Write);
        guard.mcp_tool_permissions(alice);
    } catch (...) {
        escaped = true;
    }
    ASSERT_TRUE("non-standard handler exception contained", !escaped);
    ASSERT_TRUE("decision still returned", after.allowed);
    ASSERT_EQ("earlier handlers still called", 6, observed);
}

void test_throwing_sink_contained() {
    std::cout << "\n[ThrowingSinkContained]\n";
    RbacGuard guard(make_default_policy_engine(), std::make_shared<ThrowingSink>());

    bool escaped = false;
    try {
        guard.filter_chat_response(make_ctx(Role::Contributor, "alice"), "hello");
    } catch (...) {
        escaped = true;
    }
    ASSERT_TRUE("sink failure never reaches the caller", !escaped);
}

void test_guard_requires_engine() {
    std::cout << "\n[GuardRequiresEngine]\n";
    bool thrown = false;
    try {
        RbacGuard guard(nullptr);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    ASSERT_TRUE("null engine rejected", thrown);
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Guard Tests ===\n";

    test_chat_response_filtering();
    test_chat_redaction_by_role();
    test_chat_filtering_idempotent();
    test_unowned_personal_source_denied();
    test_source_type_mapping();
    test_require_access();
    test_require_role();
    test_knowledge_scope();
    test_mcp_tool_permissions();
    test_dashboard_config();
    test_can_view_employee_data();
    test_audit_sink_and_handlers();
    test_throwing_sink_contained();
    test_guard_requires_engine();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
