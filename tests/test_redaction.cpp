#include "rolegate/errors.hpp"
#include "rolegate/redaction.hpp"

#include <boost/property_tree/ptree.hpp>

#include <iostream>
#include <string>

using namespace rolegate;

namespace pt = boost::property_tree;

// ── Helpers ──────────────────────────────────────────────────────────────────

static UserContext make_ctx(Role role) {
    UserContext ctx;
    ctx.user_id = "u1";
    ctx.role    = role;
    ctx.team_id = "platform";
    return ctx;
}

static pt::ptree make_employee_record() {
    pt::ptree record;
    record.put("name", "Dana Smith");
    record.put("title", "Staff Engineer");
    record.put("base_salary", "185000");
    record.put("contact.Personal_Email", "dana@home.example");
    record.put("contact.work_email", "dana@corp.example");
    record.put("contact.phone_number", "555-0100");

    pt::ptree history;
    for (const char* year : { "2023", "2024" }) {
        pt::ptree entry;
        entry.put("year", year);
        entry.put("compensation", "170000");
        history.push_back({ "", entry });
    }
    record.add_child("history", history);
    return record;
}

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

void test_default_content_rules() {
    std::cout << "\n[DefaultContentRules]\n";
    auto redactor = default_content_redactor();
    ASSERT_EQ("four built-in rules", std::size_t{4}, redactor.rule_count());

    ASSERT_EQ("salary",  std::string("Offer: [SALARY REDACTED] plus equity"),
              redactor.apply("Offer: Salary: $150,000 plus equity"));
    ASSERT_EQ("budget with suffix", std::string("[BUDGET REDACTED] for Q3"),
              redactor.apply("BUDGET $2M for Q3"));
    ASSERT_EQ("text without figures untouched", std::string("salary bands are reviewed yearly"),
              redactor.apply("salary bands are reviewed yearly"));
}

void test_redaction_idempotent() {
    std::cout << "\n[RedactionIdempotent]\n";
    auto redactor = default_content_redactor();
    const std::string once = redactor.apply("revenue: $4,000,000 and compensation $120,000");
    ASSERT_EQ("second pass changes nothing", once, redactor.apply(once));
}

void test_custom_rules() {
    std::cout << "\n[CustomRules]\n";
    ContentRedactor redactor;
    redactor.add_rule({ "Ticket", R"(SEC-\d+)", "[TICKET]" });
    ASSERT_EQ("custom rule applied", std::string("see [TICKET] and [TICKET]"),
              redactor.apply("see sec-12 and SEC-7"));

    bool thrown = false;
    try {
        redactor.add_rule({ "Broken", "(unclosed", "x" });
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    ASSERT_TRUE("invalid pattern rejected", thrown);
    ASSERT_EQ("broken rule not added", std::size_t{1}, redactor.rule_count());
}

void test_record_redacted_for_contributor() {
    std::cout << "\n[RecordRedactedForContributor]\n";
    auto out = filter_record_for_user(make_ctx(Role::Contributor), make_employee_record());

    ASSERT_EQ("name kept",            std::string("Dana Smith"), out.get<std::string>("name"));
    ASSERT_EQ("salary key redacted",  std::string(kRedactedValue), out.get<std::string>("base_salary"));
    ASSERT_EQ("case-insensitive key", std::string(kRedactedValue),
              out.get<std::string>("contact.Personal_Email"));
    ASSERT_EQ("work email kept",      std::string("dana@corp.example"),
              out.get<std::string>("contact.work_email"));
    ASSERT_EQ("phone redacted",       std::string(kRedactedValue),
              out.get<std::string>("contact.phone_number"));

    int redacted_entries = 0;
    for (const auto& entry : out.get_child("history")) {
        if (entry.second.get<std::string>("compensation") == kRedactedValue) ++redacted_entries;
    }
    ASSERT_EQ("array entries redacted", 2, redacted_entries);
}

void test_record_visible_to_leadership() {
    std::cout << "\n[RecordVisibleToLeadership]\n";
    auto record = make_employee_record();
    auto lead = filter_record_for_user(make_ctx(Role::Leadership), record);
    auto exec = filter_record_for_user(make_ctx(Role::Executive), record);
    ASSERT_TRUE("leadership record unchanged", lead == record);
    ASSERT_TRUE("executive record unchanged", exec == record);
}

void test_deeply_nested_fields_redacted() {
    std::cout << "\n[DeeplyNestedFieldsRedacted]\n";
    pt::ptree record;
    std::string path;
    for (int i = 0; i < 40; ++i) {
        path += "n" + std::to_string(i) + ".";
        record.put(path + "salary", std::to_string(1000 + i));
    }

    auto out = filter_record_for_user(make_ctx(Role::NewHire), record);
    bool leaked = false;
    std::string check_path;
    for (int i = 0; i < 40; ++i) {
        check_path += "n" + std::to_string(i) + ".";
        if (out.get<std::string>(check_path + "salary") != kRedactedValue) leaked = true;
    }
    ASSERT_TRUE("no sensitive value at any depth", !leaked);
    ASSERT_EQ("deepest value redacted", std::string(kRedactedValue),
              out.get<std::string>(path + "salary"));
}

void test_long_figures_redacted() {
    std::cout << "\n[LongFiguresRedacted]\n";
    auto redactor = default_content_redactor();

    ASSERT_EQ("long run of digits", std::string("[SALARY REDACTED]"),
              redactor.apply("salary: $" + std::string(200000, '1')));
    ASSERT_EQ("long run of separators", std::string("[BUDGET REDACTED] left"),
              redactor.apply("budget" + std::string(100000, ' ') + "$9,000 left"));
}

void test_custom_field_list() {
    std::cout << "\n[CustomFieldList]\n";
    pt::ptree record;
    record.put("age", "41");
    record.put("salary", "100");

    auto out = filter_record_for_user(make_ctx(Role::Manager), record, { "age" });
    ASSERT_EQ("listed field redacted", std::string(kRedactedValue), out.get<std::string>("age"));
    ASSERT_EQ("unlisted field kept", std::string("100"), out.get<std::string>("salary"));
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Redaction Tests ===\n";

    test_default_content_rules();
    test_redaction_idempotent();
    test_custom_rules();
    test_record_redacted_for_contributor();
    test_record_visible_to_leadership();
    test_deeply_nested_fields_redacted();
    test_long_figures_redacted();
    test_custom_field_list();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
