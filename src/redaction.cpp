#include "rolegate/redaction.hpp"
#include "rolegate/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rolegate {

namespace {

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_sensitive_key(const std::string& key, const std::vector<std::string>& fields) {
    const std::string key_lower = lower(key);
    for (const auto& field : fields) {
        if (key_lower.find(field) != std::string::npos) return true;
    }
    return false;
}

boost::property_tree::ptree filter_tree(const boost::property_tree::ptree& tree,
                                        const std::vector<std::string>& fields) {
    boost::property_tree::ptree filtered;
    filtered.data() = tree.data();

    for (const auto& child : tree) {
        const std::string& key = child.first;
        if (!key.empty() && is_sensitive_key(key, fields)) {
            filtered.push_back({ key, boost::property_tree::ptree(kRedactedValue) });
        } else if (!child.second.empty()) {
            filtered.push_back({ key, filter_tree(child.second, fields) });
        } else {
            filtered.push_back(child);
        }
    }
    return filtered;
}

} // namespace

// ── ContentRedactor ───────────────────────────────────────────────────────────

void ContentRedactor::add_rule(RedactionRule rule) {
    try {
        boost::regex regex(rule.pattern, boost::regex::perl | boost::regex::icase);
        rules_.push_back({ std::move(rule), std::move(regex) });
    } catch (const boost::regex_error& e) {
        throw ConfigurationError("redaction rule '" + rule.name + "' has an invalid pattern: "
                                 + e.what());
    }
}

std::string ContentRedactor::apply(const std::string& text) const {
    std::string result = text;
    for (const auto& compiled : rules_) {
        try {
            result = boost::regex_replace(result, compiled.regex, compiled.rule.replacement);
        } catch (const std::runtime_error& e) {
            spdlog::error("redaction: rule {} failed length={} error={}",
                          compiled.rule.name, text.size(), e.what());
            return compiled.rule.replacement;
        }
    }
    return result;
}

// ── Built-in rules ────────────────────────────────────────────────────────────

ContentRedactor default_content_redactor() {
    ContentRedactor redactor;

    redactor.add_rule({
        "Salary",
        R"(salary[:\s]+\$[\d,]+)",
        "[SALARY REDACTED]"
    });

    redactor.add_rule({
        "Compensation",
        R"(compensation[:\s]+\$[\d,]+)",
        "[COMPENSATION REDACTED]"
    });

    redactor.add_rule({
        "Revenue",
        R"(revenue[:\s]+\$[\d,]+[BMK]?)",
        "[REVENUE REDACTED]"
    });

    redactor.add_rule({
        "Budget",
        R"(budget[:\s]+\$[\d,]+[BMK]?)",
        "[BUDGET REDACTED]"
    });

    return redactor;
}

const std::vector<std::string>& default_sensitive_fields() {
    static const std::vector<std::string> fields = {
        "salary",
        "compensation",
        "ssn",
        "social_security",
        "bank_account",
        "personal_email",
        "home_address",
        "phone_number",
    };
    return fields;
}

boost::property_tree::ptree filter_record_for_user(
    const UserContext& ctx,
    const boost::property_tree::ptree& record,
    const std::vector<std::string>& sensitive_fields) {
    if (outranks_or_equals(ctx.role, Role::Leadership)) return record;
    return filter_tree(record, sensitive_fields);
}

} // namespace rolegate
