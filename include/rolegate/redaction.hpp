#pragma once

#include "rolegate/types.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/regex.hpp>

#include <string>
#include <vector>

namespace rolegate {

struct RedactionRule {
    std::string name;
    std::string pattern;       // Perl syntax, matched case-insensitively
    std::string replacement;
};

/**
 * ContentRedactor
 *
 * Rewrites every match of its rules in free text. Replacements never match
 * their own rule, so applying a redactor twice yields the same text. A rule
 * that cannot finish matching withholds the whole text.
 */
class ContentRedactor {
public:
    /// Throws ConfigurationError when the pattern does not compile.
    void add_rule(RedactionRule rule);

    std::string apply(const std::string& text) const;

    std::size_t rule_count() const { return rules_.size(); }

private:
    struct CompiledRule {
        RedactionRule rule;
        boost::regex  regex;
    };

    std::vector<CompiledRule> rules_;
};

// ── Built-in rules ────────────────────────────────────────────────────────────

/// Salary, compensation, revenue and budget figures.
ContentRedactor default_content_redactor();

/// Key substrings treated as sensitive in structured records.
const std::vector<std::string>& default_sensitive_fields();

inline constexpr const char* kRedactedValue = "[REDACTED]";

/// Replaces the value of every sensitive key with kRedactedValue unless the
/// caller is Leadership or above. Nested records and arrays are walked at
/// every depth.
boost::property_tree::ptree filter_record_for_user(
    const UserContext& ctx,
    const boost::property_tree::ptree& record,
    const std::vector<std::string>& sensitive_fields = default_sensitive_fields());

} // namespace rolegate
