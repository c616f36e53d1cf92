#pragma once

#include <optional>
#include <string>

namespace rolegate {

struct Settings {
    std::string                environment = "development";   // development | staging | production
    std::string                log_level   = "info";
    std::optional<std::string> audit_log_path;

    bool is_production() const { return environment == "production"; }
};

/// Defaults overlaid with ROLEGATE_ENV, ROLEGATE_LOG_LEVEL and ROLEGATE_AUDIT_LOG.
Settings settings_from_environment();

/// Throws ConfigurationError on an unknown environment or log level.
void validate(const Settings& settings);

/**
 * Installs the default spdlog logger: a colour sink on stderr and, when an
 * audit log path is set, a file sink next to it.
 */
void configure_logging(const Settings& settings);

} // namespace rolegate
