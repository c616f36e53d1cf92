#include "rolegate/settings.hpp"
#include "rolegate/errors.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <vector>

namespace rolegate {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

} // namespace

Settings settings_from_environment() {
    Settings settings;
    if (auto v = env("ROLEGATE_ENV"))       settings.environment    = *v;
    if (auto v = env("ROLEGATE_LOG_LEVEL")) settings.log_level      = *v;
    if (auto v = env("ROLEGATE_AUDIT_LOG")) settings.audit_log_path = *v;
    return settings;
}

void validate(const Settings& settings) {
    if (settings.environment != "development" &&
        settings.environment != "staging" &&
        settings.environment != "production") {
        throw ConfigurationError("Unknown environment: " + settings.environment);
    }
    // spdlog maps unknown names to "off"; only accept "off" when asked for.
    if (settings.log_level != "off" &&
        spdlog::level::from_str(settings.log_level) == spdlog::level::off) {
        throw ConfigurationError("Unknown log level: " + settings.log_level);
    }
}

void configure_logging(const Settings& settings) {
    validate(settings);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (settings.audit_log_path) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            *settings.audit_log_path, false));
    }

    auto logger = std::make_shared<spdlog::logger>("rolegate", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(settings.log_level));
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
}

} // namespace rolegate
