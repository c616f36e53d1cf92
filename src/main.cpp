#include "rolegate/audit.hpp"
#include "rolegate/bootstrap.hpp"
#include "rolegate/errors.hpp"
#include "rolegate/guard.hpp"
#include "rolegate/json.hpp"
#include "rolegate/policy_engine.hpp"
#include "rolegate/settings.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace rolegate;

namespace po = boost::program_options;

static StringList split_list(const std::string& value) {
    StringList items;
    std::string::size_type start = 0;
    while (start <= value.size()) {
        auto comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        if (comma > start) items.push_back(value.substr(start, comma - start));
        start = comma + 1;
    }
    return items;
}

// key=value; true/false become booleans, plain integers become numbers,
// values containing commas become string lists.
static void parse_attribute(const std::string& arg, ResourceAttributes& attrs) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw ConfigurationError("Attribute must be key=value: " + arg);
    }
    const std::string key   = arg.substr(0, eq);
    const std::string value = arg.substr(eq + 1);

    if (value == "true" || value == "false") {
        attrs[key] = (value == "true");
        return;
    }

    const bool numeric = !value.empty() &&
        std::all_of(value.begin() + (value[0] == '-' ? 1 : 0), value.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; }) &&
        value != "-";
    if (numeric) {
        attrs[key] = static_cast<std::int64_t>(std::stoll(value));
        return;
    }

    if (value.find(',') != std::string::npos) {
        attrs[key] = split_list(value);
        return;
    }

    attrs[key] = value;
}

int main(int argc, char* argv[]) {
    auto settings = settings_from_environment();

    std::string role_str;
    std::string user_id;
    std::string team_id;
    std::string department_id;
    std::string manager_id;
    std::string reports;
    std::string projects;
    std::string resource_str;
    std::string level_str;
    std::string audit_log;
    std::string demo_role;
    std::vector<std::string> attr_args;

    po::options_description description{"rolegate"};
    description.add_options()
        ("help,h", "Show the help message")
        ("role,r", po::value<std::string>(&role_str)->default_value("ic"),
         "Caller role (new_hire, ic, manager, director, executive, ...)")
        ("user,u", po::value<std::string>(&user_id)->default_value("cli-user"), "Caller user id")
        ("team,t", po::value<std::string>(&team_id), "Caller team id")
        ("department,d", po::value<std::string>(&department_id), "Caller department id")
        ("manager", po::value<std::string>(&manager_id), "Caller's manager user id")
        ("reports", po::value<std::string>(&reports), "Comma separated direct reports")
        ("projects", po::value<std::string>(&projects), "Comma separated project ids")
        ("resource", po::value<std::string>(&resource_str), "Resource type, e.g. knowledge_team")
        ("level,l", po::value<std::string>(&level_str)->default_value("read"),
         "Required access level (none, read, write, admin)")
        ("attr,a", po::value<std::vector<std::string>>(&attr_args)->composing(),
         "Resource attribute key=value, repeatable")
        ("explain", "Print the evaluation trace instead of the bare decision")
        ("bootstrap", "Print the bootstrap payload for the caller")
        ("demo-role", po::value<std::string>(&demo_role), "Role override for bootstrap outside production")
        ("environment,e", po::value<std::string>(&settings.environment)->default_value(settings.environment),
         "development, staging or production")
        ("log-level", po::value<std::string>(&settings.log_level)->default_value(settings.log_level),
         "trace, debug, info, warn, error, critical or off")
        ("audit-log", po::value<std::string>(&audit_log), "Also write log records to this file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, description), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "rolegate: " << e.what() << "\n" << description << std::endl;
        return 2;
    }

    if (vm.count("help")) {
        std::cout << description << std::endl;
        return 0;
    }

    try {
        if (!audit_log.empty()) settings.audit_log_path = audit_log;
        configure_logging(settings);

        auto engine = make_default_policy_engine();
        auto audit  = std::make_shared<AuditLogger>();
        RbacGuard guard(engine, audit);

        if (vm.count("bootstrap")) {
            UserProfile profile;
            profile.id         = user_id;
            profile.role       = role_str;
            profile.team       = team_id;
            profile.department = department_id;

            std::optional<std::string> demo;
            if (!demo_role.empty()) demo = demo_role;

            std::cout << to_json(build_bootstrap(guard, *engine, profile, demo, settings)) << std::endl;
            spdlog::shutdown();
            return 0;
        }

        if (resource_str.empty()) {
            throw ConfigurationError("--resource is required unless --bootstrap is given");
        }
        auto resource = resource_from_string(resource_str);
        if (!resource) throw ConfigurationError("Unknown resource: " + resource_str);
        auto level = access_level_from_string(level_str);
        if (!level) throw ConfigurationError("Unknown access level: " + level_str);

        UserContext ctx;
        ctx.user_id       = user_id;
        ctx.role          = parse_role(role_str);
        ctx.team_id       = team_id;
        ctx.department_id = department_id;
        if (!manager_id.empty()) ctx.manager_id = manager_id;
        if (!reports.empty())    ctx.direct_reports = split_list(reports);
        if (!projects.empty())   ctx.project_ids    = split_list(projects);

        ResourceAttributes attrs;
        for (const auto& arg : attr_args) parse_attribute(arg, attrs);

        bool allowed = false;
        if (vm.count("explain")) {
            auto result = engine->explain(ctx, *resource, *level, attrs);
            allowed = result.decision.allowed;
            std::cout << to_json(result) << std::endl;
        } else {
            auto decision = guard.check_access(ctx, *resource, *level, attrs);
            allowed = decision.allowed;
            std::cout << to_json(decision) << std::endl;
        }

        spdlog::shutdown();
        return allowed ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "rolegate: " << e.what() << std::endl;
        spdlog::shutdown();
        return 2;
    }
}
