/**
 * qapp CLI - deploy command
 *
 * Validate, render, preprocess and deploy an application directory, then
 * bring its services to the requested state.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace qapp::cli::commands {

namespace {

struct DeployOptions {
    std::string source;
    std::string name;
    std::string state = "installed";
    bool force = false;
    std::vector<std::string> vars;
    std::string vars_file;
    ConfigOverrides overrides;
};

int cmd_deploy(const GlobalOptions& opts, const DeployOptions& deploy_opts) {
    auto state = parse_desired_state(deploy_opts.state);
    if (!state) {
        return report_error(Error(ErrorCode::CONFIG_ERROR,
            "invalid state '" + deploy_opts.state + "' (expected installed, started or restarted)"),
            opts.json);
    }

    auto config = resolve_engine_config(opts, deploy_opts.overrides);
    if (config.isErr()) {
        return report_error(config.error(), opts.json);
    }

    auto vars = collect_variables(deploy_opts.vars_file, deploy_opts.vars);
    if (vars.isErr()) {
        return report_error(vars.error(), opts.json);
    }

    DeployRequest request;
    request.source_dir = deploy_opts.source;
    request.name = deploy_opts.name;
    request.state = *state;
    request.force = deploy_opts.force;
    request.variables = vars.value();

    auto engine = Engine::create(config.value());
    auto report = engine->deploy(request);
    if (report.isErr()) {
        return report_error(report.error(), opts.json);
    }

    const auto& r = report.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["changed"] = r.changed;
        j["application_name"] = r.app_name;
        j["service_name"] = r.main_service;
        j["unit_files"] = r.unit_files;
        j["changed_files"] = r.changed_files;
        j["removed_files"] = r.removed_files;
        j["action"] = service_action_to_string(r.action);
        j["restart_order"] = r.restart_order;
        j["msg"] = r.message;
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << r.app_name << ": " << r.message << std::endl;
        std::cout << "  service: " << r.main_service << std::endl;
        for (const auto& unit : r.unit_files) {
            std::cout << "  unit:    " << unit << std::endl;
        }
        for (const auto& path : r.changed_files) {
            std::cout << "  wrote:   " << path << std::endl;
        }
        for (const auto& path : r.removed_files) {
            std::cout << "  removed: " << path << std::endl;
        }
        if (r.action != ServiceAction::None) {
            std::cout << "  action:  " << service_action_to_string(r.action) << std::endl;
        }
        for (const auto& service : r.restart_order) {
            std::cout << "  restarted: " << service << std::endl;
        }
    }

    return 0;
}

} // anonymous namespace

void setup_deploy(CLI::App* app, GlobalOptions& opts) {
    static DeployOptions deploy_opts;

    app->add_option("source", deploy_opts.source, "Application directory")->required();
    app->add_option("--name", deploy_opts.name, "Application name (default: directory name)");
    app->add_option("--state", deploy_opts.state, "installed, started or restarted")
        ->capture_default_str();
    app->add_flag("--force", deploy_opts.force, "Rewrite every file");
    app->add_option("--timeout", deploy_opts.overrides.timeout, "Supervisor call timeout in seconds")
        ->check(CLI::PositiveNumber);
    app->add_option("--var", deploy_opts.vars, "Template variable key=value (repeatable)");
    app->add_option("--vars-file", deploy_opts.vars_file, "JSON file of template variables");
    app->add_option("--units-root", deploy_opts.overrides.units_root, "Unit file directory");
    app->add_option("--base-path", deploy_opts.overrides.base_path, "Auxiliary file root");
    app->add_option("--state-dir", deploy_opts.overrides.state_dir, "Record and lock directory");
    app->add_flag("--no-validate", deploy_opts.overrides.no_validate, "Skip unit generator dry-run");

    app->callback([&opts]() {
        std::exit(cmd_deploy(opts, deploy_opts));
    });
}

} // namespace qapp::cli::commands
