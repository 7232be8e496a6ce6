/**
 * qapp CLI - status command
 *
 * Show the deployment record of an application and its main service state.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace qapp::cli::commands {

namespace {

struct StatusOptions {
    std::string name;
    ConfigOverrides overrides;
};

int cmd_status(const GlobalOptions& opts, const StatusOptions& status_opts) {
    auto config = resolve_engine_config(opts, status_opts.overrides);
    if (config.isErr()) {
        return report_error(config.error(), opts.json);
    }

    auto engine = Engine::create(config.value());
    auto status = engine->status(status_opts.name);
    if (status.isErr()) {
        return report_error(status.error(), opts.json);
    }

    const auto& s = status.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["application_name"] = s.app_name;
        j["service_name"] = s.main_service;
        j["service_state"] = run_state_to_string(s.main_state);
        j["deployed"] = s.record.has_value();
        if (s.record) {
            j["deployed_at"] = s.record->deployed_at;
            j["files"] = nlohmann::json::object();
            for (const auto& [path, entry] : s.record->files) {
                j["files"][path] = {
                    {"digest", entry.digest},
                    {"modified_at", entry.modified_at},
                };
            }
        }
        output_json(j);
    } else {
        std::cout << s.app_name << std::endl;
        std::cout << "  service: " << s.main_service << " ("
                  << run_state_to_string(s.main_state) << ")" << std::endl;
        if (!s.record) {
            std::cout << "  not deployed" << std::endl;
        } else {
            std::cout << "  deployed: " << s.record->deployed_at << std::endl;
            for (const auto& [path, entry] : s.record->files) {
                std::cout << "  " << entry.digest.substr(0, 12) << "  " << path << std::endl;
            }
        }
    }

    return 0;
}

} // anonymous namespace

void setup_status(CLI::App* app, GlobalOptions& opts) {
    static StatusOptions status_opts;

    app->add_option("name", status_opts.name, "Application name")->required();
    app->add_option("--state-dir", status_opts.overrides.state_dir, "Record and lock directory");

    app->callback([&opts]() {
        std::exit(cmd_status(opts, status_opts));
    });
}

} // namespace qapp::cli::commands
