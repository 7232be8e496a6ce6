/**
 * qapp CLI - render command
 *
 * Print every file a deploy would write, without touching the host.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace qapp::cli::commands {

namespace {

struct RenderOptions {
    std::string source;
    std::string name;
    std::vector<std::string> vars;
    std::string vars_file;
    ConfigOverrides overrides;
};

int cmd_render(const GlobalOptions& opts, const RenderOptions& render_opts) {
    auto config = resolve_engine_config(opts, render_opts.overrides);
    if (config.isErr()) {
        return report_error(config.error(), opts.json);
    }

    auto vars = collect_variables(render_opts.vars_file, render_opts.vars);
    if (vars.isErr()) {
        return report_error(vars.error(), opts.json);
    }

    DeployRequest request;
    request.source_dir = render_opts.source;
    request.name = render_opts.name;
    request.variables = vars.value();

    auto engine = Engine::create(config.value());
    auto plan = engine->plan(request);
    if (plan.isErr()) {
        return report_error(plan.error(), opts.json);
    }

    const auto& p = plan.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["application_name"] = p.layout.name;
        j["service_name"] = p.main_service;
        j["unit_files"] = p.unit_files;
        j["files"] = nlohmann::json::array();
        for (const auto& file : p.files) {
            j["files"].push_back({
                {"path", file.path},
                {"category", file_category_to_string(file.category)},
                {"unit", file.unit},
                {"content", file.content},
            });
        }
        output_json(j);
    } else {
        for (const auto& file : p.files) {
            std::cout << "# " << file.path << std::endl;
            std::cout << file.content;
            if (!file.content.empty() && file.content.back() != '\n') {
                std::cout << std::endl;
            }
            std::cout << std::endl;
        }
    }

    return 0;
}

} // anonymous namespace

void setup_render(CLI::App* app, GlobalOptions& opts) {
    static RenderOptions render_opts;

    app->add_option("source", render_opts.source, "Application directory")->required();
    app->add_option("--name", render_opts.name, "Application name (default: directory name)");
    app->add_option("--var", render_opts.vars, "Template variable key=value (repeatable)");
    app->add_option("--vars-file", render_opts.vars_file, "JSON file of template variables");
    app->add_option("--units-root", render_opts.overrides.units_root, "Unit file directory");
    app->add_option("--base-path", render_opts.overrides.base_path, "Auxiliary file root");

    app->callback([&opts]() {
        std::exit(cmd_render(opts, render_opts));
    });
}

} // namespace qapp::cli::commands
