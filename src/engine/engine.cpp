#include "qapp/engine.hpp"
#include "qapp/deployer.hpp"
#include "qapp/platform.hpp"
#include "qapp/preprocess.hpp"

#include <spdlog/spdlog.h>

namespace qapp {

namespace {

struct RenderedUnit {
    const UnitSource* source;
    std::string text;
};

Result<std::string> render_source(const TemplateRenderer& renderer,
                                  const std::string& path,
                                  const VariableMap& variables) {
    auto content = read_file(path);
    if (!content) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, "cannot read " + path));
    }
    return renderer.render(*content, variables, path);
}

std::string success_message(DesiredState state, bool changed) {
    if (!changed) return "application already up to date";
    switch (state) {
        case DesiredState::Installed: return "unit files deployed";
        case DesiredState::Started: return "unit files deployed and service started";
        case DesiredState::Restarted: return "unit files deployed and service restarted";
    }
    return "unit files deployed";
}

} // namespace

std::unique_ptr<Engine> Engine::create(EngineConfig config) {
    SystemctlOptions options;
    options.systemctl = config.systemctl;
    options.generator = config.generator;
    options.timeout = config.timeout;
    options.user_mode = config.user_mode;

    auto supervisor = std::make_unique<SystemctlSupervisor>(options);
    return create(std::move(config), std::move(supervisor));
}

std::unique_ptr<Engine> Engine::create(EngineConfig config,
                                       std::unique_ptr<Supervisor> supervisor,
                                       std::unique_ptr<TemplateRenderer> renderer) {
    if (!renderer) {
        renderer = std::make_unique<PlaceholderRenderer>();
    }
    return std::unique_ptr<Engine>(
        new Engine(std::move(config), std::move(supervisor), std::move(renderer)));
}

Engine::Engine(EngineConfig config,
               std::unique_ptr<Supervisor> supervisor,
               std::unique_ptr<TemplateRenderer> renderer)
    : config_(std::move(config)),
      supervisor_(std::move(supervisor)),
      renderer_(std::move(renderer)) {}

Result<DeploymentPlan> Engine::buildPlan(const AppLayout& layout,
                                         const VariableMap& variables) const {
    DeploymentPlan plan;
    plan.layout = layout;
    plan.main_service = service_name(layout.name, MAIN_UNIT);

    VariableMap scope = variables;
    scope[APP_NAME_VARIABLE] = layout.name;

    // Render everything before preprocessing anything
    std::vector<RenderedUnit> rendered_units;
    for (const auto& unit : layout.units) {
        auto text = render_source(*renderer_, unit.path, scope);
        if (text.isErr()) {
            return Result<DeploymentPlan>::err(text.error());
        }
        rendered_units.push_back({&unit, text.value()});
    }

    std::vector<PlannedFile> aux_files;
    for (const auto& aux : layout.auxiliary) {
        auto text = render_source(*renderer_, aux.path, scope);
        if (text.isErr()) {
            return Result<DeploymentPlan>::err(text.error());
        }

        PlannedFile file;
        file.path = auxiliary_target_path(config_.base_path, layout.name,
                                          aux.category, aux.unit, aux.rel_path);
        file.content = text.value();
        file.category = aux.category == AuxiliaryCategory::Init ? FileCategory::Init
                                                                : FileCategory::Config;
        file.unit = aux.unit;
        aux_files.push_back(file);
    }

    PreprocessContext ctx;
    ctx.app_name = layout.name;
    ctx.base_path = config_.base_path;
    ctx.unit_names = layout.unit_base_names();

    for (const auto& ru : rendered_units) {
        auto processed = preprocess_unit(ru.text, ru.source->kind, ru.source->base_name,
                                         ctx, ru.source->path);
        if (processed.isErr()) {
            return Result<DeploymentPlan>::err(processed.error());
        }

        PlannedFile file;
        file.path = unit_target_path(config_.units_root, layout.name, ru.source->filename);
        file.content = processed.value();
        file.category = FileCategory::Unit;
        file.unit = ru.source->base_name;
        plan.files.push_back(file);
        plan.unit_files.push_back(prefixed_name(layout.name, ru.source->filename));
    }

    plan.files.insert(plan.files.end(), aux_files.begin(), aux_files.end());
    return Result<DeploymentPlan>::ok(plan);
}

Result<DeploymentPlan> Engine::plan(const DeployRequest& request) const {
    auto layout = validate_layout(request.source_dir, request.name);
    if (layout.isErr()) {
        return Result<DeploymentPlan>::err(layout.error());
    }
    return buildPlan(layout.value(), request.variables);
}

Result<DeployReport> Engine::deploy(const DeployRequest& request) {
    auto layout = validate_layout(request.source_dir, request.name);
    if (layout.isErr()) {
        return Result<DeployReport>::err(layout.error());
    }
    const std::string& app_name = layout.value().name;

    std::string lock_error;
    auto lock = FileLock::acquire(lock_file_path(config_, app_name), lock_error);
    if (!lock) {
        return Result<DeployReport>::err(Error(ErrorCode::IO_ERROR, lock_error));
    }
    spdlog::debug("acquired lock {}", lock->path());

    auto plan = buildPlan(layout.value(), request.variables);
    if (plan.isErr()) {
        return Result<DeployReport>::err(plan.error());
    }

    std::string record_path = deployment_record_path(config_.state_dir, app_name);
    DeploymentRecord previous = load_deployment_record(record_path, app_name);

    auto diff = diff_files(plan.value().files, previous, request.force);
    if (diff.isErr()) {
        return Result<DeployReport>::err(diff.error());
    }

    DeployReport report;
    report.app_name = app_name;
    report.main_service = plan.value().main_service;
    report.unit_files = plan.value().unit_files;
    report.any_changed = diff.value().any_changed;

    if (report.any_changed) {
        auto outcome = deploy_files(app_name, plan.value().files, diff.value(),
                                    previous, record_path,
                                    join_path(config_.base_path, app_name));
        if (outcome.isErr()) {
            return Result<DeployReport>::err(outcome.error());
        }
        report.changed_files = outcome.value().written;
        report.removed_files = outcome.value().removed;
    } else {
        spdlog::info("{}: no file changes", app_name);
    }

    OrchestrationRequest orch;
    orch.app_name = app_name;
    orch.main_service = report.main_service;
    orch.state = request.state;
    orch.any_changed = report.any_changed;
    orch.validate_units = config_.validate_units;

    auto orchestrated = orchestrate(*supervisor_, orch);
    if (orchestrated.isErr()) {
        return Result<DeployReport>::err(orchestrated.error());
    }

    report.action = orchestrated.value().action;
    report.main_state = orchestrated.value().main_state;
    report.restart_order = orchestrated.value().restart_order;
    report.changed = report.any_changed || report.action != ServiceAction::None;
    report.message = success_message(request.state, report.changed);

    spdlog::info("{}: {}", app_name, report.message);
    return Result<DeployReport>::ok(report);
}

Result<AppStatus> Engine::status(const std::string& app_name) {
    std::string name = normalize_app_name(app_name);
    if (!is_valid_app_name(name)) {
        return Result<AppStatus>::err(Error(ErrorCode::LAYOUT_ERROR,
            "invalid application name: '" + name + "'"));
    }

    AppStatus status;
    status.app_name = name;
    status.main_service = service_name(name, MAIN_UNIT);

    std::string record_path = deployment_record_path(config_.state_dir, name);
    if (path_exists(record_path)) {
        status.record = load_deployment_record(record_path, name);
    }

    auto state = supervisor_->state(status.main_service);
    if (state.isErr()) {
        return Result<AppStatus>::err(state.error());
    }
    status.main_state = state.value();

    return Result<AppStatus>::ok(status);
}

} // namespace qapp
