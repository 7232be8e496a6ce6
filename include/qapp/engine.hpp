#pragma once

#include "qapp/config.hpp"
#include "qapp/layout.hpp"
#include "qapp/ledger.hpp"
#include "qapp/orchestrator.hpp"
#include "qapp/supervisor.hpp"
#include "qapp/template.hpp"
#include "qapp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qapp {

// ============================================================================
// Requests and Reports
// ============================================================================

struct DeployRequest {
    std::string source_dir;
    std::string name;                  // empty: source directory base name
    DesiredState state = DesiredState::Installed;
    bool force = false;
    VariableMap variables;
};

// Everything a deployment would write, computed without touching the host
struct DeploymentPlan {
    AppLayout layout;
    std::string main_service;
    std::vector<std::string> unit_files;  // "{app}--{unit}.{suffix}", layout order
    std::vector<PlannedFile> files;       // units first, then init, then config
};

struct DeployReport {
    std::string app_name;
    std::string main_service;
    std::vector<std::string> unit_files;
    std::vector<std::string> changed_files;
    std::vector<std::string> removed_files;
    bool any_changed = false;
    bool changed = false;  // files or service state changed
    ServiceAction action = ServiceAction::None;
    RunState main_state = RunState::Unknown;
    std::vector<std::string> restart_order;
    std::string message;
};

struct AppStatus {
    std::string app_name;
    std::string main_service;
    std::optional<DeploymentRecord> record;
    RunState main_state = RunState::Unknown;
};

// ============================================================================
// Engine
// ============================================================================

/**
 * @brief Deployment pipeline for application directories
 *
 * Layout Validator -> Template Renderer -> Unit Preprocessor ->
 * Checksum Ledger -> File Deployer -> Dependency Resolver ->
 * Service Orchestrator.
 *
 * No host state is mutated before the File Deployer stage. A deploy holds
 * the per-application lock from name resolution until orchestration ends.
 */
class Engine {
public:
    /**
     * @brief Create an engine bound to systemd
     * @param config Resolved configuration (defaults already applied)
     */
    static std::unique_ptr<Engine> create(EngineConfig config);

    /**
     * @brief Create an engine with explicit collaborators
     * @param renderer Template renderer (PlaceholderRenderer when null)
     */
    static std::unique_ptr<Engine> create(EngineConfig config,
                                          std::unique_ptr<Supervisor> supervisor,
                                          std::unique_ptr<TemplateRenderer> renderer = nullptr);

    const EngineConfig& config() const { return config_; }

    /// Validate, render and preprocess without touching the host
    Result<DeploymentPlan> plan(const DeployRequest& request) const;

    /// Run the full pipeline
    Result<DeployReport> deploy(const DeployRequest& request);

    /// Deployment record and main service state of an application
    Result<AppStatus> status(const std::string& app_name);

private:
    Engine(EngineConfig config,
           std::unique_ptr<Supervisor> supervisor,
           std::unique_ptr<TemplateRenderer> renderer);

    Result<DeploymentPlan> buildPlan(const AppLayout& layout, const VariableMap& variables) const;

    EngineConfig config_;
    std::unique_ptr<Supervisor> supervisor_;
    std::unique_ptr<TemplateRenderer> renderer_;
};

} // namespace qapp
