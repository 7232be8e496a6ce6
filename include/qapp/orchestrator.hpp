#pragma once

#include "qapp/supervisor.hpp"
#include "qapp/types.hpp"

#include <string>
#include <vector>

namespace qapp {

// ============================================================================
// Service Orchestration
// ============================================================================

enum class ServiceAction {
    None,            // reload only
    StartMain,
    CascadeRestart,  // dependencies in order, then main
};

inline const char* service_action_to_string(ServiceAction a) {
    switch (a) {
        case ServiceAction::None: return "none";
        case ServiceAction::StartMain: return "start";
        case ServiceAction::CascadeRestart: return "restart";
    }
    return "none";
}

// The transition table. Unknown run state behaves as inactive.
ServiceAction decide_service_action(DesiredState requested, bool any_changed, RunState main_state);

struct OrchestrationRequest {
    std::string app_name;
    std::string main_service;
    DesiredState state = DesiredState::Installed;
    bool any_changed = false;
    bool validate_units = true;
};

struct OrchestrationResult {
    ServiceAction action = ServiceAction::None;
    RunState main_state = RunState::Unknown;  // before any transition
    bool validated = false;
    std::vector<std::string> restart_order;   // services restarted, in order
};

/**
 * Bring the supervisor in line with the requested state.
 *
 * Validates the generated units (when something changed and validation is
 * enabled), reloads, then starts or cascade-restarts as the transition table
 * requires. The restart order is fully resolved before the first restart,
 * so a dependency cycle performs no restarts.
 */
Result<OrchestrationResult> orchestrate(Supervisor& supervisor, const OrchestrationRequest& request);

} // namespace qapp
