#include "qapp/orchestrator.hpp"
#include "qapp/dependency.hpp"

#include <spdlog/spdlog.h>

namespace qapp {

ServiceAction decide_service_action(DesiredState requested, bool any_changed, RunState main_state) {
    switch (requested) {
        case DesiredState::Installed:
            return ServiceAction::None;
        case DesiredState::Restarted:
            return ServiceAction::CascadeRestart;
        case DesiredState::Started:
            if (main_state != RunState::Active) return ServiceAction::StartMain;
            return any_changed ? ServiceAction::CascadeRestart : ServiceAction::None;
    }
    return ServiceAction::None;
}

Result<OrchestrationResult> orchestrate(Supervisor& supervisor, const OrchestrationRequest& request) {
    OrchestrationResult result;

    if (request.any_changed && request.validate_units) {
        auto valid = supervisor.validateUnits();
        if (valid.isErr()) {
            return Result<OrchestrationResult>::err(valid.error());
        }
        result.validated = true;
    }

    auto reloaded = supervisor.reload();
    if (reloaded.isErr()) {
        return Result<OrchestrationResult>::err(reloaded.error());
    }

    if (request.state == DesiredState::Started) {
        auto state = supervisor.state(request.main_service);
        if (state.isErr()) {
            return Result<OrchestrationResult>::err(state.error());
        }
        result.main_state = state.value();
    }

    result.action = decide_service_action(request.state, request.any_changed, result.main_state);
    spdlog::debug("{}: requested {}, changed={}, main {} -> action {}",
                  request.app_name, desired_state_to_string(request.state),
                  request.any_changed, run_state_to_string(result.main_state),
                  service_action_to_string(result.action));

    switch (result.action) {
        case ServiceAction::None:
            break;

        case ServiceAction::StartMain: {
            spdlog::info("starting {}", request.main_service);
            auto started = supervisor.start(request.main_service);
            if (started.isErr()) {
                return Result<OrchestrationResult>::err(started.error());
            }
            break;
        }

        case ServiceAction::CascadeRestart: {
            auto order = resolve_restart_order(supervisor, request.main_service, request.app_name);
            if (order.isErr()) {
                return Result<OrchestrationResult>::err(order.error());
            }
            for (const auto& service : order.value()) {
                spdlog::info("restarting {}", service);
                auto restarted = supervisor.restart(service);
                if (restarted.isErr()) {
                    return Result<OrchestrationResult>::err(restarted.error());
                }
                result.restart_order.push_back(service);
            }
            break;
        }
    }

    return Result<OrchestrationResult>::ok(result);
}

} // namespace qapp
