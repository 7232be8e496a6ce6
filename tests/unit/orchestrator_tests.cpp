#include <doctest/doctest.h>
#include <qapp/orchestrator.hpp>

#include "test_helpers.hpp"

using namespace qapp;
using qapp::test::RecordingSupervisor;

namespace {

const char* MAIN = "app--main.service";

OrchestrationRequest request(DesiredState state, bool changed) {
    OrchestrationRequest req;
    req.app_name = "app";
    req.main_service = MAIN;
    req.state = state;
    req.any_changed = changed;
    return req;
}

} // namespace

// ============================================================================
// Transition Table
// ============================================================================

TEST_CASE("installed never touches services") {
    for (bool changed : {false, true}) {
        for (auto st : {RunState::Active, RunState::Inactive, RunState::Unknown}) {
            CHECK(decide_service_action(DesiredState::Installed, changed, st) == ServiceAction::None);
        }
    }
}

TEST_CASE("restarted always cascades") {
    for (bool changed : {false, true}) {
        for (auto st : {RunState::Active, RunState::Inactive, RunState::Unknown}) {
            CHECK(decide_service_action(DesiredState::Restarted, changed, st) ==
                  ServiceAction::CascadeRestart);
        }
    }
}

TEST_CASE("started depends on run state and change") {
    CHECK(decide_service_action(DesiredState::Started, false, RunState::Inactive) == ServiceAction::StartMain);
    CHECK(decide_service_action(DesiredState::Started, true, RunState::Inactive) == ServiceAction::StartMain);
    CHECK(decide_service_action(DesiredState::Started, true, RunState::Unknown) == ServiceAction::StartMain);
    CHECK(decide_service_action(DesiredState::Started, true, RunState::Active) == ServiceAction::CascadeRestart);
    CHECK(decide_service_action(DesiredState::Started, false, RunState::Active) == ServiceAction::None);
}

// ============================================================================
// Orchestration
// ============================================================================

TEST_CASE("installed reloads only") {
    RecordingSupervisor sup;
    auto r = orchestrate(sup, request(DesiredState::Installed, true));
    REQUIRE(r.isOk());
    CHECK(r.value().action == ServiceAction::None);
    CHECK(sup.calls == std::vector<std::string>{"validate", "daemon-reload"});
}

TEST_CASE("reload happens even when nothing changed") {
    RecordingSupervisor sup;
    sup.states[MAIN] = RunState::Active;
    auto r = orchestrate(sup, request(DesiredState::Started, false));
    REQUIRE(r.isOk());
    CHECK(r.value().action == ServiceAction::None);
    CHECK_FALSE(r.value().validated);
    CHECK(sup.calls == std::vector<std::string>{"daemon-reload", "is-active app--main.service"});
}

TEST_CASE("inactive main is started without a cascade") {
    RecordingSupervisor sup;
    sup.deps[MAIN] = {"app--db.service"};

    auto r = orchestrate(sup, request(DesiredState::Started, true));
    REQUIRE(r.isOk());
    CHECK(r.value().action == ServiceAction::StartMain);
    CHECK(r.value().main_state == RunState::Inactive);
    CHECK(sup.transitions() == std::vector<std::string>{"start app--main.service"});
}

TEST_CASE("changed and active cascades dependencies first") {
    RecordingSupervisor sup;
    sup.states[MAIN] = RunState::Active;
    sup.deps[MAIN] = {"app--cache.service", "app--db.service"};

    auto r = orchestrate(sup, request(DesiredState::Started, true));
    REQUIRE(r.isOk());
    CHECK(r.value().action == ServiceAction::CascadeRestart);
    CHECK(sup.transitions() == std::vector<std::string>{
        "restart app--db.service", "restart app--cache.service", "restart app--main.service"});
    CHECK(r.value().restart_order.size() == 3);
}

TEST_CASE("restarted cascades without querying state") {
    RecordingSupervisor sup;
    auto r = orchestrate(sup, request(DesiredState::Restarted, false));
    REQUIRE(r.isOk());
    CHECK(sup.transitions() == std::vector<std::string>{"restart app--main.service"});
    for (const auto& call : sup.calls) {
        CHECK(call.rfind("is-active", 0) != 0);
    }
}

TEST_CASE("validation runs before reload and stops on failure") {
    RecordingSupervisor sup;
    sup.validation_fails = true;

    auto r = orchestrate(sup, request(DesiredState::Started, true));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::SERVICE_ERROR);
    CHECK(sup.calls == std::vector<std::string>{"validate"});
}

TEST_CASE("validation can be disabled") {
    RecordingSupervisor sup;
    auto req = request(DesiredState::Installed, true);
    req.validate_units = false;

    auto r = orchestrate(sup, req);
    REQUIRE(r.isOk());
    CHECK(sup.calls == std::vector<std::string>{"daemon-reload"});
}

TEST_CASE("reload failure is a service error") {
    RecordingSupervisor sup;
    sup.reload_fails = true;
    auto r = orchestrate(sup, request(DesiredState::Started, false));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::SERVICE_ERROR);
    CHECK(sup.transitions().empty());
}

TEST_CASE("a cycle performs no restarts") {
    RecordingSupervisor sup;
    sup.states[MAIN] = RunState::Active;
    sup.deps[MAIN] = {"app--a.service"};
    sup.deps["app--a.service"] = {"app--main.service"};

    auto r = orchestrate(sup, request(DesiredState::Restarted, false));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::DEPENDENCY_ERROR);
    CHECK(sup.transitions().empty());
}

TEST_CASE("failed restart stops the cascade") {
    RecordingSupervisor sup;
    sup.deps[MAIN] = {"app--a.service", "app--b.service"};
    sup.failing = {"app--b.service"};

    auto r = orchestrate(sup, request(DesiredState::Restarted, false));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::SERVICE_ERROR);
    CHECK(sup.transitions() == std::vector<std::string>{"restart app--b.service"});
}
