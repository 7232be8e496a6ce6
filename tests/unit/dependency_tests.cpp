#include <doctest/doctest.h>
#include <qapp/dependency.hpp>

#include "test_helpers.hpp"

using namespace qapp;
using qapp::test::RecordingSupervisor;

TEST_CASE("dependencies restart before their dependents") {
    RecordingSupervisor sup;
    sup.deps["app--main.service"] = {"app--a.service", "app--b.service"};
    sup.deps["app--b.service"] = {"app--c.service"};

    auto r = resolve_restart_order(sup, "app--main.service", "app");
    REQUIRE(r.isOk());
    CHECK(r.value() == std::vector<std::string>{
        "app--c.service", "app--b.service", "app--a.service", "app--main.service"});
}

TEST_CASE("main alone when it has no dependencies") {
    RecordingSupervisor sup;
    auto r = resolve_restart_order(sup, "app--main.service", "app");
    REQUIRE(r.isOk());
    CHECK(r.value() == std::vector<std::string>{"app--main.service"});
}

TEST_CASE("shared dependency is restarted once") {
    RecordingSupervisor sup;
    sup.deps["app--main.service"] = {"app--web.service", "app--db.service"};
    sup.deps["app--web.service"] = {"app--db.service"};

    auto r = resolve_restart_order(sup, "app--main.service", "app");
    REQUIRE(r.isOk());
    CHECK(r.value() == std::vector<std::string>{
        "app--db.service", "app--web.service", "app--main.service"});
}

TEST_CASE("services outside the application are ignored") {
    RecordingSupervisor sup;
    sup.deps["app--main.service"] = {"network-online.target", "other--db.service",
                                     "app--db.service", "app--main.service", "-.mount"};

    auto r = resolve_restart_order(sup, "app--main.service", "app");
    REQUIRE(r.isOk());
    CHECK(r.value() == std::vector<std::string>{"app--db.service", "app--main.service"});

    for (const auto& call : sup.calls) {
        CHECK(call.find("other--") == std::string::npos);
        CHECK(call.find("network-online") == std::string::npos);
    }
}

TEST_CASE("a prefix that merely starts the same is not the application") {
    RecordingSupervisor sup;
    sup.deps["app--main.service"] = {"appx--db.service", "app-db.service"};

    auto r = resolve_restart_order(sup, "app--main.service", "app");
    REQUIRE(r.isOk());
    CHECK(r.value().size() == 1);
}

TEST_CASE("a cycle is a dependency error naming the services") {
    RecordingSupervisor sup;
    sup.deps["app--main.service"] = {"app--a.service"};
    sup.deps["app--a.service"] = {"app--b.service"};
    sup.deps["app--b.service"] = {"app--a.service"};

    auto r = resolve_restart_order(sup, "app--main.service", "app");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::DEPENDENCY_ERROR);
    CHECK(r.error().message().find("app--a.service") != std::string::npos);
    CHECK(r.error().message().find("app--b.service") != std::string::npos);
    CHECK(sup.transitions().empty());
}

TEST_CASE("supervisor failure during discovery is propagated") {
    class FailingShow : public RecordingSupervisor {
    public:
        Result<std::vector<std::string>> dependencies(const std::string&) override {
            return Result<std::vector<std::string>>::err(Error(ErrorCode::SERVICE_ERROR, "show timed out"));
        }
    };

    FailingShow sup;
    auto r = resolve_restart_order(sup, "app--main.service", "app");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::SERVICE_ERROR);
}

TEST_CASE("restart order works on a prepared graph") {
    DependencyGraph graph;
    graph.nodes = {"m", "x", "y"};
    graph.edges["m"] = {"x", "y"};
    graph.edges["x"] = {"y"};

    auto r = restart_order(graph, "m");
    REQUIRE(r.isOk());
    CHECK(r.value() == std::vector<std::string>{"y", "x", "m"});
}
