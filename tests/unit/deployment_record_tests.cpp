#include <doctest/doctest.h>
#include <qapp/ledger.hpp>

#include "test_helpers.hpp"

#include <sys/stat.h>

using namespace qapp;
using qapp::test::TempTestDir;

TEST_CASE("record serialization is readable back") {
    DeploymentRecord record;
    record.app_name = "myapp";
    record.deployed_at = "2026-01-02T03:04:05Z";
    record.files["/etc/containers/systemd/myapp--main.container"] =
        RecordEntry{"abc123", 0644, "2026-01-02T03:04:05Z"};

    auto json = serialize_deployment_record(record);
    CHECK(json.find("\"$schema\": \"qapp.deployment.record.v1\"") != std::string::npos);
    CHECK(json.find("\"mode\": \"0644\"") != std::string::npos);

    auto parsed = parse_deployment_record(json);
    REQUIRE(parsed.ok);
    CHECK(parsed.record.app_name == "myapp");
    CHECK(parsed.record.deployed_at == "2026-01-02T03:04:05Z");
    REQUIRE(parsed.record.files.size() == 1);
    const auto& entry = parsed.record.files.begin()->second;
    CHECK(entry.digest == "abc123");
    CHECK(entry.mode == 0644);
}

TEST_CASE("record parse errors") {
    CHECK_FALSE(parse_deployment_record("[]").ok);
    CHECK_FALSE(parse_deployment_record("{").ok);
    CHECK_FALSE(parse_deployment_record(R"({"files": {}})").ok);
    CHECK_FALSE(parse_deployment_record(R"({"$schema": "other.v1"})").ok);
    CHECK_FALSE(parse_deployment_record(
        R"({"$schema": "qapp.deployment.record.v1", "files": {"/a": {"mode": "0644"}}})").ok);
    CHECK_FALSE(parse_deployment_record(
        R"({"$schema": "qapp.deployment.record.v1", "files": {"/a": {"digest": "d", "mode": "rw"}}})").ok);
}

TEST_CASE("missing record loads as empty") {
    TempTestDir tmp;
    auto record = load_deployment_record(tmp.file("records/app.json"), "app");
    CHECK(record.app_name == "app");
    CHECK(record.files.empty());
}

TEST_CASE("corrupt record loads as empty") {
    TempTestDir tmp;
    tmp.write("records/app.json", "{ not json");
    auto record = load_deployment_record(tmp.file("records/app.json"), "app");
    CHECK(record.files.empty());
}

TEST_CASE("saved record is private to the owner") {
    TempTestDir tmp;
    auto path = deployment_record_path(tmp.path, "app");
    CHECK(path == tmp.path + "/records/app.json");

    DeploymentRecord record;
    record.app_name = "app";
    REQUIRE(save_deployment_record(path, record).isOk());

    struct stat st{};
    REQUIRE(::stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);

    auto loaded = load_deployment_record(path, "app");
    CHECK(loaded.app_name == "app");
}
