#include <doctest/doctest.h>
#include <qapp/preprocess.hpp>

using namespace qapp;

namespace {

PreprocessContext make_ctx() {
    PreprocessContext ctx;
    ctx.app_name = "myapp";
    ctx.base_path = "/srv";
    ctx.unit_names = {"main", "db", "cache", "data", "backend"};
    return ctx;
}

std::string run(const std::string& text, UnitKind kind = UnitKind::Container,
                const std::string& unit = "main") {
    auto r = preprocess_unit(text, kind, unit, make_ctx(), unit + unit_kind_suffix(kind));
    REQUIRE(r.isOk());
    return r.value();
}

} // namespace

// ============================================================================
// Path substitution
// ============================================================================

TEST_CASE("init.d volume source becomes the deployment path") {
    auto out = run("[Container]\nContainerName=x\nVolume=init.d:/docker-entrypoint-initdb.d:ro,z\n");
    CHECK(out == "[Container]\nContainerName=x\n"
                 "Volume=/srv/myapp/init/main:/docker-entrypoint-initdb.d:ro,z\n");
}

TEST_CASE("config.d subpath is appended") {
    auto ctx = make_ctx();
    CHECK(substitute_mount_source("config.d/nginx", ctx, "web") == "/srv/myapp/config/web/nginx");
    CHECK(substitute_mount_source("config.d/", ctx, "web") == "/srv/myapp/config/web");
    CHECK(substitute_mount_source("init.d", ctx, "db") == "/srv/myapp/init/db");
}

TEST_CASE("only exact init.d and config.d sources are rewritten") {
    auto ctx = make_ctx();
    CHECK(substitute_mount_source("init.data", ctx, "main") == "init.data");
    CHECK(substitute_mount_source("config.dir/x", ctx, "main") == "config.dir/x");
    CHECK(substitute_mount_source("/etc/init.d", ctx, "main") == "/etc/init.d");
    CHECK(substitute_mount_source("./init.d", ctx, "main") == "./init.d");
}

TEST_CASE("base path with trailing slash does not double the separator") {
    auto ctx = make_ctx();
    ctx.base_path = "/data/";
    CHECK(substitute_mount_source("init.d", ctx, "main") == "/data/myapp/init/main");
}

// ============================================================================
// Resource prefixing
// ============================================================================

TEST_CASE("prefix_token rules") {
    auto ctx = make_ctx();
    CHECK(prefix_token("db.service", ctx) == "myapp--db.service");
    CHECK(prefix_token("data.volume", ctx) == "myapp--data.volume");
    CHECK(prefix_token("web.kube", ctx) == "myapp--web.kube");
    CHECK(prefix_token("db", ctx) == "myapp--db");
    CHECK(prefix_token("unrelated", ctx) == "unrelated");
    CHECK(prefix_token("/run/data", ctx) == "/run/data");
    CHECK(prefix_token("host", ctx) == "host");
    CHECK(prefix_token("", ctx) == "");
}

TEST_CASE("already prefixed tokens are never prefixed twice") {
    auto ctx = make_ctx();
    CHECK(prefix_token("myapp--db", ctx) == "myapp--db");
    CHECK(prefix_token("myapp--db.service", ctx) == "myapp--db.service");

    auto once = run("[Unit]\nRequires=db.service\n[Container]\nContainerName=c\n");
    auto twice = run(once);
    CHECK(once == twice);
    CHECK(twice.find("myapp--myapp--") == std::string::npos);
}

TEST_CASE("systemd list directives prefix each token") {
    auto out = run("[Unit]\nAfter=network-online.target db.service  cache.service\n"
                   "Wants=db.service\n[Container]\nContainerName=c\n");
    CHECK(out.find("After=network-online.target myapp--db.service  myapp--cache.service\n") !=
          std::string::npos);
    CHECK(out.find("Wants=myapp--db.service\n") != std::string::npos);
}

TEST_CASE("mount style directives prefix only the resource component") {
    auto out = run("[Container]\nContainerName=c\n"
                   "Volume=data.volume:/var/lib/data:Z\n"
                   "Volume=data:/other\n"
                   "Volume=/host/path:/mnt\n"
                   "Network=backend.network:ip=10.0.0.5\n"
                   "Pod=web.pod\n");
    CHECK(out.find("Volume=myapp--data.volume:/var/lib/data:Z\n") != std::string::npos);
    CHECK(out.find("Volume=myapp--data:/other\n") != std::string::npos);
    CHECK(out.find("Volume=/host/path:/mnt\n") != std::string::npos);
    CHECK(out.find("Network=myapp--backend.network:ip=10.0.0.5\n") != std::string::npos);
    CHECK(out.find("Pod=myapp--web.pod\n") != std::string::npos);
}

TEST_CASE("directives outside the set are untouched") {
    auto out = run("[Container]\nContainerName=c\nImage=db.container\nEnvironment=HOST=db\n");
    CHECK(out == "[Container]\nContainerName=c\nImage=db.container\nEnvironment=HOST=db\n");
}

TEST_CASE("substituted init.d path is not prefixed") {
    auto out = run("[Container]\nContainerName=c\nVolume=init.d/sql:/init\n");
    CHECK(out.find("Volume=/srv/myapp/init/main/sql:/init\n") != std::string::npos);
}

// ============================================================================
// Naming injection
// ============================================================================

TEST_CASE("container name is injected right after the section header") {
    auto out = run("[Unit]\nDescription=x\n\n[Container]\nImage=nginx\n");
    CHECK(out == "[Unit]\nDescription=x\n\n[Container]\nContainerName=myapp--main\nImage=nginx\n");
}

TEST_CASE("explicit container name is never rewritten") {
    auto out = run("[Container]\nImage=nginx\nContainerName=custom\n");
    CHECK(out == "[Container]\nImage=nginx\nContainerName=custom\n");
}

TEST_CASE("each kind gets its own name directive") {
    CHECK(run("[Volume]\n", UnitKind::Volume, "data") == "[Volume]\nVolumeName=myapp--data\n");
    CHECK(run("[Network]\n", UnitKind::Network, "backend") == "[Network]\nNetworkName=myapp--backend\n");
    CHECK(run("[Pod]\n", UnitKind::Pod, "web") == "[Pod]\nPodName=myapp--web\n");
}

TEST_CASE("missing section is created for the name") {
    auto out = run("[Unit]\nDescription=data\n", UnitKind::Volume, "data");
    CHECK(out == "[Unit]\nDescription=data\n\n[Volume]\nVolumeName=myapp--data\n");
}

TEST_CASE("kube units get no name injection") {
    std::string text = "[Kube]\nYaml=app.yaml\n";
    CHECK(run(text, UnitKind::Kube, "web") == text);
}

TEST_CASE("comments and blank lines survive preprocessing") {
    std::string text = "# managed\n[Container]\n# image below\nContainerName=c\n\nImage=x\n";
    CHECK(run(text) == text);
}

TEST_CASE("malformed unit fails the whole preprocessing") {
    auto r = preprocess_unit("[Container\n", UnitKind::Container, "main", make_ctx(), "main.container");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::PREPROCESS_ERROR);
}

TEST_CASE("mount rule keeps the remainder verbatim") {
    auto rule = parse_mount_rule("src:/dst:ro,z");
    CHECK(rule.source == "src");
    CHECK(rule.rest == ":/dst:ro,z");

    auto bare = parse_mount_rule("data.volume");
    CHECK(bare.source == "data.volume");
    CHECK(bare.rest.empty());
}
