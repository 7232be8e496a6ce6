#include <doctest/doctest.h>
#include <qapp/template.hpp>

#include "test_helpers.hpp"

using namespace qapp;
using qapp::test::TempTestDir;

TEST_CASE("placeholders are substituted") {
    PlaceholderRenderer renderer;
    VariableMap vars{{"image", "nginx:1.25"}, {"quadlet_app_name", "shop"}};

    auto r = renderer.render("Image={{ image }}\nLabel=app={{quadlet_app_name}}\n", vars, "main.container");
    REQUIRE(r.isOk());
    CHECK(r.value() == "Image=nginx:1.25\nLabel=app=shop\n");
}

TEST_CASE("text without placeholders is unchanged") {
    PlaceholderRenderer renderer;
    std::string text = "[Container]\nExec=sh -c 'echo ${HOME} %h {single}'\n";
    auto r = renderer.render(text, {}, "main.container");
    REQUIRE(r.isOk());
    CHECK(r.value() == text);
}

TEST_CASE("undefined variable is a template error naming file and line") {
    PlaceholderRenderer renderer;
    auto r = renderer.render("[Container]\nImage={{ missing }}\n", {}, "quadlets/main.container");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::TEMPLATE_ERROR);
    CHECK(r.error().message().find("quadlets/main.container:2") != std::string::npos);
    CHECK(r.error().message().find("missing") != std::string::npos);
}

TEST_CASE("unterminated placeholder is a template error") {
    PlaceholderRenderer renderer;
    auto r = renderer.render("Image={{ image\n", {{"image", "x"}}, "main.container");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::TEMPLATE_ERROR);
}

TEST_CASE("invalid placeholder expression is a template error") {
    PlaceholderRenderer renderer;
    auto r = renderer.render("{{ image | upper }}", {{"image", "x"}}, "main.container");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::TEMPLATE_ERROR);
}

TEST_CASE("variable assignments parse key=value") {
    auto r = parse_variable_assignments({"image=nginx", "env=A=B", "empty="});
    REQUIRE(r.isOk());
    CHECK(r.value().at("image") == "nginx");
    CHECK(r.value().at("env") == "A=B");
    CHECK(r.value().at("empty") == "");

    CHECK(parse_variable_assignments({"novalue"}).isErr());
    CHECK(parse_variable_assignments({"=x"}).isErr());
}

TEST_CASE("variables file accepts scalar values") {
    TempTestDir tmp;
    tmp.write("vars.json", R"({"image": "nginx", "replicas": 3, "debug": true})");

    auto r = load_variables_file(tmp.file("vars.json"));
    REQUIRE(r.isOk());
    CHECK(r.value().at("image") == "nginx");
    CHECK(r.value().at("replicas") == "3");
    CHECK(r.value().at("debug") == "true");
}

TEST_CASE("variables file rejects nested values and bad JSON") {
    TempTestDir tmp;
    tmp.write("nested.json", R"({"list": [1, 2]})");
    tmp.write("broken.json", "{not json");

    auto nested = load_variables_file(tmp.file("nested.json"));
    REQUIRE(nested.isErr());
    CHECK(nested.error().code() == ErrorCode::CONFIG_ERROR);

    CHECK(load_variables_file(tmp.file("broken.json")).isErr());
    CHECK(load_variables_file(tmp.file("absent.json")).isErr());
}

TEST_CASE("later variable sources win") {
    auto merged = merge_variables({{"a", "1"}, {"b", "1"}}, {{"b", "2"}});
    CHECK(merged.at("a") == "1");
    CHECK(merged.at("b") == "2");
}
