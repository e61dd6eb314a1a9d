#include <catch2/catch_test_macros.hpp>

#include "event/payload.hpp"

using json = nlohmann::json;

TEST_CASE("extract_cwd", "[payload]") {

    SECTION("DirectCwd") {
        REQUIRE(extract_cwd({{"cwd", "/path/to/project"}}) == "/path/to/project");
    }

    SECTION("WorkingDirectory") {
        REQUIRE(extract_cwd({{"working_directory", "/path/to/project"}}) == "/path/to/project");
    }

    SECTION("NestedToolInput") {
        json payload = {{"tool_input", {{"cwd", "/path/to/project"}}}};
        REQUIRE(extract_cwd(payload) == "/path/to/project");
    }

    SECTION("EmptyPayload") {
        REQUIRE(extract_cwd(json::object()).empty());
    }

    SECTION("DirectOverWorkingDirectory") {
        json payload = {{"cwd", "/direct"}, {"working_directory", "/wd"}};
        REQUIRE(extract_cwd(payload) == "/direct");
    }

    SECTION("DirectOverNested") {
        json payload = {{"cwd", "/direct"}, {"tool_input", {{"cwd", "/nested"}}}};
        REQUIRE(extract_cwd(payload) == "/direct");
    }

    SECTION("WorkingDirectoryOverNested") {
        json payload = {{"working_directory", "/wd"}, {"tool_input", {{"cwd", "/nested"}}}};
        REQUIRE(extract_cwd(payload) == "/wd");
    }

    SECTION("WrongTypesIgnored") {
        json payload = {{"cwd", 42}, {"tool_input", "not an object"}, {"working_directory", "/wd"}};
        REQUIRE(extract_cwd(payload) == "/wd");
        REQUIRE(extract_cwd(json::array({1, 2})).empty());
        REQUIRE(extract_cwd(json("string")).empty());
    }
}

TEST_CASE("extract_command", "[payload]") {

    SECTION("ToolInputCommand") {
        REQUIRE(extract_command({{"tool_input", {{"command", "npm test"}}}}) == "npm test");
    }

    SECTION("ArgsCommand") {
        REQUIRE(extract_command({{"args", {{"command", "git status"}}}}) == "git status");
    }

    SECTION("EmptyPayload") {
        REQUIRE(extract_command(json::object()).empty());
    }

    SECTION("ToolInputOverArgs") {
        json payload = {
            {"tool_input", {{"command", "from_tool_input"}}},
            {"args", {{"command", "from_args"}}},
        };
        REQUIRE(extract_command(payload) == "from_tool_input");
    }

    SECTION("EmptyToolInputCommandFallsThrough") {
        json payload = {
            {"tool_input", {{"command", ""}}},
            {"args", {{"command", "from_args"}}},
        };
        REQUIRE(extract_command(payload) == "from_args");
    }

    SECTION("TopLevelCommandIgnored") {
        REQUIRE(extract_command({{"command", "ls"}}).empty());
    }
}
