#include <catch2/catch_test_macros.hpp>

#include "response/verdict.hpp"

using json = nlohmann::json;

TEST_CASE("Verdict", "[verdict]") {

    SECTION("AllowShape") {
        auto j = Verdict::allow().to_json();
        REQUIRE(j == json::parse(R"({"hookSpecificOutput": {"permissionDecision": "allow"}, "continue": true})"));
    }

    SECTION("DenyShape") {
        auto j = Verdict::deny("Too dangerous").to_json();
        REQUIRE(j["hookSpecificOutput"]["permissionDecision"] == "deny");
        REQUIRE(j["hookSpecificOutput"]["permissionDecisionReason"] == "Too dangerous");
        REQUIRE(j["continue"] == false);
    }

    SECTION("RoundTripThroughText") {
        for (const auto& v : {Verdict::allow(), Verdict::deny("rm -rf blocked"), Verdict::deny("")}) {
            auto parsed = Verdict::from_json(json::parse(v.to_json().dump()));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == v);
        }
    }

    SECTION("DenyWithoutReason") {
        auto v = Verdict::from_json({{"hookSpecificOutput", {{"permissionDecision", "deny"}}}});
        REQUIRE(v.has_value());
        REQUIRE_FALSE(v->allowed());
        REQUIRE(v->reason.empty());
    }

    SECTION("RejectsMalformed") {
        REQUIRE_FALSE(Verdict::from_json(json::array()).has_value());
        REQUIRE_FALSE(Verdict::from_json(json::object()).has_value());
        REQUIRE_FALSE(Verdict::from_json({{"hookSpecificOutput", "allow"}}).has_value());
        REQUIRE_FALSE(Verdict::from_json({{"hookSpecificOutput", {{"permissionDecision", "ask"}}}}).has_value());
        REQUIRE_FALSE(Verdict::from_json({{"hookSpecificOutput", {{"permissionDecision", 1}}}}).has_value());
        REQUIRE_FALSE(Verdict::from_json(
            {{"hookSpecificOutput", {{"permissionDecision", "deny"}, {"permissionDecisionReason", 5}}}}).has_value());
    }

    SECTION("RejectsContradictoryContinue") {
        REQUIRE_FALSE(Verdict::from_json(
            {{"hookSpecificOutput", {{"permissionDecision", "allow"}}}, {"continue", false}}).has_value());
        REQUIRE_FALSE(Verdict::from_json(
            {{"hookSpecificOutput", {{"permissionDecision", "deny"}}}, {"continue", "no"}}).has_value());
    }
}
