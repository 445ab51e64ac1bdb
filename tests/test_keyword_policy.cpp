#include <catch2/catch_test_macros.hpp>
#include "validator/keyword_policy.hpp"

using namespace docgate;

TEST_CASE("KeywordPolicy: assignment forms block, bare words do not", "[validator][keywords]") {
    const auto policy = KeywordPolicy::defaults();

    const auto assigned = policy->evaluate("password: hunter2");
    REQUIRE(assigned.size() == 1);
    CHECK(assigned[0].rule->keyword == "password");
    CHECK(assigned[0].rule->action == KeywordAction::BLOCK);

    CHECK(policy->evaluate("Reset your password from the settings page").empty());
    CHECK(policy->evaluate("The token bucket refills every second").empty());
}

TEST_CASE("KeywordPolicy: matching is case-insensitive", "[validator][keywords]") {
    const auto policy = KeywordPolicy::defaults();

    const auto m = policy->evaluate("API-KEY = abc and a PRIVATE   KEY block");
    REQUIRE(m.size() == 2);
    CHECK(m[0].rule->keyword == "private key");
    CHECK(m[1].rule->keyword == "api_key");
}

TEST_CASE("KeywordPolicy: matches follow table order, one per rule", "[validator][keywords]") {
    const auto policy = KeywordPolicy::defaults();

    const auto m = policy->evaluate("proprietary, confidential, proprietary again");
    REQUIRE(m.size() == 2);
    CHECK(m[0].rule->keyword == "confidential");
    CHECK(m[1].rule->keyword == "proprietary");
    CHECK(m[0].message ==
          "Sensitive keyword detected: \"confidential\" - Confidential information reference");
}

TEST_CASE("KeywordPolicy: custom table", "[validator][keywords]") {
    KeywordPolicy policy({
        KeywordRule{"codename", std::regex("blue\\s+falcon", std::regex::icase),
                    KeywordAction::BLOCK, "Project codename"},
    });

    CHECK(policy.statistics().total == 1);
    CHECK(policy.statistics().blocking == 1);
    const auto m = policy.evaluate("Launch of Blue Falcon is next week");
    REQUIRE(m.size() == 1);
    CHECK(m[0].message == "Sensitive keyword detected: \"codename\" - Project codename");
}
