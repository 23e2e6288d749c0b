#include "core/prompter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace wifiap::core;

// ============================================================================
// ConsolePrompter
// ============================================================================

TEST_CASE("Console prompter: only y or Y confirms", "[prompter]") {
    std::istringstream in("y\nY\nyes\nn\n\n");
    std::ostringstream out;
    ConsolePrompter prompter(in, out);

    REQUIRE(prompter.confirm("Proceed?"));
    REQUIRE(prompter.confirm("Proceed?"));
    REQUIRE_FALSE(prompter.confirm("Proceed?"));
    REQUIRE_FALSE(prompter.confirm("Proceed?"));
    REQUIRE_FALSE(prompter.confirm("Proceed?"));
    REQUIRE(out.str().find("Proceed? (y/N): ") != std::string::npos);
}

TEST_CASE("Console prompter: end of input declines", "[prompter]") {
    std::istringstream in("");
    std::ostringstream out;
    ConsolePrompter prompter(in, out);

    REQUIRE_FALSE(prompter.confirm("Continue with reset?"));
}

TEST_CASE("Console prompter: choose returns the zero-based option", "[prompter]") {
    std::istringstream in("2\n");
    std::ostringstream out;
    ConsolePrompter prompter(in, out);

    REQUIRE(prompter.choose("Profile exists", {"Replace", "Keep", "Abort"}) == 1);
    REQUIRE(out.str().find("  1) Replace") != std::string::npos);
    REQUIRE(out.str().find("  3) Abort") != std::string::npos);
    REQUIRE(out.str().find("Choose (1-3): ") != std::string::npos);
}

TEST_CASE("Console prompter: invalid choices abort", "[prompter]") {
    const std::vector<std::string> options = {"Replace", "Keep", "Abort"};

    SECTION("out of range") {
        std::istringstream in("0\n4\n-1\n");
        std::ostringstream out;
        ConsolePrompter prompter(in, out);
        REQUIRE(prompter.choose("Pick", options) == -1);
        REQUIRE(prompter.choose("Pick", options) == -1);
        REQUIRE(prompter.choose("Pick", options) == -1);
    }

    SECTION("not a number") {
        std::istringstream in("two\n1x\n\n");
        std::ostringstream out;
        ConsolePrompter prompter(in, out);
        REQUIRE(prompter.choose("Pick", options) == -1);
        REQUIRE(prompter.choose("Pick", options) == -1);
        REQUIRE(prompter.choose("Pick", options) == -1);
    }

    SECTION("end of input") {
        std::istringstream in("");
        std::ostringstream out;
        ConsolePrompter prompter(in, out);
        REQUIRE(prompter.choose("Pick", options) == -1);
    }
}

// ============================================================================
// AutoPrompter
// ============================================================================

TEST_CASE("Auto prompter: confirms every prompt", "[prompter][force]") {
    std::ostringstream out;
    AutoPrompter prompter(out);

    REQUIRE(prompter.confirm("Disconnect wlan0?"));
    REQUIRE(prompter.confirm("Proceed?"));
    REQUIRE(out.str().find("Disconnect wlan0? (y/N): y [--force]") != std::string::npos);
}

TEST_CASE("Auto prompter: fixed choice within range", "[prompter][force]") {
    std::ostringstream out;
    const std::vector<std::string> options = {"Replace", "Keep"};

    AutoPrompter keep(out, 1);
    REQUIRE(keep.choose("Profile exists", options) == 1);
    REQUIRE(out.str().find("Profile exists -> Keep [automatic]") != std::string::npos);

    AutoPrompter first(out);
    REQUIRE(first.choose("Profile exists", options) == 0);

    AutoPrompter past_end(out, 2);
    REQUIRE(past_end.choose("Profile exists", options) == -1);

    AutoPrompter negative(out, -1);
    REQUIRE(negative.choose("Profile exists", options) == -1);

    REQUIRE(first.choose("Nothing to pick", {}) == -1);
}
