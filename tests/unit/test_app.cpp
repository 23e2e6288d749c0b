#include "cli/app.hpp"
#include "cli/arguments.hpp"
#include "core/errors.hpp"
#include "../mocks/mock_network_config_service.hpp"
#include "../mocks/scripted_prompter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace wifiap;
using namespace wifiap::cli;
using services::Outcome;

namespace {

/**
 * Dispatcher over the in-memory network service with zero waits
 */
struct AppFixture {
    core::AppConfig config;
    testing::MockNetworkConfigService network;
    testing::ScriptedPrompter prompter;
    std::ostringstream out;
    std::ostringstream err;

    AppFixture() {
        config.timing.scan_settle_seconds = 0;
        config.timing.restart_delay_seconds = 0;
        network.add_device("wlan0");
        network.add_radio("wlan0", true, true);
    }

    static Arguments parse(std::vector<std::string> argv) {
        argv.insert(argv.begin(), "wifi-ap");
        return parse_arguments(argv);
    }

    Outcome dispatch(const std::vector<std::string>& argv) {
        CommandDispatcher dispatcher(config, network, prompter, out);
        return dispatcher.dispatch(parse(argv));
    }

    int run(const std::vector<std::string>& argv) {
        CommandDispatcher dispatcher(config, network, prompter, out);
        return execute(dispatcher, parse(argv), err);
    }
};

} // namespace

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("Dispatcher: create runs the connection flow", "[cli][dispatch]") {
    AppFixture f;
    f.prompter.confirmations = {true};

    REQUIRE(f.dispatch({"create", "Cafe", "secret123", "wlan0", "6"}) == Outcome::COMPLETED);
    REQUIRE(f.network.called("create Cafe-AP"));
    REQUIRE(f.network.called("up Cafe-AP"));
}

TEST_CASE("Dispatcher: declined prompts before any change are cancellations", "[cli][dispatch]") {
    AppFixture f;

    REQUIRE(f.dispatch({"Cafe", "secret123", "wlan0", "6"}) == Outcome::CANCELLED);
    REQUIRE(f.dispatch({"--reset"}) == Outcome::CANCELLED);
    REQUIRE(f.out.str().find("Reset cancelled.") != std::string::npos);
    REQUIRE(f.network.calls.empty());
}

TEST_CASE("Dispatcher: bare control reports status", "[cli][dispatch][control]") {
    AppFixture f;
    f.network.add_profile("Cafe-AP", "wlan0", "Cafe", true);

    REQUIRE(f.dispatch({"control"}) == Outcome::COMPLETED);
    REQUIRE(f.out.str().find("[ACTIVE]") != std::string::npos);
    REQUIRE(f.out.str().find("Cafe-AP") != std::string::npos);
    REQUIRE(f.network.calls.empty());
}

TEST_CASE("Dispatcher: update-band applies the --band value", "[cli][dispatch][update]") {
    AppFixture f;
    f.network.add_profile("Cafe-AP", "wlan0", "Cafe", false, core::Band::GHZ_5, 36);

    REQUIRE(f.dispatch({"--update-band", "--band=2.4", "Cafe-AP", "5"}) == Outcome::COMPLETED);
    auto stored = f.network.show_profile("Cafe-AP");
    REQUIRE(stored);
    REQUIRE(stored->band == core::Band::GHZ_2_4);
    REQUIRE(stored->channel == 5);
}

// ============================================================================
// Exit codes
// ============================================================================

TEST_CASE("Exit codes: completed and cancelled commands exit 0", "[cli][exit]") {
    AppFixture f;
    REQUIRE(f.run({"--reset"}) == 0);

    f.prompter.confirmations = {true};
    REQUIRE(f.run({"--reset"}) == 0);
    REQUIRE(f.err.str().empty());
}

TEST_CASE("Exit codes: declining the disconnect prompt exits 1", "[cli][exit]") {
    AppFixture f;
    f.network.device("wlan0")->state = "connected";
    f.network.device("wlan0")->connection = "Home WiFi";

    REQUIRE(f.run({"Cafe", "secret123", "wlan0", "6"}) == 1);
    REQUIRE(f.err.str().find("ERROR: ") == 0);
    REQUIRE(f.network.calls.empty());
}

TEST_CASE("Exit codes: failures exit 1", "[cli][exit]") {
    AppFixture f;

    SECTION("usage") {
        REQUIRE(f.run({"control", "delete"}) == 1);
        REQUIRE(f.err.str().find("--help") != std::string::npos);
    }

    SECTION("precondition") {
        REQUIRE(f.run({"control", "status", "Missing-AP"}) == 1);
        REQUIRE(f.err.str().find("--help") == std::string::npos);
    }

    SECTION("external") {
        f.network.add_profile("Cafe-AP", "wlan0", "Cafe");
        f.network.failing = {"delete"};
        REQUIRE(f.run({"control", "delete", "Cafe-AP"}) == 1);
        REQUIRE(f.err.str().find("ERROR: ") == 0);
    }
}

TEST_CASE("Exit codes: report_error prints details", "[cli][exit]") {
    std::ostringstream err;

    core::ApError aborted(core::ErrorKind::ABORTED, "Aborted by user");
    REQUIRE(report_error(aborted, err) == 1);

    auto ambiguous = core::precondition_error("Multiple WiFi interfaces", {"wlan0", "wlan1"});
    REQUIRE(report_error(ambiguous, err) == 1);
    REQUIRE(err.str() == "ERROR: Aborted by user\n"
                         "ERROR: Multiple WiFi interfaces\n"
                         "  wlan0\n"
                         "  wlan1\n");

    std::ostringstream usage;
    REQUIRE(report_error(core::usage_error("SSID and password are required"), usage) == 1);
    REQUIRE(usage.str().find("Run 'wifi-ap --help' for usage.") != std::string::npos);
}
