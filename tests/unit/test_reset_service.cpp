#include "services/reset_service.hpp"
#include "../mocks/mock_network_config_service.hpp"
#include "../mocks/scripted_prompter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace wifiap;
using namespace wifiap::services;

namespace {

void populate(testing::MockNetworkConfigService& network) {
    network.add_device("wlan0");
    network.add_device("wlan1");
    network.add_device("p2p-dev-wlan0", "wifi-p2p");
    network.add_profile("Cafe-AP", "wlan0", "Cafe", true);
    network.add_profile("OfficeAP", "wlan1", "Office");
    network.add_profile("Home WiFi", "wlan1", "Home");
}

} // namespace

TEST_CASE("Reset: declining changes nothing", "[reset]") {
    testing::MockNetworkConfigService network;
    populate(network);
    testing::ScriptedPrompter prompter;
    prompter.confirmations = {false};
    std::ostringstream out;

    ResetService reset(network, prompter, out);
    REQUIRE(reset.reset() == Outcome::CANCELLED);
    REQUIRE(network.calls.empty());
    REQUIRE(out.str().find("Reset cancelled.") != std::string::npos);
}

TEST_CASE("Reset: removes AP profiles and restores client mode", "[reset]") {
    testing::MockNetworkConfigService network;
    populate(network);
    testing::ScriptedPrompter prompter;
    prompter.confirmations = {true};
    std::ostringstream out;

    ResetService reset(network, prompter, out);
    REQUIRE(reset.reset() == Outcome::COMPLETED);

    REQUIRE(network.profiles.count("Cafe-AP") == 0);
    REQUIRE(network.profiles.count("OfficeAP") == 0);
    REQUIRE(network.profiles.count("Home WiFi") == 1);

    REQUIRE(network.called("radio on"));
    REQUIRE(network.called("managed wlan0 yes"));
    REQUIRE(network.called("managed wlan1 yes"));
    REQUIRE(network.called("rescan wlan0"));
    REQUIRE_FALSE(network.called("managed p2p-dev-wlan0 yes"));
    REQUIRE(out.str().find("nmcli device wifi connect") != std::string::npos);
}

TEST_CASE("Reset: running twice succeeds both times", "[reset]") {
    testing::MockNetworkConfigService network;
    populate(network);
    testing::ScriptedPrompter prompter;
    prompter.confirmations = {true, true};
    std::ostringstream out;

    ResetService reset(network, prompter, out);
    REQUIRE(reset.reset() == Outcome::COMPLETED);
    REQUIRE(reset.reset() == Outcome::COMPLETED);
    REQUIRE(network.count_prefix("delete ") == 2);
}

TEST_CASE("Reset: step failures are warnings", "[reset]") {
    testing::MockNetworkConfigService network;
    populate(network);
    network.failing = {"delete", "radio", "managed", "rescan"};
    testing::ScriptedPrompter prompter;
    prompter.confirmations = {true};
    std::ostringstream out;

    ResetService reset(network, prompter, out);
    REQUIRE(reset.reset() == Outcome::COMPLETED);
    REQUIRE(network.called("delete Cafe-AP"));
    REQUIRE(network.called("delete OfficeAP"));
}

TEST_CASE("Reset: network listing is capped", "[reset]") {
    testing::MockNetworkConfigService network;
    network.add_device("wlan0");
    for (int i = 0; i < 15; ++i) {
        network.scan.push_back({"net" + std::to_string(i), 1, 50});
    }
    testing::ScriptedPrompter prompter;
    prompter.confirmations = {true};
    std::ostringstream out;

    ResetService reset(network, prompter, out);
    reset.reset();
    REQUIRE(out.str().find("net9 ") != std::string::npos);
    REQUIRE(out.str().find("net10 ") == std::string::npos);
}
