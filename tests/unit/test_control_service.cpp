#include "services/control_service.hpp"
#include "services/capability_prober.hpp"
#include "core/errors.hpp"
#include "../mocks/mock_network_config_service.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <sstream>

using namespace wifiap;
using namespace wifiap::services;

namespace {

struct ControlFixture {
    testing::MockNetworkConfigService network;
    std::ostringstream out;
    CapabilityProber prober{network};
    ControlService control{network, prober, std::chrono::seconds(0), out};

    ControlFixture() {
        network.add_device("wlan0");
        network.add_device("wlan1");
    }
};

core::ErrorKind failure_kind(ControlFixture& f, const std::string& command, const std::string& name = "") {
    try {
        f.control.run(command, name, "");
    } catch (const core::ApError& e) {
        return e.kind();
    }
    FAIL("expected failure");
    return core::ErrorKind::USAGE;
}

} // namespace

// ============================================================================
// start / stop / restart
// ============================================================================

TEST_CASE("Control: start without a name picks the first AP by name", "[control]") {
    ControlFixture f;
    f.network.add_profile("Zulu-AP", "wlan0", "Zulu");
    f.network.add_profile("Alpha-AP", "wlan1", "Alpha");

    REQUIRE(f.control.start("", "") == Outcome::COMPLETED);
    REQUIRE(f.network.calls == std::vector<std::string>{"up Alpha-AP"});
}

TEST_CASE("Control: start with name and interface", "[control]") {
    ControlFixture f;
    f.network.add_profile("Cafe-AP", "wlan0", "Cafe");

    f.control.start("Cafe-AP", "wlan1");
    REQUIRE(f.network.called("up Cafe-AP wlan1"));
}

TEST_CASE("Control: start failures", "[control]") {
    ControlFixture f;
    REQUIRE(failure_kind(f, "start") == core::ErrorKind::PRECONDITION);

    f.network.add_profile("Cafe-AP", "wlan0", "Cafe");
    f.network.failing.insert("up");
    REQUIRE(failure_kind(f, "start", "Cafe-AP") == core::ErrorKind::EXTERNAL);
}

TEST_CASE("Control: stop of an inactive profile is not an error", "[control]") {
    ControlFixture f;
    f.network.add_profile("Cafe-AP", "wlan0", "Cafe");

    REQUIRE(f.control.stop("Cafe-AP") == Outcome::COMPLETED);
    REQUIRE(f.out.str().find("may not be active") != std::string::npos);
}

TEST_CASE("Control: stop without a name stops every active AP", "[control]") {
    ControlFixture f;
    f.network.add_profile("A-AP", "wlan0", "A", true);
    f.network.add_profile("B-AP", "wlan1", "B", true);
    f.network.add_profile("C-AP", "", "C");

    f.control.stop("");
    REQUIRE(f.network.calls == std::vector<std::string>{"down A-AP", "down B-AP"});
}

TEST_CASE("Control: restart goes down then up", "[control]") {
    ControlFixture f;
    f.network.add_profile("Cafe-AP", "wlan0", "Cafe", true);

    REQUIRE(f.control.restart("", "") == Outcome::COMPLETED);
    REQUIRE(f.network.calls == std::vector<std::string>{"down Cafe-AP", "up Cafe-AP"});
}

TEST_CASE("Control: restart of an inactive profile ignores the down failure", "[control]") {
    ControlFixture f;
    f.network.add_profile("Cafe-AP", "wlan0", "Cafe");

    REQUIRE(f.control.restart("Cafe-AP", "") == Outcome::COMPLETED);
    REQUIRE(f.network.show_profile("Cafe-AP")->is_active());
}

// ============================================================================
// status / list / delete / interfaces
// ============================================================================

TEST_CASE("Control: status tags every AP profile", "[control]") {
    ControlFixture f;
    f.network.add_profile("Alpha-AP", "wlan0", "Alpha", true);
    f.network.add_profile("Beta-AP", "wlan1", "Beta");

    f.control.status("");
    auto text = f.out.str();
    REQUIRE(text.find("[ACTIVE]   Alpha-AP") != std::string::npos);
    REQUIRE(text.find("[INACTIVE] Beta-AP") != std::string::npos);
    REQUIRE(text.find("SSID: Alpha") != std::string::npos);
    REQUIRE(text.find("SSID: Beta") == std::string::npos);
}

TEST_CASE("Control: status of an unknown profile fails", "[control]") {
    ControlFixture f;
    REQUIRE(failure_kind(f, "status", "Nope-AP") == core::ErrorKind::PRECONDITION);
}

TEST_CASE("Control: list shows only wireless profiles", "[control]") {
    ControlFixture f;
    f.network.add_profile("Cafe-AP", "wlan0", "Cafe");
    core::ConnectionProfile wired;
    wired.name = "Wired connection 1";
    wired.type = "802-3-ethernet";
    f.network.other_profiles.push_back(wired);

    f.control.list();
    REQUIRE(f.out.str().find("Cafe-AP") != std::string::npos);
    REQUIRE(f.out.str().find("Wired connection 1") == std::string::npos);
}

TEST_CASE("Control: delete", "[control]") {
    ControlFixture f;
    REQUIRE(failure_kind(f, "delete") == core::ErrorKind::USAGE);
    REQUIRE(failure_kind(f, "delete", "Nope-AP") == core::ErrorKind::EXTERNAL);

    f.network.add_profile("Cafe-AP", "wlan0", "Cafe");
    REQUIRE(f.control.remove("Cafe-AP") == Outcome::COMPLETED);
    REQUIRE(f.network.profiles.empty());
}

TEST_CASE("Control: interfaces reports capabilities", "[control]") {
    ControlFixture f;
    f.network.add_radio("wlan0", true, true, true);

    f.control.interfaces();
    auto text = f.out.str();
    REQUIRE(text.find("AP mode: supported") != std::string::npos);
    REQUIRE(text.find("Bands: 2.4GHz, 5GHz") != std::string::npos);
    REQUIRE(text.find("AP mode: unknown") != std::string::npos);
}

TEST_CASE("Control: unknown command is a usage error", "[control]") {
    ControlFixture f;
    REQUIRE(failure_kind(f, "explode") == core::ErrorKind::USAGE);
}
