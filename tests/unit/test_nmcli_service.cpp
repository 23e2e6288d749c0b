#include "infrastructure/command_runner.hpp"
#include "infrastructure/nmcli_service.hpp"
#include "core/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <memory>

using namespace wifiap;
using namespace wifiap::infrastructure;

namespace {

/**
 * Records argv and answers from canned output keyed by the joined command
 */
class RecordingRunner : public CommandRunner {
  public:
    std::vector<std::vector<std::string>> commands;
    std::map<std::string, CommandResult> answers;

    CommandResult run(const std::vector<std::string>& argv) override {
        commands.push_back(argv);
        std::string key;
        for (const auto& arg : argv) {
            key += (key.empty() ? "" : " ") + arg;
        }
        auto it = answers.find(key);
        if (it != answers.end()) {
            return it->second;
        }
        CommandResult ok;
        ok.exit_code = 0;
        return ok;
    }

    void answer(const std::string& command, const std::string& output, int exit_code = 0) {
        CommandResult result;
        result.exit_code = exit_code;
        result.output = output;
        answers[command] = result;
    }
};

struct ServiceFixture {
    core::ToolsConfig tools;
    std::shared_ptr<RecordingRunner> runner = std::make_shared<RecordingRunner>();
    std::unique_ptr<NmcliNetworkConfigService> service;

    ServiceFixture() {
        tools.nmcli = "/usr/bin/nmcli";
        service = std::make_unique<NmcliNetworkConfigService>(tools, runner);
    }
};

} // namespace

TEST_CASE("nmcli service: create passes every property as its own argument", "[nmcli][service]") {
    ServiceFixture f;
    auto result = f.service->create_profile("My Cafe-AP", "wlan0", "My Cafe; rm -rf /",
                                            {{"wifi.mode", "ap"}, {"wifi-sec.psk", "p@ss word"}});
    REQUIRE(result.ok());
    REQUIRE(f.runner->commands.size() == 1);
    REQUIRE(f.runner->commands[0] == std::vector<std::string>{
                                         "/usr/bin/nmcli", "connection", "add", "type", "wifi", "ifname", "wlan0",
                                         "con-name", "My Cafe-AP", "autoconnect", "no", "ssid", "My Cafe; rm -rf /",
                                         "wifi.mode", "ap", "wifi-sec.psk", "p@ss word"});
}

TEST_CASE("nmcli service: activation with and without interface", "[nmcli][service]") {
    ServiceFixture f;
    f.service->activate("Cafe-AP", "");
    f.service->activate("Cafe-AP", "wlan1");
    REQUIRE(f.runner->commands[0] == std::vector<std::string>{"/usr/bin/nmcli", "connection", "up", "Cafe-AP"});
    REQUIRE(f.runner->commands[1] ==
            std::vector<std::string>{"/usr/bin/nmcli", "connection", "up", "Cafe-AP", "ifname", "wlan1"});
}

TEST_CASE("nmcli service: radio info goes through iw dev then iw phy", "[nmcli][service]") {
    ServiceFixture f;
    f.runner->answer("iw dev wlan0 info", "Interface wlan0\n\twiphy 2\n");
    f.runner->answer("iw phy phy2 info", "Wiphy phy2\n\tBand 2:\n\t\t\t* 5180 MHz [36]\n");

    auto radio = f.service->radio_info("wlan0");
    REQUIRE(radio);
    REQUIRE(radio->phy == "phy2");
    REQUIRE(radio->has_band2);
}

TEST_CASE("nmcli service: failed queries yield empty results", "[nmcli][service]") {
    ServiceFixture f;
    f.runner->answer("iw dev wlan9 info", "", 237);
    f.runner->answer("/usr/bin/nmcli -t -f DEVICE,TYPE,STATE,CONNECTION device status", "", 8);

    REQUIRE_FALSE(f.service->radio_info("wlan9").has_value());
    REQUIRE(f.service->list_devices().empty());
}

TEST_CASE("nmcli service: missing profile", "[nmcli][service]") {
    ServiceFixture f;
    CommandResult missing;
    missing.exit_code = 10;
    missing.error = "Error: Nope-AP - no such connection profile.\n";
    f.runner->answers["/usr/bin/nmcli -s -t -f connection.id,connection.interface-name,802-11-wireless.ssid,"
                      "802-11-wireless.mode,802-11-wireless.band,802-11-wireless.channel,ipv4.addresses,"
                      "802-11-wireless-security.key-mgmt,802-11-wireless-security.psk,GENERAL.STATE "
                      "connection show Nope-AP"] = missing;

    REQUIRE_FALSE(f.service->show_profile("Nope-AP").has_value());
    REQUIRE(missing.message() == "Error: Nope-AP - no such connection profile.");
}

TEST_CASE("Command description masks secrets", "[nmcli][service]") {
    auto text = describe_command({"nmcli", "connection", "add", "ssid", "My Cafe", "wifi-sec.psk", "secret123"});
    REQUIRE(text == "nmcli connection add ssid \"My Cafe\" wifi-sec.psk ********");
}

TEST_CASE("Process runner captures output and exit status", "[command]") {
    ProcessCommandRunner runner;

    auto echo = runner.run({"echo", "hello; world"});
    REQUIRE(echo.ok());
    REQUIRE(echo.output == "hello; world\n");

    auto missing = runner.run({"wifi-ap-no-such-binary"});
    REQUIRE(missing.exit_code == 127);
    REQUIRE_FALSE(missing.ok());
}
