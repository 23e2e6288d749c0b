#include "infrastructure/nmcli_parser.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace wifiap;
using namespace wifiap::infrastructure::parser;

// ============================================================================
// Terse field splitting
// ============================================================================

TEST_CASE("nmcli parser: terse fields honour escapes", "[parser][nmcli]") {
    auto fields = split_terse_fields(R"(Cafe\: Guest:6:72)");
    REQUIRE(fields.size() == 3);
    REQUIRE(fields[0] == "Cafe: Guest");
    REQUIRE(fields[1] == "6");
    REQUIRE(fields[2] == "72");

    fields = split_terse_fields(R"(back\\slash::end)");
    REQUIRE(fields.size() == 3);
    REQUIRE(fields[0] == R"(back\slash)");
    REQUIRE(fields[1].empty());
    REQUIRE(fields[2] == "end");
}

// ============================================================================
// Device and connection listings
// ============================================================================

TEST_CASE("nmcli parser: device status", "[parser][nmcli]") {
    const std::string output =
        "wlan0:wifi:connected:Home WiFi\n"
        "wlan1:wifi:disconnected:--\n"
        "p2p-dev-wlan0:wifi-p2p:disconnected:--\n"
        "eth0:ethernet:unmanaged:--\n"
        "lo:loopback:unmanaged:--\n";

    auto devices = parse_device_status(output);
    REQUIRE(devices.size() == 5);

    REQUIRE(devices[0].name == "wlan0");
    REQUIRE(devices[0].connection == "Home WiFi");
    REQUIRE(devices[0].is_connected());
    REQUIRE(devices[0].is_ap_candidate());

    REQUIRE(devices[1].connection.empty());
    REQUIRE(devices[1].is_ap_candidate());

    REQUIRE(devices[2].is_p2p);
    REQUIRE(devices[2].is_wifi());
    REQUIRE_FALSE(devices[2].is_ap_candidate());

    REQUIRE_FALSE(devices[3].managed);
    REQUIRE_FALSE(devices[3].is_wifi());
}

TEST_CASE("nmcli parser: connection list", "[parser][nmcli]") {
    const std::string output =
        "My_Home_AP-AP:802-11-wireless:wlan0:activated\n"
        "Wired connection 1:802-3-ethernet::\n"
        "Office\\:Guest:802-11-wireless::\n";

    auto profiles = parse_connection_list(output);
    REQUIRE(profiles.size() == 3);
    REQUIRE(profiles[0].name == "My_Home_AP-AP");
    REQUIRE(profiles[0].is_wireless());
    REQUIRE(profiles[0].is_active());
    REQUIRE(profiles[0].device == "wlan0");
    REQUIRE_FALSE(profiles[1].is_wireless());
    REQUIRE(profiles[2].name == "Office:Guest");
    REQUIRE_FALSE(profiles[2].is_active());
}

TEST_CASE("nmcli parser: profile settings", "[parser][nmcli]") {
    const std::string output =
        "connection.id:Cafe-AP\n"
        "connection.interface-name:wlan1\n"
        "802-11-wireless.ssid:Cafe: Free\n"
        "802-11-wireless.mode:ap\n"
        "802-11-wireless.band:a\n"
        "802-11-wireless.channel:44\n"
        "ipv4.addresses:10.0.0.1/24\n"
        "802-11-wireless-security.key-mgmt:wpa-psk\n"
        "802-11-wireless-security.psk:hunter22\n"
        "GENERAL.STATE:activated\n";

    auto settings = parse_profile_settings("Cafe-AP", output);
    REQUIRE(settings.name == "Cafe-AP");
    REQUIRE(settings.interface == "wlan1");
    REQUIRE(settings.ssid == "Cafe: Free");
    REQUIRE(settings.mode == "ap");
    REQUIRE(settings.band == core::Band::GHZ_5);
    REQUIRE(settings.channel == 44);
    REQUIRE(settings.ip_cidr == "10.0.0.1/24");
    REQUIRE(settings.password == "hunter22");
    REQUIRE(settings.is_active());
}

TEST_CASE("nmcli parser: unset profile values", "[parser][nmcli]") {
    auto settings = parse_profile_settings("Bare-AP",
                                           "connection.interface-name:--\n"
                                           "802-11-wireless.band:--\n"
                                           "802-11-wireless.channel:0\n");
    REQUIRE(settings.interface.empty());
    REQUIRE_FALSE(settings.band.has_value());
    REQUIRE(settings.channel == 0);
    REQUIRE_FALSE(settings.is_active());
}

TEST_CASE("nmcli parser: wifi scan list", "[parser][nmcli]") {
    const std::string output =
        "Neighbour:1:80\n"
        "Cafe\\: Free:6:55\n"
        ":11:30\n"
        "Broken:--:10\n";

    auto entries = parse_wifi_list(output);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].channel == 1);
    REQUIRE(entries[0].signal == 80);
    REQUIRE(entries[1].ssid == "Cafe: Free");
    REQUIRE(entries[2].ssid.empty());
    REQUIRE(entries[2].channel == 11);
}

// ============================================================================
// iw output
// ============================================================================

TEST_CASE("iw parser: dev info resolves wiphy", "[parser][iw]") {
    const std::string output =
        "Interface wlan0\n"
        "\tifindex 3\n"
        "\twdev 0x1\n"
        "\taddr dc:a6:32:00:00:01\n"
        "\ttype managed\n"
        "\twiphy 0\n"
        "\tchannel 6 (2437 MHz), width: 20 MHz, center1: 2437 MHz\n";

    REQUIRE(parse_iw_dev_phy(output) == std::string("phy0"));
    REQUIRE_FALSE(parse_iw_dev_phy("command failed: No such device (-19)\n").has_value());
}

TEST_CASE("iw parser: dual band radio with AP mode", "[parser][iw]") {
    const std::string output =
        "Wiphy phy0\n"
        "\tmax # scan SSIDs: 10\n"
        "\tSupported interface modes:\n"
        "\t\t * IBSS\n"
        "\t\t * managed\n"
        "\t\t * AP\n"
        "\t\t * P2P-client\n"
        "\tBand 1:\n"
        "\t\tFrequencies:\n"
        "\t\t\t* 2412 MHz [1] (20.0 dBm)\n"
        "\t\t\t* 2437 MHz [6] (20.0 dBm)\n"
        "\tBand 2:\n"
        "\t\tFrequencies:\n"
        "\t\t\t* 5180.0 MHz [36] (20.0 dBm)\n"
        "\t\t\t* 5745 MHz [149] (disabled)\n";

    auto radio = parse_iw_phy_info("phy0", output);
    REQUIRE(radio.phy == "phy0");
    REQUIRE(radio.supports_ap);
    REQUIRE(radio.has_band1);
    REQUIRE(radio.has_band2);
    REQUIRE(radio.frequencies_mhz.size() == 4);
    REQUIRE(radio.frequencies_mhz[2] == 5180);
}

TEST_CASE("iw parser: 2.4GHz-only radio without AP mode", "[parser][iw]") {
    const std::string output =
        "Wiphy phy1\n"
        "\tSupported interface modes:\n"
        "\t\t * managed\n"
        "\t\t * AP/VLAN\n"
        "\t\t * monitor\n"
        "\tBand 1:\n"
        "\t\tFrequencies:\n"
        "\t\t\t* 2462 MHz [11] (20.0 dBm)\n";

    auto radio = parse_iw_phy_info("phy1", output);
    REQUIRE_FALSE(radio.supports_ap);
    REQUIRE(radio.has_band1);
    REQUIRE_FALSE(radio.has_band2);
    REQUIRE(radio.frequencies_mhz == std::vector<int>{2462});
}
