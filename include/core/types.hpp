#ifndef WIFIAP_CORE_TYPES_HPP
#define WIFIAP_CORE_TYPES_HPP

#include <string>
#include <vector>
#include <optional>
#include <map>

namespace wifiap
{
    namespace core
    {

        /**
         * Radio band of an access point
         */
        enum class Band
        {
            GHZ_2_4,
            GHZ_5
        };

        /**
         * Access point parameters collected for one create invocation
         */
        struct APConfig
        {
            std::string ssid;
            std::string password;
            std::string interface;
            Band band = Band::GHZ_2_4;
            int channel = 0;
            std::string ip_cidr;
        };

        /**
         * One row of the profile listing (NAME,TYPE,DEVICE,STATE)
         */
        struct ConnectionProfile
        {
            std::string name;
            std::string type;
            std::string device;
            std::string state;

            bool is_wireless() const { return type == "802-11-wireless" || type == "wifi"; }
            bool is_active() const { return state == "activated"; }
        };

        /**
         * Detailed settings of one profile as stored by NetworkManager
         */
        struct ProfileSettings
        {
            std::string name;
            std::string interface;
            std::string ssid;
            std::string password;
            std::string mode;
            std::optional<Band> band;
            int channel = 0;
            std::string ip_cidr;
            std::string key_mgmt;
            std::string state;

            bool is_active() const { return state == "activated"; }
        };

        /**
         * One network seen in a scan
         */
        struct ScanEntry
        {
            std::string ssid;
            int channel = 0;
            int signal = 0;
        };

        struct ChannelUsageSample
        {
            int channel = 0;
            int count = 0;
        };

        /**
         * One row of the device listing (DEVICE,TYPE,STATE,CONNECTION)
         */
        struct InterfaceDescriptor
        {
            std::string name;
            std::string type;
            std::string state;
            std::string connection;
            bool managed = true;
            bool is_p2p = false;

            bool is_wifi() const { return type == "wifi" || type == "wifi-p2p"; }
            bool is_connected() const { return state == "connected"; }
            bool is_ap_candidate() const { return type == "wifi" && managed && !is_p2p; }
        };

        /**
         * What iw reports about the physical radio behind an interface
         */
        struct RadioInfo
        {
            std::string phy;
            std::vector<int> frequencies_mhz;
            bool has_band1 = false;
            bool has_band2 = false;
            bool supports_ap = false;
        };

        /**
         * System state fetched once per command and passed to the decision functions
         */
        struct SystemSnapshot
        {
            std::vector<InterfaceDescriptor> interfaces;
            std::vector<ConnectionProfile> profiles;
            // AP profile name -> configured connection.interface-name
            std::map<std::string, std::string> ap_bindings;

            const InterfaceDescriptor *find_interface(const std::string &name) const;
            const ConnectionProfile *find_profile(const std::string &name) const;
            std::vector<ConnectionProfile> ap_profiles() const;
            std::vector<InterfaceDescriptor> wifi_interfaces() const;
        };

    } // namespace core
} // namespace wifiap

#endif // WIFIAP_CORE_TYPES_HPP
