#ifndef WIFIAP_INFRASTRUCTURE_NETWORK_CONFIG_SERVICE_HPP
#define WIFIAP_INFRASTRUCTURE_NETWORK_CONFIG_SERVICE_HPP

#include "core/types.hpp"
#include "infrastructure/command_runner.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wifiap
{
    namespace infrastructure
    {

        /**
         * Property assignments passed to profile create/modify, in order
         */
        using ProfileProperties = std::vector<std::pair<std::string, std::string>>;

        /**
         * Everything the tool asks of the network stack
         *
         * NetworkManager owns the profile store and the radios; this interface
         * is the only place that talks to it. Mutating calls return the raw
         * CommandResult so callers can report the external tool's verdict.
         */
        class NetworkConfigService
        {
        public:
            virtual ~NetworkConfigService() = default;

            // Queries
            virtual std::vector<core::InterfaceDescriptor> list_devices() = 0;
            virtual std::vector<core::ConnectionProfile> list_profiles() = 0;
            virtual std::optional<core::ProfileSettings> show_profile(const std::string &name) = 0;
            virtual std::vector<core::ScanEntry> scan_results(const std::string &interface) = 0;
            virtual std::optional<core::RadioInfo> radio_info(const std::string &interface) = 0;

            // Profile lifecycle
            virtual CommandResult create_profile(const std::string &name,
                                                 const std::string &interface,
                                                 const std::string &ssid,
                                                 const ProfileProperties &properties) = 0;
            virtual CommandResult modify_profile(const std::string &name, const ProfileProperties &properties) = 0;
            virtual CommandResult delete_profile(const std::string &name) = 0;
            virtual CommandResult activate(const std::string &name, const std::string &interface = "") = 0;
            virtual CommandResult deactivate(const std::string &name) = 0;

            // Devices and radio
            virtual CommandResult disconnect_device(const std::string &interface) = 0;
            virtual CommandResult set_wifi_radio(bool enabled) = 0;
            virtual CommandResult set_managed(const std::string &interface, bool managed) = 0;
            virtual CommandResult rescan(const std::string &interface) = 0;
        };

    } // namespace infrastructure
} // namespace wifiap

#endif // WIFIAP_INFRASTRUCTURE_NETWORK_CONFIG_SERVICE_HPP
