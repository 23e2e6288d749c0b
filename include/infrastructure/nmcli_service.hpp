#ifndef WIFIAP_INFRASTRUCTURE_NMCLI_SERVICE_HPP
#define WIFIAP_INFRASTRUCTURE_NMCLI_SERVICE_HPP

#include "infrastructure/network_config_service.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wifiap
{
    namespace core
    {
        class Logger;
        struct ToolsConfig;
    }
}

namespace wifiap
{
    namespace infrastructure
    {

        /**
         * NetworkConfigService backed by the nmcli and iw command line tools
         */
        class NmcliNetworkConfigService : public NetworkConfigService
        {
        public:
            NmcliNetworkConfigService(const core::ToolsConfig &tools, std::shared_ptr<CommandRunner> runner);

            std::vector<core::InterfaceDescriptor> list_devices() override;
            std::vector<core::ConnectionProfile> list_profiles() override;
            std::optional<core::ProfileSettings> show_profile(const std::string &name) override;
            std::vector<core::ScanEntry> scan_results(const std::string &interface) override;
            std::optional<core::RadioInfo> radio_info(const std::string &interface) override;

            CommandResult create_profile(const std::string &name,
                                         const std::string &interface,
                                         const std::string &ssid,
                                         const ProfileProperties &properties) override;
            CommandResult modify_profile(const std::string &name, const ProfileProperties &properties) override;
            CommandResult delete_profile(const std::string &name) override;
            CommandResult activate(const std::string &name, const std::string &interface) override;
            CommandResult deactivate(const std::string &name) override;

            CommandResult disconnect_device(const std::string &interface) override;
            CommandResult set_wifi_radio(bool enabled) override;
            CommandResult set_managed(const std::string &interface, bool managed) override;
            CommandResult rescan(const std::string &interface) override;

        private:
            CommandResult run_nmcli(const std::vector<std::string> &args);
            CommandResult run_iw(const std::vector<std::string> &args);

            std::string nmcli_;
            std::string iw_;
            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace wifiap

#endif // WIFIAP_INFRASTRUCTURE_NMCLI_SERVICE_HPP
