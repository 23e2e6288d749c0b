/**
 * NetworkManager backend
 * Every nmcli/iw invocation of the tool is issued from here
 */

#include "infrastructure/nmcli_service.hpp"
#include "infrastructure/nmcli_parser.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

namespace wifiap
{
    namespace infrastructure
    {

        NmcliNetworkConfigService::NmcliNetworkConfigService(const core::ToolsConfig &tools,
                                                             std::shared_ptr<CommandRunner> runner)
            : nmcli_(tools.nmcli), iw_(tools.iw), runner_(std::move(runner)),
              logger_(core::get_logger("NmcliService"))
        {
        }

        std::vector<core::InterfaceDescriptor> NmcliNetworkConfigService::list_devices()
        {
            auto result = run_nmcli({"-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device", "status"});
            if (!result.ok())
            {
                logger_->warning("Failed to get device status from NetworkManager",
                                 core::LogContext().add("error", result.message()));
                return {};
            }
            return parser::parse_device_status(result.output);
        }

        std::vector<core::ConnectionProfile> NmcliNetworkConfigService::list_profiles()
        {
            auto result = run_nmcli({"-t", "-f", "NAME,TYPE,DEVICE,STATE", "connection", "show"});
            if (!result.ok())
            {
                logger_->warning("Failed to list connection profiles",
                                 core::LogContext().add("error", result.message()));
                return {};
            }
            return parser::parse_connection_list(result.output);
        }

        std::optional<core::ProfileSettings> NmcliNetworkConfigService::show_profile(const std::string &name)
        {
            // -s reveals the PSK; without root nmcli simply leaves it blank
            auto result = run_nmcli({"-s", "-t", "-f",
                                     "connection.id,connection.interface-name,"
                                     "802-11-wireless.ssid,802-11-wireless.mode,"
                                     "802-11-wireless.band,802-11-wireless.channel,"
                                     "ipv4.addresses,802-11-wireless-security.key-mgmt,"
                                     "802-11-wireless-security.psk,GENERAL.STATE",
                                     "connection", "show", name});
            if (!result.ok())
            {
                logger_->debug("Profile not found", core::LogContext().add("profile", name));
                return std::nullopt;
            }
            return parser::parse_profile_settings(name, result.output);
        }

        std::vector<core::ScanEntry> NmcliNetworkConfigService::scan_results(const std::string &interface)
        {
            auto result = run_nmcli({"-t", "-f", "SSID,CHAN,SIGNAL", "device", "wifi", "list", "ifname", interface});
            if (!result.ok())
            {
                logger_->warning("Failed to read scan results",
                                 core::LogContext().add("interface", interface).add("error", result.message()));
                return {};
            }
            return parser::parse_wifi_list(result.output);
        }

        std::optional<core::RadioInfo> NmcliNetworkConfigService::radio_info(const std::string &interface)
        {
            auto dev = run_iw({"dev", interface, "info"});
            if (!dev.ok())
            {
                logger_->debug("iw dev info failed", core::LogContext().add("interface", interface).add("error", dev.message()));
                return std::nullopt;
            }

            auto phy = parser::parse_iw_dev_phy(dev.output);
            if (!phy)
            {
                return std::nullopt;
            }

            auto info = run_iw({"phy", *phy, "info"});
            if (!info.ok())
            {
                logger_->debug("iw phy info failed", core::LogContext().add("phy", *phy).add("error", info.message()));
                return std::nullopt;
            }
            return parser::parse_iw_phy_info(*phy, info.output);
        }

        CommandResult NmcliNetworkConfigService::create_profile(const std::string &name,
                                                                const std::string &interface,
                                                                const std::string &ssid,
                                                                const ProfileProperties &properties)
        {
            std::vector<std::string> args = {
                "connection", "add",
                "type", "wifi",
                "ifname", interface,
                "con-name", name,
                "autoconnect", "no",
                "ssid", ssid};
            for (const auto &[key, value] : properties)
            {
                args.push_back(key);
                args.push_back(value);
            }
            return run_nmcli(args);
        }

        CommandResult NmcliNetworkConfigService::modify_profile(const std::string &name, const ProfileProperties &properties)
        {
            std::vector<std::string> args = {"connection", "modify", name};
            for (const auto &[key, value] : properties)
            {
                args.push_back(key);
                args.push_back(value);
            }
            return run_nmcli(args);
        }

        CommandResult NmcliNetworkConfigService::delete_profile(const std::string &name)
        {
            return run_nmcli({"connection", "delete", name});
        }

        CommandResult NmcliNetworkConfigService::activate(const std::string &name, const std::string &interface)
        {
            if (interface.empty())
            {
                return run_nmcli({"connection", "up", name});
            }
            return run_nmcli({"connection", "up", name, "ifname", interface});
        }

        CommandResult NmcliNetworkConfigService::deactivate(const std::string &name)
        {
            return run_nmcli({"connection", "down", name});
        }

        CommandResult NmcliNetworkConfigService::disconnect_device(const std::string &interface)
        {
            return run_nmcli({"device", "disconnect", interface});
        }

        CommandResult NmcliNetworkConfigService::set_wifi_radio(bool enabled)
        {
            return run_nmcli({"radio", "wifi", enabled ? "on" : "off"});
        }

        CommandResult NmcliNetworkConfigService::set_managed(const std::string &interface, bool managed)
        {
            return run_nmcli({"device", "set", interface, "managed", managed ? "yes" : "no"});
        }

        CommandResult NmcliNetworkConfigService::rescan(const std::string &interface)
        {
            return run_nmcli({"device", "wifi", "rescan", "ifname", interface});
        }

        CommandResult NmcliNetworkConfigService::run_nmcli(const std::vector<std::string> &args)
        {
            std::vector<std::string> argv;
            argv.reserve(args.size() + 1);
            argv.push_back(nmcli_);
            argv.insert(argv.end(), args.begin(), args.end());
            return runner_->run(argv);
        }

        CommandResult NmcliNetworkConfigService::run_iw(const std::vector<std::string> &args)
        {
            std::vector<std::string> argv;
            argv.reserve(args.size() + 1);
            argv.push_back(iw_);
            argv.insert(argv.end(), args.begin(), args.end());
            return runner_->run(argv);
        }

    } // namespace infrastructure
} // namespace wifiap
