#include "services/control_service.hpp"
#include "services/capability_prober.hpp"
#include "services/snapshot.hpp"
#include "infrastructure/network_config_service.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/wifi.hpp"

#include <iomanip>
#include <thread>

namespace wifiap
{
    namespace services
    {

        namespace
        {
            std::string or_dash(const std::string &value)
            {
                return value.empty() ? "--" : value;
            }
        }

        ControlService::ControlService(infrastructure::NetworkConfigService &network,
                                       CapabilityProber &prober,
                                       std::chrono::seconds restart_delay,
                                       std::ostream &out)
            : network_(network), prober_(prober), restart_delay_(restart_delay), out_(out),
              logger_(core::get_logger("ControlService"))
        {
        }

        Outcome ControlService::run(const std::string &command, const std::string &name, const std::string &interface)
        {
            if (command == "start")
            {
                return start(name, interface);
            }
            if (command == "stop")
            {
                return stop(name);
            }
            if (command == "restart")
            {
                return restart(name, interface);
            }
            if (command == "status")
            {
                return status(name);
            }
            if (command == "list")
            {
                return list();
            }
            if (command == "delete")
            {
                return remove(name);
            }
            if (command == "interfaces")
            {
                return interfaces();
            }
            throw core::usage_error("Unknown control command '" + command + "'");
        }

        std::string ControlService::resolve_name(const std::string &name, const core::SystemSnapshot &snapshot) const
        {
            if (!name.empty())
            {
                return name;
            }

            auto profiles = snapshot.ap_profiles();
            if (profiles.empty())
            {
                throw core::precondition_error("No access point connections found",
                                               {"Create one with: wifi-ap create <SSID> <PASSWORD>"});
            }
            out_ << "No connection specified, using '" << profiles.front().name << "'" << std::endl;
            return profiles.front().name;
        }

        Outcome ControlService::start(const std::string &name, const std::string &interface)
        {
            auto snapshot = take_snapshot(network_);
            std::string target = resolve_name(name, snapshot);

            out_ << "Starting access point '" << target << "'..." << std::endl;
            auto result = network_.activate(target, interface);
            if (!result.ok())
            {
                throw core::external_error("Failed to start access point '" + target + "'", {result.message()});
            }
            out_ << "SUCCESS: Access point '" << target << "' started" << std::endl;
            return Outcome::COMPLETED;
        }

        Outcome ControlService::stop(const std::string &name)
        {
            if (!name.empty())
            {
                out_ << "Stopping access point '" << name << "'..." << std::endl;
                auto result = network_.deactivate(name);
                if (!result.ok())
                {
                    logger_->info("Deactivate failed", core::LogContext().add("profile", name).add("error", result.message()));
                    out_ << "Failed to stop '" << name << "' (it may not be active)" << std::endl;
                    return Outcome::COMPLETED;
                }
                out_ << "SUCCESS: Access point '" << name << "' stopped" << std::endl;
                return Outcome::COMPLETED;
            }

            auto snapshot = take_snapshot(network_);
            bool stopped_any = false;
            for (const auto &profile : snapshot.ap_profiles())
            {
                if (!profile.is_active())
                {
                    continue;
                }
                stopped_any = true;
                out_ << "Stopping access point '" << profile.name << "'..." << std::endl;
                auto result = network_.deactivate(profile.name);
                if (!result.ok())
                {
                    logger_->warning("Failed to stop access point",
                                     core::LogContext().add("profile", profile.name).add("error", result.message()));
                }
            }

            if (!stopped_any)
            {
                out_ << "No active access points found" << std::endl;
            }
            return Outcome::COMPLETED;
        }

        Outcome ControlService::restart(const std::string &name, const std::string &interface)
        {
            auto snapshot = take_snapshot(network_);
            std::string target = resolve_name(name, snapshot);

            out_ << "Restarting access point '" << target << "'..." << std::endl;
            auto down = network_.deactivate(target);
            if (!down.ok())
            {
                logger_->debug("Deactivate before restart failed",
                               core::LogContext().add("profile", target).add("error", down.message()));
            }

            if (restart_delay_.count() > 0)
            {
                std::this_thread::sleep_for(restart_delay_);
            }

            auto up = network_.activate(target, interface);
            if (!up.ok())
            {
                throw core::external_error("Failed to restart access point '" + target + "'", {up.message()});
            }
            out_ << "SUCCESS: Access point '" << target << "' restarted" << std::endl;
            return Outcome::COMPLETED;
        }

        Outcome ControlService::status(const std::string &name)
        {
            auto snapshot = take_snapshot(network_);

            if (!name.empty())
            {
                auto settings = network_.show_profile(name);
                if (!settings)
                {
                    throw core::precondition_error("Connection '" + name + "' not found");
                }

                out_ << "Connection: " << settings->name << std::endl;
                out_ << "State: " << (settings->is_active() ? "activated" : "inactive") << std::endl;
                if (settings->is_active())
                {
                    print_details(settings->name);
                    print_device_table(snapshot);
                }
                return Outcome::COMPLETED;
            }

            auto profiles = snapshot.ap_profiles();
            out_ << "=== Access Point Connections ===" << std::endl;
            if (profiles.empty())
            {
                out_ << "  (none)" << std::endl;
            }
            for (const auto &profile : profiles)
            {
                out_ << "  " << (profile.is_active() ? "[ACTIVE]   " : "[INACTIVE] ") << profile.name;
                if (profile.is_active() && !profile.device.empty())
                {
                    out_ << " on " << profile.device;
                }
                out_ << std::endl;
            }

            out_ << std::endl;
            print_device_table(snapshot);

            for (const auto &profile : profiles)
            {
                if (profile.is_active())
                {
                    out_ << std::endl
                         << "--- " << profile.name << " ---" << std::endl;
                    print_details(profile.name);
                }
            }
            return Outcome::COMPLETED;
        }

        Outcome ControlService::list()
        {
            auto profiles = network_.list_profiles();

            out_ << std::left << std::setw(32) << "NAME" << std::setw(18) << "TYPE" << std::setw(12) << "DEVICE"
                 << "STATE" << std::endl;
            for (const auto &profile : profiles)
            {
                if (!profile.is_wireless())
                {
                    continue;
                }
                out_ << std::left << std::setw(32) << profile.name << std::setw(18) << profile.type << std::setw(12)
                     << or_dash(profile.device) << or_dash(profile.state) << std::endl;
            }
            return Outcome::COMPLETED;
        }

        Outcome ControlService::remove(const std::string &name)
        {
            if (name.empty())
            {
                throw core::usage_error("Connection name required for delete");
            }

            out_ << "Deleting connection '" << name << "'..." << std::endl;
            auto result = network_.delete_profile(name);
            if (!result.ok())
            {
                throw core::external_error("Failed to delete connection '" + name + "'", {result.message()});
            }
            out_ << "SUCCESS: Connection '" << name << "' deleted" << std::endl;
            return Outcome::COMPLETED;
        }

        Outcome ControlService::interfaces()
        {
            auto devices = network_.list_devices();

            out_ << "=== WiFi Interfaces ===" << std::endl;
            bool any = false;
            for (const auto &iface : devices)
            {
                if (!iface.is_wifi())
                {
                    continue;
                }
                any = true;

                out_ << iface.name << std::endl;
                out_ << "  Type: " << iface.type << (iface.is_p2p ? " (P2P, not usable for AP)" : "") << std::endl;
                out_ << "  State: " << iface.state << std::endl;
                out_ << "  Connection: " << or_dash(iface.connection) << std::endl;

                auto ap_mode = prober_.supports_ap_mode(iface.name);
                out_ << "  AP mode: " << (ap_mode ? (*ap_mode ? "supported" : "not supported") : "unknown") << std::endl;

                auto bands = prober_.supported_bands(iface.name);
                out_ << "  Bands: ";
                if (!bands)
                {
                    out_ << "unknown";
                }
                else if (bands->empty())
                {
                    out_ << "none";
                }
                else
                {
                    for (std::size_t i = 0; i < bands->size(); ++i)
                    {
                        out_ << (i ? ", " : "") << core::band_label((*bands)[i]);
                    }
                }
                out_ << std::endl;
            }

            if (!any)
            {
                out_ << "  (no WiFi interfaces found)" << std::endl;
            }
            return Outcome::COMPLETED;
        }

        void ControlService::print_device_table(const core::SystemSnapshot &snapshot)
        {
            out_ << std::left << std::setw(16) << "DEVICE" << std::setw(12) << "TYPE" << std::setw(16) << "STATE"
                 << "CONNECTION" << std::endl;
            for (const auto &iface : snapshot.wifi_interfaces())
            {
                out_ << std::left << std::setw(16) << iface.name << std::setw(12) << iface.type << std::setw(16)
                     << iface.state << or_dash(iface.connection) << std::endl;
            }
        }

        void ControlService::print_details(const std::string &name)
        {
            auto settings = network_.show_profile(name);
            if (!settings)
            {
                return;
            }
            out_ << "  SSID: " << settings->ssid << std::endl;
            out_ << "  Interface: " << or_dash(settings->interface) << std::endl;
            out_ << "  Band: " << (settings->band ? core::band_label(*settings->band) : std::string("auto")) << std::endl;
            out_ << "  Channel: " << (settings->channel ? std::to_string(settings->channel) : std::string("auto"))
                 << std::endl;
            out_ << "  IP Address: " << or_dash(settings->ip_cidr) << std::endl;
            out_ << "  Security: " << or_dash(settings->key_mgmt) << std::endl;
        }

    } // namespace services
} // namespace wifiap
