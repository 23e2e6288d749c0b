#include "services/reset_service.hpp"
#include "services/snapshot.hpp"
#include "infrastructure/network_config_service.hpp"
#include "core/logger.hpp"
#include "core/prompter.hpp"

namespace wifiap
{
    namespace services
    {

        ResetService::ResetService(infrastructure::NetworkConfigService &network, core::Prompter &prompter,
                                   std::ostream &out)
            : network_(network), prompter_(prompter), out_(out), logger_(core::get_logger("ResetService"))
        {
        }

        Outcome ResetService::reset()
        {
            out_ << "This will remove all access point connections and restore normal WiFi client operation."
                 << std::endl;
            if (!prompter_.confirm("Continue with reset?"))
            {
                out_ << "Reset cancelled." << std::endl;
                return Outcome::CANCELLED;
            }

            auto snapshot = take_snapshot(network_);
            remove_ap_profiles(snapshot);
            restore_interfaces(snapshot);

            out_ << std::endl
                 << "SUCCESS: WiFi reset complete. Interfaces are back in client mode." << std::endl;

            // Rescans were just triggered, so the listing is taken again
            snapshot.interfaces = network_.list_devices();
            list_networks(snapshot);
            return Outcome::COMPLETED;
        }

        void ResetService::remove_ap_profiles(const core::SystemSnapshot &snapshot)
        {
            auto profiles = snapshot.ap_profiles();
            if (profiles.empty())
            {
                out_ << "No access point connections found." << std::endl;
                return;
            }

            for (const auto &profile : profiles)
            {
                out_ << "Removing access point connection '" << profile.name << "'..." << std::endl;

                // Inactive profiles make "down" fail; that is expected here
                auto down = network_.deactivate(profile.name);
                if (!down.ok())
                {
                    logger_->debug("Deactivate before delete failed",
                                   core::LogContext().add("profile", profile.name).add("error", down.message()));
                }

                auto removed = network_.delete_profile(profile.name);
                if (!removed.ok())
                {
                    logger_->warning("Failed to delete access point connection",
                                     core::LogContext().add("profile", profile.name).add("error", removed.message()));
                }
            }
        }

        void ResetService::restore_interfaces(const core::SystemSnapshot &snapshot)
        {
            auto radio = network_.set_wifi_radio(true);
            if (!radio.ok())
            {
                logger_->warning("Failed to enable WiFi radio", core::LogContext().add("error", radio.message()));
            }

            for (const auto &iface : snapshot.wifi_interfaces())
            {
                if (iface.is_p2p)
                {
                    continue;
                }

                out_ << "Restoring interface " << iface.name << " to managed client mode..." << std::endl;

                auto managed = network_.set_managed(iface.name, true);
                if (!managed.ok())
                {
                    logger_->warning("Failed to set interface managed",
                                     core::LogContext().add("interface", iface.name).add("error", managed.message()));
                }

                auto scan = network_.rescan(iface.name);
                if (!scan.ok())
                {
                    logger_->warning("WiFi rescan failed",
                                     core::LogContext().add("interface", iface.name).add("error", scan.message()));
                }
            }
        }

        void ResetService::list_networks(const core::SystemSnapshot &snapshot)
        {
            for (const auto &iface : snapshot.wifi_interfaces())
            {
                if (iface.is_p2p)
                {
                    continue;
                }

                auto networks = network_.scan_results(iface.name);
                out_ << std::endl
                     << "Available networks on " << iface.name << ":" << std::endl;
                if (networks.empty())
                {
                    out_ << "  (none visible yet, scanning may take a few seconds)" << std::endl;
                    continue;
                }

                std::size_t shown = 0;
                for (const auto &entry : networks)
                {
                    if (shown == MAX_LISTED_NETWORKS)
                    {
                        break;
                    }
                    out_ << "  " << (entry.ssid.empty() ? "<hidden>" : entry.ssid) << " (channel " << entry.channel
                         << ", signal " << entry.signal << "%)" << std::endl;
                    ++shown;
                }
            }

            out_ << std::endl
                 << "To connect to a network: nmcli device wifi connect <SSID> password <PASSWORD>" << std::endl;
        }

    } // namespace services
} // namespace wifiap
