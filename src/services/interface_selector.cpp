#include "services/interface_selector.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <vector>

namespace wifiap
{
    namespace services
    {

        namespace
        {
            std::string describe(const core::InterfaceDescriptor &iface)
            {
                std::string line = "  " + iface.name + " (" + iface.state;
                if (!iface.connection.empty())
                {
                    line += ", " + iface.connection;
                }
                return line + ")";
            }

            std::vector<std::string> describe_wifi(const core::SystemSnapshot &snapshot)
            {
                std::vector<std::string> lines;
                for (const auto &iface : snapshot.wifi_interfaces())
                {
                    lines.push_back(describe(iface) + (iface.is_p2p ? " [p2p, not usable]" : ""));
                }
                return lines;
            }
        }

        InterfaceSelection select_interface(const core::SystemSnapshot &snapshot)
        {
            auto logger = core::get_logger("InterfaceSelector");
            auto ap_profiles = snapshot.ap_profiles();

            // An AP that is up wins over one that is merely configured
            for (const auto &profile : ap_profiles)
            {
                if (profile.is_active() && !profile.device.empty())
                {
                    logger->info("Found active access point",
                                 core::LogContext().add("profile", profile.name).add("interface", profile.device));
                    return {profile.device, InterfaceChoice::EXISTING_AP};
                }
            }
            for (const auto &profile : ap_profiles)
            {
                auto it = snapshot.ap_bindings.find(profile.name);
                if (it != snapshot.ap_bindings.end() && !it->second.empty())
                {
                    logger->info("Found configured access point",
                                 core::LogContext().add("profile", profile.name).add("interface", it->second));
                    return {it->second, InterfaceChoice::EXISTING_AP};
                }
            }

            std::vector<core::InterfaceDescriptor> candidates;
            for (const auto &iface : snapshot.interfaces)
            {
                if (iface.is_ap_candidate())
                {
                    candidates.push_back(iface);
                }
            }

            if (candidates.size() == 1)
            {
                return {candidates.front().name, InterfaceChoice::ONLY_CANDIDATE};
            }

            if (candidates.size() > 1)
            {
                std::vector<std::string> details;
                for (const auto &iface : candidates)
                {
                    details.push_back(describe(iface));
                }
                throw core::precondition_error("Multiple WiFi interfaces detected. Please specify which one to use", details);
            }

            auto details = describe_wifi(snapshot);
            details.push_back("Note: P2P and unmanaged interfaces are not suitable for access points");
            throw core::precondition_error("No suitable WiFi interfaces found", details);
        }

        InterfaceSelection check_interface(const core::SystemSnapshot &snapshot, const std::string &interface)
        {
            const auto *iface = snapshot.find_interface(interface);
            if (!iface || !iface->is_wifi())
            {
                throw core::precondition_error("Interface '" + interface + "' not found or is not a WiFi interface",
                                               describe_wifi(snapshot));
            }
            if (iface->is_p2p)
            {
                throw core::precondition_error("P2P interface '" + interface + "' cannot be used for access points",
                                               {"Please specify a regular WiFi interface (e.g., wlan0, wlan1)"});
            }
            return {interface, InterfaceChoice::EXPLICIT};
        }

    } // namespace services
} // namespace wifiap
