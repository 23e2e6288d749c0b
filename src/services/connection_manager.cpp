/**
 * Access point profile management
 * Creates, replaces, restarts and band-updates NetworkManager AP profiles
 */

#include "services/connection_manager.hpp"
#include "services/capability_prober.hpp"
#include "services/channel_selector.hpp"
#include "services/interface_selector.hpp"
#include "services/snapshot.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/prompter.hpp"
#include "core/wifi.hpp"

namespace wifiap
{
    namespace services
    {

        ConnectionManager::ConnectionManager(infrastructure::NetworkConfigService &network,
                                             CapabilityProber &prober,
                                             ChannelSelector &selector,
                                             core::Prompter &prompter,
                                             std::ostream &out)
            : network_(network), prober_(prober), selector_(selector), prompter_(prompter), out_(out),
              logger_(core::get_logger("ConnectionManager"))
        {
        }

        infrastructure::ProfileProperties ConnectionManager::ap_properties(const core::APConfig &config)
        {
            return {
                {"wifi.mode", "ap"},
                {"wifi.band", core::band_to_nm(config.band)},
                {"wifi.channel", std::to_string(config.channel)},
                {"ipv4.method", "shared"}, // NAT + DHCP through NetworkManager's dnsmasq
                {"ipv4.addresses", config.ip_cidr},
                {"ipv6.method", "disabled"},
                {"wifi-sec.key-mgmt", "wpa-psk"},
                {"wifi-sec.psk", config.password},
                {"wifi-sec.proto", "rsn"},     // WPA2 only
                {"wifi-sec.pairwise", "ccmp"}, // AES-CCMP
                {"wifi-sec.group", "ccmp"},
                {"wifi-sec.wps-method", "disabled"}};
        }

        Outcome ConnectionManager::create(const CreateRequest &request)
        {
            // Argument problems are reported before anything touches the system
            core::validate_ssid(request.ssid);
            core::validate_password(request.password);
            core::validate_ip_cidr(request.ip_cidr);
            if (request.channel)
            {
                core::validate_channel(request.band, *request.channel);
            }

            auto snapshot = take_snapshot(network_);

            InterfaceSelection selection;
            if (request.interface.empty())
            {
                out_ << "No interface specified, auto-detecting..." << std::endl;
                selection = select_interface(snapshot);
                if (selection.reason == InterfaceChoice::EXISTING_AP)
                {
                    out_ << "Found existing access point on interface: " << selection.interface << std::endl;
                    out_ << "Defaulting to update existing AP configuration" << std::endl;
                }
                else
                {
                    out_ << "Using only available interface: " << selection.interface << std::endl;
                }
            }
            else
            {
                selection = check_interface(snapshot, request.interface);
            }

            core::APConfig config;
            config.ssid = request.ssid;
            config.password = request.password;
            config.interface = selection.interface;
            config.band = request.band;
            config.ip_cidr = request.ip_cidr;

            if (!prober_.supports(config.interface, config.band))
            {
                throw core::precondition_error("Interface " + config.interface + " does not support the " +
                                               core::band_label(config.band) + " band");
            }

            if (request.channel)
            {
                config.channel = *request.channel;
            }
            else
            {
                config.channel = selector_.select(config.band, config.interface, config.ssid);
                out_ << "Auto-selected channel " << config.channel << " (" << core::band_label(config.band) << ")"
                     << std::endl;
            }

            const std::string profile_name = core::derive_profile_name(config.ssid);
            const core::ConnectionProfile *existing = snapshot.find_profile(profile_name);
            const core::InterfaceDescriptor *iface = snapshot.find_interface(config.interface);
            bool busy = iface && iface->is_connected() && iface->connection != profile_name;

            if (busy)
            {
                out_ << "Warning: Interface " << config.interface << " is currently connected";
                if (!iface->connection.empty())
                {
                    out_ << " to '" << iface->connection << "'";
                }
                out_ << std::endl;
                if (!prompter_.confirm("This will disconnect the existing connection. Continue?"))
                {
                    throw core::ApError(core::ErrorKind::ABORTED, "Aborted");
                }
            }

            print_summary(config, profile_name);
            if (existing)
            {
                out_ << "STATUS: Connection '" << profile_name << "' already exists (State: "
                     << (existing->state.empty() ? "inactive" : existing->state) << ")" << std::endl;
            }
            else
            {
                out_ << "STATUS: Will create new connection '" << profile_name << "'" << std::endl;
            }
            out_ << std::endl;

            if (!prompter_.confirm("Proceed with this configuration?"))
            {
                out_ << "Aborted" << std::endl;
                return Outcome::CANCELLED;
            }

            out_ << std::endl
                 << "Setting up WiFi Access Point..." << std::endl;

            if (busy)
            {
                out_ << "Disconnecting interface " << config.interface << "..." << std::endl;
                auto result = network_.disconnect_device(config.interface);
                if (!result.ok())
                {
                    logger_->warning("Failed to disconnect interface",
                                     core::LogContext().add("interface", config.interface).add("error", result.message()));
                }
            }

            if (existing)
            {
                int choice;
                if (request.replace)
                {
                    choice = 0;
                }
                else if (request.force)
                {
                    choice = 1;
                }
                else
                {
                    choice = prompter_.choose("Connection '" + profile_name + "' already exists. Do you want to:",
                                              {"Replace the existing configuration (recommended)",
                                               "Keep existing and just restart it",
                                               "Abort"});
                }

                if (choice != 0 && choice != 1)
                {
                    out_ << "Aborted" << std::endl;
                    return Outcome::CANCELLED;
                }

                if (existing->is_active())
                {
                    out_ << "Connection is currently active. Stopping it..." << std::endl;
                    network_.deactivate(profile_name);
                }

                if (choice == 1)
                {
                    out_ << "Keeping existing configuration, just restarting..." << std::endl;
                    auto result = network_.activate(profile_name);
                    if (!result.ok())
                    {
                        fail_activation("Could not restart existing connection", config.interface, result);
                    }
                    out_ << std::endl
                         << "SUCCESS: Existing WiFi Access Point restarted!" << std::endl;
                    out_ << "  Connection Name: " << profile_name << std::endl;
                    print_profile(profile_name);
                    return Outcome::COMPLETED;
                }

                out_ << "Deleting existing connection..." << std::endl;
                auto removed = network_.delete_profile(profile_name);
                if (!removed.ok())
                {
                    logger_->warning("Failed to delete existing connection",
                                     core::LogContext().add("profile", profile_name).add("error", removed.message()));
                }
            }

            out_ << "Creating access point connection..." << std::endl;
            logger_->info("Configuring WiFi AP with WPA2-PSK + AES-CCMP security (WPS disabled)",
                          core::LogContext()
                              .add("profile", profile_name)
                              .add("interface", config.interface)
                              .add("band", core::band_to_nm(config.band))
                              .add("channel", config.channel));

            auto created = network_.create_profile(profile_name, config.interface, config.ssid, ap_properties(config));
            if (!created.ok())
            {
                throw core::external_error("Failed to create access point connection '" + profile_name + "'",
                                           {created.message()});
            }

            out_ << "Starting access point..." << std::endl;
            auto activated = network_.activate(profile_name);
            if (!activated.ok())
            {
                fail_activation("Failed to start access point", config.interface, activated);
            }

            out_ << std::endl
                 << "SUCCESS: WiFi Access Point successfully created!" << std::endl;
            out_ << "  SSID: " << config.ssid << std::endl;
            out_ << "  Interface: " << config.interface << std::endl;
            out_ << "  Band: " << core::band_label(config.band) << std::endl;
            out_ << "  Channel: " << config.channel << std::endl;
            out_ << "  IP Address: " << config.ip_cidr << std::endl;
            out_ << "  Connection Name: " << profile_name << std::endl;
            out_ << std::endl
                 << "Clients can now connect to your access point." << std::endl;
            print_profile(profile_name);
            return Outcome::COMPLETED;
        }

        Outcome ConnectionManager::update_band(const std::string &name, core::Band band, std::optional<int> channel)
        {
            if (channel)
            {
                core::validate_channel(band, *channel);
            }

            auto settings = find_profile(name);
            if (!settings)
            {
                throw core::precondition_error("Connection '" + name + "' not found");
            }
            if (!settings->mode.empty() && settings->mode != "ap")
            {
                throw core::precondition_error("Connection '" + settings->name + "' is not an access point (mode: " +
                                               settings->mode + ")");
            }

            const std::string &interface = settings->interface;
            if (!interface.empty() && !prober_.supports(interface, band))
            {
                throw core::precondition_error("Interface " + interface + " does not support the " +
                                               core::band_label(band) + " band");
            }

            int new_channel;
            if (channel)
            {
                new_channel = *channel;
            }
            else
            {
                if (interface.empty())
                {
                    throw core::precondition_error("Connection '" + settings->name +
                                                   "' is not bound to an interface; specify a channel instead of auto");
                }
                new_channel = selector_.select(band, interface, settings->ssid);
                out_ << "Auto-selected channel " << new_channel << " (" << core::band_label(band) << ")" << std::endl;
            }

            out_ << "Updating '" << settings->name << "': band "
                 << (settings->band ? core::band_label(*settings->band) : std::string("auto")) << " -> "
                 << core::band_label(band) << ", channel " << settings->channel << " -> " << new_channel << std::endl;

            bool was_active = settings->is_active();
            if (was_active)
            {
                out_ << "Stopping active access point..." << std::endl;
                auto stopped = network_.deactivate(settings->name);
                if (!stopped.ok())
                {
                    logger_->warning("Failed to stop access point before update",
                                     core::LogContext().add("profile", settings->name).add("error", stopped.message()));
                }
            }

            auto modified = network_.modify_profile(settings->name,
                                                    {{"wifi.band", core::band_to_nm(band)},
                                                     {"wifi.channel", std::to_string(new_channel)}});
            if (!modified.ok())
            {
                if (was_active)
                {
                    // Bring the unchanged AP back before reporting
                    network_.activate(settings->name);
                }
                throw core::external_error("Failed to update band/channel of '" + settings->name + "'",
                                           {modified.message()});
            }

            if (was_active)
            {
                out_ << "Restarting access point..." << std::endl;
                auto restarted = network_.activate(settings->name);
                if (!restarted.ok())
                {
                    throw core::external_error("Band/channel updated but the access point failed to restart",
                                               {restarted.message(),
                                                "Start it manually with: wifi-ap control start " + settings->name});
                }
            }

            out_ << "SUCCESS: Band updated to " << core::band_label(band) << ", channel " << new_channel << std::endl;
            print_profile(settings->name);
            return Outcome::COMPLETED;
        }

        std::optional<core::ProfileSettings> ConnectionManager::find_profile(const std::string &name_or_ssid)
        {
            auto settings = network_.show_profile(name_or_ssid);
            if (settings)
            {
                return settings;
            }

            std::string derived = core::derive_profile_name(name_or_ssid);
            if (derived != name_or_ssid)
            {
                logger_->debug("Trying derived profile name", core::LogContext().add("profile", derived));
                return network_.show_profile(derived);
            }
            return std::nullopt;
        }

        void ConnectionManager::print_summary(const core::APConfig &config, const std::string &profile_name) const
        {
            out_ << std::endl
                 << "=== WiFi Access Point Configuration ===" << std::endl;
            out_ << "SSID: " << config.ssid << std::endl;
            out_ << "Password: " << core::mask_password(config.password) << std::endl;
            out_ << "Interface: " << config.interface << std::endl;
            out_ << "Band: " << core::band_label(config.band) << std::endl;
            out_ << "Channel: " << config.channel << std::endl;
            out_ << "IP Address: " << config.ip_cidr << std::endl;
            out_ << "Connection Name: " << profile_name << std::endl;
            out_ << std::endl;
        }

        void ConnectionManager::print_profile(const std::string &name)
        {
            auto settings = network_.show_profile(name);
            if (!settings)
            {
                return;
            }

            out_ << std::endl
                 << "Connection status:" << std::endl;
            out_ << "  connection.id: " << settings->name << std::endl;
            out_ << "  connection.interface-name: " << settings->interface << std::endl;
            out_ << "  802-11-wireless.ssid: " << settings->ssid << std::endl;
            out_ << "  802-11-wireless.band: " << (settings->band ? core::band_to_nm(*settings->band) : "--") << std::endl;
            out_ << "  802-11-wireless.channel: " << settings->channel << std::endl;
            out_ << "  ipv4.addresses: " << settings->ip_cidr << std::endl;
        }

        void ConnectionManager::fail_activation(const std::string &message,
                                                const std::string &interface,
                                                const infrastructure::CommandResult &result)
        {
            std::vector<std::string> details;
            if (!result.message().empty())
            {
                details.push_back(result.message());
            }
            details.push_back("nmcli exit status: " + std::to_string(result.exit_code));
            details.push_back("You may need to check if the wireless interface supports AP mode or if there are conflicting connections.");

            auto ap_mode = prober_.supports_ap_mode(interface);
            if (!ap_mode)
            {
                details.push_back("AP mode support of " + interface + ": unknown (iw could not resolve the radio)");
            }
            else
            {
                details.push_back("AP mode support of " + interface + ": " + (*ap_mode ? "yes" : "no"));
            }
            throw core::external_error(message, details);
        }

    } // namespace services
} // namespace wifiap
