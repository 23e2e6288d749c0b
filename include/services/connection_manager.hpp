#ifndef WIFIAP_SERVICES_CONNECTION_MANAGER_HPP
#define WIFIAP_SERVICES_CONNECTION_MANAGER_HPP

#include "core/types.hpp"
#include "infrastructure/network_config_service.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace wifiap
{
    namespace core
    {
        class Logger;
        class Prompter;
    }
    namespace services
    {
        class CapabilityProber;
        class ChannelSelector;
    }
}

namespace wifiap
{
    namespace services
    {

        /**
         * Parameters of one create invocation as given on the command line
         */
        struct CreateRequest
        {
            std::string ssid;
            std::string password;
            std::string interface;      // empty: auto-detect
            std::optional<int> channel; // nullopt: auto-select
            core::Band band = core::Band::GHZ_2_4;
            std::string ip_cidr;
            bool force = false;
            bool replace = false;
        };

        /**
         * How a command ended when it did not fail
         */
        enum class Outcome
        {
            COMPLETED,
            CANCELLED
        };

        /**
         * Brings a NetworkManager profile into the state described by an AP
         * configuration and changes band/channel of existing profiles
         */
        class ConnectionManager
        {
        public:
            ConnectionManager(infrastructure::NetworkConfigService &network,
                              CapabilityProber &prober,
                              ChannelSelector &selector,
                              core::Prompter &prompter,
                              std::ostream &out);

            /**
             * Validates, resolves interface and channel, then creates, replaces or
             * restarts the "<ssid>-AP" profile and brings it up
             */
            Outcome create(const CreateRequest &request);

            /**
             * Changes only band and channel of an existing profile; an active
             * profile is stopped before and restarted after the change
             */
            Outcome update_band(const std::string &name, core::Band band, std::optional<int> channel);

            /**
             * nmcli properties of an access point profile
             */
            static infrastructure::ProfileProperties ap_properties(const core::APConfig &config);

        private:
            std::optional<core::ProfileSettings> find_profile(const std::string &name_or_ssid);
            void print_summary(const core::APConfig &config, const std::string &profile_name) const;
            void print_profile(const std::string &name);
            [[noreturn]] void fail_activation(const std::string &message,
                                              const std::string &interface,
                                              const infrastructure::CommandResult &result);

            infrastructure::NetworkConfigService &network_;
            CapabilityProber &prober_;
            ChannelSelector &selector_;
            core::Prompter &prompter_;
            std::ostream &out_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace wifiap

#endif // WIFIAP_SERVICES_CONNECTION_MANAGER_HPP
