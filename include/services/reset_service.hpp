#ifndef WIFIAP_SERVICES_RESET_SERVICE_HPP
#define WIFIAP_SERVICES_RESET_SERVICE_HPP

#include "services/connection_manager.hpp"

#include <cstddef>
#include <memory>
#include <ostream>

namespace wifiap
{
    namespace core
    {
        class Logger;
        class Prompter;
    }
    namespace infrastructure
    {
        class NetworkConfigService;
    }
}

namespace wifiap
{
    namespace services
    {

        /**
         * Returns the WiFi side of the machine to normal client operation:
         * every AP-pattern profile is removed and all WiFi radios are handed
         * back to NetworkManager
         *
         * Only the confirmation can stop it; every later step is best effort,
         * so running it twice succeeds both times.
         */
        class ResetService
        {
        public:
            static constexpr std::size_t MAX_LISTED_NETWORKS = 10;

            ResetService(infrastructure::NetworkConfigService &network, core::Prompter &prompter, std::ostream &out);

            Outcome reset();

        private:
            void remove_ap_profiles(const core::SystemSnapshot &snapshot);
            void restore_interfaces(const core::SystemSnapshot &snapshot);
            void list_networks(const core::SystemSnapshot &snapshot);

            infrastructure::NetworkConfigService &network_;
            core::Prompter &prompter_;
            std::ostream &out_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace wifiap

#endif // WIFIAP_SERVICES_RESET_SERVICE_HPP
