#ifndef WIFIAP_SERVICES_CHANNEL_SELECTOR_HPP
#define WIFIAP_SERVICES_CHANNEL_SELECTOR_HPP

#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace wifiap
{
    namespace core
    {
        class Logger;
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
         * Picks the least congested standard channel of a band from a fresh scan
         */
        class ChannelSelector
        {
        public:
            ChannelSelector(infrastructure::NetworkConfigService &network, std::chrono::seconds settle_time);

            /**
             * Rescans on the interface, waits the settle time and chooses a channel.
             * Networks named own_ssid are ignored so a running AP does not count
             * against itself.
             */
            int select(core::Band band, const std::string &interface, const std::string &own_ssid);

            /**
             * Occupancy of every candidate channel, in scan order
             */
            static std::vector<core::ChannelUsageSample> tally(core::Band band,
                                                               const std::vector<core::ScanEntry> &scan,
                                                               const std::string &own_ssid);

            /**
             * The band default unless a candidate is strictly less busy; among
             * those, the first in scan order
             */
            static int pick(core::Band band, const std::vector<core::ChannelUsageSample> &usage);

        private:
            infrastructure::NetworkConfigService &network_;
            std::chrono::seconds settle_time_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace wifiap

#endif // WIFIAP_SERVICES_CHANNEL_SELECTOR_HPP
