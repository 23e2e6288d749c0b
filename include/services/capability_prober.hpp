#ifndef WIFIAP_SERVICES_CAPABILITY_PROBER_HPP
#define WIFIAP_SERVICES_CAPABILITY_PROBER_HPP

#include "core/types.hpp"

#include <memory>
#include <optional>
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
         * Answers band and AP-mode questions about the radio behind an interface
         *
         * Introspection failures never block an operation: an unresolvable
         * radio is assumed to support the band.
         */
        class CapabilityProber
        {
        public:
            explicit CapabilityProber(infrastructure::NetworkConfigService &network);

            bool supports(const std::string &interface, core::Band band);

            // nullopt when the radio could not be resolved
            std::optional<bool> supports_ap_mode(const std::string &interface);
            std::optional<std::vector<core::Band>> supported_bands(const std::string &interface);

            static bool radio_supports(const core::RadioInfo &radio, core::Band band);

        private:
            infrastructure::NetworkConfigService &network_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace wifiap

#endif // WIFIAP_SERVICES_CAPABILITY_PROBER_HPP
