#include "services/capability_prober.hpp"
#include "infrastructure/network_config_service.hpp"
#include "core/logger.hpp"
#include "core/wifi.hpp"

#include <algorithm>

namespace wifiap
{
    namespace services
    {

        CapabilityProber::CapabilityProber(infrastructure::NetworkConfigService &network)
            : network_(network), logger_(core::get_logger("CapabilityProber"))
        {
        }

        bool CapabilityProber::radio_supports(const core::RadioInfo &radio, core::Band band)
        {
            int low = band == core::Band::GHZ_5 ? 5000 : 2000;
            int high = low + 999;
            bool marker = band == core::Band::GHZ_5 ? radio.has_band2 : radio.has_band1;

            return marker || std::any_of(radio.frequencies_mhz.begin(), radio.frequencies_mhz.end(),
                                         [low, high](int mhz)
                                         { return mhz >= low && mhz <= high; });
        }

        bool CapabilityProber::supports(const std::string &interface, core::Band band)
        {
            auto radio = network_.radio_info(interface);
            if (!radio)
            {
                logger_->warning("Could not determine radio capabilities, assuming band is supported",
                                 core::LogContext().add("interface", interface).add("band", core::band_label(band)));
                return true;
            }

            bool supported = radio_supports(*radio, band);
            logger_->debug("Band support",
                           core::LogContext()
                               .add("interface", interface)
                               .add("phy", radio->phy)
                               .add("band", core::band_label(band))
                               .add("supported", supported));
            return supported;
        }

        std::optional<bool> CapabilityProber::supports_ap_mode(const std::string &interface)
        {
            auto radio = network_.radio_info(interface);
            if (!radio)
            {
                return std::nullopt;
            }
            return radio->supports_ap;
        }

        std::optional<std::vector<core::Band>> CapabilityProber::supported_bands(const std::string &interface)
        {
            auto radio = network_.radio_info(interface);
            if (!radio)
            {
                return std::nullopt;
            }

            std::vector<core::Band> bands;
            for (auto band : {core::Band::GHZ_2_4, core::Band::GHZ_5})
            {
                if (radio_supports(*radio, band))
                {
                    bands.push_back(band);
                }
            }
            return bands;
        }

    } // namespace services
} // namespace wifiap
