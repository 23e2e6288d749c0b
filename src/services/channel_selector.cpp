#include "services/channel_selector.hpp"
#include "infrastructure/network_config_service.hpp"
#include "core/logger.hpp"
#include "core/wifi.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

namespace wifiap
{
    namespace services
    {

        ChannelSelector::ChannelSelector(infrastructure::NetworkConfigService &network, std::chrono::seconds settle_time)
            : network_(network), settle_time_(settle_time), logger_(core::get_logger("ChannelSelector"))
        {
        }

        int ChannelSelector::select(core::Band band, const std::string &interface, const std::string &own_ssid)
        {
            logger_->info("Scanning for the least congested channel",
                          core::LogContext().add("interface", interface).add("band", core::band_label(band)));

            auto rescan = network_.rescan(interface);
            if (!rescan.ok())
            {
                // Results from an earlier scan are still usable
                logger_->warning("WiFi rescan failed, using cached scan results",
                                 core::LogContext().add("interface", interface).add("error", rescan.message()));
            }

            if (settle_time_.count() > 0)
            {
                std::this_thread::sleep_for(settle_time_);
            }

            auto usage = tally(band, network_.scan_results(interface), own_ssid);
            int channel = pick(band, usage);

            std::ostringstream summary;
            for (const auto &sample : usage)
            {
                summary << sample.channel << "=" << sample.count << " ";
            }
            logger_->info("Selected channel",
                          core::LogContext().add("channel", channel).add("usage", summary.str()));
            return channel;
        }

        std::vector<core::ChannelUsageSample> ChannelSelector::tally(core::Band band,
                                                                     const std::vector<core::ScanEntry> &scan,
                                                                     const std::string &own_ssid)
        {
            std::vector<core::ChannelUsageSample> usage;
            for (int channel : core::candidate_channels(band))
            {
                usage.push_back({channel, 0});
            }

            for (const auto &entry : scan)
            {
                if (!own_ssid.empty() && entry.ssid == own_ssid)
                {
                    continue;
                }

                auto it = std::find_if(usage.begin(), usage.end(),
                                       [&entry](const core::ChannelUsageSample &sample)
                                       { return sample.channel == entry.channel; });
                if (it != usage.end())
                {
                    ++it->count;
                }
            }
            return usage;
        }

        int ChannelSelector::pick(core::Band band, const std::vector<core::ChannelUsageSample> &usage)
        {
            int best = core::default_channel(band);
            int best_count = 0;

            auto def = std::find_if(usage.begin(), usage.end(),
                                    [best](const core::ChannelUsageSample &sample)
                                    { return sample.channel == best; });
            if (def != usage.end())
            {
                best_count = def->count;
            }

            for (const auto &sample : usage)
            {
                if (!core::is_valid_channel(band, sample.channel))
                {
                    continue;
                }
                if (sample.count < best_count)
                {
                    best = sample.channel;
                    best_count = sample.count;
                }
            }
            return best;
        }

    } // namespace services
} // namespace wifiap
