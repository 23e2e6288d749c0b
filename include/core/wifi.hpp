#ifndef WIFIAP_CORE_WIFI_HPP
#define WIFIAP_CORE_WIFI_HPP

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wifiap
{
    namespace core
    {

        constexpr std::size_t SSID_MIN_LENGTH = 1;
        constexpr std::size_t SSID_MAX_LENGTH = 32;
        constexpr std::size_t PASSWORD_MIN_LENGTH = 8;
        constexpr std::size_t PASSWORD_MAX_LENGTH = 63;

        // Band helpers
        std::string band_label(Band band);        // "2.4GHz" / "5GHz"
        std::string band_to_nm(Band band);        // "bg" / "a"
        std::optional<Band> parse_band(const std::string &text);

        /**
         * Channel legality: 1-14 on 2.4GHz, the fixed 20MHz allow-list on 5GHz
         */
        bool is_valid_channel(Band band, int channel);
        const std::vector<int> &legal_channels(Band band);

        /**
         * Channels the selector considers, in scan order, and its default
         */
        const std::vector<int> &candidate_channels(Band band);
        int default_channel(Band band);

        /**
         * Spaces become underscores, then everything outside [A-Za-z0-9_-] is dropped
         */
        std::string sanitize_connection_name(const std::string &ssid);
        std::string derive_profile_name(const std::string &ssid);
        bool is_ap_profile_name(const std::string &name);

        // Argument validation; each throws ApError(USAGE) on failure
        void validate_ssid(const std::string &ssid);
        void validate_password(const std::string &password);
        void validate_channel(Band band, int channel);
        void validate_ip_cidr(const std::string &ip_cidr);

        /**
         * "auto" yields nullopt, a decimal number yields the channel
         */
        std::optional<int> parse_channel_argument(const std::string &text);

        std::string mask_password(const std::string &password);

    } // namespace core
} // namespace wifiap

#endif // WIFIAP_CORE_WIFI_HPP
