#include "core/wifi.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace wifiap
{
    namespace core
    {

        namespace
        {
            const std::vector<int> CHANNELS_2_4 = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14};

            const std::vector<int> CHANNELS_5 = {
                36, 40, 44, 48, 52, 56, 60, 64,
                100, 104, 108, 112, 116, 120, 124, 128, 132, 136, 140, 144,
                149, 153, 157, 161, 165};

            // Non-overlapping 2.4GHz channels
            const std::vector<int> CANDIDATES_2_4 = {1, 6, 11};

            // UNII-1 and UNII-3, no DFS
            const std::vector<int> CANDIDATES_5 = {36, 40, 44, 48, 149, 153, 157, 161, 165};

            std::string to_lower(std::string value)
            {
                std::transform(value.begin(), value.end(), value.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return value;
            }
        }

        std::string band_label(Band band)
        {
            return band == Band::GHZ_5 ? "5GHz" : "2.4GHz";
        }

        std::string band_to_nm(Band band)
        {
            return band == Band::GHZ_5 ? "a" : "bg";
        }

        std::optional<Band> parse_band(const std::string &text)
        {
            std::string value = to_lower(text);
            if (value == "2.4" || value == "2.4ghz" || value == "bg")
            {
                return Band::GHZ_2_4;
            }
            if (value == "5" || value == "5ghz" || value == "a")
            {
                return Band::GHZ_5;
            }
            return std::nullopt;
        }

        const std::vector<int> &legal_channels(Band band)
        {
            return band == Band::GHZ_5 ? CHANNELS_5 : CHANNELS_2_4;
        }

        bool is_valid_channel(Band band, int channel)
        {
            const auto &channels = legal_channels(band);
            return std::find(channels.begin(), channels.end(), channel) != channels.end();
        }

        const std::vector<int> &candidate_channels(Band band)
        {
            return band == Band::GHZ_5 ? CANDIDATES_5 : CANDIDATES_2_4;
        }

        int default_channel(Band band)
        {
            return band == Band::GHZ_5 ? 36 : 6;
        }

        std::string sanitize_connection_name(const std::string &ssid)
        {
            std::string result;
            result.reserve(ssid.size());
            for (char c : ssid)
            {
                if (c == ' ')
                {
                    result += '_';
                }
                else if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')
                {
                    result += c;
                }
            }
            return result;
        }

        std::string derive_profile_name(const std::string &ssid)
        {
            return sanitize_connection_name(ssid) + "-AP";
        }

        bool is_ap_profile_name(const std::string &name)
        {
            // "-AP" is a special case of "AP"
            return name.size() >= 2 && name.compare(name.size() - 2, 2, "AP") == 0;
        }

        void validate_ssid(const std::string &ssid)
        {
            if (ssid.size() < SSID_MIN_LENGTH)
            {
                throw usage_error("SSID cannot be empty");
            }
            if (ssid.size() > SSID_MAX_LENGTH)
            {
                throw usage_error("SSID cannot be longer than " + std::to_string(SSID_MAX_LENGTH) + " characters");
            }
        }

        void validate_password(const std::string &password)
        {
            if (password.empty())
            {
                throw usage_error("Password cannot be empty");
            }
            if (password.size() < PASSWORD_MIN_LENGTH)
            {
                throw usage_error("Password must be at least " + std::to_string(PASSWORD_MIN_LENGTH) + " characters long");
            }
            if (password.size() > PASSWORD_MAX_LENGTH)
            {
                throw usage_error("Password cannot be longer than " + std::to_string(PASSWORD_MAX_LENGTH) + " characters");
            }
        }

        void validate_channel(Band band, int channel)
        {
            if (is_valid_channel(band, channel))
            {
                return;
            }
            if (band == Band::GHZ_2_4)
            {
                throw usage_error("Channel " + std::to_string(channel) + " is not valid for 2.4GHz (use 1-14)");
            }

            std::string allowed;
            for (int c : CHANNELS_5)
            {
                if (!allowed.empty())
                {
                    allowed += ",";
                }
                allowed += std::to_string(c);
            }
            throw usage_error("Channel " + std::to_string(channel) + " is not valid for 5GHz (use one of " + allowed + ")");
        }

        void validate_ip_cidr(const std::string &ip_cidr)
        {
            static const std::regex cidr_regex(R"(^(\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3})/(\d{1,2})$)");

            std::smatch match;
            if (!std::regex_match(ip_cidr, match, cidr_regex))
            {
                throw usage_error("IP address must be in CIDR form, e.g. 192.168.4.1/24 (got '" + ip_cidr + "')");
            }
            for (int i = 1; i <= 4; ++i)
            {
                if (std::stoi(match[i].str()) > 255)
                {
                    throw usage_error("IP address octet out of range in '" + ip_cidr + "'");
                }
            }
            if (std::stoi(match[5].str()) > 32)
            {
                throw usage_error("IP prefix length must be between 0 and 32 in '" + ip_cidr + "'");
            }
        }

        std::optional<int> parse_channel_argument(const std::string &text)
        {
            if (to_lower(text) == "auto")
            {
                return std::nullopt;
            }
            if (text.empty() || text.size() > 3 ||
                !std::all_of(text.begin(), text.end(), [](unsigned char c)
                             { return std::isdigit(c); }))
            {
                throw usage_error("Channel must be a number or 'auto' (got '" + text + "')");
            }
            return std::stoi(text);
        }

        std::string mask_password(const std::string &password)
        {
            if (password.size() <= 2)
            {
                return std::string(password.size(), '*');
            }
            return password.substr(0, 1) + std::string(password.size() - 2, '*') + password.substr(password.size() - 1);
        }

    } // namespace core
} // namespace wifiap
