#ifndef WIFIAP_INFRASTRUCTURE_NMCLI_PARSER_HPP
#define WIFIAP_INFRASTRUCTURE_NMCLI_PARSER_HPP

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wifiap
{
    namespace infrastructure
    {
        namespace parser
        {

            /**
             * Splits one line of `nmcli -t` output on ':' honouring the
             * "\:" and "\\" escapes nmcli applies to field values
             */
            std::vector<std::string> split_terse_fields(const std::string &line);

            // nmcli -t -f DEVICE,TYPE,STATE,CONNECTION device status
            std::vector<core::InterfaceDescriptor> parse_device_status(const std::string &output);

            // nmcli -t -f NAME,TYPE,DEVICE,STATE connection show
            std::vector<core::ConnectionProfile> parse_connection_list(const std::string &output);

            // nmcli -s -t -f <fields> connection show <name>, one "key:value" per line
            core::ProfileSettings parse_profile_settings(const std::string &name, const std::string &output);

            // nmcli -t -f SSID,CHAN,SIGNAL device wifi list ifname <if>
            std::vector<core::ScanEntry> parse_wifi_list(const std::string &output);

            // iw dev <if> info -> "phy<N>"
            std::optional<std::string> parse_iw_dev_phy(const std::string &output);

            // iw phy <phy> info
            core::RadioInfo parse_iw_phy_info(const std::string &phy, const std::string &output);

        } // namespace parser
    } // namespace infrastructure
} // namespace wifiap

#endif // WIFIAP_INFRASTRUCTURE_NMCLI_PARSER_HPP
