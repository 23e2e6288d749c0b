#include "infrastructure/nmcli_parser.hpp"
#include "core/wifi.hpp"

#include <regex>
#include <sstream>

namespace wifiap
{
    namespace infrastructure
    {
        namespace parser
        {

            namespace
            {
                std::string trim(const std::string &text)
                {
                    const char *whitespace = " \t\r\n";
                    auto start = text.find_first_not_of(whitespace);
                    if (start == std::string::npos)
                    {
                        return "";
                    }
                    auto end = text.find_last_not_of(whitespace);
                    return text.substr(start, end - start + 1);
                }

                std::vector<std::string> non_empty_lines(const std::string &output)
                {
                    std::vector<std::string> lines;
                    std::istringstream stream(output);
                    std::string line;
                    while (std::getline(stream, line))
                    {
                        if (!line.empty() && line.back() == '\r')
                        {
                            line.pop_back();
                        }
                        if (!line.empty())
                        {
                            lines.push_back(line);
                        }
                    }
                    return lines;
                }

                int to_int(const std::string &text, int fallback = 0)
                {
                    try
                    {
                        return std::stoi(text);
                    }
                    catch (const std::exception &)
                    {
                        return fallback;
                    }
                }
            }

            std::vector<std::string> split_terse_fields(const std::string &line)
            {
                std::vector<std::string> fields;
                std::string current;

                for (size_t i = 0; i < line.size(); ++i)
                {
                    if (line[i] == '\\' && i + 1 < line.size() && (line[i + 1] == ':' || line[i + 1] == '\\'))
                    {
                        current += line[i + 1];
                        ++i;
                    }
                    else if (line[i] == ':')
                    {
                        fields.push_back(current);
                        current.clear();
                    }
                    else
                    {
                        current += line[i];
                    }
                }

                fields.push_back(current);
                return fields;
            }

            std::vector<core::InterfaceDescriptor> parse_device_status(const std::string &output)
            {
                std::vector<core::InterfaceDescriptor> devices;
                for (const auto &line : non_empty_lines(output))
                {
                    auto fields = split_terse_fields(line);
                    if (fields.size() < 3)
                    {
                        continue;
                    }

                    core::InterfaceDescriptor device;
                    device.name = fields[0];
                    device.type = fields[1];
                    device.state = fields[2];
                    if (fields.size() > 3 && fields[3] != "--")
                    {
                        device.connection = fields[3];
                    }
                    device.managed = device.state != "unmanaged";
                    device.is_p2p = device.type == "wifi-p2p" || device.name.find("p2p") != std::string::npos;
                    devices.push_back(device);
                }
                return devices;
            }

            std::vector<core::ConnectionProfile> parse_connection_list(const std::string &output)
            {
                std::vector<core::ConnectionProfile> profiles;
                for (const auto &line : non_empty_lines(output))
                {
                    auto fields = split_terse_fields(line);
                    if (fields.size() < 2 || fields[0].empty())
                    {
                        continue;
                    }

                    core::ConnectionProfile profile;
                    profile.name = fields[0];
                    profile.type = fields[1];
                    if (fields.size() > 2 && fields[2] != "--")
                    {
                        profile.device = fields[2];
                    }
                    if (fields.size() > 3)
                    {
                        profile.state = fields[3];
                    }
                    profiles.push_back(profile);
                }
                return profiles;
            }

            core::ProfileSettings parse_profile_settings(const std::string &name, const std::string &output)
            {
                core::ProfileSettings settings;
                settings.name = name;

                for (const auto &line : non_empty_lines(output))
                {
                    // Multi-line terse output is "key:value"; the value is not escaped
                    auto colon = line.find(':');
                    if (colon == std::string::npos)
                    {
                        continue;
                    }
                    std::string key = line.substr(0, colon);
                    std::string value = line.substr(colon + 1);
                    if (value == "--")
                    {
                        value.clear();
                    }

                    if (key == "connection.id")
                        settings.name = value;
                    else if (key == "connection.interface-name")
                        settings.interface = value;
                    else if (key == "802-11-wireless.ssid")
                        settings.ssid = value;
                    else if (key == "802-11-wireless.mode")
                        settings.mode = value;
                    else if (key == "802-11-wireless.band")
                        settings.band = value.empty() ? std::nullopt : core::parse_band(value);
                    else if (key == "802-11-wireless.channel")
                        settings.channel = to_int(value);
                    else if (key == "ipv4.addresses")
                        settings.ip_cidr = value;
                    else if (key == "802-11-wireless-security.key-mgmt")
                        settings.key_mgmt = value;
                    else if (key == "802-11-wireless-security.psk")
                        settings.password = value;
                    else if (key == "GENERAL.STATE")
                        settings.state = value;
                }
                return settings;
            }

            std::vector<core::ScanEntry> parse_wifi_list(const std::string &output)
            {
                std::vector<core::ScanEntry> entries;
                for (const auto &line : non_empty_lines(output))
                {
                    auto fields = split_terse_fields(line);
                    if (fields.size() < 2)
                    {
                        continue;
                    }

                    core::ScanEntry entry;
                    entry.ssid = fields[0];
                    entry.channel = to_int(fields[1]);
                    if (fields.size() > 2)
                    {
                        entry.signal = to_int(fields[2]);
                    }
                    if (entry.channel > 0)
                    {
                        entries.push_back(entry);
                    }
                }
                return entries;
            }

            std::optional<std::string> parse_iw_dev_phy(const std::string &output)
            {
                static const std::regex wiphy_regex(R"(^\s*wiphy\s+(\d+)\s*$)");

                for (const auto &line : non_empty_lines(output))
                {
                    std::smatch match;
                    if (std::regex_match(line, match, wiphy_regex))
                    {
                        return "phy" + match[1].str();
                    }
                }
                return std::nullopt;
            }

            core::RadioInfo parse_iw_phy_info(const std::string &phy, const std::string &output)
            {
                static const std::regex freq_regex(R"(^\s*\*\s*(\d+)(?:\.\d+)?\s*MHz)");
                static const std::regex band_regex(R"(^\s*Band\s+(\d+):)");
                static const std::regex mode_regex(R"(^\s*\*\s*(\S+)\s*$)");

                core::RadioInfo info;
                info.phy = phy;
                bool in_modes = false;

                for (const auto &line : non_empty_lines(output))
                {
                    std::smatch match;

                    if (trim(line) == "Supported interface modes:")
                    {
                        in_modes = true;
                        continue;
                    }

                    if (in_modes)
                    {
                        if (std::regex_match(line, match, mode_regex))
                        {
                            if (match[1].str() == "AP")
                            {
                                info.supports_ap = true;
                            }
                            continue;
                        }
                        in_modes = false;
                    }

                    if (std::regex_search(line, match, band_regex))
                    {
                        int band = std::stoi(match[1].str());
                        if (band == 1)
                            info.has_band1 = true;
                        else if (band == 2)
                            info.has_band2 = true;
                    }
                    else if (std::regex_search(line, match, freq_regex))
                    {
                        info.frequencies_mhz.push_back(std::stoi(match[1].str()));
                    }
                }
                return info;
            }

        } // namespace parser
    } // namespace infrastructure
} // namespace wifiap
