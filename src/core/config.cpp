#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/wifi.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace wifiap
{
    namespace core
    {

        // DefaultsConfig implementation
        void DefaultsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("ip_cidr"))
                ip_cidr = j["ip_cidr"].get<std::string>();
            if (j.contains("channel"))
            {
                // Accept both "auto"/"6" and a bare number
                if (j["channel"].is_number_integer())
                    channel = std::to_string(j["channel"].get<int>());
                else
                    channel = j["channel"].get<std::string>();
            }
            if (j.contains("band"))
            {
                if (j["band"].is_number())
                    band = j["band"].get<double>() >= 5.0 ? "5" : "2.4";
                else
                    band = j["band"].get<std::string>();
            }
        }

        nlohmann::json DefaultsConfig::to_json() const
        {
            return nlohmann::json{
                {"ip_cidr", ip_cidr},
                {"channel", channel},
                {"band", band}};
        }

        // TimingConfig implementation
        void TimingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("scan_settle_seconds"))
                scan_settle_seconds = j["scan_settle_seconds"].get<int>();
            if (j.contains("restart_delay_seconds"))
                restart_delay_seconds = j["restart_delay_seconds"].get<int>();
        }

        nlohmann::json TimingConfig::to_json() const
        {
            return nlohmann::json{
                {"scan_settle_seconds", scan_settle_seconds},
                {"restart_delay_seconds", restart_delay_seconds}};
        }

        // ToolsConfig implementation
        void ToolsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("nmcli"))
                nmcli = j["nmcli"].get<std::string>();
            if (j.contains("iw"))
                iw = j["iw"].get<std::string>();
            if (j.contains("sudo"))
                sudo = j["sudo"].get<std::string>();
        }

        nlohmann::json ToolsConfig::to_json() const
        {
            return nlohmann::json{
                {"nmcli", nmcli},
                {"iw", iw},
                {"sudo", sudo}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"].get<std::string>();
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"].get<std::string>();
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // AppConfig implementation
        std::unique_ptr<AppConfig> AppConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<AppConfig> AppConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("configuration root must be a JSON object");
            }

            auto config = std::make_unique<AppConfig>();
            try
            {
                if (j.contains("defaults"))
                {
                    config->defaults.from_json(j["defaults"]);
                }
                if (j.contains("timing"))
                {
                    config->timing.from_json(j["timing"]);
                }
                if (j.contains("tools"))
                {
                    config->tools.from_json(j["tools"]);
                }
                if (j.contains("logging"))
                {
                    config->logging.from_json(j["logging"]);
                }
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument("Wrong value type in configuration: " + std::string(e.what()));
            }
            return config;
        }

        std::unique_ptr<AppConfig> AppConfig::create_default()
        {
            return std::make_unique<AppConfig>();
        }

        std::unique_ptr<AppConfig> AppConfig::load(const std::string &explicit_path)
        {
            if (!explicit_path.empty())
            {
                return from_file(explicit_path);
            }

            std::error_code ec;
            if (std::filesystem::exists(DEFAULT_PATH, ec))
            {
                return from_file(DEFAULT_PATH);
            }
            return create_default();
        }

        nlohmann::json AppConfig::to_json() const
        {
            return nlohmann::json{
                {"defaults", defaults.to_json()},
                {"timing", timing.to_json()},
                {"tools", tools.to_json()},
                {"logging", logging.to_json()}};
        }

        void AppConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        void AppConfig::validate() const
        {
            if (!parse_band(defaults.band))
            {
                throw std::invalid_argument("defaults.band must be 2.4 or 5 (got '" + defaults.band + "')");
            }

            try
            {
                validate_ip_cidr(defaults.ip_cidr);
                auto channel = parse_channel_argument(defaults.channel);
                if (channel)
                {
                    validate_channel(*parse_band(defaults.band), *channel);
                }
            }
            catch (const ApError &e)
            {
                throw std::invalid_argument("defaults: " + std::string(e.what()));
            }

            if (timing.scan_settle_seconds < 0 || timing.scan_settle_seconds > 60)
            {
                throw std::invalid_argument("timing.scan_settle_seconds must be between 0 and 60");
            }
            if (timing.restart_delay_seconds < 0 || timing.restart_delay_seconds > 60)
            {
                throw std::invalid_argument("timing.restart_delay_seconds must be between 0 and 60");
            }

            if (tools.nmcli.empty() || tools.iw.empty() || tools.sudo.empty())
            {
                throw std::invalid_argument("tools entries cannot be empty");
            }
        }

    } // namespace core
} // namespace wifiap
