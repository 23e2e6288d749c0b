#ifndef WIFIAP_CORE_CONFIG_HPP
#define WIFIAP_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <nlohmann/json.hpp>

namespace wifiap
{
    namespace core
    {

        /**
         * Values used when the command line leaves an AP parameter out
         */
        struct DefaultsConfig
        {
            std::string ip_cidr = "192.168.4.1/24";
            std::string channel = "auto";
            std::string band = "2.4";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Fixed waits between external calls
         */
        struct TimingConfig
        {
            int scan_settle_seconds = 2;
            int restart_delay_seconds = 2;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Executables invoked by the tool
         */
        struct ToolsConfig
        {
            std::string nmcli = "nmcli";
            std::string iw = "iw";
            std::string sudo = "sudo";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct LoggingConfig
        {
            std::string log_level = "WARNING";
            std::string log_file; // Empty means console only

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete tool configuration
         */
        class AppConfig
        {
        public:
            DefaultsConfig defaults;
            TimingConfig timing;
            ToolsConfig tools;
            LoggingConfig logging;

            static constexpr const char *DEFAULT_PATH = "/etc/wifi-ap/config.json";

        public:
            AppConfig() = default;

            // Factory methods
            static std::unique_ptr<AppConfig> from_file(const std::string &config_path);
            static std::unique_ptr<AppConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<AppConfig> create_default();

            /**
             * Explicit path: must exist. Empty path: DEFAULT_PATH when present,
             * built-in defaults otherwise.
             */
            static std::unique_ptr<AppConfig> load(const std::string &explicit_path);

            // Serialization
            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            /**
             * Throws std::invalid_argument naming the first bad field
             */
            void validate() const;
        };

    } // namespace core
} // namespace wifiap

#endif // WIFIAP_CORE_CONFIG_HPP
