#ifndef WIFIAP_CLI_ARGUMENTS_HPP
#define WIFIAP_CLI_ARGUMENTS_HPP

#include "core/config.hpp"
#include "core/types.hpp"
#include "services/connection_manager.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wifiap
{
    namespace cli
    {

        enum class Mode
        {
            NONE,
            CREATE,
            RESET,
            UPDATE_BAND,
            CONTROL
        };

        /**
         * Parsed command line
         */
        struct Arguments
        {
            std::string config_file; // Empty: default location
            int verbosity = 0;
            std::string log_file;
            bool help = false;
            bool version = false;
            bool force = false;
            bool replace = false;
            std::string band; // --band value, empty when not given
            Mode mode = Mode::NONE;
            std::vector<std::string> positionals; // Mode word removed

            /**
             * Whether the command changes network state and so must run as root
             */
            bool needs_root() const;
        };

        struct UpdateBandRequest
        {
            std::string name;
            core::Band band = core::Band::GHZ_2_4;
            std::optional<int> channel;
        };

        struct ControlRequest
        {
            std::string command;
            std::string name;
            std::string interface;
        };

        /**
         * getopt_long over argv; options may appear anywhere. Unknown options and
         * conflicting modes throw ApError(USAGE).
         */
        Arguments parse_arguments(int argc, char *argv[]);
        Arguments parse_arguments(const std::vector<std::string> &argv);

        /**
         * SSID PASSWORD [INTERFACE] [CHANNEL|auto] [IP_CIDR] [BAND]
         *
         * Missing optional values come from the configuration defaults. Without
         * an explicit band a channel above 14 selects 5GHz.
         */
        services::CreateRequest build_create_request(const Arguments &args, const core::DefaultsConfig &defaults);

        // NAME BAND [CHANNEL|auto]
        UpdateBandRequest build_update_band_request(const Arguments &args);

        // COMMAND [NAME] [INTERFACE]
        ControlRequest build_control_request(const Arguments &args);

        core::Band parse_band_argument(const std::string &text);

        /**
         * Builds and validates the request of the selected mode without running
         * it, so argument errors surface before privilege escalation
         */
        void check_arguments(const Arguments &args, const core::DefaultsConfig &defaults);

    } // namespace cli
} // namespace wifiap

#endif // WIFIAP_CLI_ARGUMENTS_HPP
