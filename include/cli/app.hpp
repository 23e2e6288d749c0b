#ifndef WIFIAP_CLI_APP_HPP
#define WIFIAP_CLI_APP_HPP

#include "cli/arguments.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "services/capability_prober.hpp"
#include "services/channel_selector.hpp"
#include "services/connection_manager.hpp"

#include <ostream>

namespace wifiap
{
    namespace core
    {
        class Prompter;
    }
    namespace infrastructure
    {
        class NetworkConfigService;
    }
}

namespace wifiap
{
    namespace cli
    {

        void print_usage(std::ostream &out, const char *program_name);
        void print_version(std::ostream &out);

        /**
         * Prints an ApError with its detail lines; returns the process exit code
         */
        int report_error(const core::ApError &error, std::ostream &err);

        /**
         * Runs the mode selected on the command line against a network service
         */
        class CommandDispatcher
        {
        public:
            CommandDispatcher(const core::AppConfig &config,
                              infrastructure::NetworkConfigService &network,
                              core::Prompter &prompter,
                              std::ostream &out);

            services::Outcome dispatch(const Arguments &args);

        private:
            const core::AppConfig &config_;
            infrastructure::NetworkConfigService &network_;
            core::Prompter &prompter_;
            std::ostream &out_;
            services::CapabilityProber prober_;
            services::ChannelSelector selector_;
        };

        /**
         * Dispatches one command and maps the result to a process exit code:
         * completed and cancelled commands exit 0, every ApError exits 1
         */
        int execute(CommandDispatcher &dispatcher, const Arguments &args, std::ostream &err);

    } // namespace cli
} // namespace wifiap

#endif // WIFIAP_CLI_APP_HPP
