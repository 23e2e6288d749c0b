/**
 * wifi-ap
 * Command line entry point: configures NetworkManager WiFi access points
 */

#include <iostream>
#include <memory>
#include <string>

#include "cli/app.hpp"
#include "cli/arguments.hpp"
#include "cli/privilege.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/prompter.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/nmcli_service.hpp"

namespace wifiap {

/**
 * -v / -vv override the configured level
 */
core::LogLevel resolve_log_level(int verbosity, const std::string &configured) {
    if (verbosity == 1) {
        return core::LogLevel::INFO;
    } else if (verbosity >= 2) {
        return core::LogLevel::DEBUG;
    }
    return core::LoggerManager::string_to_level(configured);
}

} // namespace wifiap

int main(int argc, char* argv[]) {
    using namespace wifiap;

    cli::Arguments args;
    try {
        args = cli::parse_arguments(argc, argv);
    } catch (const core::ApError& e) {
        return cli::report_error(e, std::cerr);
    }

    if (args.help) {
        cli::print_usage(std::cout, argv[0]);
        return 0;
    }

    if (args.version) {
        cli::print_version(std::cout);
        return 0;
    }

    if (args.mode == cli::Mode::NONE) {
        cli::print_usage(std::cerr, argv[0]);
        return 1;
    }

    core::setup_logging(resolve_log_level(args.verbosity, "WARNING"), args.log_file);
    auto logger = core::get_logger("main");

    // Load configuration
    std::unique_ptr<core::AppConfig> config;
    try {
        config = core::AppConfig::load(args.config_file);
        config->validate();
    } catch (const std::exception& e) {
        logger->error("Failed to load configuration",
                     core::LogContext().add("config_file", args.config_file.empty() ? core::AppConfig::DEFAULT_PATH : args.config_file)
                                      .add("error", e.what()));
        std::cerr << "ERROR: Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    std::string log_file = args.log_file.empty() ? config->logging.log_file : args.log_file;
    core::setup_logging(resolve_log_level(args.verbosity, config->logging.log_level), log_file);

    try {
        cli::check_arguments(args, config->defaults);

        if (args.needs_root() && !cli::is_root()) {
            cli::reexec_with_sudo(config->tools.sudo, argc, argv);
        }

        auto runner = std::make_shared<infrastructure::ProcessCommandRunner>();
        infrastructure::NmcliNetworkConfigService network(config->tools, runner);

        std::unique_ptr<core::Prompter> prompter;
        if (args.force) {
            prompter = std::make_unique<core::AutoPrompter>(std::cout);
        } else {
            prompter = std::make_unique<core::ConsolePrompter>(std::cin, std::cout);
        }

        cli::CommandDispatcher dispatcher(*config, network, *prompter, std::cout);
        int exit_code = cli::execute(dispatcher, args, std::cerr);

        logger->debug("Command finished", core::LogContext().add("exit_code", exit_code));
        return exit_code;

    } catch (const core::ApError& e) {
        logger->debug("Command failed", core::LogContext().add("error", e.what()));
        return cli::report_error(e, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
