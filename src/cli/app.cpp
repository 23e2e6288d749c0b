#include "cli/app.hpp"
#include "services/control_service.hpp"
#include "services/reset_service.hpp"
#include "infrastructure/network_config_service.hpp"
#include "core/prompter.hpp"

#include <chrono>

namespace wifiap
{
    namespace cli
    {

        void print_usage(std::ostream &out, const char *program_name)
        {
            out << "WiFi Access Point Manager\n\n";
            out << "Usage:\n";
            out << "  " << program_name << " [OPTIONS] create <SSID> <PASSWORD> [INTERFACE] [CHANNEL|auto] [IP_CIDR] [BAND]\n";
            out << "  " << program_name << " [OPTIONS] <SSID> <PASSWORD> ...\n";
            out << "  " << program_name << " [OPTIONS] --reset\n";
            out << "  " << program_name << " [OPTIONS] --update-band <NAME> <BAND> [CHANNEL|auto]\n";
            out << "  " << program_name << " [OPTIONS] control [COMMAND] [NAME] [INTERFACE]\n\n";
            out << "Control commands (default: status):\n";
            out << "  start [NAME] [INTERFACE]   Start an access point (default: first configured)\n";
            out << "  stop [NAME]                Stop an access point (default: all active)\n";
            out << "  restart [NAME] [INTERFACE] Stop, wait, start\n";
            out << "  status [NAME]              Show access point status\n";
            out << "  list                       List wireless connections\n";
            out << "  delete NAME                Delete a connection\n";
            out << "  interfaces                 Show WiFi interfaces and their capabilities\n\n";
            out << "Options:\n";
            out << "  -c, --config FILE        Configuration file path (default: " << core::AppConfig::DEFAULT_PATH << ")\n";
            out << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
            out << "  -l, --log-file FILE      Also write logs to FILE\n";
            out << "  --force                  Do not ask for confirmation; keep an existing profile\n";
            out << "  --replace                Replace an existing profile without asking\n";
            out << "  --band=2.4|5             Radio band (also accepts 2.4GHz, bg, 5GHz, a)\n";
            out << "  -h, --help               Show this help message\n";
            out << "  --version                Show version information\n\n";
            out << "Defaults: channel auto, IP 192.168.4.1/24, band 2.4GHz. INTERFACE may be \"\" or auto.\n\n";
            out << "Examples:\n";
            out << "  " << program_name << " create MyHotspot secret123           # Auto-detect interface and channel\n";
            out << "  " << program_name << " create MyHotspot secret123 wlan1 36 192.168.50.1/24 5\n";
            out << "  " << program_name << " --update-band MyHotspot-AP 5 auto\n";
            out << "  " << program_name << " control status\n";
            out << "  " << program_name << " --reset --force\n";
            out << std::endl;
        }

        void print_version(std::ostream &out)
        {
            out << "wifi-ap v0.1.0" << std::endl;
            out << "Built for Linux with NetworkManager" << std::endl;
        }

        int report_error(const core::ApError &error, std::ostream &err)
        {
            err << "ERROR: " << error.what() << std::endl;
            for (const auto &line : error.details())
            {
                err << "  " << line << std::endl;
            }
            if (error.kind() == core::ErrorKind::USAGE)
            {
                err << "Run 'wifi-ap --help' for usage." << std::endl;
            }
            return 1;
        }

        CommandDispatcher::CommandDispatcher(const core::AppConfig &config,
                                             infrastructure::NetworkConfigService &network,
                                             core::Prompter &prompter,
                                             std::ostream &out)
            : config_(config), network_(network), prompter_(prompter), out_(out), prober_(network),
              selector_(network, std::chrono::seconds(config.timing.scan_settle_seconds))
        {
        }

        services::Outcome CommandDispatcher::dispatch(const Arguments &args)
        {
            switch (args.mode)
            {
            case Mode::CREATE:
            {
                auto request = build_create_request(args, config_.defaults);
                services::ConnectionManager manager(network_, prober_, selector_, prompter_, out_);
                return manager.create(request);
            }
            case Mode::UPDATE_BAND:
            {
                auto request = build_update_band_request(args);
                services::ConnectionManager manager(network_, prober_, selector_, prompter_, out_);
                return manager.update_band(request.name, request.band, request.channel);
            }
            case Mode::RESET:
            {
                services::ResetService reset(network_, prompter_, out_);
                return reset.reset();
            }
            case Mode::CONTROL:
            {
                auto request = build_control_request(args);
                services::ControlService control(network_, prober_,
                                                 std::chrono::seconds(config_.timing.restart_delay_seconds), out_);
                return control.run(request.command, request.name, request.interface);
            }
            case Mode::NONE:
                break;
            }
            throw core::usage_error("No command given");
        }

        int execute(CommandDispatcher &dispatcher, const Arguments &args, std::ostream &err)
        {
            try
            {
                dispatcher.dispatch(args);
                return 0;
            }
            catch (const core::ApError &e)
            {
                return report_error(e, err);
            }
        }

    } // namespace cli
} // namespace wifiap
