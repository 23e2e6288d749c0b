#include "cli/arguments.hpp"
#include "core/errors.hpp"
#include "core/wifi.hpp"

#include <getopt.h>

namespace wifiap
{
    namespace cli
    {

        namespace
        {
            enum LongOnlyOption
            {
                OPT_VERSION = 256,
                OPT_FORCE,
                OPT_REPLACE,
                OPT_RESET,
                OPT_UPDATE_BAND,
                OPT_BAND
            };

            const std::vector<std::string> READ_ONLY_CONTROL = {"status", "list", "interfaces"};
        }

        bool Arguments::needs_root() const
        {
            if (help || version || mode == Mode::NONE)
            {
                return false;
            }
            if (mode == Mode::CONTROL)
            {
                if (positionals.empty())
                {
                    return false;
                }
                for (const auto &command : READ_ONLY_CONTROL)
                {
                    if (positionals.front() == command)
                    {
                        return false;
                    }
                }
            }
            return true;
        }

        Arguments parse_arguments(int argc, char *argv[])
        {
            Arguments args;
            bool reset = false;
            bool update_band = false;

            static struct option long_options[] = {
                {"config", required_argument, 0, 'c'},
                {"verbose", no_argument, 0, 'v'},
                {"log-file", required_argument, 0, 'l'},
                {"help", no_argument, 0, 'h'},
                {"version", no_argument, 0, OPT_VERSION},
                {"force", no_argument, 0, OPT_FORCE},
                {"replace", no_argument, 0, OPT_REPLACE},
                {"reset", no_argument, 0, OPT_RESET},
                {"update-band", no_argument, 0, OPT_UPDATE_BAND},
                {"band", required_argument, 0, OPT_BAND},
                {0, 0, 0, 0}};

            // Parsing may run more than once per process (tests)
            optind = 0;
            opterr = 0;

            int c;
            int option_index = 0;

            while ((c = getopt_long(argc, argv, ":c:vl:h", long_options, &option_index)) != -1)
            {
                switch (c)
                {
                case 'c':
                    args.config_file = optarg;
                    break;
                case 'v':
                    args.verbosity++;
                    break;
                case 'l':
                    args.log_file = optarg;
                    break;
                case 'h':
                    args.help = true;
                    break;
                case OPT_VERSION:
                    args.version = true;
                    break;
                case OPT_FORCE:
                    args.force = true;
                    break;
                case OPT_REPLACE:
                    args.replace = true;
                    break;
                case OPT_RESET:
                    reset = true;
                    break;
                case OPT_UPDATE_BAND:
                    update_band = true;
                    break;
                case OPT_BAND:
                    args.band = optarg;
                    break;
                case ':':
                    throw core::usage_error(std::string("Option ") + argv[optind - 1] + " requires a value");
                default:
                    throw core::usage_error(std::string("Unknown option: ") + argv[optind - 1]);
                }
            }

            for (int i = optind; i < argc; ++i)
            {
                args.positionals.emplace_back(argv[i]);
            }

            if (reset && update_band)
            {
                throw core::usage_error("--reset and --update-band cannot be combined");
            }

            if (reset)
            {
                args.mode = Mode::RESET;
            }
            else if (update_band)
            {
                args.mode = Mode::UPDATE_BAND;
            }
            else if (!args.positionals.empty() && args.positionals.front() == "control")
            {
                args.mode = Mode::CONTROL;
                args.positionals.erase(args.positionals.begin());
            }
            else if (!args.positionals.empty() && args.positionals.front() == "create")
            {
                args.mode = Mode::CREATE;
                args.positionals.erase(args.positionals.begin());
            }
            else if (!args.positionals.empty())
            {
                args.mode = Mode::CREATE;
            }

            return args;
        }

        Arguments parse_arguments(const std::vector<std::string> &argv)
        {
            // getopt_long permutes the array, so it works on private copies
            std::vector<std::string> storage(argv);
            std::vector<char *> pointers;
            for (auto &arg : storage)
            {
                pointers.push_back(&arg[0]);
            }
            pointers.push_back(nullptr);
            return parse_arguments(static_cast<int>(storage.size()), pointers.data());
        }

        core::Band parse_band_argument(const std::string &text)
        {
            auto band = core::parse_band(text);
            if (!band)
            {
                throw core::usage_error("Invalid band '" + text + "'. Use 2.4 or 5");
            }
            return *band;
        }

        services::CreateRequest build_create_request(const Arguments &args, const core::DefaultsConfig &defaults)
        {
            const auto &p = args.positionals;
            if (p.size() < 2)
            {
                throw core::usage_error("SSID and password are required");
            }
            if (p.size() > 6)
            {
                throw core::usage_error("Too many arguments");
            }

            services::CreateRequest request;
            request.ssid = p[0];
            request.password = p[1];
            request.force = args.force;
            request.replace = args.replace;

            if (p.size() > 2 && p[2] != "auto")
            {
                request.interface = p[2];
            }

            request.channel = core::parse_channel_argument(p.size() > 3 ? p[3] : defaults.channel);
            request.ip_cidr = p.size() > 4 && !p[4].empty() ? p[4] : defaults.ip_cidr;

            std::string band_text = args.band;
            if (band_text.empty() && p.size() > 5)
            {
                band_text = p[5];
            }

            if (!band_text.empty())
            {
                request.band = parse_band_argument(band_text);
            }
            else if (request.channel && *request.channel > 14)
            {
                request.band = core::Band::GHZ_5;
            }
            else
            {
                request.band = parse_band_argument(defaults.band);
            }
            return request;
        }

        UpdateBandRequest build_update_band_request(const Arguments &args)
        {
            const auto &p = args.positionals;
            if (p.size() < 2 && !(p.size() == 1 && !args.band.empty()))
            {
                throw core::usage_error("--update-band requires a connection name and a band");
            }
            if (p.size() > 3)
            {
                throw core::usage_error("Too many arguments");
            }

            UpdateBandRequest request;
            request.name = p[0];

            std::size_t channel_index = 2;
            if (!args.band.empty())
            {
                // --band=X NAME [CHANNEL]
                if (p.size() > 2)
                {
                    throw core::usage_error("Too many arguments");
                }
                request.band = parse_band_argument(args.band);
                channel_index = 1;
            }
            else
            {
                request.band = parse_band_argument(p[1]);
            }

            if (p.size() > channel_index)
            {
                request.channel = core::parse_channel_argument(p[channel_index]);
            }
            return request;
        }

        ControlRequest build_control_request(const Arguments &args)
        {
            const auto &p = args.positionals;
            if (p.size() > 3)
            {
                throw core::usage_error("Too many arguments");
            }

            ControlRequest request;
            request.command = p.empty() ? "status" : p[0];
            if (p.size() > 1)
            {
                request.name = p[1];
            }
            if (p.size() > 2 && p[2] != "auto")
            {
                request.interface = p[2];
            }
            return request;
        }

        void check_arguments(const Arguments &args, const core::DefaultsConfig &defaults)
        {
            switch (args.mode)
            {
            case Mode::CREATE:
            {
                auto request = build_create_request(args, defaults);
                core::validate_ssid(request.ssid);
                core::validate_password(request.password);
                core::validate_ip_cidr(request.ip_cidr);
                if (request.channel)
                {
                    core::validate_channel(request.band, *request.channel);
                }
                break;
            }
            case Mode::UPDATE_BAND:
            {
                auto request = build_update_band_request(args);
                if (request.channel)
                {
                    core::validate_channel(request.band, *request.channel);
                }
                break;
            }
            case Mode::CONTROL:
                build_control_request(args);
                break;
            case Mode::RESET:
                if (!args.positionals.empty())
                {
                    throw core::usage_error("--reset takes no arguments");
                }
                break;
            case Mode::NONE:
                throw core::usage_error("No command given");
            }
        }

    } // namespace cli
} // namespace wifiap
