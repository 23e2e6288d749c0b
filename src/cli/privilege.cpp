#include "cli/privilege.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits.h>
#include <unistd.h>
#include <vector>

namespace wifiap
{
    namespace cli
    {

        namespace
        {
            // Set in the environment of the re-executed child
            constexpr const char *ELEVATED_MARKER = "WIFI_AP_ELEVATED";

            std::string self_executable(const char *argv0)
            {
                char buffer[PATH_MAX];
                ssize_t length = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
                if (length > 0)
                {
                    buffer[length] = '\0';
                    return buffer;
                }
                return argv0 ? argv0 : "";
            }
        }

        bool is_root()
        {
            return geteuid() == 0;
        }

        void reexec_with_sudo(const std::string &sudo, int argc, char *argv[])
        {
            if (std::getenv(ELEVATED_MARKER))
            {
                throw core::precondition_error("This command must be run as root",
                                               {"Please run with: sudo wifi-ap ..."});
            }

            std::string self = self_executable(argc > 0 ? argv[0] : nullptr);
            if (self.empty())
            {
                throw core::precondition_error("This command must be run as root",
                                               {"Could not determine the path of this program"});
            }

            auto logger = core::get_logger("Privilege");
            logger->info("Not running as root, re-executing through sudo", core::LogContext().add("sudo", sudo));

            std::string marker = std::string(ELEVATED_MARKER) + "=1";
            std::vector<std::string> storage = {sudo, marker, self};
            for (int i = 1; i < argc; ++i)
            {
                storage.emplace_back(argv[i]);
            }

            std::vector<char *> exec_args;
            for (auto &arg : storage)
            {
                exec_args.push_back(&arg[0]);
            }
            exec_args.push_back(nullptr);

            // sudo VAR=value cmd ... passes the marker to the child
            execvp(exec_args[0], exec_args.data());

            throw core::precondition_error("This command must be run as root",
                                           {"Failed to execute " + sudo + ": " + std::strerror(errno),
                                            "Please run with: sudo wifi-ap ..."});
        }

    } // namespace cli
} // namespace wifiap
