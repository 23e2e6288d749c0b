#ifndef WIFIAP_CLI_PRIVILEGE_HPP
#define WIFIAP_CLI_PRIVILEGE_HPP

#include <string>

namespace wifiap
{
    namespace cli
    {

        bool is_root();

        /**
         * Replaces the process with "sudo <this binary> <original arguments>".
         * Only returns by throwing ApError(PRECONDITION) when that is impossible:
         * the binary cannot be located, sudo cannot be executed, or the process
         * already went through sudo once.
         */
        [[noreturn]] void reexec_with_sudo(const std::string &sudo, int argc, char *argv[]);

    } // namespace cli
} // namespace wifiap

#endif // WIFIAP_CLI_PRIVILEGE_HPP
