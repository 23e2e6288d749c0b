#ifndef WIFIAP_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define WIFIAP_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <memory>
#include <string>
#include <vector>

namespace wifiap
{
    namespace core
    {
        class Logger;
    }
}

namespace wifiap
{
    namespace infrastructure
    {

        /**
         * Outcome of one external command
         */
        struct CommandResult
        {
            int exit_code = -1; // -1 when the child could not be started or was killed
            std::string output; // stdout
            std::string error;  // stderr

            bool ok() const { return exit_code == 0; }

            // stderr if present, otherwise stdout, trailing newlines removed
            std::string message() const;
        };

        /**
         * Runs an external program and waits for it
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            virtual CommandResult run(const std::vector<std::string> &argv) = 0;
        };

        /**
         * fork/exec implementation; arguments go straight to execvp so SSIDs and
         * passphrases are never interpreted by a shell
         */
        class ProcessCommandRunner : public CommandRunner
        {
        public:
            ProcessCommandRunner();

            CommandResult run(const std::vector<std::string> &argv) override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

        /**
         * Joins argv for logging; the value following a secret flag is masked
         */
        std::string describe_command(const std::vector<std::string> &argv);

    } // namespace infrastructure
} // namespace wifiap

#endif // WIFIAP_INFRASTRUCTURE_COMMAND_RUNNER_HPP
