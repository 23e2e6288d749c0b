/**
 * External command execution
 * fork/exec with separate stdout and stderr pipes drained through poll()
 */

#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace wifiap
{
    namespace infrastructure
    {

        namespace
        {
            void close_fd(int &fd)
            {
                if (fd >= 0)
                {
                    close(fd);
                    fd = -1;
                }
            }

            std::string trim_trailing_newlines(std::string text)
            {
                while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
                {
                    text.pop_back();
                }
                return text;
            }
        }

        std::string CommandResult::message() const
        {
            std::string text = trim_trailing_newlines(error);
            if (text.empty())
            {
                text = trim_trailing_newlines(output);
            }
            return text;
        }

        std::string describe_command(const std::vector<std::string> &argv)
        {
            std::ostringstream cmd;
            bool mask_next = false;
            for (size_t i = 0; i < argv.size(); ++i)
            {
                if (i > 0)
                    cmd << " ";

                if (mask_next)
                {
                    cmd << "********";
                    mask_next = false;
                    continue;
                }

                const std::string &arg = argv[i];
                if (arg.find(' ') != std::string::npos)
                    cmd << "\"" << arg << "\"";
                else
                    cmd << arg;

                if (arg == "wifi-sec.psk" || arg == "802-11-wireless-security.psk" || arg == "password")
                {
                    mask_next = true;
                }
            }
            return cmd.str();
        }

        ProcessCommandRunner::ProcessCommandRunner()
            : logger_(core::get_logger("CommandRunner"))
        {
        }

        CommandResult ProcessCommandRunner::run(const std::vector<std::string> &argv)
        {
            CommandResult result;
            if (argv.empty())
            {
                result.error = "empty command";
                return result;
            }

            logger_->debug("exec", core::LogContext().add("command", describe_command(argv)));

            int out_pipe[2] = {-1, -1};
            int err_pipe[2] = {-1, -1};
            if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0)
            {
                result.error = std::string("pipe failed: ") + std::strerror(errno);
                close_fd(out_pipe[0]);
                close_fd(out_pipe[1]);
                logger_->error("Failed to create pipes", core::LogContext().add("error", result.error));
                return result;
            }

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                dup2(out_pipe[1], STDOUT_FILENO);
                dup2(err_pipe[1], STDERR_FILENO);

                int devnull = open("/dev/null", O_RDONLY);
                if (devnull >= 0)
                {
                    dup2(devnull, STDIN_FILENO);
                }

                std::vector<char *> args;
                for (const auto &arg : argv)
                {
                    args.push_back(const_cast<char *>(arg.c_str()));
                }
                args.push_back(nullptr);

                execvp(args[0], args.data());
                _exit(127); // If execvp fails
            }
            else if (pid < 0)
            {
                result.error = std::string("fork failed: ") + std::strerror(errno);
                logger_->error("Failed to fork", core::LogContext().add("error", result.error));
                close_fd(out_pipe[0]);
                close_fd(out_pipe[1]);
                close_fd(err_pipe[0]);
                close_fd(err_pipe[1]);
                return result;
            }

            // Parent process
            close_fd(out_pipe[1]);
            close_fd(err_pipe[1]);

            struct pollfd fds[2];
            fds[0] = {out_pipe[0], POLLIN, 0};
            fds[1] = {err_pipe[0], POLLIN, 0};
            std::string *sinks[2] = {&result.output, &result.error};
            int open_fds = 2;
            char buffer[512];

            while (open_fds > 0)
            {
                int ret = poll(fds, 2, -1);
                if (ret < 0)
                {
                    if (errno == EINTR)
                        continue;
                    logger_->warning("poll failed", core::LogContext().add("error", std::strerror(errno)));
                    break;
                }

                for (int i = 0; i < 2; ++i)
                {
                    if (fds[i].fd < 0 || fds[i].revents == 0)
                        continue;

                    ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                    if (n > 0)
                    {
                        sinks[i]->append(buffer, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR)
                    {
                        close(fds[i].fd);
                        fds[i].fd = -1;
                        --open_fds;
                    }
                }
            }

            for (auto &pfd : fds)
            {
                if (pfd.fd >= 0)
                    close(pfd.fd);
            }

            int status = 0;
            while (waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                {
                    logger_->error("waitpid failed", core::LogContext().add("error", std::strerror(errno)));
                    return result;
                }
            }

            result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            if (result.exit_code == 127 && result.output.empty() && result.error.empty())
            {
                result.error = argv[0] + ": command not found";
            }

            logger_->debug("exit", core::LogContext().add("program", argv[0]).add("code", result.exit_code));
            return result;
        }

    } // namespace infrastructure
} // namespace wifiap
