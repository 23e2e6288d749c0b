#include "core/prompter.hpp"

namespace wifiap
{
    namespace core
    {

        ConsolePrompter::ConsolePrompter(std::istream &in, std::ostream &out)
            : in_(in), out_(out)
        {
        }

        bool ConsolePrompter::confirm(const std::string &question)
        {
            out_ << question << " (y/N): " << std::flush;

            std::string response;
            if (!std::getline(in_, response))
            {
                out_ << std::endl;
                return false;
            }
            return response == "y" || response == "Y";
        }

        int ConsolePrompter::choose(const std::string &question, const std::vector<std::string> &options)
        {
            out_ << question << std::endl;
            for (size_t i = 0; i < options.size(); ++i)
            {
                out_ << "  " << (i + 1) << ") " << options[i] << std::endl;
            }
            out_ << "Choose (1-" << options.size() << "): " << std::flush;

            std::string response;
            if (!std::getline(in_, response))
            {
                out_ << std::endl;
                return -1;
            }

            try
            {
                size_t consumed = 0;
                int choice = std::stoi(response, &consumed);
                if (consumed == response.size() && choice >= 1 && choice <= static_cast<int>(options.size()))
                {
                    return choice - 1;
                }
            }
            catch (const std::exception &)
            {
                // Not a number; treated as abort below
            }
            return -1;
        }

        AutoPrompter::AutoPrompter(std::ostream &out, int choice)
            : out_(out), choice_(choice)
        {
        }

        bool AutoPrompter::confirm(const std::string &question)
        {
            out_ << question << " (y/N): y [--force]" << std::endl;
            return true;
        }

        int AutoPrompter::choose(const std::string &question, const std::vector<std::string> &options)
        {
            if (choice_ < 0 || choice_ >= static_cast<int>(options.size()))
            {
                return -1;
            }
            out_ << question << " -> " << options[choice_] << " [automatic]" << std::endl;
            return choice_;
        }

    } // namespace core
} // namespace wifiap
