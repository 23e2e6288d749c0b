#ifndef WIFIAP_CORE_PROMPTER_HPP
#define WIFIAP_CORE_PROMPTER_HPP

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace wifiap
{
    namespace core
    {

        /**
         * Operator interaction used by the commands before destructive steps
         */
        class Prompter
        {
        public:
            virtual ~Prompter() = default;

            /**
             * Yes/no question, default no
             */
            virtual bool confirm(const std::string &question) = 0;

            /**
             * Returns the zero-based index of the chosen option, or -1 to abort
             */
            virtual int choose(const std::string &question, const std::vector<std::string> &options) = 0;
        };

        /**
         * Reads answers from a terminal; anything but y/Y declines
         */
        class ConsolePrompter : public Prompter
        {
        public:
            ConsolePrompter(std::istream &in, std::ostream &out);

            bool confirm(const std::string &question) override;
            int choose(const std::string &question, const std::vector<std::string> &options) override;

        private:
            std::istream &in_;
            std::ostream &out_;
        };

        /**
         * Non-interactive policy for --force: confirms everything and picks a fixed option
         */
        class AutoPrompter : public Prompter
        {
        public:
            explicit AutoPrompter(std::ostream &out, int choice = 0);

            bool confirm(const std::string &question) override;
            int choose(const std::string &question, const std::vector<std::string> &options) override;

        private:
            std::ostream &out_;
            int choice_;
        };

    } // namespace core
} // namespace wifiap

#endif // WIFIAP_CORE_PROMPTER_HPP
