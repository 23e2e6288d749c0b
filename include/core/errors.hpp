#ifndef WIFIAP_CORE_ERRORS_HPP
#define WIFIAP_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace wifiap
{
    namespace core
    {

        /**
         * Failure classes of a command
         *
         * USAGE        bad or missing arguments, nothing was touched
         * PRECONDITION system state forbids the operation, nothing was touched
         * ABORTED      the operator declined a prompt that guards a destructive step
         * EXTERNAL     nmcli or iw reported a failure on a required step
         */
        enum class ErrorKind
        {
            USAGE,
            PRECONDITION,
            ABORTED,
            EXTERNAL
        };

        class ApError : public std::runtime_error
        {
        public:
            ApError(ErrorKind kind, const std::string &message, std::vector<std::string> details = {})
                : std::runtime_error(message), kind_(kind), details_(std::move(details))
            {
            }

            ErrorKind kind() const { return kind_; }

            // Extra lines shown to the operator below the message (candidates, hints)
            const std::vector<std::string> &details() const { return details_; }

        private:
            ErrorKind kind_;
            std::vector<std::string> details_;
        };

        inline ApError usage_error(const std::string &message)
        {
            return ApError(ErrorKind::USAGE, message);
        }

        inline ApError precondition_error(const std::string &message, std::vector<std::string> details = {})
        {
            return ApError(ErrorKind::PRECONDITION, message, std::move(details));
        }

        inline ApError external_error(const std::string &message, std::vector<std::string> details = {})
        {
            return ApError(ErrorKind::EXTERNAL, message, std::move(details));
        }

    } // namespace core
} // namespace wifiap

#endif // WIFIAP_CORE_ERRORS_HPP
