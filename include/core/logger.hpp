#ifndef WIFIAP_CORE_LOGGER_HPP
#define WIFIAP_CORE_LOGGER_HPP

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <sstream>
#include <map>
#include <ostream>
#include <utility>
#include <vector>

namespace wifiap
{
    namespace core
    {

        /**
         * Log levels
         */
        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARNING = 2,
            ERROR = 3,
            CRITICAL = 4
        };

        /**
         * Structured key=value pairs appended to a log line
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::ostringstream ss;
                ss << std::boolalpha << value;
                context_.emplace_back(key, ss.str());
                return *this;
            }

            std::string format() const;
            bool empty() const { return context_.empty(); }

        private:
            // Insertion order is kept so related keys stay together
            std::vector<std::pair<std::string, std::string>> context_;
        };

        /**
         * Named logger writing to the console sink (stderr) and an optional file
         *
         * Operator-facing output of the tool goes to stdout through the command
         * layer; diagnostics never share that stream.
         */
        class Logger
        {
        public:
            Logger(const std::string &name, LogLevel level = LogLevel::WARNING);
            ~Logger();

            void set_level(LogLevel level) { level_ = level; }
            void set_output_file(const std::string &filename);
            void set_console_output(bool enabled) { console_output_ = enabled; }
            void set_console_stream(std::ostream *stream) { console_stream_ = stream; }

            void debug(const std::string &message, const LogContext &context = LogContext{});
            void info(const std::string &message, const LogContext &context = LogContext{});
            void warning(const std::string &message, const LogContext &context = LogContext{});
            void error(const std::string &message, const LogContext &context = LogContext{});

            bool is_enabled(LogLevel level) const { return level >= level_; }

        private:
            void log(LogLevel level, const std::string &message, const LogContext &context);
            std::string format_message(LogLevel level, const std::string &message, const LogContext &context) const;
            static std::string current_timestamp();

            std::string name_;
            LogLevel level_;
            bool console_output_;
            std::ostream *console_stream_;
            std::unique_ptr<std::ofstream> file_output_;
            mutable std::mutex mutex_;
        };

        /**
         * Logger registry; every logger created through it picks up the
         * process-wide level, file and console settings
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            void setup_logging(LogLevel level = LogLevel::WARNING,
                               const std::string &log_file = "",
                               bool console_output = true);

            std::shared_ptr<Logger> get_logger(const std::string &name);

            static LogLevel string_to_level(const std::string &level_str);
            static std::string level_to_string(LogLevel level);

        private:
            LoggerManager() = default;

            LogLevel default_level_ = LogLevel::WARNING;
            std::string default_log_file_;
            bool default_console_output_ = true;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::WARNING,
                           const std::string &log_file = "",
                           bool console_output = true);

    } // namespace core
} // namespace wifiap

#endif // WIFIAP_CORE_LOGGER_HPP
