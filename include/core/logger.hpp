#ifndef APROTATE_CORE_LOGGER_HPP
#define APROTATE_CORE_LOGGER_HPP

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <map>

namespace aprotate
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

        std::string log_level_to_string(LogLevel level);

        /**
         * Structured logging context for key-value pairs
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::stringstream ss;
                ss << value;
                context_[key] = ss.str();
                return *this;
            }

            std::string format() const;
            bool empty() const { return context_.empty(); }

        private:
            std::map<std::string, std::string> context_;
        };

        /**
         * Destination shared by every logger of the process. One mutex covers
         * console and file, so lines from the polling thread and from engine
         * callers never interleave.
         */
        class LogSink
        {
        public:
            explicit LogSink(bool console_output = true) : console_output_(console_output) {}

            // Appends to `filename`; an empty name closes the file
            bool open_file(const std::string &filename);
            void set_console_output(bool enabled) { console_output_ = enabled; }

            void write(LogLevel level, const std::string &line);

        private:
            std::mutex mutex_;
            std::ofstream file_;
            std::atomic<bool> console_output_;
        };

        /**
         * Named logger (Thread-safe)
         */
        class Logger
        {
        public:
            Logger(const std::string &name, LogLevel level = LogLevel::INFO,
                   std::shared_ptr<LogSink> sink = nullptr);

            void set_level(LogLevel level) { level_ = level; }
            bool is_enabled(LogLevel level) const { return level >= level_.load(); }

            void debug(const std::string &message, const LogContext &context = LogContext{});
            void info(const std::string &message, const LogContext &context = LogContext{});
            void warning(const std::string &message, const LogContext &context = LogContext{});
            void error(const std::string &message, const LogContext &context = LogContext{});
            void critical(const std::string &message, const LogContext &context = LogContext{});

            const std::string &name() const { return name_; }

        private:
            void log(LogLevel level, const std::string &message, const LogContext &context);

            std::string name_;
            std::atomic<LogLevel> level_;
            std::shared_ptr<LogSink> sink_;
        };

        /**
         * Logger factory and management
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            // Reconfigures the shared sink; loggers handed out earlier follow it
            void setup_logging(LogLevel level = LogLevel::INFO,
                               const std::string &log_file = "",
                               bool console_output = true);

            // Changes the level of every logger without touching outputs (config reload)
            void set_level(LogLevel level);

            std::shared_ptr<Logger> get_logger(const std::string &name);

            static LogLevel string_to_level(const std::string &level_str);

        private:
            LoggerManager() : sink_(std::make_shared<LogSink>()) {}

            LogLevel default_level_ = LogLevel::INFO;
            std::string log_file_;
            std::shared_ptr<LogSink> sink_;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::INFO,
                           const std::string &log_file = "",
                           bool console_output = true);

    } // namespace core
} // namespace aprotate

#endif // APROTATE_CORE_LOGGER_HPP
