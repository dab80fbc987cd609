#include "core/logger.hpp"
#include "core/clock.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace aprotate
{
    namespace core
    {

        std::string log_level_to_string(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRIT";
            }
            return "UNKNOWN";
        }

        std::string LogContext::format() const
        {
            std::string formatted;
            for (const auto &[key, value] : context_)
            {
                if (!formatted.empty())
                {
                    formatted += ' ';
                }
                formatted += key + "=" + value;
            }
            return formatted;
        }

        bool LogSink::open_file(const std::string &filename)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (file_.is_open())
            {
                file_.close();
            }
            if (filename.empty())
            {
                return true;
            }

            file_.open(filename, std::ios::app);
            if (!file_.is_open())
            {
                std::cerr << "Failed to open log file: " << filename << std::endl;
                return false;
            }
            return true;
        }

        void LogSink::write(LogLevel level, const std::string &line)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (console_output_)
            {
                // Warnings and worse go to stderr so journald tags them
                auto &stream = level >= LogLevel::WARNING ? std::cerr : std::cout;
                stream << line << std::endl;
            }

            if (file_.is_open())
            {
                file_ << line << std::endl;
            }
        }

        Logger::Logger(const std::string &name, LogLevel level, std::shared_ptr<LogSink> sink)
            : name_(name), level_(level), sink_(sink ? std::move(sink) : std::make_shared<LogSink>())
        {
        }

        void Logger::debug(const std::string &message, const LogContext &context)
        {
            log(LogLevel::DEBUG, message, context);
        }

        void Logger::info(const std::string &message, const LogContext &context)
        {
            log(LogLevel::INFO, message, context);
        }

        void Logger::warning(const std::string &message, const LogContext &context)
        {
            log(LogLevel::WARNING, message, context);
        }

        void Logger::error(const std::string &message, const LogContext &context)
        {
            log(LogLevel::ERROR, message, context);
        }

        void Logger::critical(const std::string &message, const LogContext &context)
        {
            log(LogLevel::CRITICAL, message, context);
        }

        void Logger::log(LogLevel level, const std::string &message, const LogContext &context)
        {
            if (!is_enabled(level))
            {
                return;
            }

            std::string line = format_iso8601(SystemClock().now());
            line += " [" + log_level_to_string(level) + "] " + name_ + ": " + message;
            if (!context.empty())
            {
                line += " " + context.format();
            }
            sink_->write(level, line);
        }

        LoggerManager &LoggerManager::instance()
        {
            static LoggerManager instance;
            return instance;
        }

        void LoggerManager::setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            default_level_ = level;
            sink_->set_console_output(console_output);
            if (log_file != log_file_)
            {
                // Keep console output if the file cannot be opened
                if (!sink_->open_file(log_file))
                {
                    sink_->set_console_output(true);
                }
                log_file_ = log_file;
            }

            for (auto &[name, logger] : loggers_)
            {
                logger->set_level(level);
            }
        }

        void LoggerManager::set_level(LogLevel level)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            default_level_ = level;
            for (auto &[name, logger] : loggers_)
            {
                logger->set_level(level);
            }
        }

        std::shared_ptr<Logger> LoggerManager::get_logger(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = loggers_.find(name);
            if (it != loggers_.end())
            {
                return it->second;
            }

            auto logger = std::make_shared<Logger>(name, default_level_, sink_);
            loggers_[name] = logger;
            return logger;
        }

        LogLevel LoggerManager::string_to_level(const std::string &level_str)
        {
            std::string upper_level = level_str;
            std::transform(upper_level.begin(), upper_level.end(), upper_level.begin(), ::toupper);

            if (upper_level == "DEBUG")
                return LogLevel::DEBUG;
            if (upper_level == "WARNING" || upper_level == "WARN")
                return LogLevel::WARNING;
            if (upper_level == "ERROR")
                return LogLevel::ERROR;
            if (upper_level == "CRITICAL" || upper_level == "CRIT")
                return LogLevel::CRITICAL;

            return LogLevel::INFO;
        }

        std::shared_ptr<Logger> get_logger(const std::string &name)
        {
            return LoggerManager::instance().get_logger(name);
        }

        void setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            LoggerManager::instance().setup_logging(level, log_file, console_output);
        }

    } // namespace core
} // namespace aprotate
