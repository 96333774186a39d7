#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void init(const std::string &log_level = "INFO")
    {
        Level level;
        if (!parseLevel(log_level, level))
        {
            level = Level::INFO;
        }
        getLogger()->set_level(toSpdlog(level));
    }

    static void setLevel(const std::string &log_level)
    {
        Level level;
        if (!parseLevel(log_level, level))
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
            level = Level::INFO;
        }

        getLogger()->set_level(toSpdlog(level));
        info("Log level changed to: " + log_level);
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stderr_color_mt("invoice_forensics");
        return logger;
    }

    static bool parseLevel(const std::string &name, Level &level)
    {
        if (name == "TRACE")
            level = Level::TRACE;
        else if (name == "DEBUG")
            level = Level::DEBUG;
        else if (name == "INFO")
            level = Level::INFO;
        else if (name == "WARN")
            level = Level::WARN;
        else if (name == "ERROR")
            level = Level::ERROR;
        else
            return false;
        return true;
    }

    static spdlog::level::level_enum toSpdlog(Level level)
    {
        switch (level)
        {
        case Level::TRACE:
            return spdlog::level::trace;
        case Level::DEBUG:
            return spdlog::level::debug;
        case Level::WARN:
            return spdlog::level::warn;
        case Level::ERROR:
            return spdlog::level::err;
        case Level::INFO:
        default:
            return spdlog::level::info;
        }
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        }
    }
};
