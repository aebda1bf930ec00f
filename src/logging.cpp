#include "todo/logging.hpp"
#include <spdlog/sinks/stdout_sinks.h>

namespace todo::logging
{

    std::shared_ptr<spdlog::logger> init(spdlog::level::level_enum level)
    {
        auto logger = spdlog::get(kLoggerName);
        if (!logger)
        {
            logger = spdlog::stderr_logger_st(kLoggerName);
            logger->set_pattern(kLogPattern);
        }
        logger->set_level(level);
        return logger;
    }

    std::shared_ptr<spdlog::logger> get()
    {
        if (auto logger = spdlog::get(kLoggerName))
            return logger;
        return init();
    }

    Result<spdlog::level::level_enum> level_from_string(const std::string &name)
    {
        auto level = spdlog::level::from_str(name);
        // from_str falls back to "off" for names it does not know
        if (level == spdlog::level::off && name != "off")
            return std::unexpected(TodoError::config("Unknown log level: " + name));
        return level;
    }

} // namespace todo::logging
