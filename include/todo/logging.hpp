#pragma once

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace todo::logging
{

    inline constexpr const char *kLoggerName = "todo";

    /**
     * Timestamped single-line layout written to stderr. Diagnostics that end
     * the process are logged at critical so every accepted level shows them.
     */
    inline constexpr const char *kLogPattern = "%Y/%m/%d %H:%M:%S %v";

    /**
     * Create the stderr logger, or adjust its level if it already exists.
     */
    std::shared_ptr<spdlog::logger> init(spdlog::level::level_enum level = spdlog::level::warn);

    /** The process logger, created at the default level on first use */
    std::shared_ptr<spdlog::logger> get();

    /** Map "trace".."off" to a spdlog level; unknown names are a ConfigError. */
    Result<spdlog::level::level_enum> level_from_string(const std::string &name);

} // namespace todo::logging
