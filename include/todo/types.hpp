#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace todo
{

    /**
     * Error categories surfaced by the item pipeline and its configuration.
     * The CLI front end maps them to process exit codes.
     */
    enum class ErrorCode
    {
        MalformedInput,
        MalformedDate,
        ConfigError,
        IOError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::MalformedInput:
            return "MalformedInput";
        case ErrorCode::MalformedDate:
            return "MalformedDate";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

    /**
     * Todo error with code and message
     */
    class TodoError : public std::runtime_error
    {
    public:
        ErrorCode code;

        TodoError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static TodoError malformed_input(const std::string &msg)
        {
            return TodoError(ErrorCode::MalformedInput, msg);
        }

        static TodoError malformed_date(const std::string &msg)
        {
            return TodoError(ErrorCode::MalformedDate, msg);
        }

        static TodoError config(const std::string &msg)
        {
            return TodoError(ErrorCode::ConfigError, msg);
        }

        static TodoError io(const std::string &msg)
        {
            return TodoError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, TodoError>;

    /** Fixed diagnostics printed before a fail-fast exit. */
    inline constexpr const char *kInvalidJsonMessage = "Invalid JSON passed to ./todo-app";
    inline constexpr const char *kBadDueDateMessage = "Badly formed due date.";

} // namespace todo
