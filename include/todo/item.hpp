#pragma once

#include "types.hpp"
#include "due_date.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace todo
{

    /**
     * Input as received. Missing or null fields are empty strings.
     */
    struct RawItem
    {
        std::string task; // JSON key "todo"
        std::string due;  // JSON key "due", optional
    };

    /**
     * Validated item. `due` is a real date or the absent-date sentinel.
     */
    struct ParsedItem
    {
        std::string task;
        CalendarDate due;

        /** Display form, keeping "Todo" ahead of "Due" */
        nlohmann::ordered_json to_json() const;
    };

    /**
     * InputProcessor turns the raw `--add` value into a ParsedItem. Every
     * failure comes back as a TodoError; nothing here exits the process.
     */
    class InputProcessor
    {
    public:
        /**
         * Parse JSON text and check the {"todo": string, "due": string} shape.
         * Keys match case-insensitively and are applied in document order, so
         * the last matching key wins. Values of other keys are never converted.
         */
        static Result<RawItem> deserialize(const std::string &raw_input);

        /** Copy the task and parse the due date against `format` */
        static Result<ParsedItem> build(const RawItem &raw,
                                        const std::string &format = kDefaultDueDateFormat);

        /** deserialize() followed by build() */
        static Result<ParsedItem> process(const std::string &raw_input,
                                          const std::string &format = kDefaultDueDateFormat);
    };

} // namespace todo
