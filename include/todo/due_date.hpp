#pragma once

#include "types.hpp"
#include <string>

namespace todo
{

    /** Layout used when no configuration overrides it. */
    inline constexpr const char *kDefaultDueDateFormat = "YYYY-MM-DD";

    /**
     * Date-only value. A default-constructed CalendarDate is the absent-date
     * sentinel; every real date has month and day >= 1.
     */
    struct CalendarDate
    {
        int year{0};
        unsigned month{0};
        unsigned day{0};

        bool is_absent() const { return month == 0 && day == 0; }

        /** "YYYY-MM-DD", or an empty string for the sentinel */
        std::string to_string() const;

        /** Midnight UTC in RFC 3339 form. The sentinel maps to 0001-01-01T00:00:00Z. */
        std::string to_rfc3339() const;

        bool operator==(const CalendarDate &) const = default;
    };

    /**
     * DueDateParser converts the optional `due` text into a CalendarDate.
     *
     * A layout is built from the tokens YYYY, MM and DD (each exactly once)
     * and literal characters. Every token consumes a fixed number of digits.
     */
    class DueDateParser
    {
    public:
        /** Parse due text against a layout. Empty text yields the sentinel. */
        static Result<CalendarDate> parse(const std::string &due_text,
                                          const std::string &format = kDefaultDueDateFormat);

        /** Check that a layout names each date field exactly once. */
        static Result<void> validate_format(const std::string &format);

        static bool is_valid_date(int year, unsigned month, unsigned day);
    };

} // namespace todo
