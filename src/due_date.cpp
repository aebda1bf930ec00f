#include "todo/due_date.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace todo
{

    namespace
    {
        enum class Field
        {
            Year,
            Month,
            Day,
            Literal
        };

        struct Token
        {
            Field field;
            std::size_t width; // digits consumed, or 1 for a literal
        };

        Token token_at(std::string_view format, std::size_t pos)
        {
            auto rest = format.substr(pos);
            if (rest.starts_with("YYYY"))
                return {Field::Year, 4};
            if (rest.starts_with("MM"))
                return {Field::Month, 2};
            if (rest.starts_with("DD"))
                return {Field::Day, 2};
            return {Field::Literal, 1};
        }

        bool read_digits(std::string_view text, std::size_t pos, std::size_t width, int &value)
        {
            if (pos + width > text.size())
                return false;
            value = 0;
            for (std::size_t i = pos; i < pos + width; ++i)
            {
                char c = text[i];
                if (c < '0' || c > '9')
                    return false;
                value = value * 10 + (c - '0');
            }
            return true;
        }
    } // namespace

    std::string CalendarDate::to_string() const
    {
        if (is_absent())
            return {};
        std::ostringstream oss;
        oss << std::setfill('0') << std::setw(4) << year << '-'
            << std::setw(2) << month << '-'
            << std::setw(2) << day;
        return oss.str();
    }

    std::string CalendarDate::to_rfc3339() const
    {
        if (is_absent())
            return "0001-01-01T00:00:00Z";
        return to_string() + "T00:00:00Z";
    }

    bool DueDateParser::is_valid_date(int year, unsigned month, unsigned day)
    {
        std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{month},
                                        std::chrono::day{day}};
        return ymd.ok();
    }

    Result<void> DueDateParser::validate_format(const std::string &format)
    {
        int years = 0;
        int months = 0;
        int days = 0;
        std::size_t pos = 0;
        while (pos < format.size())
        {
            Token tok = token_at(format, pos);
            if (tok.field == Field::Year)
                ++years;
            else if (tok.field == Field::Month)
                ++months;
            else if (tok.field == Field::Day)
                ++days;
            pos += tok.width;
        }
        if (years != 1 || months != 1 || days != 1)
        {
            return std::unexpected(TodoError::config(
                "Date format must contain YYYY, MM and DD exactly once: " + format));
        }
        return {};
    }

    Result<CalendarDate> DueDateParser::parse(const std::string &due_text, const std::string &format)
    {
        if (due_text.empty())
            return CalendarDate{};

        auto layout_ok = validate_format(format);
        if (!layout_ok)
            return std::unexpected(layout_ok.error());

        int year = 0;
        int month = 0;
        int day = 0;
        std::size_t in = 0;
        std::size_t pos = 0;
        while (pos < format.size())
        {
            Token tok = token_at(format, pos);
            if (tok.field == Field::Literal)
            {
                if (in >= due_text.size() || due_text[in] != format[pos])
                    return std::unexpected(TodoError::malformed_date(kBadDueDateMessage));
                ++in;
            }
            else
            {
                int &target = tok.field == Field::Year ? year : (tok.field == Field::Month ? month : day);
                if (!read_digits(due_text, in, tok.width, target))
                    return std::unexpected(TodoError::malformed_date(kBadDueDateMessage));
                in += tok.width;
            }
            pos += tok.width;
        }

        // Extra text after the layout is consumed
        if (in != due_text.size())
            return std::unexpected(TodoError::malformed_date(kBadDueDateMessage));

        if (!is_valid_date(year, static_cast<unsigned>(month), static_cast<unsigned>(day)))
            return std::unexpected(TodoError::malformed_date(kBadDueDateMessage));

        return CalendarDate{year, static_cast<unsigned>(month), static_cast<unsigned>(day)};
    }

} // namespace todo
