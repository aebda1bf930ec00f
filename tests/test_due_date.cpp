#include <catch2/catch_test_macros.hpp>
#include "todo/due_date.hpp"

using namespace todo;

TEST_CASE("Empty due text yields the absent sentinel", "[due_date]")
{
    auto parsed = DueDateParser::parse("");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->is_absent());
    REQUIRE(*parsed == CalendarDate{});
    REQUIRE(parsed->to_rfc3339() == "0001-01-01T00:00:00Z");
}

TEST_CASE("Well formed dates parse to midnight", "[due_date]")
{
    auto parsed = DueDateParser::parse("2020-02-02");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->year == 2020);
    REQUIRE(parsed->month == 2u);
    REQUIRE(parsed->day == 2u);
    REQUIRE_FALSE(parsed->is_absent());
    REQUIRE(parsed->to_string() == "2020-02-02");
    REQUIRE(parsed->to_rfc3339() == "2020-02-02T00:00:00Z");
}

TEST_CASE("Leap days follow the calendar", "[due_date]")
{
    REQUIRE(DueDateParser::parse("2020-02-29").has_value());
    REQUIRE(DueDateParser::parse("2000-02-29").has_value());
    REQUIRE_FALSE(DueDateParser::parse("2019-02-29").has_value());
    REQUIRE_FALSE(DueDateParser::parse("1900-02-29").has_value());
}

TEST_CASE("Malformed dates are rejected", "[due_date]")
{
    for (const char *bad : {"02-02-2020", "2020/02/02", "2020-13-01", "2020-02-30", "2020-00-10",
                            "2020-01-00", "2020-2-02", "2020-02-2", "20-02-02", "2020-02-02T00:00:00Z",
                            "2020-02-02 ", " 2020-02-02", "+020-02-02", "2020-0a-02", "tomorrow"})
    {
        INFO(bad);
        auto parsed = DueDateParser::parse(bad);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::MalformedDate);
        REQUIRE(std::string(parsed.error().what()) == "Badly formed due date.");
    }
}

TEST_CASE("Custom layouts reorder fields", "[due_date]")
{
    auto iso = DueDateParser::parse("2020-02-02");
    auto dmy = DueDateParser::parse("02/02/2020", "DD/MM/YYYY");
    auto compact = DueDateParser::parse("20201231", "YYYYMMDD");
    REQUIRE(dmy.has_value());
    REQUIRE(*dmy == *iso);
    REQUIRE(compact.has_value());
    REQUIRE(compact->to_string() == "2020-12-31");

    REQUIRE_FALSE(DueDateParser::parse("2020-02-02", "DD/MM/YYYY").has_value());
}

TEST_CASE("Layouts must name each field once", "[due_date]")
{
    REQUIRE(DueDateParser::validate_format("YYYY-MM-DD").has_value());
    REQUIRE(DueDateParser::validate_format("DD.MM.YYYY").has_value());

    auto missing_day = DueDateParser::validate_format("YYYY-MM");
    REQUIRE_FALSE(missing_day.has_value());
    REQUIRE(missing_day.error().code == ErrorCode::ConfigError);
    REQUIRE_FALSE(DueDateParser::validate_format("YYYY-MM-DD-DD").has_value());
    REQUIRE_FALSE(DueDateParser::validate_format("").has_value());

    auto parsed = DueDateParser::parse("2020-02", "YYYY-MM");
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == ErrorCode::ConfigError);
}
