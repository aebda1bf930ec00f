#include <catch2/catch_test_macros.hpp>
#include "todo/item.hpp"
#include "todo/render.hpp"
#include <sstream>

using namespace todo;

TEST_CASE("Render layout matches the confirmation block", "[render]")
{
    ParsedItem item{"Practice Go", CalendarDate{2020, 2, 2}};
    std::string expected =
        "You entered:\n"
        "\n"
        "\t{\n"
        "\t\t\"Todo\": \"Practice Go\",\n"
        "\t\t\"Due\": \"2020-02-02T00:00:00Z\"\n"
        "\t}";
    REQUIRE(ItemRenderer::format(item) == expected);
}

TEST_CASE("Absent due date renders as the zero instant", "[render]")
{
    auto item = InputProcessor::process(R"({"todo": "Write report"})");
    REQUIRE(item.has_value());
    auto text = ItemRenderer::format(*item);
    REQUIRE(text.starts_with("You entered:"));
    REQUIRE(text.find("\"Write report\"") != std::string::npos);
    REQUIRE(text.find("\"Due\": \"0001-01-01T00:00:00Z\"") != std::string::npos);
}

TEST_CASE("Task text is escaped as JSON", "[render]")
{
    ParsedItem item{"say \"hi\"\n<b>&</b>", CalendarDate{}};
    auto text = ItemRenderer::format(item);
    REQUIRE(text.find(R"("Todo": "say \"hi\"\n\u003cb\u003e\u0026\u003c/b\u003e")") != std::string::npos);
}

TEST_CASE("Backspace and form feed use unicode escapes", "[render]")
{
    ParsedItem item{"a\bb\fc\\b\td", CalendarDate{}};
    auto text = ItemRenderer::format(item);
    REQUIRE(text.find(R"("Todo": "a\u0008b\u000cc\\b\td")") != std::string::npos);
}

TEST_CASE("Rendering is deterministic", "[render]")
{
    const std::string input = R"({"todo": "Practice Go", "due": "2020-02-02"})";
    std::ostringstream first;
    std::ostringstream second;
    REQUIRE(ItemRenderer::render(*InputProcessor::process(input), first).has_value());
    REQUIRE(ItemRenderer::render(*InputProcessor::process(input), second).has_value());
    REQUIRE(first.str() == second.str());
}

TEST_CASE("Render reports characters written", "[render]")
{
    ParsedItem item{"", CalendarDate{}};
    std::ostringstream out;
    auto written = ItemRenderer::render(item, out);
    REQUIRE(written.has_value());
    REQUIRE(*written == out.str().size());
    REQUIRE(out.str() == ItemRenderer::format(item));
}

TEST_CASE("Render on a failed stream is an IOError", "[render]")
{
    ParsedItem item{"Practice Go", CalendarDate{2020, 2, 2}};
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    auto written = ItemRenderer::render(item, out);
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().code == ErrorCode::IOError);
    REQUIRE(out.str().empty());
}
