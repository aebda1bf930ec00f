#include "todo/render.hpp"

namespace todo
{

    namespace
    {
        constexpr const char *kIntro = "You entered:\n\n\t";

        // <, >, & and the JS line separators go out as \u escapes, and so do
        // the short forms \b and \f that nlohmann emits.
        std::string rewrite_escapes(const std::string &dumped)
        {
            std::string out;
            out.reserve(dumped.size());
            for (std::size_t i = 0; i < dumped.size(); ++i)
            {
                char c = dumped[i];
                if (c == '\\' && i + 1 < dumped.size())
                {
                    char next = dumped[++i];
                    if (next == 'b')
                        out += "\\u0008";
                    else if (next == 'f')
                        out += "\\u000c";
                    else
                    {
                        out += c;
                        out += next;
                    }
                }
                else if (c == '<')
                    out += "\\u003c";
                else if (c == '>')
                    out += "\\u003e";
                else if (c == '&')
                    out += "\\u0026";
                else if (c == '\xE2' && i + 2 < dumped.size() && dumped[i + 1] == '\x80' &&
                         (dumped[i + 2] == '\xA8' || dumped[i + 2] == '\xA9'))
                {
                    out += dumped[i + 2] == '\xA8' ? "\\u2028" : "\\u2029";
                    i += 2;
                }
                else
                    out += c;
            }
            return out;
        }

        // Every line after the first is shifted one tab to the right
        std::string prefix_lines(const std::string &text, const std::string &prefix)
        {
            std::string out;
            out.reserve(text.size() + prefix.size() * 4);
            for (char c : text)
            {
                out += c;
                if (c == '\n')
                    out += prefix;
            }
            return out;
        }
    } // namespace

    std::string ItemRenderer::format(const ParsedItem &item)
    {
        auto dumped = item.to_json().dump(1, '\t', false, nlohmann::ordered_json::error_handler_t::replace);
        return kIntro + prefix_lines(rewrite_escapes(dumped), "\t");
    }

    Result<std::size_t> ItemRenderer::render(const ParsedItem &item, std::ostream &out)
    {
        if (!out.good())
            return std::unexpected(TodoError::io("Output stream is not writable"));

        auto text = format(item);
        out << text;
        out.flush();
        if (!out.good())
            return std::unexpected(TodoError::io("Failed to write rendered item"));
        return text.size();
    }

} // namespace todo
