#include "todo/item.hpp"
#include "todo/logging.hpp"
#include <algorithm>
#include <cctype>

namespace todo
{

    using Json = nlohmann::json;

    namespace
    {
        bool iequals(const std::string &a, const std::string &b)
        {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                       return std::tolower(x) == std::tolower(y);
                   });
        }

        /**
         * SAX handler that fills a RawItem straight from the token stream.
         * Only depth-1 values under a "todo" or "due" key are inspected.
         */
        class RawItemHandler : public nlohmann::json_sax<Json>
        {
        public:
            bool null() override
            {
                on_value(Json::value_t::null, nullptr);
                return true;
            }

            bool boolean(bool) override
            {
                on_value(Json::value_t::boolean, nullptr);
                return true;
            }

            bool number_integer(number_integer_t) override
            {
                on_value(Json::value_t::number_integer, nullptr);
                return true;
            }

            bool number_unsigned(number_unsigned_t) override
            {
                on_value(Json::value_t::number_unsigned, nullptr);
                return true;
            }

            bool number_float(number_float_t, const string_t &) override
            {
                on_value(Json::value_t::number_float, nullptr);
                return true;
            }

            bool string(string_t &val) override
            {
                on_value(Json::value_t::string, &val);
                return true;
            }

            bool binary(binary_t &) override
            {
                on_value(Json::value_t::binary, nullptr);
                return true;
            }

            bool start_object(std::size_t) override
            {
                on_value(Json::value_t::object, nullptr);
                ++depth_;
                return true;
            }

            bool key(string_t &val) override
            {
                if (depth_ == 1)
                    key_ = val;
                return true;
            }

            bool end_object() override
            {
                --depth_;
                return true;
            }

            bool start_array(std::size_t) override
            {
                on_value(Json::value_t::array, nullptr);
                ++depth_;
                return true;
            }

            bool end_array() override
            {
                --depth_;
                return true;
            }

            bool parse_error(std::size_t position, const std::string &last_token,
                             const nlohmann::detail::exception &ex) override
            {
                error_id_ = ex.id;
                error_position_ = position;
                error_token_ = last_token;
                error_what_ = ex.what();
                return false;
            }

            const RawItem &item() const { return item_; }
            bool shape_error() const { return shape_error_; }
            int error_id() const { return error_id_; }
            std::size_t error_position() const { return error_position_; }
            const std::string &error_token() const { return error_token_; }
            const std::string &error_what() const { return error_what_; }

        private:
            void on_value(Json::value_t type, const std::string *text)
            {
                if (depth_ == 0)
                {
                    top_is_object_ = type == Json::value_t::object;
                    if (!top_is_object_ && type != Json::value_t::null)
                        fail_shape(std::string("top-level value is ") + type_name(type) + ", expected object");
                    return;
                }
                if (depth_ != 1 || !top_is_object_)
                    return;

                std::string *field = nullptr;
                if (iequals(key_, "todo"))
                    field = &item_.task;
                else if (iequals(key_, "due"))
                    field = &item_.due;
                if (!field || type == Json::value_t::null)
                    return;

                if (type == Json::value_t::string)
                    *field = *text;
                else
                    fail_shape("field \"" + key_ + "\" has type " + type_name(type) + ", expected string");
            }

            void fail_shape(const std::string &reason)
            {
                if (!shape_error_)
                    logging::get()->debug("{}", reason);
                shape_error_ = true;
            }

            static const char *type_name(Json::value_t type)
            {
                return Json(type).type_name();
            }

            RawItem item_;
            std::string key_;
            int depth_{0};
            bool top_is_object_{false};
            bool shape_error_{false};

            int error_id_{0};
            std::size_t error_position_{0};
            std::string error_token_;
            std::string error_what_;
        };

        constexpr int kNumberOverflow = 406;
    } // namespace

    nlohmann::ordered_json ParsedItem::to_json() const
    {
        return nlohmann::ordered_json{
            {"Todo", task},
            {"Due", due.to_rfc3339()}};
    }

    Result<RawItem> InputProcessor::deserialize(const std::string &raw_input)
    {
        std::string text = raw_input;
        while (true)
        {
            RawItemHandler handler;
            bool ok = false;
            try
            {
                ok = Json::sax_parse(text, &handler);
            }
            catch (const std::exception &e)
            {
                logging::get()->debug("JSON parse failed: {}", e.what());
                return std::unexpected(TodoError::malformed_input(kInvalidJsonMessage));
            }

            if (ok)
            {
                if (handler.shape_error())
                    return std::unexpected(TodoError::malformed_input(kInvalidJsonMessage));
                return handler.item();
            }

            // A number too large for a double is still valid JSON. Its value
            // never reaches a RawItem, so swap it for 0 and parse again.
            const auto &token = handler.error_token();
            if (handler.error_id() == kNumberOverflow && !token.empty() &&
                handler.error_position() >= token.size())
            {
                auto start = handler.error_position() - token.size();
                if (text.compare(start, token.size(), token) == 0)
                {
                    text.replace(start, token.size(), "0");
                    continue;
                }
            }

            logging::get()->debug("JSON parse failed: {}", handler.error_what());
            return std::unexpected(TodoError::malformed_input(kInvalidJsonMessage));
        }
    }

    Result<ParsedItem> InputProcessor::build(const RawItem &raw, const std::string &format)
    {
        auto due = DueDateParser::parse(raw.due, format);
        if (!due)
        {
            logging::get()->debug("due date \"{}\" does not match layout {}", raw.due, format);
            return std::unexpected(due.error());
        }
        return ParsedItem{raw.task, *due};
    }

    Result<ParsedItem> InputProcessor::process(const std::string &raw_input, const std::string &format)
    {
        auto raw = deserialize(raw_input);
        if (!raw)
            return std::unexpected(raw.error());

        logging::get()->debug("deserialized item: todo=\"{}\" due=\"{}\"", raw->task, raw->due);
        return build(*raw, format);
    }

} // namespace todo
