#include "todo/config.hpp"
#include "todo/logging.hpp"
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace todo
{
    namespace
    {
        AppConfig parse_toml(const toml::table &tbl, AppConfig cfg)
        {
            auto app = tbl["app"].as_table();
            if (!app)
                return cfg;

            if (auto fmt = (*app)["date_format"].value<std::string>())
                cfg.date_format = *fmt;
            if (auto level = (*app)["log_level"].value<std::string>())
                cfg.log_level = *level;
            if (auto item = (*app)["default_item"].value<std::string>())
                cfg.default_item = *item;
            return cfg;
        }
    } // namespace

    Result<AppConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(TodoError::io("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<AppConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AppConfig cfg{};
        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl, cfg);
        }
        catch (const std::exception &e)
        {
            return std::unexpected(TodoError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        auto valid = validate(cfg);
        if (!valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::validate(const AppConfig &cfg)
    {
        auto layout = DueDateParser::validate_format(cfg.date_format);
        if (!layout)
            return layout;
        auto level = logging::level_from_string(cfg.log_level);
        if (!level)
            return std::unexpected(level.error());
        // fatal diagnostics are logged at critical and must stay visible
        if (*level == spdlog::level::off)
            return std::unexpected(TodoError::config("log_level \"off\" would hide fatal diagnostics"));
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const AppConfig &cfg)
    {
        nlohmann::json j;
        j["date_format"] = cfg.date_format;
        j["log_level"] = cfg.log_level;
        j["default_item"] = cfg.default_item;
        return j;
    }

} // namespace todo
