#pragma once

#include "types.hpp"
#include "due_date.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace todo
{

    struct AppConfig
    {
        std::string date_format{kDefaultDueDateFormat};
        std::string log_level{"warn"};
        std::string default_item{R"({"todo": "Something worth doing"})"};
    };

    /**
     * ConfigLoader reads the optional TOML config named on the command line.
     * Values live in an [app] table; anything missing keeps its default.
     *
     *   [app]
     *   date_format = "DD/MM/YYYY"
     *   log_level = "debug"
     *   default_item = '{"todo": "Water the plants"}'
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. */
        static Result<AppConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<AppConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for debug output. */
        static nlohmann::json to_json(const AppConfig &cfg);

    private:
        static Result<void> validate(const AppConfig &cfg);
    };

} // namespace todo
