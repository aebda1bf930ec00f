#include "todo/cli.hpp"
#include "todo/item.hpp"
#include "todo/logging.hpp"
#include "todo/render.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <iostream>

namespace todo::cli
{

	namespace
	{
		constexpr const char *kAddHelp =
			"Item to add to todo list.\n"
			"\t{\"todo\": task to do, \"due\": date due (YYYY-MM-DD)}";

		constexpr std::array<const char *, 4> kLongOptions{"add", "config", "verbose", "help"};
		constexpr std::array<const char *, 3> kValueOptions{"-a", "--add", "--config"};

		template <std::size_t N>
		bool contains(const std::array<const char *, N> &names, const std::string &name)
		{
			for (const char *n : names)
			{
				if (name == n)
					return true;
			}
			return false;
		}
	} // namespace

	std::vector<std::string> normalize_args(int argc, char *argv[])
	{
		std::vector<std::string> args;
		args.reserve(static_cast<std::size_t>(argc));
		bool value_next = false;
		for (int i = 0; i < argc; ++i)
		{
			std::string arg = argv[i];
			if (i == 0 || value_next)
			{
				value_next = false;
				args.push_back(std::move(arg));
				continue;
			}
			// flag parsing ends at "--" or the first positional argument
			if (arg == "--" || arg.size() < 2 || arg[0] != '-')
				break;
			if (arg.size() > 2 && arg[0] == '-' && arg[1] != '-')
			{
				auto name = arg.substr(1, arg.find('=') - 1);
				if (contains(kLongOptions, name))
					arg.insert(0, "-");
			}
			value_next = contains(kValueOptions, arg);
			args.push_back(std::move(arg));
		}
		return args;
	}

	int exit_code_for(ErrorCode code)
	{
		switch (code)
		{
		case ErrorCode::MalformedInput:
		case ErrorCode::MalformedDate:
		case ErrorCode::ConfigError:
			return kExitInvalid;
		case ErrorCode::IOError:
			return kExitOutput;
		}
		return kExitInvalid;
	}

	int run_pipeline(const std::string &input, const AppConfig &cfg, std::ostream &out)
	{
		auto log = logging::get();

		auto item = InputProcessor::process(input, cfg.date_format);
		if (!item)
		{
			log->critical("{}", item.error().what());
			return exit_code_for(item.error().code);
		}
		log->debug("parsed due date: {}", item->due.is_absent() ? "<none>" : item->due.to_string());

		auto written = ItemRenderer::render(*item, out);
		if (!written)
		{
			log->critical("{}", written.error().what());
			return exit_code_for(written.error().code);
		}
		log->debug("wrote {} characters", *written);
		return kExitOk;
	}

	int run(int argc, char *argv[])
	{
		logging::init();

		CLI::App app{"todo-app: validate one todo item and echo it back"};
		app.allow_extras();

		AppConfig cfg{};
		std::string add_input = cfg.default_item;
		auto add_opt = app.add_option("-a,--add", add_input, kAddHelp)->capture_default_str();

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		bool verbose = false;
		app.add_flag("-v,--verbose", verbose, "Log pipeline steps to stderr");

		auto args = normalize_args(argc, argv);
		std::vector<char *> cargs;
		cargs.reserve(args.size());
		for (auto &a : args)
			cargs.push_back(a.data());
		int cargc = static_cast<int>(cargs.size());
		char **cargv = cargs.data();

		CLI11_PARSE(app, cargc, cargv);

		if (!config_path.empty())
		{
			auto loaded = ConfigLoader::load(config_path);
			if (!loaded)
			{
				logging::get()->critical("{}", loaded.error().what());
				return kExitInvalid;
			}
			cfg = *loaded;
			if (add_opt->count() == 0)
				add_input = cfg.default_item;
		}

		// level names were checked when the config was loaded
		auto level = logging::level_from_string(cfg.log_level);
		logging::init(verbose ? spdlog::level::debug : level.value_or(spdlog::level::warn));
		if (!config_path.empty())
			logging::get()->debug("config {}: {}", config_path, ConfigLoader::to_json(cfg).dump());

		return run_pipeline(add_input, cfg, std::cout);
	}

} // namespace todo::cli
