#include "app/DaemonMain.hpp"
#include "engine/Core.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/SettingsManager.hpp"
#include "report/Serializer.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

namespace
{

constexpr char kUsage[] =
    "usage: flowledger [--state PATH] [--input PATH|-] [--tariff N]\n"
    "                  [--leak-threshold N] [--units metric|us]\n"
    "                  [--save-interval SECONDS] [--keep-running]\n"
    "                  [--status] [--verbose]";

template <typename T>
std::optional<T> parse_number(std::optional<std::string> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    T parsed{};
    auto const *end = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(value->data(), end, parsed);
    if (ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return parsed;
}

struct CommandLine
{
    fl::engine::CoreSettings settings;
    fl::engine::SettingsUpdate overrides;
    bool status = false;
    bool verbose = false;
    bool help = false;
};

} // namespace

namespace fl::app
{

int daemon_main(int argc, char *argv[])
{
    try
    {
        auto read_env = [](char const *key) -> std::optional<std::string>
        {
            auto value = std::getenv(key);
            if (value == nullptr)
            {
                return std::nullopt;
            }
            return std::string(value);
        };

        CommandLine cli;
        bool ok = true;

        auto take_double = [&](std::optional<std::string> const &raw,
                               char const *what) -> std::optional<double>
        {
            auto parsed = parse_number<double>(raw);
            if (raw && !parsed)
            {
                FL_LOG_ERROR("{} '{}' is not a number", what, *raw);
                ok = false;
            }
            return parsed;
        };

        auto take_units = [&](std::optional<std::string> const &raw)
            -> std::optional<fl::engine::UnitSystem>
        {
            if (!raw)
            {
                return std::nullopt;
            }
            auto parsed = fl::engine::SettingsManager::parse_unit_system(*raw);
            if (!parsed)
            {
                FL_LOG_ERROR("unknown unit system '{}'", *raw);
                ok = false;
            }
            return parsed;
        };

        // Environment first; flags below take precedence.
        if (auto env = read_env("FL_STATE_PATH"); env)
        {
            cli.settings.state_path = *env;
        }
        if (auto tariff = take_double(read_env("FL_TARIFF"), "FL_TARIFF"))
        {
            cli.overrides.water_tariff = tariff;
        }
        if (auto threshold = take_double(read_env("FL_LEAK_THRESHOLD"),
                                         "FL_LEAK_THRESHOLD"))
        {
            cli.overrides.leak_threshold = threshold;
        }
        if (auto units = take_units(read_env("FL_UNIT_SYSTEM")))
        {
            cli.overrides.unit_system = units;
        }

        for (int index = 1; index < argc; ++index)
        {
            if (argv[index] == nullptr)
                continue;
            std::string_view arg = argv[index];
            auto next_value = [&]() -> std::optional<std::string>
            {
                if (index + 1 >= argc || argv[index + 1] == nullptr)
                {
                    FL_LOG_ERROR("{} needs a value", arg);
                    ok = false;
                    return std::nullopt;
                }
                return std::string(argv[++index]);
            };

            if (arg == "--state")
            {
                if (auto value = next_value())
                    cli.settings.state_path = *value;
            }
            else if (arg == "--input")
            {
                if (auto value = next_value())
                    cli.settings.input_path = *value == "-" ? "" : *value;
            }
            else if (arg == "--tariff")
            {
                if (auto value = take_double(next_value(), "--tariff"))
                    cli.overrides.water_tariff = value;
            }
            else if (arg == "--leak-threshold")
            {
                if (auto value = take_double(next_value(), "--leak-threshold"))
                    cli.overrides.leak_threshold = value;
            }
            else if (arg == "--units")
            {
                if (auto value = take_units(next_value()))
                    cli.overrides.unit_system = value;
            }
            else if (arg == "--save-interval")
            {
                auto raw = next_value();
                auto value = parse_number<int>(raw);
                if (raw && !value)
                {
                    FL_LOG_ERROR("--save-interval '{}' is not an integer",
                                 *raw);
                    ok = false;
                }
                cli.overrides.save_interval_seconds = value;
            }
            else if (arg == "--keep-running")
            {
                cli.settings.stop_at_end_of_input = false;
            }
            else if (arg == "--status")
            {
                cli.status = true;
            }
            else if (arg == "--verbose")
            {
                cli.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                cli.help = true;
            }
            else
            {
                FL_LOG_ERROR("unknown argument '{}'", arg);
                ok = false;
            }
        }

        if (cli.help || !ok)
        {
            fl::log::print_status("{}", kUsage);
            return ok ? 0 : 2;
        }

        fl::log::set_debug_enabled(cli.verbose);
        fl::log::set_log_file(fl::utils::data_root() / "flowledger.log");

        if (cli.status)
        {
            auto snapshot = fl::engine::Core::offline_snapshot(
                cli.settings, cli.overrides, fl::engine::calendar::now_seconds());
            if (!snapshot)
            {
                fl::log::print_status("{}", R"({"result":"no-state"})");
                return 1;
            }
            fl::log::print_status("{}",
                                  fl::report::serialize_status(*snapshot, true));
            return 0;
        }

        fl::runtime::install_signal_handlers();

        auto engine = fl::engine::Core::create(cli.settings, cli.overrides);
        engine->events().subscribe<fl::engine::LeakStateChangedEvent>(
            [](auto const &event)
            {
                fl::log::print_status("{}", fl::report::serialize_leak_event(
                                                event.event, event.at));
            });
        engine->events().subscribe<fl::engine::StateSavedEvent>(
            [core = engine.get()](auto const &event)
            {
                if (event.success && fl::log::debug_enabled())
                {
                    FL_LOG_DEBUG("status {}", fl::report::serialize_status(
                                                  core->snapshot()));
                }
            });

        std::thread engine_thread([core = engine.get()] { core->run(); });
        FL_LOG_INFO("engine thread started");

        while (!fl::runtime::should_shutdown() && engine->is_running())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        FL_LOG_INFO("stopping engine");
        engine->stop();
        if (engine_thread.joinable())
        {
            engine_thread.join();
        }
        engine.reset();

        FL_LOG_INFO("shutdown complete");
        return 0;
    }
    catch (std::exception const &ex)
    {
        FL_LOG_ERROR("flowledger failed: {}", ex.what());
        std::fprintf(stderr, "flowledger failed: %s\n", ex.what());
    }
    return 1;
}

} // namespace fl::app

int main(int argc, char *argv[])
{
    return fl::app::daemon_main(argc, argv);
}
