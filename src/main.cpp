#include "app/Config.hpp"
#include "app/DaemonController.hpp"
#include "app/Process.hpp"
#include "app/StopCommand.hpp"
#include "state/SettingsStore.hpp"
#include "utils/Errors.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace
{

std::filesystem::path require_config_root()
{
    auto root = tbl::utils::config_root();
    if (!root)
    {
        throw tbl::ConfigError(
            "cannot determine config directory; set HOME or TBL_CONFIG_DIR");
    }
    return *root;
}

int run(std::vector<std::string> const &args)
{
    auto cli = tbl::app::parse_command_line(args);
    if (cli.help)
    {
        std::fputs(tbl::app::usage_text().c_str(), stdout);
        return 0;
    }
    if (cli.version)
    {
        tbl::log::print_status("{}", tbl::version::kDisplayVersion);
        return 0;
    }

    auto config_dir = require_config_root();
    if (cli.stop)
    {
        tbl::app::StopOptions stop;
        stop.config_dir = config_dir;
        return tbl::app::report_stop_result(
            tbl::app::stop_running_instance(std::move(stop)));
    }

    bool const daemonized = tbl::app::is_daemonized();
    std::unique_ptr<tbl::storage::Database> db;
    if (daemonized)
    {
        if (!tbl::utils::ensure_directory(config_dir))
        {
            throw tbl::LaunchError("failed to create config dir " +
                                   config_dir.string());
        }
        std::error_code ec;
        std::filesystem::current_path(config_dir, ec);
        if (ec)
        {
            throw tbl::LaunchError("failed to chdir to " + config_dir.string() +
                                   ": " + ec.message());
        }
    }
    auto const settings_path = config_dir / "settings.db";
    std::error_code exists_ec;
    if (daemonized || std::filesystem::exists(settings_path, exists_ec))
    {
        db = std::make_unique<tbl::storage::Database>(settings_path);
    }

    tbl::app::LaunchOptions options;
    options.config_dir = config_dir;
    options.settings = tbl::app::resolve_settings(
        cli, &tbl::app::read_environment, db.get());
    options.args = args;
    options.daemonized = daemonized;
    db.reset();

    tbl::app::DaemonController controller(std::move(options));
    return controller.run();
}

} // namespace

int main(int argc, char *argv[])
{
    std::vector<std::string> args;
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] != nullptr)
        {
            args.emplace_back(argv[index]);
        }
    }

    try
    {
        return run(args);
    }
    catch (tbl::LaunchError const &ex)
    {
        TBL_LOG_ERROR("startup failed: {}", ex.what());
        tbl::log::print_error("tbl: {}", ex.what());
    }
    catch (std::exception const &ex)
    {
        TBL_LOG_ERROR("unexpected failure: {}", ex.what());
        tbl::log::print_error("tbl failed: {}", ex.what());
    }
    return 1;
}
