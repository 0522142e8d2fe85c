#include "app/DaemonMain.hpp"

#include "app/Config.hpp"
#include "engine/Core.hpp"
#include "http/Server.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

namespace ts::app
{

namespace
{

// "--run-seconds=N" or "--run-seconds N"; a missing or bad number means 5.
int parse_run_seconds(int argc, char *argv[])
{
    auto parse = [](std::string_view text)
    {
        int value = 0;
        auto [ptr, ec] =
            std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} ||
            ptr != text.data() + text.size())
        {
            return 5;
        }
        return value;
    };
    int run_seconds = 0;
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] == nullptr)
        {
            continue;
        }
        std::string_view arg = argv[index];
        if (arg.rfind("--run-seconds=", 0) == 0)
        {
            run_seconds = parse(arg.substr(14));
        }
        else if (arg == "--run-seconds")
        {
            if (index + 1 < argc && argv[index + 1] &&
                argv[index + 1][0] != '-')
            {
                run_seconds = parse(argv[index + 1]);
            }
            else
            {
                run_seconds = 5;
            }
        }
    }
    return run_seconds;
}

void prepare_directories(engine::CoreSettings const &settings)
{
    std::error_code ec;
    if (!settings.keep_downloaded_files)
    {
        ts::utils::empty_directory(
            settings.download_dir,
            {settings.seed_dir, settings.torrent_file_dir}, ec);
        if (ec)
        {
            TS_LOG_WARN("could not empty {}: {}",
                        settings.download_dir.string(), ec.message());
        }
    }
    for (auto const &dir : {settings.download_dir, settings.seed_dir,
                            settings.torrent_file_dir})
    {
        if (!ts::utils::ensure_directory(dir, ec))
        {
            TS_LOG_WARN("could not create {}: {}", dir.string(),
                        ec.message());
        }
    }
}

} // namespace

int daemon_main(int argc, char *argv[])
{
    try
    {
        ts::runtime::install_signal_handlers();

        auto config = load_config(process_environment());
        if (!config.log_file.empty())
        {
            ts::log::set_log_file(config.log_file);
        }
        TS_LOG_INFO("{} starting", ts::version::kDisplayVersion);
        TS_LOG_INFO("download dir {}, seed dir {}, seed time {} ms, "
                    "metadata timeout {} ms",
                    config.core.download_dir.string(),
                    config.core.seed_dir.string(),
                    config.core.seed_time.count(),
                    config.core.metadata_timeout.count());
        prepare_directories(config.core);

        int run_seconds = parse_run_seconds(argc, argv);

        auto engine = ts::engine::Core::create(config.core);
        std::thread engine_thread([core = engine.get()] { core->run(); });
        TS_LOG_INFO("Engine thread started");

        ts::http::Server server(engine.get(), config.http_bind);
        if (!server.start())
        {
            ts::runtime::request_shutdown();
        }

        if (run_seconds > 0)
        {
            std::thread(
                [run_seconds]()
                {
                    std::this_thread::sleep_for(
                        std::chrono::seconds(run_seconds));
                    TS_LOG_INFO("Auto shutdown: run-seconds={} reached, "
                                "requesting shutdown",
                                run_seconds);
                    ts::runtime::request_shutdown();
                })
                .detach();
        }

        ts::log::print_status("TorrentStream listening on port {}; CTRL+C "
                              "to stop.",
                              server.port());

        ts::runtime::wait_for_shutdown();

        TS_LOG_INFO("Shutdown requested; stopping HTTP and engine...");
        // 1. Stop accepting requests; the server object stays alive so that
        //    late Core callbacks still have somewhere to land.
        server.stop();

        // 2. Stop the loop and wait for it before tearing the engine down.
        engine->stop();
        if (engine_thread.joinable())
        {
            engine_thread.join();
        }
        engine.reset();

        ts::log::print_status("Shutdown complete.");
        TS_LOG_INFO("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "TorrentStream daemon failed: %s\n", ex.what());
    }
    return 1;
}

} // namespace ts::app
