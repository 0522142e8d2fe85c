#include "engine/Core.hpp"

#include "engine/AsyncTaskService.hpp"
#include "engine/LibtorrentEngine.hpp"
#include "engine/LifecycleManager.hpp"
#include "engine/MetadataAcquirer.hpp"
#include "engine/Metainfo.hpp"
#include "engine/SchedulerService.hpp"
#include "engine/SeedReconciler.hpp"
#include "engine/SeedStore.hpp"
#include "engine/TorrentUtils.hpp"
#include "utils/FS.hpp"
#include "utils/HttpFetch.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

namespace ts::engine
{

namespace
{

constexpr auto kStatsInterval = std::chrono::milliseconds(1000);
constexpr std::size_t kMaxPendingTasks = 4096;

EngineSettings stream_engine_settings(CoreSettings const &s)
{
    EngineSettings settings;
    settings.label = "stream";
    settings.listen_interface = s.listen_interface;
    settings.max_connections_per_torrent = s.max_connections_per_torrent;
    settings.download_rate_limit = s.download_rate_limit;
    settings.upload_rate_limit = s.upload_rate_limit;
    settings.read_ahead_pieces = s.read_ahead_pieces;
    settings.enable_dht = s.enable_dht;
    return settings;
}

// The metadata engine never downloads payload, so it gets an ephemeral
// port and no rate limits.
EngineSettings info_engine_settings(CoreSettings const &s)
{
    EngineSettings settings;
    settings.label = "info";
    settings.listen_interface = "0.0.0.0:0";
    settings.max_connections_per_torrent = s.max_connections_per_torrent;
    settings.enable_dht = s.enable_dht;
    return settings;
}

std::filesystem::path scratch_dir_for(CoreSettings const &s)
{
    return s.download_dir / ".info";
}

// "/Name/dir/file.mkv" -> "Name"
std::string seed_candidate(std::string_view path)
{
    while (!path.empty() && path.front() == '/')
    {
        path.remove_prefix(1);
    }
    auto slash = path.find('/');
    return std::string(path.substr(0, slash));
}

bool summary_has_path(TorrentSummary const &summary, std::string_view path)
{
    while (!path.empty() && path.front() == '/')
    {
        path.remove_prefix(1);
    }
    return std::any_of(summary.files.begin(), summary.files.end(),
                       [path](SummaryFile const &file)
                       { return file.path == path; });
}

} // namespace

struct Core::Impl
{
    CoreSettings settings;

    // Declared before the engines: libtorrent's alert notify touches them
    // until the engines are gone.
    std::deque<std::function<void()>> tasks;
    std::mutex task_mutex;
    std::condition_variable task_space_cv;
    std::mutex wake_mutex;
    std::condition_variable wake_cv;
    bool wake_pending = false;
    std::atomic_bool shutdown_requested{false};
    std::atomic_bool running{false};

    SchedulerService scheduler;
    LibtorrentEngine stream_engine;
    LibtorrentEngine info_engine;
    SeedStore seeds;
    LifecycleManager lifecycle;
    MetadataAcquirer acquirer;
    SeedReconciler reconciler;
    StreamBroker broker;
    StatsAggregator aggregator;
    AsyncTaskService fetch_service{"fetch"};
    std::atomic<std::shared_ptr<StreamStats const>> stats_snapshot{
        std::make_shared<StreamStats const>()};

    explicit Impl(CoreSettings s)
        : settings(std::move(s)),
          stream_engine(stream_engine_settings(settings)),
          info_engine(info_engine_settings(settings)),
          seeds(settings.seed_dir, settings.torrent_file_dir,
                settings.keep_torrent_files),
          lifecycle(stream_engine, scheduler, seeds,
                    LifecycleSettings{settings.seed_time,
                                      settings.keep_downloaded_files}),
          acquirer(info_engine, scheduler, settings.metadata_timeout,
                   scratch_dir_for(settings)),
          reconciler(stream_engine, lifecycle, seeds, settings.download_dir),
          broker(stream_engine, scheduler, lifecycle,
                 StreamBrokerSettings{settings.download_dir,
                                      settings.metadata_timeout}),
          aggregator(stream_engine, lifecycle)
    {
        for (auto const &dir : {settings.download_dir, settings.seed_dir,
                                scratch_dir_for(settings)})
        {
            std::error_code ec;
            if (!dir.empty() && !utils::ensure_directory(dir, ec))
            {
                TS_LOG_WARN("unable to create {}: {}", dir.string(),
                            ec.message());
            }
        }
        stream_engine.start([this] { notify(); });
        info_engine.start([this] { notify(); });
        fetch_service.start();
    }

    ~Impl()
    {
        // Queued fetches finish first; whatever they enqueue is dropped
        // with the task queue.
        fetch_service.stop();
    }

    void enqueue(std::function<void()> task)
    {
        {
            std::unique_lock<std::mutex> lock(task_mutex);
            while (tasks.size() >= kMaxPendingTasks &&
                   !shutdown_requested.load(std::memory_order_relaxed))
            {
                TS_LOG_INFO("task queue maxed out ({}); waiting for engine "
                            "to catch up",
                            tasks.size());
                task_space_cv.wait(
                    lock,
                    [this]
                    {
                        return tasks.size() < kMaxPendingTasks ||
                               shutdown_requested.load(
                                   std::memory_order_relaxed);
                    });
            }
            tasks.push_back(std::move(task));
        }
        notify();
    }

    void notify()
    {
        {
            std::lock_guard<std::mutex> lock(wake_mutex);
            wake_pending = true;
        }
        wake_cv.notify_one();
    }

    void process_tasks()
    {
        std::deque<std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lock(task_mutex);
            pending.swap(tasks);
        }
        task_space_cv.notify_all();
        if (pending.empty())
        {
            return;
        }
        TS_LOG_DEBUG("Processing {} pending engine commands", pending.size());
        for (auto &task : pending)
        {
            try
            {
                task();
            }
            catch (std::exception const &ex)
            {
                TS_LOG_ERROR("engine task threw std::exception: {}",
                             ex.what());
                TS_LOG_ERROR("engine task failed; continuing");
            }
        }
    }

    void wait_for_work(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(wake_mutex);
        wake_cv.wait_for(lock, timeout,
                         [this]
                         {
                             return wake_pending ||
                                    shutdown_requested.load(
                                        std::memory_order_relaxed);
                         });
        wake_pending = false;
    }

    void publish_stats()
    {
        stats_snapshot.store(
            std::make_shared<StreamStats const>(aggregator.collect()),
            std::memory_order_release);
    }

    void startup()
    {
        if (settings.auto_seed)
        {
            reconciler.reconcile();
        }
        scheduler.schedule(kStatsInterval, [this] { publish_stats(); });
        publish_stats();
    }

    void run()
    {
        running.store(true);
        startup();
        while (!shutdown_requested.load())
        {
            process_tasks();
            stream_engine.process_alerts();
            info_engine.process_alerts();
            broker.retry_pending_reads();
            auto now = SchedulerService::Clock::now();
            scheduler.tick(now);

            auto sched_wait = scheduler.time_until_next_task(now);
            auto wait_limit = std::min<long long>(
                static_cast<long long>(settings.idle_sleep_ms),
                static_cast<long long>(sched_wait.count()));
            wait_for_work(
                std::chrono::milliseconds(std::max<long long>(1, wait_limit)));
        }
        TS_LOG_INFO("engine loop stopped ({} streams open)",
                    broker.open_tickets());
        running.store(false);
    }

    // Runs on the fetch worker. A seed file whose listing contains `path`
    // short-cuts the download.
    std::optional<std::vector<std::uint8_t>>
    load_torrent_file(std::string const &uri, std::string const &path,
                      std::string &error)
    {
        auto candidate = seed_candidate(path);
        if (!candidate.empty() && seeds.contains(candidate))
        {
            std::error_code ec;
            auto bytes = seeds.load(candidate, ec);
            if (!ec)
            {
                auto summary = summarize_metainfo(bytes);
                if (summary && summary_has_path(*summary, path))
                {
                    TS_LOG_DEBUG("using seed file for {}", candidate);
                    return bytes;
                }
            }
        }
        auto fetched = utils::http_get(uri, settings.fetch_timeout);
        if (!fetched.ok())
        {
            error = fetched.error.empty()
                        ? "HTTP status " + std::to_string(fetched.status)
                        : fetched.error;
            return std::nullopt;
        }
        return std::move(fetched.body);
    }

    void archive_seed(std::string const &name,
                      std::vector<std::uint8_t> const &bytes)
    {
        std::error_code ec;
        if (!seeds.archive(name, bytes, ec))
        {
            TS_LOG_DEBUG("{} will not be restored on restart", name);
        }
    }
};

Core::Core(CoreSettings settings)
    : impl_(std::make_unique<Impl>(std::move(settings)))
{
}

Core::~Core() = default;

std::unique_ptr<Core> Core::create(CoreSettings settings)
{
    return std::make_unique<Core>(std::move(settings));
}

void Core::run()
{
    impl_->run();
}

void Core::stop() noexcept
{
    impl_->shutdown_requested.store(true);
    impl_->task_space_cv.notify_all();
    impl_->wake_cv.notify_one();
}

bool Core::is_running() const noexcept
{
    return impl_->running.load();
}

void Core::resolve_torrent(std::string uri, ResolveCallback callback)
{
    auto kind = classify_uri(uri);
    if (kind == UriKind::Invalid)
    {
        callback({ResolveStatus::InvalidUri, std::nullopt, "invalid uri"});
        return;
    }
    if (kind == UriKind::TorrentFile)
    {
        auto accepted = impl_->fetch_service.submit(
            [impl = impl_.get(), uri, callback]
            {
                std::string error;
                auto bytes = impl->load_torrent_file(uri, {}, error);
                if (!bytes)
                {
                    callback({ResolveStatus::FetchFailed, std::nullopt, error});
                    return;
                }
                auto summary = summarize_metainfo(*bytes);
                if (!summary)
                {
                    callback({ResolveStatus::FetchFailed, std::nullopt,
                              "not a torrent file"});
                    return;
                }
                callback({ResolveStatus::Ok, std::move(summary), {}});
            });
        if (!accepted)
        {
            callback({ResolveStatus::FetchFailed, std::nullopt,
                      "shutting down"});
        }
        return;
    }

    auto magnet =
        kind == UriKind::InfoHash ? magnet_for_info_hash(uri) : std::move(uri);
    impl_->enqueue(
        [impl = impl_.get(), magnet = std::move(magnet),
         callback = std::move(callback)]() mutable
        {
            impl->acquirer.resolve(
                AddSource::magnet(std::move(magnet)),
                [callback](std::optional<TorrentSummary> summary)
                {
                    if (!summary)
                    {
                        callback({ResolveStatus::NoMetadata, std::nullopt,
                                  "no metadata"});
                        return;
                    }
                    callback({ResolveStatus::Ok, std::move(summary), {}});
                });
        });
}

void Core::open_stream(StreamRequest request, OpenStreamCallback callback)
{
    auto kind = classify_uri(request.uri);
    if (kind == UriKind::Invalid)
    {
        callback({OpenStreamStatus::InvalidUri, std::nullopt, "invalid uri"});
        return;
    }
    if (kind == UriKind::TorrentFile)
    {
        auto accepted = impl_->fetch_service.submit(
            [impl = impl_.get(), request, callback]
            {
                std::string error;
                auto bytes =
                    impl->load_torrent_file(request.uri, request.path, error);
                if (!bytes)
                {
                    callback(
                        {OpenStreamStatus::FetchFailed, std::nullopt, error});
                    return;
                }
                auto summary = summarize_metainfo(*bytes);
                if (!summary)
                {
                    callback({OpenStreamStatus::FetchFailed, std::nullopt,
                              "not a torrent file"});
                    return;
                }
                impl->enqueue(
                    [impl, bytes = std::move(*bytes), name = summary->name,
                     hash = summary->hash, path = request.path, callback]
                    {
                        impl->broker.open(
                            AddSource::metainfo(bytes), hash, path,
                            [impl, bytes, name,
                             callback](OpenStreamResult result)
                            {
                                if (result.status == OpenStreamStatus::Ok)
                                {
                                    impl->archive_seed(name, bytes);
                                }
                                callback(std::move(result));
                            });
                    });
            });
        if (!accepted)
        {
            callback({OpenStreamStatus::FetchFailed, std::nullopt,
                      "shutting down"});
        }
        return;
    }

    auto magnet = kind == UriKind::InfoHash ? magnet_for_info_hash(request.uri)
                                            : std::move(request.uri);
    auto hash = magnet_content_id(magnet);
    if (!hash)
    {
        callback({OpenStreamStatus::InvalidUri, std::nullopt,
                  "no info-hash in uri"});
        return;
    }
    impl_->enqueue(
        [impl = impl_.get(), magnet = std::move(magnet), hash = std::move(*hash),
         path = std::move(request.path),
         callback = std::move(callback)]() mutable
        {
            impl->broker.open(AddSource::magnet(std::move(magnet)),
                              std::move(hash), std::move(path),
                              std::move(callback));
        });
}

void Core::close_stream(StreamTicket const &ticket)
{
    impl_->enqueue([impl = impl_.get(), id = ticket.id]
                   { impl->broker.close(id); });
}

void Core::read_chunk(StreamTicket const &ticket, std::uint64_t offset,
                      std::size_t max_bytes, ReadCallback callback)
{
    impl_->enqueue(
        [impl = impl_.get(), id = ticket.id, offset, max_bytes,
         callback = std::move(callback)]() mutable
        { impl->broker.read(id, offset, max_bytes, std::move(callback)); });
}

std::shared_ptr<StreamStats const> Core::stats() const noexcept
{
    return impl_->stats_snapshot.load(std::memory_order_acquire);
}

CoreSettings const &Core::settings() const noexcept
{
    return impl_->settings;
}

} // namespace ts::engine
