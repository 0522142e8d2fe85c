#include "engine/LifecycleManager.hpp"

#include "engine/SeedStore.hpp"
#include "engine/SwarmEngine.hpp"
#include "utils/Log.hpp"

#include <utility>

namespace ts::engine
{

char const *to_string(LifecyclePhase phase) noexcept
{
    switch (phase)
    {
    case LifecyclePhase::Active:
        return "active";
    case LifecyclePhase::Draining:
        return "draining";
    case LifecyclePhase::Removing:
        return "removing";
    }
    return "unknown";
}

LifecycleManager::LifecycleManager(SwarmEngine &engine,
                                   SchedulerService &scheduler,
                                   SeedStore &seeds, LifecycleSettings settings)
    : engine_(engine), scheduler_(scheduler), seeds_(seeds),
      settings_(settings)
{
}

LifecycleManager::~LifecycleManager()
{
    for (auto &[hash, record] : records_)
    {
        if (record.timer)
        {
            scheduler_.cancel(*record.timer);
        }
    }
}

bool LifecycleManager::stream_opened(std::string const &hash,
                                     std::string_view file_name)
{
    auto &record = records_[hash];
    if (record.phase == LifecyclePhase::Removing)
    {
        TS_LOG_DEBUG("Stream for {} refused; {} is being removed", file_name,
                     hash);
        return false;
    }
    TS_LOG_INFO("Stream opened: {}", file_name);
    ++record.open_streams;
    if (record.timer)
    {
        scheduler_.cancel(*record.timer);
        record.timer.reset();
        TS_LOG_DEBUG("Teardown of {} cancelled", hash);
    }
    record.phase = LifecyclePhase::Active;
    return true;
}

void LifecycleManager::stream_closed(std::string const &hash,
                                     std::string_view file_name)
{
    TS_LOG_INFO("Stream closed: {}", file_name);
    auto it = records_.find(hash);
    if (it == records_.end() || it->second.open_streams <= 0)
    {
        TS_LOG_WARN("Stream close for {} without a matching open", hash);
        if (it == records_.end())
        {
            it = records_.emplace(hash, SessionLifecycle{}).first;
        }
        if (it->second.phase == LifecyclePhase::Removing)
        {
            return;
        }
        it->second.open_streams = 1;
    }
    auto &record = it->second;
    if (--record.open_streams > 0)
    {
        return;
    }
    arm_teardown(hash, record);
}

bool LifecycleManager::admit_seed(std::string const &hash,
                                  std::string_view name)
{
    if (records_.contains(hash))
    {
        return false;
    }
    auto &record = records_[hash];
    arm_teardown(hash, record);
    TS_LOG_INFO("Seeding torrent: {}", name);
    return true;
}

bool LifecycleManager::after_teardown(std::string const &hash,
                                      std::function<void()> callback)
{
    auto it = records_.find(hash);
    if (it == records_.end() || it->second.phase != LifecyclePhase::Removing)
    {
        return false;
    }
    it->second.teardown_waiters.push_back(std::move(callback));
    return true;
}

void LifecycleManager::arm_teardown(std::string const &hash,
                                    SessionLifecycle &record)
{
    record.open_streams = 0;
    record.phase = LifecyclePhase::Draining;
    if (record.timer)
    {
        return;
    }
    record.deadline =
        SchedulerService::Clock::now() + settings_.grace_period;
    record.timer = scheduler_.schedule_once(
        settings_.grace_period, [this, hash] { on_teardown_due(hash); });
    TS_LOG_DEBUG("Teardown of {} armed for {} ms", hash,
                 settings_.grace_period.count());
}

void LifecycleManager::on_teardown_due(std::string const &hash)
{
    auto it = records_.find(hash);
    if (it == records_.end() || it->second.phase != LifecyclePhase::Draining)
    {
        return;
    }
    auto &record = it->second;
    record.phase = LifecyclePhase::Removing;
    record.timer.reset();

    auto session = engine_.get(hash);
    if (!session)
    {
        TS_LOG_DEBUG("Teardown of {}: engine holds no session", hash);
        auto waiters = std::move(record.teardown_waiters);
        records_.erase(it);
        for (auto &waiter : waiters)
        {
            waiter();
        }
        return;
    }
    engine_.destroy(hash, !settings_.keep_downloaded_files,
                    [this, hash, name = session->name](bool removed)
                    { finish_teardown(hash, name, removed); });
}

void LifecycleManager::finish_teardown(std::string const &hash,
                                       std::string const &name, bool removed)
{
    if (removed)
    {
        TS_LOG_INFO("Removed torrent: {}", name);
    }
    else
    {
        TS_LOG_DEBUG("Torrent {} was already gone at teardown", name);
    }
    if (!name.empty())
    {
        seeds_.remove(name);
    }
    std::vector<std::function<void()>> waiters;
    if (auto it = records_.find(hash); it != records_.end())
    {
        waiters = std::move(it->second.teardown_waiters);
        records_.erase(it);
    }
    for (auto &waiter : waiters)
    {
        waiter();
    }
}

bool LifecycleManager::has_record(std::string const &hash) const
{
    return records_.contains(hash);
}

std::optional<LifecyclePhase>
LifecycleManager::phase(std::string const &hash) const
{
    auto it = records_.find(hash);
    if (it == records_.end())
    {
        return std::nullopt;
    }
    return it->second.phase;
}

int LifecycleManager::open_streams(std::string const &hash) const
{
    auto it = records_.find(hash);
    return it == records_.end() ? 0 : it->second.open_streams;
}

int LifecycleManager::total_open_streams() const
{
    int total = 0;
    for (auto const &[hash, record] : records_)
    {
        total += record.open_streams;
    }
    return total;
}

bool LifecycleManager::teardown_pending(std::string const &hash) const
{
    auto it = records_.find(hash);
    return it != records_.end() && it->second.timer.has_value();
}

std::optional<SchedulerService::Clock::time_point>
LifecycleManager::teardown_deadline(std::string const &hash) const
{
    auto it = records_.find(hash);
    if (it == records_.end() || !it->second.timer)
    {
        return std::nullopt;
    }
    return it->second.deadline;
}

std::size_t LifecycleManager::size() const noexcept
{
    return records_.size();
}

} // namespace ts::engine
