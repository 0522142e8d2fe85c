#include "engine/AsyncTaskService.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace ts::engine
{

AsyncTaskService::AsyncTaskService(std::string name) : name_(std::move(name))
{
}

AsyncTaskService::~AsyncTaskService()
{
    stop();
}

void AsyncTaskService::start()
{
    if (worker_.joinable())
    {
        return;
    }
    exit_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this] { loop(); });
}

void AsyncTaskService::stop()
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        exit_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable())
    {
        worker_.join();
    }
    running_.store(false, std::memory_order_release);
}

bool AsyncTaskService::is_running() const noexcept
{
    return running_.load(std::memory_order_acquire);
}

bool AsyncTaskService::submit(std::function<void()> task)
{
    if (!task)
    {
        return false;
    }
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (exit_requested_.load(std::memory_order_acquire))
        {
            TS_LOG_DEBUG("{} worker stopping; task dropped", name_);
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

std::size_t AsyncTaskService::queued() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return tasks_.size();
}

void AsyncTaskService::loop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock,
                     [this]
                     {
                         return exit_requested_.load(
                                    std::memory_order_acquire) ||
                                !tasks_.empty();
                     });
            if (tasks_.empty())
            {
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try
        {
            task();
        }
        catch (std::exception const &ex)
        {
            TS_LOG_ERROR("{} task threw: {}", name_, ex.what());
        }
    }
    running_.store(false, std::memory_order_release);
}

} // namespace ts::engine
