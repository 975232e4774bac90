#include "nascore/server/periodic_task.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace nascore::server
{

    PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> task)
        : name_(std::move(name)), interval_(interval), task_(std::move(task)) {}

    PeriodicTask::~PeriodicTask()
    {
        stop();
    }

    void PeriodicTask::start()
    {
        std::lock_guard lock(mutex_);
        if (thread_.joinable())
        {
            return;
        }
        stop_requested_ = false;
        thread_ = std::thread([this]
                              { loop(); });
        spdlog::debug("Background task '{}' started, interval {} ms", name_, interval_.count());
    }

    void PeriodicTask::stop()
    {
        std::thread worker;
        {
            std::lock_guard lock(mutex_);
            if (!thread_.joinable())
            {
                return;
            }
            stop_requested_ = true;
            worker = std::move(thread_);
        }
        wake_.notify_all();
        worker.join();
        spdlog::debug("Background task '{}' stopped", name_);
    }

    bool PeriodicTask::running() const
    {
        std::lock_guard lock(mutex_);
        return thread_.joinable() && !stop_requested_;
    }

    void PeriodicTask::loop()
    {
        std::unique_lock lock(mutex_);
        while (!stop_requested_)
        {
            if (wake_.wait_for(lock, interval_, [this]
                               { return stop_requested_; }))
            {
                break;
            }
            lock.unlock();
            run_once();
            lock.lock();
        }
    }

    void PeriodicTask::run_once()
    {
        try
        {
            task_();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Background task '{}' failed: {}", name_, ex.what());
        }
    }

} // namespace nascore::server
