#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace nascore::server
{

    /// Runs `task` on its own thread every `interval` until stopped.
    /// Exceptions thrown by the task are logged and the schedule continues.
    class PeriodicTask
    {
    public:
        PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
        ~PeriodicTask();

        PeriodicTask(const PeriodicTask &) = delete;
        PeriodicTask &operator=(const PeriodicTask &) = delete;

        void start();
        void stop();

        bool running() const;

    private:
        void loop();
        void run_once();

        std::string name_;
        std::chrono::milliseconds interval_;
        std::function<void()> task_;

        mutable std::mutex mutex_;
        std::condition_variable wake_;
        bool stop_requested_{false};
        std::thread thread_;
    };

} // namespace nascore::server
