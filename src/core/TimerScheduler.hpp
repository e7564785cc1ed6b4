//
// TimerScheduler.hpp — single worker thread running tasks at their deadlines
//

#ifndef POKERPRO_TIMERSCHEDULER_HPP
#define POKERPRO_TIMERSCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "Effects.hpp"

namespace pokerpro::core
{
    class TimerScheduler final : public Scheduler
    {
    public:
        TimerScheduler();
        ~TimerScheduler() override;

        TimerScheduler(TimerScheduler const&) = delete;
        auto operator=(TimerScheduler const&) -> TimerScheduler& = delete;

        auto Schedule(std::chrono::milliseconds delay, Task task) -> void override;

        // Drops pending tasks and joins the worker. Safe to call twice.
        auto Shutdown() -> void;

    private:
        using Clock = std::chrono::steady_clock;

        struct Entry
        {
            Clock::time_point due;
            uint64_t seq{};
            Task task;
        };

        // earliest deadline first, FIFO among equal deadlines
        struct Later
        {
            auto operator()(Entry const& a, Entry const& b) const -> bool
            {
                return a.due != b.due ? a.due > b.due : a.seq > b.seq;
            }
        };

        auto Run() -> void;

        std::mutex mtx_;
        std::condition_variable cv_;
        std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
        uint64_t next_seq_{};
        bool stopping_{false};
        std::thread worker_;
    };
}

#endif //POKERPRO_TIMERSCHEDULER_HPP
