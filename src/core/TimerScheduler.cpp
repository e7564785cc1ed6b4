//
// TimerScheduler.cpp
//

#include "TimerScheduler.hpp"

#include <cstdio>
#include <exception>
#include <print>
#include <utility>

namespace pokerpro::core
{
    TimerScheduler::TimerScheduler() :
        worker_([this] { Run(); }) {}

    TimerScheduler::~TimerScheduler()
    {
        Shutdown();
    }

    auto TimerScheduler::Schedule(std::chrono::milliseconds delay, Task task) -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stopping_)
            {
                return;
            }
            queue_.push(Entry{.due = Clock::now() + delay, .seq = next_seq_++, .task = std::move(task)});
        }
        cv_.notify_all();
    }

    auto TimerScheduler::Shutdown() -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            stopping_ = true;
            queue_ = {};
        }
        cv_.notify_all();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        {
            worker_.join();
        }
    }

    auto TimerScheduler::Run() -> void
    {
        std::unique_lock<std::mutex> lk(mtx_);
        while (!stopping_)
        {
            if (queue_.empty())
            {
                cv_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
                continue;
            }

            auto const due = queue_.top().due;
            if (Clock::now() < due)
            {
                cv_.wait_until(lk, due);
                continue;
            }

            Task task = queue_.top().task;
            queue_.pop();
            lk.unlock();
            try
            {
                task();
            }
            catch (std::exception const& e)
            {
                std::print(stderr, "[timer] task threw: {}\n", e.what());
            }
            lk.lock();
        }
    }
}
