//
// ManualScheduler.hpp — virtual-clock Scheduler driven from the test thread
//

#ifndef POKERPRO_MANUALSCHEDULER_HPP
#define POKERPRO_MANUALSCHEDULER_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>

#include "../core/Effects.hpp"

namespace pokerpro::core::debug
{
    class ManualScheduler final : public Scheduler
    {
    public:
        auto Schedule(std::chrono::milliseconds delay, Task task) -> void override
        {
            queue_.emplace(std::pair{now_ + delay, seq_++}, std::move(task));
        }

        // Runs every task due within `by`, in deadline order, including ones scheduled meanwhile.
        auto AdvanceBy(std::chrono::milliseconds by) -> std::size_t
        {
            auto const until = now_ + by;
            std::size_t ran = 0;
            while (!queue_.empty() && queue_.begin()->first.first <= until)
            {
                ran += RunFront();
            }
            now_ = until;
            return ran;
        }

        // Runs tasks regardless of deadline until none remain or `limit` ran.
        auto RunUntilIdle(std::size_t limit = 10'000) -> std::size_t
        {
            std::size_t ran = 0;
            while (!queue_.empty() && ran < limit)
            {
                ran += RunFront();
            }
            return ran;
        }

        // Runs only tasks already due at the current virtual time.
        auto RunDue() -> std::size_t
        {
            return AdvanceBy(std::chrono::milliseconds{0});
        }

        [[nodiscard]] auto Pending() const -> std::size_t { return queue_.size(); }
        [[nodiscard]] auto Now() const -> std::chrono::milliseconds { return now_; }

    private:
        auto RunFront() -> std::size_t
        {
            auto node = queue_.extract(queue_.begin());
            now_ = std::max(now_, node.key().first);
            node.mapped()();
            return 1;
        }

        std::chrono::milliseconds now_{0};
        uint64_t seq_{};
        std::map<std::pair<std::chrono::milliseconds, uint64_t>, Task> queue_;
    };
}

#endif //POKERPRO_MANUALSCHEDULER_HPP
