//
// Inspector.hpp — read-only view of Store internals for tests
//

#ifndef POKERPRO_INSPECTOR_HPP
#define POKERPRO_INSPECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>

#include "../core/Store.hpp"

namespace pokerpro::core::debug
{
    struct Inspector
    {
        struct StoreStats
        {
            uint64_t processed{};
            uint64_t commits{};
            uint64_t rejections{};
            uint64_t guard_trips{};
            uint64_t command_failures{};
            std::size_t subscribers{};
            std::size_t queued{};
            bool draining{false};
            bool has_driver{false};
        };

        static inline auto Gather(Store const& s) -> StoreStats
        {
            std::lock_guard<std::mutex> lock(s.mtx_);
            return StoreStats{
                .processed = s.processed_,
                .commits = s.commits_,
                .rejections = s.rejections_,
                .guard_trips = s.guard_trips_,
                .command_failures = s.command_failures_,
                .subscribers = s.subscribers_.size(),
                .queued = s.inbox_.size(),
                .draining = s.draining_,
                .has_driver = s.driver_ != nullptr
            };
        }
    };
}

#endif //POKERPRO_INSPECTOR_HPP
