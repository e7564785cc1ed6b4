//
// PracticeDriver.hpp — simple seeded bot for the seats the user does not play
//

#ifndef POKERPRO_PRACTICEDRIVER_HPP
#define POKERPRO_PRACTICEDRIVER_HPP

#include <chrono>
#include <mutex>
#include <random>

#include "SessionDriver.hpp"

namespace pokerpro::core
{
    class PracticeDriver final : public SessionDriver
    {
    public:
        PracticeDriver(Scheduler& scheduler, std::optional<SeatIdxT> hero_seat, Config const& config);

        [[nodiscard]] auto Mode() const -> SessionMode override { return SessionMode::Practice; }

        // Refuses the hero seat: its decisions only arrive as user intents.
        auto Decide(ModelSP model, SeatIdxT seat, DecisionPurpose purpose, DecisionCallback on_ready) -> void override;

        // Synchronous choice, exposed for tests.
        auto Choose(Model const& model, SeatIdxT seat) -> Decision;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        Scheduler& scheduler_;
        std::optional<SeatIdxT> hero_seat_;
        std::chrono::milliseconds think_delay_;
        std::mutex mtx_;
        std::mt19937 rng_;
    };
}

#endif //POKERPRO_PRACTICEDRIVER_HPP
