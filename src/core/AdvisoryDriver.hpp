//
// AdvisoryDriver.hpp — strategy-backed decisions and hints with a conservative fallback
//

#ifndef POKERPRO_ADVISORYDRIVER_HPP
#define POKERPRO_ADVISORYDRIVER_HPP

#include <chrono>
#include <memory>

#include "SessionDriver.hpp"
#include "StrategyProvider.hpp"

namespace pokerpro::core
{
    class AdvisoryDriver final : public SessionDriver
    {
    public:
        AdvisoryDriver(Scheduler& scheduler, std::shared_ptr<StrategyProvider> strategy, Config const& config);

        [[nodiscard]] auto Mode() const -> SessionMode override { return SessionMode::Advisory; }

        auto Decide(ModelSP model, SeatIdxT seat, DecisionPurpose purpose, DecisionCallback on_ready) -> void override;

        // Provider answer when it is usable, otherwise Fallback.
        auto Advise(Model const& model, SeatIdxT seat) -> Decision;

        // Check, else Call when the price is at most a tenth of the stack, else Fold.
        static auto Fallback(Model const& model, SeatIdxT seat) -> Decision;

    private:
        Scheduler& scheduler_;
        std::shared_ptr<StrategyProvider> strategy_;
        std::chrono::milliseconds think_delay_;
    };
}

#endif //POKERPRO_ADVISORYDRIVER_HPP
