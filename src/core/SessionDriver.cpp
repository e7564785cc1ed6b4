//
// SessionDriver.cpp — driver selection by session mode
//

#include "SessionDriver.hpp"

#include <utility>

#include "AdvisoryDriver.hpp"
#include "EquityProvider.hpp"
#include "PracticeDriver.hpp"
#include "ReplayDriver.hpp"

namespace pokerpro::core
{
    auto MakeSessionDriver(SessionMode mode, Frozen<HandData> const& hand, DriverDeps const& deps)
        -> std::unique_ptr<SessionDriver>
    {
        switch (mode)
        {
        case SessionMode::Replay:
            return std::make_unique<ReplayDriver>(*hand, deps.config.seed);
        case SessionMode::Practice:
            PPR_ASSERT(deps.scheduler != nullptr, "practice driver needs a scheduler");
            return std::make_unique<PracticeDriver>(*deps.scheduler, hand->hero_seat, deps.config);
        case SessionMode::Advisory:
        {
            PPR_ASSERT(deps.scheduler != nullptr, "advisory driver needs a scheduler");
            std::shared_ptr<StrategyProvider> strategy = deps.strategy
                                                             ? deps.strategy
                                                             : std::make_shared<EquityProvider>();
            return std::make_unique<AdvisoryDriver>(*deps.scheduler, std::move(strategy), deps.config);
        }
        }
        PPR_THROW(error::Code::Driver, "unknown session mode");
    }

    auto MakeDriverFactory(DriverDeps deps) -> DriverFactory
    {
        return [deps = std::move(deps)](SessionMode mode, Frozen<HandData> const& hand)
        {
            return MakeSessionDriver(mode, hand, deps);
        };
    }
}
