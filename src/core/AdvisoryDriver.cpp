//
// AdvisoryDriver.cpp
//

#include "AdvisoryDriver.hpp"

#include <cstdio>
#include <exception>
#include <print>
#include <utility>

#include "Betting.hpp"

namespace pokerpro::core
{
    using namespace std::chrono_literals;

    AdvisoryDriver::AdvisoryDriver(Scheduler& scheduler, std::shared_ptr<StrategyProvider> strategy,
                                   Config const& config) :
        scheduler_(scheduler),
        strategy_(std::move(strategy)),
        think_delay_(config.bot_think_delay) {}

    auto AdvisoryDriver::Decide(ModelSP model, SeatIdxT seat, DecisionPurpose purpose, DecisionCallback on_ready) -> void
    {
        Decision d = Advise(*model, seat);
        auto const delay = (purpose == DecisionPurpose::Hint) ? 0ms : think_delay_;
        scheduler_.Schedule(delay, [on_ready = std::move(on_ready), d = std::move(d)]
        {
            on_ready(d);
        });
    }

    auto AdvisoryDriver::Advise(Model const& model, SeatIdxT seat) -> Decision
    {
        ActionSet const legal = model.legal_actions.Empty() ? betting::LegalActions(*model.seats, seat) : model.legal_actions;
        if (strategy_)
        {
            try
            {
                auto suggestion = strategy_->Suggest(model, seat);
                if (suggestion && legal.Contains(suggestion->kind))
                {
                    return std::move(*suggestion);
                }
                if (suggestion)
                {
                    std::print(stderr, "[advisory] seat {}: provider suggested illegal {}\n",
                               static_cast<int>(seat), to_string(suggestion->kind));
                }
                else
                {
                    std::print(stderr, "[advisory] seat {}: provider declined: {}\n",
                               static_cast<int>(seat), suggestion.error());
                }
            }
            catch (OmegaException<error::Code> const& e)
            {
                std::print(stderr, "[advisory] seat {}: provider failed: {}\n", static_cast<int>(seat), e.what());
            }
            catch (std::exception const& e)
            {
                std::print(stderr, "[advisory] seat {}: provider failed: {}\n", static_cast<int>(seat), e.what());
            }
        }
        return Fallback(model, seat);
    }

    auto AdvisoryDriver::Fallback(Model const& model, SeatIdxT seat) -> Decision
    {
        SeatMap const& seats = *model.seats;
        ActionSet const legal = model.legal_actions.Empty() ? betting::LegalActions(seats, seat) : model.legal_actions;
        if (legal.Contains(ActionKind::Check))
        {
            return Decision{.kind = ActionKind::Check, .amount = 0, .frequency = 1.0, .rationale = "fallback: free check"};
        }

        Chips const to_call = betting::ToCall(seats, seat);
        auto const it = seats.find(seat);
        Chips const stack = (it == seats.end()) ? 0 : it->second.stack;
        if (legal.Contains(ActionKind::Call) && to_call * 10 <= stack)
        {
            return Decision{.kind = ActionKind::Call, .amount = to_call, .frequency = 1.0, .rationale = "fallback: cheap call"};
        }
        return Decision{.kind = ActionKind::Fold, .amount = 0, .frequency = 1.0, .rationale = "fallback: fold"};
    }
}
