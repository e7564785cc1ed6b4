//
// PracticeDriver.cpp
//

#include "PracticeDriver.hpp"

#include <cstdio>
#include <print>
#include <utility>
#include <vector>

#include "Betting.hpp"

namespace pokerpro::core
{
    PracticeDriver::PracticeDriver(Scheduler& scheduler, std::optional<SeatIdxT> hero_seat, Config const& config) :
        scheduler_(scheduler),
        hero_seat_(hero_seat),
        think_delay_(config.bot_think_delay),
        rng_(static_cast<std::mt19937::result_type>(config.seed)) {}

    auto PracticeDriver::Decide(ModelSP model, SeatIdxT seat, DecisionPurpose purpose, DecisionCallback on_ready) -> void
    {
        if (hero_seat_ && *hero_seat_ == seat)
        {
            std::print(stderr, "[practice] refusing to decide for hero seat {}\n", static_cast<int>(seat));
            return;
        }
        if (purpose == DecisionPurpose::Hint)
        {
            std::print(stderr, "[practice] hint requested for seat {}; practice gives none\n", static_cast<int>(seat));
            return;
        }

        Decision d = Choose(*model, seat);
        scheduler_.Schedule(think_delay_, [on_ready = std::move(on_ready), d = std::move(d)]
        {
            on_ready(d);
        });
    }

    auto PracticeDriver::Choose(Model const& model, SeatIdxT seat) -> Decision
    {
        std::lock_guard<std::mutex> lock(mtx_);

        SeatMap const& seats = *model.seats;
        ActionSet const legal = model.legal_actions.Empty() ? betting::LegalActions(seats, seat) : model.legal_actions;
        Chips const to_call = betting::ToCall(seats, seat);
        auto const it = seats.find(seat);
        Chips const stack = (it == seats.end()) ? 0 : it->second.stack;

        // weighted pool: repeats make an entry more likely
        std::vector<Decision> pool;
        auto add = [&](ActionKind k, Chips amount, int weight, char const* why)
        {
            for (int i = 0; i < weight; ++i)
            {
                pool.push_back(Decision{.kind = k, .amount = amount, .frequency = 1.0, .rationale = why});
            }
        };

        if (legal.Contains(ActionKind::Check))
        {
            add(ActionKind::Check, 0, 6, "check it through");
            if (legal.Contains(ActionKind::Bet))
            {
                add(ActionKind::Bet, betting::SuggestedBetTo(seats, seat, model.pot, model.big_blind), 2, "half-pot bet");
            }
            if (legal.Contains(ActionKind::Raise))
            {
                add(ActionKind::Raise, betting::SuggestedRaiseTo(seats, seat, model.big_blind), 1, "raise the option");
            }
        }
        else if (legal.Contains(ActionKind::Call))
        {
            bool const cheap = to_call * 4 <= stack;
            add(ActionKind::Call, to_call, cheap ? 6 : 2, cheap ? "small price" : "curious");
            add(ActionKind::Fold, 0, cheap ? 1 : 4, "too expensive");
            if (legal.Contains(ActionKind::Raise))
            {
                add(ActionKind::Raise, betting::SuggestedRaiseTo(seats, seat, model.big_blind), 1, "pressure");
            }
        }

        if (pool.empty())
        {
            return Decision{.kind = ActionKind::Fold, .amount = 0, .frequency = 1.0, .rationale = "no legal action"};
        }
        return pool[pick(pool)];
    }
}
