//
// ReplayDriver.cpp
//

#include "ReplayDriver.hpp"

#include <cstdio>
#include <print>
#include <utility>

#include "HoldemEngine.hpp"

namespace pokerpro::core
{
    namespace
    {
        auto PositionOf(HoldemEngine const& engine, std::optional<ActionRecord> last) -> ReplayPosition
        {
            return ReplayPosition{
                .street = engine.StreetNow(),
                .board = Frozen<Board>{engine.BoardNow()},
                .table = engine.Table(),
                .last_action = std::move(last)
            };
        }

        auto Ended(EngineResult const& r) -> bool
        {
            return r.outcome == EngineOutcome::HandEnded;
        }
    }

    ReplayDriver::ReplayDriver(HandData const& hand, uint64_t seed) :
        hand_id_(hand.hand_id)
    {
        HoldemEngine engine{seed};
        engine.Reset(hand);
        positions_.push_back(PositionOf(engine, std::nullopt));

        bool ended = false;
        for (std::size_t i = 0; i < hand.actions.size() && !ended; ++i)
        {
            ActionRecord const& rec = hand.actions[i];

            // deal up to the street the log moves on to
            while (!ended && !engine.Table().to_act && engine.StreetNow() < rec.street)
            {
                EngineResult const r = engine.Continue();
                ended = Ended(r);
                Push(engine, FeedbackFor(r));
            }
            if (ended)
            {
                std::print(stderr, "[replay] hand {} ended before action {}; dropping the rest\n", hand_id_, i);
                truncated_ = true;
                break;
            }

            if (auto const ok = engine.Validate(rec.seat, rec.kind, rec.amount); !ok || engine.StreetNow() != rec.street)
            {
                std::print(stderr, "[replay] hand {} action {} (seat {} {} {}) does not fit the table: {}\n",
                           hand_id_, i, static_cast<int>(rec.seat), to_string(rec.kind), rec.amount,
                           ok ? std::string{"street mismatch"} : error::describe(ok.error()));
                truncated_ = true;
                break;
            }

            EngineResult const r = engine.Apply(rec.seat, rec.kind, rec.amount);
            last_action_ = r.action;
            ended = Ended(r);
            Push(engine, FeedbackFor(r));
        }

        // run out the remaining streets once the log is through and betting is closed
        while (!ended && !truncated_ && !engine.Table().to_act)
        {
            EngineResult const r = engine.Continue();
            ended = Ended(r);
            Push(engine, FeedbackFor(r));
        }

        std::print("[replay] hand {}: {} scripted events{}\n", hand_id_, script_.size(),
                   truncated_ ? " (truncated)" : "");
    }

    auto ReplayDriver::Push(HoldemEngine const& engine, std::vector<Msg> messages) -> void
    {
        for (Msg& m : messages)
        {
            auto const step = static_cast<uint32_t>(script_.size());
            std::visit([step](auto& v)
            {
                if constexpr (requires { v.step; })
                {
                    v.step = step;
                }
            }, m);
            script_.push_back(std::move(m));
            positions_.push_back(PositionOf(engine, last_action_));
        }
    }

    auto ReplayDriver::Decide(ModelSP model, SeatIdxT seat, DecisionPurpose, DecisionCallback) -> void
    {
        std::print(stderr, "[replay] unexpected decide for seat {} in hand {} (model hand {})\n",
                   static_cast<int>(seat), hand_id_, model ? model->hand_id : std::string{});
    }

    auto ReplayDriver::ScriptedEventAt(uint32_t index) const -> std::optional<Msg>
    {
        if (index >= script_.size())
        {
            return std::nullopt;
        }
        return script_[index];
    }

    auto ReplayDriver::PositionAt(uint32_t cursor) const -> std::optional<ReplayPosition>
    {
        if (cursor >= positions_.size())
        {
            return std::nullopt;
        }
        return positions_[cursor];
    }
}
