//
// EquityProvider.cpp
//

#include "EquityProvider.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include <vector>

#include "Betting.hpp"
#include "HandEvaluator.hpp"
#include "Util.hpp"

namespace pokerpro::core
{
    namespace
    {
        constexpr double CallMargin = 0.05;
        constexpr double ValueBetAt = 0.6;
        constexpr double RaiseAt = 0.8;

        auto CategoryStrength(HandCategory c) -> double
        {
            switch (c)
            {
            case HandCategory::HighCard: return 0.15;
            case HandCategory::Pair: return 0.45;
            case HandCategory::TwoPair: return 0.65;
            case HandCategory::Trips: return 0.75;
            case HandCategory::Straight: return 0.82;
            case HandCategory::Flush: return 0.86;
            case HandCategory::FullHouse: return 0.92;
            case HandCategory::Quads: return 0.97;
            case HandCategory::StraightFlush: return 1.0;
            }
            return 0.0;
        }
    }

    auto EquityProvider::Strength(std::span<Card const> hole, std::span<Card const> board) -> double
    {
        if (board.size() >= 3)
        {
            std::vector<Card> all(hole.begin(), hole.end());
            all.insert(all.end(), board.begin(), board.end());
            return CategoryStrength(Evaluate(all).category);
        }

        auto const hi = std::max(std::to_underlying(hole[0].rank), std::to_underlying(hole[1].rank));
        auto const lo = std::min(std::to_underlying(hole[0].rank), std::to_underlying(hole[1].rank));
        if (hi == lo)
        {
            return 0.5 + hi / 24.0;
        }
        double s = (hi + lo) / 24.0 * 0.6;
        if (hole[0].suit == hole[1].suit) s += 0.05;
        if (hi - lo == 1) s += 0.03;
        return s;
    }

    auto EquityProvider::Suggest(Model const& model, SeatIdxT seat) -> std::expected<Decision, std::string>
    {
        auto const it = model.seats->find(seat);
        if (it == model.seats->end())
        {
            return std::unexpected(std::format("seat {} not at table", static_cast<int>(seat)));
        }
        auto const hole = util::ParseCards(it->second.cards);
        if (!hole || hole->size() != constants::MaxHoleCards)
        {
            return std::unexpected(std::format("hole cards of seat {} unknown", static_cast<int>(seat)));
        }
        auto const board = util::ParseCards(*model.board);
        if (!board)
        {
            return std::unexpected(std::string{"unreadable board"});
        }

        SeatMap const& seats = *model.seats;
        ActionSet const legal = model.legal_actions.Empty() ? betting::LegalActions(seats, seat) : model.legal_actions;
        double const strength = Strength(*hole, *board);
        Chips const to_call = betting::ToCall(seats, seat);
        Chips const pot = betting::TotalPot(seats, model.pot);
        double const odds = to_call > 0 ? static_cast<double>(to_call) / static_cast<double>(pot + to_call) : 0.0;

        auto decision = [&](ActionKind k, Chips amount, std::string why) -> Decision
        {
            return Decision{.kind = k, .amount = amount, .frequency = std::clamp(strength, 0.05, 1.0), .rationale = std::move(why)};
        };

        if (to_call == 0)
        {
            if (strength >= ValueBetAt && legal.Contains(ActionKind::Bet))
            {
                return decision(ActionKind::Bet, betting::SuggestedBetTo(seats, seat, model.pot, model.big_blind),
                                std::format("strength {:.0f}%: bet for value", strength * 100));
            }
            if (strength >= ValueBetAt && legal.Contains(ActionKind::Raise))
            {
                return decision(ActionKind::Raise, betting::SuggestedRaiseTo(seats, seat, model.big_blind),
                                std::format("strength {:.0f}%: raise for value", strength * 100));
            }
            return decision(ActionKind::Check, 0, std::format("strength {:.0f}%: check", strength * 100));
        }

        if (strength >= RaiseAt && legal.Contains(ActionKind::Raise))
        {
            return decision(ActionKind::Raise, betting::SuggestedRaiseTo(seats, seat, model.big_blind),
                            std::format("strength {:.0f}% well ahead of {:.0f}% pot odds", strength * 100, odds * 100));
        }
        if (strength >= odds + CallMargin)
        {
            return decision(ActionKind::Call, to_call,
                            std::format("strength {:.0f}% beats {:.0f}% pot odds", strength * 100, odds * 100));
        }
        return decision(ActionKind::Fold, 0,
                        std::format("strength {:.0f}% below {:.0f}% pot odds", strength * 100, odds * 100));
    }
}
