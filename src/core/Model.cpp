//
// Model.cpp
//

#include "Model.hpp"

#include <algorithm>
#include <format>

#include "Util.hpp"

namespace pokerpro::core
{
    auto MakeInitialModel(Config const& cfg) -> Model
    {
        Model m{};
        m.autoplay_on = cfg.autoplay;
        m.step_delay = std::max(cfg.step_delay, constants::MinStepDelay);
        m.theme_id = cfg.theme_id;
        return m;
    }

    auto ValidateHand(HandData const& hand) -> error::ValidateResult
    {
        using error::Rejection;
        using error::RejectionCode;

        if (!StreetForBoard(hand.board.size()))
        {
            return std::unexpected(Rejection{RejectionCode::BoardMismatch}
                .with_detail(std::format("board has {} cards", hand.board.size())));
        }
        if (hand.board.size() + hand.runout.size() > constants::MaxBoardCards)
        {
            return std::unexpected(Rejection{RejectionCode::InvalidHand}
                .with_detail(std::format("board plus runout has {} cards", hand.board.size() + hand.runout.size())));
        }
        if (hand.seats.size() > constants::MaxSeats)
        {
            return std::unexpected(Rejection{RejectionCode::InvalidHand}
                .with_detail(std::format("{} seats", hand.seats.size())));
        }

        util::CardUniqueChecker checker;
        auto add_all = [&checker](Board const& tokens) -> bool
        {
            auto const cards = util::ParseCards(tokens);
            if (!cards)
            {
                return false;
            }
            for (Card const& c : *cards)
            {
                checker.Add(c);
            }
            return true;
        };

        for (auto const& [idx, seat] : hand.seats)
        {
            if (seat.cards.size() > constants::MaxHoleCards)
            {
                return std::unexpected(Rejection{RejectionCode::InvalidHand}.with_seat(idx)
                    .with_detail(std::format("{} hole cards", seat.cards.size())));
            }
            if (seat.stack < 0 || seat.chips_in_front < 0)
            {
                return std::unexpected(Rejection{RejectionCode::InvalidHand}.with_seat(idx)
                    .with_detail("negative chips"));
            }
            if (!add_all(seat.cards))
            {
                return std::unexpected(Rejection{RejectionCode::InvalidHand}.with_seat(idx)
                    .with_detail("unreadable hole card"));
            }
        }
        if (!add_all(hand.board) || !add_all(hand.runout))
        {
            return std::unexpected(Rejection{RejectionCode::InvalidHand}.with_detail("unreadable board card"));
        }
        if (checker.ContainsDup())
        {
            return std::unexpected(Rejection{RejectionCode::DuplicateCards});
        }

        if (hand.to_act)
        {
            auto const it = hand.seats.find(*hand.to_act);
            if (it == hand.seats.end() || it->second.folded)
            {
                return std::unexpected(Rejection{RejectionCode::InvalidHand}.with_seat(*hand.to_act)
                    .with_detail("seat to act is missing or folded"));
            }
        }
        if (hand.hero_seat && !hand.seats.contains(*hand.hero_seat))
        {
            return std::unexpected(Rejection{RejectionCode::InvalidHand}.with_seat(*hand.hero_seat)
                .with_detail("hero seat missing"));
        }
        if (hand.pot < 0)
        {
            return std::unexpected(Rejection{RejectionCode::InvalidHand}.with_detail("negative pot"));
        }
        return {};
    }

    auto WithActing(Frozen<SeatMap> const& seats, std::optional<SeatIdxT> to_act) -> Frozen<SeatMap>
    {
        bool const consistent = std::ranges::all_of(*seats, [&](auto const& kv)
        {
            return kv.second.acting == (to_act && *to_act == kv.first);
        });
        if (consistent)
        {
            return seats;
        }
        return seats.With([&](SeatMap& m)
        {
            for (auto& [idx, seat] : m)
            {
                seat.acting = to_act && *to_act == idx;
            }
        });
    }
}
