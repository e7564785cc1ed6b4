//
// Betting.cpp
//

#include "Betting.hpp"

#include <algorithm>
#include <ranges>

namespace pokerpro::core::betting
{
    auto CurrentBet(SeatMap const& seats) -> Chips
    {
        Chips bet = 0;
        for (SeatState const& s : seats | std::views::values)
        {
            bet = std::max(bet, s.chips_in_front);
        }
        return bet;
    }

    auto ToCall(SeatMap const& seats, SeatIdxT seat) -> Chips
    {
        auto const it = seats.find(seat);
        if (it == seats.end())
        {
            return 0;
        }
        return std::max<Chips>(0, CurrentBet(seats) - it->second.chips_in_front);
    }

    auto LegalActions(SeatMap const& seats, SeatIdxT seat) -> ActionSet
    {
        auto const it = seats.find(seat);
        if (it == seats.end())
        {
            return {};
        }
        SeatState const& s = it->second;
        if (s.folded || s.all_in || s.stack <= 0)
        {
            return {};
        }

        Chips const current = CurrentBet(seats);
        Chips const to_call = std::max<Chips>(0, current - s.chips_in_front);

        ActionSet legal;
        if (to_call == 0)
        {
            legal.Add(ActionKind::Check);
            legal.Add(current == 0 ? ActionKind::Bet : ActionKind::Raise);
        }
        else
        {
            legal.Add(ActionKind::Fold);
            legal.Add(ActionKind::Call);
            if (s.stack > to_call)
            {
                legal.Add(ActionKind::Raise);
            }
        }
        return legal;
    }

    auto LiveSeats(SeatMap const& seats) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(seats | std::views::values,
                                                              [](SeatState const& s) { return !s.folded; }));
    }

    auto ActionableSeats(SeatMap const& seats) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(seats | std::views::values, [](SeatState const& s)
        {
            return !s.folded && !s.all_in && s.stack > 0;
        }));
    }

    auto TotalPot(SeatMap const& seats, Chips collected) -> Chips
    {
        Chips pot = collected;
        for (SeatState const& s : seats | std::views::values)
        {
            pot += s.chips_in_front;
        }
        return pot;
    }

    auto MinRaiseTo(Chips current_bet, Chips last_raise, Chips big_blind) -> Chips
    {
        return current_bet + std::max(last_raise, std::max<Chips>(big_blind, 1));
    }

    auto SuggestedBetTo(SeatMap const& seats, SeatIdxT seat, Chips collected, Chips big_blind) -> Chips
    {
        auto const it = seats.find(seat);
        if (it == seats.end())
        {
            return 0;
        }
        Chips const all_in = it->second.chips_in_front + it->second.stack;
        Chips const want = std::max(std::max<Chips>(big_blind, 1), TotalPot(seats, collected) / 2);
        return std::min(want, all_in);
    }

    auto SuggestedRaiseTo(SeatMap const& seats, SeatIdxT seat, Chips big_blind) -> Chips
    {
        auto const it = seats.find(seat);
        if (it == seats.end())
        {
            return 0;
        }
        Chips const current = CurrentBet(seats);
        Chips const all_in = it->second.chips_in_front + it->second.stack;
        Chips const want = std::max(current * 2, current + std::max<Chips>(big_blind, 1));
        return std::min(want, all_in);
    }
}
