//
// Betting.hpp — no-limit betting arithmetic over a seat map
//

#ifndef POKERPRO_BETTING_HPP
#define POKERPRO_BETTING_HPP

#include <cstddef>
#include <optional>

#include "Model.hpp"
#include "Types.hpp"

namespace pokerpro::core::betting
{
    // Largest contribution in front of any seat this street.
    auto CurrentBet(SeatMap const& seats) -> Chips;

    auto ToCall(SeatMap const& seats, SeatIdxT seat) -> Chips;

    // Fold/Call when facing a bet, Check/Bet when not, Raise when the stack covers more than the call.
    auto LegalActions(SeatMap const& seats, SeatIdxT seat) -> ActionSet;

    // Seats still holding cards.
    auto LiveSeats(SeatMap const& seats) -> std::size_t;

    // Seats still holding cards with chips behind.
    auto ActionableSeats(SeatMap const& seats) -> std::size_t;

    // Pot as it will stand once the chips in front are collected.
    auto TotalPot(SeatMap const& seats, Chips collected) -> Chips;

    // Smallest legal raise-to given the size of the last raise on this street.
    auto MinRaiseTo(Chips current_bet, Chips last_raise, Chips big_blind) -> Chips;

    // Opening bet-to: half the pot, at least one big blind, capped at all-in.
    auto SuggestedBetTo(SeatMap const& seats, SeatIdxT seat, Chips collected, Chips big_blind) -> Chips;

    // Raise-to: double the current bet (at least one big blind over it), capped at all-in.
    auto SuggestedRaiseTo(SeatMap const& seats, SeatIdxT seat, Chips big_blind) -> Chips;
}

#endif //POKERPRO_BETTING_HPP
