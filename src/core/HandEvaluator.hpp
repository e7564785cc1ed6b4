//
// HandEvaluator.hpp — best five-card value of five to seven cards
//

#ifndef POKERPRO_HANDEVALUATOR_HPP
#define POKERPRO_HANDEVALUATOR_HPP

#include <compare>
#include <cstdint>
#include <span>
#include <string_view>

#include "Types.hpp"

namespace pokerpro::core
{
    enum class HandCategory : uint8_t
    {
        HighCard = 0,
        Pair,
        TwoPair,
        Trips,
        Straight,
        Flush,
        FullHouse,
        Quads,
        StraightFlush
    };

    // score = category << 20 | five 4-bit tiebreak ranks, so plain integer order ranks hands
    struct HandValue
    {
        HandCategory category{};
        uint32_t score{};

        auto operator<=>(HandValue const& o) const -> std::strong_ordering { return score <=> o.score; }
        auto operator==(HandValue const& o) const -> bool { return score == o.score; }
    };

    // Throws InvalidAction for fewer than five or more than seven cards.
    auto Evaluate(std::span<Card const> cards) -> HandValue;

    auto to_string(HandCategory c) -> std::string_view;
}

#endif //POKERPRO_HANDEVALUATOR_HPP
