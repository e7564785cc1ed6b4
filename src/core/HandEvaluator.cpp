//
// HandEvaluator.cpp
//

#include "HandEvaluator.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <format>
#include <initializer_list>

#include "Exception.hpp"

namespace pokerpro::core
{
    namespace
    {
        constexpr uint16_t WheelMask = 0x100F; // A,5,4,3,2

        // High rank of the best straight in a 13-bit rank mask, -1 if none.
        auto StraightHigh(uint16_t mask) -> int
        {
            uint32_t const m = mask;
            uint32_t const run = m & (m << 1) & (m << 2) & (m << 3) & (m << 4);
            if (run != 0)
            {
                return static_cast<int>(std::bit_width(run)) - 1;
            }
            if ((mask & WheelMask) == WheelMask)
            {
                return static_cast<int>(Rank::Five);
            }
            return -1;
        }

        auto Pack(HandCategory c, std::initializer_list<int> ranks) -> HandValue
        {
            uint32_t score = static_cast<uint32_t>(c) << 20;
            int shift = 16;
            for (int const r : ranks)
            {
                score |= static_cast<uint32_t>(r & 0xF) << shift;
                shift -= 4;
            }
            return HandValue{c, score};
        }

        // Highest n ranks set in mask, descending.
        auto TopRanks(uint16_t mask, int n, std::array<int, 5>& out) -> void
        {
            int filled = 0;
            for (int r = 12; r >= 0 && filled < n; --r)
            {
                if (mask & (1u << r))
                {
                    out[static_cast<std::size_t>(filled++)] = r;
                }
            }
        }
    }

    auto Evaluate(std::span<Card const> cards) -> HandValue
    {
        if (cards.size() < 5 || cards.size() > 7)
        {
            PPR_THROW(error::Code::InvalidAction, std::format("cannot evaluate {} cards", cards.size()));
        }

        std::array<uint8_t, 13> counts{};
        std::array<uint16_t, 4> suit_masks{};
        uint16_t all = 0;
        for (Card const& c : cards)
        {
            auto const r = static_cast<std::size_t>(c.rank);
            ++counts[r];
            suit_masks[static_cast<std::size_t>(c.suit)] |= static_cast<uint16_t>(1u << r);
            all |= static_cast<uint16_t>(1u << r);
        }

        for (uint16_t const sm : suit_masks)
        {
            if (std::popcount(sm) >= 5)
            {
                if (int const hi = StraightHigh(sm); hi >= 0)
                {
                    return Pack(HandCategory::StraightFlush, {hi});
                }
                break;
            }
        }

        int quad = -1;
        int trips_hi = -1;
        int trips_lo = -1;
        int pair_hi = -1;
        int pair_lo = -1;
        for (int r = 12; r >= 0; --r)
        {
            switch (counts[static_cast<std::size_t>(r)])
            {
            case 4:
                if (quad < 0) quad = r;
                break;
            case 3:
                if (trips_hi < 0) trips_hi = r;
                else if (trips_lo < 0) trips_lo = r;
                break;
            case 2:
                if (pair_hi < 0) pair_hi = r;
                else if (pair_lo < 0) pair_lo = r;
                break;
            default:
                break;
            }
        }

        if (quad >= 0)
        {
            std::array<int, 5> k{};
            TopRanks(static_cast<uint16_t>(all & ~(1u << quad)), 1, k);
            return Pack(HandCategory::Quads, {quad, k[0]});
        }

        if (trips_hi >= 0 && (trips_lo >= 0 || pair_hi >= 0))
        {
            int const pair = std::max(trips_lo, pair_hi);
            return Pack(HandCategory::FullHouse, {trips_hi, pair});
        }

        for (uint16_t const sm : suit_masks)
        {
            if (std::popcount(sm) >= 5)
            {
                std::array<int, 5> k{};
                TopRanks(sm, 5, k);
                return Pack(HandCategory::Flush, {k[0], k[1], k[2], k[3], k[4]});
            }
        }

        if (int const hi = StraightHigh(all); hi >= 0)
        {
            return Pack(HandCategory::Straight, {hi});
        }

        if (trips_hi >= 0)
        {
            std::array<int, 5> k{};
            TopRanks(static_cast<uint16_t>(all & ~(1u << trips_hi)), 2, k);
            return Pack(HandCategory::Trips, {trips_hi, k[0], k[1]});
        }

        if (pair_hi >= 0 && pair_lo >= 0)
        {
            std::array<int, 5> k{};
            TopRanks(static_cast<uint16_t>(all & ~(1u << pair_hi) & ~(1u << pair_lo)), 1, k);
            return Pack(HandCategory::TwoPair, {pair_hi, pair_lo, k[0]});
        }

        if (pair_hi >= 0)
        {
            std::array<int, 5> k{};
            TopRanks(static_cast<uint16_t>(all & ~(1u << pair_hi)), 3, k);
            return Pack(HandCategory::Pair, {pair_hi, k[0], k[1], k[2]});
        }

        std::array<int, 5> k{};
        TopRanks(all, 5, k);
        return Pack(HandCategory::HighCard, {k[0], k[1], k[2], k[3], k[4]});
    }

    auto to_string(HandCategory c) -> std::string_view
    {
        switch (c)
        {
        case HandCategory::HighCard: return "high card";
        case HandCategory::Pair: return "a pair";
        case HandCategory::TwoPair: return "two pair";
        case HandCategory::Trips: return "three of a kind";
        case HandCategory::Straight: return "a straight";
        case HandCategory::Flush: return "a flush";
        case HandCategory::FullHouse: return "a full house";
        case HandCategory::Quads: return "four of a kind";
        case HandCategory::StraightFlush: return "a straight flush";
        }
        return "?";
    }
}
