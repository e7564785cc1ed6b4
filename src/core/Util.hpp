//
// Util.hpp — card bookkeeping helpers
//

#ifndef POKERPRO_UTIL_HPP
#define POKERPRO_UTIL_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "Types.hpp"

namespace pokerpro::core::util
{
    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(c.suit) * 13 + static_cast<uint64_t>(c.rank);
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), contains_dup_(false) {}

        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
        }

        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }

        [[nodiscard]]
        auto Seen(Card const& c) const -> bool
        {
            return (cards_ & (uint64_t{1} << CardToUID(c))) != 0;
        }

    private:
        uint64_t cards_;
        bool contains_dup_;
    };

    // nullopt when any token fails to parse
    inline auto ParseCards(std::span<CardToken const> tokens) -> std::optional<std::vector<Card>>
    {
        std::vector<Card> out;
        out.reserve(tokens.size());
        for (CardToken const& t : tokens)
        {
            auto c = ParseCard(t);
            if (!c)
            {
                return std::nullopt;
            }
            out.push_back(*c);
        }
        return out;
    }

    inline auto ToTokens(std::span<Card const> cards) -> std::vector<CardToken>
    {
        std::vector<CardToken> out;
        out.reserve(cards.size());
        for (Card const& c : cards)
        {
            out.push_back(to_string(c));
        }
        return out;
    }
}

#endif //POKERPRO_UTIL_HPP
