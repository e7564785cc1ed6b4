//
// Types.hpp — cards, table enums and session configuration
//

#ifndef POKERPRO_TYPES_HPP
#define POKERPRO_TYPES_HPP

#define PPR_ALLOW_EXCEPTIONS true
#define PPR_ENABLE_TEST_HOOKS true

#include <array>
#include <bit>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace pokerpro::core::constants
{
    inline constexpr std::size_t MaxSeats = 10;
    inline constexpr std::size_t MaxBoardCards = 5;
    inline constexpr std::size_t MaxHoleCards = 2;
    inline constexpr std::chrono::milliseconds MinStepDelay{60};
    inline constexpr std::chrono::milliseconds BannerTtl{2000};
}

namespace pokerpro::core
{
    using SeatIdxT = uint8_t;
    using Chips = int64_t;
    using TxId = uint64_t;
    using CardToken = std::string;

    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };

    enum class Rank : uint8_t
    {
        Two = 0,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace
    };

    struct Card
    {
        Rank rank{};
        Suit suit{};

        auto operator==(Card const&) const -> bool = default;
    };

    enum class Street : uint8_t
    {
        Preflop = 0,
        Flop,
        Turn,
        River,
        Showdown,
        Done
    };

    enum class SessionMode : uint8_t
    {
        Practice = 0,
        Advisory,
        Replay
    };

    enum class WaitingFor : uint8_t
    {
        None = 0,
        HumanDecision,
        BotDecision,
        Animation
    };

    enum class ActionKind : uint8_t
    {
        Fold = 0,
        Check,
        Call,
        Bet,
        Raise
    };

    enum class AnimationKind : uint8_t
    {
        SeatAction = 0,
        FoldCards,
        BetChips,
        DealBoard,
        PotToWinner
    };

    // Why the driver is being asked: to act for a seat, or to advise the human on it.
    enum class DecisionPurpose : uint8_t
    {
        Decide = 0,
        Hint
    };

    // Fixed-width set of action kinds; value type so it compares by content.
    class ActionSet
    {
    public:
        constexpr ActionSet() = default;

        constexpr ActionSet(std::initializer_list<ActionKind> kinds)
        {
            for (ActionKind const k : kinds)
            {
                Add(k);
            }
        }

        constexpr auto Add(ActionKind k) -> ActionSet&
        {
            bits_ = static_cast<uint8_t>(bits_ | Bit(k));
            return *this;
        }

        [[nodiscard]]
        constexpr auto Contains(ActionKind k) const -> bool { return (bits_ & Bit(k)) != 0; }

        [[nodiscard]]
        constexpr auto Empty() const -> bool { return bits_ == 0; }

        [[nodiscard]]
        constexpr auto Size() const -> std::size_t { return static_cast<std::size_t>(std::popcount(bits_)); }

        [[nodiscard]]
        constexpr auto Bits() const -> uint8_t { return bits_; }

        static constexpr auto FromBits(uint8_t bits) -> ActionSet
        {
            ActionSet s;
            s.bits_ = static_cast<uint8_t>(bits & 0x1F);
            return s;
        }

        [[nodiscard]]
        auto Kinds() const -> std::vector<ActionKind>
        {
            std::vector<ActionKind> out;
            for (uint8_t i = 0; i <= static_cast<uint8_t>(ActionKind::Raise); ++i)
            {
                if (Contains(static_cast<ActionKind>(i)))
                {
                    out.push_back(static_cast<ActionKind>(i));
                }
            }
            return out;
        }

        auto operator==(ActionSet const&) const -> bool = default;

    private:
        static constexpr auto Bit(ActionKind k) -> uint8_t { return static_cast<uint8_t>(1u << static_cast<unsigned>(k)); }

        uint8_t bits_{0};
    };

    struct Config
    {
        std::chrono::milliseconds step_delay{1000};
        std::chrono::milliseconds bot_think_delay{400};
        uint64_t seed{std::random_device{}()};
        std::string theme_id{"forest-green-pro"};
        bool autoplay{false};
    };

    inline auto to_string(Street s) -> std::string_view
    {
        switch (s)
        {
        case Street::Preflop: return "Preflop";
        case Street::Flop: return "Flop";
        case Street::Turn: return "Turn";
        case Street::River: return "River";
        case Street::Showdown: return "Showdown";
        case Street::Done: return "Done";
        }
        return "?";
    }

    inline auto to_string(SessionMode m) -> std::string_view
    {
        switch (m)
        {
        case SessionMode::Practice: return "Practice";
        case SessionMode::Advisory: return "Advisory";
        case SessionMode::Replay: return "Replay";
        }
        return "?";
    }

    inline auto to_string(WaitingFor w) -> std::string_view
    {
        switch (w)
        {
        case WaitingFor::None: return "None";
        case WaitingFor::HumanDecision: return "HumanDecision";
        case WaitingFor::BotDecision: return "BotDecision";
        case WaitingFor::Animation: return "Animation";
        }
        return "?";
    }

    inline auto to_string(ActionKind k) -> std::string_view
    {
        switch (k)
        {
        case ActionKind::Fold: return "Fold";
        case ActionKind::Check: return "Check";
        case ActionKind::Call: return "Call";
        case ActionKind::Bet: return "Bet";
        case ActionKind::Raise: return "Raise";
        }
        return "?";
    }

    inline auto to_string(Card const& c) -> std::string
    {
        static constexpr std::array<char, 13> ranks{'2', '3', '4', '5', '6', '7', '8', '9', 'T', 'J', 'Q', 'K', 'A'};
        static constexpr std::array<char, 4> suits{'h', 'd', 'c', 's'};
        return std::string{ranks[static_cast<std::size_t>(c.rank)], suits[static_cast<std::size_t>(c.suit)]};
    }

    // "As", "Td", "9c"; rank letters accept either case.
    inline auto ParseCard(std::string_view token) -> std::optional<Card>
    {
        if (token.size() != 2)
        {
            return std::nullopt;
        }

        static constexpr std::string_view ranks = "23456789TJQKA";
        static constexpr std::string_view suits = "hdcs";

        char r = token[0];
        if (r >= 'a' && r <= 'z')
        {
            r = static_cast<char>(r - 'a' + 'A');
        }
        char s = token[1];
        if (s >= 'A' && s <= 'Z')
        {
            s = static_cast<char>(s - 'A' + 'a');
        }

        auto const ri = ranks.find(r);
        auto const si = suits.find(s);
        if (ri == std::string_view::npos || si == std::string_view::npos)
        {
            return std::nullopt;
        }
        return Card{static_cast<Rank>(ri), static_cast<Suit>(si)};
    }

    // Board length consistent with a street; Showdown and Done carry a full board.
    inline auto BoardSizeFor(Street s) -> std::size_t
    {
        switch (s)
        {
        case Street::Preflop: return 0;
        case Street::Flop: return 3;
        case Street::Turn: return 4;
        case Street::River:
        case Street::Showdown:
        case Street::Done: return 5;
        }
        return 0;
    }

    inline auto StreetForBoard(std::size_t n) -> std::optional<Street>
    {
        switch (n)
        {
        case 0: return Street::Preflop;
        case 3: return Street::Flop;
        case 4: return Street::Turn;
        case 5: return Street::River;
        default: return std::nullopt;
        }
    }
}

#endif //POKERPRO_TYPES_HPP
