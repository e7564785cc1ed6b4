//
// Model.hpp — the immutable session state and the records it is built from
//

#ifndef POKERPRO_MODEL_HPP
#define POKERPRO_MODEL_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Exception.hpp"
#include "Frozen.hpp"
#include "Types.hpp"

namespace pokerpro::core
{
    // Hole cards arrive already filtered for visibility; an empty list means hidden.
    struct SeatState
    {
        std::string player_uid;
        std::string name;
        Chips stack{};
        Chips chips_in_front{};
        bool folded{false};
        bool all_in{false};
        std::vector<CardToken> cards;
        SeatIdxT position{};
        bool acting{false};

        auto operator==(SeatState const&) const -> bool = default;
    };

    using SeatMap = std::map<SeatIdxT, SeatState>;
    using Board = std::vector<CardToken>;

    // amount: total bet-to for Bet/Raise, chips added for Call, zero otherwise
    struct ActionRecord
    {
        SeatIdxT seat{};
        ActionKind kind{};
        Chips amount{};
        Street street{};

        auto operator==(ActionRecord const&) const -> bool = default;
    };

    struct Hint
    {
        SeatIdxT seat{};
        ActionKind action{};
        Chips amount{};
        double frequency{};
        std::string rationale;

        auto operator==(Hint const&) const -> bool = default;
    };

    struct Banner
    {
        uint64_t id{};
        std::string text;
        std::string style;
        std::chrono::milliseconds ttl{};

        auto operator==(Banner const&) const -> bool = default;
    };

    using Banners = std::vector<Banner>;

    struct Payout
    {
        SeatIdxT seat{};
        Chips amount{};
        std::string description;

        auto operator==(Payout const&) const -> bool = default;
    };

    // What the authoritative engine reports about the table after a step.
    struct TableUpdate
    {
        Frozen<SeatMap> seats;
        Chips pot{};
        std::optional<SeatIdxT> to_act;

        auto operator==(TableUpdate const&) const -> bool = default;
    };

    // Table as it stood at one replay review position.
    struct ReplayPosition
    {
        Street street{Street::Preflop};
        Frozen<Board> board;
        TableUpdate table;
        std::optional<ActionRecord> last_action;

        auto operator==(ReplayPosition const&) const -> bool = default;
    };

    // Load payload produced by an external hand loader.
    struct HandData
    {
        std::string hand_id;
        SeatMap seats;
        Board board;
        // cards still to come, in dealing order
        Board runout;
        Chips pot{};
        std::optional<SeatIdxT> to_act;
        ActionSet legal;
        std::optional<SeatIdxT> hero_seat;
        SeatIdxT button_seat{};
        Chips small_blind{};
        Chips big_blind{};
        std::vector<ActionRecord> actions;

        auto operator==(HandData const&) const -> bool = default;
    };

    struct Model
    {
        std::string hand_id;
        Street street{Street::Preflop};
        std::optional<SeatIdxT> to_act_seat;
        Chips pot{};
        Frozen<Board> board;
        Frozen<SeatMap> seats;
        ActionSet legal_actions;
        std::optional<ActionRecord> last_action;
        SessionMode session_mode{SessionMode::Practice};
        bool autoplay_on{false};
        std::chrono::milliseconds step_delay{1000};
        WaitingFor waiting_for{WaitingFor::None};
        uint32_t review_cursor{};
        uint32_t review_length{};
        bool review_paused{false};
        std::optional<Hint> hint;
        Frozen<Banners> banners;
        std::string theme_id{"forest-green-pro"};
        TxId tx_id{};

        std::optional<SeatIdxT> hero_seat;
        Chips big_blind{};
        // an accepted decision or continue is in flight to the engine
        bool engine_pending{false};
        uint64_t next_banner_id{1};
        // payload of the last load, replayed by ResetHand
        Frozen<HandData> source;

        auto operator==(Model const&) const -> bool = default;
    };

    using ModelSP = std::shared_ptr<Model const>;

    // Fresh Model carrying only session preferences.
    auto MakeInitialModel(Config const& cfg) -> Model;

    // Structural checks on a load payload: board size, card tokens, duplicates, seat refs.
    auto ValidateHand(HandData const& hand) -> error::ValidateResult;

    // Returns the same instance when acting flags already agree with to_act.
    auto WithActing(Frozen<SeatMap> const& seats, std::optional<SeatIdxT> to_act) -> Frozen<SeatMap>;
}

#endif //POKERPRO_MODEL_HPP
