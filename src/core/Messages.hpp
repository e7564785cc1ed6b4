//
// Messages.hpp — closed vocabulary of events dispatched into the Store
//

#ifndef POKERPRO_MESSAGES_HPP
#define POKERPRO_MESSAGES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Model.hpp"
#include "Types.hpp"

namespace pokerpro::core
{
    // A driver's answer for one seat, also used as an advisory hint.
    struct Decision
    {
        ActionKind kind{};
        Chips amount{};
        double frequency{1.0};
        std::string rationale;

        auto operator==(Decision const&) const -> bool = default;
    };

    namespace msg
    {
        // ---- intents (front end) ----
        // Empty from the front end. A step the reducer schedules for itself carries the
        // tx_id it was scheduled under and is dropped once that moves on.
        struct AdvanceRequested
        {
            static constexpr std::string_view name = "AdvanceRequested";
            std::optional<TxId> scheduled_at{};
            // scheduled by autoplay; dropped once autoplay is off or the review paused
            bool autoplay{false};
            auto operator==(AdvanceRequested const&) const -> bool = default;
        };

        struct ToggleAutoplay
        {
            static constexpr std::string_view name = "ToggleAutoplay";
            bool on{};
            auto operator==(ToggleAutoplay const&) const -> bool = default;
        };

        // seat defaults to the hero seat (live) or the seat to act
        struct UserChose
        {
            static constexpr std::string_view name = "UserChose";
            ActionKind kind{};
            Chips amount{};
            std::optional<SeatIdxT> seat{};
            auto operator==(UserChose const&) const -> bool = default;
        };

        struct SeekReview
        {
            static constexpr std::string_view name = "SeekReview";
            int64_t index{};
            auto operator==(SeekReview const&) const -> bool = default;
        };

        struct StepBack
        {
            static constexpr std::string_view name = "StepBack";
            auto operator==(StepBack const&) const -> bool = default;
        };

        struct SetReviewPaused
        {
            static constexpr std::string_view name = "SetReviewPaused";
            bool paused{};
            auto operator==(SetReviewPaused const&) const -> bool = default;
        };

        struct SetStepDelay
        {
            static constexpr std::string_view name = "SetStepDelay";
            std::chrono::milliseconds delay{};
            auto operator==(SetStepDelay const&) const -> bool = default;
        };

        struct LoadHand
        {
            static constexpr std::string_view name = "LoadHand";
            Frozen<HandData> hand;
            SessionMode mode{SessionMode::Practice};
            auto operator==(LoadHand const&) const -> bool = default;
        };

        struct ResetHand
        {
            static constexpr std::string_view name = "ResetHand";
            auto operator==(ResetHand const&) const -> bool = default;
        };

        struct ThemeChanged
        {
            static constexpr std::string_view name = "ThemeChanged";
            std::string theme_id;
            auto operator==(ThemeChanged const&) const -> bool = default;
        };

        // ---- completions (drivers, animator, timers) ----
        struct DecisionReady
        {
            static constexpr std::string_view name = "DecisionReady";
            SeatIdxT seat{};
            Decision decision;
            auto operator==(DecisionReady const&) const -> bool = default;
        };

        struct HintReady
        {
            static constexpr std::string_view name = "HintReady";
            SeatIdxT seat{};
            Decision decision;
            auto operator==(HintReady const&) const -> bool = default;
        };

        struct AnimationFinished
        {
            static constexpr std::string_view name = "AnimationFinished";
            TxId token{};
            auto operator==(AnimationFinished const&) const -> bool = default;
        };

        struct BannerExpired
        {
            static constexpr std::string_view name = "BannerExpired";
            uint64_t id{};
            auto operator==(BannerExpired const&) const -> bool = default;
        };

        struct ScriptLoaded
        {
            static constexpr std::string_view name = "ScriptLoaded";
            std::string hand_id;
            std::size_t count{};
            auto operator==(ScriptLoaded const&) const -> bool = default;
        };

        struct ReplayRepositioned
        {
            static constexpr std::string_view name = "ReplayRepositioned";
            uint32_t cursor{};
            ReplayPosition position;
            auto operator==(ReplayRepositioned const&) const -> bool = default;
        };

        // ---- engine / script feedback; step is set only on scripted replay events ----
        struct ActionApplied
        {
            static constexpr std::string_view name = "ActionApplied";
            ActionRecord action;
            TableUpdate table;
            std::optional<uint32_t> step{};
            auto operator==(ActionApplied const&) const -> bool = default;
        };

        struct StreetAdvanced
        {
            static constexpr std::string_view name = "StreetAdvanced";
            Street street{};
            Frozen<Board> board;
            TableUpdate table;
            std::optional<uint32_t> step{};
            auto operator==(StreetAdvanced const&) const -> bool = default;
        };

        struct HandFinished
        {
            static constexpr std::string_view name = "HandFinished";
            std::vector<Payout> payouts;
            TableUpdate table;
            std::optional<uint32_t> step{};
            // the action that ended the hand, when it ended on one
            std::optional<ActionRecord> final_action{};
            auto operator==(HandFinished const&) const -> bool = default;
        };

        struct EngineRejected
        {
            static constexpr std::string_view name = "EngineRejected";
            std::optional<SeatIdxT> seat{};
            std::string reason;
            auto operator==(EngineRejected const&) const -> bool = default;
        };
    }

    using Msg = std::variant<
        msg::AdvanceRequested,
        msg::ToggleAutoplay,
        msg::UserChose,
        msg::SeekReview,
        msg::StepBack,
        msg::SetReviewPaused,
        msg::SetStepDelay,
        msg::LoadHand,
        msg::ResetHand,
        msg::ThemeChanged,
        msg::DecisionReady,
        msg::HintReady,
        msg::AnimationFinished,
        msg::BannerExpired,
        msg::ScriptLoaded,
        msg::ReplayRepositioned,
        msg::ActionApplied,
        msg::StreetAdvanced,
        msg::HandFinished,
        msg::EngineRejected>;

    inline auto NameOf(Msg const& m) -> std::string_view
    {
        return std::visit([](auto const& v) -> std::string_view { return std::decay_t<decltype(v)>::name; }, m);
    }

    // The only messages allowed to take a populated table back to empty.
    inline auto IsResetMessage(Msg const& m) -> bool
    {
        return std::holds_alternative<msg::LoadHand>(m) || std::holds_alternative<msg::ResetHand>(m);
    }
}

#endif //POKERPRO_MESSAGES_HPP
