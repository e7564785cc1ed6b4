//
// Commands.hpp — closed vocabulary of side-effect requests returned by Update
//

#ifndef POKERPRO_COMMANDS_HPP
#define POKERPRO_COMMANDS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "Messages.hpp"
#include "Model.hpp"
#include "Types.hpp"

namespace pokerpro::core
{
    namespace cmd
    {
        struct PlaySound
        {
            static constexpr std::string_view name = "PlaySound";
            std::string sound;
            auto operator==(PlaySound const&) const -> bool = default;
        };

        struct Speak
        {
            static constexpr std::string_view name = "Speak";
            std::string text;
            auto operator==(Speak const&) const -> bool = default;
        };

        struct Animate
        {
            static constexpr std::string_view name = "Animate";
            AnimationKind kind{};
            TxId token{};
            std::optional<SeatIdxT> seat{};
            Chips amount{};
            auto operator==(Animate const&) const -> bool = default;
        };

        struct AskDriverForDecision
        {
            static constexpr std::string_view name = "AskDriverForDecision";
            SeatIdxT seat{};
            DecisionPurpose purpose{DecisionPurpose::Decide};
            auto operator==(AskDriverForDecision const&) const -> bool = default;
        };

        struct ApplyToEngine
        {
            static constexpr std::string_view name = "ApplyToEngine";
            SeatIdxT seat{};
            ActionKind kind{};
            Chips amount{};
            auto operator==(ApplyToEngine const&) const -> bool = default;
        };

        // close the betting round / deal the next street
        struct ApplyContinue
        {
            static constexpr std::string_view name = "ApplyContinue";
            auto operator==(ApplyContinue const&) const -> bool = default;
        };

        struct ResetEngine
        {
            static constexpr std::string_view name = "ResetEngine";
            Frozen<HandData> hand;
            auto operator==(ResetEngine const&) const -> bool = default;
        };

        struct InstallDriver
        {
            static constexpr std::string_view name = "InstallDriver";
            Frozen<HandData> hand;
            SessionMode mode{};
            auto operator==(InstallDriver const&) const -> bool = default;
        };

        struct ScheduleTimer
        {
            static constexpr std::string_view name = "ScheduleTimer";
            std::chrono::milliseconds delay{};
            Msg message;
            auto operator==(ScheduleTimer const&) const -> bool = default;
        };

        struct PublishEvent
        {
            static constexpr std::string_view name = "PublishEvent";
            std::string topic;
            std::string payload;
            auto operator==(PublishEvent const&) const -> bool = default;
        };

        struct FetchScriptedEvent
        {
            static constexpr std::string_view name = "FetchScriptedEvent";
            uint32_t index{};
            auto operator==(FetchScriptedEvent const&) const -> bool = default;
        };

        struct RepositionReplay
        {
            static constexpr std::string_view name = "RepositionReplay";
            uint32_t cursor{};
            auto operator==(RepositionReplay const&) const -> bool = default;
        };
    }

    using Cmd = std::variant<
        cmd::PlaySound,
        cmd::Speak,
        cmd::Animate,
        cmd::AskDriverForDecision,
        cmd::ApplyToEngine,
        cmd::ApplyContinue,
        cmd::ResetEngine,
        cmd::InstallDriver,
        cmd::ScheduleTimer,
        cmd::PublishEvent,
        cmd::FetchScriptedEvent,
        cmd::RepositionReplay>;

    inline auto NameOf(Cmd const& c) -> std::string_view
    {
        return std::visit([](auto const& v) -> std::string_view { return std::decay_t<decltype(v)>::name; }, c);
    }
}

#endif //POKERPRO_COMMANDS_HPP
