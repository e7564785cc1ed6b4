//
// Engine.hpp — authoritative poker rules engine boundary
//

#ifndef POKERPRO_ENGINE_HPP
#define POKERPRO_ENGINE_HPP

#include <optional>
#include <vector>

#include "Exception.hpp"
#include "Messages.hpp"
#include "Model.hpp"
#include "Types.hpp"

namespace pokerpro::core
{
    enum class EngineOutcome : uint8_t
    {
        Applied, // action taken; to_act is empty once the betting round closed
        StreetDealt,
        HandEnded
    };

    struct EngineResult
    {
        EngineOutcome outcome{EngineOutcome::Applied};
        std::optional<ActionRecord> action;
        Street street{Street::Preflop};
        Board board;
        TableUpdate table;
        std::vector<Payout> payouts;
    };

    class PokerEngine
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~PokerEngine() = default;

        virtual auto Reset(HandData const& hand) -> void = 0;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        virtual auto Validate(SeatIdxT seat, ActionKind kind, Chips amount) const -> CheckResult = 0;

        // Throws InvalidAction when Validate would refuse.
        virtual auto Apply(SeatIdxT seat, ActionKind kind, Chips amount) -> EngineResult = 0;

        // Collect bets and deal the next street, or settle the hand after the river.
        // Throws Engine while a betting round is still open.
        virtual auto Continue() -> EngineResult = 0;

        [[nodiscard]] virtual auto Table() const -> TableUpdate = 0;
        [[nodiscard]] virtual auto StreetNow() const -> Street = 0;
        [[nodiscard]] virtual auto BoardNow() const -> Board = 0;
    };

    // Follow-up messages for a result, in dispatch order. Steps are left unset.
    auto FeedbackFor(EngineResult const& result) -> std::vector<Msg>;
}

#endif //POKERPRO_ENGINE_HPP
