//
// ReplayDriver.hpp — scripted events derived once from a recorded action log
//

#ifndef POKERPRO_REPLAYDRIVER_HPP
#define POKERPRO_REPLAYDRIVER_HPP

#include <string>
#include <vector>

#include "SessionDriver.hpp"

namespace pokerpro::core
{
    class HoldemEngine;

    class ReplayDriver final : public SessionDriver
    {
    public:
        // Runs a private engine over hand.actions. An inconsistent log truncates the script.
        ReplayDriver(HandData const& hand, uint64_t seed);

        [[nodiscard]] auto Mode() const -> SessionMode override { return SessionMode::Replay; }

        auto Decide(ModelSP model, SeatIdxT seat, DecisionPurpose purpose, DecisionCallback on_ready) -> void override;

        [[nodiscard]] auto ScriptedEventAt(uint32_t index) const -> std::optional<Msg> override;
        [[nodiscard]] auto ScriptedEventCount() const -> std::size_t override { return script_.size(); }
        [[nodiscard]] auto PositionAt(uint32_t cursor) const -> std::optional<ReplayPosition> override;

        [[nodiscard]] auto Truncated() const -> bool { return truncated_; }

    private:
        auto Push(HoldemEngine const& engine, std::vector<Msg> messages) -> void;

        std::string hand_id_;
        std::vector<Msg> script_;
        // positions_[i] is the table after i scripted events
        std::vector<ReplayPosition> positions_;
        std::optional<ActionRecord> last_action_;
        bool truncated_{false};
    };
}

#endif //POKERPRO_REPLAYDRIVER_HPP
