//
// SessionDriver.hpp — mode-specific source of decisions and scripted events
//

#ifndef POKERPRO_SESSIONDRIVER_HPP
#define POKERPRO_SESSIONDRIVER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "Effects.hpp"
#include "Messages.hpp"
#include "Model.hpp"
#include "Types.hpp"

namespace pokerpro::core
{
    class StrategyProvider;

    using DecisionCallback = std::function<void(Decision)>;

    class SessionDriver
    {
    public:
        virtual ~SessionDriver() = default;

        [[nodiscard]] virtual auto Mode() const -> SessionMode = 0;

        // Asynchronous; on_ready is called at most once, possibly from another thread.
        // A driver that cannot answer logs and never calls back.
        virtual auto Decide(ModelSP model, SeatIdxT seat, DecisionPurpose purpose, DecisionCallback on_ready) -> void = 0;

        // Replay only; other drivers have no script.
        [[nodiscard]] virtual auto ScriptedEventAt(uint32_t) const -> std::optional<Msg> { return std::nullopt; }
        [[nodiscard]] virtual auto ScriptedEventCount() const -> std::size_t { return 0; }

        // Table as it stood once `cursor` scripted events had been applied.
        [[nodiscard]] virtual auto PositionAt(uint32_t) const -> std::optional<ReplayPosition> { return std::nullopt; }
    };

    struct DriverDeps
    {
        Scheduler* scheduler{nullptr};
        std::shared_ptr<StrategyProvider> strategy;
        Config config;
    };

    using DriverFactory = std::function<std::unique_ptr<SessionDriver>(SessionMode, Frozen<HandData> const&)>;

    auto MakeSessionDriver(SessionMode mode, Frozen<HandData> const& hand, DriverDeps const& deps)
        -> std::unique_ptr<SessionDriver>;

    auto MakeDriverFactory(DriverDeps deps) -> DriverFactory;
}

#endif //POKERPRO_SESSIONDRIVER_HPP
