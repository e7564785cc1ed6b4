//
// RecordingDriver.hpp — SessionDriver decorator that records asks and answers
//

#ifndef POKERPRO_RECORDINGDRIVER_HPP
#define POKERPRO_RECORDINGDRIVER_HPP

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "../core/SessionDriver.hpp"

namespace pokerpro::core::debug
{
    class RecordingDriver final : public SessionDriver
    {
    public:
        struct Ask
        {
            SeatIdxT seat{};
            DecisionPurpose purpose{};
            TxId tx_id{};
        };

        explicit RecordingDriver(std::unique_ptr<SessionDriver> inner)
            : inner_{std::move(inner)}
        {
        }

        [[nodiscard]] auto Mode() const -> SessionMode override { return inner_->Mode(); }

        auto Decide(ModelSP model, SeatIdxT seat, DecisionPurpose purpose, DecisionCallback on_ready) -> void override
        {
            {
                std::lock_guard<std::mutex> lock(state_->mtx);
                state_->asks.push_back(Ask{.seat = seat, .purpose = purpose, .tx_id = model ? model->tx_id : 0});
            }
            inner_->Decide(std::move(model), seat, purpose,
                           [state = state_, on_ready = std::move(on_ready)](Decision d)
                           {
                               {
                                   std::lock_guard<std::mutex> lock(state->mtx);
                                   state->answers.push_back(d);
                               }
                               on_ready(std::move(d));
                           });
        }

        [[nodiscard]] auto ScriptedEventAt(uint32_t index) const -> std::optional<Msg> override
        {
            return inner_->ScriptedEventAt(index);
        }

        [[nodiscard]] auto ScriptedEventCount() const -> std::size_t override
        {
            return inner_->ScriptedEventCount();
        }

        [[nodiscard]] auto PositionAt(uint32_t cursor) const -> std::optional<ReplayPosition> override
        {
            return inner_->PositionAt(cursor);
        }

        auto Asks() const -> std::vector<Ask>
        {
            std::lock_guard<std::mutex> lock(state_->mtx);
            return state_->asks;
        }

        auto Answers() const -> std::vector<Decision>
        {
            std::lock_guard<std::mutex> lock(state_->mtx);
            return state_->answers;
        }

    private:
        // shared with in-flight callbacks, which may outlive the driver
        struct State
        {
            std::mutex mtx;
            std::vector<Ask> asks;
            std::vector<Decision> answers;
        };

        std::unique_ptr<SessionDriver> inner_;
        std::shared_ptr<State> state_{std::make_shared<State>()};
    };

    // Wraps every driver a factory builds; `last` receives the most recent one.
    inline auto WrapRecording(DriverFactory inner, std::shared_ptr<RecordingDriver*> last) -> DriverFactory
    {
        return [inner = std::move(inner), last = std::move(last)](SessionMode mode, Frozen<HandData> const& hand)
            -> std::unique_ptr<SessionDriver>
        {
            auto rec = std::make_unique<RecordingDriver>(inner(mode, hand));
            if (last)
            {
                *last = rec.get();
            }
            return rec;
        };
    }
}

#endif //POKERPRO_RECORDINGDRIVER_HPP
