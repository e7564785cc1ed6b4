//
// Effects.hpp — collaborator interfaces the Store executes Commands against
//

#ifndef POKERPRO_EFFECTS_HPP
#define POKERPRO_EFFECTS_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>

#include "Types.hpp"

namespace pokerpro::core
{
    class AudioSink
    {
    public:
        virtual ~AudioSink() = default;

        virtual auto Play(std::string_view sound) -> void = 0;
        virtual auto Speak(std::string_view text) -> void = 0;
    };

    struct AnimationSpec
    {
        AnimationKind kind{};
        TxId token{};
        std::optional<SeatIdxT> seat;
        Chips amount{};
    };

    class Animator
    {
    public:
        virtual ~Animator() = default;

        // on_done must be called exactly once, from any thread, when the effect ends.
        virtual auto Start(AnimationSpec const& spec, std::function<void()> on_done) -> void = 0;
    };

    class EventBus
    {
    public:
        virtual ~EventBus() = default;

        virtual auto Publish(std::string_view topic, std::string_view payload) -> void = 0;
    };

    class Scheduler
    {
    public:
        using Task = std::function<void()>;

        virtual ~Scheduler() = default;

        // Runs task once after delay; never blocks the caller.
        virtual auto Schedule(std::chrono::milliseconds delay, Task task) -> void = 0;
    };
}

#endif //POKERPRO_EFFECTS_HPP
