//
// Fixtures.hpp — sample hands and a Store harness driven by a virtual clock
//

#ifndef POKERPRO_TESTS_FIXTURES_HPP
#define POKERPRO_TESTS_FIXTURES_HPP

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/Commands.hpp"
#include "../core/HoldemEngine.hpp"
#include "../core/Messages.hpp"
#include "../core/Model.hpp"
#include "../core/SessionDriver.hpp"
#include "../core/Store.hpp"
#include "../debug/ManualScheduler.hpp"
#include "../debug/RecordingDriver.hpp"

namespace pokerpro::core::fixtures
{
    // Heads-up, button posts the small blind and acts first. The log ends on a flop fold.
    inline auto HeadsUpHand() -> HandData
    {
        SeatMap seats;
        seats.emplace(0, SeatState{.player_uid = "u0", .name = "Hero", .stack = 995, .chips_in_front = 5,
                                   .cards = {"As", "Kd"}, .position = 0});
        seats.emplace(1, SeatState{.player_uid = "u1", .name = "Villain", .stack = 990, .chips_in_front = 10,
                                   .position = 1});
        return HandData{
            .hand_id = "hu-1",
            .seats = std::move(seats),
            .board = {},
            .runout = {"Qh", "7c", "2d", "Js", "3h"},
            .pot = 0,
            .to_act = 0,
            .legal = {ActionKind::Raise, ActionKind::Call, ActionKind::Fold},
            .hero_seat = 0,
            .button_seat = 0,
            .small_blind = 5,
            .big_blind = 10,
            .actions = {
                {.seat = 0, .kind = ActionKind::Raise, .amount = 30, .street = Street::Preflop},
                {.seat = 1, .kind = ActionKind::Call, .amount = 20, .street = Street::Preflop},
                {.seat = 1, .kind = ActionKind::Check, .amount = 0, .street = Street::Flop},
                {.seat = 0, .kind = ActionKind::Bet, .amount = 40, .street = Street::Flop},
                {.seat = 1, .kind = ActionKind::Fold, .amount = 0, .street = Street::Flop},
            }
        };
    }

    // Script events produced by HeadsUpHand's log: raise, call, flop, check, bet, fold-ends-hand.
    inline constexpr std::size_t HeadsUpScriptLength = 6;

    // Three seats, everyone's cards known, checked down to showdown after a preflop all-in.
    inline auto ShowdownHand() -> HandData
    {
        SeatMap seats;
        seats.emplace(0, SeatState{.player_uid = "u0", .name = "Short", .stack = 100, .cards = {"As", "Ah"}, .position = 0});
        seats.emplace(1, SeatState{.player_uid = "u1", .name = "Kings", .stack = 500, .cards = {"Ks", "Kh"}, .position = 1});
        seats.emplace(2, SeatState{.player_uid = "u2", .name = "Queens", .stack = 500, .cards = {"Qs", "Qh"}, .position = 2});
        return HandData{
            .hand_id = "sd-1",
            .seats = std::move(seats),
            .board = {},
            .runout = {"2c", "7d", "9h", "Js", "3c"},
            .pot = 0,
            .to_act = 0,
            .legal = {},
            .hero_seat = std::nullopt,
            .button_seat = 2,
            .small_blind = 5,
            .big_blind = 10,
            .actions = {
                {.seat = 0, .kind = ActionKind::Bet, .amount = 100, .street = Street::Preflop},
                {.seat = 1, .kind = ActionKind::Raise, .amount = 300, .street = Street::Preflop},
                {.seat = 2, .kind = ActionKind::Call, .amount = 300, .street = Street::Preflop},
                {.seat = 1, .kind = ActionKind::Check, .amount = 0, .street = Street::Flop},
                {.seat = 2, .kind = ActionKind::Check, .amount = 0, .street = Street::Flop},
                {.seat = 1, .kind = ActionKind::Check, .amount = 0, .street = Street::Turn},
                {.seat = 2, .kind = ActionKind::Check, .amount = 0, .street = Street::Turn},
                {.seat = 1, .kind = ActionKind::Check, .amount = 0, .street = Street::River},
                {.seat = 2, .kind = ActionKind::Check, .amount = 0, .street = Street::River},
            }
        };
    }

    inline auto Load(HandData hand, SessionMode mode) -> msg::LoadHand
    {
        return msg::LoadHand{.hand = Frozen<HandData>{std::move(hand)}, .mode = mode};
    }

    inline auto CommandNames(std::vector<Cmd> const& cmds) -> std::vector<std::string_view>
    {
        std::vector<std::string_view> out;
        for (Cmd const& c : cmds)
        {
            out.push_back(NameOf(c));
        }
        return out;
    }

    class RecordingAudio final : public AudioSink
    {
    public:
        auto Play(std::string_view sound) -> void override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            sounds_.emplace_back(sound);
        }

        auto Speak(std::string_view text) -> void override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            speech_.emplace_back(text);
        }

        auto Sounds() const -> std::vector<std::string>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return sounds_;
        }

        auto Speech() const -> std::vector<std::string>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return speech_;
        }

    private:
        mutable std::mutex mtx_;
        std::vector<std::string> sounds_;
        std::vector<std::string> speech_;
    };

    class RecordingEvents final : public EventBus
    {
    public:
        auto Publish(std::string_view topic, std::string_view) -> void override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            topics_.emplace_back(topic);
        }

        auto Topics() const -> std::vector<std::string>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return topics_;
        }

    private:
        mutable std::mutex mtx_;
        std::vector<std::string> topics_;
    };

    // Store wired to a manual scheduler, a seeded engine and the real driver factory.
    // Without an animator every animation completes as soon as it starts.
    struct Harness
    {
        explicit Harness(Config cfg = MakeConfig(), Animator* animator = nullptr)
            : config(cfg)
        {
            last_driver = std::make_shared<debug::RecordingDriver*>(nullptr);
            DriverDeps deps{.scheduler = &scheduler, .strategy = nullptr, .config = config};
            store = Store::Create(MakeInitialModel(config), Store::Collaborators{
                .audio = &audio,
                .animator = animator,
                .events = &events,
                .scheduler = &scheduler,
                .engine = std::make_shared<HoldemEngine>(config.seed),
                .driver_factory = debug::WrapRecording(MakeDriverFactory(deps), last_driver)
            });
        }

        static auto MakeConfig() -> Config
        {
            Config c{};
            c.seed = 7;
            c.step_delay = std::chrono::milliseconds(100);
            c.bot_think_delay = std::chrono::milliseconds(50);
            return c;
        }

        auto Current() const -> ModelSP { return store->GetModel(); }

        // Dispatches, then runs every timer the message chain scheduled.
        auto Send(Msg m) -> void
        {
            store->Dispatch(std::move(m));
            scheduler.RunUntilIdle();
        }

        Config config;
        debug::ManualScheduler scheduler;
        RecordingAudio audio;
        RecordingEvents events;
        std::shared_ptr<debug::RecordingDriver*> last_driver;
        std::shared_ptr<Store> store;
    };
}

#endif //POKERPRO_TESTS_FIXTURES_HPP
