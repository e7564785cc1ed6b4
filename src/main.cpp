//
// main.cpp — pokerprod: one table session served to WebSocket viewers
//

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>

#include "core/EquityProvider.hpp"
#include "core/Exception.hpp"
#include "core/HoldemEngine.hpp"
#include "core/Messages.hpp"
#include "core/Model.hpp"
#include "core/SessionDriver.hpp"
#include "core/Store.hpp"
#include "core/TimerScheduler.hpp"
#include "debug/AuditLogger.hpp"
#include "net/RemoteView.hpp"

using namespace pokerpro::core;

namespace
{
    std::atomic<bool> g_stop{false};

    auto OnSignal(int) -> void
    {
        g_stop = true;
    }

    struct ServerConfig
    {
        std::uint16_t port{9002};
        SessionMode mode{SessionMode::Practice};
        Config session{};
        std::optional<SeatIdxT> hero{0};
        std::string audit_path;
    };

    auto ParseMode(std::string_view s) -> std::optional<SessionMode>
    {
        if (s == "practice") return SessionMode::Practice;
        if (s == "advisory") return SessionMode::Advisory;
        if (s == "replay") return SessionMode::Replay;
        return std::nullopt;
    }

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            std::uint64_t v{};
            if (arg == "--port")
            {
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--mode")
            {
                if (i + 1 < argc)
                {
                    auto const mode = ParseMode(argv[++i]);
                    if (mode) { cfg.mode = *mode; }
                    else { std::print(stderr, "[pokerprod] unknown mode '{}', keeping {}\n", argv[i], to_string(cfg.mode)); }
                }
            }
            else if (arg == "--seed")
            {
                if (next_uint(v)) { cfg.session.seed = v; }
            }
            else if (arg == "--step_delay_ms")
            {
                if (next_uint(v)) { cfg.session.step_delay = std::chrono::milliseconds(v); }
            }
            else if (arg == "--bot_delay_ms")
            {
                if (next_uint(v)) { cfg.session.bot_think_delay = std::chrono::milliseconds(v); }
            }
            else if (arg == "--hero")
            {
                if (next_uint(v)) { cfg.hero = static_cast<SeatIdxT>(v); }
            }
            else if (arg == "--hot_seat")
            {
                cfg.hero.reset();
            }
            else if (arg == "--autoplay")
            {
                cfg.session.autoplay = true;
            }
            else if (arg == "--audit")
            {
                if (i + 1 < argc) { cfg.audit_path = argv[++i]; }
            }
            else
            {
                std::print(stderr, "[pokerprod] ignoring argument '{}'\n", arg);
            }
        }
        return cfg;
    }

    class ConsoleAudio final : public AudioSink
    {
    public:
        auto Play(std::string_view sound) -> void override
        {
            std::print("[audio] {}\n", sound);
        }

        auto Speak(std::string_view text) -> void override
        {
            std::print("[audio] \"{}\"\n", text);
        }
    };

    class ConsoleEvents final : public EventBus
    {
    public:
        auto Publish(std::string_view topic, std::string_view payload) -> void override
        {
            std::print("[event] {} {}\n", topic, payload);
        }
    };

    // Stands in for the viewer's animation timing: completes each effect after a fixed duration.
    class TimedAnimator final : public Animator
    {
    public:
        explicit TimedAnimator(Scheduler& scheduler) : scheduler_(scheduler) {}

        auto Start(AnimationSpec const& spec, std::function<void()> on_done) -> void override
        {
            using namespace std::chrono_literals;
            std::chrono::milliseconds d = 250ms;
            switch (spec.kind)
            {
            case AnimationKind::SeatAction: d = 150ms; break;
            case AnimationKind::FoldCards: d = 200ms; break;
            case AnimationKind::BetChips: d = 300ms; break;
            case AnimationKind::DealBoard: d = 400ms; break;
            case AnimationKind::PotToWinner: d = 600ms; break;
            }
            scheduler_.Schedule(d, std::move(on_done));
        }

    private:
        Scheduler& scheduler_;
    };

    // Three-handed, blinds posted, hero on the button to act first.
    auto DemoHand(std::optional<SeatIdxT> hero) -> HandData
    {
        SeatMap seats;
        seats.emplace(0, SeatState{.player_uid = "u-hero", .name = "Hero", .stack = 1000, .chips_in_front = 0,
                                   .cards = {"As", "Kd"}, .position = 0});
        seats.emplace(1, SeatState{.player_uid = "u-ivy", .name = "Ivy", .stack = 995, .chips_in_front = 5,
                                   .position = 1});
        seats.emplace(2, SeatState{.player_uid = "u-otto", .name = "Otto", .stack = 990, .chips_in_front = 10,
                                   .position = 2});

        return HandData{
            .hand_id = "demo-0001",
            .seats = std::move(seats),
            .board = {},
            .runout = {"Qh", "7c", "2d", "Js", "3h"},
            .pot = 0,
            .to_act = 0,
            .legal = {ActionKind::Fold, ActionKind::Call, ActionKind::Raise},
            .hero_seat = hero,
            .button_seat = 0,
            .small_blind = 5,
            .big_blind = 10,
            .actions = {
                {.seat = 0, .kind = ActionKind::Raise, .amount = 30, .street = Street::Preflop},
                {.seat = 1, .kind = ActionKind::Fold, .amount = 0, .street = Street::Preflop},
                {.seat = 2, .kind = ActionKind::Call, .amount = 20, .street = Street::Preflop},
                {.seat = 2, .kind = ActionKind::Check, .amount = 0, .street = Street::Flop},
                {.seat = 0, .kind = ActionKind::Bet, .amount = 40, .street = Street::Flop},
                {.seat = 2, .kind = ActionKind::Call, .amount = 40, .street = Street::Flop},
                {.seat = 2, .kind = ActionKind::Check, .amount = 0, .street = Street::Turn},
                {.seat = 0, .kind = ActionKind::Check, .amount = 0, .street = Street::Turn},
                {.seat = 2, .kind = ActionKind::Check, .amount = 0, .street = Street::River},
                {.seat = 0, .kind = ActionKind::Check, .amount = 0, .street = Street::River},
            }
        };
    }
} // anon

int main(int argc, char** argv)
{
    ServerConfig const cfg = ParseArgs(argc, argv);

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    std::print("[pokerprod] {} session on port {} | seed {}\n",
               to_string(cfg.mode), cfg.port, cfg.session.seed);

    TimerScheduler timers;
    ConsoleAudio audio;
    ConsoleEvents events;
    TimedAnimator animator(timers);

    DriverDeps deps{
        .scheduler = &timers,
        .strategy = std::make_shared<EquityProvider>(),
        .config = cfg.session
    };

    std::shared_ptr<Store> store = Store::Create(MakeInitialModel(cfg.session), Store::Collaborators{
        .audio = &audio,
        .animator = &animator,
        .events = &events,
        .scheduler = &timers,
        .engine = std::make_shared<HoldemEngine>(cfg.session.seed),
        .driver_factory = MakeDriverFactory(deps)
    });

    HandData const hand = DemoHand(cfg.hero);

    std::shared_ptr<debug::AuditLogger> audit;
    if (!cfg.audit_path.empty())
    {
        audit = std::make_shared<debug::AuditLogger>(cfg.audit_path);
        audit->start(hand, cfg.mode, cfg.session.seed);
        store->SetTap(debug::AuditLogger::TapFor(audit));
    }

    pokerpro::net::RemoteView view(store);
    try
    {
        view.Start(cfg.port);
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "[pokerprod] {}\n", e);
        timers.Shutdown();
        return 1;
    }

    store->Dispatch(msg::LoadHand{.hand = Frozen<HandData>{hand}, .mode = cfg.mode});

    while (!g_stop)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::print("[pokerprod] shutting down\n");
    view.Stop();
    timers.Shutdown();

    if (audit)
    {
        audit->end(*store->GetModel());
        audit->flush();
    }
    return 0;
}
