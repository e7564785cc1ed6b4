//
// Store.hpp — single serialized owner of the Model; executes Commands, notifies subscribers
//

#ifndef POKERPRO_STORE_HPP
#define POKERPRO_STORE_HPP

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "Commands.hpp"
#include "Effects.hpp"
#include "Engine.hpp"
#include "Messages.hpp"
#include "Model.hpp"
#include "SessionDriver.hpp"
#include "Update.hpp"

namespace pokerpro::core::debug {struct Inspector;}
namespace pokerpro::core
{
    class Store : public std::enable_shared_from_this<Store>
    {
    public:
        using Subscriber = std::function<void(ModelSP const&)>;
        using Unsubscribe = std::function<void()>;
        using Reducer = std::function<Transition(Model const&, Msg const&)>;
        // Observes every processed message with the model it left behind.
        using Tap = std::function<void(Msg const&, Model const&, std::optional<error::Rejection> const&, bool committed)>;

        // Every collaborator is optional; a missing one is logged when a Command needs it.
        struct Collaborators
        {
            AudioSink* audio{nullptr};
            Animator* animator{nullptr};
            EventBus* events{nullptr};
            Scheduler* scheduler{nullptr};
            std::shared_ptr<PokerEngine> engine;
            DriverFactory driver_factory;
            Reducer reducer{&Update};
        };

        static auto Create(Model initial, Collaborators collaborators) -> std::shared_ptr<Store>;

        Store(Store const&) = delete;
        auto operator=(Store const&) -> Store& = delete;

        // Enqueues; the first caller drains the mailbox, re-entrant and concurrent callers return at once.
        auto Dispatch(Msg message) -> void;

        // cb runs once with the current Model, then after every committed change.
        // Every call is made by the draining thread, so a subscriber sees Models in commit order.
        // An idle Store delivers the first call before returning; a draining one before its next message.
        auto Subscribe(Subscriber cb) -> Unsubscribe;

        auto SetSessionDriver(std::shared_ptr<SessionDriver> driver) -> void;
        auto SetTap(Tap tap) -> void;

        [[nodiscard]] auto GetModel() const -> ModelSP;

        friend struct debug::Inspector;

    private:
        Store(Model initial, Collaborators collaborators);

        auto Drain() -> void;
        auto Greet(std::vector<Subscriber> const& pending, ModelSP const& model) -> void;
        auto Process(Msg const& message) -> void;
        auto Execute(Cmd const& command) -> void;
        auto Notify(ModelSP const& model) -> void;
        auto Driver() const -> std::shared_ptr<SessionDriver>;

        auto Run(cmd::PlaySound const& c) -> void;
        auto Run(cmd::Speak const& c) -> void;
        auto Run(cmd::Animate const& c) -> void;
        auto Run(cmd::AskDriverForDecision const& c) -> void;
        auto Run(cmd::ApplyToEngine const& c) -> void;
        auto Run(cmd::ApplyContinue const& c) -> void;
        auto Run(cmd::ResetEngine const& c) -> void;
        auto Run(cmd::InstallDriver const& c) -> void;
        auto Run(cmd::ScheduleTimer const& c) -> void;
        auto Run(cmd::PublishEvent const& c) -> void;
        auto Run(cmd::FetchScriptedEvent const& c) -> void;
        auto Run(cmd::RepositionReplay const& c) -> void;

    private:
        mutable std::mutex mtx_;
        ModelSP model_;
        std::deque<Msg> inbox_;
        bool draining_{false};

        struct Subscription
        {
            Subscriber cb;
            bool greeted{false};
        };

        std::map<uint64_t, Subscription> subscribers_;
        std::deque<uint64_t> greetings_;
        uint64_t next_subscriber_{1};

        std::shared_ptr<SessionDriver> driver_;
        Collaborators fx_;
        Tap tap_;

        uint64_t processed_{};
        uint64_t commits_{};
        uint64_t rejections_{};
        uint64_t guard_trips_{};
        uint64_t command_failures_{};
    };
}

#endif //POKERPRO_STORE_HPP
