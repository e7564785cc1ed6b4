//
// Store.cpp
//

#include "Store.hpp"

#include <cstdio>
#include <exception>
#include <print>
#include <utility>
#include <vector>

namespace pokerpro::core
{
    namespace
    {
        // Clears the draining flag if the drain loop exits by exception.
        struct DrainGuard
        {
            std::mutex& mtx;
            bool& draining;
            bool armed{true};

            ~DrainGuard()
            {
                if (armed)
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    draining = false;
                }
            }
        };
    }

    Store::Store(Model initial, Collaborators collaborators) :
        model_(std::make_shared<Model const>(std::move(initial))),
        fx_(std::move(collaborators))
    {
        if (!fx_.reducer)
        {
            fx_.reducer = &Update;
        }
    }

    auto Store::Create(Model initial, Collaborators collaborators) -> std::shared_ptr<Store>
    {
        return std::shared_ptr<Store>(new Store(std::move(initial), std::move(collaborators)));
    }

    auto Store::GetModel() const -> ModelSP
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return model_;
    }

    auto Store::Driver() const -> std::shared_ptr<SessionDriver>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return driver_;
    }

    auto Store::SetSessionDriver(std::shared_ptr<SessionDriver> driver) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);
        driver_ = std::move(driver);
    }

    auto Store::SetTap(Tap tap) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);
        tap_ = std::move(tap);
    }

    auto Store::Subscribe(Subscriber cb) -> Unsubscribe
    {
        uint64_t id{};
        bool drain = false;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            id = next_subscriber_++;
            subscribers_.emplace(id, Subscription{.cb = std::move(cb)});
            greetings_.push_back(id);
            drain = !draining_;
            draining_ = true;
        }
        if (drain)
        {
            Drain();
        }

        return [weak = weak_from_this(), id]
        {
            if (auto self = weak.lock())
            {
                std::lock_guard<std::mutex> lock(self->mtx_);
                self->subscribers_.erase(id);
            }
        };
    }

    auto Store::Dispatch(Msg message) -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            inbox_.push_back(std::move(message));
            if (draining_)
            {
                return;
            }
            draining_ = true;
        }
        Drain();
    }

    auto Store::Drain() -> void
    {
        DrainGuard guard{mtx_, draining_};
        while (true)
        {
            std::vector<Subscriber> pending;
            ModelSP current;
            Msg next;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                for (uint64_t const id : greetings_)
                {
                    if (auto it = subscribers_.find(id); it != subscribers_.end())
                    {
                        it->second.greeted = true;
                        pending.push_back(it->second.cb);
                    }
                }
                greetings_.clear();

                // released under the same lock a concurrent Dispatch checks
                if (pending.empty() && inbox_.empty())
                {
                    draining_ = false;
                    guard.armed = false;
                    return;
                }
                current = model_;
                if (pending.empty())
                {
                    next = std::move(inbox_.front());
                    inbox_.pop_front();
                }
            }

            if (!pending.empty())
            {
                Greet(pending, current);
                continue;
            }

            try
            {
                Process(next);
            }
            catch (OmegaException<error::Code> const& e)
            {
                std::print(stderr, "[store] {} dropped: {}\n", NameOf(next), e);
            }
            catch (std::exception const& e)
            {
                std::print(stderr, "[store] {} dropped: {}\n", NameOf(next), e.what());
            }
        }
    }

    // First delivery to new subscribers; later commits reach them through Notify.
    auto Store::Greet(std::vector<Subscriber> const& pending, ModelSP const& model) -> void
    {
        for (Subscriber const& cb : pending)
        {
            try
            {
                cb(model);
            }
            catch (OmegaException<error::Code> const& e)
            {
                std::print(stderr, "[store] subscriber failed on its first model: {}\n", e);
            }
            catch (std::exception const& e)
            {
                std::print(stderr, "[store] subscriber failed on its first model: {}\n", e.what());
            }
        }
    }

    auto Store::Process(Msg const& message) -> void
    {
        ModelSP const current = GetModel();
        Transition t = fx_.reducer(*current, message);

        // a populated table only empties through an explicit load/reset
        bool const regression = !current->seats->empty() && t.model.seats->empty() && !IsResetMessage(message);
        bool const changed = !regression && !(t.model == *current);

        ModelSP next = current;
        Tap tap;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            ++processed_;
            if (changed)
            {
                next = std::make_shared<Model const>(std::move(t.model));
                model_ = next;
                ++commits_;
            }
            if (regression)
            {
                ++guard_trips_;
            }
            if (t.rejection)
            {
                ++rejections_;
            }
            tap = tap_;
        }

        if (regression)
        {
            std::print(stderr, "[store] regression guard: {} would empty {} seats; keeping hand {}\n",
                       NameOf(message), current->seats->size(), current->hand_id);
        }
        if (t.rejection)
        {
            std::print("[store] {} rejected: {}\n", NameOf(message), error::describe(*t.rejection));
        }
        if (tap)
        {
            tap(message, *next, t.rejection, changed);
        }

        for (Cmd const& c : t.commands)
        {
            Execute(c);
        }

        if (changed)
        {
            Notify(next);
        }
    }

    auto Store::Notify(ModelSP const& model) -> void
    {
        std::vector<std::pair<uint64_t, Subscriber>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (auto const& [id, sub] : subscribers_)
            {
                // not yet greeted: its first call will carry this model or a newer one
                if (sub.greeted)
                {
                    snapshot.emplace_back(id, sub.cb);
                }
            }
        }
        for (auto const& [id, cb] : snapshot)
        {
            bool active = false;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                active = subscribers_.contains(id);
            }
            if (active)
            {
                cb(model);
            }
        }
    }

    auto Store::Execute(Cmd const& command) -> void
    {
        try
        {
            std::visit([this](auto const& c) { Run(c); }, command);
        }
        catch (OmegaException<error::Code> const& e)
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                ++command_failures_;
            }
            std::print(stderr, "[store] command {} failed: {}\n", NameOf(command), e);
        }
        catch (std::exception const& e)
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                ++command_failures_;
            }
            std::print(stderr, "[store] command {} failed: {}\n", NameOf(command), e.what());
        }
    }

    auto Store::Run(cmd::PlaySound const& c) -> void
    {
        if (fx_.audio)
        {
            fx_.audio->Play(c.sound);
        }
    }

    auto Store::Run(cmd::Speak const& c) -> void
    {
        if (fx_.audio)
        {
            fx_.audio->Speak(c.text);
        }
    }

    auto Store::Run(cmd::Animate const& c) -> void
    {
        TxId const token = c.token;
        if (!fx_.animator)
        {
            Dispatch(msg::AnimationFinished{.token = token});
            return;
        }

        try
        {
            fx_.animator->Start(AnimationSpec{.kind = c.kind, .token = token, .seat = c.seat, .amount = c.amount},
                                [weak = weak_from_this(), token]
                                {
                                    if (auto self = weak.lock())
                                    {
                                        self->Dispatch(msg::AnimationFinished{.token = token});
                                    }
                                });
        }
        catch (OmegaException<error::Code> const& e)
        {
            std::print(stderr, "[store] animation {} failed, completing it: {}\n", token, e.what());
            Dispatch(msg::AnimationFinished{.token = token});
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[store] animation {} failed, completing it: {}\n", token, e.what());
            Dispatch(msg::AnimationFinished{.token = token});
        }
    }

    auto Store::Run(cmd::AskDriverForDecision const& c) -> void
    {
        auto const driver = Driver();
        if (!driver)
        {
            std::print(stderr, "[store] no session driver to ask for seat {}\n", static_cast<int>(c.seat));
            return;
        }

        SeatIdxT const seat = c.seat;
        DecisionPurpose const purpose = c.purpose;
        driver->Decide(GetModel(), seat, purpose, [weak = weak_from_this(), seat, purpose](Decision d)
        {
            auto self = weak.lock();
            if (!self)
            {
                return;
            }
            if (purpose == DecisionPurpose::Hint)
            {
                self->Dispatch(msg::HintReady{.seat = seat, .decision = std::move(d)});
            }
            else
            {
                self->Dispatch(msg::DecisionReady{.seat = seat, .decision = std::move(d)});
            }
        });
    }

    auto Store::Run(cmd::ApplyToEngine const& c) -> void
    {
        if (!fx_.engine)
        {
            Dispatch(msg::EngineRejected{.seat = c.seat, .reason = "no engine installed"});
            return;
        }
        if (auto const ok = fx_.engine->Validate(c.seat, c.kind, c.amount); !ok)
        {
            Dispatch(msg::EngineRejected{.seat = c.seat, .reason = error::describe(ok.error())});
            return;
        }

        std::vector<Msg> feedback;
        try
        {
            feedback = FeedbackFor(fx_.engine->Apply(c.seat, c.kind, c.amount));
        }
        catch (OmegaException<error::Code> const& e)
        {
            std::print(stderr, "[engine] apply failed for seat {}: {}\n", static_cast<int>(c.seat), e.what());
            Dispatch(msg::EngineRejected{.seat = c.seat, .reason = e.what()});
            return;
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[engine] apply failed for seat {}: {}\n", static_cast<int>(c.seat), e.what());
            Dispatch(msg::EngineRejected{.seat = c.seat, .reason = e.what()});
            return;
        }
        for (Msg& m : feedback)
        {
            Dispatch(std::move(m));
        }
    }

    auto Store::Run(cmd::ApplyContinue const&) -> void
    {
        if (!fx_.engine)
        {
            Dispatch(msg::EngineRejected{.seat = std::nullopt, .reason = "no engine installed"});
            return;
        }

        std::vector<Msg> feedback;
        try
        {
            feedback = FeedbackFor(fx_.engine->Continue());
        }
        catch (OmegaException<error::Code> const& e)
        {
            std::print(stderr, "[engine] continue failed: {}\n", e.what());
            Dispatch(msg::EngineRejected{.seat = std::nullopt, .reason = e.what()});
            return;
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[engine] continue failed: {}\n", e.what());
            Dispatch(msg::EngineRejected{.seat = std::nullopt, .reason = e.what()});
            return;
        }
        for (Msg& m : feedback)
        {
            Dispatch(std::move(m));
        }
    }

    auto Store::Run(cmd::ResetEngine const& c) -> void
    {
        if (fx_.engine)
        {
            fx_.engine->Reset(*c.hand);
        }
    }

    auto Store::Run(cmd::InstallDriver const& c) -> void
    {
        if (fx_.driver_factory)
        {
            std::shared_ptr<SessionDriver> driver = fx_.driver_factory(c.mode, c.hand);
            PPR_ASSERT(driver != nullptr, "driver factory returned nothing");
            SetSessionDriver(std::move(driver));
        }

        auto const driver = Driver();
        if (!driver)
        {
            std::print(stderr, "[store] no session driver for hand {}\n", c.hand->hand_id);
            return;
        }
        if (driver->Mode() != c.mode)
        {
            std::print(stderr, "[store] driver mode {} does not match session mode {}\n",
                       to_string(driver->Mode()), to_string(c.mode));
        }
        if (c.mode == SessionMode::Replay)
        {
            Dispatch(msg::ScriptLoaded{.hand_id = c.hand->hand_id, .count = driver->ScriptedEventCount()});
        }
    }

    auto Store::Run(cmd::ScheduleTimer const& c) -> void
    {
        if (!fx_.scheduler)
        {
            std::print(stderr, "[store] no scheduler; dropping timer for {}\n", NameOf(c.message));
            return;
        }
        fx_.scheduler->Schedule(c.delay, [weak = weak_from_this(), message = c.message]
        {
            if (auto self = weak.lock())
            {
                self->Dispatch(message);
            }
        });
    }

    auto Store::Run(cmd::PublishEvent const& c) -> void
    {
        if (fx_.events)
        {
            fx_.events->Publish(c.topic, c.payload);
        }
    }

    auto Store::Run(cmd::FetchScriptedEvent const& c) -> void
    {
        auto const driver = Driver();
        if (!driver)
        {
            std::print(stderr, "[store] no session driver to fetch scripted event {}\n", c.index);
            return;
        }
        if (auto m = driver->ScriptedEventAt(c.index))
        {
            Dispatch(std::move(*m));
            return;
        }
        std::print(stderr, "[store] no scripted event at {}\n", c.index);
    }

    auto Store::Run(cmd::RepositionReplay const& c) -> void
    {
        auto const driver = Driver();
        if (!driver)
        {
            std::print(stderr, "[store] no session driver to reposition to {}\n", c.cursor);
            return;
        }
        if (auto pos = driver->PositionAt(c.cursor))
        {
            Dispatch(msg::ReplayRepositioned{.cursor = c.cursor, .position = std::move(*pos)});
            return;
        }
        std::print(stderr, "[store] no replay position {}\n", c.cursor);
    }
}
