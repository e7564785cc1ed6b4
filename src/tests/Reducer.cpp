#include <gtest/gtest.h>
#include <chrono>
#include <string_view>
#include <variant>
#include <vector>

#include "../core/Update.hpp"
#include "../debug/Invariants.hpp"
#include "Fixtures.hpp"

using namespace pokerpro::core;
using namespace pokerpro::core::fixtures;
using namespace std::chrono_literals;

namespace
{
    auto Step(Model const& m, Msg const& msg) -> Model
    {
        Transition t = Update(m, msg);
        EXPECT_FALSE(t.rejection.has_value()) << NameOf(msg) << ": " << error::describe(*t.rejection);
        return t.model;
    }

    auto LoadedLive(SessionMode mode = SessionMode::Practice) -> Model
    {
        return Step(MakeInitialModel(Config{}), Load(HeadsUpHand(), mode));
    }

    auto LoadedReplay(std::size_t script_events) -> Model
    {
        HandData h = HeadsUpHand();
        h.legal = {};
        Model m = Step(MakeInitialModel(Config{}), Load(std::move(h), SessionMode::Replay));
        return Step(m, msg::ScriptLoaded{.hand_id = "hu-1", .count = script_events});
    }

    template <class C>
    auto Find(std::vector<Cmd> const& cmds) -> C const*
    {
        for (Cmd const& c : cmds)
        {
            if (auto const* p = std::get_if<C>(&c))
            {
                return p;
            }
        }
        return nullptr;
    }
} // anonymous namespace

TEST(Reducer, LoadHand_ReplacesTableAndInstallsDriver)
{
    Model const start = MakeInitialModel(Config{});
    Transition const t = Update(start, Load(HeadsUpHand(), SessionMode::Practice));

    ASSERT_FALSE(t.rejection.has_value());
    EXPECT_EQ(t.model.hand_id, "hu-1");
    EXPECT_EQ(t.model.seats->size(), 2u);
    EXPECT_EQ(t.model.to_act_seat, std::optional<SeatIdxT>{0});
    EXPECT_TRUE(t.model.seats->at(0).acting);
    EXPECT_EQ(t.model.tx_id, start.tx_id + 1);
    EXPECT_EQ(t.model.waiting_for, WaitingFor::HumanDecision);
    EXPECT_EQ(t.model.hero_seat, std::optional<SeatIdxT>{0});

    auto const names = CommandNames(t.commands);
    ASSERT_GE(names.size(), 3u);
    EXPECT_EQ(names[0], "InstallDriver");
    EXPECT_EQ(names[1], "ResetEngine");
    EXPECT_EQ(names[2], "PublishEvent");
    EXPECT_TRUE(debug::Violations(t.model).empty());
}

TEST(Reducer, LoadHand_InvalidPayloadRejected)
{
    HandData h = HeadsUpHand();
    h.board = {"Qh", "7c"}; // no street has two board cards
    Model const start = MakeInitialModel(Config{});
    Transition const t = Update(start, Load(std::move(h), SessionMode::Practice));

    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::BoardMismatch);
    EXPECT_EQ(t.model, start);
    EXPECT_TRUE(t.commands.empty());
}

TEST(Reducer, LoadHand_DuplicateCardsRejected)
{
    HandData h = HeadsUpHand();
    h.runout[0] = "As";
    Transition const t = Update(MakeInitialModel(Config{}), Load(std::move(h), SessionMode::Practice));

    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::DuplicateCards);
}

TEST(Reducer, LoadAndSingleAdvance_Live)
{
    Model const loaded = LoadedLive();
    ASSERT_EQ(loaded.legal_actions, (ActionSet{ActionKind::Raise, ActionKind::Call, ActionKind::Fold}));

    Transition const t = Update(loaded, msg::UserChose{.kind = ActionKind::Raise, .amount = 30});

    ASSERT_FALSE(t.rejection.has_value());
    EXPECT_EQ(t.model.pot, loaded.pot);
    EXPECT_EQ(t.model.waiting_for, WaitingFor::Animation);
    EXPECT_EQ(t.model.tx_id, loaded.tx_id + 1);
    EXPECT_TRUE(t.model.engine_pending);
    EXPECT_TRUE(t.model.legal_actions.Empty());

    auto const names = CommandNames(t.commands);
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "PlaySound");
    EXPECT_EQ(names[1], "Animate");
    EXPECT_EQ(names[2], "ApplyToEngine");

    auto const& apply = std::get<cmd::ApplyToEngine>(t.commands[2]);
    EXPECT_EQ(apply.seat, 0);
    EXPECT_EQ(apply.kind, ActionKind::Raise);
    EXPECT_EQ(apply.amount, 30);
    EXPECT_EQ(std::get<cmd::Animate>(t.commands[1]).token, t.model.tx_id);
}

TEST(Reducer, LoadAndSingleAdvance_ReplayResolvesItself)
{
    Model const loaded = Step(MakeInitialModel(Config{}), Load(HeadsUpHand(), SessionMode::Replay));
    ASSERT_EQ(loaded.waiting_for, WaitingFor::HumanDecision);
    ASSERT_FALSE(loaded.hero_seat.has_value());

    Transition const t = Update(loaded, msg::UserChose{.kind = ActionKind::Raise, .amount = 30});
    ASSERT_FALSE(t.rejection.has_value());
    EXPECT_EQ(t.model.tx_id, loaded.tx_id + 1);

    auto const names = CommandNames(t.commands);
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "PlaySound");
    EXPECT_EQ(names[1], "Animate");
    EXPECT_EQ(names[2], "ApplyToEngine");
    EXPECT_EQ(names[3], "ScheduleTimer");

    auto const& timer = std::get<cmd::ScheduleTimer>(t.commands[3]);
    EXPECT_EQ(timer.delay, 0ms);
    ASSERT_TRUE(std::holds_alternative<msg::AnimationFinished>(timer.message));

    // the timer's own message brings the wait back to None
    Model const after = Step(t.model, timer.message);
    EXPECT_EQ(after.waiting_for, WaitingFor::None);
}

TEST(Reducer, IllegalActionRejected_ModelUntouched)
{
    HandData h = HeadsUpHand();
    h.legal = {ActionKind::Check, ActionKind::Call};
    Model const m = Step(MakeInitialModel(Config{}), Load(std::move(h), SessionMode::Practice));
    ASSERT_EQ(m.to_act_seat, std::optional<SeatIdxT>{0});

    Transition const t = Update(m, msg::UserChose{.kind = ActionKind::Raise, .amount = 50});

    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::IllegalAction);
    EXPECT_EQ(t.model, m);
    EXPECT_TRUE(t.commands.empty());
}

TEST(Reducer, UserChose_OutsideHumanDecisionRejected)
{
    Model m = LoadedLive();
    m = Step(m, msg::UserChose{.kind = ActionKind::Call, .amount = 5});
    ASSERT_EQ(m.waiting_for, WaitingFor::Animation);

    Transition const t = Update(m, msg::UserChose{.kind = ActionKind::Fold});
    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::WrongWaitState);
    EXPECT_EQ(t.model, m);
}

TEST(Reducer, UserChose_ForBotSeatRejectedInPractice)
{
    Model const m = LoadedLive();
    Transition const t = Update(m, msg::UserChose{.kind = ActionKind::Call, .amount = 5, .seat = 1});
    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::WrongActor);
}

TEST(Reducer, Advance_DuringAnimationRejected)
{
    Model const m = Step(LoadedLive(), msg::UserChose{.kind = ActionKind::Call, .amount = 5});
    Transition const t = Update(m, msg::AdvanceRequested{});
    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::WrongWaitState);
}

TEST(Reducer, StaleAnimationTokenIgnored)
{
    Model const m = Step(LoadedLive(), msg::UserChose{.kind = ActionKind::Call, .amount = 5});

    Transition const stale = Update(m, msg::AnimationFinished{.token = m.tx_id - 1});
    ASSERT_TRUE(stale.rejection.has_value());
    EXPECT_EQ(stale.rejection->code, error::RejectionCode::StaleToken);
    EXPECT_EQ(stale.model, m);

    Model const done = Step(m, msg::AnimationFinished{.token = m.tx_id});
    EXPECT_EQ(done.waiting_for, WaitingFor::None);
    // engine feedback still outstanding: nothing new is asked for
    EXPECT_TRUE(done.engine_pending);
}

TEST(Reducer, EngineFeedbackWithoutRequestRejected)
{
    Model const m = LoadedLive();
    Transition const t = Update(m, msg::ActionApplied{
        .action = {.seat = 0, .kind = ActionKind::Call, .amount = 5, .street = Street::Preflop},
        .table = {.seats = m.seats, .pot = 0, .to_act = 1}
    });
    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::EngineIdle);
}

TEST(Reducer, ActionApplied_HandsTurnToBotWhenAutoplay)
{
    Model m = LoadedLive();
    m.autoplay_on = true;
    m = Step(m, msg::UserChose{.kind = ActionKind::Call, .amount = 5});
    m = Step(m, msg::AnimationFinished{.token = m.tx_id});

    SeatMap seats = *m.seats;
    seats.at(0).stack = 990;
    seats.at(0).chips_in_front = 10;
    Transition const t = Update(m, msg::ActionApplied{
        .action = {.seat = 0, .kind = ActionKind::Call, .amount = 5, .street = Street::Preflop},
        .table = {.seats = Frozen<SeatMap>{seats}, .pot = 0, .to_act = 1}
    });

    ASSERT_FALSE(t.rejection.has_value());
    EXPECT_FALSE(t.model.engine_pending);
    EXPECT_EQ(t.model.to_act_seat, std::optional<SeatIdxT>{1});
    EXPECT_TRUE(t.model.seats->at(1).acting);
    EXPECT_FALSE(t.model.seats->at(0).acting);
    auto const* timer = Find<cmd::ScheduleTimer>(t.commands);
    ASSERT_NE(timer, nullptr);
    EXPECT_EQ(timer->delay, m.step_delay);
    EXPECT_TRUE(std::holds_alternative<msg::AdvanceRequested>(timer->message));
}

TEST(Reducer, Advance_AsksBotForDecision)
{
    Model m = LoadedLive();
    m.waiting_for = WaitingFor::None;
    m.legal_actions = {};
    m.to_act_seat = 1;
    m.seats = WithActing(m.seats, m.to_act_seat);

    Transition const t = Update(m, msg::AdvanceRequested{});
    ASSERT_FALSE(t.rejection.has_value());
    EXPECT_EQ(t.model.waiting_for, WaitingFor::BotDecision);
    auto const* ask = Find<cmd::AskDriverForDecision>(t.commands);
    ASSERT_NE(ask, nullptr);
    EXPECT_EQ(ask->seat, 1);
    EXPECT_EQ(ask->purpose, DecisionPurpose::Decide);

    // a decision for another seat is not accepted
    Transition const wrong = Update(t.model, msg::DecisionReady{.seat = 0, .decision = {.kind = ActionKind::Fold}});
    ASSERT_TRUE(wrong.rejection.has_value());
    EXPECT_EQ(wrong.rejection->code, error::RejectionCode::WrongActor);
}

TEST(Reducer, Advance_DuringBotDecisionAsksAgain)
{
    Model m = LoadedLive();
    m.waiting_for = WaitingFor::None;
    m.legal_actions = {};
    m.to_act_seat = 1;
    m.seats = WithActing(m.seats, m.to_act_seat);
    Model const asked = Step(m, msg::AdvanceRequested{});
    ASSERT_EQ(asked.waiting_for, WaitingFor::BotDecision);

    Transition const retry = Update(asked, msg::AdvanceRequested{});
    ASSERT_FALSE(retry.rejection.has_value());
    EXPECT_EQ(retry.model.waiting_for, WaitingFor::BotDecision);
    EXPECT_EQ(retry.model.to_act_seat, std::optional<SeatIdxT>{1});
    auto const* ask = Find<cmd::AskDriverForDecision>(retry.commands);
    ASSERT_NE(ask, nullptr);
    EXPECT_EQ(ask->seat, 1);
    EXPECT_EQ(ask->purpose, DecisionPurpose::Decide);

    // the first answer wins; the one to the repeated ask arrives too late
    Model const decided = Step(retry.model, msg::DecisionReady{.seat = 1, .decision = {.kind = ActionKind::Check}});
    EXPECT_EQ(decided.waiting_for, WaitingFor::Animation);
    EXPECT_EQ(decided.tx_id, asked.tx_id + 1);

    Transition const late = Update(decided, msg::DecisionReady{.seat = 1, .decision = {.kind = ActionKind::Check}});
    ASSERT_TRUE(late.rejection.has_value());
    EXPECT_EQ(late.rejection->code, error::RejectionCode::WrongWaitState);
    EXPECT_EQ(late.model, decided);
    EXPECT_TRUE(late.commands.empty());
}

TEST(Reducer, ScheduledAdvanceDroppedOnceOvertaken)
{
    Model m = LoadedLive();
    m.autoplay_on = true;
    m.waiting_for = WaitingFor::None;
    m.legal_actions = {};
    m.to_act_seat = 1;
    m.seats = WithActing(m.seats, m.to_act_seat);

    msg::AdvanceRequested const step{.scheduled_at = m.tx_id, .autoplay = true};
    EXPECT_EQ(Step(m, step).waiting_for, WaitingFor::BotDecision);

    Model moved_on = m;
    ++moved_on.tx_id;
    Transition const stale = Update(moved_on, step);
    ASSERT_TRUE(stale.rejection.has_value());
    EXPECT_EQ(stale.rejection->code, error::RejectionCode::StaleToken);

    Model const stopped = Step(m, msg::ToggleAutoplay{.on = false});
    Transition const off = Update(stopped, step);
    ASSERT_TRUE(off.rejection.has_value());
    EXPECT_EQ(off.rejection->code, error::RejectionCode::AutoplayStopped);
    EXPECT_TRUE(off.commands.empty());

    // an engine step after a dealt street does not depend on autoplay
    msg::AdvanceRequested const deal_step{.scheduled_at = m.tx_id, .autoplay = false};
    EXPECT_EQ(Step(stopped, deal_step).waiting_for, WaitingFor::BotDecision);

    // a bot already asked is not asked again by a timer
    Model const asked = Step(m, msg::AdvanceRequested{});
    Transition const repeat = Update(asked, step);
    ASSERT_TRUE(repeat.rejection.has_value());
    EXPECT_EQ(repeat.rejection->code, error::RejectionCode::WrongWaitState);
}

TEST(Reducer, Advance_ClosedRoundContinuesEngine)
{
    Model m = LoadedLive();
    m.waiting_for = WaitingFor::None;
    m.legal_actions = {};
    m.to_act_seat.reset();
    m.seats = WithActing(m.seats, std::nullopt);

    Transition const t = Update(m, msg::AdvanceRequested{});
    ASSERT_FALSE(t.rejection.has_value());
    EXPECT_TRUE(t.model.engine_pending);
    ASSERT_EQ(t.commands.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<cmd::ApplyContinue>(t.commands[0]));
}

TEST(Reducer, StreetAdvanced_ChecksBoardAndDirection)
{
    Model m = LoadedLive();
    m.engine_pending = true;
    m.waiting_for = WaitingFor::None;

    Transition const bad_board = Update(m, msg::StreetAdvanced{
        .street = Street::Flop, .board = Frozen<Board>{Board{"Qh", "7c"}}, .table = {.seats = m.seats}
    });
    ASSERT_TRUE(bad_board.rejection.has_value());
    EXPECT_EQ(bad_board.rejection->code, error::RejectionCode::BoardMismatch);

    Transition const ok = Update(m, msg::StreetAdvanced{
        .street = Street::Flop, .board = Frozen<Board>{Board{"Qh", "7c", "2d"}},
        .table = {.seats = m.seats, .pot = 60, .to_act = 1}
    });
    ASSERT_FALSE(ok.rejection.has_value());
    EXPECT_EQ(ok.model.street, Street::Flop);
    EXPECT_EQ(ok.model.board->size(), 3u);
    EXPECT_EQ(ok.model.pot, 60);
    EXPECT_NE(Find<cmd::Speak>(ok.commands), nullptr);

    Model back = ok.model;
    back.engine_pending = true;
    Transition const regress = Update(back, msg::StreetAdvanced{
        .street = Street::Flop, .board = Frozen<Board>{Board{"Qh", "7c", "2d"}}, .table = {.seats = m.seats}
    });
    ASSERT_TRUE(regress.rejection.has_value());
    EXPECT_EQ(regress.rejection->code, error::RejectionCode::StreetRegression);
}

TEST(Reducer, HandFinished_AnnouncesWinnerAndSchedulesBannerExpiry)
{
    Model m = Step(LoadedLive(), msg::UserChose{.kind = ActionKind::Fold});
    m = Step(m, msg::AnimationFinished{.token = m.tx_id});

    Transition const t = Update(m, msg::HandFinished{
        .payouts = {Payout{.seat = 1, .amount = 15, .description = "uncontested"}},
        .table = {.seats = m.seats, .pot = 0, .to_act = std::nullopt},
        .final_action = ActionRecord{.seat = 0, .kind = ActionKind::Fold, .street = Street::Preflop}
    });

    ASSERT_FALSE(t.rejection.has_value());
    EXPECT_EQ(t.model.street, Street::Done);
    EXPECT_FALSE(t.model.to_act_seat.has_value());
    ASSERT_EQ(t.model.banners->size(), 1u);
    EXPECT_EQ(t.model.banners->front().style, "winner");
    EXPECT_EQ(t.model.banners->front().ttl, constants::BannerTtl);

    auto const names = CommandNames(t.commands);
    EXPECT_EQ(names.front(), "PlaySound");
    EXPECT_EQ(std::get<cmd::PlaySound>(t.commands.front()).sound, "FOLD");
    auto const* speak = Find<cmd::Speak>(t.commands);
    ASSERT_NE(speak, nullptr);
    EXPECT_EQ(speak->text, "Villain wins 15");

    auto const* timer = Find<cmd::ScheduleTimer>(t.commands);
    ASSERT_NE(timer, nullptr);
    EXPECT_EQ(timer->delay, constants::BannerTtl);

    Model const expired = Step(t.model, timer->message);
    EXPECT_TRUE(expired.banners->empty());

    // a second expiry for the same banner changes nothing
    Transition const again = Update(expired, timer->message);
    EXPECT_FALSE(again.rejection.has_value());
    EXPECT_EQ(again.model, expired);

    Transition const advance = Update(t.model, msg::AdvanceRequested{});
    ASSERT_TRUE(advance.rejection.has_value());
    EXPECT_EQ(advance.rejection->code, error::RejectionCode::HandOver);
}

TEST(Reducer, EngineRejected_ShowsErrorBannerAndReturnsTurn)
{
    Model const m = Step(Step(LoadedLive(), msg::UserChose{.kind = ActionKind::Raise, .amount = 15}),
                         msg::AnimationFinished{.token = 2});
    ASSERT_EQ(m.tx_id, 2u);

    Transition const t = Update(m, msg::EngineRejected{.seat = 0, .reason = "bet below minimum"});
    ASSERT_FALSE(t.rejection.has_value());
    EXPECT_FALSE(t.model.engine_pending);
    ASSERT_EQ(t.model.banners->size(), 1u);
    EXPECT_EQ(t.model.banners->front().style, "error");
    EXPECT_EQ(t.model.waiting_for, WaitingFor::HumanDecision);
}

TEST(Reducer, SeekClampsToLastPosition)
{
    Model const m = LoadedReplay(9);
    ASSERT_EQ(m.review_length, 10u);

    Transition const t = Update(m, msg::SeekReview{.index = 999});
    ASSERT_FALSE(t.rejection.has_value());
    EXPECT_EQ(t.model.review_cursor, 9u);
    EXPECT_TRUE(t.model.review_paused);
    auto const* reposition = Find<cmd::RepositionReplay>(t.commands);
    ASSERT_NE(reposition, nullptr);
    EXPECT_EQ(reposition->cursor, 9u);

    Model const low = Step(t.model, msg::SeekReview{.index = -4});
    EXPECT_EQ(low.review_cursor, 0u);

    Model const back = Step(t.model, msg::StepBack{});
    EXPECT_EQ(back.review_cursor, 8u);
}

TEST(Reducer, SeekToCurrentPositionIsNoop)
{
    Model const m = LoadedReplay(9);
    Transition const t = Update(m, msg::SeekReview{.index = 0});
    EXPECT_FALSE(t.rejection.has_value());
    EXPECT_EQ(t.model, m);
    EXPECT_TRUE(t.commands.empty());
}

TEST(Reducer, ReviewMessagesRejectedOutsideReplay)
{
    Model const m = LoadedLive();
    std::vector<Msg> const review{msg::SeekReview{.index = 3}, msg::StepBack{}, msg::SetReviewPaused{.paused = true}};
    for (Msg const& r : review)
    {
        Transition const t = Update(m, r);
        ASSERT_TRUE(t.rejection.has_value()) << NameOf(r);
        EXPECT_EQ(t.rejection->code, error::RejectionCode::NotReplayMode);
        EXPECT_EQ(t.model, m);
    }
}

TEST(Reducer, ScriptedEventForWrongStepRejected)
{
    Model const m = LoadedReplay(6);
    Transition const t = Update(m, msg::ActionApplied{
        .action = {.seat = 0, .kind = ActionKind::Raise, .amount = 30, .street = Street::Preflop},
        .table = {.seats = m.seats},
        .step = 3
    });
    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::StaleScriptStep);
}

TEST(Reducer, ReplayAdvanceFetchesAtCursorUntilExhausted)
{
    Model m = LoadedReplay(1);
    Transition const t = Update(m, msg::AdvanceRequested{});
    ASSERT_FALSE(t.rejection.has_value());
    auto const* fetch = Find<cmd::FetchScriptedEvent>(t.commands);
    ASSERT_NE(fetch, nullptr);
    EXPECT_EQ(fetch->index, 0u);

    m = Step(m, msg::ActionApplied{
        .action = {.seat = 0, .kind = ActionKind::Raise, .amount = 30, .street = Street::Preflop},
        .table = {.seats = m.seats, .pot = 0, .to_act = 1},
        .step = 0
    });
    EXPECT_EQ(m.review_cursor, 1u);
    m = Step(m, msg::AnimationFinished{.token = m.tx_id});

    Transition const end = Update(m, msg::AdvanceRequested{});
    ASSERT_TRUE(end.rejection.has_value());
    EXPECT_EQ(end.rejection->code, error::RejectionCode::ScriptExhausted);
}

TEST(Reducer, ToggleAutoplayResumesReplay)
{
    Model m = LoadedReplay(6);
    m.review_paused = true;
    Transition const t = Update(m, msg::ToggleAutoplay{.on = true});
    EXPECT_TRUE(t.model.autoplay_on);
    EXPECT_FALSE(t.model.review_paused);
    auto const* timer = Find<cmd::ScheduleTimer>(t.commands);
    ASSERT_NE(timer, nullptr);
    EXPECT_TRUE(std::holds_alternative<msg::AdvanceRequested>(timer->message));
}

TEST(Reducer, ReplayAutoplaySkipsRecordedDecisionPoint)
{
    Model m = Step(MakeInitialModel(Config{}), Load(HeadsUpHand(), SessionMode::Replay));
    m = Step(m, msg::ScriptLoaded{.hand_id = "hu-1", .count = 6});
    ASSERT_EQ(m.waiting_for, WaitingFor::HumanDecision);

    Transition const on = Update(m, msg::ToggleAutoplay{.on = true});
    auto const* timer = Find<cmd::ScheduleTimer>(on.commands);
    ASSERT_NE(timer, nullptr);
    EXPECT_EQ(timer->delay, m.step_delay);
    EXPECT_EQ(timer->message, (Msg{msg::AdvanceRequested{.scheduled_at = m.tx_id, .autoplay = true}}));

    Transition const fired = Update(on.model, timer->message);
    ASSERT_FALSE(fired.rejection.has_value());
    EXPECT_EQ(fired.model.waiting_for, WaitingFor::None);
    auto const* fetch = Find<cmd::FetchScriptedEvent>(fired.commands);
    ASSERT_NE(fetch, nullptr);
    EXPECT_EQ(fetch->index, 0u);
}

TEST(Reducer, ScriptedStreetSchedulesNextStepOnlyUnderAutoplay)
{
    Model m = LoadedReplay(6);
    m.review_cursor = 2;
    msg::StreetAdvanced const flop{
        .street = Street::Flop, .board = Frozen<Board>{Board{"Qh", "7c", "2d"}},
        .table = {.seats = m.seats, .pot = 60, .to_act = 1},
        .step = 2
    };

    Transition const manual = Update(m, flop);
    ASSERT_FALSE(manual.rejection.has_value());
    EXPECT_EQ(manual.model.review_cursor, 3u);
    EXPECT_EQ(Find<cmd::ScheduleTimer>(manual.commands), nullptr);

    m.autoplay_on = true;
    Transition const playing = Update(m, flop);
    ASSERT_FALSE(playing.rejection.has_value());
    auto const* timer = Find<cmd::ScheduleTimer>(playing.commands);
    ASSERT_NE(timer, nullptr);
    EXPECT_EQ(timer->message, (Msg{msg::AdvanceRequested{.scheduled_at = playing.model.tx_id, .autoplay = true}}));

    m.review_paused = true;
    EXPECT_EQ(Find<cmd::ScheduleTimer>(Update(m, flop).commands), nullptr);
}

TEST(Reducer, StepDelayHasFloor)
{
    Model const m = Step(MakeInitialModel(Config{}), msg::SetStepDelay{.delay = 5ms});
    EXPECT_EQ(m.step_delay, constants::MinStepDelay);
    Model const slow = Step(m, msg::SetStepDelay{.delay = 1500ms});
    EXPECT_EQ(slow.step_delay, 1500ms);
}

TEST(Reducer, ResetWithoutHandRejected)
{
    Transition const t = Update(MakeInitialModel(Config{}), msg::ResetHand{});
    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::NoHandLoaded);
}

TEST(Reducer, ResetReloadsSourceHand)
{
    Model m = Step(LoadedLive(), msg::UserChose{.kind = ActionKind::Call, .amount = 5});
    Model const reset = Step(m, msg::ResetHand{});
    EXPECT_EQ(reset.hand_id, "hu-1");
    EXPECT_EQ(reset.waiting_for, WaitingFor::HumanDecision);
    EXPECT_FALSE(reset.last_action.has_value());
    EXPECT_FALSE(reset.engine_pending);
    EXPECT_GT(reset.tx_id, m.tx_id);
}

TEST(Reducer, AdvisoryTurnRequestsHint)
{
    Transition const t = Update(MakeInitialModel(Config{}), Load(HeadsUpHand(), SessionMode::Advisory));
    auto const* ask = Find<cmd::AskDriverForDecision>(t.commands);
    ASSERT_NE(ask, nullptr);
    EXPECT_EQ(ask->purpose, DecisionPurpose::Hint);
    EXPECT_EQ(ask->seat, 0);

    Model const hinted = Step(t.model, msg::HintReady{
        .seat = 0, .decision = {.kind = ActionKind::Call, .amount = 5, .frequency = 0.7, .rationale = "odds"}
    });
    ASSERT_TRUE(hinted.hint.has_value());
    EXPECT_EQ(hinted.hint->action, ActionKind::Call);
    EXPECT_DOUBLE_EQ(hinted.hint->frequency, 0.7);

    // the hint goes away once the user acts
    Model const acted = Step(hinted, msg::UserChose{.kind = ActionKind::Call, .amount = 5});
    EXPECT_FALSE(acted.hint.has_value());
}

TEST(Reducer, HintOutsideAdvisoryRejected)
{
    Transition const t = Update(LoadedLive(), msg::HintReady{.seat = 0, .decision = {.kind = ActionKind::Call}});
    ASSERT_TRUE(t.rejection.has_value());
    EXPECT_EQ(t.rejection->code, error::RejectionCode::WrongWaitState);
}
