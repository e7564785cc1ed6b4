#include <gtest/gtest.h>
#include <array>
#include <chrono>
#include <cstddef>
#include <span>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Messages.hpp"
#include "../core/Props.hpp"
#include "../net/codec.hpp"
#include "Fixtures.hpp"

using namespace pokerpro::core;
using namespace pokerpro::core::fixtures;
using pokerpro::core::net::AsBytes;
using pokerpro::core::net::BuildError;
using pokerpro::core::net::BuildIntent;
using pokerpro::core::net::BuildProps;
using pokerpro::core::net::DecodeIntent;
using pokerpro::core::net::DecodeProps;

namespace fb = pokerpro::gen::net;

namespace
{
    auto RoundTrip(Msg const& intent) -> Msg
    {
        flatbuffers::DetachedBuffer const buf = BuildIntent(intent, 7);
        auto decoded = DecodeIntent(AsBytes(buf));
        EXPECT_TRUE(decoded.has_value()) << NameOf(intent) << ": " << decoded.error().message;
        return decoded.value_or(Msg{msg::AdvanceRequested{}});
    }

    // IntentMsg{LoadHand} whose hand table was never written
    auto MakeHandlessLoadFB(uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        flatbuffers::Offset<fb::Intent_LoadHand> load = fb::CreateIntent_LoadHand(fbb, 0, fb::SessionMode::Replay);
        flatbuffers::Offset<fb::IntentMsg> im = fb::CreateIntentMsg(fbb, msg_id, fb::Intent::Intent_LoadHand, load.Union());
        flatbuffers::Offset<fb::Envelope> env = fb::CreateEnvelope(fbb, fb::Message::IntentMsg, im.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    auto SampleProps() -> TableProps
    {
        HandData const hand = HeadsUpHand();
        return TableProps{
            .hand_id = hand.hand_id,
            .street = Street::Flop,
            .seats = WithActing(Frozen<SeatMap>{hand.seats}, 1),
            .board = Frozen<Board>{Board{"Qh", "7c", "2d"}},
            .pot = 60,
            .to_act_seat = 1,
            .legal_actions = {ActionKind::Check, ActionKind::Bet},
            .last_action = ActionRecord{.seat = 1, .kind = ActionKind::Call, .amount = 20, .street = Street::Preflop},
            .banners = Frozen<Banners>{Banners{
                Banner{.id = 3, .text = "Villain calls", .style = "info", .ttl = std::chrono::milliseconds{2000}}
            }},
            .theme_id = "forest-green-pro",
            .autoplay_on = true,
            .waiting_for = WaitingFor::HumanDecision,
            .review_cursor = 0,
            .review_length = 0,
            .review_paused = false,
            .session_mode = SessionMode::Advisory,
            .hint = Hint{.seat = 1, .action = ActionKind::Check, .amount = 0, .frequency = 0.75, .rationale = "pot control"}
        };
    }
} // namespace

// ================== TESTS ==================

TEST(CodecIntents, EveryIntentSurvivesTheWire)
{
    std::vector<Msg> const intents{
        msg::AdvanceRequested{},
        msg::ToggleAutoplay{.on = true},
        msg::UserChose{.kind = ActionKind::Raise, .amount = 120, .seat = 3},
        msg::UserChose{.kind = ActionKind::Fold, .amount = 0, .seat = std::nullopt},
        msg::SeekReview{.index = -4},
        msg::StepBack{},
        msg::SetReviewPaused{.paused = true},
        msg::SetStepDelay{.delay = std::chrono::milliseconds{750}},
        msg::ResetHand{},
        msg::ThemeChanged{.theme_id = "midnight"},
    };

    for (Msg const& intent : intents)
    {
        Msg const back = RoundTrip(intent);
        EXPECT_EQ(back.index(), intent.index()) << NameOf(intent);
        EXPECT_TRUE(back == intent) << NameOf(intent);
    }
}

TEST(CodecIntents, LoadHandCarriesTheWholeHand)
{
    for (HandData const& hand : {HeadsUpHand(), ShowdownHand()})
    {
        Msg const back = RoundTrip(Load(hand, SessionMode::Replay));
        ASSERT_TRUE(std::holds_alternative<msg::LoadHand>(back));
        auto const& load = std::get<msg::LoadHand>(back);
        EXPECT_EQ(load.mode, SessionMode::Replay);
        EXPECT_TRUE(*load.hand == hand) << hand.hand_id;
        EXPECT_EQ(load.hand->hero_seat, hand.hero_seat);
        EXPECT_EQ(load.hand->actions.size(), hand.actions.size());
    }
}

TEST(CodecIntents, LoadHandWithoutHandIsRejected)
{
    flatbuffers::DetachedBuffer const buf = MakeHandlessLoadFB(9);
    auto const decoded = DecodeIntent(AsBytes(buf));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().message, "LoadHand without a hand");
}

TEST(CodecIntents, GarbageIsRejected)
{
    std::array<std::byte, 3> const tiny{std::byte{1}, std::byte{2}, std::byte{3}};
    EXPECT_FALSE(DecodeIntent(tiny).has_value());

    std::array<std::byte, 64> noise{};
    noise.fill(std::byte{0xAB});
    auto const decoded = DecodeIntent(noise);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().message, "verification failed");

    EXPECT_FALSE(DecodeIntent(std::span<std::byte const>{}).has_value());
}

TEST(CodecIntents, OutboundFramesAreNotIntents)
{
    flatbuffers::DetachedBuffer const props = BuildProps(SampleProps(), 1);
    auto const as_intent = DecodeIntent(AsBytes(props));
    ASSERT_FALSE(as_intent.has_value());
    EXPECT_EQ(as_intent.error().message, "not an IntentMsg");

    flatbuffers::DetachedBuffer const err = BuildError("nope", 2);
    EXPECT_FALSE(DecodeIntent(AsBytes(err)).has_value());
    EXPECT_FALSE(DecodeProps(AsBytes(err)).has_value());
}

TEST(CodecIntents, InternalMessagesCannotBeSent)
{
    EXPECT_THROW(BuildIntent(msg::AnimationFinished{.token = 4}, 1), error::SerializationError);
    EXPECT_THROW(BuildIntent(msg::BannerExpired{.id = 2}, 1), error::SerializationError);
    EXPECT_THROW(BuildIntent(msg::EngineRejected{.seat = 0, .reason = "x"}, 1), error::SerializationError);
}

TEST(CodecProps, FrameCarriesEveryField)
{
    TableProps const props = SampleProps();
    flatbuffers::DetachedBuffer const buf = BuildProps(props, 42);

    auto const decoded = DecodeProps(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->msg_id, 42u);
    EXPECT_TRUE(decoded->props == props);
    EXPECT_EQ(decoded->props.seats->at(1).name, "Villain");
    EXPECT_TRUE(decoded->props.seats->at(1).acting);
    ASSERT_TRUE(decoded->props.hint.has_value());
    EXPECT_EQ(decoded->props.hint->rationale, "pot control");
}

TEST(CodecProps, EmptyTableHasNoOptionalParts)
{
    TableProps const props = TableProps::FromModel(MakeInitialModel(Config{.seed = 1}));
    flatbuffers::DetachedBuffer const buf = BuildProps(props, 5);

    auto const decoded = DecodeProps(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_TRUE(decoded->props == props);
    EXPECT_FALSE(decoded->props.to_act_seat.has_value());
    EXPECT_FALSE(decoded->props.last_action.has_value());
    EXPECT_FALSE(decoded->props.hint.has_value());
    EXPECT_EQ(decoded->props.waiting_for, WaitingFor::None);
}
