//
// codec.cpp
//
#include "codec.hpp"

#include <format>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace fb = pokerpro::gen::net;

namespace pokerpro::core::net
{
    auto ToFbStreet(Street s) noexcept -> fb::Street
    {
        switch (s)
        {
        case Street::Preflop: return fb::Street::Preflop;
        case Street::Flop: return fb::Street::Flop;
        case Street::Turn: return fb::Street::Turn;
        case Street::River: return fb::Street::River;
        case Street::Showdown: return fb::Street::Showdown;
        case Street::Done: return fb::Street::Done;
        }
        return fb::Street::Preflop;
    }

    auto FromFbStreet(fb::Street s) noexcept -> Street
    {
        switch (s)
        {
        case fb::Street::Preflop: return Street::Preflop;
        case fb::Street::Flop: return Street::Flop;
        case fb::Street::Turn: return Street::Turn;
        case fb::Street::River: return Street::River;
        case fb::Street::Showdown: return Street::Showdown;
        case fb::Street::Done: return Street::Done;
        }
        return Street::Preflop;
    }

    auto ToFbMode(SessionMode m) noexcept -> fb::SessionMode
    {
        switch (m)
        {
        case SessionMode::Practice: return fb::SessionMode::Practice;
        case SessionMode::Advisory: return fb::SessionMode::Advisory;
        case SessionMode::Replay: return fb::SessionMode::Replay;
        }
        return fb::SessionMode::Practice;
    }

    auto FromFbMode(fb::SessionMode m) noexcept -> SessionMode
    {
        switch (m)
        {
        case fb::SessionMode::Practice: return SessionMode::Practice;
        case fb::SessionMode::Advisory: return SessionMode::Advisory;
        case fb::SessionMode::Replay: return SessionMode::Replay;
        }
        return SessionMode::Practice;
    }

    auto ToFbWaiting(WaitingFor w) noexcept -> fb::WaitingFor
    {
        switch (w)
        {
        case WaitingFor::None: return fb::WaitingFor::Idle;
        case WaitingFor::HumanDecision: return fb::WaitingFor::HumanDecision;
        case WaitingFor::BotDecision: return fb::WaitingFor::BotDecision;
        case WaitingFor::Animation: return fb::WaitingFor::Animation;
        }
        return fb::WaitingFor::Idle;
    }

    auto FromFbWaiting(fb::WaitingFor w) noexcept -> WaitingFor
    {
        switch (w)
        {
        case fb::WaitingFor::Idle: return WaitingFor::None;
        case fb::WaitingFor::HumanDecision: return WaitingFor::HumanDecision;
        case fb::WaitingFor::BotDecision: return WaitingFor::BotDecision;
        case fb::WaitingFor::Animation: return WaitingFor::Animation;
        }
        return WaitingFor::None;
    }

    auto ToFbKind(ActionKind k) noexcept -> fb::ActionKind
    {
        switch (k)
        {
        case ActionKind::Fold: return fb::ActionKind::Fold;
        case ActionKind::Check: return fb::ActionKind::Check;
        case ActionKind::Call: return fb::ActionKind::Call;
        case ActionKind::Bet: return fb::ActionKind::Bet;
        case ActionKind::Raise: return fb::ActionKind::Raise;
        }
        return fb::ActionKind::Fold;
    }

    auto FromFbKind(fb::ActionKind k) noexcept -> ActionKind
    {
        switch (k)
        {
        case fb::ActionKind::Fold: return ActionKind::Fold;
        case fb::ActionKind::Check: return ActionKind::Check;
        case fb::ActionKind::Call: return ActionKind::Call;
        case fb::ActionKind::Bet: return ActionKind::Bet;
        case fb::ActionKind::Raise: return ActionKind::Raise;
        }
        return ActionKind::Fold;
    }
}

namespace
{
    using namespace pokerpro::core;
    using pokerpro::core::net::ParseError;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)Street::Done == (int)fb::Street::Done);
    static_assert((int)SessionMode::Replay == (int)fb::SessionMode::Replay);
    static_assert((int)WaitingFor::Animation == (int)fb::WaitingFor::Animation);
    static_assert((int)ActionKind::Raise == (int)fb::ActionKind::Raise);

    using StringVec = flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>>;

    auto ReadStrings(StringVec const* v) -> std::vector<std::string>
    {
        std::vector<std::string> out;
        if (!v)
        {
            return out;
        }
        out.reserve(v->size());
        for (auto const* s : *v)
        {
            out.push_back(s ? s->str() : std::string{});
        }
        return out;
    }

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    auto WriteSeats(flatbuffers::FlatBufferBuilder& fbb, SeatMap const& seats)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::Seat>>>
    {
        std::vector<flatbuffers::Offset<fb::Seat>> out;
        out.reserve(seats.size());
        for (auto const& [idx, s] : seats)
        {
            out.push_back(fb::CreateSeat(
                fbb,
                /*index*/ idx,
                /*player_uid*/ fbb.CreateString(s.player_uid),
                /*name*/ fbb.CreateString(s.name),
                /*stack*/ s.stack,
                /*chips_in_front*/ s.chips_in_front,
                /*folded*/ s.folded,
                /*all_in*/ s.all_in,
                /*cards*/ fbb.CreateVectorOfStrings(s.cards),
                /*position*/ s.position,
                /*acting*/ s.acting
            ));
        }
        return fbb.CreateVector(out);
    }

    auto ReadSeats(flatbuffers::Vector<flatbuffers::Offset<fb::Seat>> const* v)
        -> std::expected<SeatMap, ParseError>
    {
        SeatMap out;
        if (!v)
        {
            return out;
        }
        for (auto const* s : *v)
        {
            SeatState seat{
                .player_uid = Str(s->player_uid()),
                .name = Str(s->name()),
                .stack = s->stack(),
                .chips_in_front = s->chips_in_front(),
                .folded = s->folded(),
                .all_in = s->all_in(),
                .cards = ReadStrings(s->cards()),
                .position = s->position(),
                .acting = s->acting()
            };
            if (!out.emplace(s->index(), std::move(seat)).second)
            {
                return std::unexpected(ParseError{std::format("duplicate seat {}", static_cast<int>(s->index()))});
            }
        }
        return out;
    }

    auto WriteAction(flatbuffers::FlatBufferBuilder& fbb, ActionRecord const& a) -> flatbuffers::Offset<fb::ActionEntry>
    {
        return fb::CreateActionEntry(fbb, a.seat, net::ToFbKind(a.kind), a.amount, net::ToFbStreet(a.street));
    }

    auto ReadAction(fb::ActionEntry const* a) -> ActionRecord
    {
        return ActionRecord{
            .seat = a->seat(),
            .kind = net::FromFbKind(a->kind()),
            .amount = a->amount(),
            .street = net::FromFbStreet(a->street())
        };
    }

    auto WriteHand(flatbuffers::FlatBufferBuilder& fbb, HandData const& h) -> flatbuffers::Offset<fb::HandRecord>
    {
        auto const id = fbb.CreateString(h.hand_id);
        auto const seats = WriteSeats(fbb, h.seats);
        auto const board = fbb.CreateVectorOfStrings(h.board);
        auto const runout = fbb.CreateVectorOfStrings(h.runout);
        std::vector<flatbuffers::Offset<fb::ActionEntry>> acts;
        acts.reserve(h.actions.size());
        for (ActionRecord const& a : h.actions)
        {
            acts.push_back(WriteAction(fbb, a));
        }
        auto const actions = fbb.CreateVector(acts);

        fb::HandRecordBuilder b(fbb);
        b.add_hand_id(id);
        b.add_seats(seats);
        b.add_board(board);
        b.add_runout(runout);
        b.add_pot(h.pot);
        b.add_has_to_act(h.to_act.has_value());
        b.add_to_act(h.to_act.value_or(0));
        b.add_legal_actions(h.legal.Bits());
        b.add_has_hero(h.hero_seat.has_value());
        b.add_hero_seat(h.hero_seat.value_or(0));
        b.add_button_seat(h.button_seat);
        b.add_small_blind(h.small_blind);
        b.add_big_blind(h.big_blind);
        b.add_actions(actions);
        return b.Finish();
    }

    auto ReadHand(fb::HandRecord const* h) -> std::expected<HandData, ParseError>
    {
        auto seats = ReadSeats(h->seats());
        if (!seats)
        {
            return std::unexpected(seats.error());
        }

        HandData out{
            .hand_id = Str(h->hand_id()),
            .seats = std::move(*seats),
            .board = ReadStrings(h->board()),
            .runout = ReadStrings(h->runout()),
            .pot = h->pot(),
            .to_act = h->has_to_act() ? std::optional<SeatIdxT>{h->to_act()} : std::nullopt,
            .legal = ActionSet::FromBits(h->legal_actions()),
            .hero_seat = h->has_hero() ? std::optional<SeatIdxT>{h->hero_seat()} : std::nullopt,
            .button_seat = h->button_seat(),
            .small_blind = h->small_blind(),
            .big_blind = h->big_blind(),
            .actions = {}
        };
        if (auto const* acts = h->actions())
        {
            out.actions.reserve(acts->size());
            for (auto const* a : *acts)
            {
                out.actions.push_back(ReadAction(a));
            }
        }
        return out;
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb, fb::Message type, flatbuffers::Offset<void> body)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }

    auto Open(std::span<std::byte const> bytes) -> std::expected<fb::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"verification failed"});

        return fb::GetEnvelope(data);
    }
} // anonymous

namespace pokerpro::core::net
{
    // ---------- Props (server → viewer) ----------

    auto BuildProps(TableProps const& p, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const hand_id = fbb.CreateString(p.hand_id);
        auto const seats = WriteSeats(fbb, *p.seats);
        auto const board = fbb.CreateVectorOfStrings(*p.board);

        flatbuffers::Offset<fb::ActionEntry> last{};
        if (p.last_action)
        {
            last = WriteAction(fbb, *p.last_action);
        }

        std::vector<flatbuffers::Offset<fb::Banner>> banners;
        banners.reserve(p.banners->size());
        for (Banner const& b : *p.banners)
        {
            banners.push_back(fb::CreateBanner(fbb, b.id, fbb.CreateString(b.text), fbb.CreateString(b.style),
                                               static_cast<uint32_t>(b.ttl.count())));
        }
        auto const banner_vec = fbb.CreateVector(banners);
        auto const theme = fbb.CreateString(p.theme_id);

        flatbuffers::Offset<fb::Hint> hint{};
        if (p.hint)
        {
            hint = fb::CreateHint(fbb, p.hint->seat, ToFbKind(p.hint->action), p.hint->amount, p.hint->frequency,
                                  fbb.CreateString(p.hint->rationale));
        }

        fb::PropsMsgBuilder b(fbb);
        b.add_msg_id(msg_id);
        b.add_hand_id(hand_id);
        b.add_street(ToFbStreet(p.street));
        b.add_seats(seats);
        b.add_board(board);
        b.add_pot(p.pot);
        b.add_has_to_act(p.to_act_seat.has_value());
        b.add_to_act(p.to_act_seat.value_or(0));
        b.add_legal_actions(p.legal_actions.Bits());
        if (p.last_action)
        {
            b.add_last_action(last);
        }
        b.add_banners(banner_vec);
        b.add_theme_id(theme);
        b.add_autoplay_on(p.autoplay_on);
        b.add_waiting_for(ToFbWaiting(p.waiting_for));
        b.add_review_cursor(p.review_cursor);
        b.add_review_length(p.review_length);
        b.add_review_paused(p.review_paused);
        b.add_session_mode(ToFbMode(p.session_mode));
        if (p.hint)
        {
            b.add_hint(hint);
        }
        auto const props = b.Finish();

        return Finish(fbb, fb::Message::PropsMsg, props.Union());
    }

    auto BuildError(std::string_view reason, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const em = fb::CreateErrorMsg(fbb, msg_id, fbb.CreateString(reason.data(), reason.size()));
        return Finish(fbb, fb::Message::ErrorMsg, em.Union());
    }

    // ---------- Intents (viewer → server) ----------

    auto BuildIntent(Msg const& intent, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        fb::Intent type = fb::Intent::NONE;
        flatbuffers::Offset<void> body{};

        std::visit(
            [&]<typename T0>(T0 const& v)
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, msg::AdvanceRequested>)
                {
                    type = fb::Intent::Intent_Advance;
                    body = fb::CreateIntent_Advance(fbb).Union();
                }
                else if constexpr (std::is_same_v<T, msg::ToggleAutoplay>)
                {
                    type = fb::Intent::Intent_ToggleAutoplay;
                    body = fb::CreateIntent_ToggleAutoplay(fbb, v.on).Union();
                }
                else if constexpr (std::is_same_v<T, msg::UserChose>)
                {
                    type = fb::Intent::Intent_UserChose;
                    body = fb::CreateIntent_UserChose(fbb, ToFbKind(v.kind), v.amount, v.seat.has_value(),
                                                      v.seat.value_or(0)).Union();
                }
                else if constexpr (std::is_same_v<T, msg::SeekReview>)
                {
                    type = fb::Intent::Intent_SeekReview;
                    body = fb::CreateIntent_SeekReview(fbb, v.index).Union();
                }
                else if constexpr (std::is_same_v<T, msg::StepBack>)
                {
                    type = fb::Intent::Intent_StepBack;
                    body = fb::CreateIntent_StepBack(fbb).Union();
                }
                else if constexpr (std::is_same_v<T, msg::SetReviewPaused>)
                {
                    type = fb::Intent::Intent_SetReviewPaused;
                    body = fb::CreateIntent_SetReviewPaused(fbb, v.paused).Union();
                }
                else if constexpr (std::is_same_v<T, msg::SetStepDelay>)
                {
                    type = fb::Intent::Intent_SetStepDelay;
                    body = fb::CreateIntent_SetStepDelay(fbb, static_cast<uint32_t>(v.delay.count())).Union();
                }
                else if constexpr (std::is_same_v<T, msg::LoadHand>)
                {
                    auto const hand = WriteHand(fbb, *v.hand);
                    type = fb::Intent::Intent_LoadHand;
                    body = fb::CreateIntent_LoadHand(fbb, hand, ToFbMode(v.mode)).Union();
                }
                else if constexpr (std::is_same_v<T, msg::ResetHand>)
                {
                    type = fb::Intent::Intent_ResetHand;
                    body = fb::CreateIntent_ResetHand(fbb).Union();
                }
                else if constexpr (std::is_same_v<T, msg::ThemeChanged>)
                {
                    type = fb::Intent::Intent_ThemeChanged;
                    body = fb::CreateIntent_ThemeChanged(fbb, fbb.CreateString(v.theme_id)).Union();
                }
                else
                {
                    PPR_THROW(error::Code::Serialization, std::format("{} is not a viewer intent", T::name));
                }
            },
            intent
        );

        auto const im = fb::CreateIntentMsg(fbb, msg_id, type, body);
        return Finish(fbb, fb::Message::IntentMsg, im.Union());
    }

    auto DecodeIntent(std::span<std::byte const> bytes) -> std::expected<Msg, ParseError>
    {
        auto const env = Open(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::IntentMsg)
            return std::unexpected(ParseError{"not an IntentMsg"});

        auto const* im = (*env)->message_as_IntentMsg();

        switch (im->intent_type())
        {
        case fb::Intent::Intent_Advance:
            return Msg{msg::AdvanceRequested{}};

        case fb::Intent::Intent_ToggleAutoplay:
            return Msg{msg::ToggleAutoplay{.on = im->intent_as_Intent_ToggleAutoplay()->on()}};

        case fb::Intent::Intent_UserChose:
        {
            auto const* u = im->intent_as_Intent_UserChose();
            return Msg{msg::UserChose{
                .kind = FromFbKind(u->kind()),
                .amount = u->amount(),
                .seat = u->has_seat() ? std::optional<SeatIdxT>{u->seat()} : std::nullopt
            }};
        }

        case fb::Intent::Intent_SeekReview:
            return Msg{msg::SeekReview{.index = im->intent_as_Intent_SeekReview()->index()}};

        case fb::Intent::Intent_StepBack:
            return Msg{msg::StepBack{}};

        case fb::Intent::Intent_SetReviewPaused:
            return Msg{msg::SetReviewPaused{.paused = im->intent_as_Intent_SetReviewPaused()->paused()}};

        case fb::Intent::Intent_SetStepDelay:
            return Msg{msg::SetStepDelay{
                .delay = std::chrono::milliseconds{im->intent_as_Intent_SetStepDelay()->delay_ms()}
            }};

        case fb::Intent::Intent_LoadHand:
        {
            auto const* l = im->intent_as_Intent_LoadHand();
            if (!l->hand())
                return std::unexpected(ParseError{"LoadHand without a hand"});
            auto hand = ReadHand(l->hand());
            if (!hand)
                return std::unexpected(hand.error());
            return Msg{msg::LoadHand{.hand = Frozen<HandData>{std::move(*hand)}, .mode = FromFbMode(l->mode())}};
        }

        case fb::Intent::Intent_ResetHand:
            return Msg{msg::ResetHand{}};

        case fb::Intent::Intent_ThemeChanged:
            return Msg{msg::ThemeChanged{.theme_id = Str(im->intent_as_Intent_ThemeChanged()->theme_id())}};

        case fb::Intent::NONE:
            break;
        }
        return std::unexpected(ParseError{"unknown intent"});
    }

    auto DecodeProps(std::span<std::byte const> bytes) -> std::expected<DecodedProps, ParseError>
    {
        auto const env = Open(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::PropsMsg)
            return std::unexpected(ParseError{"not a PropsMsg"});

        auto const* p = (*env)->message_as_PropsMsg();
        auto seats = ReadSeats(p->seats());
        if (!seats)
            return std::unexpected(seats.error());

        Banners banners;
        if (auto const* v = p->banners())
        {
            for (auto const* b : *v)
            {
                banners.push_back(Banner{
                    .id = b->id(),
                    .text = Str(b->text()),
                    .style = Str(b->style()),
                    .ttl = std::chrono::milliseconds{b->ttl_ms()}
                });
            }
        }

        std::optional<Hint> hint;
        if (auto const* h = p->hint())
        {
            hint = Hint{
                .seat = h->seat(),
                .action = FromFbKind(h->action()),
                .amount = h->amount(),
                .frequency = h->frequency(),
                .rationale = Str(h->rationale())
            };
        }

        DecodedProps out{};
        out.msg_id = p->msg_id();
        out.props = TableProps{
            .hand_id = Str(p->hand_id()),
            .street = FromFbStreet(p->street()),
            .seats = Frozen<SeatMap>{std::move(*seats)},
            .board = Frozen<Board>{ReadStrings(p->board())},
            .pot = p->pot(),
            .to_act_seat = p->has_to_act() ? std::optional<SeatIdxT>{p->to_act()} : std::nullopt,
            .legal_actions = ActionSet::FromBits(p->legal_actions()),
            .last_action = p->last_action() ? std::optional<ActionRecord>{ReadAction(p->last_action())} : std::nullopt,
            .banners = Frozen<Banners>{std::move(banners)},
            .theme_id = Str(p->theme_id()),
            .autoplay_on = p->autoplay_on(),
            .waiting_for = FromFbWaiting(p->waiting_for()),
            .review_cursor = p->review_cursor(),
            .review_length = p->review_length(),
            .review_paused = p->review_paused(),
            .session_mode = FromFbMode(p->session_mode()),
            .hint = std::move(hint)
        };
        return out;
    }
}
