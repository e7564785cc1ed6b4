//
// Update.cpp — reducer over the waiting-state machine
//

#include "Update.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <string>

#include "Betting.hpp"

namespace pokerpro::core
{
    namespace
    {
        using namespace std::chrono_literals;
        using error::Rejection;
        using error::RejectionCode;

        auto Reject(Model const& m, Rejection r) -> Transition
        {
            return Transition{.model = m, .commands = {}, .rejection = std::move(r)};
        }

        auto Unchanged(Model const& m) -> Transition
        {
            return Transition{.model = m};
        }

        auto IsLive(Model const& m) -> bool
        {
            return m.session_mode != SessionMode::Replay;
        }

        // Without a hero every seat is played from the controls (hot seat).
        auto IsHumanSeat(Model const& m, SeatIdxT seat) -> bool
        {
            return !m.hero_seat || *m.hero_seat == seat;
        }

        auto ReplayHasNext(Model const& m) -> bool
        {
            return m.review_cursor + 1 < m.review_length;
        }

        auto SoundFor(ActionKind k) -> std::string
        {
            switch (k)
            {
            case ActionKind::Fold: return "FOLD";
            case ActionKind::Check: return "CHECK";
            case ActionKind::Call: return "CALL";
            case ActionKind::Bet: return "BET";
            case ActionKind::Raise: return "RAISE";
            }
            return "CLICK";
        }

        auto AnimationFor(ActionKind k) -> AnimationKind
        {
            switch (k)
            {
            case ActionKind::Fold: return AnimationKind::FoldCards;
            case ActionKind::Check: return AnimationKind::SeatAction;
            case ActionKind::Call:
            case ActionKind::Bet:
            case ActionKind::Raise: return AnimationKind::BetChips;
            }
            return AnimationKind::SeatAction;
        }

        auto SeatName(Model const& m, SeatIdxT seat) -> std::string
        {
            auto const it = m.seats->find(seat);
            if (it == m.seats->end() || it->second.name.empty())
            {
                return std::format("Seat {}", static_cast<int>(seat));
            }
            return it->second.name;
        }

        auto JoinBoard(Board const& board) -> std::string
        {
            std::string out;
            for (std::size_t i = 0; i < board.size(); ++i)
            {
                out += (i ? " " : "");
                out += board[i];
            }
            return out;
        }

        // Value-equal tables keep the instance already held.
        auto ApplyTable(Model& m, TableUpdate const& t) -> void
        {
            m.to_act_seat = t.to_act;
            auto seats = WithActing(t.seats, t.to_act);
            if (!(seats == m.seats))
            {
                m.seats = std::move(seats);
            }
            m.pot = t.pot;
        }

        auto AddBanner(Model& m, std::vector<Cmd>& cmds, std::string text, std::string style) -> void
        {
            uint64_t const id = m.next_banner_id++;
            m.banners = m.banners.With([&](Banners& b)
            {
                b.push_back(Banner{.id = id, .text = std::move(text), .style = std::move(style),
                                   .ttl = constants::BannerTtl});
            });
            cmds.emplace_back(cmd::ScheduleTimer{.delay = constants::BannerTtl, .message = msg::BannerExpired{.id = id}});
        }

        // The step goes stale once tx_id moves on; an autoplay step also once autoplay stops.
        auto ScheduleAdvance(Model const& m, std::vector<Cmd>& cmds, bool autoplay) -> void
        {
            cmds.emplace_back(cmd::ScheduleTimer{
                .delay = m.step_delay,
                .message = msg::AdvanceRequested{.scheduled_at = m.tx_id, .autoplay = autoplay}
            });
        }

        auto StartHumanTurn(Model& m, std::vector<Cmd>& cmds, SeatIdxT seat, ActionSet given) -> void
        {
            m.waiting_for = WaitingFor::HumanDecision;
            m.legal_actions = given.Empty() ? betting::LegalActions(*m.seats, seat) : given;
            m.hint.reset();
            if (m.session_mode == SessionMode::Advisory)
            {
                cmds.emplace_back(cmd::AskDriverForDecision{.seat = seat, .purpose = DecisionPurpose::Hint});
            }
        }

        auto StartBotTurn(Model& m, std::vector<Cmd>& cmds, SeatIdxT seat) -> void
        {
            m.waiting_for = WaitingFor::BotDecision;
            m.legal_actions = betting::LegalActions(*m.seats, seat);
            m.hint.reset();
            cmds.emplace_back(cmd::AskDriverForDecision{.seat = seat, .purpose = DecisionPurpose::Decide});
        }

        // Decide what the table waits on once nothing is in flight.
        auto Settle(Model& m, std::vector<Cmd>& cmds) -> void
        {
            if (m.engine_pending || m.street == Street::Done || m.seats->empty())
            {
                return;
            }
            if (!IsLive(m))
            {
                // a recorded decision point is skipped by the scheduled step
                bool const idle = m.waiting_for == WaitingFor::None || m.waiting_for == WaitingFor::HumanDecision;
                if (idle && m.autoplay_on && !m.review_paused && ReplayHasNext(m))
                {
                    ScheduleAdvance(m, cmds, true);
                }
                return;
            }
            if (m.waiting_for != WaitingFor::None)
            {
                return;
            }
            if (m.to_act_seat && IsHumanSeat(m, *m.to_act_seat))
            {
                StartHumanTurn(m, cmds, *m.to_act_seat, {});
                return;
            }
            if (m.autoplay_on)
            {
                ScheduleAdvance(m, cmds, true);
            }
        }

        auto AdvanceFromIdle(Model const& model) -> Transition
        {
            if (model.seats->empty())
            {
                return Reject(model, Rejection{RejectionCode::NoHandLoaded});
            }
            if (model.street == Street::Done)
            {
                return Reject(model, Rejection{RejectionCode::HandOver}.with_street(model.street));
            }
            if (model.engine_pending)
            {
                return Reject(model, Rejection{RejectionCode::EnginePending});
            }

            Transition t{.model = model};
            Model& m = t.model;

            if (!IsLive(m))
            {
                if (!ReplayHasNext(m))
                {
                    return Reject(model, Rejection{RejectionCode::ScriptExhausted}
                        .with_detail(std::format("cursor {} of {}", m.review_cursor, m.review_length)));
                }
                t.commands.emplace_back(cmd::FetchScriptedEvent{.index = m.review_cursor});
                return t;
            }

            if (!m.to_act_seat)
            {
                m.engine_pending = true;
                t.commands.emplace_back(cmd::ApplyContinue{});
            }
            else if (IsHumanSeat(m, *m.to_act_seat))
            {
                StartHumanTurn(m, t.commands, *m.to_act_seat, {});
            }
            else
            {
                StartBotTurn(m, t.commands, *m.to_act_seat);
            }
            return t;
        }

        // Leaves the pending decision and advances as if idle; a refusal keeps the input model.
        auto AdvanceDroppingTurn(Model const& model) -> Transition
        {
            Model idle = model;
            idle.waiting_for = WaitingFor::None;
            idle.legal_actions = {};
            idle.hint.reset();
            Transition t = AdvanceFromIdle(idle);
            if (t.rejection)
            {
                return Reject(model, *t.rejection);
            }
            return t;
        }

        // Shared by the human and bot paths.
        auto AcceptDecision(Model const& model, SeatIdxT seat, ActionKind kind, Chips amount) -> Transition
        {
            if (!model.to_act_seat || *model.to_act_seat != seat)
            {
                return Reject(model, Rejection{RejectionCode::WrongActor}
                    .with_seat(seat).with_expected_seat(model.to_act_seat));
            }
            if (!model.legal_actions.Contains(kind))
            {
                return Reject(model, Rejection{RejectionCode::IllegalAction}
                    .with_seat(seat).with_kind(kind).with_amount(amount));
            }

            Transition t{.model = model};
            Model& m = t.model;
            ++m.tx_id;
            m.last_action = ActionRecord{.seat = seat, .kind = kind, .amount = amount, .street = m.street};
            m.legal_actions = {};
            m.hint.reset();
            m.waiting_for = WaitingFor::Animation;
            m.engine_pending = true;

            t.commands.emplace_back(cmd::PlaySound{.sound = SoundFor(kind)});
            t.commands.emplace_back(cmd::Animate{.kind = AnimationFor(kind), .token = m.tx_id, .seat = seat, .amount = amount});
            t.commands.emplace_back(cmd::ApplyToEngine{.seat = seat, .kind = kind, .amount = amount});
            // replay never blocks on presentation timing
            if (!IsLive(m))
            {
                t.commands.emplace_back(cmd::ScheduleTimer{.delay = 0ms, .message = msg::AnimationFinished{.token = m.tx_id}});
            }
            return t;
        }

        // Scripted events must match the cursor; engine feedback must answer a pending request.
        auto CheckFeedback(Model const& m, std::optional<uint32_t> step) -> error::ValidateResult
        {
            if (step)
            {
                if (IsLive(m))
                {
                    return std::unexpected(Rejection{RejectionCode::NotReplayMode});
                }
                if (*step != m.review_cursor)
                {
                    return std::unexpected(Rejection{RejectionCode::StaleScriptStep}
                        .with_detail(std::format("step {} at cursor {}", *step, m.review_cursor)));
                }
                if (m.waiting_for != WaitingFor::None)
                {
                    return std::unexpected(Rejection{RejectionCode::WrongWaitState}.with_waiting(m.waiting_for));
                }
                return {};
            }
            if (!m.engine_pending)
            {
                return std::unexpected(Rejection{RejectionCode::EngineIdle});
            }
            return {};
        }

        auto SeekTo(Model const& model, int64_t index) -> Transition
        {
            if (IsLive(model))
            {
                return Reject(model, Rejection{RejectionCode::NotReplayMode});
            }
            if (model.review_length == 0)
            {
                return Reject(model, Rejection{RejectionCode::NoReviewPositions});
            }

            int64_t const last = static_cast<int64_t>(model.review_length) - 1;
            auto const target = static_cast<uint32_t>(std::clamp<int64_t>(index, 0, last));
            if (target == model.review_cursor)
            {
                return Unchanged(model);
            }

            Transition t{.model = model};
            Model& m = t.model;
            m.review_cursor = target;
            m.review_paused = true;
            m.waiting_for = WaitingFor::None;
            m.legal_actions = {};
            m.hint.reset();
            m.engine_pending = false;
            ++m.tx_id;
            t.commands.emplace_back(cmd::RepositionReplay{.cursor = target});
            t.commands.emplace_back(cmd::PublishEvent{
                .topic = "review:seek",
                .payload = std::format("hand={} cursor={} length={}", m.hand_id, target, m.review_length)
            });
            return t;
        }

        // ---------- intents ----------

        auto On(Model const& model, msg::AdvanceRequested const& a) -> Transition
        {
            if (a.scheduled_at)
            {
                if (*a.scheduled_at != model.tx_id)
                {
                    return Reject(model, Rejection{RejectionCode::StaleToken}.with_token(*a.scheduled_at, model.tx_id));
                }
                if (a.autoplay && (!model.autoplay_on || (!IsLive(model) && model.review_paused)))
                {
                    return Reject(model, Rejection{RejectionCode::AutoplayStopped});
                }
                // retrying a bot is left to the user
                if (model.waiting_for == WaitingFor::BotDecision)
                {
                    return Reject(model, Rejection{RejectionCode::WrongWaitState}.with_waiting(model.waiting_for));
                }
            }

            switch (model.waiting_for)
            {
            case WaitingFor::HumanDecision:
                // a replay decision point may be skipped; the script carries on
                if (!IsLive(model))
                {
                    return AdvanceDroppingTurn(model);
                }
                [[fallthrough]];
            case WaitingFor::Animation:
                return Reject(model, Rejection{RejectionCode::WrongWaitState}.with_waiting(model.waiting_for));
            case WaitingFor::BotDecision:
                // retry: drop back to idle and ask again
                return AdvanceDroppingTurn(model);
            case WaitingFor::None:
                return AdvanceFromIdle(model);
            }
            return Reject(model, Rejection{RejectionCode::Internal_Unreachable});
        }

        auto On(Model const& model, msg::ToggleAutoplay const& a) -> Transition
        {
            Transition t{.model = model};
            Model& m = t.model;
            m.autoplay_on = a.on;
            if (a.on && !model.autoplay_on)
            {
                if (!IsLive(m))
                {
                    m.review_paused = false;
                }
                Settle(m, t.commands);
            }
            return t;
        }

        auto On(Model const& model, msg::UserChose const& c) -> Transition
        {
            if (model.waiting_for != WaitingFor::HumanDecision)
            {
                return Reject(model, Rejection{RejectionCode::WrongWaitState}
                    .with_waiting(model.waiting_for).with_kind(c.kind));
            }

            std::optional<SeatIdxT> seat = c.seat;
            if (!seat)
            {
                seat = (IsLive(model) && model.hero_seat) ? model.hero_seat : model.to_act_seat;
            }
            if (!seat)
            {
                return Reject(model, Rejection{RejectionCode::NoSeatToAct}.with_kind(c.kind));
            }
            if (IsLive(model) && !IsHumanSeat(model, *seat))
            {
                return Reject(model, Rejection{RejectionCode::WrongActor}
                    .with_seat(*seat).with_expected_seat(model.hero_seat));
            }
            return AcceptDecision(model, *seat, c.kind, c.amount);
        }

        auto On(Model const& model, msg::SeekReview const& s) -> Transition
        {
            return SeekTo(model, s.index);
        }

        auto On(Model const& model, msg::StepBack const&) -> Transition
        {
            return SeekTo(model, static_cast<int64_t>(model.review_cursor) - 1);
        }

        auto On(Model const& model, msg::SetReviewPaused const& p) -> Transition
        {
            if (IsLive(model))
            {
                return Reject(model, Rejection{RejectionCode::NotReplayMode});
            }
            Transition t{.model = model};
            t.model.review_paused = p.paused;
            if (!p.paused && model.review_paused)
            {
                Settle(t.model, t.commands);
            }
            return t;
        }

        auto On(Model const& model, msg::SetStepDelay const& d) -> Transition
        {
            Transition t{.model = model};
            t.model.step_delay = std::max(d.delay, constants::MinStepDelay);
            return t;
        }

        auto On(Model const& model, msg::LoadHand const& l) -> Transition
        {
            if (auto const ok = ValidateHand(*l.hand); !ok)
            {
                return Reject(model, ok.error());
            }
            HandData const& h = *l.hand;

            // full replacement; only session preferences and counters carry over
            Transition t{};
            Model& m = t.model;
            m.hand_id = h.hand_id;
            m.street = StreetForBoard(h.board.size()).value_or(Street::Preflop);
            m.to_act_seat = h.to_act;
            m.pot = h.pot;
            m.board = Frozen<Board>{h.board};
            m.seats = WithActing(Frozen<SeatMap>{h.seats}, h.to_act);
            m.session_mode = l.mode;
            m.autoplay_on = model.autoplay_on;
            m.step_delay = model.step_delay;
            m.theme_id = model.theme_id;
            m.tx_id = model.tx_id + 1;
            m.next_banner_id = model.next_banner_id;
            m.hero_seat = (l.mode == SessionMode::Replay) ? std::nullopt : h.hero_seat;
            m.big_blind = h.big_blind;
            m.source = l.hand;

            t.commands.emplace_back(cmd::InstallDriver{.hand = l.hand, .mode = l.mode});
            t.commands.emplace_back(cmd::ResetEngine{.hand = l.hand});
            t.commands.emplace_back(cmd::PublishEvent{
                .topic = "hand:loaded",
                .payload = std::format("hand={} mode={} seats={}", h.hand_id, to_string(l.mode), h.seats.size())
            });

            if (!IsLive(m))
            {
                // a recorded decision point may be tried before the script resumes
                if (h.to_act && !h.legal.Empty())
                {
                    m.waiting_for = WaitingFor::HumanDecision;
                    m.legal_actions = h.legal;
                }
            }
            else if (h.to_act && IsHumanSeat(m, *h.to_act))
            {
                StartHumanTurn(m, t.commands, *h.to_act, h.legal);
            }
            else
            {
                Settle(m, t.commands);
            }
            return t;
        }

        auto On(Model const& model, msg::ResetHand const&) -> Transition
        {
            if (model.source.SameAs(Frozen<HandData>{}))
            {
                return Reject(model, Rejection{RejectionCode::NoHandLoaded});
            }
            return On(model, msg::LoadHand{.hand = model.source, .mode = model.session_mode});
        }

        auto On(Model const& model, msg::ThemeChanged const& c) -> Transition
        {
            Transition t{.model = model};
            t.model.theme_id = c.theme_id;
            return t;
        }

        // ---------- completions ----------

        auto On(Model const& model, msg::DecisionReady const& d) -> Transition
        {
            if (model.waiting_for != WaitingFor::BotDecision)
            {
                return Reject(model, Rejection{RejectionCode::WrongWaitState}
                    .with_waiting(model.waiting_for).with_seat(d.seat));
            }
            return AcceptDecision(model, d.seat, d.decision.kind, d.decision.amount);
        }

        auto On(Model const& model, msg::HintReady const& h) -> Transition
        {
            if (model.session_mode != SessionMode::Advisory || model.waiting_for != WaitingFor::HumanDecision)
            {
                return Reject(model, Rejection{RejectionCode::WrongWaitState}
                    .with_waiting(model.waiting_for).with_seat(h.seat));
            }
            if (!model.to_act_seat || *model.to_act_seat != h.seat)
            {
                return Reject(model, Rejection{RejectionCode::WrongActor}
                    .with_seat(h.seat).with_expected_seat(model.to_act_seat));
            }
            Transition t{.model = model};
            t.model.hint = Hint{
                .seat = h.seat,
                .action = h.decision.kind,
                .amount = h.decision.amount,
                .frequency = h.decision.frequency,
                .rationale = h.decision.rationale
            };
            return t;
        }

        auto On(Model const& model, msg::AnimationFinished const& a) -> Transition
        {
            if (model.waiting_for != WaitingFor::Animation)
            {
                return Reject(model, Rejection{RejectionCode::WrongWaitState}
                    .with_waiting(model.waiting_for).with_token(a.token, model.tx_id));
            }
            if (a.token != model.tx_id)
            {
                return Reject(model, Rejection{RejectionCode::StaleToken}.with_token(a.token, model.tx_id));
            }
            Transition t{.model = model};
            t.model.waiting_for = WaitingFor::None;
            Settle(t.model, t.commands);
            return t;
        }

        auto On(Model const& model, msg::BannerExpired const& b) -> Transition
        {
            bool const present = std::ranges::any_of(*model.banners, [&](Banner const& x) { return x.id == b.id; });
            if (!present)
            {
                return Unchanged(model);
            }
            Transition t{.model = model};
            t.model.banners = model.banners.With([&](Banners& v)
            {
                std::erase_if(v, [&](Banner const& x) { return x.id == b.id; });
            });
            return t;
        }

        auto On(Model const& model, msg::ScriptLoaded const& s) -> Transition
        {
            if (IsLive(model))
            {
                return Reject(model, Rejection{RejectionCode::NotReplayMode});
            }
            if (s.hand_id != model.hand_id)
            {
                return Reject(model, Rejection{RejectionCode::HandMismatch}
                    .with_detail(std::format("script for {} while {} is loaded", s.hand_id, model.hand_id)));
            }
            Transition t{.model = model};
            t.model.review_length = static_cast<uint32_t>(s.count + 1);
            Settle(t.model, t.commands);
            return t;
        }

        auto On(Model const& model, msg::ReplayRepositioned const& r) -> Transition
        {
            if (IsLive(model))
            {
                return Reject(model, Rejection{RejectionCode::NotReplayMode});
            }
            if (r.cursor != model.review_cursor)
            {
                return Reject(model, Rejection{RejectionCode::StaleScriptStep}
                    .with_detail(std::format("position {} at cursor {}", r.cursor, model.review_cursor)));
            }
            Transition t{.model = model};
            Model& m = t.model;
            m.street = r.position.street;
            if (!(r.position.board == m.board))
            {
                m.board = r.position.board;
            }
            ApplyTable(m, r.position.table);
            m.last_action = r.position.last_action;
            m.waiting_for = WaitingFor::None;
            m.legal_actions = {};
            m.hint.reset();
            return t;
        }

        // ---------- engine / script feedback ----------

        auto On(Model const& model, msg::ActionApplied const& a) -> Transition
        {
            if (auto const ok = CheckFeedback(model, a.step); !ok)
            {
                return Reject(model, ok.error());
            }

            Transition t{.model = model};
            Model& m = t.model;
            ApplyTable(m, a.table);
            m.last_action = a.action;

            if (a.step)
            {
                m.review_cursor = *a.step + 1;
                ++m.tx_id;
                m.waiting_for = WaitingFor::Animation;
                m.legal_actions = {};
                t.commands.emplace_back(cmd::PlaySound{.sound = SoundFor(a.action.kind)});
                t.commands.emplace_back(cmd::Animate{
                    .kind = AnimationFor(a.action.kind),
                    .token = m.tx_id,
                    .seat = a.action.seat,
                    .amount = a.action.amount
                });
                t.commands.emplace_back(cmd::ScheduleTimer{.delay = 0ms, .message = msg::AnimationFinished{.token = m.tx_id}});
                return t;
            }

            m.engine_pending = false;
            Settle(m, t.commands);
            return t;
        }

        auto On(Model const& model, msg::StreetAdvanced const& s) -> Transition
        {
            if (auto const ok = CheckFeedback(model, s.step); !ok)
            {
                return Reject(model, ok.error());
            }
            if (s.board->size() != BoardSizeFor(s.street))
            {
                return Reject(model, Rejection{RejectionCode::BoardMismatch}.with_street(s.street)
                    .with_detail(std::format("{} board cards", s.board->size())));
            }
            if (s.street <= model.street || s.street > Street::River)
            {
                return Reject(model, Rejection{RejectionCode::StreetRegression}.with_street(s.street));
            }

            Transition t{.model = model};
            Model& m = t.model;
            m.street = s.street;
            if (!(s.board == m.board))
            {
                m.board = s.board;
            }
            ApplyTable(m, s.table);
            ++m.tx_id;
            m.waiting_for = WaitingFor::None;
            m.legal_actions = {};
            m.hint.reset();

            t.commands.emplace_back(cmd::Animate{.kind = AnimationKind::DealBoard, .token = m.tx_id});
            t.commands.emplace_back(cmd::PlaySound{.sound = "DEAL"});
            t.commands.emplace_back(cmd::Speak{.text = std::format("{}: {}", to_string(s.street), JoinBoard(*s.board))});

            if (s.step)
            {
                m.review_cursor = *s.step + 1;
                // manual review steps one event per Advance
                if (m.autoplay_on && !m.review_paused && ReplayHasNext(m))
                {
                    ScheduleAdvance(m, t.commands, true);
                }
                return t;
            }

            m.engine_pending = false;
            if (m.to_act_seat && IsHumanSeat(m, *m.to_act_seat))
            {
                StartHumanTurn(m, t.commands, *m.to_act_seat, {});
            }
            else
            {
                ScheduleAdvance(m, t.commands, false);
            }
            return t;
        }

        auto On(Model const& model, msg::HandFinished const& h) -> Transition
        {
            if (auto const ok = CheckFeedback(model, h.step); !ok)
            {
                return Reject(model, ok.error());
            }

            Transition t{.model = model};
            Model& m = t.model;
            TableUpdate table = h.table;
            table.to_act.reset();
            ApplyTable(m, table);
            m.street = Street::Done;
            m.waiting_for = WaitingFor::None;
            m.legal_actions = {};
            m.hint.reset();
            m.engine_pending = false;
            ++m.tx_id;
            if (h.step)
            {
                m.review_cursor = *h.step + 1;
            }

            if (h.final_action)
            {
                m.last_action = h.final_action;
                t.commands.emplace_back(cmd::PlaySound{.sound = SoundFor(h.final_action->kind)});
            }

            std::string spoken;
            for (Payout const& p : h.payouts)
            {
                spoken += std::format("{}{} wins {}", spoken.empty() ? "" : ", ", SeatName(m, p.seat), p.amount);
            }

            std::optional<SeatIdxT> first;
            Chips total = 0;
            if (!h.payouts.empty())
            {
                first = h.payouts.front().seat;
            }
            for (Payout const& p : h.payouts)
            {
                total += p.amount;
            }

            t.commands.emplace_back(cmd::Animate{
                .kind = AnimationKind::PotToWinner,
                .token = m.tx_id,
                .seat = first,
                .amount = total
            });
            t.commands.emplace_back(cmd::PlaySound{.sound = "WINNER"});
            if (!spoken.empty())
            {
                t.commands.emplace_back(cmd::Speak{.text = spoken});
            }
            for (Payout const& p : h.payouts)
            {
                AddBanner(m, t.commands, std::format("{} (+{})", p.description, p.amount), "winner");
            }
            t.commands.emplace_back(cmd::PublishEvent{
                .topic = "hand:finished",
                .payload = std::format("hand={} payouts={} total={}", m.hand_id, h.payouts.size(), total)
            });
            return t;
        }

        auto On(Model const& model, msg::EngineRejected const& e) -> Transition
        {
            if (!model.engine_pending)
            {
                return Reject(model, Rejection{RejectionCode::EngineIdle}.with_detail(e.reason));
            }
            Transition t{.model = model};
            Model& m = t.model;
            m.engine_pending = false;
            AddBanner(m, t.commands, std::format("Action refused: {}", e.reason), "error");
            Settle(m, t.commands);
            return t;
        }
    }

    auto Update(Model const& model, Msg const& message) -> Transition
    {
        return std::visit([&model](auto const& m) -> Transition { return On(model, m); }, message);
    }
}
