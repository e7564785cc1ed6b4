//
// HoldemEngine.cpp
//

#include "HoldemEngine.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

#include "Betting.hpp"
#include "Util.hpp"

namespace pokerpro::core
{
    using error::Rejection;
    using error::RejectionCode;

    HoldemEngine::HoldemEngine(uint64_t seed):
        rng_(seed) {}

    auto HoldemEngine::Reset(HandData const& hand) -> void
    {
        if (auto const ok = ValidateHand(hand); !ok)
        {
            PPR_THROW(error::Code::Engine, std::format("reset with invalid hand {}: {}", hand.hand_id,
                                                       error::describe(ok.error())));
        }

        hand_ = hand;
        seats_ = hand.seats;
        board_ = util::ParseCards(hand.board).value_or(std::vector<Card>{});
        runout_ = util::ParseCards(hand.runout).value_or(std::vector<Card>{});
        street_ = StreetForBoard(board_.size()).value_or(Street::Preflop);
        big_blind_ = std::max<Chips>(hand.big_blind, 1);
        current_bet_ = betting::CurrentBet(seats_);
        last_raise_ = big_blind_;
        pot_ = hand.pot;
        dead_money_ = hand.pot;
        to_act_ = hand.to_act;
        acted_.clear();
        committed_.clear();
        hole_.clear();

        util::CardUniqueChecker seen;
        for (auto const& [idx, seat] : seats_)
        {
            committed_[idx] = seat.chips_in_front;
            auto cards = util::ParseCards(seat.cards).value_or(std::vector<Card>{});
            for (Card const& c : cards)
            {
                seen.Add(c);
            }
            hole_[idx] = std::move(cards);
        }
        for (Card const& c : board_) seen.Add(c);
        for (Card const& c : runout_) seen.Add(c);

        deck_.clear();
        for (uint8_t s = 0; s < 4; ++s)
        {
            for (uint8_t r = 0; r < 13; ++r)
            {
                Card const c{static_cast<Rank>(r), static_cast<Suit>(s)};
                if (!seen.Seen(c))
                {
                    deck_.push_back(c);
                }
            }
        }
        std::ranges::shuffle(deck_, rng_);

        // hidden hole cards are dealt from the remaining deck and stay private until showdown
        for (auto& [idx, cards] : hole_)
        {
            if (seats_.at(idx).folded)
            {
                continue;
            }
            while (cards.size() < constants::MaxHoleCards)
            {
                cards.push_back(DealCard());
            }
        }
    }

    auto HoldemEngine::Validate(SeatIdxT seat, ActionKind kind, Chips amount) const -> CheckResult
    {
        if (street_ == Street::Showdown || street_ == Street::Done)
        {
            return std::unexpected(Rejection{RejectionCode::HandOver}.with_street(street_));
        }
        auto const it = seats_.find(seat);
        if (it == seats_.end())
        {
            return std::unexpected(Rejection{RejectionCode::SeatNotFound}.with_seat(seat));
        }
        if (!to_act_)
        {
            return std::unexpected(Rejection{RejectionCode::NoSeatToAct}.with_seat(seat));
        }
        if (*to_act_ != seat)
        {
            return std::unexpected(Rejection{RejectionCode::WrongActor}.with_seat(seat).with_expected_seat(to_act_));
        }
        if (!betting::LegalActions(seats_, seat).Contains(kind))
        {
            return std::unexpected(Rejection{RejectionCode::IllegalAction}.with_seat(seat).with_kind(kind));
        }

        SeatState const& s = it->second;
        Chips const all_in = s.chips_in_front + s.stack;

        if (kind == ActionKind::Bet || kind == ActionKind::Raise)
        {
            Chips const min_to = (kind == ActionKind::Bet)
                                     ? std::min(big_blind_, all_in)
                                     : std::min(betting::MinRaiseTo(current_bet_, last_raise_, big_blind_), all_in);
            if (amount > all_in)
            {
                return std::unexpected(Rejection{RejectionCode::BetTooLarge}
                    .with_seat(seat).with_kind(kind).with_amount(amount).with_limit(all_in));
            }
            if (amount < min_to || amount <= current_bet_)
            {
                return std::unexpected(Rejection{RejectionCode::BetTooSmall}
                    .with_seat(seat).with_kind(kind).with_amount(amount).with_limit(min_to));
            }
        }
        return {};
    }

    auto HoldemEngine::Apply(SeatIdxT seat, ActionKind kind, Chips amount) -> EngineResult
    {
        if (auto const ok = Validate(seat, kind, amount); !ok)
        {
            PPR_THROW(error::Code::InvalidAction, error::describe(ok.error()));
        }

        SeatState& s = seats_.at(seat);
        ActionRecord rec{.seat = seat, .kind = kind, .amount = 0, .street = street_};

        switch (kind)
        {
        case ActionKind::Fold:
            s.folded = true;
            break;
        case ActionKind::Check:
            break;
        case ActionKind::Call:
        {
            Chips const put = std::min(current_bet_ - s.chips_in_front, s.stack);
            s.stack -= put;
            s.chips_in_front += put;
            committed_[seat] += put;
            rec.amount = put;
            break;
        }
        case ActionKind::Bet:
        case ActionKind::Raise:
        {
            Chips const put = amount - s.chips_in_front;
            s.stack -= put;
            s.chips_in_front = amount;
            committed_[seat] += put;
            Chips const raise = amount - current_bet_;
            // a short all-in raise does not reopen the action
            if (raise >= last_raise_)
            {
                last_raise_ = raise;
                acted_.clear();
            }
            current_bet_ = amount;
            rec.amount = amount;
            break;
        }
        }

        if (!s.folded && s.stack == 0)
        {
            s.all_in = true;
        }
        acted_.insert(seat);

        if (betting::LiveSeats(seats_) == 1)
        {
            auto const winner = std::ranges::find_if(seats_, [](auto const& kv) { return !kv.second.folded; });
            to_act_.reset();
            auto payouts = AwardUncontested(winner->first);
            street_ = Street::Done;
            return Result(EngineOutcome::HandEnded, rec, std::move(payouts));
        }

        to_act_ = NextToAct(seat);
        return Result(EngineOutcome::Applied, rec);
    }

    auto HoldemEngine::Continue() -> EngineResult
    {
        if (to_act_)
        {
            PPR_THROW(error::Code::Engine, std::format("betting round still open for seat {}", static_cast<int>(*to_act_)));
        }
        if (street_ == Street::Showdown || street_ == Street::Done)
        {
            PPR_THROW(error::Code::Engine, std::format("hand {} already settled", hand_.hand_id));
        }

        CollectBets();

        if (street_ == Street::River)
        {
            auto payouts = Showdown();
            street_ = Street::Done;
            return Result(EngineOutcome::HandEnded, std::nullopt, std::move(payouts));
        }

        std::size_t const n = (street_ == Street::Preflop) ? 3 : 1;
        for (std::size_t i = 0; i < n; ++i)
        {
            if (!runout_.empty())
            {
                board_.push_back(runout_.front());
                runout_.erase(runout_.begin());
            }
            else
            {
                board_.push_back(DealCard());
            }
        }
        street_ = static_cast<Street>(std::to_underlying(street_) + 1);
        to_act_ = FirstToActPostflop();
        return Result(EngineOutcome::StreetDealt);
    }

    auto HoldemEngine::Table() const -> TableUpdate
    {
        SeatMap seats = seats_;
        for (auto& [idx, seat] : seats)
        {
            seat.acting = to_act_ && *to_act_ == idx;
        }
        return TableUpdate{.seats = Frozen<SeatMap>{std::move(seats)}, .pot = pot_, .to_act = to_act_};
    }

    auto HoldemEngine::BoardNow() const -> Board
    {
        return util::ToTokens(board_);
    }

    auto HoldemEngine::NextToAct(SeatIdxT after) const -> std::optional<SeatIdxT>
    {
        auto const needs_action = [this](SeatIdxT idx, SeatState const& s)
        {
            if (s.folded || s.all_in || s.stack <= 0)
            {
                return false;
            }
            return !acted_.contains(idx) || s.chips_in_front < current_bet_;
        };

        // nobody left to bet against
        if (betting::ActionableSeats(seats_) <= 1)
        {
            auto const lone = std::ranges::find_if(seats_, [](auto const& kv)
            {
                return !kv.second.folded && !kv.second.all_in && kv.second.stack > 0;
            });
            if (lone == seats_.end() || lone->second.chips_in_front >= current_bet_)
            {
                return std::nullopt;
            }
        }

        auto it = seats_.upper_bound(after);
        for (std::size_t i = 0; i < seats_.size(); ++i, ++it)
        {
            if (it == seats_.end())
            {
                it = seats_.begin();
            }
            if (needs_action(it->first, it->second))
            {
                return it->first;
            }
        }
        return std::nullopt;
    }

    auto HoldemEngine::FirstToActPostflop() const -> std::optional<SeatIdxT>
    {
        if (betting::ActionableSeats(seats_) < 2)
        {
            return std::nullopt;
        }
        return NextToAct(hand_.button_seat);
    }

    auto HoldemEngine::CollectBets() -> void
    {
        for (SeatState& s : seats_ | std::views::values)
        {
            pot_ += s.chips_in_front;
            s.chips_in_front = 0;
        }
        current_bet_ = 0;
        last_raise_ = big_blind_;
        acted_.clear();
    }

    auto HoldemEngine::DealCard() -> Card
    {
        if (deck_.empty())
        {
            PPR_THROW(error::Code::Engine, "deck exhausted");
        }
        Card const c = deck_.back();
        deck_.pop_back();
        return c;
    }

    auto HoldemEngine::AwardUncontested(SeatIdxT winner) -> std::vector<Payout>
    {
        CollectBets();
        Chips const amount = pot_;
        seats_.at(winner).stack += amount;
        pot_ = 0;
        return {Payout{.seat = winner, .amount = amount, .description = "uncontested"}};
    }

    auto HoldemEngine::Showdown() -> std::vector<Payout>
    {
        std::map<SeatIdxT, HandValue> values;
        for (auto& [idx, seat] : seats_)
        {
            if (seat.folded)
            {
                continue;
            }
            std::vector<Card> seven = hole_.at(idx);
            seven.insert(seven.end(), board_.begin(), board_.end());
            values.emplace(idx, Evaluate(seven));
            seat.cards = util::ToTokens(hole_.at(idx));
        }

        std::map<SeatIdxT, Chips> won;
        auto award = [&](Chips amount, std::vector<SeatIdxT> const& eligible) -> void
        {
            HandValue best{};
            for (SeatIdxT const idx : eligible)
            {
                best = std::max(best, values.at(idx));
            }
            std::vector<SeatIdxT> winners;
            for (SeatIdxT const idx : eligible)
            {
                if (values.at(idx) == best)
                {
                    winners.push_back(idx);
                }
            }
            // odd chips go to the earliest seats
            Chips const share = amount / static_cast<Chips>(winners.size());
            Chips rem = amount % static_cast<Chips>(winners.size());
            for (SeatIdxT const w : winners)
            {
                won[w] += share + (rem > 0 ? 1 : 0);
                if (rem > 0) --rem;
            }
        };

        std::set<Chips> levels;
        for (Chips const c : committed_ | std::views::values)
        {
            if (c > 0) levels.insert(c);
        }

        Chips prev = 0;
        Chips carry = dead_money_;
        bool awarded_any = false;
        for (Chips const level : levels)
        {
            Chips slice = 0;
            std::vector<SeatIdxT> eligible;
            for (auto const& [idx, c] : committed_)
            {
                slice += std::min(c, level) - std::min(c, prev);
                if (c >= level && values.contains(idx))
                {
                    eligible.push_back(idx);
                }
            }
            prev = level;
            if (eligible.empty())
            {
                carry += slice;
                continue;
            }
            award(slice + carry, eligible);
            carry = 0;
            awarded_any = true;
        }
        if (carry > 0 || !awarded_any)
        {
            std::vector<SeatIdxT> live;
            for (SeatIdxT const idx : values | std::views::keys)
            {
                live.push_back(idx);
            }
            award(carry, live);
        }

        std::vector<Payout> payouts;
        for (auto const& [idx, amount] : won)
        {
            if (amount <= 0)
            {
                continue;
            }
            seats_.at(idx).stack += amount;
            payouts.push_back(Payout{
                .seat = idx,
                .amount = amount,
                .description = std::format("{} wins with {}", seats_.at(idx).name, to_string(values.at(idx).category))
            });
        }
        pot_ = 0;
        return payouts;
    }

    auto HoldemEngine::Result(EngineOutcome outcome, std::optional<ActionRecord> action,
                              std::vector<Payout> payouts) const -> EngineResult
    {
        return EngineResult{
            .outcome = outcome,
            .action = std::move(action),
            .street = street_,
            .board = BoardNow(),
            .table = Table(),
            .payouts = std::move(payouts)
        };
    }
}
