//
// Invariants.hpp — structural checks on a committed Model
//

#ifndef POKERPRO_INVARIANTS_HPP
#define POKERPRO_INVARIANTS_HPP

#include "../core/Model.hpp"
#include "../core/Util.hpp"
#include <cassert>
#include <format>
#include <string>
#include <vector>

namespace pokerpro::core::debug
{
    // Every broken invariant, described; empty when the Model is consistent.
    inline auto Violations(Model const& m) -> std::vector<std::string>
    {
        std::vector<std::string> out;

        // 1) acting flag matches to_act_seat, at most one seat acting
        std::size_t acting = 0;
        for (auto const& [idx, s] : *m.seats)
        {
            if (s.acting)
            {
                ++acting;
                if (!m.to_act_seat || *m.to_act_seat != idx)
                {
                    out.push_back(std::format("seat {} acting but toAct is {}", static_cast<int>(idx),
                                              m.to_act_seat ? static_cast<int>(*m.to_act_seat) : -1));
                }
            }
        }
        if (acting > 1)
        {
            out.push_back(std::format("{} seats acting", acting));
        }
        if (m.to_act_seat && !m.seats->contains(*m.to_act_seat))
        {
            out.push_back(std::format("toAct {} not at table", static_cast<int>(*m.to_act_seat)));
        }

        // 2) legal actions only while a decision is awaited, never without a seat to act
        bool const deciding = m.waiting_for == WaitingFor::HumanDecision || m.waiting_for == WaitingFor::BotDecision;
        if (!m.legal_actions.Empty() && (!deciding || !m.to_act_seat))
        {
            out.push_back(std::format("legal actions while waiting for {}", to_string(m.waiting_for)));
        }

        // 3) board length follows the street until the hand is settled
        if (m.street < Street::Showdown && m.board->size() != BoardSizeFor(m.street))
        {
            out.push_back(std::format("{} board cards on the {}", m.board->size(), to_string(m.street)));
        }
        if (m.board->size() > constants::MaxBoardCards)
        {
            out.push_back("board longer than five cards");
        }

        // 4) no card twice between board and visible hole cards
        util::CardUniqueChecker seen;
        auto add = [&](CardToken const& t)
        {
            if (auto c = ParseCard(t))
            {
                if (seen.Seen(*c))
                {
                    out.push_back(std::format("card {} shown twice", t));
                }
                seen.Add(*c);
            }
            else
            {
                out.push_back(std::format("unreadable card {}", t));
            }
        };
        for (CardToken const& t : *m.board) add(t);
        for (auto const& [idx, s] : *m.seats)
        {
            if (s.cards.size() > constants::MaxHoleCards)
            {
                out.push_back(std::format("seat {} holds {} cards", static_cast<int>(idx), s.cards.size()));
            }
            for (CardToken const& t : s.cards) add(t);
            if (s.stack < 0 || s.chips_in_front < 0)
            {
                out.push_back(std::format("seat {} has negative chips", static_cast<int>(idx)));
            }
        }

        // 5) replay bookkeeping
        if (m.session_mode != SessionMode::Replay && (m.review_cursor != 0 || m.review_length != 0))
        {
            out.push_back("review position outside replay");
        }
        if (m.review_length > 0 && m.review_cursor >= m.review_length)
        {
            out.push_back(std::format("cursor {} past length {}", m.review_cursor, m.review_length));
        }

        if (m.pot < 0)
        {
            out.push_back("negative pot");
        }
        return out;
    }

    inline auto CheckInvariants(Model const& m) -> void
    {
#if PPR_ENABLE_TEST_HOOKS == false
        (void)m;
#else
        auto const v = Violations(m);
        assert(v.empty() && "Model invariant broken");
        (void)v;
#endif
    }
}

#endif //POKERPRO_INVARIANTS_HPP
