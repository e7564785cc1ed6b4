//
// HoldemEngine.hpp — no-limit hold'em betting, dealing and showdown
//

#ifndef POKERPRO_HOLDEMENGINE_HPP
#define POKERPRO_HOLDEMENGINE_HPP

#include <map>
#include <optional>
#include <random>
#include <set>
#include <vector>

#include "Engine.hpp"
#include "HandEvaluator.hpp"

namespace pokerpro::core
{
    class HoldemEngine final : public PokerEngine
    {
    public:
        explicit HoldemEngine(uint64_t seed);

        auto Reset(HandData const& hand) -> void override;
        auto Validate(SeatIdxT seat, ActionKind kind, Chips amount) const -> CheckResult override;
        auto Apply(SeatIdxT seat, ActionKind kind, Chips amount) -> EngineResult override;
        auto Continue() -> EngineResult override;

        [[nodiscard]] auto Table() const -> TableUpdate override;
        [[nodiscard]] auto StreetNow() const -> Street override { return street_; }
        [[nodiscard]] auto BoardNow() const -> Board override;

        [[nodiscard]] auto CurrentBet() const -> Chips { return current_bet_; }
        [[nodiscard]] auto LastRaise() const -> Chips { return last_raise_; }

    private:
        auto NextToAct(SeatIdxT after) const -> std::optional<SeatIdxT>;
        auto FirstToActPostflop() const -> std::optional<SeatIdxT>;
        auto CollectBets() -> void;
        auto DealCard() -> Card;
        auto AwardUncontested(SeatIdxT winner) -> std::vector<Payout>;
        auto Showdown() -> std::vector<Payout>;
        auto Result(EngineOutcome outcome, std::optional<ActionRecord> action = std::nullopt,
                    std::vector<Payout> payouts = {}) const -> EngineResult;

        std::mt19937_64 rng_;
        HandData hand_;
        SeatMap seats_;
        std::map<SeatIdxT, std::vector<Card>> hole_;
        std::map<SeatIdxT, Chips> committed_;
        std::vector<Card> board_;
        std::vector<Card> runout_;
        std::vector<Card> deck_;
        Street street_{Street::Preflop};
        Chips pot_{};
        Chips dead_money_{};
        Chips current_bet_{};
        Chips last_raise_{};
        Chips big_blind_{};
        std::optional<SeatIdxT> to_act_;
        std::set<SeatIdxT> acted_;
    };
}

#endif //POKERPRO_HOLDEMENGINE_HPP
