//
// EquityProvider.hpp — made-hand strength against pot odds
//

#ifndef POKERPRO_EQUITYPROVIDER_HPP
#define POKERPRO_EQUITYPROVIDER_HPP

#include <span>

#include "StrategyProvider.hpp"

namespace pokerpro::core
{
    class EquityProvider final : public StrategyProvider
    {
    public:
        auto Suggest(Model const& model, SeatIdxT seat) -> std::expected<Decision, std::string> override;

        // 0..1; needs both hole cards, board optional
        static auto Strength(std::span<Card const> hole, std::span<Card const> board) -> double;
    };
}

#endif //POKERPRO_EQUITYPROVIDER_HPP
