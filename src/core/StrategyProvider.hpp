//
// StrategyProvider.hpp — external source of advisory decisions
//

#ifndef POKERPRO_STRATEGYPROVIDER_HPP
#define POKERPRO_STRATEGYPROVIDER_HPP

#include <expected>
#include <string>

#include "Messages.hpp"
#include "Model.hpp"

namespace pokerpro::core
{
    class StrategyProvider
    {
    public:
        virtual ~StrategyProvider() = default;

        // unexpected(reason) when the provider has no answer for this spot
        virtual auto Suggest(Model const& model, SeatIdxT seat) -> std::expected<Decision, std::string> = 0;
    };
}

#endif //POKERPRO_STRATEGYPROVIDER_HPP
