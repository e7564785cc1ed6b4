//
// Engine.cpp
//

#include "Engine.hpp"

namespace pokerpro::core
{
    auto FeedbackFor(EngineResult const& result) -> std::vector<Msg>
    {
        std::vector<Msg> out;
        switch (result.outcome)
        {
        case EngineOutcome::Applied:
            PPR_ASSERT(result.action.has_value(), "applied result without an action");
            out.emplace_back(msg::ActionApplied{.action = *result.action, .table = result.table});
            break;
        case EngineOutcome::StreetDealt:
            out.emplace_back(msg::StreetAdvanced{
                .street = result.street,
                .board = Frozen<Board>{result.board},
                .table = result.table
            });
            break;
        case EngineOutcome::HandEnded:
            out.emplace_back(msg::HandFinished{
                .payouts = result.payouts,
                .table = result.table,
                .final_action = result.action
            });
            break;
        }
        return out;
    }
}
