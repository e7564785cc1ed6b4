//
// Props.cpp
//

#include "Props.hpp"

#include <utility>

namespace pokerpro::core
{
    auto TableProps::FromModel(Model const& m) -> TableProps
    {
        return TableProps{
            .hand_id = m.hand_id,
            .street = m.street,
            .seats = m.seats,
            .board = m.board,
            .pot = m.pot,
            .to_act_seat = m.to_act_seat,
            .legal_actions = m.legal_actions,
            .last_action = m.last_action,
            .banners = m.banners,
            .theme_id = m.theme_id,
            .autoplay_on = m.autoplay_on,
            .waiting_for = m.waiting_for,
            .review_cursor = m.review_cursor,
            .review_length = m.review_length,
            .review_paused = m.review_paused,
            .session_mode = m.session_mode,
            .hint = m.hint
        };
    }

    PropsGate::PropsGate(Render render) :
        render_(std::move(render)) {}

    auto PropsGate::Offer(Model const& model) -> bool
    {
        TableProps props = TableProps::FromModel(model);
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (last_ && *last_ == props)
            {
                return false;
            }
            last_ = props;
            ++renders_;
        }
        if (render_)
        {
            render_(props);
        }
        return true;
    }

    auto PropsGate::RenderCount() const -> uint64_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return renders_;
    }

    auto PropsGate::Last() const -> std::optional<TableProps>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return last_;
    }

    auto SubscribeProps(Store& store, std::shared_ptr<PropsGate> gate) -> Store::Unsubscribe
    {
        return store.Subscribe([gate = std::move(gate)](ModelSP const& model)
        {
            gate->Offer(*model);
        });
    }
}
