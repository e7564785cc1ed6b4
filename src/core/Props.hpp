//
// Props.hpp — value-comparable projection of the Model for rendering
//

#ifndef POKERPRO_PROPS_HPP
#define POKERPRO_PROPS_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "Model.hpp"
#include "Store.hpp"

namespace pokerpro::core
{
    struct TableProps
    {
        std::string hand_id;
        Street street{Street::Preflop};
        Frozen<SeatMap> seats;
        Frozen<Board> board;
        Chips pot{};
        std::optional<SeatIdxT> to_act_seat;
        ActionSet legal_actions;
        std::optional<ActionRecord> last_action;
        Frozen<Banners> banners;
        std::string theme_id;
        bool autoplay_on{false};
        WaitingFor waiting_for{WaitingFor::None};
        uint32_t review_cursor{};
        uint32_t review_length{};
        bool review_paused{false};
        SessionMode session_mode{SessionMode::Practice};
        std::optional<Hint> hint;

        static auto FromModel(Model const& m) -> TableProps;

        auto operator==(TableProps const&) const -> bool = default;
    };

    // Forwards to render only when the projection changed.
    class PropsGate
    {
    public:
        using Render = std::function<void(TableProps const&)>;

        explicit PropsGate(Render render);

        auto Offer(Model const& model) -> bool;

        [[nodiscard]] auto RenderCount() const -> uint64_t;
        [[nodiscard]] auto Last() const -> std::optional<TableProps>;

    private:
        mutable std::mutex mtx_;
        Render render_;
        std::optional<TableProps> last_;
        uint64_t renders_{};
    };

    auto SubscribeProps(Store& store, std::shared_ptr<PropsGate> gate) -> Store::Unsubscribe;
}

#endif //POKERPRO_PROPS_HPP
