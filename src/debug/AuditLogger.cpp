#include "AuditLogger.hpp"

#include <format>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <utility>

using namespace pokerpro::core;

namespace
{

auto s_seat(std::optional<SeatIdxT> s) -> std::string
{
    return s ? std::format("S{}", static_cast<int>(*s)) : std::string("--");
}

auto s_board(Board const& b) -> std::string
{
    std::string body;
    for (size_t i{}; i < b.size(); ++i)
    {
        body += (i ? "," : "");
        body += b[i];
    }
    return body;
}

auto s_seats(SeatMap const& seats) -> std::string
{
    std::string body;
    bool first = true;
    for (auto const& [idx, s] : seats)
    {
        body += std::format("{}S{}:{}/{}{}{}",
                            first ? "" : ",",
                            static_cast<int>(idx),
                            s.stack,
                            s.chips_in_front,
                            s.folded ? "F" : "",
                            s.all_in ? "A" : "");
        first = false;
    }
    return body;
}

auto s_message(Msg const& m) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& v) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, msg::UserChose>)
            {
                return std::format("UserChose({} {} {})", s_seat(v.seat), to_string(v.kind), v.amount);
            }
            else if constexpr (std::is_same_v<T, msg::DecisionReady> || std::is_same_v<T, msg::HintReady>)
            {
                return std::format("{}(S{} {} {})", T::name, static_cast<int>(v.seat), to_string(v.decision.kind),
                                   v.decision.amount);
            }
            else if constexpr (std::is_same_v<T, msg::AnimationFinished>)
            {
                return std::format("AnimationFinished({})", v.token);
            }
            else if constexpr (std::is_same_v<T, msg::SeekReview>)
            {
                return std::format("SeekReview({})", v.index);
            }
            else if constexpr (std::is_same_v<T, msg::LoadHand>)
            {
                return std::format("LoadHand({} {})", v.hand->hand_id, to_string(v.mode));
            }
            else if constexpr (std::is_same_v<T, msg::ActionApplied>)
            {
                return std::format("ActionApplied(S{} {} {} step={})", static_cast<int>(v.action.seat),
                                   to_string(v.action.kind), v.action.amount,
                                   v.step ? std::to_string(*v.step) : std::string("-"));
            }
            else if constexpr (std::is_same_v<T, msg::StreetAdvanced>)
            {
                return std::format("StreetAdvanced({} [{}])", to_string(v.street), s_board(*v.board));
            }
            else if constexpr (std::is_same_v<T, msg::HandFinished>)
            {
                std::string body;
                for (size_t i{}; i < v.payouts.size(); ++i)
                {
                    body += std::format("{}S{}+{}", i ? "," : "", static_cast<int>(v.payouts[i].seat), v.payouts[i].amount);
                }
                return std::format("HandFinished([{}])", body);
            }
            else if constexpr (std::is_same_v<T, msg::EngineRejected>)
            {
                return std::format("EngineRejected({} {})", s_seat(v.seat), v.reason);
            }
            else
            {
                return std::string(T::name);
            }
        },
        m
    );
}

} // anonymous namespace

namespace pokerpro::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(HandData const& hand, SessionMode mode, std::uint64_t seed) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Hand={}\n", hand.hand_id);
    out_ << std::format("Mode={}\n", to_string(mode));
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Seats=[{}]\n", s_seats(hand.seats));
    out_ << std::format("Board=[{}] Actions={}\n", s_board(hand.board), hand.actions.size());
    lines_ += 5;
    out_.flush();
}

auto AuditLogger::message(Msg const& m) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Msg: {}\n", s_message(m));
    ++lines_;
}

auto AuditLogger::outcome(Model const& m, std::optional<error::Rejection> const& rejection, bool committed) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (rejection)
    {
        out_ << std::format("Rejected: {}\n", error::describe(*rejection));
        ++lines_;
        return;
    }
    out_ << std::format(
        "{} tx={} street={} wait={} toAct={} pot={} board=[{}] cursor={}/{}\n",
        committed ? "Commit" : "Same",
        m.tx_id,
        to_string(m.street),
        to_string(m.waiting_for),
        s_seat(m.to_act_seat),
        m.pot,
        s_board(*m.board),
        m.review_cursor,
        m.review_length
    );
    ++lines_;
}

auto AuditLogger::end(Model const& m) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("End street={} seats=[{}]\n", to_string(m.street), s_seats(*m.seats));
    ++lines_;
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
}

auto AuditLogger::lines() const -> std::uint64_t
{
    std::lock_guard<std::mutex> lock(mtx_);
    return lines_;
}

auto AuditLogger::TapFor(std::shared_ptr<AuditLogger> logger) -> Store::Tap
{
    return [logger = std::move(logger)](Msg const& m, Model const& model,
                                        std::optional<error::Rejection> const& rejection, bool committed)
    {
        logger->message(m);
        logger->outcome(model, rejection, committed);
    };
}

} // namespace pokerpro::core::debug
