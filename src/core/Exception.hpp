//
// Exception.hpp — error codes, throw helpers and ordinary rejection reasons
//

#ifndef POKERPRO_EXCEPTION_HPP
#define POKERPRO_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "Types.hpp"

namespace pokerpro::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Reducer, // reducer reached a state it cannot represent
        Store, // store misuse (missing collaborator, bad wiring)
        Engine, // engine misuse (not a user invalid move)
        Driver, // session driver failure
        InvalidAction, // proposed action cannot be applied
        Serialization, // FlatBuffers verification/build errors
        Network, // transport failure
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ReducerError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StoreError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct EngineError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct DriverError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Reducer: throw ReducerError(std::move(msg), c);
        case Code::Store: throw StoreError(std::move(msg), c);
        case Code::Engine: throw EngineError(std::move(msg), c);
        case Code::Driver: throw DriverError(std::move(msg), c);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Network: throw NetworkError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define PPR_THROW(code_enum, msg) ::pokerpro::core::error::fail((code_enum), (msg))
#define PPR_ASSERT(cond, msg) do { if(!(cond)) ::pokerpro::core::error::fail(::pokerpro::core::error::Code::Assertion, (msg)); } while(0)

    // Ordinary, expected refusals; grouped by who produces them.
    enum class RejectionCode : std::uint16_t
    {
        // Reducer flow
        WrongWaitState,
        WrongActor,
        IllegalAction,
        NoSeatToAct,
        StaleToken,
        AutoplayStopped,
        EnginePending,
        EngineIdle,
        HandOver,

        // Replay
        NotReplayMode,
        NoReviewPositions,
        ScriptExhausted,
        StaleScriptStep,
        HandMismatch,

        // Table consistency
        BoardMismatch,
        StreetRegression,
        InvalidHand,
        DuplicateCards,
        NoHandLoaded,

        // Engine
        BetTooSmall,
        BetTooLarge,
        SeatNotFound,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the rejection.
    struct Rejection
    {
        RejectionCode code{};
        std::optional<WaitingFor> waiting{};
        std::optional<SeatIdxT> seat{};
        std::optional<SeatIdxT> expected_seat{};
        std::optional<ActionKind> kind{};
        std::optional<Chips> amount{};
        std::optional<Chips> limit{};
        std::optional<TxId> token{};
        std::optional<TxId> expected_token{};
        std::optional<Street> street{};
        std::optional<std::string> detail{};

        auto with_waiting(WaitingFor w) -> Rejection&
        {
            waiting = w;
            return *this;
        }

        auto with_seat(SeatIdxT s) -> Rejection&
        {
            seat = s;
            return *this;
        }

        auto with_expected_seat(std::optional<SeatIdxT> s) -> Rejection&
        {
            expected_seat = s;
            return *this;
        }

        auto with_kind(ActionKind k) -> Rejection&
        {
            kind = k;
            return *this;
        }

        auto with_amount(Chips a) -> Rejection&
        {
            amount = a;
            return *this;
        }

        auto with_limit(Chips l) -> Rejection&
        {
            limit = l;
            return *this;
        }

        auto with_token(TxId got, TxId want) -> Rejection&
        {
            token = got;
            expected_token = want;
            return *this;
        }

        auto with_street(Street s) -> Rejection&
        {
            street = s;
            return *this;
        }

        auto with_detail(std::string d) -> Rejection&
        {
            detail = std::move(d);
            return *this;
        }

        auto operator==(Rejection const&) const -> bool = default;
    };

    inline auto to_string(RejectionCode c) -> std::string_view
    {
        using E = RejectionCode;
        switch (c)
        {
        case E::WrongWaitState: return "Message not expected in current waiting state";
        case E::WrongActor: return "Wrong actor (seat to act required)";
        case E::IllegalAction: return "Action kind not legal right now";
        case E::NoSeatToAct: return "No seat is required to act";
        case E::StaleToken: return "Stale token";
        case E::AutoplayStopped: return "Autoplay stopped before the scheduled step";
        case E::EnginePending: return "Engine feedback still pending";
        case E::EngineIdle: return "Engine feedback without a pending request";
        case E::HandOver: return "Hand already finished";

        case E::NotReplayMode: return "Replay: session is not a replay";
        case E::NoReviewPositions: return "Replay: no review positions loaded";
        case E::ScriptExhausted: return "Replay: scripted events exhausted";
        case E::StaleScriptStep: return "Replay: stale scripted step";
        case E::HandMismatch: return "Replay: script belongs to another hand";

        case E::BoardMismatch: return "Board length does not match street";
        case E::StreetRegression: return "Street moved backwards";
        case E::InvalidHand: return "Hand payload invalid";
        case E::DuplicateCards: return "Duplicate cards in hand payload";
        case E::NoHandLoaded: return "No hand loaded";

        case E::BetTooSmall: return "Engine: bet below minimum";
        case E::BetTooLarge: return "Engine: bet exceeds stack";
        case E::SeatNotFound: return "Engine: seat not at table";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(Rejection const& r) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(r.code));
        if (r.waiting) s += std::format(" | waiting={}", to_string(*r.waiting));
        if (r.seat) s += std::format(" | seat={}", static_cast<int>(*r.seat));
        if (r.expected_seat) s += std::format(" | toAct={}", static_cast<int>(*r.expected_seat));
        if (r.kind) s += std::format(" | kind={}", to_string(*r.kind));
        if (r.amount) s += std::format(" | amount={}", *r.amount);
        if (r.limit) s += std::format(" | limit={}", *r.limit);
        if (r.token) s += std::format(" | token={}", *r.token);
        if (r.expected_token) s += std::format(" | txId={}", *r.expected_token);
        if (r.street) s += std::format(" | street={}", to_string(*r.street));
        if (r.detail) s += std::format(" | {}", *r.detail);
        return s;
    }

    using ValidateResult = std::expected<void, Rejection>;
}

#endif //POKERPRO_EXCEPTION_HPP
