//
// codec.hpp — FlatBuffers encoding of Props frames and decoding of viewer intents
//

#ifndef POKERPRO_CODEC_HPP
#define POKERPRO_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <flatbuffers/flatbuffers.h>

#include "../core/Messages.hpp"
#include "../core/Model.hpp"
#include "../core/Props.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/pokerpro_net_generated.h"

namespace pokerpro::core::net
{
    struct ParseError
    {
        std::string message;
    };

    struct DecodedProps
    {
        std::uint64_t msg_id{};
        TableProps props;
    };

    auto ToFbStreet(Street s) noexcept -> pokerpro::gen::net::Street;
    auto FromFbStreet(pokerpro::gen::net::Street s) noexcept -> Street;
    auto ToFbMode(SessionMode m) noexcept -> pokerpro::gen::net::SessionMode;
    auto FromFbMode(pokerpro::gen::net::SessionMode m) noexcept -> SessionMode;
    auto ToFbWaiting(WaitingFor w) noexcept -> pokerpro::gen::net::WaitingFor;
    auto FromFbWaiting(pokerpro::gen::net::WaitingFor w) noexcept -> WaitingFor;
    auto ToFbKind(ActionKind k) noexcept -> pokerpro::gen::net::ActionKind;
    auto FromFbKind(pokerpro::gen::net::ActionKind k) noexcept -> ActionKind;

    // --- Outbound (server → viewer) ---

    auto BuildProps(TableProps const& props, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildError(std::string_view reason, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Outbound (viewer → server) ---

    // Throws Serialization for messages that are not front-end intents.
    auto BuildIntent(Msg const& intent, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Inbound decode ---

    auto DecodeIntent(std::span<std::byte const> bytes) -> std::expected<Msg, ParseError>;

    auto DecodeProps(std::span<std::byte const> bytes) -> std::expected<DecodedProps, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace pokerpro::core::net

#endif //POKERPRO_CODEC_HPP
