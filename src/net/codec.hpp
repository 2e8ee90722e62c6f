//
// Created by Malik T on 21/08/2025.
//

#ifndef RUMMIKUB_CODEC_HPP
#define RUMMIKUB_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/rummikub_net_generated.h"

namespace rummikub::core::net
{
    // Lightweight local parse error (as permitted)
    struct ParseError
    {
        std::string message;
    };

    // What a player action decodes into
    struct DecodedAction
    {
        std::uint64_t msg_id{};
        std::string game_id;
        std::string player_id;
        rummikub::core::PlayerAction action{};
    };

    struct DecodedViolation
    {
        std::uint64_t msg_id{};
        rummikub::core::error::RuleViolationCode code{};
        std::string reason;
        std::string description;
    };

    auto ToFbKind(rummikub::core::MeldKind k) noexcept -> rummikub::gen::net::MeldKind;
    auto ToFbStatus(rummikub::core::GameStatus s) noexcept -> rummikub::gen::net::GameStatus;

    auto FromFbKind(rummikub::gen::net::MeldKind k) -> std::expected<rummikub::core::MeldKind, ParseError>;
    auto FromFbStatus(rummikub::gen::net::GameStatus s) -> std::expected<rummikub::core::GameStatus, ParseError>;

    // --- Outbound builders (server → client, client → server) ---

    auto BuildSnapshot(rummikub::core::ViewerSnapshot const& snap,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(rummikub::core::error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // The whole board the player proposes to leave behind
    auto BuildAction_PlayTiles(std::string_view game_id,
                               std::string_view player_id,
                               std::span<rummikub::core::Meld const> melds,
                               std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Draw(std::string_view game_id,
                          std::string_view player_id,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction(std::string_view game_id,
                     std::string_view player_id,
                     rummikub::core::PlayerAction const& action,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified envelope → value) ---

    auto DecodePlayerAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>;

    auto DecodeSnapshot(std::span<std::byte const> bytes)
        -> std::expected<rummikub::core::ViewerSnapshot, ParseError>;

    auto DecodeViolation(std::span<std::byte const> bytes)
        -> std::expected<DecodedViolation, ParseError>;

    // --- Authoritative state, used by the game store ---

    auto EncodeGameRecord(rummikub::core::GameState const& g) -> std::vector<std::uint8_t>;

    auto DecodeGameRecord(std::span<std::byte const> bytes)
        -> std::expected<rummikub::core::GameState, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return std::as_bytes(std::span{buf.data(), buf.size()});
    }

    inline auto AsBytes(std::vector<std::uint8_t> const& buf) -> std::span<std::byte const>
    {
        return std::as_bytes(std::span{buf});
    }
} // namespace rummikub::core::net


#endif //RUMMIKUB_CODEC_HPP
