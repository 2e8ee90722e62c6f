//
// Codec.cpp
//
#include "codec.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <format>
#include <utility>
#include <vector>

#include "../core/TileCodec.hpp"

namespace fb = rummikub::gen::net;

namespace rummikub::core::net
{
    auto ToFbKind(rummikub::core::MeldKind k) noexcept -> fb::MeldKind
    {
        switch (k)
        {
        case rummikub::core::MeldKind::Group: return fb::MeldKind::Group;
        case rummikub::core::MeldKind::Run: return fb::MeldKind::Run;
        }
        return fb::MeldKind::Group;
    }

    auto FromFbKind(fb::MeldKind k) -> std::expected<rummikub::core::MeldKind, ParseError>
    {
        switch (k)
        {
        case fb::MeldKind::Group: return rummikub::core::MeldKind::Group;
        case fb::MeldKind::Run: return rummikub::core::MeldKind::Run;
        }
        return std::unexpected(ParseError{std::format("unknown meld kind {}", static_cast<int>(k))});
    }

    auto ToFbStatus(rummikub::core::GameStatus s) noexcept -> fb::GameStatus
    {
        switch (s)
        {
        case rummikub::core::GameStatus::WaitingForPlayers: return fb::GameStatus::WaitingForPlayers;
        case rummikub::core::GameStatus::InProgress: return fb::GameStatus::InProgress;
        case rummikub::core::GameStatus::Completed: return fb::GameStatus::Completed;
        }
        return fb::GameStatus::WaitingForPlayers;
    }

    auto FromFbStatus(fb::GameStatus s) -> std::expected<rummikub::core::GameStatus, ParseError>
    {
        switch (s)
        {
        case fb::GameStatus::WaitingForPlayers: return rummikub::core::GameStatus::WaitingForPlayers;
        case fb::GameStatus::InProgress: return rummikub::core::GameStatus::InProgress;
        case fb::GameStatus::Completed: return rummikub::core::GameStatus::Completed;
        }
        return std::unexpected(ParseError{std::format("unknown game status {}", static_cast<int>(s))});
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)rummikub::core::MeldKind::Run == (int)fb::MeldKind::Run);
    static_assert((int)rummikub::core::GameStatus::Completed == (int)fb::GameStatus::Completed);

    using rummikub::core::net::ParseError;
    using StringOffsets = std::vector<flatbuffers::Offset<flatbuffers::String>>;
    using FbStrings = flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>>;

    constexpr std::uint16_t SchemaVersion = 1;

    inline auto TileStrings(flatbuffers::FlatBufferBuilder& fbb, std::span<rummikub::core::TileId const> ids)
        -> flatbuffers::Offset<FbStrings>
    {
        StringOffsets out;
        out.reserve(ids.size());
        for (auto const id : ids) out.push_back(fbb.CreateString(rummikub::core::tiles::ToString(id)));
        return fbb.CreateVector(out);
    }

    inline auto OptString(flatbuffers::FlatBufferBuilder& fbb, std::optional<std::string> const& s)
        -> flatbuffers::Offset<flatbuffers::String>
    {
        return s ? fbb.CreateString(*s) : flatbuffers::Offset<flatbuffers::String>{};
    }

    inline auto ToFbMelds(flatbuffers::FlatBufferBuilder& fbb, std::span<rummikub::core::Meld const> melds)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::Meld>>>
    {
        std::vector<flatbuffers::Offset<fb::Meld>> out;
        out.reserve(melds.size());
        for (rummikub::core::Meld const& m : melds)
        {
            auto const tiles = TileStrings(fbb, m.tiles);
            out.push_back(fb::CreateMeld(fbb, rummikub::core::net::ToFbKind(m.kind), tiles));
        }
        return fbb.CreateVector(out);
    }

    inline auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    inline auto OptStr(flatbuffers::String const* s) -> std::optional<std::string>
    {
        if (!s) return std::nullopt;
        return s->str();
    }

    auto FromFbTiles(FbStrings const* v) -> std::expected<std::vector<rummikub::core::TileId>, ParseError>
    {
        std::vector<rummikub::core::TileId> out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* s : *v)
        {
            std::string_view const text = s ? s->string_view() : std::string_view{};
            auto const id = rummikub::core::tiles::Parse(text);
            if (!id) return std::unexpected(ParseError{std::format("unknown tile '{}'", text)});
            out.push_back(*id);
        }
        return out;
    }

    auto FromFbMelds(flatbuffers::Vector<flatbuffers::Offset<fb::Meld>> const* v)
        -> std::expected<std::vector<rummikub::core::Meld>, ParseError>
    {
        std::vector<rummikub::core::Meld> out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* m : *v)
        {
            auto const kind = rummikub::core::net::FromFbKind(m->kind());
            if (!kind) return std::unexpected(kind.error());
            auto tiles = FromFbTiles(m->tiles());
            if (!tiles) return std::unexpected(tiles.error());
            out.push_back(rummikub::core::Meld{*kind, std::move(*tiles)});
        }
        return out;
    }

    // Verified envelope of the expected message type
    auto OpenEnvelope(std::span<std::byte const> bytes, fb::Message expected)
        -> std::expected<fb::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        auto const* env = fb::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});

        if (env->message_type() != expected)
            return std::unexpected(ParseError{std::format("unexpected message type {}",
                                                          fb::EnumNameMessage(env->message_type()))});
        return env;
    }

    inline auto ToMillis(rummikub::core::Timestamp t) -> std::int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }

    inline auto FromMillis(std::int64_t ms) -> rummikub::core::Timestamp
    {
        return rummikub::core::Timestamp{std::chrono::duration_cast<rummikub::core::Timestamp::duration>(
            std::chrono::milliseconds{ms})};
    }
} // anonymous

namespace rummikub::core::net
{
    // ---------- Snapshot (server → client) ----------

    auto BuildSnapshot(rummikub::core::ViewerSnapshot const& snap,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const board = ToFbMelds(fbb, snap.board);
        auto const my_rack = TileStrings(fbb, snap.my_rack);

        std::vector<flatbuffers::Offset<fb::SeatView>> seats;
        seats.reserve(snap.players.size());
        for (rummikub::core::PlayerView const& p : snap.players)
        {
            auto const id = fbb.CreateString(p.id);
            auto const name = OptString(fbb, p.name);
            seats.push_back(fb::CreateSeatView(fbb, id, name, p.rack_size, p.initial_meld_met));
        }
        auto const seats_vec = fbb.CreateVector(seats);

        auto const game_id = fbb.CreateString(snap.game_id);
        auto const game_name = fbb.CreateString(snap.game_name);
        auto const winner = OptString(fbb, snap.winner_id);
        auto const viewer = fbb.CreateString(snap.viewer_id);

        auto const sm = fb::CreateSnapshotMsg(
            fbb,
            /*msg_id*/ msg_id,
            /*schema_version*/ SchemaVersion,
            /*game_id*/ game_id,
            /*game_name*/ game_name,
            /*status*/ ToFbStatus(snap.status),
            /*current_player_index*/ snap.current_player_index,
            /*winner_id*/ winner,
            /*board*/ board,
            /*pool_size*/ snap.pool_size,
            /*viewer_id*/ viewer,
            /*my_rack*/ my_rack,
            /*my_initial_meld_met*/ snap.my_initial_meld_met,
            /*players*/ seats_vec,
            /*version*/ snap.version
        );

        auto const env = fb::CreateEnvelope(fbb, fb::Message::SnapshotMsg, sm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Violation (server → client) ----------

    auto BuildViolation(rummikub::core::error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const reason = fbb.CreateString(rummikub::core::error::reason_code(v.code));
        auto const txt = fbb.CreateString(rummikub::core::error::describe(v));
        auto const vio = fb::CreateViolation(
            fbb, msg_id, static_cast<uint16_t>(v.code), reason, txt);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::Violation, vio.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Builders (client → server) ----------

    auto BuildAction_PlayTiles(std::string_view game_id,
                               std::string_view player_id,
                               std::span<rummikub::core::Meld const> melds,
                               std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const melds_vec = ToFbMelds(fbb, melds);
        auto const a = fb::CreateAction_PlayTiles(fbb, melds_vec);
        auto const gid = fbb.CreateString(game_id);
        auto const pid = fbb.CreateString(player_id);
        auto const m = fb::CreatePlayerActionMsg(
            fbb, msg_id, gid, pid, fb::Action::Action_PlayTiles, a.Union());
        auto const e = fb::CreateEnvelope(fbb, fb::Message::PlayerActionMsg, m.Union());
        fbb.Finish(e);
        return fbb.Release();
    }

    auto BuildAction_Draw(std::string_view game_id,
                          std::string_view player_id,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const d = fb::CreateAction_Draw(fbb);
        auto const gid = fbb.CreateString(game_id);
        auto const pid = fbb.CreateString(player_id);
        auto const m = fb::CreatePlayerActionMsg(
            fbb, msg_id, gid, pid, fb::Action::Action_Draw, d.Union());
        auto const e = fb::CreateEnvelope(fbb, fb::Message::PlayerActionMsg, m.Union());
        fbb.Finish(e);
        return fbb.Release();
    }

    auto BuildAction(std::string_view game_id,
                     std::string_view player_id,
                     rummikub::core::PlayerAction const& action,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, rummikub::core::PlayTilesAction>)
                return BuildAction_PlayTiles(game_id, player_id, act.melds, msg_id);
            else
                return BuildAction_Draw(game_id, player_id, msg_id);
        }, action);
    }

    // ---------- Decode (client/server ← inbound wire) ----------

    auto DecodePlayerAction(std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>
    {
        auto const env = OpenEnvelope(bytes, fb::Message::PlayerActionMsg);
        if (!env) return std::unexpected(env.error());

        auto const* pam = (*env)->message_as_PlayerActionMsg();

        DecodedAction out{};
        out.msg_id = pam->msg_id();
        out.game_id = Str(pam->game_id());
        out.player_id = Str(pam->player_id());

        switch (pam->action_type())
        {
        case fb::Action::Action_PlayTiles:
        {
            auto melds = FromFbMelds(pam->action_as_Action_PlayTiles()->melds());
            if (!melds) return std::unexpected(melds.error());
            out.action = rummikub::core::PlayTilesAction{std::move(*melds)};
            return out;
        }
        case fb::Action::Action_Draw:
            out.action = rummikub::core::DrawAction{};
            return out;
        default:
            return std::unexpected(ParseError{"unknown action kind"});
        }
    }

    auto DecodeSnapshot(std::span<std::byte const> bytes)
        -> std::expected<rummikub::core::ViewerSnapshot, ParseError>
    {
        auto const env = OpenEnvelope(bytes, fb::Message::SnapshotMsg);
        if (!env) return std::unexpected(env.error());
        auto const* sm = (*env)->message_as_SnapshotMsg();

        rummikub::core::ViewerSnapshot out{};
        out.game_id = Str(sm->game_id());
        out.game_name = Str(sm->game_name());

        auto const status = FromFbStatus(sm->status());
        if (!status) return std::unexpected(status.error());
        out.status = *status;

        out.current_player_index = sm->current_player_index();
        out.winner_id = OptStr(sm->winner_id());

        auto board = FromFbMelds(sm->board());
        if (!board) return std::unexpected(board.error());
        out.board = std::move(*board);

        out.pool_size = sm->pool_size();
        out.viewer_id = Str(sm->viewer_id());

        auto rack = FromFbTiles(sm->my_rack());
        if (!rack) return std::unexpected(rack.error());
        out.my_rack = std::move(*rack);
        out.my_initial_meld_met = sm->my_initial_meld_met();

        if (auto const* seats = sm->players())
        {
            for (auto const* s : *seats)
            {
                out.players.push_back(rummikub::core::PlayerView{
                    .id = Str(s->player_id()),
                    .name = OptStr(s->name()),
                    .rack_size = s->rack_size(),
                    .initial_meld_met = s->initial_meld_met()
                });
            }
        }
        out.version = sm->version();
        return out;
    }

    auto DecodeViolation(std::span<std::byte const> bytes)
        -> std::expected<DecodedViolation, ParseError>
    {
        auto const env = OpenEnvelope(bytes, fb::Message::Violation);
        if (!env) return std::unexpected(env.error());
        auto const* v = (*env)->message_as_Violation();

        using RVC = rummikub::core::error::RuleViolationCode;
        if (v->code() > std::to_underlying(RVC::Internal_Unreachable))
            return std::unexpected(ParseError{std::format("unknown violation code {}", v->code())});

        return DecodedViolation{
            .msg_id = v->msg_id(),
            .code = static_cast<RVC>(v->code()),
            .reason = Str(v->reason()),
            .description = Str(v->description())
        };
    }

    // ---------- Game record (store) ----------

    auto EncodeGameRecord(rummikub::core::GameState const& g) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::PlayerRecord>> players;
        players.reserve(g.players.size());
        for (rummikub::core::PlayerState const& p : g.players)
        {
            auto const id = fbb.CreateString(p.id);
            auto const name = OptString(fbb, p.name);
            auto const rack = TileStrings(fbb, p.rack);
            players.push_back(fb::CreatePlayerRecord(fbb, id, name, rack, p.initial_meld_met));
        }
        auto const players_vec = fbb.CreateVector(players);
        auto const pool = TileStrings(fbb, g.pool);
        auto const board = ToFbMelds(fbb, g.board);
        auto const game_id = fbb.CreateString(g.game_id);
        auto const game_name = fbb.CreateString(g.game_name);
        auto const winner = OptString(fbb, g.winner_id);

        auto const rec = fb::CreateGameRecord(
            fbb,
            /*schema_version*/ SchemaVersion,
            /*game_id*/ game_id,
            /*game_name*/ game_name,
            /*players*/ players_vec,
            /*pool*/ pool,
            /*board*/ board,
            /*current_player_index*/ g.current_player_index,
            /*status*/ ToFbStatus(g.status),
            /*winner_id*/ winner,
            /*created_at_ms*/ ToMillis(g.created_at),
            /*updated_at_ms*/ ToMillis(g.updated_at),
            /*version*/ g.version
        );
        auto const env = fb::CreateEnvelope(fbb, fb::Message::GameRecord, rec.Union());
        fbb.Finish(env);

        std::vector<std::uint8_t> out(fbb.GetSize());
        std::memcpy(out.data(), fbb.GetBufferPointer(), fbb.GetSize());
        return out;
    }

    auto DecodeGameRecord(std::span<std::byte const> bytes)
        -> std::expected<rummikub::core::GameState, ParseError>
    {
        auto const env = OpenEnvelope(bytes, fb::Message::GameRecord);
        if (!env) return std::unexpected(env.error());
        auto const* rec = (*env)->message_as_GameRecord();

        rummikub::core::GameState g{};
        g.game_id = Str(rec->game_id());
        g.game_name = Str(rec->game_name());

        if (auto const* players = rec->players())
        {
            for (auto const* p : *players)
            {
                auto rack = FromFbTiles(p->rack());
                if (!rack) return std::unexpected(rack.error());
                g.players.push_back(rummikub::core::PlayerState{
                    .id = Str(p->id()),
                    .name = OptStr(p->name()),
                    .rack = std::move(*rack),
                    .initial_meld_met = p->initial_meld_met()
                });
            }
        }

        auto pool = FromFbTiles(rec->pool());
        if (!pool) return std::unexpected(pool.error());
        g.pool = std::move(*pool);

        auto board = FromFbMelds(rec->board());
        if (!board) return std::unexpected(board.error());
        g.board = std::move(*board);

        auto const status = FromFbStatus(rec->status());
        if (!status) return std::unexpected(status.error());
        g.status = *status;

        g.current_player_index = rec->current_player_index();
        g.winner_id = OptStr(rec->winner_id());
        g.created_at = FromMillis(rec->created_at_ms());
        g.updated_at = FromMillis(rec->updated_at_ms());
        g.version = rec->version();
        return g;
    }
}
