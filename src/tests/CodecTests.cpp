#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <span>
#include <variant>
#include <vector>

#include "../core/TurnEngine.hpp"
#include "../core/MeldValidator.hpp"
#include "../core/Exception.hpp"
#include "../net/codec.hpp"
#include "TestUtil.hpp"

#include "generated/flatbuffers/rummikub_net_generated.h"

using namespace rummikub::core;
using namespace rummikub::test;
namespace fbn = rummikub::gen::net;

namespace
{
    auto StartedGame(uint64_t seed) -> GameState
    {
        Config cfg{};
        cfg.seed = seed;
        cfg.n_players = 3;
        cfg.check_invariants = true;
        TurnEngine const engine(cfg);

        GameState g = engine.CreateGame("codec-game").value();
        g = engine.Join(g, "alice").value();
        g = engine.Join(g, "bob").value();
        g = engine.Join(g, "carol").value();
        g = engine.Draw(g, g.players[0].id).value();
        g.version = 9;
        return g;
    }

    // PlayerActionMsg whose meld carries a tile id the codec does not know
    auto MakeBadTileAction() -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        std::vector<flatbuffers::Offset<flatbuffers::String>> tiles{
            fbb.CreateString("3ra"), fbb.CreateString("4ra"), fbb.CreateString("99za")
        };
        auto const meld = fbn::CreateMeld(fbb, fbn::MeldKind::Run, fbb.CreateVector(tiles));
        std::vector<flatbuffers::Offset<fbn::Meld>> melds{meld};
        auto const play = fbn::CreateAction_PlayTiles(fbb, fbb.CreateVector(melds));
        auto const pam = fbn::CreatePlayerActionMsg(fbb, 5, fbb.CreateString("g"), fbb.CreateString("p"),
                                                    fbn::Action::Action_PlayTiles, play.Union());
        fbb.Finish(fbn::CreateEnvelope(fbb, fbn::Message::PlayerActionMsg, pam.Union()));
        return fbb.Release();
    }
}

TEST(Codec, Snapshot_From_Live_Game_Decodes)
{
    GameState const g = StartedGame(0xA11CE5EEDULL);
    TurnEngine const engine{};
    auto const snap = engine.SnapshotFor(g, g.players[1].id).value();

    auto const buf = net::BuildSnapshot(*snap, 77);
    auto const back = net::DecodeSnapshot(net::AsBytes(buf));
    ASSERT_TRUE(back.has_value()) << back.error().message;

    EXPECT_EQ(back->game_id, "codec-game");
    EXPECT_EQ(back->game_name, g.game_name);
    EXPECT_EQ(back->status, GameStatus::InProgress);
    EXPECT_EQ(back->viewer_id, g.players[1].id);
    EXPECT_EQ(back->my_rack, g.players[1].rack);
    EXPECT_EQ(back->pool_size, g.pool.size());
    EXPECT_EQ(back->version, 9u);
    EXPECT_FALSE(back->winner_id.has_value());

    ASSERT_EQ(back->players.size(), 3u);
    EXPECT_EQ(back->players[0].rack_size, constants::RackSize + 1);
    EXPECT_EQ(back->players[2].name, std::optional<std::string>{"carol"});
}

TEST(Codec, PlayTiles_Action_Keeps_Meld_Order)
{
    std::vector<Meld> const melds{Run({"jb", "2ob", "3ob"}), Group({"10ba", "10ka", "10ra"})};
    auto const buf = net::BuildAction("g1", "p1", PlayTilesAction{melds}, 12);

    auto const back = net::DecodePlayerAction(net::AsBytes(buf));
    ASSERT_TRUE(back.has_value()) << back.error().message;
    EXPECT_EQ(back->msg_id, 12u);
    EXPECT_EQ(back->game_id, "g1");
    EXPECT_EQ(back->player_id, "p1");

    auto const* play = std::get_if<PlayTilesAction>(&back->action);
    ASSERT_NE(play, nullptr);
    ASSERT_EQ(play->melds.size(), 2u);
    EXPECT_EQ(play->melds[0].kind, MeldKind::Run);
    EXPECT_EQ(play->melds[0].tiles, melds[0].tiles);
    EXPECT_EQ(play->melds[1].tiles, melds[1].tiles);
    EXPECT_TRUE(meld::SameMeld(play->melds[1], melds[1]));
}

TEST(Codec, Draw_Action_Decodes)
{
    auto const buf = net::BuildAction_Draw("g1", "p2", 3);
    auto const back = net::DecodePlayerAction(net::AsBytes(buf));
    ASSERT_TRUE(back.has_value());
    EXPECT_TRUE(std::holds_alternative<DrawAction>(back->action));
    EXPECT_EQ(back->player_id, "p2");
}

TEST(Codec, Violation_Carries_Stable_Reason)
{
    error::RuleViolation v{.code = error::RuleViolationCode::InitialMeldNotMet};
    v.with_player("A").with_points(27).with_threshold(30);

    auto const buf = net::BuildViolation(v, 4);
    auto const back = net::DecodeViolation(net::AsBytes(buf));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, error::RuleViolationCode::InitialMeldNotMet);
    EXPECT_EQ(back->reason, error::reason_code(v.code));
    EXPECT_EQ(back->description, error::describe(v));
    EXPECT_NE(back->description.find("points=27"), std::string::npos);
}

TEST(Codec, Game_Record_Restores_State)
{
    GameState const g = StartedGame(0xF00DF00DULL);
    auto const bytes = net::EncodeGameRecord(g);

    auto const back = net::DecodeGameRecord(net::AsBytes(bytes));
    ASSERT_TRUE(back.has_value()) << back.error().message;
    EXPECT_EQ(back->game_id, g.game_id);
    EXPECT_EQ(back->pool, g.pool);
    EXPECT_EQ(back->status, g.status);
    EXPECT_EQ(back->current_player_index, g.current_player_index);
    EXPECT_EQ(back->version, g.version);
    ASSERT_EQ(back->players.size(), g.players.size());
    for (size_t i = 0; i < g.players.size(); ++i)
    {
        EXPECT_EQ(back->players[i].id, g.players[i].id);
        EXPECT_EQ(back->players[i].name, g.players[i].name);
        EXPECT_EQ(back->players[i].rack, g.players[i].rack);
    }
}

TEST(Codec, Rejects_Garbage_And_Wrong_Message)
{
    std::array<std::byte, 3> tiny{};
    EXPECT_FALSE(net::DecodePlayerAction(tiny).has_value());

    std::vector<std::byte> junk(64, std::byte{0x5A});
    EXPECT_FALSE(net::DecodeSnapshot(junk).has_value());

    // a valid buffer of another message type
    auto const draw = net::BuildAction_Draw("g1", "p2", 3);
    auto const as_snapshot = net::DecodeSnapshot(net::AsBytes(draw));
    ASSERT_FALSE(as_snapshot.has_value());
    EXPECT_NE(as_snapshot.error().message.find("unexpected message type"), std::string::npos);
}

TEST(Codec, Rejects_Unknown_Tile_Text)
{
    auto const buf = MakeBadTileAction();
    auto const back = net::DecodePlayerAction(net::AsBytes(buf));
    ASSERT_FALSE(back.has_value());
    EXPECT_NE(back.error().message.find("99za"), std::string::npos);
}
