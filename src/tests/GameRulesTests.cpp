#include <gtest/gtest.h>
#include <vector>

#include "../core/GameRules.hpp"
#include "../core/Exception.hpp"
#include "TestUtil.hpp"

using namespace rummikub::core;
using namespace rummikub::test;
using RVC = error::RuleViolationCode;

TEST(GameRules, Newly_Played_Is_Set_Difference)
{
    std::vector<Meld> const board{Run({"3ra", "4ra", "5ra"})};
    std::vector<Meld> const extended{Run({"3ra", "4ra", "5ra", "6ra"})};

    EXPECT_EQ(rules::NewlyPlayed(extended, board), TileSet{T("6ra")});
    EXPECT_TRUE(rules::NewlyPlayed(board, board).empty());

    // splitting a run is a rearrangement, not a contribution
    std::vector<Meld> const before{Run({"3ra", "4ra", "5ra", "6ra", "7ra", "8ra"})};
    std::vector<Meld> const rearranged{Run({"3ra", "4ra", "5ra"}), Run({"6ra", "7ra", "8ra"})};
    EXPECT_TRUE(rules::NewlyPlayed(rearranged, before).empty());
}

TEST(GameRules, Turn_Owner_Gates_Status_And_Seat)
{
    GameState g = TwoPlayerGame(Tiles({"1ka"}), Tiles({"2ka"}));
    EXPECT_TRUE(rules::TurnOwnerOk(g, "A").has_value());

    auto const wrong = rules::TurnOwnerOk(g, "B");
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, RVC::NotPlayersTurn);
    EXPECT_EQ(wrong.error().seat, std::optional<PlyrIdxT>{0});

    g.status = GameStatus::WaitingForPlayers;
    EXPECT_EQ(rules::TurnOwnerOk(g, "A").error().code, RVC::GameNotStarted);

    g.status = GameStatus::Completed;
    EXPECT_EQ(rules::TurnOwnerOk(g, "A").error().code, RVC::GameFinished);
}

TEST(GameRules, Owns_Tiles_Names_Missing_Tile)
{
    GameState const g = TwoPlayerGame(Tiles({"1ka", "2ka", "ja"}), {});
    EXPECT_TRUE(rules::OwnsTiles(g.players[0], TileSet{T("1ka"), T("ja")}).has_value());

    auto const r = rules::OwnsTiles(g.players[0], TileSet{T("1ka"), T("3ka")});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::TileNotOwned);
    EXPECT_EQ(r.error().tile, std::optional<std::string>{"3ka"});
}

TEST(GameRules, Initial_Meld_Counts_Only_Melds_With_New_Tiles)
{
    GameState const g = TwoPlayerGame(Tiles({"10ka", "10ra", "10ba", "1ob", "2ob", "3ob"}), {});
    PlayerState const& a = g.players[0];

    std::vector<Meld> const thirty{Group({"10ka", "10ra", "10ba"})};
    EXPECT_TRUE(rules::InitialMeldOk(a, rules::NewlyPlayed(thirty, {}), thirty).has_value());

    std::vector<Meld> const six{Run({"1ob", "2ob", "3ob"})};
    auto const low = rules::InitialMeldOk(a, rules::NewlyPlayed(six, {}), six);
    ASSERT_FALSE(low.has_value());
    EXPECT_EQ(low.error().code, RVC::InitialMeldNotMet);
    EXPECT_EQ(low.error().points, std::optional<int>{6});
    EXPECT_EQ(low.error().threshold, std::optional<int>{30});

    // a 30-point meld already on the board does not count toward someone else's opening
    std::vector<Meld> const board{Group({"10kb", "10rb", "10bb"})};
    std::vector<Meld> candidate = board;
    candidate.push_back(Run({"1ob", "2ob", "3ob"}));
    EXPECT_EQ(rules::InitialMeldOk(a, rules::NewlyPlayed(candidate, board), candidate).error().code,
              RVC::InitialMeldNotMet);

    PlayerState opened = a;
    opened.initial_meld_met = true;
    EXPECT_TRUE(rules::InitialMeldOk(opened, rules::NewlyPlayed(six, {}), six).has_value());
}

TEST(GameRules, Board_Checks)
{
    std::vector<Meld> const board{Run({"3ra", "4ra", "5ra"})};

    std::vector<Meld> const dropped{Run({"3ra", "4ra"})};
    auto const missing = rules::BoardTilesRetained(dropped, board);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, RVC::BoardTilesMissing);
    EXPECT_EQ(missing.error().tile, std::optional<std::string>{"5ra"});

    std::vector<Meld> const twice{Run({"3ra", "4ra", "5ra"}), Group({"5ra", "5ka", "5ba"})};
    auto const dup = rules::NoDuplicateTiles(twice);
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, RVC::DuplicateTile);
    EXPECT_EQ(dup.error().meld_index, std::optional<uint16_t>{1});

    std::vector<Meld> const bad_second{Run({"3ra", "4ra", "5ra"}), Run({"7ka", "9ka", "10ka"})};
    auto const invalid = rules::AllMeldsValid(bad_second);
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, RVC::NonConsecutive);
    EXPECT_EQ(invalid.error().meld_index, std::optional<uint16_t>{1});
}

TEST(GameRules, Win_Needs_Empty_Rack_And_Opening)
{
    GameState g = TwoPlayerGame({}, Tiles({"1ka"}));
    EXPECT_FALSE(rules::Win(g, "A"));

    g.players[0].initial_meld_met = true;
    EXPECT_TRUE(rules::Win(g, "A"));

    g.players[1].initial_meld_met = true;
    EXPECT_FALSE(rules::Win(g, "B"));
    EXPECT_FALSE(rules::Win(g, "nobody"));
}

TEST(GameRules, Pool_Non_Empty)
{
    EXPECT_TRUE(rules::PoolNonEmpty(TwoPlayerGame({}, {}, Tiles({"1ra"}))).has_value());
    EXPECT_EQ(rules::PoolNonEmpty(TwoPlayerGame({}, {})).error().code, RVC::PoolEmpty);
}

TEST(GameRules, Penalty_Scores_Only_For_Completed_Games)
{
    GameState g = TwoPlayerGame({}, Tiles({"13ka", "2rb", "jb"}));
    EXPECT_EQ(rules::RackPenalty(g.players[1].rack), 13 + 2 + constants::JokerPenalty);

    auto const running = rules::PenaltyScores(g);
    EXPECT_EQ(running.at("A"), 0);
    EXPECT_EQ(running.at("B"), 0);

    g.status = GameStatus::Completed;
    g.winner_id = "A";
    auto const final_scores = rules::PenaltyScores(g);
    EXPECT_EQ(final_scores.at("A"), 45);
    EXPECT_EQ(final_scores.at("B"), -45);
}
