#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <memory>
#include <numeric>
#include <print>
#include <vector>

#include "../core/TurnEngine.hpp"
#include "../core/GreedyAi.hpp"
#include "../core/GameRules.hpp"
#include "../core/Exception.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"

using namespace rummikub::core;

namespace
{
    struct Outcome
    {
        GameState final_state;
        int turns{};
        int rejected{};
    };

    auto PlayOut(uint64_t seed, uint32_t n_players, debug::AuditLogger& log) -> Outcome
    {
        Config cfg{};
        cfg.n_players = n_players;
        cfg.seed = seed;
        cfg.check_invariants = true;
        TurnEngine const engine(cfg);

        GameState g = engine.CreateGame(std::format("selfplay-{}", seed)).value();
        std::vector<std::unique_ptr<Player>> players;
        for (uint32_t i = 0; i < n_players; ++i)
        {
            g = engine.Join(g, std::format("bot{}", i)).value();
            players.emplace_back(std::make_unique<GreedyAI>(seed + 1 + i));
        }
        log.start(g, seed);

        Outcome out{};
        while (g.status == GameStatus::InProgress && out.turns < 1000)
        {
            std::string const actor = engine.CurrentPlayer(g).value();
            auto const snap = engine.SnapshotFor(g, actor).value();
            PlayerAction const action = players[g.current_player_index]->Play(snap);

            log.turn(g, actor, action);
            auto next = engine.ExecuteTurn(g, actor, action);
            if (!next)
            {
                log.violation(next.error());
                if (next.error().code == error::RuleViolationCode::PoolEmpty) break;
                ++out.rejected;
                next = engine.ExecuteTurn(g, actor, DrawAction{});
                if (!next) break;
            }
            log.outcome(engine.Outcome(g, *next));
            g = std::move(*next);
            ++out.turns;
        }
        if (g.status == GameStatus::Completed) log.end(g, engine.Scores(g));
        log.flush();

        out.final_state = std::move(g);
        return out;
    }
}

TEST(SelfPlay, Greedy_Bots_Play_Legal_Games)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (auto const [seed, n] : {std::pair{111ull, 2u}, std::pair{222ull, 3u}, std::pair{333ull, 4u}})
        {
            auto const path = fs::path(std::format("_artifacts/rummikub_{}.log", seed));
            Outcome result{};
            {
                debug::AuditLogger log(path.string());
                result = PlayOut(seed, n, log);
            }
            GameState const& g = result.final_state;

            EXPECT_EQ(result.rejected, 0) << "seed " << seed;
            EXPECT_GT(result.turns, 0);
            EXPECT_NO_THROW(debug::CheckInvariants(g));

            if (g.status == GameStatus::Completed)
            {
                ASSERT_TRUE(g.winner_id.has_value());
                EXPECT_TRUE(rules::Win(g, *g.winner_id));

                auto const scores = rules::PenaltyScores(g);
                int const total = std::accumulate(scores.begin(), scores.end(), 0,
                                                  [](int acc, auto const& kv) { return acc + kv.second; });
                EXPECT_EQ(total, 0);
            }
            else
            {
                // stopped on an exhausted pool or the turn cap
                EXPECT_FALSE(g.winner_id.has_value());
            }

            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e.to_str());
        FAIL() << e.what();
    }
}

TEST(SelfPlay, Same_Seed_Same_Game)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");

    debug::AuditLogger first_log("_artifacts/rummikub_repeat_a.log");
    debug::AuditLogger second_log("_artifacts/rummikub_repeat_b.log");
    Outcome const first = PlayOut(4242, 2, first_log);
    Outcome const second = PlayOut(4242, 2, second_log);

    EXPECT_EQ(first.turns, second.turns);
    EXPECT_EQ(first.final_state.status, second.final_state.status);
    EXPECT_EQ(first.final_state.pool, second.final_state.pool);
    ASSERT_EQ(first.final_state.players.size(), second.final_state.players.size());
    for (size_t i = 0; i < first.final_state.players.size(); ++i)
        EXPECT_EQ(first.final_state.players[i].rack, second.final_state.players[i].rack);
}
