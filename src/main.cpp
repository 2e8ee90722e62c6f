//
// Created by Malik T on 13/08/2025.
//

//
// main.cpp: self-play driver, greedy AIs playing through the game service
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <format>
#include <memory>
#include <print>
#include <string>
#include <vector>

#include "core/Exception.hpp"
#include "core/GreedyAi.hpp"
#include "core/Player.hpp"
#include "core/TileCodec.hpp"
#include "core/Types.hpp"
#include "debug/AuditLogger.hpp"
#include "service/GameService.hpp"
#include "service/GameLock.hpp"
#include "service/InMemoryGameStore.hpp"

namespace
{
    using namespace rummikub;

    struct CliConfig
    {
        std::uint32_t n_players{2};
        std::uint64_t seed{123456789ULL};
        std::uint32_t max_turns{2000};
        std::string   log_path{"rummikub_selfplay.log"};
    };

    auto ParseArgs(int argc, char** argv) -> CliConfig
    {
        CliConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--max-turns")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.max_turns = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--log" && i + 1 < argc)
            {
                cfg.log_path = argv[++i];
            }
        }
        return cfg;
    }

    auto RackText(std::vector<core::TileId> const& rack) -> std::string
    {
        std::string out;
        for (std::size_t i{}; i < rack.size(); ++i)
        {
            out += (i ? " " : "");
            out += core::tiles::ToString(rack[i]);
        }
        return out;
    }
}

int main(int argc, char** argv)
{
    using namespace rummikub::core;
    using rummikub::service::GameService;
    using rummikub::service::ViewPtr;

    CliConfig const cc = ParseArgs(argc, argv);

    Config cfg;
    cfg.n_players        = cc.n_players;
    cfg.seed             = cc.seed;
    cfg.check_invariants = true;

    try
    {
        auto audit = std::make_shared<debug::AuditLogger>(cc.log_path);
        GameService service(cfg,
                            std::make_shared<rummikub::service::InMemoryGameStore>(),
                            std::make_shared<rummikub::service::InMemoryGameLockManager>(),
                            audit);

        auto created = service.CreateGame(cc.n_players);
        if (!created)
        {
            std::print("[rummikub] cannot create game: {}{}\n",
                       error::to_string(created.error().code), error::describe(created.error()));
            return 1;
        }
        std::string const game_id = created->game_id;
        std::print("[rummikub] game {} \"{}\" with {} player(s), seed {}\n",
                   game_id, created->game_name, cc.n_players, cc.seed);

        // seat index -> player id, filled in join order
        std::vector<std::string> ids;
        std::vector<std::unique_ptr<Player>> players;
        for (std::uint32_t i = 0; i < cc.n_players; ++i)
        {
            auto view = service.JoinGame(game_id, std::format("ai{}", i));
            if (!view)
            {
                std::print("[rummikub] join failed: {}{}\n",
                           error::to_string(view.error().code), error::describe(view.error()));
                return 1;
            }
            ids.push_back((*view)->viewer_id);
            players.emplace_back(std::make_unique<GreedyAI>(cc.seed + static_cast<std::uint64_t>(i * 1337u),
                                                            cfg.initial_meld_threshold));
        }

        ViewPtr view = *service.GetGame(game_id, ids.front());
        std::uint32_t turns = 0;

        while (view->status == GameStatus::InProgress && turns < cc.max_turns)
        {
            std::string const& actor = ids[view->current_player_index];
            auto const mine = service.GetGame(game_id, actor);
            if (!mine) { return 1; }

            PlayerAction const action = players[view->current_player_index]->Play(*mine);
            auto next = service.ExecuteTurn(game_id, actor, action);

            if (!next && std::holds_alternative<PlayTilesAction>(action))
            {
                // a rejected play costs the turn like a voluntary draw
                std::print("[rummikub] P{} play rejected: {}\n",
                           view->current_player_index, error::reason_code(next.error().code));
                next = service.ExecuteTurn(game_id, actor, DrawAction{});
            }

            if (!next && next.error().code == error::RuleViolationCode::PoolEmpty)
            {
                std::print("[rummikub] P{} cannot move, pool exhausted\n", view->current_player_index);
                break;
            }
            if (!next)
            {
                std::print("[rummikub] unexpected rejection: {}{}\n",
                           error::to_string(next.error().code), error::describe(next.error()));
                return 1;
            }

            view = *next;
            ++turns;
        }

        ViewPtr const last = *service.GetGame(game_id, ids.front());
        std::print("[rummikub] stopped after {} turn(s), status {}\n", turns, error::to_string(last->status));

        for (std::size_t i{}; i < ids.size(); ++i)
        {
            auto const seat = service.GetGame(game_id, ids[i]);
            std::print("  P{} {:<4} rack[{:2}] {}\n", i, ids[i].substr(0, 4), (*seat)->my_rack.size(),
                       RackText((*seat)->my_rack));
        }
        if (last->winner_id)
        {
            std::print("[rummikub] winner {}\n", *last->winner_id);
        }
        audit->flush();
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e.to_str());
        return 2;
    }

    return 0;
}
