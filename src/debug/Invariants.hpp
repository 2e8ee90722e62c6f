//
// Created by Malik T on 19/08/2025.
//

#ifndef RUMMIKUB_INVARIANTS_HPP
#define RUMMIKUB_INVARIANTS_HPP

#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "../core/TileCodec.hpp"
#include "../core/Util.hpp"
#include <algorithm>
#include <format>
#include <ranges>

namespace rummikub::core::debug
{
    // A second layer of checks on top of the rules: the tile partition and the
    // lifecycle fields must agree after every transition. Throws AssertionError.
    inline auto CheckInvariants(GameState const& g) -> void
    {
#if RMK_ENABLE_TEST_HOOKS == false
        (void)g;
#else
        // 1) Seat count and turn pointer
        RMK_ASSERT(g.players.size() >= constants::MinPlayers && g.players.size() <= constants::MaxPlayers,
                   std::format("player count {} outside 2..4", g.players.size()));
        RMK_ASSERT(g.current_player_index < g.players.size(), "current player index out of range");

        // 2) Player ids unique
        for (size_t i = 0; i < g.players.size(); ++i)
            for (size_t j = i + 1; j < g.players.size(); ++j)
                RMK_ASSERT(g.players[i].id != g.players[j].id,
                           std::format("player id {} appears twice", g.players[i].id));

        // 3) Lifecycle: everyone named once the game is running
        if (g.status != GameStatus::WaitingForPlayers)
            RMK_ASSERT(std::ranges::all_of(g.players, &PlayerState::Joined), "unnamed seat in a started game");

        // 4) Winner only on completion, and it must be a seated player who won
        if (g.status == GameStatus::Completed && g.winner_id)
        {
            auto const it = std::ranges::find(g.players, *g.winner_id, &PlayerState::id);
            RMK_ASSERT(it != g.players.end(), "winner is not seated");
            RMK_ASSERT(it->rack.empty() && it->initial_meld_met, "winner still holds tiles");
        }
        else
        {
            RMK_ASSERT(!g.winner_id || g.status == GameStatus::Completed, "winner set before completion");
        }

        // 5) Racks + pool + board == the 106 tiles, each exactly once
        {
            util::TileUniqueChecker checker{};
            auto push = [&](TileId id)
            {
                RMK_ASSERT(tiles::IsValid(id), std::format("tile index {} outside the tile set", id.index));
                checker.Add(id);
                RMK_ASSERT(!checker.ContainsDup(), std::format("tile {} held twice", tiles::ToString(id)));
            };

            for (auto const& p : g.players) for (auto const id : p.rack) push(id);
            for (auto const id : g.pool) push(id);
            for (auto const& m : g.board) for (auto const id : m.tiles) push(id);

            RMK_ASSERT(checker.Complete(),
                       std::format("{} of {} tiles accounted for", checker.Count(), constants::TileCount));
        }
#endif // RMK_ENABLE_TEST_HOOKS == true
    }
}
#endif //RUMMIKUB_INVARIANTS_HPP
