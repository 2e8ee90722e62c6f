//
// Created by Malik T on 04/09/2025.
//

#ifndef RUMMIKUB_GAMERULES_HPP
#define RUMMIKUB_GAMERULES_HPP

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

// Stateless predicates gating every action. None of them mutates its input.
namespace rummikub::core::rules
{
    using CheckResult = error::ValidateResult;

    auto FindPlayer(GameState const& state, std::string_view player_id) -> std::optional<PlyrIdxT>;

    // GameNotStarted / GameFinished outside in_progress.
    auto TurnGate(GameState const& state) -> CheckResult;
    // TurnGate, then NotPlayersTurn unless player_id holds the current seat.
    auto TurnOwnerOk(GameState const& state, std::string_view player_id) -> CheckResult;

    auto OwnsTiles(PlayerState const& player, TileSet const& ids) -> CheckResult;

    // Tiles on the candidate board that are not on the current board.
    auto NewlyPlayed(std::span<Meld const> candidate, std::span<Meld const> current) -> TileSet;

    auto NoDuplicateTiles(std::span<Meld const> candidate) -> CheckResult;
    // Every tile on the current board must still be on the candidate board.
    auto BoardTilesRetained(std::span<Meld const> candidate, std::span<Meld const> current) -> CheckResult;
    // Runs the meld validator over each meld, tagging the failing meld's index.
    auto AllMeldsValid(std::span<Meld const> candidate) -> CheckResult;

    // Vacuous once met. Otherwise the melds holding at least one newly played
    // tile must price to at least threshold.
    auto InitialMeldOk(PlayerState const& player, TileSet const& newly, std::span<Meld const> candidate,
                       int threshold = constants::InitialMeldThreshold) -> CheckResult;

    auto PoolNonEmpty(GameState const& state) -> CheckResult;

    auto Win(GameState const& state, std::string_view player_id) -> bool;

    // Face values of a rack, jokers at constants::JokerPenalty.
    auto RackPenalty(std::span<TileId const> rack) -> int;
    // Completed games only; losers -(rack), winner +sum of the losers' racks.
    // Every score is 0 for a game that has not finished.
    auto PenaltyScores(GameState const& state) -> std::map<std::string, int>;
}

#endif //RUMMIKUB_GAMERULES_HPP
