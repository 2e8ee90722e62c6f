//
// Created by Malik T on 04/09/2025.
//

#include "GameRules.hpp"

#include <algorithm>
#include <ranges>

#include "MeldValidator.hpp"
#include "TileCodec.hpp"
#include "Util.hpp"

namespace
{
    inline auto Viol(rummikub::core::error::RuleViolationCode code) -> rummikub::core::error::RuleViolation
    {
        return rummikub::core::error::RuleViolation{ .code = code };
    }

    auto TileText(rummikub::core::TileId id) -> std::string
    {
        using namespace rummikub::core;
        return tiles::IsValid(id) ? tiles::ToString(id) : std::to_string(id.index);
    }
}

namespace rummikub::core::rules
{
    using RVC = error::RuleViolationCode;

    auto FindPlayer(GameState const& state, std::string_view player_id) -> std::optional<PlyrIdxT>
    {
        for (size_t i = 0; i < state.players.size(); ++i)
        {
            if (state.players[i].id == player_id) return static_cast<PlyrIdxT>(i);
        }
        return std::nullopt;
    }

    auto TurnGate(GameState const& state) -> CheckResult
    {
        switch (state.status)
        {
        case GameStatus::WaitingForPlayers:
            return std::unexpected(Viol(RVC::GameNotStarted).with_status(state.status));
        case GameStatus::Completed:
            return std::unexpected(Viol(RVC::GameFinished).with_status(state.status));
        case GameStatus::InProgress:
            return {};
        }
        return std::unexpected(Viol(RVC::Internal_Unreachable));
    }

    auto TurnOwnerOk(GameState const& state, std::string_view player_id) -> CheckResult
    {
        if (auto gate = TurnGate(state); !gate)
            return std::unexpected(gate.error().with_player(std::string{player_id}));

        RMK_ASSERT(state.current_player_index < state.players.size(), "current player index out of range");

        if (state.players[state.current_player_index].id != player_id)
            return std::unexpected(Viol(RVC::NotPlayersTurn)
                                   .with_player(std::string{player_id})
                                   .with_seat(state.current_player_index));
        return {};
    }

    auto OwnsTiles(PlayerState const& player, TileSet const& ids) -> CheckResult
    {
        for (TileId const id : ids)
        {
            if (std::ranges::find(player.rack, id) == player.rack.end())
                return std::unexpected(Viol(RVC::TileNotOwned).with_player(player.id).with_tile(TileText(id)));
        }
        return {};
    }

    auto NewlyPlayed(std::span<Meld const> candidate, std::span<Meld const> current) -> TileSet
    {
        TileSet on_board;
        for (Meld const& m : current) on_board.insert(m.tiles.begin(), m.tiles.end());

        TileSet newly;
        for (Meld const& m : candidate)
        {
            for (TileId const id : m.tiles)
                if (!on_board.contains(id)) newly.insert(id);
        }
        return newly;
    }

    auto NoDuplicateTiles(std::span<Meld const> candidate) -> CheckResult
    {
        util::TileUniqueChecker checker{};
        for (size_t i = 0; i < candidate.size(); ++i)
        {
            for (TileId const id : candidate[i].tiles)
            {
                checker.Add(id);
                if (checker.ContainsDup())
                    return std::unexpected(Viol(RVC::DuplicateTile)
                                           .with_tile(TileText(id))
                                           .with_meld(static_cast<uint16_t>(i)));
            }
        }
        return {};
    }

    auto BoardTilesRetained(std::span<Meld const> candidate, std::span<Meld const> current) -> CheckResult
    {
        TileSet kept;
        for (Meld const& m : candidate) kept.insert(m.tiles.begin(), m.tiles.end());

        for (Meld const& m : current)
        {
            for (TileId const id : m.tiles)
                if (!kept.contains(id))
                    return std::unexpected(Viol(RVC::BoardTilesMissing).with_tile(TileText(id)));
        }
        return {};
    }

    auto AllMeldsValid(std::span<Meld const> candidate) -> CheckResult
    {
        for (size_t i = 0; i < candidate.size(); ++i)
        {
            if (auto priced = meld::ValidateAndPrice(candidate[i]); !priced)
                return std::unexpected(priced.error().with_meld(static_cast<uint16_t>(i)));
        }
        return {};
    }

    auto InitialMeldOk(PlayerState const& player, TileSet const& newly, std::span<Meld const> candidate,
                       int const threshold) -> CheckResult
    {
        if (player.initial_meld_met) return {};

        int points = 0;
        for (size_t i = 0; i < candidate.size(); ++i)
        {
            Meld const& m = candidate[i];
            bool const touches_newly = std::ranges::any_of(m.tiles, [&](TileId id) { return newly.contains(id); });
            if (!touches_newly) continue;

            auto priced = meld::ValidateAndPrice(m);
            if (!priced) return std::unexpected(priced.error().with_meld(static_cast<uint16_t>(i)));
            points += priced->value;
        }

        if (points < threshold)
            return std::unexpected(Viol(RVC::InitialMeldNotMet)
                                   .with_player(player.id)
                                   .with_points(points)
                                   .with_threshold(threshold));
        return {};
    }

    auto PoolNonEmpty(GameState const& state) -> CheckResult
    {
        if (state.pool.empty()) return std::unexpected(Viol(RVC::PoolEmpty));
        return {};
    }

    auto Win(GameState const& state, std::string_view player_id) -> bool
    {
        auto const seat = FindPlayer(state, player_id);
        if (!seat) return false;
        PlayerState const& p = state.players[*seat];
        return p.rack.empty() && p.initial_meld_met;
    }

    auto RackPenalty(std::span<TileId const> rack) -> int
    {
        int total = 0;
        for (TileId const id : rack)
        {
            auto const value = tiles::ValueOf(id);
            total += value ? *value : constants::JokerPenalty;
        }
        return total;
    }

    auto PenaltyScores(GameState const& state) -> std::map<std::string, int>
    {
        std::map<std::string, int> scores;
        for (PlayerState const& p : state.players) scores[p.id] = 0;
        if (state.status != GameStatus::Completed || !state.winner_id) return scores;

        int pot = 0;
        for (PlayerState const& p : state.players)
        {
            if (p.id == *state.winner_id) continue;
            int const penalty = RackPenalty(p.rack);
            scores[p.id] = -penalty;
            pot += penalty;
        }
        scores[*state.winner_id] = pot;
        return scores;
    }
}
