//
// Created by Malik T on 05/09/2025.
//

#include "StandardRules.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <type_traits>
#include <variant>

#include "GameRules.hpp"

namespace
{
    inline auto Viol(rummikub::core::error::RuleViolationCode code) -> rummikub::core::error::RuleViolation
    {
        return rummikub::core::error::RuleViolation{ .code = code };
    }
}

namespace rummikub::core
{
    StandardRules::StandardRules(int const initial_meld_threshold) :
        threshold_(initial_meld_threshold)
    {
    }

    auto StandardRules::Validate(GameState const& state, std::string_view actor, PlayerAction const& a) const
        -> CheckResult
    {
        using RVC = ::rummikub::core::error::RuleViolationCode;

        if (auto owner = rules::TurnOwnerOk(state, actor); !owner) return owner;
        PlayerState const& player = state.players[state.current_player_index];

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayTilesAction>)
            {
                TileSet const newly = rules::NewlyPlayed(act.melds, state.board);

                // a resubmitted or merely rearranged board plays nothing
                if (newly.empty())
                    return std::unexpected(Viol(RVC::NoOpMove).with_player(player.id));

                if (auto r = rules::OwnsTiles(player, newly); !r) return r;
                if (auto r = rules::NoDuplicateTiles(act.melds); !r) return r;
                if (auto r = rules::BoardTilesRetained(act.melds, state.board); !r) return r;
                if (auto r = rules::AllMeldsValid(act.melds); !r) return r;
                if (auto r = rules::InitialMeldOk(player, newly, act.melds, threshold_); !r) return r;
                return {};
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                if (auto r = rules::PoolNonEmpty(state); !r)
                    return std::unexpected(r.error().with_player(player.id));
                return {};
            }

            RMK_THROW(rummikub::core::error::Code::Unknown, "Unreachable variant in Validate");
        }, a);
    }

    auto StandardRules::Apply(GameState const& state, std::string_view actor, PlayerAction const& a) const
        -> GameState
    {
        using rummikub::core::error::Code;

        auto const seat = rules::FindPlayer(state, actor);
        if (!seat) RMK_THROW(Code::Rules, std::format("Apply for unknown player {}", actor));

        GameState next = state;
        PlayerState& player = next.players[*seat];

        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlayTilesAction>)
            {
                TileSet const newly = rules::NewlyPlayed(act.melds, state.board);
                RMK_ASSERT(!newly.empty(), "Apply of a play that adds no tile");

                std::erase_if(player.rack, [&](TileId id) { return newly.contains(id); });
                next.board = act.melds;
                player.initial_meld_met = true;

                if (rules::Win(next, player.id))
                {
                    next.status = GameStatus::Completed;
                    next.winner_id = player.id;
                }
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                if (next.pool.empty()) RMK_THROW(Code::State, "Draw from an empty pool");
                player.rack.push_back(next.pool.back());
                next.pool.pop_back();
            }
        }, a);

        return next;
    }

    auto StandardRules::Advance(GameState const& state) const -> Result<GameState>
    {
        if (auto gate = rules::TurnGate(state); !gate) return std::unexpected(gate.error());
        RMK_ASSERT(!state.players.empty(), "Advance on a game without players");

        GameState next = state;
        for (PlayerState const& p : state.players)
        {
            if (rules::Win(state, p.id))
            {
                next.status = GameStatus::Completed;
                next.winner_id = p.id;
                return next;
            }
        }

        next.current_player_index = static_cast<PlyrIdxT>((state.current_player_index + 1) % state.players.size());
        return next;
    }
}
