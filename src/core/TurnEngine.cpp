//
// Created by Malik T on 15/08/2025.
//
#include "TurnEngine.hpp"
#include <algorithm>
#include <iterator>
#include <random>
#include <ranges>
#include <utility>

#include "GameRules.hpp"
#include "StandardRules.hpp"
#include "TileCodec.hpp"
#include "Util.hpp"
#include "../debug/Invariants.hpp"

namespace
{
    inline auto Viol(rummikub::core::error::RuleViolationCode code) -> rummikub::core::error::RuleViolation
    {
        return rummikub::core::error::RuleViolation{ .code = code };
    }
}

namespace rummikub::core
{
    using RVC = error::RuleViolationCode;

    TurnEngine::TurnEngine(Config const& config, std::unique_ptr<Rules> rules) :
        cfg_(config),
        rules_(rules ? std::move(rules) : std::make_unique<StandardRules>(config.initial_meld_threshold))
    {
        RMK_ASSERT(cfg_.rack_size > 0, "rack size must be positive");
    }

    auto TurnEngine::Checked(GameState state) const -> GameState
    {
        if (cfg_.check_invariants) debug::CheckInvariants(state);
        return state;
    }

    auto TurnEngine::CreateGame(std::string game_id, uint32_t const n_players, uint64_t const seed) const
        -> Result<GameState>
    {
        if (n_players < constants::MinPlayers || n_players > constants::MaxPlayers)
            return std::unexpected(Viol(RVC::InvalidPlayerCount).with_attempted(static_cast<uint16_t>(n_players)));

        RMK_ASSERT(static_cast<size_t>(cfg_.rack_size) * n_players <= constants::TileCount,
                   "Less tiles in the universe than required to deal the racks");

        std::mt19937_64 rng{seed};

        GameState g{};
        g.game_id = std::move(game_id);
        g.game_name = util::GameName(rng);
        g.status = GameStatus::WaitingForPlayers;
        g.current_player_index = 0;

        // Produces a shuffled universe; racks are dealt from its back
        g.pool = tiles::FullUniverse();
        std::ranges::shuffle(g.pool, rng);

        g.players.resize(n_players);
        for (PlayerState& p : g.players)
        {
            do
            {
                p.id = util::HexToken(rng);
            }
            while (std::ranges::count(g.players, p.id, &PlayerState::id) > 1);

            p.rack.reserve(cfg_.rack_size);
            while (p.rack.size() < cfg_.rack_size)
            {
                p.rack.push_back(g.pool.back());
                g.pool.pop_back();
            }
        }

        return Checked(std::move(g));
    }

    auto TurnEngine::CreateGame(std::string game_id) const -> Result<GameState>
    {
        return CreateGame(std::move(game_id), cfg_.n_players, cfg_.seed);
    }

    auto TurnEngine::Join(GameState const& state, std::string_view name) const -> Result<GameState>
    {
        switch (state.status)
        {
        case GameStatus::InProgress:
            return std::unexpected(Viol(RVC::GameFull).with_status(state.status));
        case GameStatus::Completed:
            return std::unexpected(Viol(RVC::GameFinished).with_status(state.status));
        case GameStatus::WaitingForPlayers:
            break;
        }

        std::string_view const clean = util::Trim(name);
        if (clean.empty()) return std::unexpected(Viol(RVC::InvalidName));

        for (PlayerState const& p : state.players)
        {
            if (p.name && *p.name == clean)
                return std::unexpected(Viol(RVC::NameTaken).with_player(p.id));
        }

        auto const slot = std::ranges::find_if(state.players, [](PlayerState const& p) { return !p.Joined(); });
        if (slot == state.players.end()) return std::unexpected(Viol(RVC::GameFull));

        GameState next = state;
        auto const seat = static_cast<size_t>(std::distance(state.players.begin(), slot));
        next.players[seat].name = std::string{clean};

        if (std::ranges::all_of(next.players, &PlayerState::Joined))
        {
            next.status = GameStatus::InProgress;
            next.current_player_index = 0;
        }
        return Checked(std::move(next));
    }

    auto TurnEngine::Apply(GameState const& state, std::string_view player_id, PlayerAction const& action) const
        -> Result<GameState>
    {
        if (auto const ok = rules_->Validate(state, player_id, action); !ok.has_value())
            return std::unexpected(ok.error());
        return Checked(rules_->Apply(state, player_id, action));
    }

    auto TurnEngine::PlayTiles(GameState const& state, std::string_view player_id, std::vector<Meld> melds) const
        -> Result<GameState>
    {
        return Apply(state, player_id, PlayerAction{PlayTilesAction{std::move(melds)}});
    }

    auto TurnEngine::Draw(GameState const& state, std::string_view player_id) const -> Result<GameState>
    {
        return Apply(state, player_id, PlayerAction{DrawAction{}});
    }

    auto TurnEngine::AdvanceTurn(GameState const& state) const -> Result<GameState>
    {
        auto next = rules_->Advance(state);
        if (!next) return next;
        return Checked(std::move(*next));
    }

    auto TurnEngine::ExecuteTurn(GameState const& state, std::string_view player_id,
                                 PlayerAction const& action) const -> Result<GameState>
    {
        auto applied = Apply(state, player_id, action);
        if (!applied) return applied;
        if (applied->status == GameStatus::Completed) return applied;
        return AdvanceTurn(*applied);
    }

    auto TurnEngine::SnapshotFor(GameState const& state, std::string_view player_id) const
        -> Result<std::shared_ptr<ViewerSnapshot const>>
    {
        auto const seat = rules::FindPlayer(state, player_id);
        if (!seat) return std::unexpected(Viol(RVC::PlayerNotInGame).with_player(std::string{player_id}));

        std::shared_ptr<ViewerSnapshot> snap = std::make_shared<ViewerSnapshot>();
        snap->game_id = state.game_id;
        snap->game_name = state.game_name;
        snap->status = state.status;
        snap->current_player_index = state.current_player_index;
        snap->winner_id = state.winner_id;
        snap->board = state.board;
        snap->pool_size = static_cast<uint8_t>(state.pool.size());
        snap->version = state.version;

        PlayerState const& me = state.players[*seat];
        snap->viewer_id = me.id;
        snap->my_rack = me.rack;
        snap->my_initial_meld_met = me.initial_meld_met;

        for (PlayerState const& p : state.players)
        {
            snap->players.push_back(PlayerView{
                .id = p.id,
                .name = p.name,
                .rack_size = static_cast<uint8_t>(p.rack.size()),
                .initial_meld_met = p.initial_meld_met
            });
        }
        return snap;
    }

    auto TurnEngine::CurrentPlayer(GameState const& state) const -> Result<std::string>
    {
        if (auto gate = rules::TurnGate(state); !gate) return std::unexpected(gate.error());
        RMK_ASSERT(state.current_player_index < state.players.size(), "current player index out of range");
        return state.players[state.current_player_index].id;
    }

    auto TurnEngine::Scores(GameState const& state) const -> std::map<std::string, int>
    {
        return rules::PenaltyScores(state);
    }

    auto TurnEngine::Outcome(GameState const& before, GameState const& after) const noexcept -> MoveOutcome
    {
        if (after.status == GameStatus::Completed && before.status != GameStatus::Completed)
            return MoveOutcome::GameEnded;
        if (after.current_player_index != before.current_player_index)
            return MoveOutcome::TurnEnded;
        return MoveOutcome::Applied;
    }
}
