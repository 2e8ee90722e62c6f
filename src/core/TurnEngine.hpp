//
// Created by Malik T on 15/08/2025.
//

#ifndef RUMMIKUB_TURNENGINE_HPP
#define RUMMIKUB_TURNENGINE_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"

namespace rummikub::core
{
    // Stateless driver of the game state machine
    //   waiting_for_players -> in_progress -> completed.
    // Every operation takes a GameState by const& and hands back a new value or
    // the first rule violation found; the input is never touched.
    class TurnEngine
    {
    public:
        explicit TurnEngine(Config const& config = {}, std::unique_ptr<Rules> rules = nullptr);

        // Deals cfg.rack_size tiles to each of n_players unnamed seats from a
        // universe shuffled with seed; the rest is the pool.
        auto CreateGame(std::string game_id, uint32_t n_players, uint64_t seed) const -> Result<GameState>;
        auto CreateGame(std::string game_id) const -> Result<GameState>;

        // Names the first unnamed seat; the last one starts the game.
        auto Join(GameState const& state, std::string_view name) const -> Result<GameState>;

        auto PlayTiles(GameState const& state, std::string_view player_id, std::vector<Meld> melds) const
            -> Result<GameState>;
        auto Draw(GameState const& state, std::string_view player_id) const -> Result<GameState>;

        // Validate + apply one action, turn pointer unchanged.
        auto Apply(GameState const& state, std::string_view player_id, PlayerAction const& action) const
            -> Result<GameState>;
        auto AdvanceTurn(GameState const& state) const -> Result<GameState>;
        // Apply, then advance unless the action finished the game.
        auto ExecuteTurn(GameState const& state, std::string_view player_id, PlayerAction const& action) const
            -> Result<GameState>;

        auto SnapshotFor(GameState const& state, std::string_view player_id) const
            -> Result<std::shared_ptr<ViewerSnapshot const>>;
        auto CurrentPlayer(GameState const& state) const -> Result<std::string>;
        auto Scores(GameState const& state) const -> std::map<std::string, int>;

        auto Outcome(GameState const& before, GameState const& after) const noexcept -> MoveOutcome;

        auto Settings() const noexcept -> Config const& { return cfg_; }

    private:
        auto Checked(GameState state) const -> GameState;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
    };
}
#endif //RUMMIKUB_TURNENGINE_HPP
