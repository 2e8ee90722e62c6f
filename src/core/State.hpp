//
// Created by Malik T on 14/08/2025.
//

#ifndef RUMMIKUB_STATE_HPP
#define RUMMIKUB_STATE_HPP

#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"

namespace rummikub::core
{
    struct PlayerState
    {
        std::string id;
        std::optional<std::string> name{};
        std::vector<TileId> rack;
        bool initial_meld_met{false};

        [[nodiscard]]
        auto Joined() const -> bool { return name.has_value(); }
    };

    // Authoritative game value. Engine operations take it by const& and return
    // a new one; nothing holds on to a reference.
    struct GameState
    {
        std::string game_id;
        std::string game_name;
        std::vector<PlayerState> players;
        // shuffled at creation, drawn from the back
        std::vector<TileId> pool;
        std::vector<Meld> board;
        PlyrIdxT current_player_index{};
        GameStatus status{GameStatus::WaitingForPlayers};
        std::optional<std::string> winner_id{};
        Timestamp created_at{};
        Timestamp updated_at{};
        uint64_t version{};
    };

    struct PlayerView
    {
        std::string id;
        std::optional<std::string> name{};
        uint8_t rack_size{};
        bool initial_meld_met{false};
    };

    // Per-viewer snapshot exposed to UI/network: my rack in full, counts for others
    struct ViewerSnapshot
    {
        std::string game_id;
        std::string game_name;
        GameStatus status{GameStatus::WaitingForPlayers};
        PlyrIdxT current_player_index{};
        std::optional<std::string> winner_id{};
        std::vector<Meld> board;
        uint8_t pool_size{};

        std::string viewer_id;
        std::vector<TileId> my_rack;
        bool my_initial_meld_met{false};
        std::vector<PlayerView> players;

        uint64_t version{};
    };
} // namespace rummikub::core

#endif //RUMMIKUB_STATE_HPP
