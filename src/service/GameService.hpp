//
// Created by Malik T on 11/09/2025.
//

#ifndef RUMMIKUB_GAMESERVICE_HPP
#define RUMMIKUB_GAMESERVICE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "../core/TurnEngine.hpp"
#include "../core/Types.hpp"
#include "GameLock.hpp"
#include "GameStore.hpp"

namespace rummikub::core::debug { class AuditLogger; }

namespace rummikub::service
{
    // Public listing entry; carries no rack contents.
    struct GameSummary
    {
        std::string game_id;
        std::string game_name;
        core::GameStatus status{core::GameStatus::WaitingForPlayers};
        uint8_t player_count{};
        uint8_t joined{};
        core::Timestamp created_at{};
        core::Timestamp updated_at{};
        uint64_t version{};
    };

    using ViewPtr = std::shared_ptr<core::ViewerSnapshot const>;

    // Facade over engine + store + lock. Every mutation holds the game's lock
    // from load to save and bumps version/updated_at. Rule violations come back
    // as values; a missing game (GameNotFoundError) or a lock timeout
    // (ConcurrentModificationError) throws.
    class GameService
    {
    public:
        GameService(core::Config const& cfg,
                    std::shared_ptr<GameStore> store,
                    std::shared_ptr<GameLockManager> locks,
                    std::shared_ptr<core::debug::AuditLogger> audit = nullptr);

        auto CreateGame(uint32_t player_count) -> core::Result<GameSummary>;
        // Re-joining under a name already seated returns that seat's view.
        auto JoinGame(std::string_view game_id, std::string_view name) -> core::Result<ViewPtr>;
        auto GetGame(std::string_view game_id, std::string_view player_id) const -> core::Result<ViewPtr>;
        auto ListGames() const -> std::vector<GameSummary>;
        auto ExecuteTurn(std::string_view game_id, std::string_view player_id,
                         core::PlayerAction const& action) -> core::Result<ViewPtr>;

        auto Engine() const noexcept -> core::TurnEngine const& { return engine_; }
        auto SessionId() const noexcept -> std::string const& { return session_id_; }

    private:
        auto Lock(std::string_view game_id) -> GameLock;
        auto Persist(core::GameState state) -> core::GameState;
        auto NextToken() -> std::string;

        auto Audit(auto&& fn) -> void;

    private:
        core::Config cfg_;
        core::TurnEngine engine_;
        std::shared_ptr<GameStore> store_;
        std::shared_ptr<GameLockManager> locks_;
        std::shared_ptr<core::debug::AuditLogger> audit_;

        std::mutex rng_mx_;
        std::mt19937_64 rng_;
        std::string session_id_;
        uint64_t acquisitions_{};

        std::mutex audit_mx_;
    };

    auto Summarize(core::GameState const& g) -> GameSummary;
}

#endif //RUMMIKUB_GAMESERVICE_HPP
