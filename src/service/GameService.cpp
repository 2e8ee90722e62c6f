//
// Created by Malik T on 11/09/2025.
//

#include "GameService.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <iterator>
#include <ranges>
#include <utility>

#include "../core/Util.hpp"
#include "../debug/AuditLogger.hpp"

namespace rummikub::service
{
    using core::Result;

    auto Summarize(core::GameState const& g) -> GameSummary
    {
        return GameSummary{
            .game_id = g.game_id,
            .game_name = g.game_name,
            .status = g.status,
            .player_count = static_cast<uint8_t>(g.players.size()),
            .joined = static_cast<uint8_t>(std::ranges::count_if(g.players, &core::PlayerState::Joined)),
            .created_at = g.created_at,
            .updated_at = g.updated_at,
            .version = g.version
        };
    }

    GameService::GameService(core::Config const& cfg,
                             std::shared_ptr<GameStore> store,
                             std::shared_ptr<GameLockManager> locks,
                             std::shared_ptr<core::debug::AuditLogger> audit) :
        cfg_(cfg),
        engine_(cfg),
        store_(std::move(store)),
        locks_(std::move(locks)),
        audit_(std::move(audit)),
        rng_{cfg.seed}
    {
        RMK_ASSERT(store_ != nullptr, "GameService needs a store");
        RMK_ASSERT(locks_ != nullptr, "GameService needs a lock manager");
        session_id_ = core::util::HexToken(rng_);
    }

    auto GameService::Audit(auto&& fn) -> void
    {
        if (!audit_) return;
        std::lock_guard<std::mutex> lock(audit_mx_);
        fn(*audit_);
    }

    auto GameService::NextToken() -> std::string
    {
        std::lock_guard<std::mutex> lock(rng_mx_);
        return core::util::HexToken(rng_);
    }

    auto GameService::Lock(std::string_view game_id) -> GameLock
    {
        std::string owner;
        {
            std::lock_guard<std::mutex> lock(rng_mx_);
            owner = std::format("{}:{}", session_id_, ++acquisitions_);
        }
        return locks_->Acquire(std::string{game_id}, std::move(owner), cfg_.lock_wait, cfg_.lock_lease);
    }

    auto GameService::Persist(core::GameState state) -> core::GameState
    {
        state.updated_at = std::max(std::chrono::system_clock::now(), state.updated_at);
        ++state.version;
        store_->Save(state);
        return state;
    }

    auto GameService::CreateGame(uint32_t const player_count) -> Result<GameSummary>
    {
        std::string const game_id = NextToken();
        uint64_t seed{};
        {
            std::lock_guard<std::mutex> lock(rng_mx_);
            seed = rng_();
        }

        auto created = engine_.CreateGame(game_id, player_count, seed);
        if (!created) return std::unexpected(created.error());

        created->created_at = std::chrono::system_clock::now();
        created->updated_at = created->created_at;
        created->version = 0;

        GameLock const held = Lock(game_id);
        core::GameState const saved = Persist(std::move(*created));

        Audit([&](core::debug::AuditLogger& log) { log.start(saved, seed); });
        return Summarize(saved);
    }

    auto GameService::JoinGame(std::string_view game_id, std::string_view name) -> Result<ViewPtr>
    {
        GameLock const held = Lock(game_id);
        core::GameState const state = store_->Load(game_id);

        std::string_view const clean = core::util::Trim(name);
        auto const already = std::ranges::find_if(state.players, [&](core::PlayerState const& p)
        {
            return p.name && *p.name == clean;
        });
        if (already != state.players.end()) return engine_.SnapshotFor(state, already->id);

        auto joined = engine_.Join(state, name);
        if (!joined)
        {
            Audit([&](core::debug::AuditLogger& log) { log.violation(joined.error()); });
            return std::unexpected(joined.error());
        }

        // the engine fills the first unnamed seat
        auto const seat = std::ranges::find_if(state.players, [](core::PlayerState const& p) { return !p.Joined(); });
        RMK_ASSERT(seat != state.players.end(), "join succeeded without a free seat");
        auto const index = static_cast<size_t>(std::distance(state.players.begin(), seat));

        core::GameState const saved = Persist(std::move(*joined));
        std::string const& player_id = saved.players[index].id;
        Audit([&](core::debug::AuditLogger& log)
        {
            log.note(std::format("P{} {} joined as \"{}\"", index, player_id, *saved.players[index].name));
        });
        return engine_.SnapshotFor(saved, player_id);
    }

    auto GameService::GetGame(std::string_view game_id, std::string_view player_id) const -> Result<ViewPtr>
    {
        core::GameState const state = store_->Load(game_id);
        return engine_.SnapshotFor(state, player_id);
    }

    auto GameService::ListGames() const -> std::vector<GameSummary>
    {
        std::vector<GameSummary> out;
        for (core::GameState const& g : store_->List()) out.push_back(Summarize(g));
        std::ranges::sort(out, std::ranges::less{}, &GameSummary::created_at);
        return out;
    }

    auto GameService::ExecuteTurn(std::string_view game_id, std::string_view player_id,
                                  core::PlayerAction const& action) -> Result<ViewPtr>
    {
        GameLock const held = Lock(game_id);
        core::GameState const state = store_->Load(game_id);

        Audit([&](core::debug::AuditLogger& log) { log.turn(state, player_id, action); });

        auto next = engine_.ExecuteTurn(state, player_id, action);
        if (!next)
        {
            Audit([&](core::debug::AuditLogger& log)
            {
                log.violation(next.error());
                log.outcome(core::MoveOutcome::Invalid);
            });
            return std::unexpected(next.error());
        }

        core::GameState const saved = Persist(std::move(*next));
        Audit([&](core::debug::AuditLogger& log)
        {
            log.outcome(engine_.Outcome(state, saved));
            if (saved.status == core::GameStatus::Completed) log.end(saved, engine_.Scores(saved));
        });
        return engine_.SnapshotFor(saved, player_id);
    }
}
