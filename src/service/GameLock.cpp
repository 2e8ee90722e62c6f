//
// Created by Malik T on 10/09/2025.
//

#include "GameLock.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "../core/Exception.hpp"

namespace rummikub::service
{
    GameLock::GameLock(GameLockManager& mgr, std::string game_id, std::string owner) :
        mgr_(&mgr),
        game_id_(std::move(game_id)),
        owner_(std::move(owner))
    {
    }

    GameLock::GameLock(GameLock&& other) noexcept :
        mgr_(std::exchange(other.mgr_, nullptr)),
        game_id_(std::move(other.game_id_)),
        owner_(std::move(other.owner_))
    {
    }

    GameLock::~GameLock()
    {
        if (mgr_) mgr_->Release(game_id_, owner_);
    }

    auto GameLock::Release() -> bool
    {
        if (!mgr_) return false;
        bool const released = mgr_->Release(game_id_, owner_);
        mgr_ = nullptr;
        return released;
    }

    auto GameLockManager::Acquire(std::string game_id, std::string owner,
                                  std::chrono::milliseconds const wait,
                                  std::chrono::milliseconds const lease) -> GameLock
    {
        if (!TryAcquire(game_id, owner, wait, lease))
            RMK_THROW(core::error::Code::Concurrency,
                      std::format("Could not acquire lock for game {} within {}ms", game_id, wait.count()));
        return GameLock{*this, std::move(game_id), std::move(owner)};
    }

    auto InMemoryGameLockManager::TryAcquire(std::string_view game_id, std::string_view owner,
                                             std::chrono::milliseconds const wait,
                                             std::chrono::milliseconds const lease) -> bool
    {
        Clock::time_point const deadline = Clock::now() + wait;
        std::unique_lock<std::mutex> lock(m_);
        while (true)
        {
            Clock::time_point const now = Clock::now();
            auto const it = leases_.find(game_id);
            if (it == leases_.end() || it->second.expires <= now)
            {
                leases_.insert_or_assign(std::string{game_id}, Lease{std::string{owner}, now + lease});
                return true;
            }
            if (now >= deadline) return false;

            // wake on release, on lease expiry, or when our wait runs out
            cv_.wait_until(lock, std::min(deadline, it->second.expires));
        }
    }

    auto InMemoryGameLockManager::Release(std::string_view game_id, std::string_view owner) -> bool
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            auto const it = leases_.find(game_id);
            if (it == leases_.end() || it->second.owner != owner) return false;
            leases_.erase(it);
        }
        cv_.notify_all();
        return true;
    }

    auto InMemoryGameLockManager::Holder(std::string_view game_id) const -> std::optional<std::string>
    {
        std::lock_guard<std::mutex> lock(m_);
        auto const it = leases_.find(game_id);
        if (it == leases_.end() || it->second.expires <= Clock::now()) return std::nullopt;
        return it->second.owner;
    }
}
