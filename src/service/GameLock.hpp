//
// Created by Malik T on 10/09/2025.
//

#ifndef RUMMIKUB_GAMELOCK_HPP
#define RUMMIKUB_GAMELOCK_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace rummikub::service
{
    class GameLockManager;

    // Exclusive hold on one game for the span of a load -> engine -> save.
    // Releases on destruction, and only if the lease is still ours.
    class GameLock
    {
    public:
        GameLock(GameLockManager& mgr, std::string game_id, std::string owner);
        ~GameLock();

        GameLock(GameLock const&) = delete;
        auto operator=(GameLock const&) -> GameLock& = delete;

        GameLock(GameLock&& other) noexcept;
        auto operator=(GameLock&&) -> GameLock& = delete;

        // Returns false when the lease had already lapsed and been taken over.
        auto Release() -> bool;

        auto GameId() const noexcept -> std::string const& { return game_id_; }
        auto Owner() const noexcept -> std::string const& { return owner_; }

    private:
        GameLockManager* mgr_;
        std::string game_id_;
        std::string owner_;
    };

    // Keyed, time-leased mutual exclusion. An expired lease may be taken over.
    class GameLockManager
    {
    public:
        virtual ~GameLockManager() = default;

        // Waits at most `wait` for the game; false on timeout.
        virtual auto TryAcquire(std::string_view game_id, std::string_view owner,
                                std::chrono::milliseconds wait,
                                std::chrono::milliseconds lease) -> bool = 0;

        // Drops the lease if `owner` still holds it.
        virtual auto Release(std::string_view game_id, std::string_view owner) -> bool = 0;

        // Throws error::ConcurrentModificationError when the wait runs out.
        auto Acquire(std::string game_id, std::string owner,
                     std::chrono::milliseconds wait,
                     std::chrono::milliseconds lease) -> GameLock;
    };

    class InMemoryGameLockManager final : public GameLockManager
    {
    public:
        using Clock = std::chrono::steady_clock;

        auto TryAcquire(std::string_view game_id, std::string_view owner,
                        std::chrono::milliseconds wait,
                        std::chrono::milliseconds lease) -> bool override;
        auto Release(std::string_view game_id, std::string_view owner) -> bool override;

        // Current live holder, if any
        auto Holder(std::string_view game_id) const -> std::optional<std::string>;

    private:
        struct Lease
        {
            std::string owner;
            Clock::time_point expires;
        };

        mutable std::mutex m_;
        std::condition_variable cv_;
        std::map<std::string, Lease, std::less<>> leases_;
    };
}

#endif //RUMMIKUB_GAMELOCK_HPP
