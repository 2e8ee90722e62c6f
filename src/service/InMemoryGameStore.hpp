//
// Created by Malik T on 09/09/2025.
//

#ifndef RUMMIKUB_INMEMORYGAMESTORE_HPP
#define RUMMIKUB_INMEMORYGAMESTORE_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "GameStore.hpp"

namespace rummikub::service
{
    // Keeps every game as its encoded GameRecord, so a Load always goes
    // through the same decode path a real store would.
    class InMemoryGameStore final : public GameStore
    {
    public:
        auto Load(std::string_view game_id) const -> core::GameState override;
        auto Save(core::GameState const& state) -> void override;
        auto List() const -> std::vector<core::GameState> override;

        auto Size() const -> size_t;

    private:
        mutable std::mutex mx_;
        std::map<std::string, std::vector<std::uint8_t>, std::less<>> games_;
    };
}

#endif //RUMMIKUB_INMEMORYGAMESTORE_HPP
