//
// Created by Malik T on 09/09/2025.
//

#ifndef RUMMIKUB_GAMESTORE_HPP
#define RUMMIKUB_GAMESTORE_HPP

#include <string>
#include <string_view>
#include <vector>

#include "../core/State.hpp"

namespace rummikub::service
{
    // Persistence seam of the service layer. Implementations throw
    // error::GameNotFoundError from Load for an unknown id.
    class GameStore
    {
    public:
        virtual ~GameStore() = default;

        virtual auto Load(std::string_view game_id) const -> core::GameState = 0;
        virtual auto Save(core::GameState const& state) -> void = 0;
        virtual auto List() const -> std::vector<core::GameState> = 0;
    };
}

#endif //RUMMIKUB_GAMESTORE_HPP
