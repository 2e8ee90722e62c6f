//
// Created by Malik T on 14/08/2025.
//

#ifndef RUMMIKUB_PLAYER_HPP
#define RUMMIKUB_PLAYER_HPP

#include <memory>

#include "Actions.hpp"
#include "State.hpp"

namespace rummikub::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by the game loop (self-play driver or a service client) with the
        // viewer's own snapshot; the returned action is validated by the engine.
        virtual PlayerAction Play(std::shared_ptr<const ViewerSnapshot> snapshot) = 0;
    };
}
#endif //RUMMIKUB_PLAYER_HPP
