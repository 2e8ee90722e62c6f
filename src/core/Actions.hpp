//
// Created by Malik T on 14/08/2025.
//

#ifndef RUMMIKUB_ACTIONS_HPP
#define RUMMIKUB_ACTIONS_HPP

#include "Types.hpp"

namespace rummikub::core
{
    // The whole board the player wants to leave behind, not a delta.
    struct PlayTilesAction { std::vector<Meld> melds; };
    struct DrawAction      {};

    using PlayerAction = std::variant<PlayTilesAction, DrawAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        TurnEnded,
        GameEnded
    };
} // namespace rummikub::core

#endif //RUMMIKUB_ACTIONS_HPP
