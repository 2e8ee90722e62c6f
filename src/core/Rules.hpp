//
// Created by Malik T on 15/08/2025.
//

#ifndef RUMMIKUB_RULES_HPP
#define RUMMIKUB_RULES_HPP

#include <string_view>

#include "Actions.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace rummikub::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameState const& state, std::string_view actor, PlayerAction const& a) const
            -> CheckResult = 0;

        // Builds the successor of an already validated action; state is untouched.
        virtual auto Apply(GameState const& state, std::string_view actor, PlayerAction const& a) const
            -> GameState = 0;

        // Passes the turn on, or completes the game if someone has won.
        virtual auto Advance(GameState const& state) const -> Result<GameState> = 0;
    };
}

#endif //RUMMIKUB_RULES_HPP
