//
// Created by Malik T on 05/09/2025.
//

#ifndef RUMMIKUB_STANDARDRULES_HPP
#define RUMMIKUB_STANDARDRULES_HPP
#include "Rules.hpp"

namespace rummikub::core
{
    class StandardRules final : public Rules
    {
    public:
        explicit StandardRules(int initial_meld_threshold = constants::InitialMeldThreshold);

        auto Validate(GameState const& state, std::string_view actor, PlayerAction const& a) const
            -> CheckResult override;
        auto Apply(GameState const& state, std::string_view actor, PlayerAction const& a) const
            -> GameState override;
        auto Advance(GameState const& state) const -> Result<GameState> override;

        auto Threshold() const noexcept -> int { return threshold_; }

    private:
        int threshold_;
    };
}

#endif //RUMMIKUB_STANDARDRULES_HPP
