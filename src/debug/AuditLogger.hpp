//
// Created by Malik T on 20/08/2025.
//

#ifndef RUMMIKUB_AUDITLOGGER_HPP
#define RUMMIKUB_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <string>
#include <string_view>

#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace rummikub::core::debug
{
    // Line-oriented transcript of one or more games, meant for humans diffing runs.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (game id/name, seed, player count, pool size)
        auto start(GameState const& game, std::uint64_t seed) -> void;

        // Per turn (before the engine runs): actor, rack/board sizes, proposed action
        auto turn(GameState const& game,
                  std::string_view actor,
                  PlayerAction const& a) -> void;

        // Per step outcome (after apply/advance)
        auto outcome(MoveOutcome m) -> void;

        // Rejected action
        auto violation(error::RuleViolation const& v) -> void;

        // Free-form note (joins, skipped turns)
        auto note(std::string_view text) -> void;

        // Game end footer (winner and penalty scores)
        auto end(GameState const& game, std::map<std::string, int> const& scores) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    auto DescribeAction(PlayerAction const& a) -> std::string;
}

#endif //RUMMIKUB_AUDITLOGGER_HPP
