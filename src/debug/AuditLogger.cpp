#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/MeldValidator.hpp"

using namespace rummikub::core;

namespace
{

auto s_status(GameStatus const s) -> std::string_view
{
    switch (s)
    {
        case GameStatus::WaitingForPlayers: return "W";
        case GameStatus::InProgress:        return "P";
        case GameStatus::Completed:         return "C";
    }
    return "?";
}

auto s_meld(Meld const& m) -> std::string
{
    return std::format("{}({})", m.kind == MeldKind::Group ? "G" : "R", meld::CanonicalId(m));
}

auto s_board(std::vector<Meld> const& board) -> std::string
{
    std::string serial;
    for (size_t i{}; i < board.size(); ++i)
    {
        serial += (i ? "," : "");
        serial += s_meld(board[i]);
    }
    return serial;
}

auto seat_of(GameState const& g, std::string_view id) -> int
{
    for (size_t i{}; i < g.players.size(); ++i)
        if (g.players[i].id == id) return static_cast<int>(i);
    return -1;
}

} // anonymous namespace

namespace rummikub::core::debug
{

auto DescribeAction(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayTilesAction>)
            {
                return std::format("PlayTiles[{}]", s_board(act.melds));
            }
            else
            {
                return "Draw";
            }
        },
        a
    );
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& game, uint64_t seed) -> void
{
    out_ << std::format("Game={} \"{}\"\n", game.game_id, game.game_name);
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", game.players.size());
    out_ << std::format("Pool={}\n", game.pool.size());
    out_.flush();
}

auto AuditLogger::turn(GameState const& game,
                       std::string_view actor,
                       PlayerAction const& a) -> void
{
    int const seat = seat_of(game, actor);
    std::size_t const rack = seat >= 0 ? game.players[static_cast<size_t>(seat)].rack.size() : 0;

    out_ << std::format(
        "Turn v={} actor=P{} status={} rack={} pool={} board=[{}]\n",
        game.version,
        seat,
        s_status(game.status),
        rack,
        game.pool.size(),
        s_board(game.board)
    );

    out_ << std::format("Action: {}\n", DescribeAction(a));
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied   ? "Applied" :
        (m == MoveOutcome::TurnEnded ? "TurnEnded" :
        (m == MoveOutcome::GameEnded ? "GameEnded" : "Invalid")));
    out_ << std::format("Outcome: {}\n", txt);
}

auto AuditLogger::violation(error::RuleViolation const& v) -> void
{
    out_ << std::format("Rejected: {} {}\n", error::reason_code(v.code), error::describe(v));
}

auto AuditLogger::note(std::string_view text) -> void
{
    out_ << std::format("Note: {}\n", text);
}

auto AuditLogger::end(GameState const& game, std::map<std::string, int> const& scores) -> void
{
    int const winner = game.winner_id ? seat_of(game, *game.winner_id) : -1;
    out_ << std::format("Winner={}\n", winner);

    std::string body;
    for (size_t i{}; i < game.players.size(); ++i)
    {
        auto const it = scores.find(game.players[i].id);
        body += std::format("{}{}:{}", (i ? "," : ""), i, it != scores.end() ? it->second : 0);
    }
    out_ << std::format("Scores=[{}]\n", body);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace rummikub::core::debug
