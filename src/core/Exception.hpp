//
// Created by Malik T on 14/08/2025.
//

#ifndef RUMMIKUB_EXCEPTION_HPP
#define RUMMIKUB_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace rummikub::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a rejected move)
        State, // state engine misuse (not a rejected move)
        InvalidAction, // caller handed the engine something it cannot interpret
        NotFound, // game id missing from the store
        Concurrency, // game lock not acquired in time
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct GameNotFoundError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConcurrentModificationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Rules: throw RulesError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c);
        case Code::NotFound: throw GameNotFoundError(std::move(msg), c);
        case Code::Concurrency: throw ConcurrentModificationError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define RMK_THROW(code_enum, msg) ::rummikub::core::error::fail((code_enum), (msg))
#define RMK_ASSERT(cond, msg) do { if(!(cond)) ::rummikub::core::error::fail(::rummikub::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by where they are detected.
    enum class RuleViolationCode : std::uint16_t
    {
        // Meld / tile
        SizeError,
        UnknownTile,
        DuplicateTile,
        MixedNumbers,
        ColorDuplication,
        AmbiguousGroup,
        TooManyJokers,
        MixedColors,
        AmbiguousRun,
        NonConsecutive,
        OutOfRange,
        AmbiguousValue,

        // Play / turn
        TileNotOwned,
        BoardTilesMissing,
        InitialMeldNotMet,
        NoOpMove,
        NotPlayersTurn,
        GameNotStarted,
        GameFinished,
        PoolEmpty,
        PlayerNotInGame,

        // Join / creation
        NameTaken,
        GameFull,
        InvalidName,
        InvalidPlayerCount,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<std::string> player_id{};
        std::optional<PlyrIdxT> seat{};
        std::optional<GameStatus> status{};

        // Textual tile id ("7ra", "jb") or the raw text that failed to parse
        std::optional<std::string> tile{};
        std::optional<std::uint16_t> meld_index{};

        // Small integers useful in error messages
        std::optional<int> points{};
        std::optional<int> threshold{};
        std::optional<std::uint16_t> attempted_count{}; // e.g., meld size, player count

        auto with_player(std::string id) -> RuleViolation&
        {
            player_id = std::move(id);
            return *this;
        }

        auto with_seat(PlyrIdxT s) -> RuleViolation&
        {
            seat = s;
            return *this;
        }

        auto with_status(GameStatus s) -> RuleViolation&
        {
            status = s;
            return *this;
        }

        auto with_tile(std::string t) -> RuleViolation&
        {
            tile = std::move(t);
            return *this;
        }

        auto with_meld(std::uint16_t i) -> RuleViolation&
        {
            meld_index = i;
            return *this;
        }

        auto with_points(int p) -> RuleViolation&
        {
            points = p;
            return *this;
        }

        auto with_threshold(int t) -> RuleViolation&
        {
            threshold = t;
            return *this;
        }

        auto with_attempted(std::uint16_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Meld / tile
        case E::SizeError: return "Meld: wrong number of tiles";
        case E::UnknownTile: return "Tile: not part of the tile set";
        case E::DuplicateTile: return "Tile: used more than once";
        case E::MixedNumbers: return "Group: tiles show different numbers";
        case E::ColorDuplication: return "Group: color repeated";
        case E::AmbiguousGroup: return "Group: no numbered tile to fix its number";
        case E::TooManyJokers: return "Group: more jokers than free colors";
        case E::MixedColors: return "Run: tiles show different colors";
        case E::AmbiguousRun: return "Run: no numbered tile to anchor it";
        case E::NonConsecutive: return "Run: numbers not consecutive";
        case E::OutOfRange: return "Run: leaves the range 1..13";
        case E::AmbiguousValue: return "Tile: joker has no value outside a meld";

        // Play / turn
        case E::TileNotOwned: return "Play: tile not in player's rack";
        case E::BoardTilesMissing: return "Play: tile removed from the board";
        case E::InitialMeldNotMet: return "Play: initial meld below threshold";
        case E::NoOpMove: return "Play: no tile from the rack was played";
        case E::NotPlayersTurn: return "Turn: not this player's turn";
        case E::GameNotStarted: return "Turn: game has not started";
        case E::GameFinished: return "Turn: game is finished";
        case E::PoolEmpty: return "Draw: pool is empty";
        case E::PlayerNotInGame: return "Player: not part of this game";

        // Join / creation
        case E::NameTaken: return "Join: name already taken";
        case E::GameFull: return "Join: no free seat";
        case E::InvalidName: return "Join: name is empty";
        case E::InvalidPlayerCount: return "Create: player count outside 2..4";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    // Stable machine-readable reason, shipped in Violation messages.
    inline auto reason_code(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::SizeError: return "SIZE_ERROR";
        case E::UnknownTile: return "UNKNOWN_TILE";
        case E::DuplicateTile: return "DUPLICATE_TILE";
        case E::MixedNumbers: return "MIXED_NUMBERS";
        case E::ColorDuplication: return "COLOR_DUPLICATION";
        case E::AmbiguousGroup: return "AMBIGUOUS_GROUP";
        case E::TooManyJokers: return "TOO_MANY_JOKERS";
        case E::MixedColors: return "MIXED_COLORS";
        case E::AmbiguousRun: return "AMBIGUOUS_RUN";
        case E::NonConsecutive: return "NON_CONSECUTIVE";
        case E::OutOfRange: return "OUT_OF_RANGE";
        case E::AmbiguousValue: return "AMBIGUOUS_VALUE";
        case E::TileNotOwned: return "TILE_NOT_OWNED";
        case E::BoardTilesMissing: return "BOARD_TILES_MISSING";
        case E::InitialMeldNotMet: return "INITIAL_MELD_NOT_MET";
        case E::NoOpMove: return "NO_OP_MOVE";
        case E::NotPlayersTurn: return "NOT_PLAYERS_TURN";
        case E::GameNotStarted: return "GAME_NOT_STARTED";
        case E::GameFinished: return "GAME_FINISHED";
        case E::PoolEmpty: return "POOL_EMPTY";
        case E::PlayerNotInGame: return "PLAYER_NOT_IN_GAME";
        case E::NameTaken: return "NAME_TAKEN";
        case E::GameFull: return "GAME_FULL";
        case E::InvalidName: return "INVALID_NAME";
        case E::InvalidPlayerCount: return "INVALID_PLAYER_COUNT";
        case E::Internal_Unreachable: return "INTERNAL_UNREACHABLE";
        }
        return "UNKNOWN";
    }

    inline auto to_string(GameStatus s) -> std::string_view
    {
        switch (s)
        {
        case GameStatus::WaitingForPlayers: return "waiting_for_players";
        case GameStatus::InProgress: return "in_progress";
        case GameStatus::Completed: return "completed";
        }
        return "unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.status) s += std::format(" | status={}", to_string(*v.status));
        if (v.player_id) s += std::format(" | player={}", *v.player_id);
        if (v.seat) s += std::format(" | seat=P{}", static_cast<int>(*v.seat));
        if (v.tile) s += std::format(" | tile={}", *v.tile);
        if (v.meld_index) s += std::format(" | meld=#{}", *v.meld_index);
        if (v.points) s += std::format(" | points={}", *v.points);
        if (v.threshold) s += std::format(" | need={}", *v.threshold);
        if (v.attempted_count) s += std::format(" | attempted={}", *v.attempted_count);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

namespace rummikub::core
{
    template <class T>
    using Result = std::expected<T, error::RuleViolation>;
}

#endif //RUMMIKUB_EXCEPTION_HPP
