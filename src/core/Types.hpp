//
// Created by Malik T on 14/08/2025.
//

#ifndef RUMMIKUB_TYPES_HPP
#define RUMMIKUB_TYPES_HPP

#define RMK_ENABLE_TEST_HOOKS true

#include <array>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <random>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace rummikub::core::constants
{
    inline constexpr uint8_t MinNumber = 1;
    inline constexpr uint8_t MaxNumber = 13;
    inline constexpr size_t  ColorCount = 4;
    inline constexpr size_t  CopyCount = 2;
    inline constexpr size_t  NumberedTileCount = MaxNumber * ColorCount * CopyCount; // 104
    inline constexpr size_t  JokerCount = 2;
    inline constexpr size_t  TileCount = NumberedTileCount + JokerCount;            // 106

    inline constexpr size_t GroupMinSize = 3;
    inline constexpr size_t GroupMaxSize = 4;
    inline constexpr size_t RunMinSize = 3;

    inline constexpr size_t MinPlayers = 2;
    inline constexpr size_t MaxPlayers = 4;
    inline constexpr uint8_t RackSize = 14;
    inline constexpr int InitialMeldThreshold = 30;

    // Penalty a joker left on a rack costs at the end of the game
    inline constexpr int JokerPenalty = 30;
}

namespace rummikub::core
{
    // Declaration order is the canonical color order (Black, Red, Blue, Orange).
    enum class Color : uint8_t
    {
        Black = 0,
        Red,
        Blue,
        Orange
    };

    inline constexpr std::array<Color, constants::ColorCount> AllColors{
        Color::Black, Color::Red, Color::Blue, Color::Orange
    };

    enum class Copy : uint8_t
    {
        A = 0,
        B
    };

    struct NumberedTile
    {
        uint8_t number{};
        Color color{};
        Copy copy{};
    };

    struct JokerTile
    {
        Copy copy{};
    };

    using Tile = std::variant<NumberedTile, JokerTile>;

    // Dense index into the 106-tile universe. This is the only tile handle kept
    // in game state; use tiles::Decode for the structured view.
    struct TileId
    {
        uint8_t index{};

        auto operator<=>(TileId const&) const = default;
    };

    using TileSet = std::set<TileId>;

    enum class MeldKind : uint8_t
    {
        Group,
        Run
    };

    // Tiles keep submission order; for runs the position is what resolves jokers.
    struct Meld
    {
        MeldKind kind{MeldKind::Group};
        std::vector<TileId> tiles;
    };

    enum class GameStatus : uint8_t
    {
        WaitingForPlayers,
        InProgress,
        Completed
    };

    using PlyrIdxT = uint8_t;
    using Timestamp = std::chrono::system_clock::time_point;

    struct Config
    {
        uint32_t n_players{2};
        uint8_t  rack_size{constants::RackSize};
        int      initial_meld_threshold{constants::InitialMeldThreshold};
        uint64_t seed{std::random_device{}()};
        // run debug::CheckInvariants on every state the engine hands back
        bool     check_invariants{false};
        std::chrono::milliseconds lock_wait{std::chrono::seconds(5)};
        std::chrono::milliseconds lock_lease{std::chrono::seconds(5)};
    };
}

#endif //RUMMIKUB_TYPES_HPP
