//
// Created by Malik T on 02/09/2025.
//

#ifndef RUMMIKUB_TILECODEC_HPP
#define RUMMIKUB_TILECODEC_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Exception.hpp"
#include "Types.hpp"

// Mapping between the 106 physical tiles and their dense TileId.
// Numbered tiles occupy [0, 104): ((color * 13) + (number - 1)) * 2 + copy.
// Jokers occupy 104 (copy A) and 105 (copy B).
namespace rummikub::core::tiles
{
    // Throws (Assertion) for a number outside 1..13; callers holding
    // untrusted input go through Parse instead.
    [[nodiscard]] auto Encode(uint8_t number, Color color, Copy copy) -> TileId;
    [[nodiscard]] auto EncodeJoker(Copy copy) -> TileId;

    [[nodiscard]] auto IsValid(TileId id) noexcept -> bool;
    [[nodiscard]] auto IsJoker(TileId id) noexcept -> bool;

    // Empty for jokers.
    auto NumberOf(TileId id) -> std::optional<uint8_t>;
    auto ColorOf(TileId id) -> std::optional<Color>;
    auto CopyOf(TileId id) -> Copy;

    // Face value; AmbiguousValue for a joker outside a meld.
    auto ValueOf(TileId id) -> Result<int>;

    auto Decode(TileId id) -> Tile;
    auto FullUniverse() -> std::vector<TileId>;

    // "10ra", "jb"
    auto ToString(TileId id) -> std::string;
    // Inverse of ToString; UnknownTile on anything else.
    auto Parse(std::string_view text) -> Result<TileId>;
    // "Red 10", "Joker"
    auto Format(TileId id) -> std::string;

    auto ColorCode(Color c) -> char;
    auto ColorName(Color c) -> std::string_view;
}

#endif //RUMMIKUB_TILECODEC_HPP
