//
// Created by Malik T on 02/09/2025.
//

#ifndef RUMMIKUB_MELDVALIDATOR_HPP
#define RUMMIKUB_MELDVALIDATOR_HPP

#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "Exception.hpp"
#include "Types.hpp"

namespace rummikub::core::meld
{
    // The numbered face a joker stands for inside one meld.
    struct ResolvedFace
    {
        uint8_t number{};
        Color color{};

        auto operator==(ResolvedFace const&) const -> bool = default;
    };

    struct MeldPrice
    {
        int value{};
        std::map<TileId, ResolvedFace> joker_assignment;
    };

    // Validates a meld of the declared kind, resolves its jokers and prices it.
    // Checks run in this order and the first failure is reported:
    //   size, unknown tile, duplicate tile, then
    //   Group: MixedNumbers, ColorDuplication, AmbiguousGroup, TooManyJokers
    //   Run:   MixedColors, AmbiguousRun, NonConsecutive, OutOfRange
    auto ValidateAndPrice(MeldKind kind, std::span<TileId const> tiles) -> Result<MeldPrice>;
    auto ValidateAndPrice(Meld const& m) -> Result<MeldPrice>;

    // Groups: numbered tiles by (color, number, copy), jokers last by copy.
    // Runs: submission order.
    auto CanonicalOrder(Meld const& m) -> std::vector<TileId>;
    auto CanonicalId(Meld const& m) -> std::string;
    auto SameMeld(Meld const& a, Meld const& b) -> bool;

    auto KindName(MeldKind k) -> std::string_view;
}

#endif //RUMMIKUB_MELDVALIDATOR_HPP
