//
// Created by Malik T on 02/09/2025.
//

#include "MeldValidator.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <optional>
#include <tuple>
#include <utility>

#include "TileCodec.hpp"
#include "Util.hpp"

namespace rummikub::core::meld
{
    using RVC = error::RuleViolationCode;

    namespace
    {
        inline auto Viol(RVC c) -> error::RuleViolation
        {
            return error::RuleViolation{ .code = c };
        }

        struct Positioned
        {
            size_t pos{};
            TileId id{};
        };

        struct Split
        {
            std::vector<Positioned> numbered;
            std::vector<Positioned> jokers;
        };

        auto SplitTiles(std::span<TileId const> tiles) -> Split
        {
            Split s;
            for (size_t i = 0; i < tiles.size(); ++i)
            {
                if (tiles::IsJoker(tiles[i])) s.jokers.push_back({i, tiles[i]});
                else s.numbered.push_back({i, tiles[i]});
            }
            return s;
        }

        auto CheckShape(MeldKind kind, std::span<TileId const> tiles) -> error::ValidateResult
        {
            auto const n = tiles.size();
            // runs are bounded by OutOfRange, not by size
            bool const size_ok = kind == MeldKind::Group
                                     ? (n >= constants::GroupMinSize && n <= constants::GroupMaxSize)
                                     : n >= constants::RunMinSize;
            if (n == 0 || !size_ok)
                return std::unexpected(Viol(RVC::SizeError).with_attempted(static_cast<uint16_t>(n)));

            for (auto const id : tiles)
            {
                if (!tiles::IsValid(id))
                    return std::unexpected(Viol(RVC::UnknownTile).with_tile(std::to_string(id.index)));
            }
            return {};
        }

        // Only a repeated joker gets this far; a repeated numbered tile already
        // failed ColorDuplication or NonConsecutive.
        auto CheckUnique(std::span<TileId const> tiles) -> error::ValidateResult
        {
            util::TileUniqueChecker seen;
            for (auto const id : tiles)
            {
                seen.Add(id);
                if (seen.ContainsDup())
                    return std::unexpected(Viol(RVC::DuplicateTile).with_tile(tiles::ToString(id)));
            }
            return {};
        }

        auto PriceGroup(std::span<TileId const> tiles) -> Result<MeldPrice>
        {
            auto const [numbered, jokers] = SplitTiles(tiles);

            std::optional<uint8_t> number;
            for (auto const& t : numbered)
            {
                auto const n = *tiles::NumberOf(t.id);
                if (number && *number != n)
                    return std::unexpected(Viol(RVC::MixedNumbers).with_tile(tiles::ToString(t.id)));
                number = n;
            }

            std::array<bool, constants::ColorCount> used{};
            for (auto const& t : numbered)
            {
                auto const c = std::to_underlying(*tiles::ColorOf(t.id));
                if (used[c])
                    return std::unexpected(Viol(RVC::ColorDuplication).with_tile(tiles::ToString(t.id)));
                used[c] = true;
            }

            if (!number) return std::unexpected(Viol(RVC::AmbiguousGroup));

            std::vector<Color> free_colors;
            for (auto const c : AllColors)
                if (!used[std::to_underlying(c)]) free_colors.push_back(c);

            if (jokers.size() > free_colors.size())
                return std::unexpected(Viol(RVC::TooManyJokers).with_attempted(static_cast<uint16_t>(jokers.size())));

            MeldPrice price{};
            price.value = static_cast<int>(*number) * static_cast<int>(tiles.size());
            for (size_t i = 0; i < jokers.size(); ++i)
                price.joker_assignment.emplace(jokers[i].id, ResolvedFace{*number, free_colors[i]});
            return price;
        }

        auto PriceRun(std::span<TileId const> tiles) -> Result<MeldPrice>
        {
            auto const [numbered, jokers] = SplitTiles(tiles);

            std::optional<Color> color;
            for (auto const& t : numbered)
            {
                auto const c = *tiles::ColorOf(t.id);
                if (color && *color != c)
                    return std::unexpected(Viol(RVC::MixedColors).with_tile(tiles::ToString(t.id)));
                color = c;
            }

            if (!color) return std::unexpected(Viol(RVC::AmbiguousRun));

            // value the run would show at position 0
            int const start = static_cast<int>(*tiles::NumberOf(numbered.front().id))
                - static_cast<int>(numbered.front().pos);
            for (auto const& t : numbered)
            {
                if (static_cast<int>(*tiles::NumberOf(t.id)) != start + static_cast<int>(t.pos))
                    return std::unexpected(Viol(RVC::NonConsecutive).with_tile(tiles::ToString(t.id)));
            }

            int const last = start + static_cast<int>(tiles.size()) - 1;
            if (start < constants::MinNumber || last > constants::MaxNumber)
                return std::unexpected(Viol(RVC::OutOfRange).with_points(start < constants::MinNumber ? start : last));

            MeldPrice price{};
            for (size_t p = 0; p < tiles.size(); ++p)
                price.value += start + static_cast<int>(p);
            for (auto const& j : jokers)
                price.joker_assignment.emplace(j.id, ResolvedFace{static_cast<uint8_t>(start + static_cast<int>(j.pos)),
                                                                  *color});
            return price;
        }
    }

    auto ValidateAndPrice(MeldKind kind, std::span<TileId const> tiles) -> Result<MeldPrice>
    {
        if (auto ok = CheckShape(kind, tiles); !ok) return std::unexpected(ok.error());
        Result<MeldPrice> price = std::unexpected(Viol(RVC::Internal_Unreachable));
        switch (kind)
        {
        case MeldKind::Group: price = PriceGroup(tiles); break;
        case MeldKind::Run: price = PriceRun(tiles); break;
        }
        if (!price) return price;
        if (auto ok = CheckUnique(tiles); !ok) return std::unexpected(ok.error());
        return price;
    }

    auto ValidateAndPrice(Meld const& m) -> Result<MeldPrice>
    {
        return ValidateAndPrice(m.kind, std::span<TileId const>{m.tiles});
    }

    auto CanonicalOrder(Meld const& m) -> std::vector<TileId>
    {
        std::vector<TileId> out = m.tiles;
        if (m.kind == MeldKind::Run) return out;

        auto key = [](TileId id)
        {
            // jokers sort past every color
            if (!tiles::IsValid(id) || tiles::IsJoker(id))
                return std::tuple{static_cast<int>(constants::ColorCount), 0, static_cast<int>(id.index)};
            return std::tuple{static_cast<int>(std::to_underlying(*tiles::ColorOf(id))),
                              static_cast<int>(*tiles::NumberOf(id)),
                              static_cast<int>(std::to_underlying(tiles::CopyOf(id)))};
        };
        std::ranges::stable_sort(out, [&](TileId a, TileId b) { return key(a) < key(b); });
        return out;
    }

    auto CanonicalId(Meld const& m) -> std::string
    {
        std::string out;
        for (auto const id : CanonicalOrder(m))
        {
            if (!out.empty()) out += '-';
            out += tiles::IsValid(id) ? tiles::ToString(id) : std::format("?{}", id.index);
        }
        return out;
    }

    auto SameMeld(Meld const& a, Meld const& b) -> bool
    {
        return a.kind == b.kind && CanonicalId(a) == CanonicalId(b);
    }

    auto KindName(MeldKind k) -> std::string_view
    {
        switch (k)
        {
        case MeldKind::Group: return "group";
        case MeldKind::Run: return "run";
        }
        return "unknown";
    }
}
