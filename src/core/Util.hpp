//
// Created by Malik T on 14/08/2025.
//

#ifndef RUMMIKUB_UTIL_HPP
#define RUMMIKUB_UTIL_HPP

#include <array>
#include <bitset>
#include <format>
#include <random>
#include <span>
#include <string>
#include <string_view>

#include "Types.hpp"

namespace rummikub::core::util
{
    class TileUniqueChecker
    {
    public:
        TileUniqueChecker():
            tiles_{}, contains_dup_(false) {}

        auto Add(TileId t) -> void
        {
            contains_dup_ |= tiles_.test(t.index);
            tiles_.set(t.index);
        }

        auto AddAll(std::span<TileId const> ts) -> void
        {
            for (auto const t : ts) Add(t);
        }

        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }

        [[nodiscard]]
        auto Count() const -> size_t
        {
            return tiles_.count();
        }

        [[nodiscard]]
        auto Complete() const -> bool
        {
            return tiles_.count() == constants::TileCount;
        }

    private:
        // one bit per tile index; indices past the universe are still tracked
        std::bitset<256> tiles_;
        bool contains_dup_;
    };

    inline auto Trim(std::string_view s) -> std::string_view
    {
        auto const is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; };
        while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
        while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
        return s;
    }

    // Opaque 16-hex-digit token, used for player ids and lock owner tokens.
    template <class Rng>
    inline auto HexToken(Rng& rng) -> std::string
    {
        std::uniform_int_distribution<uint64_t> dist;
        return std::format("{:016x}", dist(rng));
    }

    // "[Action] [Preposition] [Location]", e.g. "Siege of Gondor".
    template <class Rng>
    inline auto GameName(Rng& rng) -> std::string
    {
        static constexpr std::array<std::string_view, 22> actions{
            "Siege", "Defense", "Quest", "Trial", "Fall", "Reckoning",
            "Incursion", "Blockade", "Extraction", "Breach", "Containment",
            "Battle", "Challenge", "War", "Conquest", "Showdown", "Rumble",
            "Uprising", "Gambit", "Clash", "Tournament", "Race"
        };
        static constexpr std::array<std::string_view, 5> prepositions{"of", "at", "for", "on", "in"};
        static constexpr std::array<std::string_view, 22> locations{
            "Gondor", "the Black Forest", "Dragon's Peak", "Ironhold", "the Whispering Caves",
            "Mars", "Sector 7G", "the Orion Nebula", "Titan Station", "Alpha Centauri",
            "Barcelona", "Madrid", "Seville", "Tokyo", "Cairo", "London", "Moscow",
            "Berlin", "Brazil", "Egypt", "Japan", "New York"
        };

        auto pick = [&rng](auto const& list) -> std::string_view
        {
            std::uniform_int_distribution<size_t> dist(0, list.size() - 1);
            return list[dist(rng)];
        };
        auto const action = pick(actions);
        auto const prep = pick(prepositions);
        auto const location = pick(locations);
        return std::format("{} {} {}", action, prep, location);
    }
}

#endif //RUMMIKUB_UTIL_HPP
