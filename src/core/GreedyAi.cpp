//
// Created by Malik T on 18/08/2025.
//

#include "GreedyAi.hpp"
#include <algorithm>
#include <array>
#include <functional>
#include <iterator>
#include <optional>
#include <ranges>
#include <utility>

#include "MeldValidator.hpp"
#include "TileCodec.hpp"

namespace rummikub::core
{
    GreedyAI::GreedyAI(uint64_t rng_seed, int const initial_meld_threshold):
        rng_(rng_seed), threshold_(initial_meld_threshold) {}

    namespace
    {
        auto Valid(Meld const& m) -> bool
        {
            return meld::ValidateAndPrice(m).has_value();
        }

        // [number][color] -> one tile of that face held in the rack
        using FaceTable = std::array<std::array<std::optional<TileId>, constants::ColorCount>, constants::MaxNumber + 1>;

        auto Faces(std::vector<TileId> const& rack) -> FaceTable
        {
            FaceTable faces{};
            for (TileId const id : rack)
            {
                if (tiles::IsJoker(id)) continue;
                auto& slot = faces[*tiles::NumberOf(id)][std::to_underlying(*tiles::ColorOf(id))];
                if (!slot) slot = id;
            }
            return faces;
        }
    }

    auto GreedyAI::CandidateMelds(std::vector<TileId> const& rack) -> std::vector<Meld>
    {
        FaceTable const faces = Faces(rack);
        std::vector<TileId> jokers;
        std::ranges::copy_if(rack, std::back_inserter(jokers), [](TileId id) { return tiles::IsJoker(id); });

        std::vector<Meld> out;

        // Groups: one tile per color of a number, a joker filling a pair
        for (uint8_t n = constants::MinNumber; n <= constants::MaxNumber; ++n)
        {
            Meld g{MeldKind::Group, {}};
            for (auto const& slot : faces[n])
                if (slot) g.tiles.push_back(*slot);

            if (g.tiles.size() >= constants::GroupMinSize) out.push_back(g);
            if (g.tiles.size() == 2)
            {
                for (TileId const j : jokers)
                {
                    Meld with_joker = g;
                    with_joker.tiles.push_back(j);
                    out.push_back(std::move(with_joker));
                }
            }
        }

        // Runs: maximal consecutive stretches per color, a joker stretching a pair
        for (Color const c : AllColors)
        {
            auto const col = std::to_underlying(c);
            uint8_t n = constants::MinNumber;
            while (n <= constants::MaxNumber)
            {
                if (!faces[n][col])
                {
                    ++n;
                    continue;
                }
                Meld r{MeldKind::Run, {}};
                while (n <= constants::MaxNumber && faces[n][col])
                {
                    r.tiles.push_back(*faces[n][col]);
                    ++n;
                }

                if (r.tiles.size() >= constants::RunMinSize) out.push_back(r);
                if (r.tiles.size() == 2)
                {
                    for (TileId const j : jokers)
                    {
                        Meld with_joker = r;
                        // n is one past the pair; fall back to the front at 13
                        if (n <= constants::MaxNumber) with_joker.tiles.push_back(j);
                        else with_joker.tiles.insert(with_joker.tiles.begin(), j);
                        out.push_back(std::move(with_joker));
                    }
                }
            }
        }

        std::erase_if(out, [](Meld const& m) { return !Valid(m); });
        return out;
    }

    auto GreedyAI::PickDisjoint(std::vector<Meld> candidates) -> std::vector<Priced>
    {
        std::vector<Priced> priced;
        for (Meld& m : candidates)
        {
            auto const p = meld::ValidateAndPrice(m);
            if (p) priced.push_back(Priced{std::move(m), p->value});
        }

        // random tie-break between equally valued melds
        std::ranges::shuffle(priced, rng_);
        std::ranges::stable_sort(priced, std::ranges::greater{}, &Priced::value);

        std::vector<Priced> picked;
        TileSet used;
        for (Priced& p : priced)
        {
            if (std::ranges::any_of(p.meld.tiles, [&](TileId id) { return used.contains(id); })) continue;
            used.insert(p.meld.tiles.begin(), p.meld.tiles.end());
            picked.push_back(std::move(p));
        }
        return picked;
    }

    auto GreedyAI::ExtendBoard(std::vector<Meld>& board, std::vector<TileId>& rack) -> bool
    {
        bool any = false;
        bool changed = true;
        while (changed)
        {
            changed = false;
            for (Meld& m : board)
            {
                for (auto it = rack.begin(); it != rack.end(); ++it)
                {
                    // jokers are worth more kept in hand
                    if (tiles::IsJoker(*it)) continue;

                    Meld back = m;
                    back.tiles.push_back(*it);
                    Meld front = m;
                    front.tiles.insert(front.tiles.begin(), *it);

                    if (Valid(back)) m = std::move(back);
                    else if (m.kind == MeldKind::Run && Valid(front)) m = std::move(front);
                    else continue;

                    rack.erase(it);
                    changed = any = true;
                    break;
                }
            }
        }
        return any;
    }

    auto GreedyAI::Play(std::shared_ptr<const ViewerSnapshot> snapshot) -> PlayerAction
    {
        if (snapshot->my_rack.empty()) return DrawAction{};

        std::vector<Priced> const melds = PickDisjoint(CandidateMelds(snapshot->my_rack));

        int value = 0;
        for (Priced const& p : melds) value += p.value;

        bool const opened = snapshot->my_initial_meld_met;
        if (!opened && value < threshold_) return DrawAction{};

        std::vector<Meld> board = snapshot->board;
        std::vector<TileId> rack = snapshot->my_rack;
        for (Priced const& p : melds)
        {
            std::erase_if(rack, [&](TileId id) { return std::ranges::find(p.meld.tiles, id) != p.meld.tiles.end(); });
            board.push_back(p.meld);
        }

        bool const extended = opened && ExtendBoard(board, rack);
        if (melds.empty() && !extended) return DrawAction{};

        return PlayTilesAction{std::move(board)};
    }
}
