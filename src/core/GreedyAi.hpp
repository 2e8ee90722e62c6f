//
// Created by Malik T on 18/08/2025.
//

#ifndef RUMMIKUB_GREEDYAI_HPP
#define RUMMIKUB_GREEDYAI_HPP

#include <random>
#include <vector>

#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace rummikub::core
{
    // Lays down the most valuable disjoint melds it can build from its rack,
    // then, once opened, lays single tiles onto the ends of board melds.
    // Draws when it has nothing legal to play.
    class GreedyAI final : public rummikub::core::Player
    {
    public:
        explicit GreedyAI(uint64_t rng_seed, int initial_meld_threshold = constants::InitialMeldThreshold);

        auto Play(std::shared_ptr<const rummikub::core::ViewerSnapshot> snapshot)
            -> rummikub::core::PlayerAction override;

        // Candidate melds buildable from the rack alone, valid and disjoint-agnostic.
        static auto CandidateMelds(std::vector<TileId> const& rack) -> std::vector<Meld>;

    private:
        struct Priced
        {
            Meld meld;
            int value{};
        };

        auto PickDisjoint(std::vector<Meld> candidates) -> std::vector<Priced>;
        static auto ExtendBoard(std::vector<Meld>& board, std::vector<TileId>& rack) -> bool;

    private:
        std::mt19937 rng_;
        int threshold_;
    };
}

#endif //RUMMIKUB_GREEDYAI_HPP
