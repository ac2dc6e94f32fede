// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HAMGRID_NEIGHBOR_HEURISTIC_H
#define HAMGRID_NEIGHBOR_HEURISTIC_H

#include "grid_geometry.h"
#include "visited_bitset.h"

#include <cstdint>

// Score given to the target so it is always tried last.
constexpr int32_t TARGET_SCORE = INT32_MAX;

// Weights of the move ordering score (lower score is tried first).
struct HeuristicWeights {
    int32_t warnsdorff = 10;        // Per unvisited neighbor of the candidate
    int32_t corner_bonus = -3;      // Corners have the fewest approach routes
    int32_t edge_bonus = -1;
    int32_t near_target_radius = 4; // Opening phase: penalty = radius - distance, floored at 0
    int32_t endgame_cells = 4;      // Closing phase starts at this many unvisited cells
    int32_t endgame_scale = 1;      // Closing phase: + distance * scale
    int32_t urgent_bonus = -2;      // Candidate with exactly one unvisited neighbor
};

// Up to four ranked candidates, best first.
struct RankedNeighbors {
    Point cells[4];
    uint8_t count = 0;
};

// Number of in-bounds, unvisited 4-neighbors of `p`.
int count_unvisited_neighbors(const Point& p, const GridSize& grid, const VisitedBitset& visited);

// Score of moving to `candidate`. `unvisited_count` is the number of unvisited
// cells before the move.
int32_t score_candidate(
    const Point& candidate,
    const Point& target,
    const GridSize& grid,
    const VisitedBitset& visited,
    int32_t unvisited_count,
    const HeuristicWeights& weights
);

// Unvisited neighbors of `cell`, ordered by ascending score. Ties keep the
// up/down/left/right enumeration order. Pure: the same inputs always give the
// same order.
RankedNeighbors ranked_unvisited_neighbors(
    const Point& cell,
    const Point& target,
    const GridSize& grid,
    const VisitedBitset& visited,
    int32_t unvisited_count,
    const HeuristicWeights& weights = HeuristicWeights()
);

#endif // HAMGRID_NEIGHBOR_HEURISTIC_H
