// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "neighbor_heuristic.h"

#include <algorithm>

int count_unvisited_neighbors(const Point& p, const GridSize& grid, const VisitedBitset& visited) {
    int count = 0;
    for (const auto& d : DIRECTION_OFFSETS) {
        Point n{p.row + d[0], p.col + d[1]};
        if (in_bounds(n, grid) && !visited.is_visited(n)) {
            count++;
        }
    }
    return count;
}

int32_t score_candidate(
    const Point& candidate,
    const Point& target,
    const GridSize& grid,
    const VisitedBitset& visited,
    int32_t unvisited_count,
    const HeuristicWeights& weights
) {
    if (candidate == target) {
        return TARGET_SCORE;
    }

    // Warnsdorff: fewer onward options first
    int onward = count_unvisited_neighbors(candidate, grid, visited);
    int32_t score = onward * weights.warnsdorff;

    if (is_corner(candidate, grid)) {
        score += weights.corner_bonus;
    } else if (is_edge(candidate, grid)) {
        score += weights.edge_bonus;
    }

    // Distance shaping: stay away from the target while more than half the
    // grid is open, head for it in the last few steps.
    int32_t distance = manhattan_distance(candidate, target);
    if (unvisited_count > grid.cell_count() / 2) {
        score += std::max(0, weights.near_target_radius - distance);
    } else if (unvisited_count <= weights.endgame_cells) {
        score += distance * weights.endgame_scale;
    }

    if (onward == 1) {
        score += weights.urgent_bonus;
    }

    return score;
}

RankedNeighbors ranked_unvisited_neighbors(
    const Point& cell,
    const Point& target,
    const GridSize& grid,
    const VisitedBitset& visited,
    int32_t unvisited_count,
    const HeuristicWeights& weights
) {
    RankedNeighbors ranked;
    int32_t scores[4];

    for (const auto& d : DIRECTION_OFFSETS) {
        Point n{cell.row + d[0], cell.col + d[1]};
        if (!in_bounds(n, grid) || visited.is_visited(n)) {
            continue;
        }
        scores[ranked.count] = score_candidate(n, target, grid, visited, unvisited_count, weights);
        ranked.cells[ranked.count] = n;
        ranked.count++;
    }

    // Insertion sort, stable on equal scores
    for (uint8_t i = 1; i < ranked.count; i++) {
        Point p = ranked.cells[i];
        int32_t s = scores[i];
        int j = i - 1;
        while (j >= 0 && scores[j] > s) {
            scores[j + 1] = scores[j];
            ranked.cells[j + 1] = ranked.cells[j];
            j--;
        }
        scores[j + 1] = s;
        ranked.cells[j + 1] = p;
    }

    return ranked;
}
