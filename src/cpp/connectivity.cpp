// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "connectivity.h"
#include "neighbor_heuristic.h"

bool remaining_is_connected(const GridSize& grid, const VisitedBitset& visited, int32_t unvisited_count) {
    if (unvisited_count <= 1) {
        return true;
    }

    // Seed from the first unvisited cell in row-major order
    Point seed{-1, -1};
    for (int32_t r = 0; r < grid.rows && seed.row < 0; r++) {
        for (int32_t c = 0; c < grid.cols; c++) {
            if (!visited.is_visited(Point{r, c})) {
                seed = Point{r, c};
                break;
            }
        }
    }
    if (seed.row < 0) {
        return true;
    }

    // Iterative DFS; `reached` doubles as the seen set
    VisitedBitset reached(grid);
    Point stack[MAX_GRID_CELLS];
    int32_t stack_len = 0;

    stack[stack_len++] = seed;
    reached.mark(seed);

    while (stack_len > 0) {
        Point current = stack[--stack_len];

        for (const auto& d : DIRECTION_OFFSETS) {
            Point n{current.row + d[0], current.col + d[1]};
            if (!in_bounds(n, grid) || visited.is_visited(n) || reached.is_visited(n)) {
                continue;
            }
            reached.mark(n);
            if (reached.count() == unvisited_count) {
                return true;
            }
            stack[stack_len++] = n;
        }
    }

    return reached.count() == unvisited_count;
}

bool is_likely_cut_vertex(const Point& cell, const GridSize& grid, const VisitedBitset& visited) {
    int open = count_unvisited_neighbors(cell, grid, visited);
    if (open <= 1) {
        return false;
    }
    if (open == 2 && is_corner(cell, grid)) {
        return false;
    }
    return true;
}
