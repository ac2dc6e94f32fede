// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "grid_geometry.h"

#include <cstdlib>

bool is_valid_grid(const GridSize& grid) {
    if (grid.rows <= 0 || grid.cols <= 0) {
        return false;
    }
    // Compare without multiplying to stay clear of overflow on huge inputs.
    return grid.rows <= MAX_GRID_CELLS / grid.cols;
}

bool is_corner(const Point& p, const GridSize& grid) {
    const bool top_or_bottom = p.row == 0 || p.row == grid.rows - 1;
    const bool left_or_right = p.col == 0 || p.col == grid.cols - 1;
    return top_or_bottom && left_or_right;
}

bool is_edge(const Point& p, const GridSize& grid) {
    if (is_corner(p, grid)) {
        return false;
    }
    return p.row == 0 || p.row == grid.rows - 1 || p.col == 0 || p.col == grid.cols - 1;
}

bool is_adjacent(const Point& a, const Point& b) {
    return manhattan_distance(a, b) == 1;
}

int32_t manhattan_distance(const Point& a, const Point& b) {
    return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}

std::optional<Direction> direction_toward(const Point& from, const Point& to) {
    if (to.row < from.row) return Direction::Up;
    if (to.row > from.row) return Direction::Down;
    if (to.col < from.col) return Direction::Left;
    if (to.col > from.col) return Direction::Right;
    return std::nullopt;
}
