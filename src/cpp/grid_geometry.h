// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HAMGRID_GRID_GEOMETRY_H
#define HAMGRID_GRID_GEOMETRY_H

#include <cstddef>
#include <cstdint>
#include <optional>

// Hard capacity of the fixed-width visited bitset (32x32).
constexpr int32_t MAX_GRID_CELLS = 1024;

// Grid cell, addressed by row and column.
struct Point {
    int32_t row = 0;
    int32_t col = 0;

    bool operator==(const Point& o) const { return row == o.row && col == o.col; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

struct GridSize {
    int32_t rows = 0;
    int32_t cols = 0;

    int32_t cell_count() const { return rows * cols; }
};

enum class Direction : uint8_t {
    Up = 0,
    Down = 1,
    Left = 2,
    Right = 3
};

// Enumeration order of neighbors: up, down, left, right.
// Ranking ties are broken by this order.
constexpr int32_t DIRECTION_OFFSETS[4][2] = {
    {-1, 0},
    {1, 0},
    {0, -1},
    {0, 1}
};

inline bool in_bounds(int32_t row, int32_t col, const GridSize& grid) {
    return row >= 0 && row < grid.rows && col >= 0 && col < grid.cols;
}

inline bool in_bounds(const Point& p, const GridSize& grid) {
    return in_bounds(p.row, p.col, grid);
}

// Checkerboard color of a cell, always 0 or 1.
inline int cell_parity(int32_t row, int32_t col) {
    const int64_t sum = static_cast<int64_t>(row) + col;
    return static_cast<int>((sum % 2 + 2) % 2);
}

inline bool has_different_parity(int32_t r1, int32_t c1, int32_t r2, int32_t c2) {
    return cell_parity(r1, c1) != cell_parity(r2, c2);
}

// Row-major index. Caller guarantees the point is in bounds.
inline size_t cell_index(const Point& p, const GridSize& grid) {
    return static_cast<size_t>(p.row) * static_cast<size_t>(grid.cols) + static_cast<size_t>(p.col);
}

// True when the grid has positive dimensions and fits the bitset capacity.
bool is_valid_grid(const GridSize& grid);

bool is_corner(const Point& p, const GridSize& grid);

// Boundary cell that is not a corner.
bool is_edge(const Point& p, const GridSize& grid);

// 4-adjacency.
bool is_adjacent(const Point& a, const Point& b);

int32_t manhattan_distance(const Point& a, const Point& b);

// Direction from `from` toward `to`. Rows are compared before columns, so a
// non-adjacent pair still yields a direction; identical points yield none.
std::optional<Direction> direction_toward(const Point& from, const Point& to);

#endif // HAMGRID_GRID_GEOMETRY_H
