// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HAMGRID_ROAD_GRID_H
#define HAMGRID_ROAD_GRID_H

#include "grid_geometry.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Road tile of one path cell.
struct CellConnectionData {
    std::vector<Direction> connections; // Toward the previous cell, then toward the next
    size_t path_index = 0;
};

// Indexed [row][col]; empty for cells not on the path.
using ConnectionGrid = std::vector<std::vector<std::optional<CellConnectionData>>>;

// "up", "down", "left" or "right".
const char* direction_name(Direction direction);

// Bit per direction: 1 = up, 2 = down, 4 = left, 8 = right.
uint8_t connection_mask(const CellConnectionData& cell);

// rows x cols grid with no data. Non-positive sizes give an empty grid.
ConnectionGrid create_empty_grid(const GridSize& grid);

// Road tiles for a path. Path cells outside the grid are skipped.
ConnectionGrid to_connection_grid(const std::vector<Point>& path, const GridSize& grid);

#endif // HAMGRID_ROAD_GRID_H
