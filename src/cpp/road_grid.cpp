// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "road_grid.h"

#include <cstdio>

const char* direction_name(Direction direction) {
    switch (direction) {
        case Direction::Up: return "up";
        case Direction::Down: return "down";
        case Direction::Left: return "left";
        case Direction::Right: return "right";
    }
    return "unknown";
}

uint8_t connection_mask(const CellConnectionData& cell) {
    uint8_t mask = 0;
    for (Direction d : cell.connections) {
        mask |= static_cast<uint8_t>(1u << static_cast<uint8_t>(d));
    }
    return mask;
}

ConnectionGrid create_empty_grid(const GridSize& grid) {
    if (grid.rows <= 0 || grid.cols <= 0) {
        return ConnectionGrid();
    }
    return ConnectionGrid(
        static_cast<size_t>(grid.rows),
        std::vector<std::optional<CellConnectionData>>(static_cast<size_t>(grid.cols))
    );
}

ConnectionGrid to_connection_grid(const std::vector<Point>& path, const GridSize& grid) {
    ConnectionGrid result = create_empty_grid(grid);
    if (result.empty()) {
        return result;
    }

    size_t skipped = 0;
    for (size_t i = 0; i < path.size(); i++) {
        const Point& current = path[i];
        if (!in_bounds(current, grid)) {
            skipped++;
            continue;
        }

        CellConnectionData cell;
        cell.path_index = i;

        if (i > 0) {
            if (auto d = direction_toward(current, path[i - 1])) {
                cell.connections.push_back(*d);
            }
        }
        if (i + 1 < path.size()) {
            if (auto d = direction_toward(current, path[i + 1])) {
                cell.connections.push_back(*d);
            }
        }

        result[static_cast<size_t>(current.row)][static_cast<size_t>(current.col)] = std::move(cell);
    }

    if (skipped > 0) {
        fprintf(stderr, "[RoadGrid] Skipped %zu path cell(s) outside the %dx%d grid\n",
                skipped, grid.rows, grid.cols);
    }
    return result;
}
