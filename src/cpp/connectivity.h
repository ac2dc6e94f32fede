// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HAMGRID_CONNECTIVITY_H
#define HAMGRID_CONNECTIVITY_H

#include "grid_geometry.h"
#include "visited_bitset.h"

#include <cstdint>

// True when the unvisited cells form a single 4-connected region.
// `unvisited_count` must equal the number of unvisited cells; the traversal
// stops as soon as it has reached that many.
bool remaining_is_connected(const GridSize& grid, const VisitedBitset& visited, int32_t unvisited_count);

// Cheap gate in front of remaining_is_connected(). Returns false for a cell
// that cannot split the unvisited region: one with at most one unvisited
// neighbor, or a corner with exactly two. This is a heuristic, not a proof.
bool is_likely_cut_vertex(const Point& cell, const GridSize& grid, const VisitedBitset& visited);

#endif // HAMGRID_CONNECTIVITY_H
