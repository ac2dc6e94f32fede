// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HAMGRID_SEARCH_CONFIG_H
#define HAMGRID_SEARCH_CONFIG_H

#include "grid_geometry.h"
#include "neighbor_heuristic.h"

#include <cstdint>

struct SearchConfig {
    uint32_t default_max_iterations = 500000; // Budget used by PathRequest when none is given
    bool verbose = false;                     // Print per-search progress lines
    bool verify_solution = true;              // Re-check every found path before returning it
    HeuristicWeights weights;
};

// Overrides fields from the environment:
//   HAMGRID_VERBOSE=0|1
//   HAMGRID_VERIFY=0|1
//   HAMGRID_MAX_ITERATIONS=<positive integer>
// Malformed values are reported on stderr and leave the field unchanged.
// Returns the number of fields that were overridden.
int load_search_config_from_env(SearchConfig& config);

// Iteration budget that keeps a search interactive for the given grid size.
// Larger grids get more iterations, with diminishing returns.
uint32_t recommended_max_iterations(const GridSize& grid);

#endif // HAMGRID_SEARCH_CONFIG_H
