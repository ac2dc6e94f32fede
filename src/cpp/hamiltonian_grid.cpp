#include "hamiltonian_grid.h"
#include "connectivity.h"
#include "neighbor_heuristic.h"
#include "road_grid.h"
#include "visited_bitset.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <openssl/sha.h>

namespace {

// One expanded node of the explicit DFS stack. The node's cell is the path
// entry at the same depth.
struct SearchFrame {
    RankedNeighbors candidates;
    uint8_t next;               // Next candidate to try after backtracking
};

enum class NodeOutcome {
    Expand,      // Frame pushed, keep exploring
    DeadEnd,     // Cannot be extended
    Success,     // All cells visited, standing on the target
    OutOfBudget
};

std::string bytes_to_hex(const uint8_t* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result.push_back(hex_chars[(data[i] >> 4) & 0xf]);
        result.push_back(hex_chars[data[i] & 0xf]);
    }
    return result;
}

void append_u16_le(std::vector<uint8_t>& out, int32_t value) {
    uint16_t v = static_cast<uint16_t>(value);
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

} // anonymous namespace

// ============================================================================
// DFS Hamiltonian path search (iterative, avoids deep recursion).
// Node order comes from ranked_unvisited_neighbors(); a candidate that might
// split the unvisited region is only taken if the remainder stays connected.
// Iterations are counted per node entered, as in the recursive formulation.
// ============================================================================
static SearchStatus search_hamiltonian_path_dfs(
    const Point& start,
    const Point& end,
    const GridSize& grid,
    uint32_t max_iterations,
    const HeuristicWeights& weights,
    std::vector<Point>& path,
    SearchResult& stats
) {
    const int32_t total_cells = grid.cell_count();

    VisitedBitset visited(grid);
    std::vector<SearchFrame> frames;
    frames.reserve(static_cast<size_t>(total_cells));
    path.clear();
    path.reserve(static_cast<size_t>(total_cells));

    visited.mark(start);
    path.push_back(start);
    int32_t unvisited = total_cells - 1;

    // Enter the node at the tail of the path
    auto enter_node = [&]() -> NodeOutcome {
        if (stats.iterations >= max_iterations) {
            return NodeOutcome::OutOfBudget;
        }
        stats.iterations++;
        stats.max_depth = std::max(stats.max_depth, static_cast<uint32_t>(path.size()));

        const Point current = path.back();
        if (unvisited == 0) {
            return current == end ? NodeOutcome::Success : NodeOutcome::DeadEnd;
        }
        // Reaching the target early never completes a Hamiltonian path
        if (current == end) {
            return NodeOutcome::DeadEnd;
        }

        SearchFrame frame;
        frame.candidates = ranked_unvisited_neighbors(current, end, grid, visited, unvisited, weights);
        frame.next = 0;
        frames.push_back(frame);
        return NodeOutcome::Expand;
    };

    NodeOutcome outcome = enter_node();
    if (outcome == NodeOutcome::OutOfBudget) {
        return SearchStatus::BudgetExhausted;
    }
    if (outcome != NodeOutcome::Expand) {
        return SearchStatus::Exhausted;
    }

    while (!frames.empty()) {
        SearchFrame& frame = frames.back();

        if (frame.next == frame.candidates.count) {
            // No more candidates; backtrack (the start cell stays marked)
            frames.pop_back();
            if (!frames.empty()) {
                visited.unmark(path.back());
                path.pop_back();
                unvisited++;
            }
            continue;
        }

        const Point next = frame.candidates.cells[frame.next++];
        visited.mark(next);
        unvisited--;

        if (next != end && unvisited >= 3 && is_likely_cut_vertex(next, grid, visited)) {
            stats.connectivity_checks++;
            if (!remaining_is_connected(grid, visited, unvisited)) {
                visited.unmark(next);
                unvisited++;
                stats.pruned_moves++;
                continue;
            }
        }

        // `frame` may dangle after this point
        path.push_back(next);
        outcome = enter_node();

        if (outcome == NodeOutcome::Success) {
            return SearchStatus::Found;
        }
        if (outcome == NodeOutcome::OutOfBudget) {
            return SearchStatus::BudgetExhausted;
        }
        if (outcome == NodeOutcome::DeadEnd) {
            path.pop_back();
            visited.unmark(next);
            unvisited++;
        }
    }

    return SearchStatus::Exhausted;
}

const char* search_status_name(SearchStatus status) {
    switch (status) {
        case SearchStatus::Found: return "found";
        case SearchStatus::Exhausted: return "exhausted";
        case SearchStatus::BudgetExhausted: return "budget exhausted";
        case SearchStatus::ParityInfeasible: return "parity infeasible";
        case SearchStatus::SameEndpoints: return "same endpoints";
        case SearchStatus::InvalidRequest: return "invalid request";
        case SearchStatus::VerificationFailed: return "verification failed";
        case SearchStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_parity_feasible(const Point& start, const Point& end, const GridSize& grid) {
    const int start_parity = cell_parity(start.row, start.col);
    const int end_parity = cell_parity(end.row, end.col);

    if (grid.cell_count() % 2 == 0) {
        // Both colors hold N/2 cells; a path alternates colors
        return start_parity != end_parity;
    }
    // Color 0 holds one cell more than color 1, so the path starts and ends on it
    return start_parity == 0 && end_parity == 0;
}

bool validate_path(
    const std::vector<Point>& path,
    const GridSize& grid,
    const Point& start,
    const Point& end,
    std::string* error
) {
    auto fail = [error](const std::string& reason) {
        if (error) {
            *error = reason;
        }
        return false;
    };

    if (!is_valid_grid(grid)) {
        return fail("invalid grid size");
    }
    if (path.size() != static_cast<size_t>(grid.cell_count())) {
        return fail("path length " + std::to_string(path.size()) + " != cell count " +
                    std::to_string(grid.cell_count()));
    }
    if (path.front() != start) {
        return fail("path does not begin at the start cell");
    }
    if (path.back() != end) {
        return fail("path does not finish at the end cell");
    }

    VisitedBitset seen(grid);
    for (size_t i = 0; i < path.size(); i++) {
        const Point& p = path[i];
        if (!in_bounds(p, grid)) {
            return fail("cell " + std::to_string(i) + " out of bounds");
        }
        if (seen.is_visited(p)) {
            return fail("cell " + std::to_string(i) + " visited twice");
        }
        seen.mark(p);
        if (i > 0 && !is_adjacent(path[i - 1], p)) {
            return fail("cells " + std::to_string(i - 1) + " and " + std::to_string(i) + " are not adjacent");
        }
    }
    return true;
}

std::string path_digest_hex(const std::vector<Point>& path, const GridSize& grid) {
    std::vector<uint8_t> data;
    data.reserve(4 + path.size() * 4);

    append_u16_le(data, grid.rows);
    append_u16_le(data, grid.cols);
    for (const Point& p : path) {
        append_u16_le(data, p.row);
        append_u16_le(data, p.col);
    }

    uint8_t hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

// ============================================================================
// GridPathSearcher implementation
// ============================================================================

GridPathSearcher::GridPathSearcher() {}

GridPathSearcher::GridPathSearcher(const SearchConfig& config) : m_config(config) {}

GridPathSearcher::~GridPathSearcher() {}

uint64_t GridPathSearcher::get_time_us() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count();
}

SearchResult GridPathSearcher::find_path(
    const Point& start,
    const Point& end,
    const GridSize& grid,
    uint32_t max_iterations
) const {
    SearchResult result;
    const uint64_t start_time = get_time_us();

    if (!is_valid_grid(grid)) {
        fprintf(stderr, "[ERROR] find_path: grid %dx%d must be positive and hold at most %d cells\n",
                grid.rows, grid.cols, MAX_GRID_CELLS);
        result.status = SearchStatus::InvalidRequest;
        return result;
    }
    if (!in_bounds(start, grid) || !in_bounds(end, grid)) {
        fprintf(stderr, "[ERROR] find_path: endpoint (%d,%d) or (%d,%d) outside the %dx%d grid\n",
                start.row, start.col, end.row, end.col, grid.rows, grid.cols);
        result.status = SearchStatus::InvalidRequest;
        return result;
    }

    if (start == end) {
        result.status = SearchStatus::SameEndpoints;
    } else if (!is_parity_feasible(start, end, grid)) {
        result.status = SearchStatus::ParityInfeasible;
    } else {
        std::vector<Point> path;
        result.status = search_hamiltonian_path_dfs(
            start, end, grid, max_iterations, m_config.weights, path, result);

        if (result.status == SearchStatus::Found && m_config.verify_solution) {
            std::string error;
            if (!validate_path(path, grid, start, end, &error)) {
                fprintf(stderr, "[VERIFY FAILED] %dx%d (%d,%d)->(%d,%d): %s\n",
                        grid.rows, grid.cols, start.row, start.col, end.row, end.col, error.c_str());
                result.status = SearchStatus::VerificationFailed;
            }
        }

        if (result.status == SearchStatus::Found) {
            result.found = true;
            result.path_digest = path_digest_hex(path, grid);
            result.path = std::move(path);
        }
    }

    result.elapsed_us = get_time_us() - start_time;

    if (m_config.verbose) {
        printf("[GridPathSearcher] %dx%d (%d,%d)->(%d,%d): %s, %u iterations, "
               "%llu connectivity checks, %llu pruned, depth %u, %llu us\n",
               grid.rows, grid.cols, start.row, start.col, end.row, end.col,
               search_status_name(result.status), result.iterations,
               static_cast<unsigned long long>(result.connectivity_checks),
               static_cast<unsigned long long>(result.pruned_moves),
               result.max_depth,
               static_cast<unsigned long long>(result.elapsed_us));
    }

    return result;
}

SearchResult find_path(const Point& start, const Point& end, const GridSize& grid, uint32_t max_iterations) {
    static const GridPathSearcher searcher;
    return searcher.find_path(start, end, grid, max_iterations);
}

// ============================================================================
// C interface implementation
// ============================================================================

extern "C" {

GridPathSearcher* hg_create() {
    SearchConfig config;
    load_search_config_from_env(config);
    return new GridPathSearcher(config);
}

void hg_destroy(GridPathSearcher* searcher) {
    delete searcher;
}

void hg_set_verbose(GridPathSearcher* searcher, int verbose) {
    if (searcher) {
        searcher->set_verbose(verbose != 0);
    }
}

int hg_find_path(
    GridPathSearcher* searcher,
    int32_t start_row,
    int32_t start_col,
    int32_t end_row,
    int32_t end_col,
    int32_t grid_rows,
    int32_t grid_cols,
    uint32_t max_iterations,
    int32_t* out_path,
    size_t* out_path_len,
    uint32_t* out_iterations,
    char* out_digest_hex
) {
    if (!searcher || !out_path || !out_path_len || !out_iterations) {
        fprintf(stderr, "[ERROR] hg_find_path: null argument\n");
        return -1;
    }

    *out_path_len = 0;
    *out_iterations = 0;
    if (out_digest_hex) out_digest_hex[0] = '\0';

    SearchResult result = searcher->find_path(
        Point{start_row, start_col},
        Point{end_row, end_col},
        GridSize{grid_rows, grid_cols},
        max_iterations
    );

    *out_iterations = result.iterations;

    switch (result.status) {
        case SearchStatus::Found:
            break;
        case SearchStatus::ParityInfeasible:
            return 2;
        case SearchStatus::SameEndpoints:
            return 3;
        case SearchStatus::InvalidRequest:
        case SearchStatus::Cancelled:
            return -1;
        case SearchStatus::Exhausted:
        case SearchStatus::BudgetExhausted:
        case SearchStatus::VerificationFailed:
            return 0;
    }

    // Copy path
    for (size_t i = 0; i < result.path.size(); i++) {
        out_path[i * 2] = result.path[i].row;
        out_path[i * 2 + 1] = result.path[i].col;
    }
    *out_path_len = result.path.size();

    if (out_digest_hex) {
        std::memcpy(out_digest_hex, result.path_digest.c_str(), result.path_digest.size() + 1);
    }

    return 1;
}

int hg_cell_parity(int32_t row, int32_t col) {
    return cell_parity(row, col);
}

int hg_has_different_parity(int32_t r1, int32_t c1, int32_t r2, int32_t c2) {
    return has_different_parity(r1, c1, r2, c2) ? 1 : 0;
}

int hg_path_to_connection_grid(
    const int32_t* path,
    size_t path_len,
    int32_t grid_rows,
    int32_t grid_cols,
    uint8_t* out_masks,
    int32_t* out_indices
) {
    if ((path_len > 0 && !path) || !out_masks || !out_indices) {
        fprintf(stderr, "[ERROR] hg_path_to_connection_grid: null argument\n");
        return -1;
    }
    const GridSize grid{grid_rows, grid_cols};
    if (!is_valid_grid(grid)) {
        fprintf(stderr, "[ERROR] hg_path_to_connection_grid: grid %dx%d must be positive and hold at most %d cells\n",
                grid_rows, grid_cols, MAX_GRID_CELLS);
        return -1;
    }

    std::vector<Point> points(path_len);
    for (size_t i = 0; i < path_len; i++) {
        points[i] = Point{path[i * 2], path[i * 2 + 1]};
    }

    ConnectionGrid tiles = to_connection_grid(points, grid);

    for (int32_t r = 0; r < grid_rows; r++) {
        for (int32_t c = 0; c < grid_cols; c++) {
            const size_t idx = cell_index(Point{r, c}, grid);
            const auto& cell = tiles[static_cast<size_t>(r)][static_cast<size_t>(c)];
            if (cell) {
                out_masks[idx] = connection_mask(*cell);
                out_indices[idx] = static_cast<int32_t>(cell->path_index);
            } else {
                out_masks[idx] = 0;
                out_indices[idx] = -1;
            }
        }
    }
    return 0;
}

uint32_t hg_recommended_max_iterations(int32_t grid_rows, int32_t grid_cols) {
    return recommended_max_iterations(GridSize{grid_rows, grid_cols});
}

} // extern "C"
