#pragma once

#include "grid_geometry.h"
#include "search_config.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Outcome of one find_path() call.
enum class SearchStatus : uint8_t {
    Found,              // Hamiltonian path from start to end returned
    Exhausted,          // Whole search tree explored, no path exists
    BudgetExhausted,    // Iteration budget spent before a path was found
    ParityInfeasible,   // Rejected by the checkerboard argument, no search run
    SameEndpoints,      // start == end, no search run
    InvalidRequest,     // Bad grid size or endpoint out of bounds, no search run
    VerificationFailed, // Search produced a path that failed validate_path()
    Cancelled           // Dropped from the PathWorker queue before it ran
};

const char* search_status_name(SearchStatus status);

// Search result structure
struct SearchResult {
    bool found = false;                 // Whether a Hamiltonian path was found
    SearchStatus status = SearchStatus::InvalidRequest;
    std::vector<Point> path;            // Full path start..end, empty unless found
    uint32_t iterations = 0;            // Search nodes entered
    // Diagnostics
    uint64_t connectivity_checks = 0;   // Full connectivity traversals run
    uint64_t pruned_moves = 0;          // Candidate moves rejected by connectivity
    uint32_t max_depth = 0;             // Longest path prefix reached
    uint64_t elapsed_us = 0;            // Wall clock time of the call
    std::string path_digest;            // SHA-256 of the path (hex), empty unless found
};

// Checkerboard feasibility. With N = rows*cols cells:
//   - N even: start and end must have different colors;
//   - N odd:  both must lie on the majority color (parity 0).
// A request failing this test has no Hamiltonian path.
bool is_parity_feasible(const Point& start, const Point& end, const GridSize& grid);

// Checks that `path` is a Hamiltonian path of `grid` from `start` to `end`:
// every cell exactly once, consecutive cells 4-adjacent. On failure a reason
// is written to `error` when given.
bool validate_path(
    const std::vector<Point>& path,
    const GridSize& grid,
    const Point& start,
    const Point& end,
    std::string* error = nullptr
);

// Lowercase hex SHA-256 over the grid size followed by the path cells, each
// value serialized as a little-endian uint16.
std::string path_digest_hex(const std::vector<Point>& path, const GridSize& grid);

class GridPathSearcher {
public:
    GridPathSearcher();
    explicit GridPathSearcher(const SearchConfig& config);
    ~GridPathSearcher();

    // Finds a Hamiltonian path from `start` to `end` visiting every cell of
    // `grid`, entering at most `max_iterations` search nodes.
    //   - found=true:  path holds rows*cols cells, start first, end last
    //   - found=false: path is empty; status tells why and iterations is 0
    //     unless a search actually ran
    // Each call owns its own search state, so concurrent calls are safe.
    SearchResult find_path(
        const Point& start,
        const Point& end,
        const GridSize& grid,
        uint32_t max_iterations
    ) const;

    const SearchConfig& config() const { return m_config; }

    // Not synchronized with running find_path() calls.
    void set_verbose(bool verbose) { m_config.verbose = verbose; }

private:
    // Get current time (us).
    static uint64_t get_time_us();

    SearchConfig m_config;
};

// Convenience wrapper using a default-configured searcher.
SearchResult find_path(const Point& start, const Point& end, const GridSize& grid, uint32_t max_iterations);

// ============================================================================
// C API (for hosts linking the library through a foreign function interface)
// ============================================================================

extern "C" {
    // Create/destroy the searcher.
    GridPathSearcher* hg_create();
    void hg_destroy(GridPathSearcher* searcher);

    void hg_set_verbose(GridPathSearcher* searcher, int verbose);

    // Search function.
    // out_path must hold 2 * grid_rows * grid_cols values (row, col interleaved).
    // out_digest_hex, when not null, must hold at least 65 bytes.
    // Returns: 1 = found, 0 = not found (budget spent or no path exists),
    //          2 = parity infeasible, 3 = start equals end, -1 = invalid arguments
    int hg_find_path(
        GridPathSearcher* searcher,
        int32_t start_row,
        int32_t start_col,
        int32_t end_row,
        int32_t end_col,
        int32_t grid_rows,
        int32_t grid_cols,
        uint32_t max_iterations,
        // Output parameters
        int32_t* out_path,
        size_t* out_path_len,      // Number of cells in out_path
        uint32_t* out_iterations,
        char* out_digest_hex
    );

    // Checkerboard color of a cell (0 or 1).
    int hg_cell_parity(int32_t row, int32_t col);

    // 1 if the two cells have different colors, 0 otherwise.
    int hg_has_different_parity(int32_t r1, int32_t c1, int32_t r2, int32_t c2);

    // Converts a path (row, col interleaved) to per-cell road tiles.
    // out_masks and out_indices hold grid_rows * grid_cols entries, row-major.
    // Mask bits: 1 = up, 2 = down, 4 = left, 8 = right. Index -1 = empty cell.
    // The grid must fit MAX_GRID_CELLS, as for hg_find_path.
    // Returns: 0 = ok, -1 = invalid arguments
    int hg_path_to_connection_grid(
        const int32_t* path,
        size_t path_len,
        int32_t grid_rows,
        int32_t grid_cols,
        uint8_t* out_masks,
        int32_t* out_indices
    );

    uint32_t hg_recommended_max_iterations(int32_t grid_rows, int32_t grid_cols);
}
