// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HAMGRID_VISITED_BITSET_H
#define HAMGRID_VISITED_BITSET_H

#include "grid_geometry.h"

#include <cstdint>
#include <cstring>

/**
 * Bit-per-cell set over the cells of one grid.
 *
 * Storage is a fixed array of 64-bit words sized for MAX_GRID_CELLS, so a
 * search never allocates for its visited state. Callers validate the grid
 * with is_valid_grid() before constructing one.
 *
 * mark() on a set bit or unmark() on a clear bit is a caller bug; the search
 * keeps the set in lock-step with its path stack.
 */
class VisitedBitset {
public:
    explicit VisitedBitset(const GridSize& grid) : m_grid(grid) {
        clear();
    }

    bool is_visited(const Point& p) const {
        size_t pos = cell_index(p, m_grid);
        return (m_words[pos / 64] >> (pos % 64)) & 1ULL;
    }

    void mark(const Point& p) {
        size_t pos = cell_index(p, m_grid);
        m_words[pos / 64] |= (1ULL << (pos % 64));
        m_count++;
    }

    void unmark(const Point& p) {
        size_t pos = cell_index(p, m_grid);
        m_words[pos / 64] &= ~(1ULL << (pos % 64));
        m_count--;
    }

    void clear() {
        std::memset(m_words, 0, sizeof(m_words));
        m_count = 0;
    }

    // Number of marked cells.
    int32_t count() const { return m_count; }

    const GridSize& grid() const { return m_grid; }

private:
    static constexpr size_t NUM_WORDS = (MAX_GRID_CELLS + 63) / 64;

    uint64_t m_words[NUM_WORDS];
    GridSize m_grid;
    int32_t m_count{0};
};

#endif // HAMGRID_VISITED_BITSET_H
