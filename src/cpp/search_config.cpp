// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "search_config.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

bool parse_flag(const char* name, const char* value, bool& out) {
    if (std::strcmp(value, "1") == 0 || std::strcmp(value, "true") == 0) {
        out = true;
        return true;
    }
    if (std::strcmp(value, "0") == 0 || std::strcmp(value, "false") == 0) {
        out = false;
        return true;
    }
    fprintf(stderr, "[SearchConfig] ERROR: %s=\"%s\" is not 0/1, ignored\n", name, value);
    return false;
}

bool parse_u32(const char* name, const char* value, uint32_t& out) {
    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || value[0] == '-' ||
        parsed == 0 || parsed > UINT32_MAX) {
        fprintf(stderr, "[SearchConfig] ERROR: %s=\"%s\" is not a positive 32-bit integer, ignored\n",
                name, value);
        return false;
    }
    out = static_cast<uint32_t>(parsed);
    return true;
}

} // anonymous namespace

int load_search_config_from_env(SearchConfig& config) {
    int overridden = 0;

    if (const char* v = std::getenv("HAMGRID_VERBOSE")) {
        if (parse_flag("HAMGRID_VERBOSE", v, config.verbose)) overridden++;
    }
    if (const char* v = std::getenv("HAMGRID_VERIFY")) {
        if (parse_flag("HAMGRID_VERIFY", v, config.verify_solution)) overridden++;
    }
    if (const char* v = std::getenv("HAMGRID_MAX_ITERATIONS")) {
        if (parse_u32("HAMGRID_MAX_ITERATIONS", v, config.default_max_iterations)) overridden++;
    }

    if (config.verbose) {
        printf("[SearchConfig] max_iterations=%u verify=%d (%d override(s) from env)\n",
               config.default_max_iterations, config.verify_solution ? 1 : 0, overridden);
    }
    return overridden;
}

uint32_t recommended_max_iterations(const GridSize& grid) {
    int64_t total_cells = static_cast<int64_t>(grid.rows) * grid.cols;
    if (total_cells <= 100) {
        return 500000;    // up to 10x10
    }
    if (total_cells <= 400) {
        return 2000000;   // up to 20x20
    }
    if (total_cells <= 1000) {
        return 5000000;   // up to ~32x32
    }
    return 10000000;
}
