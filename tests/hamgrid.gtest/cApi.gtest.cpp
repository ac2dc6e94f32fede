#include "hamiltonian_grid.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <vector>

namespace gtest {

class CApi : public ::testing::Test {
protected:
    void SetUp() override { searcher = hg_create(); }
    void TearDown() override { hg_destroy(searcher); }

    GridPathSearcher* searcher = nullptr;
    int32_t path[2 * 16] = {};
    size_t pathLen = 0;
    uint32_t iterations = 0;
    char digest[65] = {};
};

TEST_F(CApi, Find_Path_2x2) {
    ASSERT_NE(searcher, nullptr);
    const int rc = hg_find_path(searcher, 0, 0, 0, 1, 2, 2, 1000, path, &pathLen, &iterations, digest);

    EXPECT_EQ(rc, 1);
    EXPECT_EQ(pathLen, 4u);
    EXPECT_EQ(iterations, 4u);
    EXPECT_EQ(std::strlen(digest), 64u);

    const int32_t expected[] = {0, 0, 1, 0, 1, 1, 0, 1};
    for (size_t i = 0; i < 8; ++i) {
        EXPECT_EQ(path[i], expected[i]) << "at " << i;
    }
}

TEST_F(CApi, Find_Path_Without_Digest) {
    EXPECT_EQ(hg_find_path(searcher, 0, 0, 0, 3, 4, 4, 100000, path, &pathLen, &iterations, nullptr), 1);
    EXPECT_EQ(pathLen, 16u);
}

TEST_F(CApi, Status_Codes) {
    EXPECT_EQ(hg_find_path(searcher, 0, 0, 1, 1, 2, 2, 1000, path, &pathLen, &iterations, digest), 2);
    EXPECT_EQ(pathLen, 0u);
    EXPECT_EQ(digest[0], '\0');

    EXPECT_EQ(hg_find_path(searcher, 1, 0, 1, 0, 2, 2, 1000, path, &pathLen, &iterations, digest), 3);
    EXPECT_EQ(hg_find_path(searcher, 0, 0, 0, 1, 2, 2, 3, path, &pathLen, &iterations, digest), 0);
    EXPECT_EQ(iterations, 3u);
    EXPECT_EQ(hg_find_path(searcher, 0, 0, 0, 9, 2, 2, 1000, path, &pathLen, &iterations, digest), -1);
    EXPECT_EQ(hg_find_path(searcher, 0, 0, 0, 1, 0, 2, 1000, path, &pathLen, &iterations, digest), -1);
}

TEST_F(CApi, Null_Arguments) {
    EXPECT_EQ(hg_find_path(nullptr, 0, 0, 0, 1, 2, 2, 1000, path, &pathLen, &iterations, digest), -1);
    EXPECT_EQ(hg_find_path(searcher, 0, 0, 0, 1, 2, 2, 1000, nullptr, &pathLen, &iterations, digest), -1);
    EXPECT_EQ(hg_find_path(searcher, 0, 0, 0, 1, 2, 2, 1000, path, nullptr, &iterations, digest), -1);
    EXPECT_EQ(hg_find_path(searcher, 0, 0, 0, 1, 2, 2, 1000, path, &pathLen, nullptr, digest), -1);

    hg_set_verbose(nullptr, 1);
    hg_destroy(nullptr);
}

TEST(CApiFree, Parity) {
    EXPECT_EQ(hg_cell_parity(0, 0), 0);
    EXPECT_EQ(hg_cell_parity(0, 1), 1);
    EXPECT_EQ(hg_cell_parity(3, 4), 1);
    EXPECT_EQ(hg_has_different_parity(0, 0, 1, 0), 1);
    EXPECT_EQ(hg_has_different_parity(0, 0, 1, 1), 0);
    EXPECT_EQ(hg_cell_parity(INT32_MAX, 1), 0);
    EXPECT_EQ(hg_cell_parity(INT32_MIN, 1), 1);
    EXPECT_EQ(hg_has_different_parity(INT32_MAX, 0, INT32_MIN, 0), 1);
}

TEST(CApiFree, Connection_Grid) {
    const int32_t path[] = {0, 0, 1, 0, 1, 1, 0, 1};
    uint8_t masks[4] = {};
    int32_t indices[4] = {};

    ASSERT_EQ(hg_path_to_connection_grid(path, 4, 2, 2, masks, indices), 0);

    const uint8_t expectedMasks[] = {2, 2, 9, 5};
    const int32_t expectedIndices[] = {0, 3, 1, 2};
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(masks[i], expectedMasks[i]) << "at " << i;
        EXPECT_EQ(indices[i], expectedIndices[i]) << "at " << i;
    }
}

TEST(CApiFree, Connection_Grid_Partial_And_Invalid) {
    const int32_t path[] = {0, 0, 0, 1};
    uint8_t masks[6] = {};
    int32_t indices[6] = {};

    ASSERT_EQ(hg_path_to_connection_grid(path, 2, 2, 3, masks, indices), 0);
    EXPECT_EQ(masks[0], 8);
    EXPECT_EQ(masks[1], 4);
    for (size_t i = 2; i < 6; ++i) {
        EXPECT_EQ(masks[i], 0);
        EXPECT_EQ(indices[i], -1);
    }

    EXPECT_EQ(hg_path_to_connection_grid(nullptr, 2, 2, 3, masks, indices), -1);
    EXPECT_EQ(hg_path_to_connection_grid(path, 2, 0, 3, masks, indices), -1);
    EXPECT_EQ(hg_path_to_connection_grid(nullptr, 0, 2, 3, masks, indices), 0);
}

//! Oversized grids are rejected before any output is written.
TEST(CApiFree, Connection_Grid_Rejects_Oversized_Grid) {
    const int32_t path[] = {0, 0, 0, 1};
    uint8_t masks[4] = {7, 7, 7, 7};
    int32_t indices[4] = {7, 7, 7, 7};

    EXPECT_EQ(hg_path_to_connection_grid(path, 2, 33, 32, masks, indices), -1);
    EXPECT_EQ(hg_path_to_connection_grid(path, 2, INT32_MAX, INT32_MAX, masks, indices), -1);
    EXPECT_EQ(hg_path_to_connection_grid(path, 2, 1, INT32_MAX, masks, indices), -1);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(masks[i], 7);
        EXPECT_EQ(indices[i], 7);
    }

    EXPECT_EQ(hg_path_to_connection_grid(path, 2, 32, 32, nullptr, indices), -1);
}

TEST(CApiFree, Recommended_Iterations) {
    EXPECT_EQ(hg_recommended_max_iterations(5, 5), 500000u);
    EXPECT_EQ(hg_recommended_max_iterations(20, 20), 2000000u);
    EXPECT_EQ(hg_recommended_max_iterations(50, 50), 10000000u);
}

} // namespace gtest
