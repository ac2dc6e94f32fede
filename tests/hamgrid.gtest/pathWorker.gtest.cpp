#include "path_worker.h"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <vector>

namespace gtest {

TEST(PathWorker, Finds_Path) {
    PathWorker worker;
    auto future = worker.submit(PathRequest{Point{0, 0}, Point{2, 2}, GridSize{3, 3}, 0});
    const SearchResult result = future.get();

    EXPECT_TRUE(result.found);
    EXPECT_EQ(result.status, SearchStatus::Found);
    EXPECT_EQ(result.path.size(), 9u);
    EXPECT_EQ(result.path_digest.size(), 64u);

    const PathWorkerStats stats = worker.stats();
    EXPECT_EQ(stats.total_requests, 1u);
    EXPECT_EQ(stats.cache_hits, 0u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.found, 1u);
}

//! A repeated request is answered from the cache.
TEST(PathWorker, Repeated_Request_Hits_Cache) {
    PathWorker worker;
    const PathRequest request{Point{0, 0}, Point{2, 2}, GridSize{3, 3}, 0};

    const SearchResult first = worker.submit(request).get();
    const SearchResult second = worker.submit(request).get();

    EXPECT_EQ(second.status, first.status);
    EXPECT_EQ(second.path, first.path);
    EXPECT_EQ(second.path_digest, first.path_digest);

    PathWorkerStats stats = worker.stats();
    EXPECT_EQ(stats.total_requests, 2u);
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.completed, 1u);

    worker.clear_cache();
    worker.submit(request).get();
    stats = worker.stats();
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.completed, 2u);
}

//! Zero budget and the configured default budget are the same request.
TEST(PathWorker, Zero_Budget_Uses_Config_Default) {
    SearchConfig config;
    config.default_max_iterations = 3;
    PathWorker worker(config);

    const SearchResult result = worker.submit(PathRequest{Point{0, 0}, Point{0, 1}, GridSize{2, 2}, 0}).get();
    EXPECT_EQ(result.status, SearchStatus::BudgetExhausted);
    EXPECT_EQ(result.iterations, 3u);

    worker.submit(PathRequest{Point{0, 0}, Point{0, 1}, GridSize{2, 2}, 3}).get();
    EXPECT_EQ(worker.stats().cache_hits, 1u);
}

TEST(PathWorker, Unsolvable_Requests) {
    PathWorker worker;
    auto parity = worker.submit(PathRequest{Point{0, 0}, Point{1, 1}, GridSize{2, 2}, 0});
    auto same = worker.submit(PathRequest{Point{1, 1}, Point{1, 1}, GridSize{2, 2}, 0});
    auto invalid = worker.submit(PathRequest{Point{0, 0}, Point{5, 5}, GridSize{2, 2}, 0});

    EXPECT_EQ(parity.get().status, SearchStatus::ParityInfeasible);
    EXPECT_EQ(same.get().status, SearchStatus::SameEndpoints);
    EXPECT_EQ(invalid.get().status, SearchStatus::InvalidRequest);
    EXPECT_EQ(worker.stats().found, 0u);
}

TEST(PathWorker, Rejects_After_Stop) {
    PathWorker worker;
    const PathRequest request{Point{0, 0}, Point{0, 1}, GridSize{2, 2}, 0};
    ASSERT_TRUE(worker.submit(request).get().found);
    ASSERT_EQ(worker.cache_size(), 1u);

    worker.stop();
    worker.stop();

    //! A cached answer is not handed out once the worker is stopped.
    auto future = worker.submit(request);
    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    const SearchResult result = future.get();
    EXPECT_FALSE(result.found);
    EXPECT_EQ(result.status, SearchStatus::InvalidRequest);
    EXPECT_TRUE(result.path.empty());
    EXPECT_EQ(worker.stats().cache_hits, 0u);

    const SearchResult other = worker.submit(PathRequest{Point{0, 0}, Point{1, 0}, GridSize{2, 2}, 0}).get();
    EXPECT_EQ(other.status, SearchStatus::InvalidRequest);
}

TEST(PathWorker, Invalid_Requests_Not_Cached) {
    PathWorker worker;
    const PathRequest request{Point{0, 0}, Point{0, 1}, GridSize{0, 0}, 0};

    EXPECT_EQ(worker.submit(request).get().status, SearchStatus::InvalidRequest);
    EXPECT_EQ(worker.submit(request).get().status, SearchStatus::InvalidRequest);

    const PathWorkerStats stats = worker.stats();
    EXPECT_EQ(stats.cache_hits, 0u);
    EXPECT_EQ(stats.completed, 2u);
    EXPECT_EQ(worker.cache_size(), 0u);
}

//! Moving to another start empties the cache.
TEST(PathWorker, Cache_Holds_One_Start) {
    PathWorker worker;
    const PathRequest first{Point{0, 0}, Point{2, 2}, GridSize{3, 3}, 0};
    const PathRequest sameStart{Point{0, 0}, Point{2, 0}, GridSize{3, 3}, 0};
    const PathRequest otherStart{Point{0, 2}, Point{2, 0}, GridSize{3, 3}, 0};

    worker.submit(first).get();
    worker.submit(sameStart).get();
    EXPECT_EQ(worker.cache_size(), 2u);

    EXPECT_TRUE(worker.submit(otherStart).get().found);
    EXPECT_EQ(worker.cache_size(), 1u);

    worker.submit(first).get();
    PathWorkerStats stats = worker.stats();
    EXPECT_EQ(stats.cache_hits, 0u);
    EXPECT_EQ(stats.completed, 4u);

    //! Same start on another grid size is a different anchor too.
    worker.submit(PathRequest{Point{0, 0}, Point{2, 2}, GridSize{5, 5}, 0}).get();
    EXPECT_EQ(worker.cache_size(), 1u);
    worker.submit(first).get();
    stats = worker.stats();
    EXPECT_EQ(stats.cache_hits, 0u);
    EXPECT_EQ(stats.completed, 6u);
}

TEST(PathWorker, Cache_Capacity_Bounded) {
    PathWorker worker;
    const uint32_t requests = static_cast<uint32_t>(PathWorker::MAX_CACHED_RESULTS) + 10;

    for (uint32_t budget = 1; budget <= requests; ++budget) {
        worker.submit(PathRequest{Point{0, 0}, Point{0, 1}, GridSize{2, 2}, budget}).get();
    }
    EXPECT_EQ(worker.cache_size(), PathWorker::MAX_CACHED_RESULTS);

    //! Cached entries still answer; the overflow request was searched again.
    worker.submit(PathRequest{Point{0, 0}, Point{0, 1}, GridSize{2, 2}, 1}).get();
    worker.submit(PathRequest{Point{0, 0}, Point{0, 1}, GridSize{2, 2}, requests}).get();
    const PathWorkerStats stats = worker.stats();
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.completed, static_cast<uint64_t>(requests) + 1);
}

//! Every request is answered exactly once: searched, or cancelled while queued.
TEST(PathWorker, Cancel_Pending) {
    PathWorker worker;

    std::vector<std::future<SearchResult>> futures;
    for (uint32_t i = 0; i < 20; ++i) {
        futures.push_back(worker.submit(PathRequest{Point{0, 0}, Point{5, 0}, GridSize{6, 6}, 100000 + i}));
    }
    const size_t dropped = worker.cancel_pending();

    size_t cancelled = 0;
    for (auto& f : futures) {
        const SearchResult result = f.get();
        if (result.status == SearchStatus::Cancelled) {
            ++cancelled;
            EXPECT_FALSE(result.found);
            EXPECT_EQ(result.iterations, 0u);
        } else {
            EXPECT_TRUE(result.found);
        }
    }
    EXPECT_EQ(cancelled, dropped);

    const PathWorkerStats stats = worker.stats();
    EXPECT_EQ(stats.cancelled, dropped);
    EXPECT_EQ(stats.completed + stats.cancelled, futures.size());
    EXPECT_EQ(worker.cancel_pending(), 0u);

    //! The worker keeps serving after a cancel.
    EXPECT_TRUE(worker.submit(PathRequest{Point{0, 0}, Point{0, 1}, GridSize{2, 2}, 0}).get().found);
}

TEST(PathWorker, Multiple_Workers) {
    PathWorker worker(SearchConfig(), 4);

    std::vector<std::future<SearchResult>> futures;
    for (int32_t c = 1; c < 6; c += 2) {
        futures.push_back(worker.submit(PathRequest{Point{0, 0}, Point{0, c}, GridSize{6, 6}, 0}));
        futures.push_back(worker.submit(PathRequest{Point{0, 0}, Point{5, c - 1}, GridSize{6, 6}, 0}));
    }

    for (auto& f : futures) {
        const SearchResult result = f.get();
        ASSERT_TRUE(result.found);
        EXPECT_EQ(result.path.size(), 36u);
    }

    const PathWorkerStats stats = worker.stats();
    EXPECT_EQ(stats.total_requests, futures.size());
    EXPECT_EQ(stats.completed, futures.size());
    EXPECT_EQ(stats.found, futures.size());
}

} // namespace gtest
