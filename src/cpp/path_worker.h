// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HAMGRID_PATH_WORKER_H
#define HAMGRID_PATH_WORKER_H

#include "hamiltonian_grid.h"

#include <atomic>
#include <cstddef>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

struct PathRequest {
    Point start;
    Point end;
    GridSize grid;
    uint32_t max_iterations = 0; // 0 = SearchConfig::default_max_iterations

    bool operator<(const PathRequest& o) const;
};

struct PathWorkerStats {
    uint64_t total_requests = 0;
    uint64_t cache_hits = 0;
    uint64_t completed = 0;      // Searches run by the worker threads
    uint64_t found = 0;          // Of those, searches that found a path
    uint64_t cancelled = 0;      // Queued requests dropped by cancel_pending()
};

/**
 * Runs find_path() off the caller's thread.
 *
 * A UI asks for a path every time the pointer moves over a cell, and keeps
 * asking for the same endpoints. Results are therefore cached by request;
 * a repeated request is answered from the cache without searching again.
 * The cache only holds results for one (start, grid) pair at a time: a
 * request with another start or grid size empties it. It never holds more
 * than MAX_CACHED_RESULTS entries, and InvalidRequest results are not cached.
 *
 * When the pointer moves on, searches still waiting in the queue are stale;
 * cancel_pending() drops them before a worker picks them up.
 *
 * Each search still runs to completion on one worker thread; the iteration
 * budget is the only limit on its duration.
 */
class PathWorker {
public:
    static constexpr size_t MAX_CACHED_RESULTS = 1024;

    explicit PathWorker(const SearchConfig& config = SearchConfig(), unsigned workerCount = 1);
    ~PathWorker();

    // Non-copyable
    PathWorker(const PathWorker&) = delete;
    PathWorker& operator=(const PathWorker&) = delete;

    // Queue a search. After stop() the future is ready at once with
    // status InvalidRequest.
    std::future<SearchResult> submit(const PathRequest& request);

    // Answer every request still waiting in the queue with status Cancelled.
    // Searches already running are not interrupted. Returns the number of
    // requests dropped.
    size_t cancel_pending();

    // Stop accepting work, fail queued requests and join the threads.
    void stop();

    void clear_cache();
    size_t cache_size() const;
    PathWorkerStats stats() const;

private:
    struct Job {
        PathRequest request;
        std::promise<SearchResult> promise;
    };

    void worker_loop();
    PathRequest normalize(const PathRequest& request) const;
    bool matches_cache_anchor(const PathRequest& request) const;
    static void reject(std::promise<SearchResult>& promise, SearchStatus status);

    GridPathSearcher m_searcher;

    std::vector<std::thread> m_workers;
    std::queue<Job> m_jobs;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_running{false};

    std::map<PathRequest, SearchResult> m_cache;
    Point m_cacheStart;          // (start, grid) of the entries in m_cache
    GridSize m_cacheGrid;
    mutable std::mutex m_cacheMutex;

    std::atomic<uint64_t> m_totalRequests{0};
    std::atomic<uint64_t> m_cacheHits{0};
    std::atomic<uint64_t> m_completed{0};
    std::atomic<uint64_t> m_found{0};
    std::atomic<uint64_t> m_cancelled{0};
};

#endif // HAMGRID_PATH_WORKER_H
