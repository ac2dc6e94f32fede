// Copyright (c) 2025 The Thought Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "path_worker.h"

#include <cstdio>
#include <exception>
#include <tuple>

bool PathRequest::operator<(const PathRequest& o) const {
    return std::tie(start.row, start.col, end.row, end.col, grid.rows, grid.cols, max_iterations) <
           std::tie(o.start.row, o.start.col, o.end.row, o.end.col, o.grid.rows, o.grid.cols, o.max_iterations);
}

PathWorker::PathWorker(const SearchConfig& config, unsigned workerCount) : m_searcher(config) {
    if (workerCount == 0) {
        workerCount = 1;
    }
    m_running.store(true);
    for (unsigned i = 0; i < workerCount; ++i) {
        m_workers.emplace_back(&PathWorker::worker_loop, this);
    }
    if (config.verbose) {
        printf("[PathWorker] Started %u worker thread(s)\n", workerCount);
    }
}

PathWorker::~PathWorker() {
    stop();
}

PathRequest PathWorker::normalize(const PathRequest& request) const {
    PathRequest normalized = request;
    if (normalized.max_iterations == 0) {
        normalized.max_iterations = m_searcher.config().default_max_iterations;
    }
    return normalized;
}

bool PathWorker::matches_cache_anchor(const PathRequest& request) const {
    return request.start == m_cacheStart &&
           request.grid.rows == m_cacheGrid.rows && request.grid.cols == m_cacheGrid.cols;
}

void PathWorker::reject(std::promise<SearchResult>& promise, SearchStatus status) {
    SearchResult rejected;
    rejected.status = status;
    promise.set_value(std::move(rejected));
}

std::future<SearchResult> PathWorker::submit(const PathRequest& request) {
    m_totalRequests.fetch_add(1, std::memory_order_relaxed);
    const PathRequest key = normalize(request);

    std::promise<SearchResult> promise;
    std::future<SearchResult> future = promise.get_future();

    if (!m_running.load()) {
        fprintf(stderr, "[PathWorker] Request (%d,%d)->(%d,%d) rejected: worker stopped\n",
                key.start.row, key.start.col, key.end.row, key.end.col);
        reject(promise, SearchStatus::InvalidRequest);
        return future;
    }

    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        if (!matches_cache_anchor(key)) {
            // New start or grid: earlier results are no longer asked for
            m_cache.clear();
            m_cacheStart = key.start;
            m_cacheGrid = key.grid;
        }
        auto it = m_cache.find(key);
        if (it != m_cache.end()) {
            m_cacheHits.fetch_add(1, std::memory_order_relaxed);
            promise.set_value(it->second);
            return future;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running.load()) {
            m_jobs.push(Job{key, std::move(promise)});
            m_cv.notify_one();
            return future;
        }
    }

    fprintf(stderr, "[PathWorker] Request (%d,%d)->(%d,%d) rejected: worker stopped\n",
            key.start.row, key.start.col, key.end.row, key.end.col);
    reject(promise, SearchStatus::InvalidRequest);
    return future;
}

size_t PathWorker::cancel_pending() {
    std::queue<Job> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::swap(pending, m_jobs);
    }

    const size_t dropped = pending.size();
    while (!pending.empty()) {
        reject(pending.front().promise, SearchStatus::Cancelled);
        pending.pop();
    }
    m_cancelled.fetch_add(dropped, std::memory_order_relaxed);

    if (dropped > 0 && m_searcher.config().verbose) {
        printf("[PathWorker] Cancelled %zu queued request(s)\n", dropped);
    }
    return dropped;
}

void PathWorker::stop() {
    std::queue<Job> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.exchange(false)) return;
        std::swap(pending, m_jobs);
    }
    m_cv.notify_all();
    for (auto& t : m_workers) {
        if (t.joinable()) t.join();
    }
    m_workers.clear();

    if (!pending.empty()) {
        fprintf(stderr, "[PathWorker] Stopped with %zu queued request(s) unanswered\n", pending.size());
    }
    while (!pending.empty()) {
        reject(pending.front().promise, SearchStatus::InvalidRequest);
        pending.pop();
    }

    if (m_searcher.config().verbose) {
        PathWorkerStats s = stats();
        printf("[PathWorker] Shutdown complete: %llu requests, %llu cache hits, %llu searches, %llu found\n",
               static_cast<unsigned long long>(s.total_requests),
               static_cast<unsigned long long>(s.cache_hits),
               static_cast<unsigned long long>(s.completed),
               static_cast<unsigned long long>(s.found));
    }
}

void PathWorker::clear_cache() {
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    m_cache.clear();
}

size_t PathWorker::cache_size() const {
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    return m_cache.size();
}

PathWorkerStats PathWorker::stats() const {
    PathWorkerStats s;
    s.total_requests = m_totalRequests.load(std::memory_order_relaxed);
    s.cache_hits = m_cacheHits.load(std::memory_order_relaxed);
    s.completed = m_completed.load(std::memory_order_relaxed);
    s.found = m_found.load(std::memory_order_relaxed);
    s.cancelled = m_cancelled.load(std::memory_order_relaxed);
    return s;
}

void PathWorker::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&] { return !m_running.load() || !m_jobs.empty(); });
            if (!m_running.load()) break;
            job = std::move(m_jobs.front());
            m_jobs.pop();
        }

        try {
            SearchResult result = m_searcher.find_path(
                job.request.start, job.request.end, job.request.grid, job.request.max_iterations);

            m_completed.fetch_add(1, std::memory_order_relaxed);
            if (result.found) {
                m_found.fetch_add(1, std::memory_order_relaxed);
            }
            if (result.status != SearchStatus::InvalidRequest) {
                std::lock_guard<std::mutex> lock(m_cacheMutex);
                // Results for a start the caller has moved away from are dropped
                if (matches_cache_anchor(job.request) && m_cache.size() < MAX_CACHED_RESULTS) {
                    m_cache[job.request] = result;
                }
            }
            job.promise.set_value(std::move(result));
        } catch (const std::exception& e) {
            // Hand the failure to the caller waiting on the future
            fprintf(stderr, "[PathWorker] ERROR: search failed: %s\n", e.what());
            job.promise.set_exception(std::current_exception());
        }
    }
}
