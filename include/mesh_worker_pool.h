/**
 * @file mesh_worker_pool.h
 * @brief Fixed-size thread pool running meshing jobs in fork-join batches
 *
 * Workers are created once and reused for every batch, so a tick never spawns
 * threads. runBatch() hands a list of jobs to the pool and blocks until every
 * one of them has finished; that join is the only point where the calling
 * thread waits on meshing.
 *
 * Each job receives the index of the worker running it (0..workerCount()-1).
 * Jobs use it to pick per-worker scratch memory, see MeshBufferPool.
 *
 * Usage:
 *   MeshWorkerPool workers(4);
 *   std::vector<MeshWorkerPool::Job> jobs;
 *   jobs.push_back([&](size_t workerIndex) { ... });
 *   workers.runBatch(std::move(jobs));   // returns once all jobs ran
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

class MeshWorkerPool {
public:
    using Job = std::function<void(size_t workerIndex)>;

    /**
     * @brief Starts the worker threads
     *
     * @param workerCount Number of threads; 0 picks hardware_concurrency - 1
     *                    (at least 1)
     */
    explicit MeshWorkerPool(size_t workerCount = 0);

    /**
     * @brief Signals the workers to exit and joins them
     */
    ~MeshWorkerPool();

    MeshWorkerPool(const MeshWorkerPool&) = delete;
    MeshWorkerPool& operator=(const MeshWorkerPool&) = delete;

    /**
     * @brief Runs every job on the pool and waits for all of them
     *
     * If one or more jobs throw, the remaining jobs still run and the first
     * captured exception is rethrown here after the join.
     * Must not be called from inside a job.
     */
    void runBatch(std::vector<Job> jobs);

    size_t workerCount() const { return m_workers.size(); }

    /**
     * @brief Worker count used when 0 is requested
     */
    static size_t defaultWorkerCount();

private:
    void workerThreadFunction(size_t workerIndex);

    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running;

    // === Job queue (accessed by the batch caller + workers) ===
    std::mutex m_queueMutex;
    std::condition_variable m_queueCV;        ///< Wakes workers when jobs arrive
    std::condition_variable m_batchDoneCV;    ///< Wakes runBatch when the last job ends
    std::deque<Job> m_jobQueue;
    size_t m_pendingJobs;                     ///< Jobs of the current batch not yet finished
    std::exception_ptr m_firstError;

    std::mutex m_batchMutex;                  ///< One batch at a time
};
