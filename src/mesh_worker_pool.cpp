/**
 * @file mesh_worker_pool.cpp
 * @brief Persistent meshing threads with a fork-join batch barrier
 */

#include "mesh_worker_pool.h"
#include "logger.h"

#include <utility>

size_t MeshWorkerPool::defaultWorkerCount() {
    unsigned int hardware = std::thread::hardware_concurrency();
    if (hardware <= 1) {
        return 1;
    }
    return static_cast<size_t>(hardware - 1);
}

MeshWorkerPool::MeshWorkerPool(size_t workerCount)
    : m_running(true)
    , m_pendingJobs(0) {
    if (workerCount == 0) {
        workerCount = defaultWorkerCount();
    }

    m_workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        m_workers.emplace_back(&MeshWorkerPool::workerThreadFunction, this, i);
    }

    Logger::debug() << "MeshWorkerPool started with " << workerCount << " workers";
}

MeshWorkerPool::~MeshWorkerPool() {
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_running.store(false);
    }
    m_queueCV.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    Logger::debug() << "MeshWorkerPool stopped (" << m_workers.size() << " workers joined)";
}

void MeshWorkerPool::runBatch(std::vector<Job> jobs) {
    if (jobs.empty()) {
        return;
    }

    std::lock_guard<std::mutex> batchLock(m_batchMutex);

    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_firstError = nullptr;
        m_pendingJobs = jobs.size();
        for (auto& job : jobs) {
            m_jobQueue.push_back(std::move(job));
        }

        m_queueCV.notify_all();

        m_batchDoneCV.wait(lock, [this]() { return m_pendingJobs == 0; });

        error = m_firstError;
        m_firstError = nullptr;
    }

    if (error) {
        std::rethrow_exception(error);
    }
}

void MeshWorkerPool::workerThreadFunction(size_t workerIndex) {
    Logger::debug() << "Mesh worker " << workerIndex << " started (ID: " << std::this_thread::get_id() << ")";

    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            // Wait until there's work or we should exit
            m_queueCV.wait(lock, [this]() {
                return !m_jobQueue.empty() || !m_running.load();
            });

            if (!m_running.load() && m_jobQueue.empty()) {
                break;
            }

            job = std::move(m_jobQueue.front());
            m_jobQueue.pop_front();
        }

        std::exception_ptr error;
        try {
            job(workerIndex);
        } catch (...) {
            // Handed to runBatch, which rethrows it on the calling thread
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            if (error && !m_firstError) {
                m_firstError = error;
            }
            --m_pendingJobs;
            if (m_pendingJobs == 0) {
                m_batchDoneCV.notify_all();
            }
        }
    }

    Logger::debug() << "Mesh worker " << workerIndex << " exiting";
}
