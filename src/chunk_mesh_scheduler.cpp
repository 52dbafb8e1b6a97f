/**
 * @file chunk_mesh_scheduler.cpp
 * @brief Budgeted chunk remeshing: selection, parallel meshing, application
 */

#include "chunk_mesh_scheduler.h"
#include "logger.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

ChunkMeshScheduler::ChunkMeshScheduler(VoxelMap& map, MeshWorkerPool& workers, MeshBufferPool& scratchPool,
                                       ChunkMeshSink& sink, const SchedulerSettings& settings)
    : m_map(map)
    , m_workers(workers)
    , m_scratchPool(scratchPool)
    , m_sink(sink)
    , m_settings(settings) {
    if (settings.meshesPerTick <= 0) {
        throw std::invalid_argument("ChunkMeshScheduler: meshes per tick must be positive, got " +
                                    std::to_string(settings.meshesPerTick));
    }
    if (!(settings.unitScale > 0.0f) || !(settings.texelScale > 0.0f)) {
        throw std::invalid_argument("ChunkMeshScheduler: unit and texel scales must be positive");
    }
    if (scratchPool.size() < workers.workerCount()) {
        throw std::invalid_argument("ChunkMeshScheduler: scratch pool has " + std::to_string(scratchPool.size()) +
                                    " sets for " + std::to_string(workers.workerCount()) + " workers");
    }

    Logger::info() << "ChunkMeshScheduler ready (budget " << settings.meshesPerTick
                   << " chunks/tick, " << workers.workerCount() << " workers)";
}

// ========== Host notifications ==========

void ChunkMeshScheduler::onChunkAdded(const ChunkCoord& coord) {
    uint64_t registration;
    float unitScale;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_registered.count(coord) > 0) {
            // Already renderable: treat as a content change
            markDirtyLocked(coord);
            return;
        }
        registration = ++m_nextRegistration;
        m_registered.emplace(coord, registration);
        unitScale = m_settings.unitScale;
    }

    // The chunk is registered but not yet dirty, so no tick can pick it up
    // before the sink has prepared it
    m_sink.prepareChunk(coord, chunkBounds(coord, unitScale));

    // A remove (and possibly a re-add) during prepareChunk supersedes this registration
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_registered.find(coord);
    if (it != m_registered.end() && it->second == registration) {
        markDirtyLocked(coord);
    }
}

void ChunkMeshScheduler::onChunkRemoved(const ChunkCoord& coord) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_registered.erase(coord) == 0) {
        return;
    }

    auto it = m_states.find(coord);
    if (it == m_states.end()) {
        return;
    }

    switch (it->second) {
        case ChunkMeshState::DIRTY:
            removeFromQueueLocked(coord);
            m_states.erase(it);
            break;
        case ChunkMeshState::IN_FLIGHT_DIRTY:
            // Result will be discarded by finishTick; the newer mark is moot
            it->second = ChunkMeshState::IN_FLIGHT;
            break;
        case ChunkMeshState::IN_FLIGHT:
        case ChunkMeshState::CLEAN:
            break;
    }
}

void ChunkMeshScheduler::onUpdate(const ChunkCoord& coord) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_registered.count(coord) == 0) {
        Logger::debug() << "Ignoring update for unregistered chunk ("
                        << coord.x << ", " << coord.y << ", " << coord.z << ")";
        return;
    }

    markDirtyLocked(coord);
}

// ========== Ticking ==========

size_t ChunkMeshScheduler::tick() {
    MeshingBatch batch = beginTick();

    try {
        executeBatch(batch);
    } catch (const std::exception& e) {
        Logger::error() << "Meshing batch failed: " << e.what();
        // Settle every selected chunk before propagating so none stays InFlight
        finishTick(batch);
        throw;
    }

    return finishTick(batch);
}

MeshingBatch ChunkMeshScheduler::beginTick() {
    MeshingBatch batch;
    batch.startTime = std::chrono::steady_clock::now();

    std::vector<ChunkCoord> selected;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        batch.params.unitScale = m_settings.unitScale;
        batch.params.texelScale = m_settings.texelScale;

        const size_t budget = static_cast<size_t>(m_settings.meshesPerTick);
        while (selected.size() < budget && !m_dirtyQueue.empty()) {
            ChunkCoord coord = m_dirtyQueue.front();
            m_dirtyQueue.pop_front();

            m_states[coord] = ChunkMeshState::IN_FLIGHT;
            ++m_inFlight;
            selected.push_back(coord);
        }
    }

    if (selected.empty()) {
        return batch;
    }

    // Snapshot without m_mutex: edit callbacks may notify the scheduler while
    // holding the map lock
    std::vector<VoxelMap::BufferRef> buffers;
    buffers.reserve(selected.size());
    for (const ChunkCoord& coord : selected) {
        buffers.push_back(m_map.bufferAt(coord));
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    for (size_t i = 0; i < selected.size(); i++) {
        const ChunkCoord& coord = selected[i];
        if (!buffers[i]) {
            // Unloaded since it was marked; a reload will mark it again
            settleUnitLocked(coord);
            ++batch.skipped;
            Logger::debug() << "Skipping chunk (" << coord.x << ", " << coord.y << ", " << coord.z
                            << "): no voxel buffer";
            continue;
        }

        MeshingUnit unit;
        unit.coord = coord;
        unit.buffer = std::move(buffers[i]);
        batch.units.push_back(std::move(unit));
    }

    m_stats.chunksSkipped += batch.skipped;
    return batch;
}

void ChunkMeshScheduler::executeBatch(MeshingBatch& batch) {
    if (batch.empty()) {
        return;
    }

    std::vector<MeshWorkerPool::Job> jobs;
    jobs.reserve(batch.units.size());

    const MeshingParams params = batch.params;
    for (MeshingUnit& unit : batch.units) {
        MeshingUnit* target = &unit;
        jobs.push_back([this, target, params](size_t workerIndex) {
            MeshBuffers& scratch = m_scratchPool.buffersFor(workerIndex);
            greedyMesh(*target->buffer, scratch, target->mesh, params);
            target->meshed = true;
        });
    }

    m_workers.runBatch(std::move(jobs));
}

size_t ChunkMeshScheduler::finishTick(MeshingBatch& batch) {
    std::vector<MeshingUnit*> toApply;
    toApply.reserve(batch.units.size());

    size_t meshed = 0;
    size_t discarded = 0;

    // Map lookups happen before m_mutex is taken (see beginTick)
    std::vector<uint8_t> loaded;
    loaded.reserve(batch.units.size());
    for (const MeshingUnit& unit : batch.units) {
        loaded.push_back(m_map.contains(unit.coord) ? 1 : 0);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (size_t i = 0; i < batch.units.size(); i++) {
            MeshingUnit& unit = batch.units[i];
            if (unit.meshed) {
                ++meshed;
            }

            const bool registered = m_registered.count(unit.coord) > 0;
            if (!unit.meshed || !registered || !loaded[i]) {
                ++discarded;
                Logger::debug() << "Discarding mesh for chunk (" << unit.coord.x << ", " << unit.coord.y
                                << ", " << unit.coord.z << "): "
                                << (unit.meshed ? "chunk removed" : "meshing did not complete");
            } else {
                toApply.push_back(&unit);
            }

            settleUnitLocked(unit.coord);
            unit.buffer.reset();
        }
    }

    uint64_t vertices = 0;
    for (MeshingUnit* unit : toApply) {
        vertices += unit->mesh.vertexCount();
        m_sink.applyMesh(unit->coord, std::move(unit->mesh));
    }

    const auto endTime = std::chrono::steady_clock::now();
    const double elapsedMs = std::chrono::duration<double, std::milli>(endTime - batch.startTime).count();

    size_t remaining;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.ticks++;
        m_stats.chunksMeshed += meshed;
        m_stats.meshesApplied += toApply.size();
        m_stats.resultsDiscarded += discarded;
        m_stats.verticesEmitted += vertices;
        m_stats.lastTickMs = elapsedMs;
        remaining = m_dirtyQueue.size();
    }

    if (!batch.empty() || batch.skipped > 0) {
        Logger::debug() << "Meshing tick: " << toApply.size() << " applied, " << discarded << " discarded, "
                        << batch.skipped << " skipped, " << remaining << " still dirty ("
                        << elapsedMs << " ms)";
    }

    return toApply.size();
}

// ========== Settings ==========

void ChunkMeshScheduler::setFrameBudget(int meshesPerTick) {
    if (meshesPerTick <= 0) {
        throw std::invalid_argument("ChunkMeshScheduler: meshes per tick must be positive, got " +
                                    std::to_string(meshesPerTick));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.meshesPerTick = meshesPerTick;
    Logger::info() << "Meshing frame budget set to " << meshesPerTick << " chunks/tick";
}

int ChunkMeshScheduler::frameBudget() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settings.meshesPerTick;
}

// ========== Queries ==========

ChunkMeshState ChunkMeshScheduler::stateOf(const ChunkCoord& coord) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(coord);
    return (it != m_states.end()) ? it->second : ChunkMeshState::CLEAN;
}

bool ChunkMeshScheduler::isDirty(const ChunkCoord& coord) const {
    ChunkMeshState state = stateOf(coord);
    return state == ChunkMeshState::DIRTY || state == ChunkMeshState::IN_FLIGHT_DIRTY;
}

bool ChunkMeshScheduler::isInFlight(const ChunkCoord& coord) const {
    ChunkMeshState state = stateOf(coord);
    return state == ChunkMeshState::IN_FLIGHT || state == ChunkMeshState::IN_FLIGHT_DIRTY;
}

bool ChunkMeshScheduler::isRegistered(const ChunkCoord& coord) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registered.count(coord) > 0;
}

size_t ChunkMeshScheduler::dirtyCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dirtyQueue.size();
}

size_t ChunkMeshScheduler::inFlightCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight;
}

size_t ChunkMeshScheduler::registeredCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registered.size();
}

MeshingStats ChunkMeshScheduler::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

// ========== Private helpers ==========

void ChunkMeshScheduler::markDirtyLocked(const ChunkCoord& coord) {
    auto it = m_states.find(coord);
    if (it == m_states.end()) {
        m_states.emplace(coord, ChunkMeshState::DIRTY);
        m_dirtyQueue.push_back(coord);
        return;
    }

    if (it->second == ChunkMeshState::IN_FLIGHT) {
        it->second = ChunkMeshState::IN_FLIGHT_DIRTY;
    }
    // DIRTY and IN_FLIGHT_DIRTY already carry a pending mark
}

void ChunkMeshScheduler::removeFromQueueLocked(const ChunkCoord& coord) {
    auto it = std::find(m_dirtyQueue.begin(), m_dirtyQueue.end(), coord);
    if (it != m_dirtyQueue.end()) {
        m_dirtyQueue.erase(it);
    }
}

void ChunkMeshScheduler::settleUnitLocked(const ChunkCoord& coord) {
    auto it = m_states.find(coord);
    if (it == m_states.end()) {
        return;
    }

    if (m_inFlight > 0) {
        --m_inFlight;
    }

    if (it->second == ChunkMeshState::IN_FLIGHT_DIRTY && m_registered.count(coord) > 0) {
        // Dirtied again while meshing: the applied mesh is already stale
        it->second = ChunkMeshState::DIRTY;
        m_dirtyQueue.push_back(coord);
    } else {
        m_states.erase(it);
    }
}
