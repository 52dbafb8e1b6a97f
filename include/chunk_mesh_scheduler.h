/**
 * @file chunk_mesh_scheduler.h
 * @brief Dirty tracking and budgeted per-tick remeshing of chunks
 *
 * Features:
 * - Per-chunk meshing state (Clean, Dirty, InFlight, InFlightDirty)
 * - FIFO queue of dirty chunks, each queued at most once
 * - Per-tick frame budget: at most meshesPerTick chunks leave the queue per tick,
 *   the rest stay dirty for later ticks
 * - Meshing runs in parallel on a MeshWorkerPool, each job using the scratch
 *   buffers of the worker it runs on
 * - Results are handed to a host-implemented ChunkMeshSink
 *
 * A tick is three passes:
 *   MeshingBatch batch = scheduler.beginTick();   // selection (sequential)
 *   scheduler.executeBatch(batch);                // meshing (parallel, joins)
 *   scheduler.finishTick(batch);                  // application (sequential)
 * tick() runs all three. Hosts that need to react between the passes can call
 * them individually.
 *
 * A chunk marked dirty while its previous mesh is still being built is not
 * lost: once the older result is applied the chunk goes back to Dirty and is
 * meshed again on a later tick.
 *
 * Thread Safety:
 * - onChunkAdded / onChunkRemoved / onUpdate and the queries may be called from
 *   any thread
 * - tick() and the staged passes must be called from a single thread
 * - Sink callbacks run on the calling thread without the scheduler lock held
 *   and may call back into the scheduler
 * - The scheduler never calls into the VoxelMap while holding its own lock, so
 *   a VoxelMap::mutate() callback may call onUpdate()
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "chunk_coord.h"
#include "chunk_mesh.h"
#include "greedy_mesher.h"
#include "mesh_buffer_pool.h"
#include "mesh_worker_pool.h"
#include "voxel_map.h"

/**
 * @brief Meshing state of one chunk
 */
enum class ChunkMeshState {
    CLEAN,            ///< Mesh is up to date (or the chunk was never seen)
    DIRTY,            ///< Queued for remeshing
    IN_FLIGHT,        ///< Selected this tick, result not yet applied
    IN_FLIGHT_DIRTY   ///< Selected this tick and dirtied again since
};

/**
 * @brief Host-side receiver of chunk meshes
 *
 * Implemented by whatever owns the renderable objects (GPU mesh store, scene
 * graph, test recorder, ...).
 */
class ChunkMeshSink {
public:
    virtual ~ChunkMeshSink() = default;

    /**
     * @brief Called once when a chunk becomes renderable, before any mesh for it
     *
     * @param coord Chunk coordinate
     * @param bounds World-space bounds (for culling setup and placement)
     */
    virtual void prepareChunk(const ChunkCoord& coord, const ChunkBounds& bounds) = 0;

    /**
     * @brief Replaces the chunk's current mesh
     *
     * @param coord Chunk coordinate
     * @param mesh New mesh in chunk-local space (may be empty)
     */
    virtual void applyMesh(const ChunkCoord& coord, ChunkMesh&& mesh) = 0;
};

/**
 * @brief Runtime settings of the scheduler
 */
struct SchedulerSettings {
    int meshesPerTick = 16;     ///< Frame budget, must be positive
    float unitScale = 1.0f;     ///< World units per voxel
    float texelScale = 1.0f;    ///< UV units per voxel
};

/**
 * @brief One selected chunk travelling through a tick
 */
struct MeshingUnit {
    ChunkCoord coord;
    VoxelMap::BufferRef buffer;   ///< Snapshot taken during selection
    ChunkMesh mesh;               ///< Filled by the meshing pass
    bool meshed = false;
};

/**
 * @brief Work selected by beginTick()
 */
struct MeshingBatch {
    std::vector<MeshingUnit> units;
    MeshingParams params;
    size_t skipped = 0;           ///< Dirty chunks dropped because they were unloaded
    std::chrono::steady_clock::time_point startTime;

    bool empty() const { return units.empty(); }
    size_t size() const { return units.size(); }
};

/**
 * @brief Cumulative scheduler counters
 */
struct MeshingStats {
    uint64_t ticks = 0;
    uint64_t chunksMeshed = 0;        ///< Meshing jobs that completed
    uint64_t meshesApplied = 0;       ///< Meshes handed to the sink
    uint64_t chunksSkipped = 0;       ///< Dirty chunks without a buffer at selection
    uint64_t resultsDiscarded = 0;    ///< Results dropped because the chunk went away
    uint64_t verticesEmitted = 0;     ///< Vertices in applied meshes
    double lastTickMs = 0.0;          ///< Wall time of the most recent tick
};

class ChunkMeshScheduler {
public:
    /**
     * @brief Creates a scheduler over existing storage, workers and scratch memory
     *
     * All referenced objects must outlive the scheduler.
     *
     * @throws std::invalid_argument if the budget or a scale is not positive, or
     *         if scratchPool has fewer scratch sets than workers has threads
     */
    ChunkMeshScheduler(VoxelMap& map, MeshWorkerPool& workers, MeshBufferPool& scratchPool,
                       ChunkMeshSink& sink, const SchedulerSettings& settings = SchedulerSettings{});

    ChunkMeshScheduler(const ChunkMeshScheduler&) = delete;
    ChunkMeshScheduler& operator=(const ChunkMeshScheduler&) = delete;

    // ========== Host notifications ==========

    /**
     * @brief Registers a chunk as renderable and queues its first mesh
     *
     * Calls sink.prepareChunk() the first time a coordinate is registered.
     * If the chunk is removed while prepareChunk() runs, it is not queued; a
     * re-add during that window gets its own prepareChunk() call and first mark.
     */
    void onChunkAdded(const ChunkCoord& coord);

    /**
     * @brief Unregisters a chunk
     *
     * Queued work is dropped; a result still in flight is discarded when the
     * tick finishes.
     */
    void onChunkRemoved(const ChunkCoord& coord);

    /**
     * @brief Marks a chunk's mesh as stale (idempotent)
     *
     * Ignored for coordinates that are not registered.
     */
    void onUpdate(const ChunkCoord& coord);

    // ========== Ticking ==========

    /**
     * @brief Runs one full tick
     * @return Number of meshes applied to the sink
     */
    size_t tick();

    /**
     * @brief Selection pass: takes up to the frame budget of dirty chunks
     *
     * Each selected chunk's buffer is snapshotted; chunks whose buffer is gone
     * are dropped and return to Clean (or to Dirty if marked again meanwhile).
     */
    MeshingBatch beginTick();

    /**
     * @brief Meshing pass: meshes every unit on the worker pool and joins
     */
    void executeBatch(MeshingBatch& batch);

    /**
     * @brief Application pass: hands results to the sink and settles states
     * @return Number of meshes applied
     */
    size_t finishTick(MeshingBatch& batch);

    // ========== Settings ==========

    /**
     * @brief Changes the per-tick budget
     * @throws std::invalid_argument if meshesPerTick is not positive
     */
    void setFrameBudget(int meshesPerTick);
    int frameBudget() const;

    // ========== Queries ==========

    ChunkMeshState stateOf(const ChunkCoord& coord) const;

    /// True if the chunk has a pending dirty mark (Dirty or InFlightDirty)
    bool isDirty(const ChunkCoord& coord) const;

    /// True if the chunk was selected and its result is not applied yet
    bool isInFlight(const ChunkCoord& coord) const;

    bool isRegistered(const ChunkCoord& coord) const;

    /// Chunks waiting in the dirty queue
    size_t dirtyCount() const;
    size_t inFlightCount() const;
    size_t registeredCount() const;

    MeshingStats getStats() const;

private:
    // All *Locked helpers expect m_mutex to be held
    void markDirtyLocked(const ChunkCoord& coord);
    void removeFromQueueLocked(const ChunkCoord& coord);
    void settleUnitLocked(const ChunkCoord& coord);

    VoxelMap& m_map;
    MeshWorkerPool& m_workers;
    MeshBufferPool& m_scratchPool;
    ChunkMeshSink& m_sink;

    mutable std::mutex m_mutex;
    SchedulerSettings m_settings;
    std::unordered_map<ChunkCoord, uint64_t> m_registered;     ///< Coordinate -> registration id
    uint64_t m_nextRegistration = 0;
    std::unordered_map<ChunkCoord, ChunkMeshState> m_states;   ///< Non-clean chunks only
    std::deque<ChunkCoord> m_dirtyQueue;
    size_t m_inFlight = 0;
    MeshingStats m_stats;
};
