/**
 * @file mesh_buffer_pool.h
 * @brief Per-worker scratch memory for the greedy mesher
 *
 * Every meshing call needs a face mask, a visited mask, a list of merged quads
 * and vertex/index accumulators. Each worker keeps one set for the lifetime of
 * the pool and clears it (capacity preserved) before every call.
 *
 * Usage:
 *   MeshBufferPool pool(workers.workerCount());
 *   // inside a job running on worker `workerIndex`:
 *   MeshBuffers& scratch = pool.buffersFor(workerIndex);
 *   greedyMesh(buffer, scratch, mesh, params);
 *
 * Thread Safety:
 *   The pool hands out one instance per worker index and never shares an index.
 *   buffersFor() itself does no locking; the instance list is fixed at
 *   construction, so concurrent lookups with distinct indices are safe.
 */

#pragma once

#include <vector>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <utility>
#include "chunk_mesh.h"

/**
 * @brief One merged rectangle waiting to be turned into vertices
 */
struct GreedyQuad {
    uint8_t face = 0;        ///< Face direction index (see FaceDirection)
    int slice = 0;           ///< Interior layer along the face axis (0..CHUNK_LENGTH-1)
    int u = 0;               ///< Start cell along the first in-slice axis
    int v = 0;               ///< Start cell along the second in-slice axis
    int width = 0;           ///< Extent along u, in cells
    int height = 0;          ///< Extent along v, in cells
    uint16_t material = 0;   ///< Voxel material shared by every merged cell
};

/**
 * @brief Reusable intermediate containers for one meshing worker
 *
 * Carries no state between calls: reset() runs at the start of every meshing
 * call and leaves only capacity behind.
 */
class MeshBuffers {
public:
    MeshBuffers();

    MeshBuffers(const MeshBuffers&) = delete;
    MeshBuffers& operator=(const MeshBuffers&) = delete;

    /**
     * @brief Clears every container, keeping allocated capacity
     *
     * Also counts the reuse for pool statistics.
     */
    void reset();

    /// Material per slice cell; EMPTY_MATERIAL means "no visible face"
    std::vector<uint16_t> faceMask;

    /// 1 if the slice cell is already covered by an emitted quad
    std::vector<uint8_t> visited;

    /// Quads merged so far in this call, in emission order
    std::vector<GreedyQuad> quads;

    /// Vertex and index accumulator, copied into the caller's mesh at the end
    ChunkMesh accumulator;

    /// Number of meshing calls served by this instance
    size_t useCount() const { return m_useCount; }

private:
    size_t m_useCount = 0;
};

/**
 * @brief Fixed set of MeshBuffers, one per meshing worker
 */
class MeshBufferPool {
public:
    /**
     * @brief Creates one scratch set per worker
     * @param workerCount Number of workers that will mesh concurrently
     */
    explicit MeshBufferPool(size_t workerCount);

    ~MeshBufferPool() = default;

    // Prevent copying (pools should not be copied)
    MeshBufferPool(const MeshBufferPool&) = delete;
    MeshBufferPool& operator=(const MeshBufferPool&) = delete;

    /**
     * @brief Scratch set owned by the given worker
     *
     * @param workerIndex Index of the calling worker (0..size()-1)
     * @throws std::out_of_range if workerIndex is not below size()
     */
    MeshBuffers& buffersFor(size_t workerIndex);

    /**
     * @brief Number of scratch sets (equals the worker count it was built for)
     */
    size_t size() const { return m_buffers.size(); }

    /**
     * @brief Gets current pool statistics
     *
     * @return Pair of (scratch sets, total meshing calls served)
     */
    std::pair<size_t, size_t> getPoolStats() const;

private:
    std::vector<std::unique_ptr<MeshBuffers>> m_buffers;
};
