/**
 * @file voxel_map.h
 * @brief Sparse chunk storage: chunk coordinate -> padded voxel buffer
 *
 * THREAD SAFETY:
 * - The map is protected by a shared_mutex (readers: meshing workers, writers:
 *   the edit/generation side)
 * - Readers get shared_ptr<const ChunkBuffer> snapshots. mutate() never writes
 *   into a buffer somebody else still holds; it clones first (copy-on-write).
 *   A snapshot taken before a meshing tick therefore stays unchanged until the
 *   worker drops it, even if the chunk is edited or unloaded meanwhile.
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>
#include <functional>
#include <unordered_map>
#include <shared_mutex>
#include "chunk_buffer.h"
#include "chunk_coord.h"

class VoxelMap {
public:
    using BufferRef = std::shared_ptr<const ChunkBuffer>;

    VoxelMap() = default;
    ~VoxelMap() = default;

    VoxelMap(const VoxelMap&) = delete;
    VoxelMap& operator=(const VoxelMap&) = delete;

    /**
     * @brief Read-only snapshot of a chunk's buffer
     * @return The buffer, or nullptr if the chunk is not loaded
     */
    BufferRef bufferAt(const ChunkCoord& coord) const;

    /**
     * @brief Inserts a fully built buffer, replacing any previous one
     */
    void insert(const ChunkCoord& coord, ChunkBuffer buffer);

    /**
     * @brief Unloads a chunk
     * @return The removed voxels, or std::nullopt if the chunk was not loaded
     */
    std::optional<ChunkBuffer> remove(const ChunkCoord& coord);

    /**
     * @brief Edits a chunk's voxels in place (copy-on-write)
     *
     * @param coord Chunk to edit
     * @param edit Callback receiving a writable buffer. Runs under the map's
     *             exclusive lock, so it must not call back into the map.
     *             Calling ChunkMeshScheduler::onUpdate() from it is allowed.
     * @return False if the chunk is not loaded
     */
    bool mutate(const ChunkCoord& coord, const std::function<void(ChunkBuffer&)>& edit);

    bool contains(const ChunkCoord& coord) const;
    size_t size() const;

    /**
     * @brief Snapshot of every loaded chunk coordinate (unordered)
     */
    std::vector<ChunkCoord> coords() const;

    void clear();

private:
    std::unordered_map<ChunkCoord, std::shared_ptr<ChunkBuffer>> m_chunks;
    mutable std::shared_mutex m_mutex;
};
