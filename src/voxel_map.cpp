/**
 * @file voxel_map.cpp
 * @brief Implementation of the sparse chunk map
 */

#include "voxel_map.h"

#include <mutex>

VoxelMap::BufferRef VoxelMap::bufferAt(const ChunkCoord& coord) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_chunks.find(coord);
    if (it == m_chunks.end()) {
        return nullptr;
    }
    return it->second;
}

void VoxelMap::insert(const ChunkCoord& coord, ChunkBuffer buffer) {
    // Build outside the lock; only the pointer swap needs exclusivity
    auto stored = std::make_shared<ChunkBuffer>(std::move(buffer));

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_chunks[coord] = std::move(stored);
}

std::optional<ChunkBuffer> VoxelMap::remove(const ChunkCoord& coord) {
    std::shared_ptr<ChunkBuffer> removed;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_chunks.find(coord);
        if (it == m_chunks.end()) {
            return std::nullopt;
        }
        removed = std::move(it->second);
        m_chunks.erase(it);
    }

    // A meshing worker may still hold this buffer; hand back a copy in that case
    if (removed.use_count() == 1) {
        return std::move(*removed);
    }
    return *removed;
}

bool VoxelMap::mutate(const ChunkCoord& coord, const std::function<void(ChunkBuffer&)>& edit) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_chunks.find(coord);
    if (it == m_chunks.end()) {
        return false;
    }

    std::shared_ptr<ChunkBuffer>& slot = it->second;
    if (slot.use_count() > 1) {
        // Someone holds a snapshot: detach before writing
        slot = std::make_shared<ChunkBuffer>(*slot);
    }
    edit(*slot);
    return true;
}

bool VoxelMap::contains(const ChunkCoord& coord) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_chunks.find(coord) != m_chunks.end();
}

size_t VoxelMap::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_chunks.size();
}

std::vector<ChunkCoord> VoxelMap::coords() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<ChunkCoord> result;
    result.reserve(m_chunks.size());
    for (const auto& [coord, buffer] : m_chunks) {
        result.push_back(coord);
    }
    return result;
}

void VoxelMap::clear() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_chunks.clear();
}
