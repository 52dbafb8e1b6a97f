/**
 * @file mesh_buffer_pool.cpp
 * @brief Implementation of per-worker mesher scratch memory
 */

#include "mesh_buffer_pool.h"
#include "chunk_shape.h"
#include "logger.h"

#include <stdexcept>
#include <string>

namespace {
    constexpr size_t SLICE_CELLS =
        static_cast<size_t>(ChunkShape::CHUNK_LENGTH) * ChunkShape::CHUNK_LENGTH;

    // Typical terrain chunks emit a few hundred quads; start there so the
    // first ticks do not spend their time growing vectors
    constexpr size_t INITIAL_QUAD_CAPACITY = 1024;
}

MeshBuffers::MeshBuffers()
    : faceMask(SLICE_CELLS, 0)
    , visited(SLICE_CELLS, 0) {
    quads.reserve(INITIAL_QUAD_CAPACITY);
    accumulator.positions.reserve(INITIAL_QUAD_CAPACITY * 4);
    accumulator.normals.reserve(INITIAL_QUAD_CAPACITY * 4);
    accumulator.uvs.reserve(INITIAL_QUAD_CAPACITY * 4);
    accumulator.materials.reserve(INITIAL_QUAD_CAPACITY * 4);
    accumulator.indices.reserve(INITIAL_QUAD_CAPACITY * 6);
}

void MeshBuffers::reset() {
    // assign() on an equally sized vector rewrites in place, no reallocation
    faceMask.assign(SLICE_CELLS, 0);
    visited.assign(SLICE_CELLS, 0);
    quads.clear();
    accumulator.clear();
    ++m_useCount;
}

MeshBufferPool::MeshBufferPool(size_t workerCount) {
    m_buffers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        m_buffers.push_back(std::make_unique<MeshBuffers>());
    }

    Logger::debug() << "MeshBufferPool initialized with " << workerCount << " scratch sets";
}

MeshBuffers& MeshBufferPool::buffersFor(size_t workerIndex) {
    if (workerIndex >= m_buffers.size()) {
        throw std::out_of_range("MeshBufferPool: worker index " + std::to_string(workerIndex) +
                                " out of range (pool size " + std::to_string(m_buffers.size()) + ")");
    }
    return *m_buffers[workerIndex];
}

std::pair<size_t, size_t> MeshBufferPool::getPoolStats() const {
    size_t totalUses = 0;
    for (const auto& buffers : m_buffers) {
        totalUses += buffers->useCount();
    }
    return {m_buffers.size(), totalUses};
}
