/**
 * @file chunk_buffer.cpp
 * @brief Implementation of padded chunk voxel storage
 */

#include "chunk_buffer.h"

#include <algorithm>

using ChunkShape::CHUNK_LENGTH;
using ChunkShape::PADDED_LENGTH;
using ChunkShape::PADDING;

ChunkBuffer::ChunkBuffer()
    : m_voxels(ChunkShape::PADDED_VOLUME, Voxel::empty()) {
}

ChunkBuffer::ChunkBuffer(Voxel fillVoxel)
    : ChunkBuffer() {
    fill(fillVoxel);
}

Voxel ChunkBuffer::getVoxel(int x, int y, int z) const {
    const glm::ivec3 local(x, y, z);
    if (!ChunkShape::isLocalInBounds(local)) {
        return Voxel::empty();  // Out of bounds
    }
    return m_voxels[ChunkShape::linearize(ChunkShape::localToPadded(local))];
}

void ChunkBuffer::setVoxel(int x, int y, int z, Voxel voxel) {
    const glm::ivec3 local(x, y, z);
    if (!ChunkShape::isLocalInBounds(local)) {
        return;  // Out of bounds
    }
    m_voxels[ChunkShape::linearize(ChunkShape::localToPadded(local))] = voxel;
}

void ChunkBuffer::fill(Voxel voxel) {
    for (int z = 0; z < CHUNK_LENGTH; ++z) {
        for (int y = 0; y < CHUNK_LENGTH; ++y) {
            // X is contiguous in memory, so each row is one run
            const size_t rowStart = ChunkShape::linearize(glm::ivec3(PADDING, y + PADDING, z + PADDING));
            std::fill_n(m_voxels.begin() + static_cast<std::ptrdiff_t>(rowStart), CHUNK_LENGTH, voxel);
        }
    }
}

bool ChunkBuffer::isEmpty() const {
    for (int z = 0; z < CHUNK_LENGTH; ++z) {
        for (int y = 0; y < CHUNK_LENGTH; ++y) {
            const size_t rowStart = ChunkShape::linearize(glm::ivec3(PADDING, y + PADDING, z + PADDING));
            for (int x = 0; x < CHUNK_LENGTH; ++x) {
                if (!m_voxels[rowStart + static_cast<size_t>(x)].isEmpty()) {
                    return false;  // Early exit on first solid cell
                }
            }
        }
    }
    return true;
}

size_t ChunkBuffer::countSolid() const {
    size_t count = 0;
    for (int z = 0; z < CHUNK_LENGTH; ++z) {
        for (int y = 0; y < CHUNK_LENGTH; ++y) {
            const size_t rowStart = ChunkShape::linearize(glm::ivec3(PADDING, y + PADDING, z + PADDING));
            for (int x = 0; x < CHUNK_LENGTH; ++x) {
                if (!m_voxels[rowStart + static_cast<size_t>(x)].isEmpty()) {
                    ++count;
                }
            }
        }
    }
    return count;
}

void ChunkBuffer::copyBorderFrom(int axis, bool positiveSide, const ChunkBuffer& neighbor) {
    if (axis < 0 || axis > 2) {
        return;
    }

    const int u = (axis + 1) % 3;
    const int v = (axis + 2) % 3;

    // Our border layer and the neighbor's interior layer that touches it
    const int borderLayer = positiveSide ? PADDED_LENGTH - 1 : 0;
    const int sourceLayer = positiveSide ? ChunkShape::INTERIOR_MIN : ChunkShape::INTERIOR_MAX;

    for (int j = PADDING; j < PADDING + CHUNK_LENGTH; ++j) {
        for (int i = PADDING; i < PADDING + CHUNK_LENGTH; ++i) {
            glm::ivec3 dst(0);
            dst[axis] = borderLayer;
            dst[u] = i;
            dst[v] = j;

            glm::ivec3 src = dst;
            src[axis] = sourceLayer;

            m_voxels[ChunkShape::linearize(dst)] = neighbor.m_voxels[ChunkShape::linearize(src)];
        }
    }
}

void ChunkBuffer::clearBorder() {
    for (size_t i = 0; i < m_voxels.size(); ++i) {
        const glm::ivec3 p = ChunkShape::delinearize(i);
        const bool interior =
            p.x >= ChunkShape::INTERIOR_MIN && p.x <= ChunkShape::INTERIOR_MAX &&
            p.y >= ChunkShape::INTERIOR_MIN && p.y <= ChunkShape::INTERIOR_MAX &&
            p.z >= ChunkShape::INTERIOR_MIN && p.z <= ChunkShape::INTERIOR_MAX;
        if (!interior) {
            m_voxels[i] = Voxel::empty();
        }
    }
}
