/**
 * @file chunk_buffer.h
 * @brief Dense padded voxel storage for one chunk
 */

#pragma once

#include <vector>
#include <cstddef>
#include <glm/glm.hpp>
#include "voxel.h"
#include "chunk_shape.h"

/**
 * @brief Padded voxel array for a single chunk
 *
 * Holds ChunkShape::PADDED_VOLUME voxels. Accessors taking a local coordinate
 * address the 16^3 interior; padded accessors also reach the border.
 * A fresh buffer is entirely empty, including its border, which makes the
 * chunk's outer faces visible until a neighbor is copied in.
 *
 * Local-coordinate accessors follow the world edit convention: reads outside
 * the chunk return empty and writes outside it are ignored.
 */
class ChunkBuffer {
public:
    ChunkBuffer();

    /**
     * @brief Builds a buffer whose interior is filled with one voxel
     * @param fillVoxel Voxel written to every interior cell (border stays empty)
     */
    explicit ChunkBuffer(Voxel fillVoxel);

    // ========== Interior Access ==========

    Voxel getVoxel(int x, int y, int z) const;
    void setVoxel(int x, int y, int z, Voxel voxel);

    /**
     * @brief Writes one voxel to every interior cell
     */
    void fill(Voxel voxel);

    /**
     * @brief True when every interior cell is empty
     */
    bool isEmpty() const;

    /**
     * @brief Number of non-empty interior cells
     */
    size_t countSolid() const;

    // ========== Padded Access ==========

    Voxel getPaddedVoxel(const glm::ivec3& padded) const {
        return m_voxels[ChunkShape::linearize(padded)];
    }

    void setPaddedVoxel(const glm::ivec3& padded, Voxel voxel) {
        m_voxels[ChunkShape::linearize(padded)] = voxel;
    }

    Voxel at(size_t index) const { return m_voxels[index]; }

    const Voxel* data() const { return m_voxels.data(); }
    size_t size() const { return m_voxels.size(); }

    /**
     * @brief Copies a neighbor's touching edge layer into this buffer's border
     *
     * @param axis 0 = X, 1 = Y, 2 = Z
     * @param positiveSide True for the neighbor at +axis, false for -axis
     * @param neighbor The adjacent chunk's buffer
     */
    void copyBorderFrom(int axis, bool positiveSide, const ChunkBuffer& neighbor);

    /**
     * @brief Resets every border cell to empty
     */
    void clearBorder();

    bool operator==(const ChunkBuffer& other) const { return m_voxels == other.m_voxels; }
    bool operator!=(const ChunkBuffer& other) const { return m_voxels != other.m_voxels; }

private:
    std::vector<Voxel> m_voxels;
};
