/**
 * @file chunk_shape.h
 * @brief Chunk dimensions and the padded coordinate <-> index mapping
 *
 * A chunk stores CHUNK_LENGTH^3 cells plus a one-cell border on every side.
 * The border carries copies of the neighboring chunks' edge cells so the mesher
 * can decide face visibility without looking outside the buffer.
 *
 * Coordinate spaces:
 * - Local:  0..CHUNK_LENGTH-1 per axis, the cells owned by the chunk
 * - Padded: 0..PADDED_LENGTH-1 per axis, local + PADDING
 *
 * Memory layout: X fastest, then Y, then Z.
 *   index = x + PADDED_LENGTH * (y + PADDED_LENGTH * z)
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <glm/glm.hpp>

namespace ChunkShape {
    /// Cells per chunk edge
    constexpr int CHUNK_LENGTH = 16;

    /// Border cells on each side
    constexpr int PADDING = 1;

    /// Cells per padded edge (18)
    constexpr int PADDED_LENGTH = CHUNK_LENGTH + 2 * PADDING;

    /// Cells in the padded volume (18^3 = 5832)
    constexpr size_t PADDED_VOLUME =
        static_cast<size_t>(PADDED_LENGTH) * PADDED_LENGTH * PADDED_LENGTH;

    /// First and last padded index of the interior along one axis
    constexpr int INTERIOR_MIN = PADDING;
    constexpr int INTERIOR_MAX = PADDING + CHUNK_LENGTH - 1;

    inline bool isPaddedInBounds(const glm::ivec3& p) {
        return p.x >= 0 && p.x < PADDED_LENGTH &&
               p.y >= 0 && p.y < PADDED_LENGTH &&
               p.z >= 0 && p.z < PADDED_LENGTH;
    }

    inline bool isLocalInBounds(const glm::ivec3& p) {
        return p.x >= 0 && p.x < CHUNK_LENGTH &&
               p.y >= 0 && p.y < CHUNK_LENGTH &&
               p.z >= 0 && p.z < CHUNK_LENGTH;
    }

    inline glm::ivec3 localToPadded(const glm::ivec3& local) {
        return local + glm::ivec3(PADDING);
    }

    /**
     * @brief Flat storage index of a padded coordinate
     *
     * Callers only ever pass coordinates inside the padded volume; anything else
     * is a bug in the caller, caught by the assert in debug builds.
     */
    inline size_t linearize(const glm::ivec3& p) {
        assert(isPaddedInBounds(p) && "padded chunk coordinate out of range");
        return static_cast<size_t>(p.x) +
               static_cast<size_t>(PADDED_LENGTH) *
                   (static_cast<size_t>(p.y) + static_cast<size_t>(PADDED_LENGTH) * static_cast<size_t>(p.z));
    }

    /**
     * @brief Inverse of linearize()
     */
    inline glm::ivec3 delinearize(size_t index) {
        assert(index < PADDED_VOLUME && "chunk buffer index out of range");
        const int i = static_cast<int>(index);
        return glm::ivec3(i % PADDED_LENGTH,
                          (i / PADDED_LENGTH) % PADDED_LENGTH,
                          i / (PADDED_LENGTH * PADDED_LENGTH));
    }
}
