/**
 * @file chunk_coord.h
 * @brief Chunk position in the world grid, usable as a map key
 */

#pragma once

#include <cstddef>
#include <functional>
#include <glm/glm.hpp>
#include "chunk_shape.h"

/**
 * @brief Chunk coordinate key for the voxel map and the dirty set
 *
 * Chunk (1, 0, -2) covers world voxels x = 16..31, y = 0..15, z = -32..-17.
 */
struct ChunkCoord {
    int x = 0;
    int y = 0;
    int z = 0;

    bool operator==(const ChunkCoord& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    bool operator!=(const ChunkCoord& other) const {
        return !(*this == other);
    }

    /// Lexicographic (x, y, z) ordering for sorted containers
    bool operator<(const ChunkCoord& other) const {
        if (x != other.x) return x < other.x;
        if (y != other.y) return y < other.y;
        return z < other.z;
    }

    /// Minimum corner of the chunk in world voxel units
    glm::ivec3 worldOrigin() const {
        return glm::ivec3(x, y, z) * ChunkShape::CHUNK_LENGTH;
    }
};

/**
 * @brief Hash function for ChunkCoord to enable use in unordered containers
 */
namespace std {
    template<>
    struct hash<ChunkCoord> {
        size_t operator()(const ChunkCoord& coord) const {
            // Large odd multipliers spread neighboring coordinates across buckets
            size_t h = static_cast<size_t>(static_cast<unsigned int>(coord.x)) * 73856093u;
            h ^= static_cast<size_t>(static_cast<unsigned int>(coord.y)) * 19349663u;
            h ^= static_cast<size_t>(static_cast<unsigned int>(coord.z)) * 83492791u;
            return h;
        }
    };
}
