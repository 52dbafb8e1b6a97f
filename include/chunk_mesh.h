/**
 * @file chunk_mesh.h
 * @brief Triangle mesh produced for one chunk
 */

#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <glm/glm.hpp>
#include "chunk_coord.h"

/**
 * @brief Indexed triangle list in chunk-local space
 *
 * positions, normals, uvs and materials are index-aligned (one entry per vertex).
 * Every index refers to an existing vertex and indices.size() is a multiple of 3.
 * An empty mesh (no vertices, no indices) is a valid result for an empty chunk.
 */
struct ChunkMesh {
    std::vector<glm::vec3> positions;   ///< Vertex positions (grid corners * unit scale)
    std::vector<glm::vec3> normals;     ///< Face normal, shared by the 4 vertices of a quad
    std::vector<glm::vec2> uvs;         ///< Texture coordinates (quad extent * texel scale)
    std::vector<uint16_t> materials;    ///< Voxel material of the quad each vertex belongs to
    std::vector<uint32_t> indices;      ///< Triangle list, 6 per quad

    size_t vertexCount() const { return positions.size(); }
    size_t triangleCount() const { return indices.size() / 3; }
    bool isEmpty() const { return positions.empty() && indices.empty(); }

    /**
     * @brief Empties every list, keeping allocated capacity
     */
    void clear();

    bool operator==(const ChunkMesh& other) const;
    bool operator!=(const ChunkMesh& other) const { return !(*this == other); }
};

/**
 * @brief Checks the structural invariants of a mesh
 *
 * @return True when all attribute lists match the vertex count, the index count
 *         is a multiple of 3 and every index is below the vertex count
 */
bool isValidMesh(const ChunkMesh& mesh);

/**
 * @brief Axis-aligned bounds of a chunk in world units
 */
struct ChunkBounds {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};
};

/**
 * @brief World-space bounds of a chunk for a given voxel size
 * @param coord Chunk coordinate
 * @param unitScale World units per voxel
 */
ChunkBounds chunkBounds(const ChunkCoord& coord, float unitScale);
