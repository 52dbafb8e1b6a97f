/**
 * @file chunk_mesh.cpp
 * @brief ChunkMesh helpers
 */

#include "chunk_mesh.h"
#include "chunk_shape.h"

void ChunkMesh::clear() {
    positions.clear();
    normals.clear();
    uvs.clear();
    materials.clear();
    indices.clear();
}

bool ChunkMesh::operator==(const ChunkMesh& other) const {
    return positions == other.positions &&
           normals == other.normals &&
           uvs == other.uvs &&
           materials == other.materials &&
           indices == other.indices;
}

bool isValidMesh(const ChunkMesh& mesh) {
    const size_t vertexCount = mesh.positions.size();
    if (mesh.normals.size() != vertexCount ||
        mesh.uvs.size() != vertexCount ||
        mesh.materials.size() != vertexCount) {
        return false;
    }

    if (mesh.indices.size() % 3 != 0) {
        return false;
    }

    for (uint32_t index : mesh.indices) {
        if (static_cast<size_t>(index) >= vertexCount) {
            return false;
        }
    }
    return true;
}

ChunkBounds chunkBounds(const ChunkCoord& coord, float unitScale) {
    ChunkBounds bounds;
    bounds.min = glm::vec3(coord.worldOrigin()) * unitScale;
    bounds.max = bounds.min + glm::vec3(static_cast<float>(ChunkShape::CHUNK_LENGTH) * unitScale);
    return bounds;
}
