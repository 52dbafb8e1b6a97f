/**
 * @file test_greedy_mesher.cpp
 * @brief Correctness tests for the greedy chunk mesher
 *
 * Tests:
 * 1. Empty chunk yields an empty mesh
 * 2. Single voxel and full chunk yield six quads
 * 3. Same buffer always yields the same mesh
 * 4. Different materials never merge
 * 5. Triangles are counter-clockwise seen from outside
 * 6. Padding samples hide faces at the chunk border
 * 7. Position and UV scales
 */

#include "test_utils.h"
#include "greedy_mesher.h"
#include "mesh_buffer_pool.h"

#include <algorithm>
#include <glm/glm.hpp>

namespace {

size_t quadCount(const ChunkMesh& mesh) {
    return mesh.indices.size() / 6;
}

size_t quadsWithNormal(const ChunkMesh& mesh, const glm::vec3& normal) {
    size_t count = 0;
    for (size_t i = 0; i < mesh.normals.size(); i += 4) {
        if (mesh.normals[i] == normal) {
            count++;
        }
    }
    return count;
}

} // namespace

// ============================================================
// Test 1: Emptiness
// ============================================================

TEST(EmptyChunkYieldsEmptyMesh) {
    MeshBuffers scratch;
    ChunkBuffer buffer;

    ChunkMesh mesh = greedyMesh(buffer, scratch);

    ASSERT_TRUE(mesh.isEmpty());
    ASSERT_EQ(mesh.vertexCount(), size_t(0));
    ASSERT_EQ(mesh.indices.size(), size_t(0));
    ASSERT_TRUE(isValidMesh(mesh));
}

TEST(OutputIsClearedBeforeMeshing) {
    MeshBuffers scratch;
    ChunkMesh mesh;
    greedyMesh(makeSolidChunk(), scratch, mesh);
    ASSERT_FALSE(mesh.isEmpty());

    greedyMesh(ChunkBuffer(), scratch, mesh);
    ASSERT_TRUE(mesh.isEmpty());
}

// ============================================================
// Test 2: Closed Surfaces
// ============================================================

TEST(SingleVoxelYieldsSixQuads) {
    MeshBuffers scratch;
    ChunkBuffer buffer;
    buffer.setVoxel(3, 4, 5, Voxel(7));

    ChunkMesh mesh = greedyMesh(buffer, scratch);

    ASSERT_EQ(quadCount(mesh), size_t(6));
    ASSERT_EQ(mesh.vertexCount(), size_t(24));
    ASSERT_EQ(mesh.indices.size(), size_t(36));
    ASSERT_EQ(mesh.triangleCount(), size_t(12));

    // Canonical order: +X first, sitting on the far side of the cell
    ASSERT_EQ(mesh.positions[0], glm::vec3(4.0f, 4.0f, 5.0f));
    ASSERT_EQ(mesh.normals[0], glm::vec3(1.0f, 0.0f, 0.0f));
    ASSERT_EQ(mesh.indices[0], 0u);
    ASSERT_EQ(mesh.indices[1], 1u);
    ASSERT_EQ(mesh.indices[2], 2u);

    // Then -X on the near side, with reversed triangles
    ASSERT_EQ(mesh.positions[4], glm::vec3(3.0f, 4.0f, 5.0f));
    ASSERT_EQ(mesh.normals[4], glm::vec3(-1.0f, 0.0f, 0.0f));
    ASSERT_EQ(mesh.indices[6], 4u);
    ASSERT_EQ(mesh.indices[7], 6u);
    ASSERT_EQ(mesh.indices[8], 5u);

    for (uint16_t material : mesh.materials) {
        ASSERT_EQ(material, 7);
    }
}

TEST(FullChunkYieldsSixQuads) {
    MeshBuffers scratch;
    ChunkMesh mesh = greedyMesh(makeSolidChunk(), scratch);

    ASSERT_EQ(quadCount(mesh), size_t(6));
    ASSERT_EQ(mesh.vertexCount(), size_t(24));
    ASSERT_EQ(mesh.indices.size(), size_t(36));

    const glm::vec3 normals[6] = {
        glm::vec3(1, 0, 0), glm::vec3(-1, 0, 0),
        glm::vec3(0, 1, 0), glm::vec3(0, -1, 0),
        glm::vec3(0, 0, 1), glm::vec3(0, 0, -1)
    };
    for (int face = 0; face < 6; face++) {
        ASSERT_EQ(mesh.normals[face * 4], normals[face]);
        ASSERT_EQ(faceNormal(static_cast<FaceDirection>(face)), normals[face]);
    }

    // Every vertex on the chunk's outer surface
    for (const glm::vec3& p : mesh.positions) {
        for (int axis = 0; axis < 3; axis++) {
            ASSERT_TRUE(p[axis] == 0.0f || p[axis] == 16.0f);
        }
    }
}

TEST(HeightfieldMeshIsValid) {
    MeshBuffers scratch;
    ChunkMesh mesh = greedyMesh(makeHeightfieldChunk(3), scratch);

    ASSERT_FALSE(mesh.isEmpty());
    ASSERT_TRUE(isValidMesh(mesh));
    ASSERT_EQ(mesh.indices.size() % 6, size_t(0));
    ASSERT_EQ(mesh.vertexCount(), quadCount(mesh) * 4);

    for (uint32_t index : mesh.indices) {
        ASSERT_LT(index, mesh.vertexCount());
    }
}

// ============================================================
// Test 3: Determinism
// ============================================================

TEST(MeshingIsDeterministic) {
    ChunkBuffer buffer = makeHeightfieldChunk(11);

    MeshBuffers scratchA;
    MeshBuffers scratchB;

    ChunkMesh first = greedyMesh(buffer, scratchA);
    // Dirty scratchA with another chunk before meshing again
    greedyMesh(makeCheckerboardChunkX(), scratchA);
    ChunkMesh second = greedyMesh(buffer, scratchA);
    ChunkMesh third = greedyMesh(buffer, scratchB);

    ASSERT_TRUE(first == second);
    ASSERT_TRUE(first == third);
}

// ============================================================
// Test 4: Material Boundaries
// ============================================================

TEST(CheckerboardDoesNotMerge) {
    MeshBuffers scratch;
    ChunkMesh mesh = greedyMesh(makeCheckerboardChunkX(), scratch);

    // +-X: only the outer layers are visible, each a single material
    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(1, 0, 0)), size_t(1));
    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(-1, 0, 0)), size_t(1));
    // +-Y and +-Z: one strip per X column
    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(0, 1, 0)), size_t(16));
    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(0, -1, 0)), size_t(16));
    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(0, 0, 1)), size_t(16));
    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(0, 0, -1)), size_t(16));

    ASSERT_EQ(quadCount(mesh), size_t(66));
    ASSERT_EQ(mesh.vertexCount(), size_t(264));
}

TEST(TwoLayerChunkSplitsByMaterial) {
    ChunkBuffer buffer;
    for (int z = 0; z < 16; z++) {
        for (int y = 0; y < 16; y++) {
            for (int x = 0; x < 16; x++) {
                buffer.setVoxel(x, y, z, Voxel(y < 8 ? 1 : 2));
            }
        }
    }

    MeshBuffers scratch;
    ChunkMesh mesh = greedyMesh(buffer, scratch);

    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(0, 1, 0)), size_t(1));
    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(0, -1, 0)), size_t(1));
    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(1, 0, 0)), size_t(2));
    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(0, 0, -1)), size_t(2));
    ASSERT_EQ(quadCount(mesh), size_t(10));

    // Top face carries the upper material, bottom face the lower one
    for (size_t i = 0; i < mesh.normals.size(); i++) {
        if (mesh.normals[i] == glm::vec3(0, 1, 0)) {
            ASSERT_EQ(mesh.materials[i], 2);
        } else if (mesh.normals[i] == glm::vec3(0, -1, 0)) {
            ASSERT_EQ(mesh.materials[i], 1);
        }
    }
}

// ============================================================
// Test 5: Winding
// ============================================================

TEST(TrianglesFaceOutward) {
    MeshBuffers scratch;
    ChunkMesh mesh = greedyMesh(makeHeightfieldChunk(5), scratch);

    for (size_t t = 0; t < mesh.indices.size(); t += 3) {
        const glm::vec3& a = mesh.positions[mesh.indices[t]];
        const glm::vec3& b = mesh.positions[mesh.indices[t + 1]];
        const glm::vec3& c = mesh.positions[mesh.indices[t + 2]];
        const glm::vec3 n = glm::cross(b - a, c - a);

        ASSERT_GT(glm::dot(n, mesh.normals[mesh.indices[t]]), 0.0f);
    }
}

// ============================================================
// Test 6: Padding Visibility
// ============================================================

TEST(SolidNeighborHidesBorderFaces) {
    ChunkBuffer buffer = makeSolidChunk();
    buffer.copyBorderFrom(0, true, makeSolidChunk(5));

    MeshBuffers scratch;
    ChunkMesh mesh = greedyMesh(buffer, scratch);

    ASSERT_EQ(quadsWithNormal(mesh, glm::vec3(1, 0, 0)), size_t(0));
    ASSERT_EQ(quadCount(mesh), size_t(5));
}

TEST(PaddingIsNeverMeshed) {
    ChunkBuffer buffer;
    buffer.copyBorderFrom(1, false, makeSolidChunk());

    MeshBuffers scratch;
    ChunkMesh mesh = greedyMesh(buffer, scratch);

    ASSERT_TRUE(mesh.isEmpty());
}

// ============================================================
// Test 7: Scales
// ============================================================

TEST(UnitAndTexelScalesApply) {
    MeshingParams params;
    params.unitScale = 0.5f;
    params.texelScale = 2.0f;

    MeshBuffers scratch;
    ChunkMesh mesh = greedyMesh(makeSolidChunk(), scratch, params);

    float maxCoord = 0.0f;
    for (const glm::vec3& p : mesh.positions) {
        maxCoord = std::max(maxCoord, std::max(p.x, std::max(p.y, p.z)));
    }
    ASSERT_NEAR(maxCoord, 8.0f, 1e-6f);

    // Corner offsets (0,0) (w,0) (w,h) (0,h) of a 16x16 quad
    ASSERT_EQ(mesh.uvs[0], glm::vec2(0.0f, 0.0f));
    ASSERT_EQ(mesh.uvs[1], glm::vec2(32.0f, 0.0f));
    ASSERT_EQ(mesh.uvs[2], glm::vec2(32.0f, 32.0f));
    ASSERT_EQ(mesh.uvs[3], glm::vec2(0.0f, 32.0f));
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
