/**
 * @file test_chunk_addressing.cpp
 * @brief Tests for voxel addressing, chunk coordinates and ChunkBuffer access
 *
 * Tests:
 * 1. linearize / delinearize are inverse over the padded volume
 * 2. Local coordinates map into the padded interior
 * 3. Out-of-range local access is ignored
 * 4. Border copies pick the touching layer of the neighbor
 * 5. ChunkCoord hashing, ordering and world origin
 */

#include "test_utils.h"
#include "chunk_shape.h"
#include "chunk_buffer.h"
#include "chunk_coord.h"
#include "voxel.h"

#include <set>
#include <unordered_set>

using ChunkShape::CHUNK_LENGTH;
using ChunkShape::PADDED_LENGTH;
using ChunkShape::PADDED_VOLUME;

// ============================================================
// Test 1: Linearization Bijection
// ============================================================

TEST(LinearizeIsBijective) {
    std::vector<bool> seen(PADDED_VOLUME, false);

    for (int z = 0; z < PADDED_LENGTH; z++) {
        for (int y = 0; y < PADDED_LENGTH; y++) {
            for (int x = 0; x < PADDED_LENGTH; x++) {
                const glm::ivec3 p(x, y, z);
                const size_t index = ChunkShape::linearize(p);
                ASSERT_LT(index, PADDED_VOLUME);
                ASSERT_FALSE(seen[index]);
                seen[index] = true;
                ASSERT_EQ(ChunkShape::delinearize(index), p);
            }
        }
    }

    for (bool hit : seen) {
        ASSERT_TRUE(hit);
    }
}

TEST(LinearizeLayout) {
    ASSERT_EQ(PADDED_LENGTH, 18);
    ASSERT_EQ(PADDED_VOLUME, size_t(18 * 18 * 18));
    ASSERT_EQ(ChunkShape::linearize(glm::ivec3(0, 0, 0)), size_t(0));
    ASSERT_EQ(ChunkShape::linearize(glm::ivec3(1, 0, 0)), size_t(1));
    ASSERT_EQ(ChunkShape::linearize(glm::ivec3(0, 1, 0)), size_t(18));
    ASSERT_EQ(ChunkShape::linearize(glm::ivec3(0, 0, 1)), size_t(324));
    ASSERT_EQ(ChunkShape::linearize(glm::ivec3(17, 17, 17)), PADDED_VOLUME - 1);
}

// ============================================================
// Test 2: Local -> Padded Mapping
// ============================================================

TEST(LocalToPaddedOffsetsByPadding) {
    ASSERT_EQ(ChunkShape::localToPadded(glm::ivec3(0, 0, 0)), glm::ivec3(1, 1, 1));
    ASSERT_EQ(ChunkShape::localToPadded(glm::ivec3(15, 15, 15)), glm::ivec3(16, 16, 16));

    ASSERT_TRUE(ChunkShape::isLocalInBounds(glm::ivec3(0, 0, 0)));
    ASSERT_TRUE(ChunkShape::isLocalInBounds(glm::ivec3(15, 15, 15)));
    ASSERT_FALSE(ChunkShape::isLocalInBounds(glm::ivec3(16, 0, 0)));
    ASSERT_FALSE(ChunkShape::isLocalInBounds(glm::ivec3(0, -1, 0)));

    ASSERT_TRUE(ChunkShape::isPaddedInBounds(glm::ivec3(17, 0, 17)));
    ASSERT_FALSE(ChunkShape::isPaddedInBounds(glm::ivec3(18, 0, 0)));
}

TEST(SetVoxelWritesInteriorCell) {
    ChunkBuffer buffer;
    buffer.setVoxel(3, 4, 5, Voxel(7));

    ASSERT_EQ(buffer.getVoxel(3, 4, 5), Voxel(7));
    ASSERT_EQ(buffer.getPaddedVoxel(glm::ivec3(4, 5, 6)), Voxel(7));
    ASSERT_EQ(buffer.countSolid(), size_t(1));
    ASSERT_FALSE(buffer.isEmpty());
}

// ============================================================
// Test 3: Out-of-range Access
// ============================================================

TEST(OutOfRangeLocalAccessIsIgnored) {
    ChunkBuffer buffer;

    buffer.setVoxel(-1, 0, 0, Voxel(5));
    buffer.setVoxel(0, CHUNK_LENGTH, 0, Voxel(5));
    buffer.setVoxel(0, 0, 100, Voxel(5));

    ASSERT_TRUE(buffer.isEmpty());
    ASSERT_TRUE(buffer.getVoxel(-1, 0, 0).isEmpty());
    ASSERT_TRUE(buffer.getVoxel(CHUNK_LENGTH, 0, 0).isEmpty());

    // Nothing leaked into the border either
    for (size_t i = 0; i < buffer.size(); i++) {
        ASSERT_TRUE(buffer.at(i).isEmpty());
    }
}

TEST(FillLeavesBorderEmpty) {
    ChunkBuffer buffer(Voxel(2));

    ASSERT_EQ(buffer.countSolid(), size_t(CHUNK_LENGTH * CHUNK_LENGTH * CHUNK_LENGTH));
    ASSERT_TRUE(buffer.getPaddedVoxel(glm::ivec3(0, 5, 5)).isEmpty());
    ASSERT_TRUE(buffer.getPaddedVoxel(glm::ivec3(17, 5, 5)).isEmpty());
    ASSERT_TRUE(buffer.getPaddedVoxel(glm::ivec3(5, 5, 0)).isEmpty());
    ASSERT_EQ(buffer.getPaddedVoxel(glm::ivec3(1, 1, 1)), Voxel(2));
}

// ============================================================
// Test 4: Border Copies
// ============================================================

TEST(CopyBorderFromPositiveNeighbor) {
    ChunkBuffer neighbor;
    // Neighbor's first interior X layer (local x = 0) is what touches our +X side
    neighbor.setVoxel(0, 2, 3, Voxel(9));
    neighbor.setVoxel(15, 2, 3, Voxel(4));

    ChunkBuffer buffer;
    buffer.copyBorderFrom(0, true, neighbor);

    ASSERT_EQ(buffer.getPaddedVoxel(glm::ivec3(PADDED_LENGTH - 1, 3, 4)), Voxel(9));
    ASSERT_TRUE(buffer.getPaddedVoxel(glm::ivec3(0, 3, 4)).isEmpty());
    ASSERT_TRUE(buffer.isEmpty());  // interior untouched
}

TEST(CopyBorderFromNegativeNeighbor) {
    ChunkBuffer neighbor;
    neighbor.setVoxel(6, 15, 1, Voxel(3));

    ChunkBuffer buffer;
    buffer.copyBorderFrom(1, false, neighbor);

    ASSERT_EQ(buffer.getPaddedVoxel(glm::ivec3(7, 0, 2)), Voxel(3));

    buffer.clearBorder();
    ASSERT_TRUE(buffer.getPaddedVoxel(glm::ivec3(7, 0, 2)).isEmpty());
}

// ============================================================
// Test 5: Chunk Coordinates
// ============================================================

TEST(ChunkCoordWorldOrigin) {
    ChunkCoord coord{1, 0, -2};
    ASSERT_EQ(coord.worldOrigin(), glm::ivec3(16, 0, -32));
}

TEST(ChunkCoordHashAndOrdering) {
    std::unordered_set<ChunkCoord> hashed;
    std::set<ChunkCoord> ordered;

    for (int x = -3; x <= 3; x++) {
        for (int y = -3; y <= 3; y++) {
            for (int z = -3; z <= 3; z++) {
                hashed.insert(ChunkCoord{x, y, z});
                ordered.insert(ChunkCoord{x, y, z});
            }
        }
    }

    ASSERT_EQ(hashed.size(), size_t(343));
    ASSERT_EQ(ordered.size(), size_t(343));
    const ChunkCoord member{-3, 2, 1};
    ASSERT_EQ(hashed.count(member), size_t(1));

    ASSERT_TRUE((ChunkCoord{0, 0, 1} < ChunkCoord{0, 1, 0}));
    ASSERT_TRUE((ChunkCoord{-1, 5, 5} < ChunkCoord{0, 0, 0}));
    ASSERT_FALSE((ChunkCoord{1, 1, 1} < ChunkCoord{1, 1, 1}));
}

TEST(ChunkBoundsScaleWithUnit) {
    ChunkBounds bounds = chunkBounds(ChunkCoord{1, -1, 0}, 0.5f);
    ASSERT_EQ(bounds.min, glm::vec3(8.0f, -8.0f, 0.0f));
    ASSERT_EQ(bounds.max, glm::vec3(16.0f, 0.0f, 8.0f));
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
