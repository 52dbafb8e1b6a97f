/**
 * @file test_mesh_buffer_pool.cpp
 * @brief Tests for per-worker mesher scratch reuse
 *
 * Reused scratch memory must never leak state from one meshing call into the
 * next: 1000 calls over a rotating set of chunks through one MeshBuffers must
 * match meshes built with fresh scratch every time.
 */

#include "test_utils.h"
#include "mesh_buffer_pool.h"
#include "greedy_mesher.h"

#include <vector>

TEST(ReusedScratchMatchesFreshScratch) {
    std::vector<ChunkBuffer> chunks;
    chunks.push_back(makeSolidChunk(2));
    chunks.push_back(ChunkBuffer());
    chunks.push_back(makeCheckerboardChunkX());
    for (int seed = 0; seed < 5; seed++) {
        chunks.push_back(makeHeightfieldChunk(seed));
    }

    // Reference meshes, each from its own scratch
    std::vector<ChunkMesh> expected;
    for (const auto& chunk : chunks) {
        MeshBuffers fresh;
        expected.push_back(greedyMesh(chunk, fresh));
    }

    MeshBufferPool pool(1);
    MeshBuffers& reused = pool.buffersFor(0);
    ChunkMesh mesh;

    {
        ScopedTimer timer("1000 meshing calls on reused scratch");
        for (int i = 0; i < 1000; i++) {
            const size_t which = static_cast<size_t>(i * 7) % chunks.size();
            greedyMesh(chunks[which], reused, mesh);
            ASSERT_TRUE(mesh == expected[which]);
        }
    }

    auto [sets, uses] = pool.getPoolStats();
    ASSERT_EQ(sets, size_t(1));
    ASSERT_EQ(uses, size_t(1000));
}

TEST(ResetClearsButKeepsCapacity) {
    MeshBuffers scratch;
    greedyMesh(makeCheckerboardChunkX(), scratch);

    ASSERT_FALSE(scratch.quads.empty());
    const size_t quadCapacity = scratch.quads.capacity();
    const size_t indexCapacity = scratch.accumulator.indices.capacity();

    scratch.reset();

    ASSERT_TRUE(scratch.quads.empty());
    ASSERT_TRUE(scratch.accumulator.isEmpty());
    ASSERT_EQ(scratch.quads.capacity(), quadCapacity);
    ASSERT_EQ(scratch.accumulator.indices.capacity(), indexCapacity);
    ASSERT_EQ(scratch.faceMask.size(), size_t(256));
    for (uint16_t cell : scratch.faceMask) {
        ASSERT_EQ(cell, 0);
    }
    for (uint8_t cell : scratch.visited) {
        ASSERT_EQ(cell, 0);
    }
}

TEST(PoolHandsOutOneSetPerWorker) {
    MeshBufferPool pool(4);
    ASSERT_EQ(pool.size(), size_t(4));

    MeshBuffers* first = &pool.buffersFor(0);
    for (size_t i = 1; i < pool.size(); i++) {
        ASSERT_NE(&pool.buffersFor(i), first);
    }

    // Same index, same instance
    ASSERT_EQ(&pool.buffersFor(2), &pool.buffersFor(2));
}

TEST(OutOfRangeWorkerIndexThrows) {
    MeshBufferPool pool(2);
    ASSERT_THROWS(pool.buffersFor(2), std::out_of_range);
    ASSERT_THROWS(pool.buffersFor(100), std::out_of_range);
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
