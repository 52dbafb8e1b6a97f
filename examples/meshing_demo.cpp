/**
 * @file meshing_demo.cpp
 * @brief Minimal host driving the chunk mesh scheduler
 *
 * Generates a small terrain region, lets the scheduler mesh it under the frame
 * budget, edits one chunk and remeshes it, then unloads a chunk.
 *
 * Usage:
 *   meshing_demo [config.yaml]
 */

#include "chunk_buffer.h"
#include "chunk_mesh_scheduler.h"
#include "logger.h"
#include "mesh_buffer_pool.h"
#include "mesh_worker_pool.h"
#include "meshing_config.h"
#include "voxel_map.h"

#include <cmath>
#include <cstdint>
#include <unordered_map>

namespace {

constexpr int REGION_CHUNKS_XZ = 4;
constexpr int REGION_CHUNKS_Y = 2;

/**
 * @brief Stand-in for a GPU mesh store: keeps per-chunk vertex counts
 */
class DemoMeshStore : public ChunkMeshSink {
public:
    void prepareChunk(const ChunkCoord& coord, const ChunkBounds& bounds) override {
        m_vertexCounts[coord] = 0;
        Logger::debug() << "Prepared chunk (" << coord.x << ", " << coord.y << ", " << coord.z
                        << ") at [" << bounds.min.x << ", " << bounds.min.y << ", " << bounds.min.z << "]";
    }

    void applyMesh(const ChunkCoord& coord, ChunkMesh&& mesh) override {
        m_vertexCounts[coord] = mesh.vertexCount();
        m_uploads++;
    }

    void forget(const ChunkCoord& coord) { m_vertexCounts.erase(coord); }

    size_t uploads() const { return m_uploads; }

    size_t totalVertices() const {
        size_t total = 0;
        for (const auto& [coord, count] : m_vertexCounts) {
            total += count;
        }
        return total;
    }

private:
    std::unordered_map<ChunkCoord, size_t> m_vertexCounts;
    size_t m_uploads = 0;
};

/// Rolling hills in world voxel units
int terrainHeight(int worldX, int worldZ) {
    const float h = 12.0f + 6.0f * std::sin(worldX * 0.15f) + 5.0f * std::cos(worldZ * 0.11f);
    return static_cast<int>(h);
}

ChunkBuffer generateChunk(const ChunkCoord& coord) {
    ChunkBuffer buffer;
    const glm::ivec3 origin = coord.worldOrigin();

    for (int z = 0; z < ChunkShape::CHUNK_LENGTH; z++) {
        for (int x = 0; x < ChunkShape::CHUNK_LENGTH; x++) {
            const int height = terrainHeight(origin.x + x, origin.z + z);
            for (int y = 0; y < ChunkShape::CHUNK_LENGTH; y++) {
                const int worldY = origin.y + y;
                if (worldY >= height) {
                    break;
                }
                uint16_t material = 1;                      // stone
                if (worldY == height - 1) material = 3;     // grass
                else if (worldY >= height - 3) material = 2; // dirt
                buffer.setVoxel(x, y, z, Voxel(material));
            }
        }
    }
    return buffer;
}

/// Copies the touching layers of every generated neighbor into the padding
void fillBorders(const ChunkCoord& coord, ChunkBuffer& buffer,
                 const std::unordered_map<ChunkCoord, ChunkBuffer>& generated) {
    for (int axis = 0; axis < 3; axis++) {
        for (int side = 0; side < 2; side++) {
            const bool positive = (side == 0);
            ChunkCoord neighbor = coord;
            int* component = (axis == 0) ? &neighbor.x : (axis == 1) ? &neighbor.y : &neighbor.z;
            *component += positive ? 1 : -1;

            auto it = generated.find(neighbor);
            if (it != generated.end()) {
                buffer.copyBorderFrom(axis, positive, it->second);
            }
        }
    }
}

size_t tickUntilIdle(ChunkMeshScheduler& scheduler) {
    size_t ticks = 0;
    while (scheduler.dirtyCount() > 0) {
        const size_t applied = scheduler.tick();
        ticks++;
        Logger::info() << "Tick " << ticks << ": " << applied << " meshes applied, "
                       << scheduler.dirtyCount() << " chunks still dirty";
    }
    return ticks;
}

} // namespace

int main(int argc, char** argv) {
    MeshingConfig config;
    if (argc > 1 && !config.loadFromFile(argv[1])) {
        Logger::error() << "Could not load meshing config: " << argv[1];
        return 1;
    }
    config.apply();

    VoxelMap map;
    DemoMeshStore store;
    MeshWorkerPool workers(config.workerThreads());
    MeshBufferPool scratch(workers.workerCount());

    try {
        ChunkMeshScheduler scheduler(map, workers, scratch, store, config.schedulerSettings());

        // Generate the region, then pad each chunk from its neighbors
        std::unordered_map<ChunkCoord, ChunkBuffer> generated;
        for (int cx = 0; cx < REGION_CHUNKS_XZ; cx++) {
            for (int cy = 0; cy < REGION_CHUNKS_Y; cy++) {
                for (int cz = 0; cz < REGION_CHUNKS_XZ; cz++) {
                    const ChunkCoord coord{cx, cy, cz};
                    generated.emplace(coord, generateChunk(coord));
                }
            }
        }

        for (const auto& [coord, buffer] : generated) {
            ChunkBuffer padded = buffer;
            fillBorders(coord, padded, generated);
            map.insert(coord, std::move(padded));
            scheduler.onChunkAdded(coord);
        }

        Logger::info() << "Loaded " << map.size() << " chunks, meshing with budget "
                       << scheduler.frameBudget() << " on " << workers.workerCount() << " workers";

        tickUntilIdle(scheduler);
        Logger::info() << "Initial meshing done: " << store.totalVertices() << " vertices";

        // Dig a pit in the middle of one chunk
        const ChunkCoord edited{1, 0, 1};
        const bool dug = map.mutate(edited, [](ChunkBuffer& buffer) {
            for (int y = 4; y < 12; y++) {
                for (int z = 6; z < 10; z++) {
                    for (int x = 6; x < 10; x++) {
                        buffer.setVoxel(x, y, z, Voxel::empty());
                    }
                }
            }
        });
        if (dug) {
            scheduler.onUpdate(edited);
            tickUntilIdle(scheduler);
            Logger::info() << "After edit: " << store.totalVertices() << " vertices";
        }

        // Unload a corner chunk
        const ChunkCoord unloaded{0, 1, 0};
        scheduler.onChunkRemoved(unloaded);
        if (map.remove(unloaded)) {
            store.forget(unloaded);
        }

        const MeshingStats stats = scheduler.getStats();
        Logger::info() << "Stats: " << stats.ticks << " ticks, " << stats.chunksMeshed << " meshed, "
                       << stats.meshesApplied << " applied, " << stats.chunksSkipped << " skipped, "
                       << stats.resultsDiscarded << " discarded, " << stats.verticesEmitted
                       << " vertices emitted, last tick " << stats.lastTickMs << " ms";
        Logger::info() << "Mesh store received " << store.uploads() << " uploads, holds "
                       << store.totalVertices() << " vertices for " << map.size() << " chunks";
    } catch (const std::exception& e) {
        Logger::error() << "Meshing demo failed: " << e.what();
        return 1;
    }

    return 0;
}
