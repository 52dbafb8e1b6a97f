/**
 * @file greedy_mesher.h
 * @brief Greedy face-merging mesher for one padded chunk buffer
 *
 * Face culling: a face is emitted only where a non-empty cell touches an empty
 * cell (the touching cell may be in the padding border).
 * Greedy merging: within each slice, visible faces of the same material are
 * merged into maximal rectangles, one quad each.
 *
 * Output ordering is canonical, so the same buffer always yields the same mesh:
 * faces +X, -X, +Y, -Y, +Z, -Z; slices ascending along the face axis; quads in
 * the order their first cell is reached scanning rows (v) then columns (u).
 * The in-slice axes of face axis A are u = (A + 1) % 3 and v = (A + 2) % 3.
 */

#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include "chunk_buffer.h"
#include "chunk_mesh.h"
#include "mesh_buffer_pool.h"

/**
 * @brief The six axis-aligned face directions, in meshing order
 */
enum class FaceDirection : uint8_t {
    POS_X = 0,
    NEG_X = 1,
    POS_Y = 2,
    NEG_Y = 3,
    POS_Z = 4,
    NEG_Z = 5
};

constexpr int FACE_DIRECTION_COUNT = 6;

/**
 * @brief Outward unit normal of a face direction
 */
glm::vec3 faceNormal(FaceDirection face);

/**
 * @brief Caller-supplied scales applied to emitted vertices
 */
struct MeshingParams {
    float unitScale = 1.0f;    ///< World units per voxel, applied to every position
    float texelScale = 1.0f;   ///< UV units per voxel of quad extent
};

/**
 * @brief Meshes one chunk buffer into @p out
 *
 * @param buffer Padded voxel buffer (read only; must not change during the call)
 * @param scratch Worker-owned scratch memory, reset at the start of the call
 * @param out Receives the mesh; previous contents are replaced
 * @param params Position and UV scales
 */
void greedyMesh(const ChunkBuffer& buffer, MeshBuffers& scratch, ChunkMesh& out,
                const MeshingParams& params = MeshingParams{});

/**
 * @brief Convenience overload returning the mesh by value
 */
ChunkMesh greedyMesh(const ChunkBuffer& buffer, MeshBuffers& scratch,
                     const MeshingParams& params = MeshingParams{});
