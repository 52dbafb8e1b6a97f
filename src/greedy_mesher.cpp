/**
 * @file greedy_mesher.cpp
 * @brief Slice-by-slice greedy meshing with face culling
 */

#include "greedy_mesher.h"
#include "chunk_shape.h"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <vector>

using ChunkShape::CHUNK_LENGTH;
using ChunkShape::PADDING;

namespace {

struct FaceAxes {
    int axis;       ///< Axis the face points along
    int u;          ///< First in-slice axis
    int v;          ///< Second in-slice axis
    int step;       ///< +1 or -1 along axis
};

FaceAxes faceAxes(uint8_t face) {
    FaceAxes axes;
    axes.axis = face / 2;
    axes.u = (axes.axis + 1) % 3;
    axes.v = (axes.axis + 2) % 3;
    axes.step = (face % 2 == 0) ? 1 : -1;
    return axes;
}

inline size_t maskIndex(int u, int v) {
    return static_cast<size_t>(u) + static_cast<size_t>(v) * CHUNK_LENGTH;
}

/**
 * Fills scratch.faceMask for one slice. Returns false if the slice has no
 * visible face at all, letting the caller skip the merge pass.
 */
bool buildFaceMask(const ChunkBuffer& buffer, const FaceAxes& axes, int slice,
                   std::vector<uint16_t>& mask) {
    bool anyFace = false;

    glm::ivec3 cell(0);
    cell[axes.axis] = slice + PADDING;

    for (int v = 0; v < CHUNK_LENGTH; ++v) {
        cell[axes.v] = v + PADDING;
        for (int u = 0; u < CHUNK_LENGTH; ++u) {
            cell[axes.u] = u + PADDING;

            const Voxel voxel = buffer.getPaddedVoxel(cell);
            uint16_t maskValue = Voxel::EMPTY_MATERIAL;

            if (!voxel.isEmpty()) {
                glm::ivec3 neighbor = cell;
                neighbor[axes.axis] += axes.step;
                if (buffer.getPaddedVoxel(neighbor).isEmpty()) {
                    maskValue = voxel.material;
                    anyFace = true;
                }
            }

            mask[maskIndex(u, v)] = maskValue;
        }
    }

    return anyFace;
}

/**
 * Merges the current face mask into rectangles and appends them to
 * scratch.quads. Width grows first (along u), then height (along v) while the
 * whole next row still matches.
 */
void mergeSlice(uint8_t face, int slice, MeshBuffers& scratch) {
    std::vector<uint16_t>& mask = scratch.faceMask;
    std::vector<uint8_t>& visited = scratch.visited;

    std::fill(visited.begin(), visited.end(), 0);

    for (int v = 0; v < CHUNK_LENGTH; ++v) {
        for (int u = 0; u < CHUNK_LENGTH; ++u) {
            const size_t start = maskIndex(u, v);
            const uint16_t material = mask[start];
            if (material == Voxel::EMPTY_MATERIAL || visited[start]) {
                continue;
            }

            int width = 1;
            while (u + width < CHUNK_LENGTH) {
                const size_t idx = maskIndex(u + width, v);
                if (mask[idx] != material || visited[idx]) {
                    break;
                }
                ++width;
            }

            int height = 1;
            while (v + height < CHUNK_LENGTH) {
                bool rowMatches = true;
                for (int du = 0; du < width; ++du) {
                    const size_t idx = maskIndex(u + du, v + height);
                    if (mask[idx] != material || visited[idx]) {
                        rowMatches = false;
                        break;
                    }
                }
                if (!rowMatches) {
                    break;
                }
                ++height;
            }

            for (int dv = 0; dv < height; ++dv) {
                for (int du = 0; du < width; ++du) {
                    visited[maskIndex(u + du, v + dv)] = 1;
                }
            }

            GreedyQuad quad;
            quad.face = face;
            quad.slice = slice;
            quad.u = u;
            quad.v = v;
            quad.width = width;
            quad.height = height;
            quad.material = material;
            scratch.quads.push_back(quad);

            u += width - 1;
        }
    }
}

/**
 * Expands one quad into 4 vertices and 6 indices.
 *
 * Corners go origin, +u, +u+v, +v. Since u x v points along +axis, that order
 * is counter-clockwise seen from a +axis face; -axis faces use the reversed
 * triangle order so every face is counter-clockwise from outside.
 */
void emitQuad(const GreedyQuad& quad, const MeshingParams& params, ChunkMesh& mesh) {
    const FaceAxes axes = faceAxes(quad.face);

    // + faces sit on the far side of their cell, - faces on the near side
    const int plane = (axes.step > 0) ? quad.slice + 1 : quad.slice;

    glm::ivec3 origin(0);
    origin[axes.axis] = plane;
    origin[axes.u] = quad.u;
    origin[axes.v] = quad.v;

    glm::ivec3 du(0);
    du[axes.u] = quad.width;
    glm::ivec3 dv(0);
    dv[axes.v] = quad.height;

    const glm::ivec3 corners[4] = {origin, origin + du, origin + du + dv, origin + dv};

    const float w = static_cast<float>(quad.width) * params.texelScale;
    const float h = static_cast<float>(quad.height) * params.texelScale;
    const glm::vec2 cornerUVs[4] = {
        glm::vec2(0.0f, 0.0f),
        glm::vec2(w, 0.0f),
        glm::vec2(w, h),
        glm::vec2(0.0f, h)
    };

    const glm::vec3 normal = faceNormal(static_cast<FaceDirection>(quad.face));
    const uint32_t base = static_cast<uint32_t>(mesh.positions.size());

    for (int i = 0; i < 4; ++i) {
        mesh.positions.push_back(glm::vec3(corners[i]) * params.unitScale);
        mesh.normals.push_back(normal);
        mesh.uvs.push_back(cornerUVs[i]);
        mesh.materials.push_back(quad.material);
    }

    if (axes.step > 0) {
        mesh.indices.insert(mesh.indices.end(), {base + 0, base + 1, base + 2, base + 0, base + 2, base + 3});
    } else {
        mesh.indices.insert(mesh.indices.end(), {base + 0, base + 2, base + 1, base + 0, base + 3, base + 2});
    }
}

} // namespace

glm::vec3 faceNormal(FaceDirection face) {
    switch (face) {
        case FaceDirection::POS_X: return glm::vec3( 1.0f,  0.0f,  0.0f);
        case FaceDirection::NEG_X: return glm::vec3(-1.0f,  0.0f,  0.0f);
        case FaceDirection::POS_Y: return glm::vec3( 0.0f,  1.0f,  0.0f);
        case FaceDirection::NEG_Y: return glm::vec3( 0.0f, -1.0f,  0.0f);
        case FaceDirection::POS_Z: return glm::vec3( 0.0f,  0.0f,  1.0f);
        case FaceDirection::NEG_Z: return glm::vec3( 0.0f,  0.0f, -1.0f);
    }
    return glm::vec3(0.0f);
}

void greedyMesh(const ChunkBuffer& buffer, MeshBuffers& scratch, ChunkMesh& out,
                const MeshingParams& params) {
    scratch.reset();

    for (uint8_t face = 0; face < FACE_DIRECTION_COUNT; ++face) {
        const FaceAxes axes = faceAxes(face);
        for (int slice = 0; slice < CHUNK_LENGTH; ++slice) {
            if (!buildFaceMask(buffer, axes, slice, scratch.faceMask)) {
                continue;
            }
            mergeSlice(face, slice, scratch);
        }
    }

    ChunkMesh& acc = scratch.accumulator;
    for (const GreedyQuad& quad : scratch.quads) {
        emitQuad(quad, params, acc);
    }

    assert(isValidMesh(acc) && "greedy mesher produced a malformed mesh");
    assert(acc.indices.size() == scratch.quads.size() * 6);

    // Copy out so the accumulator keeps its capacity for the next call
    out.positions.assign(acc.positions.begin(), acc.positions.end());
    out.normals.assign(acc.normals.begin(), acc.normals.end());
    out.uvs.assign(acc.uvs.begin(), acc.uvs.end());
    out.materials.assign(acc.materials.begin(), acc.materials.end());
    out.indices.assign(acc.indices.begin(), acc.indices.end());
}

ChunkMesh greedyMesh(const ChunkBuffer& buffer, MeshBuffers& scratch, const MeshingParams& params) {
    ChunkMesh mesh;
    greedyMesh(buffer, scratch, mesh, params);
    return mesh;
}
