/**
 * @file voxel.h
 * @brief The smallest unit of the voxel world: one cell's material
 */

#pragma once

#include <cstdint>

/**
 * @brief Material identity of a single chunk cell
 *
 * Material 0 is reserved for empty space. Empty cells produce no geometry and
 * never hide a neighbor's face.
 */
struct Voxel {
    static constexpr uint16_t EMPTY_MATERIAL = 0;

    uint16_t material = EMPTY_MATERIAL;

    constexpr Voxel() = default;
    constexpr explicit Voxel(uint16_t mat) : material(mat) {}

    static constexpr Voxel empty() { return Voxel(); }

    constexpr bool isEmpty() const { return material == EMPTY_MATERIAL; }

    constexpr bool operator==(const Voxel& other) const { return material == other.material; }
    constexpr bool operator!=(const Voxel& other) const { return material != other.material; }
};

static_assert(sizeof(Voxel) == 2, "Voxel must stay a packed 16-bit value");
