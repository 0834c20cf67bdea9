/**
 * @file world_utils.h
 * @brief Chunk coordinates and world <-> chunk/local conversions
 *
 */

#pragma once

#include "world_constants.h"
#include <glm/glm.hpp>
#include <cmath>
#include <cstddef>
#include <functional>

/**
 * @brief Integer position of a chunk in the chunk grid
 *
 * One unit is one chunk extent, so chunk (1, 0, 0) starts at global block X = 32.
 */
struct ChunkCoord {
    int x = 0;
    int y = 0;
    int z = 0;

    ChunkCoord() = default;
    ChunkCoord(int x_, int y_, int z_) : x(x_), y(y_), z(z_) {}
    explicit ChunkCoord(const glm::ivec3& v) : x(v.x), y(v.y), z(v.z) {}

    glm::ivec3 toVec() const { return glm::ivec3(x, y, z); }

    ChunkCoord offset(const glm::ivec3& d) const { return ChunkCoord(x + d.x, y + d.y, z + d.z); }

    /// Squared distance in chunk units
    int distanceSquared(const ChunkCoord& other) const {
        int dx = x - other.x;
        int dy = y - other.y;
        int dz = z - other.z;
        return dx * dx + dy * dy + dz * dz;
    }

    bool operator==(const ChunkCoord& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const ChunkCoord& other) const { return !(*this == other); }

    /// Lexicographic order, used to keep iteration deterministic where needed
    bool operator<(const ChunkCoord& other) const {
        if (x != other.x) return x < other.x;
        if (y != other.y) return y < other.y;
        return z < other.z;
    }
};

namespace std {
    template<>
    struct hash<ChunkCoord> {
        size_t operator()(const ChunkCoord& coord) const {
            size_t h1 = hash<int>()(coord.x);
            size_t h2 = hash<int>()(coord.y);
            size_t h3 = hash<int>()(coord.z);
            return h1 ^ (h2 << 1) ^ (h3 << 2);
        }
    };
}

// ========== Integer helpers ==========

/// Division rounding toward negative infinity
inline int floorDiv(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        q--;
    }
    return q;
}

/// Modulo with the sign of the divisor, so floorMod(-1, 32) == 31
inline int floorMod(int a, int b) {
    int r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) {
        r += b;
    }
    return r;
}

inline glm::ivec3 chunkSize() {
    return glm::ivec3(WorldConstants::CHUNK_SIZE_X, WorldConstants::CHUNK_SIZE_Y, WorldConstants::CHUNK_SIZE_Z);
}

// ========== Global block coordinates ==========

/**
 * @brief Chunk containing a global block coordinate
 */
inline ChunkCoord globalToChunk(const glm::ivec3& global) {
    return ChunkCoord(floorDiv(global.x, WorldConstants::CHUNK_SIZE_X),
                      floorDiv(global.y, WorldConstants::CHUNK_SIZE_Y),
                      floorDiv(global.z, WorldConstants::CHUNK_SIZE_Z));
}

/**
 * @brief Position of a global block inside its chunk, each axis in [0, size)
 */
inline glm::ivec3 globalToLocal(const glm::ivec3& global) {
    return glm::ivec3(floorMod(global.x, WorldConstants::CHUNK_SIZE_X),
                      floorMod(global.y, WorldConstants::CHUNK_SIZE_Y),
                      floorMod(global.z, WorldConstants::CHUNK_SIZE_Z));
}

/**
 * @brief Inverse of globalToChunk/globalToLocal
 */
inline glm::ivec3 chunkLocalToGlobal(const ChunkCoord& chunk, const glm::ivec3& local) {
    return chunk.toVec() * chunkSize() + local;
}

// ========== World (continuous) coordinates ==========

/// Largest world coordinate magnitude accepted for block lookups (2^30)
constexpr float WORLD_COORD_LIMIT = 1073741824.0f;

/**
 * @brief True when every component is finite and within WORLD_COORD_LIMIT
 *
 * worldToGlobal is only defined for such positions.
 */
inline bool isValidWorldPosition(const glm::vec3& world) {
    for (int i = 0; i < 3; ++i) {
        if (!std::isfinite(world[i]) || std::fabs(world[i]) >= WORLD_COORD_LIMIT) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Global block that contains a world position
 *
 * Block centers sit on integer coordinates, so a block spans [b - 0.5, b + 0.5)
 * on each axis and the position is rounded rather than floored.
 * Callers check isValidWorldPosition first.
 */
inline glm::ivec3 worldToGlobal(const glm::vec3& world) {
    return glm::ivec3(static_cast<int>(std::round(world.x)),
                      static_cast<int>(std::round(world.y)),
                      static_cast<int>(std::round(world.z)));
}

/**
 * @brief Chunk containing a world position
 *
 * Uses floor division so that world x = -1.0 lands in chunk -1, not chunk 0.
 */
inline ChunkCoord worldToChunk(const glm::vec3& world) {
    return globalToChunk(worldToGlobal(world));
}

/**
 * @brief Local block coordinate of a world position inside its chunk
 *
 * world x = -1.0 gives local x = 31 with 32-wide chunks.
 */
inline glm::ivec3 worldToLocal(const glm::vec3& world) {
    return globalToLocal(worldToGlobal(world));
}
