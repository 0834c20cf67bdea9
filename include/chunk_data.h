/**
 * @file chunk_data.h
 * @brief Dense block storage for one chunk
 */

#pragma once

#include "block.h"
#include "world_constants.h"
#include <glm/glm.hpp>
#include <cstddef>
#include <optional>
#include <vector>

/**
 * @brief Fixed-size 3D block array
 *
 * Layout is y-major: offset = y * (SZ * SX) + z * SX + x. Every lookup is
 * bounds-checked; an out-of-range coordinate means "this cell belongs to a
 * neighbouring chunk" and is reported as std::nullopt, never as an error.
 */
class ChunkData {
public:
    static constexpr int SIZE_X = WorldConstants::CHUNK_SIZE_X;
    static constexpr int SIZE_Y = WorldConstants::CHUNK_SIZE_Y;
    static constexpr int SIZE_Z = WorldConstants::CHUNK_SIZE_Z;
    static constexpr int VOLUME = WorldConstants::CHUNK_VOLUME;

    /// All air
    ChunkData();

    /**
     * @brief Maps a local coordinate to its array offset
     * @return Offset, or std::nullopt if any axis is outside [0, size)
     */
    static std::optional<size_t> coordsToOffset(const glm::ivec3& local);

    /**
     * @brief Inverse of coordsToOffset for offsets in [0, VOLUME)
     */
    static glm::ivec3 offsetToCoords(size_t offset);

    static bool inBounds(const glm::ivec3& local) {
        return local.x >= 0 && local.x < SIZE_X &&
               local.y >= 0 && local.y < SIZE_Y &&
               local.z >= 0 && local.z < SIZE_Z;
    }

    /**
     * @brief Block at a local coordinate
     * @return The block, or std::nullopt when out of range
     */
    std::optional<Block> getBlock(const glm::ivec3& local) const;

    std::optional<Block> getBlock(int x, int y, int z) const { return getBlock(glm::ivec3(x, y, z)); }

    /**
     * @brief Stores a block; out-of-range coordinates are ignored
     */
    void setBlock(const glm::ivec3& local, const Block& block);

    void setBlock(int x, int y, int z, const Block& block) { setBlock(glm::ivec3(x, y, z), block); }

    void fill(const Block& block);

    /// Number of cells holding something other than air
    size_t countNonAir() const;

    const Block& at(size_t offset) const { return m_blocks[offset]; }

    bool operator==(const ChunkData& other) const { return m_blocks == other.m_blocks; }

private:
    std::vector<Block> m_blocks;  ///< VOLUME entries in y/z/x order
};
