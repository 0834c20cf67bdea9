/**
 * @file terrain_generator.h
 * @brief Chunk block data sources used by the world
 */

#pragma once

#include "block.h"
#include "chunk_data.h"
#include "world_utils.h"
#include <memory>
#include <optional>

class FastNoiseLite;

/**
 * @brief Produces the initial blocks of a chunk
 *
 * Implementations must be pure functions of the chunk coordinate (and their
 * own construction parameters). They never look at neighbouring chunks.
 */
class TerrainGenerator {
public:
    virtual ~TerrainGenerator() = default;

    /**
     * @brief Generates block data for one chunk
     * @return Block data, or std::nullopt when there is nothing to create here
     */
    virtual std::optional<ChunkData> generateChunk(const ChunkCoord& coord) const = 0;
};

/**
 * @brief Height-field terrain from two FastNoiseLite layers
 *
 * height(x, z) = fbm(x, z) * 64 + ridged(x, z) * 128, with the FBm layer at
 * frequency 0.001 and the ridged layer at 0.0005. Every cell at or below the
 * height is filled:
 * - the top 5 layers are Snow above Y = 85; otherwise the surface is
 *   SnowGrass above Y = 64 or Grass, with Dirt beneath
 * - everything deeper is Stone
 */
class NoiseTerrainGenerator : public TerrainGenerator {
public:
    explicit NoiseTerrainGenerator(int seed);
    ~NoiseTerrainGenerator() override;

    std::optional<ChunkData> generateChunk(const ChunkCoord& coord) const override;

    /// Surface height of a global block column
    int heightAt(int worldX, int worldZ) const;

    /// Block placed at global height `y` in a column whose surface is `height`
    static Block layerBlock(int y, int height);

    int seed() const { return m_seed; }

private:
    int m_seed;
    std::unique_ptr<FastNoiseLite> m_fbm;      ///< Rolling hills
    std::unique_ptr<FastNoiseLite> m_ridged;   ///< Mountain ridges
};

/**
 * @brief Flat terrain: `block` at every global Y <= topY, air above
 */
class FlatTerrainGenerator : public TerrainGenerator {
public:
    explicit FlatTerrainGenerator(int topY, Block block = Block(BlockId::STONE))
        : m_topY(topY), m_block(block) {}

    std::optional<ChunkData> generateChunk(const ChunkCoord& coord) const override;

    int topY() const { return m_topY; }

private:
    int m_topY;
    Block m_block;
};
