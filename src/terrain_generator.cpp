#include "terrain_generator.h"
#include "FastNoiseLite.h"
#include <algorithm>

// ========== NoiseTerrainGenerator ==========

NoiseTerrainGenerator::NoiseTerrainGenerator(int seed)
    : m_seed(seed),
      m_fbm(std::make_unique<FastNoiseLite>(seed)),
      m_ridged(std::make_unique<FastNoiseLite>(seed)) {
    m_fbm->SetNoiseType(FastNoiseLite::NoiseType_Perlin);
    m_fbm->SetFractalType(FastNoiseLite::FractalType_FBm);
    m_fbm->SetFrequency(0.001f);

    m_ridged->SetNoiseType(FastNoiseLite::NoiseType_Perlin);
    m_ridged->SetFractalType(FastNoiseLite::FractalType_Ridged);
    m_ridged->SetFrequency(0.0005f);
}

NoiseTerrainGenerator::~NoiseTerrainGenerator() = default;

int NoiseTerrainGenerator::heightAt(int worldX, int worldZ) const {
    float x = static_cast<float>(worldX);
    float z = static_cast<float>(worldZ);
    float hills = m_fbm->GetNoise(x, z) * 64.0f;
    float ridges = m_ridged->GetNoise(x, z) * 128.0f;
    return static_cast<int>(hills + ridges);
}

Block NoiseTerrainGenerator::layerBlock(int y, int height) {
    if (y > height - 5) {
        if (y > 85) {
            return Block(BlockId::SNOW);
        }
        if (y == height) {
            return Block(y > 64 ? BlockId::SNOW_GRASS : BlockId::GRASS);
        }
        return Block(BlockId::DIRT);
    }
    return Block(BlockId::STONE);
}

std::optional<ChunkData> NoiseTerrainGenerator::generateChunk(const ChunkCoord& coord) const {
    ChunkData data;
    const glm::ivec3 origin = coord.toVec() * chunkSize();

    for (int z = 0; z < ChunkData::SIZE_Z; ++z) {
        for (int x = 0; x < ChunkData::SIZE_X; ++x) {
            int height = heightAt(origin.x + x, origin.z + z);
            for (int y = 0; y < ChunkData::SIZE_Y; ++y) {
                int worldY = origin.y + y;
                if (worldY > height) {
                    break;
                }
                data.setBlock(x, y, z, layerBlock(worldY, height));
            }
        }
    }

    return data;
}

// ========== FlatTerrainGenerator ==========

std::optional<ChunkData> FlatTerrainGenerator::generateChunk(const ChunkCoord& coord) const {
    ChunkData data;
    const int baseY = coord.y * ChunkData::SIZE_Y;

    // Whole chunk below the surface
    if (baseY + ChunkData::SIZE_Y - 1 <= m_topY) {
        data.fill(m_block);
        return data;
    }

    int localTop = std::min(m_topY - baseY, ChunkData::SIZE_Y - 1);
    for (int y = 0; y <= localTop; ++y) {
        for (int z = 0; z < ChunkData::SIZE_Z; ++z) {
            for (int x = 0; x < ChunkData::SIZE_X; ++x) {
                data.setBlock(x, y, z, m_block);
            }
        }
    }
    return data;
}
