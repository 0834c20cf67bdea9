/**
 * @file block_storage_test.cpp
 * @brief Tests for block ids, chunk storage and coordinate conversion
 *
 * Tests:
 * 1. Offset layout is y-major and invertible
 * 2. Bounds checks on get/set
 * 3. Fill and non-air counting
 * 4. Solidity of known and unknown ids
 * 5. Block id names and raw id parsing
 * 6. Global/chunk/local conversion round trip
 * 7. Negative coordinates floor toward negative infinity
 * 8. World positions round to the nearest block center
 */

#include "test_utils.h"
#include "block.h"
#include "chunk_data.h"
#include "world_utils.h"

// ============================================================
// Test 1: Offset Layout
// ============================================================

TEST(offset_layout_is_y_major) {
    ASSERT_EQ(*ChunkData::coordsToOffset(glm::ivec3(0, 0, 0)), 0u);
    ASSERT_EQ(*ChunkData::coordsToOffset(glm::ivec3(1, 0, 0)), 1u);
    ASSERT_EQ(*ChunkData::coordsToOffset(glm::ivec3(0, 0, 1)), 32u);
    ASSERT_EQ(*ChunkData::coordsToOffset(glm::ivec3(0, 1, 0)), 1024u);
    ASSERT_EQ(*ChunkData::coordsToOffset(glm::ivec3(31, 31, 31)),
              static_cast<size_t>(ChunkData::VOLUME - 1));

    for (size_t offset = 0; offset < static_cast<size_t>(ChunkData::VOLUME); offset += 97) {
        glm::ivec3 local = ChunkData::offsetToCoords(offset);
        ASSERT_TRUE(ChunkData::inBounds(local));
        ASSERT_EQ(*ChunkData::coordsToOffset(local), offset);
    }
}

// ============================================================
// Test 2: Bounds Checks
// ============================================================

TEST(out_of_range_access) {
    ChunkData chunk;

    ASSERT_FALSE(ChunkData::coordsToOffset(glm::ivec3(-1, 0, 0)).has_value());
    ASSERT_FALSE(ChunkData::coordsToOffset(glm::ivec3(0, 32, 0)).has_value());
    ASSERT_FALSE(ChunkData::coordsToOffset(glm::ivec3(0, 0, 32)).has_value());
    ASSERT_FALSE(chunk.getBlock(32, 0, 0).has_value());
    ASSERT_FALSE(chunk.getBlock(0, -1, 0).has_value());

    // Out-of-range writes leave storage untouched
    chunk.setBlock(32, 0, 0, Block(BlockId::STONE));
    chunk.setBlock(-1, -1, -1, Block(BlockId::STONE));
    ASSERT_EQ(chunk.countNonAir(), 0u);

    chunk.setBlock(3, 4, 5, Block(BlockId::DIRT));
    auto stored = chunk.getBlock(3, 4, 5);
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->id, static_cast<uint16_t>(BlockId::DIRT));
    ASSERT_TRUE(chunk.getBlock(4, 4, 5)->isAir());
}

// ============================================================
// Test 3: Fill And Count
// ============================================================

TEST(fill_and_count) {
    ChunkData chunk;
    ASSERT_EQ(chunk.countNonAir(), 0u);

    chunk.fill(Block(BlockId::STONE));
    ASSERT_EQ(chunk.countNonAir(), static_cast<size_t>(ChunkData::VOLUME));

    chunk.setBlock(0, 0, 0, Block::air());
    ASSERT_EQ(chunk.countNonAir(), static_cast<size_t>(ChunkData::VOLUME - 1));

    ChunkData copy = chunk;
    ASSERT_TRUE(copy == chunk);
    copy.setBlock(1, 1, 1, Block(BlockId::SNOW));
    ASSERT_FALSE(copy == chunk);
}

// ============================================================
// Test 4: Solidity
// ============================================================

TEST(solidity_of_ids) {
    ASSERT_FALSE(isSolid(Block::air()));
    ASSERT_TRUE(isSolid(Block(BlockId::STONE)));
    ASSERT_TRUE(isSolid(Block(BlockId::SNOW_GRASS)));

    // Unrecognized ids are treated as solid
    ASSERT_TRUE(isSolid(Block(static_cast<uint16_t>(500))));
    ASSERT_TRUE(isSolid(Block(static_cast<uint16_t>(BlockId::END_ID))));

    // State never affects solidity
    ASSERT_FALSE(isSolid(Block(BlockId::AIR, 7)));
}

// ============================================================
// Test 5: Block Id Names
// ============================================================

TEST(block_id_names) {
    ASSERT_TRUE(blockIdFromU16(0) == BlockId::AIR);
    ASSERT_TRUE(blockIdFromU16(5) == BlockId::SNOW_GRASS);
    ASSERT_FALSE(blockIdFromU16(6).has_value());
    ASSERT_FALSE(blockIdFromU16(65535).has_value());

    ASSERT_EQ(std::string(blockIdName(BlockId::GRASS)), std::string("grass"));
    ASSERT_TRUE(blockIdFromName("snow_grass") == BlockId::SNOW_GRASS);
    ASSERT_FALSE(blockIdFromName("lava").has_value());
}

// ============================================================
// Test 6: Coordinate Round Trip
// ============================================================

TEST(coordinate_round_trip) {
    for (int x = -70; x <= 70; x += 7) {
        for (int y = -40; y <= 40; y += 13) {
            for (int z = -65; z <= 65; z += 11) {
                glm::ivec3 global(x, y, z);
                ChunkCoord chunk = globalToChunk(global);
                glm::ivec3 local = globalToLocal(global);
                ASSERT_TRUE(ChunkData::inBounds(local));
                ASSERT_EQ(chunkLocalToGlobal(chunk, local), global);
            }
        }
    }
}

// ============================================================
// Test 7: Floor Semantics
// ============================================================

TEST(negative_coordinates_floor) {
    ASSERT_EQ(floorDiv(-1, 32), -1);
    ASSERT_EQ(floorMod(-1, 32), 31);
    ASSERT_EQ(floorDiv(-32, 32), -1);
    ASSERT_EQ(floorMod(-32, 32), 0);
    ASSERT_EQ(floorDiv(-33, 32), -2);
    ASSERT_EQ(floorDiv(31, 32), 0);

    ASSERT_TRUE(worldToChunk(glm::vec3(-1.0f, 0.0f, 0.0f)) == ChunkCoord(-1, 0, 0));
    ASSERT_EQ(worldToLocal(glm::vec3(-1.0f, 0.0f, 0.0f)), glm::ivec3(31, 0, 0));

    ASSERT_TRUE(worldToChunk(glm::vec3(0.0f, 128.5f, -2.0f)) == ChunkCoord(0, 4, -1));
}

// ============================================================
// Test 8: Rounding
// ============================================================

TEST(world_positions_round_to_nearest) {
    ASSERT_EQ(worldToGlobal(glm::vec3(0.4f, -0.4f, 1.6f)), glm::ivec3(0, 0, 2));
    // Halfway cases round away from zero
    ASSERT_EQ(worldToGlobal(glm::vec3(0.5f, -0.5f, 31.5f)), glm::ivec3(1, -1, 32));
    ASSERT_TRUE(worldToChunk(glm::vec3(31.5f, 0.0f, 0.0f)) == ChunkCoord(1, 0, 0));
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
