/**
 * @file world_constants.h
 * @brief Chunk dimensions and world defaults
 */

#pragma once

namespace WorldConstants {
    // ========== Chunk Dimensions ==========
    /// Blocks per chunk along X. Must be a power of two.
    constexpr int CHUNK_SIZE_X = 32;
    /// Blocks per chunk along Y
    constexpr int CHUNK_SIZE_Y = 32;
    /// Blocks per chunk along Z
    constexpr int CHUNK_SIZE_Z = 32;
    /// Total blocks in one chunk
    constexpr int CHUNK_VOLUME = CHUNK_SIZE_X * CHUNK_SIZE_Y * CHUNK_SIZE_Z;

    static_assert((CHUNK_SIZE_X & (CHUNK_SIZE_X - 1)) == 0, "chunk X size must be a power of two");
    static_assert((CHUNK_SIZE_Y & (CHUNK_SIZE_Y - 1)) == 0, "chunk Y size must be a power of two");
    static_assert((CHUNK_SIZE_Z & (CHUNK_SIZE_Z - 1)) == 0, "chunk Z size must be a power of two");

    // ========== Defaults ==========
    /// Retention radius in chunks
    constexpr int DEFAULT_RENDER_DISTANCE = 8;
    /// Terrain seed
    constexpr int DEFAULT_SEED = 69;
}

namespace PickerConstants {
    /// Ray marching increment (world units)
    constexpr float DEFAULT_STEP = 0.1f;
    /// Furthest block the picker reports (world units)
    constexpr float DEFAULT_MAX_DISTANCE = 16.0f;
}

namespace ViewConstants {
    /// Where the viewpoint starts, just above the default terrain
    constexpr float START_X = 0.0f;
    constexpr float START_Y = 128.5f;
    constexpr float START_Z = -2.0f;
}
