#pragma once

#include "block.h"
#include "chunk_face_config.h"
#include "world_utils.h"
#include <glm/glm.hpp>

// The block the viewpoint is looking at, recomputed every frame
struct BlockTarget {
    ChunkCoord chunk;            // Chunk containing the block
    glm::ivec3 local{0};         // Block coordinate inside that chunk
    FaceDirection face = FaceDirection::PosY;  // Face the ray entered through
    Block block;                 // Block that was hit
    float distance = 0.0f;       // Distance marched before the hit

    // Global block coordinate
    glm::ivec3 toGlobal() const {
        return chunkLocalToGlobal(chunk, local);
    }

    // Cell in front of the struck face, where a placed block goes
    glm::ivec3 placementCoords() const {
        return toGlobal() + getFaceConfig(face).normal;
    }

    bool operator==(const BlockTarget& other) const {
        return chunk == other.chunk && local == other.local && face == other.face;
    }
};
