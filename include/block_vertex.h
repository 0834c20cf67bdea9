/**
 * @file block_vertex.h
 * @brief Packed 8-byte vertex format emitted by the chunk mesher
 */

#pragma once

#include "chunk_face_config.h"
#include <glm/glm.hpp>
#include <array>
#include <cstdint>

/**
 * @brief Unpacked view of a BlockVertex
 */
struct DecodedVertex {
    glm::ivec3 doubledPosition;   ///< Chunk-local position * 2
    uint8_t uvCorner;             ///< 0-3, slot within the face quad
    FaceDirection direction;      ///< Face the vertex belongs to
    uint32_t texture;             ///< Texture index
    std::array<uint8_t, 4> ao;    ///< Occlusion level per face corner slot (0-3)

    /// Chunk-local position in blocks (half-integer for cube corners)
    glm::vec3 position() const { return glm::vec3(doubledPosition) * 0.5f; }
};

/**
 * @brief Compressed block vertex (2 x uint32)
 *
 * Layout:
 * data0 bits 0-9:   X * 2 (10-bit two's complement)
 * data0 bits 10-19: Y * 2
 * data0 bits 20-29: Z * 2
 * data0 bits 30-31: UV corner (0-3)
 * data1 bits 0-7:   AO levels, 2 bits per corner slot (slot 0 lowest)
 * data1 bits 8-10:  Face direction (0-5)
 * data1 bits 11-31: Texture index (21 bits)
 *
 * Positions are chunk-local and sit on half-block offsets, so doubling them
 * makes every corner an integer in [-1, 2 * size - 1].
 */
struct BlockVertex {
    uint32_t data0 = 0;
    uint32_t data1 = 0;

    static constexpr uint32_t POSITION_BITS = 10;
    static constexpr uint32_t POSITION_MASK = (1u << POSITION_BITS) - 1;
    static constexpr int POSITION_MIN = -(1 << (POSITION_BITS - 1));
    static constexpr int POSITION_MAX = (1 << (POSITION_BITS - 1)) - 1;
    static constexpr uint32_t TEXTURE_BITS = 21;
    static constexpr uint32_t TEXTURE_MASK = (1u << TEXTURE_BITS) - 1;

    /**
     * @brief Pack vertex data
     * @param doubledPosition Chunk-local position * 2, each axis in [POSITION_MIN, POSITION_MAX]
     * @param uvCorner Slot within the face quad (0-3)
     * @param direction Face direction
     * @param texture Texture index (masked to 21 bits)
     * @param ao Occlusion level (0-3) for each of the face's 4 corner slots
     */
    static inline BlockVertex pack(const glm::ivec3& doubledPosition,
                                   uint8_t uvCorner,
                                   FaceDirection direction,
                                   uint32_t texture,
                                   const std::array<uint8_t, 4>& ao) {
        BlockVertex v;
        v.data0 = (toField(doubledPosition.x))
                | (toField(doubledPosition.y) << 10)
                | (toField(doubledPosition.z) << 20)
                | (static_cast<uint32_t>(uvCorner & 0x3) << 30);

        v.data1 = static_cast<uint32_t>(ao[0] & 0x3)
                | (static_cast<uint32_t>(ao[1] & 0x3) << 2)
                | (static_cast<uint32_t>(ao[2] & 0x3) << 4)
                | (static_cast<uint32_t>(ao[3] & 0x3) << 6)
                | (static_cast<uint32_t>(static_cast<uint8_t>(direction) & 0x7) << 8)
                | ((texture & TEXTURE_MASK) << 11);
        return v;
    }

    DecodedVertex decode() const {
        DecodedVertex d;
        d.doubledPosition = glm::ivec3(fromField(data0 & POSITION_MASK),
                                       fromField((data0 >> 10) & POSITION_MASK),
                                       fromField((data0 >> 20) & POSITION_MASK));
        d.uvCorner = static_cast<uint8_t>((data0 >> 30) & 0x3);
        for (int i = 0; i < 4; ++i) {
            d.ao[i] = static_cast<uint8_t>((data1 >> (i * 2)) & 0x3);
        }
        d.direction = static_cast<FaceDirection>((data1 >> 8) & 0x7);
        d.texture = (data1 >> 11) & TEXTURE_MASK;
        return d;
    }

    bool operator==(const BlockVertex& other) const { return data0 == other.data0 && data1 == other.data1; }
    bool operator!=(const BlockVertex& other) const { return !(*this == other); }

private:
    static inline uint32_t toField(int value) {
        return static_cast<uint32_t>(value) & POSITION_MASK;
    }

    // Sign-extend a 10-bit field
    static inline int fromField(uint32_t field) {
        int value = static_cast<int>(field);
        if (value & (1 << (POSITION_BITS - 1))) {
            value -= (1 << POSITION_BITS);
        }
        return value;
    }
};

static_assert(sizeof(BlockVertex) == 8, "BlockVertex must stay 8 bytes");
