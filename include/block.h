/**
 * @file block.h
 * @brief Block value type, block id enumeration and solidity rules
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Known block types
 *
 * END_ID is not a block. Any raw id at or past it is unknown: it is treated as
 * solid for occlusion and falls back to texture 0.
 */
enum class BlockId : uint16_t {
    AIR = 0,
    STONE = 1,
    GRASS = 2,
    DIRT = 3,
    SNOW = 4,
    SNOW_GRASS = 5,
    END_ID = 6  ///< First unrecognized id
};

/**
 * @brief Converts a raw id into a known BlockId
 * @return The id, or std::nullopt if raw >= END_ID
 */
inline std::optional<BlockId> blockIdFromU16(uint16_t raw) {
    if (raw >= static_cast<uint16_t>(BlockId::END_ID)) {
        return std::nullopt;
    }
    return static_cast<BlockId>(raw);
}

/**
 * @brief Manifest name of a block id ("stone", "snow_grass", ...)
 */
const char* blockIdName(BlockId id);

/**
 * @brief Looks up a block id by manifest name
 * @return The id, or std::nullopt for unknown names
 */
std::optional<BlockId> blockIdFromName(const std::string& name);

/**
 * @brief Content of a single voxel cell
 *
 * `state` is carried along for block variants and is not interpreted here.
 */
struct Block {
    uint16_t id = 0;     ///< Raw block id (0 = air)
    uint16_t state = 0;  ///< Variant data, unused by the core

    Block() = default;
    Block(uint16_t id_, uint16_t state_ = 0) : id(id_), state(state_) {}
    Block(BlockId id_, uint16_t state_ = 0) : id(static_cast<uint16_t>(id_)), state(state_) {}

    static Block air() { return Block(); }

    bool isAir() const { return id == 0; }

    bool operator==(const Block& other) const { return id == other.id && state == other.state; }
    bool operator!=(const Block& other) const { return !(*this == other); }
};

/**
 * @brief Whether a block occludes its neighbours
 *
 * Air is the only non-solid block. Unknown ids count as solid so that
 * corrupted or newer data never opens holes in the mesh.
 */
inline bool isSolid(const Block& block) {
    // Every known id past AIR is solid, and so is every unknown id
    return block.id != static_cast<uint16_t>(BlockId::AIR);
}
