/**
 * @file block_textures.h
 * @brief Block id + face -> texture index table loaded from a YAML manifest
 *
 */

#pragma once

#include "block.h"
#include "chunk_face_config.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace YAML { class Node; }

/**
 * @brief One texture index per cube side
 */
struct BlockSides {
    uint32_t top = 0;     ///< +Y
    uint32_t bottom = 0;  ///< -Y
    uint32_t left = 0;    ///< -X
    uint32_t right = 0;   ///< +X
    uint32_t front = 0;   ///< +Z
    uint32_t back = 0;    ///< -Z

    static BlockSides same(uint32_t t) { return {t, t, t, t, t, t}; }

    static BlockSides cylinder(uint32_t top, uint32_t bottom, uint32_t side) {
        return {top, bottom, side, side, side, side};
    }

    uint32_t inDirection(FaceDirection dir) const {
        switch (dir) {
            case FaceDirection::PosX: return right;
            case FaceDirection::NegX: return left;
            case FaceDirection::PosY: return top;
            case FaceDirection::NegY: return bottom;
            case FaceDirection::PosZ: return front;
            case FaceDirection::NegZ: return back;
        }
        return 0;
    }
};

/**
 * @brief Texture lookup used by the mesher
 *
 * Texture index 0 is reserved for the fallback texture: every block id with
 * no entry (air, unknown ids, blocks missing from the manifest) resolves to 0.
 * Manifest textures are numbered from 1 in first-seen order; a texture name
 * used by several blocks gets a single index.
 *
 * Manifest format:
 * @code
 * blocks:
 *   - name: stone
 *     textures: [stone.png]                             # all faces
 *   - name: grass
 *     textures: [grass_top.png, dirt.png, grass_side.png] # top, bottom, sides
 *   - name: crate
 *     textures: [t.png, b.png, l.png, r.png, f.png, k.png] # top, bottom, left, right, front, back
 * @endcode
 */
class BlockTextureTable {
public:
    static constexpr uint32_t FALLBACK_TEXTURE = 0;

    BlockTextureTable();

    /**
     * @brief Table matching assets/blocks.yaml, for runs without a manifest
     */
    static BlockTextureTable defaults();

    /**
     * @brief Replaces the table with the contents of a manifest file
     * @return false on I/O or parse errors; the table is left unchanged
     */
    bool loadFromFile(const std::string& path);

    /**
     * @brief Same as loadFromFile, reading the manifest from a string
     */
    bool loadFromString(const std::string& yaml);

    /**
     * @brief Texture index for one face of a block
     * @return FALLBACK_TEXTURE when the id is unmapped
     */
    uint32_t textureFor(uint16_t blockId, FaceDirection face) const;

    uint32_t textureFor(BlockId blockId, FaceDirection face) const {
        return textureFor(static_cast<uint16_t>(blockId), face);
    }

    void setSides(BlockId id, const BlockSides& sides);

    bool hasBlock(BlockId id) const;

    /// Texture names by index; entry 0 is the fallback
    const std::vector<std::string>& textureNames() const { return m_textureNames; }

    size_t blockCount() const { return m_sides.size(); }

private:
    bool loadFromNode(const YAML::Node& root, const std::string& source);
    uint32_t internTexture(const std::string& name);

    std::unordered_map<uint16_t, BlockSides> m_sides;
    std::vector<std::string> m_textureNames;
    std::unordered_map<std::string, uint32_t> m_textureIds;
};
