/**
 * @file block_textures.cpp
 * @brief YAML manifest loading for BlockTextureTable
 */

#include "block_textures.h"
#include "logger.h"
#include <yaml-cpp/yaml.h>

namespace {
    const char* FALLBACK_TEXTURE_NAME = "<missing>";
}

BlockTextureTable::BlockTextureTable() {
    m_textureNames.push_back(FALLBACK_TEXTURE_NAME);
}

BlockTextureTable BlockTextureTable::defaults() {
    BlockTextureTable table;
    uint32_t stone = table.internTexture("stone.png");
    uint32_t grassTop = table.internTexture("grass_top.png");
    uint32_t dirt = table.internTexture("dirt.png");
    uint32_t grassSide = table.internTexture("grass_side.png");
    uint32_t snow = table.internTexture("snow.png");
    uint32_t snowGrassSide = table.internTexture("snow_grass_side.png");

    table.setSides(BlockId::STONE, BlockSides::same(stone));
    table.setSides(BlockId::GRASS, BlockSides::cylinder(grassTop, dirt, grassSide));
    table.setSides(BlockId::DIRT, BlockSides::same(dirt));
    table.setSides(BlockId::SNOW, BlockSides::same(snow));
    table.setSides(BlockId::SNOW_GRASS, BlockSides::cylinder(snow, dirt, snowGrassSide));
    return table;
}

bool BlockTextureTable::loadFromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const std::exception& e) {
        Logger::error() << "Error parsing block manifest " << path << ": " << e.what();
        return false;
    }
    return loadFromNode(root, path);
}

bool BlockTextureTable::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const std::exception& e) {
        Logger::error() << "Error parsing block manifest: " << e.what();
        return false;
    }
    return loadFromNode(root, "<string>");
}

bool BlockTextureTable::loadFromNode(const YAML::Node& root, const std::string& source) {
    YAML::Node blocks = root["blocks"];
    if (!blocks || !blocks.IsSequence()) {
        Logger::error() << "Block manifest " << source << " has no 'blocks' sequence";
        return false;
    }

    // Build into a scratch table so a bad manifest leaves *this untouched
    BlockTextureTable loaded;

    for (size_t i = 0; i < blocks.size(); ++i) {
        const YAML::Node& entry = blocks[i];
        if (!entry.IsMap() || !entry["name"]) {
            Logger::error() << source << ": block entry " << i << " has no name; skipping";
            continue;
        }

        std::vector<std::string> textures;
        std::string name;
        try {
            name = entry["name"].as<std::string>();
            YAML::Node texNode = entry["textures"];
            if (texNode && texNode.IsSequence()) {
                textures = texNode.as<std::vector<std::string>>();
            } else if (texNode && texNode.IsScalar()) {
                textures.push_back(texNode.as<std::string>());
            }
        } catch (const YAML::Exception& e) {
            Logger::error() << source << ": block entry " << i << " is malformed: " << e.what();
            continue;
        }

        auto id = blockIdFromName(name);
        if (!id) {
            Logger::warning() << "Block manifest: unknown block '" << name << "'; skipping";
            continue;
        }

        BlockSides sides;
        switch (textures.size()) {
            case 1:
                sides = BlockSides::same(loaded.internTexture(textures[0]));
                break;
            case 3:
                sides = BlockSides::cylinder(loaded.internTexture(textures[0]),
                                             loaded.internTexture(textures[1]),
                                             loaded.internTexture(textures[2]));
                break;
            case 6:
                sides.top = loaded.internTexture(textures[0]);
                sides.bottom = loaded.internTexture(textures[1]);
                sides.left = loaded.internTexture(textures[2]);
                sides.right = loaded.internTexture(textures[3]);
                sides.front = loaded.internTexture(textures[4]);
                sides.back = loaded.internTexture(textures[5]);
                break;
            default:
                Logger::error() << source << ": block '" << name << "' lists " << textures.size()
                                << " textures; expected 1, 3 or 6";
                continue;
        }

        if (loaded.hasBlock(*id)) {
            Logger::warning() << "Block manifest: duplicate entry for '" << name << "'; keeping the last one";
        }
        loaded.setSides(*id, sides);
    }

    *this = std::move(loaded);
    Logger::info() << "Loaded block manifest " << source << ": " << m_sides.size() << " blocks, "
                   << (m_textureNames.size() - 1) << " textures";
    return true;
}

uint32_t BlockTextureTable::internTexture(const std::string& name) {
    auto it = m_textureIds.find(name);
    if (it != m_textureIds.end()) {
        return it->second;
    }
    uint32_t id = static_cast<uint32_t>(m_textureNames.size());
    m_textureNames.push_back(name);
    m_textureIds[name] = id;
    return id;
}

uint32_t BlockTextureTable::textureFor(uint16_t blockId, FaceDirection face) const {
    auto it = m_sides.find(blockId);
    if (it == m_sides.end()) {
        return FALLBACK_TEXTURE;
    }
    return it->second.inDirection(face);
}

void BlockTextureTable::setSides(BlockId id, const BlockSides& sides) {
    m_sides[static_cast<uint16_t>(id)] = sides;
}

bool BlockTextureTable::hasBlock(BlockId id) const {
    return m_sides.count(static_cast<uint16_t>(id)) > 0;
}
