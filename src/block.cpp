#include "block.h"

namespace {
    struct BlockNameEntry {
        BlockId id;
        const char* name;
    };

    constexpr BlockNameEntry BLOCK_NAMES[] = {
        {BlockId::AIR, "air"},
        {BlockId::STONE, "stone"},
        {BlockId::GRASS, "grass"},
        {BlockId::DIRT, "dirt"},
        {BlockId::SNOW, "snow"},
        {BlockId::SNOW_GRASS, "snow_grass"},
    };
}

const char* blockIdName(BlockId id) {
    for (const auto& entry : BLOCK_NAMES) {
        if (entry.id == id) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<BlockId> blockIdFromName(const std::string& name) {
    for (const auto& entry : BLOCK_NAMES) {
        if (name == entry.name) {
            return entry.id;
        }
    }
    return std::nullopt;
}
