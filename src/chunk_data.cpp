#include "chunk_data.h"
#include <algorithm>

ChunkData::ChunkData()
    : m_blocks(static_cast<size_t>(VOLUME), Block::air()) {
}

std::optional<size_t> ChunkData::coordsToOffset(const glm::ivec3& local) {
    if (!inBounds(local)) {
        return std::nullopt;
    }
    return static_cast<size_t>(local.y) * (SIZE_Z * SIZE_X)
         + static_cast<size_t>(local.z) * SIZE_X
         + static_cast<size_t>(local.x);
}

glm::ivec3 ChunkData::offsetToCoords(size_t offset) {
    int o = static_cast<int>(offset);
    int x = o % SIZE_X;
    int z = (o / SIZE_X) % SIZE_Z;
    int y = o / (SIZE_X * SIZE_Z);
    return glm::ivec3(x, y, z);
}

std::optional<Block> ChunkData::getBlock(const glm::ivec3& local) const {
    auto offset = coordsToOffset(local);
    if (!offset) {
        return std::nullopt;
    }
    return m_blocks[*offset];
}

void ChunkData::setBlock(const glm::ivec3& local, const Block& block) {
    auto offset = coordsToOffset(local);
    if (offset) {
        m_blocks[*offset] = block;
    }
}

void ChunkData::fill(const Block& block) {
    std::fill(m_blocks.begin(), m_blocks.end(), block);
}

size_t ChunkData::countNonAir() const {
    return static_cast<size_t>(std::count_if(m_blocks.begin(), m_blocks.end(),
                                             [](const Block& b) { return !b.isAir(); }));
}
