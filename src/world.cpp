/**
 * @file world.cpp
 * @brief Retention passes, chunk lookups and block edits
 */

#include "world.h"
#include "logger.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
    std::string coordString(const ChunkCoord& c) {
        return "(" + std::to_string(c.x) + ", " + std::to_string(c.y) + ", " + std::to_string(c.z) + ")";
    }
}

World::World(const TerrainGenerator& generator,
             const BlockTextureTable& textures,
             MeshUploader& uploader,
             int renderDistance,
             MeshOptions meshOptions)
    : m_generator(generator),
      m_uploader(uploader),
      m_mesher(textures, meshOptions),
      m_renderDistance(std::max(1, renderDistance)) {
}

World::~World() {
    for (auto& entry : m_chunks) {
        entry.second.releaseMesh(m_uploader);
    }
}

// ========== Viewpoint & Retention ==========

bool World::setViewpoint(const glm::vec3& worldPosition) {
    if (!isValidWorldPosition(worldPosition)) {
        Logger::error() << "Viewpoint rejected: (" << worldPosition.x << ", " << worldPosition.y << ", "
                        << worldPosition.z << ") is not a finite in-range position";
        throw std::invalid_argument("viewpoint must be a finite in-range world position");
    }
    m_viewpoint = worldPosition;
    ChunkCoord current = worldToChunk(worldPosition);

    if (m_retentionValid && current == m_viewpointChunk) {
        return false;
    }

    m_viewpointChunk = current;
    recomputeRetention(current, m_renderDistance);
    return true;
}

void World::setRenderDistance(int renderDistance) {
    if (renderDistance < 1) {
        Logger::warning() << "Render distance " << renderDistance << " is below 1, using 1";
        renderDistance = 1;
    }
    if (renderDistance != m_renderDistance) {
        m_renderDistance = renderDistance;
        m_retentionValid = false;
    }
}

std::vector<ChunkCoord> World::retentionSet(const ChunkCoord& center, int radius) {
    std::vector<ChunkCoord> coords;
    const int half = radius / 2 + 1;
    const int radiusSquared = radius * radius;

    for (int dx = -half; dx <= half; ++dx) {
        for (int dy = -half; dy <= half; ++dy) {
            for (int dz = -half; dz <= half; ++dz) {
                if (dx * dx + dy * dy + dz * dz < radiusSquared) {
                    coords.emplace_back(center.x + dx, center.y + dy, center.z + dz);
                }
            }
        }
    }
    return coords;
}

RetentionStats World::recomputeRetention(const ChunkCoord& center, int radius) {
    RetentionStats stats;
    std::unordered_set<ChunkCoord> keep;
    std::unordered_set<ChunkCoord> dirty;

    // Pass 1: generate missing chunks
    for (const ChunkCoord& coord : retentionSet(center, radius)) {
        keep.insert(coord);
        if (m_chunks.count(coord)) {
            continue;
        }

        std::optional<ChunkData> data = m_generator.generateChunk(coord);
        if (!data) {
            stats.empty++;
            continue;
        }

        m_chunks.emplace(coord, Chunk(coord, std::make_unique<ChunkData>(std::move(*data))));
        stats.created++;
        markWithNeighbors(coord, dirty);
    }
    stats.retained = keep.size();

    // Pass 2: evict everything outside the retention set
    for (auto it = m_chunks.begin(); it != m_chunks.end();) {
        if (keep.count(it->first)) {
            ++it;
            continue;
        }
        auto victim = it++;
        evict(victim);
        stats.evicted++;
    }

    // Pass 3: remesh what changed (chunks evicted above are skipped)
    stats.remeshed = remeshDirty(dirty);
    m_retentionValid = true;

    Logger::info() << "Retention pass at " << coordString(center) << " (R=" << radius << "): "
                   << stats.created << " created, " << stats.evicted << " evicted, "
                   << stats.remeshed << " remeshed, " << m_chunks.size() << " loaded";
    return stats;
}

void World::evict(std::unordered_map<ChunkCoord, Chunk>::iterator it) {
    Logger::debug() << "Evicting chunk " << coordString(it->first);
    it->second.releaseMesh(m_uploader);
    m_chunks.erase(it);
}

void World::markWithNeighbors(const ChunkCoord& coord, std::unordered_set<ChunkCoord>& dirty) const {
    dirty.insert(coord);
    for (const auto& face : FACE_CONFIGS) {
        ChunkCoord neighbor = coord.offset(face.normal);
        if (m_chunks.count(neighbor)) {
            dirty.insert(neighbor);
        }
    }
}

size_t World::remeshDirty(const std::unordered_set<ChunkCoord>& dirty) {
    size_t remeshed = 0;
    for (const ChunkCoord& coord : dirty) {
        if (m_chunks.count(coord)) {
            remeshChunk(coord);
            remeshed++;
        }
    }
    return remeshed;
}

// ========== Chunk Access ==========

Chunk* World::getChunkAt(const ChunkCoord& coord) {
    auto it = m_chunks.find(coord);
    return it != m_chunks.end() ? &it->second : nullptr;
}

const Chunk* World::getChunkAt(const ChunkCoord& coord) const {
    auto it = m_chunks.find(coord);
    return it != m_chunks.end() ? &it->second : nullptr;
}

Chunk& World::requireChunk(const ChunkCoord& coord) {
    Chunk* chunk = getChunkAt(coord);
    if (!chunk) {
        Logger::error() << "Chunk " << coordString(coord) << " is not loaded";
        throw std::out_of_range("chunk " + coordString(coord) + " is not loaded");
    }
    return *chunk;
}

const Chunk& World::requireChunk(const ChunkCoord& coord) const {
    const Chunk* chunk = getChunkAt(coord);
    if (!chunk) {
        Logger::error() << "Chunk " << coordString(coord) << " is not loaded";
        throw std::out_of_range("chunk " + coordString(coord) + " is not loaded");
    }
    return *chunk;
}

ChunkState World::getChunkState(const ChunkCoord& coord) const {
    const Chunk* chunk = getChunkAt(coord);
    return chunk ? chunk->state() : ChunkState::UNLOADED;
}

std::vector<ChunkCoord> World::loadedCoords() const {
    std::vector<ChunkCoord> coords;
    coords.reserve(m_chunks.size());
    for (const auto& entry : m_chunks) {
        coords.push_back(entry.first);
    }
    std::sort(coords.begin(), coords.end());
    return coords;
}

size_t World::totalFaceCount() const {
    size_t faces = 0;
    for (const auto& entry : m_chunks) {
        faces += entry.second.faceCount();
    }
    return faces;
}

// ========== Block Querying and Modification ==========

std::optional<Block> World::getBlock(const glm::ivec3& global) const {
    return getBlock(globalToChunk(global), globalToLocal(global));
}

std::optional<Block> World::getBlock(const ChunkCoord& chunk, const glm::ivec3& local) const {
    const Chunk* c = getChunkAt(chunk);
    if (!c) {
        return std::nullopt;
    }
    return c->data().getBlock(local);
}

bool World::setBlock(const glm::ivec3& global, const Block& block) {
    return setBlock(globalToChunk(global), globalToLocal(global), block);
}

bool World::setBlock(const ChunkCoord& chunk, const glm::ivec3& local, const Block& block) {
    Chunk* c = getChunkAt(chunk);
    if (!c) {
        Logger::debug() << "Ignoring edit in unloaded chunk " << coordString(chunk);
        return false;
    }
    if (!ChunkData::inBounds(local)) {
        return false;
    }

    c->data().setBlock(local, block);

    std::unordered_set<ChunkCoord> dirty;
    markWithNeighbors(chunk, dirty);
    remeshDirty(dirty);
    return true;
}

Block World::blockUnderViewpoint() const {
    const Chunk& chunk = requireChunk(worldToChunk(m_viewpoint));
    // worldToLocal is always in range
    return *chunk.data().getBlock(worldToLocal(m_viewpoint));
}

// ========== Meshing ==========

ChunkNeighbors World::neighborsOf(const ChunkCoord& coord) const {
    ChunkNeighbors neighbors;
    for (const auto& face : FACE_CONFIGS) {
        const Chunk* neighbor = getChunkAt(coord.offset(face.normal));
        neighbors.set(face.direction, neighbor ? &neighbor->data() : nullptr);
    }
    return neighbors;
}

void World::remeshChunk(const ChunkCoord& coord) {
    Chunk& chunk = requireChunk(coord);
    // Neighbour borrows live only for this call; the chunk's own blocks are read, not written
    ChunkNeighbors neighbors = neighborsOf(coord);
    chunk.updateMesh(m_mesher, neighbors, m_uploader);
}
