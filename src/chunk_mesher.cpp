/**
 * @file chunk_mesher.cpp
 * @brief Face culling, cross-chunk lookups and AO for chunk meshes
 */

#include "chunk_mesher.h"
#include "logger.h"
#include "world_utils.h"
#include <stdexcept>
#include <string>

int ChunkNeighbors::count() const {
    int n = 0;
    for (const ChunkData* data : faces) {
        if (data) n++;
    }
    return n;
}

ChunkMesher::ChunkMesher(const BlockTextureTable& textures, MeshOptions options)
    : m_textures(textures), m_options(options) {
    m_options.aoRotation &= 3;
}

CellState ChunkMesher::probe(const ChunkData& chunk, const ChunkNeighbors& neighbors, const glm::ivec3& local) {
    const glm::ivec3 size = chunkSize();

    // Inside this chunk - direct access
    if (auto own = chunk.getBlock(local)) {
        return isSolid(*own) ? CellState::SOLID : CellState::EMPTY;
    }

    int outsideAxis = -1;
    int outsideCount = 0;
    for (int axis = 0; axis < 3; ++axis) {
        if (local[axis] < 0 || local[axis] >= size[axis]) {
            outsideAxis = axis;
            outsideCount++;
        }
    }

    if (outsideCount > 1) {
        return CellState::UNKNOWN;
    }

    bool positive = local[outsideAxis] >= size[outsideAxis];
    const ChunkData* neighbor = neighbors.get(faceFromAxis(outsideAxis, positive));
    if (!neighbor) {
        return CellState::UNKNOWN;
    }

    // Shift onto the neighbour's facing layer: x = 32 becomes 0, x = -1 becomes 31
    glm::ivec3 mapped = local;
    mapped[outsideAxis] += positive ? -size[outsideAxis] : size[outsideAxis];

    auto block = neighbor->getBlock(mapped);
    if (!block) {
        Logger::error() << "Mesher: cell (" << local.x << ", " << local.y << ", " << local.z
                        << ") does not map into the " << faceDirectionName(faceFromAxis(outsideAxis, positive))
                        << " neighbour";
        throw std::logic_error("unresolvable neighbour offset (" + std::to_string(mapped.x) + ", " +
                               std::to_string(mapped.y) + ", " + std::to_string(mapped.z) + ")");
    }
    return isSolid(*block) ? CellState::SOLID : CellState::EMPTY;
}

uint8_t ChunkMesher::occlusionLevel(bool edgeA, bool edgeB, bool corner) {
    if (edgeA && edgeB) {
        return 3;
    }
    return static_cast<uint8_t>((edgeA ? 1 : 0) + (edgeB ? 1 : 0) + (corner ? 1 : 0));
}

ChunkMeshData ChunkMesher::generate(const ChunkData& chunk, const ChunkNeighbors& neighbors) const {
    ChunkMeshData mesh;

    for (int y = 0; y < ChunkData::SIZE_Y; ++y) {
        for (int z = 0; z < ChunkData::SIZE_Z; ++z) {
            for (int x = 0; x < ChunkData::SIZE_X; ++x) {
                glm::ivec3 pos(x, y, z);
                const Block& block = chunk.at(*ChunkData::coordsToOffset(pos));
                if (block.isAir()) {
                    continue;
                }

                for (const auto& face : FACE_CONFIGS) {
                    if (probe(chunk, neighbors, pos + face.normal) != CellState::EMPTY) {
                        continue;
                    }
                    emitFace(chunk, neighbors, pos, block, face, mesh);
                }
            }
        }
    }

    return mesh;
}

void ChunkMesher::emitFace(const ChunkData& chunk, const ChunkNeighbors& neighbors,
                           const glm::ivec3& pos, const Block& block, const FaceConfig& face,
                           ChunkMeshData& out) const {
    // AMBIENT OCCLUSION: per face corner, two edge cells and the diagonal in front of the face
    std::array<uint8_t, 4> cornerAO{};
    for (int slot = 0; slot < 4; ++slot) {
        AOProbeOffsets probes = aoProbeOffsets(face, slot);
        bool edgeA = probe(chunk, neighbors, pos + probes.edgeA) == CellState::SOLID;
        bool edgeB = probe(chunk, neighbors, pos + probes.edgeB) == CellState::SOLID;
        bool corner = probe(chunk, neighbors, pos + probes.corner) == CellState::SOLID;
        cornerAO[slot] = occlusionLevel(edgeA, edgeB, corner);
    }

    std::array<uint8_t, 4> packedAO{};
    for (int slot = 0; slot < 4; ++slot) {
        packedAO[slot] = cornerAO[(slot + m_options.aoRotation) & 3];
    }

    uint32_t texture = m_textures.textureFor(block.id, face.direction);
    uint32_t base = static_cast<uint32_t>(out.vertices.size());

    for (int slot = 0; slot < 4; ++slot) {
        glm::ivec3 doubled = pos * 2 + CUBE_CORNERS[face.corners[slot]];
        out.vertices.push_back(BlockVertex::pack(doubled, static_cast<uint8_t>(slot),
                                                 face.direction, texture, packedAO));
    }

    for (uint32_t index : FACE_INDEX_FAN) {
        out.indices.push_back(base + index);
    }
}
