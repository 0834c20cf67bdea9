/**
 * @file chunk_mesher.h
 * @brief Face-culling mesh generation with per-vertex ambient occlusion
 *
 * ARCHITECTURE:
 * The mesher is a pure function of one chunk's blocks, read-only borrows of
 * its six face-adjacent chunks, and a texture table. It never touches the
 * world map; the caller assembles a ChunkNeighbors for the duration of one
 * generate() call and drops it afterwards.
 *
 * FACE RULES:
 * - Air is never meshed.
 * - A face is emitted only when the cell in front of it is known to be empty.
 * - A boundary face whose neighbour chunk is absent is skipped: an unloaded
 *   region is neither assumed empty nor solid.
 * - Unknown block ids are solid (see isSolid()).
 *
 * OUTPUT ORDER:
 * Blocks are visited y-major, then z, then x; faces in FaceDirection order.
 * Each emitted face adds 4 vertices and 6 indices, with no sharing between faces.
 */

#pragma once

#include "block_textures.h"
#include "block_vertex.h"
#include "chunk_data.h"
#include "chunk_face_config.h"
#include <array>
#include <cstdint>
#include <vector>

/**
 * @brief Read-only borrows of the six face-adjacent chunks
 *
 * Indexed by FaceDirection; nullptr means the neighbour is not loaded.
 */
struct ChunkNeighbors {
    std::array<const ChunkData*, FACE_COUNT> faces{};

    const ChunkData* get(FaceDirection dir) const { return faces[static_cast<size_t>(dir)]; }
    void set(FaceDirection dir, const ChunkData* data) { faces[static_cast<size_t>(dir)] = data; }

    /// Number of neighbours present
    int count() const;
};

/**
 * @brief Mesher tuning that stays fixed for the lifetime of a world
 */
struct MeshOptions {
    /// Rotates which face corner's AO level lands in each packed slot (0-3)
    int aoRotation = 0;
};

/**
 * @brief CPU-side mesh of one chunk
 */
struct ChunkMeshData {
    std::vector<BlockVertex> vertices;
    std::vector<uint32_t> indices;

    size_t faceCount() const { return indices.size() / FACE_INDEX_FAN.size(); }
    bool empty() const { return indices.empty(); }
};

/**
 * @brief What the mesher knows about a cell
 */
enum class CellState : uint8_t {
    EMPTY,    ///< Non-solid block
    SOLID,    ///< Solid block (including unknown ids)
    UNKNOWN   ///< Cell lies in a chunk that was not borrowed
};

/**
 * @brief Converts chunk block data into a packed triangle mesh
 */
class ChunkMesher {
public:
    explicit ChunkMesher(const BlockTextureTable& textures, MeshOptions options = MeshOptions());

    /**
     * @brief Builds the mesh for one chunk
     *
     * @param chunk Blocks of the chunk being meshed
     * @param neighbors Face-adjacent chunks (may be partially or fully absent)
     * @return Vertex and index lists
     * @throws std::logic_error if a boundary cell cannot be mapped into its
     *         neighbour chunk (a bug in the coordinate mapping)
     */
    ChunkMeshData generate(const ChunkData& chunk, const ChunkNeighbors& neighbors) const;

    /**
     * @brief Solidity of a cell given in this chunk's local coordinates
     *
     * Cells up to one block outside the chunk on a single axis are looked up
     * in the matching neighbour. Cells outside on two or more axes belong to
     * edge/corner chunks, which are never borrowed, and report UNKNOWN.
     */
    static CellState probe(const ChunkData& chunk, const ChunkNeighbors& neighbors, const glm::ivec3& local);

    /**
     * @brief Occlusion level of one face corner
     * @return 0 (open) to 3 (both edges solid)
     */
    static uint8_t occlusionLevel(bool edgeA, bool edgeB, bool corner);

    /// Shading-side brightness for an occlusion level (3 = fully lit)
    static uint8_t aoBrightness(uint8_t occlusion) { return static_cast<uint8_t>(3 - (occlusion & 3)); }

    const MeshOptions& options() const { return m_options; }

private:
    void emitFace(const ChunkData& chunk, const ChunkNeighbors& neighbors,
                  const glm::ivec3& pos, const Block& block, const FaceConfig& face,
                  ChunkMeshData& out) const;

    const BlockTextureTable& m_textures;
    MeshOptions m_options;
};
