/**
 * @file world.h
 * @brief Chunk map, viewpoint retention and dependent remeshing
 *
 * ARCHITECTURE:
 * - The world owns every loaded Chunk in a hash map keyed by ChunkCoord.
 * - The set of loaded coordinates follows a tracked viewpoint: whenever the
 *   viewpoint enters a different chunk, a retention pass generates every
 *   missing chunk within the render distance and evicts everything outside it.
 * - New chunks and block edits mark the affected chunk and its loaded
 *   face-adjacent neighbours dirty; dirty chunks are remeshed at the end of the
 *   operation, after all insertions and evictions.
 *
 * THREAD SAFETY:
 * None. The world is driven from a single thread, one frame at a time;
 * generation and meshing complete synchronously inside the calls that need them.
 *
 * COLLABORATORS (borrowed, must outlive the world):
 * - TerrainGenerator: block data for new chunks
 * - BlockTextureTable: texture indices for the mesher
 * - MeshUploader: receives every mesh and every release
 */

#pragma once

#include "block.h"
#include "chunk.h"
#include "chunk_mesher.h"
#include "mesh_upload.h"
#include "terrain_generator.h"
#include "world_constants.h"
#include "world_utils.h"
#include <glm/glm.hpp>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * @brief Outcome of one retention pass
 */
struct RetentionStats {
    size_t created = 0;    ///< Chunks generated and inserted
    size_t empty = 0;      ///< Coordinates the generator declined
    size_t evicted = 0;    ///< Chunks removed
    size_t remeshed = 0;   ///< Dirty chunks meshed at the end of the pass
    size_t retained = 0;   ///< Size of the retention set
};

/**
 * @brief The loaded part of the voxel world
 */
class World {
public:
    /**
     * @param generator Terrain source for new chunks
     * @param textures Texture table used when meshing
     * @param uploader Mesh receiver
     * @param renderDistance Retention radius in chunks (R)
     * @param meshOptions Mesher tuning
     */
    World(const TerrainGenerator& generator,
          const BlockTextureTable& textures,
          MeshUploader& uploader,
          int renderDistance = WorldConstants::DEFAULT_RENDER_DISTANCE,
          MeshOptions meshOptions = MeshOptions());

    /**
     * @brief Releases every uploaded mesh
     */
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // ========== Viewpoint & Retention ==========

    /**
     * @brief Tracks the viewpoint; runs a retention pass when its chunk changes
     *
     * The first call always runs a pass, as does the first call after
     * setRenderDistance().
     *
     * @param worldPosition Viewpoint in world space
     * @return True if a retention pass ran
     * @throws std::invalid_argument if the position fails isValidWorldPosition()
     */
    bool setViewpoint(const glm::vec3& worldPosition);

    const glm::vec3& viewpoint() const { return m_viewpoint; }
    const ChunkCoord& viewpointChunk() const { return m_viewpointChunk; }

    /**
     * @brief Changes the retention radius; applied on the next setViewpoint()
     */
    void setRenderDistance(int renderDistance);
    int renderDistance() const { return m_renderDistance; }

    /**
     * @brief Loads every chunk within `radius` of `center` and evicts the rest
     *
     * Candidates are the cube of half-width radius / 2 + 1 around the center;
     * a candidate is kept when its squared chunk distance is below radius^2.
     *
     * @return Counters for the pass
     */
    RetentionStats recomputeRetention(const ChunkCoord& center, int radius);

    /**
     * @brief Coordinates a retention pass around `center` keeps, in scan order
     */
    static std::vector<ChunkCoord> retentionSet(const ChunkCoord& center, int radius);

    // ========== Chunk Access ==========

    /// Chunk at a coordinate, or nullptr if it is not loaded
    Chunk* getChunkAt(const ChunkCoord& coord);
    const Chunk* getChunkAt(const ChunkCoord& coord) const;

    /**
     * @brief Chunk that callers expect to be loaded
     * @throws std::out_of_range if it is not; this is a caller bug (query
     *         before the retention pass that loads it)
     */
    Chunk& requireChunk(const ChunkCoord& coord);
    const Chunk& requireChunk(const ChunkCoord& coord) const;

    bool hasChunk(const ChunkCoord& coord) const { return m_chunks.count(coord) > 0; }
    size_t chunkCount() const { return m_chunks.size(); }

    ChunkState getChunkState(const ChunkCoord& coord) const;

    /// Loaded coordinates in ascending order
    std::vector<ChunkCoord> loadedCoords() const;

    /**
     * @brief Calls fn(const Chunk&) for every loaded chunk (unspecified order)
     */
    template<typename Fn>
    void forEachChunk(Fn&& fn) const {
        for (const auto& entry : m_chunks) {
            fn(entry.second);
        }
    }

    /// Total faces over all loaded meshes
    size_t totalFaceCount() const;

    // ========== Block Querying and Modification ==========

    /**
     * @brief Block at a global block coordinate
     * @return The block, or std::nullopt if its chunk is not loaded
     */
    std::optional<Block> getBlock(const glm::ivec3& global) const;

    std::optional<Block> getBlock(const ChunkCoord& chunk, const glm::ivec3& local) const;

    /**
     * @brief Writes a block and remeshes the chunk plus its loaded neighbours
     * @return False if the chunk is not loaded (nothing changes)
     */
    bool setBlock(const glm::ivec3& global, const Block& block);

    /**
     * @brief Same as setBlock(global), addressed by chunk and local coordinate
     * @return False if the chunk is not loaded or `local` is out of range
     */
    bool setBlock(const ChunkCoord& chunk, const glm::ivec3& local, const Block& block);

    /**
     * @brief Block containing the viewpoint
     * @throws std::out_of_range if the viewpoint chunk has not been generated
     */
    Block blockUnderViewpoint() const;

    // ========== Meshing ==========

    /**
     * @brief Read-only borrows of a coordinate's loaded face neighbours
     */
    ChunkNeighbors neighborsOf(const ChunkCoord& coord) const;

    /**
     * @brief Remeshes one loaded chunk against its current neighbours
     */
    void remeshChunk(const ChunkCoord& coord);

    const ChunkMesher& mesher() const { return m_mesher; }

private:
    /// Adds `coord` and each loaded face neighbour to `dirty`
    void markWithNeighbors(const ChunkCoord& coord, std::unordered_set<ChunkCoord>& dirty) const;

    /// Remeshes each dirty chunk that is still loaded
    size_t remeshDirty(const std::unordered_set<ChunkCoord>& dirty);

    void evict(std::unordered_map<ChunkCoord, Chunk>::iterator it);

    const TerrainGenerator& m_generator;
    MeshUploader& m_uploader;
    ChunkMesher m_mesher;

    std::unordered_map<ChunkCoord, Chunk> m_chunks;  ///< Loaded chunks

    int m_renderDistance;
    glm::vec3 m_viewpoint{0.0f};
    ChunkCoord m_viewpointChunk;
    bool m_retentionValid = false;  ///< False until the first pass, and after a radius change
};
