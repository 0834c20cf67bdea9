/**
 * @file chunk.h
 * @brief A loaded chunk: block data, grid coordinate and uploaded mesh
 *
 */

#pragma once

#include "chunk_data.h"
#include "chunk_mesher.h"
#include "mesh_upload.h"
#include "world_utils.h"
#include <cstdint>
#include <memory>
#include <optional>

/**
 * @brief Lifecycle of a chunk coordinate
 *
 * UNLOADED -> GENERATING -> LOADED -> UNLOADED. Generation and the first
 * mesh both happen synchronously inside one retention pass, so GENERATING is
 * only observable between insertion and the end of that pass.
 */
enum class ChunkState : uint8_t {
    UNLOADED,     ///< Not in the chunk map
    GENERATING,   ///< Block data present, first mesh pending
    LOADED        ///< Meshed and renderable
};

inline const char* chunkStateToString(ChunkState state) {
    switch (state) {
        case ChunkState::UNLOADED:   return "UNLOADED";
        case ChunkState::GENERATING: return "GENERATING";
        case ChunkState::LOADED:     return "LOADED";
        default:                     return "UNKNOWN";
    }
}

/**
 * @brief Mesh data kept alongside its upload handle
 */
struct ChunkMesh {
    ChunkMeshData data;   ///< CPU copy (used for stats and tests)
    MeshHandle handle;    ///< Uploaded buffers
};

/**
 * @brief One chunk of the world
 *
 * Owns its ChunkData exclusively. The mesh is absent until the first call to
 * updateMesh(). Chunks are move-only; the world map owns them by value.
 */
class Chunk {
public:
    Chunk(const ChunkCoord& coord, std::unique_ptr<ChunkData> data);

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;
    Chunk(Chunk&&) = default;
    Chunk& operator=(Chunk&&) = default;

    const ChunkCoord& coord() const { return m_coord; }

    const ChunkData& data() const { return *m_data; }
    ChunkData& data() { return *m_data; }

    ChunkState state() const { return m_state; }

    /**
     * @brief Remeshes from the current block data and uploads the result
     *
     * The first call uploads a new mesh; later calls update the existing one.
     *
     * @param mesher Mesh generator
     * @param neighbors Read-only borrows of the face-adjacent chunks, valid for this call only
     * @param uploader Receiver of the mesh buffers
     */
    void updateMesh(const ChunkMesher& mesher, const ChunkNeighbors& neighbors, MeshUploader& uploader);

    /**
     * @brief Frees the uploaded mesh, if any
     */
    void releaseMesh(MeshUploader& uploader);

    bool hasMesh() const { return m_mesh.has_value(); }

    /// Mesh, or nullptr before the first updateMesh()
    const ChunkMesh* mesh() const { return m_mesh ? &*m_mesh : nullptr; }

    size_t faceCount() const { return m_mesh ? m_mesh->data.faceCount() : 0; }

    /// World-space position of local block (0, 0, 0)'s center
    glm::vec3 worldOrigin() const { return glm::vec3(m_coord.toVec() * chunkSize()); }

private:
    ChunkCoord m_coord;                     ///< Chunk grid coordinate
    std::unique_ptr<ChunkData> m_data;      ///< Block storage
    std::optional<ChunkMesh> m_mesh;        ///< Absent until first meshed
    ChunkState m_state = ChunkState::GENERATING;
};
