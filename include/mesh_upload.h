/**
 * @file mesh_upload.h
 * @brief GPU mesh upload interface and an in-memory implementation
 *
 * The world hands every remeshed chunk to a MeshUploader and keeps only the
 * returned handle. A GPU backend implements the interface with real buffers;
 * HeadlessMeshUploader keeps the data in host memory for tests and the demo.
 */

#pragma once

#include "block_vertex.h"
#include <cstdint>
#include <unordered_map>
#include <vector>

/**
 * @brief Opaque reference to an uploaded mesh (0 = none)
 */
struct MeshHandle {
    uint64_t id = 0;

    bool valid() const { return id != 0; }
    bool operator==(const MeshHandle& other) const { return id == other.id; }
    bool operator!=(const MeshHandle& other) const { return id != other.id; }
};

/**
 * @brief Receives chunk meshes for rendering
 */
class MeshUploader {
public:
    virtual ~MeshUploader() = default;

    /**
     * @brief Creates buffers for a new mesh
     * @return Handle used for later updates and draws
     */
    virtual MeshHandle upload(const std::vector<BlockVertex>& vertices,
                              const std::vector<uint32_t>& indices) = 0;

    /**
     * @brief Replaces a mesh's contents
     *
     * Buffers whose size changed are recreated; buffers of the same size are
     * overwritten in place.
     */
    virtual void update(MeshHandle handle,
                        const std::vector<BlockVertex>& vertices,
                        const std::vector<uint32_t>& indices) = 0;

    /**
     * @brief Frees a mesh; the handle is invalid afterwards
     */
    virtual void release(MeshHandle handle) = 0;
};

/**
 * @brief MeshUploader that stores buffers in host memory
 */
class HeadlessMeshUploader : public MeshUploader {
public:
    struct Buffers {
        std::vector<BlockVertex> vertices;
        std::vector<uint32_t> indices;
    };

    /// Operation counters
    struct Stats {
        size_t uploads = 0;         ///< New meshes
        size_t replacements = 0;    ///< Buffers recreated because the size changed
        size_t inPlaceWrites = 0;   ///< Buffers overwritten at the same size
        size_t releases = 0;        ///< Meshes freed
    };

    MeshHandle upload(const std::vector<BlockVertex>& vertices,
                      const std::vector<uint32_t>& indices) override;

    void update(MeshHandle handle,
                const std::vector<BlockVertex>& vertices,
                const std::vector<uint32_t>& indices) override;

    void release(MeshHandle handle) override;

    /// Buffers behind a handle, or nullptr if it is not live
    const Buffers* find(MeshHandle handle) const;

    size_t liveCount() const { return m_meshes.size(); }
    const Stats& stats() const { return m_stats; }

private:
    std::unordered_map<uint64_t, Buffers> m_meshes;
    uint64_t m_nextId = 1;
    Stats m_stats;
};
