#include "chunk.h"
#include "logger.h"
#include <stdexcept>
#include <utility>

Chunk::Chunk(const ChunkCoord& coord, std::unique_ptr<ChunkData> data)
    : m_coord(coord), m_data(std::move(data)) {
    if (!m_data) {
        throw std::invalid_argument("Chunk requires block data");
    }
}

void Chunk::updateMesh(const ChunkMesher& mesher, const ChunkNeighbors& neighbors, MeshUploader& uploader) {
    ChunkMeshData meshData = mesher.generate(*m_data, neighbors);

    if (!m_mesh) {
        ChunkMesh mesh;
        mesh.handle = uploader.upload(meshData.vertices, meshData.indices);
        mesh.data = std::move(meshData);
        m_mesh = std::move(mesh);
    } else {
        uploader.update(m_mesh->handle, meshData.vertices, meshData.indices);
        m_mesh->data = std::move(meshData);
    }

    m_state = ChunkState::LOADED;

    Logger::debug() << "Meshed chunk (" << m_coord.x << ", " << m_coord.y << ", " << m_coord.z << "): "
                    << m_mesh->data.faceCount() << " faces, " << neighbors.count() << " neighbours";
}

void Chunk::releaseMesh(MeshUploader& uploader) {
    if (m_mesh) {
        uploader.release(m_mesh->handle);
        m_mesh.reset();
    }
}
