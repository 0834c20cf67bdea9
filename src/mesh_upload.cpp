#include "mesh_upload.h"
#include "logger.h"
#include <algorithm>
#include <stdexcept>
#include <string>

MeshHandle HeadlessMeshUploader::upload(const std::vector<BlockVertex>& vertices,
                                        const std::vector<uint32_t>& indices) {
    MeshHandle handle;
    handle.id = m_nextId++;
    m_meshes[handle.id] = Buffers{vertices, indices};
    m_stats.uploads++;
    return handle;
}

void HeadlessMeshUploader::update(MeshHandle handle,
                                  const std::vector<BlockVertex>& vertices,
                                  const std::vector<uint32_t>& indices) {
    auto it = m_meshes.find(handle.id);
    if (it == m_meshes.end()) {
        Logger::error() << "Mesh update for unknown handle " << handle.id;
        throw std::out_of_range("unknown mesh handle " + std::to_string(handle.id));
    }

    Buffers& buffers = it->second;

    // Vertex buffer
    if (buffers.vertices.size() != vertices.size()) {
        buffers.vertices = vertices;
        m_stats.replacements++;
    } else {
        std::copy(vertices.begin(), vertices.end(), buffers.vertices.begin());
        m_stats.inPlaceWrites++;
    }

    // Index buffer
    if (buffers.indices.size() != indices.size()) {
        buffers.indices = indices;
        m_stats.replacements++;
    } else {
        std::copy(indices.begin(), indices.end(), buffers.indices.begin());
        m_stats.inPlaceWrites++;
    }
}

void HeadlessMeshUploader::release(MeshHandle handle) {
    if (m_meshes.erase(handle.id) > 0) {
        m_stats.releases++;
    } else {
        Logger::warning() << "Release of unknown mesh handle " << handle.id;
    }
}

const HeadlessMeshUploader::Buffers* HeadlessMeshUploader::find(MeshHandle handle) const {
    auto it = m_meshes.find(handle.id);
    return it != m_meshes.end() ? &it->second : nullptr;
}
