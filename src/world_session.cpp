#include "world_session.h"
#include "logger.h"
#include "raycast.h"
#include <cmath>
#include <sstream>

glm::vec3 directionFromYawPitch(float yawDegrees, float pitchDegrees) {
    glm::vec3 front;
    front.x = std::cos(glm::radians(yawDegrees)) * std::cos(glm::radians(pitchDegrees));
    front.y = std::sin(glm::radians(pitchDegrees));
    front.z = std::sin(glm::radians(yawDegrees)) * std::cos(glm::radians(pitchDegrees));
    return glm::normalize(front);
}

std::string DebugInfo::format() const {
    std::ostringstream out;
    out << "chunk: (" << viewpointChunk.x << ", " << viewpointChunk.y << ", " << viewpointChunk.z << ")\n";
    out << "eye: (" << eye.x << ", " << eye.y << ", " << eye.z << ")\n";

    auto known = blockIdFromU16(blockUnderViewpoint.id);
    out << "block under camera: " << (known ? blockIdName(*known) : "unknown")
        << " (" << blockUnderViewpoint.id << ")\n";

    if (target) {
        glm::ivec3 g = target->toGlobal();
        out << "target: (" << g.x << ", " << g.y << ", " << g.z << ") face " << faceDirectionName(target->face) << "\n";
    } else {
        out << "target: none\n";
    }
    out << "loaded chunks: " << loadedChunks;
    return out.str();
}

WorldSession::WorldSession(World& world, float pickDistance, float pickStep)
    : m_world(world), m_pickDistance(pickDistance), m_pickStep(pickStep) {
}

size_t WorldSession::update(const ViewState& view, const std::vector<BlockEdit>& edits) {
    m_view = view;
    m_frame++;

    // 1. Viewpoint tracking (synchronous retention pass on chunk change)
    m_world.setViewpoint(view.position);

    // 2. Input-driven edits
    size_t applied = 0;
    for (const BlockEdit& edit : edits) {
        if (applyEdit(edit)) {
            applied++;
        }
    }

    // 3. Targeting
    m_target = Raycast::pick(m_world, view.position, view.direction, m_pickDistance, m_pickStep);
    return applied;
}

bool WorldSession::applyEdit(const BlockEdit& edit) {
    switch (edit.kind) {
        case EditKind::SetAt:
            return m_world.setBlock(edit.global, edit.block);

        case EditKind::PlaceAtViewpoint:
            return m_world.setBlock(worldToGlobal(m_view.position), edit.block);

        case EditKind::BreakTarget:
            if (!m_target) {
                Logger::debug() << "Break ignored: no target";
                return false;
            }
            return m_world.setBlock(m_target->chunk, m_target->local, Block::air());

        case EditKind::PlaceAgainstTarget:
            if (!m_target) {
                Logger::debug() << "Place ignored: no target";
                return false;
            }
            return m_world.setBlock(m_target->placementCoords(), edit.block);
    }
    return false;
}

FrameDrawStats WorldSession::render(RenderSink& sink) const {
    return ChunkRenderer::recordFrame(m_world, m_wireframe, m_target, sink);
}

DebugInfo WorldSession::debugInfo() const {
    DebugInfo info;
    info.viewpointChunk = m_world.viewpointChunk();
    info.eye = m_world.viewpoint();
    info.blockUnderViewpoint = m_world.blockUnderViewpoint();
    info.target = m_target;
    info.loadedChunks = m_world.chunkCount();
    return info;
}
