/**
 * @file world_session.h
 * @brief Per-frame driver: viewpoint tracking, block edits, picking, rendering
 *
 * Frame order (single-threaded):
 * 1. World::setViewpoint() - may run a retention pass that generates and meshes chunks
 * 2. Queued block edits, in submission order
 * 3. Raycast from the view position along the view direction
 * Rendering then reads the chunk map, which no longer changes this frame.
 *
 * Edits that act on "the target" use the target picked in the previous frame,
 * i.e. the block that was outlined when the input arrived.
 */

#pragma once

#include "block.h"
#include "chunk_renderer.h"
#include "target_info.h"
#include "world.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Camera input for one frame
 */
struct ViewState {
    glm::vec3 position{0.0f};
    glm::vec3 direction{0.0f, 0.0f, -1.0f};  ///< Need not be normalized
};

/**
 * @brief Unit view direction from yaw/pitch in degrees (yaw 0 looks along +X)
 */
glm::vec3 directionFromYawPitch(float yawDegrees, float pitchDegrees);

enum class EditKind : uint8_t {
    SetAt,               ///< Write `block` at `global`
    PlaceAtViewpoint,    ///< Write `block` at the block containing the viewpoint
    BreakTarget,         ///< Replace the current target with air
    PlaceAgainstTarget   ///< Write `block` in front of the target's struck face
};

/**
 * @brief One input-driven block change
 */
struct BlockEdit {
    EditKind kind = EditKind::SetAt;
    glm::ivec3 global{0};
    Block block;

    static BlockEdit setAt(const glm::ivec3& global, const Block& block) { return {EditKind::SetAt, global, block}; }
    static BlockEdit placeAtViewpoint(const Block& block) { return {EditKind::PlaceAtViewpoint, glm::ivec3(0), block}; }
    static BlockEdit breakTarget() { return {EditKind::BreakTarget, glm::ivec3(0), Block::air()}; }
    static BlockEdit placeAgainstTarget(const Block& block) { return {EditKind::PlaceAgainstTarget, glm::ivec3(0), block}; }
};

/**
 * @brief Snapshot for an on-screen debug panel
 */
struct DebugInfo {
    ChunkCoord viewpointChunk;
    glm::vec3 eye{0.0f};
    Block blockUnderViewpoint;
    std::optional<BlockTarget> target;
    size_t loadedChunks = 0;

    /// Multi-line text: chunk, eye, block under camera, target
    std::string format() const;
};

class WorldSession {
public:
    /**
     * @param world World to drive (borrowed)
     * @param pickDistance Raycast reach
     * @param pickStep Raycast step
     */
    WorldSession(World& world,
                 float pickDistance = PickerConstants::DEFAULT_MAX_DISTANCE,
                 float pickStep = PickerConstants::DEFAULT_STEP);

    /**
     * @brief Runs one frame's update
     * @return Number of edits that changed the world
     */
    size_t update(const ViewState& view, const std::vector<BlockEdit>& edits = {});

    const std::optional<BlockTarget>& target() const { return m_target; }

    void toggleWireframe() { m_wireframe = !m_wireframe; }
    void setWireframe(bool enabled) { m_wireframe = enabled; }
    bool wireframe() const { return m_wireframe; }

    /**
     * @brief Records this frame's draws
     */
    FrameDrawStats render(RenderSink& sink) const;

    /**
     * @brief Debug snapshot
     * @throws std::out_of_range before the first update()
     */
    DebugInfo debugInfo() const;

    uint64_t frameCount() const { return m_frame; }
    const World& world() const { return m_world; }

private:
    bool applyEdit(const BlockEdit& edit);

    World& m_world;
    float m_pickDistance;
    float m_pickStep;
    ViewState m_view;
    std::optional<BlockTarget> m_target;
    bool m_wireframe = false;
    uint64_t m_frame = 0;
};
