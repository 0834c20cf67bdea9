/**
 * @file chunk_renderer.h
 * @brief Per-frame draw recording for chunk meshes and the target outline
 *
 * The renderer does not talk to a GPU. It walks the world's meshes and issues
 * abstract commands to a RenderSink, which a graphics backend implements.
 * Frame order:
 * 1. Normal pass (filled polygons) over every chunk with geometry
 * 2. Wireframe pass over the same chunks, only when enabled
 * 3. Outline of the targeted block, if any
 */

#pragma once

#include "mesh_upload.h"
#include "target_info.h"
#include "world_utils.h"
#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <optional>

class World;

enum class RenderMode : uint8_t {
    Normal,
    Wireframe
};

enum class PolygonMode : uint8_t {
    Fill,
    Line
};

enum class DepthCompare : uint8_t {
    Less,
    LessOrEqual
};

/**
 * @brief Fixed-function state selected by a RenderMode
 */
struct PipelineState {
    PolygonMode polygonMode;
    bool depthWrite;
    DepthCompare depthCompare;
    bool cullBackFaces;

    bool operator==(const PipelineState& other) const {
        return polygonMode == other.polygonMode && depthWrite == other.depthWrite &&
               depthCompare == other.depthCompare && cullBackFaces == other.cullBackFaces;
    }
};

/**
 * @brief Pipeline state for a render mode
 *
 * Both modes test LESS_OR_EQUAL. Normal fills and writes depth; Wireframe
 * draws lines over the filled pass without writing depth, so coplanar
 * edges pass.
 */
PipelineState pipelineStateFor(RenderMode mode);

/**
 * @brief Line state for the target outline: LESS, no depth write
 */
PipelineState outlinePipelineState();

/// "normal" or "wireframe"
const char* renderModeName(RenderMode mode);

/**
 * @brief Line list outlining one block: 12 edges, 24 endpoints
 * @param global Global block coordinate (block spans +-0.5 around it)
 * @param inflate Outward offset that keeps the lines off the block faces
 */
std::array<glm::vec3, 24> outlineVertices(const glm::ivec3& global, float inflate = 0.005f);

/**
 * @brief Receiver of draw commands
 */
class RenderSink {
public:
    virtual ~RenderSink() = default;

    virtual void bindPipeline(RenderMode mode, const PipelineState& state) = 0;

    /**
     * @param chunk Chunk coordinate (the backend offsets by chunk * size)
     * @param mesh Uploaded mesh
     * @param indexCount Indices to draw
     */
    virtual void drawChunk(const ChunkCoord& chunk, MeshHandle mesh, uint32_t indexCount) = 0;

    virtual void drawOutline(const PipelineState& state, const std::array<glm::vec3, 24>& lines) = 0;
};

/**
 * @brief Draw counts for one frame
 */
struct FrameDrawStats {
    size_t normalDraws = 0;
    size_t wireframeDraws = 0;
    bool outlineDrawn = false;
};

class ChunkRenderer {
public:
    /**
     * @brief Records one frame
     * @param world Source of chunk meshes (not modified)
     * @param wireframe Whether to add the wireframe pass
     * @param target Block to outline
     * @param sink Command receiver
     */
    static FrameDrawStats recordFrame(const World& world,
                                      bool wireframe,
                                      const std::optional<BlockTarget>& target,
                                      RenderSink& sink);

private:
    static size_t recordPass(const World& world, RenderMode mode, RenderSink& sink);
};
