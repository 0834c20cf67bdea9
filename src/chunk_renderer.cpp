#include "chunk_renderer.h"
#include "world.h"
#include <algorithm>
#include <vector>

PipelineState pipelineStateFor(RenderMode mode) {
    switch (mode) {
        case RenderMode::Wireframe:
            return {PolygonMode::Line, false, DepthCompare::LessOrEqual, true};
        case RenderMode::Normal:
        default:
            return {PolygonMode::Fill, true, DepthCompare::LessOrEqual, true};
    }
}

PipelineState outlinePipelineState() {
    return {PolygonMode::Line, false, DepthCompare::Less, true};
}

const char* renderModeName(RenderMode mode) {
    return mode == RenderMode::Wireframe ? "wireframe" : "normal";
}

std::array<glm::vec3, 24> outlineVertices(const glm::ivec3& global, float inflate) {
    const glm::vec3 center(global);
    const float h = 0.5f + inflate;
    const glm::vec3 lo = center - glm::vec3(h);
    const glm::vec3 hi = center + glm::vec3(h);

    std::array<glm::vec3, 24> v;
    size_t n = 0;
    auto addLine = [&](const glm::vec3& a, const glm::vec3& b) {
        v[n++] = a;
        v[n++] = b;
    };

    // Bottom face edges
    addLine({lo.x, lo.y, lo.z}, {hi.x, lo.y, lo.z});
    addLine({hi.x, lo.y, lo.z}, {hi.x, lo.y, hi.z});
    addLine({hi.x, lo.y, hi.z}, {lo.x, lo.y, hi.z});
    addLine({lo.x, lo.y, hi.z}, {lo.x, lo.y, lo.z});

    // Top face edges
    addLine({lo.x, hi.y, lo.z}, {hi.x, hi.y, lo.z});
    addLine({hi.x, hi.y, lo.z}, {hi.x, hi.y, hi.z});
    addLine({hi.x, hi.y, hi.z}, {lo.x, hi.y, hi.z});
    addLine({lo.x, hi.y, hi.z}, {lo.x, hi.y, lo.z});

    // Vertical edges
    addLine({lo.x, lo.y, lo.z}, {lo.x, hi.y, lo.z});
    addLine({hi.x, lo.y, lo.z}, {hi.x, hi.y, lo.z});
    addLine({hi.x, lo.y, hi.z}, {hi.x, hi.y, hi.z});
    addLine({lo.x, lo.y, hi.z}, {lo.x, hi.y, hi.z});

    return v;
}

size_t ChunkRenderer::recordPass(const World& world, RenderMode mode, RenderSink& sink) {
    sink.bindPipeline(mode, pipelineStateFor(mode));

    // Stable draw order keeps captured frames comparable
    std::vector<const Chunk*> drawable;
    world.forEachChunk([&drawable](const Chunk& chunk) {
        const ChunkMesh* mesh = chunk.mesh();
        if (mesh && !mesh->data.empty()) {
            drawable.push_back(&chunk);
        }
    });
    std::sort(drawable.begin(), drawable.end(),
              [](const Chunk* a, const Chunk* b) { return a->coord() < b->coord(); });

    for (const Chunk* chunk : drawable) {
        const ChunkMesh* mesh = chunk->mesh();
        sink.drawChunk(chunk->coord(), mesh->handle, static_cast<uint32_t>(mesh->data.indices.size()));
    }
    return drawable.size();
}

FrameDrawStats ChunkRenderer::recordFrame(const World& world,
                                          bool wireframe,
                                          const std::optional<BlockTarget>& target,
                                          RenderSink& sink) {
    FrameDrawStats stats;
    stats.normalDraws = recordPass(world, RenderMode::Normal, sink);

    if (wireframe) {
        stats.wireframeDraws = recordPass(world, RenderMode::Wireframe, sink);
    }

    if (target) {
        sink.drawOutline(outlinePipelineState(), outlineVertices(target->toGlobal()));
        stats.outlineDrawn = true;
    }
    return stats;
}
