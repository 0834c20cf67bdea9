/**
 * @file main.cpp
 * @brief Headless demo: flies a viewpoint over generated terrain
 *
 * Loads config.ini and the block manifest, builds a world around the start
 * position, then runs a fixed number of frames. Each frame moves the
 * viewpoint, feeds a few scripted edits, picks a target and records the
 * draw passes into a counting sink. Progress is logged periodically.
 *
 * Usage: voxel_world_demo [--debug] [--config <file>] [--frames <n>] [--flat]
 */

#include <array>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <chrono>
#include <vector>
#include <glm/glm.hpp>
#include "block_textures.h"
#include "chunk_renderer.h"
#include "config.h"
#include "logger.h"
#include "mesh_upload.h"
#include "terrain_generator.h"
#include "world.h"
#include "world_constants.h"
#include "world_session.h"

namespace {

// Counts draw commands instead of submitting them
class CountingRenderSink : public RenderSink {
public:
    void bindPipeline(RenderMode mode, const PipelineState&) override {
        m_mode = mode;
    }

    void drawChunk(const ChunkCoord&, MeshHandle, uint32_t indexCount) override {
        if (m_mode == RenderMode::Wireframe) {
            m_wireframeIndices += indexCount;
        } else {
            m_normalIndices += indexCount;
        }
    }

    void drawOutline(const PipelineState&, const std::array<glm::vec3, 24>&) override {
        m_outlines++;
    }

    uint64_t normalIndices() const { return m_normalIndices; }
    uint64_t wireframeIndices() const { return m_wireframeIndices; }
    uint64_t outlines() const { return m_outlines; }

private:
    RenderMode m_mode = RenderMode::Normal;
    uint64_t m_normalIndices = 0;
    uint64_t m_wireframeIndices = 0;
    uint64_t m_outlines = 0;
};

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config.ini";
    bool debugMode = false;
    bool forceFlat = false;
    int framesOverride = -1;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-debug" || arg == "--debug") {
            debugMode = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--frames" && i + 1 < argc) {
            framesOverride = std::atoi(argv[++i]);
        } else if (arg == "--flat") {
            forceFlat = true;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--debug] [--config <file>] [--frames <n>] [--flat]\n";
            return 1;
        }
    }

    try {
        // Load configuration first
        Config& config = Config::instance();
        if (!config.loadFromFile(configPath)) {
            Logger::warning() << "Failed to load " << configPath << ", using default values";
        }

        WorldSettings settings = WorldSettings::fromConfig(config);
        if (forceFlat) {
            settings.generator = GeneratorKind::FLAT;
        }
        if (framesOverride >= 0) {
            settings.demoFrames = framesOverride;
        }

        Logger::setUseColors(settings.logColors);
        Logger::setMinLevel(debugMode ? LogLevel::DEBUG : Logger::parseLevel(settings.logLevel));

        BlockTextureTable textures;
        if (!textures.loadFromFile(settings.blockManifest)) {
            Logger::warning() << "Using built-in block textures";
            textures = BlockTextureTable::defaults();
        }

        std::unique_ptr<TerrainGenerator> generator;
        if (settings.generator == GeneratorKind::FLAT) {
            generator = std::make_unique<FlatTerrainGenerator>(settings.flatHeight, Block(BlockId::GRASS));
            Logger::info() << "Flat terrain, top at Y=" << settings.flatHeight;
        } else {
            generator = std::make_unique<NoiseTerrainGenerator>(settings.seed);
            Logger::info() << "Noise terrain, seed " << settings.seed;
        }

        HeadlessMeshUploader uploader;
        MeshOptions meshOptions;
        meshOptions.aoRotation = settings.aoRotation;

        World world(*generator, textures, uploader, settings.renderDistance, meshOptions);
        WorldSession session(world, settings.pickMaxDistance, settings.pickStep);
        CountingRenderSink sink;

        ViewState view;
        view.position = glm::vec3(ViewConstants::START_X, ViewConstants::START_Y, ViewConstants::START_Z);
        view.direction = directionFromYawPitch(90.0f, -35.0f);

        const auto start = std::chrono::high_resolution_clock::now();
        size_t editsApplied = 0;

        for (int frame = 0; frame < settings.demoFrames; ++frame) {
            std::vector<BlockEdit> edits;
            if (frame % 20 == 10) {
                edits.push_back(BlockEdit::breakTarget());
            }
            if (frame % 20 == 15) {
                edits.push_back(BlockEdit::placeAgainstTarget(Block(BlockId::STONE)));
            }
            if (frame == settings.demoFrames / 2) {
                session.toggleWireframe();
                Logger::info() << "Render mode: "
                               << renderModeName(session.wireframe() ? RenderMode::Wireframe : RenderMode::Normal);
            }

            editsApplied += session.update(view, edits);
            session.render(sink);

            if (frame % 30 == 0) {
                Logger::info() << "Frame " << frame << "\n" << session.debugInfo().format();
            }

            view.position.z += settings.demoSpeed;
        }

        const auto end = std::chrono::high_resolution_clock::now();
        double seconds = std::chrono::duration<double>(end - start).count();

        const auto& stats = uploader.stats();
        Logger::info() << "Ran " << settings.demoFrames << " frames in " << seconds << " s";
        Logger::info() << "Chunks loaded: " << world.chunkCount() << ", faces: " << world.totalFaceCount();
        Logger::info() << "Mesh uploads: " << stats.uploads << ", replacements: " << stats.replacements
                       << ", in-place writes: " << stats.inPlaceWrites << ", releases: " << stats.releases;
        Logger::info() << "Edits applied: " << editsApplied << ", outlines drawn: " << sink.outlines();
        Logger::info() << "Indices drawn: " << sink.normalIndices() << " normal, "
                       << sink.wireframeIndices() << " wireframe";
        return 0;

    } catch (const std::exception& e) {
        Logger::error() << "Fatal error: " << e.what();
        return 1;
    }
}
