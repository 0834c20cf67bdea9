/**
 * @file block_picker_test.cpp
 * @brief Tests for ray picking, frame updates and draw recording
 *
 * Tests:
 * 1. Looking straight down hits the ground's top face
 * 2. Reach limit and misses
 * 3. Side faces and placement cells
 * 4. A single block on a diagonal ray is not skipped
 * 5. Degenerate entry directions throw
 * 6. Break/place edits use the previous frame's target
 * 7. Placing at the viewpoint and picking from inside a block
 * 8. Draw passes: normal, wireframe, outline
 * 9. Pipeline states and outline geometry
 * 10. Debug snapshot
 * 11. Non-finite ray input throws
 */

#include "test_utils.h"
#include "block_textures.h"
#include "mesh_upload.h"
#include "raycast.h"
#include "terrain_generator.h"
#include "world.h"
#include "world_session.h"
#include <limits>

// ============================================================
// Test 1: Straight Down
// ============================================================

TEST(straight_down_hits_top_face) {
    FlatTerrainGenerator generator(128);
    BlockTextureTable textures = BlockTextureTable::defaults();
    HeadlessMeshUploader uploader;
    World world(generator, textures, uploader, 2);

    glm::vec3 origin(16.0f, 150.0f, 16.0f);
    world.setViewpoint(origin);

    auto target = Raycast::pick(world, origin, glm::vec3(0.0f, -1.0f, 0.0f), 32.0f);
    ASSERT_TRUE(target.has_value());
    ASSERT_EQ(target->toGlobal(), glm::ivec3(16, 128, 16));
    ASSERT_TRUE(target->chunk == ChunkCoord(0, 4, 0));
    ASSERT_EQ(target->local, glm::ivec3(16, 0, 16));
    ASSERT_TRUE(target->face == FaceDirection::PosY);
    ASSERT_TRUE(target->block == Block(BlockId::STONE));
    ASSERT_EQ(target->placementCoords(), glm::ivec3(16, 129, 16));
    ASSERT_NEAR(target->distance, 21.5f, 0.15f);
}

// ============================================================
// Test 2: Reach And Misses
// ============================================================

TEST(reach_limit_and_misses) {
    FlatTerrainGenerator generator(128);
    BlockTextureTable textures = BlockTextureTable::defaults();
    HeadlessMeshUploader uploader;
    World world(generator, textures, uploader, 2);

    glm::vec3 origin(16.0f, 150.0f, 16.0f);
    world.setViewpoint(origin);

    // Ground is about 21.5 blocks away, past the default reach
    ASSERT_FALSE(Raycast::pick(world, origin, glm::vec3(0.0f, -1.0f, 0.0f)).has_value());
    ASSERT_FALSE(Raycast::pick(world, origin, glm::vec3(0.0f, 1.0f, 0.0f), 32.0f).has_value());
    ASSERT_FALSE(Raycast::pick(world, origin, glm::vec3(0.0f), 32.0f).has_value());
    ASSERT_THROWS(Raycast::pick(world, origin, glm::vec3(0.0f, -1.0f, 0.0f), 32.0f, 0.0f),
                  std::invalid_argument);

    // Direction need not be normalized
    auto scaled = Raycast::pick(world, origin, glm::vec3(0.0f, -5.0f, 0.0f), 32.0f);
    ASSERT_TRUE(scaled.has_value());
    ASSERT_EQ(scaled->toGlobal(), glm::ivec3(16, 128, 16));
}

// ============================================================
// Test 3: Side Faces
// ============================================================

TEST(side_face_and_placement) {
    MockTerrainGenerator generator;
    ChunkData data;
    data.setBlock(10, 5, 5, Block(BlockId::DIRT));
    generator.chunks[ChunkCoord(0, 0, 0)] = data;
    BlockTextureTable textures = BlockTextureTable::defaults();
    HeadlessMeshUploader uploader;
    World world(generator, textures, uploader, 1);

    glm::vec3 origin(5.0f, 5.0f, 5.0f);
    world.setViewpoint(origin);

    auto fromWest = Raycast::pick(world, origin, glm::vec3(1.0f, 0.0f, 0.0f));
    ASSERT_TRUE(fromWest.has_value());
    ASSERT_EQ(fromWest->toGlobal(), glm::ivec3(10, 5, 5));
    ASSERT_TRUE(fromWest->face == FaceDirection::NegX);
    ASSERT_EQ(fromWest->placementCoords(), glm::ivec3(9, 5, 5));
    ASSERT_TRUE(fromWest->block == Block(BlockId::DIRT));

    glm::vec3 east(15.0f, 5.0f, 5.0f);
    auto fromEast = Raycast::pick(world, east, glm::vec3(-1.0f, 0.0f, 0.0f));
    ASSERT_TRUE(fromEast.has_value());
    ASSERT_TRUE(fromEast->face == FaceDirection::PosX);
    ASSERT_EQ(fromEast->placementCoords(), glm::ivec3(11, 5, 5));

    glm::vec3 north(10.0f, 5.0f, 12.0f);
    auto fromNorth = Raycast::pick(world, north, glm::vec3(0.0f, 0.0f, -1.0f));
    ASSERT_TRUE(fromNorth.has_value());
    ASSERT_TRUE(fromNorth->face == FaceDirection::PosZ);
}

// ============================================================
// Test 4: Thin Target On A Diagonal
// ============================================================

TEST(single_block_on_diagonal_ray) {
    MockTerrainGenerator generator;
    ChunkData data;
    data.setBlock(10, 6, 5, Block(BlockId::SNOW));
    generator.chunks[ChunkCoord(0, 0, 0)] = data;
    BlockTextureTable textures = BlockTextureTable::defaults();
    HeadlessMeshUploader uploader;
    World world(generator, textures, uploader, 1);

    glm::vec3 origin(5.0f, 5.0f, 5.0f);
    world.setViewpoint(origin);

    auto target = Raycast::pick(world, origin, glm::vec3(1.0f, 0.2f, 0.1f));
    ASSERT_TRUE(target.has_value());
    ASSERT_EQ(target->toGlobal(), glm::ivec3(10, 6, 5));
    ASSERT_TRUE(target->face == FaceDirection::NegX);

    // Slightly off to the side it misses entirely
    ASSERT_FALSE(Raycast::pick(world, origin, glm::vec3(1.0f, 0.2f, 0.3f)).has_value());
}

// ============================================================
// Test 5: Degenerate Entry
// ============================================================

TEST(degenerate_entry_throws) {
    glm::vec3 center(0.0f);

    // Exactly through an edge: X and Y slabs are crossed at the same time
    glm::vec3 diagonal = glm::normalize(glm::vec3(1.0f, 1.0f, 0.0f));
    ASSERT_THROWS(Raycast::entryFace(glm::vec3(-0.6f, -0.6f, 0.0f), diagonal, center), std::logic_error);

    ASSERT_THROWS(Raycast::entryFace(glm::vec3(-0.6f, 0.0f, 0.0f), glm::vec3(0.0f), center), std::logic_error);

    // Axis-aligned rays ignore the parallel axes
    ASSERT_TRUE(Raycast::entryFace(glm::vec3(0.0f, 0.6f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f), center) ==
                FaceDirection::PosY);
    ASSERT_TRUE(Raycast::entryFace(glm::vec3(0.0f, 0.0f, -0.55f), glm::vec3(0.0f, 0.0f, 1.0f), center) ==
                FaceDirection::NegZ);
}

// ============================================================
// Test 6: Frame Edits
// ============================================================

TEST(break_and_place_use_previous_target) {
    FlatTerrainGenerator generator(128);
    BlockTextureTable textures = BlockTextureTable::defaults();
    HeadlessMeshUploader uploader;
    World world(generator, textures, uploader, 2);
    WorldSession session(world, 32.0f);

    ViewState view;
    view.position = glm::vec3(16.0f, 150.0f, 16.0f);
    view.direction = glm::vec3(0.0f, -1.0f, 0.0f);

    // No target yet: nothing to break
    ASSERT_EQ(session.update(view, {BlockEdit::breakTarget()}), 0u);
    ASSERT_TRUE(session.target().has_value());
    ASSERT_EQ(session.target()->toGlobal(), glm::ivec3(16, 128, 16));
    ASSERT_EQ(session.frameCount(), 1u);

    ASSERT_EQ(session.update(view, {BlockEdit::breakTarget()}), 1u);
    ASSERT_TRUE(world.getBlock(glm::ivec3(16, 128, 16))->isAir());
    ASSERT_EQ(session.target()->toGlobal(), glm::ivec3(16, 127, 16));
    ASSERT_TRUE(session.target()->face == FaceDirection::PosY);

    // Goes on top of the block now targeted, filling the hole again
    ASSERT_EQ(session.update(view, {BlockEdit::placeAgainstTarget(Block(BlockId::GRASS))}), 1u);
    ASSERT_TRUE(world.getBlock(glm::ivec3(16, 128, 16)) == Block(BlockId::GRASS));
    ASSERT_EQ(session.target()->toGlobal(), glm::ivec3(16, 128, 16));

    // Explicit coordinates; outside the loaded region the edit is dropped
    std::vector<BlockEdit> edits = {
        BlockEdit::setAt(glm::ivec3(0, 140, 0), Block(BlockId::STONE)),
        BlockEdit::setAt(glm::ivec3(0, 140, 1000), Block(BlockId::STONE))
    };
    ASSERT_EQ(session.update(view, edits), 1u);
    ASSERT_TRUE(world.getBlock(glm::ivec3(0, 140, 0)) == Block(BlockId::STONE));
}

// ============================================================
// Test 7: Viewpoint Placement
// ============================================================

TEST(place_at_viewpoint) {
    FlatTerrainGenerator generator(128);
    BlockTextureTable textures = BlockTextureTable::defaults();
    HeadlessMeshUploader uploader;
    World world(generator, textures, uploader, 2);
    WorldSession session(world, 32.0f);

    ViewState view;
    view.position = glm::vec3(16.2f, 140.4f, 15.8f);
    view.direction = glm::vec3(0.0f, -1.0f, 0.0f);

    ASSERT_EQ(session.update(view, {BlockEdit::placeAtViewpoint(Block(BlockId::SNOW))}), 1u);
    ASSERT_TRUE(world.getBlock(glm::ivec3(16, 140, 16)) == Block(BlockId::SNOW));
    ASSERT_TRUE(world.blockUnderViewpoint() == Block(BlockId::SNOW));

    // The ray starts inside the new block
    ASSERT_TRUE(session.target().has_value());
    ASSERT_EQ(session.target()->toGlobal(), glm::ivec3(16, 140, 16));
    ASSERT_NEAR(session.target()->distance, 0.0f, 1e-6f);
}

// ============================================================
// Test 8: Draw Passes
// ============================================================

TEST(draw_passes_in_order) {
    FlatTerrainGenerator generator(128);
    BlockTextureTable textures = BlockTextureTable::defaults();
    HeadlessMeshUploader uploader;
    World world(generator, textures, uploader, 2);
    WorldSession session(world, 32.0f);

    ViewState view;
    view.position = glm::vec3(16.0f, 150.0f, 16.0f);
    view.direction = glm::vec3(0.0f, -1.0f, 0.0f);
    session.update(view);

    // Only the nine surface chunks of the y = 4 layer have exposed faces
    ASSERT_EQ(world.totalFaceCount(), 9u * 1024u);

    RecordingRenderSink plain;
    FrameDrawStats stats = session.render(plain);
    ASSERT_EQ(stats.normalDraws, 9u);
    ASSERT_EQ(stats.wireframeDraws, 0u);
    ASSERT_TRUE(stats.outlineDrawn);
    ASSERT_TRUE(plain.commands.front().kind == RecordingRenderSink::Command::BIND);
    ASSERT_TRUE(plain.commands.back().kind == RecordingRenderSink::Command::OUTLINE);
    ASSERT_TRUE(plain.outlineState == outlinePipelineState());
    ASSERT_EQ(plain.count(RecordingRenderSink::Command::DRAW, RenderMode::Wireframe), 0u);

    // Draws are sorted by chunk coordinate and carry the full index count
    ChunkCoord previous(-100, -100, -100);
    for (const auto& cmd : plain.commands) {
        if (cmd.kind != RecordingRenderSink::Command::DRAW) continue;
        ASSERT_TRUE(previous < cmd.chunk);
        ASSERT_EQ(cmd.indexCount, 1024u * 6u);
        previous = cmd.chunk;
    }

    session.toggleWireframe();
    ASSERT_TRUE(session.wireframe());
    RecordingRenderSink wire;
    stats = session.render(wire);
    ASSERT_EQ(stats.normalDraws, 9u);
    ASSERT_EQ(stats.wireframeDraws, 9u);
    ASSERT_EQ(wire.count(RecordingRenderSink::Command::BIND, RenderMode::Normal), 1u);
    ASSERT_EQ(wire.count(RecordingRenderSink::Command::BIND, RenderMode::Wireframe), 1u);
    ASSERT_EQ(wire.count(RecordingRenderSink::Command::DRAW, RenderMode::Wireframe), 9u);

    // Normal pass first, wireframe second, outline last
    ASSERT_TRUE(wire.commands[0].mode == RenderMode::Normal);
    ASSERT_TRUE(wire.commands[10].kind == RecordingRenderSink::Command::BIND);
    ASSERT_TRUE(wire.commands[10].mode == RenderMode::Wireframe);
    ASSERT_TRUE(wire.commands.back().kind == RecordingRenderSink::Command::OUTLINE);

    // No target, no outline
    view.direction = glm::vec3(0.0f, 1.0f, 0.0f);
    session.update(view);
    session.setWireframe(false);
    RecordingRenderSink sky;
    stats = session.render(sky);
    ASSERT_FALSE(stats.outlineDrawn);
    ASSERT_EQ(sky.count(RecordingRenderSink::Command::OUTLINE, RenderMode::Normal), 0u);
}

// ============================================================
// Test 9: Pipeline States And Outline
// ============================================================

TEST(pipeline_states_and_outline) {
    PipelineState normal = pipelineStateFor(RenderMode::Normal);
    ASSERT_TRUE(normal.polygonMode == PolygonMode::Fill);
    ASSERT_TRUE(normal.depthWrite);
    ASSERT_TRUE(normal.depthCompare == DepthCompare::LessOrEqual);
    ASSERT_TRUE(normal.cullBackFaces);

    PipelineState wire = pipelineStateFor(RenderMode::Wireframe);
    ASSERT_TRUE(wire.polygonMode == PolygonMode::Line);
    ASSERT_FALSE(wire.depthWrite);
    ASSERT_TRUE(wire.depthCompare == DepthCompare::LessOrEqual);
    ASSERT_TRUE(wire.cullBackFaces);
    ASSERT_FALSE(normal == wire);
    ASSERT_EQ(std::string(renderModeName(RenderMode::Normal)), std::string("normal"));
    ASSERT_EQ(std::string(renderModeName(RenderMode::Wireframe)), std::string("wireframe"));

    // Outline lines test strictly and leave depth alone
    PipelineState outline = outlinePipelineState();
    ASSERT_TRUE(outline.polygonMode == PolygonMode::Line);
    ASSERT_FALSE(outline.depthWrite);
    ASSERT_TRUE(outline.depthCompare == DepthCompare::Less);

    auto lines = outlineVertices(glm::ivec3(3, -2, 7));
    glm::vec3 lo(1e9f), hi(-1e9f);
    for (const glm::vec3& p : lines) {
        lo = glm::min(lo, p);
        hi = glm::max(hi, p);
    }
    ASSERT_NEAR(lo.x, 2.495f, 1e-4f);
    ASSERT_NEAR(hi.x, 3.505f, 1e-4f);
    ASSERT_NEAR(lo.y, -2.505f, 1e-4f);
    ASSERT_NEAR(hi.z, 7.505f, 1e-4f);

    // Each of the 12 segments runs along exactly one axis
    for (size_t i = 0; i < lines.size(); i += 2) {
        glm::vec3 d = glm::abs(lines[i + 1] - lines[i]);
        int moving = (d.x > 0.5f) + (d.y > 0.5f) + (d.z > 0.5f);
        ASSERT_EQ(moving, 1);
    }
}

// ============================================================
// Test 10: Debug Snapshot
// ============================================================

TEST(debug_snapshot) {
    FlatTerrainGenerator generator(128);
    BlockTextureTable textures = BlockTextureTable::defaults();
    HeadlessMeshUploader uploader;
    World world(generator, textures, uploader, 2);
    WorldSession session(world, 32.0f);

    ASSERT_THROWS(session.debugInfo(), std::out_of_range);

    ViewState view;
    view.position = glm::vec3(16.0f, 150.0f, 16.0f);
    view.direction = directionFromYawPitch(0.0f, -90.0f);
    ASSERT_NEAR(view.direction.y, -1.0f, 1e-5f);
    session.update(view);

    DebugInfo info = session.debugInfo();
    ASSERT_TRUE(info.viewpointChunk == ChunkCoord(0, 4, 0));
    ASSERT_TRUE(info.blockUnderViewpoint.isAir());
    ASSERT_TRUE(info.target.has_value());
    ASSERT_EQ(info.loadedChunks, world.chunkCount());

    std::string text = info.format();
    ASSERT_TRUE(text.find("chunk: (0, 4, 0)") != std::string::npos);
    ASSERT_TRUE(text.find("block under camera: air") != std::string::npos);
    ASSERT_TRUE(text.find("face +Y") != std::string::npos);

    glm::vec3 forward = directionFromYawPitch(90.0f, 0.0f);
    ASSERT_NEAR(forward.z, 1.0f, 1e-5f);
    ASSERT_NEAR(forward.x, 0.0f, 1e-5f);
}

// ============================================================
// Test 11: Non-Finite Ray Input
// ============================================================

TEST(non_finite_ray_throws) {
    FlatTerrainGenerator generator(128);
    BlockTextureTable textures = BlockTextureTable::defaults();
    HeadlessMeshUploader uploader;
    World world(generator, textures, uploader, 2);

    glm::vec3 origin(16.0f, 150.0f, 16.0f);
    world.setViewpoint(origin);

    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    const glm::vec3 down(0.0f, -1.0f, 0.0f);

    ASSERT_THROWS(Raycast::pick(world, glm::vec3(nan, 150.0f, 16.0f), down, 32.0f), std::invalid_argument);
    ASSERT_THROWS(Raycast::pick(world, glm::vec3(16.0f, inf, 16.0f), down, 32.0f), std::invalid_argument);
    ASSERT_THROWS(Raycast::pick(world, origin, glm::vec3(0.0f, -1.0f, nan), 32.0f), std::invalid_argument);
    ASSERT_THROWS(Raycast::pick(world, origin, glm::vec3(-inf, 0.0f, 0.0f), 32.0f), std::invalid_argument);

    // The session forwards the same check through its viewpoint update
    WorldSession session(world, 32.0f);
    ViewState view;
    view.position = glm::vec3(16.0f, 150.0f, 16.0f);
    view.direction = glm::vec3(nan);
    ASSERT_THROWS(session.update(view), std::invalid_argument);

    // Finite input still picks after the rejected calls
    auto target = Raycast::pick(world, origin, down, 32.0f);
    ASSERT_TRUE(target.has_value());
    ASSERT_EQ(target->toGlobal(), glm::ivec3(16, 128, 16));
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
