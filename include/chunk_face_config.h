/**
 * @file chunk_face_config.h
 * @brief Face directions and the unit-cube tables used by the chunk mesher
 *
 * One face table, one winding convention and one AO corner mapping are
 * used throughout:
 * - Cube corners are stored in half-block units (+-1 means +-0.5 from the
 *   block center), so doubled vertex positions stay integral.
 * - Each face lists its 4 corners clockwise as seen from outside the cube.
 *   Triangles use the fan 0,1,2 / 2,3,0, so the pipeline culls
 *   counter-clockwise (back) faces.
 * - The AO cells of a face corner are derived from that corner's signs on the
 *   two in-plane axes (see aoProbeOffsets()).
 *
 * Usage:
 *   for (const auto& face : FACE_CONFIGS) {
 *       glm::ivec3 neighbor = pos + face.normal;
 *       ...
 *   }
 */

#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstdint>

/**
 * @brief Face direction; the value is the 3-bit direction index stored in BlockVertex
 */
enum class FaceDirection : uint8_t {
    PosX = 0,  // Right face (+X)
    NegX = 1,  // Left face (-X)
    PosY = 2,  // Top face (+Y)
    NegY = 3,  // Bottom face (-Y)
    PosZ = 4,  // Front face (+Z)
    NegZ = 5   // Back face (-Z)
};

constexpr int FACE_COUNT = 6;

/**
 * @brief Unit cube corners in half-block units
 *
 * Index:  0 (+,+,+)  1 (+,+,-)  2 (-,+,-)  3 (-,+,+)
 *         4 (+,-,+)  5 (+,-,-)  6 (-,-,-)  7 (-,-,+)
 */
static constexpr std::array<glm::ivec3, 8> CUBE_CORNERS = {{
    { 1,  1,  1},
    { 1,  1, -1},
    {-1,  1, -1},
    {-1,  1,  1},
    { 1, -1,  1},
    { 1, -1, -1},
    {-1, -1, -1},
    {-1, -1,  1}
}};

/// Two triangles per face quad, relative to the face's first vertex
static constexpr std::array<uint32_t, 6> FACE_INDEX_FAN = {{0, 1, 2, 2, 3, 0}};

/**
 * @brief Everything the mesher needs to know about one cube face
 */
struct FaceConfig {
    FaceDirection direction;            ///< Which face this is
    glm::ivec3 normal;                  ///< Unit offset to the neighbour cell
    uint8_t axis;                       ///< 0 = X, 1 = Y, 2 = Z
    bool positive;                      ///< Normal points along +axis
    uint8_t tangentA;                   ///< First in-plane axis
    uint8_t tangentB;                   ///< Second in-plane axis
    std::array<uint8_t, 4> corners;     ///< Indices into CUBE_CORNERS, clockwise from outside
    const char* name;                   ///< "+X", "-Y", ...
};

/**
 * @brief Static configuration for all 6 cube faces, indexed by FaceDirection
 */
static constexpr std::array<FaceConfig, FACE_COUNT> FACE_CONFIGS = {{
    { FaceDirection::PosX, {+1, 0, 0}, 0, true,  1, 2, {5, 4, 0, 1}, "+X" },
    { FaceDirection::NegX, {-1, 0, 0}, 0, false, 1, 2, {7, 6, 2, 3}, "-X" },
    { FaceDirection::PosY, {0, +1, 0}, 1, true,  0, 2, {3, 2, 1, 0}, "+Y" },
    { FaceDirection::NegY, {0, -1, 0}, 1, false, 0, 2, {4, 5, 6, 7}, "-Y" },
    { FaceDirection::PosZ, {0, 0, +1}, 2, true,  0, 1, {4, 7, 3, 0}, "+Z" },
    { FaceDirection::NegZ, {0, 0, -1}, 2, false, 0, 1, {6, 5, 1, 2}, "-Z" }
}};

inline const FaceConfig& getFaceConfig(FaceDirection dir) {
    return FACE_CONFIGS[static_cast<size_t>(dir)];
}

inline const char* faceDirectionName(FaceDirection dir) {
    return getFaceConfig(dir).name;
}

/**
 * @brief Face whose normal is +-1 along the given axis
 * @param axis 0 = X, 1 = Y, 2 = Z
 * @param positive True for the + face
 */
inline FaceDirection faceFromAxis(int axis, bool positive) {
    return static_cast<FaceDirection>(axis * 2 + (positive ? 0 : 1));
}

/**
 * @brief Cells sampled for one face corner's ambient occlusion
 *
 * All three offsets are relative to the block that owns the face and lie in
 * the layer in front of the face (block + normal).
 */
struct AOProbeOffsets {
    glm::ivec3 edgeA;   ///< Shares the corner along tangentA
    glm::ivec3 edgeB;   ///< Shares the corner along tangentB
    glm::ivec3 corner;  ///< Diagonal cell
};

/**
 * @brief AO sample offsets for corner slot `slot` (0-3) of a face
 */
inline AOProbeOffsets aoProbeOffsets(const FaceConfig& face, int slot) {
    const glm::ivec3& c = CUBE_CORNERS[face.corners[slot]];

    glm::ivec3 stepA(0);
    glm::ivec3 stepB(0);
    stepA[face.tangentA] = c[face.tangentA];
    stepB[face.tangentB] = c[face.tangentB];

    AOProbeOffsets probes;
    probes.edgeA = face.normal + stepA;
    probes.edgeB = face.normal + stepB;
    probes.corner = face.normal + stepA + stepB;
    return probes;
}
