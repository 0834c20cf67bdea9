#pragma once

#include "target_info.h"
#include "world_constants.h"
#include <glm/glm.hpp>
#include <optional>

// Forward declaration
class World;

// Fixed-step ray marcher that finds the first solid block along a ray.
//
// Each sample is resolved to a chunk + local block with the same rounding
// rules as the rest of the world. Unloaded chunks are passed through.
// A step of 0.1 cannot skip a full block, so single-block walls are always hit.
class Raycast {
public:
    // Cast a ray from origin along direction (normalized internally).
    // Returns std::nullopt when nothing solid lies within maxDistance, or
    // when direction has zero length.
    // Throws std::invalid_argument for a non-positive step, a non-finite or
    // out-of-range origin, or a non-finite direction or reach.
    // Throws std::logic_error if the struck face cannot be determined.
    static std::optional<BlockTarget> pick(const World& world,
                                           const glm::vec3& origin,
                                           const glm::vec3& direction,
                                           float maxDistance = PickerConstants::DEFAULT_MAX_DISTANCE,
                                           float step = PickerConstants::DEFAULT_STEP);

    // Face of the block centered at blockCenter that a ray entered through.
    // previousSample is the last sample before the hit; direction must be normalized.
    static FaceDirection entryFace(const glm::vec3& previousSample,
                                   const glm::vec3& direction,
                                   const glm::vec3& blockCenter);
};
