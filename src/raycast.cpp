#include "raycast.h"
#include "world.h"
#include "logger.h"
#include <cmath>
#include <limits>
#include <stdexcept>

std::optional<BlockTarget> Raycast::pick(const World& world,
                                         const glm::vec3& origin,
                                         const glm::vec3& direction,
                                         float maxDistance,
                                         float step) {
    if (!isValidWorldPosition(origin) || !std::isfinite(direction.x) ||
        !std::isfinite(direction.y) || !std::isfinite(direction.z) || !std::isfinite(maxDistance)) {
        Logger::error() << "Raycast rejected non-finite input: origin (" << origin.x << ", " << origin.y << ", "
                        << origin.z << "), direction (" << direction.x << ", " << direction.y << ", "
                        << direction.z << "), reach " << maxDistance;
        throw std::invalid_argument("raycast origin, direction and reach must be finite");
    }
    // Guard against zero-length direction vector (normalize() would produce NaN)
    if (glm::length(direction) < 0.0001f) {
        return std::nullopt;
    }
    if (!(step > 0.0f)) {
        Logger::error() << "Raycast step must be positive, got " << step;
        throw std::invalid_argument("raycast step must be positive");
    }

    const glm::vec3 dir = glm::normalize(direction);
    const glm::vec3 delta = dir * step;

    glm::vec3 ray = origin;
    float travelled = 0.0f;

    while (travelled <= maxDistance) {
        ChunkCoord chunk = worldToChunk(ray);
        glm::ivec3 local = worldToLocal(ray);

        std::optional<Block> block = world.getBlock(chunk, local);
        if (block && isSolid(*block)) {
            BlockTarget target;
            target.chunk = chunk;
            target.local = local;
            target.block = *block;
            target.distance = travelled;
            target.face = entryFace(ray - delta, dir, glm::vec3(chunkLocalToGlobal(chunk, local)));
            return target;
        }

        ray += delta;
        travelled += step;
    }

    return std::nullopt;
}

FaceDirection Raycast::entryFace(const glm::vec3& previousSample,
                                 const glm::vec3& direction,
                                 const glm::vec3& blockCenter) {
    // Ray/box entry test against the unit box around the block center:
    // per axis, t = -(ro / d) - 0.5 / |d| is where the ray crosses that axis's
    // near slab. The largest t is the slab crossed last, i.e. the entry face.
    const glm::vec3 ro = previousSample - blockCenter;

    int bestAxis = -1;
    float bestT = -std::numeric_limits<float>::infinity();
    bool tied = false;

    for (int axis = 0; axis < 3; ++axis) {
        float d = direction[axis];
        if (std::abs(d) < 1e-6f) {
            continue;  // Parallel to this axis's faces
        }
        float t = -(ro[axis] / d) - 0.5f / std::abs(d);
        if (bestAxis < 0 || t > bestT) {
            bestAxis = axis;
            bestT = t;
            tied = false;
        } else if (t == bestT) {
            tied = true;
        }
    }

    if (bestAxis < 0 || tied) {
        Logger::error() << "Raycast: no dominant entry axis for direction ("
                        << direction.x << ", " << direction.y << ", " << direction.z << ")";
        throw std::logic_error("degenerate raycast entry face");
    }

    // Entered through the face pointing back toward the ray
    return faceFromAxis(bestAxis, direction[bestAxis] < 0.0f);
}
