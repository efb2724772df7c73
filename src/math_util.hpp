#pragma once
#include <ecs/ecs.hpp>
#include <cmath>
#include <algorithm>

namespace engine::math {

/**
 * @brief Planar (x, y) distance between two arena positions.
 */
inline float distance_2d(const ecs::Vec3& a, const ecs::Vec3& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

/**
 * @brief Circle overlap test. Strict: exact tangency is not a collision.
 */
inline bool circles_overlap(const ecs::Vec3& a, float ra, const ecs::Vec3& b, float rb) {
    return distance_2d(a, b) < ra + rb;
}

/**
 * @brief Scales a 2D vector to unit length. Returns {0,0} for near-zero input.
 */
inline ecs::Vec2 normalize_2d(ecs::Vec2 v) {
    const float mag = std::sqrt(v.x * v.x + v.y * v.y);
    if (mag < 0.001f) return {0, 0};
    return {v.x / mag, v.y / mag};
}

/**
 * @brief Result of projecting a point onto a ray.
 * along: signed distance along the ray; off: perpendicular distance.
 */
struct RayProjection {
    float along = 0.0f;
    float off   = 0.0f;
};

inline RayProjection project_onto_ray(const ecs::Vec3& origin, const ecs::Vec3& dir,
                                      const ecs::Vec3& point) {
    const float px = point.x - origin.x;
    const float py = point.y - origin.y;
    const float along = px * dir.x + py * dir.y;
    const float cx = origin.x + dir.x * along;
    const float cy = origin.y + dir.y * along;
    const float dx = point.x - cx;
    const float dy = point.y - cy;
    return {along, std::sqrt(dx * dx + dy * dy)};
}

} // namespace engine::math
