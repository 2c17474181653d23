#include <sightline/math/math.hpp>

#include <cmath>
#include <cstdlib>
#include <algorithm>

namespace sightline::math {

namespace utils {

double angle_between(const Vec2& from, const Vec2& to) noexcept {
    return std::atan2(to.y - from.y, to.x - from.x);
}

double distance(const Vec2& a, const Vec2& b) noexcept {
    return glm::length(b - a);
}

bool approximately_equal(double a, double b, double epsilon) noexcept {
    return std::abs(a - b) < epsilon;
}

bool approximately_equal(const Vec2& a, const Vec2& b, double epsilon) noexcept {
    Vec2 d = b - a;
    return glm::dot(d, d) < epsilon * epsilon;
}

int32_t chebyshev_distance(int32_t x1, int32_t y1, int32_t x2, int32_t y2) noexcept {
    return std::max(std::abs(x2 - x1), std::abs(y2 - y1));
}

} // namespace utils

bool Bounds::contains(const Vec2& point, double epsilon) const noexcept {
    return point.x >= -epsilon && point.y >= -epsilon &&
           point.x <= width + epsilon && point.y <= height + epsilon;
}

Ray2 Ray2::from_angle(const Vec2& origin, double angle) noexcept {
    return Ray2{origin, Vec2(std::cos(angle), std::sin(angle))};
}

bool Ray2::intersects_segment(const Vec2& a, const Vec2& b, double& t) const noexcept {
    // origin + direction * t == a + (b - a) * s
    Vec2 edge = b - a;
    double denom = utils::cross(direction, edge);
    if (std::abs(denom) < PARALLEL_EPSILON) {
        return false;
    }

    Vec2 to_start = a - origin;
    double ray_t = utils::cross(to_start, edge) / denom;
    double seg_s = utils::cross(to_start, direction) / denom;

    if (ray_t < 0.0) {
        return false;
    }
    if (seg_s < -SEGMENT_PARAM_EPSILON || seg_s > 1.0 + SEGMENT_PARAM_EPSILON) {
        return false;
    }

    t = ray_t;
    return true;
}

} // namespace sightline::math
