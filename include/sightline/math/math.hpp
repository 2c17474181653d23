#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <cstdint>

namespace sightline::math {

// Planar geometry runs in double precision
using Vec2 = glm::dvec2;
using IVec2 = glm::ivec2;

// ============================================================================
// Tolerances
// ============================================================================

// Hit points and segment endpoints closer than this (in pixels) are the same vertex.
inline constexpr double POINT_MERGE_TOLERANCE = 1e-4;

// Angular offset (radians) of the two extra rays cast beside every endpoint. A ray aimed
// exactly at a corner cannot tell which side of it the view continues on; the offset rays
// resolve both sides.
inline constexpr double CORNER_PEEK_EPSILON = 1e-3;

// Ray/segment pairs whose cross-product denominator is below this are parallel or degenerate
// and never intersect.
inline constexpr double PARALLEL_EPSILON = 1e-10;

// Slack applied when accepting a segment parameter at exactly 0 or 1, so a ray aimed at an
// endpoint still hits the segment owning it after rounding.
inline constexpr double SEGMENT_PARAM_EPSILON = 1e-9;

namespace utils {
    constexpr double PI = glm::pi<double>();
    constexpr double TWO_PI = 2.0 * PI;

    // z component of the 3D cross product
    constexpr double cross(const Vec2& a, const Vec2& b) noexcept { return a.x * b.y - a.y * b.x; }

    // Angle of (to - from) in radians, range (-PI, PI]
    double angle_between(const Vec2& from, const Vec2& to) noexcept;

    double distance(const Vec2& a, const Vec2& b) noexcept;

    bool approximately_equal(double a, double b, double epsilon = POINT_MERGE_TOLERANCE) noexcept;
    bool approximately_equal(const Vec2& a, const Vec2& b, double epsilon = POINT_MERGE_TOLERANCE) noexcept;

    // max(|dx|, |dy|)
    int32_t chebyshev_distance(int32_t x1, int32_t y1, int32_t x2, int32_t y2) noexcept;
}

// Axis-aligned rectangle anchored at the origin, in pixels
struct Bounds {
    double width = 0.0;
    double height = 0.0;

    double area() const noexcept { return width * height; }
    bool contains(const Vec2& point, double epsilon = POINT_MERGE_TOLERANCE) const noexcept;
};

// Half-line from an origin along a unit direction
struct Ray2 {
    Vec2 origin{0.0};
    Vec2 direction{1.0, 0.0};

    static Ray2 from_angle(const Vec2& origin, double angle) noexcept;

    Vec2 point_at(double t) const noexcept { return origin + direction * t; }

    // Parametric intersection with segment [a, b]. On hit writes the ray parameter to t.
    // Parallel or degenerate pairs never intersect.
    bool intersects_segment(const Vec2& a, const Vec2& b, double& t) const noexcept;
};

} // namespace sightline::math
