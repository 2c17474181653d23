#pragma once

#include <sightline/geometry/polygon.hpp>
#include <sightline/geometry/segment.hpp>
#include <sightline/math/math.hpp>
#include <array>
#include <optional>
#include <span>
#include <vector>

namespace sightline::vision {

using geometry::Point;
using geometry::Segment;
using geometry::VisibilityPolygon;

// Ray-cast visibility polygon
// Casts three rays at every obstacle endpoint (one at the endpoint, two just beside it) and
// keeps the nearest hit of each. Sorting the hits by angle yields the visible region.
class RaycastVisibility {
public:
    // Visible region from origin inside the rectangle [0, width] x [0, height].
    // Windows and open doors are ignored. With nothing blocking the result is the four
    // bounds corners in clockwise order; zero-area bounds give an empty polygon.
    static VisibilityPolygon compute_visibility(
        const Point& origin,
        std::span<const Segment> walls,
        const math::Bounds& bounds
    );

    // Nearest hit of ray against segments, if any. Hits closer than POINT_MERGE_TOLERANCE to the
    // ray origin are ignored.
    static std::optional<Point> cast_ray(const math::Ray2& ray, std::span<const Segment> segments);

private:
    struct RayHit {
        double angle;
        Point point;
    };

    // Rectangle edges so every ray terminates
    static std::array<Segment, 4> boundary_segments(const math::Bounds& bounds);

    // Segment endpoints with near-duplicates merged
    static std::vector<Point> unique_endpoints(std::span<const Segment> segments);

    // Wrap into (-PI, PI]
    static double normalize_angle(double angle) noexcept;
};

} // namespace sightline::vision
