#pragma once

#include <sightline/geometry/segment.hpp>
#include <vector>

namespace sightline::geometry {

// Region visible from origin. Vertices are in angular order around the origin.
// A polygon either has at least three vertices or none (fully occluded, zero radius).
struct VisibilityPolygon {
    Point origin{0.0};
    std::vector<Point> points;

    bool empty() const noexcept { return points.size() < 3; }
};

// Even-odd point-in-polygon test. Polygons with fewer than three vertices contain nothing.
bool is_point_visible(const Point& point, const VisibilityPolygon& polygon) noexcept;

// Pull every vertex farther than radius from the origin back onto the circle along the
// origin-to-vertex direction. Vertex order is preserved. A non-positive radius gives an
// empty polygon.
VisibilityPolygon clip_to_radius(const VisibilityPolygon& polygon, double radius);

// Largest origin-to-vertex distance, 0 for an empty polygon
double max_vertex_distance(const VisibilityPolygon& polygon) noexcept;

// Shoelace area, always non-negative
double polygon_area(const VisibilityPolygon& polygon) noexcept;

} // namespace sightline::geometry
