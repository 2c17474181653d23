#include <sightline/geometry/polygon.hpp>

#include <algorithm>
#include <cmath>

namespace sightline::geometry {

bool is_point_visible(const Point& point, const VisibilityPolygon& polygon) noexcept {
    const auto& pts = polygon.points;
    if (pts.size() < 3) {
        return false;
    }

    // Count crossings of a horizontal ray towards +x
    bool inside = false;
    for (size_t i = 0, j = pts.size() - 1; i < pts.size(); j = i++) {
        const Point& pi = pts[i];
        const Point& pj = pts[j];
        if ((pi.y > point.y) != (pj.y > point.y)) {
            double x_cross = (pj.x - pi.x) * (point.y - pi.y) / (pj.y - pi.y) + pi.x;
            if (point.x < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

VisibilityPolygon clip_to_radius(const VisibilityPolygon& polygon, double radius) {
    VisibilityPolygon clipped;
    clipped.origin = polygon.origin;
    if (radius <= 0.0 || polygon.points.size() < 3) {
        return clipped;
    }

    clipped.points.reserve(polygon.points.size());
    for (const Point& p : polygon.points) {
        Point offset = p - polygon.origin;
        double dist = glm::length(offset);
        if (dist > radius) {
            clipped.points.push_back(polygon.origin + offset * (radius / dist));
        } else {
            clipped.points.push_back(p);
        }
    }
    return clipped;
}

double max_vertex_distance(const VisibilityPolygon& polygon) noexcept {
    double max_dist = 0.0;
    for (const Point& p : polygon.points) {
        max_dist = std::max(max_dist, glm::length(p - polygon.origin));
    }
    return max_dist;
}

double polygon_area(const VisibilityPolygon& polygon) noexcept {
    const auto& pts = polygon.points;
    if (pts.size() < 3) {
        return 0.0;
    }

    double twice_area = 0.0;
    for (size_t i = 0, j = pts.size() - 1; i < pts.size(); j = i++) {
        twice_area += math::utils::cross(pts[j], pts[i]);
    }
    return std::abs(twice_area) * 0.5;
}

} // namespace sightline::geometry
