#include <sightline/vision/raycast_visibility.hpp>
#include <sightline/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace sightline::vision {

VisibilityPolygon RaycastVisibility::compute_visibility(
    const Point& origin,
    std::span<const Segment> walls,
    const math::Bounds& bounds)
{
    VisibilityPolygon result;
    result.origin = origin;

    if (bounds.area() <= 0.0) {
        LOG_TRACE(Visibility, "Degenerate bounds {}x{}, empty polygon", bounds.width, bounds.height);
        return result;
    }

    std::vector<Segment> blocking = geometry::sight_blocking_segments(walls);

    // Nothing blocks: the whole rectangle is visible
    if (blocking.empty()) {
        result.points = {
            Point(0.0, 0.0),
            Point(bounds.width, 0.0),
            Point(bounds.width, bounds.height),
            Point(0.0, bounds.height)
        };
        return result;
    }

    size_t wall_count = blocking.size();
    for (const Segment& edge : boundary_segments(bounds)) {
        blocking.push_back(edge);
    }

    std::vector<Point> endpoints = unique_endpoints(blocking);

    std::vector<RayHit> hits;
    hits.reserve(endpoints.size() * 3);

    const double offsets[3] = {-math::CORNER_PEEK_EPSILON, 0.0, math::CORNER_PEEK_EPSILON};
    for (const Point& endpoint : endpoints) {
        double base_angle = math::utils::angle_between(origin, endpoint);
        for (double offset : offsets) {
            double angle = normalize_angle(base_angle + offset);
            std::optional<Point> hit = cast_ray(math::Ray2::from_angle(origin, angle), blocking);
            if (hit) {
                hits.push_back(RayHit{angle, *hit});
            }
        }
    }

    std::sort(hits.begin(), hits.end(), [](const RayHit& lhs, const RayHit& rhs) {
        return lhs.angle < rhs.angle;
    });

    result.points.reserve(hits.size());
    for (const RayHit& hit : hits) {
        if (!result.points.empty() && math::utils::approximately_equal(result.points.back(), hit.point)) {
            continue;
        }
        result.points.push_back(hit.point);
    }

    // The sequence is cyclic, so the last vertex may duplicate the first
    if (result.points.size() > 1 &&
        math::utils::approximately_equal(result.points.back(), result.points.front())) {
        result.points.pop_back();
    }

    if (result.points.size() < 3) {
        LOG_DEBUG(Visibility, "Origin ({}, {}) fully occluded", origin.x, origin.y);
        result.points.clear();
    }

    LOG_TRACE(Visibility, "Visibility from ({:.1f}, {:.1f}): {} walls, {} endpoints, {} vertices",
              origin.x, origin.y, wall_count, endpoints.size(), result.points.size());

    return result;
}

std::optional<Point> RaycastVisibility::cast_ray(const math::Ray2& ray, std::span<const Segment> segments) {
    double closest_t = std::numeric_limits<double>::infinity();
    bool found = false;

    // Hits at the origin itself are skipped, so a viewer standing on a wall still sees both sides
    for (const Segment& segment : segments) {
        double t = 0.0;
        if (!ray.intersects_segment(segment.a, segment.b, t) || t < math::POINT_MERGE_TOLERANCE) {
            continue;
        }
        if (t < closest_t) {
            closest_t = t;
            found = true;
        }
    }

    if (!found) {
        return std::nullopt;
    }
    return ray.point_at(closest_t);
}

std::array<Segment, 4> RaycastVisibility::boundary_segments(const math::Bounds& bounds) {
    const Point top_left(0.0, 0.0);
    const Point top_right(bounds.width, 0.0);
    const Point bottom_right(bounds.width, bounds.height);
    const Point bottom_left(0.0, bounds.height);

    return {
        Segment::solid(top_left, top_right),
        Segment::solid(top_right, bottom_right),
        Segment::solid(bottom_right, bottom_left),
        Segment::solid(bottom_left, top_left)
    };
}

std::vector<Point> RaycastVisibility::unique_endpoints(std::span<const Segment> segments) {
    std::vector<Point> unique;
    unique.reserve(segments.size() * 2);

    auto add = [&unique](const Point& p) {
        for (const Point& existing : unique) {
            if (math::utils::approximately_equal(existing, p)) {
                return;
            }
        }
        unique.push_back(p);
    };

    for (const Segment& segment : segments) {
        add(segment.a);
        add(segment.b);
    }
    return unique;
}

double RaycastVisibility::normalize_angle(double angle) noexcept {
    while (angle > math::utils::PI) {
        angle -= math::utils::TWO_PI;
    }
    while (angle <= -math::utils::PI) {
        angle += math::utils::TWO_PI;
    }
    return angle;
}

} // namespace sightline::vision
