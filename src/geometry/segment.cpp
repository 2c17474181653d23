#include <sightline/geometry/segment.hpp>

#include <cmath>

namespace sightline::geometry {

bool blocks_sight(const Segment& segment) noexcept {
    switch (segment.kind) {
        case SegmentKind::Solid: return true;
        case SegmentKind::Door: return !segment.is_open;
        case SegmentKind::Window: return false;
    }
    return true;
}

bool blocks_movement(const Segment& segment) noexcept {
    switch (segment.kind) {
        case SegmentKind::Solid: return true;
        case SegmentKind::Door: return !segment.is_open;
        case SegmentKind::Window: return true;
    }
    return true;
}

std::vector<Segment> sight_blocking_segments(std::span<const Segment> segments) {
    std::vector<Segment> blocking;
    blocking.reserve(segments.size());
    for (const Segment& segment : segments) {
        if (blocks_sight(segment)) {
            blocking.push_back(segment);
        }
    }
    return blocking;
}

bool properly_crosses(const Point& from, const Point& to,
                      const Point& a, const Point& b) noexcept {
    Point r = to - from;
    Point s = b - a;
    double denom = math::utils::cross(r, s);
    if (std::abs(denom) < math::PARALLEL_EPSILON) {
        return false;
    }

    Point qp = a - from;
    double t = math::utils::cross(qp, s) / denom;
    double u = math::utils::cross(qp, r) / denom;

    // Open interval on the move, closed on the wall so wall corners stay sealed
    constexpr double eps = math::SEGMENT_PARAM_EPSILON;
    return t > eps && t < 1.0 - eps && u >= -eps && u <= 1.0 + eps;
}

bool is_movement_blocked(const Point& from, const Point& to, std::span<const Segment> segments) noexcept {
    for (const Segment& segment : segments) {
        if (!blocks_movement(segment)) {
            continue;
        }
        if (properly_crosses(from, to, segment.a, segment.b)) {
            return true;
        }
    }
    return false;
}

const char* to_string(SegmentKind kind) noexcept {
    switch (kind) {
        case SegmentKind::Solid: return "solid";
        case SegmentKind::Door: return "door";
        case SegmentKind::Window: return "window";
        default: return "unknown";
    }
}

std::optional<SegmentKind> segment_kind_from_string(std::string_view name) noexcept {
    if (name == "solid") return SegmentKind::Solid;
    if (name == "door") return SegmentKind::Door;
    if (name == "window") return SegmentKind::Window;
    return std::nullopt;
}

} // namespace sightline::geometry
