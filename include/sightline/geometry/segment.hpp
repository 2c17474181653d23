#pragma once

#include <sightline/math/math.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace sightline::geometry {

using Point = math::Vec2;

// What an obstacle edge is made of. Every consumer switches on this tag; the blocking rules
// below are the only place that interprets it.
enum class SegmentKind : uint8_t {
    Solid,      // Blocks sight, light and movement
    Door,       // Blocks sight, light and movement while closed
    Window      // Blocks movement only (glass)
};

// Obstacle edge. Units are whatever the caller works in (pixels for visibility and
// lighting, grid lines for the pathfinder).
struct Segment {
    Point a{0.0};
    Point b{0.0};
    SegmentKind kind = SegmentKind::Solid;
    bool is_open = false;                   // Only meaningful for doors

    static Segment solid(const Point& a, const Point& b) { return Segment{a, b, SegmentKind::Solid, false}; }
    static Segment door(const Point& a, const Point& b, bool open) { return Segment{a, b, SegmentKind::Door, open}; }
    static Segment window(const Point& a, const Point& b) { return Segment{a, b, SegmentKind::Window, false}; }
};

// Does this segment stop line of sight and light?
bool blocks_sight(const Segment& segment) noexcept;

// Does this segment stop a creature crossing it?
bool blocks_movement(const Segment& segment) noexcept;

// Segments that participate in occlusion, in input order
std::vector<Segment> sight_blocking_segments(std::span<const Segment> segments);

// True if the interior of the move from -> to meets the wall a-b. A move that only starts or
// ends on the wall does not cross it; a wall endpoint touching the middle of the move does.
// Collinear overlapping segments are reported as not crossing.
bool properly_crosses(const Point& from, const Point& to,
                      const Point& a, const Point& b) noexcept;

// True iff the straight move from -> to crosses a segment that blocks movement
bool is_movement_blocked(const Point& from, const Point& to, std::span<const Segment> segments) noexcept;

const char* to_string(SegmentKind kind) noexcept;
std::optional<SegmentKind> segment_kind_from_string(std::string_view name) noexcept;

} // namespace sightline::geometry
