#pragma once

#include <sightline/geometry/polygon.hpp>
#include <sightline/map/battle_map.hpp>
#include <sightline/math/math.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace sightline::vision {

using map::LightLevel;
using map::LightSource;

// Illuminated region of one light. Both polygons share the light's pixel-space origin and
// dim_poly encloses bright_poly.
struct LitArea {
    LightSource source;
    geometry::VisibilityPolygon bright_poly;
    geometry::VisibilityPolygon dim_poly;
};

// Catalog entry for a carried or cast light, radii in feet
struct LightSourceDefinition {
    std::string_view name;
    int32_t bright_radius_feet;
    int32_t dim_radius_feet;
};

// Radii used when a light name is not in the catalog, in cells
inline constexpr double DEFAULT_BRIGHT_RADIUS_CELLS = 4.0;
inline constexpr double DEFAULT_DIM_RADIUS_CELLS = 4.0;

// One lit area per source, in input order. Sources are in grid space; walls and bounds
// are in pixels.
std::vector<LitArea> compute_lit_areas(
    std::span<const LightSource> sources,
    std::span<const geometry::Segment> walls,
    const math::Bounds& bounds,
    double cell_size
);

// Distance-based illumination of a grid-space point. Occlusion is not considered.
// Within any bright radius: Bright. Within any bright + dim radius: Dim unless the ambient
// level is already Bright. Otherwise the ambient level.
LightLevel get_lighting_at_point(
    const math::Vec2& point,
    std::span<const LightSource> sources,
    LightLevel ambient
);

// Known light sources (candle, torch, lantern-hooded, ...)
std::span<const LightSourceDefinition> light_catalog() noexcept;

// Light of a catalog type placed at (x, y). Feet convert to cells rounding up; unknown
// names use the default radii.
LightSource light_source_from_catalog(std::string_view name, double x, double y);

// ceil(feet / 5)
int32_t feet_to_cells(int32_t feet) noexcept;

} // namespace sightline::vision
