#include <sightline/vision/lighting.hpp>
#include <sightline/vision/raycast_visibility.hpp>
#include <sightline/core/log.hpp>
#include <array>

namespace sightline::vision {

namespace {
    constexpr int32_t FEET_PER_CELL = 5;

    constexpr std::array<LightSourceDefinition, 8> LIGHT_CATALOG = {{
        {"candle", 5, 5},
        {"lamp", 15, 30},
        {"torch", 20, 20},
        {"light-cantrip", 20, 20},
        {"continual-flame", 20, 20},
        {"lantern-hooded", 30, 30},
        {"lantern-bullseye", 60, 60},
        {"daylight-spell", 60, 60},
    }};
}

std::vector<LitArea> compute_lit_areas(
    std::span<const LightSource> sources,
    std::span<const geometry::Segment> walls,
    const math::Bounds& bounds,
    double cell_size)
{
    LOG_SCOPE_TIMER_CAT("compute_lit_areas", Lighting);

    std::vector<LitArea> areas;
    areas.reserve(sources.size());

    for (const LightSource& source : sources) {
        Point origin(source.x * cell_size, source.y * cell_size);
        VisibilityPolygon visible = RaycastVisibility::compute_visibility(origin, walls, bounds);

        LitArea area;
        area.source = source;
        area.bright_poly = geometry::clip_to_radius(visible, source.bright_radius * cell_size);
        area.dim_poly = geometry::clip_to_radius(visible, (source.bright_radius + source.dim_radius) * cell_size);
        areas.push_back(std::move(area));
    }

    LOG_DEBUG(Lighting, "Computed {} lit areas against {} walls", areas.size(), walls.size());
    return areas;
}

LightLevel get_lighting_at_point(
    const math::Vec2& point,
    std::span<const LightSource> sources,
    LightLevel ambient)
{
    bool in_dim = false;
    for (const LightSource& source : sources) {
        double dist = math::utils::distance(point, math::Vec2(source.x, source.y));
        if (dist <= source.bright_radius) {
            return LightLevel::Bright;
        }
        if (dist <= source.bright_radius + source.dim_radius) {
            in_dim = true;
        }
    }

    if (in_dim && ambient != LightLevel::Bright) {
        return LightLevel::Dim;
    }
    return ambient;
}

std::span<const LightSourceDefinition> light_catalog() noexcept {
    return LIGHT_CATALOG;
}

LightSource light_source_from_catalog(std::string_view name, double x, double y) {
    LightSource source;
    source.x = x;
    source.y = y;

    for (const LightSourceDefinition& def : LIGHT_CATALOG) {
        if (def.name == name) {
            source.bright_radius = feet_to_cells(def.bright_radius_feet);
            source.dim_radius = feet_to_cells(def.dim_radius_feet);
            return source;
        }
    }

    LOG_WARNING(Lighting, "Unknown light source '{}', using default radii", name);
    source.bright_radius = DEFAULT_BRIGHT_RADIUS_CELLS;
    source.dim_radius = DEFAULT_DIM_RADIUS_CELLS;
    return source;
}

int32_t feet_to_cells(int32_t feet) noexcept {
    if (feet <= 0) {
        return 0;
    }
    return (feet + FEET_PER_CELL - 1) / FEET_PER_CELL;
}

} // namespace sightline::vision
