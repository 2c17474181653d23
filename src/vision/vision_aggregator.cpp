#include <sightline/vision/vision_aggregator.hpp>
#include <sightline/vision/lighting.hpp>
#include <sightline/vision/raycast_visibility.hpp>
#include <sightline/core/log.hpp>
#include <algorithm>
#include <array>
#include <iterator>
#include <limits>

namespace sightline::vision {

namespace {
    constexpr int32_t DEFAULT_DARKVISION_FEET = 60;

    struct SpeciesDarkvision {
        std::string_view species;
        int32_t range_feet;
    };

    constexpr std::array<SpeciesDarkvision, 7> DARKVISION_SPECIES = {{
        {"aasimar", 60},
        {"dragonborn", 60},
        {"dwarf", 120},
        {"elf", 60},
        {"gnome", 60},
        {"orc", 120},
        {"tiefling", 60},
    }};

    // Bounding box used to skip point-in-polygon tests for far-away cells
    struct PolygonBox {
        double min_x = std::numeric_limits<double>::max();
        double min_y = std::numeric_limits<double>::max();
        double max_x = std::numeric_limits<double>::lowest();
        double max_y = std::numeric_limits<double>::lowest();

        bool contains(const geometry::Point& p) const {
            return p.x >= min_x && p.x <= max_x && p.y >= min_y && p.y <= max_y;
        }
    };

    PolygonBox bounding_box(const geometry::VisibilityPolygon& polygon) {
        PolygonBox box;
        for (const geometry::Point& p : polygon.points) {
            box.min_x = std::min(box.min_x, p.x);
            box.min_y = std::min(box.min_y, p.y);
            box.max_x = std::max(box.max_x, p.x);
            box.max_y = std::max(box.max_y, p.y);
        }
        return box;
    }
}

PartyVision VisionAggregator::compute_party_vision(const map::BattleMap& battle_map,
                                                   std::span<const Token> viewers)
{
    LOG_SCOPE_TIMER_CAT("compute_party_vision", Vision);

    PartyVision result;
    if (viewers.empty()) {
        return result;
    }

    const map::GridSettings& grid = battle_map.grid;
    const math::Bounds bounds = grid.pixel_bounds();
    const std::vector<geometry::Segment> walls = battle_map.pixel_segments();

    result.party_polygons.reserve(viewers.size());
    for (const Token& viewer : viewers) {
        Point origin = viewer.footprint_center() * grid.cell_size;
        result.party_polygons.push_back(RaycastVisibility::compute_visibility(origin, walls, bounds));
    }

    std::vector<PolygonBox> boxes;
    boxes.reserve(result.party_polygons.size());
    for (const auto& polygon : result.party_polygons) {
        boxes.push_back(bounding_box(polygon));
    }

    // One sample per cell, at its center
    for (int32_t y = 0; y < grid.height; ++y) {
        for (int32_t x = 0; x < grid.width; ++x) {
            Point center = grid.cell_center_px(x, y);
            for (size_t i = 0; i < result.party_polygons.size(); ++i) {
                if (boxes[i].contains(center) && geometry::is_point_visible(center, result.party_polygons[i])) {
                    result.visible_cells.push_back(CellCoord{x, y});
                    break;
                }
            }
        }
    }

    LOG_DEBUG(Vision, "Party vision: {} viewers, {} of {} cells visible",
              viewers.size(), result.visible_cells.size(),
              static_cast<int64_t>(grid.width) * grid.height);

    return result;
}

bool VisionAggregator::is_token_visible_to_party(const Token& target,
                                                 std::span<const geometry::VisibilityPolygon> party_polygons,
                                                 double cell_size)
{
    Point center = target.footprint_center() * cell_size;
    return std::any_of(party_polygons.begin(), party_polygons.end(),
                       [&center](const geometry::VisibilityPolygon& polygon) {
                           return geometry::is_point_visible(center, polygon);
                       });
}

VisionSet VisionAggregator::build_vision_set(std::span<const CellCoord> cells) {
    return VisionSet(cells.begin(), cells.end());
}

bool VisionAggregator::is_token_in_vision_set(const Token& token, const VisionSet& vision_set) {
    for (int32_t dy = 0; dy < token.size_y; ++dy) {
        for (int32_t dx = 0; dx < token.size_x; ++dx) {
            if (vision_set.contains(CellCoord{token.grid_x + dx, token.grid_y + dy})) {
                return true;
            }
        }
    }
    return false;
}

VisionUpdate VisionAggregator::recompute_vision(const map::BattleMap& battle_map, const VisionSet& explored) {
    std::vector<Token> viewers = select_viewer_tokens(battle_map.tokens);
    PartyVision vision = compute_party_vision(battle_map, viewers);

    VisionUpdate update;
    update.explored_cells = merge_explored(explored, vision.visible_cells);
    update.visible_cells = std::move(vision.visible_cells);

    LOG_DEBUG(Vision, "Explored cells: {} -> {}", explored.size(), update.explored_cells.size());
    return update;
}

std::vector<Token> select_viewer_tokens(std::span<const Token> tokens) {
    std::vector<Token> viewers;
    std::copy_if(tokens.begin(), tokens.end(), std::back_inserter(viewers),
                 [](const Token& token) { return token.entity_type == map::EntityType::Player; });
    return viewers;
}

bool has_darkvision(std::string_view species_id) {
    return darkvision_range_feet(species_id) > 0;
}

int32_t darkvision_range_feet(std::string_view species_id, std::string_view subspecies_id) {
    if (species_id == "elf" && subspecies_id == "drow") {
        return 120;
    }
    for (const SpeciesDarkvision& entry : DARKVISION_SPECIES) {
        if (entry.species == species_id) {
            return entry.range_feet;
        }
    }
    return 0;
}

int32_t token_darkvision_cells(const Token& token) {
    if (token.darkvision_range) {
        return feet_to_cells(*token.darkvision_range);
    }
    return token.darkvision ? feet_to_cells(DEFAULT_DARKVISION_FEET) : 0;
}

FogState classify_fog_cell(const CellCoord& cell,
                           const VisionSet& visible,
                           const VisionSet& revealed,
                           const VisionSet& explored)
{
    if (visible.contains(cell) || revealed.contains(cell)) {
        return FogState::Visible;
    }
    if (explored.contains(cell)) {
        return FogState::Explored;
    }
    return FogState::Unexplored;
}

VisionSet merge_explored(const VisionSet& explored, std::span<const CellCoord> visible) {
    VisionSet merged = explored;
    merged.insert(visible.begin(), visible.end());
    return merged;
}

} // namespace sightline::vision
