#include <sightline/core/log.hpp>
#include <sightline/map/map_loader.hpp>
#include <sightline/vision/lighting.hpp>
#include <sightline/vision/vision_aggregator.hpp>
#include <sightline/pathing/pathfinder.hpp>

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace sightline;

namespace {

std::optional<int32_t> parse_int(std::string_view text) {
    int32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

char light_glyph(map::LightLevel level) {
    switch (level) {
        case map::LightLevel::Bright: return '.';
        case map::LightLevel::Dim: return ':';
        default: return ' ';
    }
}

// One character per cell: tokens, path, then light level of visible cells, '#' for fog
void print_map(const map::BattleMap& battle_map,
               const vision::VisionSet& visible,
               const std::vector<map::CellCoord>& path) {
    const vision::VisionSet path_cells(path.begin(), path.end());

    for (int32_t y = 0; y < battle_map.grid.height; ++y) {
        std::string row;
        row.reserve(static_cast<size_t>(battle_map.grid.width));
        for (int32_t x = 0; x < battle_map.grid.width; ++x) {
            const map::CellCoord cell{x, y};
            char glyph = '#';

            if (visible.contains(cell)) {
                math::Vec2 center(x + 0.5, y + 0.5);
                glyph = light_glyph(vision::get_lighting_at_point(center, battle_map.lights, battle_map.ambient_light));
            }
            if (path_cells.contains(cell)) {
                glyph = '*';
            }
            for (const map::Token& token : battle_map.tokens) {
                if (x >= token.grid_x && x < token.grid_x + token.size_x &&
                    y >= token.grid_y && y < token.grid_y + token.size_y) {
                    glyph = token.entity_type == map::EntityType::Player ? 'P'
                          : token.entity_type == map::EntityType::Enemy ? 'E' : 'N';
                }
            }
            row.push_back(glyph);
        }
        std::cout << "  " << row << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2 && argc != 6) {
        std::cerr << "Usage: " << argv[0] << " <map.json> [startX startY goalX goalY]" << std::endl;
        return 1;
    }

    core::Logger& logger = core::Logger::instance();
    logger.initialize("logs/sightline_demo.log");
    logger.set_console_output(false);

    auto loaded = map::MapLoader::load_from_file(argv[1]);
    if (!loaded) {
        std::cerr << "Failed to load map: " << loaded.error().to_string() << std::endl;
        logger.shutdown();
        return 1;
    }
    const map::BattleMap& battle_map = *loaded;

    std::cout << "=== Sightline Demo ===" << std::endl;
    std::cout << "Map: " << argv[1] << " (" << battle_map.grid.width << "x" << battle_map.grid.height
              << " cells, " << battle_map.walls.size() << " walls, " << battle_map.tokens.size()
              << " tokens, " << battle_map.lights.size() << " lights)" << std::endl;

    // Party vision
    vision::VisionUpdate update = vision::VisionAggregator::recompute_vision(battle_map, {});
    const vision::VisionSet visible = vision::VisionAggregator::build_vision_set(update.visible_cells);

    std::cout << "Visible cells: " << update.visible_cells.size() << " of "
              << battle_map.grid.width * battle_map.grid.height << std::endl;

    for (const map::Token& token : battle_map.tokens) {
        if (token.entity_type == map::EntityType::Player) {
            continue;
        }
        bool seen = vision::VisionAggregator::is_token_in_vision_set(token, visible);
        std::cout << "  " << token.id << " (" << map::to_string(token.entity_type) << "): "
                  << (seen ? "visible" : "hidden") << std::endl;
    }

    std::vector<vision::LitArea> lit_areas = vision::compute_lit_areas(
        battle_map.lights, battle_map.pixel_segments(), battle_map.grid.pixel_bounds(), battle_map.grid.cell_size);
    for (size_t i = 0; i < lit_areas.size(); ++i) {
        const vision::LitArea& area = lit_areas[i];
        std::cout << "Light " << i << " at (" << area.source.x << ", " << area.source.y << "): "
                  << area.bright_poly.points.size() << " bright vertices, "
                  << area.dim_poly.points.size() << " dim vertices" << std::endl;
    }

    // Optional path query
    std::vector<map::CellCoord> path;
    if (argc == 6) {
        auto sx = parse_int(argv[2]);
        auto sy = parse_int(argv[3]);
        auto gx = parse_int(argv[4]);
        auto gy = parse_int(argv[5]);
        if (!sx || !sy || !gx || !gy) {
            std::cerr << "Path coordinates must be integers" << std::endl;
            logger.shutdown();
            return 1;
        }

        pathing::PathResult result = pathing::Pathfinder::find_path(
            battle_map, map::CellCoord{*sx, *sy}, map::CellCoord{*gx, *gy});
        if (result.reached_goal) {
            std::cout << "Path (" << *sx << ", " << *sy << ") -> (" << *gx << ", " << *gy << "): "
                      << result.total_cost << " ft over " << result.path.size() << " cells" << std::endl;
            path = std::move(result.path);
        } else {
            std::cout << "No path from (" << *sx << ", " << *sy << ") to (" << *gx << ", " << *gy << ")" << std::endl;
        }
    }

    std::cout << std::endl;
    print_map(battle_map, visible, path);
    std::cout << std::endl << "Legend: P player, E enemy, N npc, * path, . bright, : dim, blank dark, # unseen"
              << std::endl;

    logger.shutdown();
    return 0;
}
