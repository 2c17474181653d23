#include <sightline/map/map_loader.hpp>
#include <sightline/vision/lighting.hpp>
#include <sightline/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <limits>
#include <format>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace sightline::map {

namespace {

// Helper: Extract string from JSON with default
std::string json_get_string(const json& j, const std::string& key, const std::string& default_val = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return default_val;
}

// Helper: Extract double from JSON with default
double json_get_double(const json& j, const std::string& key, double default_val = 0.0) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return default_val;
}

// Helper: Extract bool from JSON with default
bool json_get_bool(const json& j, const std::string& key, bool default_val = false) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return default_val;
}

Error parse_error(std::string message) {
    return Error(ErrorCode::ParseError, std::move(message));
}

Error format_error(std::string message) {
    return Error(ErrorCode::InvalidFormat, std::move(message));
}

Result<double, Error> require_number(const json& j, const std::string& key, std::string_view what) {
    if (!j.contains(key) || !j[key].is_number()) {
        return std::unexpected(format_error(std::format("{} is missing numeric '{}'", what, key)));
    }
    return j[key].get<double>();
}

// Rounds to the nearest integer; values outside the int32 range are rejected
Result<int32_t, Error> to_int32(double value, const std::string& key, std::string_view what) {
    const double rounded = std::round(value);
    if (!std::isfinite(rounded) ||
        rounded < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
        rounded > static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return std::unexpected(format_error(std::format("{} has out-of-range '{}': {}", what, key, value)));
    }
    return static_cast<int32_t>(rounded);
}

Result<int32_t, Error> require_int(const json& j, const std::string& key, std::string_view what) {
    auto number = require_number(j, key, what);
    if (!number) return std::unexpected(number.error());
    return to_int32(*number, key, what);
}

// Optional integer member, default when absent or not a number
Result<int32_t, Error> json_get_int(const json& j, const std::string& key, std::string_view what, int32_t default_val) {
    if (j.contains(key) && j[key].is_number()) {
        return to_int32(j[key].get<double>(), key, what);
    }
    return default_val;
}

// "#RRGGBB" string or 0xRRGGBB integer
Result<std::optional<uint32_t>, Error> parse_color(const json& j) {
    if (!j.contains("color") || j["color"].is_null()) {
        return std::optional<uint32_t>{};
    }
    const json& color = j["color"];
    if (color.is_number_unsigned() || color.is_number_integer()) {
        return std::optional<uint32_t>{color.get<uint32_t>() & 0xFFFFFFu};
    }
    if (color.is_string()) {
        std::string text = color.get<std::string>();
        if (text.size() == 7 && text[0] == '#') {
            try {
                return std::optional<uint32_t>{static_cast<uint32_t>(std::stoul(text.substr(1), nullptr, 16))};
            } catch (const std::exception&) {
                // Fall through to the error below
            }
        }
    }
    return std::unexpected(parse_error(std::format("Invalid light color: {}", color.dump())));
}

Result<GridSettings, Error> parse_grid(const json& root) {
    if (!root.contains("grid") || !root["grid"].is_object()) {
        return std::unexpected(format_error("Map is missing the 'grid' object"));
    }
    const json& grid_json = root["grid"];

    auto width = require_int(grid_json, "width", "grid");
    if (!width) return std::unexpected(width.error());
    auto height = require_int(grid_json, "height", "grid");
    if (!height) return std::unexpected(height.error());
    if (*width > MAX_GRID_DIMENSION || *height > MAX_GRID_DIMENSION) {
        return std::unexpected(format_error(std::format("Grid size {}x{} exceeds {} cells per side",
                                                        *width, *height, MAX_GRID_DIMENSION)));
    }

    GridSettings grid;
    grid.width = *width;
    grid.height = *height;
    grid.cell_size = json_get_double(grid_json, "cellSize", grid.cell_size);
    return grid;
}

Result<WallSegment, Error> parse_wall(const json& wall_json, size_t index) {
    const std::string what = std::format("wall[{}]", index);
    WallSegment wall;
    wall.id = json_get_string(wall_json, "id", what);

    auto x1 = require_number(wall_json, "x1", what);
    if (!x1) return std::unexpected(x1.error());
    auto y1 = require_number(wall_json, "y1", what);
    if (!y1) return std::unexpected(y1.error());
    auto x2 = require_number(wall_json, "x2", what);
    if (!x2) return std::unexpected(x2.error());
    auto y2 = require_number(wall_json, "y2", what);
    if (!y2) return std::unexpected(y2.error());

    wall.x1 = *x1;
    wall.y1 = *y1;
    wall.x2 = *x2;
    wall.y2 = *y2;

    std::string type = json_get_string(wall_json, "type", "solid");
    auto kind = geometry::segment_kind_from_string(type);
    if (!kind) {
        return std::unexpected(parse_error(std::format("{} has unknown type '{}'", what, type)));
    }
    wall.kind = *kind;
    wall.is_open = json_get_bool(wall_json, "isOpen", false);
    return wall;
}

Result<TerrainCell, Error> parse_terrain(const json& cell_json, size_t index) {
    const std::string what = std::format("terrain[{}]", index);
    TerrainCell cell;

    auto x = require_int(cell_json, "x", what);
    if (!x) return std::unexpected(x.error());
    auto y = require_int(cell_json, "y", what);
    if (!y) return std::unexpected(y.error());

    cell.x = *x;
    cell.y = *y;

    std::string type = json_get_string(cell_json, "type", "difficult");
    auto terrain_type = terrain_type_from_string(type);
    if (!terrain_type) {
        return std::unexpected(parse_error(std::format("{} has unknown type '{}'", what, type)));
    }
    cell.type = *terrain_type;
    auto cost = json_get_int(cell_json, "movementCost", what, cell.movement_cost);
    if (!cost) return std::unexpected(cost.error());
    cell.movement_cost = *cost;
    return cell;
}

Result<Token, Error> parse_token(const json& token_json, size_t index) {
    const std::string what = std::format("token[{}]", index);
    Token token;
    token.id = json_get_string(token_json, "id", what);

    auto grid_x = require_int(token_json, "gridX", what);
    if (!grid_x) return std::unexpected(grid_x.error());
    auto grid_y = require_int(token_json, "gridY", what);
    if (!grid_y) return std::unexpected(grid_y.error());
    auto size_x = json_get_int(token_json, "sizeX", what, 1);
    if (!size_x) return std::unexpected(size_x.error());
    auto size_y = json_get_int(token_json, "sizeY", what, 1);
    if (!size_y) return std::unexpected(size_y.error());

    token.grid_x = *grid_x;
    token.grid_y = *grid_y;
    token.size_x = *size_x;
    token.size_y = *size_y;

    std::string entity = json_get_string(token_json, "entityType", "player");
    auto entity_type = entity_type_from_string(entity);
    if (!entity_type) {
        return std::unexpected(parse_error(std::format("{} has unknown entityType '{}'", what, entity)));
    }
    token.entity_type = *entity_type;
    token.darkvision = json_get_bool(token_json, "darkvision", false);
    if (token_json.contains("darkvisionRange") && token_json["darkvisionRange"].is_number()) {
        auto range = require_int(token_json, "darkvisionRange", what);
        if (!range) return std::unexpected(range.error());
        token.darkvision_range = *range;
    }
    return token;
}

Result<LightSource, Error> parse_light(const json& light_json, size_t index) {
    const std::string what = std::format("light[{}]", index);

    auto x = require_number(light_json, "x", what);
    if (!x) return std::unexpected(x.error());
    auto y = require_number(light_json, "y", what);
    if (!y) return std::unexpected(y.error());

    LightSource light;
    std::string source_name = json_get_string(light_json, "source");
    if (!source_name.empty()) {
        light = vision::light_source_from_catalog(source_name, *x, *y);
    } else {
        light.x = *x;
        light.y = *y;
        light.bright_radius = json_get_double(light_json, "brightRadius", 0.0);
        light.dim_radius = json_get_double(light_json, "dimRadius", 0.0);
    }

    auto color = parse_color(light_json);
    if (!color) return std::unexpected(color.error());
    light.color = *color;
    return light;
}

// Parse every element of an optional array member with the given element parser
template<typename T, typename ParseFn>
Result<std::vector<T>, Error> parse_array(const json& root, const std::string& key, ParseFn parse) {
    std::vector<T> items;
    if (!root.contains(key) || root[key].is_null()) {
        return items;
    }
    if (!root[key].is_array()) {
        return std::unexpected(format_error(std::format("'{}' must be an array", key)));
    }

    const json& array = root[key];
    items.reserve(array.size());
    for (size_t i = 0; i < array.size(); ++i) {
        if (!array[i].is_object()) {
            return std::unexpected(format_error(std::format("{}[{}] must be an object", key, i)));
        }
        auto item = parse(array[i], i);
        if (!item) return std::unexpected(item.error());
        items.push_back(std::move(*item));
    }
    return items;
}

} // namespace

Result<BattleMap, Error> MapLoader::load_from_file(const std::string& json_path) {
    std::error_code ec;
    if (!std::filesystem::exists(json_path, ec)) {
        LOG_ERROR(Map, "Map file not found: {}", json_path);
        return std::unexpected(Error(ErrorCode::FileNotFound, std::format("Map file not found: {}", json_path)));
    }

    std::ifstream file(json_path);
    if (!file.is_open()) {
        LOG_ERROR(Map, "Failed to open map file: {}", json_path);
        return std::unexpected(Error(ErrorCode::FileReadError, std::format("Failed to open map file: {}", json_path)));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(Error(ErrorCode::FileReadError, std::format("Failed to read map file: {}", json_path)));
    }

    auto result = load_from_string(buffer.str());
    if (result) {
        LOG_INFO(Map, "Loaded map {} ({}x{} cells, {} walls, {} tokens, {} lights)",
                 json_path, result->grid.width, result->grid.height,
                 result->walls.size(), result->tokens.size(), result->lights.size());
    }
    return result;
}

Result<BattleMap, Error> MapLoader::load_from_string(std::string_view json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::exception& e) {
        LOG_ERROR(Map, "Failed to parse map JSON: {}", e.what());
        return std::unexpected(parse_error(std::format("Failed to parse map JSON: {}", e.what())));
    }

    if (!root.is_object()) {
        return std::unexpected(format_error("Map document must be a JSON object"));
    }

    BattleMap battle_map;

    try {
        auto grid = parse_grid(root);
        if (!grid) return std::unexpected(grid.error());
        battle_map.grid = *grid;

        auto walls = parse_array<WallSegment>(root, "walls", parse_wall);
        if (!walls) return std::unexpected(walls.error());
        battle_map.walls = std::move(*walls);

        auto terrain = parse_array<TerrainCell>(root, "terrain", parse_terrain);
        if (!terrain) return std::unexpected(terrain.error());
        battle_map.terrain = std::move(*terrain);

        auto tokens = parse_array<Token>(root, "tokens", parse_token);
        if (!tokens) return std::unexpected(tokens.error());
        battle_map.tokens = std::move(*tokens);

        auto lights = parse_array<LightSource>(root, "lights", parse_light);
        if (!lights) return std::unexpected(lights.error());
        battle_map.lights = std::move(*lights);
    } catch (const json::exception& e) {
        // Out-of-range numbers and similar conversion failures
        LOG_ERROR(Map, "Invalid value in map JSON: {}", e.what());
        return std::unexpected(parse_error(std::format("Invalid value in map JSON: {}", e.what())));
    }

    std::string ambient = json_get_string(root, "ambientLight", "bright");
    auto ambient_level = light_level_from_string(ambient);
    if (!ambient_level) {
        return std::unexpected(parse_error(std::format("Unknown ambientLight '{}'", ambient)));
    }
    battle_map.ambient_light = *ambient_level;

    std::string rule = json_get_string(root, "diagonalRule", "standard");
    auto diagonal_rule = diagonal_rule_from_string(rule);
    if (!diagonal_rule) {
        return std::unexpected(parse_error(std::format("Unknown diagonalRule '{}'", rule)));
    }
    battle_map.diagonal_rule = *diagonal_rule;

    for (const std::string& problem : validate_map(battle_map)) {
        LOG_WARNING(Map, "Map check: {}", problem);
    }

    return battle_map;
}

std::vector<std::string> MapLoader::validate_map(const BattleMap& battle_map) {
    std::vector<std::string> problems;
    const GridSettings& grid = battle_map.grid;

    if (grid.width <= 0 || grid.height <= 0) {
        problems.push_back(std::format("Grid size {}x{} is not positive", grid.width, grid.height));
    }
    if (grid.cell_size <= 0.0) {
        problems.push_back(std::format("Cell size {} is not positive", grid.cell_size));
    }

    auto on_grid = [&grid](double x, double y) {
        return x >= 0.0 && y >= 0.0 && x <= grid.width && y <= grid.height;
    };

    for (const WallSegment& wall : battle_map.walls) {
        if (!on_grid(wall.x1, wall.y1) || !on_grid(wall.x2, wall.y2)) {
            problems.push_back(std::format("Wall '{}' extends outside the grid", wall.id));
        }
        if (wall.x1 == wall.x2 && wall.y1 == wall.y2) {
            problems.push_back(std::format("Wall '{}' has zero length", wall.id));
        }
        if (wall.is_open && wall.kind != geometry::SegmentKind::Door) {
            problems.push_back(std::format("Wall '{}' is marked open but is not a door", wall.id));
        }
    }

    for (const TerrainCell& cell : battle_map.terrain) {
        if (!grid.contains(cell.x, cell.y)) {
            problems.push_back(std::format("Terrain cell ({}, {}) is outside the grid", cell.x, cell.y));
        }
        if (cell.movement_cost < 1) {
            problems.push_back(std::format("Terrain cell ({}, {}) has movement cost {}", cell.x, cell.y, cell.movement_cost));
        }
    }

    for (const Token& token : battle_map.tokens) {
        if (token.size_x <= 0 || token.size_y <= 0) {
            problems.push_back(std::format("Token '{}' has an empty footprint", token.id));
        }
        if (!grid.contains(token.grid_x, token.grid_y)) {
            problems.push_back(std::format("Token '{}' is outside the grid", token.id));
        }
    }

    for (const LightSource& light : battle_map.lights) {
        if (light.bright_radius < 0.0 || light.dim_radius < 0.0) {
            problems.push_back(std::format("Light at ({}, {}) has a negative radius", light.x, light.y));
        }
    }

    return problems;
}

} // namespace sightline::map
