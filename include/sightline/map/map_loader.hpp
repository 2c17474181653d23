#pragma once

#include <sightline/core/types.hpp>
#include <sightline/map/battle_map.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace sightline::map {

// Largest grid width or height a map may declare
inline constexpr int32_t MAX_GRID_DIMENSION = 4096;

// MapLoader - Builds BattleMap snapshots from JSON documents
//
// Document layout:
//   grid      { width, height, cellSize }        cells / pixels per cell
//   walls     [ { id, x1, y1, x2, y2, type, isOpen } ]
//   terrain   [ { x, y, type, movementCost } ]
//   tokens    [ { id, gridX, gridY, sizeX, sizeY, entityType, darkvision, darkvisionRange } ]
//   lights    [ { x, y, brightRadius, dimRadius, color } | { x, y, source } ]
//   ambientLight  "bright" | "dim" | "darkness"
//   diagonalRule  "standard" | "alternate"
class MapLoader {
public:
    // Read and parse a map file. Never throws.
    static Result<BattleMap, Error> load_from_file(const std::string& json_path);

    // Parse a map document held in memory. Never throws.
    static Result<BattleMap, Error> load_from_string(std::string_view json_text);

    // Sanity checks that do not stop a map from loading (off-grid walls, tokens outside the
    // grid, empty footprints, ...). Returns one message per problem, empty if the map is clean.
    static std::vector<std::string> validate_map(const BattleMap& battle_map);
};

} // namespace sightline::map
