#pragma once

#include <sightline/geometry/segment.hpp>
#include <sightline/math/math.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sightline::map {

// Integer grid cell coordinate
struct CellCoord {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const CellCoord& other) const {
        return x == other.x && y == other.y;
    }
};

// Hash function for CellCoord (for unordered_set / unordered_map)
struct CellCoordHash {
    size_t operator()(const CellCoord& coord) const {
        size_t h1 = std::hash<int32_t>{}(coord.x);
        size_t h2 = std::hash<int32_t>{}(coord.y);
        return h1 ^ (h2 << 1);
    }
};

// Grid dimensions and the pixel scale used by visibility and lighting
struct GridSettings {
    int32_t width = 0;                      // Cells
    int32_t height = 0;                     // Cells
    double cell_size = 50.0;                // Pixels per cell

    math::Bounds pixel_bounds() const noexcept {
        return math::Bounds{width * cell_size, height * cell_size};
    }

    bool contains(int32_t x, int32_t y) const noexcept {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    // Center of a cell in pixels
    math::Vec2 cell_center_px(int32_t x, int32_t y) const noexcept {
        return math::Vec2((x + 0.5) * cell_size, (y + 0.5) * cell_size);
    }
};

// Wall as authored on the map, endpoints on grid lines
struct WallSegment {
    std::string id;
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;
    geometry::SegmentKind kind = geometry::SegmentKind::Solid;
    bool is_open = false;

    // Same wall in grid units
    geometry::Segment to_segment() const {
        return geometry::Segment{math::Vec2(x1, y1), math::Vec2(x2, y2), kind, is_open};
    }
};

enum class TerrainType : uint8_t {
    Normal,
    Difficult,
    Water,          // Double cost without a swim speed
    Climbing,       // Double cost without a climb speed
    Hazard
};

// Sparse per-cell movement override. Cells without an entry cost 1x.
struct TerrainCell {
    int32_t x = 0;
    int32_t y = 0;
    TerrainType type = TerrainType::Difficult;
    int32_t movement_cost = 2;              // Multiplier applied to the base step cost
};

enum class EntityType : uint8_t {
    Player,
    Enemy,
    Npc
};

// Creature on the map. Position is the top-left cell of its footprint.
struct Token {
    std::string id;
    int32_t grid_x = 0;
    int32_t grid_y = 0;
    int32_t size_x = 1;                     // Footprint width in cells
    int32_t size_y = 1;                     // Footprint height in cells
    EntityType entity_type = EntityType::Player;
    bool darkvision = false;
    std::optional<int32_t> darkvision_range; // Feet

    // Footprint center in cells (a 2x2 token at (3,3) is centered on (4,4))
    math::Vec2 footprint_center() const noexcept {
        return math::Vec2(grid_x + size_x * 0.5, grid_y + size_y * 0.5);
    }
};

// Ambient or per-point illumination
enum class LightLevel : uint8_t {
    Bright,
    Dim,
    Darkness
};

// Point light in grid space. dim_radius extends beyond bright_radius.
struct LightSource {
    double x = 0.0;
    double y = 0.0;
    double bright_radius = 0.0;             // Cells
    double dim_radius = 0.0;                // Cells beyond the bright radius
    std::optional<uint32_t> color;          // 0xRRGGBB, rendering only
};

// How diagonal steps are charged
enum class DiagonalRule : uint8_t {
    Standard,       // Every diagonal costs 5 ft
    Alternate       // 5-10-5: every second diagonal costs 10 ft
};

// Immutable snapshot of everything the computations read. The owning application rebuilds
// or copies it whenever walls, doors, tokens, terrain or lights change.
struct BattleMap {
    GridSettings grid;
    std::vector<WallSegment> walls;
    std::vector<TerrainCell> terrain;
    std::vector<Token> tokens;
    std::vector<LightSource> lights;
    LightLevel ambient_light = LightLevel::Bright;
    DiagonalRule diagonal_rule = DiagonalRule::Standard;

    // Walls scaled to pixels for visibility and lighting
    std::vector<geometry::Segment> pixel_segments() const;

    // Walls in grid units for the pathfinder
    std::vector<geometry::Segment> grid_segments() const;

    const Token* find_token(std::string_view id) const noexcept;
};

// Scale grid-space walls to pixel space, keeping kind and open state
std::vector<geometry::Segment> walls_to_segments(std::span<const WallSegment> walls, double cell_size);

const char* to_string(TerrainType type) noexcept;
std::optional<TerrainType> terrain_type_from_string(std::string_view name) noexcept;

const char* to_string(EntityType type) noexcept;
std::optional<EntityType> entity_type_from_string(std::string_view name) noexcept;

const char* to_string(LightLevel level) noexcept;
std::optional<LightLevel> light_level_from_string(std::string_view name) noexcept;

const char* to_string(DiagonalRule rule) noexcept;
std::optional<DiagonalRule> diagonal_rule_from_string(std::string_view name) noexcept;

} // namespace sightline::map
