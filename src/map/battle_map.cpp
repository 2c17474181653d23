#include <sightline/map/battle_map.hpp>

namespace sightline::map {

std::vector<geometry::Segment> walls_to_segments(std::span<const WallSegment> walls, double cell_size) {
    std::vector<geometry::Segment> segments;
    segments.reserve(walls.size());
    for (const WallSegment& wall : walls) {
        geometry::Segment segment = wall.to_segment();
        segment.a *= cell_size;
        segment.b *= cell_size;
        segments.push_back(segment);
    }
    return segments;
}

std::vector<geometry::Segment> BattleMap::pixel_segments() const {
    return walls_to_segments(walls, grid.cell_size);
}

std::vector<geometry::Segment> BattleMap::grid_segments() const {
    return walls_to_segments(walls, 1.0);
}

const Token* BattleMap::find_token(std::string_view id) const noexcept {
    for (const Token& token : tokens) {
        if (token.id == id) {
            return &token;
        }
    }
    return nullptr;
}

const char* to_string(TerrainType type) noexcept {
    switch (type) {
        case TerrainType::Normal: return "normal";
        case TerrainType::Difficult: return "difficult";
        case TerrainType::Water: return "water";
        case TerrainType::Climbing: return "climbing";
        case TerrainType::Hazard: return "hazard";
        default: return "unknown";
    }
}

std::optional<TerrainType> terrain_type_from_string(std::string_view name) noexcept {
    if (name == "normal") return TerrainType::Normal;
    if (name == "difficult") return TerrainType::Difficult;
    if (name == "water") return TerrainType::Water;
    if (name == "climbing") return TerrainType::Climbing;
    if (name == "hazard") return TerrainType::Hazard;
    return std::nullopt;
}

const char* to_string(EntityType type) noexcept {
    switch (type) {
        case EntityType::Player: return "player";
        case EntityType::Enemy: return "enemy";
        case EntityType::Npc: return "npc";
        default: return "unknown";
    }
}

std::optional<EntityType> entity_type_from_string(std::string_view name) noexcept {
    if (name == "player") return EntityType::Player;
    if (name == "enemy") return EntityType::Enemy;
    if (name == "npc") return EntityType::Npc;
    return std::nullopt;
}

const char* to_string(LightLevel level) noexcept {
    switch (level) {
        case LightLevel::Bright: return "bright";
        case LightLevel::Dim: return "dim";
        case LightLevel::Darkness: return "darkness";
        default: return "unknown";
    }
}

std::optional<LightLevel> light_level_from_string(std::string_view name) noexcept {
    if (name == "bright") return LightLevel::Bright;
    if (name == "dim") return LightLevel::Dim;
    if (name == "darkness") return LightLevel::Darkness;
    return std::nullopt;
}

const char* to_string(DiagonalRule rule) noexcept {
    switch (rule) {
        case DiagonalRule::Standard: return "standard";
        case DiagonalRule::Alternate: return "alternate";
        default: return "unknown";
    }
}

std::optional<DiagonalRule> diagonal_rule_from_string(std::string_view name) noexcept {
    if (name == "standard") return DiagonalRule::Standard;
    if (name == "alternate") return DiagonalRule::Alternate;
    return std::nullopt;
}

} // namespace sightline::map
