#pragma once

#include <sightline/geometry/polygon.hpp>
#include <sightline/map/battle_map.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sightline::vision {

using map::CellCoord;
using map::CellCoordHash;
using map::Token;

// O(1) membership index over grid cells
using VisionSet = std::unordered_set<CellCoord, CellCoordHash>;

// Result of party vision - one polygon per viewer plus the union as cells
struct PartyVision {
    std::vector<geometry::VisibilityPolygon> party_polygons;   // Pixel space, viewer order
    std::vector<CellCoord> visible_cells;                      // Row-major order
};

// Three-state fog of war for one cell
enum class FogState : uint8_t {
    Visible,        // Seen by the party now, or revealed by the DM
    Explored,       // Seen before, not now
    Unexplored      // Never seen
};

// Visible cells of the current frame plus the explored set grown by them
struct VisionUpdate {
    std::vector<CellCoord> visible_cells;
    VisionSet explored_cells;
};

// Party-wide visibility
// One ray-cast polygon per viewer, unioned into a visible-cell set by testing each cell
// center against every polygon. A cell seen by any viewer is visible to the whole party.
class VisionAggregator {
public:
    // Polygons are anchored at each viewer's footprint center. No viewers, no vision.
    static PartyVision compute_party_vision(const map::BattleMap& battle_map,
                                            std::span<const Token> viewers);

    // Footprint center of target inside any party polygon
    static bool is_token_visible_to_party(const Token& target,
                                          std::span<const geometry::VisibilityPolygon> party_polygons,
                                          double cell_size);

    static VisionSet build_vision_set(std::span<const CellCoord> cells);

    // Any cell of the token's footprint in the set. A large creature stays visible while any
    // part of it is.
    static bool is_token_in_vision_set(const Token& token, const VisionSet& vision_set);

    // Party vision for the map's player tokens, folded into the explored set
    static VisionUpdate recompute_vision(const map::BattleMap& battle_map, const VisionSet& explored);
};

// Player tokens only; enemies and NPCs do not feed party vision
std::vector<Token> select_viewer_tokens(std::span<const Token> tokens);

// Species with darkvision (aasimar, dragonborn, dwarf, elf, gnome, orc, tiefling)
bool has_darkvision(std::string_view species_id);

// 120 ft for dwarves, orcs and drow, 60 ft for the other darkvision species, else 0
int32_t darkvision_range_feet(std::string_view species_id, std::string_view subspecies_id = {});

// Token darkvision in cells: explicit range, else 60 ft when flagged, else 0
int32_t token_darkvision_cells(const Token& token);

FogState classify_fog_cell(const CellCoord& cell,
                           const VisionSet& visible,
                           const VisionSet& revealed,
                           const VisionSet& explored);

// Union of explored and visible
VisionSet merge_explored(const VisionSet& explored, std::span<const CellCoord> visible);

} // namespace sightline::vision
