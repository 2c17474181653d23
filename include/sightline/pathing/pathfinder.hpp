#pragma once

#include <sightline/geometry/segment.hpp>
#include <sightline/map/battle_map.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sightline::pathing {

using map::CellCoord;
using map::DiagonalRule;
using map::TerrainCell;

// Cost of one step onto plain ground, in feet
inline constexpr int32_t BASE_STEP_COST = 5;

// Second diagonal of a pair under the 5-10-5 rule
inline constexpr int32_t ALTERNATE_DIAGONAL_COST = 10;

// Movement modes that waive the water/climbing surcharge
struct TokenSpeeds {
    bool has_swim_speed = false;
    bool has_climb_speed = false;
};

struct PathOptions {
    std::optional<int32_t> movement_budget;     // Feet; unset means unlimited
    DiagonalRule diagonal_rule = DiagonalRule::Standard;
    TokenSpeeds speeds;
};

struct PathResult {
    std::vector<CellCoord> path;    // Start to goal inclusive, empty when not reached
    int32_t total_cost = 0;         // Feet
    bool reached_goal = false;
};

struct ReachableCell {
    int32_t x = 0;
    int32_t y = 0;
    int32_t cost = 0;               // Cheapest cumulative cost in feet
};

// Grid A* for tabletop movement
// 8-connected, every step costs 5 ft (diagonals included under the standard rule), scaled by
// the destination cell's terrain. Walls are in grid units: a wall lying on the grid line
// between two cells blocks the step across it, and a diagonal step is blocked by a wall on
// any of the four edges around the shared corner.
class Pathfinder {
public:
    // Minimum-cost route. Start == goal is a zero-cost single-cell path. When no route exists
    // inside the grid, or every route exceeds the budget, the result is empty and not reached.
    static PathResult find_path(
        int32_t start_x, int32_t start_y,
        int32_t goal_x, int32_t goal_y,
        int32_t grid_width, int32_t grid_height,
        std::span<const geometry::Segment> walls,
        std::span<const TerrainCell> terrain,
        const PathOptions& options = {}
    );

    // Route on a map snapshot using its walls, terrain and diagonal rule
    static PathResult find_path(
        const map::BattleMap& battle_map,
        const CellCoord& start,
        const CellCoord& goal,
        std::optional<int32_t> movement_budget = std::nullopt,
        const TokenSpeeds& speeds = {}
    );

    // Every cell reachable from (x, y) within budget, with its cheapest cost.
    // The origin itself is not listed. Sorted by cost, then row, then column.
    static std::vector<ReachableCell> get_reachable_cells_with_walls(
        int32_t x, int32_t y,
        int32_t budget,
        std::span<const TerrainCell> terrain,
        int32_t grid_width, int32_t grid_height,
        std::span<const geometry::Segment> walls,
        DiagonalRule diagonal_rule = DiagonalRule::Standard,
        const TokenSpeeds& speeds = {}
    );

    // Is the single step between two adjacent cells blocked by a wall?
    static bool is_movement_blocked_by_wall(
        int32_t from_x, int32_t from_y,
        int32_t to_x, int32_t to_y,
        std::span<const geometry::Segment> walls
    );

    // Cost of stepping onto a cell (nullptr means no terrain entry)
    static int32_t step_cost(const TerrainCell* cell, int32_t base_cost, const TokenSpeeds& speeds) noexcept;

    // Admissible distance estimate in feet
    static int32_t heuristic(int32_t x1, int32_t y1, int32_t x2, int32_t y2, DiagonalRule rule) noexcept;

private:
    static bool wall_blocks_step(int32_t from_x, int32_t from_y, int32_t dx, int32_t dy,
                                 const geometry::Segment& wall);

    // Vertical wall on grid line x = edge_x covering row cell_y
    static bool is_vertical_wall_at_edge(int32_t edge_x, int32_t cell_y, const geometry::Segment& wall) noexcept;

    // Horizontal wall on grid line y = edge_y covering column cell_x
    static bool is_horizontal_wall_at_edge(int32_t cell_x, int32_t edge_y, const geometry::Segment& wall) noexcept;
};

} // namespace sightline::pathing
