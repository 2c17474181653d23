#include <sightline/pathing/pathfinder.hpp>
#include <sightline/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <unordered_map>

namespace sightline::pathing {

namespace {
    constexpr int32_t INF = std::numeric_limits<int32_t>::max();

    // Wall endpoints are authored on grid lines; allow for float noise from import
    constexpr double GRID_LINE_TOLERANCE = 1e-6;

    // Open-set entry. Lower f first, then lower h (closer to the goal), then insertion order.
    struct OpenNode {
        int32_t f;
        int32_t h;
        uint64_t seq;
        int32_t state;
        int32_t g;
    };

    struct OpenCmp {
        bool operator()(const OpenNode& a, const OpenNode& b) const noexcept {
            // min-heap via priority_queue (reverse comparator)
            if (a.f != b.f) return a.f > b.f;
            if (a.h != b.h) return a.h > b.h;
            return a.seq > b.seq;
        }
    };

    using OpenSet = std::priority_queue<OpenNode, std::vector<OpenNode>, OpenCmp>;
    using TerrainIndex = std::unordered_map<CellCoord, const TerrainCell*, map::CellCoordHash>;

    // First entry wins when a cell is listed twice
    TerrainIndex index_terrain(std::span<const TerrainCell> terrain) {
        TerrainIndex index;
        index.reserve(terrain.size());
        for (const TerrainCell& cell : terrain) {
            index.try_emplace(CellCoord{cell.x, cell.y}, &cell);
        }
        return index;
    }

    const TerrainCell* lookup_terrain(const TerrainIndex& index, int32_t x, int32_t y) {
        auto it = index.find(CellCoord{x, y});
        return it != index.end() ? it->second : nullptr;
    }

    // Dense search-state layout. Under the 5-10-5 rule the cost of the next diagonal depends
    // on how many diagonals came before, so each cell carries two states (even/odd count).
    struct SearchGrid {
        int32_t width;
        int32_t height;
        int32_t parities;

        size_t size() const { return static_cast<size_t>(width) * height * parities; }
        int32_t state(int32_t x, int32_t y, int32_t parity) const { return (y * width + x) * parities + parity; }
        int32_t parity(int32_t state) const { return state % parities; }
        CellCoord cell(int32_t state) const {
            int32_t index = state / parities;
            return CellCoord{index % width, index / width};
        }
    };

    struct StepBase {
        int32_t cost;
        int32_t parity;     // Diagonal count parity after the step
    };

    StepBase base_step(DiagonalRule rule, bool diagonal, int32_t parity) {
        if (!diagonal || rule == DiagonalRule::Standard) {
            return StepBase{BASE_STEP_COST, parity};
        }
        int32_t next = parity ^ 1;
        return StepBase{next == 0 ? ALTERNATE_DIAGONAL_COST : BASE_STEP_COST, next};
    }

    bool near(double a, double b) {
        return std::abs(a - b) < GRID_LINE_TOLERANCE;
    }
}

PathResult Pathfinder::find_path(
    int32_t start_x, int32_t start_y,
    int32_t goal_x, int32_t goal_y,
    int32_t grid_width, int32_t grid_height,
    std::span<const geometry::Segment> walls,
    std::span<const TerrainCell> terrain,
    const PathOptions& options)
{
    if (start_x == goal_x && start_y == goal_y) {
        PathResult trivial;
        trivial.path.push_back(CellCoord{start_x, start_y});
        trivial.reached_goal = true;
        return trivial;
    }

    auto in_grid = [&](int32_t x, int32_t y) {
        return x >= 0 && y >= 0 && x < grid_width && y < grid_height;
    };
    if (!in_grid(start_x, start_y) || !in_grid(goal_x, goal_y)) {
        LOG_WARNING(Pathfinding, "Path ({}, {}) -> ({}, {}) leaves the {}x{} grid",
                    start_x, start_y, goal_x, goal_y, grid_width, grid_height);
        return PathResult{};
    }

    const DiagonalRule rule = options.diagonal_rule;
    const TerrainIndex terrain_index = index_terrain(terrain);
    const SearchGrid grid{grid_width, grid_height, rule == DiagonalRule::Alternate ? 2 : 1};

    std::vector<int32_t> g_cost(grid.size(), INF);
    std::vector<int32_t> parent(grid.size(), -1);

    OpenSet open;
    uint64_t seq = 0;

    const int32_t start_state = grid.state(start_x, start_y, 0);
    const int32_t h0 = heuristic(start_x, start_y, goal_x, goal_y, rule);
    g_cost[start_state] = 0;
    open.push(OpenNode{h0, h0, seq++, start_state, 0});

    size_t expanded = 0;

    while (!open.empty()) {
        const OpenNode top = open.top();
        open.pop();

        // Skip stale queue entries
        if (top.g != g_cost[top.state]) continue;

        const CellCoord current = grid.cell(top.state);
        if (current.x == goal_x && current.y == goal_y) {
            PathResult result;
            for (int32_t s = top.state; s != -1; s = parent[s]) {
                result.path.push_back(grid.cell(s));
            }
            std::reverse(result.path.begin(), result.path.end());
            result.total_cost = top.g;
            result.reached_goal = true;

            LOG_DEBUG(Pathfinding, "Path ({}, {}) -> ({}, {}): {} ft over {} cells, {} expansions",
                      start_x, start_y, goal_x, goal_y, result.total_cost, result.path.size(), expanded);
            return result;
        }

        ++expanded;
        const int32_t parity = grid.parity(top.state);

        for (int32_t dx = -1; dx <= 1; ++dx) {
            for (int32_t dy = -1; dy <= 1; ++dy) {
                if (dx == 0 && dy == 0) continue;
                const int32_t nx = current.x + dx;
                const int32_t ny = current.y + dy;

                if (!in_grid(nx, ny)) continue;
                if (is_movement_blocked_by_wall(current.x, current.y, nx, ny, walls)) continue;

                const StepBase base = base_step(rule, dx != 0 && dy != 0, parity);
                const int32_t new_g = top.g + step_cost(lookup_terrain(terrain_index, nx, ny), base.cost, options.speeds);

                // Never expand past the movement budget
                if (options.movement_budget && new_g > *options.movement_budget) continue;

                const int32_t next_state = grid.state(nx, ny, base.parity);
                if (new_g >= g_cost[next_state]) continue;

                g_cost[next_state] = new_g;
                parent[next_state] = top.state;
                const int32_t h = heuristic(nx, ny, goal_x, goal_y, rule);
                open.push(OpenNode{new_g + h, h, seq++, next_state, new_g});
            }
        }
    }

    if (options.movement_budget) {
        LOG_DEBUG(Pathfinding, "Goal ({}, {}) not reachable from ({}, {}) within {} ft",
                  goal_x, goal_y, start_x, start_y, *options.movement_budget);
    } else {
        LOG_DEBUG(Pathfinding, "Goal ({}, {}) not reachable from ({}, {})",
                  goal_x, goal_y, start_x, start_y);
    }
    return PathResult{};
}

PathResult Pathfinder::find_path(
    const map::BattleMap& battle_map,
    const CellCoord& start,
    const CellCoord& goal,
    std::optional<int32_t> movement_budget,
    const TokenSpeeds& speeds)
{
    PathOptions options;
    options.movement_budget = movement_budget;
    options.diagonal_rule = battle_map.diagonal_rule;
    options.speeds = speeds;

    const std::vector<geometry::Segment> walls = battle_map.grid_segments();
    return find_path(start.x, start.y, goal.x, goal.y,
                     battle_map.grid.width, battle_map.grid.height,
                     walls, battle_map.terrain, options);
}

std::vector<ReachableCell> Pathfinder::get_reachable_cells_with_walls(
    int32_t x, int32_t y,
    int32_t budget,
    std::span<const TerrainCell> terrain,
    int32_t grid_width, int32_t grid_height,
    std::span<const geometry::Segment> walls,
    DiagonalRule diagonal_rule,
    const TokenSpeeds& speeds)
{
    std::vector<ReachableCell> reachable;
    if (budget <= 0 || x < 0 || y < 0 || x >= grid_width || y >= grid_height) {
        return reachable;
    }

    const TerrainIndex terrain_index = index_terrain(terrain);
    const SearchGrid grid{grid_width, grid_height, diagonal_rule == DiagonalRule::Alternate ? 2 : 1};

    std::vector<int32_t> g_cost(grid.size(), INF);
    std::vector<int32_t> best_cell_cost(static_cast<size_t>(grid_width) * grid_height, INF);

    // Dijkstra: h is always 0, so f == g
    OpenSet open;
    uint64_t seq = 0;

    const int32_t start_state = grid.state(x, y, 0);
    g_cost[start_state] = 0;
    open.push(OpenNode{0, 0, seq++, start_state, 0});

    while (!open.empty()) {
        const OpenNode top = open.top();
        open.pop();

        if (top.g != g_cost[top.state]) continue;

        const CellCoord current = grid.cell(top.state);
        int32_t& best = best_cell_cost[static_cast<size_t>(current.y) * grid_width + current.x];
        best = std::min(best, top.g);

        const int32_t parity = grid.parity(top.state);
        for (int32_t dx = -1; dx <= 1; ++dx) {
            for (int32_t dy = -1; dy <= 1; ++dy) {
                if (dx == 0 && dy == 0) continue;
                const int32_t nx = current.x + dx;
                const int32_t ny = current.y + dy;

                if (nx < 0 || ny < 0 || nx >= grid_width || ny >= grid_height) continue;
                if (is_movement_blocked_by_wall(current.x, current.y, nx, ny, walls)) continue;

                const StepBase base = base_step(diagonal_rule, dx != 0 && dy != 0, parity);
                const int32_t new_g = top.g + step_cost(lookup_terrain(terrain_index, nx, ny), base.cost, speeds);
                if (new_g > budget) continue;

                const int32_t next_state = grid.state(nx, ny, base.parity);
                if (new_g >= g_cost[next_state]) continue;

                g_cost[next_state] = new_g;
                open.push(OpenNode{new_g, 0, seq++, next_state, new_g});
            }
        }
    }

    for (int32_t cy = 0; cy < grid_height; ++cy) {
        for (int32_t cx = 0; cx < grid_width; ++cx) {
            if (cx == x && cy == y) continue;
            int32_t cost = best_cell_cost[static_cast<size_t>(cy) * grid_width + cx];
            if (cost != INF) {
                reachable.push_back(ReachableCell{cx, cy, cost});
            }
        }
    }

    std::stable_sort(reachable.begin(), reachable.end(), [](const ReachableCell& a, const ReachableCell& b) {
        return a.cost < b.cost;
    });

    LOG_DEBUG(Pathfinding, "{} cells reachable from ({}, {}) within {} ft", reachable.size(), x, y, budget);
    return reachable;
}

bool Pathfinder::is_movement_blocked_by_wall(
    int32_t from_x, int32_t from_y,
    int32_t to_x, int32_t to_y,
    std::span<const geometry::Segment> walls)
{
    const int32_t dx = to_x - from_x;
    const int32_t dy = to_y - from_y;

    for (const geometry::Segment& wall : walls) {
        if (!geometry::blocks_movement(wall)) continue;
        if (wall_blocks_step(from_x, from_y, dx, dy, wall)) return true;
    }
    return false;
}

int32_t Pathfinder::step_cost(const TerrainCell* cell, int32_t base_cost, const TokenSpeeds& speeds) noexcept {
    if (!cell) {
        return base_cost;
    }

    switch (cell->type) {
        case map::TerrainType::Water:
            return speeds.has_swim_speed ? base_cost : base_cost * 2;
        case map::TerrainType::Climbing:
            return speeds.has_climb_speed ? base_cost : base_cost * 2;
        default:
            break;
    }

    if (cell->movement_cost > 1) {
        return base_cost * cell->movement_cost;
    }
    return base_cost;
}

int32_t Pathfinder::heuristic(int32_t x1, int32_t y1, int32_t x2, int32_t y2, DiagonalRule rule) noexcept {
    const int32_t dx = std::abs(x2 - x1);
    const int32_t dy = std::abs(y2 - y1);

    if (rule == DiagonalRule::Alternate) {
        // Assumes the first diagonal is the cheap one, so it never overestimates
        const int32_t diag = std::min(dx, dy);
        const int32_t straight = std::max(dx, dy) - diag;
        const int32_t full_pairs = diag / 2;
        const int32_t remainder = diag % 2;
        return full_pairs * (BASE_STEP_COST + ALTERNATE_DIAGONAL_COST) +
               remainder * BASE_STEP_COST + straight * BASE_STEP_COST;
    }
    return std::max(dx, dy) * BASE_STEP_COST;
}

bool Pathfinder::wall_blocks_step(int32_t from_x, int32_t from_y, int32_t dx, int32_t dy,
                                  const geometry::Segment& wall)
{
    const bool vertical = near(wall.a.x, wall.b.x);
    const bool horizontal = near(wall.a.y, wall.b.y);

    // Slanted walls: block when they cross the line between the two cell centers
    if (!vertical && !horizontal) {
        const geometry::Point from(from_x + 0.5, from_y + 0.5);
        const geometry::Point to(from_x + dx + 0.5, from_y + dy + 0.5);
        return geometry::properly_crosses(from, to, wall.a, wall.b);
    }

    const int32_t edge_x = dx > 0 ? from_x + 1 : from_x;
    const int32_t edge_y = dy > 0 ? from_y + 1 : from_y;

    if (dx != 0 && dy == 0) {
        return is_vertical_wall_at_edge(edge_x, from_y, wall);
    }
    if (dy != 0 && dx == 0) {
        return is_horizontal_wall_at_edge(from_x, edge_y, wall);
    }

    // Diagonal: any wall on the four edges meeting at the crossed corner blocks it
    return is_vertical_wall_at_edge(edge_x, from_y, wall) ||
           is_vertical_wall_at_edge(edge_x, from_y + dy, wall) ||
           is_horizontal_wall_at_edge(from_x, edge_y, wall) ||
           is_horizontal_wall_at_edge(from_x + dx, edge_y, wall);
}

bool Pathfinder::is_vertical_wall_at_edge(int32_t edge_x, int32_t cell_y, const geometry::Segment& wall) noexcept {
    if (!near(wall.a.x, wall.b.x) || !near(wall.a.x, edge_x)) {
        return false;
    }
    const double min_y = std::min(wall.a.y, wall.b.y);
    const double max_y = std::max(wall.a.y, wall.b.y);
    return min_y <= cell_y + GRID_LINE_TOLERANCE && max_y >= cell_y + 1 - GRID_LINE_TOLERANCE;
}

bool Pathfinder::is_horizontal_wall_at_edge(int32_t cell_x, int32_t edge_y, const geometry::Segment& wall) noexcept {
    if (!near(wall.a.y, wall.b.y) || !near(wall.a.y, edge_y)) {
        return false;
    }
    const double min_x = std::min(wall.a.x, wall.b.x);
    const double max_x = std::max(wall.a.x, wall.b.x);
    return min_x <= cell_x + GRID_LINE_TOLERANCE && max_x >= cell_x + 1 - GRID_LINE_TOLERANCE;
}

} // namespace sightline::pathing
