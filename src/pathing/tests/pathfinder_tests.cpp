#include <sightline/pathing/pathfinder.hpp>
#include <sightline/core/log.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdlib>
#include <vector>

using namespace sightline;
using namespace sightline::pathing;
using namespace testing;

using geometry::Point;
using geometry::Segment;

// Test fixture: open 10x10 grid, walls and terrain added per test
class PathfinderTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::instance().set_console_output(false);
    }

    PathResult find(int32_t sx, int32_t sy, int32_t gx, int32_t gy, const PathOptions& options = {}) {
        return Pathfinder::find_path(sx, sy, gx, gy, width, height, walls, terrain, options);
    }

    static TerrainCell make_terrain(int32_t x, int32_t y, map::TerrainType type, int32_t cost = 2) {
        TerrainCell cell;
        cell.x = x;
        cell.y = y;
        cell.type = type;
        cell.movement_cost = cost;
        return cell;
    }

    // Consecutive cells are 8-adjacent
    static void expect_contiguous(const std::vector<CellCoord>& path) {
        for (size_t i = 1; i < path.size(); ++i) {
            int32_t step = math::utils::chebyshev_distance(path[i - 1].x, path[i - 1].y, path[i].x, path[i].y);
            EXPECT_EQ(step, 1) << "gap at step " << i;
        }
    }

    int32_t width = 10;
    int32_t height = 10;
    std::vector<Segment> walls;
    std::vector<TerrainCell> terrain;
};

// ============================================================================
// Basic paths
// ============================================================================

TEST_F(PathfinderTest, StartEqualsGoal) {
    PathResult result = find(3, 3, 3, 3);
    EXPECT_TRUE(result.reached_goal);
    EXPECT_EQ(result.total_cost, 0);
    ASSERT_EQ(result.path.size(), 1u);
    EXPECT_EQ(result.path[0], (CellCoord{3, 3}));
}

TEST_F(PathfinderTest, StraightLineCostsFivePerCell) {
    PathResult result = find(0, 0, 3, 0);
    EXPECT_TRUE(result.reached_goal);
    EXPECT_EQ(result.total_cost, 15);
    ASSERT_EQ(result.path.size(), 4u);
    EXPECT_EQ(result.path.front(), (CellCoord{0, 0}));
    EXPECT_EQ(result.path.back(), (CellCoord{3, 0}));
}

TEST_F(PathfinderTest, DiagonalCostsSameAsStraight) {
    PathResult result = find(0, 0, 3, 3);
    EXPECT_TRUE(result.reached_goal);
    EXPECT_EQ(result.total_cost, 15);
    ASSERT_EQ(result.path.size(), 4u);
    EXPECT_EQ(result.path[1], (CellCoord{1, 1}));
    EXPECT_EQ(result.path[2], (CellCoord{2, 2}));
}

TEST_F(PathfinderTest, MixedMoveCostsChebyshevDistance) {
    PathResult result = find(1, 2, 7, 5);
    EXPECT_TRUE(result.reached_goal);
    EXPECT_EQ(result.total_cost, 30);
    EXPECT_EQ(result.path.size(), 7u);
    expect_contiguous(result.path);
}

TEST_F(PathfinderTest, OffGridEndpointsNotReached) {
    PathResult result = find(-1, 0, 3, 3);
    EXPECT_FALSE(result.reached_goal);
    EXPECT_TRUE(result.path.empty());

    result = find(0, 0, 10, 3);
    EXPECT_FALSE(result.reached_goal);
    EXPECT_TRUE(result.path.empty());
}

// ============================================================================
// Walls
// ============================================================================

TEST_F(PathfinderTest, WallForcesDetour) {
    width = 5;
    height = 5;
    walls.push_back(Segment::solid(Point(2, 0), Point(2, 3)));

    PathResult result = find(0, 1, 4, 1);
    EXPECT_TRUE(result.reached_goal);
    EXPECT_GT(result.total_cost, 20);
    EXPECT_EQ(result.total_cost, 25);
    expect_contiguous(result.path);

    // The detour goes below the wall end
    bool passes_below = false;
    for (const CellCoord& cell : result.path) {
        if (cell.y >= 3) passes_below = true;
    }
    EXPECT_TRUE(passes_below);
}

TEST_F(PathfinderTest, EnclosedStartNotReached) {
    walls = {
        Segment::solid(Point(2, 2), Point(3, 2)),
        Segment::solid(Point(3, 2), Point(3, 3)),
        Segment::solid(Point(3, 3), Point(2, 3)),
        Segment::solid(Point(2, 3), Point(2, 2)),
    };

    PathResult result = find(2, 2, 0, 0);
    EXPECT_FALSE(result.reached_goal);
    EXPECT_TRUE(result.path.empty());
    EXPECT_EQ(result.total_cost, 0);
}

TEST_F(PathfinderTest, WindowBlocksMovement) {
    width = 5;
    height = 5;
    walls.push_back(Segment::window(Point(2, 0), Point(2, 5)));

    PathResult result = find(0, 0, 4, 0);
    EXPECT_FALSE(result.reached_goal);
}

TEST_F(PathfinderTest, ClosedDoorBlocksOpenDoorDoesNot) {
    width = 5;
    height = 5;
    walls.push_back(Segment::door(Point(2, 0), Point(2, 5), false));
    EXPECT_FALSE(find(0, 0, 4, 0).reached_goal);

    walls[0].is_open = true;
    PathResult result = find(0, 0, 4, 0);
    EXPECT_TRUE(result.reached_goal);
    EXPECT_EQ(result.total_cost, 20);
}

TEST_F(PathfinderTest, WallOnEdgeBlocksSingleStep) {
    walls.push_back(Segment::solid(Point(1, 0), Point(1, 1)));

    EXPECT_TRUE(Pathfinder::is_movement_blocked_by_wall(0, 0, 1, 0, walls));
    EXPECT_TRUE(Pathfinder::is_movement_blocked_by_wall(1, 0, 0, 0, walls));
    EXPECT_FALSE(Pathfinder::is_movement_blocked_by_wall(0, 1, 1, 1, walls));
    EXPECT_FALSE(Pathfinder::is_movement_blocked_by_wall(0, 0, 0, 1, walls));
}

TEST_F(PathfinderTest, DiagonalBlockedByWallAtCorner) {
    // Vertical wall touching the corner shared by (0,0) and (1,1)
    walls.push_back(Segment::solid(Point(1, 1), Point(1, 2)));

    EXPECT_TRUE(Pathfinder::is_movement_blocked_by_wall(0, 0, 1, 1, walls));
    EXPECT_TRUE(Pathfinder::is_movement_blocked_by_wall(1, 1, 0, 0, walls));
    EXPECT_FALSE(Pathfinder::is_movement_blocked_by_wall(2, 2, 3, 3, walls));
}

TEST_F(PathfinderTest, SlantedWallBlocksCrossingStep) {
    walls.push_back(Segment::solid(Point(0, 2), Point(2, 0)));

    EXPECT_TRUE(Pathfinder::is_movement_blocked_by_wall(0, 0, 1, 1, walls));
    EXPECT_FALSE(Pathfinder::is_movement_blocked_by_wall(3, 3, 4, 4, walls));
}

TEST_F(PathfinderTest, SlantedWallEndingOnCellCenterOnlyBlocksCrossingSteps) {
    // Starts on the center of (1,1), runs to the center of (3,2)
    walls.push_back(Segment::solid(Point(1.5, 1.5), Point(3.5, 2.5)));

    // Ends on the wall
    EXPECT_FALSE(Pathfinder::is_movement_blocked_by_wall(0, 0, 1, 1, walls));
    // Starts on the wall
    EXPECT_FALSE(Pathfinder::is_movement_blocked_by_wall(1, 1, 2, 1, walls));
    EXPECT_FALSE(Pathfinder::is_movement_blocked_by_wall(1, 1, 0, 1, walls));
    // Crosses it
    EXPECT_TRUE(Pathfinder::is_movement_blocked_by_wall(2, 1, 2, 2, walls));
    EXPECT_TRUE(Pathfinder::is_movement_blocked_by_wall(2, 2, 2, 1, walls));
}

// ============================================================================
// Budget
// ============================================================================

TEST_F(PathfinderTest, BudgetBelowOptimumNotReached) {
    PathOptions options;
    options.movement_budget = 15;

    PathResult result = find(0, 0, 4, 0, options);
    EXPECT_FALSE(result.reached_goal);
    EXPECT_TRUE(result.path.empty());
}

TEST_F(PathfinderTest, BudgetAtOptimumReached) {
    PathOptions options;
    options.movement_budget = 20;

    PathResult result = find(0, 0, 4, 0, options);
    EXPECT_TRUE(result.reached_goal);
    EXPECT_EQ(result.total_cost, 20);
}

// ============================================================================
// Terrain
// ============================================================================

TEST_F(PathfinderTest, DifficultTerrainDoublesStep) {
    width = 3;
    height = 1;
    terrain.push_back(make_terrain(1, 0, map::TerrainType::Difficult));

    PathResult result = find(0, 0, 2, 0);
    EXPECT_TRUE(result.reached_goal);
    EXPECT_EQ(result.total_cost, 15);
}

TEST_F(PathfinderTest, RouteAvoidsDifficultTerrain) {
    terrain.push_back(make_terrain(1, 0, map::TerrainType::Difficult));

    PathResult result = find(0, 0, 2, 0);
    EXPECT_TRUE(result.reached_goal);
    EXPECT_EQ(result.total_cost, 10);
    EXPECT_THAT(result.path, Not(Contains(CellCoord{1, 0})));
}

TEST_F(PathfinderTest, WaterWaivedBySwimSpeed) {
    width = 3;
    height = 1;
    terrain.push_back(make_terrain(1, 0, map::TerrainType::Water));

    EXPECT_EQ(find(0, 0, 2, 0).total_cost, 15);

    PathOptions swimmer;
    swimmer.speeds.has_swim_speed = true;
    EXPECT_EQ(find(0, 0, 2, 0, swimmer).total_cost, 10);
}

TEST_F(PathfinderTest, ClimbingWaivedByClimbSpeed) {
    width = 3;
    height = 1;
    terrain.push_back(make_terrain(1, 0, map::TerrainType::Climbing));

    EXPECT_EQ(find(0, 0, 2, 0).total_cost, 15);

    PathOptions climber;
    climber.speeds.has_climb_speed = true;
    EXPECT_EQ(find(0, 0, 2, 0, climber).total_cost, 10);
}

TEST_F(PathfinderTest, StepCostRules) {
    TokenSpeeds none;
    TokenSpeeds swimmer;
    swimmer.has_swim_speed = true;

    EXPECT_EQ(Pathfinder::step_cost(nullptr, 5, none), 5);

    TerrainCell hazard = make_terrain(0, 0, map::TerrainType::Hazard, 3);
    EXPECT_EQ(Pathfinder::step_cost(&hazard, 5, none), 15);

    TerrainCell plain = make_terrain(0, 0, map::TerrainType::Normal, 1);
    EXPECT_EQ(Pathfinder::step_cost(&plain, 5, none), 5);

    TerrainCell deep_water = make_terrain(0, 0, map::TerrainType::Water, 4);
    EXPECT_EQ(Pathfinder::step_cost(&deep_water, 5, none), 10);
    EXPECT_EQ(Pathfinder::step_cost(&deep_water, 5, swimmer), 5);
}

// ============================================================================
// Diagonal rules
// ============================================================================

TEST_F(PathfinderTest, AlternateRuleChargesEverySecondDiagonal) {
    PathOptions options;
    options.diagonal_rule = DiagonalRule::Alternate;

    EXPECT_EQ(find(0, 0, 1, 1, options).total_cost, 5);
    EXPECT_EQ(find(0, 0, 2, 2, options).total_cost, 15);
    EXPECT_EQ(find(0, 0, 3, 3, options).total_cost, 20);
    EXPECT_EQ(find(0, 0, 4, 4, options).total_cost, 30);

    // Straight moves are unaffected
    EXPECT_EQ(find(0, 0, 4, 0, options).total_cost, 20);
}

TEST_F(PathfinderTest, HeuristicMatchesOpenGridCost) {
    EXPECT_EQ(Pathfinder::heuristic(0, 0, 3, 3, DiagonalRule::Standard), 15);
    EXPECT_EQ(Pathfinder::heuristic(0, 0, 5, 2, DiagonalRule::Standard), 25);
    EXPECT_EQ(Pathfinder::heuristic(0, 0, 2, 2, DiagonalRule::Alternate), 15);
    EXPECT_EQ(Pathfinder::heuristic(0, 0, 5, 2, DiagonalRule::Alternate), 30);
}

TEST_F(PathfinderTest, MapOverloadUsesMapRule) {
    map::BattleMap battle_map;
    battle_map.grid.width = 6;
    battle_map.grid.height = 6;
    battle_map.diagonal_rule = DiagonalRule::Alternate;

    PathResult result = Pathfinder::find_path(battle_map, CellCoord{0, 0}, CellCoord{2, 2});
    EXPECT_TRUE(result.reached_goal);
    EXPECT_EQ(result.total_cost, 15);

    PathResult limited = Pathfinder::find_path(battle_map, CellCoord{0, 0}, CellCoord{2, 2}, 10);
    EXPECT_FALSE(limited.reached_goal);
}

TEST_F(PathfinderTest, MapOverloadSeesMapWalls) {
    map::BattleMap battle_map;
    battle_map.grid.width = 5;
    battle_map.grid.height = 5;

    map::WallSegment wall;
    wall.id = "w";
    wall.x1 = 2;
    wall.y1 = 0;
    wall.x2 = 2;
    wall.y2 = 5;
    battle_map.walls.push_back(wall);

    EXPECT_FALSE(Pathfinder::find_path(battle_map, CellCoord{0, 0}, CellCoord{4, 0}).reached_goal);
}

// ============================================================================
// Reachable cells
// ============================================================================

TEST_F(PathfinderTest, ReachableOneStepRing) {
    width = 5;
    height = 5;

    std::vector<ReachableCell> cells =
        Pathfinder::get_reachable_cells_with_walls(2, 2, 5, terrain, width, height, walls);

    ASSERT_EQ(cells.size(), 8u);
    for (const ReachableCell& cell : cells) {
        EXPECT_EQ(cell.cost, 5);
        EXPECT_FALSE(cell.x == 2 && cell.y == 2);
    }

    // Same cost: row-major order
    EXPECT_EQ(cells.front().x, 1);
    EXPECT_EQ(cells.front().y, 1);
    EXPECT_EQ(cells.back().x, 3);
    EXPECT_EQ(cells.back().y, 3);
}

TEST_F(PathfinderTest, ReachableSortedByCost) {
    std::vector<ReachableCell> cells =
        Pathfinder::get_reachable_cells_with_walls(5, 5, 10, terrain, width, height, walls);

    // 5x5 block minus the origin
    ASSERT_EQ(cells.size(), 24u);
    for (size_t i = 1; i < cells.size(); ++i) {
        EXPECT_LE(cells[i - 1].cost, cells[i].cost);
    }
    EXPECT_EQ(cells.back().cost, 10);
}

TEST_F(PathfinderTest, ReachableRespectsWalls) {
    width = 5;
    height = 5;
    walls.push_back(Segment::solid(Point(3, 0), Point(3, 5)));

    std::vector<ReachableCell> cells =
        Pathfinder::get_reachable_cells_with_walls(2, 2, 5, terrain, width, height, walls);

    EXPECT_EQ(cells.size(), 5u);
    for (const ReachableCell& cell : cells) {
        EXPECT_LT(cell.x, 3);
    }
}

TEST_F(PathfinderTest, ReachableRespectsTerrain) {
    width = 3;
    height = 1;
    terrain.push_back(make_terrain(1, 0, map::TerrainType::Difficult));

    std::vector<ReachableCell> cells =
        Pathfinder::get_reachable_cells_with_walls(0, 0, 10, terrain, width, height, walls);

    ASSERT_EQ(cells.size(), 1u);
    EXPECT_EQ(cells[0].x, 1);
    EXPECT_EQ(cells[0].cost, 10);
}

TEST_F(PathfinderTest, ReachableEmptyForZeroBudgetOrOffGrid) {
    EXPECT_TRUE(Pathfinder::get_reachable_cells_with_walls(2, 2, 0, terrain, width, height, walls).empty());
    EXPECT_TRUE(Pathfinder::get_reachable_cells_with_walls(-1, 2, 30, terrain, width, height, walls).empty());
}
