#include <sightline/vision/lighting.hpp>
#include <sightline/vision/raycast_visibility.hpp>
#include <sightline/geometry/polygon.hpp>
#include <sightline/core/log.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace sightline;
using namespace sightline::vision;
using namespace testing;

class LightingTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::instance().set_console_output(false);
    }

    static LightSource make_light(double x, double y, double bright, double dim) {
        LightSource light;
        light.x = x;
        light.y = y;
        light.bright_radius = bright;
        light.dim_radius = dim;
        return light;
    }

    const math::Bounds bounds{500.0, 500.0};    // 10x10 cells at 50 px
    const double cell_size = 50.0;
};

// ============================================================================
// Lit areas
// ============================================================================

TEST_F(LightingTest, NoSourcesNoAreas) {
    std::vector<LitArea> areas = compute_lit_areas({}, {}, bounds, cell_size);
    EXPECT_TRUE(areas.empty());
}

TEST_F(LightingTest, OneAreaPerSourceInOrder) {
    std::vector<LightSource> lights = {
        make_light(2, 2, 2, 2),
        make_light(7, 7, 1, 3),
        make_light(5, 1, 4, 4),
    };

    std::vector<LitArea> areas = compute_lit_areas(lights, {}, bounds, cell_size);
    ASSERT_EQ(areas.size(), 3u);
    for (size_t i = 0; i < lights.size(); ++i) {
        EXPECT_DOUBLE_EQ(areas[i].source.x, lights[i].x);
        EXPECT_DOUBLE_EQ(areas[i].source.y, lights[i].y);
    }
}

TEST_F(LightingTest, PolygonsAnchoredAtSourceInPixels) {
    std::vector<LightSource> lights = {make_light(3, 4, 2, 2)};
    std::vector<LitArea> areas = compute_lit_areas(lights, {}, bounds, cell_size);

    ASSERT_EQ(areas.size(), 1u);
    EXPECT_EQ(areas[0].bright_poly.origin, Point(150, 200));
    EXPECT_EQ(areas[0].dim_poly.origin, Point(150, 200));
}

TEST_F(LightingTest, DimExtendsBeyondBright) {
    std::vector<LightSource> lights = {make_light(5, 5, 2, 2)};
    std::vector<LitArea> areas = compute_lit_areas(lights, {}, bounds, cell_size);

    ASSERT_EQ(areas.size(), 1u);
    double bright = geometry::max_vertex_distance(areas[0].bright_poly);
    double dim = geometry::max_vertex_distance(areas[0].dim_poly);
    EXPECT_GE(dim, bright);
    EXPECT_NEAR(bright, 100.0, 1e-9);
    EXPECT_NEAR(dim, 200.0, 1e-9);
}

TEST_F(LightingTest, ZeroRadiusGivesEmptyPolygons) {
    std::vector<LightSource> lights = {make_light(5, 5, 0, 0)};
    std::vector<LitArea> areas = compute_lit_areas(lights, {}, bounds, cell_size);

    ASSERT_EQ(areas.size(), 1u);
    EXPECT_TRUE(areas[0].bright_poly.points.empty());
    EXPECT_TRUE(areas[0].dim_poly.points.empty());
}

TEST_F(LightingTest, WallShadowsLight) {
    // Wall across the whole map at x = 6 cells
    std::vector<geometry::Segment> walls = {
        geometry::Segment::solid(Point(300, 0), Point(300, 500))
    };
    std::vector<LightSource> lights = {make_light(4, 5, 6, 0)};
    std::vector<LitArea> areas = compute_lit_areas(lights, walls, bounds, cell_size);

    ASSERT_EQ(areas.size(), 1u);
    EXPECT_TRUE(geometry::is_point_visible(Point(250, 250), areas[0].bright_poly));
    EXPECT_FALSE(geometry::is_point_visible(Point(350, 250), areas[0].bright_poly));
}

TEST_F(LightingTest, LightOnWallLineLightsBothSides) {
    std::vector<geometry::Segment> walls = {
        geometry::Segment::solid(Point(300, 0), Point(300, 500))
    };
    std::vector<LightSource> lights = {make_light(6, 5, 2, 0)};
    std::vector<LitArea> areas = compute_lit_areas(lights, walls, bounds, cell_size);

    ASSERT_EQ(areas.size(), 1u);
    EXPECT_FALSE(areas[0].bright_poly.points.empty());
    EXPECT_TRUE(geometry::is_point_visible(Point(250, 250), areas[0].bright_poly));
    EXPECT_TRUE(geometry::is_point_visible(Point(350, 250), areas[0].bright_poly));
}

// ============================================================================
// Point illumination
// ============================================================================

TEST_F(LightingTest, NoSourcesUsesAmbient) {
    EXPECT_EQ(get_lighting_at_point(math::Vec2(3, 3), {}, LightLevel::Bright), LightLevel::Bright);
    EXPECT_EQ(get_lighting_at_point(math::Vec2(3, 3), {}, LightLevel::Dim), LightLevel::Dim);
    EXPECT_EQ(get_lighting_at_point(math::Vec2(3, 3), {}, LightLevel::Darkness), LightLevel::Darkness);
}

TEST_F(LightingTest, InsideBrightRadiusIsBright) {
    std::vector<LightSource> lights = {make_light(5, 5, 4, 4)};
    EXPECT_EQ(get_lighting_at_point(math::Vec2(5, 5), lights, LightLevel::Darkness), LightLevel::Bright);
    EXPECT_EQ(get_lighting_at_point(math::Vec2(8, 5), lights, LightLevel::Darkness), LightLevel::Bright);
    EXPECT_EQ(get_lighting_at_point(math::Vec2(9, 5), lights, LightLevel::Dim), LightLevel::Bright);
}

TEST_F(LightingTest, DimRingDependsOnAmbient) {
    std::vector<LightSource> lights = {make_light(5, 5, 4, 4)};
    const math::Vec2 in_ring(11, 5);

    EXPECT_EQ(get_lighting_at_point(in_ring, lights, LightLevel::Darkness), LightLevel::Dim);
    EXPECT_EQ(get_lighting_at_point(in_ring, lights, LightLevel::Dim), LightLevel::Dim);
    EXPECT_EQ(get_lighting_at_point(in_ring, lights, LightLevel::Bright), LightLevel::Bright);
}

TEST_F(LightingTest, OutsideAllRadiiUsesAmbient) {
    std::vector<LightSource> lights = {make_light(5, 5, 4, 4)};
    EXPECT_EQ(get_lighting_at_point(math::Vec2(20, 5), lights, LightLevel::Darkness), LightLevel::Darkness);
    EXPECT_EQ(get_lighting_at_point(math::Vec2(20, 5), lights, LightLevel::Dim), LightLevel::Dim);
}

TEST_F(LightingTest, AnyBrightSourceWins) {
    std::vector<LightSource> lights = {
        make_light(0, 0, 1, 10),
        make_light(10, 0, 2, 0),
    };
    // Dim from the first light, bright from the second
    EXPECT_EQ(get_lighting_at_point(math::Vec2(9, 0), lights, LightLevel::Darkness), LightLevel::Bright);
}

// ============================================================================
// Catalog
// ============================================================================

TEST_F(LightingTest, FeetToCellsRoundsUp) {
    EXPECT_EQ(feet_to_cells(0), 0);
    EXPECT_EQ(feet_to_cells(5), 1);
    EXPECT_EQ(feet_to_cells(7), 2);
    EXPECT_EQ(feet_to_cells(20), 4);
    EXPECT_EQ(feet_to_cells(60), 12);
    EXPECT_EQ(feet_to_cells(-10), 0);
}

TEST_F(LightingTest, TorchFromCatalog) {
    LightSource torch = light_source_from_catalog("torch", 3, 4);
    EXPECT_DOUBLE_EQ(torch.x, 3.0);
    EXPECT_DOUBLE_EQ(torch.y, 4.0);
    EXPECT_DOUBLE_EQ(torch.bright_radius, 4.0);
    EXPECT_DOUBLE_EQ(torch.dim_radius, 4.0);
}

TEST_F(LightingTest, CatalogConvertsFeetToCells) {
    LightSource candle = light_source_from_catalog("candle", 0, 0);
    EXPECT_DOUBLE_EQ(candle.bright_radius, 1.0);
    EXPECT_DOUBLE_EQ(candle.dim_radius, 1.0);

    LightSource lamp = light_source_from_catalog("lamp", 0, 0);
    EXPECT_DOUBLE_EQ(lamp.bright_radius, 3.0);
    EXPECT_DOUBLE_EQ(lamp.dim_radius, 6.0);

    LightSource daylight = light_source_from_catalog("daylight-spell", 0, 0);
    EXPECT_DOUBLE_EQ(daylight.bright_radius, 12.0);
    EXPECT_DOUBLE_EQ(daylight.dim_radius, 12.0);
}

TEST_F(LightingTest, SpellLightsUseSpellNames) {
    LightSource cantrip = light_source_from_catalog("light-cantrip", 2, 2);
    EXPECT_DOUBLE_EQ(cantrip.bright_radius, 4.0);
    EXPECT_DOUBLE_EQ(cantrip.dim_radius, 4.0);

    LightSource flame = light_source_from_catalog("continual-flame", 2, 2);
    EXPECT_DOUBLE_EQ(flame.bright_radius, 4.0);
}

TEST_F(LightingTest, UnknownCatalogNameUsesDefaults) {
    LightSource unknown = light_source_from_catalog("glowing-mushroom", 1, 1);
    EXPECT_DOUBLE_EQ(unknown.bright_radius, DEFAULT_BRIGHT_RADIUS_CELLS);
    EXPECT_DOUBLE_EQ(unknown.dim_radius, DEFAULT_DIM_RADIUS_CELLS);
}

TEST_F(LightingTest, CatalogNamesAreUnique) {
    std::vector<std::string> names;
    for (const LightSourceDefinition& def : light_catalog()) {
        names.emplace_back(def.name);
    }
    EXPECT_THAT(names, Contains("torch"));
    EXPECT_THAT(names, Contains("lantern-hooded"));

    std::sort(names.begin(), names.end());
    EXPECT_TRUE(std::adjacent_find(names.begin(), names.end()) == names.end());
}
