/**
 * @file test_proj_module.cpp
 * @brief Functional tests for the PROJ-backed search pipeline
 *
 * Needs the PROJ EPSG database; tests are skipped when it cannot load.
 */

#include <gtest/gtest.h>
#include "CoordinateSearch.hpp"
#include "CoordinateSystem.hpp"
#include "CoordinateTransformer.hpp"
#include <cmath>

using namespace SCS;

class ProjModuleTest : public ::testing::Test {
protected:
    void SetUp() override {
        module = std::make_shared<ProjModule>();
    }

    // Load the module, skipping the test when PROJ is not usable
    bool loadOrSkip() {
        try {
            module->load().get();
        } catch (const std::exception& e) {
            load_error = e.what();
            return false;
        }
        return true;
    }

    std::shared_ptr<ProjModule> module;
    std::string load_error;
};

TEST_F(ProjModuleTest, ProjectBeforeLoad) {
    EXPECT_FALSE(module->isLoaded());
    EXPECT_FALSE(module->project(MapPoint(500000.0, 6500000.0, 3006), 3857).has_value());
    EXPECT_FALSE(module->getLastError().empty());
    EXPECT_EQ(module->name(), "PROJ");
}

TEST_F(ProjModuleTest, TmToWebMercator) {
    if (!loadOrSkip()) GTEST_SKIP() << "PROJ not usable: " << load_error;
    EXPECT_TRUE(module->isLoaded());

    auto p = module->project(MapPoint(500000.0, 6500000.0, 3006), 3857);
    ASSERT_TRUE(p.has_value()) << module->getLastError();
    // x = 0 on the central meridian, so x is R * 15 degrees
    EXPECT_NEAR(p->x, 1669792.36, 0.01);
    EXPECT_GT(p->y, 7.5e6);
    EXPECT_LT(p->y, 9.0e6);
    EXPECT_EQ(p->spatial_reference_id, 3857);
}

TEST_F(ProjModuleTest, ZoneToWebMercator) {
    if (!loadOrSkip()) GTEST_SKIP() << "PROJ not usable: " << load_error;

    auto p = module->project(MapPoint(150000.0, 6500000.0, 3008), 3857);
    ASSERT_TRUE(p.has_value()) << module->getLastError();
    EXPECT_NEAR(p->x, 1502813.13, 0.01);
}

TEST_F(ProjModuleTest, TmToGeographic) {
    if (!loadOrSkip()) GTEST_SKIP() << "PROJ not usable: " << load_error;

    // Longitude first after axis normalization
    auto p = module->project(MapPoint(500000.0, 6500000.0, 3006), 4326);
    ASSERT_TRUE(p.has_value()) << module->getLastError();
    EXPECT_NEAR(p->x, 15.0, 1e-6);
    EXPECT_GT(p->y, 58.0);
    EXPECT_LT(p->y, 59.0);
}

TEST_F(ProjModuleTest, InvalidTarget) {
    if (!loadOrSkip()) GTEST_SKIP() << "PROJ not usable: " << load_error;

    EXPECT_FALSE(module->project(MapPoint(500000.0, 6500000.0, 3006), 999999).has_value());
    EXPECT_FALSE(module->getLastError().empty());

    EXPECT_FALSE(module->project(MapPoint(500000.0, 6500000.0), 3857).has_value());
}

TEST_F(ProjModuleTest, SearchEndToEnd) {
    if (!loadOrSkip()) GTEST_SKIP() << "PROJ not usable: " << load_error;

    auto transformer = std::make_shared<CoordinateTransformer>(module);
    auto map_view = std::make_shared<StaticMapView>(3857, 13.4);
    CoordinateSearch search(transformer, map_view);

    SearchOutcome outcome = search.searchCoordinates("N 6500000 E 150000").get();
    ASSERT_EQ(outcome.status, SearchStatus::DELIVERED) << outcome.error;
    EXPECT_EQ(outcome.result->projection->epsg, 3008);
    EXPECT_NEAR(outcome.result->point.x, 1502813.13, 0.01);

    outcome = search.searchCoordinates("6580822 674032").get();
    ASSERT_EQ(outcome.status, SearchStatus::DELIVERED) << outcome.error;
    EXPECT_EQ(outcome.result->projection, &Sweref99::tm());
    EXPECT_DOUBLE_EQ(outcome.result->easting, 674032.0);
    // Stockholm
    EXPECT_NEAR(outcome.result->point.x, 2010000.0, 20000.0);
}
