/**
 * @file test_projection_table.cpp
 * @brief Unit tests for the SWEREF 99 projection table
 */

#include <gtest/gtest.h>
#include "Projection.hpp"

using namespace SCS;

class ProjectionTableTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(ProjectionTableTest, TableLayout) {
    ASSERT_EQ(Sweref99::all().size(), 13u);
    ASSERT_EQ(Sweref99::zones().size(), 12u);
    EXPECT_EQ(Sweref99::all().front(), &Sweref99::tm());

    int epsg = 3007;
    for (const auto& zone : Sweref99::zones()) {
        EXPECT_EQ(zone.epsg, epsg++);
        EXPECT_TRUE(zone.isZone());
    }
}

TEST_F(ProjectionTableTest, TmDefinition) {
    const Projection& tm = Sweref99::tm();
    EXPECT_EQ(tm.id, "sweref99-tm");
    EXPECT_EQ(tm.epsg, 3006);
    EXPECT_EQ(tm.code, "EPSG:3006");
    EXPECT_EQ(tm.name, "SWEREF 99 TM");
    EXPECT_FALSE(tm.isZone());
    EXPECT_DOUBLE_EQ(tm.central_meridian, 15.0);
    EXPECT_DOUBLE_EQ(tm.scale_factor, 0.9996);
    EXPECT_DOUBLE_EQ(tm.false_easting, 500000.0);
    EXPECT_DOUBLE_EQ(tm.bounds.e_min, 300000.0);
    EXPECT_DOUBLE_EQ(tm.bounds.e_max, 700000.0);
    EXPECT_DOUBLE_EQ(tm.bounds.n_min, 6100000.0);
    EXPECT_DOUBLE_EQ(tm.bounds.n_max, 7700000.0);
}

TEST_F(ProjectionTableTest, ZoneDefinition) {
    const Projection* zone = Sweref99::findByEpsg(3008);
    ASSERT_NE(zone, nullptr);
    EXPECT_EQ(zone->id, "sweref99-1330");
    EXPECT_EQ(zone->zone_id, "13 30");
    EXPECT_EQ(zone->name, "SWEREF 99 13 30");
    EXPECT_DOUBLE_EQ(zone->central_meridian, 13.5);
    EXPECT_DOUBLE_EQ(zone->scale_factor, 1.0);
    EXPECT_DOUBLE_EQ(zone->false_easting, 150000.0);
    EXPECT_DOUBLE_EQ(zone->bounds.e_min, 50000.0);
    EXPECT_DOUBLE_EQ(zone->bounds.e_max, 250000.0);
}

TEST_F(ProjectionTableTest, Lookups) {
    EXPECT_EQ(Sweref99::findByEpsg(3006), &Sweref99::tm());
    EXPECT_EQ(Sweref99::findByEpsg(4326), nullptr);
    EXPECT_EQ(Sweref99::findById("sweref99-tm"), &Sweref99::tm());

    const Projection* zone = Sweref99::findById("sweref99-2315");
    ASSERT_NE(zone, nullptr);
    EXPECT_EQ(zone->epsg, 3018);
    EXPECT_EQ(Sweref99::findById("sweref99-9999"), nullptr);
}

TEST_F(ProjectionTableTest, ZoneByMeridian) {
    const Projection* zone = Sweref99::zoneByMeridian(13.5);
    ASSERT_NE(zone, nullptr);
    EXPECT_EQ(zone->epsg, 3008);

    zone = Sweref99::zoneByMeridian(13.499);
    ASSERT_NE(zone, nullptr);
    EXPECT_EQ(zone->epsg, 3008);

    EXPECT_EQ(Sweref99::zoneByMeridian(13.0), nullptr);
}

TEST_F(ProjectionTableTest, NearestZone) {
    EXPECT_EQ(Sweref99::nearestZone(13.4).epsg, 3008);
    EXPECT_EQ(Sweref99::nearestZone(18.1).epsg, 3011);
    EXPECT_EQ(Sweref99::nearestZone(-100.0).epsg, 3007);
    EXPECT_EQ(Sweref99::nearestZone(30.0).epsg, 3018);

    // 12.75 is equally far from 12 00 and 13 30; table order decides
    EXPECT_EQ(Sweref99::nearestZone(12.75).epsg, 3007);
}

TEST_F(ProjectionTableTest, ProjString) {
    std::string tm = Sweref99::tm().projString();
    EXPECT_NE(tm.find("+proj=tmerc"), std::string::npos);
    EXPECT_NE(tm.find("+lon_0=15"), std::string::npos);
    EXPECT_NE(tm.find("+k=0.9996"), std::string::npos);
    EXPECT_NE(tm.find("+x_0=500000"), std::string::npos);
    EXPECT_NE(tm.find("+ellps=GRS80"), std::string::npos);

    std::string zone = Sweref99::findByEpsg(3008)->projString();
    EXPECT_NE(zone.find("+lon_0=13.5"), std::string::npos);
    EXPECT_NE(zone.find("+x_0=150000"), std::string::npos);
}

TEST_F(ProjectionTableTest, BoundsContainment) {
    const ProjectionBounds& b = Sweref99::tm().bounds;
    EXPECT_TRUE(b.contains(300000.0, 6100000.0));
    EXPECT_TRUE(b.contains(700000.0, 7700000.0));
    EXPECT_FALSE(b.contains(299999.0, 6500000.0));
    EXPECT_FALSE(b.contains(500000.0, 7700001.0));
}
