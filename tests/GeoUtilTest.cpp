#include <gtest/gtest.h>

#include "TestFixtures.hpp"
#include "geo/GeoUtil.hpp"

namespace ranker::test {

TEST(GeoUtilTest, OneDegreeOfLatitude) {
    const GeoPoint a{40.0, -75.0};
    const GeoPoint b{41.0, -75.0};
    EXPECT_NEAR(geoutil::haversine_miles(a, b), 69.09, 0.01);
}

TEST(GeoUtilTest, ZeroDistanceToSelf) {
    EXPECT_DOUBLE_EQ(geoutil::haversine_miles(home_point(), home_point()), 0.0);
}

TEST(GeoUtilTest, KnownCityPair) {
    // New York to Philadelphia, ~80 miles
    const GeoPoint nyc{40.7128, -74.0060};
    const GeoPoint phl{39.9526, -75.1652};
    EXPECT_NEAR(geoutil::haversine_miles(nyc, phl), 80.6, 0.5);
}

TEST(GeoUtilTest, DistanceToSegmentUsesPerpendicular) {
    const GeoPoint a = home_point();
    const GeoPoint b = offset_miles(a, 4.0, 0.0);
    const GeoPoint p = offset_miles(a, 2.0, 0.5);
    EXPECT_NEAR(geoutil::distance_to_segment_miles(p, a, b), 0.5, 0.01);
}

TEST(GeoUtilTest, DistanceToSegmentClampsToEndpoints) {
    const GeoPoint a = home_point();
    const GeoPoint b = offset_miles(a, 4.0, 0.0);
    const GeoPoint p = offset_miles(a, -1.0, 0.0);
    EXPECT_NEAR(geoutil::distance_to_segment_miles(p, a, b), 1.0, 0.01);
}

TEST(GeoUtilTest, DegenerateSegmentIsAPoint) {
    const GeoPoint a = home_point();
    const GeoPoint p = offset_miles(a, 0.0, 1.0);
    EXPECT_NEAR(geoutil::distance_to_segment_miles(p, a, a), 1.0, 0.01);
}

TEST(GeoUtilTest, FormatDistance) {
    EXPECT_EQ(geoutil::format_distance(0.05), "< 0.1 mi");
    EXPECT_EQ(geoutil::format_distance(0.3), "0.3 mi");
    EXPECT_EQ(geoutil::format_distance(12.34), "12.3 mi");
}

}  // namespace ranker::test
