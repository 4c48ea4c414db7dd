// =============================================================================
// Distance Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geocell/distance.hpp"
#include "geocell/error.hpp"
#include "geocell/formulas.hpp"
#include <cmath>
#include <limits>

using namespace geocell;

class DistanceTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(DistanceTest, CommonPrefix) {
    EXPECT_EQ(common_prefix_length("u120fxwsh", "u120fxws0"), 8u);
    EXPECT_EQ(common_prefix_length("u120", "u120fxw"), 4u);
    EXPECT_EQ(common_prefix_length("s", "u"), 0u);
    EXPECT_EQ(common_prefix_length("gcpu", "gcpu"), 4u);
}

// Tier 1: cell size radius at the common prefix length
TEST_F(DistanceTest, CellSizeTier) {
    EXPECT_DOUBLE_EQ(distance1("u120fxwsh", "u120fxws0"), 15.239);
    EXPECT_DOUBLE_EQ(distance1("u120fxwsh", "U120FXWS0"), 15.239);
    EXPECT_DOUBLE_EQ(distance1("s", "u"), CELL_SIZES[0].radius);
    EXPECT_DOUBLE_EQ(distance1("u120fxw", "u120fxw"), CELL_SIZES[7].radius);
}

// Tier 2: flat-earth distance of the centers
TEST_F(DistanceTest, FlatEarthTier) {
    EXPECT_NEAR(distance2("u120fxwsh", "u120fxws0"), 19.0879, 1e-3);
    EXPECT_DOUBLE_EQ(distance2("u120fxw", "u120fxw"), 0.0);

    // Latitude adjustment shrinks an east-west offset
    double adjusted = distance2("u120fxwsh", "u120fxws0", R_M, true);
    EXPECT_NEAR(adjusted, 11.6978, 1e-3);

    // radius 0 gives degrees squared
    double d2 = distance2("u120fxwsh", "u120fxws0", 0.0);
    EXPECT_NEAR(std::sqrt(d2), 0.000171661376953125, 1e-12);
}

// Tier 3: haversine distance of the centers
TEST_F(DistanceTest, GreatCircleTier) {
    EXPECT_NEAR(distance3("u120fxwsh", "u120fxws0"), 11.6978, 1e-3);
    EXPECT_NEAR(distance3("u120fxwsh", "u120fxws0", 6371.0087714), 0.0116978, 1e-6);
}

TEST_F(DistanceTest, RejectsBadInput) {
    EXPECT_THROW(distance1("", "u"), InvalidGeohashError);
    EXPECT_THROW(distance2("u", "a"), InvalidGeohashError);
    EXPECT_THROW(distance3("u", "s", -1.0), InvalidArgumentError);
}

// Only radius 0 selects degrees squared; other bad radii are errors
TEST_F(DistanceTest, FlatEarthRejectsBadRadius) {
    EXPECT_THROW(distance2("u120fxwsh", "u120fxws0", -1.0), InvalidArgumentError);
    EXPECT_THROW(distance2("u120fxwsh", "u120fxws0", -6371000.0, true), InvalidArgumentError);
    EXPECT_THROW(distance2("u120fxwsh", "u120fxws0", std::numeric_limits<double>::quiet_NaN()),
                 InvalidArgumentError);
    EXPECT_THROW(distance2("u120fxwsh", "u120fxws0", std::numeric_limits<double>::infinity()),
                 InvalidArgumentError);
}

TEST_F(DistanceTest, SizeTable) {
    EXPECT_EQ(CELL_SIZES.size(), static_cast<size_t>(MAX_PRECISION + 1));
    for (int p = 1; p <= MAX_PRECISION; ++p) {
        EXPECT_LT(cell_size(p).radius, cell_size(p - 1).radius);
        // radius = sqrt(height * width / pi), to the table's 3 decimals
        double r = std::sqrt(cell_size(p).height * cell_size(p).width / Formulas::PI);
        EXPECT_NEAR(cell_size(p).radius, r, 1e-3 + r * 1e-3) << "precision " << p;
    }
    EXPECT_THROW(cell_size(13), InvalidPrecisionError);

    LatLonDelta s = cell_sizes("u120fxw");
    EXPECT_DOUBLE_EQ(s.lat, 153.0);
    EXPECT_DOUBLE_EQ(s.lon, 153.0);
}

// =============================================================================
// Formulas
// =============================================================================

TEST(FormulasTest, ValidateCoordinate) {
    EXPECT_NO_THROW(Formulas::validate_coordinate(90.0, -180.0));
    EXPECT_THROW(Formulas::validate_coordinate(90.0001, 0.0), InvalidCoordinateError);
    EXPECT_THROW(Formulas::validate_coordinate(0.0, std::numeric_limits<double>::infinity()),
                 InvalidCoordinateError);
}

TEST(FormulasTest, Unroll) {
    EXPECT_DOUBLE_EQ(Formulas::unroll180(350.0), -10.0);
    EXPECT_DOUBLE_EQ(Formulas::unroll180(-350.0), 10.0);
    EXPECT_DOUBLE_EQ(Formulas::unroll180(45.0), 45.0);
}

// Across the antimeridian only a wrapped delta is short
TEST(FormulasTest, WrapAcrossAntimeridian) {
    Coordinate a(0.0, 179.5), b(0.0, -179.5);
    EXPECT_NEAR(Formulas::equirectangular_squared(a, b, false, true), 1.0, 1e-12);
    EXPECT_NEAR(Formulas::equirectangular_squared(a, b, false, false), 359.0 * 359.0, 1e-9);

    double one_degree = Formulas::radians(1.0) * R_M;
    EXPECT_NEAR(Formulas::haversine(a, b, R_M, true), one_degree, 1e-6);
    EXPECT_NEAR(Formulas::haversine(a, b, R_M, false), one_degree, 1e-6);
}

TEST(FormulasTest, QuarterMeridian) {
    Coordinate equator(0.0, 0.0), pole(90.0, 0.0);
    EXPECT_NEAR(Formulas::haversine(equator, pole), R_M * Formulas::PI / 2.0, 1e-6);
    EXPECT_NEAR(Formulas::equirectangular(equator, pole), R_M * Formulas::PI / 2.0, 1e-6);
    EXPECT_THROW(Formulas::equirectangular(equator, pole, 0.0), InvalidArgumentError);
}
