// =============================================================================
// Resolution Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geocell/resolution.hpp"
#include "geocell/codec.hpp"
#include "geocell/error.hpp"
#include <cmath>
#include <limits>

using namespace geocell;

class ResolutionTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ResolutionTest, KnownValues) {
    Resolutions r1 = resolution_for(1);
    EXPECT_DOUBLE_EQ(r1.lon, 45.0);
    EXPECT_DOUBLE_EQ(r1.lat, 45.0);

    Resolutions r2 = resolution_for(2);
    EXPECT_DOUBLE_EQ(r2.lon, 11.25);
    EXPECT_DOUBLE_EQ(r2.lat, 5.625);

    Resolutions r12 = resolution_for(12);
    EXPECT_DOUBLE_EQ(r12.lon, std::ldexp(360.0, -30));
    EXPECT_DOUBLE_EQ(r12.lat, std::ldexp(180.0, -30));
}

// Independent precisions per axis
TEST_F(ResolutionTest, MixedPrecisions) {
    Resolutions r = resolution_for(3, 1);
    EXPECT_DOUBLE_EQ(r.lon, resolution_for(3).lon);
    EXPECT_DOUBLE_EQ(r.lat, resolution_for(1).lat);
}

// Resolution matches the actual cell dimensions
TEST_F(ResolutionTest, MatchesCellSize) {
    for (int p = 1; p <= MAX_PRECISION; ++p) {
        BoundingBox box = Codec::bounds(Codec::encode(52.205, 0.119, p));
        Resolutions r = resolution_for(p);
        EXPECT_DOUBLE_EQ(box.width(), r.lon) << "precision " << p;
        EXPECT_DOUBLE_EQ(box.height(), r.lat) << "precision " << p;
    }
}

TEST_F(ResolutionTest, InverseOfPrecision) {
    for (int p = 1; p <= MAX_PRECISION; ++p) {
        Resolutions r = resolution_for(p, p);
        EXPECT_EQ(precision_for(r.lon, r.lat), p);
    }
}

TEST_F(ResolutionTest, PrecisionForTargets) {
    EXPECT_EQ(precision_for(45.0), 1);
    EXPECT_EQ(precision_for(44.9), 2);
    EXPECT_EQ(precision_for(1000.0), 1);
    EXPECT_EQ(precision_for(11.25, 5.625), 2);
    // Finer than anything representable falls back to the maximum
    EXPECT_EQ(precision_for(0.0), MAX_PRECISION);
    EXPECT_EQ(precision_for(1e-12), MAX_PRECISION);
}

TEST_F(ResolutionTest, RejectsBadInput) {
    EXPECT_THROW(resolution_for(0), InvalidPrecisionError);
    EXPECT_THROW(resolution_for(13), InvalidPrecisionError);
    EXPECT_THROW(resolution_for(5, 0), InvalidPrecisionError);
    EXPECT_THROW(precision_for(-1.0), InvalidResolutionError);
    EXPECT_THROW(precision_for(1.0, std::numeric_limits<double>::quiet_NaN()), InvalidResolutionError);
}
