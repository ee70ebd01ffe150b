/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitring/orientation.hpp>
#include <orbitring/constants.hpp>

#include <cmath>
#include <limits>

namespace orbitring {
namespace {

class OrientationTest : public ::testing::Test {
protected:
    // Two thresholds, three bands
    OrbitingBodyProfile simple{
        "Test Body", 0.5f, 2.0f,
        {10.0f, 20.0f},
        {1.0f, 2.0f, 3.0f},
        400.0,
        RingColor{1.0f, 1.0f, 1.0f, 1.0f}};

    const OrbitingBodyProfile &iss = getProfile(Body::ISS);
    const OrbitingBodyProfile &tss = getProfile(Body::TSS);
    const OrbitingBodyProfile &hst = getProfile(Body::HST);
};

// The inverse of a rotation is its transpose
Mat4 transpose(const Mat4& matrix) {
    Mat4 result{};
    for (int row = 0; row < 4; row++) {
        for (int col = 0; col < 4; col++) {
            result.m[row][col] = matrix.m[col][row];
        }
    }
    return result;
}

float below(float value) {
    return std::nextafter(value, 0.0f);
}

float above(float value) {
    return std::nextafter(value, 90.0f);
}

// ============================================================================
// Exponent Base
// ============================================================================

TEST_F(OrientationTest, ExponentBaseAtEquator) {
    EXPECT_EQ(exponentBase(simple, 0.0f), PI_F / 2.0f);
    EXPECT_EQ(exponentBase(iss, 0.0f), PI_F / iss.getCorrectionMultiplier());
}

TEST_F(OrientationTest, ExponentBaseFormula) {
    float absLat = 37.5f;
    float expected = PI_F / iss.getCorrectionMultiplier()
        + absLat * DEGREES_TO_RADIANS_F / iss.getInclinationRadians();
    EXPECT_EQ(exponentBase(iss, absLat), expected);
}

TEST_F(OrientationTest, ExponentBaseGrowsWithLatitude) {
    EXPECT_LT(exponentBase(hst, 5.0f), exponentBase(hst, 15.0f));
    EXPECT_LT(exponentBase(hst, 15.0f), exponentBase(hst, 25.0f));
}

// ============================================================================
// Band Selection
// ============================================================================

TEST_F(OrientationTest, SelectPowerFirstBand) {
    EXPECT_EQ(selectCorrectionPower(simple, 0.0f), 1.0f);
    EXPECT_EQ(selectCorrectionPower(simple, 5.0f), 1.0f);
}

TEST_F(OrientationTest, SelectPowerThresholdBelongsToLowerBand) {
    EXPECT_EQ(selectCorrectionPower(simple, below(10.0f)), 1.0f);
    EXPECT_EQ(selectCorrectionPower(simple, 10.0f), 1.0f);
    EXPECT_EQ(selectCorrectionPower(simple, above(10.0f)), 2.0f);

    EXPECT_EQ(selectCorrectionPower(simple, 20.0f), 2.0f);
    EXPECT_EQ(selectCorrectionPower(simple, above(20.0f)), 3.0f);
}

TEST_F(OrientationTest, SelectPowerPastLastThreshold) {
    EXPECT_EQ(selectCorrectionPower(simple, 45.0f), 3.0f);
    EXPECT_EQ(selectCorrectionPower(simple, 90.0f), 3.0f);
}

TEST_F(OrientationTest, SelectPowerOutsideLatitudeRange) {
    EXPECT_EQ(selectCorrectionPower(simple, 135.0f), 3.0f);
    EXPECT_EQ(selectCorrectionPower(simple, std::numeric_limits<float>::infinity()), 3.0f);
}

TEST_F(OrientationTest, SelectPowerISSBands) {
    EXPECT_EQ(selectCorrectionPower(iss, 0.0f), 0.80f);
    EXPECT_EQ(selectCorrectionPower(iss, 12.0f), 0.80f);
    EXPECT_EQ(selectCorrectionPower(iss, 12.5f), 0.85f);
    EXPECT_EQ(selectCorrectionPower(iss, 30.0f), 1.25f);
    EXPECT_EQ(selectCorrectionPower(iss, 51.0f), 3.20f);
    EXPECT_EQ(selectCorrectionPower(iss, 51.5f), 4.00f);
}

TEST_F(OrientationTest, SelectPowerTSSFractionalThreshold) {
    EXPECT_EQ(selectCorrectionPower(tss, 41.2f), 2.50f);
    EXPECT_EQ(selectCorrectionPower(tss, 41.5f), 2.50f);
    EXPECT_EQ(selectCorrectionPower(tss, 41.6f), 2.80f);
}

TEST_F(OrientationTest, SelectPowerHSTBands) {
    EXPECT_EQ(selectCorrectionPower(hst, 9.0f), 0.35f);
    EXPECT_EQ(selectCorrectionPower(hst, 21.0f), 1.00f);
    EXPECT_EQ(selectCorrectionPower(hst, 28.0f), 3.00f);
}

// ============================================================================
// Corrected Inclination
// ============================================================================

TEST_F(OrientationTest, InclinationCorrectionTwoStages) {
    float lat = 15.0f;
    float expected = std::pow(exponentBase(simple, lat), 2.0f);
    EXPECT_EQ(inclinationCorrection(simple, lat), expected);
}

TEST_F(OrientationTest, CorrectedInclinationUsesNominalInclinationAsBase) {
    float lat = 33.3f;
    float correction = inclinationCorrection(iss, lat);
    EXPECT_EQ(correctedInclination(iss, lat), std::pow(iss.getInclinationRadians(), correction));
}

TEST_F(OrientationTest, CorrectedInclinationAtEquator) {
    float base = PI_F / 2.0f;
    float expected = std::pow(0.5f, std::pow(base, 1.0f));
    EXPECT_FLOAT_EQ(correctedInclination(simple, 0.0f), expected);
}

TEST_F(OrientationTest, CorrectedInclinationIsSymmetricInLatitude) {
    for (float lat : {0.0f, 7.5f, 10.0f, 12.0f, 33.0f, 45.25f, 51.0f, 60.0f, 89.9f}) {
        EXPECT_EQ(correctedInclination(iss, lat), correctedInclination(iss, -lat)) << "lat " << lat;
        EXPECT_EQ(correctedInclination(tss, lat), correctedInclination(tss, -lat)) << "lat " << lat;
        EXPECT_EQ(correctedInclination(hst, lat), correctedInclination(hst, -lat)) << "lat " << lat;
    }
}

TEST_F(OrientationTest, CorrectedInclinationJumpsAtThreshold) {
    float atThreshold = correctedInclination(simple, 10.0f);
    float justAbove = correctedInclination(simple, above(10.0f));
    EXPECT_GT(std::fabs(atThreshold - justAbove), 1e-3f);
}

TEST_F(OrientationTest, CorrectedInclinationContinuousWithinBand) {
    float a = correctedInclination(simple, below(10.0f));
    float b = correctedInclination(simple, 10.0f);
    EXPECT_NEAR(a, b, 1e-5f);

    float c = correctedInclination(iss, 30.0f);
    float d = correctedInclination(iss, 30.001f);
    EXPECT_NEAR(c, d, 1e-4f);
}

TEST_F(OrientationTest, CorrectedInclinationIsDeterministic) {
    EXPECT_EQ(correctedInclination(hst, 23.45f), correctedInclination(hst, 23.45f));
}

TEST_F(OrientationTest, FractionalPowersStayFiniteAtEquator) {
    OrbitingBodyProfile fractional{
        "Fractional", 0.9f, 2.0f,
        {10.0f},
        {0.8f, 2.0f},
        400.0,
        RingColor{1.0f, 1.0f, 1.0f, 1.0f}};

    EXPECT_GT(exponentBase(fractional, 0.0f), 0.0f);
    EXPECT_TRUE(std::isfinite(correctedInclination(fractional, 0.0f)));

    GeodeticSample sample{.latitudeDeg = 0.0f, .longitudeDeg = 0.0f, .headingFactor = 1.0f};
    Mat4 transform = orbitTrackTransform(fractional, sample);
    for (int row = 0; row < 4; row++) {
        for (int col = 0; col < 4; col++) {
            EXPECT_TRUE(std::isfinite(transform.at(row, col))) << row << "," << col;
        }
    }
}

TEST_F(OrientationTest, BuiltinProfilesFiniteAcrossLatitudes) {
    for (auto body : allBodies()) {
        const auto &profile = getProfile(body);
        for (float lat = -90.0f; lat <= 90.0f; lat += 0.5f) {
            EXPECT_TRUE(std::isfinite(correctedInclination(profile, lat))) << body << " lat " << lat;
        }
    }
}

TEST_F(OrientationTest, CorrectedInclinationOutsideLatitudeRangeIsFinite) {
    EXPECT_TRUE(std::isfinite(correctedInclination(iss, 95.0f)));
    EXPECT_TRUE(std::isfinite(correctedInclination(iss, -180.0f)));
}

// ============================================================================
// Heading
// ============================================================================

TEST(HeadingTest, IncreasingLatitudeIsNorth) {
    EXPECT_EQ(headingFactor(10.0f, 12.0f), 1.0f);
    EXPECT_EQ(headingFactor(-30.0f, -29.0f), 1.0f);
}

TEST(HeadingTest, DecreasingLatitudeIsSouth) {
    EXPECT_EQ(headingFactor(12.0f, 10.0f), -1.0f);
    EXPECT_EQ(headingFactor(-29.0f, -30.0f), -1.0f);
}

TEST(HeadingTest, UnchangedLatitudeIsNorth) {
    EXPECT_EQ(headingFactor(51.6f, 51.6f), 1.0f);
}

TEST(HeadingTest, ParseHeading) {
    EXPECT_EQ(parseHeadingFactor("N"), 1.0f);
    EXPECT_EQ(parseHeadingFactor("north"), 1.0f);
    EXPECT_EQ(parseHeadingFactor("+1"), 1.0f);
    EXPECT_EQ(parseHeadingFactor("1"), 1.0f);
    EXPECT_EQ(parseHeadingFactor("s"), -1.0f);
    EXPECT_EQ(parseHeadingFactor("South"), -1.0f);
    EXPECT_EQ(parseHeadingFactor("-1"), -1.0f);
    EXPECT_FALSE(parseHeadingFactor("east").has_value());
    EXPECT_FALSE(parseHeadingFactor("").has_value());
}

// ============================================================================
// Coordinate Offsets
// ============================================================================

TEST(OffsetTest, LongitudeOffset) {
    EXPECT_EQ(longitudeOffset(180.0f), 0.0f);
    EXPECT_FLOAT_EQ(longitudeOffset(0.0f), -PI_F);
    EXPECT_FLOAT_EQ(longitudeOffset(90.0f), -PI_F / 2.0f);
}

TEST(OffsetTest, LatitudeOffset) {
    EXPECT_EQ(latitudeOffset(-180.0f), 0.0f);
    EXPECT_FLOAT_EQ(latitudeOffset(0.0f), PI_F);
    EXPECT_FLOAT_EQ(latitudeOffset(45.0f), 225.0f * DEGREES_TO_RADIANS_F);
}

TEST(OffsetTest, OffsetsAreAsymmetric) {
    EXPECT_NE(longitudeOffset(30.0f), latitudeOffset(30.0f));
}

// ============================================================================
// Composite Rotation
// ============================================================================

TEST(CompositeTest, ZeroAnglesGiveIdentity) {
    EXPECT_EQ(composite(0.0f, 0.0f, 0.0f), Mat4::identity());
}

TEST(CompositeTest, SingleAngleGivesElementaryRotation) {
    EXPECT_EQ(composite(0.7f, 0.0f, 0.0f), Mat4::rotation(0.7f, 0.0f, 0.0f, 1.0f));
    EXPECT_EQ(composite(0.0f, 0.7f, 0.0f), Mat4::rotation(0.7f, 0.0f, 1.0f, 0.0f));
    EXPECT_EQ(composite(0.0f, 0.0f, 0.7f), Mat4::rotation(0.7f, 1.0f, 0.0f, 0.0f));
}

TEST(CompositeTest, CompositionOrder) {
    float a = 0.3f, b = 0.7f, c = 1.1f;
    Mat4 r1 = Mat4::rotation(a, 0.0f, 0.0f, 1.0f);
    Mat4 r2 = Mat4::rotation(b, 0.0f, 1.0f, 0.0f);
    Mat4 r3 = Mat4::rotation(c, 1.0f, 0.0f, 0.0f);

    EXPECT_EQ(composite(a, b, c), r1 * (r3 * r2));
    EXPECT_FALSE(approximatelyEqual(composite(a, b, c), r1 * (r2 * r3), 1e-3f));
    EXPECT_FALSE(approximatelyEqual(composite(a, b, c), (r3 * r2) * r1, 1e-3f));
}

TEST(CompositeTest, SwappingOffsetsChangesResult) {
    float a = 0.3f, b = 0.7f, c = 1.1f;
    EXPECT_FALSE(approximatelyEqual(composite(a, b, c), composite(a, c, b), 1e-3f));
}

TEST(CompositeTest, RecomputationIsBitIdentical) {
    Mat4 first = composite(0.41f, -2.3f, 3.7f);
    Mat4 second = composite(0.41f, -2.3f, 3.7f);
    EXPECT_EQ(first, second);
}

TEST(CompositeTest, ResultIsPureRotation) {
    Mat4 r = composite(0.41f, -2.3f, 3.7f);
    EXPECT_TRUE(approximatelyEqual(r * transpose(r), Mat4::identity(), 1e-5f));
    for (int col = 0; col < 3; col++) {
        EXPECT_EQ(r.at(3, col), 0.0f);
        EXPECT_EQ(r.at(col, 3), 0.0f);
    }
    EXPECT_EQ(r.at(3, 3), 1.0f);
}

// ============================================================================
// Orbit Track Transform
// ============================================================================

TEST_F(OrientationTest, OrbitTrackTransformChainsCorrectionAndComposite) {
    GeodeticSample sample{.latitudeDeg = 35.2f, .longitudeDeg = -97.4f, .headingFactor = 1.0f};
    Mat4 expected = composite(
        correctedInclination(iss, sample.latitudeDeg),
        longitudeOffset(sample.longitudeDeg),
        latitudeOffset(sample.latitudeDeg));
    EXPECT_EQ(orbitTrackTransform(iss, sample), expected);
}

TEST_F(OrientationTest, SouthboundNegatesInclination) {
    GeodeticSample sample{.latitudeDeg = -12.0f, .longitudeDeg = 140.0f, .headingFactor = -1.0f};
    Mat4 expected = composite(
        -correctedInclination(tss, sample.latitudeDeg),
        longitudeOffset(sample.longitudeDeg),
        latitudeOffset(sample.latitudeDeg));
    EXPECT_EQ(orbitTrackTransform(tss, sample), expected);
}

TEST_F(OrientationTest, HeadingChangesTransform) {
    GeodeticSample north{.latitudeDeg = 20.0f, .longitudeDeg = 10.0f, .headingFactor = 1.0f};
    GeodeticSample south{.latitudeDeg = 20.0f, .longitudeDeg = 10.0f, .headingFactor = -1.0f};
    EXPECT_FALSE(approximatelyEqual(orbitTrackTransform(hst, north), orbitTrackTransform(hst, south), 1e-3f));
}

TEST_F(OrientationTest, OrbitTrackTransformByBody) {
    GeodeticSample sample{.latitudeDeg = 48.0f, .longitudeDeg = 2.3f, .headingFactor = -1.0f};
    auto transform = orbitTrackTransform(Body::ISS, sample);
    ASSERT_TRUE(transform.has_value());
    EXPECT_EQ(*transform, orbitTrackTransform(iss, sample));
}

TEST_F(OrientationTest, NoOrbitTrackWithoutBody) {
    GeodeticSample sample{.latitudeDeg = 0.0f, .longitudeDeg = 0.0f, .headingFactor = 1.0f};
    EXPECT_FALSE(orbitTrackTransform(Body::NONE, sample).has_value());
}

} // namespace
} // namespace orbitring
