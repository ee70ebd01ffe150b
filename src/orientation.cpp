/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitring/orientation.hpp>
#include <orbitring/constants.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace orbitring {

// ============================================================================
// Heading
// ============================================================================

float headingFactor(float previousLatitudeDeg, float latitudeDeg) {
    return latitudeDeg < previousLatitudeDeg ? -1.0f : 1.0f;
}

std::optional<float> parseHeadingFactor(std::string_view heading) {
    std::string lower(heading);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "n" || lower == "north" || lower == "+1" || lower == "1") {
        return 1.0f;
    }
    if (lower == "s" || lower == "south" || lower == "-1") {
        return -1.0f;
    }
    return std::nullopt;
}

// ============================================================================
// Orientation Correction
// ============================================================================

float exponentBase(const OrbitingBodyProfile &profile, float absLatitudeDeg) {
    return PI_F / profile.getCorrectionMultiplier()
        + absLatitudeDeg * DEGREES_TO_RADIANS_F / profile.getInclinationRadians();
}

float selectCorrectionPower(const OrbitingBodyProfile &profile, float absLatitudeDeg) {
    const auto &thresholds = profile.getLatitudeThresholds();
    const auto &powers = profile.getCorrectionPowers();

    // First match wins; the threshold itself belongs to the lower band
    for (size_t i = 0; i < thresholds.size(); i++) {
        if (absLatitudeDeg <= thresholds[i]) {
            return powers[i];
        }
    }

    // Above every threshold (or NaN): the band past the last threshold
    return powers.back();
}

float inclinationCorrection(const OrbitingBodyProfile &profile, float latitudeDeg) {
    float absLat = std::fabs(latitudeDeg);
    float base = exponentBase(profile, absLat);
    float power = selectCorrectionPower(profile, absLat);
    return std::pow(base, power);
}

float correctedInclination(const OrbitingBodyProfile &profile, float latitudeDeg) {
    return std::pow(profile.getInclinationRadians(), inclinationCorrection(profile, latitudeDeg));
}

// ============================================================================
// Composite Rotation
// ============================================================================

float longitudeOffset(float longitudeDeg) {
    return (longitudeDeg - ONE_EIGHTY_DEGREES_F) * DEGREES_TO_RADIANS_F;
}

float latitudeOffset(float latitudeDeg) {
    return (latitudeDeg + ONE_EIGHTY_DEGREES_F) * DEGREES_TO_RADIANS_F;
}

OrientationTransform composite(float correctedInclinationRadians,
                               float longitudeOffsetRadians,
                               float latitudeOffsetRadians) {
    Mat4 r1 = Mat4::identity().rotated(correctedInclinationRadians, 0.0f, 0.0f, 1.0f);
    Mat4 r2 = Mat4::identity().rotated(longitudeOffsetRadians, 0.0f, 1.0f, 0.0f);
    Mat4 r3 = Mat4::identity().rotated(latitudeOffsetRadians, 1.0f, 0.0f, 0.0f);

    Mat4 firstProduct = r3 * r2;
    return r1 * firstProduct;
}

OrientationTransform orbitTrackTransform(const OrbitingBodyProfile &profile, const GeodeticSample &sample) {
    float lonOffset = longitudeOffset(sample.longitudeDeg);
    float latOffset = latitudeOffset(sample.latitudeDeg);
    float inclination = correctedInclination(profile, sample.latitudeDeg) * sample.headingFactor;
    return composite(inclination, lonOffset, latOffset);
}

std::optional<OrientationTransform> orbitTrackTransform(Body body, const GeodeticSample &sample) {
    if (!hasProfile(body)) {
        return std::nullopt;
    }
    return orbitTrackTransform(getProfile(body), sample);
}

}
