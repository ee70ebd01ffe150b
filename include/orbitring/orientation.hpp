/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITRING_ORIENTATION_HPP
#define __ORBITRING_ORIENTATION_HPP

#include <orbitring/matrix.hpp>
#include <orbitring/profile.hpp>

#include <optional>
#include <string_view>

namespace orbitring {

/**
 * The transform applied to an orbit track ring node. Rotation only.
 */
using OrientationTransform = Mat4;

/**
 * Sub-point of an orbiting body at the current update tick.
 */
struct GeodeticSample {
    float latitudeDeg;    ///< Latitude in degrees (positive = North)
    float longitudeDeg;   ///< Longitude in degrees (positive = East)
    float headingFactor;  ///< +1 if the ground track is heading north, -1 if heading south
};

// ============================================================================
// Heading
// ============================================================================

/**
 * Derives the heading factor from two consecutive sub-point latitudes.
 * @return +1 if the latitude is increasing or unchanged, -1 if it is decreasing
 */
float headingFactor(float previousLatitudeDeg, float latitudeDeg);

/**
 * Parses a heading given as "N", "S", "north", "south", "+1", "1" or "-1".
 * @return The heading factor, or std::nullopt if not recognized
 */
std::optional<float> parseHeadingFactor(std::string_view heading);

// ============================================================================
// Orientation Correction
// ============================================================================

/**
 * Base of the inclination correction:
 *     pi / multiplier + |lat| * (pi / 180) / inclination
 *
 * This is an empirically tuned shaping function. The constants and the order
 * of operations must not change, the ring position on screen depends on it.
 */
float exponentBase(const OrbitingBodyProfile &profile, float absLatitudeDeg);

/**
 * Selects the correction power for a latitude band.
 *
 * The thresholds are scanned in ascending order and the power of the first
 * threshold with |lat| <= threshold wins, so a latitude exactly on a threshold
 * belongs to the lower band. Above the last threshold the last power is used.
 */
float selectCorrectionPower(const OrbitingBodyProfile &profile, float absLatitudeDeg);

/**
 * Returns exponentBase ^ power for the band containing |latitudeDeg|.
 */
float inclinationCorrection(const OrbitingBodyProfile &profile, float latitudeDeg);

/**
 * Returns the inclination the ring has to be tilted by so that its apparent
 * inclination stays at the body's nominal value at this latitude:
 *     inclination ^ inclinationCorrection(profile, latitudeDeg)
 *
 * Depends only on |latitudeDeg|. The heading factor is not applied here.
 * Latitudes outside [-90, 90] fall into the last band.
 */
float correctedInclination(const OrbitingBodyProfile &profile, float latitudeDeg);

// ============================================================================
// Composite Rotation
// ============================================================================

/**
 * Converts a longitude to the scene's Y rotation: (lon - 180) in radians.
 */
float longitudeOffset(float longitudeDeg);

/**
 * Converts a latitude to the scene's X rotation: (lat + 180) in radians.
 */
float latitudeOffset(float latitudeDeg);

/**
 * Builds the ring orientation from its three elementary rotations.
 *
 * R1 rotates about Z by the corrected inclination, R2 about Y by the longitude
 * offset and R3 about X by the latitude offset. The result is R1 * (R3 * R2).
 * Rotations do not commute, changing the order moves the ring off the sub-point.
 */
OrientationTransform composite(float correctedInclinationRadians,
                               float longitudeOffsetRadians,
                               float latitudeOffsetRadians);

/**
 * Computes the orientation of a body's orbit track ring for one update tick.
 *
 * The returned transform replaces the ring node's previous transform.
 */
OrientationTransform orbitTrackTransform(const OrbitingBodyProfile &profile, const GeodeticSample &sample);

/**
 * Computes the orbit track orientation for a body by identity.
 * @return The transform, or std::nullopt if the body has no orbit track (Body::NONE)
 */
std::optional<OrientationTransform> orbitTrackTransform(Body body, const GeodeticSample &sample);

}

#endif
