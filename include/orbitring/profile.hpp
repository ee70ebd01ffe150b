/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITRING_PROFILE_HPP
#define __ORBITRING_PROFILE_HPP

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orbitring {

// ============================================================================
// Profile Exception Classes
// ============================================================================

/**
 * Base exception class for orbiting body profile errors.
 */
class ProfileException : public std::runtime_error {
public:
    explicit ProfileException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when a profile is constructed with inconsistent parameters.
 */
class InvalidProfileException : public ProfileException {
public:
    explicit InvalidProfileException(const std::string& msg) : ProfileException(msg) {}
};

/**
 * Exception thrown when a profile is requested for a body that has none.
 */
class UnknownBodyException : public ProfileException {
public:
    explicit UnknownBodyException(const std::string& msg) : ProfileException(msg) {}
};

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * The orbiting bodies that can have an orbit track drawn around the globe.
 */
enum class Body {
    ISS,    ///< International Space Station
    TSS,    ///< Tiangong Space Station
    HST,    ///< Hubble Space Telescope
    NONE    ///< No body selected
};

std::ostream& operator<<(std::ostream &os, const Body &body);

/**
 * Returns the short lower-case identifier of a body ("iss", "tss", "hst", "none").
 */
std::string_view bodyID(Body body);

/**
 * Parses a body identifier, ignoring case.
 * @return The body, or std::nullopt if the identifier is not recognized
 */
std::optional<Body> parseBody(std::string_view id);

/**
 * Every body that has a profile, in display order.
 */
const std::vector<Body>& allBodies();

/**
 * RGBA color of an orbit track ring, each component in [0, 1].
 */
struct RingColor {
    float red;
    float green;
    float blue;
    float alpha;
};

// ============================================================================
// OrbitingBodyProfile
// ============================================================================

/**
 * Immutable orbital and display parameters of one orbiting body.
 *
 * The latitude thresholds split |latitude| into bands; each band has its own
 * correction power. A profile holds thresholds.size() + 1 powers, the last one
 * applying above the highest threshold.
 *
 * All invariants are checked by the constructor, so a profile that exists is
 * always safe to use in per-frame calculations.
 */
class OrbitingBodyProfile {
public:
    /**
     * @throws InvalidProfileException if the multiplier or the inclination is not
     *         positive, the thresholds are empty, not strictly ascending
     *         or outside [0, 90], or the number of powers is not thresholds + 1
     */
    OrbitingBodyProfile(std::string name,
                        float inclinationRadians,
                        float correctionMultiplier,
                        std::vector<float> latitudeThresholds,
                        std::vector<float> correctionPowers,
                        double nominalAltitudeKm,
                        RingColor ringColor);

    const std::string& getName() const { return name_; }
    float getInclinationRadians() const { return inclinationRadians_; }
    float getCorrectionMultiplier() const { return correctionMultiplier_; }
    const std::vector<float>& getLatitudeThresholds() const { return latitudeThresholds_; }
    const std::vector<float>& getCorrectionPowers() const { return correctionPowers_; }
    double getNominalAltitudeKm() const { return nominalAltitudeKm_; }
    float getRingRadiusScene() const { return ringRadiusScene_; }
    RingColor getRingColor() const { return ringColor_; }

    /**
     * Number of latitude bands (thresholds + 1).
     */
    size_t bandCount() const { return correctionPowers_.size(); }

    /**
     * Print the profile parameters to a stream.
     */
    void printInfo(std::ostream &os) const;

private:
    std::string name_;
    float inclinationRadians_;
    float correctionMultiplier_;
    std::vector<float> latitudeThresholds_;
    std::vector<float> correctionPowers_;
    double nominalAltitudeKm_;
    float ringRadiusScene_;
    RingColor ringColor_;
};

// ============================================================================
// Profile Lookup
// ============================================================================

/**
 * Checks whether a body has a profile.
 */
bool hasProfile(Body body);

/**
 * Returns the built-in profile of a body.
 * @throws UnknownBodyException if the body has no profile (Body::NONE)
 */
const OrbitingBodyProfile& getProfile(Body body);

}

#endif
