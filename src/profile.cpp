/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitring/profile.hpp>
#include <orbitring/constants.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <map>
#include <sstream>

namespace orbitring {

using spdlog::debug;

std::ostream& operator<<(std::ostream &os, const Body &body) {
    switch (body) {
        case Body::ISS:
            os << "ISS";
            break;
        case Body::TSS:
            os << "TSS";
            break;
        case Body::HST:
            os << "HST";
            break;
        case Body::NONE:
            os << "NONE";
            break;
    }
    return os;
}

std::string_view bodyID(Body body) {
    switch (body) {
        case Body::ISS: return "iss";
        case Body::TSS: return "tss";
        case Body::HST: return "hst";
        case Body::NONE: return "none";
    }
    return "none";
}

std::optional<Body> parseBody(std::string_view id) {
    std::string lower(id);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto body : {Body::ISS, Body::TSS, Body::HST, Body::NONE}) {
        if (lower == bodyID(body)) {
            return body;
        }
    }
    return std::nullopt;
}

const std::vector<Body>& allBodies() {
    static const std::vector<Body> bodies = {Body::ISS, Body::TSS, Body::HST};
    return bodies;
}

// ============================================================================
// OrbitingBodyProfile
// ============================================================================

OrbitingBodyProfile::OrbitingBodyProfile(std::string name,
                                         float inclinationRadians,
                                         float correctionMultiplier,
                                         std::vector<float> latitudeThresholds,
                                         std::vector<float> correctionPowers,
                                         double nominalAltitudeKm,
                                         RingColor ringColor)
    : name_(std::move(name)),
      inclinationRadians_(inclinationRadians),
      correctionMultiplier_(correctionMultiplier),
      latitudeThresholds_(std::move(latitudeThresholds)),
      correctionPowers_(std::move(correctionPowers)),
      nominalAltitudeKm_(nominalAltitudeKm),
      ringRadiusScene_(0.0f),
      ringColor_(ringColor) {

    if (!std::isfinite(inclinationRadians_) || inclinationRadians_ <= 0.0f) {
        throw InvalidProfileException(std::format("{}: inclination must be positive, got {}", name_, inclinationRadians_));
    }
    if (!std::isfinite(correctionMultiplier_) || correctionMultiplier_ <= 0.0f) {
        throw InvalidProfileException(std::format("{}: correction multiplier must be positive, got {}", name_, correctionMultiplier_));
    }
    if (latitudeThresholds_.empty()) {
        throw InvalidProfileException(std::format("{}: at least one latitude threshold is required", name_));
    }
    if (correctionPowers_.size() != latitudeThresholds_.size() + 1) {
        throw InvalidProfileException(std::format("{}: expected {} correction powers for {} thresholds, got {}",
            name_, latitudeThresholds_.size() + 1, latitudeThresholds_.size(), correctionPowers_.size()));
    }
    for (size_t i = 0; i < latitudeThresholds_.size(); i++) {
        float threshold = latitudeThresholds_[i];
        if (!std::isfinite(threshold) || threshold < 0.0f || threshold > 90.0f) {
            throw InvalidProfileException(std::format("{}: latitude threshold {} is outside [0, 90]", name_, threshold));
        }
        if (i > 0 && threshold <= latitudeThresholds_[i - 1]) {
            throw InvalidProfileException(std::format("{}: latitude thresholds must be strictly ascending ({} follows {})",
                name_, threshold, latitudeThresholds_[i - 1]));
        }
    }
    for (auto power : correctionPowers_) {
        if (!std::isfinite(power)) {
            throw InvalidProfileException(std::format("{}: correction powers must be finite", name_));
        }
    }
    if (!std::isfinite(nominalAltitudeKm_) || nominalAltitudeKm_ < 0.0) {
        throw InvalidProfileException(std::format("{}: altitude must not be negative, got {}", name_, nominalAltitudeKm_));
    }

    ringRadiusScene_ = static_cast<float>(GLOBE_RADIUS_SCENE * (EARTH_RADIUS_KM + nominalAltitudeKm_) / EARTH_RADIUS_KM);
}

void OrbitingBodyProfile::printInfo(std::ostream &os) const {
    os << "Name:                  " << name_ << std::endl;
    os << "Inclination:           " << std::format("{:.4f}° ({:.6f} rad)",
        inclinationRadians_ * RADIANS_TO_DEGREES, inclinationRadians_) << std::endl;
    os << "Nominal Altitude:      " << std::format("{:.1f} km", nominalAltitudeKm_) << std::endl;
    os << "Correction Multiplier: " << correctionMultiplier_ << std::endl;
    os << "Ring Radius (scene):   " << std::format("{:.4f}", ringRadiusScene_) << std::endl;
    os << "Ring Color (RGBA):     " << std::format("{:.2f} {:.2f} {:.2f} {:.2f}",
        ringColor_.red, ringColor_.green, ringColor_.blue, ringColor_.alpha) << std::endl;
    os << "Latitude Bands:" << std::endl;
    float lower = 0.0f;
    for (size_t i = 0; i < latitudeThresholds_.size(); i++) {
        os << std::format("  {:>5.1f}° - {:>5.1f}°  power {:.2f}", lower, latitudeThresholds_[i], correctionPowers_[i]) << std::endl;
        lower = latitudeThresholds_[i];
    }
    os << std::format("  {:>5.1f}° +         power {:.2f}", lower, correctionPowers_.back()) << std::endl;
}

// ============================================================================
// Profile Lookup
// ============================================================================

namespace {

float degreesToRadians(double degrees) {
    return static_cast<float>(degrees * DEGREES_TO_RADIANS);
}

std::map<Body, OrbitingBodyProfile> buildProfiles() {
    std::map<Body, OrbitingBodyProfile> profiles;

    profiles.emplace(Body::ISS, OrbitingBodyProfile(
        "International Space Station",
        degreesToRadians(51.6416),
        3.5f,
        {12.0f, 17.0f, 25.0f, 33.0f, 40.0f, 45.0f, 49.0f, 51.0f},
        {0.80f, 0.85f, 1.00f, 1.25f, 1.60f, 2.00f, 2.50f, 3.20f, 4.00f},
        420.0,
        RingColor{0.90f, 0.12f, 0.12f, 1.0f}));

    profiles.emplace(Body::TSS, OrbitingBodyProfile(
        "Tiangong Space Station",
        degreesToRadians(41.4700),
        3.6f,
        {15.0f, 20.0f, 25.0f, 30.0f, 35.0f, 38.0f, 40.0f, 41.0f, 41.5f},
        {0.75f, 0.85f, 1.00f, 1.20f, 1.45f, 1.70f, 2.00f, 2.30f, 2.50f, 2.80f},
        390.0,
        RingColor{0.98f, 0.78f, 0.20f, 1.0f}));

    profiles.emplace(Body::HST, OrbitingBodyProfile(
        "Hubble Space Telescope",
        degreesToRadians(28.4700),
        3.6f,
        {10.0f, 15.0f, 18.0f, 20.0f, 22.0f, 24.0f, 26.0f, 27.0f},
        {0.35f, 0.50f, 0.65f, 0.80f, 1.00f, 1.30f, 1.75f, 2.10f, 3.00f},
        535.0,
        RingColor{0.56f, 0.36f, 0.92f, 1.0f}));

    debug("Loaded {} orbiting body profiles", profiles.size());
    return profiles;
}

const std::map<Body, OrbitingBodyProfile>& profiles() {
    static const std::map<Body, OrbitingBodyProfile> table = buildProfiles();
    return table;
}

}

bool hasProfile(Body body) {
    return profiles().contains(body);
}

const OrbitingBodyProfile& getProfile(Body body) {
    auto it = profiles().find(body);
    if (it == profiles().end()) {
        std::ostringstream msg;
        msg << "No orbiting body profile for " << body;
        throw UnknownBodyException(msg.str());
    }
    return it->second;
}

}
