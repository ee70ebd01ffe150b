/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitring/config.hpp>

#include <cmath>

namespace orbitring {

Body Config::getBody() {
    return body;
}

void Config::setBody(const Body b) {
    body = b;
}

double Config::getLatitude() {
    return latitude;
}

void Config::setLatitude(const double l) {
    if (l > 90.0) {
        latitude = 90.0;
    } else if (l < -90.0) {
        latitude = -90.0;
    } else {
        latitude = l;
    }
}

double Config::getLongitude() {
    return longitude;
}

/** Longitudes are wrapped into [-180, 180) */
void Config::setLongitude(const double l) {
    double wrapped = std::fmod(l + 180.0, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    longitude = wrapped - 180.0;
}

std::optional<double> Config::getPreviousLatitude() {
    return previousLatitude;
}

void Config::setPreviousLatitude(const double l) {
    if (l > 90.0) {
        previousLatitude = 90.0;
    } else if (l < -90.0) {
        previousLatitude = -90.0;
    } else {
        previousLatitude = l;
    }
}

float Config::getHeadingFactor() {
    return headingFactor;
}

void Config::setHeadingFactor(const float h) {
    headingFactor = h < 0.0f ? -1.0f : 1.0f;
}

double Config::getAltitude() {
    return altitude;
}

void Config::setAltitude(const double a) {
    altitude = a < 0.0 ? 0.0 : a;
}

double Config::getMinimumElevation() {
    if (minimumElevation >= 0.0 && minimumElevation <= 90.0) {
        return minimumElevation;
    }
    if (minimumElevation > 90.0) {
        return 90.0;
    }
    return 0.0;
}

void Config::setMinimumElevation(const double degrees) {
    if (degrees >= 0.0 && degrees <= 90.0) {
        minimumElevation = degrees;
    } else if (degrees > 90.0) {
        minimumElevation = 90.0;
    } else {
        minimumElevation = 0.0;
    }
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

}
