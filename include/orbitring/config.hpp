/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITRING_CONFIG_HPP
#define __ORBITRING_CONFIG_HPP

#include <orbitring/profile.hpp>

#include <optional>

namespace orbitring {

class Config {
public:
    Config() = default;
    ~Config() = default;

    Body getBody();
    void setBody(const Body b);

    double getLatitude();
    void setLatitude(const double l);

    double getLongitude();
    void setLongitude(const double l);

    std::optional<double> getPreviousLatitude();
    void setPreviousLatitude(const double l);

    float getHeadingFactor();
    void setHeadingFactor(const float h);

    double getAltitude();
    void setAltitude(const double a);

    double getMinimumElevation();
    void setMinimumElevation(const double degrees);

    bool getVerbose();
    void setVerbose(bool);

private:
    Body body = Body::ISS;
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<double> previousLatitude;
    float headingFactor = 1.0f;
    double altitude = 0.0;
    double minimumElevation = 10.0;
    bool verbose = false;
};

}

#endif
