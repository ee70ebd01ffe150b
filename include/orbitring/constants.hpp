/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITRING_CONSTANTS_HPP
#define __ORBITRING_CONSTANTS_HPP

#include <cmath>

namespace orbitring {

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = M_PI / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / M_PI;

// Single precision versions used by the per-frame orientation math.
// The ring orientation is tuned against float arithmetic, so these must stay float.
constexpr float PI_F = static_cast<float>(M_PI);
constexpr float DEGREES_TO_RADIANS_F = static_cast<float>(M_PI / 180.0);
constexpr float ONE_EIGHTY_DEGREES_F = 180.0f;

// Mean Earth radius (km)
constexpr double EARTH_RADIUS_KM = 6371.0;

// Radius of the globe node in scene units
constexpr float GLOBE_RADIUS_SCENE = 5.0f;

}

#endif
