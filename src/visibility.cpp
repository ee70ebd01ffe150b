/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitring/visibility.hpp>
#include <orbitring/constants.hpp>

#include <algorithm>
#include <cmath>

namespace orbitring {

double visibilityDiameterKm(double altitudeKm, double minElevationDeg) {
    double satRadiusKm = EARTH_RADIUS_KM + altitudeKm;
    double elevationRad = minElevationDeg * M_PI / 180.0;

    // Central angle alpha in radians
    double cosAlpha = (std::cos(elevationRad) * satRadiusKm) / EARTH_RADIUS_KM;
    if (cosAlpha > 1.0) {
        return 0.0;
    }

    // Elevations past the zenith would take acos out of its domain
    double alpha = std::acos(std::max(cosAlpha, -1.0));
    double arcDistanceKm = EARTH_RADIUS_KM * alpha;
    return 2.0 * arcDistanceKm;
}

}
