/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITRING_VISIBILITY_HPP
#define __ORBITRING_VISIBILITY_HPP

namespace orbitring {

/**
 * Computes the diameter of the ground circle from which a satellite is
 * visible above a minimum elevation angle.
 *
 * With R the Earth radius, r = R + altitude and e the elevation:
 *     cos(alpha) = cos(e) * r / R
 *     diameter   = 2 * R * alpha
 *
 * @param altitudeKm Altitude of the satellite in kilometers
 * @param minElevationDeg Minimum elevation above the horizon in degrees
 * @return Diameter in kilometers, or 0 if cos(alpha) > 1 (no such circle)
 */
double visibilityDiameterKm(double altitudeKm, double minElevationDeg);

}

#endif
