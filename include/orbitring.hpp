/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITRING_HPP
#define __ORBITRING_HPP

#include <orbitring/constants.hpp>
#include <orbitring/config.hpp>
#include <orbitring/matrix.hpp>
#include <orbitring/profile.hpp>
#include <orbitring/orientation.hpp>
#include <orbitring/visibility.hpp>

#endif
