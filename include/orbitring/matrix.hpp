/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITRING_MATRIX_HPP
#define __ORBITRING_MATRIX_HPP

#include <iostream>

namespace orbitring {

/**
 * 3D vector in scene coordinates.
 */
struct Vec3 {
    float x, y, z;

    float magnitude() const;
};

/**
 * 4x4 homogeneous transform in the scene graph's layout.
 *
 * The matrix uses the row-vector convention of the host scene: a point p is
 * transformed as p' = p * M, rows 0-2 hold the images of the X, Y and Z basis
 * vectors and row 3 holds the translation.
 *
 * The product A * B therefore applies A first and B second.
 */
struct Mat4 {
    float m[4][4];

    /**
     * Returns the identity transform.
     */
    static Mat4 identity();

    /**
     * Returns a rotation by angleInRadians about the axis (x, y, z).
     *
     * The axis does not need to be normalized. A zero-length axis yields the
     * identity. Positive angles rotate counter-clockwise when looking down
     * the axis towards the origin.
     */
    static Mat4 rotation(float angleInRadians, float x, float y, float z);

    /**
     * Returns this transform with a rotation concatenated in front of it,
     * i.e. rotation(angle, axis) * (*this).
     */
    Mat4 rotated(float angleInRadians, float x, float y, float z) const;

    Mat4 operator*(const Mat4& other) const;

    /**
     * Transforms a point (w = 1) by this matrix.
     */
    Vec3 transformPoint(const Vec3& p) const;

    float at(int row, int col) const {
        return m[row][col];
    }

    bool operator==(const Mat4& other) const = default;
};

std::ostream& operator<<(std::ostream &os, const Mat4 &matrix);

/**
 * Returns true if every element of a and b differs by no more than tolerance.
 */
bool approximatelyEqual(const Mat4& a, const Mat4& b, float tolerance);

}

#endif
