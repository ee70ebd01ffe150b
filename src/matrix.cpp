/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitring/matrix.hpp>

#include <cmath>
#include <iomanip>

namespace orbitring {

float Vec3::magnitude() const {
    return std::sqrt(x*x + y*y + z*z);
}

Mat4 Mat4::identity() {
    return Mat4{{
        {1.0f, 0.0f, 0.0f, 0.0f},
        {0.0f, 1.0f, 0.0f, 0.0f},
        {0.0f, 0.0f, 1.0f, 0.0f},
        {0.0f, 0.0f, 0.0f, 1.0f}
    }};
}

/**
 * Rodrigues' rotation formula, transposed for the row-vector convention.
 */
Mat4 Mat4::rotation(float angleInRadians, float x, float y, float z) {
    float length = Vec3{x, y, z}.magnitude();
    if (length == 0.0f) {
        return identity();
    }
    x /= length;
    y /= length;
    z /= length;

    float c = std::cos(angleInRadians);
    float s = std::sin(angleInRadians);
    float t = 1.0f - c;

    Mat4 r = identity();
    r.m[0][0] = c + x*x*t;
    r.m[0][1] = x*y*t + z*s;
    r.m[0][2] = x*z*t - y*s;

    r.m[1][0] = x*y*t - z*s;
    r.m[1][1] = c + y*y*t;
    r.m[1][2] = y*z*t + x*s;

    r.m[2][0] = x*z*t + y*s;
    r.m[2][1] = y*z*t - x*s;
    r.m[2][2] = c + z*z*t;
    return r;
}

Mat4 Mat4::rotated(float angleInRadians, float x, float y, float z) const {
    return rotation(angleInRadians, x, y, z) * (*this);
}

Mat4 Mat4::operator*(const Mat4& other) const {
    Mat4 result{};
    for (int row = 0; row < 4; row++) {
        for (int col = 0; col < 4; col++) {
            float sum = 0.0f;
            for (int k = 0; k < 4; k++) {
                sum += m[row][k] * other.m[k][col];
            }
            result.m[row][col] = sum;
        }
    }
    return result;
}

Vec3 Mat4::transformPoint(const Vec3& p) const {
    return {
        p.x * m[0][0] + p.y * m[1][0] + p.z * m[2][0] + m[3][0],
        p.x * m[0][1] + p.y * m[1][1] + p.z * m[2][1] + m[3][1],
        p.x * m[0][2] + p.y * m[1][2] + p.z * m[2][2] + m[3][2]
    };
}

std::ostream& operator<<(std::ostream &os, const Mat4 &matrix) {
    auto flags = os.flags();
    auto precision = os.precision();
    os << std::fixed << std::setprecision(6);
    for (int row = 0; row < 4; row++) {
        os << "[";
        for (int col = 0; col < 4; col++) {
            os << std::setw(10) << matrix.m[row][col];
            if (col < 3) {
                os << " ";
            }
        }
        os << " ]" << std::endl;
    }
    os.flags(flags);
    os.precision(precision);
    return os;
}

bool approximatelyEqual(const Mat4& a, const Mat4& b, float tolerance) {
    for (int row = 0; row < 4; row++) {
        for (int col = 0; col < 4; col++) {
            if (std::fabs(a.m[row][col] - b.m[row][col]) > tolerance) {
                return false;
            }
        }
    }
    return true;
}

}
