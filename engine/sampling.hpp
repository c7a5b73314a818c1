/**
 * @file sampling.hpp
 * @brief Warping functions from [0,1)^2 to directions, plus pdf guards
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "geometry.hpp"
#include <cmath>
#include <algorithm>

namespace sunbeam {

constexpr double PI = 3.14159265358979323846;
constexpr double INV_PI = 0.31830988618379067;
constexpr double INV_2PI = 0.15915494309189535;
constexpr double PI_OVER_2 = 1.57079632679489661923;
constexpr double PI_OVER_4 = 0.78539816339744830961;

// Largest double strictly below 1
constexpr double ONE_MINUS_EPSILON = 0x1.fffffffffffffp-1;

/**
 * @brief A pdf that may be divided into a contribution
 */
inline bool is_valid_pdf(double pdf) {
    return std::isfinite(pdf) && pdf > 0.0;
}

/**
 * @brief Shirley-Chiu concentric mapping of the unit square to the unit disk
 */
inline Point2d concentric_sample_disk(Point2d u) {
    double ox = 2.0 * u.x - 1.0;
    double oy = 2.0 * u.y - 1.0;
    if (ox == 0.0 && oy == 0.0) {
        return {0.0, 0.0};
    }

    double r, theta;
    if (std::fabs(ox) > std::fabs(oy)) {
        r = ox;
        theta = PI_OVER_4 * (oy / ox);
    } else {
        r = oy;
        theta = PI_OVER_2 - PI_OVER_4 * (ox / oy);
    }
    return {r * std::cos(theta), r * std::sin(theta)};
}

/**
 * @brief Cosine-weighted direction on the +z hemisphere (Malley's method)
 */
inline vec3 cosine_sample_hemisphere(Point2d u) {
    Point2d d = concentric_sample_disk(u);
    double z = std::sqrt(std::max(0.0, 1.0 - d.x * d.x - d.y * d.y));
    return {d.x, d.y, z};
}

inline double cosine_hemisphere_pdf(double cos_theta) {
    return cos_theta * INV_PI;
}

/**
 * @brief Uniformly distributed direction on the +z hemisphere
 */
inline vec3 uniform_sample_hemisphere(Point2d u) {
    double z = u.x;
    double r = std::sqrt(std::max(0.0, 1.0 - z * z));
    double phi = 2.0 * PI * u.y;
    return {r * std::cos(phi), r * std::sin(phi), z};
}

inline double uniform_hemisphere_pdf() {
    return INV_2PI;
}

inline vec3 spherical_direction(double sin_theta, double cos_theta, double phi) {
    return {sin_theta * std::cos(phi), sin_theta * std::sin(phi), cos_theta};
}

} // namespace sunbeam
