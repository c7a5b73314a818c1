/**
 * @file microfacet.hpp
 * @brief Microfacet normal distributions (Beckmann, Trowbridge-Reitz)
 *
 * All directions are in the local shading frame where the normal is +z.
 * Distributions are isotropic.
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "geometry.hpp"
#include "sampling.hpp"
#include <cmath>
#include <stdexcept>

namespace sunbeam {

enum class MicrofacetType {
    Beckmann,
    TrowbridgeReitz  // GGX
};

/**
 * @brief Isotropic microfacet normal distribution
 */
struct MicrofacetDistribution {
    MicrofacetType type = MicrofacetType::TrowbridgeReitz;
    double alpha = 0.5;

    static MicrofacetDistribution beckmann(double alpha) {
        return make(MicrofacetType::Beckmann, alpha);
    }

    static MicrofacetDistribution trowbridge_reitz(double alpha) {
        return make(MicrofacetType::TrowbridgeReitz, alpha);
    }

    static MicrofacetDistribution make(MicrofacetType type, double alpha) {
        if (!std::isfinite(alpha) || alpha <= 0.0) {
            throw std::invalid_argument("microfacet alpha must be positive and finite");
        }
        MicrofacetDistribution d;
        d.type = type;
        d.alpha = alpha;
        return d;
    }

    /**
     * @brief Map a perceptual roughness in (0, 1] to alpha
     */
    static double roughness_to_alpha(double roughness) {
        roughness = std::max(roughness, 1e-3);
        double x = std::log(roughness);
        return 1.62142 + 0.819955 * x + 0.1734 * x * x + 0.0171201 * x * x * x +
               0.000640711 * x * x * x * x;
    }

    /**
     * @brief Differential area of microfacets with normal wh
     */
    double D(const vec3& wh) const {
        double cos2 = wh.z * wh.z;
        if (cos2 <= 0.0) {
            return 0.0;
        }
        double tan2 = std::max(0.0, 1.0 - cos2) / cos2;
        if (!std::isfinite(tan2)) {
            return 0.0;
        }
        double cos4 = cos2 * cos2;
        double a2 = alpha * alpha;

        if (type == MicrofacetType::Beckmann) {
            return std::exp(-tan2 / a2) / (PI * a2 * cos4);
        }
        double e = tan2 / a2;
        return 1.0 / (PI * a2 * cos4 * (1.0 + e) * (1.0 + e));
    }

    /**
     * @brief Smith auxiliary function: invisible over visible microfacet area
     */
    double lambda(const vec3& w) const {
        double cos2 = w.z * w.z;
        if (cos2 <= 0.0) {
            return 0.0;
        }
        double abs_tan = std::sqrt(std::max(0.0, 1.0 - cos2) / cos2);
        if (!std::isfinite(abs_tan)) {
            return 0.0;
        }

        if (type == MicrofacetType::Beckmann) {
            double a = 1.0 / (alpha * abs_tan);
            if (a >= 1.6) {
                return 0.0;
            }
            return (1.0 - 1.259 * a + 0.396 * a * a) / (3.535 * a + 2.181 * a * a);
        }
        double alpha2_tan2 = (alpha * abs_tan) * (alpha * abs_tan);
        return (-1.0 + std::sqrt(1.0 + alpha2_tan2)) / 2.0;
    }

    double G(const vec3& wo, const vec3& wi) const {
        return 1.0 / (1.0 + lambda(wo) + lambda(wi));
    }

    /**
     * @brief Draw a half vector proportional to D(wh) |cos(theta_h)|
     */
    vec3 sample_wh(const vec3& wo, Point2d u) const {
        double tan2;
        if (type == MicrofacetType::Beckmann) {
            double log_sample = std::log(1.0 - u.x);
            if (!std::isfinite(log_sample)) {
                log_sample = 0.0;
            }
            tan2 = -alpha * alpha * log_sample;
        } else {
            tan2 = alpha * alpha * u.x / (1.0 - u.x);
        }
        double phi = 2.0 * PI * u.y;
        double cos_theta = 1.0 / std::sqrt(1.0 + tan2);
        double sin_theta = std::sqrt(std::max(0.0, 1.0 - cos_theta * cos_theta));
        vec3 wh = spherical_direction(sin_theta, cos_theta, phi);
        if (wo.z * wh.z <= 0.0) {
            wh = vec3_negate(wh);
        }
        return wh;
    }

    double pdf(const vec3& wh) const {
        return D(wh) * std::fabs(wh.z);
    }
};

} // namespace sunbeam
