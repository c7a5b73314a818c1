/**
 * @file fresnel.hpp
 * @brief Unpolarized Fresnel reflectance for dielectric and conductor interfaces
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include <cmath>
#include <algorithm>

namespace sunbeam {

/**
 * Reflectance at a dielectric boundary
 * @param cos_theta_i Cosine of the incident angle, negative when light arrives from inside
 * @param eta_i Index of refraction on the side the normal points to
 * @param eta_t Index of refraction on the other side
 * @return Fraction of light reflected, 1 on total internal reflection
 */
inline double fresnel_dielectric(double cos_theta_i, double eta_i, double eta_t) {
    cos_theta_i = std::clamp(cos_theta_i, -1.0, 1.0);
    if (cos_theta_i <= 0.0) {
        std::swap(eta_i, eta_t);
        cos_theta_i = std::fabs(cos_theta_i);
    }

    // Snell's law
    double sin_theta_i = std::sqrt(std::max(0.0, 1.0 - cos_theta_i * cos_theta_i));
    double sin_theta_t = eta_i / eta_t * sin_theta_i;
    if (sin_theta_t >= 1.0) {
        return 1.0;
    }
    double cos_theta_t = std::sqrt(std::max(0.0, 1.0 - sin_theta_t * sin_theta_t));

    double r_parl = ((eta_t * cos_theta_i) - (eta_i * cos_theta_t)) /
                    ((eta_t * cos_theta_i) + (eta_i * cos_theta_t));
    double r_perp = ((eta_i * cos_theta_i) - (eta_t * cos_theta_t)) /
                    ((eta_i * cos_theta_i) + (eta_t * cos_theta_t));
    return 0.5 * (r_parl * r_parl + r_perp * r_perp);
}

/**
 * Reflectance of a conductor for a single channel
 * @param cos_theta_i Cosine of the incident angle
 * @param eta Relative index of refraction (eta_t / eta_i)
 * @param k Relative absorption coefficient (k / eta_i)
 */
inline double fresnel_conductor_channel(double cos_theta_i, double eta, double k) {
    cos_theta_i = std::clamp(cos_theta_i, -1.0, 1.0);
    double cos2 = cos_theta_i * cos_theta_i;
    double sin2 = 1.0 - cos2;
    double eta2 = eta * eta;
    double k2 = k * k;

    double t0 = eta2 - k2 - sin2;
    double a2_plus_b2 = std::sqrt(std::max(0.0, t0 * t0 + 4.0 * eta2 * k2));
    double t1 = a2_plus_b2 + cos2;
    double a = std::sqrt(std::max(0.0, 0.5 * (a2_plus_b2 + t0)));
    double t2 = 2.0 * cos_theta_i * a;
    double rs = (t1 - t2) / (t1 + t2);

    double t3 = cos2 * a2_plus_b2 + sin2 * sin2;
    double t4 = t2 * sin2;
    double rp = rs * (t3 - t4) / (t3 + t4);

    return 0.5 * (rp + rs);
}

inline color fresnel_conductor(double cos_theta_i, color eta_i, color eta_t, color k) {
    color eta = vec3_div(eta_t, eta_i);
    color eta_k = vec3_div(k, eta_i);
    return {
        fresnel_conductor_channel(cos_theta_i, eta.x, eta_k.x),
        fresnel_conductor_channel(cos_theta_i, eta.y, eta_k.y),
        fresnel_conductor_channel(cos_theta_i, eta.z, eta_k.z)
    };
}

/**
 * @brief Fresnel term kinds
 */
enum class FresnelType {
    NoOp,        // Reflects everything (perfect mirror)
    Dielectric,  // Glass, water, plastic coatings
    Conductor    // Metals
};

/**
 * @brief Fresnel term attached to a specular or microfacet lobe
 */
struct Fresnel {
    FresnelType type = FresnelType::NoOp;
    double eta_i = 1.0;
    double eta_t = 1.0;
    color conductor_eta_i = {1.0, 1.0, 1.0};
    color conductor_eta_t = {1.0, 1.0, 1.0};
    color conductor_k = {0.0, 0.0, 0.0};

    static Fresnel no_op() {
        return Fresnel{};
    }

    static Fresnel dielectric(double eta_i, double eta_t) {
        Fresnel f;
        f.type = FresnelType::Dielectric;
        f.eta_i = eta_i;
        f.eta_t = eta_t;
        return f;
    }

    static Fresnel conductor(color eta_i, color eta_t, color k) {
        Fresnel f;
        f.type = FresnelType::Conductor;
        f.conductor_eta_i = eta_i;
        f.conductor_eta_t = eta_t;
        f.conductor_k = k;
        return f;
    }

    /**
     * @brief Reflected fraction per channel for the given incident cosine
     */
    color evaluate(double cos_theta_i) const {
        switch (type) {
            case FresnelType::Dielectric:
                return vec3_splat(fresnel_dielectric(cos_theta_i, eta_i, eta_t));
            case FresnelType::Conductor:
                return fresnel_conductor(std::fabs(cos_theta_i),
                                         conductor_eta_i, conductor_eta_t, conductor_k);
            case FresnelType::NoOp:
            default:
                return {1.0, 1.0, 1.0};
        }
    }
};

} // namespace sunbeam
