/**
 * @file bxdf.hpp
 * @brief Individual scattering lobes (BRDFs / BTDFs) in the local shading frame
 *
 * The shading frame has its origin at the shading point with the normal
 * along +z. Every direction passed to a lobe is a unit vector pointing away
 * from the surface.
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "geometry.hpp"
#include "fresnel.hpp"
#include "microfacet.hpp"
#include <cmath>
#include <vector>

namespace sunbeam {

// ==================== Shading-frame helpers ====================

inline double cos_theta(const vec3& w) { return w.z; }
inline double abs_cos_theta(const vec3& w) { return std::fabs(w.z); }

inline bool same_hemisphere(const vec3& a, const vec3& b) {
    return a.z * b.z > 0.0;
}

/**
 * @brief Mirror wo about n
 */
inline vec3 reflect(const vec3& wo, const vec3& n) {
    return vec3_add(vec3_negate(wo), vec3_scale(n, 2.0 * vec3_dot(wo, n)));
}

/**
 * @brief Refract wi through a boundary with normal n on wi's side
 * @param eta Ratio eta_i / eta_t
 * @param wt Output transmitted direction
 * @return false on total internal reflection
 */
inline bool refract(const vec3& wi, const vec3& n, double eta, vec3& wt) {
    double cos_i = vec3_dot(n, wi);
    double sin2_i = std::max(0.0, 1.0 - cos_i * cos_i);
    double sin2_t = eta * eta * sin2_i;
    if (sin2_t >= 1.0) {
        return false;
    }
    double cos_t = std::sqrt(1.0 - sin2_t);
    wt = vec3_add(vec3_scale(vec3_negate(wi), eta), vec3_scale(n, eta * cos_i - cos_t));
    return true;
}

// ==================== Lobe classification ====================

using BxdfFlags = unsigned;

constexpr BxdfFlags BSDF_REFLECTION = 1u << 0;
constexpr BxdfFlags BSDF_TRANSMISSION = 1u << 1;
constexpr BxdfFlags BSDF_DIFFUSE = 1u << 2;
constexpr BxdfFlags BSDF_GLOSSY = 1u << 3;
constexpr BxdfFlags BSDF_SPECULAR = 1u << 4;
constexpr BxdfFlags BSDF_ALL = BSDF_REFLECTION | BSDF_TRANSMISSION |
                               BSDF_DIFFUSE | BSDF_GLOSSY | BSDF_SPECULAR;

/**
 * @brief Lobe kinds
 */
enum class BxdfKind {
    LambertianReflection,
    SpecularReflection,
    SpecularTransmission,
    MicrofacetReflection
};

/**
 * @brief Result of sampling an incident direction from a lobe
 */
struct BxdfSample {
    vec3 wi = {0.0, 0.0, 0.0};
    color f = {0.0, 0.0, 0.0};
    double pdf = 0.0;
    BxdfFlags flags = 0;

    bool valid() const { return pdf > 0.0 && !vec3_is_zero(f); }
};

/**
 * @brief One scattering lobe
 *
 * Specular lobes describe delta distributions: evaluate() is always black
 * for them and sample() returns the single scattered direction with an
 * implicit pdf of one.
 */
struct Bxdf {
    BxdfKind kind = BxdfKind::LambertianReflection;
    BxdfFlags flags = BSDF_REFLECTION | BSDF_DIFFUSE;
    color scale = {1.0, 1.0, 1.0};  // Reflectance R or transmittance T
    Fresnel fresnel;
    MicrofacetDistribution distribution;
    double eta_a = 1.0;  // Index of refraction above the surface (+z side)
    double eta_b = 1.0;  // Index of refraction below the surface

    static Bxdf lambertian_reflection(color r);
    static Bxdf specular_reflection(color r, const Fresnel& fresnel);
    static Bxdf specular_transmission(color t, double eta_a, double eta_b);
    static Bxdf microfacet_reflection(color r, const MicrofacetDistribution& distribution,
                                      const Fresnel& fresnel);

    /**
     * @brief True if every flag of this lobe is contained in t
     */
    bool matches(BxdfFlags t) const { return (flags & t) == flags; }

    bool is_specular() const { return (flags & BSDF_SPECULAR) != 0; }

    /**
     * @brief Scattered radiance fraction for the pair (wo, wi)
     *
     * Black when the pair is on the wrong sides of the surface for this
     * lobe's hemisphere.
     */
    color evaluate(const vec3& wo, const vec3& wi) const;

    /**
     * @brief Sample an incident direction given wo
     * @param u Uniform sample in [0,1)^2 (ignored by specular lobes)
     */
    BxdfSample sample(const vec3& wo, Point2d u) const;

    /**
     * @brief Solid-angle density of sample() producing wi; zero for specular lobes
     */
    double pdf(const vec3& wo, const vec3& wi) const;

    /**
     * @brief Monte Carlo estimate of the hemispherical-directional reflectance
     */
    color rho_hd(const vec3& wo, const std::vector<Point2d>& samples) const;
};

} // namespace sunbeam
