/**
 * @file material.cpp
 * @brief Lobe construction for each material
 */

#include "material.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace sunbeam {

// Index of refraction of the coating used by PlasticMaterial
static constexpr double PLASTIC_COAT_ETA = 1.5;

static void validate_roughness(double roughness, const char* material) {
    if (!std::isfinite(roughness) || roughness < 0.0) {
        throw std::invalid_argument(std::string(material) +
                                    ": roughness must be finite and non-negative");
    }
}

// ==================== Matte ====================

MatteMaterial::MatteMaterial(ColorTexture kd) : kd_(kd) {}

Bsdf MatteMaterial::compute_bsdf(const SurfaceInteraction& si) const {
    Bsdf bsdf(si);
    color r = vec3_clamp(kd_.evaluate(si), 0.0, 1.0);
    if (!vec3_is_zero(r)) {
        bsdf.add(Bxdf::lambertian_reflection(r));
    }
    return bsdf;
}

// ==================== Mirror ====================

MirrorMaterial::MirrorMaterial(ColorTexture kr) : kr_(kr) {}

Bsdf MirrorMaterial::compute_bsdf(const SurfaceInteraction& si) const {
    Bsdf bsdf(si);
    color r = vec3_clamp(kr_.evaluate(si), 0.0, 1.0);
    if (!vec3_is_zero(r)) {
        bsdf.add(Bxdf::specular_reflection(r, Fresnel::no_op()));
    }
    return bsdf;
}

// ==================== Glass ====================

GlassMaterial::GlassMaterial(ColorTexture kr, ColorTexture kt, double eta)
    : kr_(kr), kt_(kt), eta_(eta) {
    if (!std::isfinite(eta) || eta <= 0.0) {
        throw std::invalid_argument("glass: index of refraction must be positive");
    }
}

Bsdf GlassMaterial::compute_bsdf(const SurfaceInteraction& si) const {
    Bsdf bsdf(si);
    color r = vec3_clamp(kr_.evaluate(si), 0.0, 1.0);
    color t = vec3_clamp(kt_.evaluate(si), 0.0, 1.0);
    if (!vec3_is_zero(r)) {
        bsdf.add(Bxdf::specular_reflection(r, Fresnel::dielectric(1.0, eta_)));
    }
    if (!vec3_is_zero(t)) {
        bsdf.add(Bxdf::specular_transmission(t, 1.0, eta_));
    }
    return bsdf;
}

// ==================== Metal ====================

MetalMaterial::MetalMaterial(color eta, color k, double roughness, MicrofacetType distribution)
    : eta_(eta), k_(k), roughness_(FloatTexture::constant(roughness)),
      distribution_(distribution) {
    validate_roughness(roughness, "metal");
    if (!vec3_is_finite(eta) || !vec3_is_finite(k)) {
        throw std::invalid_argument("metal: eta and k must be finite");
    }
}

Bsdf MetalMaterial::compute_bsdf(const SurfaceInteraction& si) const {
    Bsdf bsdf(si);
    Fresnel fresnel = Fresnel::conductor(vec3_splat(1.0), eta_, k_);
    double roughness = roughness_.evaluate(si);
    if (roughness == 0.0) {
        bsdf.add(Bxdf::specular_reflection(vec3_splat(1.0), fresnel));
    } else {
        double alpha = MicrofacetDistribution::roughness_to_alpha(roughness);
        bsdf.add(Bxdf::microfacet_reflection(
            vec3_splat(1.0), MicrofacetDistribution::make(distribution_, alpha), fresnel));
    }
    return bsdf;
}

// ==================== Plastic ====================

PlasticMaterial::PlasticMaterial(ColorTexture kd, ColorTexture ks, double roughness)
    : kd_(kd), ks_(ks), roughness_(FloatTexture::constant(roughness)) {
    validate_roughness(roughness, "plastic");
}

Bsdf PlasticMaterial::compute_bsdf(const SurfaceInteraction& si) const {
    Bsdf bsdf(si);
    color kd = vec3_clamp(kd_.evaluate(si), 0.0, 1.0);
    if (!vec3_is_zero(kd)) {
        bsdf.add(Bxdf::lambertian_reflection(kd));
    }

    color ks = vec3_clamp(ks_.evaluate(si), 0.0, 1.0);
    if (!vec3_is_zero(ks)) {
        Fresnel coat = Fresnel::dielectric(1.0, PLASTIC_COAT_ETA);
        double roughness = roughness_.evaluate(si);
        if (roughness == 0.0) {
            bsdf.add(Bxdf::specular_reflection(ks, coat));
        } else {
            double alpha = MicrofacetDistribution::roughness_to_alpha(roughness);
            bsdf.add(Bxdf::microfacet_reflection(
                ks, MicrofacetDistribution::trowbridge_reitz(alpha), coat));
        }
    }
    return bsdf;
}

} // namespace sunbeam
