/**
 * @file bxdf.cpp
 * @brief Lambertian, specular and Torrance-Sparrow lobes
 */

#include "bxdf.hpp"
#include "sampling.hpp"

namespace sunbeam {

Bxdf Bxdf::lambertian_reflection(color r) {
    Bxdf b;
    b.kind = BxdfKind::LambertianReflection;
    b.flags = BSDF_REFLECTION | BSDF_DIFFUSE;
    b.scale = r;
    return b;
}

Bxdf Bxdf::specular_reflection(color r, const Fresnel& fresnel) {
    Bxdf b;
    b.kind = BxdfKind::SpecularReflection;
    b.flags = BSDF_REFLECTION | BSDF_SPECULAR;
    b.scale = r;
    b.fresnel = fresnel;
    return b;
}

Bxdf Bxdf::specular_transmission(color t, double eta_a, double eta_b) {
    Bxdf b;
    b.kind = BxdfKind::SpecularTransmission;
    b.flags = BSDF_TRANSMISSION | BSDF_SPECULAR;
    b.scale = t;
    b.eta_a = eta_a;
    b.eta_b = eta_b;
    b.fresnel = Fresnel::dielectric(eta_a, eta_b);
    return b;
}

Bxdf Bxdf::microfacet_reflection(color r, const MicrofacetDistribution& distribution,
                                 const Fresnel& fresnel) {
    Bxdf b;
    b.kind = BxdfKind::MicrofacetReflection;
    b.flags = BSDF_REFLECTION | BSDF_GLOSSY;
    b.scale = r;
    b.distribution = distribution;
    b.fresnel = fresnel;
    return b;
}

// Torrance-Sparrow: D(wh) G(wo, wi) F(wo, wh) / (4 cos_o cos_i)
static color torrance_sparrow(const Bxdf& b, const vec3& wo, const vec3& wi) {
    if (!same_hemisphere(wo, wi)) {
        return vec3_zero();
    }
    double cos_o = abs_cos_theta(wo);
    double cos_i = abs_cos_theta(wi);
    if (cos_o == 0.0 || cos_i == 0.0) {
        return vec3_zero();
    }
    vec3 wh = vec3_add(wi, wo);
    if (vec3_is_zero(wh)) {
        return vec3_zero();
    }
    wh = vec3_normalize(wh);

    // Fresnel is evaluated against the half vector on the +z side
    vec3 wh_up = wh.z < 0.0 ? vec3_negate(wh) : wh;
    color F = b.fresnel.evaluate(vec3_dot(wi, wh_up));

    double d_g = b.distribution.D(wh) * b.distribution.G(wo, wi) / (4.0 * cos_i * cos_o);
    color f = vec3_scale(vec3_mul(b.scale, F), d_g);
    return vec3_is_finite(f) ? f : vec3_zero();
}

color Bxdf::evaluate(const vec3& wo, const vec3& wi) const {
    switch (kind) {
        case BxdfKind::LambertianReflection:
            return same_hemisphere(wo, wi) ? vec3_scale(scale, INV_PI) : vec3_zero();

        case BxdfKind::MicrofacetReflection:
            return torrance_sparrow(*this, wo, wi);

        case BxdfKind::SpecularReflection:
        case BxdfKind::SpecularTransmission:
            // Delta distributions are never hit by an arbitrary pair
            return vec3_zero();
    }
    return vec3_zero();
}

BxdfSample Bxdf::sample(const vec3& wo, Point2d u) const {
    BxdfSample s;
    s.flags = flags;

    switch (kind) {
        case BxdfKind::LambertianReflection: {
            s.wi = cosine_sample_hemisphere(u);
            if (wo.z < 0.0) {
                s.wi.z = -s.wi.z;
            }
            s.pdf = pdf(wo, s.wi);
            s.f = evaluate(wo, s.wi);
            return s;
        }

        case BxdfKind::SpecularReflection: {
            s.wi = {-wo.x, -wo.y, wo.z};
            double cos_i = abs_cos_theta(s.wi);
            if (cos_i == 0.0) {
                return BxdfSample{};
            }
            s.pdf = 1.0;
            s.f = vec3_scale(vec3_mul(fresnel.evaluate(cos_theta(s.wi)), scale), 1.0 / cos_i);
            return s;
        }

        case BxdfKind::SpecularTransmission: {
            bool entering = cos_theta(wo) > 0.0;
            double eta_i = entering ? eta_a : eta_b;
            double eta_t = entering ? eta_b : eta_a;
            vec3 n = {0.0, 0.0, entering ? 1.0 : -1.0};

            if (!refract(wo, n, eta_i / eta_t, s.wi)) {
                // Total internal reflection; the reflection lobe carries the energy
                return BxdfSample{};
            }
            double cos_i = abs_cos_theta(s.wi);
            if (cos_i == 0.0) {
                return BxdfSample{};
            }
            color transmitted = vec3_sub(vec3_splat(1.0), fresnel.evaluate(cos_theta(s.wi)));
            color ft = vec3_mul(scale, transmitted);

            // Radiance is compressed when entering a denser medium
            ft = vec3_scale(ft, (eta_i * eta_i) / (eta_t * eta_t));

            s.pdf = 1.0;
            s.f = vec3_scale(ft, 1.0 / cos_i);
            return s;
        }

        case BxdfKind::MicrofacetReflection: {
            if (wo.z == 0.0) {
                return BxdfSample{};
            }
            vec3 wh = distribution.sample_wh(wo, u);
            if (vec3_dot(wo, wh) < 0.0) {
                return BxdfSample{};
            }
            s.wi = reflect(wo, wh);
            if (!same_hemisphere(wo, s.wi)) {
                return BxdfSample{};
            }
            s.pdf = pdf(wo, s.wi);
            s.f = evaluate(wo, s.wi);
            return s;
        }
    }
    return BxdfSample{};
}

double Bxdf::pdf(const vec3& wo, const vec3& wi) const {
    switch (kind) {
        case BxdfKind::LambertianReflection:
            return same_hemisphere(wo, wi) ? cosine_hemisphere_pdf(abs_cos_theta(wi)) : 0.0;

        case BxdfKind::MicrofacetReflection: {
            if (!same_hemisphere(wo, wi)) {
                return 0.0;
            }
            vec3 wh = vec3_normalize(vec3_add(wo, wi));
            double wo_dot_wh = std::fabs(vec3_dot(wo, wh));
            if (wo_dot_wh == 0.0) {
                return 0.0;
            }
            return distribution.pdf(wh) / (4.0 * wo_dot_wh);
        }

        case BxdfKind::SpecularReflection:
        case BxdfKind::SpecularTransmission:
            return 0.0;
    }
    return 0.0;
}

color Bxdf::rho_hd(const vec3& wo, const std::vector<Point2d>& samples) const {
    color r = vec3_zero();
    if (samples.empty()) {
        return r;
    }
    for (const Point2d& u : samples) {
        BxdfSample s = sample(wo, u);
        if (is_valid_pdf(s.pdf)) {
            r = vec3_add(r, vec3_scale(s.f, abs_cos_theta(s.wi) / s.pdf));
        }
    }
    return vec3_scale(r, 1.0 / static_cast<double>(samples.size()));
}

} // namespace sunbeam
