/**
 * @file bsdf.cpp
 * @brief Shading frame and lobe bookkeeping for Bsdf
 */

#include "bsdf.hpp"
#include <stdexcept>
#include <string>
#include <cmath>

namespace sunbeam {

Bsdf::Bsdf(const SurfaceInteraction& si)
    : ng_(si.hit.normal), ns_(si.hit.normal) {
    // Gram-Schmidt the geometry's tangent against the normal
    vec3 t = vec3_sub(si.hit.tangent, vec3_scale(ns_, vec3_dot(ns_, si.hit.tangent)));
    if (vec3_length_squared(t) < 1e-12) {
        vec3_coordinate_system(ns_, &ss_, &ts_);
    } else {
        ss_ = vec3_normalize(t);
        ts_ = vec3_cross(ns_, ss_);
    }
}

void Bsdf::add(const Bxdf& bxdf) {
    if (count_ >= MAX_BXDFS) {
        throw std::length_error("Bsdf: more than " + std::to_string(MAX_BXDFS) + " lobes");
    }
    bxdfs_[count_++] = bxdf;
}

int Bsdf::lobe_count(BxdfFlags flags) const {
    int n = 0;
    for (int i = 0; i < count_; ++i) {
        if (bxdfs_[i].matches(flags)) {
            ++n;
        }
    }
    return n;
}

vec3 Bsdf::world_to_local(const vec3& v) const {
    return {vec3_dot(v, ss_), vec3_dot(v, ts_), vec3_dot(v, ns_)};
}

vec3 Bsdf::local_to_world(const vec3& v) const {
    return {
        ss_.x * v.x + ts_.x * v.y + ns_.x * v.z,
        ss_.y * v.x + ts_.y * v.y + ns_.y * v.z,
        ss_.z * v.x + ts_.z * v.y + ns_.z * v.z
    };
}

color Bsdf::evaluate(const vec3& wo_world, const vec3& wi_world, BxdfFlags flags) const {
    vec3 wo = world_to_local(wo_world);
    vec3 wi = world_to_local(wi_world);
    if (wo.z == 0.0) {
        return vec3_zero();
    }

    bool reflect = vec3_dot(wi_world, ng_) * vec3_dot(wo_world, ng_) > 0.0;
    color f = vec3_zero();
    for (int i = 0; i < count_; ++i) {
        const Bxdf& b = bxdfs_[i];
        if (!b.matches(flags)) {
            continue;
        }
        bool is_reflection = (b.flags & BSDF_REFLECTION) != 0;
        bool is_transmission = (b.flags & BSDF_TRANSMISSION) != 0;
        if ((reflect && is_reflection) || (!reflect && is_transmission)) {
            f = vec3_add(f, b.evaluate(wo, wi));
        }
    }
    return f;
}

BxdfSample Bsdf::sample_lobe(int index, const vec3& wo_world, Point2d u) const {
    if (index < 0 || index >= count_) {
        return BxdfSample{};
    }
    vec3 wo = world_to_local(wo_world);
    if (wo.z == 0.0) {
        return BxdfSample{};
    }
    BxdfSample s = bxdfs_[index].sample(wo, u);
    if (s.pdf == 0.0) {
        return BxdfSample{};
    }
    s.wi = local_to_world(s.wi);
    return s;
}

} // namespace sunbeam
