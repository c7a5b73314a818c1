/**
 * @file bsdf.hpp
 * @brief Bundle of lobes at one shading point
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "bxdf.hpp"
#include "interaction.hpp"
#include <array>

namespace sunbeam {

/**
 * @brief Bidirectional scattering distribution function at a shading point
 *
 * Holds up to MAX_BXDFS lobes plus the shading frame (tangent, bitangent,
 * normal). Built fresh for every interaction and never kept past it.
 */
class Bsdf {
public:
    static constexpr int MAX_BXDFS = 8;

    explicit Bsdf(const SurfaceInteraction& si);

    /**
     * @brief Append a lobe
     * @throws std::length_error when MAX_BXDFS lobes are already present
     */
    void add(const Bxdf& bxdf);

    int lobe_count(BxdfFlags flags = BSDF_ALL) const;
    const Bxdf& lobe(int index) const { return bxdfs_[index]; }

    vec3 world_to_local(const vec3& v) const;
    vec3 local_to_world(const vec3& v) const;

    /**
     * @brief Sum of matching lobes for world-space (wo, wi)
     *
     * Reflection lobes answer when wo and wi are on the same side of the
     * geometric normal, transmission lobes otherwise.
     */
    color evaluate(const vec3& wo_world, const vec3& wi_world, BxdfFlags flags = BSDF_ALL) const;

    /**
     * @brief Sample lobe `index`; the returned wi is in world space
     */
    BxdfSample sample_lobe(int index, const vec3& wo_world, Point2d u) const;

    const vec3& shading_normal() const { return ns_; }

private:
    std::array<Bxdf, MAX_BXDFS> bxdfs_;
    int count_ = 0;
    vec3 ng_;  // Geometric normal
    vec3 ns_;  // Shading normal, local +z
    vec3 ss_;  // Primary tangent, local +x
    vec3 ts_;  // Secondary tangent, local +y
};

} // namespace sunbeam
