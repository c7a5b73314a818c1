/**
 * @file interaction.hpp
 * @brief Surface interaction produced by a scene intersection query
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

namespace sunbeam {

class Material;

// Spawned rays start this far off the surface along the normal
constexpr double RAY_EPSILON = 1e-4;

// Shadow segments are shortened by this much at both ends
constexpr double SHADOW_EPSILON = 1e-4;

/**
 * @brief Everything the integrator needs about one intersection
 *
 * Lives for a single integrator step.
 */
struct SurfaceInteraction {
    hit_record hit = hit_record_init();
    vec3 wo = {0.0, 0.0, 0.0};        // Unit direction back toward the ray origin
    ray incoming = ray_create({0.0, 0.0, 0.0}, {0.0, 0.0, 1.0});
    const Material* material = nullptr;

    const point3& point() const { return hit.point; }
    const vec3& normal() const { return hit.normal; }

    /**
     * @brief Surface point nudged off the surface on the side of w
     */
    point3 offset_origin(const vec3& w) const {
        double side = vec3_dot(w, hit.normal) > 0.0 ? RAY_EPSILON : -RAY_EPSILON;
        return vec3_add(hit.point, vec3_scale(hit.normal, side));
    }

    /**
     * @brief Continue a path in direction d, carrying the incoming ray's differentials
     */
    ray spawn_ray(const vec3& d) const {
        ray r = ray_create(offset_origin(d), d);
        ray_copy_differentials(&r, &incoming);
        return r;
    }
};

} // namespace sunbeam
