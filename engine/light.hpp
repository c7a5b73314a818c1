/**
 * @file light.hpp
 * @brief Light sources and shadow-ray visibility
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "geometry.hpp"
#include "scene_query.hpp"

namespace sunbeam {

/**
 * @brief Deferred shadow test between a shading point and a light sample
 */
struct VisibilityTester {
    point3 p0 = {0.0, 0.0, 0.0};
    point3 p1 = {0.0, 0.0, 0.0};

    VisibilityTester() = default;
    VisibilityTester(point3 from, point3 to) : p0(from), p1(to) {}

    /**
     * @brief True if nothing in the scene blocks the open segment p0-p1
     *
     * The segment is shortened by SHADOW_EPSILON at both ends so that the
     * surfaces the endpoints sit on do not occlude themselves. A query that
     * throws reports the segment as blocked.
     */
    bool unoccluded(const SceneQuery& scene) const;
};

/**
 * @brief Incident illumination sampled toward a reference point
 */
struct LightSample {
    color li = {0.0, 0.0, 0.0};   // Incident radiance
    vec3 wi = {0.0, 0.0, 0.0};    // Unit direction from the reference point to the light
    double distance = 0.0;
    double pdf = 0.0;
    VisibilityTester visibility;
};

/**
 * @brief Light source interface
 */
class Light {
public:
    virtual ~Light() = default;

    /**
     * @brief Sample incident radiance arriving at ref
     * @param u Uniform sample in [0,1)^2 (unused by delta lights)
     */
    virtual LightSample sample_incident(const point3& ref, Point2d u) const = 0;
};

/**
 * @brief Isotropic point light
 */
class PointLight : public Light {
public:
    /**
     * @param intensity Radiant intensity per channel
     */
    PointLight(point3 position, color intensity);

    LightSample sample_incident(const point3& ref, Point2d u) const override;

    const point3& position() const { return position_; }
    const color& intensity() const { return intensity_; }

private:
    point3 position_;
    color intensity_;
};

} // namespace sunbeam
