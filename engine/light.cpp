/**
 * @file light.cpp
 * @brief Point light sampling and shadow segment queries
 */

#include "light.hpp"
#include <cmath>
#include <exception>
#include <stdexcept>

namespace sunbeam {

bool VisibilityTester::unoccluded(const SceneQuery& scene) const {
    vec3 d = vec3_sub(p1, p0);
    double dist = vec3_length(d);
    if (dist <= 2.0 * SHADOW_EPSILON) {
        return true;
    }
    vec3 dir = vec3_scale(d, 1.0 / dist);
    point3 origin = vec3_add(p0, vec3_scale(dir, SHADOW_EPSILON));
    ray r = ray_create_bounded(origin, dir, dist - 2.0 * SHADOW_EPSILON);
    try {
        return !scene.occluded(r, dist - 2.0 * SHADOW_EPSILON);
    } catch (const std::exception&) {
        // Unanswered shadow query: no light along this segment
        return false;
    }
}

PointLight::PointLight(point3 position, color intensity)
    : position_(position), intensity_(intensity) {
    if (!vec3_is_finite(position) || !vec3_is_finite(intensity)) {
        throw std::invalid_argument("point light: position and intensity must be finite");
    }
}

LightSample PointLight::sample_incident(const point3& ref, Point2d /*u*/) const {
    LightSample ls;
    vec3 d = vec3_sub(position_, ref);
    double dist2 = vec3_length_squared(d);
    if (dist2 == 0.0) {
        return ls;
    }
    ls.distance = std::sqrt(dist2);
    ls.wi = vec3_scale(d, 1.0 / ls.distance);
    ls.li = vec3_scale(intensity_, 1.0 / dist2);
    ls.pdf = 1.0;
    ls.visibility = VisibilityTester(ref, position_);
    return ls;
}

} // namespace sunbeam
