/**
 * @file sphere.hpp
 * @brief Sphere geometry
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "sampling.hpp"
#include <cmath>
#include <algorithm>

namespace sunbeam {

/**
 * @brief Calculate UV coordinates for a point on a unit sphere
 * @param p Point on unit sphere (normalized direction from center)
 * @param u Output U coordinate [0, 1]
 * @param v Output V coordinate [0, 1]
 */
inline void get_sphere_uv(const vec3& p, double& u, double& v) {
    double theta = std::acos(std::clamp(-p.y, -1.0, 1.0));
    double phi = std::atan2(-p.z, p.x) + PI;

    u = phi * INV_2PI;
    v = theta * INV_PI;
}

/**
 * @brief Tangent in the direction of increasing U (longitude)
 */
inline vec3 get_sphere_tangent(const vec3& p) {
    // Near the poles the longitude direction is undefined
    if (std::fabs(p.y) > 0.999) {
        return {1.0, 0.0, 0.0};
    }
    return vec3_normalize({-p.z, 0.0, p.x});
}

/**
 * @brief Sphere primitive
 */
struct Sphere {
    point3 center;
    double radius;
    int material_id;

    Sphere(point3 c, double r, int mat_id = 0)
        : center(c), radius(r), material_id(mat_id) {}

    /**
     * @brief Closest intersection in (t_min, t_max]
     * @param rec Hit record to populate
     * @return true if intersection found
     */
    bool hit(const ray& r, double t_min, double t_max, hit_record& rec) const {
        double t0, t1;
        if (!roots(r, t0, t1)) {
            return false;
        }

        // Nearest root in the acceptable range
        double root = t0;
        if (root <= t_min || root > t_max) {
            root = t1;
            if (root <= t_min || root > t_max) {
                return false;
            }
        }

        rec.t = root;
        rec.point = ray_at(r, rec.t);
        vec3 outward_normal = vec3_scale(vec3_sub(rec.point, center), 1.0 / radius);
        hit_record_set_normal(&rec, r, outward_normal);
        rec.material_id = material_id;

        get_sphere_uv(outward_normal, rec.u, rec.v);
        rec.tangent = get_sphere_tangent(outward_normal);

        return true;
    }

    /**
     * @brief Any intersection in the open interval (t_min, t_max)
     */
    bool intersects(const ray& r, double t_min, double t_max) const {
        double t0, t1;
        if (!roots(r, t0, t1)) {
            return false;
        }
        return (t0 > t_min && t0 < t_max) || (t1 > t_min && t1 < t_max);
    }

private:
    // Ray parameters of both crossings, t0 <= t1
    bool roots(const ray& r, double& t0, double& t1) const {
        vec3 oc = vec3_sub(r.origin, center);

        double a = vec3_length_squared(r.direction);
        double half_b = vec3_dot(oc, r.direction);
        double c = vec3_length_squared(oc) - radius * radius;

        double discriminant = half_b * half_b - a * c;
        if (discriminant < 0 || a == 0.0) {
            return false;
        }

        double sqrtd = std::sqrt(discriminant);
        t0 = (-half_b - sqrtd) / a;
        t1 = (-half_b + sqrtd) / a;
        return true;
    }
};

} // namespace sunbeam
