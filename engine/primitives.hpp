/**
 * @file primitives.hpp
 * @brief Infinite plane primitive
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include <cmath>
#include <algorithm>

namespace sunbeam {

/**
 * @brief Infinite plane primitive
 *
 * Defined by a point on the plane and a normal vector. Both sides are
 * solid; the stored normal is the outward one.
 */
struct Plane {
    point3 point;      // A point on the plane
    vec3 normal;       // Unit normal
    int material_id;

    Plane(point3 p, vec3 n, int mat_id = 0)
        : point(p), normal(vec3_normalize(n)), material_id(mat_id) {}

    /**
     * @brief Intersection in (t_min, t_max]
     */
    bool hit(const ray& r, double t_min, double t_max, hit_record& rec) const {
        double t;
        if (!crossing(r, t) || t <= t_min || t > t_max) {
            return false;
        }

        rec.t = t;
        rec.point = ray_at(r, t);
        hit_record_set_normal(&rec, r, normal);
        rec.material_id = material_id;

        vec3 up = (std::fabs(normal.y) < 0.999) ? vec3{0, 1, 0} : vec3{1, 0, 0};
        rec.tangent = vec3_normalize(vec3_cross(up, normal));

        // Planar coordinates in the tangent frame
        vec3 bitangent = vec3_cross(normal, rec.tangent);
        vec3 local = vec3_sub(rec.point, point);
        rec.u = vec3_dot(local, rec.tangent);
        rec.v = vec3_dot(local, bitangent);

        return true;
    }

    /**
     * @brief Intersection in the open interval (t_min, t_max)
     */
    bool intersects(const ray& r, double t_min, double t_max) const {
        double t;
        return crossing(r, t) && t > t_min && t < t_max;
    }

private:
    bool crossing(const ray& r, double& t) const {
        double denom = vec3_dot(normal, r.direction);

        // Parallel (or nearly so)
        if (std::fabs(denom) < 1e-12) {
            return false;
        }
        t = vec3_dot(vec3_sub(point, r.origin), normal) / denom;
        return true;
    }
};

} // namespace sunbeam
