/**
 * @file ray.h
 * @brief Ray structure and operations for ray tracing
 */

#ifndef SUNBEAM_RAY_H
#define SUNBEAM_RAY_H

#include "vec3.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Ray with a parametric range and optional differentials
 *
 * The valid range is (0, t_max]. When has_differentials is set, the
 * rx/ry pairs describe the rays through the neighbouring pixels in
 * raster x and y.
 */
typedef struct ray {
    point3 origin;
    vec3 direction;
    double t_max;

    int has_differentials;
    point3 rx_origin;
    vec3 rx_direction;
    point3 ry_origin;
    vec3 ry_direction;
} ray;

/**
 * @brief Create a new ray with an unbounded range and no differentials
 * @param origin Ray origin point
 * @param direction Ray direction vector
 * @return New ray
 */
ray ray_create(point3 origin, vec3 direction);

/**
 * @brief Create a ray limited to (0, t_max]
 */
ray ray_create_bounded(point3 origin, vec3 direction, double t_max);

/**
 * @brief Get point along ray at parameter t
 * @param r The ray
 * @param t Parameter value (distance along ray)
 * @return Point at r.origin + t * r.direction
 */
point3 ray_at(ray r, double t);

/**
 * @brief Copy the differentials of src onto dst
 */
void ray_copy_differentials(ray* dst, const ray* src);

#ifdef __cplusplus
}
#endif

#endif /* SUNBEAM_RAY_H */
