/**
 * @file hit.h
 * @brief Hit record structure for ray-object intersections
 */

#ifndef SUNBEAM_HIT_H
#define SUNBEAM_HIT_H

#include "vec3.h"
#include "ray.h"
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Hit record containing intersection information
 */
typedef struct hit_record {
    point3 point;      /**< Point of intersection */
    vec3 normal;       /**< Outward surface normal (unit length) */
    vec3 tangent;      /**< Unit tangent orthogonal to normal */
    double t;          /**< Ray parameter at intersection */
    double u;          /**< Surface U coordinate */
    double v;          /**< Surface V coordinate */
    bool front_face;   /**< True if the ray arrived against the outward normal */
    int material_id;   /**< Material identifier for the hit surface */
} hit_record;

/**
 * @brief Initialize a hit record
 * @return Default hit record
 */
hit_record hit_record_init(void);

/**
 * @brief Store the outward normal and record which side was hit
 *
 * The normal keeps its outward orientation so that lobes can tell
 * entering from exiting; front_face is true when dot(dir, n) < 0.
 *
 * @param rec Hit record to modify
 * @param r The ray
 * @param outward_normal The outward-pointing surface normal
 */
void hit_record_set_normal(hit_record* rec, ray r, vec3 outward_normal);

#ifdef __cplusplus
}
#endif

#endif /* SUNBEAM_HIT_H */
