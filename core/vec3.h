/**
 * @file vec3.h
 * @brief 3D vector mathematics shared by the renderer core
 *
 * Vectors double as points, normals and RGB radiance values.
 */

#ifndef SUNBEAM_VEC3_H
#define SUNBEAM_VEC3_H

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief 3D vector structure
 */
typedef struct vec3 {
    double x;
    double y;
    double z;
} vec3;

/**
 * @brief Linear RGB radiance (r, g, b stored in x, y, z)
 */
typedef vec3 color;

/**
 * @brief Point alias for vec3
 */
typedef vec3 point3;

/* Construction */
vec3 vec3_create(double x, double y, double z);
vec3 vec3_zero(void);
vec3 vec3_splat(double v);

/* Basic operations */
vec3 vec3_add(vec3 a, vec3 b);
vec3 vec3_sub(vec3 a, vec3 b);
vec3 vec3_mul(vec3 a, vec3 b);
vec3 vec3_div(vec3 a, vec3 b);
vec3 vec3_scale(vec3 v, double t);
vec3 vec3_negate(vec3 v);

/* Vector products */
double vec3_dot(vec3 a, vec3 b);
double vec3_abs_dot(vec3 a, vec3 b);
vec3 vec3_cross(vec3 a, vec3 b);

/* Length operations */
double vec3_length(vec3 v);
double vec3_length_squared(vec3 v);
vec3 vec3_normalize(vec3 v);

/* Component queries */
int vec3_is_zero(vec3 v);
int vec3_is_finite(vec3 v);

/**
 * @brief Build an orthonormal basis (t, b) around unit vector n
 */
void vec3_coordinate_system(vec3 n, vec3* t, vec3* b);

/* Utility */
vec3 vec3_clamp(vec3 v, double min_val, double max_val);

#ifdef __cplusplus
}
#endif

#endif /* SUNBEAM_VEC3_H */
