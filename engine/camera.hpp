/**
 * @file camera.hpp
 * @brief Pinhole perspective and orthographic cameras
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
}

#include "geometry.hpp"

namespace sunbeam {

/**
 * @brief Camera sample in raster space
 *
 * The raster origin is the top-left corner of the film with y pointing
 * down; pixel (x, y) covers [x, x+1) x [y, y+1).
 */
struct CameraSample {
    Point2d film_point;
    Point2d lens_point;
};

enum class CameraType {
    Perspective,
    Orthographic
};

/**
 * @brief Camera for generating rays
 *
 * Immutable once built; safe to share between render threads.
 */
class Camera {
public:
    /**
     * @brief Create a perspective camera
     * @param lookfrom Camera position
     * @param lookat Point to look at
     * @param vup View up vector
     * @param vfov Vertical field of view in degrees
     * @param width Film width in pixels
     * @param height Film height in pixels
     * @throws std::invalid_argument on a degenerate frame, fov or resolution
     */
    static Camera perspective(point3 lookfrom, point3 lookat, vec3 vup, double vfov,
                              int width, int height);

    /**
     * @brief Create an orthographic camera
     * @param screen_height World-space height of the visible window
     */
    static Camera orthographic(point3 lookfrom, point3 lookat, vec3 vup, double screen_height,
                               int width, int height);

    /**
     * @brief Primary ray through the sample's film point, without differentials
     */
    ray generate_ray(const CameraSample& sample) const;

    /**
     * @brief Primary ray plus the rays offset by one pixel in raster x and y
     */
    ray generate_ray_differential(const CameraSample& sample) const;

    CameraType type() const { return type_; }
    int width() const { return width_; }
    int height() const { return height_; }

private:
    Camera() = default;

    void setup_frame(point3 lookfrom, point3 lookat, vec3 vup, int width, int height);

    // World-space point on the screen window for a raster position
    point3 screen_point(double fx, double fy) const;

    CameraType type_ = CameraType::Perspective;
    int width_ = 0;
    int height_ = 0;
    point3 origin_ = {0.0, 0.0, 0.0};
    vec3 u_ = {1.0, 0.0, 0.0};   // Right
    vec3 v_ = {0.0, 1.0, 0.0};   // Up
    vec3 w_ = {0.0, 0.0, 1.0};   // Backward (away from lookat)
    double half_width_ = 1.0;
    double half_height_ = 1.0;
};

} // namespace sunbeam
