/**
 * @file camera.cpp
 * @brief Raster-to-world ray generation
 */

#include "camera.hpp"
#include "sampling.hpp"
#include <cmath>
#include <stdexcept>

namespace sunbeam {

void Camera::setup_frame(point3 lookfrom, point3 lookat, vec3 vup, int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("camera: resolution must be positive");
    }
    vec3 forward = vec3_sub(lookfrom, lookat);
    if (vec3_is_zero(forward) || !vec3_is_finite(forward)) {
        throw std::invalid_argument("camera: lookfrom and lookat must differ");
    }
    vec3 w = vec3_normalize(forward);
    vec3 u = vec3_cross(vup, w);
    if (vec3_length_squared(u) < 1e-12) {
        throw std::invalid_argument("camera: up vector is parallel to the view direction");
    }

    width_ = width;
    height_ = height;
    origin_ = lookfrom;
    w_ = w;
    u_ = vec3_normalize(u);
    v_ = vec3_cross(w_, u_);
}

Camera Camera::perspective(point3 lookfrom, point3 lookat, vec3 vup, double vfov,
                           int width, int height) {
    if (!(vfov > 0.0 && vfov < 180.0)) {
        throw std::invalid_argument("camera: field of view must be in (0, 180) degrees");
    }
    Camera cam;
    cam.type_ = CameraType::Perspective;
    cam.setup_frame(lookfrom, lookat, vup, width, height);

    double theta = vfov * PI / 180.0;
    cam.half_height_ = std::tan(theta / 2.0);
    cam.half_width_ = cam.half_height_ * static_cast<double>(width) / height;
    return cam;
}

Camera Camera::orthographic(point3 lookfrom, point3 lookat, vec3 vup, double screen_height,
                            int width, int height) {
    if (!std::isfinite(screen_height) || screen_height <= 0.0) {
        throw std::invalid_argument("camera: screen size must be positive");
    }
    Camera cam;
    cam.type_ = CameraType::Orthographic;
    cam.setup_frame(lookfrom, lookat, vup, width, height);

    cam.half_height_ = 0.5 * screen_height;
    cam.half_width_ = cam.half_height_ * static_cast<double>(width) / height;
    return cam;
}

point3 Camera::screen_point(double fx, double fy) const {
    double sx = (2.0 * fx / width_ - 1.0) * half_width_;
    double sy = (1.0 - 2.0 * fy / height_) * half_height_;
    return vec3_add(vec3_scale(u_, sx), vec3_scale(v_, sy));
}

ray Camera::generate_ray(const CameraSample& sample) const {
    point3 s = screen_point(sample.film_point.x, sample.film_point.y);

    if (type_ == CameraType::Orthographic) {
        return ray_create(vec3_add(origin_, s), vec3_negate(w_));
    }

    // Image plane sits one unit in front of the eye
    vec3 dir = vec3_normalize(vec3_sub(s, w_));
    return ray_create(origin_, dir);
}

ray Camera::generate_ray_differential(const CameraSample& sample) const {
    ray r = generate_ray(sample);

    CameraSample sx = sample;
    sx.film_point.x += 1.0;
    CameraSample sy = sample;
    sy.film_point.y += 1.0;
    ray rx = generate_ray(sx);
    ray ry = generate_ray(sy);

    r.has_differentials = 1;
    r.rx_origin = rx.origin;
    r.rx_direction = rx.direction;
    r.ry_origin = ry.origin;
    r.ry_direction = ry.direction;
    return r;
}

} // namespace sunbeam
