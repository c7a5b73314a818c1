/**
 * @file scene.cpp
 * @brief Scene construction and intersection queries
 */

#include "scene.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace sunbeam {

static bool is_degenerate(const ray& r) {
    return !vec3_is_finite(r.origin) || !vec3_is_finite(r.direction) ||
           vec3_is_zero(r.direction) || std::isnan(r.t_max);
}

void Scene::check_material(int material_id) const {
    if (material_id < 0 || material_id >= static_cast<int>(materials.size())) {
        throw std::invalid_argument("unknown material id " + std::to_string(material_id));
    }
}

int Scene::add_material(std::shared_ptr<const Material> material) {
    if (!material) {
        throw std::invalid_argument("add_material: null material");
    }
    int id = static_cast<int>(materials.size());
    materials.push_back(std::move(material));
    return id;
}

void Scene::add_sphere(point3 center, double radius, int material_id) {
    if (!std::isfinite(radius) || radius <= 0.0 || !vec3_is_finite(center)) {
        throw std::invalid_argument("add_sphere: radius must be positive and finite");
    }
    check_material(material_id);
    spheres.emplace_back(center, radius, material_id);
}

void Scene::add_plane(point3 point, vec3 normal, int material_id) {
    if (vec3_is_zero(normal) || !vec3_is_finite(normal) || !vec3_is_finite(point)) {
        throw std::invalid_argument("add_plane: normal must be non-zero and finite");
    }
    check_material(material_id);
    planes.emplace_back(point, normal, material_id);
}

void Scene::add_light(std::shared_ptr<const Light> light) {
    if (!light) {
        throw std::invalid_argument("add_light: null light");
    }
    lights.push_back(std::move(light));
}

bool Scene::hit(const ray& r, double t_min, double t_max, hit_record& rec) const {
    hit_record temp_rec = hit_record_init();
    bool hit_anything = false;
    double closest_so_far = t_max;

    for (const auto& sphere : spheres) {
        if (sphere.hit(r, t_min, closest_so_far, temp_rec)) {
            hit_anything = true;
            closest_so_far = temp_rec.t;
            rec = temp_rec;
        }
    }

    for (const auto& plane : planes) {
        if (plane.hit(r, t_min, closest_so_far, temp_rec)) {
            hit_anything = true;
            closest_so_far = temp_rec.t;
            rec = temp_rec;
        }
    }

    return hit_anything;
}

std::optional<SurfaceInteraction> Scene::nearest_hit(const ray& r) const {
    if (is_degenerate(r)) {
        return std::nullopt;
    }

    SurfaceInteraction si;
    if (!hit(r, SCENE_T_MIN, r.t_max, si.hit)) {
        return std::nullopt;
    }

    si.wo = vec3_normalize(vec3_negate(r.direction));
    si.incoming = r;
    si.material = materials[si.hit.material_id].get();
    return si;
}

bool Scene::occluded(const ray& r, double max_distance) const {
    if (is_degenerate(r) || !(max_distance > 0.0)) {
        return false;
    }

    // Shape hits are parameterized by t; convert the distance bound
    double t_max = std::fmin(max_distance / vec3_length(r.direction), r.t_max);
    for (const auto& sphere : spheres) {
        if (sphere.intersects(r, SCENE_T_MIN, t_max)) {
            return true;
        }
    }
    for (const auto& plane : planes) {
        if (plane.intersects(r, SCENE_T_MIN, t_max)) {
            return true;
        }
    }
    return false;
}

} // namespace sunbeam
