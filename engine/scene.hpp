/**
 * @file scene.hpp
 * @brief Scene containing shapes, materials and lights
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "sphere.hpp"
#include "primitives.hpp"
#include "material.hpp"
#include "light.hpp"
#include "scene_query.hpp"
#include <memory>
#include <vector>

namespace sunbeam {

// Smallest accepted hit distance; spawned rays are already offset off the surface
constexpr double SCENE_T_MIN = 1e-9;

/**
 * @brief Brute-force collection of spheres and planes
 *
 * Shapes refer to materials by index. Once rendering starts the scene is
 * read-only and queried concurrently.
 */
class Scene : public SceneQuery {
public:
    std::vector<Sphere> spheres;
    std::vector<Plane> planes;
    std::vector<std::shared_ptr<const Material>> materials;
    std::vector<std::shared_ptr<const Light>> lights;

    /**
     * @brief Add a material and return its ID
     * @throws std::invalid_argument on a null material
     */
    int add_material(std::shared_ptr<const Material> material);

    /**
     * @throws std::invalid_argument on a non-positive radius or unknown material
     */
    void add_sphere(point3 center, double radius, int material_id);

    /**
     * @throws std::invalid_argument on a zero normal or unknown material
     */
    void add_plane(point3 point, vec3 normal, int material_id);

    /**
     * @throws std::invalid_argument on a null light
     */
    void add_light(std::shared_ptr<const Light> light);

    std::optional<SurfaceInteraction> nearest_hit(const ray& r) const override;
    bool occluded(const ray& r, double max_distance) const override;

    /**
     * @brief Raw closest-hit query over every shape in (t_min, t_max]
     */
    bool hit(const ray& r, double t_min, double t_max, hit_record& rec) const;

    const Material& get_material(int id) const {
        return *materials[id];
    }

    size_t shape_count() const { return spheres.size() + planes.size(); }

private:
    void check_material(int material_id) const;
};

} // namespace sunbeam
