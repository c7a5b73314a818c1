/**
 * @file integrator.hpp
 * @brief Whitted-style light transport
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
}

#include "light.hpp"
#include "sampler.hpp"
#include "scene_query.hpp"
#include <memory>
#include <vector>

namespace sunbeam {

/**
 * @brief Direct lighting from every light plus recursion along specular lobes
 *
 * Recursion is an explicit work stack of (ray, depth, weight) entries, so
 * the call depth does not grow with max_depth. A camera ray issues at most
 * one nearest-hit query per stack entry, and entries at depth max_depth - 1
 * never spawn children.
 */
class WhittedIntegrator {
public:
    struct Settings {
        int max_depth = 5;
        color background = {0.0, 0.0, 0.0};
    };

    /**
     * @throws std::invalid_argument if max_depth <= 0
     */
    explicit WhittedIntegrator(const Settings& settings);

    /**
     * @brief Radiance arriving at r's origin from direction -r.direction
     * @param depth Depth of r in the specular tree; camera rays are depth 0
     *
     * Draws one 2D sample per light per stack entry from the sampler. A scene
     * query that throws is a miss for that ray; exceptions from materials
     * propagate.
     */
    color incoming_radiance(const ray& r, const SceneQuery& scene,
                            const std::vector<std::shared_ptr<const Light>>& lights,
                            Sampler& sampler, int depth = 0) const;

    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

} // namespace sunbeam
