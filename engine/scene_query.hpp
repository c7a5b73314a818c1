/**
 * @file scene_query.hpp
 * @brief Intersection surface consumed by the integrator and visibility tests
 */

#pragma once

extern "C" {
#include "../core/ray.h"
}

#include "interaction.hpp"
#include <optional>

namespace sunbeam {

/**
 * @brief Nearest-hit and any-hit queries against scene geometry
 *
 * Implementations must be safe to call concurrently. A query that cannot be
 * answered (degenerate ray, malformed geometry) reports no hit.
 */
class SceneQuery {
public:
    virtual ~SceneQuery() = default;

    /**
     * @brief Closest intersection along r within (0, r.t_max]
     */
    virtual std::optional<SurfaceInteraction> nearest_hit(const ray& r) const = 0;

    /**
     * @brief True if anything blocks r within (0, max_distance)
     */
    virtual bool occluded(const ray& r, double max_distance) const = 0;
};

} // namespace sunbeam
