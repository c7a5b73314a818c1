/**
 * @file integrator.cpp
 * @brief Whitted integrator
 */

#include "integrator.hpp"
#include "bsdf.hpp"
#include "material.hpp"
#include "sampling.hpp"
#include <exception>
#include <optional>
#include <stdexcept>

namespace sunbeam {

namespace {

struct WorkItem {
    ray r;
    int depth;
    color weight;
};

// A query the scene cannot answer counts as a miss for that ray
std::optional<SurfaceInteraction> find_hit(const SceneQuery& scene, const ray& r) {
    try {
        return scene.nearest_hit(r);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

WhittedIntegrator::WhittedIntegrator(const Settings& settings) : settings_(settings) {
    if (settings_.max_depth <= 0) {
        throw std::invalid_argument("whitted integrator: max_depth must be positive");
    }
}

color WhittedIntegrator::incoming_radiance(const ray& r, const SceneQuery& scene,
                                           const std::vector<std::shared_ptr<const Light>>& lights,
                                           Sampler& sampler, int depth) const {
    if (depth < 0) {
        throw std::invalid_argument("whitted integrator: negative depth");
    }

    color L = vec3_zero();
    std::vector<WorkItem> stack;
    stack.reserve(static_cast<size_t>(settings_.max_depth) * 2);
    stack.push_back({r, depth, vec3_splat(1.0)});

    while (!stack.empty()) {
        WorkItem item = stack.back();
        stack.pop_back();

        std::optional<SurfaceInteraction> hit = find_hit(scene, item.r);
        if (!hit) {
            L = vec3_add(L, vec3_mul(item.weight, settings_.background));
            continue;
        }
        const SurfaceInteraction& si = *hit;
        if (!si.material) {
            continue;
        }

        Bsdf bsdf = si.material->compute_bsdf(si);
        const vec3& n = bsdf.shading_normal();

        // Direct lighting
        for (const auto& light : lights) {
            Point2d u = sampler.get_2d();
            LightSample ls = light->sample_incident(si.point(), u);
            if (vec3_is_zero(ls.li) || !is_valid_pdf(ls.pdf)) {
                continue;
            }
            color f = bsdf.evaluate(si.wo, ls.wi);
            double cos_i = vec3_abs_dot(ls.wi, n);
            if (vec3_is_zero(f) || cos_i <= 0.0) {
                continue;
            }
            VisibilityTester vis(si.offset_origin(ls.wi), ls.visibility.p1);
            if (!vis.unoccluded(scene)) {
                continue;
            }
            color contrib = vec3_scale(vec3_mul(f, ls.li), cos_i / ls.pdf);
            L = vec3_add(L, vec3_mul(item.weight, contrib));
        }

        if (item.depth + 1 >= settings_.max_depth) {
            continue;
        }

        // Specular reflection and transmission
        for (int i = 0; i < bsdf.lobe_count(); ++i) {
            if (!bsdf.lobe(i).is_specular()) {
                continue;
            }
            BxdfSample s = bsdf.sample_lobe(i, si.wo, Point2d{});
            if (!is_valid_pdf(s.pdf) || vec3_is_zero(s.f)) {
                continue;
            }
            color mult = vec3_scale(s.f, vec3_abs_dot(s.wi, n) / s.pdf);
            if (vec3_is_zero(mult) || !vec3_is_finite(mult)) {
                continue;
            }
            stack.push_back({si.spawn_ray(s.wi), item.depth + 1, vec3_mul(item.weight, mult)});
        }
    }

    return L;
}

} // namespace sunbeam
