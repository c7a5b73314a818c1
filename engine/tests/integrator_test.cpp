/**
 * @file integrator_test.cpp
 * @brief Tests for the Whitted integrator, lights and scene queries
 *
 * Verifies:
 * - Sphere and plane closest-hit and shadow queries
 * - Direct lighting from a point light matches the analytic value
 * - Occluders block shadow segments
 * - Failed scene queries count as misses or blocked segments
 * - Specular recursion stops at max_depth
 * - Glass splits radiance into its Fresnel reflection and transmission
 * - Invalid parameters are rejected
 */

#include "engine/integrator.hpp"
#include "engine/scene.hpp"
#include "engine/material.hpp"
#include "engine/light.hpp"
#include "engine/sampler.hpp"
#include "engine/sampling.hpp"
#include <iostream>
#include <cmath>
#include <cassert>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sunbeam;

constexpr double EPSILON = 1e-9;

bool approx_equal(double a, double b, double eps = EPSILON) {
    return std::abs(a - b) < eps;
}

/**
 * @brief Scene wrapper counting the queries made against it
 */
class CountingScene : public SceneQuery {
public:
    explicit CountingScene(const Scene& scene) : scene_(scene) {}

    std::optional<SurfaceInteraction> nearest_hit(const ray& r) const override {
        ++hit_queries;
        return scene_.nearest_hit(r);
    }

    bool occluded(const ray& r, double max_distance) const override {
        ++shadow_queries;
        return scene_.occluded(r, max_distance);
    }

    mutable int hit_queries = 0;
    mutable int shadow_queries = 0;

private:
    const Scene& scene_;
};

/**
 * @brief Scene wrapper whose queries report malformed geometry on request
 */
class FailingScene : public SceneQuery {
public:
    FailingScene(const Scene& scene, bool fail_hits, bool fail_shadows)
        : scene_(scene), fail_hits_(fail_hits), fail_shadows_(fail_shadows) {}

    std::optional<SurfaceInteraction> nearest_hit(const ray& r) const override {
        if (fail_hits_) {
            throw std::runtime_error("malformed geometry");
        }
        return scene_.nearest_hit(r);
    }

    bool occluded(const ray& r, double max_distance) const override {
        if (fail_shadows_) {
            throw std::runtime_error("malformed geometry");
        }
        return scene_.occluded(r, max_distance);
    }

private:
    const Scene& scene_;
    bool fail_hits_;
    bool fail_shadows_;
};

/**
 * @brief Material whose BSDF construction always fails
 */
class BrokenMaterial : public Material {
public:
    Bsdf compute_bsdf(const SurfaceInteraction&) const override {
        throw std::runtime_error("bsdf construction failed");
    }
    const char* name() const override { return "broken"; }
};

Sampler test_sampler() {
    Sampler s = Sampler::random(1, 4, 0);
    s.start_pixel({0, 0});
    return s;
}

std::shared_ptr<const Material> matte(double albedo) {
    return std::make_shared<MatteMaterial>(ColorTexture::constant(vec3_splat(albedo)));
}

void test_shape_queries() {
    std::cout << "Testing sphere and plane queries...\n";

    Sphere sphere({0.0, 0.0, 0.0}, 1.0, 0);
    ray r = ray_create({0.0, 0.0, -5.0}, {0.0, 0.0, 1.0});

    hit_record rec = hit_record_init();
    assert(sphere.hit(r, 0.0, 100.0, rec));
    assert(approx_equal(rec.t, 4.0));
    assert(rec.front_face);
    assert(approx_equal(rec.normal.z, -1.0));
    assert(approx_equal(vec3_dot(rec.tangent, rec.normal), 0.0));

    // Shadow queries exclude the end of the segment
    assert(!sphere.intersects(r, 0.0, 4.0));
    assert(sphere.intersects(r, 0.0, 4.5));
    assert(sphere.intersects(r, 4.5, 100.0));  // Far side
    assert(!sphere.intersects(r, 6.0, 100.0));

    // From inside, the normal stays outward
    ray inside = ray_create({0.0, 0.0, 0.0}, {1.0, 0.0, 0.0});
    assert(sphere.hit(inside, 1e-9, 100.0, rec));
    assert(!rec.front_face);
    assert(approx_equal(rec.normal.x, 1.0));

    Plane plane({0.0, -1.0, 0.0}, {0.0, 2.0, 0.0}, 0);
    assert(approx_equal(plane.normal.y, 1.0));
    ray down = ray_create({3.0, 1.0, 2.0}, {0.0, -1.0, 0.0});
    assert(plane.hit(down, 0.0, 100.0, rec));
    assert(approx_equal(rec.t, 2.0));
    assert(approx_equal(rec.u * rec.u + rec.v * rec.v, 13.0));
    assert(!plane.intersects(down, 0.0, 2.0));
    assert(plane.intersects(down, 0.0, 2.5));
    assert(!plane.hit(ray_create({0.0, 1.0, 0.0}, {1.0, 0.0, 0.0}), 0.0, 100.0, rec));

    std::cout << "  PASSED\n";
}

void test_point_light_direct() {
    std::cout << "Testing direct lighting from a point light...\n";

    Scene scene;
    int ground = scene.add_material(matte(0.5));
    scene.add_plane({0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, ground);
    scene.add_light(std::make_shared<PointLight>(point3{1.0, 2.0, 0.0}, vec3_splat(10.0)));

    WhittedIntegrator integrator({5, {0.0, 0.0, 0.0}});
    Sampler sampler = test_sampler();

    ray r = ray_create({0.0, 1.0, 0.0}, {0.0, -1.0, 0.0});
    color L = integrator.incoming_radiance(r, scene, scene.lights, sampler);

    // rho / pi * I / d^2 * cos(theta)
    double d2 = 5.0;
    double cos_theta = 2.0 / std::sqrt(5.0);
    double expected = 0.5 * INV_PI * 10.0 / d2 * cos_theta;
    assert(approx_equal(L.x, expected));
    assert(approx_equal(L.y, expected));
    assert(approx_equal(L.z, expected));

    // Light below the surface contributes nothing
    Scene under;
    under.add_plane({0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, under.add_material(matte(0.5)));
    under.add_light(std::make_shared<PointLight>(point3{1.0, -2.0, 0.0}, vec3_splat(10.0)));
    color dark = integrator.incoming_radiance(r, under, under.lights, sampler);
    assert(vec3_is_zero(dark));

    std::cout << "  PASSED\n";
}

void test_shadowing() {
    std::cout << "Testing shadow rays...\n";

    Scene scene;
    int ground = scene.add_material(matte(0.5));
    scene.add_plane({0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, ground);
    scene.add_light(std::make_shared<PointLight>(point3{1.0, 2.0, 0.0}, vec3_splat(10.0)));

    VisibilityTester segment({0.0, 0.0, 0.0}, {1.0, 2.0, 0.0});
    assert(segment.unoccluded(scene));

    // Sphere on the segment between the hit point and the light
    scene.add_sphere({0.5, 1.0, 0.0}, 0.2, ground);
    assert(!segment.unoccluded(scene));

    WhittedIntegrator integrator({5, {0.0, 0.0, 0.0}});
    Sampler sampler = test_sampler();
    CountingScene counting(scene);

    ray r = ray_create({0.0, 1.0, 0.0}, {0.0, -1.0, 0.0});
    color L = integrator.incoming_radiance(r, counting, scene.lights, sampler);
    assert(vec3_is_zero(L));
    assert(counting.hit_queries == 1);
    assert(counting.shadow_queries == 1);

    std::cout << "  PASSED\n";
}

void test_background() {
    std::cout << "Testing background on a miss...\n";

    Scene scene;
    scene.add_plane({0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, scene.add_material(matte(0.5)));

    color bg = {0.2, 0.4, 0.6};
    WhittedIntegrator integrator({3, bg});
    Sampler sampler = test_sampler();

    color L = integrator.incoming_radiance(ray_create({0.0, 1.0, 0.0}, {0.0, 1.0, 0.0}),
                                           scene, scene.lights, sampler);
    assert(approx_equal(L.x, bg.x));
    assert(approx_equal(L.y, bg.y));
    assert(approx_equal(L.z, bg.z));

    std::cout << "  PASSED\n";
}

void test_failed_queries() {
    std::cout << "Testing scene queries that fail...\n";

    Scene scene;
    scene.add_plane({0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, scene.add_material(matte(0.5)));
    scene.add_light(std::make_shared<PointLight>(point3{1.0, 2.0, 0.0}, vec3_splat(10.0)));

    color bg = {0.2, 0.4, 0.6};
    WhittedIntegrator integrator({3, bg});
    Sampler sampler = test_sampler();
    ray r = ray_create({0.0, 1.0, 0.0}, {0.0, -1.0, 0.0});

    // Failed nearest hit: the ray sees the background
    FailingScene no_hits(scene, true, false);
    color miss = integrator.incoming_radiance(r, no_hits, scene.lights, sampler);
    assert(approx_equal(miss.x, bg.x));
    assert(approx_equal(miss.y, bg.y));
    assert(approx_equal(miss.z, bg.z));

    // Failed shadow query: the light is treated as blocked
    FailingScene no_shadows(scene, false, true);
    VisibilityTester segment({0.0, 0.0, 0.0}, {1.0, 2.0, 0.0});
    assert(segment.unoccluded(scene));
    assert(!segment.unoccluded(no_shadows));
    color dark = integrator.incoming_radiance(r, no_shadows, scene.lights, sampler);
    assert(vec3_is_zero(dark));

    // Material failures are not query failures
    Scene broken;
    broken.add_plane({0.0, 0.0, 0.0}, {0.0, 1.0, 0.0},
                     broken.add_material(std::make_shared<BrokenMaterial>()));
    bool threw = false;
    try {
        integrator.incoming_radiance(r, broken, broken.lights, sampler);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "bsdf construction failed";
    }
    assert(threw);

    std::cout << "  PASSED\n";
}

void test_mirror_cavity_depth() {
    std::cout << "Testing recursion bound inside a mirror sphere...\n";

    Scene scene;
    int mirror = scene.add_material(
        std::make_shared<MirrorMaterial>(ColorTexture::constant({1.0, 1.0, 1.0})));
    scene.add_sphere({0.0, 0.0, 0.0}, 1.0, mirror);
    scene.add_light(std::make_shared<PointLight>(point3{0.0, 0.5, 0.0}, vec3_splat(1.0)));

    ray r = ray_create({0.0, 0.0, 0.0}, vec3_normalize({0.3, 0.2, 1.0}));

    for (int max_depth : {1, 2, 5}) {
        WhittedIntegrator integrator({max_depth, {1.0, 1.0, 1.0}});
        Sampler sampler = test_sampler();
        CountingScene counting(scene);

        color L = integrator.incoming_radiance(r, counting, scene.lights, sampler);
        assert(counting.hit_queries == max_depth);
        assert(vec3_is_finite(L));

        // A pure mirror has no non-specular lobe to light, and no ray escapes
        assert(vec3_is_zero(L));
        assert(counting.shadow_queries == 0);
    }

    // Starting deeper in the tree leaves fewer bounces
    WhittedIntegrator integrator({5, {0.0, 0.0, 0.0}});
    Sampler sampler = test_sampler();
    CountingScene counting(scene);
    integrator.incoming_radiance(r, counting, scene.lights, sampler, 3);
    assert(counting.hit_queries == 2);

    std::cout << "  PASSED\n";
}

void test_glass_split() {
    std::cout << "Testing glass reflection and transmission...\n";

    Scene scene;
    int glass = scene.add_material(std::make_shared<GlassMaterial>(
        ColorTexture::constant({1.0, 1.0, 1.0}), ColorTexture::constant({1.0, 1.0, 1.0}), 1.5));
    scene.add_sphere({0.0, 0.0, 0.0}, 1.0, glass);

    std::vector<std::shared_ptr<const Light>> no_lights;
    WhittedIntegrator integrator({3, {1.0, 1.0, 1.0}});
    Sampler sampler = test_sampler();

    // Head-on: reflect 4% back out, or pass through both surfaces
    ray r = ray_create({0.0, 0.0, 5.0}, {0.0, 0.0, -1.0});
    color L = integrator.incoming_radiance(r, scene, no_lights, sampler);

    double F = 0.04;
    double expected = F + (1.0 - F) * (1.0 - F);
    assert(approx_equal(L.x, expected));
    assert(L.x <= 1.0);

    // Direct only: the camera ray sees no diffuse surface
    WhittedIntegrator direct({1, {1.0, 1.0, 1.0}});
    assert(vec3_is_zero(direct.incoming_radiance(r, scene, no_lights, sampler)));

    std::cout << "  PASSED\n";
}

void test_metal_reflection() {
    std::cout << "Testing smooth metal reflection...\n";

    Scene scene;
    int metal = scene.add_material(std::make_shared<MetalMaterial>(
        color{0.2, 0.92, 1.1}, color{3.9, 2.45, 2.14}, 0.0));
    scene.add_plane({0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, metal);

    WhittedIntegrator integrator({2, {1.0, 1.0, 1.0}});
    Sampler sampler = test_sampler();
    std::vector<std::shared_ptr<const Light>> no_lights;

    color L = integrator.incoming_radiance(ray_create({0.0, 1.0, 0.0}, {0.0, -1.0, 0.0}),
                                           scene, no_lights, sampler);
    color F = fresnel_conductor(1.0, vec3_splat(1.0), {0.2, 0.92, 1.1}, {3.9, 2.45, 2.14});
    assert(approx_equal(L.x, F.x));
    assert(approx_equal(L.y, F.y));
    assert(approx_equal(L.z, F.z));

    std::cout << "  PASSED\n";
}

void test_invalid_arguments() {
    std::cout << "Testing invalid arguments...\n";

    int failures = 0;
    try { WhittedIntegrator bad({0, {0.0, 0.0, 0.0}}); } catch (const std::invalid_argument&) { ++failures; }
    try { WhittedIntegrator bad({-2, {0.0, 0.0, 0.0}}); } catch (const std::invalid_argument&) { ++failures; }

    Scene scene;
    WhittedIntegrator integrator({2, {0.0, 0.0, 0.0}});
    Sampler sampler = test_sampler();
    try {
        integrator.incoming_radiance(ray_create({0.0, 0.0, 0.0}, {0.0, 0.0, 1.0}),
                                     scene, scene.lights, sampler, -1);
    } catch (const std::invalid_argument&) {
        ++failures;
    }

    try { PointLight bad({0.0, std::nan(""), 0.0}, {1.0, 1.0, 1.0}); } catch (const std::invalid_argument&) { ++failures; }
    try { scene.add_sphere({0.0, 0.0, 0.0}, 1.0, 0); } catch (const std::invalid_argument&) { ++failures; }
    int m = scene.add_material(matte(0.5));
    try { scene.add_sphere({0.0, 0.0, 0.0}, -1.0, m); } catch (const std::invalid_argument&) { ++failures; }
    try { scene.add_plane({0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, m); } catch (const std::invalid_argument&) { ++failures; }
    try { scene.add_material(nullptr); } catch (const std::invalid_argument&) { ++failures; }
    assert(failures == 8);

    // Empty scene: every ray misses
    assert(!scene.nearest_hit(ray_create({0.0, 0.0, 0.0}, {0.0, 0.0, 1.0})));
    assert(scene.shape_count() == 0);

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Integrator Tests ===\n\n";

    test_shape_queries();
    test_point_light_direct();
    test_shadowing();
    test_background();
    test_failed_queries();
    test_mirror_cavity_depth();
    test_glass_split();
    test_metal_reflection();
    test_invalid_arguments();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
