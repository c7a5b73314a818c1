/**
 * @file demo_scenes.cpp
 * @brief Built-in scenes
 */

#include "demo_scenes.hpp"
#include "material.hpp"
#include "light.hpp"
#include <memory>
#include <stdexcept>

namespace sunbeam {

// Gold, per RGB channel
static constexpr color GOLD_ETA = {0.143, 0.374, 1.442};
static constexpr color GOLD_K = {3.983, 2.385, 1.603};

static void spheres_scene(SceneDescription& d) {
    Scene& scene = d.scene;

    int ground = scene.add_material(std::make_shared<MatteMaterial>(
        ColorTexture::constant({0.6, 0.6, 0.6})));
    int matte = scene.add_material(std::make_shared<MatteMaterial>(
        ColorTexture::constant({0.1, 0.2, 0.5})));
    int mirror = scene.add_material(std::make_shared<MirrorMaterial>(
        ColorTexture::constant({0.9, 0.9, 0.9})));
    int glass = scene.add_material(std::make_shared<GlassMaterial>(
        ColorTexture::constant({1.0, 1.0, 1.0}), ColorTexture::constant({1.0, 1.0, 1.0}), 1.5));
    int plastic = scene.add_material(std::make_shared<PlasticMaterial>(
        ColorTexture::constant({0.6, 0.1, 0.1}), ColorTexture::constant({0.4, 0.4, 0.4}), 0.1));
    int metal = scene.add_material(std::make_shared<MetalMaterial>(GOLD_ETA, GOLD_K, 0.2));

    scene.add_plane({0.0, -0.5, 0.0}, {0.0, 1.0, 0.0}, ground);
    scene.add_sphere({0.0, 0.0, -1.0}, 0.5, matte);
    scene.add_sphere({-1.1, 0.0, -1.0}, 0.5, glass);
    scene.add_sphere({1.1, 0.0, -1.0}, 0.5, mirror);
    scene.add_sphere({-0.55, -0.25, 0.0}, 0.25, plastic);
    scene.add_sphere({0.55, -0.25, 0.0}, 0.25, metal);

    scene.add_light(std::make_shared<PointLight>(point3{-2.0, 3.0, 1.0}, color{6.0, 6.0, 6.0}));
    scene.add_light(std::make_shared<PointLight>(point3{2.0, 2.0, 2.0}, color{3.0, 3.0, 3.0}));

    d.camera.position = {0.0, 1.0, 3.0};
    d.camera.target = {0.0, 0.0, -1.0};
    d.camera.fov = 45.0;
    d.render.background = {0.05, 0.05, 0.08};
}

static void mirrors_scene(SceneDescription& d) {
    Scene& scene = d.scene;

    int ground = scene.add_material(std::make_shared<MatteMaterial>(
        ColorTexture::constant({0.5, 0.5, 0.5})));
    int ball = scene.add_material(std::make_shared<MatteMaterial>(
        ColorTexture::constant({0.8, 0.3, 0.1})));
    int mirror = scene.add_material(std::make_shared<MirrorMaterial>(
        ColorTexture::constant({0.85, 0.85, 0.9})));

    scene.add_plane({0.0, -1.0, 0.0}, {0.0, 1.0, 0.0}, ground);
    scene.add_plane({-2.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, mirror);
    scene.add_plane({2.0, 0.0, 0.0}, {-1.0, 0.0, 0.0}, mirror);
    scene.add_sphere({0.0, -0.4, -1.0}, 0.6, ball);
    scene.add_sphere({0.9, -0.7, 0.2}, 0.3, mirror);

    scene.add_light(std::make_shared<PointLight>(point3{0.0, 2.5, 1.0}, color{8.0, 8.0, 8.0}));

    d.camera.position = {0.0, 0.5, 4.0};
    d.camera.target = {0.0, -0.3, -1.0};
    d.camera.fov = 50.0;
    d.render.max_depth = 8;
}

static void cornell_scene(SceneDescription& d) {
    Scene& scene = d.scene;

    int white = scene.add_material(std::make_shared<MatteMaterial>(
        ColorTexture::constant({0.73, 0.73, 0.73})));
    int red = scene.add_material(std::make_shared<MatteMaterial>(
        ColorTexture::constant({0.65, 0.05, 0.05})));
    int green = scene.add_material(std::make_shared<MatteMaterial>(
        ColorTexture::constant({0.12, 0.45, 0.15})));
    int glass = scene.add_material(std::make_shared<GlassMaterial>(
        ColorTexture::constant({1.0, 1.0, 1.0}), ColorTexture::constant({1.0, 1.0, 1.0}), 1.5));
    int metal = scene.add_material(std::make_shared<MetalMaterial>(
        color{0.2, 0.92, 1.1}, color{3.9, 2.45, 2.14}, 0.0));

    // Box of side 2 centred on the origin, open toward the camera
    scene.add_plane({0.0, -1.0, 0.0}, {0.0, 1.0, 0.0}, white);
    scene.add_plane({0.0, 1.0, 0.0}, {0.0, -1.0, 0.0}, white);
    scene.add_plane({0.0, 0.0, -1.0}, {0.0, 0.0, 1.0}, white);
    scene.add_plane({-1.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, red);
    scene.add_plane({1.0, 0.0, 0.0}, {-1.0, 0.0, 0.0}, green);

    scene.add_sphere({-0.4, -0.6, -0.3}, 0.4, metal);
    scene.add_sphere({0.45, -0.65, 0.2}, 0.35, glass);

    scene.add_light(std::make_shared<PointLight>(point3{0.0, 0.9, 0.0}, color{2.0, 1.9, 1.7}));

    d.camera.position = {0.0, 0.0, 3.4};
    d.camera.target = {0.0, 0.0, 0.0};
    d.camera.fov = 40.0;
    d.render.width = 600;
    d.render.height = 600;
    d.render.max_depth = 6;
}

std::vector<std::string> demo_scene_names() {
    return {"spheres", "mirrors", "cornell"};
}

SceneDescription build_demo_scene(const std::string& name) {
    SceneDescription d;
    if (name == "spheres") {
        spheres_scene(d);
    } else if (name == "mirrors") {
        mirrors_scene(d);
    } else if (name == "cornell") {
        cornell_scene(d);
    } else {
        throw std::invalid_argument("unknown scene '" + name + "'");
    }
    d.output_file = name + ".png";
    return d;
}

} // namespace sunbeam
