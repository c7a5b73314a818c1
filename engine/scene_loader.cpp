/**
 * @file scene_loader.cpp
 * @brief JSON to SceneDescription
 */

#include "scene_loader.hpp"
#include "material.hpp"
#include "light.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace sunbeam {

namespace {

vec3 to_vec3(const json& v, const char* key) {
    if (!v.is_array() || v.size() != 3) {
        throw std::runtime_error(std::string("'") + key + "' must be an array of 3 numbers");
    }
    auto a = v.get<std::vector<double>>();
    return {a[0], a[1], a[2]};
}

vec3 read_vec3(const json& obj, const char* key, vec3 fallback) {
    if (!obj.contains(key)) {
        return fallback;
    }
    return to_vec3(obj.at(key), key);
}

/**
 * @brief Colour given as [r, g, b] or a single grey value
 */
color read_color(const json& obj, const char* key, color fallback) {
    if (!obj.contains(key)) {
        return fallback;
    }
    const json& v = obj.at(key);
    if (v.is_number()) {
        return vec3_splat(v.get<double>());
    }
    return to_vec3(v, key);
}

std::shared_ptr<const Material> parse_material(const std::string& name, const json& mat) {
    std::string type = mat.value("type", "matte");

    if (type == "matte" || type == "lambertian") {
        return std::make_shared<MatteMaterial>(
            ColorTexture::constant(read_color(mat, "color", {0.5, 0.5, 0.5})));
    }
    if (type == "mirror") {
        return std::make_shared<MirrorMaterial>(
            ColorTexture::constant(read_color(mat, "color", {0.9, 0.9, 0.9})));
    }
    if (type == "glass" || type == "dielectric") {
        return std::make_shared<GlassMaterial>(
            ColorTexture::constant(read_color(mat, "reflect", {1.0, 1.0, 1.0})),
            ColorTexture::constant(read_color(mat, "transmit", {1.0, 1.0, 1.0})),
            mat.value("ior", 1.5));
    }
    if (type == "metal") {
        std::string dist = mat.value("distribution", "ggx");
        MicrofacetType mt;
        if (dist == "ggx" || dist == "trowbridge_reitz") {
            mt = MicrofacetType::TrowbridgeReitz;
        } else if (dist == "beckmann") {
            mt = MicrofacetType::Beckmann;
        } else {
            throw std::runtime_error("material '" + name + "': unknown distribution '" + dist + "'");
        }
        return std::make_shared<MetalMaterial>(
            read_color(mat, "eta", {0.2, 0.92, 1.1}),
            read_color(mat, "k", {3.9, 2.45, 2.14}),
            mat.value("roughness", 0.1), mt);
    }
    if (type == "plastic") {
        return std::make_shared<PlasticMaterial>(
            ColorTexture::constant(read_color(mat, "diffuse", {0.25, 0.25, 0.25})),
            ColorTexture::constant(read_color(mat, "specular", {0.25, 0.25, 0.25})),
            mat.value("roughness", 0.1));
    }
    throw std::runtime_error("material '" + name + "': unknown type '" + type + "'");
}

void parse_render(const json& r, SceneDescription& data) {
    Renderer::Settings& s = data.render;
    s.width = r.value("width", s.width);
    s.height = r.value("height", s.height);
    s.samples_per_pixel = r.value("samples", s.samples_per_pixel);
    s.max_depth = r.value("max_depth", s.max_depth);
    s.tile_size = r.value("tile_size", s.tile_size);
    s.threads = r.value("threads", s.threads);
    s.exposure = r.value("exposure", s.exposure);
    s.background = read_color(r, "background", s.background);
    data.output_file = r.value("output", data.output_file);

    if (r.contains("tonemapper")) {
        s.tone_mapper = parse_tone_mapper(r.at("tonemapper").get<std::string>());
    }

    if (r.contains("sampler")) {
        std::string sampler = r.at("sampler").get<std::string>();
        if (sampler == "stratified") {
            s.sampler = SamplerType::Stratified;
        } else if (sampler == "random") {
            s.sampler = SamplerType::Random;
        } else {
            throw std::runtime_error("unknown sampler '" + sampler + "' (stratified, random)");
        }
    }

    if (r.contains("filter")) {
        const json& f = r.at("filter");
        if (f.is_string()) {
            s.filter = Filter::from_name(f.get<std::string>());
        } else {
            Filter base = Filter::from_name(f.value("type", "box"));
            double rx = f.value("radius", base.radius_x);
            double ry = f.value("radius", base.radius_y);
            rx = f.value("radius_x", rx);
            ry = f.value("radius_y", ry);
            if (base.type == FilterType::Gaussian) {
                s.filter = Filter::gaussian(rx, ry, f.value("alpha", base.alpha));
            } else {
                s.filter = Filter::make(base.type, rx, ry);
            }
        }
    }
}

void parse_camera(const json& cam, CameraSettings& c) {
    std::string type = cam.value("type", "perspective");
    if (type == "perspective") {
        c.type = CameraType::Perspective;
    } else if (type == "orthographic") {
        c.type = CameraType::Orthographic;
    } else {
        throw std::runtime_error("unknown camera type '" + type + "'");
    }
    c.position = read_vec3(cam, "position", c.position);
    c.target = read_vec3(cam, "target", c.target);
    c.up = read_vec3(cam, "up", c.up);
    c.fov = cam.value("fov", c.fov);
    c.screen_size = cam.value("screen_size", c.screen_size);
}

} // namespace

SceneDescription SceneLoader::parse(const json& j, const std::string& source) {
    SceneDescription data;
    try {
        if (!j.is_object()) {
            throw std::runtime_error("top level must be an object");
        }

        // Material name -> ID mapping
        std::unordered_map<std::string, int> material_ids;
        if (j.contains("materials")) {
            for (const auto& [name, mat] : j.at("materials").items()) {
                material_ids[name] = data.scene.add_material(parse_material(name, mat));
            }
        }

        auto get_material = [&](const json& obj) -> int {
            std::string name = obj.at("material").get<std::string>();
            auto it = material_ids.find(name);
            if (it == material_ids.end()) {
                throw std::runtime_error("unknown material '" + name + "'");
            }
            return it->second;
        };

        if (j.contains("spheres")) {
            for (const auto& obj : j.at("spheres")) {
                data.scene.add_sphere(read_vec3(obj, "center", {0.0, 0.0, 0.0}),
                                      obj.value("radius", 1.0), get_material(obj));
            }
        }

        if (j.contains("planes")) {
            for (const auto& obj : j.at("planes")) {
                data.scene.add_plane(read_vec3(obj, "point", {0.0, 0.0, 0.0}),
                                     read_vec3(obj, "normal", {0.0, 1.0, 0.0}),
                                     get_material(obj));
            }
        }

        if (j.contains("lights")) {
            for (const auto& light : j.at("lights")) {
                std::string type = light.value("type", "point");
                if (type != "point") {
                    throw std::runtime_error("unknown light type '" + type + "'");
                }
                color c = read_color(light, "color", {1.0, 1.0, 1.0});
                color intensity = vec3_mul(c, read_color(light, "intensity", {1.0, 1.0, 1.0}));
                data.scene.add_light(std::make_shared<PointLight>(
                    read_vec3(light, "position", {0.0, 5.0, 0.0}), intensity));
            }
        }

        if (j.contains("camera")) {
            parse_camera(j.at("camera"), data.camera);
        }
        if (j.contains("render")) {
            parse_render(j.at("render"), data);
        }
    } catch (const std::exception& e) {
        throw std::runtime_error(source + ": " + e.what());
    }
    return data;
}

SceneDescription SceneLoader::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("could not open scene file: " + filename);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error(filename + ": " + e.what());
    }

    SceneDescription data = parse(j, filename);
    std::cout << "Loaded scene: " << data.scene.spheres.size() << " spheres, "
              << data.scene.planes.size() << " planes, "
              << data.scene.materials.size() << " materials, "
              << data.scene.lights.size() << " point lights" << std::endl;
    return data;
}

} // namespace sunbeam
