/**
 * @file main.cpp
 * @brief Entry point for the ray tracer
 *
 * Renders a built-in scene or a JSON scene file.
 */

#include "renderer.hpp"
#include "scene_description.hpp"
#include "scene_loader.hpp"
#include "demo_scenes.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace sunbeam;

namespace {

/**
 * @brief Command-line values; anything set here overrides the scene's own settings
 */
struct Options {
    std::string scene = "spheres";
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> samples;
    std::optional<int> max_depth;
    std::optional<int> threads;
    std::optional<int> tile_size;
    std::optional<std::string> output;
    std::optional<std::string> filter;
    std::optional<std::string> sampler;
    std::optional<std::string> tone_mapper;
    std::optional<double> exposure;
    bool quiet = false;
    bool help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --scene <name|file.json>  Built-in scene (";
    bool first = true;
    for (const std::string& name : demo_scene_names()) {
        std::cout << (first ? "" : ", ") << name;
        first = false;
    }
    std::cout << ") or scene file, default spheres\n"
              << "  --width N                 Image width in pixels\n"
              << "  --height N                Image height in pixels\n"
              << "  --samples N               Samples per pixel\n"
              << "  --max-depth N             Specular recursion depth (1 = direct only)\n"
              << "  --output FILE             Output image (.png or .ppm)\n"
              << "  --threads N               Worker threads (0 = all cores)\n"
              << "  --tile-size N             Tile edge length in pixels\n"
              << "  --filter NAME             box, triangle or gaussian\n"
              << "  --sampler NAME            stratified or random\n"
              << "  --tonemapper NAME         none, reinhard or aces\n"
              << "  --exposure X              Exposure multiplier before tone mapping\n"
              << "  --quiet                   No progress output\n"
              << "  -h, --help                Show this message\n";
}

int parse_int(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    return v;
}

double parse_double(const std::string& flag, const std::string& value) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    return v;
}

Options parse_args(int argc, char* argv[]) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opt.help = true;
            continue;
        }
        if (arg == "--quiet") {
            opt.quiet = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("unknown or incomplete option '" + arg + "'");
        }
        std::string value = argv[++i];

        if (arg == "--scene") opt.scene = value;
        else if (arg == "--width") opt.width = parse_int(arg, value);
        else if (arg == "--height") opt.height = parse_int(arg, value);
        else if (arg == "--samples") opt.samples = parse_int(arg, value);
        else if (arg == "--max-depth") opt.max_depth = parse_int(arg, value);
        else if (arg == "--threads") opt.threads = parse_int(arg, value);
        else if (arg == "--tile-size") opt.tile_size = parse_int(arg, value);
        else if (arg == "--output") opt.output = value;
        else if (arg == "--filter") opt.filter = value;
        else if (arg == "--sampler") opt.sampler = value;
        else if (arg == "--tonemapper") opt.tone_mapper = value;
        else if (arg == "--exposure") opt.exposure = parse_double(arg, value);
        else throw std::invalid_argument("unknown option '" + arg + "'");
    }
    return opt;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void apply_overrides(const Options& opt, SceneDescription& data) {
    Renderer::Settings& s = data.render;
    if (opt.width) s.width = *opt.width;
    if (opt.height) s.height = *opt.height;
    if (opt.samples) s.samples_per_pixel = *opt.samples;
    if (opt.max_depth) s.max_depth = *opt.max_depth;
    if (opt.threads) s.threads = *opt.threads;
    if (opt.tile_size) s.tile_size = *opt.tile_size;
    if (opt.exposure) s.exposure = *opt.exposure;
    if (opt.output) data.output_file = *opt.output;
    if (opt.filter) s.filter = Filter::from_name(*opt.filter);
    if (opt.tone_mapper) s.tone_mapper = parse_tone_mapper(*opt.tone_mapper);
    if (opt.sampler) {
        if (*opt.sampler == "stratified") s.sampler = SamplerType::Stratified;
        else if (*opt.sampler == "random") s.sampler = SamplerType::Random;
        else throw std::invalid_argument("unknown sampler '" + *opt.sampler + "' (stratified, random)");
    }
    s.verbose = !opt.quiet;
}

int run(int argc, char* argv[]) {
    Options opt = parse_args(argc, argv);
    if (opt.help) {
        print_usage(argv[0]);
        return 0;
    }

    std::cout << "=== sunbeam ===" << std::endl;

    SceneDescription data = ends_with(opt.scene, ".json")
        ? SceneLoader::load(opt.scene)
        : build_demo_scene(opt.scene);
    apply_overrides(opt, data);

    Camera camera = data.make_camera();
    Renderer renderer(data.render);
    std::unique_ptr<Film> film = renderer.render(data.scene, camera);

    Image image = film->to_image();
    image.apply_tone_mapping(data.render.tone_mapper, data.render.exposure);

    bool success = ends_with(data.output_file, ".png")
        ? image.write_png(data.output_file)
        : image.write_ppm(data.output_file);

    if (!success) {
        std::cerr << "Error: Failed to save image to " << data.output_file << std::endl;
        return 1;
    }
    std::cout << "Image saved to: " << data.output_file << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
