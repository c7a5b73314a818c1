/**
 * @file renderer.hpp
 * @brief Tiled, parallel Whitted renderer
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
}

#include "camera.hpp"
#include "film.hpp"
#include "filter.hpp"
#include "geometry.hpp"
#include "image.hpp"
#include "light.hpp"
#include "sampler.hpp"
#include "scene.hpp"
#include "scene_query.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

namespace sunbeam {

/**
 * @brief Unit of parallel work: a rectangle of sample positions
 */
struct Tile {
    Bounds2i bounds;
    int tile_x = 0;
    int tile_y = 0;
    int index = 0;    // Row-major tile index, used as the sampler seed
};

/**
 * @brief Split bounds into row-major tiles of tile_size x tile_size
 *
 * Tiles cover bounds with no gaps or overlaps; the last row and column are
 * clipped to the bounds.
 *
 * @throws std::invalid_argument if tile_size <= 0
 */
std::vector<Tile> make_tiles(const Bounds2i& bounds, int tile_size);

/**
 * @brief Radiance along a camera ray; may draw further samples
 */
using TraceFunction = std::function<color(const ray&, Sampler&)>;

/**
 * @brief Render one tile into a private buffer and merge it into film
 *
 * Every pixel of the tile runs the sampler (cloned with tile.index) to
 * exhaustion. Non-finite radiance is not splatted.
 *
 * @return Number of samples dropped for non-finite radiance
 */
int64_t render_tile(const Tile& tile, const Camera& camera, const Sampler& base_sampler,
                    Film& film, const TraceFunction& trace);

/**
 * @brief Thrown by Renderer::render when request_abort() stopped the render
 */
class RenderAborted : public std::runtime_error {
public:
    RenderAborted() : std::runtime_error("render aborted") {}
};

/**
 * @brief Whitted-style ray tracer renderer
 */
class Renderer {
public:
    /**
     * @brief Render settings
     */
    struct Settings {
        int width = 800;
        int height = 600;
        int samples_per_pixel = 16;
        SamplerType sampler = SamplerType::Stratified;
        int max_depth = 5;           // Specular recursion bound (1 = direct only)
        int tile_size = 16;
        int threads = 0;             // 0 = OpenMP default
        Filter filter = Filter::box();
        color background = {0.0, 0.0, 0.0};
        ToneMapper tone_mapper = ToneMapper::ACES;
        double exposure = 1.0;       // Multiplier before tone mapping
        bool verbose = true;
    };

    Renderer() = default;
    explicit Renderer(const Settings& settings) : settings_(settings) {}

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    /**
     * @brief Render through a scene query and an explicit light list
     *
     * @throws std::invalid_argument on bad settings or a camera whose
     *         resolution differs from the settings
     * @throws RenderAborted if request_abort() was called during the render
     * @throws The first exception raised by any tile; the film is discarded
     */
    std::unique_ptr<Film> render(const SceneQuery& scene,
                                 const std::vector<std::shared_ptr<const Light>>& lights,
                                 const Camera& camera);

    /**
     * @brief Render a scene with its own lights
     */
    std::unique_ptr<Film> render(const Scene& scene, const Camera& camera);

    /**
     * @brief Ask a running render to stop before its next tile
     */
    void request_abort() { abort_.store(true); }
    bool abort_requested() const { return abort_.load(); }

    /**
     * @brief Samples dropped for non-finite radiance in the last render
     */
    int64_t dropped_samples() const { return dropped_.load(); }

    Settings& settings() { return settings_; }
    const Settings& settings() const { return settings_; }

private:
    void validate() const;

    Settings settings_;
    std::atomic<bool> abort_{false};
    std::atomic<int64_t> dropped_{0};
};

} // namespace sunbeam
