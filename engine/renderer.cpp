/**
 * @file renderer.cpp
 * @brief Tile partitioning and the parallel render loop
 */

#include "renderer.hpp"
#include "integrator.hpp"
#include "profiler.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace sunbeam {

std::vector<Tile> make_tiles(const Bounds2i& bounds, int tile_size) {
    if (tile_size <= 0) {
        throw std::invalid_argument("tile size must be positive");
    }
    std::vector<Tile> tiles;
    if (bounds.empty()) {
        return tiles;
    }

    int tiles_x = (bounds.width() + tile_size - 1) / tile_size;
    int tiles_y = (bounds.height() + tile_size - 1) / tile_size;
    tiles.reserve(static_cast<size_t>(tiles_x) * tiles_y);

    for (int ty = 0; ty < tiles_y; ++ty) {
        for (int tx = 0; tx < tiles_x; ++tx) {
            Tile tile;
            tile.bounds.min = {bounds.min.x + tx * tile_size, bounds.min.y + ty * tile_size};
            tile.bounds.max = {std::min(tile.bounds.min.x + tile_size, bounds.max.x),
                               std::min(tile.bounds.min.y + tile_size, bounds.max.y)};
            tile.tile_x = tx;
            tile.tile_y = ty;
            tile.index = ty * tiles_x + tx;
            tiles.push_back(tile);
        }
    }
    return tiles;
}

int64_t render_tile(const Tile& tile, const Camera& camera, const Sampler& base_sampler,
                    Film& film, const TraceFunction& trace) {
    Sampler sampler = base_sampler.clone_with_seed(static_cast<uint64_t>(tile.index));
    FilmTile film_tile = film.get_tile(tile.bounds);
    int64_t dropped = 0;

    {
        ProfileScope scope("Tile Rendering");
        for (int y = tile.bounds.min.y; y < tile.bounds.max.y; ++y) {
            for (int x = tile.bounds.min.x; x < tile.bounds.max.x; ++x) {
                Point2i pixel = {x, y};
                sampler.start_pixel(pixel);
                do {
                    CameraSample cs = sampler.get_camera_sample(pixel);
                    ray r = camera.generate_ray_differential(cs);
                    color L = trace(r, sampler);
                    if (!vec3_is_finite(L)) {
                        ++dropped;
                        continue;
                    }
                    film_tile.add_sample(cs.film_point, L);
                } while (sampler.start_next_sample());
            }
        }
    }

    {
        ProfileScope scope("Film Merge");
        film.merge_film_tile(std::move(film_tile));
    }
    return dropped;
}

void Renderer::validate() const {
    if (settings_.width <= 0 || settings_.height <= 0) {
        throw std::invalid_argument("render: resolution must be positive");
    }
    if (settings_.samples_per_pixel <= 0) {
        throw std::invalid_argument("render: samples per pixel must be positive");
    }
    if (settings_.max_depth <= 0) {
        throw std::invalid_argument("render: max depth must be positive");
    }
    if (settings_.tile_size <= 0) {
        throw std::invalid_argument("render: tile size must be positive");
    }
    if (settings_.threads < 0) {
        throw std::invalid_argument("render: thread count must not be negative");
    }
    if (!std::isfinite(settings_.exposure) || settings_.exposure < 0.0) {
        throw std::invalid_argument("render: exposure must be finite and non-negative");
    }
}

std::unique_ptr<Film> Renderer::render(const Scene& scene, const Camera& camera) {
    return render(scene, scene.lights, camera);
}

std::unique_ptr<Film> Renderer::render(const SceneQuery& scene,
                                       const std::vector<std::shared_ptr<const Light>>& lights,
                                       const Camera& camera) {
    validate();
    if (camera.width() != settings_.width || camera.height() != settings_.height) {
        throw std::invalid_argument("render: camera resolution does not match settings");
    }

    WhittedIntegrator::Settings integrator_settings;
    integrator_settings.max_depth = settings_.max_depth;
    integrator_settings.background = settings_.background;
    const WhittedIntegrator integrator(integrator_settings);

    auto film = std::make_unique<Film>(settings_.width, settings_.height,
                                       settings_.filter, settings_.background);

    // Film offset and lens, then one 2D sample per light
    int dimensions = 2 + static_cast<int>(lights.size());
    const Sampler base_sampler = Sampler::make(settings_.sampler, settings_.samples_per_pixel,
                                               dimensions);

    const std::vector<Tile> tiles = make_tiles(film->sample_bounds(), settings_.tile_size);
    const int tile_count = static_cast<int>(tiles.size());

    TraceFunction trace = [&](const ray& r, Sampler& sampler) {
        return integrator.incoming_radiance(r, scene, lights, sampler);
    };

    int threads = 1;
#ifdef _OPENMP
    threads = settings_.threads > 0 ? settings_.threads : omp_get_max_threads();
#endif

    abort_.store(false);
    dropped_.store(0);
    Profiler::instance().reset();
    Timer total_timer;

    if (settings_.verbose) {
        std::cout << "Rendering " << settings_.width << "x" << settings_.height
                  << " image (Whitted, " << settings_.samples_per_pixel << " spp, max depth "
                  << settings_.max_depth << ", " << tile_count << " tiles) using "
                  << threads << " thread" << (threads == 1 ? "" : "s") << "..." << std::endl;
    }

    std::exception_ptr failure;
    std::atomic<int> completed_tiles{0};

    #pragma omp parallel for schedule(dynamic, 1) num_threads(threads)
    for (int i = 0; i < tile_count; ++i) {
        if (abort_.load()) {
            continue;
        }
        try {
            int64_t dropped = render_tile(tiles[i], camera, base_sampler, *film, trace);
            dropped_.fetch_add(dropped);
        } catch (...) {
            #pragma omp critical(sunbeam_render_failure)
            {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
            abort_.store(true);
            continue;
        }

        // Thread-safe progress update
        int done = ++completed_tiles;
        if (settings_.verbose && (done % 16 == 0 || done == tile_count)) {
            #pragma omp critical(sunbeam_progress)
            {
                std::cout << "\rProgress: " << (100 * done / tile_count) << "% ("
                          << done << "/" << tile_count << " tiles)" << std::flush;
            }
        }
    }

    if (failure) {
        if (settings_.verbose) {
            std::cerr << "\nRender failed; discarding film." << std::endl;
        }
        std::rethrow_exception(failure);
    }
    if (abort_.load()) {
        if (settings_.verbose) {
            std::cerr << "\nRender aborted after " << completed_tiles.load() << "/"
                      << tile_count << " tiles." << std::endl;
        }
        throw RenderAborted();
    }

    Profiler::instance().record("Total Render", Profiler::Duration(total_timer.elapsed_ms()));

    if (settings_.verbose) {
        std::cout << " Done!" << std::endl;
        if (dropped_.load() > 0) {
            std::cerr << "Warning: dropped " << dropped_.load()
                      << " samples with non-finite radiance" << std::endl;
        }
        Profiler::instance().report();
    }

    return film;
}

} // namespace sunbeam
