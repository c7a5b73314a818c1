/**
 * @file film.hpp
 * @brief Weighted radiance accumulation and tile-local film buffers
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "geometry.hpp"
#include "filter.hpp"
#include "image.hpp"
#include <mutex>
#include <vector>

namespace sunbeam {

/**
 * @brief Accumulated filter-weighted radiance for one pixel
 */
struct FilmPixel {
    color contribution_sum = {0.0, 0.0, 0.0};
    double filter_weight_sum = 0.0;
};

/**
 * @brief Private accumulation buffer for one render tile
 *
 * Covers the tile's pixels plus the neighbours its samples reach through
 * the filter. Owned by a single worker until merged into the Film.
 */
class FilmTile {
public:
    FilmTile(const Bounds2i& pixel_bounds, const Filter& filter);

    /**
     * @brief Splat radiance L at raster position p onto every pixel in filter range
     */
    void add_sample(Point2d p, color L, double sample_weight = 1.0);

    const Bounds2i& pixel_bounds() const { return pixel_bounds_; }

    const FilmPixel& pixel(Point2i p) const;

private:
    FilmPixel& pixel_ref(Point2i p);

    Bounds2i pixel_bounds_;
    Filter filter_;
    std::vector<FilmPixel> pixels_;
};

/**
 * @brief The image being rendered
 *
 * Mutated only by add_sample() and merge_film_tile(); both are thread-safe.
 * Not copyable.
 */
class Film {
public:
    /**
     * @throws std::invalid_argument on a non-positive resolution
     */
    Film(int width, int height, const Filter& filter, color background = {0.0, 0.0, 0.0});

    Film(const Film&) = delete;
    Film& operator=(const Film&) = delete;

    int width() const { return width_; }
    int height() const { return height_; }
    const Filter& filter() const { return filter_; }

    Bounds2i pixel_bounds() const { return {{0, 0}, {width_, height_}}; }

    /**
     * @brief Raster region whose samples can reach a film pixel
     *
     * The pixel bounds grown by the filter radius, so that edge pixels
     * receive as many samples as interior ones.
     */
    Bounds2i sample_bounds() const;

    /**
     * @brief Tile buffer for samples taken inside sample_bounds
     */
    FilmTile get_tile(const Bounds2i& sample_bounds) const;

    /**
     * @brief Fold a finished tile into the film
     *
     * Only the rows of the tile's footprint are locked, one at a time, so
     * merges of tiles that do not share rows run concurrently.
     */
    void merge_film_tile(FilmTile&& tile);

    /**
     * @brief Splat a single sample directly (per-row locking)
     */
    void add_sample(Point2d p, color L);

    /**
     * @brief Reconstructed value: weighted mean, or the background if nothing landed
     */
    color get_pixel(int x, int y) const;

    double get_weight(int x, int y) const;

    /**
     * @brief Reconstructed radiance for every pixel, row 0 at the top
     */
    Image to_image() const;

private:
    int index(int x, int y) const { return y * width_ + x; }

    int width_;
    int height_;
    Filter filter_;
    color background_;
    std::vector<FilmPixel> pixels_;

    mutable std::vector<std::mutex> row_mutexes_;
};

} // namespace sunbeam
