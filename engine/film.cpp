/**
 * @file film.cpp
 * @brief Filter splatting and tile merging
 */

#include "film.hpp"
#include <cmath>
#include <stdexcept>

namespace sunbeam {

// Discrete pixels whose centres lie within the filter support of p
static Bounds2i filter_footprint(Point2d p, const Filter& filter) {
    double px = p.x - 0.5;
    double py = p.y - 0.5;
    Point2i lo = {static_cast<int>(std::ceil(px - filter.radius_x)),
                  static_cast<int>(std::ceil(py - filter.radius_y))};
    Point2i hi = {static_cast<int>(std::floor(px + filter.radius_x)) + 1,
                  static_cast<int>(std::floor(py + filter.radius_y)) + 1};
    return {lo, hi};
}

// ==================== FilmTile ====================

FilmTile::FilmTile(const Bounds2i& pixel_bounds, const Filter& filter)
    : pixel_bounds_(pixel_bounds), filter_(filter),
      pixels_(static_cast<size_t>(std::max<int64_t>(0, pixel_bounds.area()))) {}

FilmPixel& FilmTile::pixel_ref(Point2i p) {
    int w = pixel_bounds_.width();
    return pixels_[(p.y - pixel_bounds_.min.y) * w + (p.x - pixel_bounds_.min.x)];
}

const FilmPixel& FilmTile::pixel(Point2i p) const {
    int w = pixel_bounds_.width();
    return pixels_[(p.y - pixel_bounds_.min.y) * w + (p.x - pixel_bounds_.min.x)];
}

void FilmTile::add_sample(Point2d p, color L, double sample_weight) {
    Bounds2i range = filter_footprint(p, filter_).intersect(pixel_bounds_);
    if (range.empty()) {
        return;
    }
    for (int y = range.min.y; y < range.max.y; ++y) {
        for (int x = range.min.x; x < range.max.x; ++x) {
            double w = filter_.evaluate(x + 0.5 - p.x, y + 0.5 - p.y);
            if (w == 0.0) {
                continue;
            }
            FilmPixel& px = pixel_ref({x, y});
            px.contribution_sum = vec3_add(px.contribution_sum, vec3_scale(L, w * sample_weight));
            px.filter_weight_sum += w;
        }
    }
}

// ==================== Film ====================

Film::Film(int width, int height, const Filter& filter, color background)
    : width_(width), height_(height), filter_(filter), background_(background) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("film: resolution must be positive");
    }
    pixels_.resize(static_cast<size_t>(width) * height);
    row_mutexes_ = std::vector<std::mutex>(static_cast<size_t>(height));
}

Bounds2i Film::sample_bounds() const {
    return {{static_cast<int>(std::floor(0.5 - filter_.radius_x)),
             static_cast<int>(std::floor(0.5 - filter_.radius_y))},
            {static_cast<int>(std::ceil(width_ - 0.5 + filter_.radius_x)),
             static_cast<int>(std::ceil(height_ - 0.5 + filter_.radius_y))}};
}

FilmTile Film::get_tile(const Bounds2i& sample_bounds) const {
    Point2i lo = {static_cast<int>(std::ceil(sample_bounds.min.x - 0.5 - filter_.radius_x)),
                  static_cast<int>(std::ceil(sample_bounds.min.y - 0.5 - filter_.radius_y))};
    Point2i hi = {static_cast<int>(std::floor(sample_bounds.max.x - 0.5 + filter_.radius_x)) + 1,
                  static_cast<int>(std::floor(sample_bounds.max.y - 0.5 + filter_.radius_y)) + 1};
    Bounds2i bounds = Bounds2i(lo, hi).intersect(pixel_bounds());
    if (bounds.empty()) {
        bounds = Bounds2i(lo, lo);
    }
    return FilmTile(bounds, filter_);
}

void Film::merge_film_tile(FilmTile&& tile) {
    const Bounds2i& b = tile.pixel_bounds();
    for (int y = b.min.y; y < b.max.y; ++y) {
        std::lock_guard<std::mutex> row_lock(row_mutexes_[y]);
        for (int x = b.min.x; x < b.max.x; ++x) {
            const FilmPixel& src = tile.pixel({x, y});
            FilmPixel& dst = pixels_[index(x, y)];
            dst.contribution_sum = vec3_add(dst.contribution_sum, src.contribution_sum);
            dst.filter_weight_sum += src.filter_weight_sum;
        }
    }
}

void Film::add_sample(Point2d p, color L) {
    Bounds2i range = filter_footprint(p, filter_).intersect(pixel_bounds());
    if (range.empty()) {
        return;
    }
    for (int y = range.min.y; y < range.max.y; ++y) {
        std::lock_guard<std::mutex> row_lock(row_mutexes_[y]);
        for (int x = range.min.x; x < range.max.x; ++x) {
            double w = filter_.evaluate(x + 0.5 - p.x, y + 0.5 - p.y);
            if (w == 0.0) {
                continue;
            }
            FilmPixel& px = pixels_[index(x, y)];
            px.contribution_sum = vec3_add(px.contribution_sum, vec3_scale(L, w));
            px.filter_weight_sum += w;
        }
    }
}

color Film::get_pixel(int x, int y) const {
    std::lock_guard<std::mutex> row_lock(row_mutexes_[y]);
    const FilmPixel& px = pixels_[index(x, y)];
    if (px.filter_weight_sum <= 0.0) {
        return background_;
    }
    return vec3_scale(px.contribution_sum, 1.0 / px.filter_weight_sum);
}

double Film::get_weight(int x, int y) const {
    std::lock_guard<std::mutex> row_lock(row_mutexes_[y]);
    return pixels_[index(x, y)].filter_weight_sum;
}

Image Film::to_image() const {
    Image image(width_, height_);
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            image.set_pixel(x, y, get_pixel(x, y));
        }
    }
    return image;
}

} // namespace sunbeam
