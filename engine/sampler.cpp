/**
 * @file sampler.cpp
 * @brief Random and stratified sample table generation
 */

#include "sampler.hpp"
#include "sampling.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sunbeam {

Sampler Sampler::random(int samples_per_pixel, int dimensions, uint64_t seed) {
    if (samples_per_pixel <= 0) {
        throw std::invalid_argument("sampler: samples per pixel must be positive");
    }
    if (dimensions < 0) {
        throw std::invalid_argument("sampler: dimension count must not be negative");
    }
    Sampler s;
    s.type_ = SamplerType::Random;
    s.samples_per_pixel_ = samples_per_pixel;
    s.dimensions_ = dimensions;
    s.seed_ = seed;
    return s;
}

Sampler Sampler::stratified(int x_strata, int y_strata, bool jitter, int dimensions,
                            uint64_t seed) {
    if (x_strata <= 0 || y_strata <= 0) {
        throw std::invalid_argument("sampler: strata counts must be positive");
    }
    if (dimensions < 0) {
        throw std::invalid_argument("sampler: dimension count must not be negative");
    }
    Sampler s;
    s.type_ = SamplerType::Stratified;
    s.samples_per_pixel_ = x_strata * y_strata;
    s.x_strata_ = x_strata;
    s.y_strata_ = y_strata;
    s.jitter_ = jitter;
    s.dimensions_ = dimensions;
    s.seed_ = seed;
    return s;
}

Sampler Sampler::make(SamplerType type, int samples_per_pixel, int dimensions, uint64_t seed) {
    if (samples_per_pixel <= 0) {
        throw std::invalid_argument("sampler: samples per pixel must be positive");
    }
    if (type == SamplerType::Random) {
        return random(samples_per_pixel, dimensions, seed);
    }
    int x = static_cast<int>(std::sqrt(static_cast<double>(samples_per_pixel)));
    while (x > 1 && samples_per_pixel % x != 0) {
        --x;
    }
    x = std::max(x, 1);
    return stratified(x, samples_per_pixel / x, true, dimensions, seed);
}

Sampler Sampler::clone_with_seed(uint64_t seed) const {
    Sampler s = *this;
    s.seed_ = seed;
    s.sample_index_ = 0;
    s.dim_1d_ = 0;
    s.dim_2d_ = 0;
    return s;
}

double Sampler::uniform() {
    // 53 random mantissa bits
    double u = static_cast<double>(rng_() >> 11) * 0x1.0p-53;
    return std::min(u, ONE_MINUS_EPSILON);
}

void Sampler::fill_tables() {
    const int n = samples_per_pixel_;
    samples_1d_.assign(dimensions_, std::vector<double>(n));
    samples_2d_.assign(dimensions_, std::vector<Point2d>(n));

    for (int d = 0; d < dimensions_; ++d) {
        std::vector<double>& s1 = samples_1d_[d];
        std::vector<Point2d>& s2 = samples_2d_[d];

        if (type_ == SamplerType::Random) {
            for (int i = 0; i < n; ++i) {
                s1[i] = uniform();
            }
            for (int i = 0; i < n; ++i) {
                double ux = uniform();
                s2[i] = {ux, uniform()};
            }
            continue;
        }

        // 1D: one value per stratum of [0,1)
        const double inv_n = 1.0 / n;
        for (int i = 0; i < n; ++i) {
            double delta = jitter_ ? uniform() : 0.5;
            s1[i] = std::min((i + delta) * inv_n, ONE_MINUS_EPSILON);
        }
        std::shuffle(s1.begin(), s1.end(), rng_);

        // 2D: x_strata * y_strata grid
        const double dx = 1.0 / x_strata_;
        const double dy = 1.0 / y_strata_;
        int k = 0;
        for (int y = 0; y < y_strata_; ++y) {
            for (int x = 0; x < x_strata_; ++x) {
                double jx = jitter_ ? uniform() : 0.5;
                double jy = jitter_ ? uniform() : 0.5;
                s2[k++] = {std::min((x + jx) * dx, ONE_MINUS_EPSILON),
                           std::min((y + jy) * dy, ONE_MINUS_EPSILON)};
            }
        }
        std::shuffle(s2.begin(), s2.end(), rng_);
    }
}

void Sampler::start_pixel(Point2i pixel) {
    pixel_ = pixel;
    sample_index_ = 0;
    dim_1d_ = 0;
    dim_2d_ = 0;

    uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(pixel.x)) << 32) |
                   static_cast<uint32_t>(pixel.y);
    rng_.seed(mix_bits(mix_bits(seed_) ^ key));
    fill_tables();
}

bool Sampler::start_next_sample() {
    if (sample_index_ >= samples_per_pixel_) {
        return false;
    }
    ++sample_index_;
    dim_1d_ = 0;
    dim_2d_ = 0;
    return sample_index_ < samples_per_pixel_;
}

double Sampler::get_1d() {
    // Tables exist only after start_pixel
    if (static_cast<size_t>(dim_1d_) < samples_1d_.size() &&
        sample_index_ < samples_per_pixel_) {
        return samples_1d_[dim_1d_++][sample_index_];
    }
    return uniform();
}

Point2d Sampler::get_2d() {
    if (static_cast<size_t>(dim_2d_) < samples_2d_.size() &&
        sample_index_ < samples_per_pixel_) {
        return samples_2d_[dim_2d_++][sample_index_];
    }
    double ux = uniform();
    return {ux, uniform()};
}

CameraSample Sampler::get_camera_sample(Point2i pixel) {
    CameraSample cs;
    Point2d offset = get_2d();
    cs.film_point = {pixel.x + offset.x, pixel.y + offset.y};
    cs.lens_point = get_2d();
    return cs;
}

} // namespace sunbeam
