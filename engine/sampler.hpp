/**
 * @file sampler.hpp
 * @brief Deterministic per-pixel sample streams
 */

#pragma once

#include "geometry.hpp"
#include "camera.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace sunbeam {

/**
 * @brief Sampler kinds
 */
enum class SamplerType {
    Random,     // Independent uniform values
    Stratified  // Jittered strata, shuffled per dimension
};

/**
 * @brief Hash a 64-bit value (splitmix64 finalizer)
 */
inline uint64_t mix_bits(uint64_t v) {
    v ^= v >> 31;
    v *= 0x7fb5d329728ea185ULL;
    v ^= v >> 27;
    v *= 0x81dadef4bc2dd44dULL;
    v ^= v >> 33;
    return v;
}

/**
 * @brief Per-pixel sample generator
 *
 * Usage per pixel:
 *   sampler.start_pixel(p);
 *   do {
 *       CameraSample cs = sampler.get_camera_sample(p);
 *       ... get_1d() / get_2d() ...
 *   } while (sampler.start_next_sample());
 *
 * The engine is reseeded at every start_pixel from (seed, pixel), so the
 * samples a pixel receives depend only on those two values and not on which
 * pixels were visited before. Requests beyond the precomputed dimensions
 * fall back to uniform draws from the same per-pixel engine.
 *
 * A sampler is owned by one thread at a time; use clone_with_seed() to give
 * each unit of work its own instance.
 */
class Sampler {
public:
    /**
     * @brief Uniform random sampler
     * @throws std::invalid_argument if samples_per_pixel <= 0
     */
    static Sampler random(int samples_per_pixel, int dimensions = 4, uint64_t seed = 0);

    /**
     * @brief Stratified sampler with x_strata * y_strata samples per pixel
     * @param jitter Randomize within each stratum (otherwise stratum centres)
     * @param dimensions Number of precomputed 1D and 2D dimensions
     * @throws std::invalid_argument on non-positive strata or negative dimensions
     */
    static Sampler stratified(int x_strata, int y_strata, bool jitter, int dimensions = 4,
                              uint64_t seed = 0);

    /**
     * @brief Build a sampler of the given type for a sample count
     *
     * Stratified samplers split samples_per_pixel into the most square
     * x_strata * y_strata factorization.
     */
    static Sampler make(SamplerType type, int samples_per_pixel, int dimensions = 4,
                        uint64_t seed = 0);

    /**
     * @brief Begin generating samples for a pixel; the first sample is current
     */
    void start_pixel(Point2i pixel);

    /**
     * @brief Advance to the next sample
     * @return false once samples_per_pixel samples have been produced
     */
    bool start_next_sample();

    double get_1d();
    Point2d get_2d();

    /**
     * @brief Film position (pixel + offset) and lens position for the current sample
     */
    CameraSample get_camera_sample(Point2i pixel);

    /**
     * @brief Independent copy producing a disjoint deterministic stream
     */
    Sampler clone_with_seed(uint64_t seed) const;

    int samples_per_pixel() const { return samples_per_pixel_; }
    int64_t current_sample_index() const { return sample_index_; }
    SamplerType type() const { return type_; }
    uint64_t seed() const { return seed_; }

private:
    Sampler() = default;

    double uniform();
    void fill_tables();

    SamplerType type_ = SamplerType::Random;
    int samples_per_pixel_ = 1;
    int x_strata_ = 1;
    int y_strata_ = 1;
    bool jitter_ = true;
    int dimensions_ = 0;
    uint64_t seed_ = 0;

    Point2i pixel_;
    int64_t sample_index_ = 0;
    int dim_1d_ = 0;
    int dim_2d_ = 0;

    // [dimension][sample index]
    std::vector<std::vector<double>> samples_1d_;
    std::vector<std::vector<Point2d>> samples_2d_;

    std::mt19937_64 rng_;
};

} // namespace sunbeam
