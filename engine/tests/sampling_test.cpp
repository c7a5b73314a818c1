/**
 * @file sampling_test.cpp
 * @brief Tests for samplers, warping functions and reconstruction filters
 *
 * Verifies:
 * - Per-pixel sample streams depend only on (seed, pixel)
 * - Cloned samplers are independent
 * - Sample counts, exhaustion and the uniform fallback
 * - Draws before the first pixel fall back to the generator
 * - Stratification covers every stratum once
 * - Disk and hemisphere warps stay in their domains
 * - Box, triangle and gaussian filters
 */

#include "engine/sampler.hpp"
#include "engine/sampling.hpp"
#include "engine/filter.hpp"
#include <iostream>
#include <cmath>
#include <cassert>
#include <stdexcept>
#include <vector>

using namespace sunbeam;

constexpr double EPSILON = 1e-12;

bool approx_equal(double a, double b, double eps = EPSILON) {
    return std::abs(a - b) < eps;
}

bool in_unit_interval(double v) {
    return v >= 0.0 && v < 1.0;
}

// Every value a pixel receives, including draws past the precomputed dimensions
std::vector<double> pixel_stream(Sampler& s, Point2i p) {
    std::vector<double> out;
    s.start_pixel(p);
    do {
        CameraSample cs = s.get_camera_sample(p);
        out.push_back(cs.film_point.x);
        out.push_back(cs.film_point.y);
        out.push_back(s.get_1d());
        for (int i = 0; i < 6; ++i) {
            Point2d u = s.get_2d();
            out.push_back(u.x);
            out.push_back(u.y);
        }
    } while (s.start_next_sample());
    return out;
}

void test_determinism() {
    std::cout << "Testing per-pixel determinism...\n";

    for (SamplerType type : {SamplerType::Random, SamplerType::Stratified}) {
        Sampler a = Sampler::make(type, 16, 3, 42);
        Sampler b = Sampler::make(type, 16, 3, 42);

        std::vector<double> first = pixel_stream(a, {5, 9});

        // Visit other pixels first; the stream must not depend on history
        pixel_stream(b, {0, 0});
        pixel_stream(b, {17, 3});
        std::vector<double> second = pixel_stream(b, {5, 9});
        assert(first == second);

        // Revisiting a pixel on the same instance replays it
        pixel_stream(a, {6, 9});
        assert(pixel_stream(a, {5, 9}) == first);

        // Neighbouring pixels differ
        assert(pixel_stream(a, {6, 9}) != first);

        // Negative coordinates are valid film-space pixels
        assert(pixel_stream(a, {-1, -1}) != pixel_stream(a, {1, 1}));
    }

    std::cout << "  PASSED\n";
}

void test_clone_with_seed() {
    std::cout << "Testing clone_with_seed...\n";

    Sampler base = Sampler::make(SamplerType::Stratified, 9, 2, 0);
    Sampler c1 = base.clone_with_seed(1);
    Sampler c2 = base.clone_with_seed(2);
    Sampler c1_again = base.clone_with_seed(1);

    assert(c1.seed() == 1);
    assert(c1.samples_per_pixel() == 9);
    assert(c1.type() == SamplerType::Stratified);

    std::vector<double> s1 = pixel_stream(c1, {3, 4});
    assert(s1 != pixel_stream(c2, {3, 4}));
    assert(s1 == pixel_stream(c1_again, {3, 4}));

    // The base is untouched by its clones
    assert(base.seed() == 0);

    std::cout << "  PASSED\n";
}

void test_sample_count_and_range() {
    std::cout << "Testing sample count, exhaustion and range...\n";

    Sampler s = Sampler::random(7, 2, 99);
    s.start_pixel({2, 2});
    int count = 0;
    do {
        assert(s.current_sample_index() == count);
        ++count;
        for (int i = 0; i < 10; ++i) {
            assert(in_unit_interval(s.get_1d()));
            Point2d u = s.get_2d();
            assert(in_unit_interval(u.x) && in_unit_interval(u.y));
        }
    } while (s.start_next_sample());
    assert(count == 7);

    // Stays exhausted, and fallback values remain in range
    assert(!s.start_next_sample());
    assert(!s.start_next_sample());
    assert(in_unit_interval(s.get_1d()));

    // start_pixel restarts the count
    s.start_pixel({3, 2});
    assert(s.current_sample_index() == 0);

    std::cout << "  PASSED\n";
}

void test_draws_before_start_pixel() {
    std::cout << "Testing draws before start_pixel...\n";

    // No tables yet: values come from the uniform fallback
    Sampler fresh = Sampler::random(4, 4, 0);
    assert(in_unit_interval(fresh.get_1d()));
    Point2d u = fresh.get_2d();
    assert(in_unit_interval(u.x) && in_unit_interval(u.y));

    Sampler strat = Sampler::make(SamplerType::Stratified, 4, 2, 5);
    Sampler clone = strat.clone_with_seed(3);
    for (int i = 0; i < 6; ++i) {
        assert(in_unit_interval(clone.get_1d()));
        Point2d v = clone.get_2d();
        assert(in_unit_interval(v.x) && in_unit_interval(v.y));
    }

    // The table path still works once the pixel starts
    std::vector<double> a = pixel_stream(clone, {1, 1});
    Sampler other = strat.clone_with_seed(3);
    assert(a == pixel_stream(other, {1, 1}));

    std::cout << "  PASSED\n";
}

void test_stratification() {
    std::cout << "Testing stratified coverage...\n";

    const int nx = 4;
    const int ny = 3;
    Sampler s = Sampler::stratified(nx, ny, true, 2, 5);
    assert(s.samples_per_pixel() == nx * ny);

    s.start_pixel({10, 20});
    std::vector<int> hits_2d(nx * ny, 0);
    std::vector<int> hits_1d(nx * ny, 0);
    do {
        Point2d u = s.get_2d();
        int sx = static_cast<int>(u.x * nx);
        int sy = static_cast<int>(u.y * ny);
        hits_2d[sy * nx + sx]++;

        double v = s.get_1d();
        hits_1d[static_cast<int>(v * nx * ny)]++;
    } while (s.start_next_sample());

    for (int h : hits_2d) {
        assert(h == 1);
    }
    for (int h : hits_1d) {
        assert(h == 1);
    }

    // Without jitter every sample sits at a stratum centre
    Sampler centres = Sampler::stratified(2, 2, false, 1, 0);
    centres.start_pixel({0, 0});
    do {
        Point2d u = centres.get_2d();
        assert(approx_equal(u.x, 0.25) || approx_equal(u.x, 0.75));
        assert(approx_equal(u.y, 0.25) || approx_equal(u.y, 0.75));
    } while (centres.start_next_sample());

    std::cout << "  PASSED\n";
}

void test_make_and_validation() {
    std::cout << "Testing sampler construction...\n";

    assert(Sampler::make(SamplerType::Stratified, 16).samples_per_pixel() == 16);
    assert(Sampler::make(SamplerType::Stratified, 8).samples_per_pixel() == 8);
    assert(Sampler::make(SamplerType::Stratified, 7).samples_per_pixel() == 7);
    assert(Sampler::make(SamplerType::Random, 5).type() == SamplerType::Random);

    int failures = 0;
    try { Sampler::random(0); } catch (const std::invalid_argument&) { ++failures; }
    try { Sampler::stratified(0, 4, true); } catch (const std::invalid_argument&) { ++failures; }
    try { Sampler::stratified(2, 2, true, -1); } catch (const std::invalid_argument&) { ++failures; }
    try { Sampler::make(SamplerType::Stratified, -3); } catch (const std::invalid_argument&) { ++failures; }
    assert(failures == 4);

    std::cout << "  PASSED\n";
}

void test_camera_sample() {
    std::cout << "Testing camera samples...\n";

    Sampler s = Sampler::make(SamplerType::Stratified, 4, 2, 3);
    Point2i p = {12, 7};
    s.start_pixel(p);
    do {
        CameraSample cs = s.get_camera_sample(p);
        assert(cs.film_point.x >= 12.0 && cs.film_point.x < 13.0);
        assert(cs.film_point.y >= 7.0 && cs.film_point.y < 8.0);
        assert(in_unit_interval(cs.lens_point.x));
    } while (s.start_next_sample());

    std::cout << "  PASSED\n";
}

void test_warping() {
    std::cout << "Testing warping functions...\n";

    const int n = 32;
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            Point2d u = {(i + 0.5) / n, (j + 0.5) / n};

            Point2d d = concentric_sample_disk(u);
            assert(d.x * d.x + d.y * d.y <= 1.0 + EPSILON);

            vec3 w = cosine_sample_hemisphere(u);
            assert(w.z >= 0.0);
            assert(approx_equal(vec3_length(w), 1.0, 1e-9));
            assert(approx_equal(cosine_hemisphere_pdf(w.z), w.z * INV_PI));

            vec3 h = uniform_sample_hemisphere(u);
            assert(h.z >= 0.0);
            assert(approx_equal(vec3_length(h), 1.0, 1e-9));
        }
    }

    Point2d origin = concentric_sample_disk({0.5, 0.5});
    assert(origin.x == 0.0 && origin.y == 0.0);

    assert(is_valid_pdf(0.5));
    assert(!is_valid_pdf(0.0));
    assert(!is_valid_pdf(std::nan("")));

    std::cout << "  PASSED\n";
}

void test_filters() {
    std::cout << "Testing reconstruction filters...\n";

    Filter box = Filter::box();
    assert(box.evaluate(0.0, 0.0) == 1.0);
    assert(box.evaluate(0.49, -0.49) == 1.0);
    assert(box.evaluate(0.6, 0.0) == 0.0);

    Filter tri = Filter::triangle(2.0, 2.0);
    assert(approx_equal(tri.evaluate(0.0, 0.0), 4.0));
    assert(approx_equal(tri.evaluate(1.0, 0.0), 2.0));
    assert(tri.evaluate(2.5, 0.0) == 0.0);

    Filter gauss = Filter::gaussian(1.5, 1.5, 2.0);
    double centre = gauss.evaluate(0.0, 0.0);
    assert(centre > 0.0);
    assert(gauss.evaluate(0.7, 0.0) < centre);
    assert(approx_equal(gauss.evaluate(1.5, 0.0), 0.0));
    assert(gauss.evaluate(1.6, 0.0) == 0.0);

    // Non-negative everywhere
    for (const Filter& f : {box, tri, gauss}) {
        for (double dx = -3.0; dx <= 3.0; dx += 0.25) {
            for (double dy = -3.0; dy <= 3.0; dy += 0.25) {
                assert(f.evaluate(dx, dy) >= 0.0);
            }
        }
    }

    assert(Filter::from_name("triangle").type == FilterType::Triangle);
    assert(Filter::from_name("gaussian").radius_x == 1.5);

    int failures = 0;
    try { Filter::box(0.0); } catch (const std::invalid_argument&) { ++failures; }
    try { Filter::triangle(-1.0, 1.0); } catch (const std::invalid_argument&) { ++failures; }
    try { Filter::gaussian(1.0, 1.0, 0.0); } catch (const std::invalid_argument&) { ++failures; }
    try { Filter::from_name("mitchell"); } catch (const std::invalid_argument&) { ++failures; }
    assert(failures == 4);

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Sampling Tests ===\n\n";

    test_determinism();
    test_clone_with_seed();
    test_sample_count_and_range();
    test_draws_before_start_pixel();
    test_stratification();
    test_make_and_validation();
    test_camera_sample();
    test_warping();
    test_filters();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
