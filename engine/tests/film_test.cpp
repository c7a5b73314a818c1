/**
 * @file film_test.cpp
 * @brief Tests for film accumulation, tile merging and image conversion
 *
 * Verifies:
 * - Box filter reproduces a centred sample exactly
 * - Pixels without weight report the background
 * - Merged tiles equal direct accumulation
 * - Concurrent splats lose no contributions
 * - Sample bounds grow with the filter radius
 * - Tone mapping and 8-bit encoding
 */

#include "engine/film.hpp"
#include "engine/image.hpp"
#include <iostream>
#include <cmath>
#include <cassert>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace sunbeam;

constexpr double EPSILON = 1e-12;

bool approx_equal(double a, double b, double eps = EPSILON) {
    return std::abs(a - b) < eps;
}

bool color_equal(color a, color b, double eps = EPSILON) {
    return approx_equal(a.x, b.x, eps) && approx_equal(a.y, b.y, eps) &&
           approx_equal(a.z, b.z, eps);
}

void test_box_identity() {
    std::cout << "Testing box filter identity...\n";

    color background = {0.1, 0.2, 0.3};
    Film film(4, 4, Filter::box(), background);

    color L = {0.7, 1.5, 3.0};
    film.add_sample({1.5, 2.5}, L);

    assert(color_equal(film.get_pixel(1, 2), L));
    assert(approx_equal(film.get_weight(1, 2), 1.0));

    // Neighbours saw nothing
    assert(color_equal(film.get_pixel(0, 2), background));
    assert(color_equal(film.get_pixel(2, 2), background));
    assert(color_equal(film.get_pixel(1, 1), background));
    assert(film.get_weight(1, 3) == 0.0);

    // Several samples average
    film.add_sample({1.3, 2.6}, {0.3, 0.5, 1.0});
    assert(color_equal(film.get_pixel(1, 2), {0.5, 1.0, 2.0}));

    std::cout << "  PASSED\n";
}

void test_weighted_mean() {
    std::cout << "Testing filter-weighted mean...\n";

    Film film(8, 8, Filter::triangle(2.0, 2.0));
    color a = {1.0, 0.0, 0.0};
    color b = {0.0, 1.0, 0.0};
    film.add_sample({4.5, 4.5}, a);  // weight 4 at pixel (4,4)
    film.add_sample({5.5, 4.5}, b);  // weight 2 at pixel (4,4)

    assert(approx_equal(film.get_weight(4, 4), 6.0));
    color p = film.get_pixel(4, 4);
    assert(approx_equal(p.x, 4.0 / 6.0));
    assert(approx_equal(p.y, 2.0 / 6.0));

    // Samples off the film still reach edge pixels
    Film edge(4, 4, Filter::triangle(2.0, 2.0));
    edge.add_sample({-0.5, 0.5}, a);
    assert(edge.get_weight(0, 0) > 0.0);

    std::cout << "  PASSED\n";
}

void test_sample_bounds() {
    std::cout << "Testing sample bounds...\n";

    Film box(8, 6, Filter::box());
    assert(box.sample_bounds() == Bounds2i({0, 0}, {8, 6}));

    Film tri(8, 6, Filter::triangle(2.0, 2.0));
    assert(tri.sample_bounds() == Bounds2i({-2, -2}, {10, 8}));

    Film gauss(8, 6, Filter::gaussian(1.5, 1.5));
    assert(gauss.sample_bounds() == Bounds2i({-1, -1}, {9, 7}));

    std::cout << "  PASSED\n";
}

void test_tile_merge() {
    std::cout << "Testing tile merge against direct accumulation...\n";

    Filter filter = Filter::gaussian(1.5, 1.5);
    Film direct(10, 7, filter);
    Film merged(10, 7, filter);

    // Two tiles splitting the sample bounds
    Bounds2i all = merged.sample_bounds();
    int mid = 4;
    Bounds2i left({all.min.x, all.min.y}, {mid, all.max.y});
    Bounds2i right({mid, all.min.y}, {all.max.x, all.max.y});

    FilmTile t0 = merged.get_tile(left);
    FilmTile t1 = merged.get_tile(right);

    // Tile buffers overlap where samples reach across the split
    assert(t0.pixel_bounds().max.x > mid);
    assert(t1.pixel_bounds().min.x < mid);

    std::vector<std::pair<Point2d, color>> samples;
    for (int i = 0; i < 200; ++i) {
        double x = all.min.x + std::fmod(i * 0.618034, 1.0) * all.width();
        double y = all.min.y + std::fmod(i * 0.414214, 1.0) * all.height();
        samples.push_back({{x, y}, {0.01 * i, 1.0, 2.0 - 0.005 * i}});
    }

    for (const auto& s : samples) {
        direct.add_sample(s.first, s.second);
        if (s.first.x < mid) {
            t0.add_sample(s.first, s.second);
        } else {
            t1.add_sample(s.first, s.second);
        }
    }
    merged.merge_film_tile(std::move(t0));
    merged.merge_film_tile(std::move(t1));

    for (int y = 0; y < 7; ++y) {
        for (int x = 0; x < 10; ++x) {
            assert(approx_equal(direct.get_weight(x, y), merged.get_weight(x, y), 1e-9));
            assert(color_equal(direct.get_pixel(x, y), merged.get_pixel(x, y), 1e-9));
        }
    }

    std::cout << "  PASSED\n";
}

void test_concurrent_add_sample() {
    std::cout << "Testing concurrent add_sample...\n";

    Filter filter = Filter::triangle(2.0, 2.0);
    Film shared(6, 6, filter);
    Film serial(6, 6, filter);

    // Every thread splats onto the same overlapping pixels
    const int per_thread = 2000;
    const Point2d spots[] = {{2.5, 2.5}, {3.1, 2.9}, {2.2, 3.7}, {3.6, 3.3}};

    #pragma omp parallel for num_threads(4)
    for (int t = 0; t < 4; ++t) {
        for (int i = 0; i < per_thread; ++i) {
            shared.add_sample(spots[i % 4], {1.0, 2.0, 3.0});
        }
    }
    for (int t = 0; t < 4; ++t) {
        for (int i = 0; i < per_thread; ++i) {
            serial.add_sample(spots[i % 4], {1.0, 2.0, 3.0});
        }
    }

    for (int y = 0; y < 6; ++y) {
        for (int x = 0; x < 6; ++x) {
            double w = serial.get_weight(x, y);
            assert(approx_equal(shared.get_weight(x, y), w, 1e-9 * (1.0 + w)));
            if (w > 0.0) {
                assert(color_equal(shared.get_pixel(x, y), {1.0, 2.0, 3.0}, 1e-9));
            }
        }
    }
    // Centre pixel: 4 * per_thread samples, each at least weight 1
    assert(shared.get_weight(2, 2) > 4.0 * per_thread);

    std::cout << "  PASSED\n";
}

void test_tile_bounds() {
    std::cout << "Testing tile buffer bounds...\n";

    Film film(16, 16, Filter::box());
    // Samples on the boundary still reach the pixel before it
    FilmTile tile = film.get_tile({{4, 4}, {8, 8}});
    assert(tile.pixel_bounds() == Bounds2i({3, 3}, {9, 9}));

    // Clipped to the film
    Film wide(16, 16, Filter::triangle(2.0, 2.0));
    FilmTile corner = wide.get_tile({{-2, -2}, {4, 4}});
    assert(corner.pixel_bounds().min == Point2i({0, 0}));
    assert(corner.pixel_bounds().max == Point2i({6, 6}));

    // Weighted samples scale the contribution, not the weight
    FilmTile t = film.get_tile({{0, 0}, {2, 2}});
    t.add_sample({0.5, 0.5}, {1.0, 1.0, 1.0}, 0.5);
    assert(approx_equal(t.pixel({0, 0}).filter_weight_sum, 1.0));
    assert(approx_equal(t.pixel({0, 0}).contribution_sum.x, 0.5));

    std::cout << "  PASSED\n";
}

void test_invalid_film() {
    std::cout << "Testing invalid film resolution...\n";

    int failures = 0;
    try { Film f(0, 10, Filter::box()); } catch (const std::invalid_argument&) { ++failures; }
    try { Film f(10, -1, Filter::box()); } catch (const std::invalid_argument&) { ++failures; }
    assert(failures == 2);

    std::cout << "  PASSED\n";
}

void test_image_output() {
    std::cout << "Testing image conversion and tone mapping...\n";

    Film film(2, 2, Filter::box(), {0.0, 0.0, 0.0});
    film.add_sample({0.5, 0.5}, {1.0, 0.25, 0.0});
    Image image = film.to_image();
    assert(image.width == 2 && image.height == 2);
    assert(color_equal(image.get_pixel(0, 0), {1.0, 0.25, 0.0}));

    std::vector<unsigned char> rgb = image.to_rgb8();
    assert(rgb.size() == 12);
    assert(rgb[0] == 255);
    assert(rgb[1] == 127);  // sqrt(0.25) * 255.999
    assert(rgb[2] == 0);

    Image hdr(1, 1);
    hdr.set_pixel(0, 0, {4.0, -1.0, std::nan("")});
    hdr.apply_tone_mapping(ToneMapper::Reinhard, 1.0);
    color c = hdr.get_pixel(0, 0);
    assert(approx_equal(c.x, 0.8));
    assert(c.y == 0.0);
    assert(c.z == 0.0);

    Image exposed(1, 1);
    exposed.set_pixel(0, 0, {0.25, 0.25, 0.25});
    exposed.apply_tone_mapping(ToneMapper::None, 2.0);
    assert(approx_equal(exposed.get_pixel(0, 0).x, 0.5));

    assert(parse_tone_mapper("aces") == ToneMapper::ACES);
    assert(std::string(tone_mapper_name(ToneMapper::Reinhard)) == "reinhard");
    bool threw = false;
    try {
        parse_tone_mapper("filmic");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Film Tests ===\n\n";

    test_box_identity();
    test_weighted_mean();
    test_sample_bounds();
    test_tile_merge();
    test_concurrent_add_sample();
    test_tile_bounds();
    test_invalid_film();
    test_image_output();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
