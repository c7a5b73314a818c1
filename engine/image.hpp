/**
 * @file image.hpp
 * @brief Linear RGB image buffer, tone mapping and file output
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include <string>
#include <vector>

namespace sunbeam {

/**
 * @brief Tone mapping operators
 */
enum class ToneMapper {
    None,       // Clamp only
    Reinhard,   // L / (1 + L)
    ACES        // ACES filmic approximation
};

/**
 * @brief Parse "none", "reinhard" or "aces"
 * @throws std::invalid_argument for any other name
 */
ToneMapper parse_tone_mapper(const std::string& name);

const char* tone_mapper_name(ToneMapper mapper);

/**
 * @brief Image buffer, row 0 at the top
 */
struct Image {
    int width;
    int height;
    std::vector<color> pixels;

    Image(int w, int h) : width(w), height(h), pixels(static_cast<size_t>(w) * h) {}

    void set_pixel(int x, int y, color c) {
        pixels[y * width + x] = c;
    }

    color get_pixel(int x, int y) const {
        return pixels[y * width + x];
    }

    /**
     * @brief Apply tone mapping and exposure to all pixels (in-place)
     * @param mapper Tone mapping operator to use
     * @param exposure Exposure multiplier (applied before tone mapping)
     */
    void apply_tone_mapping(ToneMapper mapper, double exposure = 1.0);

    /**
     * @brief Gamma-2 encoded 8-bit RGB, top row first
     */
    std::vector<unsigned char> to_rgb8() const;

    /**
     * @brief Write image to PPM file
     * @return true on success
     */
    bool write_ppm(const std::string& filename) const;

    /**
     * @brief Write image to PNG file
     * @return true on success
     */
    bool write_png(const std::string& filename) const;
};

} // namespace sunbeam
