/**
 * @file image.cpp
 * @brief Tone mapping operators and PPM output
 */

#include "image.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace sunbeam {

// ==================== Tone Mapping Operators ====================

/**
 * @brief Simple Reinhard tone mapping
 * Maps [0, inf) to [0, 1)
 */
inline double reinhard(double x) {
    return x / (1.0 + x);
}

/**
 * @brief ACES Filmic approximation (by Krzysztof Narkowicz)
 */
inline double aces_filmic(double x) {
    double a = 2.51;
    double b = 0.03;
    double c = 2.43;
    double d = 0.59;
    double e = 0.14;
    return std::clamp((x * (a * x + b)) / (x * (c * x + d) + e), 0.0, 1.0);
}

static color apply_tone_mapper(color c, ToneMapper mapper) {
    switch (mapper) {
        case ToneMapper::Reinhard:
            return {reinhard(c.x), reinhard(c.y), reinhard(c.z)};

        case ToneMapper::ACES:
            return {aces_filmic(c.x), aces_filmic(c.y), aces_filmic(c.z)};

        case ToneMapper::None:
        default:
            return vec3_clamp(c, 0.0, 1.0);
    }
}

ToneMapper parse_tone_mapper(const std::string& name) {
    if (name == "none") return ToneMapper::None;
    if (name == "reinhard") return ToneMapper::Reinhard;
    if (name == "aces") return ToneMapper::ACES;
    throw std::invalid_argument("unknown tone mapper '" + name + "' (none, reinhard, aces)");
}

const char* tone_mapper_name(ToneMapper mapper) {
    switch (mapper) {
        case ToneMapper::Reinhard: return "reinhard";
        case ToneMapper::ACES: return "aces";
        case ToneMapper::None:
        default: return "none";
    }
}

void Image::apply_tone_mapping(ToneMapper mapper, double exposure) {
    for (color& px : pixels) {
        // Negative and NaN channels carry no light
        color c = {
            std::isfinite(px.x) ? std::max(0.0, px.x * exposure) : 0.0,
            std::isfinite(px.y) ? std::max(0.0, px.y * exposure) : 0.0,
            std::isfinite(px.z) ? std::max(0.0, px.z * exposure) : 0.0
        };
        px = apply_tone_mapper(c, mapper);
    }
}

// ==================== Image Output ====================

static unsigned char encode_channel(double v) {
    // Gamma correction (gamma = 2.0)
    double g = std::sqrt(std::clamp(std::isfinite(v) ? v : 0.0, 0.0, 1.0));
    return static_cast<unsigned char>(255.999 * g);
}

std::vector<unsigned char> Image::to_rgb8() const {
    std::vector<unsigned char> data(static_cast<size_t>(width) * height * 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            color c = get_pixel(x, y);
            size_t idx = (static_cast<size_t>(y) * width + x) * 3;
            data[idx + 0] = encode_channel(c.x);
            data[idx + 1] = encode_channel(c.y);
            data[idx + 2] = encode_channel(c.z);
        }
    }
    return data;
}

bool Image::write_ppm(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "P3\n" << width << ' ' << height << "\n255\n";

    std::vector<unsigned char> data = to_rgb8();
    for (size_t i = 0; i < data.size(); i += 3) {
        file << static_cast<int>(data[i]) << ' '
             << static_cast<int>(data[i + 1]) << ' '
             << static_cast<int>(data[i + 2]) << '\n';
    }

    return static_cast<bool>(file);
}

} // namespace sunbeam
