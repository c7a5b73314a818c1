/**
 * @file image_png.cpp
 * @brief PNG output through stb_image_write
 */

#include "image.hpp"

// The single translation unit that compiles the stb writer
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

namespace sunbeam {

bool Image::write_png(const std::string& filename) const {
    std::vector<unsigned char> data = to_rgb8();
    return stbi_write_png(filename.c_str(), width, height, 3, data.data(), width * 3) != 0;
}

} // namespace sunbeam
