/**
 * @file texture.hpp
 * @brief Constant textures feeding material parameters
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "interaction.hpp"

namespace sunbeam {

/**
 * @brief Colour-valued texture
 *
 * Only constant textures exist; evaluation takes the interaction so that
 * filtered textures can use its ray differentials later.
 */
struct ColorTexture {
    color value = {0.5, 0.5, 0.5};

    static ColorTexture constant(color c) {
        ColorTexture tex;
        tex.value = c;
        return tex;
    }

    color evaluate(const SurfaceInteraction& /*si*/) const {
        return value;
    }
};

/**
 * @brief Scalar-valued texture (roughness, index of refraction)
 */
struct FloatTexture {
    double value = 0.0;

    static FloatTexture constant(double v) {
        FloatTexture tex;
        tex.value = v;
        return tex;
    }

    double evaluate(const SurfaceInteraction& /*si*/) const {
        return value;
    }
};

} // namespace sunbeam
