/**
 * @file material.hpp
 * @brief Materials that turn a surface interaction into a BSDF
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "texture.hpp"
#include "bsdf.hpp"
#include "microfacet.hpp"
#include "interaction.hpp"

namespace sunbeam {

/**
 * @brief Surface appearance interface
 *
 * Materials are immutable once built and shared between threads.
 */
class Material {
public:
    virtual ~Material() = default;

    /**
     * @brief Build the BSDF at the interaction's shading point
     */
    virtual Bsdf compute_bsdf(const SurfaceInteraction& si) const = 0;

    /**
     * @brief Short name used in log output
     */
    virtual const char* name() const = 0;
};

/**
 * @brief Ideal diffuse reflector
 */
class MatteMaterial : public Material {
public:
    explicit MatteMaterial(ColorTexture kd);

    Bsdf compute_bsdf(const SurfaceInteraction& si) const override;
    const char* name() const override { return "matte"; }

private:
    ColorTexture kd_;
};

/**
 * @brief Perfect mirror with no Fresnel falloff
 */
class MirrorMaterial : public Material {
public:
    explicit MirrorMaterial(ColorTexture kr);

    Bsdf compute_bsdf(const SurfaceInteraction& si) const override;
    const char* name() const override { return "mirror"; }

private:
    ColorTexture kr_;
};

/**
 * @brief Smooth dielectric: Fresnel-weighted specular reflection and refraction
 */
class GlassMaterial : public Material {
public:
    /**
     * @throws std::invalid_argument if eta is not positive
     */
    GlassMaterial(ColorTexture kr, ColorTexture kt, double eta);

    Bsdf compute_bsdf(const SurfaceInteraction& si) const override;
    const char* name() const override { return "glass"; }

private:
    ColorTexture kr_;
    ColorTexture kt_;
    double eta_;
};

/**
 * @brief Conductor with a microfacet lobe
 *
 * A roughness of zero collapses the lobe to a specular reflection.
 */
class MetalMaterial : public Material {
public:
    /**
     * @throws std::invalid_argument if roughness is negative or not finite
     */
    MetalMaterial(color eta, color k, double roughness,
                  MicrofacetType distribution = MicrofacetType::TrowbridgeReitz);

    Bsdf compute_bsdf(const SurfaceInteraction& si) const override;
    const char* name() const override { return "metal"; }

private:
    color eta_;
    color k_;
    FloatTexture roughness_;
    MicrofacetType distribution_;
};

/**
 * @brief Diffuse base under a glossy dielectric coat
 */
class PlasticMaterial : public Material {
public:
    /**
     * @throws std::invalid_argument if roughness is negative or not finite
     */
    PlasticMaterial(ColorTexture kd, ColorTexture ks, double roughness);

    Bsdf compute_bsdf(const SurfaceInteraction& si) const override;
    const char* name() const override { return "plastic"; }

private:
    ColorTexture kd_;
    ColorTexture ks_;
    FloatTexture roughness_;
};

} // namespace sunbeam
