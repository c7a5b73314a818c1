/**
 * @file scene_loader.hpp
 * @brief JSON scene file loading
 */

#pragma once

#include <nlohmann/json.hpp>
#include "scene_description.hpp"
#include <string>

namespace sunbeam {

using json = nlohmann::json;

/**
 * @brief Load a scene from a JSON file
 *
 * Layout:
 * {
 *   "camera":    { "type", "position", "target", "up", "fov", "screen_size" },
 *   "render":    { "width", "height", "samples", "sampler", "max_depth", "tile_size",
 *                  "threads", "filter", "background", "output", "tonemapper", "exposure" },
 *   "materials": { "<name>": { "type": "matte" | "mirror" | "glass" | "metal" | "plastic", ... } },
 *   "spheres":   [ { "center", "radius", "material" } ],
 *   "planes":    [ { "point", "normal", "material" } ],
 *   "lights":    [ { "type": "point", "position", "intensity", "color" } ]
 * }
 */
class SceneLoader {
public:
    /**
     * @brief Load scene from JSON file
     * @throws std::runtime_error naming the file on I/O, syntax or content errors
     */
    static SceneDescription load(const std::string& filename);

    /**
     * @brief Build a scene from an already parsed document
     * @param source Name used in error messages
     * @throws std::runtime_error on content errors
     */
    static SceneDescription parse(const json& j, const std::string& source = "<json>");
};

} // namespace sunbeam
