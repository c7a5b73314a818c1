/**
 * @file demo_scenes.hpp
 * @brief Built-in scenes selectable by name
 */

#pragma once

#include "scene_description.hpp"
#include <string>
#include <vector>

namespace sunbeam {

/**
 * @brief Names accepted by build_demo_scene()
 */
std::vector<std::string> demo_scene_names();

/**
 * @brief Build a built-in scene
 *
 * "spheres": one sphere per material over a matte ground plane
 * "mirrors": a matte sphere inside facing mirror walls
 * "cornell": plane-walled box with a glass and a metal sphere
 *
 * @throws std::invalid_argument for an unknown name
 */
SceneDescription build_demo_scene(const std::string& name);

} // namespace sunbeam
