/**
 * @file scene_description.hpp
 * @brief A renderable scene together with its camera and render settings
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "camera.hpp"
#include "renderer.hpp"
#include "scene.hpp"
#include <string>

namespace sunbeam {

/**
 * @brief Camera parameters before the film resolution is known
 */
struct CameraSettings {
    CameraType type = CameraType::Perspective;
    point3 position = {0.0, 1.0, 5.0};
    point3 target = {0.0, 0.0, 0.0};
    vec3 up = {0.0, 1.0, 0.0};
    double fov = 60.0;          // Vertical, degrees (perspective)
    double screen_size = 4.0;   // Window height in world units (orthographic)
};

struct SceneDescription {
    Scene scene;
    CameraSettings camera;
    Renderer::Settings render;
    std::string output_file = "output.png";

    /**
     * @brief Camera for the current render resolution
     */
    Camera make_camera() const {
        if (camera.type == CameraType::Orthographic) {
            return Camera::orthographic(camera.position, camera.target, camera.up,
                                        camera.screen_size, render.width, render.height);
        }
        return Camera::perspective(camera.position, camera.target, camera.up, camera.fov,
                                   render.width, render.height);
    }
};

} // namespace sunbeam
