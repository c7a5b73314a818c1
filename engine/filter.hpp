/**
 * @file filter.hpp
 * @brief Pixel reconstruction filters
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace sunbeam {

enum class FilterType {
    Box,
    Triangle,
    Gaussian
};

/**
 * @brief Separable reconstruction kernel, zero outside |dx| <= radius_x, |dy| <= radius_y
 *
 * All kernels are non-negative so film weights only ever grow.
 */
struct Filter {
    FilterType type = FilterType::Box;
    double radius_x = 0.5;
    double radius_y = 0.5;
    double alpha = 2.0;  // Gaussian falloff

    static Filter box(double rx = 0.5, double ry = 0.5) {
        return make(FilterType::Box, rx, ry);
    }

    static Filter triangle(double rx = 2.0, double ry = 2.0) {
        return make(FilterType::Triangle, rx, ry);
    }

    static Filter gaussian(double rx = 1.5, double ry = 1.5, double alpha = 2.0) {
        if (!std::isfinite(alpha) || alpha <= 0.0) {
            throw std::invalid_argument("gaussian filter: alpha must be positive");
        }
        Filter f = make(FilterType::Gaussian, rx, ry);
        f.alpha = alpha;
        return f;
    }

    /**
     * @throws std::invalid_argument if a radius is not positive and finite
     */
    static Filter make(FilterType type, double rx, double ry) {
        if (!std::isfinite(rx) || !std::isfinite(ry) || rx <= 0.0 || ry <= 0.0) {
            throw std::invalid_argument("filter radius must be positive and finite");
        }
        Filter f;
        f.type = type;
        f.radius_x = rx;
        f.radius_y = ry;
        return f;
    }

    /**
     * @brief Filter with default radii from "box", "triangle" or "gaussian"
     * @throws std::invalid_argument for any other name
     */
    static Filter from_name(const std::string& name) {
        if (name == "box") return box();
        if (name == "triangle") return triangle();
        if (name == "gaussian") return gaussian();
        throw std::invalid_argument("unknown filter '" + name + "' (box, triangle, gaussian)");
    }

    /**
     * @brief Kernel weight for a sample offset (dx, dy) from a pixel centre
     */
    double evaluate(double dx, double dy) const {
        if (std::fabs(dx) > radius_x || std::fabs(dy) > radius_y) {
            return 0.0;
        }
        switch (type) {
            case FilterType::Triangle:
                return std::max(0.0, radius_x - std::fabs(dx)) *
                       std::max(0.0, radius_y - std::fabs(dy));

            case FilterType::Gaussian:
                return gaussian_1d(dx, radius_x) * gaussian_1d(dy, radius_y);

            case FilterType::Box:
            default:
                return 1.0;
        }
    }

private:
    double gaussian_1d(double d, double r) const {
        return std::max(0.0, std::exp(-alpha * d * d) - std::exp(-alpha * r * r));
    }
};

} // namespace sunbeam
