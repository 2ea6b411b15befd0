/*
 * color.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: RGB / HSV conversions used by bulb adapters

**************************************************/

#ifndef HEARTH_DEVICE_ADAPTER_COLOR_HPP
#define HEARTH_DEVICE_ADAPTER_COLOR_HPP

#include "device/model/device_types.hpp"

namespace hearth::device {

/**
 * @brief Hue in degrees [0, 360), saturation and value in [0, 1]
 */
struct Hsv {
    double h = 0.0;
    double s = 0.0;
    double v = 0.0;
};

[[nodiscard]] auto rgbToHsv(const Rgb& rgb) -> Hsv;

[[nodiscard]] auto hsvToRgb(const Hsv& hsv) -> Rgb;

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_ADAPTER_COLOR_HPP
