/*
 * color.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: RGB / HSV conversions used by bulb adapters

**************************************************/

#include "color.hpp"

#include <algorithm>
#include <cmath>

namespace hearth::device {

auto rgbToHsv(const Rgb& rgb) -> Hsv {
    const double r = rgb.r / 255.0;
    const double g = rgb.g / 255.0;
    const double b = rgb.b / 255.0;
    const double maxC = std::max({r, g, b});
    const double minC = std::min({r, g, b});
    const double delta = maxC - minC;

    Hsv hsv;
    hsv.v = maxC;
    hsv.s = maxC > 0.0 ? delta / maxC : 0.0;
    if (delta <= 0.0) {
        hsv.h = 0.0;
    } else if (maxC == r) {
        hsv.h = 60.0 * std::fmod((g - b) / delta, 6.0);
    } else if (maxC == g) {
        hsv.h = 60.0 * ((b - r) / delta + 2.0);
    } else {
        hsv.h = 60.0 * ((r - g) / delta + 4.0);
    }
    if (hsv.h < 0.0) {
        hsv.h += 360.0;
    }
    return hsv;
}

auto hsvToRgb(const Hsv& hsv) -> Rgb {
    const double h = std::fmod(std::max(hsv.h, 0.0), 360.0);
    const double s = std::clamp(hsv.s, 0.0, 1.0);
    const double v = std::clamp(hsv.v, 0.0, 1.0);

    const double c = v * s;
    const double x = c * (1.0 - std::fabs(std::fmod(h / 60.0, 2.0) - 1.0));
    const double m = v - c;

    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    switch (static_cast<int>(h / 60.0)) {
        case 0:
            r = c, g = x;
            break;
        case 1:
            r = x, g = c;
            break;
        case 2:
            g = c, b = x;
            break;
        case 3:
            g = x, b = c;
            break;
        case 4:
            r = x, b = c;
            break;
        default:
            r = c, b = x;
            break;
    }
    auto channel = [m](double value) {
        return static_cast<int>(std::lround((value + m) * 255.0));
    };
    return Rgb{channel(r), channel(g), channel(b)};
}

}  // namespace hearth::device
