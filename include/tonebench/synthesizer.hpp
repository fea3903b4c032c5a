#pragma once
#include "tonebench/color.hpp"
#include "tonebench/frame_buffer.hpp"

namespace tb {

// Test pattern: red->green along u, red->blue along v, the two ramps mixed 50/50.
// (u,v) = (0,0) is the bottom-left corner of the image.
color gradient_color(double u, double v);

// Scene-linear ACEScg gradient, alpha 1.0 everywhere. Throws std::invalid_argument on w,h <= 0.
LinearBuffer synthesize_gradient(int width, int height);

} // namespace tb
