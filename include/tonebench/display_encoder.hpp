#pragma once
#include <array>
#include <cstdint>
#include "tonebench/frame_buffer.hpp"
#include "tonebench/tonemap.hpp"

namespace tb {

// One scene-linear ACEScg pixel -> 8-bit sRGB. Color channels go through the tonemapper,
// the AP1 -> Rec.709 matrix and the sRGB curve, then round to nearest. Alpha is linear and
// truncated (255*a toward zero), so 0.5 gives 127, not 128.
std::array<uint8_t,4> encode_pixel(const float* rgba, const PerceptualTonemapper& tm);

// Pointwise over the whole buffer. No state is kept between calls.
DisplayBuffer encode_display(const LinearBuffer& linear, const PerceptualTonemapper& tm);

} // namespace tb
