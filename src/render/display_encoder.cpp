#include "tonebench/display_encoder.hpp"

namespace tb {

std::array<uint8_t,4> encode_pixel(const float* rgba, const PerceptualTonemapper& tm){
    const color scene(rgba[0], rgba[1], rgba[2]);
    const color display = tm(scene);
    const color encoded = srgb_from_linear(saturate(linear_srgb_from_acescg(display)));
    const auto rgb = to_rgb8(encoded);
    return { rgb[0], rgb[1], rgb[2], to_u8_trunc(rgba[3]) };
}

DisplayBuffer encode_display(const LinearBuffer& linear, const PerceptualTonemapper& tm){
    DisplayBuffer out(linear.width, linear.height);
    const size_t n = linear.pixel_count();
    for (size_t i = 0; i < n; ++i) {
        const size_t k = i*LinearBuffer::CHANNELS;
        const auto px = encode_pixel(&linear.data[k], tm);
        out.data[k+0] = px[0];
        out.data[k+1] = px[1];
        out.data[k+2] = px[2];
        out.data[k+3] = px[3];
    }
    return out;
}

} // namespace tb
