#include "tonebench/synthesizer.hpp"
#include "tonebench/fit_range.hpp"

#include <stdexcept>

namespace tb {

color gradient_color(double u, double v){
    const color red   = acescg::red();
    const color green = acescg::green();
    const color blue  = acescg::blue();
    const color h_blended = blend(red, green, u);
    const color v_blended = blend(red, blue, v);
    return blend(h_blended, v_blended, 0.5);
}

LinearBuffer synthesize_gradient(int width, int height){
    if (width <= 0 || height <= 0)
        throw std::invalid_argument("synthesize_gradient: width and height must be positive");

    LinearBuffer buf(width, height);
    size_t idx = 0;
    // y runs bottom-up in image space, so the first row written (row 0, top) has v close to 1.
    for (int y = height - 1; y >= 0; --y) {
        const double v = fit_range(y, 0.0, height, 0.0, 1.0);
        for (int x = 0; x < width; ++x) {
            const double u = fit_range(x, 0.0, width, 0.0, 1.0);
            const color c = gradient_color(u, v);
            buf.data[idx+0] = float(c.x);
            buf.data[idx+1] = float(c.y);
            buf.data[idx+2] = float(c.z);
            buf.data[idx+3] = 1.0f;
            idx += LinearBuffer::CHANNELS;
        }
    }
    return buf;
}

} // namespace tb
