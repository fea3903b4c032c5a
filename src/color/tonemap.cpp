#include "tonebench/tonemap.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace tb {

static double sanitize(double x){
    if (std::isnan(x) || x < 0.0) return 0.0;
    if (std::isinf(x)) return std::numeric_limits<double>::max();
    return x;
}

PerceptualTonemapper::PerceptualTonemapper() : PerceptualTonemapper(PerceptualTonemapperParams{}) {}

PerceptualTonemapper::PerceptualTonemapper(const PerceptualTonemapperParams& p) : p_(p) {
    if (!(p.shoulder_start > 0.0 && p.shoulder_start < 1.0))
        throw std::invalid_argument("tonemap: shoulder_start must be in (0,1)");
    if (!(p.desaturation >= 0.0) || std::isinf(p.desaturation))
        throw std::invalid_argument("tonemap: desaturation must be finite and >= 0");
    if (!std::isfinite(p.exposure_stops))
        throw std::invalid_argument("tonemap: exposure_stops must be finite");
    gain_ = std::exp2(p.exposure_stops);
}

color PerceptualTonemapper::operator()(const color& scene_linear) const {
    color c(sanitize(scene_linear.x), sanitize(scene_linear.y), sanitize(scene_linear.z));
    if (gain_ != 1.0) c = color(sanitize(c.x*gain_), sanitize(c.y*gain_), sanitize(c.z*gain_));

    const double start = p_.shoulder_start;
    const double peak  = max_component(c);
    if (peak < start) return c;

    const double d = 1.0 - start;
    const double new_peak = 1.0 - d*d / (peak + d - start);
    c *= new_peak / peak;

    const double g = 1.0 - 1.0 / (p_.desaturation * (peak - new_peak) + 1.0);
    return lerp(c, color(new_peak, new_peak, new_peak), g);
}

} // namespace tb
