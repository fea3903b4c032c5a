#pragma once
#include <stdexcept>

namespace tb {

// Linear remap of x from [imin, imax] into [omin, omax]. No clamping: values outside the
// input range extrapolate. imin == imax has no answer and throws std::domain_error.
inline double fit_range(double x, double imin, double imax, double omin, double omax) {
    if (imin == imax) throw std::domain_error("fit_range: empty input range (imin == imax)");
    return (omax - omin) * (x - imin) / (imax - imin) + omin;
}

} // namespace tb
