#pragma once
#include "tonebench/color.hpp"

namespace tb {

struct PerceptualTonemapperParams {
    double exposure_stops = 0.0;   // gain of 2^stops before compression
    double shoulder_start = 0.76;  // peak value where highlight compression begins, in (0,1)
    double desaturation   = 0.15;  // drift of compressed highlights toward white, >= 0
};

// Hue-preserving HDR -> display-referred compression, working on the max channel so all three
// channels share one curve. Colors whose peak is below shoulder_start pass through untouched;
// above it the peak rolls off toward (but never reaches) 1 and the color desaturates slightly.
// Input and output are both ACEScg.
class PerceptualTonemapper {
public:
    PerceptualTonemapper();
    explicit PerceptualTonemapper(const PerceptualTonemapperParams& p);

    color operator()(const color& scene_linear) const;

    const PerceptualTonemapperParams& params() const { return p_; }

private:
    PerceptualTonemapperParams p_;
    double gain_ = 1.0;
};

} // namespace tb
