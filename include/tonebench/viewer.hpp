#pragma once
#include <algorithm>
#include <cmath>

namespace tb {

// Zoom of the image viewer. Never below 1:1: every buffer pixel gets at least one screen pixel.
struct ViewerZoom {
    static constexpr float MIN_SCALE = 1.0f;
    static constexpr float MAX_SCALE = 8.0f;
    static constexpr float STEP      = 1.25f;   // per wheel notch

    float scale = MIN_SCALE;

    // wheel > 0 zooms in. Returns the factor the scale actually changed by.
    float scroll(float wheel){
        if (wheel == 0.0f || !std::isfinite(wheel)) return 1.0f;
        const float old = scale;
        scale = std::min(MAX_SCALE, std::max(MIN_SCALE, scale * std::pow(STEP, wheel)));
        return scale / old;
    }

    // Scroll offset that keeps the content point under the cursor fixed after a zoom by `factor`.
    // `cursor` is relative to the viewport, `scroll` is the current offset along the same axis.
    static float anchored_scroll(float scroll, float cursor, float factor){
        return std::max(0.0f, (scroll + cursor)*factor - cursor);
    }
};

} // namespace tb
