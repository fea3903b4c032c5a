#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>

namespace tb {

// Row-major RGBA grid, row 0 at the top. Channels are stored interleaved, 4 per pixel.
template <typename T>
struct FrameBuffer {
    static constexpr int CHANNELS = 4;

    int width=0, height=0;
    std::vector<T> data;

    FrameBuffer() = default;
    FrameBuffer(int w,int h) : width(w),height(h),data(size_t(w)*size_t(h)*CHANNELS, T(0)) {}

    size_t pixel_count() const { return size_t(width)*size_t(height); }
    bool empty() const { return data.empty(); }

    inline size_t index(int x,int row) const { return (size_t(row)*size_t(width) + size_t(x))*CHANNELS; }
    inline T*       at(int x,int row)       { return &data[index(x,row)]; }
    inline const T* at(int x,int row) const { return &data[index(x,row)]; }
};

using LinearBuffer  = FrameBuffer<float>;    // scene-linear ACEScg, alpha in [0,1]
using DisplayBuffer = FrameBuffer<uint8_t>;  // gamma-encoded sRGB, 8 bits per channel

template <typename T>
inline bool operator==(const FrameBuffer<T>& a, const FrameBuffer<T>& b) {
    return a.width==b.width && a.height==b.height && a.data==b.data;
}

} // namespace tb
