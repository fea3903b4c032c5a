#pragma once
#include <string>
#include "tonebench/frame_buffer.hpp"

namespace tb {
// 32-bit float RGBA scanline EXR, ZIP compressed. On failure returns false and, if err is
// given, stores the reason.
bool write_rgba_exr(const std::string& path, const LinearBuffer& img, std::string* err=nullptr);
}
