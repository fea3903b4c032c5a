#pragma once
#include <fstream>
#include <vector>
#include <string>
#include "tonebench/frame_buffer.hpp"

namespace tb {

// Binary P6; alpha is dropped.
inline bool write_rgb_ppm(const std::string& path, const DisplayBuffer& img) {
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;
    f << "P6\n" << img.width << " " << img.height << "\n255\n";
    std::vector<unsigned char> row(size_t(img.width)*3);
    for (int y=0; y<img.height; ++y) {
        for (int x=0; x<img.width; ++x) {
            const uint8_t* p = img.at(x,y);
            row[x*3+0] = p[0]; row[x*3+1] = p[1]; row[x*3+2] = p[2];
        }
        f.write(reinterpret_cast<const char*>(row.data()), row.size());
    }
    return bool(f);
}

} // namespace tb
