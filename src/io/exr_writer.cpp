// Force TinyEXR to use system zlib (not miniz)
#define TINYEXR_USE_MINIZ 0
#define TINYEXR_USE_ZLIB  1

#define TINYEXR_IMPLEMENTATION
#include <zlib.h>        // ensure zlib types like uLong, Bytef are visible
#include <tinyexr.h>

#include <cstdlib>
#include <cstring>
#include <vector>
#include "tonebench/exr_writer.hpp"


namespace tb {

static void split_rgba(const LinearBuffer& img,
                       std::vector<float>& R, std::vector<float>& G,
                       std::vector<float>& B, std::vector<float>& A){
    const size_t n = img.pixel_count();
    R.resize(n); G.resize(n); B.resize(n); A.resize(n);
    for (size_t i=0;i<n;++i){
        const float* p = &img.data[i*LinearBuffer::CHANNELS];
        R[i]=p[0]; G[i]=p[1]; B[i]=p[2]; A[i]=p[3];
    }
}

static void set_err(std::string* err, const std::string& msg){ if (err) *err = msg; }

bool write_rgba_exr(const std::string& path, const LinearBuffer& img, std::string* err){
    if (path.empty()){ set_err(err, "empty output path"); return false; }
    if (img.empty() || img.width<=0 || img.height<=0){ set_err(err, "empty image"); return false; }

    std::vector<float> R,G,B,A; split_rgba(img,R,G,B,A);

    EXRHeader header; InitEXRHeader(&header);
    EXRImage image;  InitEXRImage(&image);
    image.num_channels = 4;

    // Channel names must be sorted in the file: A, B, G, R.
    std::vector<float*> images(4);
    images[0] = A.data(); images[1] = B.data(); images[2] = G.data(); images[3] = R.data();
    image.images = reinterpret_cast<unsigned char**>(images.data());
    image.width  = img.width; image.height = img.height;

    header.num_channels = 4;
    header.compression_type = TINYEXR_COMPRESSIONTYPE_ZIP;
    header.channels = (EXRChannelInfo*)malloc(sizeof(EXRChannelInfo)*4);
    std::memset(header.channels, 0, sizeof(EXRChannelInfo)*4);
    std::strcpy(header.channels[0].name, "A");
    std::strcpy(header.channels[1].name, "B");
    std::strcpy(header.channels[2].name, "G");
    std::strcpy(header.channels[3].name, "R");

    header.pixel_types = (int*)malloc(sizeof(int)*4);
    header.requested_pixel_types = (int*)malloc(sizeof(int)*4);
    for (int i=0;i<4;++i){ header.pixel_types[i]=TINYEXR_PIXELTYPE_FLOAT; header.requested_pixel_types[i]=TINYEXR_PIXELTYPE_FLOAT; }

    const char* exr_err = nullptr;
    int ret = SaveEXRImageToFile(&image, &header, path.c_str(), &exr_err);

    free(header.channels); free(header.pixel_types); free(header.requested_pixel_types);

    if (ret != TINYEXR_SUCCESS){
        set_err(err, exr_err ? std::string(exr_err) : "SaveEXRImageToFile failed (code " + std::to_string(ret) + ")");
        if (exr_err){ FreeEXRErrorMessage(exr_err); }
        return false;
    }
    return true;
}

} // namespace tb
