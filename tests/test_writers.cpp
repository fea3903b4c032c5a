#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <tinyexr.h>

#include "tonebench/display_encoder.hpp"
#include "tonebench/exr_writer.hpp"
#include "tonebench/ppm_writer.hpp"
#include "tonebench/synthesizer.hpp"

using namespace tb;
namespace fs = std::filesystem;

namespace {

class Writers : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("tonebench_io_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

} // namespace

TEST_F(Writers, ExrRoundTripsScenePixels) {
    LinearBuffer img = synthesize_gradient(5, 3);
    img.at(2, 1)[0] = 12.5f;      // HDR value must survive
    img.at(4, 2)[3] = 0.25f;      // and a non-opaque alpha
    const std::string path = (dir_ / "grad.exr").string();

    std::string err;
    ASSERT_TRUE(write_rgba_exr(path, img, &err)) << err;

    float* rgba = nullptr;
    int w = 0, h = 0;
    const char* load_err = nullptr;
    const int ret = LoadEXR(&rgba, &w, &h, path.c_str(), &load_err);
    if (ret != TINYEXR_SUCCESS && load_err) {
        ADD_FAILURE() << load_err;
        FreeEXRErrorMessage(load_err);
    }
    ASSERT_EQ(ret, TINYEXR_SUCCESS);
    ASSERT_EQ(w, 5);
    ASSERT_EQ(h, 3);
    for (size_t i = 0; i < img.data.size(); ++i) {
        EXPECT_FLOAT_EQ(rgba[i], img.data[i]) << "channel " << i;
    }
    free(rgba);
}

TEST_F(Writers, ExrReportsUnwritablePath) {
    const LinearBuffer img = synthesize_gradient(4, 4);
    std::string err;
    EXPECT_FALSE(write_rgba_exr((dir_ / "missing" / "x.exr").string(), img, &err));
    EXPECT_FALSE(err.empty());
}

TEST_F(Writers, ExrRejectsEmptyInput) {
    std::string err;
    EXPECT_FALSE(write_rgba_exr((dir_ / "empty.exr").string(), LinearBuffer(), &err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(write_rgba_exr("", synthesize_gradient(2, 2), &err));
}

TEST_F(Writers, PpmHeaderAndPayload) {
    const DisplayBuffer img = encode_display(synthesize_gradient(5, 3), PerceptualTonemapper());
    const std::string path = (dir_ / "grad.ppm").string();
    ASSERT_TRUE(write_rgb_ppm(path, img));

    std::ifstream f(path, std::ios::binary);
    const std::vector<char> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    const std::string header = "P6\n5 3\n255\n";
    ASSERT_EQ(bytes.size(), header.size() + 5 * 3 * 3);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + header.size()), header);

    // second pixel of the first row, alpha dropped
    const uint8_t* p = img.at(1, 0);
    EXPECT_EQ(uint8_t(bytes[header.size() + 3]), p[0]);
    EXPECT_EQ(uint8_t(bytes[header.size() + 4]), p[1]);
    EXPECT_EQ(uint8_t(bytes[header.size() + 5]), p[2]);
}

TEST_F(Writers, PpmReportsUnwritablePath) {
    const DisplayBuffer img(2, 2);
    EXPECT_FALSE(write_rgb_ppm((dir_ / "missing" / "x.ppm").string(), img));
}
