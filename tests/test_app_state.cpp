#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "tonebench/app_state.hpp"

using namespace tb;
namespace fs = std::filesystem;

namespace {

AppState small_state() {
    AppState s;
    s.width = 8;
    s.height = 4;
    return s;
}

class AppStateFiles : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("tonebench_app_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

} // namespace

TEST(AppState, DefaultSavePath) {
    const AppState s;
    EXPECT_EQ(s.file_name, "sample_file");
    EXPECT_EQ(save_path(s), (fs::path(".") / "sample_file.exr").string());
}

TEST(AppState, FileNameChangeUpdatesSavePath) {
    AppState s = small_state();
    s.output_dir = "renders";
    const Update u = update(s, FileNameChanged{"gradient"});
    EXPECT_EQ(u.state.file_name, "gradient");
    EXPECT_EQ(save_path(u.state), (fs::path("renders") / "gradient.exr").string());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(u.command));
    EXPECT_EQ(s.file_name, "sample_file");
}

TEST(AppState, RenderPressedOnlyRequestsARender) {
    AppState s = small_state();
    s.tonemap.exposure_stops = 1.5;
    const Update u = update(s, RenderPressed{});
    const auto* rc = std::get_if<RenderCommand>(&u.command);
    ASSERT_NE(rc, nullptr);
    EXPECT_EQ(rc->width, 8);
    EXPECT_EQ(rc->height, 4);
    EXPECT_EQ(rc->tonemap.exposure_stops, 1.5);
    EXPECT_EQ(u.state.display.get(), nullptr);
    EXPECT_EQ(u.state.render_count, 0);
}

TEST(AppState, RenderFinishedReplacesDisplay) {
    const AppState s = small_state();
    auto img = std::make_shared<const DisplayBuffer>(8, 4);
    const Update u = update(s, RenderFinished{img, 2.5});
    EXPECT_EQ(u.state.display, img);
    EXPECT_EQ(u.state.render_count, 1);
    EXPECT_DOUBLE_EQ(u.state.last_render_ms, 2.5);
    EXPECT_FALSE(u.state.status_is_error);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(u.command));
}

TEST(AppState, SavePressedRequestsExrWrite) {
    AppState s = small_state();
    s.output_dir = "out";
    s.file_name = "shot";
    const Update u = update(s, SaveFilePressed{});
    const auto* sc = std::get_if<SaveCommand>(&u.command);
    ASSERT_NE(sc, nullptr);
    EXPECT_EQ(sc->path, (fs::path("out") / "shot.exr").string());
    EXPECT_EQ(sc->width, 8);
    EXPECT_EQ(sc->height, 4);
    EXPECT_EQ(u.state.status, "Saving " + sc->path + " to disk..");
}

TEST(AppState, SaveWithEmptyNameIsRejected) {
    AppState s = small_state();
    s.file_name.clear();
    const Update u = update(s, SaveFilePressed{});
    EXPECT_TRUE(std::holds_alternative<std::monostate>(u.command));
    EXPECT_TRUE(u.state.status_is_error);
}

TEST(AppState, SaveFailureIsReportedNotFatal) {
    const AppState s = small_state();
    const Update u = update(s, SaveFinished{"x.exr", false, "disk full"});
    EXPECT_TRUE(u.state.status_is_error);
    EXPECT_EQ(u.state.status, "Save failed: disk full");

    const Update ok = update(u.state, SaveFinished{"x.exr", true, ""});
    EXPECT_FALSE(ok.state.status_is_error);
    EXPECT_EQ(ok.state.status, "Saved x.exr");
}

TEST(AppState, RunRenderCommandProducesBuffer) {
    const Message m = run_command(RenderCommand{6, 3, PerceptualTonemapperParams{}});
    const auto* rf = std::get_if<RenderFinished>(&m);
    ASSERT_NE(rf, nullptr);
    ASSERT_NE(rf->display.get(), nullptr);
    EXPECT_EQ(rf->display->width, 6);
    EXPECT_EQ(rf->display->height, 3);
}

TEST(AppState, InitialStateRendersOnce) {
    const AppState s = initial_state(small_state());
    ASSERT_NE(s.display.get(), nullptr);
    EXPECT_EQ(s.display->width, 8);
    EXPECT_EQ(s.display->height, 4);
    EXPECT_EQ(s.render_count, 1);
}

TEST(AppState, RenderReplacesBufferWholesale) {
    const AppState a = initial_state(small_state());
    const AppState b = dispatch(a, RenderPressed{});
    ASSERT_NE(b.display.get(), nullptr);
    EXPECT_NE(a.display, b.display);          // new buffer object
    EXPECT_TRUE(*a.display == *b.display);    // same pixels
    EXPECT_EQ(b.render_count, 2);
}

TEST(AppState, DispatchLogsProgress) {
    ::testing::internal::CaptureStdout();
    AppState s = dispatch(small_state(), FileNameChanged{"gradient"});
    s = dispatch(s, RenderPressed{});
    const std::string log = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(log.find("New name: gradient\n"), std::string::npos) << log;
    EXPECT_NE(log.find("New file name: gradient\n"), std::string::npos) << log;
    EXPECT_LT(log.find("New name: "), log.find("New file name: "));
    EXPECT_NE(log.find("Rendering...\n"), std::string::npos) << log;
    EXPECT_NE(log.find("Rendered 8x4 in "), std::string::npos) << log;
}

TEST_F(AppStateFiles, DispatchSaveWritesExr) {
    AppState s = small_state();
    s.output_dir = dir_.string();
    s = dispatch(s, FileNameChanged{"saved"});
    s = dispatch(s, SaveFilePressed{});
    EXPECT_FALSE(s.status_is_error) << s.status;
    EXPECT_TRUE(fs::exists(dir_ / "saved.exr"));
    EXPECT_GT(fs::file_size(dir_ / "saved.exr"), 0u);
}

TEST_F(AppStateFiles, DispatchSaveIntoMissingDirectoryKeepsRunning) {
    AppState s = initial_state(small_state());
    const auto shown = s.display;
    s.output_dir = (dir_ / "does" / "not" / "exist").string();
    s = dispatch(s, SaveFilePressed{});
    EXPECT_TRUE(s.status_is_error);
    EXPECT_EQ(s.status.rfind("Save failed: ", 0), 0u) << s.status;
    EXPECT_EQ(s.display, shown);
}
