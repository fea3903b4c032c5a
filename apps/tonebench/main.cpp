// Tonebench: scene-linear gradient -> perceptual tonemap -> sRGB, shown in an SDL2 + Dear ImGui window
// Headless: <out>/<name>.exr (scene-linear) and <out>/<name>.ppm (display)
#include <string>
#include <filesystem>
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <type_traits>

#include "tonebench/app_state.hpp"
#include "tonebench/exr_writer.hpp"
#include "tonebench/ppm_writer.hpp"
#include "tonebench/synthesizer.hpp"
#include "tonebench/viewer.hpp"

#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_sdlrenderer2.h"

#include <SDL2/SDL.h>

// ---------------------------- CLI Options ----------------------------
struct Opts {
    int width = 1024, height = 1024;
    std::string name = "sample_file";
    std::string out = ".";
    double exposure = 0.0;
    std::string font;
    bool headless = false;
};

static void print_usage() {
    std::cout <<
R"(Tonebench: scene-linear test image through a perceptual tonemap

Usage:
  tonebench [--width W] [--height H] [--name NAME] [--out DIR]
            [--exposure STOPS] [--font TTF] [--headless] [--help]

  --headless   render once, write <out>/<name>.exr and <out>/<name>.ppm, exit
)";
}

static Opts parse(int argc, char** argv) {
    Opts o;
    auto need = [&](int &i){ if(i+1>=argc){ print_usage(); std::exit(2);} return ++i; };
    auto bad  = [&](const std::string& flag){ std::cerr << "Bad " << flag << "\n"; print_usage(); std::exit(2); };
    // Whole argument must be a number; "12abc" is rejected.
    auto to_int = [](const char* v){
        size_t pos = 0; int n = std::stoi(v, &pos);
        if (v[pos] != '\0') throw std::invalid_argument(v);
        return n;
    };
    auto to_double = [](const char* v){
        size_t pos = 0; double d = std::stod(v, &pos);
        if (v[pos] != '\0') throw std::invalid_argument(v);
        return d;
    };

    for (int i=1;i<argc;++i) {
        std::string a(argv[i]);
        try {
            if (a=="--width")           o.width = to_int(argv[need(i)]);
            else if (a=="--height")     o.height = to_int(argv[need(i)]);
            else if (a=="--name")       o.name = argv[need(i)];
            else if (a=="--out")        o.out = argv[need(i)];
            else if (a=="--exposure")   o.exposure = to_double(argv[need(i)]);
            else if (a=="--font")       o.font = argv[need(i)];
            else if (a=="--headless")   o.headless = true;
            else if (a=="--help" || a=="-h"){ print_usage(); std::exit(0); }
            else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
        } catch (const std::logic_error&) {
            bad(a);
        }
    }
    if (o.width <= 0)  bad("--width");
    if (o.height <= 0) bad("--height");
    if (o.name.empty()) bad("--name");
    std::error_code ec;
    std::filesystem::create_directories(o.out, ec);
    if (ec) { std::cerr << "Cannot create " << o.out << ": " << ec.message() << "\n"; std::exit(2); }
    return o;
}

static tb::AppState config_from(const Opts& o){
    tb::AppState s;
    s.width = o.width; s.height = o.height;
    s.file_name = o.name;
    s.output_dir = o.out;
    s.tonemap.exposure_stops = o.exposure;
    return s;
}

static int run_headless(const tb::AppState& s){
    const std::string exr = tb::save_path(s);
    const std::string ppm = (std::filesystem::path(s.output_dir) / (s.file_name + ".ppm")).string();

    std::string err;
    if (!tb::write_rgba_exr(exr, tb::synthesize_gradient(s.width, s.height), &err)) {
        std::cerr << "Failed to write " << exr << ": " << err << "\n";
        return 1;
    }
    std::cout << "Wrote " << exr << "\n";

    if (!tb::write_rgb_ppm(ppm, *s.display)) {
        std::cerr << "Failed to write " << ppm << "\n";
        return 1;
    }
    std::cout << "Wrote " << ppm << "\n";
    return 0;
}

// ---------------------------- Window ----------------------------
// Texture mirroring the current display buffer; re-uploaded only when the buffer is replaced.
struct ImageTexture {
    SDL_Texture* tex = nullptr;
    std::shared_ptr<const tb::DisplayBuffer> shown;

    ImageTexture() = default;
    ImageTexture(const ImageTexture&) = delete;
    ImageTexture& operator=(const ImageTexture&) = delete;

    bool sync(SDL_Renderer* r, const std::shared_ptr<const tb::DisplayBuffer>& img){
        if (!img || img == shown) return true;
        if (!tex || !shown || shown->width != img->width || shown->height != img->height) {
            if (tex) SDL_DestroyTexture(tex);
            tex = SDL_CreateTexture(r, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STATIC, img->width, img->height);
            if (!tex) { std::cerr << "SDL_CreateTexture: " << SDL_GetError() << "\n"; return false; }
        }
        if (SDL_UpdateTexture(tex, nullptr, img->data.data(), img->width*tb::DisplayBuffer::CHANNELS) != 0) {
            std::cerr << "SDL_UpdateTexture: " << SDL_GetError() << "\n";
            return false;
        }
        shown = img;
        return true;
    }
    ~ImageTexture(){ if (tex) SDL_DestroyTexture(tex); }
};
static_assert(!std::is_copy_constructible<ImageTexture>::value && !std::is_copy_assignable<ImageTexture>::value,
              "ImageTexture owns its SDL_Texture");

// Scrollable viewer, at most the panel width x 512. Wheel zooms around the cursor, left drag pans.
static void draw_viewer(const tb::DisplayBuffer& d, const ImageTexture& img, tb::ViewerZoom& zoom){
    const float iw = float(d.width)*zoom.scale, ih = float(d.height)*zoom.scale;
    const ImGuiStyle& st = ImGui::GetStyle();
    ImGui::BeginChild("##viewer", ImVec2(0.0f, std::min(512.0f, ih + st.ScrollbarSize)), false,
                      ImGuiWindowFlags_HorizontalScrollbar | ImGuiWindowFlags_NoScrollWithMouse);

    const ImVec2 avail = ImGui::GetContentRegionAvail();
    if (iw < avail.x) ImGui::SetCursorPosX(0.5f*(avail.x - iw));
    ImGui::Image((ImTextureID)img.tex, ImVec2(iw, ih));

    if (ImGui::IsWindowHovered()) {
        const ImGuiIO& io = ImGui::GetIO();
        if (io.MouseWheel != 0.0f) {
            const ImVec2 wp = ImGui::GetWindowPos();
            const float f = zoom.scroll(io.MouseWheel);
            ImGui::SetScrollX(tb::ViewerZoom::anchored_scroll(ImGui::GetScrollX(), io.MousePos.x - wp.x, f));
            ImGui::SetScrollY(tb::ViewerZoom::anchored_scroll(ImGui::GetScrollY(), io.MousePos.y - wp.y, f));
        }
        if (ImGui::IsMouseDragging(ImGuiMouseButton_Left)) {
            ImGui::SetScrollX(ImGui::GetScrollX() - io.MouseDelta.x);
            ImGui::SetScrollY(ImGui::GetScrollY() - io.MouseDelta.y);
        }
    }
    ImGui::EndChild();
}

// The view: draws the panel and returns the message the user triggered, if any.
static bool draw_panel(const tb::AppState& s, const ImageTexture& img, tb::ViewerZoom& zoom,
                       char* name_buf, size_t name_cap, tb::Message& out){
    bool fired = false;
    const ImGuiViewport* vp = ImGui::GetMainViewport();
    const float panel_w = std::min(800.0f, vp->WorkSize.x);
    ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + 0.5f*vp->WorkSize.x, vp->WorkPos.y + 0.5f*vp->WorkSize.y),
                            ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(panel_w, 0.0f), ImGuiCond_Always);
    ImGui::Begin("##panel", nullptr, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                     ImGuiWindowFlags_NoSavedSettings);

    if (img.tex && s.display) draw_viewer(*s.display, img, zoom);

    if (ImGui::Button("Render", ImVec2(-1, 0))) { out = tb::RenderPressed{}; fired = true; }

    ImGui::SetNextItemWidth(-108.0f);
    if (ImGui::InputTextWithHint("##file", "Your file name", name_buf, name_cap)) {
        out = tb::FileNameChanged{std::string(name_buf)}; fired = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Save", ImVec2(100, 0))) { out = tb::SaveFilePressed{}; fired = true; }

    if (!s.status.empty()) {
        const ImVec4 col = s.status_is_error ? ImVec4(1.0f, 0.45f, 0.4f, 1.0f) : ImVec4(0.7f, 0.7f, 0.7f, 1.0f);
        ImGui::TextColored(col, "%s", s.status.c_str());
    }
    ImGui::End();
    return fired;
}

static int run_window(tb::AppState s, const Opts& o){
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init: " << SDL_GetError() << "\n";
        return 1;
    }
    SDL_Window* window = SDL_CreateWindow("Tonebench Render Image",
                                          SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1024, 768,
                                          SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) {
        std::cerr << "SDL_CreateWindow: " << SDL_GetError() << "\n";
        SDL_Quit();
        return 1;
    }
    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_PRESENTVSYNC | SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();
    if (!o.font.empty()) {
        if (std::filesystem::exists(o.font)) io.Fonts->AddFontFromFileTTF(o.font.c_str(), 18.0f);
        else std::cerr << "Warning: font '" << o.font << "' not found, using the built-in font.\n";
    }
    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    int rc = 0;
    {
        ImageTexture img;
        tb::ViewerZoom zoom;
        char name_buf[256];
        std::snprintf(name_buf, sizeof(name_buf), "%s", s.file_name.c_str());

        bool running = true;
        while (running) {
            SDL_Event e;
            while (SDL_PollEvent(&e)) {
                ImGui_ImplSDL2_ProcessEvent(&e);
                if (e.type == SDL_QUIT) running = false;
                else if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
                         e.window.windowID == SDL_GetWindowID(window)) running = false;
            }

            if (!img.sync(renderer, s.display)) { rc = 1; break; }

            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            tb::Message m;
            const bool fired = draw_panel(s, img, zoom, name_buf, sizeof(name_buf), m);

            ImGui::Render();
            SDL_RenderSetScale(renderer, io.DisplayFramebufferScale.x, io.DisplayFramebufferScale.y);
            SDL_SetRenderDrawColor(renderer, 32, 33, 36, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);

            if (fired) s = tb::dispatch(std::move(s), std::move(m));
        }
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return rc;
}

// ---------------------------- MAIN ----------------------------
int main(int argc, char** argv) {
    Opts o = parse(argc, argv);

    tb::AppState s;
    try {
        s = tb::initial_state(config_from(o));
    } catch (const std::exception& ex) {
        std::cerr << "Render failed: " << ex.what() << "\n";
        return 2;
    }

    if (o.headless) return run_headless(s);
    return run_window(std::move(s), o);
}
