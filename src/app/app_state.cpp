#include "tonebench/app_state.hpp"
#include "tonebench/display_encoder.hpp"
#include "tonebench/exr_writer.hpp"
#include "tonebench/synthesizer.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>

namespace tb {

namespace {

// std::visit helper
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string save_path(const AppState& s){
    return (std::filesystem::path(s.output_dir) / (s.file_name + ".exr")).string();
}

Update update(const AppState& s, const Message& m){
    Update u{s, std::monostate{}};
    AppState& n = u.state;

    std::visit(overloaded{
        [&](const FileNameChanged& e){
            n.file_name = e.name;
        },
        [&](const RenderPressed&){
            n.status = "Rendering...";
            n.status_is_error = false;
            u.command = RenderCommand{s.width, s.height, s.tonemap};
        },
        [&](const RenderFinished& e){
            n.display = e.display;
            n.last_render_ms = e.millis;
            n.render_count = s.render_count + 1;
            n.status = "Rendered " + std::to_string(s.width) + "x" + std::to_string(s.height);
            n.status_is_error = false;
        },
        [&](const SaveFilePressed&){
            if (s.file_name.empty()){
                n.status = "Save failed: file name is empty";
                n.status_is_error = true;
                return;
            }
            const std::string path = save_path(s);
            n.status = "Saving " + path + " to disk..";
            n.status_is_error = false;
            u.command = SaveCommand{path, s.width, s.height};
        },
        [&](const SaveFinished& e){
            if (e.ok){
                n.status = "Saved " + e.path;
                n.status_is_error = false;
            } else {
                n.status = "Save failed: " + e.error;
                n.status_is_error = true;
            }
        }
    }, m);

    return u;
}

std::shared_ptr<const DisplayBuffer> render_display(int width, int height,
                                                    const PerceptualTonemapperParams& tonemap){
    const PerceptualTonemapper tm(tonemap);
    const LinearBuffer linear = synthesize_gradient(width, height);
    return std::make_shared<const DisplayBuffer>(encode_display(linear, tm));
}

Message run_command(const RenderCommand& c){
    auto t0 = std::chrono::steady_clock::now();
    auto display = render_display(c.width, c.height, c.tonemap);
    auto t1 = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    std::cout << "Rendered " << c.width << "x" << c.height << " in " << ms << " ms\n";
    return RenderFinished{std::move(display), ms};
}

Message run_command(const SaveCommand& c){
    // The scene-linear buffer is not kept between renders; it is cheap and deterministic,
    // so it is synthesized again at full precision for the file.
    const LinearBuffer linear = synthesize_gradient(c.width, c.height);
    std::string err;
    if (!write_rgba_exr(c.path, linear, &err)) return SaveFinished{c.path, false, err};
    std::cout << "Wrote " << c.path << "\n";
    return SaveFinished{c.path, true, ""};
}

AppState dispatch(AppState s, Message m){
    for (;;) {
        if (auto* e = std::get_if<FileNameChanged>(&m))
            std::cout << "New name: " << e->name << "\n";
        const bool saving = std::holds_alternative<SaveFilePressed>(m) || std::holds_alternative<SaveFinished>(m);

        Update u = update(s, m);
        s = std::move(u.state);
        if (std::holds_alternative<FileNameChanged>(m)) std::cout << "New file name: " << s.file_name << "\n";
        if (saving && s.status_is_error) std::cerr << s.status << "\n";

        if (auto* rc = std::get_if<RenderCommand>(&u.command)) {
            std::cout << "Rendering...\n";
            m = run_command(*rc);
        } else if (auto* sc = std::get_if<SaveCommand>(&u.command)) {
            std::cout << "Saving " << sc->path << " to disk..\n";
            m = run_command(*sc);
        } else {
            break;
        }
    }
    return s;
}

AppState initial_state(AppState config){
    return dispatch(std::move(config), RenderPressed{});
}

} // namespace tb
