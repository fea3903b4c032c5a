#pragma once
#include <memory>
#include <string>
#include <variant>
#include "tonebench/frame_buffer.hpp"
#include "tonebench/tonemap.hpp"

namespace tb {

// Everything the window shows. Treated as a value: update() returns a new one, the display
// buffer is shared and never written after it is published.
struct AppState {
    std::string file_name  = "sample_file";
    std::string output_dir = ".";
    int width = 1024, height = 1024;
    PerceptualTonemapperParams tonemap;

    std::shared_ptr<const DisplayBuffer> display;
    int    render_count   = 0;
    double last_render_ms = 0.0;

    std::string status;            // last user-facing message, shown under the controls
    bool        status_is_error = false;
};

// <output_dir>/<file_name>.exr
std::string save_path(const AppState& s);

// --- Messages (view -> update) ---
struct FileNameChanged { std::string name; };
struct RenderPressed   {};
struct RenderFinished  { std::shared_ptr<const DisplayBuffer> display; double millis = 0.0; };
struct SaveFilePressed {};
struct SaveFinished    { std::string path; bool ok = false; std::string error; };

using Message = std::variant<FileNameChanged, RenderPressed, RenderFinished, SaveFilePressed, SaveFinished>;

// --- Commands (update -> runtime) ---
struct RenderCommand { int width = 0, height = 0; PerceptualTonemapperParams tonemap; };
struct SaveCommand   { std::string path; int width = 0, height = 0; };

using Command = std::variant<std::monostate, RenderCommand, SaveCommand>;

struct Update {
    AppState state;
    Command  command;
};

// Pure: no I/O, no rendering. Effects are handed back as a Command.
Update update(const AppState& s, const Message& m);

// Synthesize + encode. Used by RenderCommand and for the first frame.
std::shared_ptr<const DisplayBuffer> render_display(int width, int height,
                                                    const PerceptualTonemapperParams& tonemap);

// Performs the effect synchronously and returns the message that reports its outcome.
Message run_command(const RenderCommand& c);
Message run_command(const SaveCommand& c);

// update() + run_command() until no command is left. Logs what happens.
AppState dispatch(AppState s, Message m);

// Config in, first frame rendered.
AppState initial_state(AppState config);

} // namespace tb
