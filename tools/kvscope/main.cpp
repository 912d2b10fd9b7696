//
// kvscope — Real-time plotter for key:value serial telemetry
//
// Reads "Time:t,name:value,..." records from a serial port, discovers signals
// as they appear, and plots the included ones over a sliding time window
// using ImGui + ImPlot. Every record can be logged to CSV.
//
// Usage: kvscope [--port <device>] [--baud <rate>] [--window <sec>] [--csv <path>]
//        kvscope [-p <device>] [-b <rate>] [-w <sec>] [-o <path>]
//

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <GL/gl.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <implot.h>

#include <kvs.h>
#include <kvs_csv.h>
#include <kvs_pump.h>
#include <kvs_select.h>
#include <kvs_serial.h>

#include "cli.h"
#include "decimate.h"

// ── Signal handling ──────────────────────────────────────────────────────────

static volatile sig_atomic_t g_shutdown = 0;

static void signal_handler(int) { g_shutdown = 1; }

// ── Window / ImGui setup ─────────────────────────────────────────────────────

static bool env_flag(const char *name) {
    const char *v = getenv(name);
    return v != nullptr &&
           (strcmp(v, "1") == 0 || strcmp(v, "true") == 0 || strcmp(v, "TRUE") == 0);
}

static bool init_window(GLFWwindow *&window, bool vsync) {
    if (!glfwInit()) {
        fprintf(stderr, "Error: failed to initialize GLFW.\n"
                        "Is a display server running (X11/Wayland)?\n");
        return false;
    }
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    window = glfwCreateWindow(1280, 720, "kvscope", nullptr, nullptr);
    if (!window) {
        fprintf(stderr, "Error: failed to create GLFW window.\n");
        glfwTerminate();
        return false;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(vsync && !env_flag("KVSCOPE_NO_VSYNC") ? 1 : 0);
    return true;
}

static void shutdown_window(GLFWwindow *window) {
    if (window != nullptr)
        glfwDestroyWindow(window);
    glfwTerminate();
}

static void init_imgui(GLFWwindow *window) {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImPlot::CreateContext();

    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330");
}

static void shutdown_imgui() {
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImPlot::DestroyContext();
    ImGui::DestroyContext();
}

static void begin_frame() {
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

static void end_frame(GLFWwindow *window) {
    ImGui::Render();
    int display_w = 0;
    int display_h = 0;
    glfwGetFramebufferSize(window, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    glClearColor(0.06f, 0.06f, 0.06f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
}

// ── App state ────────────────────────────────────────────────────────────────

enum class ConnStatus { Idle, Running, Error };

/// Decode errors arrive on the pump thread; the UI reads them per frame.
struct DropLog {
    std::mutex mtx;
    uint64_t count = 0;
    std::string last;
};

struct SignalRow {
    std::string name;
    bool included = true;
};

struct AppState {
    char port_buf[256] = "/dev/ttyUSB0";
    int baud = 9600;
    char window_buf[32] = "10";
    char csv_buf[512] = {};

    ConnStatus conn_status = ConnStatus::Idle;
    char status_msg[256] = "Idle";
    bool window_valid = true;

    std::vector<SignalRow> signals; // one checkbox per registered signal
    kvs::RenderFrame frame;

    char cmd_name[64] = {};
    double cmd_value = 0.0;
    char cmd_status[128] = {};

    kvs::SerialPort port;
    kvs::CsvSink csv;
    DropLog drops;
};

// ── Plot surface ─────────────────────────────────────────────────────────────

/// Draws one frame into a single ImPlot plot: one line per included signal,
/// coloured by registration order, with a legend.
class PlotSurface : public kvs::RenderSurface {
    std::vector<double> dec_t_, dec_v_;

    static constexpr size_t kMaxPlotPoints = 4000;

  public:
    void redraw(const kvs::RenderFrame &frame) override {
        ImVec2 avail = ImGui::GetContentRegionAvail();
        if (!ImPlot::BeginPlot("Real-time Data Plot", avail, ImPlotFlags_NoMouseText))
            return;

        ImPlot::SetupAxes("Time", nullptr, ImPlotAxisFlags_NoHighlight,
                          ImPlotAxisFlags_AutoFit | ImPlotAxisFlags_NoHighlight);
        if (frame.x_max > frame.x_min)
            ImPlot::SetupAxisLimits(ImAxis_X1, frame.x_min, frame.x_max, ImPlotCond_Always);
        ImPlot::SetupLegend(ImPlotLocation_NorthEast);

        for (const auto &s : frame.series) {
            ImPlot::SetNextLineStyle(ImPlot::GetColormapColor(static_cast<int>(s.index)));
            size_t ns = s.data.size();
            if (ns == 0) {
                // Keep the legend entry for a signal with nothing in the window
                ImPlot::PlotDummy(s.name.c_str());
                continue;
            }
            if (ns > kMaxPlotPoints) {
                size_t factor = ns / (kMaxPlotPoints / 2);
                size_t cap = kvscope::decimate_capacity(ns, factor);
                dec_t_.resize(cap);
                dec_v_.resize(cap);
                size_t dn =
                    kvscope::decimate_minmax(s.data.timestamps.data(), s.data.values.data(), ns,
                                             factor, dec_t_.data(), dec_v_.data());
                ImPlot::PlotLine(s.name.c_str(), dec_t_.data(), dec_v_.data(),
                                 static_cast<int>(dn));
            } else {
                ImPlot::PlotLine(s.name.c_str(), s.data.timestamps.data(), s.data.values.data(),
                                 static_cast<int>(ns));
            }
        }
        ImPlot::EndPlot();
    }
};

// ── Start / stop ─────────────────────────────────────────────────────────────

static void set_status(AppState &state, ConnStatus st, const char *fmt, const char *arg) {
    state.conn_status = st;
    snprintf(state.status_msg, sizeof(state.status_msg), fmt, arg);
}

static void do_start(AppState &state, kvs::StreamPump &pump) {
    pump.stop();
    if (!state.port.is_open() || state.port.path() != state.port_buf ||
        state.port.baud() != state.baud) {
        if (!state.port.open(state.port_buf, state.baud)) {
            state.conn_status = ConnStatus::Error;
            snprintf(state.status_msg, sizeof(state.status_msg), "Failed to open %s (%s)",
                     state.port_buf, state.port.last_error_message().c_str());
            return;
        }
    }

    // CSV path edited since the last start: start a new file
    if (state.csv_buf[0] == '\0') {
        state.csv.close();
    } else if (!state.csv.is_open() || state.csv.path() != state.csv_buf) {
        if (!state.csv.open(state.csv_buf)) {
            set_status(state, ConnStatus::Error, "Failed to open CSV %s", state.csv_buf);
            return;
        }
    }
    pump.set_sink(state.csv.is_open() ? &state.csv : nullptr);

    if (!pump.start(state.port)) {
        set_status(state, ConnStatus::Error, "Failed to start on %s", state.port_buf);
        return;
    }
    set_status(state, ConnStatus::Running, "Reading %s", state.port_buf);
    printf("kvscope: reading %s at %d baud\n", state.port_buf, state.baud);
}

static void do_stop(AppState &state, kvs::StreamPump &pump) {
    pump.stop();
    set_status(state, ConnStatus::Idle, "Stopped (%s)", state.port_buf);
}

/// New session: forget signals and samples, truncate the CSV.
static void do_clear(AppState &state, kvs::StreamPump &pump, kvs::RenderSelector &selector) {
    if (!pump.clear())
        return;
    selector.take_new_signals();
    state.signals.clear();
    state.frame.clear();
    if (state.csv.is_open()) {
        std::string path = state.csv.path();
        if (!state.csv.open(path.c_str()))
            set_status(state, ConnStatus::Error, "Failed to reopen CSV %s", path.c_str());
    }
    std::lock_guard<std::mutex> lock(state.drops.mtx);
    state.drops.count = 0;
    state.drops.last.clear();
}

// ── UI ───────────────────────────────────────────────────────────────────────

static void render_toolbar(AppState &state, kvs::StreamPump &pump, kvs::RenderSelector &selector) {
    bool running = pump.is_running();

    // The pump stops by itself when the port goes away
    if (!running && state.conn_status == ConnStatus::Running) {
        kvs::ReadStatus st = pump.last_transport_status();
        state.port.close();
        set_status(state, st == kvs::ReadStatus::Error ? ConnStatus::Error : ConnStatus::Idle,
                   "Port closed (%s)", kvs::read_status_str(st));
    }

    if (running)
        ImGui::BeginDisabled();
    ImGui::SetNextItemWidth(180);
    ImGui::InputText("Port", state.port_buf, sizeof(state.port_buf));
    ImGui::SameLine();
    ImGui::SetNextItemWidth(100);
    ImGui::InputInt("Baud", &state.baud, 0, 0);
    ImGui::SameLine();
    ImGui::SetNextItemWidth(220);
    ImGui::InputTextWithHint("CSV", "(no logging)", state.csv_buf, sizeof(state.csv_buf));
    if (running)
        ImGui::EndDisabled();

    ImGui::SameLine();
    ImGui::SetNextItemWidth(80);
    ImGui::InputText("Window [s]", state.window_buf, sizeof(state.window_buf),
                     ImGuiInputTextFlags_CharsDecimal);

    ImGui::SameLine();
    if (!running) {
        if (ImGui::Button("Start")) {
            if (!kvs::is_valid_baud(state.baud)) {
                state.conn_status = ConnStatus::Error;
                snprintf(state.status_msg, sizeof(state.status_msg), "Unsupported baud rate %d",
                         state.baud);
            } else {
                do_start(state, pump);
            }
        }
        ImGui::SameLine();
        if (ImGui::Button("Clear"))
            do_clear(state, pump, selector);
    } else if (ImGui::Button("Stop")) {
        do_stop(state, pump);
    }

    ImVec4 color;
    switch (state.conn_status) {
    case ConnStatus::Running:
        color = ImVec4(0.2f, 0.9f, 0.2f, 1.0f);
        break;
    case ConnStatus::Error:
        color = ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
        break;
    default:
        color = ImVec4(0.6f, 0.6f, 0.6f, 1.0f);
        break;
    }
    ImGui::SameLine();
    ImGui::TextColored(color, "%s", state.status_msg);

    kvs::PumpStats st = pump.stats();
    ImGui::Text("lines: %lu  stored: %lu  dropped: %lu  malformed fields: %lu  overruns: %lu",
                (unsigned long)st.lines, (unsigned long)st.decoded, (unsigned long)st.dropped,
                (unsigned long)st.malformed_fields, (unsigned long)st.overruns);
    if (state.csv.is_open()) {
        ImGui::SameLine();
        ImGui::Text("| csv rows: %lu", (unsigned long)state.csv.rows());
        if (state.csv.write_errors() > 0) {
            ImGui::SameLine();
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "write errors: %lu",
                               (unsigned long)state.csv.write_errors());
        }
    }
    {
        std::lock_guard<std::mutex> lock(state.drops.mtx);
        if (!state.drops.last.empty()) {
            ImGui::SameLine();
            ImGui::TextColored(ImVec4(1.0f, 0.6f, 0.2f, 1.0f), "| last dropped: %s",
                               state.drops.last.c_str());
        }
    }
    if (!state.window_valid) {
        ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s",
                           kvs::config_error_str(kvs::ConfigError::InvalidWindowSize));
    }
}

static void render_signal_panel(AppState &state, kvs::StreamPump &pump,
                                kvs::RenderSelector &selector) {
    for (auto &name : selector.take_new_signals())
        state.signals.push_back(SignalRow{std::move(name), true});

    ImGui::SeparatorText("Select Signals to Plot");
    if (state.signals.empty())
        ImGui::TextDisabled("Waiting for data ...");
    for (size_t i = 0; i < state.signals.size(); ++i) {
        SignalRow &row = state.signals[i];
        ImGui::PushID(static_cast<int>(i));
        ImVec4 c = ImPlot::GetColormapColor(static_cast<int>(i));
        ImGui::ColorButton("##color", c, ImGuiColorEditFlags_NoTooltip, ImVec2(12, 12));
        ImGui::SameLine();
        if (ImGui::Checkbox(row.name.c_str(), &row.included))
            selector.toggle(row.name, row.included);
        ImGui::PopID();
    }

    // Outbound command: "name:value" written to the device
    ImGui::SeparatorText("Send Command");
    ImGui::SetNextItemWidth(-1);
    ImGui::InputTextWithHint("##cmd_name", "name", state.cmd_name, sizeof(state.cmd_name));
    ImGui::SetNextItemWidth(-1);
    ImGui::InputDouble("##cmd_value", &state.cmd_value, 0, 0, "%g");
    bool can_send = pump.is_running();
    if (!can_send)
        ImGui::BeginDisabled();
    if (ImGui::Button("Send")) {
        if (pump.send_command(state.cmd_name, state.cmd_value))
            snprintf(state.cmd_status, sizeof(state.cmd_status), "sent %s", state.cmd_name);
        else
            snprintf(state.cmd_status, sizeof(state.cmd_status), "send failed");
    }
    if (!can_send)
        ImGui::EndDisabled();
    if (state.cmd_status[0] != '\0')
        ImGui::TextDisabled("%s", state.cmd_status);
}

static void render_ui(AppState &state, kvs::StreamPump &pump, kvs::RenderSelector &selector,
                      PlotSurface &surface) {
    ImGui::SetNextWindowPos(ImVec2(0, 0));
    ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
    ImGui::Begin("kvscope", nullptr,
                 ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                     ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

    render_toolbar(state, pump, selector);
    ImGui::Separator();

    // Render tick: validate the window, snapshot, draw. An invalid window
    // keeps the previous frame on screen.
    double window = strtod(state.window_buf, nullptr);
    kvs::ConfigError err = selector.visible_series(window, state.frame);
    state.window_valid = (err == kvs::ConfigError::None);
    if (state.window_valid)
        pump.set_window_size(window);

    float panel_w = 220.0f;
    ImVec2 avail = ImGui::GetContentRegionAvail();
    ImGui::BeginChild("##plot", ImVec2(avail.x - panel_w, 0));
    surface.redraw(state.frame);
    ImGui::EndChild();
    ImGui::SameLine();
    ImGui::BeginChild("##signals", ImVec2(0, 0), ImGuiChildFlags_Border);
    render_signal_panel(state, pump, selector);
    ImGui::EndChild();

    ImGui::End();
}

// ── Main ─────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    kvscope::CliArgs args = kvscope::parse_args(argc, argv);
    if (args.help) {
        kvscope::print_usage(argv[0]);
        return 0;
    }
    if (args.error) {
        kvscope::print_usage(argv[0]);
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    AppState state;
    state.baud = args.baud;
    snprintf(state.window_buf, sizeof(state.window_buf), "%g", args.window_seconds);
    if (args.has_csv)
        snprintf(state.csv_buf, sizeof(state.csv_buf), "%s", args.csv_path);

    kvs::StreamPump pump(args.tick_hz);
    pump.set_window_size(args.window_seconds);
    pump.set_error_handler([&state](kvs::DecodeError err, std::string_view line) {
        std::lock_guard<std::mutex> lock(state.drops.mtx);
        state.drops.count++;
        state.drops.last.assign(line.substr(0, 80));
        state.drops.last += " (";
        state.drops.last += kvs::decode_error_str(err);
        state.drops.last += ")";
    });
    kvs::RenderSelector selector(pump);
    PlotSurface surface;

    GLFWwindow *window = nullptr;
    if (!init_window(window, args.vsync))
        return 1;
    init_imgui(window);

    int frame_cap_fps = 0;
    if (const char *fps_env = getenv("KVSCOPE_MAX_FPS")) {
        frame_cap_fps = atoi(fps_env);
        if (frame_cap_fps < 0)
            frame_cap_fps = 0;
    }

    if (args.has_port) {
        snprintf(state.port_buf, sizeof(state.port_buf), "%s", args.port);
        do_start(state, pump);
        if (state.conn_status == ConnStatus::Error) {
            fprintf(stderr, "Error: %s\n", state.status_msg);
            shutdown_imgui();
            shutdown_window(window);
            return 1;
        }
    }

    while (!glfwWindowShouldClose(window) && !g_shutdown) {
        auto frame_start = std::chrono::steady_clock::now();
        glfwPollEvents();
        if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS)
            break;

        begin_frame();
        render_ui(state, pump, selector, surface);
        end_frame(window);

        if (frame_cap_fps > 0) {
            auto frame_budget =
                std::chrono::duration<double>(1.0 / static_cast<double>(frame_cap_fps));
            std::this_thread::sleep_until(
                frame_start +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(frame_budget));
        }
    }

    pump.stop();
    state.csv.close();
    state.port.close();
    shutdown_imgui();
    shutdown_window(window);
    {
        std::lock_guard<std::mutex> lock(state.drops.mtx);
        if (state.drops.count > 0)
            printf("kvscope: %lu lines dropped\n", (unsigned long)state.drops.count);
    }
    printf("kvscope: shutdown complete\n");
    return 0;
}
