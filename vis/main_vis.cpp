// main_vis.cpp
// - Drives seqviz::AnimationController from a wall-time accumulator at a fixed 60 Hz tick
// - Renders parts as alpha-blended boxes coloured by visual class, plus the arm chain,
//   gripper and end-effector target (fixed-pipeline GL, no assets)
// - Scrub slider maps ImGui activate/edit/deactivate to scrubStart/scrub/scrubEnd
// - Optional mock execution run feeds snapshots into the controller on every revision
// - Plots come from the controller telemetry ring (last 2048 frames)

#include <vector>
#include <string>
#include <deque>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstdint>

#include "AnimationController.h"
#include "DemoAssemblies.h"
#include "FrameEvents.h"
#include "MockExecution.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define SEQVIZ_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include "imgui_internal.h"  // DockSpaceOverViewport

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

// ============================================================
// Vis-local float math (model works in double)
// ============================================================

struct Vec3f { float x, y, z; };

static Vec3f v3f(float x, float y, float z) { return {x,y,z}; }

static Vec3f to_v3f(const seqviz::Vec3d& v) {
    return v3f((float)v.x, (float)v.y, (float)v.z);
}

static Vec3f add(Vec3f a, Vec3f b) { return {a.x+b.x, a.y+b.y, a.z+b.z}; }
static Vec3f sub(Vec3f a, Vec3f b) { return {a.x-b.x, a.y-b.y, a.z-b.z}; }
static Vec3f mul(Vec3f a, float s)  { return {a.x*s, a.y*s, a.z*s}; }

static float clampf(float x, float lo, float hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

static float dot(Vec3f a, Vec3f b) { return a.x*b.x + a.y*b.y + a.z*b.z; }
static Vec3f cross(Vec3f a, Vec3f b) { return { a.y*b.z - a.z*b.y, a.z*b.x - a.x*b.z, a.x*b.y - a.y*b.x }; }
static float len(Vec3f a) { return std::sqrt(dot(a,a)); }
static Vec3f norm(Vec3f a) {
    float l = len(a);
    return (l > 1e-6f) ? mul(a, 1.0f/l) : v3f(0,0,0);
}

static void set_perspective(float fovy_deg, float aspect, float znear, float zfar) {
    // OpenGL fixed pipeline expects column-major matrix.
    const float fovy_rad = fovy_deg * 3.1415926535f / 180.0f;
    const float f = 1.0f / std::tan(0.5f * fovy_rad);

    float m[16] = {};
    m[0]  = f / aspect;
    m[5]  = f;
    m[10] = (zfar + znear) / (znear - zfar);
    m[11] = -1.0f;
    m[14] = (2.0f * zfar * znear) / (znear - zfar);

    glMatrixMode(GL_PROJECTION);
    glLoadMatrixf(m);
}

struct CameraBasis {
    Vec3f eye, fwd, side, up;
};

static CameraBasis make_camera_basis(Vec3f eye, Vec3f center, Vec3f up) {
    CameraBasis b{};
    b.eye = eye;
    b.fwd = norm(sub(center, eye));
    b.side = norm(cross(b.fwd, norm(up)));
    b.up = cross(b.side, b.fwd);
    return b;
}

static void look_at(const CameraBasis& b) {
    float m[16] = {
        b.side.x, b.up.x, -b.fwd.x, 0.0f,
        b.side.y, b.up.y, -b.fwd.y, 0.0f,
        b.side.z, b.up.z, -b.fwd.z, 0.0f,
        0.0f,     0.0f,   0.0f,     1.0f
    };

    glMatrixMode(GL_MODELVIEW);
    glLoadMatrixf(m);
    glTranslatef(-b.eye.x, -b.eye.y, -b.eye.z);
}

static void draw_wire_box(Vec3f c, Vec3f half) {
    const float x0 = c.x - half.x, x1 = c.x + half.x;
    const float y0 = c.y - half.y, y1 = c.y + half.y;
    const float z0 = c.z - half.z, z1 = c.z + half.z;

    glBegin(GL_LINES);
    // bottom
    glVertex3f(x0,y0,z0); glVertex3f(x1,y0,z0);
    glVertex3f(x1,y0,z0); glVertex3f(x1,y0,z1);
    glVertex3f(x1,y0,z1); glVertex3f(x0,y0,z1);
    glVertex3f(x0,y0,z1); glVertex3f(x0,y0,z0);
    // top
    glVertex3f(x0,y1,z0); glVertex3f(x1,y1,z0);
    glVertex3f(x1,y1,z0); glVertex3f(x1,y1,z1);
    glVertex3f(x1,y1,z1); glVertex3f(x0,y1,z1);
    glVertex3f(x0,y1,z1); glVertex3f(x0,y1,z0);
    // verticals
    glVertex3f(x0,y0,z0); glVertex3f(x0,y1,z0);
    glVertex3f(x1,y0,z0); glVertex3f(x1,y1,z0);
    glVertex3f(x1,y0,z1); glVertex3f(x1,y1,z1);
    glVertex3f(x0,y0,z1); glVertex3f(x0,y1,z1);
    glEnd();
}

static void draw_solid_box(Vec3f c, Vec3f half) {
    const float x0 = c.x - half.x, x1 = c.x + half.x;
    const float y0 = c.y - half.y, y1 = c.y + half.y;
    const float z0 = c.z - half.z, z1 = c.z + half.z;

    glBegin(GL_QUADS);
    // +Z
    glVertex3f(x0,y0,z1); glVertex3f(x1,y0,z1); glVertex3f(x1,y1,z1); glVertex3f(x0,y1,z1);
    // -Z
    glVertex3f(x1,y0,z0); glVertex3f(x0,y0,z0); glVertex3f(x0,y1,z0); glVertex3f(x1,y1,z0);
    // +X
    glVertex3f(x1,y0,z1); glVertex3f(x1,y0,z0); glVertex3f(x1,y1,z0); glVertex3f(x1,y1,z1);
    // -X
    glVertex3f(x0,y0,z0); glVertex3f(x0,y0,z1); glVertex3f(x0,y1,z1); glVertex3f(x0,y1,z0);
    // +Y
    glVertex3f(x0,y1,z1); glVertex3f(x1,y1,z1); glVertex3f(x1,y1,z0); glVertex3f(x0,y1,z0);
    // -Y
    glVertex3f(x0,y0,z0); glVertex3f(x1,y0,z0); glVertex3f(x1,y0,z1); glVertex3f(x0,y0,z1);
    glEnd();
}

static void draw_line(Vec3f a, Vec3f b) {
    glBegin(GL_LINES);
    glVertex3f(a.x,a.y,a.z);
    glVertex3f(b.x,b.y,b.z);
    glEnd();
}

// Very simple arrow: shaft + line head.
static void draw_arrow(Vec3f origin, Vec3f dir_unit, float length_m) {
    Vec3f d = norm(dir_unit);
    if (len(d) < 1e-6f || length_m <= 1e-4f) return;

    Vec3f tip = add(origin, mul(d, length_m));

    Vec3f up = (std::abs(d.y) < 0.9f) ? v3f(0,1,0) : v3f(1,0,0);
    Vec3f x = norm(cross(up, d));
    Vec3f y = cross(d, x);

    const float head_len = length_m * 0.18f;
    const float head_w   = length_m * 0.06f;

    draw_line(origin, tip);
    draw_line(tip, add(tip, add(mul(d, -head_len), mul(x,  head_w))));
    draw_line(tip, add(tip, add(mul(d, -head_len), mul(x, -head_w))));
    draw_line(tip, add(tip, add(mul(d, -head_len), mul(y,  head_w))));
    draw_line(tip, add(tip, add(mul(d, -head_len), mul(y, -head_w))));
}

static void draw_floor_grid(Vec3f center, float half, int cells) {
    if (cells <= 0 || half <= 0.0f) return;
    const float step = (2.0f * half) / (float)cells;
    glBegin(GL_LINES);
    for (int i = 0; i <= cells; ++i) {
        const float o = -half + step * (float)i;
        glVertex3f(center.x + o, center.y, center.z - half);
        glVertex3f(center.x + o, center.y, center.z + half);
        glVertex3f(center.x - half, center.y, center.z + o);
        glVertex3f(center.x + half, center.y, center.z + o);
    }
    glEnd();
}

// Ray vs axis-aligned box intersection (slab method).
// Returns true if intersects; t_hit is distance along ray to first hit (>=0).
static bool ray_aabb_intersect(Vec3f ro, Vec3f rd, Vec3f box_center, Vec3f box_half, float& t_hit) {
    auto inv = [&](float v) -> float { return (std::abs(v) > 1e-8f) ? (1.0f / v) : 1e30f; };

    float tmin = -1e30f;
    float tmax =  1e30f;

    float tx1 = (box_center.x - box_half.x - ro.x) * inv(rd.x);
    float tx2 = (box_center.x + box_half.x - ro.x) * inv(rd.x);
    tmin = std::max(tmin, std::min(tx1, tx2));
    tmax = std::min(tmax, std::max(tx1, tx2));

    float ty1 = (box_center.y - box_half.y - ro.y) * inv(rd.y);
    float ty2 = (box_center.y + box_half.y - ro.y) * inv(rd.y);
    tmin = std::max(tmin, std::min(ty1, ty2));
    tmax = std::min(tmax, std::max(ty1, ty2));

    float tz1 = (box_center.z - box_half.z - ro.z) * inv(rd.z);
    float tz2 = (box_center.z + box_half.z - ro.z) * inv(rd.z);
    tmin = std::max(tmin, std::min(tz1, tz2));
    tmax = std::min(tmax, std::max(tz1, tz2));

    if (tmax < 0.0f) return false;       // box behind ray
    if (tmin > tmax) return false;

    t_hit = (tmin >= 0.0f) ? tmin : tmax; // if inside box, take exiting hit
    return t_hit >= 0.0f;
}

static void visual_class_color(seqviz::VisualClass c, float& r, float& g, float& b) {
    switch (c) {
        case seqviz::VisualClass::Ghost:    r = 0.55f; g = 0.60f; b = 0.70f; break;
        case seqviz::VisualClass::Active:   r = 1.00f; g = 0.60f; b = 0.15f; break;
        case seqviz::VisualClass::Complete: r = 0.35f; g = 0.75f; b = 0.45f; break;
        case seqviz::VisualClass::Selected: r = 1.00f; g = 0.95f; b = 0.25f; break;
        default:                            r = 0.80f; g = 0.80f; b = 0.80f; break;
    }
}

static void ee_phase_color(seqviz::world::EndEffectorPhase p, float& r, float& g, float& b) {
    using seqviz::world::EndEffectorPhase;
    switch (p) {
        case EndEffectorPhase::Approach: r = 0.30f; g = 0.70f; b = 1.00f; break;
        case EndEffectorPhase::Grasp:    r = 1.00f; g = 0.85f; b = 0.20f; break;
        case EndEffectorPhase::Retreat:  r = 0.80f; g = 0.45f; b = 1.00f; break;
        default:                         r = 0.60f; g = 0.60f; b = 0.60f; break;
    }
}

struct EventLabel {
    std::uint32_t bit;
    const char* text;
    bool warning;
};

static const EventLabel kEventLabels[] = {
    { seqviz::Event_PhaseChanged,          "phase changed",        false },
    { seqviz::Event_StepCompleted,         "step completed",       false },
    { seqviz::Event_ExecStepStarted,       "exec step started",    false },
    { seqviz::Event_ExecStepSucceeded,     "exec step succeeded",  false },
    { seqviz::Event_ExecStepFailed,        "exec step failed",     false },
    { seqviz::Event_ExecHumanIntervention, "human intervention",   false },
    { seqviz::Event_ExecReset,             "exec reset",           false },
    { seqviz::Event_AutoplayFired,         "autoplay fired",       false },
    { seqviz::Event_AssemblyLoaded,        "assembly loaded",      false },
    { seqviz::Warn_SnapshotIgnored,        "snapshot ignored",     true  },
    { seqviz::Warn_ScrubWithoutStart,      "scrub without start",  true  },
    { seqviz::Warn_ControlIgnored,         "control ignored",      true  },
    { seqviz::Warn_TargetNotPermitted,     "target not permitted", true  },
    { seqviz::Warn_OpaqueCountDecreased,   "opaque count dropped", true  },
};

struct VisualUIState {
    bool show_hud = true;
    bool show_controls = true;
    bool show_plots = true;

    bool draw_floor = true;
    bool draw_parts = true;
    bool draw_outlines = true;
    bool draw_approach = false;
    bool draw_arm = true;
    bool draw_target = true;
};

static void plot_line_with_xlimits(const char* title,
                                  const char* label,
                                  const double* xs,
                                  const double* ys,
                                  int count,
                                  double t0,
                                  double t1)
{
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title)) {

        // --- X-axis handling (robust across ImPlot versions) ---
#if defined(ImAxis_X1)
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
        ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
#endif

        ImPlot::PlotLine(label, xs, ys, count);

        ImPlot::EndPlot();
    }
}

static void print_usage() {
    std::fprintf(stdout, "seqviz_vis usage:\n");
    std::fprintf(stdout, "  seqviz_vis [--assembly <name>] [--autoplay]\n");
    std::fprintf(stdout, "  assemblies:");
    for (const std::string& n : seqviz::demoAssemblyNames()) std::fprintf(stdout, " %s", n.c_str());
    std::fprintf(stdout, "\n");
}

int main(int argc, char** argv) {
    // --- CLI flags ---
    std::string assembly_name = "bearing_housing";
    bool autoplay = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--assembly" && i + 1 < argc) {
            assembly_name = argv[++i];
        } else if (arg == "--autoplay") {
            autoplay = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::fprintf(stdout, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    seqviz::AssemblyDefinition def;
    if (!seqviz::makeDemoAssembly(assembly_name, def)) {
        return fail("unknown assembly (see --help)");
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "SeqViz Assembly Viewer", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    // Validate OpenGL context exists.
    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Vendor:   %s\n", glGetString(GL_VENDOR));
    std::fprintf(stderr, "OpenGL Renderer: %s\n", glGetString(GL_RENDERER));
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef SEQVIZ_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    // --- Animation core ---
    seqviz::AnimationConfigV1 cfg;
    cfg.autoplay_after_demo_u32 = autoplay ? 1u : 0u;

    seqviz::AnimationController ctl;
    if (!ctl.setConfig(cfg)) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImPlot::DestroyContext();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("animation config rejected");
    }

    seqviz::MockExecutionRunner runner;
    std::uint32_t posted_revision = 0;
    bool exec_link = true;
    int exec_fail_step = -1;
    float exec_interval_s = 5.0f;

    VisualUIState ui;

    // --- Camera (orbit around the assembly centroid) ---
    float cam_yaw_deg   = 35.0f;
    float cam_pitch_deg = 25.0f;
    float cam_dist      = 1.0f;
    Vec3f cam_target    = v3f(0.0f, 0.0f, 0.0f);
    CameraBasis cam{};

    int assembly_idx = 0;
    const std::vector<std::string>& names = seqviz::demoAssemblyNames();
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == assembly_name) assembly_idx = (int)i;
    }

    std::deque<std::string> event_log;
    constexpr std::size_t kMaxEventLog = 64;

    auto load_assembly = [&](const seqviz::AssemblyDefinition& d) {
        ctl.loadAssembly(d);
        runner.setAssembly(d);
        posted_revision = runner.revision();

        const seqviz::StepIndex& idx = ctl.index();
        cam_target = to_v3f(idx.centroid_m());
        cam_dist = (float)(idx.radius_m() * 5.0);
        event_log.clear();
    };
    load_assembly(def);

    constexpr double kTick_s = 1.0 / 60.0;
    constexpr int kMaxSubstepsPerFrame = 20;
    double wall_prev = glfwGetTime();
    double accum_s = 0.0;
    int last_substeps = 0;
    bool dropped_accum = false;

    float scrub_value = 0.0f;

    std::vector<seqviz::FrameTelemetrySample> telem(2048);
    std::vector<double> t_hist, progress_hist, sequence_hist, reach_hist, gap_hist, complete_hist;

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // --- advance animation (wall-time accumulator) ---
        const double wall_now = glfwGetTime();
        double wall_dt = wall_now - wall_prev;
        wall_prev = wall_now;
        wall_dt = std::clamp(wall_dt, 0.0, 0.1);

        accum_s += wall_dt;
        int substeps = 0;
        dropped_accum = false;
        while (accum_s >= kTick_s && substeps < kMaxSubstepsPerFrame) {
            runner.tick(kTick_s);
            if (exec_link && runner.revision() != posted_revision) {
                posted_revision = runner.revision();
                ctl.postExecutionSnapshot(runner.snapshot());
            }
            ctl.tick(kTick_s);

            const std::uint32_t ev = ctl.getLatestEvents();
            for (const EventLabel& l : kEventLabels) {
                if ((ev & l.bit) == 0u) continue;
                char line[96];
                std::snprintf(line, sizeof(line), "%8.2f  %s%s", ctl.frame().time_s,
                              l.warning ? "WARN " : "", l.text);
                event_log.push_front(line);
            }
            while (event_log.size() > kMaxEventLog) event_log.pop_back();

            accum_s -= kTick_s;
            ++substeps;
        }
        last_substeps = substeps;
        if (substeps == kMaxSubstepsPerFrame) {
            accum_s = 0.0;
            dropped_accum = true;
        }

        const seqviz::FrameOutput& fo = ctl.frame();
        const seqviz::StepIndex& index = ctl.index();

        // --- ImGui frame ---
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef SEQVIZ_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        if (ui.show_hud) {
            ImGuiWindowFlags hud_flags =
                ImGuiWindowFlags_NoDecoration |
                ImGuiWindowFlags_AlwaysAutoResize |
                ImGuiWindowFlags_NoSavedSettings |
                ImGuiWindowFlags_NoFocusOnAppearing |
                ImGuiWindowFlags_NoNav;

            ImVec2 viewport_size = ImGui::GetMainViewport()->Size;
            ImGui::SetNextWindowPos(ImVec2(viewport_size.x - 12, 12), ImGuiCond_Always, ImVec2(1.0f, 0.0f));
            ImGui::SetNextWindowBgAlpha(0.85f);

            if (ImGui::Begin("##Hud", &ui.show_hud, hud_flags)) {
                const ImVec4 header_col = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
                const ImVec4 status_warn = ImVec4(1.0f, 1.0f, 0.0f, 1.0f);

                ImGui::TextColored(header_col, "[ %s ]", def.name.c_str());
                ImGui::Separator();

                ImGui::Text("TIME:  %.2f s", fo.time_s);
                ImGui::Text("PHASE: %s", seqviz::phaseName(fo.animation.phase));
                ImGui::ProgressBar((float)fo.animation.progress_0_1, ImVec2(260, 12), "");

                const int active = fo.animation.active_step_index;
                if (active >= 0 && active < index.stepCount()) {
                    ImGui::Text("STEP:  %d/%d  %s", active + 1, index.stepCount(),
                                index.step(active).name.c_str());
                } else {
                    ImGui::Text("STEP:  -/%d", index.stepCount());
                }
                ImGui::Text("SEQ:   %.1f %%", 100.0 * fo.animation.sequence_progress_0_1);
                ImGui::Text("DONE:  %d parts opaque", (int)seqviz::countFullyOpaque(fo.parts));
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== ARM ===");
                ImGui::Text("EE:    %s", seqviz::world::endEffectorPhaseName(fo.execution.end_effector_phase));
                ImGui::Text("Reach: %.2f", fo.arm.reach_0_1);
                ImGui::SameLine(140);
                ImGui::ProgressBar((float)fo.arm.reach_0_1, ImVec2(120, 12), "");
                ImGui::Text("Grip:  %.2f", fo.arm.gripper_gap_0_1);
                ImGui::SameLine(140);
                ImGui::ProgressBar((float)fo.arm.gripper_gap_0_1, ImVec2(120, 12), "");

                if (ctl.autoplayArmed()) {
                    ImGui::TextColored(status_warn, "Autoplay in %.1f s", ctl.autoplayRemaining_s());
                }
                if (dropped_accum) {
                    ImGui::Separator();
                    ImGui::TextColored(ImVec4(1.0f, 0.2f, 0.2f, 1.0f), ">> REALTIME DROPPED");
                }
            }
            ImGui::End();
        }

        if (ui.show_controls) {
            ImGui::SetNextWindowSize(ImVec2(460, 640), ImGuiCond_FirstUseEver);
            ImGui::Begin(">> CONTROL CONSOLE", &ui.show_controls);

            const ImVec4 cmd_header = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);

            if (ImGui::BeginTabBar("ControlTabs", ImGuiTabBarFlags_None)) {

                if (ImGui::BeginTabItem("  PLAY  ")) {
                    ImGui::TextColored(cmd_header, "[PLAYBACK] Transport");
                    ImGui::Separator();

                    const bool playing = fo.animation.phase == seqviz::Phase::Playing;
                    if (ImGui::Button(" << ", ImVec2(60, 0))) ctl.stepBackward();
                    ImGui::SameLine();
                    if (ImGui::Button(playing ? " PAUSE " : " PLAY ", ImVec2(100, 0))) ctl.toggle();
                    ImGui::SameLine();
                    if (ImGui::Button(" >> ", ImVec2(60, 0))) ctl.stepForward();
                    ImGui::SameLine();
                    if (ImGui::Button(" STOP ", ImVec2(80, 0))) ctl.forceIdle();

                    if (ImGui::Button("[ REPLAY DEMO ]", ImVec2(-1, 0))) ctl.replayDemo();
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[SCRUB] Sequence Position");
                    ImGui::Separator();
                    if (!ImGui::IsMouseDown(ImGuiMouseButton_Left) ||
                        fo.animation.phase != seqviz::Phase::Scrubbing) {
                        scrub_value = (float)fo.animation.sequence_progress_0_1;
                    }
                    const bool changed = ImGui::SliderFloat("##scrub", &scrub_value, 0.0f, 1.0f, "%.3f");
                    if (ImGui::IsItemActivated()) ctl.scrubStart();
                    if (changed) ctl.scrub((double)scrub_value);
                    if (ImGui::IsItemDeactivated()) ctl.scrubEnd();
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[ASSEMBLY] Load");
                    ImGui::Separator();
                    std::vector<const char*> name_ptrs;
                    for (const std::string& n : names) name_ptrs.push_back(n.c_str());
                    ImGui::Combo(">> Assembly", &assembly_idx, name_ptrs.data(), (int)name_ptrs.size());
                    if (ImGui::Button("[ LOAD ]", ImVec2(-1, 0))) {
                        seqviz::AssemblyDefinition next;
                        if (seqviz::makeDemoAssembly(names[(std::size_t)assembly_idx], next)) {
                            def = next;
                            load_assembly(def);
                            scrub_value = 0.0f;
                        }
                    }
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[STEPS]");
                    ImGui::Separator();
                    for (int s = 0; s < index.stepCount(); ++s) {
                        const bool is_active = (s == fo.animation.active_step_index);
                        ImGui::TextColored(is_active ? ImVec4(1.0f, 0.6f, 0.15f, 1.0f) : ImVec4(0.7f, 0.7f, 0.7f, 1.0f),
                                           "%s %-10s %s", is_active ? ">" : " ",
                                           index.step(s).id.c_str(), index.step(s).name.c_str());
                    }

                    if (last_substeps > 0) {
                        ImGui::Spacing();
                        ImGui::TextColored(ImVec4(0.0f, 1.0f, 1.0f, 1.0f), "Substeps:    %d", last_substeps);
                    }
                    ImGui::EndTabItem();
                }

                if (ImGui::BeginTabItem("  EXEC  ")) {
                    ImGui::TextColored(cmd_header, "[EXEC] Mock Execution Run");
                    ImGui::Separator();

                    ImGui::Checkbox("Link to animation", &exec_link);
                    ImGui::SliderFloat("Step interval", &exec_interval_s, 0.5f, 10.0f, "%.1f s");
                    ImGui::SliderInt("Fail step", &exec_fail_step, -1, std::max(0, index.stepCount() - 1));

                    const bool idle = runner.phase() == seqviz::ExecutionRunPhase::Idle ||
                                      runner.phase() == seqviz::ExecutionRunPhase::Complete;
                    if (ImGui::Button(" START ", ImVec2(80, 0)) && idle) {
                        seqviz::MockExecutionRunner::Config rc;
                        rc.step_interval_s = (double)exec_interval_s;
                        rc.fail_step_index = exec_fail_step;
                        rc.fail_attempts = (exec_fail_step >= 0) ? 1 : 0;
                        runner.setConfig(rc);
                        runner.setAssembly(def);
                        runner.start();
                    }
                    ImGui::SameLine();
                    if (ImGui::Button(" PAUSE ", ImVec2(80, 0))) runner.pause();
                    ImGui::SameLine();
                    if (ImGui::Button(" RESUME ", ImVec2(80, 0))) runner.resume();
                    ImGui::SameLine();
                    if (ImGui::Button(" STOP ", ImVec2(80, 0))) runner.stop();
                    if (ImGui::Button("[ INTERVENE ]", ImVec2(-1, 0))) runner.intervene();
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[STATUS]");
                    ImGui::Separator();
                    ImGui::Text("Run:      %s", seqviz::executionRunPhaseName(runner.phase()));
                    ImGui::Text("Elapsed:  %.1f s", runner.elapsed_s());
                    ImGui::Text("Revision: %u", (unsigned)runner.revision());
                    for (const seqviz::StepRuntimeState& st : runner.snapshot().step_states) {
                        ImGui::Text("  %-10s %-10s #%d", st.step_id.c_str(),
                                    seqviz::stepStatusName(st.status), st.attempt);
                    }
                    ImGui::EndTabItem();
                }

                if (ImGui::BeginTabItem("  PARTS  ")) {
                    ImGui::TextColored(cmd_header, "[PARTS] Click a row or a box to select");
                    ImGui::Separator();
                    if (ImGui::Button("Clear selection", ImVec2(-1, 0))) ctl.setSelectedPart(std::string());
                    for (int p = 0; p < index.partCount(); ++p) {
                        const seqviz::Part& part = index.part(p);
                        auto it = fo.parts.find(part.id);
                        if (it == fo.parts.end()) continue;
                        char row[160];
                        std::snprintf(row, sizeof(row), "%-12s %-9s %.2f", part.id.c_str(),
                                      seqviz::visualClassName(it->second.visual_class), it->second.opacity_0_1);
                        if (ImGui::Selectable(row, ctl.selectedPart() == part.id)) ctl.setSelectedPart(part.id);
                    }
                    ImGui::EndTabItem();
                }

                if (ImGui::BeginTabItem("  VIZ  ")) {
                    ImGui::TextColored(cmd_header, "[VISUALIZATION] Draw Layers");
                    ImGui::Separator();
                    ImGui::Checkbox("Floor grid", &ui.draw_floor);
                    ImGui::Checkbox("Parts", &ui.draw_parts);
                    ImGui::Checkbox("Part outlines", &ui.draw_outlines);
                    ImGui::Checkbox("Approach arrows", &ui.draw_approach);
                    ImGui::Checkbox("Arm", &ui.draw_arm);
                    ImGui::Checkbox("End-effector target", &ui.draw_target);
                    ImGui::Checkbox("Plots", &ui.show_plots);
                    ImGui::Spacing();
                    ImGui::SliderFloat("Yaw (deg)", &cam_yaw_deg, -180.0f, 180.0f, "%.0f");
                    ImGui::SliderFloat("Pitch (deg)", &cam_pitch_deg, -10.0f, 85.0f, "%.0f");
                    ImGui::SliderFloat("Distance (m)", &cam_dist, 0.1f, 10.0f, "%.2f");
                    ImGui::EndTabItem();
                }

                if (ImGui::BeginTabItem("  LOG  ")) {
                    ImGui::Text("Frames: %u   Digest: 0x%08X", (unsigned)ctl.frameCount(), (unsigned)ctl.runDigest());
                    ImGui::Separator();
                    for (const std::string& l : event_log) ImGui::TextUnformatted(l.c_str());
                    ImGui::EndTabItem();
                }

                ImGui::EndTabBar();
            }
            ImGui::End();
        }

        if (ui.show_plots) {
            ImGui::SetNextWindowSize(ImVec2(520, 640), ImGuiCond_FirstUseEver);
            ImGui::Begin(">> TELEMETRY", &ui.show_plots);

            const int n = ctl.getTelemetrySamples(telem.data(), (int)telem.size());
            t_hist.resize((std::size_t)n);
            progress_hist.resize((std::size_t)n);
            sequence_hist.resize((std::size_t)n);
            reach_hist.resize((std::size_t)n);
            gap_hist.resize((std::size_t)n);
            complete_hist.resize((std::size_t)n);
            for (int i = 0; i < n; ++i) {
                const seqviz::FrameTelemetrySample& s = telem[(std::size_t)i];
                t_hist[(std::size_t)i] = s.t_s;
                progress_hist[(std::size_t)i] = s.progress_0_1;
                sequence_hist[(std::size_t)i] = s.sequence_0_1;
                reach_hist[(std::size_t)i] = s.reach_0_1;
                gap_hist[(std::size_t)i] = s.gripper_gap_0_1;
                complete_hist[(std::size_t)i] = (double)s.complete_count_u32;
            }

            if (n > 1) {
                const double t0 = t_hist.front();
                const double t1 = t_hist.back();
                ImGui::Text("Samples: %d   Window: [%0.2f, %0.2f] s", n, t0, t1);
                ImGui::Separator();

                if (ImPlot::BeginPlot("Progress (0-1)")) {
#if defined(ImAxis_X1)
                    ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
                    ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
#endif
                    ImPlot::PlotLine("phase", t_hist.data(), progress_hist.data(), n);
                    ImPlot::PlotLine("sequence", t_hist.data(), sequence_hist.data(), n);
                    ImPlot::EndPlot();
                }

                plot_line_with_xlimits("Parts complete", "opaque",
                                       t_hist.data(), complete_hist.data(), n, t0, t1);
                plot_line_with_xlimits("Arm reach (0-1)", "reach",
                                       t_hist.data(), reach_hist.data(), n, t0, t1);
                plot_line_with_xlimits("Gripper gap (0-1)", "gap",
                                       t_hist.data(), gap_hist.data(), n, t0, t1);
            } else {
                ImGui::Text("Samples: %d", n);
            }
            ImGui::End();
        }

        // --- camera input (viewport only) ---
        if (!io.WantCaptureMouse) {
            if (ImGui::IsMouseDragging(ImGuiMouseButton_Right)) {
                cam_yaw_deg   -= io.MouseDelta.x * 0.3f;
                cam_pitch_deg += io.MouseDelta.y * 0.3f;
                cam_pitch_deg = clampf(cam_pitch_deg, -10.0f, 85.0f);
            }
            if (io.MouseWheel != 0.0f) {
                cam_dist = clampf(cam_dist * (1.0f - 0.1f * io.MouseWheel), 0.1f, 10.0f);
            }
        }

        const float yaw   = cam_yaw_deg   * 3.1415926535f / 180.0f;
        const float pitch = cam_pitch_deg * 3.1415926535f / 180.0f;
        const Vec3f eye = v3f(
            cam_target.x + cam_dist * std::cos(pitch) * std::sin(yaw),
            cam_target.y + cam_dist * std::sin(pitch),
            cam_target.z + cam_dist * std::cos(pitch) * std::cos(yaw)
        );
        cam = make_camera_basis(eye, cam_target, v3f(0.0f, 1.0f, 0.0f));

        const float kFovyDeg = 45.0f;

        // Left click in the viewport picks the nearest visible part.
        if (!io.WantCaptureMouse && ImGui::IsMouseClicked(ImGuiMouseButton_Left) &&
            io.DisplaySize.x > 0.0f && io.DisplaySize.y > 0.0f) {
            const float ndc_x = 2.0f * io.MousePos.x / io.DisplaySize.x - 1.0f;
            const float ndc_y = 1.0f - 2.0f * io.MousePos.y / io.DisplaySize.y;
            const float tan_half = std::tan(0.5f * kFovyDeg * 3.1415926535f / 180.0f);
            const float aspect = io.DisplaySize.x / io.DisplaySize.y;
            const Vec3f rd = norm(add(cam.fwd, add(mul(cam.side, ndc_x * tan_half * aspect),
                                                   mul(cam.up, ndc_y * tan_half))));

            float best_t = 1e30f;
            std::string best_id;
            for (int p = 0; p < index.partCount(); ++p) {
                const seqviz::Part& part = index.part(p);
                auto it = fo.parts.find(part.id);
                if (it == fo.parts.end() || it->second.opacity_0_1 <= 0.01) continue;
                float t_hit = 0.0f;
                if (ray_aabb_intersect(cam.eye, rd, to_v3f(it->second.position_m),
                                       to_v3f(part.half_extents_m), t_hit) && t_hit < best_t) {
                    best_t = t_hit;
                    best_id = part.id;
                }
            }
            ctl.setSelectedPart(best_id);
        }

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);

        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);

            glEnable(GL_DEPTH_TEST);
            glDepthFunc(GL_LESS);
            glDisable(GL_CULL_FACE);

            glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

            const float aspect = (float)fb_w / (float)fb_h;
            set_perspective(kFovyDeg, aspect, 0.01f, 50.0f);
            look_at(cam);

            const float r = (float)index.radius_m();

            if (ui.draw_floor) {
                glColor3f(0.22f, 0.22f, 0.25f);
                Vec3f floor_c = cam_target;
                floor_c.y = (float)index.floorY_m();
                draw_floor_grid(floor_c, 3.0f * r, 12);
            }

            if (ui.draw_arm) {
                const seqviz::world::ArmPose& arm = fo.arm;
                glLineWidth(4.0f);
                glColor3f(0.75f, 0.78f, 0.82f);
                for (int j = 0; j < seqviz::world::ArmPose::kNumJoints; ++j) {
                    draw_line(to_v3f(arm.joint_pos_m[(std::size_t)j]),
                              to_v3f(arm.joint_pos_m[(std::size_t)j + 1]));
                }
                glLineWidth(1.0f);

                const float jh = 0.04f * r;
                glColor3f(0.35f, 0.40f, 0.48f);
                for (const seqviz::Vec3d& jp : arm.joint_pos_m) {
                    draw_solid_box(to_v3f(jp), v3f(jh, jh, jh));
                }

                // Gripper: two fingers across the wrist, separated by the gap.
                const Vec3f ee = to_v3f(arm.end_effector_m);
                const Vec3f wrist = to_v3f(arm.joint_pos_m[(std::size_t)seqviz::world::ArmPose::kNumJoints - 1]);
                Vec3f axis = norm(sub(ee, wrist));
                if (len(axis) < 1e-6f) axis = v3f(0.0f, -1.0f, 0.0f);
                Vec3f across = norm(cross(axis, v3f(0.0f, 1.0f, 0.0f)));
                if (len(across) < 1e-6f) across = v3f(1.0f, 0.0f, 0.0f);

                const float gap = (0.02f + 0.06f * (float)arm.gripper_gap_0_1) * r;
                const float finger = 0.12f * r;
                glColor3f(0.95f, 0.85f, 0.35f);
                for (int side = -1; side <= 1; side += 2) {
                    const Vec3f root = add(ee, mul(across, 0.5f * gap * (float)side));
                    draw_line(sub(root, mul(across, 0.5f * gap * (float)side)), root);
                    draw_line(root, add(root, mul(axis, finger)));
                }
            }

            if (ui.draw_target) {
                float cr, cg, cb;
                ee_phase_color(fo.execution.end_effector_phase, cr, cg, cb);
                glColor3f(cr, cg, cb);
                const float th = 0.05f * r;
                draw_wire_box(to_v3f(fo.execution.end_effector_target_m), v3f(th, th, th));
            }

            if (ui.draw_approach) {
                glColor3f(0.45f, 0.55f, 0.85f);
                for (int p = 0; p < index.partCount(); ++p) {
                    if (index.stepOfPart(p) < 0) continue;
                    const Vec3f from = to_v3f(index.assembledPosition(p));
                    const Vec3f dir = to_v3f(index.approachDir(p));
                    draw_arrow(from, dir, (float)index.approachOffset_m(p));
                }
            }

            if (ui.draw_parts) {
                glEnable(GL_BLEND);
                glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

                // Opaque parts first, then translucent ones without depth writes.
                for (int pass = 0; pass < 2; ++pass) {
                    glDepthMask(pass == 0 ? GL_TRUE : GL_FALSE);
                    for (int p = 0; p < index.partCount(); ++p) {
                        const seqviz::Part& part = index.part(p);
                        auto it = fo.parts.find(part.id);
                        if (it == fo.parts.end()) continue;
                        const seqviz::PartRenderState& ps = it->second;
                        const bool opaque = ps.opacity_0_1 >= 1.0;
                        if ((pass == 0) != opaque) continue;
                        if (ps.opacity_0_1 <= 0.001) continue;

                        float cr, cg, cb;
                        visual_class_color(ps.visual_class, cr, cg, cb);
                        const Vec3f c = to_v3f(ps.position_m);
                        const Vec3f h = to_v3f(part.half_extents_m);

                        glColor4f(cr, cg, cb, (float)ps.opacity_0_1);
                        draw_solid_box(c, h);

                        if (ui.draw_outlines) {
                            glColor4f(cr * 0.6f, cg * 0.6f, cb * 0.6f,
                                      clampf((float)ps.opacity_0_1 + 0.2f, 0.25f, 1.0f));
                            draw_wire_box(c, h);
                        }
                    }
                }

                glDepthMask(GL_TRUE);
                glDisable(GL_BLEND);
            }
        }

        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(window);
    }

    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
