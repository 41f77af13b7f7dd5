#include "AnimationController.h"
#include "DemoAssemblies.h"
#include "FrameEvents.h"
#include "MockExecution.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "ReplayTool usage:\n"
              << "  ReplayTool [--assembly <name>] [--session <demo|play|scrub|exec>] [--dt s] [--seconds s]\n"
              << "             [--fail-step n] [--autoplay] [--config] [--out file]\n"
              << "  assemblies:";
    for (const std::string& n : seqviz::demoAssemblyNames()) std::cout << " " << n;
    std::cout << "\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string assembly = "bearing_housing";
    std::string session = "demo";
    double dt = 1.0 / 60.0;
    double seconds = 10.0;
    int fail_step = -1;
    bool autoplay = false;
    bool print_config = false;
    std::string out = "replay.csv";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--assembly" && i + 1 < argc) {
            assembly = toLower(argv[++i]);
        } else if (arg == "--session" && i + 1 < argc) {
            session = toLower(argv[++i]);
        } else if (arg == "--dt" && i + 1 < argc) {
            dt = std::stod(argv[++i]);
        } else if (arg == "--seconds" && i + 1 < argc) {
            seconds = std::stod(argv[++i]);
        } else if (arg == "--fail-step" && i + 1 < argc) {
            fail_step = std::stoi(argv[++i]);
        } else if (arg == "--autoplay") {
            autoplay = true;
        } else if (arg == "--config") {
            print_config = true;
        } else if (arg == "--out" && i + 1 < argc) {
            out = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (session != "demo" && session != "play" && session != "scrub" && session != "exec") {
        std::cout << "Unsupported session: " << session << "\n";
        printUsage();
        return 1;
    }
    if (!std::isfinite(dt) || dt <= 0.0 || !std::isfinite(seconds) || seconds <= 0.0) {
        std::fprintf(stderr, "FATAL: --dt and --seconds must be positive and finite\n");
        return EXIT_FAILURE;
    }

    seqviz::AssemblyDefinition def;
    if (!seqviz::makeDemoAssembly(assembly, def)) {
        std::fprintf(stderr, "FATAL: unknown assembly '%s'\n", assembly.c_str());
        return EXIT_FAILURE;
    }

    seqviz::AnimationConfigV1 cfg;
    cfg.autoplay_after_demo_u32 = autoplay ? 1u : 0u;

    seqviz::AnimationController ctl;
    if (!ctl.setConfig(cfg)) {
        std::fprintf(stderr, "FATAL: animation config rejected\n");
        return EXIT_FAILURE;
    }
    ctl.loadAssembly(def);

    if (print_config) {
        char buf[4096];
        if (ctl.exportConfigText(buf, (int)sizeof(buf)) > 0) std::cout << buf;
    }

    seqviz::MockExecutionRunner::Config rcfg;
    rcfg.fail_step_index = fail_step;
    rcfg.fail_attempts = (fail_step >= 0) ? 1 : 0;
    seqviz::MockExecutionRunner runner(rcfg);
    runner.setAssembly(def);
    std::uint32_t posted_revision = runner.revision();

    std::ofstream csv(out);
    if (!csv.is_open()) {
        std::fprintf(stderr, "FATAL: cannot open '%s' for writing\n", out.c_str());
        return EXIT_FAILURE;
    }
    csv << "t_s,phase,progress,active_step,sequence,complete_count,ee_phase,ee_x_m,ee_y_m,ee_z_m,reach,gripper_gap,events\n";
    csv << std::fixed << std::setprecision(6);

    // Session scripts act on the first frame.
    if (session == "play") {
        ctl.toggle();
    } else if (session == "scrub") {
        ctl.scrubStart();
    } else if (session == "exec") {
        runner.start();
    }

    const long frames = static_cast<long>(std::ceil(seconds / dt));
    std::uint32_t all_events = 0;
    for (long f = 0; f < frames; ++f) {
        if (session == "scrub") {
            const double g = static_cast<double>(f + 1) / static_cast<double>(frames);
            ctl.scrub(g);
            if (f + 1 == frames) ctl.scrubEnd();
        } else if (session == "exec") {
            runner.tick(dt);
            if (runner.revision() != posted_revision) {
                posted_revision = runner.revision();
                ctl.postExecutionSnapshot(runner.snapshot());
            }
        }

        ctl.tick(dt);

        const seqviz::FrameOutput& fo = ctl.frame();
        all_events |= fo.events_u32;
        csv << fo.time_s << ','
            << seqviz::phaseName(fo.animation.phase) << ','
            << fo.animation.progress_0_1 << ','
            << fo.animation.active_step_index << ','
            << fo.animation.sequence_progress_0_1 << ','
            << seqviz::countFullyOpaque(fo.parts) << ','
            << seqviz::world::endEffectorPhaseName(fo.execution.end_effector_phase) << ','
            << fo.arm.end_effector_m.x << ','
            << fo.arm.end_effector_m.y << ','
            << fo.arm.end_effector_m.z << ','
            << fo.arm.reach_0_1 << ','
            << fo.arm.gripper_gap_0_1 << ','
            << fo.events_u32 << '\n';
    }

    char digest[16];
    std::snprintf(digest, sizeof(digest), "0x%08X", ctl.runDigest());
    std::cout << "Replayed " << ctl.frameCount() << " frames of '" << session << "' on " << assembly << "\n";
    std::cout << "Final phase: " << seqviz::phaseName(ctl.animation().phase)
              << " active_step=" << ctl.animation().active_step_index << "\n";
    if (session == "exec") {
        std::cout << "Execution: " << seqviz::executionRunPhaseName(runner.phase()) << "\n";
    }
    std::cout << "Run digest: " << digest << "\n";
    if ((all_events & (seqviz::Warn_OpaqueCountDecreased | seqviz::Warn_TargetNotPermitted)) != 0) {
        std::cout << "WARNING: invariant warnings raised (events=0x" << std::hex << all_events << std::dec << ")\n";
    }
    std::cout << "Wrote replay trace to: " << out << "\n";
    return 0;
}
