#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "AnimationConfig.h"
#include "AnimationController.h"
#include "AssemblyTypes.h"
#include "DemoAssemblies.h"
#include "ExecutionBridge.h"
#include "FrameEvents.h"
#include "MockExecution.h"
#include "PartAnimation.h"
#include "PhaseMachine.h"
#include "Scrubber.h"
#include "arm_pose_solver.h"

using namespace seqviz;

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_FINITE(double x, const char* name) {
    if (!std::isfinite(x)) {
        std::cerr << "[FAIL] Non-finite: " << name << " = " << x << "\n";
        std::exit(1);
    }
}

static inline bool near(double a, double b, double tol) { return std::abs(a - b) <= tol; }

static inline bool nearVec(const Vec3d& a, const Vec3d& b, double tol) {
    return near(a.x, b.x, tol) && near(a.y, b.y, tol) && near(a.z, b.z, tol);
}

static inline bool sameState(const PartRenderState& a, const PartRenderState& b) {
    return a.position_m.x == b.position_m.x && a.position_m.y == b.position_m.y &&
           a.position_m.z == b.position_m.z && a.opacity_0_1 == b.opacity_0_1 &&
           a.visual_class == b.visual_class;
}

static AssemblyDefinition demo(const char* name) {
    AssemblyDefinition d;
    REQUIRE(makeDemoAssembly(name, d), "unknown demo assembly " << name);
    return d;
}

static void requirePermittedTarget(const ExecutionBridge& b, const char* ctx) {
    REQUIRE(b.targetIsPermitted(), ctx << ": end-effector target is not a permitted point");
    REQUIRE(isFinite(b.state().end_effector_target_m), ctx << ": non-finite end-effector target");
}

// =======================
// 1: Scrubber mapping
// =======================

static void runScrubberKnownValue_1A() {
    const ScrubberCoordinate c = scrubberToStep(0.625, 4);
    REQUIRE(c.step_index == 2, "N=4 g=0.625 step_index=" << c.step_index);
    REQUIRE(near(c.fraction_0_1, 0.5, 1e-12), "N=4 g=0.625 fraction=" << c.fraction_0_1);
    std::cout << "[PASS] 1A scrubberToStep(0.625, N=4) == (2, 0.5)\n";
}

static void runScrubberInverse_1B() {
    const int counts[] = {1, 3, 4, 7, 13};
    const double fracs[] = {0.0, 0.125, 0.25, 0.5, 0.9, 0.999};
    for (int n : counts) {
        for (int i = 0; i < n; ++i) {
            for (double f : fracs) {
                const double g = stepToScrubber(i, f, n);
                REQUIRE(g >= 0.0 && g <= 1.0, "stepToScrubber out of [0,1]");
                const ScrubberCoordinate c = scrubberToStep(g, n);
                REQUIRE(c.step_index == i, "inverse step mismatch n=" << n << " i=" << i << " f=" << f);
                REQUIRE(near(c.fraction_0_1, f, 1e-9), "inverse fraction mismatch n=" << n << " i=" << i << " f=" << f);
            }
        }
        // End of the last step is the only fraction-1 coordinate.
        const ScrubberCoordinate end = scrubberToStep(1.0, n);
        REQUIRE(end.step_index == n - 1 && near(end.fraction_0_1, 1.0, 1e-12), "g=1 must map to (N-1, 1)");
        REQUIRE(near(stepToScrubber(n - 1, 1.0, n), 1.0, 1e-12), "(N-1, 1) must map to 1");
    }
    std::cout << "[PASS] 1B scrubber mapping exact inverses (N = 1,3,4,7,13)\n";
}

static void runScrubberEdgeCases_1C() {
    const ScrubberCoordinate z = scrubberToStep(0.7, 0);
    REQUIRE(z.step_index == 0 && z.fraction_0_1 == 0.0, "N=0 must return (0,0)");
    REQUIRE(stepToScrubber(3, 0.5, 0) == 0.0, "N=0 must return 0");
    REQUIRE(stepToScrubber(2, 0.5, -4) == 0.0, "N<0 must return 0");

    const ScrubberCoordinate lo = scrubberToStep(-3.0, 4);
    REQUIRE(lo.step_index == 0 && lo.fraction_0_1 == 0.0, "g<0 clamps to (0,0)");
    const ScrubberCoordinate hi = scrubberToStep(7.0, 4);
    REQUIRE(hi.step_index == 3 && hi.fraction_0_1 == 1.0, "g>1 clamps to (N-1,1)");
    const ScrubberCoordinate nan = scrubberToStep(std::numeric_limits<double>::quiet_NaN(), 4);
    REQUIRE(nan.step_index == 0 && nan.fraction_0_1 == 0.0, "NaN clamps to (0,0)");

    REQUIRE(near(stepToScrubber(9, 0.5, 4), 1.0, 1e-12), "step index above range clamps to last step");
    REQUIRE(near(stepToScrubber(-2, 0.5, 4), 0.125, 1e-12), "negative step index clamps to 0");

    REQUIRE(completedStepCount(0.0, 4) == 0, "nothing complete at 0");
    REQUIRE(completedStepCount(0.5, 4) == 2, "two complete at 0.5");
    REQUIRE(completedStepCount(1.0, 4) == 4, "all complete at 1");
    REQUIRE(completedStepCount(0.5, 0) == 0, "N=0 has no completed steps");
    std::cout << "[PASS] 1C scrubber N=0 and out-of-range clamping\n";
}

// =======================
// 2: Phase state machine
// =======================

static void runDemoPhaseOrder_2A() {
    const AssemblyDefinition d = demo("bracket_stack");
    PhaseMachine m((int)d.steps.size(), (int)d.parts.size(), PhaseTimingConfig{});
    REQUIRE(m.demoArmed(), "fresh machine must arm the demo");

    const Phase expected[] = {Phase::DemoFadeIn, Phase::DemoHold, Phase::DemoExplode,
                              Phase::DemoAssemble, Phase::Idle};
    for (Phase next : expected) {
        const Phase cur = m.state().phase;
        const double dur = m.phaseDuration_s(cur);
        REQUIRE(dur >= 0.0, phaseName(cur) << " must have a finite duration during the demo");
        m.tick(dur);
        REQUIRE(m.state().phase == next, "after " << phaseName(cur) << " expected " << phaseName(next)
                                                  << " got " << phaseName(m.state().phase));
        REQUIRE(m.state().progress_0_1 == 0.0, "new phase must start at progress 0");
    }

    // Demo consumed; idle now waits for a user command.
    REQUIRE(!m.demoArmed(), "demo must not re-arm on its own");
    m.tick(100.0);
    REQUIRE(m.state().phase == Phase::Idle, "idle after demo must not advance");
    REQUIRE(m.state().active_step_index == -1, "demo end resets the user sequence");
    std::cout << "[PASS] 2A demo phase order idle->fadein->hold->explode->assemble->idle\n";
}

static void runOversizedDtNeverSkips_2B() {
    const AssemblyDefinition d = demo("bearing_housing");
    PhaseMachine m((int)d.steps.size(), (int)d.parts.size(), PhaseTimingConfig{});

    const Phase expected[] = {Phase::DemoFadeIn, Phase::DemoHold, Phase::DemoExplode,
                              Phase::DemoAssemble, Phase::Idle};
    for (Phase next : expected) {
        m.tick(1.0e6);
        REQUIRE(m.state().phase == next, "oversized dt skipped a phase; got " << phaseName(m.state().phase));
        REQUIRE(m.state().progress_0_1 == 0.0, "overshoot must not carry into the next phase");
    }
    std::cout << "[PASS] 2B oversized dt advances exactly one phase per tick\n";
}

static void runCumulativeDt_2C() {
    const AssemblyDefinition d = demo("bracket_stack");
    PhaseTimingConfig t;
    t.demo_start_delay_s = 0.5;
    PhaseMachine m((int)d.steps.size(), (int)d.parts.size(), t);

    // 0.5 / 8 is exact in binary.
    for (int i = 0; i < 7; ++i) {
        m.tick(0.0625);
        REQUIRE(m.state().phase == Phase::Idle, "transitioned early at tick " << i);
    }
    m.tick(0.0625);
    REQUIRE(m.state().phase == Phase::DemoFadeIn, "cumulative dt equal to the delay must transition");
    std::cout << "[PASS] 2C cumulative dt equal to phase duration transitions exactly once\n";
}

static void runInvalidDtAndInert_2D() {
    const AssemblyDefinition d = demo("bracket_stack");
    PhaseMachine m((int)d.steps.size(), (int)d.parts.size(), PhaseTimingConfig{});
    const double bad[] = {0.0, -1.0, std::numeric_limits<double>::quiet_NaN(),
                          std::numeric_limits<double>::infinity()};
    for (double dt : bad) {
        m.tick(dt);
        REQUIRE(m.state().phase == Phase::Idle && m.state().progress_0_1 == 0.0, "invalid dt must be a no-op");
        REQUIRE(m.state().phase_elapsed_s == 0.0, "invalid dt must not advance elapsed time");
    }

    PhaseMachine inert(0, 3, PhaseTimingConfig{});
    REQUIRE(inert.isInert() && !inert.demoArmed(), "zero-step machine is inert");
    inert.tick(10.0);
    inert.goToPhase(Phase::Playing);
    inert.goToPhase(Phase::DemoFadeIn, 0.5);
    inert.stepForward();
    inert.stepBackward();
    inert.seekSequence(0.5);
    REQUIRE(inert.state().phase == Phase::Idle, "inert machine must stay idle");
    REQUIRE(inert.state().active_step_index == -1, "inert machine has no active step");
    REQUIRE(inert.transitionCount() == 0, "inert machine must not transition");
    std::cout << "[PASS] 2D invalid dt no-op + zero-step machine inert\n";
}

static void runStepForwardBackward_2E() {
    const AssemblyDefinition d = demo("bracket_stack");
    PhaseMachine m((int)d.steps.size(), (int)d.parts.size(), PhaseTimingConfig{});

    m.stepForward();
    REQUIRE(m.state().active_step_index == 0, "first stepForward begins step 0");
    REQUIRE(!m.demoArmed(), "stepping must disarm the demo");
    m.stepForward();
    REQUIRE(m.state().active_step_index == 1, "stepForward +1");
    REQUIRE(near(m.state().sequence_progress_0_1, 0.25, 1e-12), "progress re-derived via scrubber");
    for (int i = 0; i < 6; ++i) m.stepForward();
    REQUIRE(m.state().active_step_index == 3, "stepForward clamps to last step");
    REQUIRE(near(m.state().sequence_progress_0_1, 0.75, 1e-12), "clamped step starts at fraction 0");
    m.stepBackward();
    REQUIRE(m.state().active_step_index == 2, "stepBackward -1");
    for (int i = 0; i < 6; ++i) m.stepBackward();
    REQUIRE(m.state().active_step_index == 0, "stepBackward clamps to 0");
    REQUIRE(m.state().phase == Phase::Idle, "stepping from idle stays idle");

    m.goToPhase(Phase::DemoHold);
    m.stepForward();
    REQUIRE(m.state().phase == Phase::Idle, "stepping out of a demo phase lands in idle");
    REQUIRE(m.state().active_step_index == 0, "demo reset the sequence; step forward begins step 0");

    // Stepping while playing keeps playing and re-derives progress.
    m.goToPhase(Phase::Playing);
    m.stepForward();
    REQUIRE(m.state().phase == Phase::Playing, "stepping keeps playback running");
    REQUIRE(near(m.state().progress_0_1, 0.25, 1e-12), "playing progress follows the step");

    // Seeks move the sequence position without changing phase.
    m.seekStep(2, 0.5);
    REQUIRE(m.state().phase == Phase::Playing, "seekStep keeps the phase");
    REQUIRE(m.state().active_step_index == 2, "seekStep lands on the requested step");
    REQUIRE(near(m.state().progress_0_1, 0.625, 1e-12), "seekStep progress via scrubber");
    m.goToPhase(Phase::Idle);
    m.seekStep(99, 0.0);
    REQUIRE(m.state().phase == Phase::Idle, "seekStep from idle stays idle");
    REQUIRE(m.state().active_step_index == 3, "seekStep clamps the step index");
    std::cout << "[PASS] 2E stepForward/stepBackward clamped + progress consistent\n";
}

static void runPlayingCompletes_2F() {
    const AssemblyDefinition d = demo("bracket_stack");
    StepIndex idx(d);
    PhaseMachine m(idx.stepCount(), idx.partCount(), PhaseTimingConfig{});
    m.goToPhase(Phase::Playing, 0.0);

    const double dt = 0.05;
    int last_active = m.state().active_step_index;
    std::size_t last_opaque = 0;
    int guard = 0;
    while (m.state().phase == Phase::Playing && guard++ < 10000) {
        m.tick(dt);
        if (m.state().phase != Phase::Playing) break;
        REQUIRE(m.state().active_step_index >= last_active, "active step went backwards during playback");
        last_active = m.state().active_step_index;

        PartStateMap parts;
        computeAllPartAnimations(idx, m.state(), m.timing(), RenderStyleConfig{}, "", parts);
        const std::size_t opaque = countFullyOpaque(parts);
        REQUIRE(opaque >= last_opaque, "fully-opaque count decreased during playback");
        last_opaque = opaque;
    }
    REQUIRE(m.state().phase == Phase::Idle, "playback must end in idle");
    REQUIRE(m.state().active_step_index == 3, "active step must rest on the last step");

    PartStateMap parts;
    computeAllPartAnimations(idx, m.state(), m.timing(), RenderStyleConfig{}, "", parts);
    for (const auto& kv : parts) {
        REQUIRE(kv.second.visual_class == VisualClass::Complete, kv.first << " not complete after playback");
        REQUIRE(kv.second.opacity_0_1 == 1.0, kv.first << " not opaque after playback");
    }

    for (int i = 0; i < 50; ++i) m.tick(dt);
    REQUIRE(m.state().active_step_index == 3, "active step must not advance past the end");

    // Same end state evaluated directly at the boundary.
    AnimationState end;
    end.phase = Phase::Playing;
    end.progress_0_1 = 1.0;
    end.active_step_index = 3;
    computeAllPartAnimations(idx, end, m.timing(), RenderStyleConfig{}, "", parts);
    REQUIRE(countFullyOpaque(parts) == parts.size(), "playing at progress 1 must be fully complete");
    std::cout << "[PASS] 2F playing completes: all parts complete, active step stops at last\n";
}

// =======================
// 3: Per-part render state
// =======================

static void runEasing_3A() {
    REQUIRE(easeInOutCubic(0.0) == 0.0, "ease(0)");
    REQUIRE(easeInOutCubic(1.0) == 1.0, "ease(1)");
    REQUIRE(near(easeInOutCubic(0.5), 0.5, 1e-12), "ease(0.5)");
    REQUIRE(near(easeInOutCubic(0.25), 0.0625, 1e-12), "ease(0.25)");
    REQUIRE(near(easeInOutCubic(0.75), 0.9375, 1e-12), "ease(0.75)");
    REQUIRE(easeInOutCubic(-1.0) == 0.0 && easeInOutCubic(2.0) == 1.0, "ease clamps t");
    double prev = 0.0;
    for (int i = 1; i <= 100; ++i) {
        const double v = easeInOutCubic(i / 100.0);
        REQUIRE(v >= prev, "ease must be monotonic");
        prev = v;
    }
    std::cout << "[PASS] 3A cubic ease-in-out values + monotonic\n";
}

static void runRenderStatePure_3B() {
    const AssemblyDefinition d = demo("bearing_housing");
    StepIndex idx(d);
    const PhaseTimingConfig t;
    const RenderStyleConfig s;

    const Phase phases[] = {Phase::Idle, Phase::DemoFadeIn, Phase::DemoHold, Phase::DemoExplode,
                            Phase::DemoAssemble, Phase::Playing, Phase::Scrubbing};
    const double progs[] = {0.0, 0.1, 0.37, 0.5, 0.8125, 1.0};
    for (Phase p : phases) {
        for (double g : progs) {
            for (int active = -1; active < idx.stepCount(); ++active) {
                AnimationState a;
                a.phase = p;
                a.progress_0_1 = g;
                a.active_step_index = active;
                a.sequence_progress_0_1 = g;
                for (int i = 0; i < idx.partCount(); ++i) {
                    const PartRenderState r1 = computePartAnimation(idx, i, a, t, s, "cover");
                    const PartRenderState r2 = computePartAnimation(idx, i, a, t, s, "cover");
                    REQUIRE(sameState(r1, r2), "computePartAnimation not deterministic");
                    REQUIRE(r1.opacity_0_1 >= 0.0 && r1.opacity_0_1 <= 1.0, "opacity out of [0,1]");
                    REQUIRE_FINITE(r1.position_m.x, "position.x");
                    REQUIRE_FINITE(r1.position_m.y, "position.y");
                    REQUIRE_FINITE(r1.position_m.z, "position.z");
                }
            }
        }
    }
    std::cout << "[PASS] 3B computePartAnimation pure/deterministic over phase x progress x step\n";
}

static void runRenderStateRules_3C() {
    const AssemblyDefinition d = demo("bracket_stack");
    StepIndex idx(d);
    const PhaseTimingConfig t;
    const RenderStyleConfig s;
    const int spacer = idx.findPart("spacer");
    const int base = idx.findPart("base_bracket");
    const int mid = idx.findPart("mid_bracket");
    REQUIRE(spacer >= 0 && base >= 0 && mid >= 0, "bracket_stack parts missing");

    // Default approach: straight down from 2 x bounding height above the seat.
    REQUIRE(nearVec(idx.approachPosition(spacer), v3(0.0, 0.07, 0.0), 1e-12), "default approach position");

    AnimationState a;
    a.phase = Phase::Idle;
    PartRenderState r = computePartAnimation(idx, spacer, a, t, s);
    REQUIRE(r.visual_class == VisualClass::Ghost, "fresh idle part must be ghost");
    REQUIRE(near(r.opacity_0_1, 0.10, 1e-12), "ghost opacity 10%");
    REQUIRE(nearVec(r.position_m, idx.approachPosition(spacer), 1e-12), "ghost sits at approach position");

    a.phase = Phase::DemoExplode;
    a.progress_0_1 = 0.0;
    r = computePartAnimation(idx, spacer, a, t, s);
    REQUIRE(nearVec(r.position_m, idx.assembledPosition(spacer), 1e-12), "explode starts assembled");
    REQUIRE(r.opacity_0_1 == 1.0, "explode holds opacity 1");
    a.progress_0_1 = 1.0;
    r = computePartAnimation(idx, spacer, a, t, s);
    REQUIRE(nearVec(r.position_m, idx.approachPosition(spacer), 1e-12), "explode ends at approach");

    a.phase = Phase::DemoFadeIn;
    a.progress_0_1 = 0.5;
    r = computePartAnimation(idx, 0, a, t, s);
    REQUIRE(r.visual_class == VisualClass::Complete && r.opacity_0_1 == 1.0, "first part fully faded in");
    r = computePartAnimation(idx, 3, a, t, s);
    REQUIRE(r.visual_class == VisualClass::Ghost && r.opacity_0_1 == 0.0, "last part not yet visible");

    a.phase = Phase::DemoHold;
    r = computePartAnimation(idx, mid, a, t, s);
    REQUIRE(r.visual_class == VisualClass::Complete && r.opacity_0_1 == 1.0, "hold shows everything");

    // Playing, step 1 a quarter of the way through its window (inside the move).
    a.phase = Phase::Playing;
    a.progress_0_1 = stepToScrubber(1, 0.25, idx.stepCount());
    a.active_step_index = 1;
    r = computePartAnimation(idx, base, a, t, s);
    REQUIRE(r.visual_class == VisualClass::Complete, "earlier step must be complete");
    REQUIRE(nearVec(r.position_m, idx.assembledPosition(base), 1e-12), "complete sits assembled");

    const PartRenderState act = computePartAnimation(idx, spacer, a, t, s);
    REQUIRE(act.visual_class == VisualClass::Active, "step at active index must be active");
    REQUIRE(act.opacity_0_1 <= s.active_opacity_0_1 + 1e-12, "pulse never exceeds active opacity");
    REQUIRE(act.opacity_0_1 >= s.active_opacity_0_1 * (1.0 - s.pulse_depth_0_1) - 1e-12, "pulse depth bound");
    REQUIRE(act.position_m.y < idx.approachPosition(spacer).y &&
            act.position_m.y > idx.assembledPosition(spacer).y, "active part is mid-move");

    r = computePartAnimation(idx, mid, a, t, s);
    REQUIRE(r.visual_class == VisualClass::Ghost, "later step must be ghost");
    REQUIRE(nearVec(r.position_m, idx.approachPosition(mid), 1e-12), "later step waits at approach");

    // Scrubbing: same pose, no pulse.
    a.phase = Phase::Scrubbing;
    const PartRenderState scr = computePartAnimation(idx, spacer, a, t, s);
    REQUIRE(nearVec(scr.position_m, act.position_m, 1e-12), "scrubbing position must match playing");
    REQUIRE(near(scr.opacity_0_1, s.active_opacity_0_1, 1e-12), "scrubbing must not pulse");

    // Inside the pause window the part is seated but still active.
    a.phase = Phase::Playing;
    a.progress_0_1 = stepToScrubber(1, 0.75, idx.stepCount());
    r = computePartAnimation(idx, spacer, a, t, s);
    REQUIRE(r.visual_class == VisualClass::Active, "pause window keeps the step active");
    REQUIRE(nearVec(r.position_m, idx.assembledPosition(spacer), 1e-12), "pause window is seated");

    // Pulse runs on the phase clock: periodic with pulse_period_s and continuous across steps.
    {
        const double seq_s = t.stepDuration_s() * (double)idx.stepCount();
        auto activeOpacityAt = [&](int part, double elapsed_s) {
            AnimationState p;
            p.phase = Phase::Playing;
            p.phase_elapsed_s = elapsed_s;
            p.progress_0_1 = elapsed_s / seq_s;
            p.active_step_index = scrubberToStep(p.progress_0_1, idx.stepCount()).step_index;
            const PartRenderState ps = computePartAnimation(idx, part, p, t, s);
            REQUIRE(ps.visual_class == VisualClass::Active, "sampled part must be the active one");
            return ps.opacity_0_1;
        };

        AnimationState p0;
        p0.phase = Phase::Playing;
        p0.progress_0_1 = stepToScrubber(1, 0.25, idx.stepCount());
        p0.phase_elapsed_s = 0.3;
        const double o0 = computePartAnimation(idx, spacer, p0, t, s).opacity_0_1;
        p0.phase_elapsed_s = 0.3 + s.pulse_period_s;
        const double o1 = computePartAnimation(idx, spacer, p0, t, s).opacity_0_1;
        REQUIRE(near(o0, o1, 1e-9), "opacity must repeat after one pulse period");
        p0.phase_elapsed_s = 0.3 + 0.5 * s.pulse_period_s;
        REQUIRE(std::fabs(computePartAnimation(idx, spacer, p0, t, s).opacity_0_1 - o0) > 1e-3,
                "opacity must differ half a period later");

        // Within step 1 (0.8 s .. 1.6 s) the opacity falls then rises again.
        const double step_s = t.stepDuration_s();
        const int n = 32;
        bool rose = false;
        bool fell = false;
        double prev = activeOpacityAt(spacer, step_s + 1e-6);
        for (int i = 1; i < n; ++i) {
            const double cur = activeOpacityAt(spacer, step_s + step_s * (double)i / (double)n);
            REQUIRE_FINITE(cur, "pulse opacity");
            if (cur > prev + 1e-9) rose = true;
            if (cur < prev - 1e-9) fell = true;
            prev = cur;
        }
        REQUIRE(rose && fell, "pulse must not be monotonic within a step");

        // No snap back at the step boundary.
        const double end0 = activeOpacityAt(base, step_s - 1e-6);
        const double start1 = activeOpacityAt(spacer, step_s + 1e-6);
        REQUIRE(near(end0, start1, 1e-4), "pulse must be continuous across a step change");
    }

    // Selection overrides class only.
    a.progress_0_1 = stepToScrubber(1, 0.25, idx.stepCount());
    const PartRenderState sel = computePartAnimation(idx, spacer, a, t, s, "spacer");
    REQUIRE(sel.visual_class == VisualClass::Selected, "selected part must be selected");
    REQUIRE(nearVec(sel.position_m, act.position_m, 0.0) && sel.opacity_0_1 == act.opacity_0_1,
            "selection must not change position or opacity");
    std::cout << "[PASS] 3C render-state rules per phase + selection override\n";
}

static void runFixturesAndSideApproach_3D() {
    const AssemblyDefinition d = demo("bearing_housing");
    StepIndex idx(d);
    const int housing = idx.findPart("housing");
    const int shaft = idx.findPart("shaft");
    REQUIRE(idx.stepOfPart(housing) == -1, "housing is in no step");
    REQUIRE(idx.partsOfStep(3).size() == 4, "bolt step places four parts");
    REQUIRE(nearVec(idx.approachPosition(shaft), v3(0.15, 0.13, 0.0), 1e-12), "shaft approaches from +X");

    AnimationState a;
    a.phase = Phase::Idle;
    PartRenderState r = computePartAnimation(idx, housing, a, PhaseTimingConfig{}, RenderStyleConfig{});
    REQUIRE(r.visual_class == VisualClass::Complete && r.opacity_0_1 == 1.0, "fixture complete in idle");
    a.phase = Phase::Playing;
    a.progress_0_1 = 0.1;
    r = computePartAnimation(idx, housing, a, PhaseTimingConfig{}, RenderStyleConfig{});
    REQUIRE(r.visual_class == VisualClass::Complete, "fixture complete while playing");

    // Degenerate approach vector falls back to straight down.
    AssemblyDefinition bad = d;
    bad.parts[1].has_approach_dir = true;
    bad.parts[1].approach_dir = v3(0.0, 0.0, 0.0);
    StepIndex bidx(bad);
    REQUIRE(nearVec(bidx.approachDir(1), v3(0.0, 1.0, 0.0), 1e-12), "zero approach vector uses straight down");

    REQUIRE(computePartAnimation(idx, 99, a, PhaseTimingConfig{}, RenderStyleConfig{}).opacity_0_1 == 0.0,
            "out-of-range part index yields the empty state");
    std::cout << "[PASS] 3D fixtures complete + side approach + degenerate approach fallback\n";
}

// =======================
// 4: Arm pose solver
// =======================

static void runArmReachBelowOne_4A() {
    world::ArmPoseSolver arm;
    world::ArmPoseSolver::Inputs in;
    in.base_m = v3(-0.2, 0.0, 0.0);
    in.assembly_radius_m = 0.2;
    arm.reset(in);
    REQUIRE(arm.isValid(), "arm must be valid after reset");
    REQUIRE(near(arm.totalLength_m(), 0.76 * 0.2, 1e-12), "total length = sum of ratios x radius");

    const Vec3d targets[] = {v3(100.0, 0.0, 0.0), v3(0.0, 50.0, 0.0), v3(-0.2, 0.0, 1e-6),
                             v3(0.1, 0.1, 0.1), v3(-0.2 + arm.totalLength_m(), 0.0, 0.0)};
    for (const Vec3d& tgt : targets) {
        const world::ArmPose p = world::ArmPoseSolver::solveJoints(in.base_m, tgt, arm.segmentLengths_m(), arm.config());
        REQUIRE(p.reach_0_1 < 1.0, "reach must stay below 1");
        REQUIRE(p.reach_0_1 >= 0.0, "reach must be non-negative");
        REQUIRE(p.fold_rad > 0.0, "chain must keep some fold");
        for (double j : p.joint_angle_rad) REQUIRE_FINITE(j, "joint angle");
    }

    for (int i = 0; i < 2000; ++i) arm.step(v3(100.0, 20.0, -40.0), world::EndEffectorPhase::Approach, 0.05);
    REQUIRE(arm.pose().reach_0_1 < 1.0, "reach below 1 after chasing a far target");
    std::cout << "[PASS] 4A arm reach < 1 for any finite target\n";
}

static void runArmFollowAndGripper_4B() {
    REQUIRE(world::ArmPoseSolver::followFactor(4.0, 0.0) == 0.0, "dt=0 follow is 0");
    REQUIRE(world::ArmPoseSolver::followFactor(4.0, std::numeric_limits<double>::quiet_NaN()) == 0.0, "NaN dt");
    const double f = world::ArmPoseSolver::followFactor(4.0, 0.1);
    REQUIRE(near(f, 1.0 - std::exp(-0.4), 1e-12), "follow factor 1-exp(-k dt)");

    world::ArmPoseSolver arm;
    world::ArmPoseSolver::Inputs in;
    in.base_m = v3(0.0, 0.0, 0.0);
    in.assembly_radius_m = 0.5;
    arm.reset(in);
    REQUIRE(nearVec(arm.pose().end_effector_m, v3(0.0, 0.5, 0.0), 1e-12), "rest one radius above base");
    REQUIRE(arm.pose().gripper_gap_0_1 == 1.0, "gripper starts open");

    const Vec3d target = v3(0.2, 0.1, 0.0);
    double prev = len(sub(arm.pose().end_effector_m, target));
    for (int i = 0; i < 200; ++i) {
        arm.step(target, world::EndEffectorPhase::Grasp, 1.0 / 60.0);
        const double dist = len(sub(arm.pose().end_effector_m, target));
        REQUIRE(dist <= prev + 1e-15, "end-effector must approach monotonically (no overshoot)");
        prev = dist;
    }
    REQUIRE(prev < 1e-3, "end-effector must converge");
    REQUIRE(near(arm.pose().gripper_gap_0_1, 0.15, 1e-3), "gripper closes during grasp");
    REQUIRE(near(arm.pose().yaw_rad, std::atan2(0.2, 0.0), 1e-3), "yaw heads toward the target");

    for (int i = 0; i < 200; ++i) arm.step(target, world::EndEffectorPhase::Retreat, 1.0 / 60.0);
    REQUIRE(near(arm.pose().gripper_gap_0_1, 1.0, 1e-3), "gripper reopens outside grasp");

    // Chain segments keep their lengths.
    const world::ArmPose& p = arm.pose();
    for (int i = 0; i < world::ArmPose::kNumJoints; ++i) {
        const double l = len(sub(p.joint_pos_m[(std::size_t)i + 1], p.joint_pos_m[(std::size_t)i]));
        REQUIRE(near(l, arm.segmentLengths_m()[(std::size_t)i], 1e-12), "segment length changed");
    }

    const Vec3d before = arm.pose().end_effector_m;
    arm.step(v3(5.0, 5.0, 5.0), world::EndEffectorPhase::Approach, -1.0);
    REQUIRE(nearVec(arm.pose().end_effector_m, before, 0.0), "invalid dt must not move the arm");

    world::ArmPoseSolver degenerate;
    in.assembly_radius_m = 0.0;
    degenerate.reset(in);
    REQUIRE(!degenerate.isValid(), "zero-radius arm must be invalid");
    degenerate.step(target, world::EndEffectorPhase::Approach, 0.1);
    std::cout << "[PASS] 4B critically-damped follow + gripper + chain lengths + degenerate arm\n";
}

// =======================
// 5: Execution bridge
// =======================

static ExecutionSnapshot snapshotOf(const StepIndex& idx, const std::vector<StepStatus>& st) {
    ExecutionSnapshot s;
    s.valid = true;
    s.assembly_id = idx.assemblyId();
    s.run_phase = ExecutionRunPhase::Running;
    for (int i = 0; i < idx.stepCount(); ++i) {
        StepRuntimeState rs;
        rs.step_id = idx.step(i).id;
        rs.status = st[(std::size_t)i];
        s.step_states.push_back(rs);
    }
    return s;
}

static void runBridgeCycle_5A() {
    const AssemblyDefinition d = demo("bracket_stack");
    StepIndex idx(d);
    const Vec3d rest = v3(-0.3, 0.2, 0.0);
    ExecutionBridge b(&idx, rest, BridgeConfig{});
    REQUIRE(b.state().end_effector_phase == world::EndEffectorPhase::Idle, "bridge starts idle");
    requirePermittedTarget(b, "initial");

    using S = StepStatus;
    BridgeTriggers tr = b.apply(snapshotOf(idx, {S::Running, S::Pending, S::Pending, S::Pending}));
    REQUIRE(b.state().end_effector_phase == world::EndEffectorPhase::Approach, "running -> approach");
    Vec3d p;
    REQUIRE(idx.stepApproachPosition(0, p) && nearVec(b.state().end_effector_target_m, p, 0.0), "approach target");
    REQUIRE(tr.has_seek && tr.seek_step_index == 0 && tr.seek_fraction_0_1 == 0.0, "running seeks to step start");
    REQUIRE(tr.interrupt_playback, "running interrupts playback");
    REQUIRE((tr.events_u32 & Event_ExecStepStarted) != 0, "step started event");
    requirePermittedTarget(b, "approach");

    b.tick(3.5);
    REQUIRE(b.state().end_effector_phase == world::EndEffectorPhase::Grasp, "grasp at expected - lead");
    REQUIRE(idx.stepAssembledPosition(0, p) && nearVec(b.state().end_effector_target_m, p, 0.0), "grasp target");
    b.tick(10.0);
    REQUIRE(b.state().end_effector_phase == world::EndEffectorPhase::Grasp, "grasp held until success");
    requirePermittedTarget(b, "grasp");

    tr = b.apply(snapshotOf(idx, {S::Success, S::Pending, S::Pending, S::Pending}));
    REQUIRE(tr.has_seek && tr.seek_step_index == 0 && tr.seek_fraction_0_1 == 1.0, "success seeks to step end");
    REQUIRE((tr.events_u32 & Event_ExecStepSucceeded) != 0, "step succeeded event");
    b.tick(0.4);
    REQUIRE(b.state().end_effector_phase == world::EndEffectorPhase::Retreat, "retreat after grasp hold");
    REQUIRE(idx.stepApproachPosition(0, p) && nearVec(b.state().end_effector_target_m, p, 0.0), "retreat target");
    requirePermittedTarget(b, "retreat");
    b.tick(0.6);
    REQUIRE(b.state().end_effector_phase == world::EndEffectorPhase::Idle, "idle after retreat");
    REQUIRE(nearVec(b.state().end_effector_target_m, rest, 0.0), "idle target is rest");
    requirePermittedTarget(b, "rest");

    // Failure path: approach then abort straight to retreat.
    b.apply(snapshotOf(idx, {S::Success, S::Running, S::Pending, S::Pending}));
    REQUIRE(b.state().tracked_step_index == 1, "tracks the running step");
    tr = b.apply(snapshotOf(idx, {S::Success, S::Failed, S::Pending, S::Pending}));
    REQUIRE(b.state().end_effector_phase == world::EndEffectorPhase::Retreat, "failed -> retreat");
    REQUIRE(!tr.has_seek, "failure must not advance the sequence");
    REQUIRE((tr.events_u32 & Event_ExecStepFailed) != 0, "step failed event");
    requirePermittedTarget(b, "failed");
    tr = b.apply(snapshotOf(idx, {S::Success, S::Retrying, S::Pending, S::Pending}));
    REQUIRE(b.state().end_effector_phase == world::EndEffectorPhase::Approach, "retrying -> approach again");
    REQUIRE(tr.has_seek && tr.seek_step_index == 1, "retry seeks to the step start");

    // Reset: everything pending again.
    tr = b.apply(snapshotOf(idx, {S::Pending, S::Pending, S::Pending, S::Pending}));
    REQUIRE(tr.reset_sequence && !tr.has_seek, "all pending resets the sequence");
    REQUIRE((tr.events_u32 & Event_ExecReset) != 0, "reset event");
    REQUIRE(b.state().end_effector_phase == world::EndEffectorPhase::Idle, "reset parks the arm");
    REQUIRE(b.state().tracked_step_index == -1, "reset clears the tracked step");
    requirePermittedTarget(b, "reset");
    std::cout << "[PASS] 5A bridge approach->grasp->retreat->idle cycle + failure + reset\n";
}

static void runBridgeIgnoresInvalid_5B() {
    const AssemblyDefinition d = demo("bracket_stack");
    StepIndex idx(d);
    ExecutionBridge b(&idx, v3(0.0, 1.0, 0.0), BridgeConfig{});
    using S = StepStatus;
    b.apply(snapshotOf(idx, {S::Running, S::Pending, S::Pending, S::Pending}));
    const ExecutionAnimState before = b.state();

    ExecutionSnapshot invalid = snapshotOf(idx, {S::Success, S::Running, S::Pending, S::Pending});
    invalid.valid = false;
    BridgeTriggers tr = b.apply(invalid);
    REQUIRE((tr.events_u32 & Warn_SnapshotIgnored) != 0, "invalid snapshot must be flagged");
    REQUIRE(!tr.has_seek && !tr.interrupt_playback && !tr.reset_sequence, "invalid snapshot must not trigger");

    ExecutionSnapshot other = snapshotOf(idx, {S::Success, S::Running, S::Pending, S::Pending});
    other.assembly_id = "some_other_assembly";
    tr = b.apply(other);
    REQUIRE((tr.events_u32 & Warn_SnapshotIgnored) != 0, "foreign snapshot must be flagged");

    REQUIRE(b.state().end_effector_phase == before.end_effector_phase, "phase changed by ignored snapshot");
    REQUIRE(nearVec(b.state().end_effector_target_m, before.end_effector_target_m, 0.0), "target changed");
    REQUIRE(b.lastStatus(0) == S::Running && b.lastStatus(1) == S::Pending, "statuses changed");

    // Unchanged snapshot is a no-op.
    tr = b.apply(snapshotOf(idx, {S::Running, S::Pending, S::Pending, S::Pending}));
    REQUIRE(!tr.has_seek && tr.events_u32 == 0, "repeated snapshot must not re-trigger");

    // One snapshot starting two steps: the reported current step is tracked.
    {
        ExecutionBridge tie(&idx, v3(0.0, 1.0, 0.0), BridgeConfig{});
        ExecutionSnapshot two = snapshotOf(idx, {S::Running, S::Running, S::Pending, S::Pending});
        two.current_step_id = idx.step(0).id;
        tr = tie.apply(two);
        REQUIRE(tie.state().tracked_step_index == 0, "current_step_id must pick the tracked step");
        REQUIRE(tr.has_seek && tr.seek_step_index == 0, "seek must follow the current step");
        Vec3d approach0;
        REQUIRE(idx.stepApproachPosition(0, approach0), "step 0 approach");
        REQUIRE(nearVec(tie.state().end_effector_target_m, approach0, 0.0), "target is the current step's approach");
        requirePermittedTarget(tie, "tie");

        ExecutionBridge last(&idx, v3(0.0, 1.0, 0.0), BridgeConfig{});
        tr = last.apply(snapshotOf(idx, {S::Running, S::Running, S::Pending, S::Pending}));
        REQUIRE(last.state().tracked_step_index == 1, "without a current step id the last start wins");

        ExecutionBridge unknown(&idx, v3(0.0, 1.0, 0.0), BridgeConfig{});
        ExecutionSnapshot bad = snapshotOf(idx, {S::Running, S::Running, S::Pending, S::Pending});
        bad.current_step_id = "no_such_step";
        unknown.apply(bad);
        REQUIRE(unknown.state().tracked_step_index == 1, "unknown current step id is ignored");
    }

    ExecutionBridge none(nullptr, v3(0.0, 0.0, 0.0), BridgeConfig{});
    tr = none.apply(snapshotOf(idx, {S::Running, S::Pending, S::Pending, S::Pending}));
    REQUIRE((tr.events_u32 & Warn_SnapshotIgnored) != 0, "bridge without an index ignores snapshots");
    std::cout << "[PASS] 5B invalid / foreign / repeated snapshots ignored; current step id breaks ties\n";
}

// =======================
// 6: Control adapter
// =======================

static void runScrubSequence_6A() {
    {
        AnimationController c;
        c.loadAssembly(demo("bracket_stack"));
        c.scrubStart();
        c.scrub(0.0);
        c.scrub(1.0);
        c.scrubEnd();
        REQUIRE(c.animation().phase == Phase::Idle && c.pendingCommandCount() == 4, "controls wait for tick");
        c.tick(1.0 / 60.0);
        REQUIRE(c.animation().phase == Phase::Idle, "scrub from idle must end idle");
        REQUIRE(c.animation().active_step_index == scrubberToStep(1.0, 4).step_index, "active step follows scrub");
        REQUIRE(c.animation().sequence_progress_0_1 == 1.0, "sequence position follows scrub");
        c.tick(5.0);
        REQUIRE(c.animation().phase == Phase::Idle, "scrub consumed the pending demo");
    }
    {
        AnimationController c;
        c.loadAssembly(demo("bracket_stack"));
        c.toggle();
        c.tick(0.1);
        REQUIRE(c.animation().phase == Phase::Playing, "toggle from idle plays");
        c.scrubStart();
        c.scrub(0.0);
        c.scrub(1.0);
        c.scrubEnd();
        c.tick(0.1);
        REQUIRE(c.animation().phase == Phase::Playing, "scrub from playing must resume playing");
        REQUIRE(c.animation().active_step_index == 3, "active step matches final scrub position");
    }
    {
        AnimationController c;
        c.loadAssembly(demo("bracket_stack"));
        c.getLatestEvents();
        c.scrub(0.5);
        c.tick(0.01);
        REQUIRE((c.getLatestEvents() & Warn_ScrubWithoutStart) != 0, "scrub without start must be flagged");
        REQUIRE(c.animation().active_step_index == -1, "scrub without start must not move the sequence");
    }
    std::cout << "[PASS] 6A scrubStart/scrub(0)/scrub(1)/scrubEnd restores idle or playing\n";
}

static void runControllerDemo_6B() {
    AnimationController c;
    c.loadAssembly(demo("bearing_housing"));
    REQUIRE((c.getLatestEvents() & Event_AssemblyLoaded) != 0, "load event");

    std::vector<Phase> seen;
    seen.push_back(c.animation().phase);
    std::uint32_t all = 0;
    for (int i = 0; i < 60 * 12; ++i) {
        c.tick(1.0 / 60.0);
        all |= c.frame().events_u32;
        if (c.animation().phase != seen.back()) seen.push_back(c.animation().phase);
        REQUIRE(c.frame().parts.size() == 8, "every part rendered every frame");
    }
    const Phase expected[] = {Phase::Idle, Phase::DemoFadeIn, Phase::DemoHold, Phase::DemoExplode,
                              Phase::DemoAssemble, Phase::Idle};
    REQUIRE(seen.size() == 6, "demo must visit exactly six phases, saw " << seen.size());
    for (std::size_t i = 0; i < seen.size(); ++i) {
        REQUIRE(seen[i] == expected[i], "demo phase " << i << " was " << phaseName(seen[i]));
    }
    REQUIRE((all & Warn_OpaqueCountDecreased) == 0, "fully-opaque count decreased during demo assemble");
    REQUIRE((all & Warn_TargetNotPermitted) == 0, "end-effector target left the permitted set");
    REQUIRE((all & Event_PhaseChanged) != 0, "phase change events expected");
    REQUIRE((all & Event_StepCompleted) != 0, "step completion events expected");
    REQUIRE(!c.autoplayArmed(), "autoplay is off by default");
    std::cout << "[PASS] 6B controller-driven demo order + no invariant warnings\n";
}

static std::uint32_t scriptedSession(double dt) {
    AnimationController c;
    c.loadAssembly(demo("bearing_housing"));
    for (int i = 0; i < 400; ++i) {
        if (i == 100) c.replayDemo();
        if (i == 250) c.toggle();
        if (i == 300) c.stepForward();
        if (i == 320) { c.scrubStart(); c.scrub(0.4); }
        if (i == 340) c.scrubEnd();
        if (i == 350) c.setSelectedPart("cover");
        c.tick(dt);
    }
    return c.runDigest();
}

static void runDigestDeterminism_6C() {
    const std::uint32_t a = scriptedSession(1.0 / 60.0);
    const std::uint32_t b = scriptedSession(1.0 / 60.0);
    REQUIRE(a == b, "replaying the same session must give the same digest");
    const std::uint32_t c = scriptedSession(1.0 / 30.0);
    REQUIRE(a != c, "a different session should give a different digest");
    std::cout << "[PASS] 6C run digest deterministic across replays (0x" << std::hex << a << std::dec << ")\n";
}

static void runTogglePauseResume_6D() {
    AnimationController c;
    c.loadAssembly(demo("bracket_stack"));
    c.toggle();
    c.tick(0.1);
    for (int i = 0; i < 20; ++i) c.tick(0.05);
    REQUIRE(c.animation().phase == Phase::Playing, "playing");
    const double at = c.animation().sequence_progress_0_1;
    const int step = c.animation().active_step_index;

    c.toggle();
    c.tick(0.05);
    REQUIRE(c.animation().phase == Phase::Idle, "toggle pauses to idle");
    REQUIRE(c.animation().sequence_progress_0_1 == at, "pause keeps the sequence position");
    for (int i = 0; i < 20; ++i) c.tick(0.05);
    REQUIRE(c.animation().sequence_progress_0_1 == at, "paused sequence must not move");
    const PartStateMap& parts = c.frame().parts;
    const int active_part = c.index().partsOfStep(step).front();
    REQUIRE(parts.at(c.index().part(active_part).id).visual_class == VisualClass::Active, "paused step stays active");

    c.toggle();
    c.tick(0.05);
    REQUIRE(c.animation().phase == Phase::Playing, "toggle resumes");
    REQUIRE(c.animation().sequence_progress_0_1 == at, "resume tick starts where pause left");
    c.tick(0.05);
    REQUIRE(c.animation().sequence_progress_0_1 > at, "resumed playback advances");

    c.scrubStart();
    c.toggle();
    c.tick(0.05);
    REQUIRE(c.animation().phase == Phase::Scrubbing, "toggle ignored while scrubbing");
    c.scrubEnd();
    c.forceIdle();
    c.tick(0.05);
    REQUIRE(c.animation().phase == Phase::Idle, "forceIdle");

    // Replay restarts the demo at fade-in.
    c.replayDemo();
    c.tick(0.05);
    REQUIRE(c.animation().phase == Phase::DemoFadeIn, "replayDemo resets to demo_fadein");
    REQUIRE(c.animation().progress_0_1 == 0.0, "explicit change wins over natural advance");
    c.toggle();
    c.tick(0.05);
    REQUIRE(c.animation().phase == Phase::Playing && c.animation().active_step_index == 0,
            "toggle during the demo plays from the start");
    std::cout << "[PASS] 6D toggle pause/resume + scrubbing lock + forceIdle + replayDemo\n";
}

static void runAutoplay_6E() {
    AnimationConfigV1 cfg;
    cfg.autoplay_after_demo_u32 = 1;
    cfg.autoplay_delay_s = 1.0;
    AnimationController c(cfg);
    REQUIRE(c.config().autoplay_after_demo_u32 == 1u, "config accepted");
    c.loadAssembly(demo("bracket_stack"));

    bool armed_seen = false;
    bool fired = false;
    for (int i = 0; i < 60 * 10 && !fired; ++i) {
        c.tick(1.0 / 60.0);
        if (c.autoplayArmed()) armed_seen = true;
        if ((c.frame().events_u32 & Event_AutoplayFired) != 0) fired = true;
    }
    REQUIRE(armed_seen, "autoplay must arm after the demo");
    REQUIRE(fired, "autoplay must fire after its delay");
    REQUIRE(c.animation().phase == Phase::Playing && c.animation().progress_0_1 == 0.0, "autoplay plays from 0");

    // Any control cancels a pending autoplay.
    AnimationController d(cfg);
    d.loadAssembly(demo("bracket_stack"));
    while (!d.autoplayArmed() && d.frameCount() < 2000) d.tick(1.0 / 60.0);
    REQUIRE(d.autoplayArmed(), "autoplay armed");
    d.stepForward();
    d.tick(1.0 / 60.0);
    REQUIRE(!d.autoplayArmed(), "control must clear the autoplay timer");
    for (int i = 0; i < 200; ++i) d.tick(1.0 / 60.0);
    REQUIRE(d.animation().phase == Phase::Idle, "cleared timer must not start playback");
    std::cout << "[PASS] 6E autoplay after demo fires once and is cleared by controls\n";
}

static void runExecutionDrivesAnimation_6F() {
    const AssemblyDefinition d = demo("bracket_stack");
    AnimationController c;
    c.loadAssembly(d);
    MockExecutionRunner runner;
    runner.setAssembly(d);
    runner.start();

    std::uint32_t posted = 0;
    std::uint32_t all = 0;
    const double dt = 0.25;
    for (int i = 0; i < 100; ++i) {
        runner.tick(dt);
        if (runner.revision() != posted) {
            posted = runner.revision();
            c.postExecutionSnapshot(runner.snapshot());
        }
        c.tick(dt);
        all |= c.frame().events_u32;
        REQUIRE(!isDemoPhase(c.animation().phase), "execution must pre-empt the demo");
        requirePermittedTarget(c.bridge(), "execution run");
        REQUIRE(c.frame().arm.reach_0_1 < 1.0, "reach below 1 during execution");

        if (i == 0) REQUIRE(c.animation().active_step_index == 0, "first running step seeks to step 0");
        if (i == 25) REQUIRE(c.animation().active_step_index == 1, "second step follows execution");
    }
    REQUIRE(runner.phase() == ExecutionRunPhase::Complete, "mock run completes");
    REQUIRE((all & Event_ExecStepStarted) && (all & Event_ExecStepSucceeded), "execution events expected");
    REQUIRE(c.animation().active_step_index == 3, "animation rests on the last step");
    for (const auto& kv : c.frame().parts) {
        REQUIRE(kv.second.visual_class == VisualClass::Complete, kv.first << " incomplete after execution");
    }
    REQUIRE(c.frame().execution.end_effector_phase == world::EndEffectorPhase::Idle, "arm parks after the run");

    // Invalid snapshots are dropped without touching the bridge.
    const ExecutionAnimState before = c.bridge().state();
    ExecutionSnapshot bad = runner.snapshot();
    bad.valid = false;
    c.getLatestEvents();
    c.postExecutionSnapshot(bad);
    c.tick(dt);
    REQUIRE((c.getLatestEvents() & Warn_SnapshotIgnored) != 0, "invalid snapshot flagged");
    REQUIRE(c.bridge().state().end_effector_phase == before.end_effector_phase, "bridge unchanged");

    // Interrupting a running demo.
    AnimationController e;
    e.loadAssembly(d);
    e.tick(0.5);
    e.tick(0.4);
    REQUIRE(e.animation().phase == Phase::DemoHold, "demo reached hold");
    MockExecutionRunner r2;
    r2.setAssembly(d);
    r2.start();
    e.postExecutionSnapshot(r2.snapshot());
    e.tick(0.01);
    REQUIRE(e.animation().phase == Phase::Idle, "execution interrupts the demo");
    REQUIRE(e.animation().active_step_index == 0, "interrupt seeks to the running step");
    std::cout << "[PASS] 6F mock execution drives sequence + arm; invalid snapshots ignored\n";
}

static void runEmptyAndMisuse_6G() {
    AnimationController c;
    c.loadAssembly(demo("empty"));
    c.toggle();
    c.stepForward();
    c.replayDemo();
    c.scrubStart();
    c.scrub(0.5);
    c.scrubEnd();
    c.forceIdle();
    for (int i = 0; i < 100; ++i) c.tick(0.1);
    REQUIRE(c.animation().phase == Phase::Idle, "empty assembly stays idle");
    REQUIRE(c.frame().parts.empty(), "empty assembly has no parts");
    REQUIRE((c.getLatestEvents() & Warn_ControlIgnored) != 0, "controls ignored on an empty assembly");
    REQUIRE(std::isfinite(c.frame().arm.reach_0_1), "arm still finite");

    AnimationController d;
    d.loadAssembly(demo("bracket_stack"));
    const std::uint32_t frames = d.frameCount();
    d.tick(0.0);
    d.tick(-1.0);
    d.tick(std::numeric_limits<double>::quiet_NaN());
    REQUIRE(d.frameCount() == frames, "invalid dt must not produce frames");

    d.setSelectedPart("spacer");
    d.tick(0.01);
    REQUIRE(d.frame().parts.at("spacer").visual_class == VisualClass::Selected, "selection applied");
    d.setSelectedPart("");
    d.tick(0.01);
    REQUIRE(d.frame().parts.at("spacer").visual_class != VisualClass::Selected, "selection cleared");

    for (int i = 0; i < 3000; ++i) d.tick(0.01);
    std::vector<FrameTelemetrySample> samples(4096);
    const int n = d.getTelemetrySamples(samples.data(), (int)samples.size());
    REQUIRE(n == 2048, "telemetry ring holds the newest 2048 frames, got " << n);
    REQUIRE(near(samples[(std::size_t)n - 1].t_s, d.frame().time_s, 1e-3), "newest sample last");
    for (int i = 1; i < n; ++i) {
        REQUIRE(samples[(std::size_t)i].t_s >= samples[(std::size_t)i - 1].t_s, "telemetry ordered oldest first");
    }
    REQUIRE(d.getTelemetrySamples(nullptr, 10) == 0 && d.getTelemetrySamples(samples.data(), 0) == 0,
            "telemetry misuse returns 0");
    std::cout << "[PASS] 6G empty assembly inert + invalid dt + selection + telemetry ring\n";
}

// =======================
// 7: Mock execution runner
// =======================

static void runMockRunner_7A() {
    const AssemblyDefinition d = demo("bracket_stack");
    MockExecutionRunner r;
    r.setAssembly(d);
    REQUIRE(r.phase() == ExecutionRunPhase::Idle && r.snapshot().valid, "idle, valid snapshot");
    REQUIRE(r.snapshot().step_states.size() == 4, "one state per step");

    r.start();
    REQUIRE(r.snapshot().step_states[0].status == StepStatus::Running, "first step running");
    REQUIRE(r.snapshot().current_step_id == "step_001", "current step id");
    for (int i = 0; i < 19; ++i) r.tick(0.25);
    REQUIRE(r.currentStepIndex() == 0, "no advance before the interval");
    r.tick(0.25);
    REQUIRE(r.currentStepIndex() == 1, "one step per interval");
    REQUIRE(r.snapshot().step_states[0].status == StepStatus::Success, "previous step success");
    REQUIRE(r.snapshot().step_states[1].status == StepStatus::Running, "next step running");

    r.pause();
    for (int i = 0; i < 100; ++i) r.tick(0.25);
    REQUIRE(r.currentStepIndex() == 1 && r.phase() == ExecutionRunPhase::Paused, "pause freezes the run");
    r.resume();
    for (int i = 0; i < 60; ++i) r.tick(0.25);
    REQUIRE(r.phase() == ExecutionRunPhase::Complete, "run completes after the last step");
    REQUIRE(r.snapshot().current_step_id.empty(), "no current step once complete");
    for (const StepRuntimeState& s : r.snapshot().step_states) {
        REQUIRE(s.status == StepStatus::Success, "every step succeeded");
    }

    r.stop();
    REQUIRE(r.phase() == ExecutionRunPhase::Idle, "stop returns to idle");
    for (const StepRuntimeState& s : r.snapshot().step_states) {
        REQUIRE(s.status == StepStatus::Pending, "stop resets every step");
    }

    r.start();
    r.intervene();
    REQUIRE(r.phase() == ExecutionRunPhase::Teaching, "intervene enters teaching");
    REQUIRE(r.snapshot().step_states[0].status == StepStatus::Human, "current step handed to the operator");
    r.resume();
    REQUIRE(r.snapshot().step_states[0].status == StepStatus::Retrying, "resume retries the step");
    REQUIRE(r.snapshot().step_states[0].attempt == 2, "retry bumps the attempt");

    MockExecutionRunner::Config cfg;
    cfg.fail_step_index = 1;
    cfg.fail_attempts = 1;
    MockExecutionRunner f(cfg);
    f.setAssembly(d);
    f.start();
    for (int i = 0; i < 40; ++i) f.tick(0.25);
    REQUIRE(f.snapshot().step_states[1].status == StepStatus::Failed, "scripted failure");
    for (int i = 0; i < 20; ++i) f.tick(0.25);
    REQUIRE(f.snapshot().step_states[1].status == StepStatus::Retrying, "retry after failure");
    REQUIRE(f.snapshot().step_states[1].attempt == 2, "second attempt");
    for (int i = 0; i < 20; ++i) f.tick(0.25);
    REQUIRE(f.snapshot().step_states[1].status == StepStatus::Success, "retry succeeds");
    for (int i = 0; i < 40; ++i) f.tick(0.25);
    REQUIRE(f.phase() == ExecutionRunPhase::Complete, "failing run still completes");

    MockExecutionRunner empty;
    empty.setAssembly(demo("empty"));
    empty.start();
    REQUIRE(empty.phase() == ExecutionRunPhase::Idle, "nothing to run");
    std::cout << "[PASS] 7A mock execution: interval advance, pause/resume, stop, intervene, failure/retry\n";
}

// =======================
// 8: Configuration contract
// =======================

static void runConfigContract_8A() {
    AnimationConfigV1 in;
    AnimationConfigV1 out;
    REQUIRE(sanitizeConfig(in, out), "default config accepted");
    REQUIRE(out.fnv_hash_u32 == hashConfig(out), "sanitized config carries its hash");
    REQUIRE(hashConfig(out) == hashConfig(out), "hash deterministic");

    AnimationConfigV1 changed = out;
    changed.timing.move_s = 0.75;
    REQUIRE(hashConfig(changed) != hashConfig(out), "hash must cover timing");

    AnimationConfigV1 wrong = in;
    wrong.version_u32 = 2;
    AnimationConfigV1 untouched = out;
    REQUIRE(!sanitizeConfig(wrong, untouched), "mismatched version rejected");
    REQUIRE(untouched.fnv_hash_u32 == out.fnv_hash_u32, "rejected config leaves output untouched");
    wrong = in;
    wrong.size_bytes_u32 = 4;
    REQUIRE(!sanitizeConfig(wrong, untouched), "mismatched size rejected");

    AnimationController c;
    REQUIRE(!c.setConfig(wrong), "controller rejects mismatched config");

    AnimationConfigV1 wild = in;
    wild.style.ghost_opacity_0_1 = 5.0;
    wild.timing.move_s = -1.0;
    wild.timing.pause_s = std::numeric_limits<double>::quiet_NaN();
    wild.arm.reach_cap_0_1 = 1.5;
    REQUIRE(sanitizeConfig(wild, out), "out-of-range values are clamped, not rejected");
    REQUIRE(out.style.ghost_opacity_0_1 == 1.0, "opacity clamped");
    REQUIRE(out.timing.move_s == 0.0, "negative duration clamped");
    REQUIRE(out.timing.stepDuration_s() > 0.0, "step window kept positive");
    REQUIRE(out.arm.reach_cap_0_1 < 1.0, "reach cap kept below 1");

    char buf[4096];
    const int n = exportConfigText(in, buf, (int)sizeof(buf));
    REQUIRE(n > 0 && n < (int)sizeof(buf), "export wrote text");
    REQUIRE(std::strstr(buf, "AnimationConfigV1") != nullptr, "export header");
    REQUIRE(std::strstr(buf, "fnv_hash_u32=0x") != nullptr, "export hash stamp");
    REQUIRE(std::strstr(buf, "move_s=0.5") != nullptr, "export timing");

    char buf2[4096];
    REQUIRE(c.exportConfigText(buf2, (int)sizeof(buf2)) == n && std::strcmp(buf, buf2) == 0,
            "controller export matches the default config");

    char tiny[16];
    const int m = exportConfigText(in, tiny, (int)sizeof(tiny));
    REQUIRE(m == 15 && std::strlen(tiny) == 15, "export truncates safely");
    REQUIRE(exportConfigText(in, nullptr, 10) == 0, "null buffer");
    std::cout << "[PASS] 8A config version/size contract + clamping + hash + text export\n";
}

} // namespace

int main() {
    // =======================
    // 1: Scrubber mapping
    // =======================
    runScrubberKnownValue_1A();
    runScrubberInverse_1B();
    runScrubberEdgeCases_1C();

    // =======================
    // 2: Phase state machine
    // =======================
    runDemoPhaseOrder_2A();
    runOversizedDtNeverSkips_2B();
    runCumulativeDt_2C();
    runInvalidDtAndInert_2D();
    runStepForwardBackward_2E();
    runPlayingCompletes_2F();

    // =======================
    // 3: Per-part render state
    // =======================
    runEasing_3A();
    runRenderStatePure_3B();
    runRenderStateRules_3C();
    runFixturesAndSideApproach_3D();

    // =======================
    // 4: Arm pose solver
    // =======================
    runArmReachBelowOne_4A();
    runArmFollowAndGripper_4B();

    // =======================
    // 5: Execution bridge
    // =======================
    runBridgeCycle_5A();
    runBridgeIgnoresInvalid_5B();

    // =======================
    // 6: Control adapter
    // =======================
    runScrubSequence_6A();
    runControllerDemo_6B();
    runDigestDeterminism_6C();
    runTogglePauseResume_6D();
    runAutoplay_6E();
    runExecutionDrivesAnimation_6F();
    runEmptyAndMisuse_6G();

    // =======================
    // 7: Mock execution
    // =======================
    runMockRunner_7A();

    // =======================
    // 8: Configuration
    // =======================
    runConfigContract_8A();

    return 0;
}
