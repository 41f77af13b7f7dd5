#include "PhaseMachine.h"

#include "Scrubber.h"

#include <algorithm>
#include <cmath>

namespace seqviz {

namespace {

// Cumulative dt summing to a phase duration may land a few ulps short of 1.
constexpr double kCompleteEps = 1e-9;

inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

inline bool isFinitePositive(double x) { return std::isfinite(x) && x > 0.0; }

inline bool tracksSequence(Phase p) {
    return p == Phase::Playing || p == Phase::Scrubbing || p == Phase::DemoAssemble;
}

} // namespace

const char* phaseName(Phase p) {
    switch (p) {
        case Phase::Idle:         return "idle";
        case Phase::DemoFadeIn:   return "demo_fadein";
        case Phase::DemoHold:     return "demo_hold";
        case Phase::DemoExplode:  return "demo_explode";
        case Phase::DemoAssemble: return "demo_assemble";
        case Phase::Playing:      return "playing";
        case Phase::Scrubbing:    return "scrubbing";
        default:                  return "unknown";
    }
}

PhaseMachine::PhaseMachine(int step_count, int part_count, const PhaseTimingConfig& timing)
    : timing_(timing),
      step_count_(std::max(step_count, 0)),
      part_count_(std::max(part_count, 0)) {
    demo_armed_ = !isInert();
}

Phase PhaseMachine::nextPhase(Phase p) {
    switch (p) {
        case Phase::Idle:         return Phase::DemoFadeIn;
        case Phase::DemoFadeIn:   return Phase::DemoHold;
        case Phase::DemoHold:     return Phase::DemoExplode;
        case Phase::DemoExplode:  return Phase::DemoAssemble;
        case Phase::DemoAssemble: return Phase::Idle;
        case Phase::Playing:      return Phase::Idle;
        case Phase::Scrubbing:    return Phase::Idle;
        default:                  return Phase::Idle;
    }
}

double PhaseMachine::phaseDuration_s(Phase p) const {
    switch (p) {
        case Phase::Idle:
            return demo_armed_ ? std::max(timing_.demo_start_delay_s, 0.0) : -1.0;
        case Phase::DemoFadeIn:
            return std::max(timing_.fadein_per_part_s, 0.0) * static_cast<double>(part_count_);
        case Phase::DemoHold:
            return std::max(timing_.hold_s, 0.0);
        case Phase::DemoExplode:
            return std::max(timing_.explode_s, 0.0);
        case Phase::DemoAssemble:
        case Phase::Playing:
            return std::max(timing_.stepDuration_s(), 0.0) * static_cast<double>(step_count_);
        case Phase::Scrubbing:
        default:
            return -1.0;
    }
}

void PhaseMachine::applySequence(double global_0_1) {
    state_.sequence_progress_0_1 = clamp01(global_0_1);
    state_.active_step_index = scrubberToStep(state_.sequence_progress_0_1, step_count_).step_index;
}

void PhaseMachine::enterPhase(Phase p, double at_progress_0_1) {
    if (p == Phase::Count) p = Phase::Idle;

    const Phase prev = state_.phase;
    state_.phase = p;
    state_.progress_0_1 = clamp01(at_progress_0_1);

    const double dur = phaseDuration_s(p);
    state_.phase_elapsed_s = (dur > 0.0) ? state_.progress_0_1 * dur : 0.0;

    if (tracksSequence(p)) {
        applySequence(state_.progress_0_1);
    } else if (isDemoPhase(p)) {
        state_.sequence_progress_0_1 = 0.0;
        state_.active_step_index = -1;
    } else if (p == Phase::Idle && prev == Phase::DemoAssemble) {
        // The demo is a preview; the user sequence starts from scratch.
        state_.sequence_progress_0_1 = 0.0;
        state_.active_step_index = -1;
    }

    // Any departure from Idle consumes the pending demo start.
    if (p != Phase::Idle) demo_armed_ = false;

    ++transitions_u32_;
}

void PhaseMachine::tick(double dt) {
    if (isInert()) return;
    if (!isFinitePositive(dt)) return;

    const double dur = phaseDuration_s(state_.phase);
    if (dur < 0.0) return;

    state_.phase_elapsed_s += dt;
    if (dur > 0.0) {
        state_.progress_0_1 = clamp01(state_.progress_0_1 + dt / dur);
    } else {
        state_.progress_0_1 = 1.0;
    }

    if (tracksSequence(state_.phase)) {
        applySequence(state_.progress_0_1);
    }

    if (state_.progress_0_1 >= 1.0 - kCompleteEps) {
        // Snap to the boundary so the final pose of this phase is exact before leaving.
        state_.progress_0_1 = 1.0;
        if (tracksSequence(state_.phase)) applySequence(1.0);
        enterPhase(nextPhase(state_.phase), 0.0);
    }
}

void PhaseMachine::goToPhase(Phase p) {
    if (isInert()) return;
    const double at = (p == Phase::Playing || p == Phase::Scrubbing) ? state_.sequence_progress_0_1 : 0.0;
    enterPhase(p, at);
}

void PhaseMachine::goToPhase(Phase p, double at_progress_0_1) {
    if (isInert()) return;
    enterPhase(p, at_progress_0_1);
}

void PhaseMachine::seekSequence(double global_0_1) {
    if (isInert()) return;
    demo_armed_ = false;
    applySequence(global_0_1);

    if (state_.phase == Phase::Playing || state_.phase == Phase::Scrubbing) {
        state_.progress_0_1 = state_.sequence_progress_0_1;
        const double dur = phaseDuration_s(state_.phase);
        state_.phase_elapsed_s = (dur > 0.0) ? state_.progress_0_1 * dur : 0.0;
    }
}

void PhaseMachine::seekStep(int step_index, double fraction_0_1) {
    if (isInert()) return;
    seekSequence(stepToScrubber(step_index, fraction_0_1, step_count_));
}

void PhaseMachine::resetSequence() {
    if (isInert()) return;
    state_.sequence_progress_0_1 = 0.0;
    state_.active_step_index = -1;
    if (state_.phase == Phase::Playing || state_.phase == Phase::Scrubbing) {
        state_.progress_0_1 = 0.0;
        state_.phase_elapsed_s = 0.0;
    }
}

void PhaseMachine::stepForward() {
    if (isInert()) return;
    if (isDemoPhase(state_.phase)) enterPhase(Phase::Idle, 0.0);

    const int cur = state_.active_step_index;
    const int next = std::clamp((cur < 0) ? 0 : cur + 1, 0, step_count_ - 1);
    seekStep(next, 0.0);
}

void PhaseMachine::stepBackward() {
    if (isInert()) return;
    if (isDemoPhase(state_.phase)) enterPhase(Phase::Idle, 0.0);

    const int cur = state_.active_step_index;
    const int prev = std::clamp((cur <= 0) ? 0 : cur - 1, 0, step_count_ - 1);
    seekStep(prev, 0.0);
}

void PhaseMachine::armDemo(bool armed) {
    if (isInert()) return;
    demo_armed_ = armed;
}

} // namespace seqviz
