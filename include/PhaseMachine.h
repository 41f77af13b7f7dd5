#pragma once

// PhaseMachine.h
//
// Phase state machine for the assembly animation.
//
// Demo order (natural transitions on tick):
//   Idle -> DemoFadeIn -> DemoHold -> DemoExplode -> DemoAssemble -> Idle
// Playing and Scrubbing are entered only through goToPhase() and fall back to Idle.
//
// Rules:
//   - The machine is the only writer of AnimationState; everyone else reads state().
//   - At most one natural transition per tick. Overshoot past a phase boundary is
//     discarded: the next phase starts at progress 0.
//   - A machine built for zero steps is inert: it stays Idle and every call is a no-op.
//   - Idle only advances on its own while the demo is armed (fresh assembly load).

#include <cstdint>

namespace seqviz {

enum class Phase : std::uint32_t {
    Idle = 0,
    DemoFadeIn,
    DemoHold,
    DemoExplode,
    DemoAssemble,
    Playing,
    Scrubbing,
    Count
};

const char* phaseName(Phase p);

inline bool isDemoPhase(Phase p) {
    return p == Phase::DemoFadeIn || p == Phase::DemoHold ||
           p == Phase::DemoExplode || p == Phase::DemoAssemble;
}

struct AnimationState {
    Phase phase = Phase::Idle;

    // Position within the phase; for Playing/Scrubbing, within the whole sequence.
    double progress_0_1 = 0.0;

    // -1 until a part has begun.
    int active_step_index = -1;

    // Last known position in the whole sequence (kept across pause/resume).
    double sequence_progress_0_1 = 0.0;

    // Seconds spent in the current phase.
    double phase_elapsed_s = 0.0;
};

struct PhaseTimingConfig {
    double demo_start_delay_s = 0.5;
    double fadein_per_part_s  = 0.1;
    double hold_s             = 1.0;
    double explode_s          = 1.0;

    // Per-step playback window: move, then pause, then complete.
    double move_s  = 0.5;
    double pause_s = 0.3;

    double stepDuration_s() const { return move_s + pause_s; }
};

class PhaseMachine {
public:
    PhaseMachine() = default;
    PhaseMachine(int step_count, int part_count, const PhaseTimingConfig& timing);

    // Advance by dt seconds. dt must be positive and finite; otherwise ignored.
    void tick(double dt);

    // Explicit switch; always legal. Without a progress argument Playing/Scrubbing
    // resume from the current sequence position and every other phase starts at 0.
    void goToPhase(Phase p);
    void goToPhase(Phase p, double at_progress_0_1);

    void stepForward();
    void stepBackward();

    // Move the sequence position without changing phase.
    void seekStep(int step_index, double fraction_0_1);
    void seekSequence(double global_0_1);

    // Back to "no part has begun".
    void resetSequence();

    void armDemo(bool armed);
    bool demoArmed() const { return demo_armed_; }

    const AnimationState& state() const { return state_; }
    const PhaseTimingConfig& timing() const { return timing_; }

    // Seconds for the phase to complete naturally, or < 0 if it never does.
    double phaseDuration_s(Phase p) const;

    int stepCount() const { return step_count_; }
    int partCount() const { return part_count_; }
    bool isInert() const { return step_count_ <= 0; }

    // Incremented on every phase entry (natural or explicit).
    std::uint32_t transitionCount() const { return transitions_u32_; }

private:
    static Phase nextPhase(Phase p);

    void enterPhase(Phase p, double at_progress_0_1);
    void applySequence(double global_0_1);

    PhaseTimingConfig timing_{};
    AnimationState state_{};

    int step_count_ = 0;
    int part_count_ = 0;

    bool demo_armed_ = false;
    std::uint32_t transitions_u32_ = 0;
};

} // namespace seqviz
