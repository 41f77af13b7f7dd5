#pragma once

// AnimationController.h
//
// Control adapter: the only stateful shell around the animation core.
// Owns the step index, phase machine, execution bridge and arm solver for one
// assembly and runs them in a fixed order once per tick:
//
//   1. merge the most recent execution snapshot (bridge triggers)
//   2. drain queued host controls, in the order they were issued
//   3. natural phase advance (skipped if 1 or 2 changed the phase this tick)
//   4. auto-play timer
//   5. bridge timing, arm pose
//   6. part render states, events, telemetry, run digest
//
// Host controls never act immediately; they are applied at the next tick boundary.

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "AnimationConfig.h"
#include "AssemblyTypes.h"
#include "ExecutionBridge.h"
#include "PartAnimation.h"
#include "PhaseMachine.h"
#include "arm_pose_solver.h"

namespace seqviz {

struct FrameTelemetrySample {
    // Fixed order, explicit units.
    float t_s = 0.0f;
    std::uint32_t phase_u32 = 0;
    float progress_0_1 = 0.0f;
    std::int32_t active_step_i32 = -1;
    float sequence_0_1 = 0.0f;
    std::uint32_t complete_count_u32 = 0;
    float reach_0_1 = 0.0f;
    float gripper_gap_0_1 = 1.0f;
    std::uint32_t ee_phase_u32 = 0;
    float ee_x_m = 0.0f;
    float ee_y_m = 0.0f;
    float ee_z_m = 0.0f;
};

// Everything the renderer needs for one frame.
struct FrameOutput {
    double time_s = 0.0;
    AnimationState animation{};
    PartStateMap parts;
    ExecutionAnimState execution{};
    world::ArmPose arm{};
    std::uint32_t events_u32 = 0;
};

enum class ControlCommand : std::uint32_t {
    Toggle = 0,
    StepForward,
    StepBackward,
    ReplayDemo,
    ScrubStart,
    Scrub,
    ScrubEnd,
    ForceIdle,
};

const char* controlCommandName(ControlCommand c);

class AnimationController {
public:
    AnimationController();
    explicit AnimationController(const AnimationConfigV1& cfg);

    // The bridge keeps a pointer into the owned step index.
    AnimationController(const AnimationController&) = delete;
    AnimationController& operator=(const AnimationController&) = delete;
    AnimationController(AnimationController&&) = delete;
    AnimationController& operator=(AnimationController&&) = delete;

    // Rejects mismatched version/size. An accepted config reloads the current assembly.
    bool setConfig(const AnimationConfigV1& cfg);
    const AnimationConfigV1& config() const { return cfg_; }

    // Replaces the assembly; every piece of animation state starts fresh.
    void loadAssembly(const AssemblyDefinition& def);
    const StepIndex& index() const { return index_; }

    // ---- Host controls (queued) ----
    void toggle();
    void stepForward();
    void stepBackward();
    void replayDemo();
    void scrubStart();
    void scrub(double global_0_1);
    void scrubEnd();
    void forceIdle();

    // ---- Inputs ----
    // Most recent wins; merged at the next tick. Invalid snapshots are dropped.
    void postExecutionSnapshot(const ExecutionSnapshot& snap);
    void setSelectedPart(const std::string& part_id) { selected_part_id_ = part_id; }
    const std::string& selectedPart() const { return selected_part_id_; }

    // dt must be positive and finite; invalid dt is ignored.
    void tick(double dt);

    const FrameOutput& frame() const { return frame_; }
    const AnimationState& animation() const { return machine_.state(); }
    const PhaseMachine& machine() const { return machine_; }
    const ExecutionBridge& bridge() const { return bridge_; }
    const world::ArmPoseSolver& arm() const { return arm_; }

    bool autoplayArmed() const { return autoplay_armed_; }
    double autoplayRemaining_s() const { return autoplay_armed_ ? autoplay_remaining_s_ : 0.0; }
    std::size_t pendingCommandCount() const { return commands_.size(); }

    // Latched since the last call.
    std::uint32_t getLatestEvents();
    int getTelemetrySamples(FrameTelemetrySample* out_ptr, int cap) const;

    // FNV-1a32 over every frame produced since the last load.
    std::uint32_t runDigest() const { return digest_u32_; }
    std::uint32_t frameCount() const { return frame_count_u32_; }

    int exportConfigText(char* buf, int cap) const;

private:
    struct Command {
        ControlCommand kind = ControlCommand::Toggle;
        double value = 0.0;
    };

    void reload();
    void enqueue(ControlCommand c, double value = 0.0);
    void execute(const Command& c, std::uint32_t& ev);
    void applyTriggers(const BridgeTriggers& trig, std::uint32_t& ev);
    void clearAutoplay();
    void computeOutputs();
    void recordFrame();

    AnimationConfigV1 cfg_{};

    AssemblyDefinition def_{};
    StepIndex index_{};
    PhaseMachine machine_{};
    ExecutionBridge bridge_{};
    world::ArmPoseSolver arm_{};

    std::vector<Command> commands_;
    ExecutionSnapshot pending_snapshot_{};
    bool has_pending_snapshot_ = false;

    std::string selected_part_id_;
    bool resume_after_scrub_ = false;

    bool autoplay_armed_ = false;
    double autoplay_remaining_s_ = 0.0;

    FrameOutput frame_{};
    double time_s_ = 0.0;
    std::size_t last_complete_count_ = 0;

    std::uint32_t latest_events_bits_ = 0;
    std::uint32_t digest_u32_ = 0;
    std::uint32_t frame_count_u32_ = 0;

    // Telemetry ring buffer (fixed capacity, no allocation during tick)
    static constexpr int kTelemetryCapacity_ = 2048;
    std::array<FrameTelemetrySample, kTelemetryCapacity_> telemetry_rb_{};
    int telemetry_head_ = 0;
    int telemetry_count_ = 0;
};

} // namespace seqviz
