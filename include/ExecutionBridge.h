#pragma once

// ExecutionBridge.h
//
// Reconciles execution-state snapshots (per-step status from the remote
// execution process) into:
//   - ExecutionAnimState (end-effector target + phase), of which the bridge is the
//     only writer, and
//   - BridgeTriggers for the phase machine (seek / interrupt / reset), which the
//     control adapter applies.
//
// End-effector cycle for the tracked step:
//   running/retrying -> Approach   (target: step approach position)
//   expected completion - lead, or success -> Grasp (target: step assembled position)
//   success seen + grasp hold      -> Retreat  (target: step approach position)
//   retreat elapsed                -> Idle     (target: rest position)
// failed / human skip straight to Retreat. The target is therefore always one of
// {tracked step approach, tracked step assembled, rest}.
//
// Snapshots are "most recent wins": only status changes relative to the last
// merged snapshot matter. Invalid snapshots (or snapshots for another assembly)
// leave everything unchanged.

#include <cstdint>
#include <string>
#include <vector>

#include "AssemblyTypes.h"
#include "arm_pose_solver.h"

namespace seqviz {

enum class StepStatus : std::uint32_t {
    Pending = 0,
    Running,
    Success,
    Failed,
    Human,
    Retrying,
};

const char* stepStatusName(StepStatus s);

enum class ExecutionRunPhase : std::uint32_t {
    Idle = 0,
    Running,
    Paused,
    Complete,
    Teaching,
};

const char* executionRunPhaseName(ExecutionRunPhase p);

struct StepRuntimeState {
    std::string step_id;
    StepStatus status = StepStatus::Pending;
    int attempt = 1;
};

struct ExecutionSnapshot {
    bool valid = false;
    std::string assembly_id;   // empty matches any assembly
    ExecutionRunPhase run_phase = ExecutionRunPhase::Idle;
    std::string current_step_id;
    std::vector<StepRuntimeState> step_states;
};

struct ExecutionAnimState {
    Vec3d end_effector_target_m{};
    world::EndEffectorPhase end_effector_phase = world::EndEffectorPhase::Idle;

    // Step the end-effector cycle belongs to, -1 before any step ran.
    int tracked_step_index = -1;
};

struct BridgeConfig {
    double expected_step_s = 5.0;  // nominal execution time of one step
    double grasp_lead_s    = 1.5;  // grasp starts this long before expected completion
    double grasp_hold_s    = 0.4;  // grasp held after success before retreating
    double retreat_s       = 0.6;
};

struct BridgeTriggers {
    bool has_seek = false;
    int seek_step_index = 0;
    double seek_fraction_0_1 = 0.0;

    // Execution took over: stop demo/playback.
    bool interrupt_playback = false;

    // Execution was reset (every step pending again).
    bool reset_sequence = false;

    // FrameEventBits raised while merging.
    std::uint32_t events_u32 = 0;
};

class ExecutionBridge {
public:
    ExecutionBridge() = default;
    ExecutionBridge(const StepIndex* index, const Vec3d& rest_m, const BridgeConfig& cfg);

    // Merge one snapshot. Transitions are handled in step order; when one snapshot starts
    // several steps, current_step_id picks the tracked one (else the last started).
    BridgeTriggers apply(const ExecutionSnapshot& snap);

    // Timed part of the end-effector cycle.
    void tick(double dt);

    const ExecutionAnimState& state() const { return state_; }
    const BridgeConfig& config() const { return cfg_; }
    Vec3d restPosition_m() const { return rest_m_; }

    StepStatus lastStatus(int step_idx) const;

    // True if the current target is one of the permitted points.
    bool targetIsPermitted() const;

private:
    void startStep(int step_idx);
    void succeedStep(int step_idx);
    void abortStep(int step_idx);
    void goIdle();
    void setPhase(world::EndEffectorPhase p, const Vec3d& target_m);

    const StepIndex* index_ = nullptr;
    BridgeConfig cfg_{};
    Vec3d rest_m_{};

    ExecutionAnimState state_{};
    std::vector<StepStatus> last_status_;

    double phase_timer_s_ = 0.0;
    bool success_seen_ = false;
};

} // namespace seqviz
