#include "ExecutionBridge.h"

#include "FrameEvents.h"

#include <algorithm>
#include <cmath>

namespace seqviz {

using world::EndEffectorPhase;

namespace {

constexpr double kSameEps = 1e-12;

inline bool isFinitePositive(double x) { return std::isfinite(x) && x > 0.0; }

inline bool samePoint(const Vec3d& a, const Vec3d& b) {
    return len(sub(a, b)) <= kSameEps;
}

} // namespace

const char* stepStatusName(StepStatus s) {
    switch (s) {
        case StepStatus::Pending:  return "pending";
        case StepStatus::Running:  return "running";
        case StepStatus::Success:  return "success";
        case StepStatus::Failed:   return "failed";
        case StepStatus::Human:    return "human";
        case StepStatus::Retrying: return "retrying";
        default:                   return "unknown";
    }
}

const char* executionRunPhaseName(ExecutionRunPhase p) {
    switch (p) {
        case ExecutionRunPhase::Idle:     return "idle";
        case ExecutionRunPhase::Running:  return "running";
        case ExecutionRunPhase::Paused:   return "paused";
        case ExecutionRunPhase::Complete: return "complete";
        case ExecutionRunPhase::Teaching: return "teaching";
        default:                          return "unknown";
    }
}

ExecutionBridge::ExecutionBridge(const StepIndex* index, const Vec3d& rest_m, const BridgeConfig& cfg)
    : index_(index), cfg_(cfg), rest_m_(rest_m) {
    state_.end_effector_target_m = rest_m_;
    state_.end_effector_phase = EndEffectorPhase::Idle;
    state_.tracked_step_index = -1;
    if (index_) {
        last_status_.assign(static_cast<std::size_t>(index_->stepCount()), StepStatus::Pending);
    }
}

StepStatus ExecutionBridge::lastStatus(int step_idx) const {
    if (step_idx < 0 || step_idx >= static_cast<int>(last_status_.size())) return StepStatus::Pending;
    return last_status_[static_cast<std::size_t>(step_idx)];
}

void ExecutionBridge::setPhase(EndEffectorPhase p, const Vec3d& target_m) {
    state_.end_effector_phase = p;
    state_.end_effector_target_m = target_m;
    phase_timer_s_ = 0.0;
}

void ExecutionBridge::goIdle() {
    setPhase(EndEffectorPhase::Idle, rest_m_);
    success_seen_ = false;
}

void ExecutionBridge::startStep(int step_idx) {
    Vec3d approach;
    if (!index_->stepApproachPosition(step_idx, approach)) return;
    state_.tracked_step_index = step_idx;
    success_seen_ = false;
    setPhase(EndEffectorPhase::Approach, approach);
}

void ExecutionBridge::succeedStep(int step_idx) {
    Vec3d assembled;
    if (!index_->stepAssembledPosition(step_idx, assembled)) return;

    if (state_.tracked_step_index != step_idx) {
        // Success for a step we never saw running: grasp it directly.
        state_.tracked_step_index = step_idx;
        setPhase(EndEffectorPhase::Grasp, assembled);
    } else if (state_.end_effector_phase == EndEffectorPhase::Approach ||
               state_.end_effector_phase == EndEffectorPhase::Idle) {
        setPhase(EndEffectorPhase::Grasp, assembled);
    }
    success_seen_ = true;
}

void ExecutionBridge::abortStep(int step_idx) {
    if (state_.tracked_step_index != step_idx) return;
    if (state_.end_effector_phase == EndEffectorPhase::Idle ||
        state_.end_effector_phase == EndEffectorPhase::Retreat) {
        return;
    }
    Vec3d approach;
    if (!index_->stepApproachPosition(step_idx, approach)) return;
    success_seen_ = false;
    setPhase(EndEffectorPhase::Retreat, approach);
}

BridgeTriggers ExecutionBridge::apply(const ExecutionSnapshot& snap) {
    BridgeTriggers trig;

    if (!index_ || !snap.valid) {
        trig.events_u32 |= Warn_SnapshotIgnored;
        return trig;
    }
    if (!snap.assembly_id.empty() && snap.assembly_id != index_->assemblyId()) {
        trig.events_u32 |= Warn_SnapshotIgnored;
        return trig;
    }

    const int n = index_->stepCount();

    // Resolve the snapshot into step order; steps absent from it keep their last status.
    std::vector<StepStatus> next = last_status_;
    for (const StepRuntimeState& rs : snap.step_states) {
        const int idx = index_->findStep(rs.step_id);
        if (idx < 0) continue;
        next[static_cast<std::size_t>(idx)] = rs.status;
    }

    bool any_active_before = false;
    for (StepStatus s : last_status_) {
        if (s != StepStatus::Pending) any_active_before = true;
    }

    bool started_any = false;
    for (int i = 0; i < n; ++i) {
        const StepStatus prev = last_status_[static_cast<std::size_t>(i)];
        const StepStatus cur = next[static_cast<std::size_t>(i)];
        if (prev == cur) continue;

        switch (cur) {
            case StepStatus::Running:
            case StepStatus::Retrying:
                started_any = true;
                startStep(i);
                trig.has_seek = true;
                trig.seek_step_index = i;
                trig.seek_fraction_0_1 = 0.0;
                trig.interrupt_playback = true;
                trig.events_u32 |= Event_ExecStepStarted;
                break;
            case StepStatus::Success:
                succeedStep(i);
                trig.has_seek = true;
                trig.seek_step_index = i;
                trig.seek_fraction_0_1 = 1.0;
                trig.interrupt_playback = true;
                trig.events_u32 |= Event_ExecStepSucceeded;
                break;
            case StepStatus::Failed:
                abortStep(i);
                trig.events_u32 |= Event_ExecStepFailed;
                break;
            case StepStatus::Human:
                abortStep(i);
                trig.events_u32 |= Event_ExecHumanIntervention;
                break;
            case StepStatus::Pending:
            default:
                if (state_.tracked_step_index == i) goIdle();
                break;
        }
    }

    // Several steps started in one snapshot: the reported current step is the one tracked.
    const int current = snap.current_step_id.empty() ? -1 : index_->findStep(snap.current_step_id);
    if (started_any && current >= 0 && current != state_.tracked_step_index) {
        const StepStatus cs = next[static_cast<std::size_t>(current)];
        if (cs == StepStatus::Running || cs == StepStatus::Retrying) {
            startStep(current);
            trig.seek_step_index = current;
            trig.seek_fraction_0_1 = 0.0;
        }
    }

    bool all_pending = true;
    for (StepStatus s : next) {
        if (s != StepStatus::Pending) all_pending = false;
    }
    if (all_pending && any_active_before) {
        goIdle();
        state_.tracked_step_index = -1;
        trig.reset_sequence = true;
        trig.has_seek = false;
        trig.events_u32 |= Event_ExecReset;
    }

    last_status_ = next;
    return trig;
}

void ExecutionBridge::tick(double dt) {
    if (!isFinitePositive(dt)) return;
    phase_timer_s_ += dt;

    const int step = state_.tracked_step_index;

    switch (state_.end_effector_phase) {
        case EndEffectorPhase::Approach: {
            const double grasp_at_s = std::max(cfg_.expected_step_s - cfg_.grasp_lead_s, 0.0);
            if (phase_timer_s_ >= grasp_at_s) {
                Vec3d assembled;
                if (index_ && index_->stepAssembledPosition(step, assembled)) {
                    setPhase(EndEffectorPhase::Grasp, assembled);
                }
            }
            break;
        }
        case EndEffectorPhase::Grasp: {
            // Without success the gripper keeps holding at the seat.
            if (success_seen_ && phase_timer_s_ >= cfg_.grasp_hold_s) {
                Vec3d approach;
                if (index_ && index_->stepApproachPosition(step, approach)) {
                    setPhase(EndEffectorPhase::Retreat, approach);
                }
            }
            break;
        }
        case EndEffectorPhase::Retreat:
            if (phase_timer_s_ >= cfg_.retreat_s) goIdle();
            break;
        case EndEffectorPhase::Idle:
        default:
            break;
    }
}

bool ExecutionBridge::targetIsPermitted() const {
    const Vec3d& t = state_.end_effector_target_m;
    if (samePoint(t, rest_m_)) return true;
    if (!index_) return false;

    const int step = state_.tracked_step_index;
    Vec3d p;
    if (index_->stepApproachPosition(step, p) && samePoint(t, p)) return true;
    if (index_->stepAssembledPosition(step, p) && samePoint(t, p)) return true;
    return false;
}

} // namespace seqviz
