#include "AnimationController.h"

#include "FrameEvents.h"
#include "Fnv1a.h"

#include <algorithm>
#include <cmath>

namespace seqviz {

using namespace detail;
using world::ArmPoseSolver;

namespace {

constexpr double kSequenceEndEps = 1e-9;

inline bool isFinitePositive(double x) { return std::isfinite(x) && x > 0.0; }

inline bool monotonicPhase(Phase p) {
    return p == Phase::Playing || p == Phase::DemoAssemble;
}

inline std::uint32_t hashVec(std::uint32_t h, const Vec3d& v) {
    h = fnv1a32_add_f64(h, v.x);
    h = fnv1a32_add_f64(h, v.y);
    h = fnv1a32_add_f64(h, v.z);
    return h;
}

} // namespace

const char* controlCommandName(ControlCommand c) {
    switch (c) {
        case ControlCommand::Toggle:       return "toggle";
        case ControlCommand::StepForward:  return "step_forward";
        case ControlCommand::StepBackward: return "step_backward";
        case ControlCommand::ReplayDemo:   return "replay_demo";
        case ControlCommand::ScrubStart:   return "scrub_start";
        case ControlCommand::Scrub:        return "scrub";
        case ControlCommand::ScrubEnd:     return "scrub_end";
        case ControlCommand::ForceIdle:    return "force_idle";
        default:                           return "unknown";
    }
}

AnimationController::AnimationController() {
    const AnimationConfigV1 defaults;
    if (!sanitizeConfig(defaults, cfg_)) cfg_ = defaults;
    arm_.setConfig(cfg_.arm);
    reload();
}

AnimationController::AnimationController(const AnimationConfigV1& cfg) : AnimationController() {
    setConfig(cfg);
}

bool AnimationController::setConfig(const AnimationConfigV1& cfg) {
    AnimationConfigV1 sane;
    if (!sanitizeConfig(cfg, sane)) return false;
    cfg_ = sane;
    arm_.setConfig(cfg_.arm);
    reload();
    return true;
}

void AnimationController::loadAssembly(const AssemblyDefinition& def) {
    def_ = def;
    reload();
    latest_events_bits_ |= Event_AssemblyLoaded;
}

void AnimationController::reload() {
    index_.rebuild(def_);
    machine_ = PhaseMachine(index_.stepCount(), index_.partCount(), cfg_.timing);

    // Base on the assembly floor, offset sideways by a multiple of the footprint radius.
    const Vec3d c = index_.centroid_m();
    const double r = index_.radius_m();
    ArmPoseSolver::Inputs in;
    in.base_m = v3(c.x + cfg_.arm.base_offset_x_radii * r,
                   index_.floorY_m(),
                   c.z + cfg_.arm.base_offset_z_radii * r);
    in.assembly_radius_m = r;
    arm_.reset(in);

    bridge_ = ExecutionBridge(&index_, arm_.restPosition_m(), cfg_.bridge);

    commands_.clear();
    pending_snapshot_ = ExecutionSnapshot{};
    has_pending_snapshot_ = false;
    resume_after_scrub_ = false;
    autoplay_armed_ = false;
    autoplay_remaining_s_ = 0.0;

    time_s_ = 0.0;
    digest_u32_ = fnv1a32_begin();
    frame_count_u32_ = 0;
    telemetry_head_ = 0;
    telemetry_count_ = 0;

    computeOutputs();
    frame_.events_u32 = 0;
    last_complete_count_ = countFullyOpaque(frame_.parts);
}

void AnimationController::enqueue(ControlCommand c, double value) {
    Command cmd;
    cmd.kind = c;
    cmd.value = value;
    commands_.push_back(cmd);
}

void AnimationController::toggle()        { enqueue(ControlCommand::Toggle); }
void AnimationController::stepForward()   { enqueue(ControlCommand::StepForward); }
void AnimationController::stepBackward()  { enqueue(ControlCommand::StepBackward); }
void AnimationController::replayDemo()    { enqueue(ControlCommand::ReplayDemo); }
void AnimationController::scrubStart()    { enqueue(ControlCommand::ScrubStart); }
void AnimationController::scrub(double g) { enqueue(ControlCommand::Scrub, g); }
void AnimationController::scrubEnd()      { enqueue(ControlCommand::ScrubEnd); }
void AnimationController::forceIdle()     { enqueue(ControlCommand::ForceIdle); }

void AnimationController::postExecutionSnapshot(const ExecutionSnapshot& snap) {
    if (!snap.valid) {
        // Keep whatever was pending; stale-but-valid beats undefined.
        latest_events_bits_ |= Warn_SnapshotIgnored;
        return;
    }
    pending_snapshot_ = snap;
    has_pending_snapshot_ = true;
}

void AnimationController::clearAutoplay() {
    autoplay_armed_ = false;
    autoplay_remaining_s_ = 0.0;
}

void AnimationController::execute(const Command& c, std::uint32_t& ev) {
    clearAutoplay();

    if (machine_.isInert()) {
        ev |= Warn_ControlIgnored;
        return;
    }

    const Phase ph = machine_.state().phase;

    switch (c.kind) {
        case ControlCommand::Toggle:
            if (ph == Phase::Playing) {
                machine_.goToPhase(Phase::Idle);
            } else if (ph == Phase::Scrubbing) {
                ev |= Warn_ControlIgnored;
            } else if (isDemoPhase(ph)) {
                machine_.goToPhase(Phase::Playing, 0.0);
            } else if (machine_.state().sequence_progress_0_1 >= 1.0 - kSequenceEndEps) {
                machine_.goToPhase(Phase::Playing, 0.0);
            } else {
                machine_.goToPhase(Phase::Playing);
            }
            break;
        case ControlCommand::StepForward:
            machine_.stepForward();
            break;
        case ControlCommand::StepBackward:
            machine_.stepBackward();
            break;
        case ControlCommand::ReplayDemo:
            resume_after_scrub_ = false;
            machine_.goToPhase(Phase::DemoFadeIn);
            break;
        case ControlCommand::ScrubStart:
            if (ph == Phase::Scrubbing) {
                ev |= Warn_ControlIgnored;
                break;
            }
            resume_after_scrub_ = (ph == Phase::Playing);
            machine_.goToPhase(Phase::Scrubbing);
            break;
        case ControlCommand::Scrub:
            if (ph != Phase::Scrubbing) {
                ev |= Warn_ScrubWithoutStart;
                break;
            }
            machine_.seekSequence(c.value);
            break;
        case ControlCommand::ScrubEnd:
            if (ph != Phase::Scrubbing) {
                ev |= Warn_ControlIgnored;
                break;
            }
            machine_.goToPhase(resume_after_scrub_ ? Phase::Playing : Phase::Idle);
            resume_after_scrub_ = false;
            break;
        case ControlCommand::ForceIdle:
            resume_after_scrub_ = false;
            machine_.armDemo(false);
            machine_.goToPhase(Phase::Idle);
            break;
        default:
            ev |= Warn_ControlIgnored;
            break;
    }
}

void AnimationController::applyTriggers(const BridgeTriggers& trig, std::uint32_t& ev) {
    ev |= trig.events_u32;
    if (machine_.isInert()) return;

    const Phase ph = machine_.state().phase;
    if (trig.interrupt_playback && (isDemoPhase(ph) || ph == Phase::Playing)) {
        clearAutoplay();
        machine_.goToPhase(Phase::Idle);
    }

    if (trig.reset_sequence) {
        clearAutoplay();
        machine_.resetSequence();
    } else if (trig.has_seek && machine_.state().phase != Phase::Scrubbing) {
        // The user holding the scrubber wins over execution progress.
        clearAutoplay();
        machine_.seekStep(trig.seek_step_index, trig.seek_fraction_0_1);
    }
}

void AnimationController::tick(double dt) {
    if (!isFinitePositive(dt)) return;

    std::uint32_t ev = 0;
    const Phase phase_before = machine_.state().phase;
    const std::uint32_t transitions_before = machine_.transitionCount();
    const bool interfered = has_pending_snapshot_ || !commands_.empty();

    // 1) External execution state
    if (has_pending_snapshot_) {
        has_pending_snapshot_ = false;
        applyTriggers(bridge_.apply(pending_snapshot_), ev);
    }

    // 2) Host controls in issue order
    for (const Command& c : commands_) execute(c, ev);
    commands_.clear();

    // 3) Explicit intent wins over the machine's own clock.
    const bool explicit_change = (machine_.transitionCount() != transitions_before);
    bool autoplay_just_armed = false;
    if (!explicit_change) {
        const Phase pre = machine_.state().phase;
        machine_.tick(dt);
        const Phase post = machine_.state().phase;
        if (pre == Phase::DemoAssemble && post == Phase::Idle && cfg_.autoplay_after_demo_u32 != 0u) {
            autoplay_armed_ = true;
            autoplay_remaining_s_ = cfg_.autoplay_delay_s;
            autoplay_just_armed = true;
        }
    }

    // 4) Auto-play timer lives only while idle.
    if (autoplay_armed_) {
        if (machine_.state().phase != Phase::Idle) {
            clearAutoplay();
        } else if (!autoplay_just_armed) {
            autoplay_remaining_s_ -= dt;
            if (autoplay_remaining_s_ <= 0.0) {
                clearAutoplay();
                machine_.goToPhase(Phase::Playing, 0.0);
                ev |= Event_AutoplayFired;
            }
        }
    }

    // 5) End-effector cycle and arm
    bridge_.tick(dt);
    arm_.step(bridge_.state().end_effector_target_m, bridge_.state().end_effector_phase, dt);
    time_s_ += dt;

    computeOutputs();

    // 6) Events
    if (machine_.transitionCount() != transitions_before) ev |= Event_PhaseChanged;

    const Phase phase_now = machine_.state().phase;
    const std::size_t complete = countFullyOpaque(frame_.parts);
    if (monotonicPhase(phase_now) && phase_now == phase_before && complete > last_complete_count_) {
        ev |= Event_StepCompleted;
    }
    if (monotonicPhase(phase_now) && phase_now == phase_before && !interfered &&
        machine_.transitionCount() == transitions_before && complete < last_complete_count_) {
        ev |= Warn_OpaqueCountDecreased;
    }
    if (!bridge_.targetIsPermitted()) ev |= Warn_TargetNotPermitted;
    last_complete_count_ = complete;

    frame_.events_u32 = ev;
    latest_events_bits_ |= ev;

    recordFrame();
}

void AnimationController::computeOutputs() {
    frame_.time_s = time_s_;
    frame_.animation = machine_.state();
    frame_.execution = bridge_.state();

    computeAllPartAnimations(index_, machine_.state(), cfg_.timing, cfg_.style,
                             selected_part_id_, frame_.parts);

    frame_.arm = arm_.pose();
}

void AnimationController::recordFrame() {
    const AnimationState& a = frame_.animation;
    const world::ArmPose& p = frame_.arm;

    std::uint32_t h = digest_u32_;
    h = fnv1a32_add_u32(h, frame_count_u32_);
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(a.phase));
    h = fnv1a32_add_f64(h, a.progress_0_1);
    h = fnv1a32_add_i32(h, a.active_step_index);
    h = fnv1a32_add_f64(h, a.sequence_progress_0_1);
    for (const auto& kv : frame_.parts) {
        h = fnv1a32_add_str(h, kv.first.data(), kv.first.size());
        h = hashVec(h, kv.second.position_m);
        h = fnv1a32_add_f64(h, kv.second.opacity_0_1);
        h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(kv.second.visual_class));
    }
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(frame_.execution.end_effector_phase));
    h = hashVec(h, frame_.execution.end_effector_target_m);
    h = hashVec(h, p.end_effector_m);
    for (double j : p.joint_angle_rad) h = fnv1a32_add_f64(h, j);
    h = fnv1a32_add_f64(h, p.gripper_gap_0_1);
    digest_u32_ = h;
    ++frame_count_u32_;

    FrameTelemetrySample s;
    s.t_s = static_cast<float>(frame_.time_s);
    s.phase_u32 = static_cast<std::uint32_t>(a.phase);
    s.progress_0_1 = static_cast<float>(a.progress_0_1);
    s.active_step_i32 = static_cast<std::int32_t>(a.active_step_index);
    s.sequence_0_1 = static_cast<float>(a.sequence_progress_0_1);
    s.complete_count_u32 = static_cast<std::uint32_t>(last_complete_count_);
    s.reach_0_1 = static_cast<float>(p.reach_0_1);
    s.gripper_gap_0_1 = static_cast<float>(p.gripper_gap_0_1);
    s.ee_phase_u32 = static_cast<std::uint32_t>(frame_.execution.end_effector_phase);
    s.ee_x_m = static_cast<float>(p.end_effector_m.x);
    s.ee_y_m = static_cast<float>(p.end_effector_m.y);
    s.ee_z_m = static_cast<float>(p.end_effector_m.z);

    telemetry_rb_[telemetry_head_] = s;
    telemetry_head_ = (telemetry_head_ + 1) % kTelemetryCapacity_;
    telemetry_count_ = std::min(telemetry_count_ + 1, kTelemetryCapacity_);
}

std::uint32_t AnimationController::getLatestEvents() {
    const std::uint32_t out = latest_events_bits_;
    latest_events_bits_ = 0;
    return out;
}

int AnimationController::getTelemetrySamples(FrameTelemetrySample* out_ptr, int cap) const {
    if (!out_ptr || cap <= 0) return 0;
    const int n = std::min<int>(telemetry_count_, cap);
    // Oldest sample index = head - count (mod capacity)
    int idx = (telemetry_head_ - telemetry_count_);
    while (idx < 0) idx += kTelemetryCapacity_;
    for (int i = 0; i < n; ++i) {
        out_ptr[i] = telemetry_rb_[(idx + i) % kTelemetryCapacity_];
    }
    return n;
}

int AnimationController::exportConfigText(char* buf, int cap) const {
    return seqviz::exportConfigText(cfg_, buf, cap);
}

} // namespace seqviz
