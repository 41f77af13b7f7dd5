// world/arm_pose_solver.cpp
//
// Implementation notes:
//   - Joint angle rules follow the header exactly; nothing here iterates toward a solution.
//   - Degenerate inputs (zero-length arm, non-finite target) keep the previous pose.

#include "arm_pose_solver.h"

#include <algorithm>
#include <cmath>

namespace seqviz {
namespace world {

// Numeric stability thresholds
static constexpr double kEpsilon = 1e-12;
static constexpr double kMinArmLength = 1e-6;
static constexpr double kMaxReachCap = 0.99;
static constexpr double kPI = 3.14159265358979323846;

static inline double clampd(double v, double lo, double hi) {
    return (v < lo) ? lo : (v > hi) ? hi : v;
}

static inline double finiteOr(double v, double fallback) {
    return std::isfinite(v) ? v : fallback;
}

const char* endEffectorPhaseName(EndEffectorPhase p) {
    switch (p) {
        case EndEffectorPhase::Idle:     return "idle";
        case EndEffectorPhase::Approach: return "approach";
        case EndEffectorPhase::Grasp:    return "grasp";
        case EndEffectorPhase::Retreat:  return "retreat";
        default:                         return "unknown";
    }
}

void ArmPoseSolver::setConfig(const ArmConfig& cfg) {
    ArmConfig c = cfg;
    for (double& r : c.segment_ratio) {
        r = std::max(finiteOr(r, 0.0), 0.0);
    }
    c.reach_cap_0_1 = clampd(finiteOr(c.reach_cap_0_1, 0.95), 0.0, kMaxReachCap);
    c.max_fold_rad = clampd(finiteOr(c.max_fold_rad, 0.4 * kPI), 0.0, kPI);
    c.base_fold_share = clampd(finiteOr(c.base_fold_share, 0.3), 0.0, 1.0);
    c.joint_fold_share = clampd(finiteOr(c.joint_fold_share, 0.5), 0.0, 1.0);
    c.follow_rate_1_per_s = std::max(finiteOr(c.follow_rate_1_per_s, 4.0), 0.0);
    c.gripper_rate_1_per_s = std::max(finiteOr(c.gripper_rate_1_per_s, 6.0), 0.0);
    c.gripper_open_0_1 = clampd(finiteOr(c.gripper_open_0_1, 1.0), 0.0, 1.0);
    c.gripper_closed_0_1 = clampd(finiteOr(c.gripper_closed_0_1, 0.15), 0.0, 1.0);
    c.base_offset_x_radii = finiteOr(c.base_offset_x_radii, -1.1);
    c.base_offset_z_radii = finiteOr(c.base_offset_z_radii, 0.0);
    c.rest_height_radii = std::max(finiteOr(c.rest_height_radii, 1.0), 0.0);
    cfg_ = c;
}

void ArmPoseSolver::reset(const Inputs& in) {
    valid_ = false;

    const double radius = finiteOr(in.assembly_radius_m, 0.0);
    if (radius <= kMinArmLength || !isFinite(in.base_m)) {
        return;
    }

    total_length_m_ = 0.0;
    for (int i = 0; i < ArmConfig::kNumSegments; ++i) {
        seg_len_m_[(std::size_t)i] = cfg_.segment_ratio[(std::size_t)i] * radius;
        total_length_m_ += seg_len_m_[(std::size_t)i];
    }
    if (total_length_m_ <= kMinArmLength) {
        return;
    }

    base_m_ = in.base_m;
    rest_m_ = add(base_m_, v3(0.0, cfg_.rest_height_radii * radius, 0.0));
    ee_m_ = rest_m_;
    gripper_gap_0_1_ = cfg_.gripper_open_0_1;

    pose_ = solveJoints(base_m_, ee_m_, seg_len_m_, cfg_);
    pose_.gripper_gap_0_1 = gripper_gap_0_1_;
    valid_ = true;
}

double ArmPoseSolver::followFactor(double rate_1_per_s, double dt) {
    if (!std::isfinite(dt) || dt <= 0.0) return 0.0;
    if (!std::isfinite(rate_1_per_s) || rate_1_per_s <= 0.0) return 0.0;
    return clampd(1.0 - std::exp(-rate_1_per_s * dt), 0.0, 1.0);
}

Vec3d ArmPoseSolver::approachEndEffector(const Vec3d& current_m, const Vec3d& target_m,
                                         double rate_1_per_s, double dt) {
    if (!isFinite(target_m)) return current_m;
    const double f = followFactor(rate_1_per_s, dt);
    return add(current_m, mul(sub(target_m, current_m), f));
}

double ArmPoseSolver::approachGripper(double gap_0_1, EndEffectorPhase phase,
                                      const ArmConfig& cfg, double dt) {
    const double target = (phase == EndEffectorPhase::Grasp) ? cfg.gripper_closed_0_1 : cfg.gripper_open_0_1;
    const double f = followFactor(cfg.gripper_rate_1_per_s, dt);
    return clampd(gap_0_1 + (target - gap_0_1) * f, 0.0, 1.0);
}

ArmPose ArmPoseSolver::solveJoints(const Vec3d& base_m,
                                   const Vec3d& end_effector_m,
                                   const std::array<double, ArmConfig::kNumSegments>& seg_len_m,
                                   const ArmConfig& cfg) {
    ArmPose p;
    p.end_effector_m = end_effector_m;

    double total = 0.0;
    for (double l : seg_len_m) total += l;

    const double dx = end_effector_m.x - base_m.x;
    const double dy = end_effector_m.y - base_m.y;
    const double dz = end_effector_m.z - base_m.z;
    const double dist = std::sqrt(dx * dx + dy * dy + dz * dz);
    const double horizontal = std::sqrt(dx * dx + dz * dz);

    p.reach_0_1 = (total > kMinArmLength) ? std::min(dist / total, cfg.reach_cap_0_1) : 0.0;
    p.fold_rad = (1.0 - p.reach_0_1) * cfg.max_fold_rad;
    p.yaw_rad = (horizontal > kEpsilon) ? std::atan2(dx, dz) : 0.0;
    p.pitch_rad = (dist > kEpsilon) ? std::atan2(dy, horizontal) : 0.0;

    const int n = ArmPose::kNumJoints;
    p.joint_angle_rad[0] = p.pitch_rad + p.fold_rad * cfg.base_fold_share;
    for (int i = 1; i < n; ++i) {
        const double share = 1.0 - static_cast<double>(i) / static_cast<double>(n);
        p.joint_angle_rad[(std::size_t)i] = p.fold_rad * share * cfg.joint_fold_share;
    }

    // Stylized forward kinematics in the heading plane.
    const Vec3d up = v3(0.0, 1.0, 0.0);
    const Vec3d heading = v3(std::sin(p.yaw_rad), 0.0, std::cos(p.yaw_rad));

    double tilt = 0.5 * kPI - p.joint_angle_rad[0];
    p.joint_pos_m[0] = base_m;
    for (int i = 0; i < n; ++i) {
        if (i > 0) tilt += p.joint_angle_rad[(std::size_t)i];
        const Vec3d dir = add(mul(heading, std::sin(tilt)), mul(up, std::cos(tilt)));
        p.joint_pos_m[(std::size_t)i + 1] = add(p.joint_pos_m[(std::size_t)i], mul(dir, seg_len_m[(std::size_t)i]));
    }

    return p;
}

void ArmPoseSolver::step(const Vec3d& target_m, EndEffectorPhase phase, double dt) {
    if (!valid_) return;

    ee_m_ = approachEndEffector(ee_m_, target_m, cfg_.follow_rate_1_per_s, dt);
    gripper_gap_0_1_ = approachGripper(gripper_gap_0_1_, phase, cfg_, dt);

    pose_ = solveJoints(base_m_, ee_m_, seg_len_m_, cfg_);
    pose_.gripper_gap_0_1 = gripper_gap_0_1_;
}

} // namespace world
} // namespace seqviz
