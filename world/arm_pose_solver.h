#pragma once

// world/arm_pose_solver.h
//
// Stylized pose solver for the schematic 6-segment manipulator arm.
//
// This is NOT inverse kinematics. The arm tracks an end-effector point and
// derives a plausible curl from how far that point is from the base:
//   - end-effector: critically-damped approach, factor 1 - exp(-k * dt) per tick
//   - yaw:   heading toward the end-effector in the XZ plane (atan2(dx, dz))
//   - pitch: elevation of the end-effector above the base (atan2(dy, horizontal))
//   - reach = min(distance / total_length, reach_cap), reach_cap < 1 so the chain
//     never fully straightens
//   - fold  = (1 - reach) * max_fold
//   - joint 0 = pitch + fold * base_fold_share
//   - joint i = fold * (1 - i/n) * joint_fold_share   (i >= 1)
//   - gripper gap: independent damped scalar toward closed (Grasp) or open
//
// Forward kinematics for rendering (joint_pos_m): each segment lies in the
// vertical plane of the heading. Segment 0 is tilted (pi/2 - joint0) from +Y,
// and every following joint adds its angle to the tilt, curling the chain
// forward and down. No ImGui / OpenGL dependencies.

#include <array>
#include <cstdint>

#include "AssemblyTypes.h"

namespace seqviz {
namespace world {

enum class EndEffectorPhase : std::uint32_t {
    Idle = 0,
    Approach,
    Grasp,
    Retreat,
};

const char* endEffectorPhaseName(EndEffectorPhase p);

struct ArmConfig {
    static constexpr int kNumSegments = 6;

    // Segment lengths as a fraction of the assembly radius (base to tip).
    std::array<double, kNumSegments> segment_ratio {{0.20, 0.18, 0.14, 0.10, 0.08, 0.06}};

    double reach_cap_0_1     = 0.95;
    double max_fold_rad      = 0.4 * 3.14159265358979323846;
    double base_fold_share   = 0.3;
    double joint_fold_share  = 0.5;

    double follow_rate_1_per_s  = 4.0;
    double gripper_rate_1_per_s = 6.0;
    double gripper_open_0_1     = 1.0;
    double gripper_closed_0_1   = 0.15;

    // Base placement relative to the assembly centroid, in assembly radii (Y ignored;
    // the base sits on the assembly floor).
    double base_offset_x_radii = -1.1;
    double base_offset_z_radii = 0.0;

    // Rest point: this many radii above the base.
    double rest_height_radii = 1.0;
};

struct ArmPose {
    static constexpr int kNumJoints = ArmConfig::kNumSegments;

    Vec3d end_effector_m{};

    double yaw_rad   = 0.0;
    double pitch_rad = 0.0;
    double reach_0_1 = 0.0;
    double fold_rad  = 0.0;

    std::array<double, kNumJoints> joint_angle_rad {{0.0, 0.0, 0.0, 0.0, 0.0, 0.0}};

    // joint_pos_m[0] is the base, joint_pos_m[kNumJoints] the chain tip.
    std::array<Vec3d, kNumJoints + 1> joint_pos_m {};

    double gripper_gap_0_1 = 1.0;
};

class ArmPoseSolver {
public:
    struct Inputs {
        Vec3d base_m{};
        double assembly_radius_m = 1.0;
    };

    ArmPoseSolver() = default;
    explicit ArmPoseSolver(const ArmConfig& cfg) { setConfig(cfg); }

    // Clamps tunables into their safe ranges.
    void setConfig(const ArmConfig& cfg);
    const ArmConfig& config() const { return cfg_; }

    // Rebuild segment lengths and park the end-effector at rest with the gripper open.
    void reset(const Inputs& in);

    bool isValid() const { return valid_; }
    double totalLength_m() const { return total_length_m_; }
    const std::array<double, ArmConfig::kNumSegments>& segmentLengths_m() const { return seg_len_m_; }
    Vec3d base_m() const { return base_m_; }
    Vec3d restPosition_m() const { return rest_m_; }

    // Advance the end-effector and gripper toward their targets by dt, then re-solve joints.
    // Invalid dt moves nothing but still refreshes the pose.
    void step(const Vec3d& target_m, EndEffectorPhase phase, double dt);

    const ArmPose& pose() const { return pose_; }

    // ---- Pure pieces (usable without an instance) ----

    // 1 - exp(-rate * dt), 0 for invalid input.
    static double followFactor(double rate_1_per_s, double dt);

    static Vec3d approachEndEffector(const Vec3d& current_m, const Vec3d& target_m,
                                     double rate_1_per_s, double dt);

    static double approachGripper(double gap_0_1, EndEffectorPhase phase,
                                  const ArmConfig& cfg, double dt);

    static ArmPose solveJoints(const Vec3d& base_m,
                               const Vec3d& end_effector_m,
                               const std::array<double, ArmConfig::kNumSegments>& seg_len_m,
                               const ArmConfig& cfg);

private:
    ArmConfig cfg_{};
    std::array<double, ArmConfig::kNumSegments> seg_len_m_ {{0.0, 0.0, 0.0, 0.0, 0.0, 0.0}};
    double total_length_m_ = 0.0;

    Vec3d base_m_{};
    Vec3d rest_m_{};

    Vec3d ee_m_{};
    double gripper_gap_0_1_ = 1.0;

    ArmPose pose_{};
    bool valid_ = false;
};

} // namespace world
} // namespace seqviz
