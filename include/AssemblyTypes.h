#pragma once

// AssemblyTypes.h
//
// Geometry/Step Index: read-only projection of one assembly definition.
//
// Coordinate convention (matches vis/main_vis.cpp):
//   - Y is up, meters.
//   - A part's approach position is assembled_pos_m + approach_dir_unit * approach_offset_m.
//   - approach_dir_unit is the direction the part comes FROM. The default (+Y) is a
//     straight-down approach: the part descends vertically onto its seat.

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace seqviz {

struct Vec3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

inline Vec3d v3(double x, double y, double z) { return Vec3d{x, y, z}; }
inline Vec3d add(const Vec3d& a, const Vec3d& b) { return v3(a.x + b.x, a.y + b.y, a.z + b.z); }
inline Vec3d sub(const Vec3d& a, const Vec3d& b) { return v3(a.x - b.x, a.y - b.y, a.z - b.z); }
inline Vec3d mul(const Vec3d& a, double s) { return v3(a.x * s, a.y * s, a.z * s); }
inline double dot(const Vec3d& a, const Vec3d& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline double len(const Vec3d& a) { return std::sqrt(dot(a, a)); }
inline Vec3d lerp(const Vec3d& a, const Vec3d& b, double t) { return add(a, mul(sub(b, a), t)); }
inline bool isFinite(const Vec3d& a) {
    return std::isfinite(a.x) && std::isfinite(a.y) && std::isfinite(a.z);
}

// Part as delivered by the assembly-data collaborator.
struct Part {
    std::string id;
    std::string name;

    Vec3d assembled_pos_m{};
    Vec3d half_extents_m{0.05, 0.05, 0.05};

    // Optional approach. When has_approach_dir is false (or the vector is degenerate)
    // the straight-down approach is used.
    bool has_approach_dir = false;
    Vec3d approach_dir{0.0, 1.0, 0.0};

    // <= 0 selects the default of 2 x bounding height.
    double approach_offset_m = 0.0;
};

struct AssemblyStep {
    std::string id;
    std::string name;
    std::vector<std::string> part_ids;
};

struct AssemblyDefinition {
    std::string id;
    std::string name;
    std::vector<Part> parts;
    std::vector<AssemblyStep> steps; // execution order
};

class StepIndex {
public:
    // Used when a part has no bounding height to derive an offset from.
    static constexpr double kFallbackApproachOffset_m = 0.10;
    static constexpr double kMinAssemblyRadius_m = 0.10;

    StepIndex() = default;
    explicit StepIndex(const AssemblyDefinition& def) { rebuild(def); }

    void rebuild(const AssemblyDefinition& def);

    const std::string& assemblyId() const { return assembly_id_; }

    int partCount() const { return static_cast<int>(parts_.size()); }
    int stepCount() const { return static_cast<int>(steps_.size()); }
    bool empty() const { return parts_.empty() || steps_.empty(); }

    const Part& part(int part_idx) const { return parts_[static_cast<std::size_t>(part_idx)]; }
    const AssemblyStep& step(int step_idx) const { return steps_[static_cast<std::size_t>(step_idx)]; }

    // -1 if unknown.
    int findPart(const std::string& id) const;
    int findStep(const std::string& id) const;

    // Step that first places this part, or -1 for static fixtures.
    int stepOfPart(int part_idx) const;

    // Resolved part indices of a step (unknown ids dropped).
    const std::vector<int>& partsOfStep(int step_idx) const;

    // Normalized approach direction and resolved offset.
    Vec3d approachDir(int part_idx) const;
    double approachOffset_m(int part_idx) const;

    Vec3d assembledPosition(int part_idx) const;
    Vec3d approachPosition(int part_idx) const;

    // Positions of a step's primary (first resolved) part. Return false for
    // out-of-range steps or steps with no known parts; out is untouched then.
    bool stepAssembledPosition(int step_idx, Vec3d& out) const;
    bool stepApproachPosition(int step_idx, Vec3d& out) const;

    Vec3d centroid_m() const { return centroid_m_; }
    double floorY_m() const { return floor_y_m_; }

    // Horizontal radius enclosing every assembled part (>= kMinAssemblyRadius_m).
    double radius_m() const { return radius_m_; }

private:
    std::string assembly_id_;
    std::vector<Part> parts_;
    std::vector<AssemblyStep> steps_;

    std::vector<int> part_step_;
    std::vector<std::vector<int>> step_parts_;
    std::vector<Vec3d> approach_dir_;
    std::vector<double> approach_offset_m_;

    Vec3d centroid_m_{};
    double floor_y_m_ = 0.0;
    double radius_m_ = kMinAssemblyRadius_m;
};

} // namespace seqviz
