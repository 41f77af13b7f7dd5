#include "AssemblyTypes.h"

#include <algorithm>
#include <cmath>

namespace seqviz {

namespace {

constexpr double kMinVecLen = 1e-12;

const std::vector<int> kNoParts{};

inline Vec3d normOr(const Vec3d& v, const Vec3d& fallback) {
    if (!isFinite(v)) return fallback;
    const double l = len(v);
    return (l > kMinVecLen) ? mul(v, 1.0 / l) : fallback;
}

} // namespace

void StepIndex::rebuild(const AssemblyDefinition& def) {
    assembly_id_ = def.id;
    parts_ = def.parts;
    steps_ = def.steps;

    const std::size_t np = parts_.size();
    const std::size_t ns = steps_.size();

    part_step_.assign(np, -1);
    step_parts_.assign(ns, std::vector<int>{});
    approach_dir_.assign(np, v3(0.0, 1.0, 0.0));
    approach_offset_m_.assign(np, kFallbackApproachOffset_m);

    // Approach defaults.
    for (std::size_t i = 0; i < np; ++i) {
        Part& p = parts_[i];
        if (!isFinite(p.assembled_pos_m)) p.assembled_pos_m = v3(0.0, 0.0, 0.0);

        const Vec3d down_approach = v3(0.0, 1.0, 0.0);
        approach_dir_[i] = p.has_approach_dir ? normOr(p.approach_dir, down_approach) : down_approach;

        const double height_m = 2.0 * std::abs(p.half_extents_m.y);
        double off = p.approach_offset_m;
        if (!std::isfinite(off) || off <= 0.0) {
            off = (std::isfinite(height_m) && height_m > 0.0) ? 2.0 * height_m : kFallbackApproachOffset_m;
        }
        approach_offset_m_[i] = off;
    }

    // Step -> parts, part -> first step.
    for (std::size_t s = 0; s < ns; ++s) {
        for (const std::string& pid : steps_[s].part_ids) {
            const int pi = findPart(pid);
            if (pi < 0) continue;
            auto& list = step_parts_[s];
            if (std::find(list.begin(), list.end(), pi) != list.end()) continue;
            list.push_back(pi);
            if (part_step_[static_cast<std::size_t>(pi)] < 0) {
                part_step_[static_cast<std::size_t>(pi)] = static_cast<int>(s);
            }
        }
    }

    // Scene extents for arm placement.
    centroid_m_ = v3(0.0, 0.0, 0.0);
    floor_y_m_ = 0.0;
    radius_m_ = kMinAssemblyRadius_m;
    if (np == 0) return;

    double min_y = parts_[0].assembled_pos_m.y - std::abs(parts_[0].half_extents_m.y);
    for (const Part& p : parts_) {
        centroid_m_ = add(centroid_m_, p.assembled_pos_m);
        min_y = std::min(min_y, p.assembled_pos_m.y - std::abs(p.half_extents_m.y));
    }
    centroid_m_ = mul(centroid_m_, 1.0 / static_cast<double>(np));
    floor_y_m_ = min_y;

    double r = 0.0;
    for (const Part& p : parts_) {
        const double dx = p.assembled_pos_m.x - centroid_m_.x;
        const double dz = p.assembled_pos_m.z - centroid_m_.z;
        const double ext = std::max(std::abs(p.half_extents_m.x), std::abs(p.half_extents_m.z));
        r = std::max(r, std::sqrt(dx * dx + dz * dz) + ext);
    }
    radius_m_ = std::max(r, kMinAssemblyRadius_m);
}

int StepIndex::findPart(const std::string& id) const {
    for (std::size_t i = 0; i < parts_.size(); ++i) {
        if (parts_[i].id == id) return static_cast<int>(i);
    }
    return -1;
}

int StepIndex::findStep(const std::string& id) const {
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        if (steps_[i].id == id) return static_cast<int>(i);
    }
    return -1;
}

int StepIndex::stepOfPart(int part_idx) const {
    if (part_idx < 0 || part_idx >= partCount()) return -1;
    return part_step_[static_cast<std::size_t>(part_idx)];
}

const std::vector<int>& StepIndex::partsOfStep(int step_idx) const {
    if (step_idx < 0 || step_idx >= stepCount()) return kNoParts;
    return step_parts_[static_cast<std::size_t>(step_idx)];
}

Vec3d StepIndex::approachDir(int part_idx) const {
    if (part_idx < 0 || part_idx >= partCount()) return v3(0.0, 1.0, 0.0);
    return approach_dir_[static_cast<std::size_t>(part_idx)];
}

double StepIndex::approachOffset_m(int part_idx) const {
    if (part_idx < 0 || part_idx >= partCount()) return kFallbackApproachOffset_m;
    return approach_offset_m_[static_cast<std::size_t>(part_idx)];
}

Vec3d StepIndex::assembledPosition(int part_idx) const {
    if (part_idx < 0 || part_idx >= partCount()) return v3(0.0, 0.0, 0.0);
    return parts_[static_cast<std::size_t>(part_idx)].assembled_pos_m;
}

Vec3d StepIndex::approachPosition(int part_idx) const {
    return add(assembledPosition(part_idx), mul(approachDir(part_idx), approachOffset_m(part_idx)));
}

bool StepIndex::stepAssembledPosition(int step_idx, Vec3d& out) const {
    const auto& list = partsOfStep(step_idx);
    if (list.empty()) return false;
    out = assembledPosition(list.front());
    return true;
}

bool StepIndex::stepApproachPosition(int step_idx, Vec3d& out) const {
    const auto& list = partsOfStep(step_idx);
    if (list.empty()) return false;
    out = approachPosition(list.front());
    return true;
}

} // namespace seqviz
