#include "PartAnimation.h"

#include "Scrubber.h"

#include <algorithm>
#include <cmath>

namespace seqviz {

namespace {

constexpr double kPI = 3.14159265358979323846;
constexpr double kEps = 1e-12;

inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

PartRenderState make(const Vec3d& p, double opacity, VisualClass c) {
    PartRenderState s;
    s.position_m = p;
    s.opacity_0_1 = clamp01(opacity);
    s.visual_class = c;
    return s;
}

// Sequenced part seen from global sequence position g. The pulse runs on
// pulse_clock_s, a phase clock that keeps counting across step boundaries.
PartRenderState sequencedState(const StepIndex& index,
                               int part_idx,
                               int part_step,
                               double g,
                               bool pulse,
                               double pulse_clock_s,
                               const PhaseTimingConfig& timing,
                               const RenderStyleConfig& style) {
    const Vec3d assembled = index.assembledPosition(part_idx);
    const Vec3d approach = index.approachPosition(part_idx);

    const ScrubberCoordinate c = scrubberToStep(g, index.stepCount());

    if (part_step < c.step_index) {
        return make(assembled, 1.0, VisualClass::Complete);
    }
    if (part_step > c.step_index) {
        return make(approach, style.ghost_opacity_0_1, VisualClass::Ghost);
    }

    // Active step: only the last step can reach fraction 1 (its hold has elapsed).
    if (c.fraction_0_1 >= 1.0 - kEps) {
        return make(assembled, 1.0, VisualClass::Complete);
    }

    const double t_s = c.fraction_0_1 * timing.stepDuration_s();
    Vec3d pos = assembled;
    if (timing.move_s > kEps && t_s < timing.move_s) {
        pos = lerp(approach, assembled, easeInOutCubic(t_s / timing.move_s));
    }

    double opacity = style.active_opacity_0_1;
    if (pulse) opacity *= pulseFactor(pulse_clock_s, style);
    return make(pos, opacity, VisualClass::Active);
}

} // namespace

const char* visualClassName(VisualClass c) {
    switch (c) {
        case VisualClass::Ghost:    return "ghost";
        case VisualClass::Active:   return "active";
        case VisualClass::Complete: return "complete";
        case VisualClass::Selected: return "selected";
        default:                    return "unknown";
    }
}

double easeInOutCubic(double t) {
    t = clamp01(t);
    if (t < 0.5) return 4.0 * t * t * t;
    const double u = -2.0 * t + 2.0;
    return 1.0 - (u * u * u) / 2.0;
}

double pulseFactor(double t_s, const RenderStyleConfig& style) {
    if (!(style.pulse_period_s > kEps) || !std::isfinite(t_s)) return 1.0;
    const double depth = clamp01(style.pulse_depth_0_1);
    const double wave = 0.5 - 0.5 * std::cos(2.0 * kPI * t_s / style.pulse_period_s);
    return 1.0 - depth * wave;
}

PartRenderState computePartAnimation(const StepIndex& index,
                                     int part_idx,
                                     const AnimationState& anim,
                                     const PhaseTimingConfig& timing,
                                     const RenderStyleConfig& style,
                                     const std::string& selected_part_id) {
    if (part_idx < 0 || part_idx >= index.partCount()) return PartRenderState{};

    const Vec3d assembled = index.assembledPosition(part_idx);
    const int part_step = index.stepOfPart(part_idx);
    const double progress = clamp01(anim.progress_0_1);

    PartRenderState out;

    switch (anim.phase) {
        case Phase::DemoFadeIn: {
            const double per = std::max(timing.fadein_per_part_s, 0.0);
            const double t_s = progress * per * static_cast<double>(index.partCount());
            const double start_s = per * static_cast<double>(part_idx);
            const double o = (per > kEps) ? clamp01((t_s - start_s) / per) : 1.0;
            const VisualClass c = (o >= 1.0) ? VisualClass::Complete
                                : (o > 0.0)  ? VisualClass::Active
                                             : VisualClass::Ghost;
            out = make(assembled, o, c);
            break;
        }
        case Phase::DemoHold:
            out = make(assembled, 1.0, VisualClass::Complete);
            break;
        case Phase::DemoExplode: {
            const Vec3d approach = index.approachPosition(part_idx);
            out = make(lerp(assembled, approach, easeInOutCubic(progress)), 1.0, VisualClass::Complete);
            break;
        }
        case Phase::DemoAssemble:
        case Phase::Playing:
        case Phase::Scrubbing: {
            if (part_step < 0) {
                out = make(assembled, 1.0, VisualClass::Complete);
            } else {
                const bool pulse = (anim.phase != Phase::Scrubbing);
                out = sequencedState(index, part_idx, part_step, progress, pulse,
                                     anim.phase_elapsed_s, timing, style);
            }
            break;
        }
        case Phase::Idle:
        default: {
            if (part_step < 0) {
                out = make(assembled, 1.0, VisualClass::Complete);
            } else if (anim.active_step_index < 0) {
                out = make(index.approachPosition(part_idx), style.ghost_opacity_0_1, VisualClass::Ghost);
            } else {
                out = sequencedState(index, part_idx, part_step, anim.sequence_progress_0_1,
                                     false, 0.0, timing, style);
            }
            break;
        }
    }

    if (!selected_part_id.empty() && index.part(part_idx).id == selected_part_id) {
        out.visual_class = VisualClass::Selected;
    }
    return out;
}

void computeAllPartAnimations(const StepIndex& index,
                              const AnimationState& anim,
                              const PhaseTimingConfig& timing,
                              const RenderStyleConfig& style,
                              const std::string& selected_part_id,
                              PartStateMap& out) {
    out.clear();
    for (int i = 0; i < index.partCount(); ++i) {
        out[index.part(i).id] = computePartAnimation(index, i, anim, timing, style, selected_part_id);
    }
}

std::size_t countFullyOpaque(const PartStateMap& parts) {
    std::size_t n = 0;
    for (const auto& kv : parts) {
        if (kv.second.opacity_0_1 >= 1.0) ++n;
    }
    return n;
}

} // namespace seqviz
