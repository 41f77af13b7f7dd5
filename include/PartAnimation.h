#pragma once

// PartAnimation.h
//
// Per-part render state: a pure function of (animation state, step index, config).
// No side effects and no history, so any (phase, progress) can be evaluated
// directly without having played up to it.
//
// Phase rules (sequenced parts):
//   idle           completed -> Complete @ assembled; not yet active -> Ghost @ approach;
//                  active step of a paused run -> Active, no pulse
//   demo_fadein    one part at a time, opacity 0 -> 1 @ assembled (part list order)
//   demo_hold      every part Complete @ assembled
//   demo_explode   assembled -> approach, eased, all parts in parallel, opacity 1
//   demo_assemble  per-step window: move (eased) approach -> assembled, pause, Complete;
//   playing        active step pulses; later steps Ghost @ approach
//   scrubbing      as playing, driven by the scrub position, no pulse
// Parts referenced by no step are static fixtures (Complete @ assembled) outside
// the demo phases. The selected part only changes visual_class.

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

#include "AssemblyTypes.h"
#include "PhaseMachine.h"

namespace seqviz {

enum class VisualClass : std::uint32_t {
    Ghost = 0,
    Active,
    Complete,
    Selected,
};

const char* visualClassName(VisualClass c);

struct PartRenderState {
    Vec3d position_m{};
    double opacity_0_1 = 0.0;
    VisualClass visual_class = VisualClass::Ghost;
};

struct RenderStyleConfig {
    double ghost_opacity_0_1  = 0.10;
    double active_opacity_0_1 = 0.90; // below 1 so only Complete parts are fully opaque
    double pulse_period_s     = 2.0;
    double pulse_depth_0_1    = 0.35;
};

using PartStateMap = std::map<std::string, PartRenderState>;

// f(t) = t<0.5 ? 4t^3 : 1-(-2t+2)^3/2, t clamped to [0,1].
double easeInOutCubic(double t);

// Multiplicative opacity factor for the active step, t seconds on the phase clock
// (AnimationState::phase_elapsed_s), so the pulse is continuous across steps.
double pulseFactor(double t_s, const RenderStyleConfig& style);

PartRenderState computePartAnimation(const StepIndex& index,
                                     int part_idx,
                                     const AnimationState& anim,
                                     const PhaseTimingConfig& timing,
                                     const RenderStyleConfig& style,
                                     const std::string& selected_part_id = std::string());

void computeAllPartAnimations(const StepIndex& index,
                              const AnimationState& anim,
                              const PhaseTimingConfig& timing,
                              const RenderStyleConfig& style,
                              const std::string& selected_part_id,
                              PartStateMap& out);

// Parts at opacity 1.
std::size_t countFullyOpaque(const PartStateMap& parts);

} // namespace seqviz
