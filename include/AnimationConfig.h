#pragma once

#include <cstdint>

#include "ExecutionBridge.h"
#include "PartAnimation.h"
#include "PhaseMachine.h"
#include "arm_pose_solver.h"

namespace seqviz {

// Versioned, hashable configuration contract. Everything tunable in the engine lives here.
struct AnimationConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(AnimationConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    PhaseTimingConfig timing{};
    RenderStyleConfig style{};
    world::ArmConfig arm{};
    BridgeConfig bridge{};

    // Auto-play after the demo finishes (Control Adapter timer).
    std::uint32_t autoplay_after_demo_u32 = 0;
    double autoplay_delay_s = 1.5;
};

// Accepts only matching version/size; returns false (and leaves out untouched) otherwise.
// Out-of-range tunables are clamped.
bool sanitizeConfig(const AnimationConfigV1& in, AnimationConfigV1& out);

// FNV-1a32 over every field in a fixed order (fnv_hash_u32 itself excluded).
std::uint32_t hashConfig(const AnimationConfigV1& cfg);

// Stable, deterministic text dump. Returns bytes written (excluding NUL).
int exportConfigText(const AnimationConfigV1& cfg, char* buf, int cap);

} // namespace seqviz
