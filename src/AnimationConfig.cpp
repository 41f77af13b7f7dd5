#include "AnimationConfig.h"

#include "Fnv1a.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace seqviz {

using namespace detail;

namespace {

constexpr double kMinStepWindow_s = 1e-3;
constexpr double kMaxDuration_s = 3600.0;

inline double clampDuration(double v, double fallback) {
    if (!std::isfinite(v)) return fallback;
    return std::clamp(v, 0.0, kMaxDuration_s);
}

inline double clamp01Or(double v, double fallback) {
    if (!std::isfinite(v)) return fallback;
    return std::clamp(v, 0.0, 1.0);
}

} // namespace

bool sanitizeConfig(const AnimationConfigV1& in, AnimationConfigV1& out) {
    // Deterministic contract enforcement: accept only matching version/size.
    if (in.version_u32 != 1u || in.size_bytes_u32 != sizeof(AnimationConfigV1)) {
        return false;
    }

    AnimationConfigV1 c = in;
    const PhaseTimingConfig dt{};
    c.timing.demo_start_delay_s = clampDuration(c.timing.demo_start_delay_s, dt.demo_start_delay_s);
    c.timing.fadein_per_part_s  = clampDuration(c.timing.fadein_per_part_s, dt.fadein_per_part_s);
    c.timing.hold_s             = clampDuration(c.timing.hold_s, dt.hold_s);
    c.timing.explode_s          = clampDuration(c.timing.explode_s, dt.explode_s);
    c.timing.move_s             = clampDuration(c.timing.move_s, dt.move_s);
    c.timing.pause_s            = clampDuration(c.timing.pause_s, dt.pause_s);
    if (c.timing.stepDuration_s() < kMinStepWindow_s) {
        c.timing.pause_s = kMinStepWindow_s - c.timing.move_s;
    }

    const RenderStyleConfig ds{};
    c.style.ghost_opacity_0_1  = clamp01Or(c.style.ghost_opacity_0_1, ds.ghost_opacity_0_1);
    c.style.active_opacity_0_1 = clamp01Or(c.style.active_opacity_0_1, ds.active_opacity_0_1);
    c.style.pulse_depth_0_1    = clamp01Or(c.style.pulse_depth_0_1, ds.pulse_depth_0_1);
    c.style.pulse_period_s     = clampDuration(c.style.pulse_period_s, ds.pulse_period_s);

    world::ArmPoseSolver arm;
    arm.setConfig(c.arm);
    c.arm = arm.config();

    const BridgeConfig db{};
    c.bridge.expected_step_s = clampDuration(c.bridge.expected_step_s, db.expected_step_s);
    c.bridge.grasp_lead_s    = clampDuration(c.bridge.grasp_lead_s, db.grasp_lead_s);
    c.bridge.grasp_hold_s    = clampDuration(c.bridge.grasp_hold_s, db.grasp_hold_s);
    c.bridge.retreat_s       = clampDuration(c.bridge.retreat_s, db.retreat_s);

    c.autoplay_after_demo_u32 = (c.autoplay_after_demo_u32 != 0u) ? 1u : 0u;
    c.autoplay_delay_s = clampDuration(c.autoplay_delay_s, 1.5);

    c.fnv_hash_u32 = hashConfig(c);
    out = c;
    return true;
}

std::uint32_t hashConfig(const AnimationConfigV1& cfg) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, cfg.version_u32);
    h = fnv1a32_add_u32(h, cfg.size_bytes_u32);

    h = fnv1a32_add_f64(h, cfg.timing.demo_start_delay_s);
    h = fnv1a32_add_f64(h, cfg.timing.fadein_per_part_s);
    h = fnv1a32_add_f64(h, cfg.timing.hold_s);
    h = fnv1a32_add_f64(h, cfg.timing.explode_s);
    h = fnv1a32_add_f64(h, cfg.timing.move_s);
    h = fnv1a32_add_f64(h, cfg.timing.pause_s);

    h = fnv1a32_add_f64(h, cfg.style.ghost_opacity_0_1);
    h = fnv1a32_add_f64(h, cfg.style.active_opacity_0_1);
    h = fnv1a32_add_f64(h, cfg.style.pulse_period_s);
    h = fnv1a32_add_f64(h, cfg.style.pulse_depth_0_1);

    for (double r : cfg.arm.segment_ratio) h = fnv1a32_add_f64(h, r);
    h = fnv1a32_add_f64(h, cfg.arm.reach_cap_0_1);
    h = fnv1a32_add_f64(h, cfg.arm.max_fold_rad);
    h = fnv1a32_add_f64(h, cfg.arm.base_fold_share);
    h = fnv1a32_add_f64(h, cfg.arm.joint_fold_share);
    h = fnv1a32_add_f64(h, cfg.arm.follow_rate_1_per_s);
    h = fnv1a32_add_f64(h, cfg.arm.gripper_rate_1_per_s);
    h = fnv1a32_add_f64(h, cfg.arm.gripper_open_0_1);
    h = fnv1a32_add_f64(h, cfg.arm.gripper_closed_0_1);
    h = fnv1a32_add_f64(h, cfg.arm.base_offset_x_radii);
    h = fnv1a32_add_f64(h, cfg.arm.base_offset_z_radii);
    h = fnv1a32_add_f64(h, cfg.arm.rest_height_radii);

    h = fnv1a32_add_f64(h, cfg.bridge.expected_step_s);
    h = fnv1a32_add_f64(h, cfg.bridge.grasp_lead_s);
    h = fnv1a32_add_f64(h, cfg.bridge.grasp_hold_s);
    h = fnv1a32_add_f64(h, cfg.bridge.retreat_s);

    h = fnv1a32_add_u32(h, cfg.autoplay_after_demo_u32);
    h = fnv1a32_add_f64(h, cfg.autoplay_delay_s);
    return h;
}

int exportConfigText(const AnimationConfigV1& cfg, char* buf, int cap) {
    if (!buf || cap <= 0) return 0;
    buf[0] = '\0';

    int n = 0;
    auto app = [&](const char* fmt, auto... args) {
        if (n >= cap - 1) return;
        const int w = std::snprintf(buf + n, (size_t)(cap - n), fmt, args...);
        if (w > 0) n += std::min(w, cap - 1 - n);
    };

    app("AnimationConfigV1\n");
    app("  version_u32=%u\n", cfg.version_u32);
    app("  size_bytes_u32=%u\n", cfg.size_bytes_u32);

    app("PhaseTiming\n");
    app("  demo_start_delay_s=%.9g\n", cfg.timing.demo_start_delay_s);
    app("  fadein_per_part_s=%.9g\n", cfg.timing.fadein_per_part_s);
    app("  hold_s=%.9g\n", cfg.timing.hold_s);
    app("  explode_s=%.9g\n", cfg.timing.explode_s);
    app("  move_s=%.9g\n", cfg.timing.move_s);
    app("  pause_s=%.9g\n", cfg.timing.pause_s);

    app("RenderStyle\n");
    app("  ghost_opacity_0_1=%.9g\n", cfg.style.ghost_opacity_0_1);
    app("  active_opacity_0_1=%.9g\n", cfg.style.active_opacity_0_1);
    app("  pulse_period_s=%.9g\n", cfg.style.pulse_period_s);
    app("  pulse_depth_0_1=%.9g\n", cfg.style.pulse_depth_0_1);

    app("Arm\n");
    app("  segment_ratio=(%.4f,%.4f,%.4f,%.4f,%.4f,%.4f)\n",
        cfg.arm.segment_ratio[0], cfg.arm.segment_ratio[1], cfg.arm.segment_ratio[2],
        cfg.arm.segment_ratio[3], cfg.arm.segment_ratio[4], cfg.arm.segment_ratio[5]);
    app("  reach_cap_0_1=%.9g\n", cfg.arm.reach_cap_0_1);
    app("  max_fold_rad=%.9g\n", cfg.arm.max_fold_rad);
    app("  base_fold_share=%.9g\n", cfg.arm.base_fold_share);
    app("  joint_fold_share=%.9g\n", cfg.arm.joint_fold_share);
    app("  follow_rate_1_per_s=%.9g\n", cfg.arm.follow_rate_1_per_s);
    app("  gripper_rate_1_per_s=%.9g\n", cfg.arm.gripper_rate_1_per_s);
    app("  gripper_open_0_1=%.9g\n", cfg.arm.gripper_open_0_1);
    app("  gripper_closed_0_1=%.9g\n", cfg.arm.gripper_closed_0_1);
    app("  base_offset_radii=(%.4f,%.4f)\n", cfg.arm.base_offset_x_radii, cfg.arm.base_offset_z_radii);
    app("  rest_height_radii=%.9g\n", cfg.arm.rest_height_radii);

    app("Bridge\n");
    app("  expected_step_s=%.9g\n", cfg.bridge.expected_step_s);
    app("  grasp_lead_s=%.9g\n", cfg.bridge.grasp_lead_s);
    app("  grasp_hold_s=%.9g\n", cfg.bridge.grasp_hold_s);
    app("  retreat_s=%.9g\n", cfg.bridge.retreat_s);

    app("Autoplay\n");
    app("  autoplay_after_demo_u32=%u\n", cfg.autoplay_after_demo_u32);
    app("  autoplay_delay_s=%.9g\n", cfg.autoplay_delay_s);

    app("fnv_hash_u32=0x%08X\n", hashConfig(cfg));
    return n;
}

} // namespace seqviz
