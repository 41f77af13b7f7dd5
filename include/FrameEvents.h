#pragma once

#include <cstdint>

namespace seqviz {

// Event / warning bitmask latched per frame (developer-visible; never affects output).
enum FrameEventBits : std::uint32_t {
    Event_None                  = 0u,
    Event_PhaseChanged          = 1u << 0,
    Event_StepCompleted         = 1u << 1,
    Event_ExecStepStarted       = 1u << 2,
    Event_ExecStepSucceeded     = 1u << 3,
    Event_ExecStepFailed        = 1u << 4,
    Event_ExecHumanIntervention = 1u << 5,
    Event_ExecReset             = 1u << 6,
    Event_AutoplayFired         = 1u << 7,
    Event_AssemblyLoaded        = 1u << 8,
    // Rejected input / invariant checks (warnings)
    Warn_SnapshotIgnored        = 1u << 16,
    Warn_ScrubWithoutStart      = 1u << 17,
    Warn_ControlIgnored         = 1u << 18,
    Warn_TargetNotPermitted     = 1u << 19,
    Warn_OpaqueCountDecreased   = 1u << 20,
};

} // namespace seqviz
