#pragma once

// MockExecution.h
//
// Deterministic, tick-driven stand-in for the remote execution process.
// One step advances every step_interval_s of running time:
//   running -> success (next step running), or for a scripted failure
//   running -> failed -> retrying (attempt + 1) -> ... -> success.
// The run completes after the last step succeeds. Pause/intervene freeze the clock.

#include <cstdint>
#include <string>
#include <vector>

#include "AssemblyTypes.h"
#include "ExecutionBridge.h"

namespace seqviz {

class MockExecutionRunner {
public:
    struct Config {
        double step_interval_s = 5.0;

        // Step that fails before it succeeds (-1: none), and how many times.
        int fail_step_index = -1;
        int fail_attempts = 0;
    };

    MockExecutionRunner() = default;
    explicit MockExecutionRunner(const Config& cfg) : cfg_(cfg) {}

    // Resets the run to idle with every step pending.
    void setAssembly(const AssemblyDefinition& def);
    void setConfig(const Config& cfg) { cfg_ = cfg; }
    const Config& config() const { return cfg_; }

    void start();
    void pause();
    void resume();
    void stop();
    // Operator takes over: current step goes to human, the run to teaching.
    void intervene();

    // dt must be positive and finite; invalid dt is ignored.
    void tick(double dt);

    const ExecutionSnapshot& snapshot() const { return snap_; }
    ExecutionRunPhase phase() const { return snap_.run_phase; }
    bool isRunning() const { return snap_.run_phase == ExecutionRunPhase::Running; }
    int currentStepIndex() const { return current_; }
    double elapsed_s() const { return elapsed_s_; }

    // Bumped on every snapshot change; hosts post the snapshot when it moves.
    std::uint32_t revision() const { return revision_u32_; }

private:
    void setAllPending();
    void setStatus(int step_idx, StepStatus s);
    void advance();

    Config cfg_{};
    std::vector<std::string> step_ids_;
    ExecutionSnapshot snap_{};

    int current_ = -1;
    int failures_done_ = 0;
    double step_timer_s_ = 0.0;
    double elapsed_s_ = 0.0;
    std::uint32_t revision_u32_ = 0;
};

} // namespace seqviz
