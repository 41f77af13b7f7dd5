#include "MockExecution.h"

#include <algorithm>
#include <cmath>

namespace seqviz {

namespace {

constexpr double kMinInterval_s = 1e-3;

inline bool isFinitePositive(double x) { return std::isfinite(x) && x > 0.0; }

} // namespace

void MockExecutionRunner::setAssembly(const AssemblyDefinition& def) {
    step_ids_.clear();
    for (const AssemblyStep& s : def.steps) step_ids_.push_back(s.id);

    snap_ = ExecutionSnapshot{};
    snap_.valid = true;
    snap_.assembly_id = def.id;
    setAllPending();
    snap_.run_phase = ExecutionRunPhase::Idle;

    current_ = -1;
    failures_done_ = 0;
    step_timer_s_ = 0.0;
    elapsed_s_ = 0.0;
    ++revision_u32_;
}

void MockExecutionRunner::setAllPending() {
    snap_.step_states.clear();
    for (const std::string& id : step_ids_) {
        StepRuntimeState rs;
        rs.step_id = id;
        rs.status = StepStatus::Pending;
        rs.attempt = 1;
        snap_.step_states.push_back(rs);
    }
    snap_.current_step_id.clear();
}

void MockExecutionRunner::setStatus(int step_idx, StepStatus s) {
    if (step_idx < 0 || step_idx >= static_cast<int>(snap_.step_states.size())) return;
    snap_.step_states[static_cast<std::size_t>(step_idx)].status = s;
}

void MockExecutionRunner::start() {
    if (step_ids_.empty()) return;

    setAllPending();
    current_ = 0;
    failures_done_ = 0;
    step_timer_s_ = 0.0;
    elapsed_s_ = 0.0;

    setStatus(0, StepStatus::Running);
    snap_.current_step_id = step_ids_[0];
    snap_.run_phase = ExecutionRunPhase::Running;
    ++revision_u32_;
}

void MockExecutionRunner::pause() {
    if (snap_.run_phase != ExecutionRunPhase::Running) return;
    snap_.run_phase = ExecutionRunPhase::Paused;
    ++revision_u32_;
}

void MockExecutionRunner::resume() {
    if (snap_.run_phase == ExecutionRunPhase::Teaching) {
        // The step the operator took over is retried.
        if (current_ >= 0 && current_ < static_cast<int>(snap_.step_states.size())) {
            StepRuntimeState& rs = snap_.step_states[static_cast<std::size_t>(current_)];
            rs.status = StepStatus::Retrying;
            rs.attempt += 1;
        }
        step_timer_s_ = 0.0;
    } else if (snap_.run_phase != ExecutionRunPhase::Paused) {
        return;
    }
    snap_.run_phase = ExecutionRunPhase::Running;
    ++revision_u32_;
}

void MockExecutionRunner::stop() {
    setAllPending();
    snap_.run_phase = ExecutionRunPhase::Idle;
    current_ = -1;
    failures_done_ = 0;
    step_timer_s_ = 0.0;
    elapsed_s_ = 0.0;
    ++revision_u32_;
}

void MockExecutionRunner::intervene() {
    if (snap_.run_phase != ExecutionRunPhase::Running &&
        snap_.run_phase != ExecutionRunPhase::Paused) {
        return;
    }
    setStatus(current_, StepStatus::Human);
    snap_.run_phase = ExecutionRunPhase::Teaching;
    ++revision_u32_;
}

void MockExecutionRunner::advance() {
    if (current_ < 0 || current_ >= static_cast<int>(snap_.step_states.size())) return;

    StepRuntimeState& rs = snap_.step_states[static_cast<std::size_t>(current_)];
    const bool scripted_failure = (current_ == cfg_.fail_step_index) && (failures_done_ < cfg_.fail_attempts);

    if (rs.status == StepStatus::Failed) {
        rs.status = StepStatus::Retrying;
        rs.attempt += 1;
    } else if (scripted_failure) {
        rs.status = StepStatus::Failed;
        ++failures_done_;
    } else {
        rs.status = StepStatus::Success;
        ++current_;
        if (current_ >= static_cast<int>(step_ids_.size())) {
            snap_.run_phase = ExecutionRunPhase::Complete;
            snap_.current_step_id.clear();
        } else {
            setStatus(current_, StepStatus::Running);
            snap_.current_step_id = step_ids_[static_cast<std::size_t>(current_)];
        }
    }
    ++revision_u32_;
}

void MockExecutionRunner::tick(double dt) {
    if (!isFinitePositive(dt)) return;
    if (snap_.run_phase != ExecutionRunPhase::Running) return;

    elapsed_s_ += dt;
    step_timer_s_ += dt;

    const double interval = std::max(cfg_.step_interval_s, kMinInterval_s);
    while (step_timer_s_ >= interval && snap_.run_phase == ExecutionRunPhase::Running) {
        step_timer_s_ -= interval;
        advance();
    }
}

} // namespace seqviz
