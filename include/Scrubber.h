#pragma once

// Scrubber.h
//
// Bidirectional mapping between global normalized sequence progress and
// (step index, within-step fraction). N equal segments over [0,1].
//
//   scrubberToStep(g): step = floor(g*N) clamped to [0,N-1], fraction = g*N - step
//   stepToScrubber(i,f): (i + f) / N
//
// N <= 0 maps to {0, 0} / 0. Out-of-range inputs are clamped, never rejected.

namespace seqviz {

struct ScrubberCoordinate {
    int step_index = 0;
    double fraction_0_1 = 0.0;
};

ScrubberCoordinate scrubberToStep(double global_0_1, int step_count);
double stepToScrubber(int step_index, double fraction_0_1, int step_count);

// Number of steps fully complete at global position g (0..N).
int completedStepCount(double global_0_1, int step_count);

} // namespace seqviz
