#include "Scrubber.h"

#include <algorithm>
#include <cmath>

namespace seqviz {

namespace {

// Absorbs (i + f) / N * N landing a hair below i.
constexpr double kSnapEps = 1e-9;

inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

} // namespace

ScrubberCoordinate scrubberToStep(double global_0_1, int step_count) {
    ScrubberCoordinate c;
    if (step_count <= 0) return c;

    const double n = static_cast<double>(step_count);
    const double x = clamp01(global_0_1) * n;

    int idx = static_cast<int>(std::floor(x + kSnapEps));
    idx = std::clamp(idx, 0, step_count - 1);

    c.step_index = idx;
    c.fraction_0_1 = clamp01(x - static_cast<double>(idx));
    return c;
}

double stepToScrubber(int step_index, double fraction_0_1, int step_count) {
    if (step_count <= 0) return 0.0;
    const int idx = std::clamp(step_index, 0, step_count - 1);
    const double g = (static_cast<double>(idx) + clamp01(fraction_0_1)) / static_cast<double>(step_count);
    return clamp01(g);
}

int completedStepCount(double global_0_1, int step_count) {
    if (step_count <= 0) return 0;
    const double x = clamp01(global_0_1) * static_cast<double>(step_count);
    const int done = static_cast<int>(std::floor(x + kSnapEps));
    return std::clamp(done, 0, step_count);
}

} // namespace seqviz
