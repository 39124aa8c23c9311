#pragma once

#include "chanloop/v1/numeric_types.hpp"
#include "chanloop/v1/simulation.hpp"

#include <vector>

namespace chanloop::v1 {

/// Steady-state loop averaged over the retained cycles, phase by phase.
/// h and b hold samples_per_cycle + 1 points; the last repeats the first.
struct AveragedLoop {
    Vector h;
    Vector b;
    int cycles_used = 0;
    int cycles_discarded = 0;

    [[nodiscard]] Index size() const { return h.size(); }
    [[nodiscard]] bool empty() const { return h.size() == 0; }
    /// Points per cycle, without the closing point.
    [[nodiscard]] Index points_per_cycle() const { return h.size() > 0 ? h.size() - 1 : 0; }
};

/// Drop the first discard_cycles cycles and average the rest by phase index.
/// Throws InsufficientDataError when fewer than two complete cycles remain or
/// the samples are not phase-aligned cycle by cycle.
[[nodiscard]] AveragedLoop average(const std::vector<LoopSample>& samples, int discard_cycles);

/// Largest |difference| between the same phase of two consecutive cycles,
/// taken over the last retained pair. Small values mean the transient died out.
[[nodiscard]] Real cycle_to_cycle_change(const std::vector<LoopSample>& samples);

}  // namespace chanloop::v1
