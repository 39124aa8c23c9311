#include "chanloop/v1/averaging.hpp"

#include "chanloop/v1/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace chanloop::v1 {

namespace {

constexpr int kMinRetainedCycles = 2;

struct CycleLayout {
    int cycles = 0;
    int per_cycle = 0;
};

/// Samples must come as whole cycles 0, 1, 2, ... each with phases 0..N-1.
CycleLayout check_layout(const std::vector<LoopSample>& samples) {
    if (samples.empty()) {
        throw InsufficientDataError("no samples to average");
    }

    int per_cycle = 0;
    while (static_cast<std::size_t>(per_cycle) < samples.size() &&
           samples[static_cast<std::size_t>(per_cycle)].cycle == samples.front().cycle) {
        ++per_cycle;
    }
    if (samples.size() % static_cast<std::size_t>(per_cycle) != 0) {
        throw InsufficientDataError("last cycle is incomplete (" + std::to_string(samples.size()) +
                                    " samples, " + std::to_string(per_cycle) + " per cycle)");
    }

    const int cycles = static_cast<int>(samples.size() / static_cast<std::size_t>(per_cycle));
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const int expected_cycle = static_cast<int>(i / static_cast<std::size_t>(per_cycle));
        const int expected_phase = static_cast<int>(i % static_cast<std::size_t>(per_cycle));
        if (samples[i].cycle != samples.front().cycle + expected_cycle ||
            samples[i].phase != expected_phase) {
            throw InsufficientDataError("sample " + std::to_string(i) +
                                        " is not phase-aligned (cycle " +
                                        std::to_string(samples[i].cycle) + ", phase " +
                                        std::to_string(samples[i].phase) + ")");
        }
    }
    return {cycles, per_cycle};
}

}  // namespace

AveragedLoop average(const std::vector<LoopSample>& samples, int discard_cycles) {
    if (discard_cycles < 0) {
        throw InvalidParameterError("discard_cycles must not be negative");
    }

    const CycleLayout layout = check_layout(samples);
    const int retained = layout.cycles - discard_cycles;
    if (retained < kMinRetainedCycles) {
        throw InsufficientDataError("averaging needs at least " + std::to_string(kMinRetainedCycles) +
                                    " cycles after discarding " + std::to_string(discard_cycles) +
                                    " of " + std::to_string(layout.cycles));
    }

    const Index n = layout.per_cycle;
    Vector h_sum = Vector::Zero(n);
    Vector b_sum = Vector::Zero(n);

    for (int cycle = discard_cycles; cycle < layout.cycles; ++cycle) {
        const std::size_t base = static_cast<std::size_t>(cycle) * static_cast<std::size_t>(n);
        for (Index k = 0; k < n; ++k) {
            const LoopSample& s = samples[base + static_cast<std::size_t>(k)];
            h_sum[k] += s.h;
            b_sum[k] += s.b;
        }
    }

    AveragedLoop loop;
    loop.cycles_used = retained;
    loop.cycles_discarded = discard_cycles;
    loop.h.resize(n + 1);
    loop.b.resize(n + 1);
    loop.h.head(n) = h_sum / static_cast<Real>(retained);
    loop.b.head(n) = b_sum / static_cast<Real>(retained);
    loop.h[n] = loop.h[0];
    loop.b[n] = loop.b[0];
    return loop;
}

Real cycle_to_cycle_change(const std::vector<LoopSample>& samples) {
    const CycleLayout layout = check_layout(samples);
    if (layout.cycles < 2) {
        throw InsufficientDataError("cycle-to-cycle change needs at least 2 cycles");
    }

    const auto n = static_cast<std::size_t>(layout.per_cycle);
    const std::size_t last = static_cast<std::size_t>(layout.cycles - 1) * n;
    const std::size_t prev = last - n;
    Real change = 0.0;
    for (std::size_t k = 0; k < n; ++k) {
        change = std::max(change, std::abs(samples[last + k].b - samples[prev + k].b));
    }
    return change;
}

}  // namespace chanloop::v1
