#pragma once

#include "chanloop/v1/components/chan_core.hpp"
#include "chanloop/v1/numeric_types.hpp"
#include "chanloop/v1/parameters.hpp"
#include "chanloop/v1/waveform.hpp"

#include <vector>

namespace chanloop::v1 {

struct LoopSample {
    int cycle = 0;          // 0-based cycle index
    int phase = 0;          // Sample position within the cycle
    Real time = 0.0;        // [s], cycle * period + waveform time
    Real h = 0.0;           // Applied field [A/m]
    Real h_core = 0.0;      // Field inside the core material [A/m]
    Real b = 0.0;           // Flux density [T]
};

/// Operating point where dH changed sign.
struct ReversalPoint {
    Real h = 0.0;
    Real h_core = 0.0;
    Real b = 0.0;
};

/// Operating point carried from one sample to the next (and across cycles).
///
/// The current curve is B = scale * branch(H_core) + offset. It starts at the
/// newest reversal point and, when an older one exists, is stretched to end at
/// the reversal before it. Reaching that point closes the minor loop: both
/// points are dropped and the outer curve resumes (return-point memory).
struct CoreState {
    Real h = 0.0;
    Real h_core = 0.0;
    Real b = 0.0;
    Branch branch = Branch::Initial;
    Real offset = 0.0;      // Vertical shift of the current branch [T]
    Real scale = 1.0;       // Vertical stretch of the current branch
    int direction = 0;      // Sign of the last non-zero dH
    std::vector<ReversalPoint> reversals;  // Open reversal points, oldest first
};

class Simulator {
public:
    /// Throws InvalidParameterError if params are invalid.
    explicit Simulator(const ModelParameters& params);

    /// Run params.num_cycles cycles of the waveform from the current state.
    /// Nothing is returned (and the state is left unchanged) on failure.
    [[nodiscard]] std::vector<LoopSample> run(const ExcitationWaveform& waveform);

    /// Advance one sample. Reverses the branch when dH changes sign and
    /// closes minor loops whose starting point is reached again.
    void step(Real h_applied);

    /// Back to the demagnetised state.
    void reset() { state_ = CoreState{}; }

    [[nodiscard]] const CoreState& state() const { return state_; }
    [[nodiscard]] const ModelParameters& params() const { return params_; }
    [[nodiscard]] const ChanCore& core() const { return core_; }

private:
    void select_branch(CoreState& state) const;

    ModelParameters params_;
    ChanCore core_;
    CoreState state_;
};

/// Pure entry point: fresh demagnetised core, all cycles, no side effects.
[[nodiscard]] std::vector<LoopSample> simulate(const ModelParameters& params,
                                               const ExcitationWaveform& waveform);

}  // namespace chanloop::v1
