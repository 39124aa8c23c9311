#pragma once

// =============================================================================
// ChanLoop - Excitation Waveforms
// =============================================================================
// One period of applied field samples. The engine repeats the period for each
// simulated cycle, so samples lie in [0, period) and never include the end
// point of the period.
// =============================================================================

#include "chanloop/v1/numeric_types.hpp"
#include "chanloop/v1/parameters.hpp"

#include <cstddef>
#include <vector>

namespace chanloop::v1 {

struct ExcitationWaveform {
    std::vector<Real> time;    // [s], strictly increasing, within [0, period)
    std::vector<Real> field;   // Applied field H [A/m]
    Real period = 0.0;         // [s]

    [[nodiscard]] std::size_t size() const { return time.size(); }
    [[nodiscard]] bool empty() const { return time.empty(); }
};

/// Applied field of the given shape at time t (period 1/frequency, zero phase).
[[nodiscard]] Real excitation_at(WaveformShape shape, Real amplitude, Real frequency, Real t);

/// Sample one period of params.waveform at params.samples_per_cycle points.
[[nodiscard]] ExcitationWaveform make_excitation(const ModelParameters& params);

/// Build a field waveform from one period of sampled magnetising current,
/// H = turns * i / path_length.
[[nodiscard]] ExcitationWaveform excitation_from_current(const std::vector<Real>& time,
                                                         const std::vector<Real>& current,
                                                         Real period,
                                                         const ModelParameters& params);

/// Throws InvalidParameterError unless the waveform has at least two finite
/// samples with strictly increasing time stamps inside one positive period.
void validate_waveform(const ExcitationWaveform& waveform);

}  // namespace chanloop::v1
