#include "chanloop/v1/waveform.hpp"

#include "chanloop/v1/errors.hpp"

#include <cmath>
#include <numbers>
#include <string>

namespace chanloop::v1 {

Real excitation_at(WaveformShape shape, Real amplitude, Real frequency, Real t) {
    const Real period = 1.0 / frequency;
    switch (shape) {
        case WaveformShape::Sine:
            return amplitude * std::sin(2.0 * std::numbers::pi * frequency * t);
        case WaveformShape::Triangle: {
            // Rises 0 -> +A over the first quarter, falls to -A at three
            // quarters, returns to 0 at the end of the period.
            Real phase = std::fmod(t, period) / period;
            if (phase < 0.0) phase += 1.0;
            if (phase < 0.25) return amplitude * 4.0 * phase;
            if (phase < 0.75) return amplitude * (2.0 - 4.0 * phase);
            return amplitude * (4.0 * phase - 4.0);
        }
    }
    return 0.0;
}

ExcitationWaveform make_excitation(const ModelParameters& params) {
    validate_parameters(params);

    ExcitationWaveform waveform;
    waveform.period = params.period();
    const auto n = static_cast<std::size_t>(params.samples_per_cycle);
    waveform.time.reserve(n);
    waveform.field.reserve(n);

    for (std::size_t k = 0; k < n; ++k) {
        const Real t = waveform.period * static_cast<Real>(k) / static_cast<Real>(n);
        waveform.time.push_back(t);
        waveform.field.push_back(
            excitation_at(params.waveform, params.field_amplitude, params.frequency, t));
    }
    return waveform;
}

ExcitationWaveform excitation_from_current(const std::vector<Real>& time,
                                           const std::vector<Real>& current,
                                           Real period,
                                           const ModelParameters& params) {
    validate_parameters(params);
    if (time.size() != current.size()) {
        throw InvalidParameterError("current waveform has " + std::to_string(current.size()) +
                                    " samples but " + std::to_string(time.size()) + " time stamps");
    }

    ExcitationWaveform waveform;
    waveform.period = period;
    waveform.time = time;
    waveform.field.reserve(current.size());
    const Real scale = static_cast<Real>(params.turns) / params.path_length;
    for (Real i : current) {
        waveform.field.push_back(scale * i);
    }
    validate_waveform(waveform);
    return waveform;
}

void validate_waveform(const ExcitationWaveform& waveform) {
    if (waveform.time.size() != waveform.field.size()) {
        throw InvalidParameterError("waveform time and field sequences differ in length");
    }
    if (waveform.size() < 2) {
        throw InvalidParameterError("waveform needs at least 2 samples per cycle");
    }
    if (!std::isfinite(waveform.period) || waveform.period <= 0.0) {
        throw InvalidParameterError("waveform period must be a positive finite value");
    }

    for (std::size_t k = 0; k < waveform.size(); ++k) {
        const Real t = waveform.time[k];
        if (!std::isfinite(t) || !std::isfinite(waveform.field[k])) {
            throw InvalidParameterError("waveform sample " + std::to_string(k) + " is non-finite");
        }
        if (k > 0 && t <= waveform.time[k - 1]) {
            throw InvalidParameterError("waveform time stamps must be strictly increasing (sample " +
                                        std::to_string(k) + ")");
        }
    }
    if (waveform.time.front() < 0.0 || waveform.time.back() >= waveform.period) {
        throw InvalidParameterError("waveform time stamps must lie within [0, period)");
    }
}

}  // namespace chanloop::v1
