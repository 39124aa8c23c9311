#include "chanloop/v1/simulation.hpp"

#include "chanloop/v1/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace chanloop::v1 {

namespace {

// Allowed overshoot of |B| past Bs before the loop counts as unphysical.
constexpr Real kEnvelopeTolerance = 1e-9;

const ModelParameters& checked(const ModelParameters& params) {
    validate_parameters(params);
    return params;
}

}  // namespace

Simulator::Simulator(const ModelParameters& params)
    : params_(checked(params))
    , core_(params_) {}

void Simulator::select_branch(CoreState& state) const {
    if (state.reversals.empty()) {
        state.branch = Branch::Initial;
        state.offset = 0.0;
        state.scale = 1.0;
        return;
    }

    state.branch = state.direction > 0 ? Branch::Ascending : Branch::Descending;
    const ReversalPoint& start = state.reversals.back();
    const Real f_start = core_.branch(state.branch, start.h_core);

    if (state.reversals.size() == 1) {
        // Shifted major branch through the only reversal point.
        state.scale = 1.0;
        state.offset = start.b - f_start;
        return;
    }

    const ReversalPoint& target = state.reversals[state.reversals.size() - 2];
    const Real span = core_.branch(state.branch, target.h_core) - f_start;
    state.scale = (target.b - start.b) / span;
    state.offset = start.b - state.scale * f_start;
}

void Simulator::step(Real h_applied) {
    const Real dh = h_applied - state_.h;
    const int direction = (dh > 0.0) ? 1 : (dh < 0.0 ? -1 : 0);

    CoreState next = state_;
    if (direction != 0) {
        if (state_.direction != 0 && direction != state_.direction) {
            next.reversals.push_back({state_.h, state_.h_core, state_.b});
        }
        next.direction = direction;

        // Wipe out every minor loop whose starting point is reached.
        while (next.reversals.size() >= 2) {
            const Real h_target = next.reversals[next.reversals.size() - 2].h;
            const bool reached = direction > 0 ? h_applied >= h_target : h_applied <= h_target;
            if (!reached) break;
            next.reversals.pop_back();
            next.reversals.pop_back();
        }
        select_branch(next);
    }

    next.b = core_.solve_flux_density(next.branch, next.offset, next.scale, h_applied,
                                      state_.b);
    next.h = h_applied;
    next.h_core = h_applied - core_.demagnetizing_factor() * next.b;

    const Real bs = params_.saturation_flux_density;
    if (!std::isfinite(next.b) || std::abs(next.b) > bs * (1.0 + kEnvelopeTolerance)) {
        throw NumericDivergenceError("flux density " + std::to_string(next.b) +
                                     " T left the saturation envelope (Bs=" +
                                     std::to_string(bs) + " T) at H=" +
                                     std::to_string(h_applied) + " A/m");
    }
    state_ = std::move(next);
}

std::vector<LoopSample> Simulator::run(const ExcitationWaveform& waveform) {
    validate_waveform(waveform);

    const CoreState start = state_;
    const auto per_cycle = waveform.size();

    std::vector<LoopSample> samples;
    samples.reserve(per_cycle * static_cast<std::size_t>(params_.num_cycles));

    try {
        for (int cycle = 0; cycle < params_.num_cycles; ++cycle) {
            const Real t0 = static_cast<Real>(cycle) * waveform.period;
            for (std::size_t k = 0; k < per_cycle; ++k) {
                step(waveform.field[k]);

                LoopSample sample;
                sample.cycle = cycle;
                sample.phase = static_cast<int>(k);
                sample.time = t0 + waveform.time[k];
                sample.h = state_.h;
                sample.h_core = state_.h_core;
                sample.b = state_.b;
                samples.push_back(sample);
            }
        }
    } catch (const NumericDivergenceError&) {
        state_ = start;
        throw;
    }
    return samples;
}

std::vector<LoopSample> simulate(const ModelParameters& params,
                                 const ExcitationWaveform& waveform) {
    Simulator sim(params);
    return sim.run(waveform);
}

}  // namespace chanloop::v1
