#include "chanloop/v1/loop_metrics.hpp"

#include "chanloop/v1/errors.hpp"

#include <cmath>

namespace chanloop::v1 {

namespace {

// Mean |y| where x crosses zero between consecutive points, interpolated.
Real mean_abs_at_zero_crossing(const Vector& x, const Vector& y) {
    Real sum = 0.0;
    int count = 0;
    for (Index i = 0; i + 1 < x.size(); ++i) {
        const Real x0 = x[i];
        const Real x1 = x[i + 1];
        if (x0 == 0.0) {
            sum += std::abs(y[i]);
            ++count;
            continue;
        }
        if ((x0 < 0.0 && x1 > 0.0) || (x0 > 0.0 && x1 < 0.0)) {
            const Real t = x0 / (x0 - x1);
            sum += std::abs(y[i] + t * (y[i + 1] - y[i]));
            ++count;
        }
    }
    return count > 0 ? sum / static_cast<Real>(count) : 0.0;
}

}  // namespace

Real loop_area(const Vector& h, const Vector& b) {
    Real twice_area = 0.0;
    const Index n = h.size();
    for (Index i = 0; i < n; ++i) {
        const Index j = (i + 1) % n;
        twice_area += h[i] * b[j] - h[j] * b[i];
    }
    return 0.5 * std::abs(twice_area);
}

LoopMetrics compute_loop_metrics(const AveragedLoop& loop, const ModelParameters& params) {
    if (loop.size() < 3 || loop.b.size() != loop.h.size()) {
        throw InsufficientDataError("loop metrics need a closed loop of at least 3 points");
    }

    LoopMetrics m;
    m.peak_field = loop.h.cwiseAbs().maxCoeff();
    m.peak_flux_density = loop.b.cwiseAbs().maxCoeff();
    m.remanence = mean_abs_at_zero_crossing(loop.h, loop.b);
    m.coercivity = mean_abs_at_zero_crossing(loop.b, loop.h);

    m.energy_density = loop_area(loop.h, loop.b);
    m.loss_density = m.energy_density * params.frequency;
    m.core_volume = params.cross_section * params.path_length;
    m.core_loss = m.loss_density * m.core_volume;

    m.peak_current = m.peak_field * params.path_length / static_cast<Real>(params.turns);
    m.peak_flux_linkage = static_cast<Real>(params.turns) * params.cross_section * m.peak_flux_density;
    if (m.peak_field > 0.0) {
        m.amplitude_permeability = m.peak_flux_density / (kMu0 * m.peak_field);
    }
    return m;
}

}  // namespace chanloop::v1
