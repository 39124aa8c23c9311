#pragma once

// =============================================================================
// ChanLoop - Loop Metrics
// =============================================================================
// Figures of merit taken from a closed steady-state loop:
// - Remanence and coercivity from the zero crossings
// - Hysteresis energy density W = |closed integral of H dB|      [J/m^3]
// - Core loss P = W * f * (A * lm)                               [W]
// - Winding view: I_peak = H_peak * lm / N, lambda_peak = N * A * B_peak
// =============================================================================

#include "chanloop/v1/averaging.hpp"
#include "chanloop/v1/numeric_types.hpp"
#include "chanloop/v1/parameters.hpp"

namespace chanloop::v1 {

struct LoopMetrics {
    Real peak_field = 0.0;              ///< max |H| (A/m)
    Real peak_flux_density = 0.0;       ///< max |B| (T)
    Real remanence = 0.0;               ///< mean |B| at H = 0 (T)
    Real coercivity = 0.0;              ///< mean |H| at B = 0 (A/m)
    Real energy_density = 0.0;          ///< loop area per cycle (J/m^3)
    Real loss_density = 0.0;            ///< energy_density * f (W/m^3)
    Real core_volume = 0.0;             ///< A * lm (m^3)
    Real core_loss = 0.0;               ///< loss_density * core_volume (W)
    Real peak_current = 0.0;            ///< H_peak * lm / N (A)
    Real peak_flux_linkage = 0.0;       ///< N * A * B_peak (Wb-turns)
    Real amplitude_permeability = 0.0;  ///< B_peak / (mu0 * H_peak), relative
};

/// Throws InsufficientDataError for a loop with fewer than 3 points.
[[nodiscard]] LoopMetrics compute_loop_metrics(const AveragedLoop& loop,
                                               const ModelParameters& params);

/// |closed integral of H dB| via the shoelace formula over the closed loop.
[[nodiscard]] Real loop_area(const Vector& h, const Vector& b);

}  // namespace chanloop::v1
