#pragma once

#include "chanloop/v1/errors.hpp"
#include "chanloop/v1/numeric_types.hpp"
#include "chanloop/v1/parameters.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace chanloop::v1 {

// =============================================================================
// Chan Core (nonlinear material law + series air gap)
// =============================================================================

/// Which curve the operating point currently follows.
enum class Branch {
    Initial,     // Initial magnetisation curve from the demagnetised state
    Ascending,   // Lower branch, dH > 0
    Descending   // Upper branch, dH < 0
};

/// Chan's empirical saturation law
///   f(x) = Bs * x / (|x| + k),  k = Hc * (Bs/Br - 1)
/// Major branches are f(H - Hc) (ascending) and f(H + Hc) (descending); both
/// pass through +/-Br at H = 0 and through zero at H = +/-Hc.
///
/// A series air gap of length lg on a path of length lm gives
///   H_applied * lm = H_core * lm + (B / mu0) * lg
/// so H_core = H_applied - g * B with g = lg / (mu0 * lm).
class ChanCore {
public:
    struct Params {
        Real saturation_flux_density = 1.5;  // Bs [T]
        Real remanence = 0.3;                // Br [T]
        Real coercive_field = 50.0;          // Hc [A/m]
        Real gap_length = 0.0;               // [m]
        Real path_length = 0.1;              // [m]
    };

    explicit ChanCore(const Params& params)
        : params_(params)
        , shape_(params.coercive_field *
                 (params.saturation_flux_density / params.remanence - 1.0))
        , demag_(params.gap_length / (kMu0 * params.path_length)) {}

    explicit ChanCore(const ModelParameters& p)
        : ChanCore(Params{p.saturation_flux_density, p.remanence, p.coercive_field,
                          p.gap_length, p.path_length}) {}

    [[nodiscard]] const Params& params() const { return params_; }

    /// k in the saturation law [A/m]
    [[nodiscard]] Real shape_coefficient() const { return shape_; }

    /// g = lg / (mu0 * lm) [A/m per T]; zero for an ungapped core
    [[nodiscard]] Real demagnetizing_factor() const { return demag_; }

    [[nodiscard]] Real saturation(Real x) const {
        const Real denom = std::abs(x) + shape_;
        check_denominator(denom, x);
        return params_.saturation_flux_density * x / denom;
    }

    /// df/dx = Bs * k / (|x| + k)^2
    [[nodiscard]] Real saturation_slope(Real x) const {
        const Real denom = std::abs(x) + shape_;
        check_denominator(denom, x);
        return params_.saturation_flux_density * shape_ / (denom * denom);
    }

    [[nodiscard]] Real ascending(Real h) const { return saturation(h - params_.coercive_field); }
    [[nodiscard]] Real descending(Real h) const { return saturation(h + params_.coercive_field); }
    [[nodiscard]] Real initial(Real h) const { return 0.5 * (ascending(h) + descending(h)); }

    /// Branch value without vertical offset.
    [[nodiscard]] Real branch(Branch b, Real h) const {
        switch (b) {
            case Branch::Ascending: return ascending(h);
            case Branch::Descending: return descending(h);
            case Branch::Initial: break;
        }
        return initial(h);
    }

    [[nodiscard]] Real branch_slope(Branch b, Real h) const {
        const Real hc = params_.coercive_field;
        switch (b) {
            case Branch::Ascending: return saturation_slope(h - hc);
            case Branch::Descending: return saturation_slope(h + hc);
            case Branch::Initial: break;
        }
        return 0.5 * (saturation_slope(h - hc) + saturation_slope(h + hc));
    }

    /// Vertical shift of a symmetric minor loop with tip field h_max:
    /// dB = (f(Hmax + Hc) - f(Hmax - Hc)) / 2. Zero in deep saturation.
    [[nodiscard]] Real minor_loop_shift(Real h_max) const {
        return 0.5 * (descending(h_max) - ascending(h_max));
    }

    /// Solve B = scale * branch(h_applied - g*B) + offset for B.
    /// The residual is strictly increasing in B and the root lies within
    /// offset +/- scale*Bs, so Newton is safeguarded by bisection on that
    /// bracket. With g == 0 the first iterate is the exact answer.
    [[nodiscard]] Real solve_flux_density(Branch b, Real offset, Real scale, Real h_applied,
                                          Real b_guess) const {
        if (!(scale > 0.0) || !std::isfinite(scale)) {
            throw NumericDivergenceError("branch scale " + std::to_string(scale) +
                                         " is not a positive finite value at H=" +
                                         std::to_string(h_applied));
        }
        const Real bs = params_.saturation_flux_density;
        const Real tol = kFluxTolerance * bs;

        Real lo = offset - scale * bs;
        Real hi = offset + scale * bs;
        Real flux = scale * branch(b, h_applied - demag_ * std::clamp(b_guess, lo, hi)) + offset;

        for (int iter = 0; iter < kMaxNewtonIterations; ++iter) {
            const Real h_core = h_applied - demag_ * flux;
            const Real residual = flux - (scale * branch(b, h_core) + offset);
            if (!std::isfinite(residual)) {
                throw NumericDivergenceError("non-finite residual while solving the gap equation at H=" +
                                             std::to_string(h_applied));
            }
            if (std::abs(residual) <= tol) {
                return flux;
            }

            if (residual > 0.0) {
                hi = flux;
            } else {
                lo = flux;
            }

            const Real jacobian = 1.0 + demag_ * scale * branch_slope(b, h_core);
            Real next = flux - residual / jacobian;
            if (!(next > lo && next < hi)) {
                next = 0.5 * (lo + hi);
            }
            flux = next;
        }

        throw NumericDivergenceError("gap equation did not converge within " +
                                     std::to_string(kMaxNewtonIterations) +
                                     " iterations at H=" + std::to_string(h_applied));
    }

    [[nodiscard]] Real solve_flux_density(Branch b, Real offset, Real h_applied,
                                          Real b_guess) const {
        return solve_flux_density(b, offset, 1.0, h_applied, b_guess);
    }

    static constexpr int kMaxNewtonIterations = 100;
    static constexpr Real kFluxTolerance = 1e-13;

private:
    static void check_denominator(Real denom, Real x) {
        if (!(denom > 0.0) || !std::isfinite(denom)) {
            throw NumericDivergenceError("saturation function denominator vanished at x=" +
                                         std::to_string(x));
        }
    }

    Params params_;
    Real shape_;
    Real demag_;
};

}  // namespace chanloop::v1
