#pragma once

// =============================================================================
// ChanLoop - Numeric Types
// =============================================================================

#include <Eigen/Core>

#include <cstdint>
#include <numbers>

namespace chanloop::v1 {

using Real = double;
using Index = Eigen::Index;
using Vector = Eigen::VectorXd;

/// Vacuum permeability [H/m]
inline constexpr Real kMu0 = 4.0e-7 * std::numbers::pi;

}  // namespace chanloop::v1
