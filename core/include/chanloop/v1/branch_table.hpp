#pragma once

#include "chanloop/v1/numeric_types.hpp"
#include "chanloop/v1/parameters.hpp"

namespace chanloop::v1 {

/// Static loop branches on a uniform grid from -Hmax to +Hmax.
/// upper = f(H + Hc) - dB, lower = f(H - Hc) + dB, middle = (upper + lower) / 2,
/// where dB closes the loop at +/-Hmax for unsaturated (minor) loops.
struct BranchTable {
    Vector h;
    Vector upper;
    Vector lower;
    Vector middle;

    [[nodiscard]] Index size() const { return h.size(); }
};

/// Ignores the gap and the waveform; uses Bs, Br, Hc and Hmax only.
/// Throws InvalidParameterError for invalid params or points < 2.
[[nodiscard]] BranchTable evaluate_branches(const ModelParameters& params, int points);

}  // namespace chanloop::v1
