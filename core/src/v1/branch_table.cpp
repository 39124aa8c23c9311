#include "chanloop/v1/branch_table.hpp"

#include "chanloop/v1/components/chan_core.hpp"
#include "chanloop/v1/errors.hpp"

namespace chanloop::v1 {

BranchTable evaluate_branches(const ModelParameters& params, int points) {
    validate_parameters(params);
    if (points < 2) {
        throw InvalidParameterError("branch table needs at least 2 points");
    }

    const ChanCore core(params);
    const Real h_max = params.field_amplitude;
    const Real shift = core.minor_loop_shift(h_max);

    BranchTable table;
    table.h = Vector::LinSpaced(points, -h_max, h_max);
    table.upper.resize(points);
    table.lower.resize(points);
    for (Index i = 0; i < points; ++i) {
        table.upper[i] = core.descending(table.h[i]) - shift;
        table.lower[i] = core.ascending(table.h[i]) + shift;
    }
    table.middle = 0.5 * (table.upper + table.lower);
    return table;
}

}  // namespace chanloop::v1
