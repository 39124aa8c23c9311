#pragma once

// =============================================================================
// ChanLoop - Run Pipeline
// =============================================================================
// validate -> waveform -> simulate -> average -> metrics -> export -> save
// Nothing is exported unless simulation and averaging succeeded, and the run
// log is only rewritten after a successful export.
// =============================================================================

#include "chanloop/v1/averaging.hpp"
#include "chanloop/v1/io/data_exporter.hpp"
#include "chanloop/v1/io/parameter_store.hpp"
#include "chanloop/v1/loop_metrics.hpp"
#include "chanloop/v1/simulation.hpp"

#include <vector>

namespace chanloop::v1 {

struct PipelineResult {
    std::vector<LoopSample> samples;
    AveragedLoop loop;
    LoopMetrics metrics;
    Real settling = 0.0;         // cycle_to_cycle_change() of the raw samples
    io::ExportReport files;
    bool parameters_saved = false;
};

/// Simulation stages only; no I/O.
[[nodiscard]] PipelineResult compute_loop(const ModelParameters& params);

/// Full run. store may be null to skip persisting the parameters.
[[nodiscard]] PipelineResult run_pipeline(const ModelParameters& params,
                                          const io::ExportOptions& output,
                                          io::ParameterStore* store);

}  // namespace chanloop::v1
