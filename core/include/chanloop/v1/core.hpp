#pragma once

// =============================================================================
// ChanLoop - Chan Hysteresis Model Core
// =============================================================================
// Umbrella header:
// - Chan saturation law with series air gap (components/chan_core.hpp)
// - Multi-cycle loop simulation and steady-state averaging
// - Loop metrics and the static branch table
// - Run log, CSV export and YAML run files
// =============================================================================

#include "chanloop/v1/numeric_types.hpp"
#include "chanloop/v1/errors.hpp"
#include "chanloop/v1/parameters.hpp"
#include "chanloop/v1/waveform.hpp"
#include "chanloop/v1/components/chan_core.hpp"
#include "chanloop/v1/simulation.hpp"
#include "chanloop/v1/averaging.hpp"
#include "chanloop/v1/loop_metrics.hpp"
#include "chanloop/v1/branch_table.hpp"
#include "chanloop/v1/io/parameter_store.hpp"
#include "chanloop/v1/io/data_exporter.hpp"
#include "chanloop/v1/parser/yaml_parser.hpp"
#include "chanloop/v1/pipeline.hpp"
