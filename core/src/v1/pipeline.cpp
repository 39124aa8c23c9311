#include "chanloop/v1/pipeline.hpp"

#include "chanloop/v1/waveform.hpp"

namespace chanloop::v1 {

PipelineResult compute_loop(const ModelParameters& params) {
    validate_parameters(params);

    PipelineResult result;
    const ExcitationWaveform waveform = make_excitation(params);
    result.samples = simulate(params, waveform);
    result.loop = average(result.samples, params.discard_cycles);
    result.metrics = compute_loop_metrics(result.loop, params);
    result.settling = cycle_to_cycle_change(result.samples);
    return result;
}

PipelineResult run_pipeline(const ModelParameters& params,
                            const io::ExportOptions& output,
                            io::ParameterStore* store) {
    PipelineResult result = compute_loop(params);

    io::DataExporter exporter(output);
    result.files = exporter.export_run(result.samples, result.loop, params, result.metrics);

    if (store != nullptr) {
        store->save(params);
        result.parameters_saved = true;
    }
    return result;
}

}  // namespace chanloop::v1
