#include <CLI/CLI.hpp>
#include <chanloop/v1/core.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>

using namespace chanloop::v1;

// Sentinel values to detect if CLI option was explicitly provided
constexpr double CLI_SENTINEL = -1e99;
constexpr int CLI_SENTINEL_INT = -1;

struct ParameterOverrides {
    double bs = CLI_SENTINEL;
    double br = CLI_SENTINEL;
    double hc = CLI_SENTINEL;
    double hmax = CLI_SENTINEL;
    double frequency = CLI_SENTINEL;
    double gap = CLI_SENTINEL;
    double path_length = CLI_SENTINEL;
    double area = CLI_SENTINEL;
    int samples = CLI_SENTINEL_INT;
    int cycles = CLI_SENTINEL_INT;
    int discard = CLI_SENTINEL_INT;
    int turns = CLI_SENTINEL_INT;
    std::string shape;
};

void apply_overrides(const ParameterOverrides& o, ModelParameters& p) {
    if (o.bs != CLI_SENTINEL) p.saturation_flux_density = o.bs;
    if (o.br != CLI_SENTINEL) p.remanence = o.br;
    if (o.hc != CLI_SENTINEL) p.coercive_field = o.hc;
    if (o.hmax != CLI_SENTINEL) p.field_amplitude = o.hmax;
    if (o.frequency != CLI_SENTINEL) p.frequency = o.frequency;
    if (o.gap != CLI_SENTINEL) p.gap_length = o.gap;
    if (o.path_length != CLI_SENTINEL) p.path_length = o.path_length;
    if (o.area != CLI_SENTINEL) p.cross_section = o.area;
    if (o.samples != CLI_SENTINEL_INT) p.samples_per_cycle = o.samples;
    if (o.cycles != CLI_SENTINEL_INT) p.num_cycles = o.cycles;
    if (o.discard != CLI_SENTINEL_INT) p.discard_cycles = o.discard;
    if (o.turns != CLI_SENTINEL_INT) p.turns = o.turns;
    if (!o.shape.empty()) {
        const auto shape = parse_waveform_shape(o.shape);
        if (!shape) {
            throw InvalidParameterError("unknown waveform shape '" + o.shape + "'");
        }
        p.waveform = *shape;
    }
}

void print_parameters(std::ostream& out, const ModelParameters& params) {
    for (const auto& [key, value] : to_key_values(params)) {
        out << "  " << std::left << std::setw(24) << key << value << std::endl;
    }
}

void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        std::cerr << "Warning: " << w << std::endl;
    }
}

/// Stored parameters, or the built-in defaults on a first run.
ModelParameters load_stored(io::ParameterStore& store, bool quiet) {
    const auto stored = store.load();
    if (!quiet) print_warnings(store.warnings());
    if (stored) {
        if (!quiet) {
            std::cerr << "Loaded parameters from: " << store.path().string() << std::endl;
        }
        return *stored;
    }
    if (!quiet) {
        std::cerr << "No run log at " << store.path().string() << ", using defaults" << std::endl;
    }
    return ModelParameters{};
}

int cmd_run(const std::string& run_file, const std::string& output_dir,
            const std::string& log_file, const ParameterOverrides& overrides,
            bool no_save, bool verbose, bool quiet) {
    try {
        io::ParameterStore store(log_file.empty() ? io::default_run_log_path()
                                                  : std::filesystem::path(log_file));

        parser::RunDefinition run;
        run.params = load_stored(store, quiet);

        if (!run_file.empty()) {
            if (!quiet) {
                std::cerr << "Reading run file: " << run_file << std::endl;
            }
            parser::YamlParser parser;
            run = parser.load(run_file, run);
            if (!quiet) print_warnings(parser.warnings());
            if (!parser.errors().empty()) {
                for (const auto& err : parser.errors()) {
                    std::cerr << "Error: " << err << std::endl;
                }
                return 1;
            }
        }

        apply_overrides(overrides, run.params);
        if (!output_dir.empty()) {
            run.output.directory = output_dir;
        }
        validate_parameters(run.params);

        if (verbose) {
            std::cerr << "Parameters:" << std::endl;
            print_parameters(std::cerr, run.params);
            std::cerr << "  core: " << (run.params.gapped() ? "gapped" : "ungapped") << std::endl;
        }

        if (!quiet) {
            std::cerr << "Simulating " << run.params.num_cycles << " cycles x "
                      << run.params.samples_per_cycle << " samples..." << std::endl;
        }

        const PipelineResult result = run_pipeline(run.params, run.output,
                                                   no_save ? nullptr : &store);

        if (!quiet) {
            std::cerr << "Simulation completed:" << std::endl;
            std::cerr << "  Cycles averaged: " << result.loop.cycles_used
                      << " (discarded " << result.loop.cycles_discarded << ")" << std::endl;
            std::cerr << std::scientific << std::setprecision(4);
            std::cerr << "  Cycle-to-cycle change: " << result.settling << " T" << std::endl;
            std::cerr << "  Peak B: " << result.metrics.peak_flux_density << " T" << std::endl;
            std::cerr << "  Remanence: " << result.metrics.remanence << " T" << std::endl;
            std::cerr << "  Coercivity: " << result.metrics.coercivity << " A/m" << std::endl;
            std::cerr << "  Loss density: " << result.metrics.loss_density << " W/m^3" << std::endl;
            std::cerr << "  Core loss: " << result.metrics.core_loss << " W" << std::endl;
            std::cerr << std::defaultfloat;
            std::cerr << "Wrote: " << result.files.raw.string() << std::endl;
            std::cerr << "Wrote: " << result.files.averaged.string() << std::endl;
            if (result.files.branches) {
                std::cerr << "Wrote: " << result.files.branches->string() << std::endl;
            }
            if (result.files.summary) {
                std::cerr << "Wrote: " << result.files.summary->string() << std::endl;
            }
            if (result.parameters_saved) {
                std::cerr << "Saved parameters to: " << store.path().string() << std::endl;
            }
        }

        return 0;

    } catch (const InvalidParameterError& e) {
        std::cerr << "Invalid parameter: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_show(const std::string& log_file) {
    try {
        io::ParameterStore store(log_file.empty() ? io::default_run_log_path()
                                                  : std::filesystem::path(log_file));
        const auto stored = store.load();
        print_warnings(store.warnings());
        if (!stored) {
            std::cout << "No stored parameters at " << store.path().string() << std::endl;
            return 0;
        }

        std::cout << "Run log: " << store.path().string() << std::endl;
        print_parameters(std::cout, *stored);
        std::cout << "\nLTspice: " << io::ltspice_inductor_line(*stored) << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_branches(const std::string& output_file, const std::string& log_file,
                 const ParameterOverrides& overrides, int points, bool quiet) {
    try {
        io::ParameterStore store(log_file.empty() ? io::default_run_log_path()
                                                  : std::filesystem::path(log_file));
        ModelParameters params = load_stored(store, quiet);
        apply_overrides(overrides, params);

        const BranchTable table =
            evaluate_branches(params, points > 0 ? points : params.samples_per_cycle);

        if (!output_file.empty()) {
            io::DataExporter::write_branches(output_file, table);
            if (!quiet) {
                std::cerr << "Wrote: " << output_file << std::endl;
            }
        } else {
            // Write to stdout
            io::DataExporter::write_branches("/dev/stdout", table);
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

void add_parameter_options(CLI::App* cmd, ParameterOverrides& o) {
    cmd->add_option("--bs", o.bs, "Saturation flux density Bs [T]");
    cmd->add_option("--br", o.br, "Remanence Br [T]");
    cmd->add_option("--hc", o.hc, "Coercive field Hc [A/m]");
    cmd->add_option("--hmax", o.hmax, "Excitation amplitude Hmax [A/m]");
    cmd->add_option("--freq", o.frequency, "Excitation frequency [Hz]");
    cmd->add_option("--shape", o.shape, "Waveform shape (sine, triangle)");
    cmd->add_option("--samples", o.samples, "Samples per cycle");
    cmd->add_option("--cycles", o.cycles, "Number of simulated cycles");
    cmd->add_option("--discard", o.discard, "Transient cycles to discard before averaging");
    cmd->add_option("--gap", o.gap, "Air gap length [m] (0 = ungapped)");
    cmd->add_option("--path-length", o.path_length, "Mean magnetic path length [m]");
    cmd->add_option("--area", o.area, "Core cross-section [m^2]");
    cmd->add_option("--turns", o.turns, "Number of turns");
}

int main(int argc, char** argv) {
    CLI::App app{"ChanLoop - B-H loop generator using Chan's hysteresis model"};
    app.set_version_flag("-V,--version", "ChanLoop 0.1.0");

    // Global options
    bool verbose = false;
    bool quiet = false;
    std::string log_file;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");
    app.add_option("--log", log_file, "Run log file (default: $CHANLOOP_RUN_LOG or ./chanloop_run.log)");

    // Run command
    auto* run_cmd = app.add_subcommand("run", "Simulate, average and export a B-H loop");
    std::string run_file;
    std::string output_dir;
    bool no_save = false;
    ParameterOverrides run_overrides;
    run_cmd->add_option("runfile", run_file, "Run definition (YAML)")
        ->check(CLI::ExistingFile);
    run_cmd->add_option("-o,--output", output_dir, "Output directory");
    run_cmd->add_flag("--no-save", no_save, "Do not update the run log");
    add_parameter_options(run_cmd, run_overrides);
    run_cmd->callback([&]() {
        std::exit(cmd_run(run_file, output_dir, log_file, run_overrides, no_save, verbose, quiet));
    });

    // Show command
    auto* show_cmd = app.add_subcommand("show", "Print the stored parameters");
    show_cmd->callback([&]() {
        std::exit(cmd_show(log_file));
    });

    // Branches command
    auto* branches_cmd = app.add_subcommand("branches", "Export the static upper/lower/middle branches");
    std::string branches_file;
    int points = 0;
    ParameterOverrides branch_overrides;
    branches_cmd->add_option("-o,--output", branches_file, "Output file (CSV)");
    branches_cmd->add_option("--points", points, "Number of field points (default: samples per cycle)");
    add_parameter_options(branches_cmd, branch_overrides);
    branches_cmd->callback([&]() {
        std::exit(cmd_branches(branches_file, log_file, branch_overrides, points, quiet));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
