#include "chanloop/v1/io/data_exporter.hpp"

#include "chanloop/v1/errors.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace chanloop::v1::io {

namespace {

std::ofstream open_for_write(const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw WriteError("Cannot open output file: " + path.string());
    }
    file << std::scientific << std::setprecision(9);
    return file;
}

void finish(std::ofstream& file, const std::filesystem::path& path) {
    file.flush();
    if (!file) {
        throw WriteError("Failed writing output file: " + path.string());
    }
}

}  // namespace

DataExporter::DataExporter(ExportOptions options)
    : options_(std::move(options)) {}

void DataExporter::ensure_directory() const {
    std::error_code ec;
    if (std::filesystem::is_directory(options_.directory, ec)) return;
    std::filesystem::create_directories(options_.directory, ec);
    if (ec) {
        throw WriteError("Cannot create output directory " + options_.directory.string() + ": " +
                         ec.message());
    }
}

void DataExporter::write_raw(const std::filesystem::path& path,
                             const std::vector<LoopSample>& samples) {
    auto file = open_for_write(path);
    file << "cycle_index,H,B\n";
    for (const auto& s : samples) {
        file << s.cycle << "," << s.h << "," << s.b << "\n";
    }
    finish(file, path);
}

void DataExporter::write_averaged(const std::filesystem::path& path, const AveragedLoop& loop) {
    auto file = open_for_write(path);
    file << "H,B\n";
    for (Index i = 0; i < loop.size(); ++i) {
        file << loop.h[i] << "," << loop.b[i] << "\n";
    }
    finish(file, path);
}

void DataExporter::write_branches(const std::filesystem::path& path, const BranchTable& table) {
    auto file = open_for_write(path);
    file << "H,B_upper,B_lower,B_middle\n";
    for (Index i = 0; i < table.size(); ++i) {
        file << table.h[i] << "," << table.upper[i] << "," << table.lower[i] << ","
             << table.middle[i] << "\n";
    }
    finish(file, path);
}

void DataExporter::write_summary(const std::filesystem::path& path,
                                 const ModelParameters& params,
                                 const LoopMetrics& metrics) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw WriteError("Cannot open output file: " + path.string());
    }

    file << "# Chan model run summary\n\n[parameters]\n";
    for (const auto& [key, value] : to_key_values(params)) {
        file << key << " = " << value << "\n";
    }

    file << "\n[loop]\n" << std::setprecision(6);
    file << "peak_field_A_per_m = " << metrics.peak_field << "\n";
    file << "peak_flux_density_T = " << metrics.peak_flux_density << "\n";
    file << "remanence_T = " << metrics.remanence << "\n";
    file << "coercivity_A_per_m = " << metrics.coercivity << "\n";
    file << "energy_density_J_per_m3 = " << metrics.energy_density << "\n";
    file << "loss_density_W_per_m3 = " << metrics.loss_density << "\n";
    file << "core_volume_m3 = " << metrics.core_volume << "\n";
    file << "core_loss_W = " << metrics.core_loss << "\n";
    file << "peak_current_A = " << metrics.peak_current << "\n";
    file << "peak_flux_linkage_Wb = " << metrics.peak_flux_linkage << "\n";
    file << "amplitude_permeability = " << metrics.amplitude_permeability << "\n";

    file << "\n[ltspice]\n" << ltspice_inductor_line(params) << "\n";
    finish(file, path);
}

ExportReport DataExporter::export_loop(const std::vector<LoopSample>& samples,
                                       const AveragedLoop& loop) {
    ensure_directory();

    ExportReport report;
    report.raw = options_.directory / options_.raw_file;
    report.averaged = options_.directory / options_.averaged_file;
    write_raw(report.raw, samples);
    write_averaged(report.averaged, loop);
    return report;
}

ExportReport DataExporter::export_run(const std::vector<LoopSample>& samples,
                                      const AveragedLoop& loop,
                                      const ModelParameters& params,
                                      const LoopMetrics& metrics) {
    ExportReport report = export_loop(samples, loop);

    if (options_.write_branches) {
        const int points = options_.branch_points > 0 ? options_.branch_points
                                                      : params.samples_per_cycle;
        const auto path = options_.directory / options_.branches_file;
        write_branches(path, evaluate_branches(params, points));
        report.branches = path;
    }
    if (options_.write_summary) {
        const auto path = options_.directory / options_.summary_file;
        write_summary(path, params, metrics);
        report.summary = path;
    }
    return report;
}

std::string ltspice_inductor_line(const ModelParameters& params, const std::string& name) {
    std::ostringstream out;
    out << std::setprecision(9);
    out << name << " N001 N002"
        << " Hc=" << params.coercive_field
        << " Br=" << params.remanence
        << " Bs=" << params.saturation_flux_density
        << " A=" << params.cross_section
        << " Lm=" << params.path_length
        << " Lg=" << params.gap_length
        << " N=" << params.turns;
    return out.str();
}

}  // namespace chanloop::v1::io
