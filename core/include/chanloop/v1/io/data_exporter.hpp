#pragma once

#include "chanloop/v1/averaging.hpp"
#include "chanloop/v1/branch_table.hpp"
#include "chanloop/v1/loop_metrics.hpp"
#include "chanloop/v1/parameters.hpp"
#include "chanloop/v1/simulation.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chanloop::v1::io {

struct ExportOptions {
    std::filesystem::path directory = ".";
    std::string raw_file = "bh_loop_raw.csv";
    std::string averaged_file = "bh_loop_averaged.csv";
    std::string branches_file = "bh_loop_branches.csv";
    std::string summary_file = "run_summary.txt";
    bool write_branches = true;
    bool write_summary = true;
    int branch_points = 0;   // 0 = samples_per_cycle
};

/// Files actually written by one export.
struct ExportReport {
    std::filesystem::path raw;
    std::filesystem::path averaged;
    std::optional<std::filesystem::path> branches;
    std::optional<std::filesystem::path> summary;
};

/// Writes loop data as comma-separated tables. Any file that cannot be
/// opened or written raises WriteError; files already written stay on disk.
class DataExporter {
public:
    explicit DataExporter(ExportOptions options = {});

    /// Raw samples and the averaged loop, always.
    ExportReport export_loop(const std::vector<LoopSample>& samples, const AveragedLoop& loop);

    /// export_loop plus the branch table and summary when enabled.
    ExportReport export_run(const std::vector<LoopSample>& samples,
                            const AveragedLoop& loop,
                            const ModelParameters& params,
                            const LoopMetrics& metrics);

    static void write_raw(const std::filesystem::path& path, const std::vector<LoopSample>& samples);
    static void write_averaged(const std::filesystem::path& path, const AveragedLoop& loop);
    static void write_branches(const std::filesystem::path& path, const BranchTable& table);
    static void write_summary(const std::filesystem::path& path,
                              const ModelParameters& params,
                              const LoopMetrics& metrics);

    [[nodiscard]] const ExportOptions& options() const { return options_; }

private:
    void ensure_directory() const;

    ExportOptions options_;
};

/// LTspice inductor instance using its built-in Chan core model.
[[nodiscard]] std::string ltspice_inductor_line(const ModelParameters& params,
                                                const std::string& name = "L1");

}  // namespace chanloop::v1::io
