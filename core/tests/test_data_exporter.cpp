#include <catch2/catch_test_macros.hpp>

#include "chanloop/v1/averaging.hpp"
#include "chanloop/v1/errors.hpp"
#include "chanloop/v1/io/data_exporter.hpp"
#include "chanloop/v1/waveform.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace chanloop::v1;
namespace fs = std::filesystem;

namespace {

class ScopedTempDir {
public:
    ScopedTempDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() / ("chanloop_export_" + std::to_string(stamp));
        fs::create_directories(path_);
    }
    ~ScopedTempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

struct RunData {
    ModelParameters params;
    std::vector<LoopSample> samples;
    AveragedLoop loop;
    LoopMetrics metrics;
};

RunData make_run() {
    RunData run;
    run.params.samples_per_cycle = 40;
    run.params.num_cycles = 4;
    run.params.discard_cycles = 1;
    run.samples = simulate(run.params, make_excitation(run.params));
    run.loop = average(run.samples, run.params.discard_cycles);
    run.metrics = compute_loop_metrics(run.loop, run.params);
    return run;
}

}  // namespace

TEST_CASE("Export writes raw and averaged tables", "[export]") {
    ScopedTempDir dir;
    const RunData run = make_run();

    io::ExportOptions options;
    options.directory = dir.path();
    io::DataExporter exporter(options);
    const io::ExportReport report = exporter.export_loop(run.samples, run.loop);

    const auto raw = read_lines(report.raw);
    REQUIRE(raw.size() == run.samples.size() + 1);
    CHECK(raw.front() == "cycle_index,H,B");
    CHECK(raw[1].rfind("0,", 0) == 0);
    CHECK(raw.back().rfind("3,", 0) == 0);

    const auto averaged = read_lines(report.averaged);
    REQUIRE(averaged.size() == static_cast<std::size_t>(run.loop.size()) + 1);
    CHECK(averaged.front() == "H,B");
    // Closed: first data row repeated as last
    CHECK(averaged[1] == averaged.back());

    CHECK_FALSE(report.branches.has_value());
    CHECK_FALSE(report.summary.has_value());
}

TEST_CASE("Export run adds branch table and summary", "[export]") {
    ScopedTempDir dir;
    const RunData run = make_run();

    io::ExportOptions options;
    options.directory = dir.path() / "nested" / "out";
    options.branch_points = 11;
    io::DataExporter exporter(options);
    const io::ExportReport report = exporter.export_run(run.samples, run.loop, run.params, run.metrics);

    REQUIRE(report.branches.has_value());
    const auto branches = read_lines(*report.branches);
    REQUIRE(branches.size() == 12);
    CHECK(branches.front() == "H,B_upper,B_lower,B_middle");

    REQUIRE(report.summary.has_value());
    const auto summary = read_lines(*report.summary);
    bool has_params = false;
    bool has_ltspice = false;
    for (const auto& line : summary) {
        if (line == "coercive_field = 50") has_params = true;
        if (line.rfind("L1 N001 N002 Hc=50 Br=0.3 Bs=1.5", 0) == 0) has_ltspice = true;
    }
    CHECK(has_params);
    CHECK(has_ltspice);
}

TEST_CASE("Export skips optional tables when disabled", "[export]") {
    ScopedTempDir dir;
    const RunData run = make_run();

    io::ExportOptions options;
    options.directory = dir.path();
    options.write_branches = false;
    options.write_summary = false;
    io::DataExporter exporter(options);
    const io::ExportReport report = exporter.export_run(run.samples, run.loop, run.params, run.metrics);

    CHECK_FALSE(report.branches.has_value());
    CHECK_FALSE(report.summary.has_value());
    CHECK_FALSE(fs::exists(dir.path() / options.branches_file));
}

TEST_CASE("Export to an unwritable destination raises WriteError", "[export][errors]") {
    ScopedTempDir dir;
    const RunData run = make_run();

    // A regular file where the output directory should be
    const fs::path blocker = dir.path() / "blocker";
    std::ofstream(blocker) << "x";

    io::ExportOptions options;
    options.directory = blocker / "out";
    io::DataExporter exporter(options);
    CHECK_THROWS_AS(exporter.export_loop(run.samples, run.loop), WriteError);

    CHECK_THROWS_AS(io::DataExporter::write_raw(blocker / "raw.csv", run.samples), WriteError);
}

TEST_CASE("LTspice inductor line carries the Chan constants", "[export][ltspice]") {
    ModelParameters params;
    params.gap_length = 1e-3;
    params.turns = 25;
    const std::string line = io::ltspice_inductor_line(params, "Lcore");
    CHECK(line == "Lcore N001 N002 Hc=50 Br=0.3 Bs=1.5 A=0.0001 Lm=0.1 Lg=0.001 N=25");
}
