#pragma once

#include "chanloop/v1/parameters.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chanloop::v1::io {

/// Persists the last-used ModelParameters as `name = value` text.
///
/// Unknown keys are ignored and missing keys keep their defaults, so logs
/// written by older or newer versions still load. The "Simulation parameters:
/// Bs=..., Br=..., Hc=..., Hmax=..., N=..." line written by the legacy
/// loop tool is understood as well.
class ParameterStore {
public:
    explicit ParameterStore(std::filesystem::path path);

    /// Empty when no log exists yet. Throws InvalidParameterError if the
    /// file exists but cannot be read.
    [[nodiscard]] std::optional<ModelParameters> load();

    /// Write to `<path>.tmp`, then rename over the log. Throws WriteError;
    /// the previous log is left untouched on failure.
    void save(const ModelParameters& params);

    [[nodiscard]] std::optional<ModelParameters> parse(const std::string& content);

    [[nodiscard]] static std::string format(const ModelParameters& params);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }

private:
    std::filesystem::path path_;
    std::vector<std::string> warnings_;
};

/// Default RunLog location: $CHANLOOP_RUN_LOG, else ./chanloop_run.log
[[nodiscard]] std::filesystem::path default_run_log_path();

}  // namespace chanloop::v1::io
