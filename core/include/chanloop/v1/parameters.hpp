#pragma once

// =============================================================================
// ChanLoop - Model Parameters
// =============================================================================
// Material, core geometry and excitation descriptors for one run. Field names
// double as RunLog keys (see parameter_keys()).
// =============================================================================

#include "chanloop/v1/numeric_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chanloop::v1 {

enum class WaveformShape {
    Sine,      // H = Hmax * sin(2*pi*f*t)
    Triangle   // Piecewise linear, same zero crossings and peaks as Sine
};

[[nodiscard]] std::string_view to_string(WaveformShape shape);
[[nodiscard]] std::optional<WaveformShape> parse_waveform_shape(std::string_view text);

struct ModelParameters {
    // Material (Chan model constants)
    Real saturation_flux_density = 1.5;   // Bs [T]
    Real remanence = 0.3;                 // Br [T]
    Real coercive_field = 50.0;           // Hc [A/m]

    // Excitation
    Real field_amplitude = 100.0;         // Hmax [A/m]
    Real frequency = 50.0;                // [Hz]
    WaveformShape waveform = WaveformShape::Sine;
    int samples_per_cycle = 200;

    // Run control
    int num_cycles = 10;
    int discard_cycles = 8;

    // Core geometry
    Real gap_length = 0.0;                // [m], 0 = ungapped
    Real path_length = 0.1;               // Mean magnetic path [m]
    Real cross_section = 1e-4;            // [m^2]
    int turns = 100;

    [[nodiscard]] bool gapped() const { return gap_length > 0.0; }
    [[nodiscard]] Real period() const { return 1.0 / frequency; }

    bool operator==(const ModelParameters&) const = default;
};

/// Throws InvalidParameterError naming the first violated constraint.
void validate_parameters(const ModelParameters& params);

/// Canonical RunLog keys, in the order they are written.
[[nodiscard]] const std::vector<std::string>& parameter_keys();

/// Serialise every field as (key, text) with round-trip precision.
[[nodiscard]] std::vector<std::pair<std::string, std::string>>
to_key_values(const ModelParameters& params);

enum class AssignStatus {
    Assigned,
    UnknownKey,
    BadValue
};

/// Assign one field by key. Keys are matched ignoring case and punctuation;
/// short aliases used by legacy run logs (Bs, Br, Hc, Hmax, N) are accepted.
AssignStatus assign_parameter(ModelParameters& params,
                              std::string_view key,
                              std::string_view value);

/// Lower-case alphanumerics only ("Gap-Length" -> "gaplength").
[[nodiscard]] std::string normalize_key(std::string_view key);

/// Parse a real with an optional SPICE-style scale suffix (k, m, u, n, meg...).
[[nodiscard]] std::optional<Real> parse_real(std::string_view text);
[[nodiscard]] std::optional<int> parse_int(std::string_view text);

}  // namespace chanloop::v1
