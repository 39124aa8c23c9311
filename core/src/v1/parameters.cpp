#include "chanloop/v1/parameters.hpp"

#include "chanloop/v1/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace chanloop::v1 {

namespace {

std::string trim(std::string_view text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && is_space(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

std::string format_real(Real value) {
    std::ostringstream out;
    out.precision(std::numeric_limits<Real>::max_digits10);
    out << value;
    return out.str();
}

bool set_real(Real& field, std::string_view value) {
    const auto parsed = parse_real(value);
    if (!parsed) return false;
    field = *parsed;
    return true;
}

bool set_int(int& field, std::string_view value) {
    const auto parsed = parse_int(value);
    if (!parsed) return false;
    field = *parsed;
    return true;
}

struct FieldBinding {
    const char* key;
    std::array<const char*, 3> aliases;
    bool (*assign)(ModelParameters&, std::string_view);
    std::string (*format)(const ModelParameters&);
};

// Keep in sync with ModelParameters. Aliases are compared after normalize_key().
const std::array<FieldBinding, 13> kBindings{{
    {"saturation_flux_density", {"bs", "bsat", nullptr},
     [](ModelParameters& p, std::string_view v) { return set_real(p.saturation_flux_density, v); },
     [](const ModelParameters& p) { return format_real(p.saturation_flux_density); }},
    {"remanence", {"br", "bremanent", nullptr},
     [](ModelParameters& p, std::string_view v) { return set_real(p.remanence, v); },
     [](const ModelParameters& p) { return format_real(p.remanence); }},
    {"coercive_field", {"hc", "coercivity", nullptr},
     [](ModelParameters& p, std::string_view v) { return set_real(p.coercive_field, v); },
     [](const ModelParameters& p) { return format_real(p.coercive_field); }},
    {"field_amplitude", {"hmax", "amplitude", nullptr},
     [](ModelParameters& p, std::string_view v) { return set_real(p.field_amplitude, v); },
     [](const ModelParameters& p) { return format_real(p.field_amplitude); }},
    {"frequency", {"f", "freq", nullptr},
     [](ModelParameters& p, std::string_view v) { return set_real(p.frequency, v); },
     [](const ModelParameters& p) { return format_real(p.frequency); }},
    {"waveform", {"shape", nullptr, nullptr},
     [](ModelParameters& p, std::string_view v) {
         const auto shape = parse_waveform_shape(trim(v));
         if (!shape) return false;
         p.waveform = *shape;
         return true;
     },
     [](const ModelParameters& p) { return std::string(to_string(p.waveform)); }},
    {"samples_per_cycle", {"n", "samples", "points"},
     [](ModelParameters& p, std::string_view v) { return set_int(p.samples_per_cycle, v); },
     [](const ModelParameters& p) { return std::to_string(p.samples_per_cycle); }},
    {"num_cycles", {"cycles", nullptr, nullptr},
     [](ModelParameters& p, std::string_view v) { return set_int(p.num_cycles, v); },
     [](const ModelParameters& p) { return std::to_string(p.num_cycles); }},
    {"discard_cycles", {"discard", nullptr, nullptr},
     [](ModelParameters& p, std::string_view v) { return set_int(p.discard_cycles, v); },
     [](const ModelParameters& p) { return std::to_string(p.discard_cycles); }},
    {"gap_length", {"lg", "gap", nullptr},
     [](ModelParameters& p, std::string_view v) { return set_real(p.gap_length, v); },
     [](const ModelParameters& p) { return format_real(p.gap_length); }},
    {"path_length", {"lm", "path", nullptr},
     [](ModelParameters& p, std::string_view v) { return set_real(p.path_length, v); },
     [](const ModelParameters& p) { return format_real(p.path_length); }},
    {"cross_section", {"a", "area", nullptr},
     [](ModelParameters& p, std::string_view v) { return set_real(p.cross_section, v); },
     [](const ModelParameters& p) { return format_real(p.cross_section); }},
    {"turns", {"nturns", nullptr, nullptr},
     [](ModelParameters& p, std::string_view v) { return set_int(p.turns, v); },
     [](const ModelParameters& p) { return std::to_string(p.turns); }},
}};

const FieldBinding* find_binding(std::string_view key) {
    const std::string wanted = normalize_key(key);
    if (wanted.empty()) return nullptr;
    for (const auto& binding : kBindings) {
        if (normalize_key(binding.key) == wanted) return &binding;
        for (const char* alias : binding.aliases) {
            if (alias != nullptr && wanted == alias) return &binding;
        }
    }
    return nullptr;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw InvalidParameterError(message);
    }
}

}  // namespace

std::string_view to_string(WaveformShape shape) {
    switch (shape) {
        case WaveformShape::Sine: return "sine";
        case WaveformShape::Triangle: return "triangle";
    }
    return "sine";
}

std::optional<WaveformShape> parse_waveform_shape(std::string_view text) {
    const std::string key = normalize_key(text);
    if (key == "sine" || key == "sin" || key == "sinusoidal") return WaveformShape::Sine;
    if (key == "triangle" || key == "tri") return WaveformShape::Triangle;
    return std::nullopt;
}

std::string normalize_key(std::string_view key) {
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

std::optional<Real> parse_real(std::string_view text) {
    const std::string raw = trim(text);
    if (raw.empty()) return std::nullopt;

    char* end = nullptr;
    const double base = std::strtod(raw.c_str(), &end);
    if (end == raw.c_str()) return std::nullopt;

    const std::string suffix = trim(std::string_view(end));
    if (suffix.empty()) {
        if (!std::isfinite(base)) return std::nullopt;
        return base;
    }

    double multiplier = 0.0;
    if (suffix == "M") {
        multiplier = 1e6;
    } else {
        const std::string lower = normalize_key(suffix);
        if (lower == "t") multiplier = 1e12;
        else if (lower == "g") multiplier = 1e9;
        else if (lower == "meg") multiplier = 1e6;
        else if (lower == "k") multiplier = 1e3;
        else if (lower == "m") multiplier = 1e-3;
        else if (lower == "u") multiplier = 1e-6;
        else if (lower == "n") multiplier = 1e-9;
        else if (lower == "p") multiplier = 1e-12;
    }
    if (multiplier == 0.0) return std::nullopt;

    const Real value = base * multiplier;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

std::optional<int> parse_int(std::string_view text) {
    const std::string raw = trim(text);
    if (raw.empty()) return std::nullopt;

    int value = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    if (*first == '+') ++first;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        // Legacy logs may write N as a float ("N=200.0").
        const auto real = parse_real(raw);
        if (!real || std::floor(*real) != *real ||
            std::abs(*real) > static_cast<Real>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(*real);
    }
    return value;
}

void validate_parameters(const ModelParameters& p) {
    auto finite = [](Real v) { return std::isfinite(v); };

    require(finite(p.saturation_flux_density) && p.saturation_flux_density > 0.0,
            "saturation_flux_density must be a positive finite value");
    require(finite(p.remanence) && p.remanence > 0.0,
            "remanence must be a positive finite value");
    require(p.saturation_flux_density > p.remanence,
            "saturation_flux_density must exceed remanence (Bs=" +
                format_real(p.saturation_flux_density) + ", Br=" + format_real(p.remanence) + ")");
    require(finite(p.coercive_field) && p.coercive_field > 0.0,
            "coercive_field must be a positive finite value");
    require(finite(p.field_amplitude) && p.field_amplitude > 0.0,
            "field_amplitude must be a positive finite value");
    require(finite(p.frequency) && p.frequency > 0.0,
            "frequency must be a positive finite value");
    require(p.samples_per_cycle >= 4, "samples_per_cycle must be at least 4");
    require(p.num_cycles >= 1, "num_cycles must be at least 1");
    require(p.discard_cycles >= 0, "discard_cycles must not be negative");
    require(finite(p.gap_length) && p.gap_length >= 0.0,
            "gap_length must be a non-negative finite value (got " + format_real(p.gap_length) + ")");
    require(finite(p.path_length) && p.path_length > 0.0,
            "path_length must be a positive finite value");
    require(finite(p.cross_section) && p.cross_section > 0.0,
            "cross_section must be a positive finite value");
    require(p.turns >= 1, "turns must be at least 1");
}

const std::vector<std::string>& parameter_keys() {
    static const std::vector<std::string> keys = [] {
        std::vector<std::string> out;
        out.reserve(kBindings.size());
        for (const auto& binding : kBindings) out.emplace_back(binding.key);
        return out;
    }();
    return keys;
}

std::vector<std::pair<std::string, std::string>> to_key_values(const ModelParameters& params) {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(kBindings.size());
    for (const auto& binding : kBindings) {
        out.emplace_back(binding.key, binding.format(params));
    }
    return out;
}

AssignStatus assign_parameter(ModelParameters& params,
                              std::string_view key,
                              std::string_view value) {
    const FieldBinding* binding = find_binding(key);
    if (binding == nullptr) return AssignStatus::UnknownKey;
    return binding->assign(params, value) ? AssignStatus::Assigned : AssignStatus::BadValue;
}

}  // namespace chanloop::v1
