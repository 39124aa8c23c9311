#include "chanloop/v1/parser/yaml_parser.hpp"

#include "chanloop/v1/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace chanloop::v1::parser {

namespace {

constexpr const char* kSchemaId = "chanloop-v1";
constexpr const char* kDiagSyntax = "CHANLOOP_YAML_E_SYNTAX";
constexpr const char* kDiagSchema = "CHANLOOP_YAML_E_SCHEMA";
constexpr const char* kDiagMissingSchema = "CHANLOOP_YAML_W_SCHEMA_MISSING";
constexpr const char* kDiagUnknownField = "CHANLOOP_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagUnknownFieldWarning = "CHANLOOP_YAML_W_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "CHANLOOP_YAML_E_TYPE_MISMATCH";
constexpr const char* kDiagInvalidParameter = "CHANLOOP_YAML_E_PARAM_INVALID";
constexpr const char* kDiagFileOpen = "CHANLOOP_YAML_E_FILE_OPEN";

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(
        errors,
        kDiagTypeMismatch,
        "Type mismatch at '" + path + "' (expected " + expected +
            ", got " + yaml_node_class(received) + ")");
}

std::optional<std::string> scalar_text(const YAML::Node& node,
                                       const std::string& path,
                                       const std::string& expected,
                                       std::vector<std::string>& errors) {
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
    return node.Scalar();
}

std::optional<bool> parse_bool_scalar(const YAML::Node& node,
                                      const std::string& path,
                                      std::vector<std::string>& errors) {
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "boolean", node);
        return std::nullopt;
    }
    bool value = false;
    if (!YAML::convert<bool>::decode(node, value)) {
        push_type_mismatch_error(errors, path, "boolean", node);
        return std::nullopt;
    }
    return value;
}

class SectionReader {
public:
    SectionReader(const YAML::Node& root,
                  const std::string& name,
                  std::unordered_set<std::string> allowed,
                  bool strict,
                  std::vector<std::string>& errors,
                  std::vector<std::string>& warnings)
        : node_(root[name])
        , name_(name)
        , allowed_(std::move(allowed))
        , strict_(strict)
        , errors_(errors)
        , warnings_(warnings) {}

    /// False when the section is absent or not a map (mismatch is reported).
    bool valid() const {
        if (!node_ || node_.IsNull()) return false;
        if (!node_.IsMap()) {
            push_type_mismatch_error(errors_, name_, "map", node_);
            return false;
        }
        return true;
    }

    void check_keys() const {
        for (const auto& it : node_) {
            if (!it.first.IsScalar()) {
                push_type_mismatch_error(errors_, name_ + ".<key>", "scalar key", it.first);
                continue;
            }
            const std::string key = it.first.Scalar();
            if (allowed_.count(key) != 0) continue;
            const std::string message = "Unknown field at '" + name_ + "." + key + "'";
            if (strict_) {
                push_error(errors_, kDiagUnknownField, message);
            } else {
                push_warning(warnings_, kDiagUnknownFieldWarning, message);
            }
        }
    }

    YAML::Node get(const std::string& key) const { return node_[key]; }
    std::string path(const std::string& key) const { return name_ + "." + key; }

private:
    YAML::Node node_;
    std::string name_;
    std::unordered_set<std::string> allowed_;
    bool strict_;
    std::vector<std::string>& errors_;
    std::vector<std::string>& warnings_;
};

/// Route a section's scalar fields through the RunLog key table.
void read_parameter_section(const SectionReader& section,
                            const std::vector<std::string>& keys,
                            ModelParameters& params,
                            std::vector<std::string>& errors) {
    for (const auto& key : keys) {
        const YAML::Node value = section.get(key);
        if (!value) continue;

        const auto text = scalar_text(value, section.path(key), "scalar", errors);
        if (!text) continue;

        if (assign_parameter(params, key, *text) != AssignStatus::Assigned) {
            push_error(errors,
                       kDiagInvalidParameter,
                       "Invalid value '" + *text + "' at '" + section.path(key) + "'");
        }
    }
}

}  // namespace

YamlParser::YamlParser(YamlParserOptions options)
    : options_(options) {}

RunDefinition YamlParser::load(const std::filesystem::path& path, const RunDefinition& base) {
    errors_.clear();
    warnings_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        push_error(errors_, kDiagFileOpen, "Cannot open file: " + path.string());
        return base;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str(), base);
}

RunDefinition YamlParser::load_string(const std::string& content, const RunDefinition& base) {
    RunDefinition run = base;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, run);
    return run;
}

void YamlParser::parse_yaml(const std::string& content, RunDefinition& run) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        push_error(errors_, kDiagSyntax, std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        push_type_mismatch_error(errors_, "<root>", "map", root);
        return;
    }

    const std::unordered_set<std::string> top_level{
        "schema", "version", "material", "core", "excitation", "run", "output"};
    for (const auto& it : root) {
        if (!it.first.IsScalar()) {
            push_type_mismatch_error(errors_, "<root>.<key>", "scalar key", it.first);
            continue;
        }
        const std::string key = it.first.Scalar();
        if (top_level.count(key) != 0) continue;
        if (options_.strict) {
            push_error(errors_, kDiagUnknownField, "Unknown field at '" + key + "'");
        } else {
            push_warning(warnings_, kDiagUnknownFieldWarning, "Unknown field at '" + key + "'");
        }
    }

    if (const YAML::Node schema = root["schema"]) {
        const auto text = scalar_text(schema, "schema", "string", errors_);
        if (text && *text != kSchemaId) {
            push_error(errors_, kDiagSchema,
                       "Unsupported schema '" + *text + "' (expected '" + kSchemaId + "')");
            return;
        }
    } else {
        push_warning(warnings_, kDiagMissingSchema,
                     std::string("No 'schema' field; assuming ") + kSchemaId);
    }

    struct ParameterSection {
        const char* name;
        std::vector<std::string> keys;
    };
    const std::vector<ParameterSection> sections{
        {"material", {"bs", "br", "hc", "saturation_flux_density", "remanence", "coercive_field"}},
        {"core", {"gap_length", "path_length", "cross_section", "turns"}},
        {"excitation", {"shape", "amplitude", "frequency", "samples_per_cycle"}},
        {"run", {"cycles", "discard_cycles"}},
    };

    for (const auto& def : sections) {
        SectionReader section(root, def.name,
                              {def.keys.begin(), def.keys.end()},
                              options_.strict, errors_, warnings_);
        if (!section.valid()) continue;
        section.check_keys();
        read_parameter_section(section, def.keys, run.params, errors_);
    }

    SectionReader output(root, "output",
                         {"directory", "raw", "averaged", "branches", "summary",
                          "write_branches", "write_summary", "branch_points"},
                         options_.strict, errors_, warnings_);
    if (output.valid()) {
        output.check_keys();

        auto read_string = [&](const std::string& key, auto assign) {
            if (const YAML::Node node = output.get(key)) {
                if (auto text = scalar_text(node, output.path(key), "string", errors_)) {
                    assign(*text);
                }
            }
        };
        read_string("directory", [&](const std::string& v) { run.output.directory = v; });
        read_string("raw", [&](const std::string& v) { run.output.raw_file = v; });
        read_string("averaged", [&](const std::string& v) { run.output.averaged_file = v; });
        read_string("branches", [&](const std::string& v) { run.output.branches_file = v; });
        read_string("summary", [&](const std::string& v) { run.output.summary_file = v; });

        if (const YAML::Node node = output.get("write_branches")) {
            if (auto v = parse_bool_scalar(node, output.path("write_branches"), errors_)) {
                run.output.write_branches = *v;
            }
        }
        if (const YAML::Node node = output.get("write_summary")) {
            if (auto v = parse_bool_scalar(node, output.path("write_summary"), errors_)) {
                run.output.write_summary = *v;
            }
        }
        if (const YAML::Node node = output.get("branch_points")) {
            if (auto text = scalar_text(node, output.path("branch_points"), "integer", errors_)) {
                const auto points = parse_int(*text);
                if (!points || *points < 0) {
                    push_error(errors_, kDiagInvalidParameter,
                               "Invalid value '" + *text + "' at 'output.branch_points'");
                } else {
                    run.output.branch_points = *points;
                }
            }
        }
    }

    if (!errors_.empty()) {
        return;
    }
    try {
        validate_parameters(run.params);
    } catch (const InvalidParameterError& e) {
        push_error(errors_, kDiagInvalidParameter, e.what());
    }
}

}  // namespace chanloop::v1::parser
