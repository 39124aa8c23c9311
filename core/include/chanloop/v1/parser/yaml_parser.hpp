#pragma once

#include "chanloop/v1/io/data_exporter.hpp"
#include "chanloop/v1/parameters.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace chanloop::v1::parser {

struct YamlParserOptions {
    bool strict = true;              // Unknown fields are errors (warnings otherwise)
};

/// Parameters and output options of one scripted run.
struct RunDefinition {
    ModelParameters params;
    io::ExportOptions output;
};

/// Reads `schema: chanloop-v1` run files. Values override `base`, so a run
/// file only needs the fields that differ from the stored parameters.
class YamlParser {
public:
    explicit YamlParser(YamlParserOptions options = {});

    // Parse from file
    RunDefinition load(const std::filesystem::path& path, const RunDefinition& base = {});

    // Parse from string
    RunDefinition load_string(const std::string& content, const RunDefinition& base = {});

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    YamlParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, RunDefinition& run);
};

}  // namespace chanloop::v1::parser
