#include "chanloop/v1/io/parameter_store.hpp"

#include "chanloop/v1/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace chanloop::v1::io {

namespace {

constexpr const char* kHeader = "# chanloop run log";
constexpr const char* kLegacyMarker = "Simulation parameters:";

/// Push the file's data to stable storage so a rename over the log never
/// publishes an empty file after a crash.
bool sync_to_disk(const std::filesystem::path& path) {
#ifndef _WIN32
    const int fd = ::open(path.c_str(), O_WRONLY);
    if (fd < 0) return false;
    const bool synced = ::fsync(fd) == 0;
    return (::close(fd) == 0) && synced;
#else
    (void)path;
    return true;
#endif
}

std::string strip(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

ParameterStore::ParameterStore(std::filesystem::path path)
    : path_(std::move(path)) {}

std::optional<ModelParameters> ParameterStore::load() {
    warnings_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw InvalidParameterError("Cannot open run log: " + path_.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::optional<ModelParameters> ParameterStore::parse(const std::string& content) {
    warnings_.clear();

    ModelParameters params;
    bool any_assigned = false;

    auto apply = [&](const std::string& key, const std::string& value, std::size_t line_no) {
        switch (assign_parameter(params, key, value)) {
            case AssignStatus::Assigned:
                any_assigned = true;
                break;
            case AssignStatus::UnknownKey:
                warnings_.push_back("line " + std::to_string(line_no) + ": ignoring unknown key '" +
                                    key + "'");
                break;
            case AssignStatus::BadValue:
                warnings_.push_back("line " + std::to_string(line_no) + ": bad value '" + value +
                                    "' for '" + key + "', keeping default");
                break;
        }
    };

    std::istringstream lines(content);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(lines, line)) {
        ++line_no;
        const std::string text = strip(line);
        if (text.empty() || text.front() == '#') continue;

        const auto legacy = text.find(kLegacyMarker);
        if (legacy != std::string::npos) {
            // Bs=1.5, Br=0.3, Hc=50.0, Hmax=100.0, N=200
            std::istringstream fields(text.substr(legacy + std::string(kLegacyMarker).size()));
            std::string field;
            while (std::getline(fields, field, ',')) {
                const auto eq = field.find('=');
                if (eq == std::string::npos) continue;
                apply(strip(field.substr(0, eq)), strip(field.substr(eq + 1)), line_no);
            }
            continue;
        }

        const auto eq = text.find('=');
        if (eq == std::string::npos) {
            warnings_.push_back("line " + std::to_string(line_no) + ": expected 'name = value'");
            continue;
        }
        apply(strip(text.substr(0, eq)), strip(text.substr(eq + 1)), line_no);
    }

    if (!any_assigned) {
        warnings_.push_back("run log contains no recognised parameters");
        return std::nullopt;
    }
    return params;
}

std::string ParameterStore::format(const ModelParameters& params) {
    std::ostringstream out;
    out << kHeader << "\n";
    for (const auto& [key, value] : to_key_values(params)) {
        out << key << " = " << value << "\n";
    }
    return out.str();
}

void ParameterStore::save(const ModelParameters& params) {
    std::filesystem::path tmp = path_;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw WriteError("Cannot write run log: " + tmp.string());
        }
        file << format(params);
        file.flush();
        if (!file) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw WriteError("Failed writing run log: " + tmp.string());
        }
    }

    if (!sync_to_disk(tmp)) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw WriteError("Cannot sync run log to disk: " + tmp.string());
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw WriteError("Cannot replace run log " + path_.string() + ": " + ec.message());
    }
}

std::filesystem::path default_run_log_path() {
    if (const char* env = std::getenv("CHANLOOP_RUN_LOG"); env != nullptr && *env != '\0') {
        return std::filesystem::path(env);
    }
    return std::filesystem::path("chanloop_run.log");
}

}  // namespace chanloop::v1::io
