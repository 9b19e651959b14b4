#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace registrycheck {

struct ValidationError {
    std::string code;
    std::string message;
};

struct ValidationReport {
    bool pass = true;
    std::string version;       // registry version when it loaded
    size_t num_categories = 0;
    size_t num_examples = 0;
    std::vector<ValidationError> errors;
};

// Loads the registry and, when it loads, replays its optional "examples"
// list ({"text": ..., "expect": "<category id>"}) through the service.
// Never throws for a bad registry; every problem lands in the report.
ValidationReport validate_registry(const std::string& registry_path);

void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}
