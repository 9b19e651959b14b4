// include/categorize/ResultArtifact.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "categorize/Models.hpp"

namespace categorize {

class Registry;

// Explainability dump of one suggestion (what fired, what it was worth).
struct ResultArtifact {
    std::string registry_version;
    double max_score = 0.0;

    CategorizationResult result;
    std::vector<RankedCategory> top;    // optional top-N list

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

ResultArtifact make_artifact(const Registry& registry,
                             CategorizationResult result,
                             std::vector<RankedCategory> top = {});

}  // namespace categorize
