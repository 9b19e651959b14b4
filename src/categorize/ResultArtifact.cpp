#include "categorize/ResultArtifact.hpp"

#include <fstream>
#include <stdexcept>

#include "categorize/Registry.hpp"

namespace categorize {

static nlohmann::json signal_to_json(const MatchSignal& s) {
    return {
        {"category", to_string(s.category)},
        {"source", to_string(s.source)},
        {"matched", s.matched},
        {"term", s.term},
        {"similarity", s.similarity},
        {"base_weight", s.base_weight},
        {"contribution", s.contribution}
    };
}

ResultArtifact make_artifact(const Registry& registry,
                             CategorizationResult result,
                             std::vector<RankedCategory> top) {
    ResultArtifact a;
    a.registry_version = registry.version();
    a.max_score = registry.scoring().max_score;
    a.result = std::move(result);
    a.top = std::move(top);
    return a;
}

nlohmann::json ResultArtifact::to_json() const {
    nlohmann::json j;
    j["registry_version"] = registry_version;
    j["input"] = result.input;
    j["tokens"] = result.tokens;

    j["category"] = to_string(result.category);
    j["confidence"] = result.confidence;
    j["fallback"] = result.fallback;

    nlohmann::json scores = nlohmann::json::object();
    for (const auto& kv : result.scores) {
        scores[to_string(kv.first)] = kv.second;
    }
    j["scores"] = scores;
    j["max_score"] = max_score;

    nlohmann::json signals = nlohmann::json::array();
    for (const auto& s : result.signals) {
        signals.push_back(signal_to_json(s));
    }
    j["signals"] = signals;

    if (!top.empty()) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& r : top) {
            arr.push_back({{"category", to_string(r.category)}, {"confidence", r.confidence}});
        }
        j["top"] = arr;
    }

    return j;
}

void ResultArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace categorize
