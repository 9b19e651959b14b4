#pragma once

#include <map>
#include <vector>

#include "categorize/Models.hpp"
#include "categorize/Registry.hpp"

namespace categorize {

// Fuses signals into one decision.
//
// score(c)      = sum of contributions for c
// confidence(c) = clamp(score(c) / max_score, 0, 1)
//
// The best confidence wins; every category within tie_epsilon of it that
// also clears fallback_threshold is tied and the lowest priority rank among
// them is taken. A best confidence below fallback_threshold (or no evidence
// at all) becomes Other, confidence 0, fallback = true.
class ScoreAggregator {
public:
    explicit ScoreAggregator(const Registry& registry) : m_registry(registry) {}

    // reads result.signals, writes scores/category/confidence/fallback
    void decide(CategorizationResult& result) const;

    double confidence_of(double score) const;

    // up to n categories with confidence > 0, best first (priority breaks
    // exact ties); {Other, 0} when nothing qualifies
    std::vector<RankedCategory> rank(const std::map<Category, double>& scores, size_t n) const;

private:
    const Registry& m_registry;
};

}  // namespace categorize
