#include "categorize/ScoreAggregator.hpp"

#include <algorithm>

namespace categorize {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

double ScoreAggregator::confidence_of(double score) const {
    return clamp01(score / m_registry.scoring().max_score);
}

void ScoreAggregator::decide(CategorizationResult& result) const {
    const ScoringConfig& cfg = m_registry.scoring();

    result.scores.clear();
    for (const auto& d : m_registry.definitions()) result.scores[d.id] = 0.0;

    for (const auto& s : result.signals) {
        auto it = result.scores.find(s.category);
        if (it == result.scores.end()) continue;
        if (s.contribution > 0.0) it->second += s.contribution;
    }

    double best = 0.0;
    for (const auto& kv : result.scores) best = std::max(best, confidence_of(kv.second));

    auto fall_back = [&result]() {
        result.category = Category::Other;
        result.confidence = 0.0;
        result.fallback = true;
    };

    if (best <= 0.0 || best < cfg.fallback_threshold) {
        fall_back();
        return;
    }

    // tie-break on the declared priority rank, never on map/hash order;
    // a tied category under the threshold cannot take the win from best
    const double cutoff = std::max(best - cfg.tie_epsilon, cfg.fallback_threshold);
    bool have_winner = false;
    Category winner = Category::Other;
    double winner_conf = 0.0;
    for (const auto& kv : result.scores) {
        const double conf = confidence_of(kv.second);
        if (conf <= 0.0 || conf < cutoff) continue;
        if (!have_winner || m_registry.priority(kv.first) < m_registry.priority(winner)) {
            have_winner = true;
            winner = kv.first;
            winner_conf = conf;
        }
    }

    if (!have_winner) {
        fall_back();
        return;
    }

    result.category = winner;
    result.confidence = winner_conf;
    result.fallback = false;
}

std::vector<RankedCategory> ScoreAggregator::rank(const std::map<Category, double>& scores, size_t n) const {
    std::vector<RankedCategory> ranked;
    ranked.reserve(scores.size());

    for (const auto& kv : scores) {
        if (!m_registry.contains(kv.first)) continue;
        const double conf = confidence_of(kv.second);
        if (conf > 0.0) ranked.push_back(RankedCategory{kv.first, conf});
    }

    std::sort(ranked.begin(), ranked.end(),
              [this](const RankedCategory& a, const RankedCategory& b) {
                  if (a.confidence != b.confidence) return a.confidence > b.confidence;
                  return m_registry.priority(a.category) < m_registry.priority(b.category);
              });

    if (ranked.empty()) ranked.push_back(RankedCategory{Category::Other, 0.0});
    if (ranked.size() > n) ranked.resize(n);
    return ranked;
}

}  // namespace categorize
