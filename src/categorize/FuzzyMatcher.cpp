#include "categorize/FuzzyMatcher.hpp"

#include <algorithm>
#include <vector>

namespace categorize {

// 1 - 1/5 is not exactly 0.8 in binary
static const double kSimilaritySlack = 1e-9;

size_t osa_distance(const std::string& a, const std::string& b) {
    const size_t n = a.size();
    const size_t m = b.size();
    if (n == 0) return m;
    if (m == 0) return n;

    // three rolling rows: i-2, i-1, i
    std::vector<size_t> prev2(m + 1, 0), prev(m + 1), cur(m + 1);
    for (size_t j = 0; j <= m; ++j) prev[j] = j;

    for (size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= m; ++j) {
            const size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            size_t d = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1]) {
                d = std::min(d, prev2[j - 2] + 1);
            }
            cur[j] = d;
        }
        std::swap(prev2, prev);
        std::swap(prev, cur);
    }
    return prev[m];
}

double similarity(const std::string& a, const std::string& b) {
    const size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;
    return 1.0 - static_cast<double>(osa_distance(a, b)) / static_cast<double>(longest);
}

void FuzzyMatcher::match(const std::vector<std::string>& tokens, std::vector<MatchSignal>& out) const {
    const ScoringConfig& cfg = m_registry.scoring();
    const auto& dict = m_registry.fuzzy_dictionary();

    for (const auto& tok : tokens) {
        if (tok.size() < cfg.fuzzy_min_token_length) continue;
        if (m_registry.keyword_entries(tok)) continue;  // exact hit already credited

        const std::string* best = nullptr;
        double best_sim = 0.0;

        for (const auto& kw : dict) {
            // distance >= length gap, so skip keywords that cannot reach the threshold
            const size_t longest = std::max(tok.size(), kw.size());
            const size_t gap = (tok.size() > kw.size()) ? tok.size() - kw.size() : kw.size() - tok.size();
            if (1.0 - static_cast<double>(gap) / static_cast<double>(longest) + kSimilaritySlack < cfg.fuzzy_threshold) continue;

            const double sim = similarity(tok, kw);
            // dict is sorted, strict > keeps the smallest keyword on ties
            if (sim > best_sim) {
                best_sim = sim;
                best = &kw;
            }
        }

        if (!best || best_sim + kSimilaritySlack < cfg.fuzzy_threshold) continue;

        const auto* entries = m_registry.keyword_entries(*best);
        if (!entries) continue;

        for (const auto& e : *entries) {
            MatchSignal s;
            s.category = e.category;
            s.source = SignalSource::Fuzzy;
            s.matched = tok;
            s.term = *best;
            s.similarity = best_sim;
            s.base_weight = e.weight;
            s.contribution = e.weight * best_sim;
            out.push_back(std::move(s));
        }
    }
}

}  // namespace categorize
