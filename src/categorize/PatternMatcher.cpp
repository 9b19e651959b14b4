#include "categorize/PatternMatcher.hpp"

#include <regex>

namespace categorize {

void PatternMatcher::match(const std::string& normalized_text, std::vector<MatchSignal>& out) const {
    if (normalized_text.empty()) return;

    for (const auto& p : m_registry.patterns()) {
        std::smatch m;
        bool hit = false;
        try {
            hit = std::regex_search(normalized_text, m, p.re);
        } catch (const std::regex_error&) {
            // error_complexity / error_stack: the rule gives no evidence for this input
            continue;
        }
        if (!hit) continue;

        MatchSignal s;
        s.category = p.category;
        s.source = SignalSource::Pattern;
        s.matched = m.str(0);
        s.term = p.source;
        s.similarity = 1.0;
        s.base_weight = p.weight;
        s.contribution = p.weight;
        out.push_back(std::move(s));
    }
}

}  // namespace categorize
