#include "categorize/CategorizationService.hpp"

#include <stdexcept>

#include "text/Normalizer.hpp"

namespace categorize {

static const Registry& require_registry(const std::shared_ptr<const Registry>& r) {
    if (!r) throw std::invalid_argument("CategorizationService requires a registry");
    return *r;
}

CategorizationService::CategorizationService(std::shared_ptr<const Registry> registry)
    : m_registry(std::move(registry)),
      m_keywords(require_registry(m_registry)),
      m_patterns(*m_registry),
      m_fuzzy(*m_registry),
      m_aggregator(*m_registry) {}

CategorizationResult CategorizationService::suggest_category(const std::string& habit_name) const {
    const textutil::NormalizedText nt = textutil::normalize(habit_name);

    CategorizationResult result;
    result.input = nt.clamped;
    result.tokens = nt.tokens;

    if (!nt.tokens.empty()) {
        m_keywords.match(nt.tokens, result.signals);
        m_patterns.match(nt.text, result.signals);
        m_fuzzy.match(nt.tokens, result.signals);
    }

    m_aggregator.decide(result);
    return result;
}

std::vector<RankedCategory> CategorizationService::suggest_top(const std::string& habit_name, size_t n) const {
    const CategorizationResult r = suggest_category(habit_name);
    return m_aggregator.rank(r.scores, n);
}

}  // namespace categorize
