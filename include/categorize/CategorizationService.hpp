#pragma once

#include <memory>
#include <string>
#include <vector>

#include "categorize/FuzzyMatcher.hpp"
#include "categorize/KeywordMatcher.hpp"
#include "categorize/Models.hpp"
#include "categorize/PatternMatcher.hpp"
#include "categorize/Registry.hpp"
#include "categorize/ScoreAggregator.hpp"

namespace categorize {

// Facade over normalizer, matchers and aggregator. Holds no mutable state:
// one instance can serve any number of threads, and every call is a pure
// function of (input, registry). Safe to call on every keystroke.
class CategorizationService {
public:
    // throws std::invalid_argument on a null registry
    explicit CategorizationService(std::shared_ptr<const Registry> registry);

    // always returns a registry category; Other with fallback=true when
    // nothing clears the threshold (empty input, emoji, unknown words)
    CategorizationResult suggest_category(const std::string& habit_name) const;

    std::vector<RankedCategory> suggest_top(const std::string& habit_name, size_t n) const;

    const std::vector<CategoryDefinition>& categories() const { return m_registry->definitions(); }
    const Registry& registry() const { return *m_registry; }

private:
    std::shared_ptr<const Registry> m_registry;

    KeywordMatcher m_keywords;
    PatternMatcher m_patterns;
    FuzzyMatcher m_fuzzy;
    ScoreAggregator m_aggregator;
};

}  // namespace categorize
