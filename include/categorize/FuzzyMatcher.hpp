#pragma once

#include <string>
#include <vector>

#include "categorize/Models.hpp"
#include "categorize/Registry.hpp"

namespace categorize {

// Optimal string alignment distance: insert, delete, substitute and adjacent
// transposition all cost 1 ("workuot" -> "workout" is 1).
size_t osa_distance(const std::string& a, const std::string& b);

// 1 - distance / max(len a, len b); 1.0 for two empty strings
double similarity(const std::string& a, const std::string& b);

// Typo tolerance. Only tokens of at least fuzzy_min_token_length characters
// with no exact keyword hit are compared, against every registry keyword; the
// best keyword per token is credited weight * similarity per category entry
// when similarity >= fuzzy_threshold.
class FuzzyMatcher {
public:
    explicit FuzzyMatcher(const Registry& registry) : m_registry(registry) {}

    void match(const std::vector<std::string>& tokens, std::vector<MatchSignal>& out) const;

private:
    const Registry& m_registry;
};

}  // namespace categorize
