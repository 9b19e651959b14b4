#pragma once

#include <string>
#include <vector>

#include "categorize/Models.hpp"
#include "categorize/Registry.hpp"

namespace categorize {

// Runs every registry pattern (registry order, no short-circuit) against the
// normalized text, e.g. "run 5k", "sleep 8 hours".
class PatternMatcher {
public:
    explicit PatternMatcher(const Registry& registry) : m_registry(registry) {}

    void match(const std::string& normalized_text, std::vector<MatchSignal>& out) const;

private:
    const Registry& m_registry;
};

}  // namespace categorize
