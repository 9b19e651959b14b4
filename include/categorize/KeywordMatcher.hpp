#pragma once

#include <string>
#include <vector>

#include "categorize/Models.hpp"
#include "categorize/Registry.hpp"

namespace categorize {

// Exact dictionary lookup: one signal per (token, category) keyword hit and
// per (2-3 token window, category) phrase hit.
class KeywordMatcher {
public:
    explicit KeywordMatcher(const Registry& registry) : m_registry(registry) {}

    void match(const std::vector<std::string>& tokens, std::vector<MatchSignal>& out) const;

private:
    const Registry& m_registry;
};

}  // namespace categorize
