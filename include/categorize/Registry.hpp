#pragma once

#include <map>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "categorize/Category.hpp"

namespace categorize {

struct WeightedTerm {
    std::string text;      // keyword (one token) or phrase (2-3 tokens)
    double weight = 0.0;
};

struct PatternRule {
    std::string regex;     // ECMAScript, evaluated against normalized text
    double weight = 0.0;
};

struct CategoryDefinition {
    Category id = Category::Other;
    int priority = 0;      // lower wins ties

    // display metadata for pickers
    std::string name;
    std::string icon;
    std::string color;

    std::vector<WeightedTerm> keywords;
    std::vector<WeightedTerm> phrases;
    std::vector<PatternRule> patterns;
};

struct ScoringConfig {
    double default_keyword_weight = 0.5;

    // phrases default to default_keyword_weight + phrase_bonus
    double phrase_bonus = 0.2;

    double default_pattern_weight = 0.6;

    // confidence = clamp(score / max_score)
    double max_score = 2.0;

    // below this the winner is discarded in favour of Other
    double fallback_threshold = 0.15;

    // fuzzy hit accepted if 1 - dist/maxlen >= fuzzy_threshold
    double fuzzy_threshold = 0.8;
    size_t fuzzy_min_token_length = 3;

    // categories within this of the best confidence are tied
    double tie_epsilon = 0.01;
};

struct IndexEntry {
    Category category = Category::Other;
    double weight = 0.0;
};

struct CompiledPattern {
    Category category = Category::Other;
    std::string source;
    double weight = 0.0;
    std::regex re;
};

// Immutable rule set. The constructor normalizes every term, validates the
// whole definition list and builds the lookup indices; any inconsistency
// throws std::runtime_error and no Registry is produced. All accessors are
// const and safe to call from many threads at once.
class Registry {
public:
    Registry(std::string version, std::vector<CategoryDefinition> definitions, ScoringConfig scoring = {});

    const std::string& version() const { return m_version; }
    const ScoringConfig& scoring() const { return m_scoring; }

    // registry order (as supplied)
    const std::vector<CategoryDefinition>& definitions() const { return m_defs; }

    const CategoryDefinition* find(Category c) const;
    bool contains(Category c) const { return find(c) != nullptr; }
    int priority(Category c) const;

    // nullptr when the token/phrase is not indexed
    const std::vector<IndexEntry>* keyword_entries(const std::string& token) const;
    const std::vector<IndexEntry>* phrase_entries(const std::string& phrase) const;

    const std::vector<CompiledPattern>& patterns() const { return m_patterns; }

    // every distinct keyword, sorted
    const std::vector<std::string>& fuzzy_dictionary() const { return m_fuzzy_dict; }

private:
    std::string m_version;
    ScoringConfig m_scoring;
    std::vector<CategoryDefinition> m_defs;
    std::map<Category, size_t> m_def_index;

    std::unordered_map<std::string, std::vector<IndexEntry>> m_keywords;
    std::unordered_map<std::string, std::vector<IndexEntry>> m_phrases;
    std::vector<CompiledPattern> m_patterns;
    std::vector<std::string> m_fuzzy_dict;

    void validate_scoring() const;
    void normalize_and_validate();
    void build_indices();
};

}  // namespace categorize
