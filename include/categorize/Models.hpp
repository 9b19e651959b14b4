#pragma once

#include <map>
#include <string>
#include <vector>

#include "categorize/Category.hpp"

namespace categorize {

enum class SignalSource {
    Keyword,
    Phrase,
    Pattern,
    Fuzzy
};

const char* to_string(SignalSource s);

// One piece of evidence for one category. Produced per call, never stored.
struct MatchSignal {
    Category category = Category::Other;
    SignalSource source = SignalSource::Keyword;

    // What we saw on the input side (token, token window, or regex match)
    std::string matched;

    // Registry side: keyword, phrase, or regex source that fired
    std::string term;

    // 1.0 except for fuzzy hits
    double similarity = 1.0;

    // Registry weight of the term and the amount actually credited
    double base_weight = 0.0;
    double contribution = 0.0;
};

struct CategorizationResult {
    std::string input;                   // after clamping
    std::vector<std::string> tokens;     // normalized

    // aggregate score (sum of contributions) for every registry category
    std::map<Category, double> scores;

    Category category = Category::Other;
    double confidence = 0.0;             // [0,1]
    bool fallback = true;

    // emission order: keyword/phrase, pattern, fuzzy
    std::vector<MatchSignal> signals;
};

struct RankedCategory {
    Category category = Category::Other;
    double confidence = 0.0;
};

}  // namespace categorize
