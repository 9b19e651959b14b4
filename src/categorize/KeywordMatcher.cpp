#include "categorize/KeywordMatcher.hpp"

#include "text/Normalizer.hpp"

namespace categorize {

static void emit(std::vector<MatchSignal>& out,
                 const std::vector<IndexEntry>& entries,
                 SignalSource source,
                 const std::string& text) {
    for (const auto& e : entries) {
        MatchSignal s;
        s.category = e.category;
        s.source = source;
        s.matched = text;
        s.term = text;
        s.similarity = 1.0;
        s.base_weight = e.weight;
        s.contribution = e.weight;
        out.push_back(std::move(s));
    }
}

void KeywordMatcher::match(const std::vector<std::string>& tokens, std::vector<MatchSignal>& out) const {
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (const auto* hits = m_registry.keyword_entries(tokens[i])) {
            emit(out, *hits, SignalSource::Keyword, tokens[i]);
        }

        // windows starting at i: "go gym", "brush teeth night"
        for (size_t len = 2; len <= 3 && i + len <= tokens.size(); ++len) {
            const std::string phrase = textutil::join_tokens(tokens, i, i + len);
            if (const auto* hits = m_registry.phrase_entries(phrase)) {
                emit(out, *hits, SignalSource::Phrase, phrase);
            }
        }
    }
}

}  // namespace categorize
