#include "categorize/Registry.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "text/Normalizer.hpp"

namespace categorize {

static std::vector<std::string> term_tokens(const std::string& s) {
    return textutil::tokenize(textutil::fold(s));
}

static std::string where_of(const CategoryDefinition& d) {
    return std::string("category '") + to_string(d.id) + "'";
}

static void require_positive(double w, const std::string& what) {
    if (!(w > 0.0)) {
        std::ostringstream oss;
        oss << what << " has non-positive weight " << w;
        throw std::runtime_error(oss.str());
    }
}

// Normalizes terms in place and drops exact repeats. The same term listed
// twice with different weights is a contradiction.
static void dedupe_terms(std::vector<WeightedTerm>& terms, const std::string& where, const char* kind) {
    std::vector<WeightedTerm> out;
    out.reserve(terms.size());
    std::map<std::string, double> seen;

    for (const auto& t : terms) {
        auto it = seen.find(t.text);
        if (it == seen.end()) {
            seen.emplace(t.text, t.weight);
            out.push_back(t);
            continue;
        }
        if (it->second != t.weight) {
            std::ostringstream oss;
            oss << where << " lists " << kind << " '" << t.text
                << "' with contradictory weights " << it->second << " and " << t.weight;
            throw std::runtime_error(oss.str());
        }
        std::cerr << "warning: " << where << " lists " << kind << " '" << t.text << "' twice; collapsed\n";
    }

    terms = std::move(out);
}

Registry::Registry(std::string version, std::vector<CategoryDefinition> definitions, ScoringConfig scoring)
    : m_version(std::move(version)),
      m_scoring(scoring),
      m_defs(std::move(definitions)) {
    if (m_version.empty()) throw std::runtime_error("registry version must not be empty");

    validate_scoring();
    normalize_and_validate();
    build_indices();
}

void Registry::validate_scoring() const {
    const ScoringConfig& s = m_scoring;

    auto fail = [](const std::string& msg) { throw std::runtime_error("scoring: " + msg); };

    if (!(s.default_keyword_weight > 0.0)) fail("default_keyword_weight must be > 0");
    if (!(s.phrase_bonus > 0.0)) fail("phrase_bonus must be > 0");
    if (!(s.default_pattern_weight > 0.0)) fail("default_pattern_weight must be > 0");
    if (!(s.max_score > 0.0)) fail("max_score must be > 0");
    if (!(s.fallback_threshold >= 0.0 && s.fallback_threshold <= 1.0)) fail("fallback_threshold must be in [0,1]");
    if (!(s.fuzzy_threshold > 0.0 && s.fuzzy_threshold <= 1.0)) fail("fuzzy_threshold must be in (0,1]");
    if (s.fuzzy_min_token_length < 1) fail("fuzzy_min_token_length must be >= 1");
    if (!(s.tie_epsilon >= 0.0)) fail("tie_epsilon must be >= 0");
}

void Registry::normalize_and_validate() {
    if (m_defs.empty()) throw std::runtime_error("registry has no categories");

    std::map<int, Category> by_priority;

    for (size_t i = 0; i < m_defs.size(); ++i) {
        CategoryDefinition& d = m_defs[i];
        const std::string where = where_of(d);

        if (!m_def_index.emplace(d.id, i).second) {
            throw std::runtime_error(where + " is defined more than once");
        }

        auto pit = by_priority.emplace(d.priority, d.id);
        if (!pit.second) {
            std::ostringstream oss;
            oss << where << " reuses priority " << d.priority
                << " already held by category '" << to_string(pit.first->second) << "'";
            throw std::runtime_error(oss.str());
        }

        for (auto& kw : d.keywords) {
            const auto toks = term_tokens(kw.text);
            if (toks.size() != 1) {
                throw std::runtime_error(where + " keyword '" + kw.text + "' must normalize to exactly one token");
            }
            require_positive(kw.weight, where + " keyword '" + kw.text + "'");
            kw.text = toks[0];
        }
        dedupe_terms(d.keywords, where, "keyword");

        for (auto& ph : d.phrases) {
            const auto toks = term_tokens(ph.text);
            if (toks.size() < 2 || toks.size() > 3) {
                throw std::runtime_error(where + " phrase '" + ph.text + "' must normalize to 2 or 3 tokens");
            }
            require_positive(ph.weight, where + " phrase '" + ph.text + "'");
            ph.text = textutil::join_tokens(toks);
        }
        dedupe_terms(d.phrases, where, "phrase");

        for (const auto& p : d.patterns) {
            if (p.regex.empty()) throw std::runtime_error(where + " has an empty pattern");
            require_positive(p.weight, where + " pattern '" + p.regex + "'");
        }
    }

    if (m_def_index.find(Category::Other) == m_def_index.end()) {
        throw std::runtime_error("registry is missing the 'other' fallback category");
    }

    // a phrase must outweigh each of its words that is a keyword in any category
    std::map<std::string, std::pair<double, Category>> heaviest;
    for (const auto& d : m_defs) {
        for (const auto& kw : d.keywords) {
            auto it = heaviest.find(kw.text);
            if (it == heaviest.end() || kw.weight > it->second.first) {
                heaviest[kw.text] = std::make_pair(kw.weight, d.id);
            }
        }
    }
    for (const auto& d : m_defs) {
        for (const auto& ph : d.phrases) {
            for (const auto& tok : term_tokens(ph.text)) {
                auto it = heaviest.find(tok);
                if (it == heaviest.end() || it->second.first < ph.weight) continue;
                std::ostringstream oss;
                oss << where_of(d) << " phrase '" << ph.text << "' (weight " << ph.weight
                    << ") does not outweigh keyword '" << tok << "' of category '"
                    << to_string(it->second.second) << "' (weight " << it->second.first << ")";
                throw std::runtime_error(oss.str());
            }
        }
    }
}

void Registry::build_indices() {
    std::set<std::string> dict;

    for (const auto& d : m_defs) {
        for (const auto& kw : d.keywords) {
            m_keywords[kw.text].push_back(IndexEntry{d.id, kw.weight});
            dict.insert(kw.text);
        }
        for (const auto& ph : d.phrases) {
            m_phrases[ph.text].push_back(IndexEntry{d.id, ph.weight});
        }
        for (const auto& p : d.patterns) {
            CompiledPattern cp;
            cp.category = d.id;
            cp.source = p.regex;
            cp.weight = p.weight;
            try {
                cp.re = std::regex(p.regex, std::regex::ECMAScript | std::regex::optimize);
            } catch (const std::regex_error& e) {
                throw std::runtime_error(where_of(d) + " pattern '" + p.regex + "' is not a valid regex: " + e.what());
            }
            m_patterns.push_back(std::move(cp));
        }
    }

    m_fuzzy_dict.assign(dict.begin(), dict.end());
}

const CategoryDefinition* Registry::find(Category c) const {
    auto it = m_def_index.find(c);
    if (it == m_def_index.end()) return nullptr;
    return &m_defs[it->second];
}

int Registry::priority(Category c) const {
    const CategoryDefinition* d = find(c);
    if (!d) throw std::out_of_range(std::string("category not in registry: ") + to_string(c));
    return d->priority;
}

const std::vector<IndexEntry>* Registry::keyword_entries(const std::string& token) const {
    auto it = m_keywords.find(token);
    if (it == m_keywords.end()) return nullptr;
    return &it->second;
}

const std::vector<IndexEntry>* Registry::phrase_entries(const std::string& phrase) const {
    auto it = m_phrases.find(phrase);
    if (it == m_phrases.end()) return nullptr;
    return &it->second;
}

}  // namespace categorize
