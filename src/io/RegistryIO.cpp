#include "io/RegistryIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;
using namespace categorize;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static int require_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    return j.at(key).get<int>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) return "";
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static double optional_number(const json& j, const char* key, double def, const std::string& where) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static std::string index_path(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

static ScoringConfig parseScoring(const json& j, const std::string& where) {
    require_object(j, where);

    ScoringConfig s;
    s.default_keyword_weight = optional_number(j, "default_keyword_weight", s.default_keyword_weight, where);
    s.phrase_bonus           = optional_number(j, "phrase_bonus", s.phrase_bonus, where);
    s.default_pattern_weight = optional_number(j, "default_pattern_weight", s.default_pattern_weight, where);
    s.max_score              = optional_number(j, "max_score", s.max_score, where);
    s.fallback_threshold     = optional_number(j, "fallback_threshold", s.fallback_threshold, where);
    s.fuzzy_threshold        = optional_number(j, "fuzzy_threshold", s.fuzzy_threshold, where);
    s.tie_epsilon            = optional_number(j, "tie_epsilon", s.tie_epsilon, where);

    if (j.contains("fuzzy_min_token_length")) {
        const json& v = j.at("fuzzy_min_token_length");
        if (!v.is_number_integer() || v.get<long long>() < 0) {
            throw std::runtime_error(where + ".fuzzy_min_token_length must be a non-negative integer");
        }
        s.fuzzy_min_token_length = static_cast<size_t>(v.get<long long>());
    }
    return s;
}

// "gym" or {"<text_key>": "gym", "weight": 0.6}
static WeightedTerm parseTerm(const json& j, const char* text_key, double def_weight, const std::string& where) {
    WeightedTerm t;
    if (j.is_string()) {
        t.text = j.get<std::string>();
        t.weight = def_weight;
        return t;
    }
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be a string or an object");
    }
    t.text = require_string(j, text_key, where);
    t.weight = optional_number(j, "weight", def_weight, where);
    return t;
}

static std::vector<WeightedTerm> parseTerms(const json& j, const char* key, const char* text_key,
                                            double def_weight, const std::string& where) {
    std::vector<WeightedTerm> out;
    if (!j.contains(key)) return out;

    const json& arr = j.at(key);
    require_array(arr, where + "." + key);
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        out.push_back(parseTerm(arr.at(i), text_key, def_weight, index_path(where, key, i)));
    }
    return out;
}

static CategoryDefinition parseCategory(const json& j, const ScoringConfig& scoring, const std::string& where) {
    require_object(j, where);

    CategoryDefinition d;

    const std::string id = require_string(j, "id", where);
    auto cat = category_from_string(id);
    if (!cat) {
        throw std::runtime_error(where + ".id: unknown category '" + id + "'");
    }
    d.id = *cat;
    d.priority = require_int(j, "priority", where);

    d.name  = optional_string(j, "name", where);
    d.icon  = optional_string(j, "icon", where);
    d.color = optional_string(j, "color", where);
    if (d.name.empty()) d.name = id;

    d.keywords = parseTerms(j, "keywords", "term", scoring.default_keyword_weight, where);
    d.phrases  = parseTerms(j, "phrases", "text",
                            scoring.default_keyword_weight + scoring.phrase_bonus, where);

    for (const auto& t : parseTerms(j, "patterns", "regex", scoring.default_pattern_weight, where)) {
        d.patterns.push_back(PatternRule{t.text, t.weight});
    }

    return d;
}

std::shared_ptr<const Registry> parseRegistry(const json& j) {
    require_object(j, "root");

    const std::string version = require_string(j, "version", "root");

    ScoringConfig scoring;
    if (j.contains("scoring")) scoring = parseScoring(j.at("scoring"), "root.scoring");

    if (!j.contains("categories")) {
        throw std::runtime_error("root missing required field: categories");
    }
    const json& cats = j.at("categories");
    require_array(cats, "root.categories");

    std::vector<CategoryDefinition> defs;
    defs.reserve(cats.size());
    for (size_t i = 0; i < cats.size(); ++i) {
        defs.push_back(parseCategory(cats.at(i), scoring, index_path("root", "categories", i)));
    }

    return std::make_shared<const Registry>(version, std::move(defs), scoring);
}

std::shared_ptr<const Registry> loadRegistry(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open registry file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return parseRegistry(j);
}
