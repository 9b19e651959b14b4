#undef NDEBUG
#include "categorize/Registry.hpp"
#include "io/RegistryIO.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace categorize;
using json = nlohmann::json;

static const std::string kRegistryPath = std::string(HABITCAT_DATA_DIR) + "/registry.json";

// minimal valid document; individual tests break one thing at a time
static json base_doc() {
    return json::parse(R"({
        "version": "test-1",
        "categories": [
            {"id": "fitness", "priority": 0, "keywords": ["gym", "run"], "phrases": ["go gym"],
             "patterns": ["\\brun\\s\\d+k\\b"]},
            {"id": "other", "priority": 9}
        ]
    })");
}

static bool rejects(const json& doc, const std::string& needle = "") {
    try {
        parseRegistry(doc);
    } catch (const std::runtime_error& e) {
        if (needle.empty()) return true;
        return std::string(e.what()).find(needle) != std::string::npos;
    }
    return false;
}

void test_load_shipped_registry() {
    std::cout << "Testing shipped registry..." << std::endl;

    auto reg = loadRegistry(kRegistryPath);
    assert(reg);
    assert(!reg->version().empty());

    for (Category c : all_categories()) {
        assert(reg->contains(c));
    }
    assert(reg->definitions().size() == all_categories().size());

    const auto& dict = reg->fuzzy_dictionary();
    assert(!dict.empty());
    assert(std::is_sorted(dict.begin(), dict.end()));
    assert(std::adjacent_find(dict.begin(), dict.end()) == dict.end());

    assert(reg->keyword_entries("meditate") != nullptr);
    assert(reg->keyword_entries("meditate")->front().category == Category::Mindfulness);
    assert(reg->phrase_entries("go gym") != nullptr);
    assert(!reg->patterns().empty());

    std::cout << "  PASS" << std::endl;
}

void test_defaults_and_normalized_terms() {
    std::cout << "Testing defaults and term normalization..." << std::endl;

    json doc = base_doc();
    doc["categories"][0]["keywords"] = json::array({"GYM", {{"term", "Run"}, {"weight", 0.4}}});
    doc["categories"][0]["phrases"] = json::array({"Go to the Gym"});
    auto reg = parseRegistry(doc);

    const ScoringConfig defaults;
    const auto* gym = reg->keyword_entries("gym");
    assert(gym && gym->size() == 1);
    assert(gym->front().weight == defaults.default_keyword_weight);
    assert(reg->keyword_entries("run")->front().weight == 0.4);

    const auto* go_gym = reg->phrase_entries("go gym");
    assert(go_gym && go_gym->size() == 1);
    assert(go_gym->front().weight == defaults.default_keyword_weight + defaults.phrase_bonus);

    assert(reg->patterns().size() == 1);
    assert(reg->patterns()[0].weight == defaults.default_pattern_weight);
    assert(reg->find(Category::Fitness)->name == "fitness");
    assert(reg->priority(Category::Other) == 9);
    assert(!reg->contains(Category::Finance));

    std::cout << "  PASS" << std::endl;
}

void test_scoring_block() {
    std::cout << "Testing scoring block..." << std::endl;

    json doc = base_doc();
    doc["scoring"] = {{"max_score", 3.0}, {"fallback_threshold", 0.2}, {"fuzzy_min_token_length", 4}};
    auto reg = parseRegistry(doc);
    assert(reg->scoring().max_score == 3.0);
    assert(reg->scoring().fallback_threshold == 0.2);
    assert(reg->scoring().fuzzy_min_token_length == 4);

    json bad = base_doc();
    bad["scoring"] = {{"max_score", 0.0}};
    assert(rejects(bad, "max_score"));

    bad = base_doc();
    bad["scoring"] = {{"fallback_threshold", 1.5}};
    assert(rejects(bad, "fallback_threshold"));

    bad = base_doc();
    bad["scoring"] = {{"fuzzy_threshold", "high"}};
    assert(rejects(bad, "must be a number"));

    std::cout << "  PASS" << std::endl;
}

void test_structural_errors() {
    std::cout << "Testing structural errors..." << std::endl;

    json doc = base_doc();
    doc.erase("version");
    assert(rejects(doc, "version"));

    doc = base_doc();
    doc["categories"] = json::array();
    assert(rejects(doc, "no categories"));

    doc = base_doc();
    doc["categories"].erase(1);
    assert(rejects(doc, "'other'"));

    doc = base_doc();
    doc["categories"][0]["id"] = "cooking";
    assert(rejects(doc, "unknown category"));

    doc = base_doc();
    doc["categories"][0].erase("priority");
    assert(rejects(doc, "root.categories[0] missing required field: priority"));

    doc = base_doc();
    doc["categories"][0]["priority"] = "first";
    assert(rejects(doc, "must be an integer"));

    doc = base_doc();
    doc["categories"][0]["keywords"] = "gym";
    assert(rejects(doc, "must be an array"));

    doc = base_doc();
    doc["categories"].push_back({{"id", "fitness"}, {"priority", 3}});
    assert(rejects(doc, "more than once"));

    doc = base_doc();
    doc["categories"][1]["priority"] = 0;
    assert(rejects(doc, "priority"));

    std::cout << "  PASS" << std::endl;
}

void test_term_errors() {
    std::cout << "Testing term errors..." << std::endl;

    json doc = base_doc();
    doc["categories"][0]["keywords"].push_back("lift weights");
    assert(rejects(doc, "exactly one token"));

    doc = base_doc();
    doc["categories"][0]["keywords"].push_back("the");
    assert(rejects(doc, "exactly one token"));

    doc = base_doc();
    doc["categories"][0]["phrases"].push_back("gym");
    assert(rejects(doc, "2 or 3 tokens"));

    doc = base_doc();
    doc["categories"][0]["phrases"].push_back("one two three four");
    assert(rejects(doc, "2 or 3 tokens"));

    doc = base_doc();
    doc["categories"][0]["keywords"].push_back({{"term", "swim"}, {"weight", 0.0}});
    assert(rejects(doc, "non-positive"));

    // same keyword, same category, different weights
    doc = base_doc();
    doc["categories"][0]["keywords"].push_back({{"term", "Gym"}, {"weight", 0.9}});
    assert(rejects(doc, "contradictory"));

    // phrase must outweigh its own keywords
    doc = base_doc();
    doc["categories"][0]["keywords"] = json::array({{{"term", "gym"}, {"weight", 0.8}}});
    assert(rejects(doc, "does not outweigh"));

    // ...and the same word as a keyword of another category
    doc = base_doc();
    doc["categories"][1]["keywords"] = json::array({{{"term", "gym"}, {"weight", 0.9}}});
    assert(rejects(doc, "of category 'other'"));

    doc = base_doc();
    doc["categories"][1]["keywords"] = json::array({{{"term", "gym"}, {"weight", 0.3}}});
    assert(!rejects(doc));

    doc = base_doc();
    doc["categories"][0]["patterns"].push_back("((unclosed");
    assert(rejects(doc, "not a valid regex"));

    std::cout << "  PASS" << std::endl;
}

void test_identical_duplicates_collapse() {
    std::cout << "Testing identical duplicate collapse..." << std::endl;

    json doc = base_doc();
    doc["categories"][0]["keywords"].push_back("GYM");
    auto reg = parseRegistry(doc);
    assert(reg->find(Category::Fitness)->keywords.size() == 2);
    assert(reg->keyword_entries("gym")->size() == 1);

    // the same keyword in two categories is allowed
    doc = base_doc();
    doc["categories"].push_back({{"id", "work"}, {"priority", 1}, {"keywords", json::array({"gym"})}});
    reg = parseRegistry(doc);
    assert(reg->keyword_entries("gym")->size() == 2);
    assert(reg->keyword_entries("gym")->at(0).category == Category::Fitness);
    assert(reg->keyword_entries("gym")->at(1).category == Category::Work);

    std::cout << "  PASS" << std::endl;
}

void test_load_errors() {
    std::cout << "Testing file load errors..." << std::endl;

    bool threw = false;
    try {
        loadRegistry("/nonexistent/registry.json");
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("failed to open") != std::string::npos;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Registry Tests ===" << std::endl;

    test_load_shipped_registry();
    test_defaults_and_normalized_terms();
    test_scoring_block();
    test_structural_errors();
    test_term_errors();
    test_identical_duplicates_collapse();
    test_load_errors();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
