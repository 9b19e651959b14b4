#undef NDEBUG
#include "categorize/CategorizationService.hpp"
#include "categorize/ResultArtifact.hpp"
#include "io/RegistryIO.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace categorize;

static const std::string kRegistryPath = std::string(HABITCAT_DATA_DIR) + "/registry.json";

static bool same_result(const CategorizationResult& a, const CategorizationResult& b) {
    if (a.category != b.category || a.confidence != b.confidence || a.fallback != b.fallback) return false;
    if (a.tokens != b.tokens || a.scores != b.scores) return false;
    if (a.signals.size() != b.signals.size()) return false;
    for (size_t i = 0; i < a.signals.size(); ++i) {
        const auto& x = a.signals[i];
        const auto& y = b.signals[i];
        if (x.category != y.category || x.source != y.source || x.matched != y.matched ||
            x.term != y.term || x.contribution != y.contribution) {
            return false;
        }
    }
    return true;
}

static bool has_signal(const CategorizationResult& r, Category c, SignalSource src) {
    for (const auto& s : r.signals) {
        if (s.category == c && s.source == src) return true;
    }
    return false;
}

static void expect(const CategorizationService& svc, const std::string& text, Category want) {
    const auto r = svc.suggest_category(text);
    if (r.category != want) {
        std::cerr << "  '" << text << "' -> " << to_string(r.category) << ", expected " << to_string(want) << std::endl;
    }
    assert(r.category == want);
}

void test_empty_and_degenerate_input(const CategorizationService& svc) {
    std::cout << "Testing empty and degenerate input..." << std::endl;

    const std::vector<std::string> inputs = {
        "", "   ", "\t\n", "!!!???", "\xF0\x9F\x8F\x83\xF0\x9F\x92\xAA",
        "\xE7\x9E\x91\xE6\x83\xB3", "\xFF\xFE\xFD", std::string(5000, '#')
    };
    for (const auto& in : inputs) {
        const auto r = svc.suggest_category(in);
        assert(r.category == Category::Other);
        assert(r.confidence == 0.0);
        assert(r.fallback);
        assert(r.signals.empty());
    }

    std::cout << "  PASS" << std::endl;
}

void test_end_to_end_examples(const CategorizationService& svc) {
    std::cout << "Testing end-to-end examples..." << std::endl;

    expect(svc, "Go to gym", Category::Fitness);
    expect(svc, "Read a book", Category::Education);
    expect(svc, "Save money", Category::Finance);
    expect(svc, "Call mom", Category::Social);
    expect(svc, "Drink water", Category::Health);
    expect(svc, "asdkjhasd", Category::Other);
    expect(svc, "Clear inbox", Category::Work);
    expect(svc, "M\xC3\xA9" "ditation", Category::Mindfulness);

    assert(svc.suggest_category("asdkjhasd").fallback);
    assert(!svc.suggest_category("Go to gym").fallback);

    std::cout << "  PASS" << std::endl;
}

void test_exact_keyword(const CategorizationService& svc) {
    std::cout << "Testing exact keyword..." << std::endl;

    const auto r = svc.suggest_category("meditate");
    assert(r.category == Category::Mindfulness);
    assert(r.confidence > svc.registry().scoring().fallback_threshold);
    assert(!r.fallback);
    assert(has_signal(r, Category::Mindfulness, SignalSource::Keyword));

    std::cout << "  PASS" << std::endl;
}

void test_case_insensitive(const CategorizationService& svc) {
    std::cout << "Testing case-insensitivity..." << std::endl;

    const auto upper = svc.suggest_category("MEDITATE");
    const auto lower = svc.suggest_category("meditate");
    assert(same_result(upper, lower));

    assert(same_result(svc.suggest_category("Go To GYM"), svc.suggest_category("go to gym")));

    std::cout << "  PASS" << std::endl;
}

void test_typo_tolerance(const CategorizationService& svc) {
    std::cout << "Testing typo tolerance..." << std::endl;

    const auto r = svc.suggest_category("Workuot");
    assert(r.category == Category::Fitness);
    assert(r.confidence > 0.0);
    assert(has_signal(r, Category::Fitness, SignalSource::Fuzzy));

    // fuzzy credit is proportionally less than the exact keyword
    const auto exact = svc.suggest_category("workout");
    assert(exact.category == Category::Fitness);
    assert(r.confidence < exact.confidence);

    const auto far = svc.suggest_category("Wrkt");
    assert(far.category == Category::Other);
    assert(far.fallback);

    std::cout << "  PASS" << std::endl;
}

void test_pattern_idioms(const CategorizationService& svc) {
    std::cout << "Testing pattern idioms..." << std::endl;

    const auto run = svc.suggest_category("Run 5k");
    assert(run.category == Category::Fitness);
    assert(has_signal(run, Category::Fitness, SignalSource::Pattern));

    const auto sleep = svc.suggest_category("Sleep 8 hours");
    assert(sleep.category == Category::Health);
    assert(has_signal(sleep, Category::Health, SignalSource::Pattern));

    // pattern adds to the keyword evidence
    assert(svc.suggest_category("run 5k").scores.at(Category::Fitness) >
           svc.suggest_category("run").scores.at(Category::Fitness));

    std::cout << "  PASS" << std::endl;
}

void test_result_invariants(const CategorizationService& svc) {
    std::cout << "Testing result invariants..." << std::endl;

    const std::vector<std::string> inputs = {
        "Go to gym", "Workuot", "sleep 8 hours", "read read read read read read book book",
        "call mom and save money", "x", std::string(300, 'z') + " gym"
    };
    for (const auto& in : inputs) {
        const auto r = svc.suggest_category(in);
        assert(svc.registry().contains(r.category));
        assert(r.confidence >= 0.0 && r.confidence <= 1.0);
        assert(r.fallback == (r.category == Category::Other && r.confidence == 0.0));
        assert(r.scores.size() == svc.registry().definitions().size());
        for (const auto& kv : r.scores) assert(kv.second >= 0.0);
        assert(r.input.size() <= in.size());
    }

    // clamped before matching: the trailing keyword is cut off
    const auto long_in = svc.suggest_category(std::string(300, 'z') + " gym");
    assert(long_in.category == Category::Other);
    assert(long_in.input.size() == 200);

    std::cout << "  PASS" << std::endl;
}

void test_determinism_and_threads(const CategorizationService& svc) {
    std::cout << "Testing determinism across calls and threads..." << std::endl;

    const std::vector<std::string> inputs = {
        "Go to gym", "Workuot", "Read a book", "sleep 8 hours", "Call mom", "asdkjhasd", ""
    };

    std::vector<CategorizationResult> baseline;
    for (const auto& in : inputs) baseline.push_back(svc.suggest_category(in));

    for (int i = 0; i < 10; ++i) {
        for (size_t k = 0; k < inputs.size(); ++k) {
            assert(same_result(svc.suggest_category(inputs[k]), baseline[k]));
        }
    }

    std::vector<int> ok(8, 1);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < ok.size(); ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                const size_t k = (t + static_cast<size_t>(i)) % inputs.size();
                if (!same_result(svc.suggest_category(inputs[k]), baseline[k])) ok[t] = 0;
            }
        });
    }
    for (auto& th : threads) th.join();
    for (int v : ok) assert(v == 1);

    std::cout << "  PASS" << std::endl;
}

void test_tie_break_reproducible() {
    std::cout << "Testing tie-break reproducibility..." << std::endl;

    CategoryDefinition social;
    social.id = Category::Social;
    social.priority = 2;
    social.keywords = {{"focus", 0.5}};

    CategoryDefinition work;
    work.id = Category::Work;
    work.priority = 1;
    work.keywords = {{"focus", 0.5}};

    CategoryDefinition other;
    other.id = Category::Other;
    other.priority = 3;

    auto reg = std::make_shared<const Registry>("tie-test", std::vector<CategoryDefinition>{social, work, other});
    const CategorizationService svc(reg);

    for (int i = 0; i < 100; ++i) {
        const auto r = svc.suggest_category("Focus");
        assert(r.category == Category::Work);
        assert(r.scores.at(Category::Work) == r.scores.at(Category::Social));
    }

    std::cout << "  PASS" << std::endl;
}

void test_suggest_top(const CategorizationService& svc) {
    std::cout << "Testing top suggestions..." << std::endl;

    auto top = svc.suggest_top("call mom and save money", 3);
    assert(top.size() >= 2);
    assert(top[0].confidence >= top[1].confidence);
    bool social = false, finance = false;
    for (const auto& t : top) {
        if (t.category == Category::Social) social = true;
        if (t.category == Category::Finance) finance = true;
        assert(t.confidence > 0.0);
    }
    assert(social && finance);

    top = svc.suggest_top("asdkjhasd", 3);
    assert(top.size() == 1);
    assert(top[0].category == Category::Other);

    top = svc.suggest_top("Go to gym", 1);
    assert(top.size() == 1);
    assert(top[0].category == Category::Fitness);

    std::cout << "  PASS" << std::endl;
}

void test_categories_listing(const CategorizationService& svc) {
    std::cout << "Testing category listing..." << std::endl;

    const auto& cats = svc.categories();
    assert(cats.size() == all_categories().size());
    for (const auto& d : cats) {
        assert(!d.name.empty());
        assert(!d.icon.empty());
        assert(!d.color.empty());
    }

    std::cout << "  PASS" << std::endl;
}

void test_artifact_json(const CategorizationService& svc) {
    std::cout << "Testing result artifact..." << std::endl;

    const auto art = make_artifact(svc.registry(), svc.suggest_category("Go to gym"), svc.suggest_top("Go to gym", 2));
    const auto j = art.to_json();

    assert(j["category"] == "fitness");
    assert(j["fallback"] == false);
    assert(j["registry_version"] == svc.registry().version());
    assert(j["tokens"].size() == 2);
    assert(j["scores"].contains("fitness"));
    assert(j["signals"].is_array() && !j["signals"].empty());
    assert(j["signals"][0].contains("source"));
    assert(j["top"][0]["category"] == "fitness");

    std::cout << "  PASS" << std::endl;
}

void test_null_registry_rejected() {
    std::cout << "Testing null registry..." << std::endl;

    bool threw = false;
    try {
        CategorizationService svc(nullptr);
        (void)svc;
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== CategorizationService Tests ===" << std::endl;

    const CategorizationService svc(loadRegistry(kRegistryPath));

    test_empty_and_degenerate_input(svc);
    test_end_to_end_examples(svc);
    test_exact_keyword(svc);
    test_case_insensitive(svc);
    test_typo_tolerance(svc);
    test_pattern_idioms(svc);
    test_result_invariants(svc);
    test_determinism_and_threads(svc);
    test_tie_break_reproducible();
    test_suggest_top(svc);
    test_categories_listing(svc);
    test_artifact_json(svc);
    test_null_registry_rejected();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
