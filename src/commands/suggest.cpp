#include "commands/suggest.hpp"

#include "categorize/CategorizationService.hpp"
#include "categorize/ResultArtifact.hpp"
#include "io/RegistryIO.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int suggest_usage() {
    std::cerr
        << "usage:\n"
        << "  habitcat suggest --text \"<habit name>\" [--registry <path>] [--topk <n>] [--json] [--out <path>]\n";
    return 1;
}

int cmd_suggest(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return suggest_usage();

    if (!has_flag(argc, argv, "--text")) {
        std::cerr << "error: missing --text\n";
        return suggest_usage();
    }

    // empty text is a valid request (it falls back to other)
    const std::string text          = get_arg(argc, argv, "--text", "");
    const std::string registry_path = get_arg(argc, argv, "--registry", "data/registry.json");
    const std::string topk_s        = get_arg(argc, argv, "--topk", "0");
    const std::string out_path      = get_arg(argc, argv, "--out", "");
    const bool as_json              = has_flag(argc, argv, "--json");

    char* end = nullptr;
    const long topk = std::strtol(topk_s.c_str(), &end, 10);
    if (end == topk_s.c_str() || *end != '\0' || topk < 0) {
        std::cerr << "error: --topk must be a non-negative integer\n";
        return 2;
    }

    std::shared_ptr<const categorize::Registry> registry;
    try {
        registry = loadRegistry(registry_path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    const categorize::CategorizationService svc(registry);

    categorize::CategorizationResult r = svc.suggest_category(text);
    std::vector<categorize::RankedCategory> top;
    if (topk > 0) top = svc.suggest_top(text, static_cast<size_t>(topk));

    const categorize::ResultArtifact art = categorize::make_artifact(*registry, std::move(r), std::move(top));

    if (!out_path.empty()) {
        try {
            art.write_to(fs::path(out_path));
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
            return 2;
        }
    }

    if (as_json) {
        std::cout << art.to_json().dump(2) << "\n";
        return 0;
    }

    const categorize::CategoryDefinition* def = registry->find(art.result.category);

    std::cout << "CATEGORY: " << categorize::to_string(art.result.category);
    if (def && !def->icon.empty()) std::cout << " " << def->icon;
    std::cout << "\n";
    std::cout << "CONFIDENCE: " << std::fixed << std::setprecision(3) << art.result.confidence << "\n";
    std::cout << "FALLBACK: " << (art.result.fallback ? "yes" : "no") << "\n";

    for (const auto& s : art.result.signals) {
        std::cout << "  - " << categorize::to_string(s.source) << " " << categorize::to_string(s.category)
                  << " '" << s.matched << "'";
        if (s.source == categorize::SignalSource::Fuzzy) std::cout << " ~ '" << s.term << "' sim=" << s.similarity;
        std::cout << " +" << s.contribution << "\n";
    }

    for (size_t i = 0; i < art.top.size(); ++i) {
        std::cout << "TOP" << (i + 1) << ": " << categorize::to_string(art.top[i].category)
                  << " " << art.top[i].confidence << "\n";
    }

    if (!out_path.empty()) std::cout << "OUT_RESULT: " << out_path << "\n";
    return 0;
}
