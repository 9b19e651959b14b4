#include "commands/validate.hpp"

#include "io/RegistryValidator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_validate(int argc, char** argv) {
    const std::string registry_path = get_arg(argc, argv, "--registry", "data/registry.json");
    const std::string out_path      = get_arg(argc, argv, "--out", "");

    const registrycheck::ValidationReport rep = registrycheck::validate_registry(registry_path);

    if (!out_path.empty()) {
        try {
            registrycheck::write_validation_report(fs::path(out_path), rep);
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
            return 2;
        }
    }

    if (!rep.pass) {
        std::cerr << "validation failed: " << registry_path << "\n";
        for (const auto& e : rep.errors) {
            std::cerr << "- " << e.code << ": " << e.message << "\n";
        }
        return 1;
    }

    std::cout << "VALIDATION: pass\n";
    std::cout << "VERSION: " << rep.version << "\n";
    std::cout << "CATEGORIES: " << rep.num_categories << "\n";
    std::cout << "EXAMPLES: " << rep.num_examples << "\n";
    if (!out_path.empty()) std::cout << "OUT_VALIDATE: " << out_path << "\n";
    return 0;
}
