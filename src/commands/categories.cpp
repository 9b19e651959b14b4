#include "commands/categories.hpp"

#include "io/RegistryIO.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

int cmd_categories(int argc, char** argv) {
    const std::string registry_path = get_arg(argc, argv, "--registry", "data/registry.json");

    std::shared_ptr<const categorize::Registry> registry;
    try {
        registry = loadRegistry(registry_path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    std::cout << "REGISTRY: " << registry->version() << "\n";
    for (const auto& d : registry->definitions()) {
        std::cout << d.priority << "\t" << categorize::to_string(d.id) << "\t" << d.name;
        if (!d.icon.empty()) std::cout << "\t" << d.icon;
        if (!d.color.empty()) std::cout << "\t" << d.color;
        std::cout << "\t(" << d.keywords.size() << " keywords, " << d.phrases.size() << " phrases, "
                  << d.patterns.size() << " patterns)\n";
    }
    return 0;
}
