#include "io/RegistryValidator.hpp"

#include "categorize/CategorizationService.hpp"
#include "io/RegistryIO.hpp"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace registrycheck {

static nlohmann::json read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open JSON file: " + path.string());
    nlohmann::json j;
    in >> j;
    return j;
}

static void add_error(ValidationReport& rep, const std::string& code, const std::string& msg) {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    rep.errors.push_back(std::move(e));
}

static void check_examples(ValidationReport& rep,
                           const nlohmann::json& root,
                           const categorize::CategorizationService& svc) {
    if (!root.contains("examples")) return;
    if (!root["examples"].is_array()) {
        add_error(rep, "bad_examples", "examples must be an array");
        return;
    }

    for (const auto& ex : root["examples"]) {
        if (!ex.is_object() || !ex.contains("text") || !ex["text"].is_string() ||
            !ex.contains("expect") || !ex["expect"].is_string()) {
            add_error(rep, "bad_examples", "example needs string fields text and expect");
            continue;
        }
        rep.num_examples += 1;

        const std::string text = ex["text"].get<std::string>();
        const std::string expect = ex["expect"].get<std::string>();

        auto want = categorize::category_from_string(expect);
        if (!want) {
            add_error(rep, "bad_examples", "example '" + text + "' expects unknown category '" + expect + "'");
            continue;
        }

        const auto r = svc.suggest_category(text);
        if (r.category != *want) {
            add_error(rep, "example_mismatch",
                      "'" + text + "' -> " + categorize::to_string(r.category) + ", expected " + expect);
        }
    }
}

ValidationReport validate_registry(const std::string& registry_path) {
    ValidationReport rep;

    if (!fs::exists(registry_path)) {
        add_error(rep, "missing_file", "registry file does not exist: " + registry_path);
        return rep;
    }

    nlohmann::json root;
    try {
        root = read_json_file(fs::path(registry_path));
    } catch (const std::exception& e) {
        add_error(rep, "json_parse_error", e.what());
        return rep;
    }

    std::shared_ptr<const categorize::Registry> registry;
    try {
        registry = parseRegistry(root);
    } catch (const std::exception& e) {
        add_error(rep, "invalid_registry", e.what());
        return rep;
    }

    rep.version = registry->version();
    rep.num_categories = registry->definitions().size();

    const categorize::CategorizationService svc(registry);
    check_examples(rep, root, svc);
    return rep;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    nlohmann::json j;
    j["pass"] = rep.pass;
    if (!rep.version.empty()) j["version"] = rep.version;
    j["num_categories"] = rep.num_categories;
    j["num_examples"] = rep.num_examples;
    j["errors"] = nlohmann::json::array();

    for (const auto& e : rep.errors) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        j["errors"].push_back(ej);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

}
