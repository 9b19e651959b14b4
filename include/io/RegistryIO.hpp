#pragma once
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "categorize/Registry.hpp"

// Load the versioned registry asset (data/registry.json). Throws
// std::runtime_error naming the offending JSON location; a registry is
// either fully loaded and validated or not produced at all.
std::shared_ptr<const categorize::Registry> loadRegistry(const std::string& path);

std::shared_ptr<const categorize::Registry> parseRegistry(const nlohmann::json& root);
