#pragma once

#include <optional>
#include <string>
#include <vector>

namespace categorize {

// Closed set of labels a habit can be filed under. Callers persist the id
// produced by to_string() and group analytics by it.
enum class Category {
    Fitness,
    Education,
    Mindfulness,
    Work,
    Health,
    Social,
    Finance,
    Other
};

const char* to_string(Category c);

// "fitness" -> Category::Fitness; unknown ids give nullopt
std::optional<Category> category_from_string(const std::string& id);

// declaration order
const std::vector<Category>& all_categories();

}  // namespace categorize
